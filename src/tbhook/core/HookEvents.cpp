#include "HookEvents.hpp"

#include <plog/Log.h>

namespace tbhook
{

const char* EventTypeName(HookEventType type)
{
    switch (type)
    {
    case HookEventType::WhitelistUpdated:
        return "WhitelistUpdated";
    case HookEventType::DailyLimitSet:
        return "DailyLimitSet";
    case HookEventType::SpendingRecorded:
        return "SpendingRecorded";
    case HookEventType::RewardDistributed:
        return "RewardDistributed";
    case HookEventType::ExecutionLogged:
        return "ExecutionLogged";
    default:
        return "Unknown";
    }
}

HookEventEmitter::ListenerId HookEventEmitter::addListener(Listener listener)
{
    if (!listener)
        return 0;
    auto id = next_id_++;
    listeners_[id] = std::move(listener);
    return id;
}

void HookEventEmitter::removeListener(ListenerId id)
{
    if (id == 0)
        return;
    listeners_.erase(id);
}

void HookEventEmitter::emit(const HookEvent& event) const
{
    PLOG_DEBUG << "[event] " << EventTypeName(event.type) << " token=" << event.tokenId << " " << event.data.dump();

    for (const auto& [id, listener] : listeners_)
    {
        listener(event);
    }
}

} // namespace tbhook
