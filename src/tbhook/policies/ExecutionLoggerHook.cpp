#include "ExecutionLoggerHook.hpp"
#include "../core/Hex.hpp"

#include <algorithm>

#include <nlohmann/json.hpp>

namespace tbhook
{

void to_json(nlohmann::json& j, const ExecutionLog& log)
{
    j = nlohmann::json{ { "timestamp", log.timestamp },
                        { "caller", log.caller.toHex() },
                        { "to", log.to.toHex() },
                        { "value", log.value },
                        { "selector", hex::Encode(log.selector) },
                        { "success", log.success } };
}

ExecutionLoggerHook::ExecutionLoggerHook(const HookCreateInfo& create_info)
    : FullHook(create_info)
{
}

std::vector<ExecutionLog> ExecutionLoggerHook::getHistory(TokenId token_id, std::size_t offset,
                                                          std::size_t limit) const
{
    auto it = logs_.find(token_id);
    if (it == logs_.end())
        return {};

    const auto& history = it->second;
    const std::size_t total = history.size();
    if (offset >= total)
        return {};

    const std::size_t end = offset + std::min(limit, total - offset);
    return std::vector<ExecutionLog>(history.begin() + static_cast<std::ptrdiff_t>(offset),
                                     history.begin() + static_cast<std::ptrdiff_t>(end));
}

std::size_t ExecutionLoggerHook::executionCount(TokenId token_id) const
{
    auto it = counts_.find(token_id);
    return it == counts_.end() ? 0 : it->second;
}

void ExecutionLoggerHook::beginCheckpoint()
{
    journaling_ = true;
    appended_.clear();
}

void ExecutionLoggerHook::commitCheckpoint()
{
    journaling_ = false;
    appended_.clear();
}

void ExecutionLoggerHook::rollbackCheckpoint()
{
    if (!journaling_)
        return;

    for (auto it = appended_.rbegin(); it != appended_.rend(); ++it)
    {
        logs_[*it].pop_back();
        --counts_[*it];
    }
    journaling_ = false;
    appended_.clear();
}

HookResult ExecutionLoggerHook::onBeforeExecute(const HookParams&)
{
    return HookResult::Success();
}

HookResult ExecutionLoggerHook::onAfterExecute(const HookParams& params)
{
    ExecutionLog entry;
    entry.timestamp = now();
    entry.caller = params.caller;
    entry.to = params.to;
    entry.value = params.value;
    entry.selector = params.selector;
    entry.success = params.success;

    logs_[params.tokenId].push_back(entry);
    const std::size_t index = counts_[params.tokenId]++;
    if (journaling_)
        appended_.push_back(params.tokenId);

    HookEvent event;
    event.type = HookEventType::ExecutionLogged;
    event.tokenId = params.tokenId;
    event.data = { { "index", index }, { "to", params.to.toHex() }, { "success", params.success } };
    emit(event);

    return HookResult::Success();
}

} // namespace tbhook
