#pragma once

#include "Types.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <string>

#include <nlohmann/json.hpp>

namespace tbhook
{

enum class HookEventType
{
    WhitelistUpdated,
    DailyLimitSet,
    SpendingRecorded,
    RewardDistributed,
    ExecutionLogged
};

const char* EventTypeName(HookEventType type);

struct HookEvent
{
    HookEventType type = HookEventType::WhitelistUpdated;
    TokenId tokenId = 0;
    nlohmann::json data = nlohmann::json::object();
};

/// Per-hook listener registry. Events are delivered synchronously in
/// registration order. Not thread-safe; hooks run on one thread.
class HookEventEmitter
{
public:
    using ListenerId = std::uint64_t;
    using Listener = std::function<void(const HookEvent&)>;

    /// Returns 0 (never a valid id) when `listener` is empty.
    ListenerId addListener(Listener listener);
    void removeListener(ListenerId id);
    std::size_t listenerCount() const { return listeners_.size(); }

    void emit(const HookEvent& event) const;

private:
    ListenerId next_id_ = 1;
    std::map<ListenerId, Listener> listeners_;
};

} // namespace tbhook
