#include "SpendingLimitHook.hpp"

#include <plog/Log.h>

namespace tbhook
{

namespace
{

// A limit lowered below what was already spent leaves nothing to spend.
Amount RemainingOf(const SpendingInfo& info)
{
    return info.spentToday >= info.dailyLimit ? 0 : info.dailyLimit - info.spentToday;
}

} // namespace

SpendingLimitHook::SpendingLimitHook(const HookCreateInfo& create_info, Timestamp seconds_per_day)
    : BeforeOnlyHook(create_info)
    , seconds_per_day_(seconds_per_day)
{
    if (seconds_per_day_ == 0)
    {
        PLOG_WARNING << "[spending_limit] seconds_per_day must be positive, using " << kSecondsPerDay;
        seconds_per_day_ = kSecondsPerDay;
    }
}

void SpendingLimitHook::setDailyLimit(TokenId token_id, Amount daily_limit)
{
    state_.get().limits[token_id].dailyLimit = daily_limit;

    HookEvent event;
    event.type = HookEventType::DailyLimitSet;
    event.tokenId = token_id;
    event.data = { { "daily_limit", daily_limit } };
    emit(event);
}

SpendingInfo SpendingLimitHook::getSpendingInfo(TokenId token_id) const
{
    const auto& limits = state_.get().limits;
    auto it = limits.find(token_id);
    return it == limits.end() ? SpendingInfo{} : it->second;
}

Amount SpendingLimitHook::getRemainingToday(TokenId token_id) const
{
    SpendingInfo info = getSpendingInfo(token_id);
    if (currentDay() > info.lastResetDay)
        return info.dailyLimit;
    return RemainingOf(info);
}

HookResult SpendingLimitHook::onBeforeExecute(const HookParams& params)
{
    if (params.value == 0)
        return HookResult::Success();

    auto& limits = state_.get().limits;
    auto it = limits.find(params.tokenId);
    if (it == limits.end() || it->second.dailyLimit == 0)
    {
        PLOG_INFO << "[spending_limit] token " << params.tokenId << " has no daily limit configured";
        return HookResult::LimitNotConfigured(params.tokenId);
    }

    auto& info = it->second;
    const auto today = currentDay();
    if (today > info.lastResetDay)
    {
        info.spentToday = 0;
        info.lastResetDay = today;
    }

    const Amount remaining = RemainingOf(info);
    if (params.value > remaining)
    {
        PLOG_INFO << "[spending_limit] token " << params.tokenId << " requested " << params.value << ", remaining "
                  << remaining;
        return HookResult::ExceedsDailyLimit(params.value, remaining);
    }

    info.spentToday += params.value;

    HookEvent event;
    event.type = HookEventType::SpendingRecorded;
    event.tokenId = params.tokenId;
    event.data = { { "amount", params.value }, { "remaining", remaining - params.value } };
    emit(event);

    return HookResult::Success();
}

} // namespace tbhook
