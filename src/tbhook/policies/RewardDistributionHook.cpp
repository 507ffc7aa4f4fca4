#include "RewardDistributionHook.hpp"

#include <exception>

#include <plog/Log.h>

namespace tbhook
{

RewardDistributionHook::RewardDistributionHook(const HookCreateInfo& create_info,
                                               std::shared_ptr<IRewardToken> reward_token, Amount reward_amount)
    : AfterOnlyHook(create_info)
    , reward_token_(std::move(reward_token))
    , reward_amount_(reward_amount)
{
}

Amount RewardDistributionHook::totalRewards(TokenId token_id) const
{
    const auto& totals = totals_.get();
    auto it = totals.find(token_id);
    return it == totals.end() ? 0 : it->second;
}

Address RewardDistributionHook::rewardToken() const
{
    return reward_token_ ? reward_token_->address() : Address{};
}

HookResult RewardDistributionHook::onAfterExecute(const HookParams& params)
{
    if (!params.success || reward_amount_ == 0)
        return HookResult::Success();

    if (!tryTransfer(params.caller))
    {
        PLOG_WARNING << "[reward] payout of " << reward_amount_ << " to " << params.caller.toHex() << " for token "
                     << params.tokenId << " failed; execution unaffected";
        return HookResult::Success();
    }

    totals_.get()[params.tokenId] += reward_amount_;

    HookEvent event;
    event.type = HookEventType::RewardDistributed;
    event.tokenId = params.tokenId;
    event.data = { { "recipient", params.caller.toHex() }, { "amount", reward_amount_ } };
    emit(event);

    return HookResult::Success();
}

bool RewardDistributionHook::tryTransfer(const Address& recipient)
{
    if (!reward_token_)
        return false;

    try
    {
        return reward_token_->transfer(recipient, reward_amount_);
    }
    catch (const std::exception& ex)
    {
        PLOG_WARNING << "[reward] token transfer threw: " << ex.what();
        return false;
    }
}

} // namespace tbhook
