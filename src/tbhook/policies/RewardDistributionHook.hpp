#pragma once

#include "RewardToken.hpp"
#include "../core/Checkpoint.hpp"
#include "../hooking/HookVariants.hpp"

#include <memory>
#include <unordered_map>

namespace tbhook
{

/// Pays a fixed reward to the caller of every successful execution.
/// A failed payout is logged and contained; it never vetoes the
/// execution it rewards.
class RewardDistributionHook final : public AfterOnlyHook, public ITransactional
{
public:
    RewardDistributionHook(const HookCreateInfo& create_info, std::shared_ptr<IRewardToken> reward_token,
                           Amount reward_amount);

    const char* hookName() const override { return "reward"; }

    Amount totalRewards(TokenId token_id) const;
    Address rewardToken() const;
    Amount rewardAmount() const { return reward_amount_; }

    ITransactional* transactional() override { return this; }
    void beginCheckpoint() override { totals_.begin(); }
    void commitCheckpoint() override { totals_.commit(); }
    void rollbackCheckpoint() override { totals_.rollback(); }

protected:
    HookResult onAfterExecute(const HookParams& params) override;

private:
    bool tryTransfer(const Address& recipient);

    std::shared_ptr<IRewardToken> reward_token_;
    Amount reward_amount_;
    CheckpointedState<std::unordered_map<TokenId, Amount>> totals_;
};

} // namespace tbhook
