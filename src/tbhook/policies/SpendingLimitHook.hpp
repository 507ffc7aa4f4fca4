#pragma once

#include "../core/Checkpoint.hpp"
#include "../hooking/HookVariants.hpp"

#include <unordered_map>

namespace tbhook
{

struct SpendingInfo
{
    Amount dailyLimit = 0;
    Amount spentToday = 0;
    std::uint64_t lastResetDay = 0;
};

/**
 * @brief Day-bucketed native-currency quota per token
 *
 * today = now / seconds_per_day. The first call in a newer bucket resets
 * spentToday lazily. The debit is committed in the before phase, ahead of
 * the target call; an aborted operation relies on the orchestrator's
 * rollback to undo it. Zero-value calls bypass the quota entirely.
 */
class SpendingLimitHook final : public BeforeOnlyHook, public ITransactional
{
public:
    explicit SpendingLimitHook(const HookCreateInfo& create_info, Timestamp seconds_per_day = kSecondsPerDay);

    const char* hookName() const override { return "spending_limit"; }

    // Keeps spending progress for the current bucket
    void setDailyLimit(TokenId token_id, Amount daily_limit);

    SpendingInfo getSpendingInfo(TokenId token_id) const;
    Amount getRemainingToday(TokenId token_id) const;
    std::uint64_t currentDay() const { return now() / seconds_per_day_; }
    Timestamp secondsPerDay() const { return seconds_per_day_; }

    ITransactional* transactional() override { return this; }
    void beginCheckpoint() override { state_.begin(); }
    void commitCheckpoint() override { state_.commit(); }
    void rollbackCheckpoint() override { state_.rollback(); }

protected:
    HookResult onBeforeExecute(const HookParams& params) override;

private:
    struct State
    {
        std::unordered_map<TokenId, SpendingInfo> limits;
    };

    Timestamp seconds_per_day_;
    CheckpointedState<State> state_;
};

} // namespace tbhook
