#pragma once

#include "../core/Address.hpp"
#include "../core/Types.hpp"
#include "../hooking/HookCreateInfo.hpp"

#include <memory>
#include <vector>

class ConfigManager;

namespace tbhook
{

class HookManager;
class LedgerRewardToken;

struct WhitelistSettings
{
    struct Entry
    {
        TokenId token_id = 0;
        std::vector<Address> targets;
    };

    bool enabled = false;
    std::vector<Entry> entries;
};

struct SpendingLimitSettings
{
    struct Limit
    {
        TokenId token_id = 0;
        Amount daily_limit = 0;
    };

    bool enabled = false;
    Timestamp seconds_per_day = kSecondsPerDay;
    std::vector<Limit> limits;
};

struct RewardSettings
{
    bool enabled = false;
    Address token;
    Address treasury;
    Amount amount = 0;
    Amount treasury_balance = 0;
};

struct HookSettings
{
    Address orchestrator;
    bool verbose = false;

    WhitelistSettings whitelist;
    SpendingLimitSettings spending_limit;
    RewardSettings reward;
    bool logger_enabled = false;
};

/// Registers the [orchestrator], [whitelist], [spending_limit], [reward]
/// and [logger] sections. `settings` must outlive the manager's load().
bool RegisterHookSettings(ConfigManager& config, HookSettings& settings);

/**
 * @brief Create the enabled reference hooks and register them with `manager`
 *
 * Hooks are registered as "whitelist", "spending_limit",
 * "execution_logger" and "reward", in that order. When the reward hook is
 * enabled, its ledger is funded with the configured treasury balance,
 * added as a rollback participant and returned through `reward_token`.
 */
bool BuildReferenceHooks(const HookSettings& settings, HookManager& manager, const TimeSource& time_source,
                         std::shared_ptr<LedgerRewardToken>& reward_token);

} // namespace tbhook
