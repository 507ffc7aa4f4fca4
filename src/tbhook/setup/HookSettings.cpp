#include "HookSettings.hpp"
#include "../../config/ConfigManager.hpp"
#include "../hooking/HookManager.hpp"
#include "../policies/ExecutionLoggerHook.hpp"
#include "../policies/RewardDistributionHook.hpp"
#include "../policies/SpendingLimitHook.hpp"
#include "../policies/WhitelistHook.hpp"

#include <plog/Log.h>

namespace tbhook
{

namespace
{

bool ParseAddress(const toml::node& node, Address& out, const std::string& what, std::string& error)
{
    auto text = node.value<std::string>();
    if (!text)
    {
        error = what + " must be a hex string";
        return false;
    }

    auto parsed = Address::FromHex(*text);
    if (!parsed)
    {
        error = what + " is not a valid address: " + *text;
        return false;
    }

    out = *parsed;
    return true;
}

bool ReadAddress(const toml::table& section, const char* key, Address& out, bool required, std::string& error)
{
    const toml::node* node = section.get(key);
    if (!node)
    {
        if (required)
            error = std::string(key) + " is required";
        return !required;
    }
    return ParseAddress(*node, out, key, error);
}

bool ReadUnsigned(const toml::table& section, const char* key, std::uint64_t& out, std::string& error)
{
    const toml::node* node = section.get(key);
    if (!node)
        return true;

    auto value = node->value<std::int64_t>();
    if (!value || *value < 0)
    {
        error = std::string(key) + " must be a non-negative integer";
        return false;
    }

    out = static_cast<std::uint64_t>(*value);
    return true;
}

bool ReadRequiredUnsigned(const toml::table& section, const char* key, std::uint64_t& out, std::string& error)
{
    if (!section.contains(key))
    {
        error = std::string(key) + " is required";
        return false;
    }
    return ReadUnsigned(section, key, out, error);
}

bool ReadEnabled(const toml::table& section, bool& out)
{
    out = section["enabled"].value_or(!section.empty());
    return true;
}

bool LoadOrchestrator(const toml::table& section, HookSettings& settings, std::string& error)
{
    if (!ReadAddress(section, "address", settings.orchestrator, true, error))
        return false;
    settings.verbose = section["verbose"].value_or(false);
    return true;
}

bool LoadWhitelist(const toml::table& section, WhitelistSettings& out, std::string& error)
{
    out = WhitelistSettings{};
    ReadEnabled(section, out.enabled);

    const toml::array* entries = section["entries"].as_array();
    if (!entries)
        return true;

    for (const auto& node : *entries)
    {
        const toml::table* entry_table = node.as_table();
        if (!entry_table)
        {
            error = "entries must be tables";
            return false;
        }

        WhitelistSettings::Entry entry;
        if (!ReadRequiredUnsigned(*entry_table, "token_id", entry.token_id, error))
            return false;

        if (const toml::array* targets = (*entry_table)["targets"].as_array())
        {
            for (const auto& target_node : *targets)
            {
                Address target;
                if (!ParseAddress(target_node, target, "whitelist target", error))
                    return false;
                entry.targets.push_back(target);
            }
        }

        out.entries.push_back(std::move(entry));
    }
    return true;
}

bool LoadSpendingLimit(const toml::table& section, SpendingLimitSettings& out, std::string& error)
{
    out = SpendingLimitSettings{};
    ReadEnabled(section, out.enabled);

    if (!ReadUnsigned(section, "seconds_per_day", out.seconds_per_day, error))
        return false;
    if (out.seconds_per_day == 0)
    {
        error = "seconds_per_day must be positive";
        return false;
    }

    const toml::array* limits = section["limits"].as_array();
    if (!limits)
        return true;

    for (const auto& node : *limits)
    {
        const toml::table* limit_table = node.as_table();
        if (!limit_table)
        {
            error = "limits must be tables";
            return false;
        }

        SpendingLimitSettings::Limit limit;
        if (!ReadRequiredUnsigned(*limit_table, "token_id", limit.token_id, error) ||
            !ReadUnsigned(*limit_table, "daily_limit", limit.daily_limit, error))
            return false;
        out.limits.push_back(limit);
    }
    return true;
}

bool LoadReward(const toml::table& section, RewardSettings& out, std::string& error)
{
    out = RewardSettings{};
    ReadEnabled(section, out.enabled);
    if (!out.enabled)
        return true;

    return ReadAddress(section, "token", out.token, true, error) &&
           ReadAddress(section, "treasury", out.treasury, true, error) &&
           ReadUnsigned(section, "amount", out.amount, error) &&
           ReadUnsigned(section, "treasury_balance", out.treasury_balance, error);
}

} // namespace

bool RegisterHookSettings(ConfigManager& config, HookSettings& settings)
{
    return config.registerTable("orchestrator",
                                { [&settings](const toml::table& section, std::string& error)
                                  { return LoadOrchestrator(section, settings, error); } }) &&
           config.registerTable("whitelist",
                                { [&settings](const toml::table& section, std::string& error)
                                  { return LoadWhitelist(section, settings.whitelist, error); } }) &&
           config.registerTable("spending_limit",
                                { [&settings](const toml::table& section, std::string& error)
                                  { return LoadSpendingLimit(section, settings.spending_limit, error); } }) &&
           config.registerTable("reward",
                                { [&settings](const toml::table& section, std::string& error)
                                  { return LoadReward(section, settings.reward, error); } }) &&
           config.registerTable("logger",
                                { [&settings](const toml::table& section, std::string&)
                                  { return ReadEnabled(section, settings.logger_enabled); } });
}

bool BuildReferenceHooks(const HookSettings& settings, HookManager& manager, const TimeSource& time_source,
                         std::shared_ptr<LedgerRewardToken>& reward_token)
{
    HookCreateInfo info;
    info.authority = settings.orchestrator;
    info.time_source = time_source;
    info.verbose = settings.verbose;

    if (settings.whitelist.enabled)
    {
        auto hook = std::make_unique<WhitelistHook>(info);
        for (const auto& entry : settings.whitelist.entries)
        {
            hook->batchWhitelist(entry.token_id, entry.targets);
        }
        if (!manager.registerHook("whitelist", std::move(hook)))
            return false;
    }

    if (settings.spending_limit.enabled)
    {
        auto hook = std::make_unique<SpendingLimitHook>(info, settings.spending_limit.seconds_per_day);
        for (const auto& limit : settings.spending_limit.limits)
        {
            hook->setDailyLimit(limit.token_id, limit.daily_limit);
        }
        if (!manager.registerHook("spending_limit", std::move(hook)))
            return false;
    }

    if (settings.logger_enabled)
    {
        if (!manager.registerHook("execution_logger", std::make_unique<ExecutionLoggerHook>(info)))
            return false;
    }

    if (settings.reward.enabled)
    {
        reward_token = std::make_shared<LedgerRewardToken>(settings.reward.token, settings.reward.treasury);
        reward_token->mint(settings.reward.treasury, settings.reward.treasury_balance);
        manager.addParticipant(reward_token.get());

        if (!manager.registerHook("reward",
                                  std::make_unique<RewardDistributionHook>(info, reward_token, settings.reward.amount)))
            return false;
    }

    PLOG_INFO << "Built " << manager.hookCount() << " reference hook(s)";
    return true;
}

} // namespace tbhook
