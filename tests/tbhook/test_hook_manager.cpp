#include <catch2/catch_test_macros.hpp>
#include <tbhook/hooking/HookManager.hpp>
#include <tbhook/policies/ExecutionLoggerHook.hpp>
#include <tbhook/policies/RewardDistributionHook.hpp>
#include <tbhook/policies/SpendingLimitHook.hpp>
#include <tbhook/policies/WhitelistHook.hpp>

#include "utils/mock_hooks.hpp"
#include "../../src/utils/ErrorReporter.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace tbhook;
using namespace test_utils;

namespace {

// IHook implemented directly, with scripted results per phase
class ScriptedHook : public IHook {
public:
    ScriptedHook(std::string name, PermissionSet perms, std::vector<std::string>& trace)
        : name_(std::move(name))
        , perms_(perms)
        , trace_(trace)
    {
    }

    PermissionSet permissions() const override { return perms_; }

    HookResult beforeExecute(const Address&, const HookParams& params) override
    {
        trace_.push_back(name_ + ":before");
        seen_before_success = params.success;
        return before_result;
    }

    HookResult afterExecute(const Address&, const HookParams& params) override
    {
        trace_.push_back(name_ + ":after");
        seen_after_success = params.success;
        seen_return_data = params.returnData;
        return after_result;
    }

    HookResult before_result = HookResult::Success();
    HookResult after_result = HookResult::Success();
    bool seen_before_success = true;
    bool seen_after_success = false;
    Bytes seen_return_data;

private:
    std::string name_;
    PermissionSet perms_;
    std::vector<std::string>& trace_;
};

TargetCall RecordingTarget(std::vector<std::string>& trace, bool success = true, Bytes return_data = {})
{
    return [&trace, success, return_data](const HookParams&)
    {
        trace.push_back("target");
        return TargetOutcome{ success, return_data };
    };
}

} // namespace

TEST_CASE("HookManager - Registration", "[hooking][manager]")
{
    HookManager manager(kOrchestrator);
    std::vector<std::string> trace;

    REQUIRE(manager.registerHook("a", std::make_unique<ScriptedHook>("a", kFullPermissions, trace)));
    REQUIRE_FALSE(manager.registerHook("a", std::make_unique<ScriptedHook>("a2", kFullPermissions, trace)));
    REQUIRE_FALSE(manager.registerHook("null", nullptr));
    REQUIRE(manager.hookCount() == 1);

    REQUIRE(manager.getHook("a") != nullptr);
    REQUIRE(manager.getHook("missing") == nullptr);
    REQUIRE(manager.getHookAs<ScriptedHook>("a") != nullptr);
    REQUIRE(manager.getHookAs<WhitelistHook>("a") == nullptr);
    REQUIRE(manager.orchestrator() == kOrchestrator);
}

TEST_CASE("HookManager - Dispatch follows declared permissions", "[hooking][manager]")
{
    HookManager manager(kOrchestrator);
    std::vector<std::string> trace;

    manager.registerHook("pre", std::make_unique<ScriptedHook>("pre", kBeforeOnlyPermissions, trace));
    manager.registerHook("post", std::make_unique<ScriptedHook>("post", kAfterOnlyPermissions, trace));
    manager.registerHook("both", std::make_unique<ScriptedHook>("both", kFullPermissions, trace));
    manager.registerHook("idle", std::make_unique<ScriptedHook>("idle", PermissionSet{}, trace));

    auto outcome = manager.execute(MakeParams(1, kDead), RecordingTarget(trace, true, { 0x01 }));

    REQUIRE(outcome.committed);
    REQUIRE(outcome.stage == ExecutionStage::Completed);
    REQUIRE(outcome.hook_result.confirmed());
    REQUIRE(outcome.target_success);
    REQUIRE(outcome.return_data == Bytes{ 0x01 });
    REQUIRE(trace == std::vector<std::string>{ "pre:before", "both:before", "target", "post:after", "both:after" });

    auto* both = manager.getHookAs<ScriptedHook>("both");
    REQUIRE_FALSE(both->seen_before_success);
    REQUIRE(both->seen_after_success);
    REQUIRE(both->seen_return_data == Bytes{ 0x01 });
}

TEST_CASE("HookManager - Before failure skips the target", "[hooking][manager]")
{
    utils::ErrorReporter::ClearErrors();
    HookManager manager(kOrchestrator);
    std::vector<std::string> trace;

    auto first = std::make_unique<ScriptedHook>("first", kFullPermissions, trace);
    first->before_result = HookResult::TargetNotWhitelisted(kDead);
    manager.registerHook("first", std::move(first));
    manager.registerHook("second", std::make_unique<ScriptedHook>("second", kFullPermissions, trace));

    auto outcome = manager.execute(MakeParams(1, kDead), RecordingTarget(trace));

    REQUIRE_FALSE(outcome.committed);
    REQUIRE(outcome.stage == ExecutionStage::Before);
    REQUIRE(outcome.hook_name == "first");
    REQUIRE(outcome.hook_result.error == HookErrorCode::TargetNotWhitelisted);
    REQUIRE(trace == std::vector<std::string>{ "first:before" });

    REQUIRE(utils::ErrorReporter::HasPendingErrors());
    auto report = utils::ErrorReporter::GetLastError();
    REQUIRE(report.category == utils::ErrorCategory::Policy);
    REQUIRE(report.severity == utils::ErrorSeverity::Info);
    utils::ErrorReporter::ClearErrors();
}

TEST_CASE("HookManager - Success without magic aborts", "[hooking][manager]")
{
    utils::ErrorReporter::ClearErrors();
    HookManager manager(kOrchestrator);
    std::vector<std::string> trace;

    auto liar = std::make_unique<ScriptedHook>("liar", kAfterOnlyPermissions, trace);
    liar->after_result.magic = Selector{ 0xDE, 0xAD, 0xBE, 0xEF };
    manager.registerHook("liar", std::move(liar));

    auto outcome = manager.execute(MakeParams(1, kDead), RecordingTarget(trace));

    REQUIRE_FALSE(outcome.committed);
    REQUIRE(outcome.stage == ExecutionStage::After);
    REQUIRE(outcome.hook_result.error == HookErrorCode::InvalidMagic);
    REQUIRE(utils::ErrorReporter::GetLastError().category == utils::ErrorCategory::Dispatch);
    utils::ErrorReporter::ClearErrors();
}

TEST_CASE("HookManager - Declared but unimplemented phase aborts", "[hooking][manager]")
{
    MockClock clock;
    HookManager manager(kOrchestrator);

    // Declares both phases through IHook but only implements the before phase
    class HalfHook : public BaseHook {
    public:
        using BaseHook::BaseHook;
        PermissionSet permissions() const override { return kFullPermissions; }

    protected:
        HookResult handleBeforeExecute(const HookParams&) override { return HookResult::Success(); }
    };

    manager.registerHook("half", std::make_unique<HalfHook>(MakeCreateInfo(clock)));
    auto outcome = manager.execute(MakeParams(1, kDead), nullptr);

    REQUIRE_FALSE(outcome.committed);
    REQUIRE(outcome.stage == ExecutionStage::After);
    REQUIRE(outcome.hook_result.error == HookErrorCode::NotImplemented);
}

TEST_CASE("HookManager - Target failures reach the after phase", "[hooking][manager]")
{
    HookManager manager(kOrchestrator);
    std::vector<std::string> trace;
    manager.registerHook("post", std::make_unique<ScriptedHook>("post", kAfterOnlyPermissions, trace));

    SECTION("Reported failure")
    {
        auto outcome = manager.execute(MakeParams(1, kDead), RecordingTarget(trace, false));
        REQUIRE(outcome.committed);
        REQUIRE_FALSE(outcome.target_success);
        REQUIRE_FALSE(manager.getHookAs<ScriptedHook>("post")->seen_after_success);
    }

    SECTION("Throwing target")
    {
        auto outcome = manager.execute(MakeParams(1, kDead),
                                       [](const HookParams&) -> TargetOutcome { throw std::runtime_error("revert"); });
        REQUIRE(outcome.committed);
        REQUIRE_FALSE(outcome.target_success);
        REQUIRE(trace == std::vector<std::string>{ "post:after" });
    }
}

TEST_CASE("HookManager - Wrong invoker is rejected by every hook", "[hooking][manager][auth]")
{
    utils::ErrorReporter::ClearErrors();
    MockClock clock;
    HookManager manager(kOrchestrator);
    auto whitelist = std::make_unique<WhitelistHook>(MakeCreateInfo(clock));
    whitelist->setWhitelist(1, kDead, true);
    manager.registerHook("whitelist", std::move(whitelist));

    auto outcome = manager.executeAs(kStranger, MakeParams(1, kDead), nullptr);
    REQUIRE_FALSE(outcome.committed);
    REQUIRE(outcome.hook_result.error == HookErrorCode::Unauthorized);
    REQUIRE(utils::ErrorReporter::GetLastError().category == utils::ErrorCategory::Authorization);

    REQUIRE(manager.execute(MakeParams(1, kDead), nullptr).committed);
    utils::ErrorReporter::ClearErrors();
}

TEST_CASE("HookManager - Reference hooks end to end", "[hooking][manager][integration]")
{
    MockClock clock;
    HookManager manager(kOrchestrator);

    const Address treasury = Address::FromUint(0x7EA5);
    auto ledger = std::make_shared<LedgerRewardToken>(Address::FromUint(0x70CE), treasury);
    ledger->mint(treasury, 100);
    manager.addParticipant(ledger.get());

    auto whitelist = std::make_unique<WhitelistHook>(MakeCreateInfo(clock));
    whitelist->batchWhitelist(1, { kDead });
    auto spending = std::make_unique<SpendingLimitHook>(MakeCreateInfo(clock));
    spending->setDailyLimit(1, 100);

    manager.registerHook("whitelist", std::move(whitelist));
    manager.registerHook("spending_limit", std::move(spending));
    manager.registerHook("execution_logger", std::make_unique<ExecutionLoggerHook>(MakeCreateInfo(clock)));
    manager.registerHook("reward", std::make_unique<RewardDistributionHook>(MakeCreateInfo(clock), ledger, 10));

    auto* spending_hook = manager.getHookAs<SpendingLimitHook>("spending_limit");
    auto* logger_hook = manager.getHookAs<ExecutionLoggerHook>("execution_logger");
    auto* reward_hook = manager.getHookAs<RewardDistributionHook>("reward");

    SECTION("Committed execution updates every hook")
    {
        auto outcome = manager.execute(MakeParams(1, kDead, 40), [](const HookParams&) { return TargetOutcome{ true, {} }; });
        REQUIRE(outcome.committed);
        REQUIRE(spending_hook->getSpendingInfo(1).spentToday == 40);
        REQUIRE(logger_hook->executionCount(1) == 1);
        REQUIRE(reward_hook->totalRewards(1) == 10);
        REQUIRE(ledger->balanceOf(kUser) == 10);
    }

    SECTION("Blocked target leaves the quota untouched")
    {
        auto outcome = manager.execute(MakeParams(1, Address::FromUint(0xBAD), 40), nullptr);
        REQUIRE_FALSE(outcome.committed);
        REQUIRE(outcome.hook_name == "whitelist");
        REQUIRE(spending_hook->getSpendingInfo(1).spentToday == 0);
        REQUIRE(logger_hook->executionCount(1) == 0);
    }

    SECTION("After-phase abort rolls back the before-phase debit")
    {
        std::vector<std::string> trace;
        auto veto = std::make_unique<ScriptedHook>("veto", kAfterOnlyPermissions, trace);
        veto->after_result = HookResult::NotImplemented(HookPhase::After);
        manager.registerHook("veto", std::move(veto));

        auto outcome = manager.execute(MakeParams(1, kDead, 40), [](const HookParams&) { return TargetOutcome{ true, {} }; });
        REQUIRE_FALSE(outcome.committed);
        REQUIRE(outcome.hook_name == "veto");

        REQUIRE(spending_hook->getSpendingInfo(1).spentToday == 0);
        REQUIRE(spending_hook->getRemainingToday(1) == 100);
        REQUIRE(logger_hook->executionCount(1) == 0);
        REQUIRE(reward_hook->totalRewards(1) == 0);
        REQUIRE(ledger->balanceOf(kUser) == 0);
        REQUIRE(ledger->balanceOf(treasury) == 100);
    }

    SECTION("Over-limit request reports the remainder")
    {
        REQUIRE(manager.execute(MakeParams(1, kDead, 70), nullptr).committed);
        auto outcome = manager.execute(MakeParams(1, kDead, 50), nullptr);
        REQUIRE_FALSE(outcome.committed);
        REQUIRE(outcome.hook_name == "spending_limit");
        REQUIRE(outcome.hook_result.requested == 50);
        REQUIRE(outcome.hook_result.remaining == 30);
        REQUIRE(logger_hook->executionCount(1) == 1);
    }
}

TEST_CASE("HookManager - Exceptions inside hooks abort and roll back", "[hooking][manager][checkpoint]")
{
    utils::ErrorReporter::ClearErrors();
    MockClock clock;
    HookManager manager(kOrchestrator);

    const Address treasury = Address::FromUint(0x7EA5);
    auto ledger = std::make_shared<LedgerRewardToken>(Address::FromUint(0x70CE), treasury);
    ledger->mint(treasury, 100);
    manager.addParticipant(ledger.get());

    auto spending = std::make_unique<SpendingLimitHook>(MakeCreateInfo(clock));
    spending->setDailyLimit(1, 100);
    manager.registerHook("spending_limit", std::move(spending));
    manager.registerHook("execution_logger", std::make_unique<ExecutionLoggerHook>(MakeCreateInfo(clock)));
    manager.registerHook("reward", std::make_unique<RewardDistributionHook>(MakeCreateInfo(clock), ledger, 10));

    auto* spending_hook = manager.getHookAs<SpendingLimitHook>("spending_limit");
    auto* logger_hook = manager.getHookAs<ExecutionLoggerHook>("execution_logger");
    auto* reward_hook = manager.getHookAs<RewardDistributionHook>("reward");
    auto succeed = [](const HookParams&) { return TargetOutcome{ true, {} }; };

    SECTION("Listener throws during the before phase")
    {
        auto id = spending_hook->events().addListener(
            [](const HookEvent& event)
            {
                if (event.type == HookEventType::SpendingRecorded)
                    throw std::runtime_error("listener failed");
            });

        std::vector<std::string> trace;
        auto outcome = manager.execute(MakeParams(1, kDead, 40), RecordingTarget(trace));

        REQUIRE_FALSE(outcome.committed);
        REQUIRE(outcome.stage == ExecutionStage::Before);
        REQUIRE(outcome.hook_name == "spending_limit");
        REQUIRE(outcome.hook_result.error == HookErrorCode::HookThrew);
        REQUIRE(outcome.hook_result.message == "hook threw: listener failed");
        REQUIRE(trace.empty());
        REQUIRE(spending_hook->getSpendingInfo(1).spentToday == 0);
        REQUIRE(utils::ErrorReporter::GetLastError().category == utils::ErrorCategory::Dispatch);

        spending_hook->events().removeListener(id);
        REQUIRE(manager.execute(MakeParams(1, kDead, 40), succeed).committed);
        REQUIRE(spending_hook->getSpendingInfo(1).spentToday == 40);
    }

    SECTION("Listener throws during the after phase")
    {
        reward_hook->events().addListener([](const HookEvent&) { throw std::runtime_error("listener failed"); });

        auto outcome = manager.execute(MakeParams(1, kDead, 40), succeed);

        REQUIRE_FALSE(outcome.committed);
        REQUIRE(outcome.stage == ExecutionStage::After);
        REQUIRE(outcome.hook_name == "reward");
        REQUIRE(spending_hook->getSpendingInfo(1).spentToday == 0);
        REQUIRE(logger_hook->executionCount(1) == 0);
        REQUIRE(logger_hook->getHistory(1, 0, 10).empty());
        REQUIRE(reward_hook->totalRewards(1) == 0);
        REQUIRE(ledger->balanceOf(kUser) == 0);
        REQUIRE(ledger->balanceOf(treasury) == 100);
    }

    SECTION("Bespoke hook throws")
    {
        class ThrowingHook : public IHook {
        public:
            PermissionSet permissions() const override { return kAfterOnlyPermissions; }
            HookResult beforeExecute(const Address&, const HookParams&) override { return HookResult::Success(); }
            HookResult afterExecute(const Address&, const HookParams&) override
            {
                throw std::length_error("too long");
            }
        };
        manager.registerHook("throwing", std::make_unique<ThrowingHook>());

        auto outcome = manager.execute(MakeParams(1, kDead, 25), succeed);
        REQUIRE_FALSE(outcome.committed);
        REQUIRE(outcome.hook_name == "throwing");
        REQUIRE(outcome.hook_result.error == HookErrorCode::HookThrew);
        REQUIRE(spending_hook->getSpendingInfo(1).spentToday == 0);
        REQUIRE(logger_hook->executionCount(1) == 0);
        REQUIRE(ledger->balanceOf(treasury) == 100);
    }

    utils::ErrorReporter::ClearErrors();
}
