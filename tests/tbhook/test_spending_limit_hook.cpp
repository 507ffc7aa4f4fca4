#include <catch2/catch_test_macros.hpp>
#include <tbhook/policies/SpendingLimitHook.hpp>

#include "utils/mock_hooks.hpp"

#include <vector>

using namespace tbhook;
using namespace test_utils;

TEST_CASE("SpendingLimitHook - Daily quota", "[policies][spending]")
{
    MockClock clock;
    SpendingLimitHook hook(MakeCreateInfo(clock));
    hook.setDailyLimit(1, 100);

    SECTION("Spending accumulates until the limit")
    {
        REQUIRE(hook.beforeExecute(kOrchestrator, MakeParams(1, kDead, 40)).confirmed());
        REQUIRE(hook.getRemainingToday(1) == 60);
        REQUIRE(hook.beforeExecute(kOrchestrator, MakeParams(1, kDead, 60)).confirmed());
        REQUIRE(hook.getRemainingToday(1) == 0);
        REQUIRE(hook.getSpendingInfo(1).spentToday == 100);
    }

    SECTION("A request over the remainder reports both amounts")
    {
        REQUIRE(hook.beforeExecute(kOrchestrator, MakeParams(1, kDead, 70)).confirmed());

        auto result = hook.beforeExecute(kOrchestrator, MakeParams(1, kDead, 31));
        REQUIRE_FALSE(result.succeeded);
        REQUIRE(result.error == HookErrorCode::ExceedsDailyLimit);
        REQUIRE(result.requested == 31);
        REQUIRE(result.remaining == 30);

        // Rejected request does not count
        REQUIRE(hook.getSpendingInfo(1).spentToday == 70);
    }

    SECTION("Sequence of requests accepts only prefixes within the limit")
    {
        const std::vector<Amount> requests{ 10, 25, 30, 50, 20, 15, 5 };
        Amount spent = 0;
        for (auto value : requests)
        {
            auto result = hook.beforeExecute(kOrchestrator, MakeParams(1, kDead, value));
            if (spent + value <= 100)
            {
                REQUIRE(result.confirmed());
                spent += value;
            }
            else
            {
                REQUIRE(result.error == HookErrorCode::ExceedsDailyLimit);
                REQUIRE(result.remaining == 100 - spent);
            }
            REQUIRE(hook.getSpendingInfo(1).spentToday == spent);
        }
        REQUIRE(spent == 100);
    }

    SECTION("Zero-value calls bypass the quota")
    {
        REQUIRE(hook.beforeExecute(kOrchestrator, MakeParams(1, kDead, 100)).confirmed());
        REQUIRE(hook.beforeExecute(kOrchestrator, MakeParams(1, kDead, 0)).confirmed());
        REQUIRE(hook.beforeExecute(kOrchestrator, MakeParams(99, kDead, 0)).confirmed());
    }
}

TEST_CASE("SpendingLimitHook - Day rollover", "[policies][spending]")
{
    MockClock clock;
    SpendingLimitHook hook(MakeCreateInfo(clock));
    hook.setDailyLimit(1, 100);

    REQUIRE(hook.beforeExecute(kOrchestrator, MakeParams(1, kDead, 100)).confirmed());
    REQUIRE_FALSE(hook.beforeExecute(kOrchestrator, MakeParams(1, kDead, 1)).succeeded);

    const auto today = hook.currentDay();
    clock.set((today + 1) * kSecondsPerDay);

    // Reported before any spending happens in the new bucket
    REQUIRE(hook.getRemainingToday(1) == 100);

    REQUIRE(hook.beforeExecute(kOrchestrator, MakeParams(1, kDead, 30)).confirmed());
    auto info = hook.getSpendingInfo(1);
    REQUIRE(info.spentToday == 30);
    REQUIRE(info.lastResetDay == today + 1);
}

TEST_CASE("SpendingLimitHook - Custom bucket length", "[policies][spending]")
{
    MockClock clock(3600);
    SpendingLimitHook hook(MakeCreateInfo(clock), 60);
    hook.setDailyLimit(1, 10);
    REQUIRE(hook.secondsPerDay() == 60);
    REQUIRE(hook.currentDay() == 60);

    REQUIRE(hook.beforeExecute(kOrchestrator, MakeParams(1, kDead, 10)).confirmed());
    clock.advance(59);
    REQUIRE_FALSE(hook.beforeExecute(kOrchestrator, MakeParams(1, kDead, 1)).succeeded);
    clock.advance(1);
    REQUIRE(hook.beforeExecute(kOrchestrator, MakeParams(1, kDead, 10)).confirmed());
}

TEST_CASE("SpendingLimitHook - Unconfigured tokens", "[policies][spending]")
{
    MockClock clock;
    SpendingLimitHook hook(MakeCreateInfo(clock));

    SECTION("No limit set")
    {
        auto result = hook.beforeExecute(kOrchestrator, MakeParams(5, kDead, 1));
        REQUIRE(result.error == HookErrorCode::LimitNotConfigured);
        REQUIRE(hook.getSpendingInfo(5).dailyLimit == 0);
    }

    SECTION("Limit of zero means not configured")
    {
        hook.setDailyLimit(5, 0);
        REQUIRE(hook.beforeExecute(kOrchestrator, MakeParams(5, kDead, 1)).error ==
                HookErrorCode::LimitNotConfigured);
    }
}

TEST_CASE("SpendingLimitHook - Limit changes keep progress", "[policies][spending]")
{
    MockClock clock;
    SpendingLimitHook hook(MakeCreateInfo(clock));
    hook.setDailyLimit(1, 100);
    REQUIRE(hook.beforeExecute(kOrchestrator, MakeParams(1, kDead, 80)).confirmed());

    hook.setDailyLimit(1, 50);
    REQUIRE(hook.getSpendingInfo(1).spentToday == 80);
    REQUIRE(hook.getRemainingToday(1) == 0);

    auto result = hook.beforeExecute(kOrchestrator, MakeParams(1, kDead, 1));
    REQUIRE(result.error == HookErrorCode::ExceedsDailyLimit);
    REQUIRE(result.remaining == 0);

    hook.setDailyLimit(1, 200);
    REQUIRE(hook.getRemainingToday(1) == 120);
}

TEST_CASE("SpendingLimitHook - Events and rollback", "[policies][spending][events]")
{
    MockClock clock;
    SpendingLimitHook hook(MakeCreateInfo(clock));
    std::vector<HookEvent> events;
    hook.events().addListener([&](const HookEvent& event) { events.push_back(event); });

    hook.setDailyLimit(1, 100);
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].type == HookEventType::DailyLimitSet);
    REQUIRE(events[0].data["daily_limit"].get<Amount>() == 100);

    hook.beginCheckpoint();
    REQUIRE(hook.beforeExecute(kOrchestrator, MakeParams(1, kDead, 25)).confirmed());
    REQUIRE(events.size() == 2);
    REQUIRE(events[1].type == HookEventType::SpendingRecorded);
    REQUIRE(events[1].data["amount"].get<Amount>() == 25);
    REQUIRE(events[1].data["remaining"].get<Amount>() == 75);

    hook.rollbackCheckpoint();
    REQUIRE(hook.getSpendingInfo(1).spentToday == 0);
    REQUIRE(hook.getRemainingToday(1) == 100);
}

TEST_CASE("SpendingLimitHook - Unauthorized invoker leaves state untouched", "[policies][spending][auth]")
{
    MockClock clock;
    SpendingLimitHook hook(MakeCreateInfo(clock));
    hook.setDailyLimit(1, 100);

    REQUIRE(hook.beforeExecute(kStranger, MakeParams(1, kDead, 10)).error == HookErrorCode::Unauthorized);
    REQUIRE(hook.getSpendingInfo(1).spentToday == 0);
}
