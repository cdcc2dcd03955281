// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Tests for draft notification system

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "draft/notifications.hpp"
#include <string>
#include <utility>
#include <vector>

using namespace draftops::draft;
using draftops::network::ConnectionState;

static Pick MakePick(int number, const std::string& player) {
    Pick pick;
    pick.pick_number = number;
    pick.player_id = player;
    pick.team_id = "3";
    pick.position = "WR";
    return pick;
}

TEST_CASE("Notifications - every event reaches its subscriber", "[notifications]") {
    DraftNotifications notifications;

    std::vector<std::string> log;
    auto s1 = notifications.SubscribePickProcessed([&](const Pick& pick, bool resolved) {
        log.push_back("processed " + pick.player_id + (resolved ? " resolved" : " pending"));
    });
    auto s2 = notifications.SubscribePickUpdated(
        [&](const Pick& pick) { log.push_back("updated " + pick.player_id); });
    auto s3 = notifications.SubscribeTeamSelecting([&](const std::string& team, int pick, double) {
        log.push_back("selecting " + team + " " + std::to_string(pick));
    });
    auto s4 = notifications.SubscribeClockUpdate(
        [&](const std::string& team, double) { log.push_back("clock " + team); });
    auto s5 = notifications.SubscribeAutodraftChanged([&](const std::string& team, bool enabled) {
        log.push_back("autodraft " + team + (enabled ? " on" : " off"));
    });
    auto s6 = notifications.SubscribeDraftCompleted(
        [&](size_t total) { log.push_back("completed " + std::to_string(total)); });
    auto s7 = notifications.SubscribeStateRecovered(
        [&](long long index) { log.push_back("recovered " + std::to_string(index)); });
    auto s8 = notifications.SubscribeConnectionState(
        [&](ConnectionState, ConnectionState now) {
            log.push_back(now == ConnectionState::CONNECTED ? "connected" : "other");
        });
    auto s9 = notifications.SubscribePicksMissed(
        [&](int missed) { log.push_back("missed " + std::to_string(missed)); });

    REQUIRE(notifications.SubscriberCount() == 9);

    notifications.NotifyPickProcessed(MakePick(4, "p4"), false);
    notifications.NotifyPickUpdated(MakePick(4, "p4"));
    notifications.NotifyTeamSelecting("6", 5, 90.0);
    notifications.NotifyClockUpdate("6", 30.0);
    notifications.NotifyAutodraftChanged("6", true);
    notifications.NotifyDraftCompleted(192);
    notifications.NotifyStateRecovered(-2);
    notifications.NotifyConnectionState(ConnectionState::CONNECTING, ConnectionState::CONNECTED);
    notifications.NotifyPicksMissed(3);

    REQUIRE(log == std::vector<std::string>{"processed p4 pending", "updated p4", "selecting 6 5",
                                            "clock 6", "autodraft 6 on", "completed 192",
                                            "recovered -2", "connected", "missed 3"});
}

TEST_CASE("Notifications - multiple subscribers all receive the event", "[notifications]") {
    DraftNotifications notifications;
    int first = 0;
    int second = 0;
    auto a = notifications.SubscribeDraftCompleted([&](size_t) { first++; });
    auto b = notifications.SubscribeDraftCompleted([&](size_t) { second++; });

    notifications.NotifyDraftCompleted(12);
    notifications.NotifyDraftCompleted(12);

    REQUIRE(first == 2);
    REQUIRE(second == 2);
}

TEST_CASE("Notifications - Subscription RAII cleanup", "[notifications]") {
    DraftNotifications notifications;
    int callback_count = 0;

    {
        auto sub = notifications.SubscribeClockUpdate(
            [&](const std::string&, double) { callback_count++; });
        notifications.NotifyClockUpdate("1", 10.0);
        REQUIRE(callback_count == 1);
        REQUIRE(notifications.SubscriberCount() == 1);
        // Subscription goes out of scope here
    }

    REQUIRE(notifications.SubscriberCount() == 0);
    notifications.NotifyClockUpdate("1", 9.0);
    REQUIRE(callback_count == 1);
}

TEST_CASE("Notifications - Subscription move and explicit unsubscribe", "[notifications]") {
    DraftNotifications notifications;
    int calls = 0;

    DraftNotifications::Subscription outer;
    {
        auto inner = notifications.SubscribePicksMissed([&](int) { calls++; });
        outer = std::move(inner);
        // inner is now empty, its destruction must not unsubscribe
    }
    notifications.NotifyPicksMissed(1);
    REQUIRE(calls == 1);

    DraftNotifications::Subscription moved(std::move(outer));
    notifications.NotifyPicksMissed(1);
    REQUIRE(calls == 2);

    moved.Unsubscribe();
    moved.Unsubscribe();
    notifications.NotifyPicksMissed(1);
    REQUIRE(calls == 2);
    REQUIRE(notifications.SubscriberCount() == 0);
}

TEST_CASE("Notifications - events without subscribers are dropped", "[notifications]") {
    DraftNotifications notifications;
    int picks = 0;
    auto sub = notifications.SubscribePickProcessed([&](const Pick&, bool) { picks++; });

    // Only the PickProcessed slot is populated on this entry
    notifications.NotifyClockUpdate("1", 5.0);
    notifications.NotifyDraftCompleted(10);
    REQUIRE(picks == 0);

    notifications.NotifyPickProcessed(MakePick(1, "p1"), true);
    REQUIRE(picks == 1);
}
