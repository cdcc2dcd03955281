// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// End-to-end draft runs through the frame pipeline

#include <catch2/catch_test_macros.hpp>
#include "draft/consistency_validator.hpp"
#include "draft/draft_state.hpp"
#include "draft/event_processor.hpp"
#include "draft/notifications.hpp"
#include "draft/player_resolution.hpp"
#include "draft/snake_order.hpp"
#include <set>

using namespace draftops::draft;

namespace {

constexpr int TEAMS = 12;
constexpr int ROUNDS = 4;
const char* POSITIONS[] = {"QB", "RB", "WR", "TE", "K", "D/ST"};

struct Scenario {
    Scenario()
        : store(Session()),
          validator(store, &notifications),
          processor(store, validator, notifications),
          resolver(Directory(), store, notifications) {
        std::vector<std::string> order;
        for (int t = 1; t <= TEAMS; ++t) {
            order.push_back(std::to_string(t));
        }
        store.SetDraftOrder(order);

        std::vector<std::string> pool;
        for (int i = 1; i <= TEAMS * ROUNDS + 20; ++i) {
            pool.push_back(std::to_string(1000 + i));
        }
        store.InitializePlayerPool(pool);

        processor.SetPositionResolver(
            [this](const std::string& id) { return resolver.ResolvePosition(id); });
        resolver.Start();
    }

    static DraftSession Session() {
        DraftSession session;
        session.league_id = "scenario";
        session.team_id = "7";
        session.team_count = TEAMS;
        session.rounds = ROUNDS;
        return session;
    }

    static std::shared_ptr<PlayerDirectory> Directory() {
        auto directory = std::make_shared<StaticPlayerDirectory>();
        for (int i = 1; i <= TEAMS * ROUNDS + 20; ++i) {
            PlayerInfo info;
            info.id = std::to_string(1000 + i);
            info.name = "Player " + info.id;
            info.position = POSITIONS[i % 6];
            directory->Add(info);
        }
        return directory;
    }

    // Feed one full pick: on the clock, a clock tick, then the selection
    void RunPick(int pick) {
        auto team = SnakeDraftCalculator::SlotForPick(TEAMS, pick);
        REQUIRE(team);
        const std::string team_id = std::to_string(*team + 1);
        REQUIRE(processor.ProcessFrame("SELECTING " + team_id + " 90000"));
        REQUIRE(processor.ProcessFrame("CLOCK " + team_id + " 30000"));
        REQUIRE(processor.ProcessFrame("SELECTED " + team_id + " " + std::to_string(1000 + pick) +
                                       " " + std::to_string(pick)));
    }

    DraftStateStore store;
    DraftNotifications notifications;
    ConsistencyValidator validator;
    EventProcessor processor;
    PlayerResolutionService resolver;
};

} // namespace

TEST_CASE("Scenario - full snake draft to completion", "[draft][scenario]") {
    Scenario s;

    std::vector<int> our_turns;
    size_t completed_total = 0;
    auto selecting = s.notifications.SubscribeTeamSelecting(
        [&](const std::string& team, int pick, double) {
            if (team == "7") our_turns.push_back(pick);
        });
    auto completed = s.notifications.SubscribeDraftCompleted(
        [&](size_t total) { completed_total = total; });

    for (int pick = 1; pick <= TEAMS * ROUNDS; ++pick) {
        s.RunPick(pick);
        if (pick % TEAMS == 0) {
            s.resolver.Flush();
            REQUIRE(s.validator.Validate().IsValid());
        }
    }
    s.resolver.Flush();

    REQUIRE(completed_total == static_cast<size_t>(TEAMS * ROUNDS));
    REQUIRE(s.store.GetStatus() == DraftStatus::COMPLETED);
    REQUIRE(s.store.DraftedCount() == static_cast<size_t>(TEAMS * ROUNDS));
    REQUIRE(s.store.GetAvailablePlayers().size() == 20);

    // Team 7 picks at 7, 18, 31 and 42
    REQUIRE(our_turns == std::vector<int>{7, 18, 31, 42});
    REQUIRE(s.store.GetMyPickNumbers() == our_turns);
    REQUIRE(RosterSize(s.store.GetMyRoster()) == ROUNDS);

    // Every roster has one player per round, and every player was patched
    // out of the bench once resolved
    for (const auto& [team, roster] : s.store.GetOtherRosters()) {
        REQUIRE(RosterSize(roster) == static_cast<size_t>(ROUNDS));
        REQUIRE(roster.at(slots::BENCH).empty());
    }
    REQUIRE(s.store.GetMyRoster().at(slots::BENCH).empty());

    auto result = s.validator.Validate();
    REQUIRE(result.IsValid());
    REQUIRE(result.Warnings().empty());

    auto stats = s.processor.GetStats();
    REQUIRE(stats.selected == static_cast<uint64_t>(TEAMS * ROUNDS));
    REQUIRE(stats.parse_errors == 0);
    REQUIRE(stats.state_errors == 0);
    REQUIRE(s.validator.GetStats().state_recoveries == 0);
}

TEST_CASE("Scenario - feed noise does not disturb the draft", "[draft][scenario]") {
    Scenario s;

    for (int pick = 1; pick <= TEAMS; ++pick) {
        s.RunPick(pick);
        REQUIRE(s.processor.ProcessFrame("PING"));
        REQUIRE_FALSE(s.processor.ProcessFrame("SELECTED garbage"));
        // Replayed selection of an already drafted player
        REQUIRE_FALSE(s.processor.ProcessFrame("SELECTED 1 1001 1"));
    }
    s.resolver.Flush();

    REQUIRE(s.store.DraftedCount() == static_cast<size_t>(TEAMS));
    REQUIRE(s.store.GetCurrentPick() == TEAMS);
    REQUIRE(s.validator.Validate().IsValid());

    auto stats = s.processor.GetStats();
    REQUIRE(stats.parse_errors == static_cast<uint64_t>(TEAMS));
    REQUIRE(stats.pick_rejections == static_cast<uint64_t>(TEAMS));
}

TEST_CASE("Scenario - state export reflects the draft", "[draft][scenario]") {
    Scenario s;
    for (int pick = 1; pick <= 8; ++pick) {
        s.RunPick(pick);
    }
    s.resolver.Flush();

    auto j = s.store.ToJson();
    REQUIRE(j["league_id"] == "scenario");
    REQUIRE(j["current_pick"] == 8);
    REQUIRE(j["picks_until_next"] == 10);
    REQUIRE(j["pick_history"].size() == 8);
    REQUIRE(j["my_pick_numbers"].size() == static_cast<size_t>(ROUNDS));
    REQUIRE(j["draft_status"] == "IN_PROGRESS");
    // Pick 7 belongs to us and has been patched to its real position
    REQUIRE(j["pick_history"][6]["team_id"] == "7");
    REQUIRE(j["pick_history"][6]["position"] != "BENCH");
}

TEST_CASE("Scenario - two picks from a clean start", "[draft][scenario]") {
    DraftSession session;
    session.league_id = "two-picks";
    session.team_id = "1";
    session.team_count = 2;
    session.rounds = 8;

    DraftStateStore store(session);
    DraftNotifications notifications;
    ConsistencyValidator validator(store, &notifications);
    EventProcessor processor(store, validator, notifications);
    store.InitializePlayerPool({"P1", "P2"});

    REQUIRE(processor.ProcessFrame("SELECTING 1 30000"));
    REQUIRE(processor.ProcessFrame("SELECTED 1 P1 1"));
    REQUIRE(processor.ProcessFrame("SELECTING 2 30000"));
    REQUIRE(processor.ProcessFrame("SELECTED 2 P2 2"));

    auto history = store.GetPickHistory();
    REQUIRE(history.size() == 2);
    REQUIRE(history[0].team_id == "1");
    REQUIRE(history[0].player_id == "P1");
    REQUIRE(history[0].pick_number == 1);
    REQUIRE(history[1].team_id == "2");
    REQUIRE(history[1].player_id == "P2");
    REQUIRE(history[1].pick_number == 2);

    REQUIRE(store.GetAvailablePlayers().empty());
    REQUIRE(store.GetCurrentPick() == 2);
    REQUIRE(validator.Validate().IsValid());
    REQUIRE(validator.GetStats().state_recoveries == 0);
}

TEST_CASE("Scenario - team on the clock is not an inconsistency", "[draft][scenario]") {
    DraftSession session;
    session.league_id = "on-the-clock";
    session.team_id = "2";
    session.team_count = 4;
    session.rounds = 2;

    DraftStateStore store(session);
    DraftNotifications notifications;
    ConsistencyValidator validator(store, &notifications);
    EventProcessor processor(store, validator, notifications);
    store.InitializePlayerPool({"a", "b", "c", "d"});
    store.SetDraftOrder({"1", "2", "3", "4"});

    // Nothing drafted yet, first team selecting
    REQUIRE(processor.ProcessFrame("SELECTING 1 90000"));
    REQUIRE(store.GetCurrentPick() == 1);
    REQUIRE(store.DraftedCount() == 0);
    REQUIRE(validator.Validate().IsValid());

    // One pick made, the next one in progress
    REQUIRE(processor.ProcessFrame("SELECTED 1 a 1"));
    REQUIRE(processor.ProcessFrame("SELECTING 2 90000"));
    REQUIRE(store.GetCurrentPick() == 2);
    REQUIRE(store.GetPickHistory().size() == 1);

    auto result = validator.Validate();
    REQUIRE(result.IsValid());
    REQUIRE(result.Errors().empty());

    // Self-heal leaves the in-progress pick alone
    auto healed = validator.ValidateAndHeal();
    REQUIRE(healed.IsValid());
    REQUIRE(validator.GetStats().state_recoveries == 0);
    REQUIRE(store.GetCurrentPick() == 2);
}
