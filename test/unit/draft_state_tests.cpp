// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "draft/draft_state.hpp"
#include <algorithm>
#include <atomic>
#include <thread>

using namespace draftops::draft;

namespace {

DraftSession TestSession() {
    DraftSession session;
    session.league_id = "league-1";
    session.team_id = "5";
    session.team_count = 12;
    session.rounds = 5;
    return session;
}

std::vector<std::string> TeamIds(int count) {
    std::vector<std::string> ids;
    for (int i = 1; i <= count; ++i) {
        ids.push_back(std::to_string(i));
    }
    return ids;
}

std::vector<std::string> PlayerIds(int count) {
    std::vector<std::string> ids;
    for (int i = 1; i <= count; ++i) {
        ids.push_back("p" + std::to_string(i));
    }
    return ids;
}

bool Contains(const std::vector<std::string>& ids, const std::string& id) {
    return std::find(ids.begin(), ids.end(), id) != ids.end();
}

} // namespace

TEST_CASE("DraftStateStore - setup", "[draft][state]") {
    DraftStateStore store(TestSession());

    SECTION("Fresh store is waiting with an empty roster") {
        REQUIRE(store.GetStatus() == DraftStatus::WAITING);
        REQUIRE(store.GetCurrentPick() == 0);
        REQUIRE(store.DraftedCount() == 0);
        REQUIRE(RosterSize(store.GetMyRoster()) == 0);
        REQUIRE(store.GetMyRoster().count(slots::BENCH) == 1);
        REQUIRE(store.SnapshotCount() == 0);
    }

    SECTION("Player pool keeps board order") {
        store.InitializePlayerPool({"c", "a", "b"});
        REQUIRE(store.GetAvailablePlayers() == std::vector<std::string>{"c", "a", "b"});
        REQUIRE(store.GetAvailablePlayers({}, 2) == std::vector<std::string>{"c", "a"});
        auto filtered = store.GetAvailablePlayers([](const std::string& id) { return id != "a"; });
        REQUIRE(filtered == std::vector<std::string>{"c", "b"});
    }

    SECTION("Draft order precomputes our picks") {
        REQUIRE(store.SetDraftOrder(TeamIds(12)));
        REQUIRE(store.GetMyPickNumbers() == std::vector<int>{5, 20, 29, 44, 53});
        REQUIRE(store.GetPicksUntilNext() == 5);
        REQUIRE(store.GetDraftOrder().size() == 12);
    }

    SECTION("Draft order without our team") {
        REQUIRE_FALSE(store.SetDraftOrder({"1", "2", "3"}));
        REQUIRE(store.GetMyPickNumbers().empty());
        REQUIRE(store.GetDraftOrder() == std::vector<std::string>{"1", "2", "3"});
    }
}

TEST_CASE("DraftStateStore - ApplyPick", "[draft][state]") {
    DraftStateStore store(TestSession());
    store.InitializePlayerPool(PlayerIds(20));
    store.SetDraftOrder(TeamIds(12));

    SECTION("Pick by another team") {
        REQUIRE(store.ApplyPick("p1", "1", 1, "RB"));

        REQUIRE(store.IsDrafted("p1"));
        REQUIRE_FALSE(Contains(store.GetAvailablePlayers(), "p1"));
        REQUIRE(store.GetCurrentPick() == 1);
        REQUIRE(store.GetPicksUntilNext() == 4);

        auto roster = store.GetRoster("1");
        REQUIRE(roster.has_value());
        REQUIRE(roster->at("RB") == std::vector<std::string>{"p1"});
        REQUIRE(RosterSize(store.GetMyRoster()) == 0);

        auto history = store.GetPickHistory();
        REQUIRE(history.size() == 1);
        REQUIRE(history[0].pick_number == 1);
        REQUIRE(history[0].team_id == "1");
        REQUIRE(history[0].position == "RB");
    }

    SECTION("Pick by the tracked team lands in my roster") {
        REQUIRE(store.ApplyPick("p2", "5", 5, "wr"));
        REQUIRE(store.GetMyRoster().at("WR") == std::vector<std::string>{"p2"});
        REQUIRE(store.GetOtherRosters().empty());
        REQUIRE(store.GetStats().my_picks == 1);
    }

    SECTION("Duplicate pick is rejected without a snapshot") {
        REQUIRE(store.ApplyPick("p1", "1", 1, "RB"));
        const size_t snapshots = store.SnapshotCount();
        const auto before = store.GetState();

        REQUIRE_FALSE(store.ApplyPick("p1", "2", 2, "RB"));
        REQUIRE(store.SnapshotCount() == snapshots);
        REQUIRE(store.GetState() == before);
    }

    SECTION("Invalid arguments are rejected") {
        REQUIRE_FALSE(store.ApplyPick("", "1", 1, "RB"));
        REQUIRE_FALSE(store.ApplyPick("p1", "", 1, "RB"));
        REQUIRE_FALSE(store.ApplyPick("p1", "1", 0, "RB"));
        REQUIRE(store.DraftedCount() == 0);
        REQUIRE(store.SnapshotCount() == 0);
    }

    SECTION("Unknown position goes to the bench") {
        REQUIRE(store.ApplyPick("p3", "2", 2, "LONGSNAPPER"));
        REQUIRE(store.GetRoster("2")->at(slots::BENCH) == std::vector<std::string>{"p3"});
        REQUIRE(store.FindPick("p3")->position == slots::BENCH);
    }

    SECTION("Player outside the pool is still recorded") {
        REQUIRE(store.ApplyPick("stranger", "3", 1, "QB"));
        REQUIRE(store.IsDrafted("stranger"));
        REQUIRE(store.GetAvailablePlayers().size() == 20);
    }

    SECTION("Recent picks are the newest, oldest first") {
        for (int i = 1; i <= 6; ++i) {
            REQUIRE(store.ApplyPick("p" + std::to_string(i), std::to_string(i), i, "RB"));
        }
        auto recent = store.GetRecentPicks(3);
        REQUIRE(recent.size() == 3);
        REQUIRE(recent.front().pick_number == 4);
        REQUIRE(recent.back().pick_number == 6);
        REQUIRE(store.GetRecentPicks(100).size() == 6);
    }
}

TEST_CASE("DraftStateStore - clock and status", "[draft][state]") {
    DraftStateStore store(TestSession());
    store.SetDraftOrder(TeamIds(12));

    SECTION("StartNewPick starts the draft") {
        REQUIRE(store.StartNewPick(1, "1", 90.0));
        REQUIRE(store.GetStatus() == DraftStatus::IN_PROGRESS);
        REQUIRE(store.GetOnTheClock() == "1");
        REQUIRE(store.GetTimeRemaining() == Catch::Approx(90.0));
        REQUIRE(store.GetCurrentPick() == 1);
    }

    SECTION("UpdateClock clamps and takes no snapshot") {
        REQUIRE(store.StartNewPick(1, "1", 90.0));
        const size_t snapshots = store.SnapshotCount();
        store.UpdateClock(12.5);
        REQUIRE(store.GetTimeRemaining() == Catch::Approx(12.5));
        store.UpdateClock(-3.0);
        REQUIRE(store.GetTimeRemaining() == Catch::Approx(0.0));
        REQUIRE(store.SnapshotCount() == snapshots);
    }

    SECTION("StartNewPick rejects bad arguments") {
        REQUIRE_FALSE(store.StartNewPick(0, "1", 90.0));
        REQUIRE_FALSE(store.StartNewPick(1, "", 90.0));
        REQUIRE(store.GetStatus() == DraftStatus::WAITING);
    }

    SECTION("CompleteDraft clears the clock") {
        REQUIRE(store.StartNewPick(1, "1", 90.0));
        store.CompleteDraft();
        REQUIRE(store.GetStatus() == DraftStatus::COMPLETED);
        REQUIRE(store.GetOnTheClock().empty());
        REQUIRE(store.GetTimeRemaining() == Catch::Approx(0.0));
    }
}

TEST_CASE("DraftStateStore - PatchRosterPosition", "[draft][state]") {
    DraftStateStore store(TestSession());
    store.InitializePlayerPool(PlayerIds(5));
    REQUIRE(store.ApplyPick("p1", "2", 1, slots::BENCH));

    SECTION("Moves the player and updates history") {
        const size_t snapshots = store.SnapshotCount();
        REQUIRE(store.PatchRosterPosition("p1", "TE"));
        auto roster = *store.GetRoster("2");
        REQUIRE(roster.at("TE") == std::vector<std::string>{"p1"});
        REQUIRE(roster.at(slots::BENCH).empty());
        REQUIRE(store.FindPick("p1")->position == "TE");
        REQUIRE(store.SnapshotCount() == snapshots + 1);
    }

    SECTION("Same position is a no-op without a snapshot") {
        const size_t snapshots = store.SnapshotCount();
        REQUIRE(store.PatchRosterPosition("p1", "bench"));
        REQUIRE(store.SnapshotCount() == snapshots);
    }

    SECTION("Undrafted player or unknown position fails") {
        REQUIRE_FALSE(store.PatchRosterPosition("p2", "QB"));
        REQUIRE_FALSE(store.PatchRosterPosition("p1", "GOALIE"));
    }
}

TEST_CASE("DraftStateStore - JSON export", "[draft][state]") {
    DraftStateStore store(TestSession());
    store.InitializePlayerPool(PlayerIds(3));
    store.SetDraftOrder(TeamIds(12));
    REQUIRE(store.StartNewPick(1, "1", 60.0));
    REQUIRE(store.ApplyPick("p1", "1", 1, "QB"));

    auto j = store.ToJson();
    REQUIRE(j["league_id"] == "league-1");
    REQUIRE(j["team_id"] == "5");
    REQUIRE(j["current_pick"] == 1);
    REQUIRE(j["draft_status"] == DraftStatusToString(DraftStatus::IN_PROGRESS));
    REQUIRE(j["pick_history"].size() == 1);
    REQUIRE(j["pick_history"][0]["player_id"] == "p1");
    REQUIRE(j["other_rosters"]["1"]["QB"][0] == "p1");
    REQUIRE(j["my_pick_numbers"].size() == 5);
    REQUIRE(j["snapshots_count"] == 2);

    auto stats = store.GetStats().ToJson();
    REQUIRE(stats["total_picks"] == 1);
    REQUIRE(stats["available_players"] == 2);
}

TEST_CASE("DraftStateStore - concurrent readers see whole picks", "[draft][state][threading]") {
    DraftStateStore store(TestSession());
    store.InitializePlayerPool(PlayerIds(200));

    std::atomic<bool> done{false};
    std::atomic<int> torn{0};

    std::thread reader([&] {
        while (!done.load()) {
            auto state = store.GetState();
            if (state.drafted_players.size() != state.pick_history.size() ||
                state.available_players.size() + state.drafted_players.size() != 200) {
                torn++;
            }
        }
    });

    for (int i = 1; i <= 200; ++i) {
        REQUIRE(store.ApplyPick("p" + std::to_string(i), std::to_string((i % 12) + 1), i, "RB"));
    }
    done = true;
    reader.join();

    REQUIRE(torn == 0);
    REQUIRE(store.DraftedCount() == 200);
}
