// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "draft/consistency_validator.hpp"
#include "draft/draft_state.hpp"
#include "draft/event_processor.hpp"
#include "draft/notifications.hpp"
#include "draft/player_resolution.hpp"
#include <algorithm>
#include <atomic>
#include <stdexcept>

using namespace draftops::draft;

namespace {

// Directory that counts lookups and fails for one id
class CountingDirectory : public PlayerDirectory {
public:
    explicit CountingDirectory(std::vector<PlayerInfo> players) : inner_(players) {}

    std::optional<PlayerInfo> Lookup(const std::string& player_id) override {
        lookups++;
        if (player_id == "broken") {
            throw std::runtime_error("directory timeout");
        }
        return inner_.Lookup(player_id);
    }

    std::atomic<int> lookups{0};

private:
    StaticPlayerDirectory inner_;
};

PlayerInfo Info(const std::string& id, const std::string& name, const std::string& position) {
    PlayerInfo info;
    info.id = id;
    info.name = name;
    info.position = position;
    return info;
}

DraftSession TestSession() {
    DraftSession session;
    session.league_id = "league-1";
    session.team_id = "1";
    session.team_count = 4;
    session.rounds = 4;
    return session;
}

bool RosterHas(const RosterView& roster, const std::string& slot, const std::string& id) {
    const auto& players = roster.at(slot);
    return std::find(players.begin(), players.end(), id) != players.end();
}

} // namespace

TEST_CASE("StaticPlayerDirectory - lookup", "[resolver]") {
    StaticPlayerDirectory directory({Info("p1", "Alpha", "QB")});
    REQUIRE(directory.Size() == 1);
    REQUIRE(directory.Lookup("p1")->name == "Alpha");
    REQUIRE_FALSE(directory.Lookup("p2").has_value());

    directory.Add(Info("p2", "Bravo", "K"));
    REQUIRE(directory.Size() == 2);
    REQUIRE(directory.Lookup("p2")->position == "K");
}

TEST_CASE("PlaceholderPlayer - stand-in identity", "[resolver]") {
    auto info = PlaceholderPlayer("4046");
    REQUIRE(info.name == "Player #4046");
    REQUIRE(info.position == slots::BENCH);
    REQUIRE(info.placeholder);
    REQUIRE(info.ToJson()["placeholder"] == true);
}

TEST_CASE("PlayerResolutionService - background patching", "[resolver]") {
    auto directory = std::make_shared<CountingDirectory>(std::vector<PlayerInfo>{
        Info("p1", "Alpha", "D/ST"), Info("p2", "Bravo", "rb"), Info("p3", "Charlie", "WR")});

    DraftStateStore store(TestSession());
    store.InitializePlayerPool({"p1", "p2", "p3", "p4", "broken"});
    DraftNotifications notifications;
    PlayerResolutionService::Config config;
    config.batch_size = 2;
    PlayerResolutionService resolver(directory, store, notifications, config);
    resolver.Start();

    std::vector<Pick> updated;
    auto sub = notifications.SubscribePickUpdated([&](const Pick& pick) { updated.push_back(pick); });

    SECTION("Unresolved picks are patched in place") {
        REQUIRE(store.ApplyPick("p1", "1", 1, slots::BENCH));
        notifications.NotifyPickProcessed(*store.FindPick("p1"), false);
        REQUIRE(store.ApplyPick("p2", "2", 2, slots::BENCH));
        notifications.NotifyPickProcessed(*store.FindPick("p2"), false);
        REQUIRE(store.ApplyPick("p3", "3", 3, slots::BENCH));
        notifications.NotifyPickProcessed(*store.FindPick("p3"), false);
        resolver.Flush();

        REQUIRE(store.FindPick("p1")->position == slots::DST);
        REQUIRE(RosterHas(store.GetMyRoster(), slots::DST, "p1"));
        REQUIRE(store.GetMyRoster().at(slots::BENCH).empty());
        REQUIRE(RosterHas(*store.GetRoster("2"), slots::RB, "p2"));
        REQUIRE(updated.size() == 3);

        REQUIRE(resolver.ResolvePosition("p1") == std::optional<std::string>(slots::DST));
        REQUIRE(resolver.ResolvePosition("p2") == std::optional<std::string>(slots::RB));

        auto stats = resolver.GetStats();
        REQUIRE(stats.queued == 3);
        REQUIRE(stats.resolved == 3);
        REQUIRE(stats.patched == 3);
        REQUIRE(stats.pending == 0);
        REQUIRE(stats.cache_size == 3);
    }

    SECTION("Resolved picks are not queued") {
        REQUIRE(store.ApplyPick("p1", "1", 1, slots::QB));
        notifications.NotifyPickProcessed(*store.FindPick("p1"), true);
        resolver.Flush();
        REQUIRE(directory->lookups == 0);
        REQUIRE(resolver.GetStats().queued == 0);
    }

    SECTION("Unknown and failing ids become placeholders and are not retried") {
        REQUIRE(store.ApplyPick("p4", "2", 1, slots::BENCH));
        notifications.NotifyPickProcessed(*store.FindPick("p4"), false);
        REQUIRE(store.ApplyPick("broken", "3", 2, slots::BENCH));
        notifications.NotifyPickProcessed(*store.FindPick("broken"), false);
        resolver.Flush();

        REQUIRE(updated.empty());
        REQUIRE(resolver.GetCached("p4")->placeholder);
        REQUIRE(resolver.GetCached("broken")->name == "Player #broken");
        REQUIRE(resolver.GetStats().failed == 2);

        const int lookups = directory->lookups;
        resolver.Enqueue("p4");
        resolver.Flush();
        REQUIRE(directory->lookups == lookups);
    }

    SECTION("Ids queued twice are looked up once") {
        resolver.Enqueue("p3");
        resolver.Enqueue("p3");
        resolver.Flush();
        REQUIRE(directory->lookups == 1);
        // Not drafted, so cached but nothing patched
        REQUIRE(resolver.GetStats().patched == 0);
        REQUIRE(resolver.ResolvePosition("p3") == std::optional<std::string>(slots::WR));
    }

    SECTION("Describe performs a synchronous lookup and caches it") {
        REQUIRE_FALSE(resolver.GetCached("p2").has_value());
        auto info = resolver.Describe("p2");
        REQUIRE(info);
        REQUIRE(info->position == slots::RB);
        REQUIRE(resolver.GetCached("p2").has_value());
        REQUIRE_FALSE(resolver.Describe("nobody").has_value());
        REQUIRE_FALSE(resolver.Describe("broken").has_value());
    }

    SECTION("Nothing is accepted after shutdown") {
        resolver.Shutdown();
        resolver.Enqueue("p1");
        resolver.Flush();
        REQUIRE(resolver.GetStats().queued == 0);
        REQUIRE(directory->lookups == 0);
    }
}

TEST_CASE("PlayerResolutionService - wired behind the event processor", "[resolver][processor]") {
    auto directory = std::make_shared<StaticPlayerDirectory>(
        std::vector<PlayerInfo>{Info("4046", "Alpha", "QB"), Info("5000", "Bravo", "TE")});

    DraftStateStore store(TestSession());
    store.SetDraftOrder({"1", "2", "3", "4"});
    DraftNotifications notifications;
    ConsistencyValidator validator(store, &notifications);
    EventProcessor processor(store, validator, notifications);
    PlayerResolutionService resolver(directory, store, notifications);
    processor.SetPositionResolver(
        [&resolver](const std::string& id) { return resolver.ResolvePosition(id); });
    resolver.Start();

    // Cold cache: recorded on the bench, fixed up in the background
    REQUIRE(processor.ProcessFrame("SELECTED 1 4046 1"));
    resolver.Flush();
    REQUIRE(store.FindPick("4046")->position == slots::QB);
    REQUIRE(RosterHas(store.GetMyRoster(), slots::QB, "4046"));

    // Warm cache: resolved on the event path
    REQUIRE(resolver.Describe("5000"));
    bool resolved_inline = false;
    auto sub = notifications.SubscribePickProcessed(
        [&](const Pick&, bool resolved) { resolved_inline = resolved; });
    REQUIRE(processor.ProcessFrame("SELECTED 2 5000 2"));
    REQUIRE(resolved_inline);
    REQUIRE(store.FindPick("5000")->position == slots::TE);

    REQUIRE(validator.Validate().IsValid());
    resolver.Shutdown();
}
