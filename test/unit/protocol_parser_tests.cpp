// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "protocol/event.hpp"
#include "protocol/event_dispatcher.hpp"

using namespace draftops::protocol;

namespace {

template <typename T>
const T& As(const std::unique_ptr<Event>& event) {
    REQUIRE(event != nullptr);
    const T* typed = dynamic_cast<const T*>(event.get());
    REQUIRE(typed != nullptr);
    return *typed;
}

} // namespace

TEST_CASE("ParseFrame - SELECTED", "[protocol][parser]") {
    SECTION("Three arguments") {
        auto event = ParseFrame("SELECTED 3 4046 17");
        const auto& selected = As<SelectedEvent>(event);
        REQUIRE(selected.team_id == 3);
        REQUIRE(selected.player_id == "4046");
        REQUIRE(selected.pick_number == 17);
        REQUIRE_FALSE(selected.member_id.has_value());
        REQUIRE(selected.raw() == "SELECTED 3 4046 17");
    }

    SECTION("Optional member id") {
        auto event = ParseFrame("SELECTED 3 4046 17 member-9");
        const auto& selected = As<SelectedEvent>(event);
        REQUIRE(selected.member_id.has_value());
        REQUIRE(*selected.member_id == "member-9");
    }

    SECTION("Verb is case-insensitive and whitespace is collapsed") {
        auto event = ParseFrame("  selected\t3   4046 17 ");
        REQUIRE(event->command() == commands::SELECTED);
        REQUIRE(As<SelectedEvent>(event).pick_number == 17);
    }

    SECTION("Wrong arity throws ParseError") {
        REQUIRE_THROWS_AS(ParseFrame("SELECTED 3 4046"), ParseError);
        REQUIRE_THROWS_AS(ParseFrame("SELECTED 3 4046 17 m extra"), ParseError);
    }

    SECTION("Non-numeric fields throw ParseError") {
        REQUIRE_THROWS_AS(ParseFrame("SELECTED x 4046 17"), ParseError);
        REQUIRE_THROWS_AS(ParseFrame("SELECTED 3 4046 seventeen"), ParseError);
        REQUIRE_THROWS_AS(ParseFrame("SELECTED 3 4046 17x"), ParseError);
    }

    SECTION("Pick number must be positive and bounded") {
        REQUIRE_THROWS_AS(ParseFrame("SELECTED 3 4046 0"), ParseError);
        REQUIRE_THROWS_AS(ParseFrame("SELECTED 3 4046 -1"), ParseError);
        REQUIRE_THROWS_AS(ParseFrame("SELECTED 3 4046 100001"), ParseError);
    }

    SECTION("ParseError names the command") {
        try {
            ParseFrame("SELECTED 3");
            FAIL("expected ParseError");
        } catch (const ParseError& e) {
            REQUIRE(e.command() == commands::SELECTED);
        }
    }
}

TEST_CASE("ParseFrame - SELECTING and CLOCK", "[protocol][parser]") {
    SECTION("SELECTING") {
        auto event = ParseFrame("SELECTING 7 90000");
        const auto& selecting = As<SelectingEvent>(event);
        REQUIRE(selecting.team_id == 7);
        REQUIRE(selecting.time_limit_ms == 90000);
    }

    SECTION("SELECTING rejects bad arity and values") {
        REQUIRE_THROWS_AS(ParseFrame("SELECTING 7"), ParseError);
        REQUIRE_THROWS_AS(ParseFrame("SELECTING 7 -5"), ParseError);
        REQUIRE_THROWS_AS(ParseFrame("SELECTING 7 90000 1"), ParseError);
    }

    SECTION("CLOCK with and without round") {
        auto event = ParseFrame("CLOCK 7 45000");
        REQUIRE(As<ClockEvent>(event).time_remaining_ms == 45000);
        REQUIRE_FALSE(As<ClockEvent>(event).round.has_value());

        auto with_round = ParseFrame("CLOCK 7 45000 3");
        REQUIRE(As<ClockEvent>(with_round).round.value() == 3);
    }

    SECTION("CLOCK rejects a day or more of remaining time") {
        REQUIRE_THROWS_AS(ParseFrame("CLOCK 7 86400001"), ParseError);
    }
}

TEST_CASE("ParseFrame - AUTODRAFT", "[protocol][parser]") {
    REQUIRE(As<AutodraftEvent>(ParseFrame("AUTODRAFT 2 true")).enabled);
    REQUIRE(As<AutodraftEvent>(ParseFrame("AUTODRAFT 2 1")).enabled);
    REQUIRE_FALSE(As<AutodraftEvent>(ParseFrame("AUTODRAFT 2 false")).enabled);
    REQUIRE_THROWS_AS(ParseFrame("AUTODRAFT 2 maybe"), ParseError);
    REQUIRE_THROWS_AS(ParseFrame("AUTODRAFT 2"), ParseError);
}

TEST_CASE("ParseFrame - session and unknown frames", "[protocol][parser]") {
    SECTION("Session commands keep their payload") {
        auto event = ParseFrame("TOKEN abc def");
        REQUIRE(event->command() == commands::TOKEN);
        REQUIRE(As<SessionEvent>(event).payload == std::vector<std::string>{"abc", "def"});

        REQUIRE(ParseFrame("PING")->command() == commands::PING);
        REQUIRE(ParseFrame("pong")->command() == commands::PONG);
        REQUIRE(ParseFrame("JOINED 4")->command() == commands::JOINED);
        REQUIRE(ParseFrame("LEFT 4")->command() == commands::LEFT);
    }

    SECTION("Unrecognised verb is not an error") {
        auto event = ParseFrame("FOO 1 2 3");
        REQUIRE(event->command() == commands::UNKNOWN);
        REQUIRE(As<UnknownEvent>(event).verb == "FOO");
    }

    SECTION("Blank frame") {
        auto event = ParseFrame("   ");
        REQUIRE(event->command() == commands::UNKNOWN);
        REQUIRE(As<UnknownEvent>(event).verb.empty());
    }

    SECTION("Oversized frame throws") {
        std::string huge = "PING " + std::string(MAX_FRAME_LENGTH, 'x');
        REQUIRE_THROWS_AS(ParseFrame(huge), ParseError);
    }
}

TEST_CASE("EventDispatcher - routing", "[protocol][dispatcher]") {
    EventDispatcher dispatcher;
    int selected_calls = 0;

    dispatcher.RegisterHandler(commands::SELECTED, [&](const Event& e) {
        selected_calls++;
        return static_cast<const SelectedEvent&>(e).pick_number > 0;
    });

    REQUIRE(dispatcher.HasHandler(commands::SELECTED));
    REQUIRE_FALSE(dispatcher.HasHandler(commands::CLOCK));

    SECTION("Dispatch calls the registered handler") {
        auto event = ParseFrame("SELECTED 1 100 1");
        REQUIRE(dispatcher.Dispatch(*event));
        REQUIRE(selected_calls == 1);
    }

    SECTION("No handler returns false") {
        auto event = ParseFrame("CLOCK 1 1000");
        REQUIRE_FALSE(dispatcher.Dispatch(*event));
    }

    SECTION("Unregister removes the handler") {
        dispatcher.UnregisterHandler(commands::SELECTED);
        auto event = ParseFrame("SELECTED 1 100 1");
        REQUIRE_FALSE(dispatcher.Dispatch(*event));
        REQUIRE(selected_calls == 0);
    }

    SECTION("Registered commands are listed") {
        dispatcher.RegisterHandler(commands::CLOCK, [](const Event&) { return true; });
        auto commands_list = dispatcher.GetRegisteredCommands();
        REQUIRE(commands_list == std::vector<std::string>{"CLOCK", "SELECTED"});
    }
}
