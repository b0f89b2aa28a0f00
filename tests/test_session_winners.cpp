/// @file test_session_winners.cpp
/// @brief Tests for the session winners list

#include <catch2/catch_test_macros.hpp>

#include "session/session_winners.hpp"

#include <chrono>
#include <string>

using namespace drawreel;

namespace {

Participant make_participant(const std::string& ticket) {
    return {"Winner", ticket, ticket};
}

WallClock::time_point at_second(int s) {
    return WallClock::time_point{} + std::chrono::seconds(s);
}

} // namespace

TEST_CASE("Winners are listed newest first", "[session]") {
    SessionWinners winners;
    CHECK(winners.empty());

    winners.record(make_participant("7"), "50 participants", at_second(10));
    winners.record(make_participant("12"), "50 participants", at_second(20));
    winners.record(make_participant("3"), "10 participants", at_second(30));

    REQUIRE(winners.size() == 3);
    CHECK(winners.entries()[0].participant.ticket_number == "3");
    CHECK(winners.entries()[0].roster == "10 participants");
    CHECK(winners.entries()[0].drawn_at == at_second(30));
    CHECK(winners.entries()[2].participant.ticket_number == "7");
    CHECK(winners.total_drawn() == 3);
}

TEST_CASE("Oldest winners drop out beyond capacity", "[session]") {
    SessionWinners winners(3);
    for (int i = 1; i <= 5; i++) {
        winners.record(make_participant(std::to_string(i)), "roster", at_second(i));
    }

    REQUIRE(winners.size() == 3);
    CHECK(winners.entries().front().participant.ticket_number == "5");
    CHECK(winners.entries().back().participant.ticket_number == "3");
    CHECK(winners.total_drawn() == 5);

    winners.clear();
    CHECK(winners.empty());
    CHECK(winners.total_drawn() == 0);
}

TEST_CASE("Zero capacity still keeps the latest winner", "[session]") {
    SessionWinners winners(0);
    winners.record(make_participant("1"), "roster", at_second(1));
    winners.record(make_participant("2"), "roster", at_second(2));

    REQUIRE(winners.size() == 1);
    CHECK(winners.entries().front().participant.ticket_number == "2");
}

TEST_CASE("Entries keep their own copy of the participant", "[session]") {
    SessionWinners winners;
    {
        Participant transient = make_participant("42");
        winners.record(transient, "roster", at_second(0));
        transient.first_name = "Changed";
    }
    CHECK(winners.entries().front().participant.first_name == "Winner");
    CHECK(winners.entries().front().participant.display_name() == "Winner 42");
}

TEST_CASE("Time of day is formatted as HH:MM:SS", "[session]") {
    std::string text = format_time_of_day(WallClock::now());
    REQUIRE(text.size() == 8);
    CHECK(text[2] == ':');
    CHECK(text[5] == ':');
}
