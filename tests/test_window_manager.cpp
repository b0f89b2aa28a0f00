/// @file test_window_manager.cpp
/// @brief Tests for initial and winner-centered window construction

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include "participants/demo_roster.hpp"
#include "windowing/window_manager.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace drawreel;

namespace {

/// n participants holding plain tickets 1..n, already in ticket order
ParticipantIndex build_plain_index(std::size_t n) {
    std::vector<Participant> participants;
    participants.reserve(n);
    for (std::size_t i = 1; i <= n; i++) {
        participants.push_back({"P", std::to_string(i), std::to_string(i)});
    }
    return ParticipantIndex::build(std::move(participants));
}

bool same_ordering(const Window& a, const Window& b) {
    return a.entries == b.entries;
}

} // namespace

// ---------- Initial window ----------

TEST_CASE("Initial window always has capacity entries", "[window]") {
    std::size_t n = GENERATE(1, 2, 7, 99, 100, 101, 250, 5000);
    ParticipantIndex index = build_plain_index(n);

    INFO("n=" << n);
    WindowPtr window = make_initial_window(index, 100);
    REQUIRE(window != nullptr);
    CHECK(window->size() == 100);
}

TEST_CASE("Scenario A: small index is padded by repetition", "[window]") {
    ParticipantIndex index = build_plain_index(10);
    const auto& all = index.participants();

    WindowPtr initial = make_initial_window(index, 100);
    REQUIRE(initial->size() == 100);
    for (std::size_t i = 0; i < 100; i++) {
        CHECK(initial->entries[i] == &all[i % 10]);
    }

    WinnerWindow winner = make_winner_window(index, 100, "7");
    REQUIRE(winner.window->size() == 100);
    CHECK(same_ordering(*winner.window, *initial));
    REQUIRE(winner.winner_offset.has_value());
    CHECK(*winner.winner_offset == 6);
    CHECK((*winner.window)[*winner.winner_offset].ticket_number == "7");
}

TEST_CASE("Large index shows both ends of the ticket range", "[window]") {
    ParticipantIndex index = build_plain_index(5000);

    WindowPtr window = make_initial_window(index, 100);
    REQUIRE(window->size() == 100);
    CHECK((*window)[0].ticket_number == "1");
    CHECK((*window)[49].ticket_number == "50");
    CHECK((*window)[50].ticket_number == "4951");
    CHECK((*window)[99].ticket_number == "5000");

    SECTION("Odd capacity gives the extra entry to the low end") {
        WindowPtr odd = make_initial_window(index, 7);
        REQUIRE(odd->size() == 7);
        CHECK((*odd)[3].ticket_number == "4");
        CHECK((*odd)[4].ticket_number == "4998");
        CHECK((*odd)[6].ticket_number == "5000");
    }
}

// ---------- Winner window ----------

TEST_CASE("Scenario B: winner near the end wraps to the start", "[window]") {
    ParticipantIndex index = ParticipantIndex::build(build_demo_roster(5000, 11));
    const auto& all = index.participants();
    const Participant& target = index.at(4998);

    WinnerWindow winner = make_winner_window(index, 100, target.ticket_number);
    REQUIRE(winner.window->size() == 100);
    REQUIRE(winner.winner_offset.has_value());
    CHECK(*winner.winner_offset == 50);
    CHECK(winner.window->entries[50] == &target);

    // 4948..4999 then 0..47
    CHECK(winner.window->entries[0] == &all[4948]);
    CHECK(winner.window->entries[51] == &all[4999]);
    CHECK(winner.window->entries[52] == &all[0]);
    CHECK(winner.window->entries[99] == &all[47]);
}

TEST_CASE("Winner near the start wraps to the end", "[window]") {
    ParticipantIndex index = build_plain_index(5000);
    const auto& all = index.participants();

    WinnerWindow winner = make_winner_window(index, 100, "0004");
    REQUIRE(winner.winner_offset.has_value());
    CHECK(*winner.winner_offset == 50);
    CHECK((*winner.window)[50].ticket_number == "4");
    CHECK(winner.window->entries[0] == &all[4953]);
    CHECK(winner.window->entries[46] == &all[4999]);
    CHECK(winner.window->entries[47] == &all[0]);
}

TEST_CASE("Winner is present at its offset for every index size", "[window]") {
    std::size_t n = GENERATE(1, 3, 50, 100, 101, 150, 1000);
    ParticipantIndex index = build_plain_index(n);

    for (std::size_t ticket : {std::size_t{1}, (n + 1) / 2, n}) {
        INFO("n=" << n << " ticket=" << ticket);
        WinnerWindow winner = make_winner_window(index, 100, std::to_string(ticket));
        REQUIRE(winner.window->size() == 100);
        REQUIRE(winner.winner_offset.has_value());
        CHECK((*winner.window)[*winner.winner_offset].ticket_number == std::to_string(ticket));
        CHECK(winner_offset_in(*winner.window, std::to_string(ticket)).has_value());
    }
}

TEST_CASE("Missing ticket falls back to the initial window", "[window]") {
    ParticipantIndex index = build_plain_index(500);

    WinnerWindow winner = make_winner_window(index, 100, "99999");
    CHECK_FALSE(winner.winner_offset.has_value());
    REQUIRE(winner.window != nullptr);
    CHECK(same_ordering(*winner.window, *make_initial_window(index, 100)));
}

TEST_CASE("Window builders are idempotent", "[window]") {
    ParticipantIndex index = ParticipantIndex::build(build_demo_roster(3000, 5));
    const std::string ticket = index.at(1234).ticket_number;

    CHECK(same_ordering(*make_initial_window(index, 100), *make_initial_window(index, 100)));

    WinnerWindow a = make_winner_window(index, 100, ticket);
    WinnerWindow b = make_winner_window(index, 100, ticket);
    CHECK(same_ordering(*a.window, *b.window));
    CHECK(a.winner_offset == b.winner_offset);
}

TEST_CASE("Window builders reject empty input", "[window]") {
    ParticipantIndex empty = ParticipantIndex::build({});
    ParticipantIndex index = build_plain_index(10);

    CHECK_THROWS_AS(make_initial_window(empty, 100), std::invalid_argument);
    CHECK_THROWS_AS(make_winner_window(empty, 100, "1"), std::invalid_argument);
    CHECK_THROWS_AS(make_initial_window(index, 0), std::invalid_argument);
    CHECK_THROWS_AS(make_winner_window(index, 0, "1"), std::invalid_argument);
}

TEST_CASE("winner_offset_in finds the first normalized match", "[window]") {
    ParticipantIndex index = build_plain_index(10);
    WindowPtr window = make_initial_window(index, 30);

    auto offset = winner_offset_in(*window, "T-003");
    REQUIRE(offset.has_value());
    CHECK(*offset == 2);
    CHECK_FALSE(winner_offset_in(*window, "11").has_value());
}
