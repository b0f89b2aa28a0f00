/// @file test_demo_roster.cpp
/// @brief Tests for synthetic demo rosters

#include <catch2/catch_test_macros.hpp>

#include "participants/demo_roster.hpp"
#include "participants/participant_index.hpp"

#include <string>

using namespace drawreel;

TEST_CASE("demo_ticket_label rotates formats", "[roster]") {
    CHECK(demo_ticket_label(3, 50) == "003");
    CHECK(demo_ticket_label(4, 50) == "T-4");
    CHECK(demo_ticket_label(5, 50) == "5");
    CHECK(demo_ticket_label(42, 5000) == "00042");
    CHECK(demo_ticket_label(5000, 5000) == "5000");
}

TEST_CASE("Demo roster covers tickets 1..count", "[roster]") {
    auto roster = build_demo_roster(300, 7);
    REQUIRE(roster.size() == 300);

    ParticipantIndex index = ParticipantIndex::build(roster);
    for (std::size_t i = 0; i < index.size(); i++) {
        INFO("position=" << i);
        CHECK(index.key_at(i).str() == std::to_string(i + 1));
        CHECK_FALSE(index.at(i).first_name.empty());
        CHECK_FALSE(index.at(i).last_name.empty());
    }
}

TEST_CASE("Demo roster is deterministic per seed", "[roster]") {
    auto a = build_demo_roster(100, 42);
    auto b = build_demo_roster(100, 42);
    auto c = build_demo_roster(100, 43);

    REQUIRE(a.size() == b.size());
    bool differs_from_other_seed = false;
    for (std::size_t i = 0; i < a.size(); i++) {
        CHECK(a[i].ticket_number == b[i].ticket_number);
        CHECK(a[i].display_name() == b[i].display_name());
        if (a[i].ticket_number != c[i].ticket_number) {
            differs_from_other_seed = true;
        }
    }
    CHECK(differs_from_other_seed);
}

TEST_CASE("Empty demo roster", "[roster]") {
    CHECK(build_demo_roster(0, 1).empty());
}
