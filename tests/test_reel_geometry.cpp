/// @file test_reel_geometry.cpp
/// @brief Tests for mapping scroll positions to visible reel slots

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "physics/spin_physics.hpp"
#include "rendering/reel_geometry.hpp"
#include "windowing/window_manager.hpp"

#include <string>
#include <vector>

using namespace drawreel;
using Catch::Approx;

namespace {

constexpr double ITEM = 80.0;

ParticipantIndex build_index(std::size_t n) {
    std::vector<Participant> participants;
    for (std::size_t i = 1; i <= n; i++) {
        participants.push_back({"P", std::to_string(i), std::to_string(i)});
    }
    return ParticipantIndex::build(std::move(participants));
}

} // namespace

TEST_CASE("Slot-aligned position shows whole rows", "[geometry]") {
    ParticipantIndex index = build_index(20);
    WindowPtr window = make_initial_window(index, 20);

    auto slots = visible_slots(3.0 * ITEM, *window, ITEM, 5);
    REQUIRE(slots.size() == 7);

    CHECK(slots[0].row == -1);
    CHECK(slots[0].window_offset == 2);
    CHECK(slots[0].y == Approx(-ITEM));
    CHECK(slots[1].row == 0);
    CHECK(slots[1].window_offset == 3);
    CHECK(slots[1].y == Approx(0.0));
    CHECK(slots[1].participant->ticket_number == "4");
    CHECK(slots[6].row == 5);
    CHECK(slots[6].window_offset == 8);
    CHECK(slots[6].y == Approx(5.0 * ITEM));
}

TEST_CASE("Partial scroll offsets every row", "[geometry]") {
    ParticipantIndex index = build_index(20);
    WindowPtr window = make_initial_window(index, 20);

    auto slots = visible_slots(3.0 * ITEM + 30.0, *window, ITEM, 5);
    REQUIRE(slots.size() == 7);
    CHECK(slots[1].window_offset == 3);
    CHECK(slots[1].y == Approx(-30.0));
    CHECK(slots[2].y == Approx(ITEM - 30.0));
}

TEST_CASE("Rows wrap around the window ends", "[geometry]") {
    ParticipantIndex index = build_index(10);
    WindowPtr window = make_initial_window(index, 10);

    SECTION("Buffer row above slot 0") {
        auto slots = visible_slots(0.0, *window, ITEM, 5);
        CHECK(slots[0].window_offset == 9);
        CHECK(slots[1].window_offset == 0);
    }

    SECTION("Negative and overflowing positions") {
        auto slots = visible_slots(-2.0 * ITEM, *window, ITEM, 5);
        CHECK(slots[1].window_offset == 8);
        CHECK(slots[3].window_offset == 0);

        auto far = visible_slots(1000.0 * 10.0 * ITEM + ITEM, *window, ITEM, 5);
        CHECK(far[1].window_offset == 1);
    }
}

TEST_CASE("Centered entry matches the physics winner line", "[geometry]") {
    ParticipantIndex index = build_index(100);
    WindowPtr window = make_initial_window(index, 100);
    const int center = 2;

    for (std::size_t slot : {std::size_t{0}, std::size_t{1}, std::size_t{57}, std::size_t{99}}) {
        INFO("slot=" << slot);
        double position = slot_target_position(slot, ITEM, center);
        const Participant* entry = centered_entry(position, *window, ITEM, center);
        REQUIRE(entry != nullptr);
        CHECK(entry == window->entries[slot]);

        // Row `center` of the viewport holds the same entry
        auto slots = visible_slots(position, *window, ITEM, 5);
        CHECK(slots[static_cast<std::size_t>(center) + 1].participant == entry);
    }
}

TEST_CASE("Empty window has nothing to show", "[geometry]") {
    Window empty;
    CHECK(visible_slots(0.0, empty, ITEM, 5).empty());
    CHECK(centered_entry(0.0, empty, ITEM, 2) == nullptr);
}
