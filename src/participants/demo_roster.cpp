/// @file demo_roster.cpp
/// @brief Deterministic synthetic rosters for the demo app and tests

#include "participants/demo_roster.hpp"

#include <algorithm>
#include <array>
#include <random>
#include <string>

namespace drawreel {

namespace {

constexpr std::array<const char*, 16> FIRST_NAMES = {
    "Ava",   "Noah", "Mia",   "Liam",  "Isla",  "Oliver", "Freya", "Jack",
    "Sofia", "Leo",  "Amara", "Harry", "Chloe", "Arthur", "Zara",  "Theo"};

constexpr std::array<const char*, 16> LAST_NAMES = {
    "Smith", "Jones",  "Patel",  "Brown", "Taylor", "Wilson", "Evans", "Khan",
    "Walsh", "Murphy", "Nguyen", "Clark", "Hughes", "Wright", "Green", "Hall"};

std::size_t digit_count(std::size_t n) {
    std::size_t digits = 1;
    while (n >= 10) {
        n /= 10;
        digits++;
    }
    return digits;
}

} // namespace

std::string demo_ticket_label(std::size_t n, std::size_t count) {
    std::string number = std::to_string(n);
    switch (n % 3) {
    case 0: {
        // Zero-padded one digit wider than the largest ticket
        std::size_t width = digit_count(count) + 1;
        return std::string(width - number.size(), '0') + number;
    }
    case 1:
        return "T-" + number;
    default:
        return number;
    }
}

std::vector<Participant> build_demo_roster(std::size_t count, std::uint32_t seed) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<std::size_t> first_pick(0, FIRST_NAMES.size() - 1);
    std::uniform_int_distribution<std::size_t> last_pick(0, LAST_NAMES.size() - 1);

    std::vector<Participant> roster;
    roster.reserve(count);
    for (std::size_t n = 1; n <= count; n++) {
        roster.push_back({FIRST_NAMES[first_pick(rng)], LAST_NAMES[last_pick(rng)],
                          demo_ticket_label(n, count)});
    }
    std::shuffle(roster.begin(), roster.end(), rng);
    return roster;
}

} // namespace drawreel
