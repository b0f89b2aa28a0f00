/// @file demo_roster.hpp
/// @brief Synthetic participant lists standing in for an uploaded competition

#pragma once

#include "participants/participant.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace drawreel {

/// Builds `count` participants holding tickets 1..count.
///
/// Ticket strings rotate through the formats seen in real uploads so the
/// normalizer is exercised: zero-padded ("00042"), prefixed ("T-43") and plain
/// ("44"). The list is shuffled, so callers must sort it through a
/// ParticipantIndex. The same seed always yields the same roster.
[[nodiscard]] std::vector<Participant> build_demo_roster(std::size_t count, std::uint32_t seed);

/// The raw ticket string build_demo_roster() assigns to ticket number `n`
[[nodiscard]] std::string demo_ticket_label(std::size_t n, std::size_t count);

} // namespace drawreel
