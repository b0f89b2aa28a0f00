/// @file session_winners.hpp
/// @brief Winners drawn during this run of the application, newest first.
///
/// Entries hold a copy of the participant, so the list survives a roster reload.

#pragma once

#include "participants/participant.hpp"

#include <chrono>
#include <cstddef>
#include <deque>
#include <string>

namespace drawreel {

using WallClock = std::chrono::system_clock;

/// One completed draw
struct SessionWinner {
    Participant participant;
    std::string roster; ///< Roster the winner was drawn from
    WallClock::time_point drawn_at;
};

class SessionWinners {
  public:
    /// @param capacity Entries kept; the oldest are dropped beyond it (at least 1)
    explicit SessionWinners(std::size_t capacity = 50);

    /// Adds a winner at the front of the list
    void record(const Participant& winner, std::string roster, WallClock::time_point drawn_at);

    void clear();

    /// Newest first
    [[nodiscard]] const std::deque<SessionWinner>& entries() const { return entries_; }
    [[nodiscard]] std::size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }

    /// Draws recorded since construction or the last clear(), including dropped ones
    [[nodiscard]] std::size_t total_drawn() const { return total_drawn_; }

  private:
    std::size_t capacity_;
    std::deque<SessionWinner> entries_;
    std::size_t total_drawn_ = 0;
};

/// Local time of day as "HH:MM:SS"
[[nodiscard]] std::string format_time_of_day(WallClock::time_point when);

} // namespace drawreel
