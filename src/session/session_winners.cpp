/// @file session_winners.cpp
/// @brief Implements the bounded session winners list

#include "session/session_winners.hpp"

#include <algorithm>
#include <ctime>
#include <utility>

namespace drawreel {

SessionWinners::SessionWinners(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)) {}

void SessionWinners::record(const Participant& winner, std::string roster,
                            WallClock::time_point drawn_at) {
    entries_.push_front({winner, std::move(roster), drawn_at});
    if (entries_.size() > capacity_) {
        entries_.pop_back();
    }
    total_drawn_++;
}

void SessionWinners::clear() {
    entries_.clear();
    total_drawn_ = 0;
}

std::string format_time_of_day(WallClock::time_point when) {
    std::time_t t = WallClock::to_time_t(when);
    std::tm local{};
    if (const std::tm* converted = std::localtime(&t)) {
        local = *converted;
    }
    char buf[16];
    if (std::strftime(buf, sizeof(buf), "%H:%M:%S", &local) == 0) {
        return "--:--:--";
    }
    return buf;
}

} // namespace drawreel
