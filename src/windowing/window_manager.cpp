/// @file window_manager.cpp
/// @brief Initial and winner-centered window construction

#include "windowing/window_manager.hpp"

#include "participants/ticket_key.hpp"

#include <stdexcept>

namespace drawreel {

namespace {

void check_inputs(const ParticipantIndex& index, std::size_t capacity) {
    if (index.empty()) {
        throw std::invalid_argument("Cannot build a window from an empty participant index");
    }
    if (capacity == 0) {
        throw std::invalid_argument("Window capacity must be at least 1");
    }
}

/// Entry i is index[(start + i) mod n], for i in [0, capacity)
WindowPtr circular_window(const ParticipantIndex& index, std::size_t start, std::size_t capacity) {
    const auto& all = index.participants();
    const std::size_t n = all.size();

    auto window = std::make_shared<Window>();
    window->entries.reserve(capacity);
    for (std::size_t i = 0; i < capacity; i++) {
        window->entries.push_back(&all[(start + i) % n]);
    }
    return window;
}

} // namespace

WindowPtr make_initial_window(const ParticipantIndex& index, std::size_t capacity) {
    check_inputs(index, capacity);

    const std::size_t n = index.size();
    if (n <= capacity) {
        return circular_window(index, 0, capacity);
    }

    // Lowest tickets first, then the highest ones
    const auto& all = index.participants();
    const std::size_t tail = capacity / 2;
    const std::size_t head = capacity - tail;

    auto window = std::make_shared<Window>();
    window->entries.reserve(capacity);
    for (std::size_t i = 0; i < head; i++) {
        window->entries.push_back(&all[i]);
    }
    for (std::size_t i = n - tail; i < n; i++) {
        window->entries.push_back(&all[i]);
    }
    return window;
}

WinnerWindow make_winner_window(const ParticipantIndex& index, std::size_t capacity,
                                std::string_view target_ticket) {
    check_inputs(index, capacity);

    auto position = index.find_position(target_ticket);
    if (!position) {
        return {make_initial_window(index, capacity), std::nullopt};
    }

    const std::size_t n = index.size();
    if (n <= capacity) {
        // Padding repeats from the start, so the first occurrence is at the index position
        return {circular_window(index, 0, capacity), *position};
    }

    // Start half a window before the winner; adding n keeps the subtraction unsigned
    const std::size_t before = capacity / 2;
    const std::size_t start = (*position + n - before % n) % n;
    return {circular_window(index, start, capacity), before};
}

std::optional<std::size_t> winner_offset_in(const Window& window, std::string_view ticket) {
    const TicketKey target = normalize_ticket(ticket);
    for (std::size_t i = 0; i < window.entries.size(); i++) {
        if (normalize_ticket(window.entries[i]->ticket_number) == target) {
            return i;
        }
    }
    return std::nullopt;
}

} // namespace drawreel
