/// @file participant_index.cpp
/// @brief Stable ticket sort and binary-search lookup

#include "participants/participant_index.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace drawreel {

ParticipantIndex ParticipantIndex::build(std::vector<Participant> participants) {
    std::vector<TicketKey> keys;
    keys.reserve(participants.size());
    for (const Participant& p : participants) {
        keys.push_back(normalize_ticket(p.ticket_number));
    }

    // Sort a permutation so each key is normalized exactly once
    std::vector<std::size_t> order(participants.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(),
                     [&keys](std::size_t a, std::size_t b) { return keys[a] < keys[b]; });

    ParticipantIndex index;
    index.participants_.reserve(participants.size());
    index.keys_.reserve(participants.size());
    for (std::size_t i : order) {
        index.participants_.push_back(std::move(participants[i]));
        index.keys_.push_back(std::move(keys[i]));
    }
    return index;
}

std::optional<std::size_t> ParticipantIndex::find_position(std::string_view raw_ticket) const {
    const TicketKey target = normalize_ticket(raw_ticket);
    auto it = std::lower_bound(keys_.begin(), keys_.end(), target);
    if (it == keys_.end() || *it != target) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(it - keys_.begin());
}

const Participant* ParticipantIndex::find_by_ticket(std::string_view raw_ticket) const {
    auto position = find_position(raw_ticket);
    if (!position) {
        return nullptr;
    }
    return &participants_[*position];
}

const Participant& ParticipantIndex::at(std::size_t position) const {
    if (position >= participants_.size()) {
        throw std::out_of_range("Participant position out of range");
    }
    return participants_[position];
}

const TicketKey& ParticipantIndex::key_at(std::size_t position) const {
    if (position >= keys_.size()) {
        throw std::out_of_range("Ticket key position out of range");
    }
    return keys_[position];
}

} // namespace drawreel
