/// @file participant_index.hpp
/// @brief Immutable, ticket-ordered view over a competition's participants

#pragma once

#include "participants/participant.hpp"
#include "participants/ticket_key.hpp"

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace drawreel {

/// All participants of one competition, sorted ascending by normalized ticket key.
///
/// Built once per competition load and read-only afterwards. Windows hold raw
/// pointers into the index, so the owner must keep it alive (and unmoved-from)
/// for as long as any window or SpinController refers to it.
class ParticipantIndex {
  public:
    ParticipantIndex() = default;

    // Non-copyable (windows point into it), movable
    ParticipantIndex(const ParticipantIndex&) = delete;
    ParticipantIndex& operator=(const ParticipantIndex&) = delete;
    ParticipantIndex(ParticipantIndex&&) = default;
    ParticipantIndex& operator=(ParticipantIndex&&) = default;

    /// Sorts a copy of the participants by ticket key. Entries with equal keys
    /// keep their input order.
    [[nodiscard]] static ParticipantIndex build(std::vector<Participant> participants);

    /// Position of the ticket in sorted order (binary search, O(log n)).
    /// With duplicate keys the earliest entry wins.
    [[nodiscard]] std::optional<std::size_t> find_position(std::string_view raw_ticket) const;

    /// The participant holding the ticket, or nullptr if it is not in the index
    [[nodiscard]] const Participant* find_by_ticket(std::string_view raw_ticket) const;

    /// @throws std::out_of_range if position >= size()
    [[nodiscard]] const Participant& at(std::size_t position) const;

    /// @throws std::out_of_range if position >= size()
    [[nodiscard]] const TicketKey& key_at(std::size_t position) const;

    [[nodiscard]] std::size_t size() const { return participants_.size(); }
    [[nodiscard]] bool empty() const { return participants_.empty(); }
    [[nodiscard]] const std::vector<Participant>& participants() const { return participants_; }

  private:
    std::vector<Participant> participants_;
    std::vector<TicketKey> keys_; ///< keys_[i] = normalize_ticket(participants_[i].ticket_number)
};

} // namespace drawreel
