/// @file ticket_key.hpp
/// @brief Canonical, comparable form of a raffle ticket identifier

#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace drawreel {

/// Normalized ticket key: digits only, no leading zeros, "0" when nothing remains.
///
/// Keys order numerically without a fixed-width integer, so ticket strings of any
/// length compare correctly: a shorter digit string is always the smaller number,
/// equal lengths fall back to lexicographic order.
class TicketKey {
  public:
    /// The key for ticket zero
    TicketKey() = default;

    [[nodiscard]] const std::string& str() const { return digits_; }

    /// Three-way comparison: negative, zero or positive
    [[nodiscard]] int compare(const TicketKey& other) const;

    friend bool operator==(const TicketKey& a, const TicketKey& b) { return a.digits_ == b.digits_; }
    friend bool operator!=(const TicketKey& a, const TicketKey& b) { return !(a == b); }
    friend bool operator<(const TicketKey& a, const TicketKey& b) { return a.compare(b) < 0; }
    friend bool operator>(const TicketKey& a, const TicketKey& b) { return b < a; }
    friend bool operator<=(const TicketKey& a, const TicketKey& b) { return !(b < a); }
    friend bool operator>=(const TicketKey& a, const TicketKey& b) { return !(a < b); }

  private:
    explicit TicketKey(std::string digits) : digits_(std::move(digits)) {}

    friend TicketKey normalize_ticket(std::string_view raw);

    std::string digits_ = "0";
};

/// Strips every non-digit character and all leading zeros.
/// "018" and "18" give the same key; "ABC123" gives "123"; "" and "000" give "0".
[[nodiscard]] TicketKey normalize_ticket(std::string_view raw);

/// True when both raw tickets normalize to the same key
[[nodiscard]] bool same_ticket(std::string_view a, std::string_view b);

} // namespace drawreel
