/// @file ticket_key.cpp
/// @brief Ticket normalization and key ordering

#include "participants/ticket_key.hpp"

#include <cctype>

namespace drawreel {

int TicketKey::compare(const TicketKey& other) const {
    if (digits_.size() != other.digits_.size()) {
        return digits_.size() < other.digits_.size() ? -1 : 1;
    }
    return digits_.compare(other.digits_);
}

TicketKey normalize_ticket(std::string_view raw) {
    std::string digits;
    digits.reserve(raw.size());
    for (char c : raw) {
        if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
            continue;
        }
        // Skip leading zeros
        if (digits.empty() && c == '0') {
            continue;
        }
        digits.push_back(c);
    }
    if (digits.empty()) {
        return TicketKey{};
    }
    return TicketKey(std::move(digits));
}

bool same_ticket(std::string_view a, std::string_view b) {
    return normalize_ticket(a) == normalize_ticket(b);
}

} // namespace drawreel
