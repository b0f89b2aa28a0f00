/// @file participant.hpp
/// @brief Raffle participant record as delivered by the ingestion layer

#pragma once

#include <string>

namespace drawreel {

/// A single raffle entry.
///
/// Records arrive already validated and deduplicated. Ticket numbers are opaque
/// strings ("0042", "T-43", "44") and must go through normalize_ticket() before
/// any comparison.
struct Participant {
    std::string first_name;
    std::string last_name;
    std::string ticket_number;

    /// "First Last", or whichever half is present
    [[nodiscard]] std::string display_name() const {
        if (first_name.empty()) {
            return last_name;
        }
        if (last_name.empty()) {
            return first_name;
        }
        return first_name + " " + last_name;
    }
};

} // namespace drawreel
