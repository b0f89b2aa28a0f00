/// @file test_ticket_key.cpp
/// @brief Tests for ticket normalization and key ordering

#include <catch2/catch_test_macros.hpp>

#include "participants/ticket_key.hpp"

using namespace drawreel;

// ---------- Normalization ----------

TEST_CASE("normalize_ticket strips leading zeros", "[ticket]") {
    CHECK(normalize_ticket("018").str() == "18");
    CHECK(normalize_ticket("00042").str() == "42");
    CHECK(normalize_ticket("18").str() == "18");
    CHECK(normalize_ticket("100").str() == "100");
}

TEST_CASE("normalize_ticket strips non-digit characters", "[ticket]") {
    CHECK(normalize_ticket("ABC123").str() == "123");
    CHECK(normalize_ticket("T-43").str() == "43");
    CHECK(normalize_ticket("#0 0 7").str() == "7");
    CHECK(normalize_ticket("1a2b3").str() == "123");
}

TEST_CASE("Tickets without significant digits map to zero", "[ticket]") {
    CHECK(normalize_ticket("").str() == "0");
    CHECK(normalize_ticket("000").str() == "0");
    CHECK(normalize_ticket("ABC").str() == "0");
    CHECK(normalize_ticket("") == TicketKey{});
}

TEST_CASE("same_ticket compares normalized keys", "[ticket]") {
    CHECK(same_ticket("018", "18"));
    CHECK(same_ticket("T-0042", "42"));
    CHECK_FALSE(same_ticket("18", "180"));
    CHECK_FALSE(same_ticket("1", "11"));
}

// ---------- Ordering ----------

TEST_CASE("TicketKey orders numerically", "[ticket]") {
    CHECK(normalize_ticket("9") < normalize_ticket("10"));
    CHECK(normalize_ticket("0099") < normalize_ticket("100"));
    CHECK(normalize_ticket("T-200") > normalize_ticket("199"));
    CHECK(normalize_ticket("12") <= normalize_ticket("012"));
    CHECK(normalize_ticket("12") >= normalize_ticket("012"));
    CHECK(normalize_ticket("0") < normalize_ticket("1"));
}

TEST_CASE("TicketKey handles numbers wider than 64 bits", "[ticket]") {
    TicketKey big = normalize_ticket("123456789012345678901234567890");
    TicketKey smaller = normalize_ticket("99999999999999999999");

    CHECK(smaller < big);
    CHECK(big.compare(smaller) > 0);
    CHECK(smaller.compare(big) < 0);
    CHECK(big.compare(normalize_ticket("0123456789012345678901234567890")) == 0);
}
