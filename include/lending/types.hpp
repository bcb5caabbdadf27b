#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>

namespace lending {

using Amount    = boost::multiprecision::cpp_int;  // principal in smallest token units
using RateBps   = boost::multiprecision::cpp_int;  // rate in basis points (1 = 0.01%)
using Timestamp = std::uint64_t;                   // unix seconds
using OrderId   = std::uint64_t;

// Index into the batch's order vector.
using OrderIndex = std::uint32_t;

enum class Side {
    Lender,
    Borrower
};

/// Largest principal a single order or an aggregate may carry (2^256 - 1).
const Amount& max_amount();

/// Largest quoted rate in basis points (2^32 - 1).
const RateBps& max_rate();

struct Order {
    OrderId     id{0};
    Side        side{Side::Lender};
    std::string sender;
    Amount      principal{0};
    RateBps     rate{0};         // lender: minimum accepted, borrower: maximum accepted
    Timestamp   maturity{0};

    std::optional<Amount>    min_principal;
    std::optional<Amount>    max_principal;
    std::optional<RateBps>   min_rate;
    std::optional<RateBps>   max_rate;
    std::optional<Timestamp> expiry;

    bool is_lender() const noexcept { return side == Side::Lender; }
};

using OrderList = std::vector<Order>;

enum class Feasibility {
    None,
    FullMatch,
    PartialLender,
    PartialBorrower,
    PartialBoth
};

struct Transfer {
    OrderId     lender_id{0};
    OrderId     borrower_id{0};
    std::string lender;     // sender identity of the lender order
    std::string borrower;   // sender identity of the borrower order
    Amount      amount{0};
    RateBps     rate{0};
    Timestamp   maturity{0};
};

const char* to_string(Side side) noexcept;
const char* to_string(Feasibility f) noexcept;

/// Human readable description, e.g. "Lenders partially matched, borrowers fully matched".
const char* describe(Feasibility f) noexcept;

} // namespace lending
