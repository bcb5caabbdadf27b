#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "lending/evaluator.hpp"
#include "lending/fixed_point.hpp"
#include "lending/types.hpp"

namespace lending {

enum class OutcomeStatus {
    Matched,
    Unmatched,
    Expired
};

const char* to_string(OutcomeStatus status) noexcept;

/// Informational per-order record; never feeds back into settlement.
struct OrderOutcome {
    OrderId       order_id{0};
    Side          side{Side::Lender};
    OutcomeStatus status{OutcomeStatus::Unmatched};
    Amount        matched_amount{0};

    std::optional<RateBps>   rate;          // clearing rate of the order's group
    std::optional<Timestamp> maturity;
    std::optional<Decimal4>  funding_rate;  // borrowers: volume-weighted quoted rate of their lenders

    std::string description;
};

using Diagnostics = std::map<OrderId, OrderOutcome>;

struct SettlementPlan {
    std::vector<Transfer> transfers;
    Diagnostics           diagnostics;
    Amount                total_transferred{0};
};

/**
 * Turn a winning result into pairwise transfers.
 *
 * For every matched group each borrower is owed
 * floor(principal * matched / borrower total) and each lender supplies
 * floor(principal * matched / lender total). Borrowers are served in
 * batch order; lenders are drawn cheapest quoted rate first (batch order
 * on equal rates) and their remaining share carries over between
 * borrowers. Floor dust is not reallocated, so the transfers of a group
 * fall short of its matched amount by less than one unit per
 * lender/borrower pairing.
 */
SettlementPlan compute_transfers(const OrderList& orders, const MatchingResult& result);

/// Diagnostic for an order that takes no part in settlement.
OrderOutcome unmatched_outcome(const Order& order, const std::string& reason);

/// Diagnostic for an order dropped because its expiry passed.
OrderOutcome expired_outcome(const Order& order, Timestamp settlement_time);

} // namespace lending
