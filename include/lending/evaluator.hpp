#pragma once

#include <vector>

#include "lending/fixed_point.hpp"
#include "lending/partition.hpp"
#include "lending/types.hpp"

namespace lending {

struct GroupMatch {
    Group       members;
    Feasibility feasibility{Feasibility::None};  // None for singletons

    Amount    total_lender_amount{0};
    Amount    total_borrower_amount{0};
    Amount    matched_amount{0};
    RateBps   min_lender_rate{0};
    RateBps   max_borrower_rate{0};
    RateBps   effective_rate{0};   // floor((min lender + max borrower) / 2)
    Timestamp maturity{0};         // earliest maturity common to both sides

    bool matched() const { return matched_amount > 0; }
};

struct MatchingResult {
    std::vector<GroupMatch> groups;

    Amount total_lender_amount{0};
    Amount total_borrower_amount{0};
    Amount total_matched_amount{0};
    Amount unmatched_lender_amount{0};
    Amount unmatched_borrower_amount{0};

    // Single clearing rate per group, so both averages are the same value.
    Decimal4 average_lender_rate;
    Decimal4 average_borrower_rate;
    Decimal4 rate_spread;
    Decimal4 matching_efficiency;

    bool        feasible{false};
    Feasibility feasibility{Feasibility::None};

    /// Rate used for ranking; identical to both side averages.
    const Decimal4& average_rate() const noexcept { return average_borrower_rate; }
};

/// Scores one group. Expects a group that passed check_group().
GroupMatch evaluate_group(const OrderList& orders, const Group& group);

/// Scores a partition that passed is_partition_feasible().
/// Throws ArithmeticOverflow if an aggregate exceeds max_amount().
MatchingResult evaluate_partition(const OrderList& orders, const Partition& partition);

} // namespace lending
