#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "lending/config.hpp"
#include "lending/evaluator.hpp"
#include "lending/settlement.hpp"
#include "lending/types.hpp"

namespace lending {

struct MatchStats {
    std::uint64_t partitions_enumerated{0};
    std::uint64_t partitions_feasible{0};   // survived the feasibility filter
    std::uint64_t results_feasible{0};      // matched a positive amount
};

/**
 * Outcome of matching one single-maturity bucket.
 *
 * `best` is empty when no partition matched anything (no feasible
 * partition): that is a normal result with zero transfers and every order
 * diagnosed as unmatched, not an error.
 */
struct BucketOutcome {
    Timestamp                     maturity{0};
    std::vector<OrderId>          order_ids;   // bucket order; GroupMatch members index into it
    std::optional<MatchingResult> best;
    SettlementPlan                plan;
    MatchStats                    stats;

    bool        matched() const noexcept { return best.has_value(); }
    Feasibility feasibility() const noexcept { return best ? best->feasibility : Feasibility::None; }
};

/**
 * Run the full pipeline on orders sharing one maturity: enumerate every
 * partition, prune infeasible ones, score the rest, pick the winner and
 * compute its transfers.
 *
 * Throws InvalidInput for malformed orders, mixed maturities, an empty
 * bucket or one larger than config.max_batch_size, and ArithmeticOverflow
 * when amounts leave the representable range.
 */
BucketOutcome match_bucket(const OrderList& orders, const BatchConfig& config = {});

} // namespace lending
