#pragma once

#include <map>
#include <vector>

#include "lending/config.hpp"
#include "lending/matcher.hpp"
#include "lending/settlement.hpp"
#include "lending/types.hpp"

namespace lending {

/// Orders keyed by exact maturity, ascending; each bucket keeps batch order.
using MaturityBuckets = std::map<Timestamp, OrderList>;

MaturityBuckets group_by_maturity(const OrderList& orders);

struct BatchReport {
    std::vector<BucketOutcome> buckets;     // ascending maturity
    std::vector<Transfer>      transfers;   // all buckets, in bucket order
    Diagnostics                diagnostics; // every order of the batch
    Amount                     total_matched{0};
    Amount                     total_transferred{0};
    std::size_t                expired_orders{0};
};

/**
 * Match one closed batch.
 *
 * Validates every order, drops orders that expired by
 * config.settlement_time, splits the rest by maturity and matches each
 * bucket independently. With worker_threads > 1 the buckets run on a
 * thread pool; the report is merged in maturity order and is identical
 * for any thread count. If a bucket fails, the error of the earliest
 * failing maturity is rethrown once all workers have finished.
 */
BatchReport process_batch(const OrderList& orders, const BatchConfig& config = {});

} // namespace lending
