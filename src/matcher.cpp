#include "lending/matcher.hpp"
#include "lending/errors.hpp"
#include "lending/feasibility.hpp"
#include "lending/partition.hpp"
#include "lending/selector.hpp"
#include "lending/validation.hpp"

#include <string>
#include <utility>

namespace lending {

BucketOutcome match_bucket(const OrderList& orders, const BatchConfig& config)
{
    validate_config(config);

    if (orders.empty())
        throw InvalidInput("empty maturity bucket");
    if (orders.size() > config.max_batch_size)
    {
        throw InvalidInput("bucket of " + std::to_string(orders.size())
                           + " orders exceeds max_batch_size "
                           + std::to_string(config.max_batch_size));
    }

    validate_orders(orders);

    const Timestamp maturity = orders.front().maturity;
    for (const Order& ord : orders)
    {
        if (ord.maturity != maturity)
        {
            throw InvalidInput("bucket mixes maturities " + std::to_string(maturity)
                               + " and " + std::to_string(ord.maturity));
        }
    }

    BucketOutcome out;
    out.maturity = maturity;
    out.order_ids.reserve(orders.size());
    for (const Order& ord : orders)
        out.order_ids.push_back(ord.id);

    BestResultSelector selector;
    PartitionSequence  seq(orders.size());

    while (auto partition = seq.next())
    {
        ++out.stats.partitions_enumerated;
        if (!is_partition_feasible(orders, *partition))
            continue;

        ++out.stats.partitions_feasible;
        MatchingResult res = evaluate_partition(orders, *partition);
        if (!res.feasible)
            continue;

        ++out.stats.results_feasible;
        selector.offer(std::move(res));
    }

    if (selector.empty())
    {
        // No feasible partition this round: zero transfers, orders retried later.
        for (const Order& ord : orders)
            out.plan.diagnostics[ord.id] = unmatched_outcome(ord, describe(Feasibility::None));
        return out;
    }

    out.best = selector.take();
    out.plan = compute_transfers(orders, *out.best);
    return out;
}

} // namespace lending
