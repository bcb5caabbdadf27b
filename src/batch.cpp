#include "lending/batch.hpp"
#include "lending/validation.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

namespace lending {

namespace {

// Matches every bucket on a pool; slot i belongs to bucket i only.
std::vector<BucketOutcome> match_parallel(const std::vector<const OrderList*>& buckets,
                                          const BatchConfig&                   config)
{
    std::vector<BucketOutcome>      outcomes(buckets.size());
    std::vector<std::exception_ptr> errors(buckets.size());

    const std::size_t threads = std::min(config.worker_threads, buckets.size());
    boost::asio::thread_pool pool(threads);

    for (std::size_t i = 0; i < buckets.size(); ++i)
    {
        boost::asio::post(pool, [&, i]() {
            try {
                outcomes[i] = match_bucket(*buckets[i], config);
            } catch (...) {
                errors[i] = std::current_exception();
            }
        });
    }
    pool.join();

    for (const std::exception_ptr& err : errors)
    {
        if (err)
            std::rethrow_exception(err);
    }
    return outcomes;
}

} // namespace

MaturityBuckets group_by_maturity(const OrderList& orders)
{
    MaturityBuckets buckets;
    for (const Order& ord : orders)
        buckets[ord.maturity].push_back(ord);
    return buckets;
}

BatchReport process_batch(const OrderList& orders, const BatchConfig& config)
{
    validate_config(config);
    validate_orders(orders);

    BatchReport report;

    OrderList active;
    active.reserve(orders.size());
    for (const Order& ord : orders)
    {
        if (config.settlement_time && ord.expiry && *ord.expiry <= *config.settlement_time)
        {
            report.diagnostics[ord.id] = expired_outcome(ord, *config.settlement_time);
            ++report.expired_orders;
            continue;
        }
        active.push_back(ord);
    }

    const MaturityBuckets buckets = group_by_maturity(active);

    std::vector<const OrderList*> bucket_orders;
    bucket_orders.reserve(buckets.size());
    for (const auto& [maturity, bucket] : buckets)
        bucket_orders.push_back(&bucket);

    if (config.worker_threads > 1 && bucket_orders.size() > 1)
    {
        report.buckets = match_parallel(bucket_orders, config);
    }
    else
    {
        report.buckets.reserve(bucket_orders.size());
        for (const OrderList* bucket : bucket_orders)
            report.buckets.push_back(match_bucket(*bucket, config));
    }

    for (const BucketOutcome& outcome : report.buckets)
    {
        report.transfers.insert(report.transfers.end(),
                                outcome.plan.transfers.begin(),
                                outcome.plan.transfers.end());
        for (const auto& [id, diag] : outcome.plan.diagnostics)
            report.diagnostics[id] = diag;

        if (outcome.best)
            report.total_matched += outcome.best->total_matched_amount;
        report.total_transferred += outcome.plan.total_transferred;
    }

    return report;
}

} // namespace lending
