#include <gtest/gtest.h>

#include "lending/batch.hpp"
#include "lending/errors.hpp"
#include "test_orders.hpp"

using namespace lending;
using testutil::borrower;
using testutil::kLaterMaturity;
using testutil::kMaturity;
using testutil::lender;
using testutil::transferred;

namespace {

OrderList two_maturity_batch() {
    return OrderList{
        lender(1, 1000, 400, kLaterMaturity),
        borrower(2, 1000, 600, kLaterMaturity),
        lender(3, 500, 300),
        borrower(4, 800, 500),
        lender(5, 300, 450),
        borrower(6, 200, 700, kLaterMaturity),
    };
}

} // namespace

TEST(GroupByMaturity, AscendingBucketsKeepBatchOrder) {
    auto buckets = group_by_maturity(two_maturity_batch());

    ASSERT_EQ(buckets.size(), 2u);
    auto it = buckets.begin();
    EXPECT_EQ(it->first, kMaturity);
    ASSERT_EQ(it->second.size(), 3u);
    EXPECT_EQ(it->second[0].id, 3u);
    EXPECT_EQ(it->second[1].id, 4u);
    EXPECT_EQ(it->second[2].id, 5u);

    ++it;
    EXPECT_EQ(it->first, kLaterMaturity);
    ASSERT_EQ(it->second.size(), 3u);
    EXPECT_EQ(it->second[0].id, 1u);
}

TEST(ProcessBatch, MaturitiesNeverMix) {
    OrderList orders{lender(1, 100, 400, kMaturity), borrower(2, 100, 600, kLaterMaturity)};
    auto report = process_batch(orders);

    ASSERT_EQ(report.buckets.size(), 2u);
    EXPECT_FALSE(report.buckets[0].matched());
    EXPECT_FALSE(report.buckets[1].matched());
    EXPECT_TRUE(report.transfers.empty());
    EXPECT_EQ(report.total_matched, 0);
}

TEST(ProcessBatch, TransfersCarryTheirBucketMaturity) {
    auto report = process_batch(two_maturity_batch());

    ASSERT_EQ(report.buckets.size(), 2u);
    EXPECT_EQ(report.buckets[0].maturity, kMaturity);
    EXPECT_EQ(report.buckets[1].maturity, kLaterMaturity);
    ASSERT_FALSE(report.transfers.empty());

    for (const auto& t : report.transfers) {
        const bool early = t.lender_id == 3 || t.lender_id == 5;
        EXPECT_EQ(t.maturity, early ? kMaturity : kLaterMaturity);
    }
    EXPECT_EQ(report.diagnostics.size(), 6u);
    EXPECT_EQ(report.total_transferred, transferred(report.transfers));
    EXPECT_LE(report.total_transferred, report.total_matched);
}

TEST(ProcessBatch, ExpiredOrdersAreSkipped) {
    auto gone = lender(1, 100, 400);
    gone.expiry = 100;
    auto kept = lender(2, 100, 400);
    kept.expiry = 101;
    OrderList orders{gone, kept, borrower(3, 100, 600)};

    BatchConfig cfg;
    cfg.settlement_time = 100;
    auto report = process_batch(orders, cfg);

    EXPECT_EQ(report.expired_orders, 1u);
    EXPECT_EQ(report.diagnostics.at(1).status, OutcomeStatus::Expired);
    EXPECT_EQ(report.diagnostics.at(2).status, OutcomeStatus::Matched);
    ASSERT_EQ(report.transfers.size(), 1u);
    EXPECT_EQ(report.transfers[0].lender_id, 2u);
    EXPECT_EQ(report.transfers[0].amount, 100);
}

TEST(ProcessBatch, ExpiryIgnoredWithoutSettlementTime) {
    auto ord = lender(1, 100, 400);
    ord.expiry = 1;
    auto report = process_batch(OrderList{ord, borrower(2, 100, 600)});

    EXPECT_EQ(report.expired_orders, 0u);
    EXPECT_EQ(report.transfers.size(), 1u);
}

TEST(ProcessBatch, DuplicateIdsAcrossBucketsRejected) {
    OrderList orders{lender(1, 100, 400, kMaturity), borrower(1, 100, 600, kLaterMaturity)};
    EXPECT_THROW(process_batch(orders), InvalidInput);
}

TEST(ProcessBatch, InfeasibleBatchMovesNothing) {
    OrderList orders{lender(1, 10000, 1000), borrower(2, 10000, 500)};
    auto report = process_batch(orders);

    EXPECT_TRUE(report.transfers.empty());
    EXPECT_EQ(report.total_transferred, 0);
    ASSERT_EQ(report.buckets.size(), 1u);
    EXPECT_EQ(report.buckets[0].feasibility(), Feasibility::None);
}

TEST(ProcessBatch, ThreadCountDoesNotChangeTheReport) {
    OrderList orders;
    const Timestamp maturities[] = {kMaturity, kLaterMaturity, kLaterMaturity + 86400,
                                    kLaterMaturity + 2 * 86400};
    OrderId id = 1;
    for (Timestamp m : maturities) {
        orders.push_back(lender(id++, 700, 410, m));
        orders.push_back(borrower(id++, 300, 560, m));
        orders.push_back(lender(id++, 250, 390, m));
        orders.push_back(borrower(id++, 600, 520, m));
        orders.push_back(borrower(id++, 90, 640, m));
    }

    BatchConfig serial;
    BatchConfig parallel;
    parallel.worker_threads = 4;

    auto a = process_batch(orders, serial);
    auto b = process_batch(orders, parallel);

    ASSERT_EQ(a.buckets.size(), b.buckets.size());
    for (std::size_t i = 0; i < a.buckets.size(); ++i)
        EXPECT_EQ(a.buckets[i].maturity, b.buckets[i].maturity);

    ASSERT_EQ(a.transfers.size(), b.transfers.size());
    for (std::size_t i = 0; i < a.transfers.size(); ++i) {
        EXPECT_EQ(a.transfers[i].lender_id, b.transfers[i].lender_id);
        EXPECT_EQ(a.transfers[i].borrower_id, b.transfers[i].borrower_id);
        EXPECT_EQ(a.transfers[i].amount, b.transfers[i].amount);
        EXPECT_EQ(a.transfers[i].maturity, b.transfers[i].maturity);
    }
    EXPECT_EQ(a.total_matched, b.total_matched);
    EXPECT_EQ(a.total_transferred, b.total_transferred);
}

TEST(ProcessBatch, BucketErrorsPropagateFromWorkers) {
    OrderList orders{lender(1, 100, 400, kMaturity), borrower(2, 100, 600, kMaturity),
                     lender(3, 100, 400, kLaterMaturity), borrower(4, 100, 600, kLaterMaturity),
                     borrower(5, 100, 600, kLaterMaturity)};

    BatchConfig cfg;
    cfg.max_batch_size = 2;
    cfg.worker_threads = 2;
    EXPECT_THROW(process_batch(orders, cfg), InvalidInput);

    cfg.worker_threads = 1;
    EXPECT_THROW(process_batch(orders, cfg), InvalidInput);
}

TEST(ProcessBatch, InvalidConfigRejected) {
    BatchConfig cfg;
    cfg.worker_threads = 0;
    EXPECT_THROW(process_batch(OrderList{lender(1, 100, 400)}, cfg), InvalidInput);
}
