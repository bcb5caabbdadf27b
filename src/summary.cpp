#include "lending/summary.hpp"

namespace lending {

namespace {

void print_bucket(std::ostream& os, const BucketOutcome& b)
{
    os << "[bucket] maturity " << b.maturity
       << ": " << b.order_ids.size() << " orders, "
       << b.stats.partitions_enumerated << " partitions ("
       << b.stats.partitions_feasible << " feasible, "
       << b.stats.results_feasible << " matching)\n";

    if (!b.best)
    {
        os << "[bucket]   no feasible partition, orders roll over\n";
        return;
    }

    const MatchingResult& r = *b.best;
    os << "[bucket]   " << to_string(r.feasibility)
       << " matched " << r.total_matched_amount
       << " (lenders " << r.total_lender_amount
       << ", borrowers " << r.total_borrower_amount << ")\n";
    os << "[bucket]   avg rate " << r.average_rate().to_string() << " bps"
       << ", efficiency " << r.matching_efficiency.to_string()
       << ", transfers " << b.plan.transfers.size() << "\n";
}

} // namespace

std::ostream& summary_stream(const BatchConfig& config, std::ostream& out, std::ostream& err)
{
    return config.output ? out : err;
}

void print_summary(std::ostream& os, const BatchReport& report, std::size_t order_count)
{
    os << "=== Batch summary ===\n\n";
    os << "[batch] orders   : " << order_count << "\n";
    os << "[batch] expired  : " << report.expired_orders << "\n";
    os << "[batch] buckets  : " << report.buckets.size() << "\n\n";

    for (const auto& b : report.buckets)
        print_bucket(os, b);

    os << "\n[batch] total matched     : " << report.total_matched << "\n";
    os << "[batch] total transferred : " << report.total_transferred << "\n";
    os << "[batch] transfers         : " << report.transfers.size() << "\n\n";

    for (const auto& [id, outcome] : report.diagnostics)
        os << "  " << outcome.description << "\n";
    os << "\n";
}

} // namespace lending
