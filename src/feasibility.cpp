#include "lending/feasibility.hpp"

#include <algorithm>
#include <iterator>
#include <set>

namespace lending {

const char* to_string(GroupCheck check) noexcept
{
    switch (check)
    {
    case GroupCheck::Ok:                  return "OK";
    case GroupCheck::MissingCounterparty: return "No compatible lenders and borrowers";
    case GroupCheck::NoRateOverlap:       return "No overlap between lender min and borrower max rates";
    case GroupCheck::MaturityMismatch:    return "No compatible maturity dates";
    }
    return "UNKNOWN";
}

std::vector<Timestamp> common_maturities(const OrderList& orders, const Group& group)
{
    std::set<Timestamp> lender_maturities;
    std::set<Timestamp> borrower_maturities;

    for (OrderIndex idx : group)
    {
        const Order& ord = orders.at(idx);
        if (ord.is_lender())
            lender_maturities.insert(ord.maturity);
        else
            borrower_maturities.insert(ord.maturity);
    }

    // std::set iterates ascending, so the intersection comes out sorted.
    std::vector<Timestamp> common;
    std::set_intersection(lender_maturities.begin(), lender_maturities.end(),
                          borrower_maturities.begin(), borrower_maturities.end(),
                          std::back_inserter(common));
    return common;
}

GroupCheck check_group(const OrderList& orders, const Group& group)
{
    if (group.size() <= 1)
        return GroupCheck::Ok;

    const RateBps* min_lender_rate   = nullptr;
    const RateBps* max_borrower_rate = nullptr;

    for (OrderIndex idx : group)
    {
        const Order& ord = orders.at(idx);
        if (ord.is_lender())
        {
            if (!min_lender_rate || ord.rate < *min_lender_rate)
                min_lender_rate = &ord.rate;
        }
        else
        {
            if (!max_borrower_rate || ord.rate > *max_borrower_rate)
                max_borrower_rate = &ord.rate;
        }
    }

    if (!min_lender_rate || !max_borrower_rate)
        return GroupCheck::MissingCounterparty;

    if (*min_lender_rate > *max_borrower_rate)
        return GroupCheck::NoRateOverlap;

    if (common_maturities(orders, group).empty())
        return GroupCheck::MaturityMismatch;

    return GroupCheck::Ok;
}

bool is_partition_feasible(const OrderList& orders, const Partition& partition)
{
    return std::all_of(partition.begin(), partition.end(), [&](const Group& group) {
        return check_group(orders, group) == GroupCheck::Ok;
    });
}

} // namespace lending
