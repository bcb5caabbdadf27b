#include "lending/settlement.hpp"
#include "lending/errors.hpp"

#include <algorithm>
#include <utility>

namespace lending {

namespace {

// Per-order running totals while a group is being allocated.
struct Allocation {
    Amount allocated{0};
    Amount weighted_rate{0};  // sum of counterparty quoted rate * amount (borrowers only)
};

std::string side_label(Side side)
{
    return side == Side::Lender ? "Lender" : "Borrower";
}

OrderOutcome matched_outcome(const Order& order, const GroupMatch& group, const Allocation& alloc)
{
    if (alloc.allocated == 0)
        return unmatched_outcome(order, "share rounded down to zero");

    OrderOutcome out;
    out.order_id       = order.id;
    out.side           = order.side;
    out.status         = OutcomeStatus::Matched;
    out.matched_amount = alloc.allocated;
    out.rate           = group.effective_rate;
    out.maturity       = group.maturity;

    if (!order.is_lender())
        out.funding_rate = Decimal4::quotient(alloc.weighted_rate, alloc.allocated);

    out.description = side_label(order.side) + " " + std::to_string(order.id) + " matched "
                    + alloc.allocated.str() + " at " + format_rate_percent(group.effective_rate)
                    + " APR";
    return out;
}

void settle_group(const OrderList& orders, const GroupMatch& group, SettlementPlan& plan)
{
    std::vector<OrderIndex> lenders;
    std::vector<OrderIndex> borrowers;
    for (OrderIndex idx : group.members)
    {
        if (orders.at(idx).is_lender())
            lenders.push_back(idx);
        else
            borrowers.push_back(idx);
    }

    if (group.total_lender_amount == 0 || group.total_borrower_amount == 0)
        throw InvalidInput("matched group without both sides");

    // Members are ascending, so a stable sort keeps batch order on equal rates.
    std::stable_sort(lenders.begin(), lenders.end(), [&](OrderIndex a, OrderIndex b) {
        return orders[a].rate < orders[b].rate;
    });

    std::vector<Amount> lender_remaining;
    lender_remaining.reserve(lenders.size());
    for (OrderIndex idx : lenders)
        lender_remaining.push_back(Amount(orders[idx].principal * group.matched_amount
                                          / group.total_lender_amount));

    std::vector<Allocation> lender_alloc(lenders.size());

    for (OrderIndex b_idx : borrowers)
    {
        const Order& borrower = orders[b_idx];
        Amount remaining = borrower.principal * group.matched_amount / group.total_borrower_amount;
        Allocation b_alloc;

        for (std::size_t k = 0; k < lenders.size() && remaining > 0; ++k)
        {
            Amount amount = std::min(remaining, lender_remaining[k]);
            if (amount == 0)
                continue;

            const Order& lender = orders[lenders[k]];

            Transfer tr;
            tr.lender_id   = lender.id;
            tr.borrower_id = borrower.id;
            tr.lender      = lender.sender;
            tr.borrower    = borrower.sender;
            tr.amount      = amount;
            tr.rate        = group.effective_rate;
            tr.maturity    = group.maturity;
            plan.transfers.push_back(std::move(tr));

            remaining           -= amount;
            lender_remaining[k] -= amount;

            lender_alloc[k].allocated += amount;
            b_alloc.allocated         += amount;
            b_alloc.weighted_rate     += lender.rate * amount;
            plan.total_transferred    += amount;
        }

        plan.diagnostics[borrower.id] = matched_outcome(borrower, group, b_alloc);
    }

    for (std::size_t k = 0; k < lenders.size(); ++k)
    {
        const Order& lender = orders[lenders[k]];
        plan.diagnostics[lender.id] = matched_outcome(lender, group, lender_alloc[k]);
    }
}

} // namespace

const char* to_string(OutcomeStatus status) noexcept
{
    switch (status)
    {
    case OutcomeStatus::Matched:   return "matched";
    case OutcomeStatus::Unmatched: return "unmatched";
    case OutcomeStatus::Expired:   return "expired";
    }
    return "unknown";
}

OrderOutcome unmatched_outcome(const Order& order, const std::string& reason)
{
    OrderOutcome out;
    out.order_id    = order.id;
    out.side        = order.side;
    out.status      = OutcomeStatus::Unmatched;
    out.description = "Order " + std::to_string(order.id) + " could not be matched: " + reason;
    return out;
}

OrderOutcome expired_outcome(const Order& order, Timestamp settlement_time)
{
    OrderOutcome out;
    out.order_id    = order.id;
    out.side        = order.side;
    out.status      = OutcomeStatus::Expired;
    out.description = "Order " + std::to_string(order.id) + " expired before settlement at "
                    + std::to_string(settlement_time);
    return out;
}

SettlementPlan compute_transfers(const OrderList& orders, const MatchingResult& result)
{
    SettlementPlan plan;

    for (const GroupMatch& group : result.groups)
    {
        switch (group.feasibility)
        {
        case Feasibility::FullMatch:
        case Feasibility::PartialLender:
        case Feasibility::PartialBorrower:
            settle_group(orders, group, plan);
            break;
        default:
            for (OrderIndex idx : group.members)
            {
                const Order& ord = orders.at(idx);
                plan.diagnostics[ord.id] = unmatched_outcome(ord, describe(Feasibility::None));
            }
            break;
        }
    }

    return plan;
}

} // namespace lending
