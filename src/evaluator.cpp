#include "lending/evaluator.hpp"
#include "lending/errors.hpp"
#include "lending/feasibility.hpp"
#include "lending/validation.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace lending {

namespace {

Feasibility classify(const Amount& lender_total, const Amount& borrower_total)
{
    if (lender_total == borrower_total)
        return Feasibility::FullMatch;
    return lender_total > borrower_total ? Feasibility::PartialLender
                                         : Feasibility::PartialBorrower;
}

Feasibility overall_feasibility(const std::vector<GroupMatch>& groups)
{
    bool any_match       = false;
    bool partial_lender  = false;
    bool partial_borrower = false;

    for (const GroupMatch& g : groups)
    {
        switch (g.feasibility)
        {
        case Feasibility::FullMatch:       any_match = true; break;
        case Feasibility::PartialLender:   any_match = true; partial_lender = true; break;
        case Feasibility::PartialBorrower: any_match = true; partial_borrower = true; break;
        default: break;
        }
    }

    if (!any_match)
        return Feasibility::None;
    if (partial_lender && partial_borrower)
        return Feasibility::PartialBoth;
    if (partial_lender)
        return Feasibility::PartialLender;
    if (partial_borrower)
        return Feasibility::PartialBorrower;
    return Feasibility::FullMatch;
}

} // namespace

GroupMatch evaluate_group(const OrderList& orders, const Group& group)
{
    if (group.empty())
        throw InvalidInput("empty matching group");

    GroupMatch gm;
    gm.members = group;

    if (group.size() == 1)
    {
        // Passthrough: counts toward its side, never matched.
        const Order& ord = orders.at(group.front());
        if (ord.is_lender())
            gm.total_lender_amount = ord.principal;
        else
            gm.total_borrower_amount = ord.principal;
        gm.maturity = ord.maturity;
        return gm;
    }

    const GroupCheck check = check_group(orders, group);
    if (check != GroupCheck::Ok)
        throw InvalidInput(std::string("evaluating an infeasible group: ") + to_string(check));

    bool have_lender   = false;
    bool have_borrower = false;

    for (OrderIndex idx : group)
    {
        const Order& ord = orders.at(idx);
        if (ord.is_lender())
        {
            gm.total_lender_amount += ord.principal;
            if (!have_lender || ord.rate < gm.min_lender_rate)
                gm.min_lender_rate = ord.rate;
            have_lender = true;
        }
        else
        {
            gm.total_borrower_amount += ord.principal;
            if (!have_borrower || ord.rate > gm.max_borrower_rate)
                gm.max_borrower_rate = ord.rate;
            have_borrower = true;
        }
    }

    gm.maturity       = common_maturities(orders, group).front();
    gm.matched_amount = std::min(gm.total_lender_amount, gm.total_borrower_amount);
    gm.effective_rate = (gm.min_lender_rate + gm.max_borrower_rate) / 2;
    gm.feasibility    = classify(gm.total_lender_amount, gm.total_borrower_amount);
    return gm;
}

MatchingResult evaluate_partition(const OrderList& orders, const Partition& partition)
{
    MatchingResult res;
    res.groups.reserve(partition.size());

    Amount weighted_rate = 0;  // sum of effective rate * matched amount

    for (const Group& group : partition)
    {
        GroupMatch gm = evaluate_group(orders, group);

        res.total_lender_amount   += gm.total_lender_amount;
        res.total_borrower_amount += gm.total_borrower_amount;
        res.total_matched_amount  += gm.matched_amount;
        weighted_rate             += gm.effective_rate * gm.matched_amount;

        res.groups.push_back(std::move(gm));
    }

    check_amount_range(res.total_lender_amount, "total lender amount");
    check_amount_range(res.total_borrower_amount, "total borrower amount");

    res.unmatched_lender_amount   = res.total_lender_amount - res.total_matched_amount;
    res.unmatched_borrower_amount = res.total_borrower_amount - res.total_matched_amount;

    res.average_lender_rate   = Decimal4::quotient(weighted_rate, res.total_matched_amount);
    res.average_borrower_rate = res.average_lender_rate;
    res.rate_spread           = Decimal4{};

    res.matching_efficiency = Decimal4::quotient(
        Amount(res.total_matched_amount * 2),
        Amount(res.total_lender_amount + res.total_borrower_amount));

    res.feasible    = res.total_matched_amount > 0;
    res.feasibility = overall_feasibility(res.groups);
    return res;
}

} // namespace lending
