#pragma once

#include <vector>

#include "lending/partition.hpp"
#include "lending/types.hpp"

namespace lending {

enum class GroupCheck {
    Ok,
    MissingCounterparty,  // group lacks a lender or a borrower
    NoRateOverlap,        // min lender rate above max borrower rate
    MaturityMismatch      // lender and borrower maturities never coincide
};

const char* to_string(GroupCheck check) noexcept;

/// First failing condition of a group, or Ok. Singletons are always Ok.
GroupCheck check_group(const OrderList& orders, const Group& group);

/// Pruning predicate: false if any multi-order group fails check_group().
bool is_partition_feasible(const OrderList& orders, const Partition& partition);

/// Maturities present on both sides of the group, ascending.
std::vector<Timestamp> common_maturities(const OrderList& orders, const Group& group);

} // namespace lending
