#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "lending/types.hpp"

namespace lending {

// Indices into the batch's order vector, ascending.
using Group = std::vector<OrderIndex>;

// Disjoint, covering, non-empty groups ordered by their first index.
using Partition = std::vector<Group>;

// Order ids of each group (sorted), groups sorted by first id.
using PartitionSignature = std::vector<std::vector<OrderId>>;

/**
 * Lazy, restartable enumeration of every set partition of n elements.
 *
 * Element 0 always opens the first group; every later element either
 * joins one of the groups opened before it or opens a new one. Walking
 * those choices in order (restricted growth strings) visits each of the
 * Bell(n) partitions exactly once without materializing them.
 *
 * Cost grows as Bell(n): callers bound n before enumerating.
 */
class PartitionSequence
{
public:
    explicit PartitionSequence(std::size_t n);

    /// Next partition, or nullopt once all Bell(n) have been produced.
    /// n == 0 produces nothing.
    std::optional<Partition> next();

    /// Restart from the first partition (all elements in one group).
    void reset() noexcept;

    std::size_t size() const noexcept { return n_; }

private:
    bool advance() noexcept;
    Partition build() const;

    std::size_t n_;
    std::vector<std::uint32_t> labels_;      // labels_[i] = group of element i
    std::vector<std::uint32_t> prefix_max_;  // max(labels_[0..i])
    bool started_{false};
    bool done_{false};
};

/// Canonical form used to compare partitions independent of construction path.
PartitionSignature canonical_signature(const OrderList& orders, const Partition& partition);

/// All partitions of `orders`, deduplicated by canonical signature.
std::vector<Partition> materialize_partitions(const OrderList& orders);

/// Bell(n). Throws ArithmeticOverflow when the value does not fit in 64 bits (n > 25).
std::uint64_t bell_number(std::size_t n);

} // namespace lending
