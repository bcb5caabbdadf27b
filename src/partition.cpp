#include "lending/partition.hpp"
#include "lending/errors.hpp"

#include <algorithm>
#include <limits>
#include <set>
#include <string>
#include <utility>

namespace lending {

PartitionSequence::PartitionSequence(std::size_t n)
    : n_(n),
      labels_(n, 0),
      prefix_max_(n, 0)
{
    if (n_ > std::numeric_limits<OrderIndex>::max())
        throw InvalidInput("partition sequence over " + std::to_string(n_) + " elements");
}

void PartitionSequence::reset() noexcept
{
    std::fill(labels_.begin(), labels_.end(), 0u);
    std::fill(prefix_max_.begin(), prefix_max_.end(), 0u);
    started_ = false;
    done_    = false;
}

std::optional<Partition> PartitionSequence::next()
{
    if (done_ || n_ == 0)
    {
        done_ = true;
        return std::nullopt;
    }

    if (!started_)
    {
        // First partition: everything in one group.
        started_ = true;
        return build();
    }

    if (!advance())
    {
        done_ = true;
        return std::nullopt;
    }
    return build();
}

bool PartitionSequence::advance() noexcept
{
    // Rightmost element that can still move to a later group (at most one
    // past the largest group opened by the elements before it).
    for (std::size_t i = n_; i-- > 1;)
    {
        if (labels_[i] <= prefix_max_[i - 1])
        {
            ++labels_[i];
            prefix_max_[i] = std::max(prefix_max_[i - 1], labels_[i]);

            for (std::size_t j = i + 1; j < n_; ++j)
            {
                labels_[j]     = 0;
                prefix_max_[j] = prefix_max_[i];
            }
            return true;
        }
    }
    return false;
}

Partition PartitionSequence::build() const
{
    Partition partition(static_cast<std::size_t>(prefix_max_[n_ - 1]) + 1);
    for (std::size_t i = 0; i < n_; ++i)
        partition[labels_[i]].push_back(static_cast<OrderIndex>(i));
    return partition;
}

PartitionSignature canonical_signature(const OrderList& orders, const Partition& partition)
{
    PartitionSignature sig;
    sig.reserve(partition.size());

    for (const Group& group : partition)
    {
        std::vector<OrderId> ids;
        ids.reserve(group.size());
        for (OrderIndex idx : group)
            ids.push_back(orders.at(idx).id);
        std::sort(ids.begin(), ids.end());
        sig.push_back(std::move(ids));
    }

    // Groups are disjoint, so ordering by the whole list orders by first id.
    std::sort(sig.begin(), sig.end());
    return sig;
}

std::vector<Partition> materialize_partitions(const OrderList& orders)
{
    std::vector<Partition> out;
    std::set<PartitionSignature> seen;

    PartitionSequence seq(orders.size());
    while (auto partition = seq.next())
    {
        if (seen.insert(canonical_signature(orders, *partition)).second)
            out.push_back(std::move(*partition));
    }
    return out;
}

std::uint64_t bell_number(std::size_t n)
{
    if (n > 25)
        throw ArithmeticOverflow("Bell(" + std::to_string(n) + ") does not fit in 64 bits");

    if (n == 0)
        return 1;

    // Bell triangle: each row starts with the last entry of the previous
    // row; the last entry of row k is Bell(k + 1).
    std::vector<std::uint64_t> row{1};
    for (std::size_t k = 1; k < n; ++k)
    {
        std::vector<std::uint64_t> next_row;
        next_row.reserve(row.size() + 1);
        next_row.push_back(row.back());
        for (std::uint64_t v : row)
            next_row.push_back(next_row.back() + v);
        row = std::move(next_row);
    }
    return row.back();
}

} // namespace lending
