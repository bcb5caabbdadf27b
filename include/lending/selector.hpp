#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "lending/evaluator.hpp"

namespace lending {

/// True if `candidate` strictly beats `incumbent`:
///   1. larger total matched amount,
///   2. then higher matching efficiency,
///   3. then lower average rate.
bool is_better_result(const MatchingResult& candidate, const MatchingResult& incumbent);

/**
 * Streaming form of the selection: offer candidates one at a time in
 * enumeration order and keep the best. A candidate replaces the incumbent
 * only when it is strictly better, so the first seen wins an exact tie.
 */
class BestResultSelector
{
public:
    void offer(MatchingResult candidate);

    bool empty() const noexcept { return !best_.has_value(); }
    std::size_t offered() const noexcept { return offered_; }

    /// Throws EmptyResultSet if nothing was offered.
    const MatchingResult& best() const;

    /// Moves the winner out; nullopt if nothing was offered.
    std::optional<MatchingResult> take();

private:
    std::optional<MatchingResult> best_;
    std::size_t offered_{0};
};

/// Index of the winning result. The first seen wins an exact tie, so the
/// choice is deterministic for a given candidate order.
/// Throws EmptyResultSet if `results` is empty.
std::size_t select_best_index(const std::vector<MatchingResult>& results);

/// Reference to results[select_best_index(results)].
const MatchingResult& select_best_result(const std::vector<MatchingResult>& results);

} // namespace lending
