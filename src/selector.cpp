#include "lending/selector.hpp"
#include "lending/errors.hpp"

#include <utility>

namespace lending {

bool is_better_result(const MatchingResult& candidate, const MatchingResult& incumbent)
{
    if (candidate.total_matched_amount != incumbent.total_matched_amount)
        return candidate.total_matched_amount > incumbent.total_matched_amount;

    if (candidate.matching_efficiency != incumbent.matching_efficiency)
        return candidate.matching_efficiency > incumbent.matching_efficiency;

    return candidate.average_rate() < incumbent.average_rate();
}

void BestResultSelector::offer(MatchingResult candidate)
{
    ++offered_;
    if (!best_ || is_better_result(candidate, *best_))
        best_ = std::move(candidate);
}

const MatchingResult& BestResultSelector::best() const
{
    if (!best_)
        throw EmptyResultSet();
    return *best_;
}

std::optional<MatchingResult> BestResultSelector::take()
{
    std::optional<MatchingResult> out = std::move(best_);
    best_.reset();
    return out;
}

std::size_t select_best_index(const std::vector<MatchingResult>& results)
{
    if (results.empty())
        throw EmptyResultSet();

    std::size_t best = 0;
    for (std::size_t i = 1; i < results.size(); ++i)
    {
        if (is_better_result(results[i], results[best]))
            best = i;
    }
    return best;
}

const MatchingResult& select_best_result(const std::vector<MatchingResult>& results)
{
    return results[select_best_index(results)];
}

} // namespace lending
