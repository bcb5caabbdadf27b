#include "lending/types.hpp"

namespace lending {

const Amount& max_amount()
{
    static const Amount limit = (Amount(1) << 256) - 1;
    return limit;
}

const RateBps& max_rate()
{
    static const RateBps limit = (RateBps(1) << 32) - 1;
    return limit;
}

const char* to_string(Side side) noexcept
{
    switch (side)
    {
    case Side::Lender:   return "lender";
    case Side::Borrower: return "borrower";
    }
    return "unknown";
}

const char* to_string(Feasibility f) noexcept
{
    switch (f)
    {
    case Feasibility::None:            return "NONE";
    case Feasibility::FullMatch:       return "FULL_MATCH";
    case Feasibility::PartialLender:   return "PARTIAL_LENDER";
    case Feasibility::PartialBorrower: return "PARTIAL_BORROWER";
    case Feasibility::PartialBoth:     return "PARTIAL_BOTH";
    }
    return "UNKNOWN";
}

const char* describe(Feasibility f) noexcept
{
    switch (f)
    {
    case Feasibility::None:            return "No compatible lenders and borrowers";
    case Feasibility::FullMatch:       return "All orders fully matched";
    case Feasibility::PartialLender:   return "Lenders partially matched, borrowers fully matched";
    case Feasibility::PartialBorrower: return "Borrowers partially matched, lenders fully matched";
    case Feasibility::PartialBoth:     return "Both sides partially matched";
    }
    return "Unknown";
}

} // namespace lending
