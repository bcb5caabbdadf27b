#pragma once

#include <cstddef>
#include <ostream>

#include "lending/batch.hpp"
#include "lending/config.hpp"

namespace lending {

/// Stream for the human readable summary: `out` when the JSON report is
/// written to config.output, otherwise `err` so that `out` carries only
/// the report.
std::ostream& summary_stream(const BatchConfig& config, std::ostream& out, std::ostream& err);

/// Tagged "[batch]" / "[bucket]" lines plus one line per order outcome.
void print_summary(std::ostream& os, const BatchReport& report, std::size_t order_count);

} // namespace lending
