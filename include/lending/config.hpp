#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "lending/types.hpp"

namespace lending {

constexpr std::size_t kDefaultMaxBatchSize = 10;  // Bell(10) = 115975 partitions
constexpr std::size_t kMaxSupportedBatchSize = 12; // Bell(12) = 4213597 partitions

struct BatchConfig {
    /// Largest single-maturity bucket the matcher will enumerate.
    std::size_t max_batch_size{kDefaultMaxBatchSize};

    /// Workers used to match maturity buckets; 1 runs them inline.
    std::size_t worker_threads{1};

    /// When set, orders with expiry <= settlement_time are dropped.
    std::optional<Timestamp> settlement_time;

    /// Report destination for the CLI; stdout when empty.
    std::optional<std::string> output;
};

/// Non-negative JSON integer. Negative numbers, floats and non-numbers
/// throw InvalidInput naming `field`.
std::uint64_t read_unsigned(const nlohmann::json& value, const char* field);

/// Throws InvalidInput when a field is outside its supported range.
void validate_config(const BatchConfig& config);

/// Reads the optional keys "max_batch_size", "worker_threads",
/// "settlement_time" and "output"; missing keys keep their defaults.
BatchConfig parse_batch_config(const nlohmann::json& j);

/// parse_batch_config() on the contents of a JSON file.
BatchConfig load_batch_config(const std::string& path);

} // namespace lending
