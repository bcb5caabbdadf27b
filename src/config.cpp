#include "lending/config.hpp"
#include "lending/errors.hpp"

#include <cstdint>
#include <fstream>
#include <string>

using nlohmann::json;

namespace lending {

std::uint64_t read_unsigned(const json& value, const char* field)
{
    if (value.is_number_unsigned())
        return value.get<std::uint64_t>();
    if (value.is_number_integer() && value.get<std::int64_t>() >= 0)
        return static_cast<std::uint64_t>(value.get<std::int64_t>());
    throw InvalidInput(std::string(field) + " must be a non-negative integer, got " + value.dump());
}

void validate_config(const BatchConfig& config)
{
    if (config.max_batch_size == 0 || config.max_batch_size > kMaxSupportedBatchSize)
    {
        throw InvalidInput("max_batch_size must be in [1, "
                           + std::to_string(kMaxSupportedBatchSize) + "], got "
                           + std::to_string(config.max_batch_size));
    }
    if (config.worker_threads == 0)
        throw InvalidInput("worker_threads must be at least 1");
}

BatchConfig parse_batch_config(const json& j)
{
    if (!j.is_object())
        throw InvalidInput("config must be a JSON object");

    BatchConfig cfg;
    try {
        if (j.contains("max_batch_size"))
            cfg.max_batch_size = static_cast<std::size_t>(
                read_unsigned(j.at("max_batch_size"), "max_batch_size"));
        if (j.contains("worker_threads"))
            cfg.worker_threads = static_cast<std::size_t>(
                read_unsigned(j.at("worker_threads"), "worker_threads"));

        if (j.contains("settlement_time") && !j.at("settlement_time").is_null())
            cfg.settlement_time = read_unsigned(j.at("settlement_time"), "settlement_time");

        if (j.contains("output") && !j.at("output").is_null())
            cfg.output = j.at("output").get<std::string>();
    } catch (const json::exception& e) {
        throw InvalidInput(std::string("config: ") + e.what());
    }

    validate_config(cfg);
    return cfg;
}

BatchConfig load_batch_config(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        throw InvalidInput("failed to open config " + path);

    json j;
    try {
        in >> j;
    } catch (const json::exception& e) {
        throw InvalidInput("config " + path + ": " + e.what());
    }
    return parse_batch_config(j);
}

} // namespace lending
