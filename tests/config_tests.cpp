#include <gtest/gtest.h>

#include "lending/config.hpp"
#include "lending/errors.hpp"

using namespace lending;
using nlohmann::json;

TEST(BatchConfig, DefaultsAreValid) {
    BatchConfig cfg;
    EXPECT_EQ(cfg.max_batch_size, kDefaultMaxBatchSize);
    EXPECT_EQ(cfg.worker_threads, 1u);
    EXPECT_FALSE(cfg.settlement_time.has_value());
    EXPECT_FALSE(cfg.output.has_value());
    EXPECT_NO_THROW(validate_config(cfg));
}

TEST(BatchConfig, EmptyObjectKeepsDefaults) {
    auto cfg = parse_batch_config(json::object());
    EXPECT_EQ(cfg.max_batch_size, kDefaultMaxBatchSize);
    EXPECT_EQ(cfg.worker_threads, 1u);
}

TEST(BatchConfig, OverridesAreRead) {
    auto cfg = parse_batch_config(json{
        {"max_batch_size", 8},
        {"worker_threads", 4},
        {"settlement_time", 1767225600},
        {"output", "report.json"},
    });

    EXPECT_EQ(cfg.max_batch_size, 8u);
    EXPECT_EQ(cfg.worker_threads, 4u);
    ASSERT_TRUE(cfg.settlement_time.has_value());
    EXPECT_EQ(*cfg.settlement_time, 1767225600u);
    ASSERT_TRUE(cfg.output.has_value());
    EXPECT_EQ(*cfg.output, "report.json");
}

TEST(BatchConfig, NullOptionalsStayUnset) {
    auto cfg = parse_batch_config(json{{"settlement_time", nullptr}, {"output", nullptr}});
    EXPECT_FALSE(cfg.settlement_time.has_value());
    EXPECT_FALSE(cfg.output.has_value());
}

TEST(BatchConfig, OutOfRangeValuesRejected) {
    EXPECT_THROW(parse_batch_config(json{{"max_batch_size", 0}}), InvalidInput);
    EXPECT_THROW(parse_batch_config(json{{"max_batch_size", kMaxSupportedBatchSize + 1}}),
                 InvalidInput);
    EXPECT_THROW(parse_batch_config(json{{"worker_threads", 0}}), InvalidInput);
    EXPECT_NO_THROW(parse_batch_config(json{{"max_batch_size", kMaxSupportedBatchSize}}));
}

TEST(BatchConfig, WrongTypesRejected) {
    EXPECT_THROW(parse_batch_config(json::array()), InvalidInput);
    EXPECT_THROW(parse_batch_config(json{{"max_batch_size", "ten"}}), InvalidInput);
    EXPECT_THROW(parse_batch_config(json{{"output", 5}}), InvalidInput);
    EXPECT_THROW(parse_batch_config(json{{"worker_threads", -1}}), InvalidInput);
    EXPECT_THROW(parse_batch_config(json{{"worker_threads", 2.5}}), InvalidInput);
    EXPECT_THROW(parse_batch_config(json{{"settlement_time", -100}}), InvalidInput);
}

TEST(BatchConfig, ReadUnsignedAcceptsOnlyNonNegativeIntegers) {
    EXPECT_EQ(read_unsigned(json(42), "n"), 42u);
    EXPECT_EQ(read_unsigned(json(0), "n"), 0u);
    EXPECT_EQ(read_unsigned(json(18446744073709551615ull), "n"), 18446744073709551615ull);
    EXPECT_THROW(read_unsigned(json(-1), "n"), InvalidInput);
    EXPECT_THROW(read_unsigned(json(1.0), "n"), InvalidInput);
    EXPECT_THROW(read_unsigned(json("7"), "n"), InvalidInput);
    EXPECT_THROW(read_unsigned(json(nullptr), "n"), InvalidInput);
}

TEST(BatchConfig, MissingFileRejected) {
    EXPECT_THROW(load_batch_config("/nonexistent/lending-config.json"), InvalidInput);
}
