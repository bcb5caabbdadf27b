#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "lending/batch.hpp"
#include "lending/types.hpp"

namespace lending {

/// Parse `{"orders": [...]}` (or a bare array of orders).
/// Amounts and rates are decimal strings or non-negative integers.
/// Throws InvalidInput on malformed JSON content and ArithmeticOverflow
/// for out-of-range values; every parsed order is validated.
OrderList parse_orders(const nlohmann::json& j);

/// parse_orders() on the contents of a file.
OrderList load_orders(const std::string& path);

nlohmann::json order_to_json(const Order& order);
nlohmann::json orders_to_json(const OrderList& orders);

nlohmann::json transfer_to_json(const Transfer& transfer);
nlohmann::json outcome_to_json(const OrderOutcome& outcome);
nlohmann::json bucket_to_json(const BucketOutcome& bucket);
nlohmann::json report_to_json(const BatchReport& report);

} // namespace lending
