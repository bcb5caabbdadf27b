#pragma once

#include "lending/types.hpp"

namespace lending {

/// Throws InvalidInput for a malformed or self-contradictory order and
/// ArithmeticOverflow when principal or rate leave the representable range.
void validate_order(const Order& order);

/// validate_order() for every entry plus batch-level checks (unique ids).
void validate_orders(const OrderList& orders);

/// Throws ArithmeticOverflow if `value` exceeds max_amount().
void check_amount_range(const Amount& value, const char* what);

} // namespace lending
