#include "lending/validation.hpp"
#include "lending/errors.hpp"

#include <string>
#include <unordered_set>

namespace lending {

namespace {

std::string order_label(const Order& order)
{
    return "order " + std::to_string(order.id);
}

void check_rate_range(const RateBps& rate, const Order& order, const char* field)
{
    if (rate < 0)
        throw InvalidInput(order_label(order) + ": negative " + field);
    if (rate > max_rate())
        throw ArithmeticOverflow(order_label(order) + ": " + field + " " + rate.str()
                                 + " exceeds " + max_rate().str() + " bps");
}

void check_principal_range(const Amount& amount, const Order& order, const char* field)
{
    if (amount < 0)
        throw InvalidInput(order_label(order) + ": negative " + field);
    if (amount > max_amount())
        throw ArithmeticOverflow(order_label(order) + ": " + field + " exceeds 256 bits");
}

} // namespace

void check_amount_range(const Amount& value, const char* what)
{
    if (value > max_amount())
        throw ArithmeticOverflow(std::string(what) + " exceeds 256 bits");
}

void validate_order(const Order& order)
{
    check_principal_range(order.principal, order, "principal");
    if (order.principal == 0)
        throw InvalidInput(order_label(order) + ": zero principal");

    check_rate_range(order.rate, order, "rate");

    if (order.min_principal)
        check_principal_range(*order.min_principal, order, "min_principal");
    if (order.max_principal)
        check_principal_range(*order.max_principal, order, "max_principal");
    if (order.min_rate)
        check_rate_range(*order.min_rate, order, "min_rate");
    if (order.max_rate)
        check_rate_range(*order.max_rate, order, "max_rate");

    if (order.min_principal && order.max_principal && *order.min_principal > *order.max_principal)
        throw InvalidInput(order_label(order) + ": min_principal above max_principal");
    if (order.min_rate && order.max_rate && *order.min_rate > *order.max_rate)
        throw InvalidInput(order_label(order) + ": min_rate above max_rate");

    // The quoted terms must sit inside the order's own bounds.
    if (order.min_principal && order.principal < *order.min_principal)
        throw InvalidInput(order_label(order) + ": principal below min_principal");
    if (order.max_principal && order.principal > *order.max_principal)
        throw InvalidInput(order_label(order) + ": principal above max_principal");
    if (order.min_rate && order.rate < *order.min_rate)
        throw InvalidInput(order_label(order) + ": rate below min_rate");
    if (order.max_rate && order.rate > *order.max_rate)
        throw InvalidInput(order_label(order) + ": rate above max_rate");
}

void validate_orders(const OrderList& orders)
{
    std::unordered_set<OrderId> seen;
    seen.reserve(orders.size());

    for (const Order& order : orders)
    {
        validate_order(order);
        if (!seen.insert(order.id).second)
            throw InvalidInput("duplicate order id " + std::to_string(order.id));
    }
}

} // namespace lending
