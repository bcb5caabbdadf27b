#include "lending/json_io.hpp"
#include "lending/config.hpp"
#include "lending/errors.hpp"
#include "lending/validation.hpp"

#include <cctype>
#include <cstdint>
#include <fstream>
#include <optional>
#include <utility>

using nlohmann::json;

namespace {

std::string to_upper(std::string s)
{
    for (auto& c : s)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

lending::Side parse_side(const json& value)
{
    if (!value.is_string())
        throw lending::InvalidInput("side must be a string");

    const auto up = to_upper(value.get<std::string>());
    if (up == "LENDER" || up == "L")
        return lending::Side::Lender;
    if (up == "BORROWER" || up == "B")
        return lending::Side::Borrower;
    throw lending::InvalidInput("unknown side '" + value.get<std::string>() + "'");
}

// Decimal string ("-12" allowed, rejected later by validation) or JSON integer.
boost::multiprecision::cpp_int parse_integer(const json& value, const char* field)
{
    using boost::multiprecision::cpp_int;

    if (value.is_number_unsigned())
        return cpp_int(value.get<std::uint64_t>());
    if (value.is_number_integer())
        return cpp_int(value.get<std::int64_t>());

    if (!value.is_string())
        throw lending::InvalidInput(std::string(field) + " must be an integer or a decimal string");

    const std::string s = value.get<std::string>();
    const std::size_t digits_from = (!s.empty() && s[0] == '-') ? 1 : 0;
    if (s.size() == digits_from)
        throw lending::InvalidInput(std::string(field) + " is empty");
    for (std::size_t i = digits_from; i < s.size(); ++i)
    {
        if (!std::isdigit(static_cast<unsigned char>(s[i])))
            throw lending::InvalidInput(std::string(field) + " '" + s + "' is not an integer");
    }

    // cpp_int reads a leading 0 as an octal prefix; amounts are always decimal.
    std::size_t first = s.find_first_not_of('0', digits_from);
    if (first == std::string::npos)
        return cpp_int(0);
    std::string digits = s.substr(first);
    if (digits_from == 1)
        digits.insert(0, 1, '-');
    return cpp_int(digits);
}

std::optional<std::uint64_t> optional_unsigned(const json& j, const char* key)
{
    if (!j.contains(key) || j.at(key).is_null())
        return std::nullopt;
    return lending::read_unsigned(j.at(key), key);
}

std::optional<boost::multiprecision::cpp_int> optional_integer(const json& j, const char* key)
{
    if (!j.contains(key) || j.at(key).is_null())
        return std::nullopt;
    return parse_integer(j.at(key), key);
}

lending::Order parse_order(const json& j)
{
    if (!j.is_object())
        throw lending::InvalidInput("order must be a JSON object");

    lending::Order ord;
    ord.id        = lending::read_unsigned(j.at("id"), "id");
    ord.side      = parse_side(j.at("side"));
    ord.sender    = j.value("sender", std::string{});
    ord.principal = parse_integer(j.at("principal"), "principal");
    ord.rate      = parse_integer(j.at("rate_bps"), "rate_bps");
    ord.maturity  = lending::read_unsigned(j.at("maturity"), "maturity");

    ord.min_principal = optional_integer(j, "min_principal");
    ord.max_principal = optional_integer(j, "max_principal");
    ord.min_rate      = optional_integer(j, "min_rate_bps");
    ord.max_rate      = optional_integer(j, "max_rate_bps");
    ord.expiry        = optional_unsigned(j, "expiry");
    return ord;
}

void put_optional(json& j, const char* key, const std::optional<boost::multiprecision::cpp_int>& v)
{
    if (v)
        j[key] = v->str();
}

} // namespace

namespace lending {

OrderList parse_orders(const json& j)
{
    const json* list = &j;
    if (j.is_object())
    {
        if (!j.contains("orders"))
            throw InvalidInput("batch has no \"orders\" array");
        list = &j.at("orders");
    }
    if (!list->is_array())
        throw InvalidInput("\"orders\" must be an array");

    OrderList orders;
    orders.reserve(list->size());
    try {
        for (const auto& item : *list)
            orders.push_back(parse_order(item));
    } catch (const json::exception& e) {
        throw InvalidInput(std::string("order JSON: ") + e.what());
    }

    validate_orders(orders);
    return orders;
}

OrderList load_orders(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        throw InvalidInput("failed to open " + path);

    json j;
    try {
        in >> j;
    } catch (const json::exception& e) {
        throw InvalidInput(path + ": " + e.what());
    }
    return parse_orders(j);
}

json order_to_json(const Order& order)
{
    json j;
    j["id"]        = order.id;
    j["side"]      = to_string(order.side);
    j["sender"]    = order.sender;
    j["principal"] = order.principal.str();
    j["rate_bps"]  = order.rate.str();
    j["maturity"]  = order.maturity;

    put_optional(j, "min_principal", order.min_principal);
    put_optional(j, "max_principal", order.max_principal);
    put_optional(j, "min_rate_bps", order.min_rate);
    put_optional(j, "max_rate_bps", order.max_rate);
    if (order.expiry)
        j["expiry"] = *order.expiry;
    return j;
}

json orders_to_json(const OrderList& orders)
{
    json list = json::array();
    for (const auto& ord : orders)
        list.push_back(order_to_json(ord));
    return json{{"orders", std::move(list)}};
}

json transfer_to_json(const Transfer& transfer)
{
    return json{
        {"lender_id",   transfer.lender_id},
        {"borrower_id", transfer.borrower_id},
        {"lender",      transfer.lender},
        {"borrower",    transfer.borrower},
        {"amount",      transfer.amount.str()},
        {"rate_bps",    transfer.rate.str()},
        {"maturity",    transfer.maturity},
    };
}

json outcome_to_json(const OrderOutcome& outcome)
{
    json j;
    j["side"]           = to_string(outcome.side);
    j["status"]         = to_string(outcome.status);
    j["matched_amount"] = outcome.matched_amount.str();
    if (outcome.rate)
        j["rate_bps"] = outcome.rate->str();
    if (outcome.maturity)
        j["maturity"] = *outcome.maturity;
    if (outcome.funding_rate)
        j["funding_rate_bps"] = outcome.funding_rate->to_string();
    j["description"] = outcome.description;
    return j;
}

json bucket_to_json(const BucketOutcome& bucket)
{
    json j;
    j["maturity"]              = bucket.maturity;
    j["feasibility"]           = to_string(bucket.feasibility());
    j["partitions_enumerated"] = bucket.stats.partitions_enumerated;
    j["partitions_feasible"]   = bucket.stats.partitions_feasible;
    j["results_feasible"]      = bucket.stats.results_feasible;

    if (!bucket.best)
        return j;

    const MatchingResult& r = *bucket.best;
    j["total_lender_amount"]       = r.total_lender_amount.str();
    j["total_borrower_amount"]     = r.total_borrower_amount.str();
    j["total_matched_amount"]      = r.total_matched_amount.str();
    j["unmatched_lender_amount"]   = r.unmatched_lender_amount.str();
    j["unmatched_borrower_amount"] = r.unmatched_borrower_amount.str();
    j["average_lender_rate_bps"]   = r.average_lender_rate.to_string();
    j["average_borrower_rate_bps"] = r.average_borrower_rate.to_string();
    j["rate_spread_bps"]           = r.rate_spread.to_string();
    j["matching_efficiency"]       = r.matching_efficiency.to_string();

    json groups = json::array();
    for (const auto& g : r.groups)
    {
        if (!g.matched())
            continue;
        json ids = json::array();
        for (OrderIndex idx : g.members)
            ids.push_back(bucket.order_ids.at(idx));
        groups.push_back(json{
            {"orders",         std::move(ids)},
            {"feasibility",    to_string(g.feasibility)},
            {"matched_amount", g.matched_amount.str()},
            {"rate_bps",       g.effective_rate.str()},
            {"maturity",       g.maturity},
        });
    }
    j["matched_groups"] = std::move(groups);
    return j;
}

json report_to_json(const BatchReport& report)
{
    json buckets = json::array();
    for (const auto& b : report.buckets)
        buckets.push_back(bucket_to_json(b));

    json transfers = json::array();
    for (const auto& t : report.transfers)
        transfers.push_back(transfer_to_json(t));

    json diagnostics = json::object();
    for (const auto& [id, outcome] : report.diagnostics)
        diagnostics[std::to_string(id)] = outcome_to_json(outcome);

    return json{
        {"total_matched",     report.total_matched.str()},
        {"total_transferred", report.total_transferred.str()},
        {"expired_orders",    report.expired_orders},
        {"buckets",           std::move(buckets)},
        {"transfers",         std::move(transfers)},
        {"diagnostics",       std::move(diagnostics)},
    };
}

} // namespace lending
