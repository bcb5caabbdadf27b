#include "lending/json_io.hpp"
#include "lending/types.hpp"

#include <cstdint>
#include <iostream>
#include <random>
#include <string>

using namespace lending;

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: lending_generate <num_orders> <seed> [num_maturities]\n";
        return 1;
    }

    const std::size_t   num_orders     = static_cast<std::size_t>(std::stoull(argv[1]));
    const std::uint32_t seed           = static_cast<std::uint32_t>(std::stoul(argv[2]));
    const std::size_t   num_maturities = (argc >= 4) ? static_cast<std::size_t>(std::stoull(argv[3])) : 1;

    if (num_maturities == 0) {
        std::cerr << "num_maturities must be at least 1\n";
        return 1;
    }

    std::mt19937_64 rng(seed);

    // Lenders quote a bit lower than borrowers so that most batches overlap.
    std::uniform_int_distribution<int>           side_dist(0, 1);
    std::uniform_int_distribution<std::uint64_t> principal_dist(1, 50);   // thousands of units
    std::uniform_int_distribution<std::int64_t>  lender_rate_dist(300, 650);
    std::uniform_int_distribution<std::int64_t>  borrower_rate_dist(400, 800);
    std::uniform_int_distribution<std::size_t>   maturity_dist(0, num_maturities - 1);

    const Timestamp first_maturity = 1767225600;  // 2026-01-01T00:00:00Z
    const Timestamp maturity_step  = 30 * 24 * 3600;

    OrderList orders;
    orders.reserve(num_orders);

    for (std::size_t i = 0; i < num_orders; ++i) {
        Order ord;
        ord.id        = static_cast<OrderId>(i + 1);
        ord.side      = (side_dist(rng) == 0) ? Side::Lender : Side::Borrower;
        ord.sender    = "0x" + std::string(38, '0') + std::to_string(10 + i % 90);
        ord.principal = Amount(principal_dist(rng)) * 1000;
        ord.rate      = ord.is_lender() ? lender_rate_dist(rng) : borrower_rate_dist(rng);
        ord.maturity  = first_maturity + maturity_step * maturity_dist(rng);
        orders.push_back(ord);
    }

    std::cout << orders_to_json(orders).dump(2) << "\n";
    return 0;
}
