#include "lending/batch.hpp"
#include "lending/config.hpp"
#include "lending/json_io.hpp"
#include "lending/partition.hpp"
#include "lending/summary.hpp"

#include <exception>
#include <fstream>
#include <iostream>
#include <string>

using namespace lending;

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: lending_match <batch.json> [config.json]\n";
        return 1;
    }

    try {
        BatchConfig config;
        if (argc >= 3) {
            config = load_batch_config(argv[2]);
        }

        std::ostream& log = summary_stream(config, std::cout, std::cerr);

        const OrderList orders = load_orders(argv[1]);
        log << "[batch] loaded " << orders.size() << " orders from " << argv[1]
            << " (max bucket " << config.max_batch_size
            << ", " << bell_number(config.max_batch_size) << " partitions worst case"
            << ", threads " << config.worker_threads << ")\n";

        const BatchReport report = process_batch(orders, config);
        print_summary(log, report, orders.size());

        const std::string body = report_to_json(report).dump(2);
        if (config.output) {
            std::ofstream out(*config.output);
            if (!out) {
                std::cerr << "Failed to open: " << *config.output << "\n";
                return 1;
            }
            out << body << "\n";
            std::cout << "[batch] report written to " << *config.output << "\n";
        } else {
            std::cout << body << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
