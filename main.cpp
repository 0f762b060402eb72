#include "delivery.hpp"
#include "optimizer.hpp"
#include "parameters.hpp"
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

void print_usage(const char* prog_name) {
    std::cerr << "Usage: " << prog_name << " <stops_file> <params_file> <seed> [--verbose] [--from LAT LNG]\n\n";
    std::cerr << "Arguments:\n";
    std::cerr << "  <stops_file>    Stops, one per line, '|' separated.\n";
    std::cerr << "  <params_file>   Parameter file (key = value).\n";
    std::cerr << "  <seed>          Integer seed for the random engines.\n";
    std::cerr << "  --verbose       (Optional) Print search progress.\n";
    std::cerr << "  --from LAT LNG  (Optional) Re-plan from the driver's current position.\n";
}

int main(int argc, char** argv) {
    std::ios::sync_with_stdio(false);
    std::cin.tie(nullptr);

    if (argc < 4) {
        print_usage(argv[0]);
        return 1;
    }

    std::string stops_file = argv[1];
    std::string params_file = argv[2];
    unsigned int seed;
    try {
        seed = std::stoul(argv[3]);
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid seed '" << argv[3] << "'.\n";
        return 1;
    }

    bool verbose_mode = false;
    bool from_current = false;
    Origin current;
    current.name = "Current Location";
    for (int i = 4; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--verbose") {
            verbose_mode = true;
        } else if (arg == "--from" && i + 2 < argc) {
            try {
                current.latitude = std::stod(argv[i + 1]);
                current.longitude = std::stod(argv[i + 2]);
            } catch (const std::exception& e) {
                std::cerr << "Error: invalid position '" << argv[i + 1] << " " << argv[i + 2] << "'.\n";
                return 1;
            }
            from_current = true;
            i += 2;
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    AlgorithmConfig config;
    Origin depot = default_depot();
    load_parameters_from_file(params_file, config, depot);
    config.seed = seed;
    if (verbose_mode) config.verbose = true;

    std::vector<Stop> stops;
    if (!read_stops_from_file(stops_file, stops)) {
        return 1;
    }

    std::cout << "Stops read: " << stops.size() << " from " << stops_file << "\n";
    std::cout << "Seed: " << seed << "\n";
    print_parameters(config, depot);

    OptimizedRoute route;
    try {
        if (from_current) {
            route = optimize_from_current_position(stops, current, config, depot);
        } else {
            route = optimize_from_depot(stops, config, depot);
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    print_route_summary(route);

    if (!export_route(route, from_current ? current : depot, depot, "route_data.txt")) {
        std::cerr << "WARNING: could not write route_data.txt\n";
    }

    std::cout << "\nDone.\n";
    return 0;
}
