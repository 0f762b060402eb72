#include "parameters.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

Origin default_depot() {
    Origin depot;
    depot.latitude = 8.4542;
    depot.longitude = 124.6319;
    depot.name = "DeliveryEase Depot";
    depot.address = "Cagayan de Oro City, Philippines";
    return depot;
}

static bool parse_bool(const std::string& value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw std::invalid_argument("not a boolean: " + value);
}

void load_parameters_from_file(const std::string& filename, AlgorithmConfig& config, Origin& depot) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "WARNING: could not open parameter file '" << filename << "'. Using defaults." << std::endl;
        return;
    }

    std::string line;
    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#') {
            continue;
        }

        std::stringstream ss(line);
        std::string key, value;
        if (std::getline(ss, key, '=') && std::getline(ss, value)) {
            trim(key);
            trim(value);

            try {
                if (key == "population_size") config.population_size = std::stoi(value);
                else if (key == "max_generations") config.max_generations = std::stoi(value);
                else if (key == "mutation_rate") config.mutation_rate = std::stod(value);
                else if (key == "crossover_rate") config.crossover_rate = std::stod(value);
                else if (key == "elite_count") config.elite_count = std::stoi(value);
                else if (key == "convergence_threshold") config.convergence_threshold = std::stod(value);
                else if (key == "dual_route_comparison") config.dual_route_comparison = parse_bool(value);
                else if (key == "tournament_size") config.tournament_size = std::stoi(value);
                else if (key == "stagnation_limit") config.stagnation_limit = std::stoi(value);
                else if (key == "refinement_iterations") config.refinement_iterations = std::stoi(value);
                else if (key == "adjacency_tolerance_km") config.adjacency_tolerance_km = std::stod(value);
                else if (key == "adjacency_reward") config.adjacency_reward = std::stod(value);
                else if (key == "adjacency_penalty_per_km") config.adjacency_penalty_per_km = std::stod(value);
                else if (key == "adjacency_penalty_cap") config.adjacency_penalty_cap = std::stod(value);
                else if (key == "lookahead_weight") config.lookahead_weight = std::stod(value);
                else if (key == "tail_return_weight") config.tail_return_weight = std::stod(value);
                else if (key == "optimized_tail_weight") config.optimized_tail_weight = std::stod(value);
                else if (key == "seed") config.seed = static_cast<unsigned int>(std::stoul(value));
                else if (key == "parallel_parents") config.parallel_parents = parse_bool(value);
                else if (key == "verbose") config.verbose = parse_bool(value);
                // Depot
                else if (key == "depot_latitude") depot.latitude = std::stod(value);
                else if (key == "depot_longitude") depot.longitude = std::stod(value);
                else if (key == "depot_name") depot.name = value;
                else if (key == "depot_address") depot.address = value;
            } catch (const std::exception& e) {
                std::cerr << "WARNING: invalid value '" << value << "' for key '" << key << "'." << std::endl;
            }
        }
    }
}

void validate_config(const AlgorithmConfig& config) {
    if (config.population_size < 1)
        throw std::invalid_argument("population_size must be at least 1");
    if (config.max_generations < 0)
        throw std::invalid_argument("max_generations must not be negative");
    if (!(config.mutation_rate >= 0.0 && config.mutation_rate <= 1.0))
        throw std::invalid_argument("mutation_rate must be in [0, 1]");
    if (!(config.crossover_rate >= 0.0 && config.crossover_rate <= 1.0))
        throw std::invalid_argument("crossover_rate must be in [0, 1]");
    if (config.elite_count < 0)
        throw std::invalid_argument("elite_count must not be negative");
    if (!(config.convergence_threshold >= 0.0))
        throw std::invalid_argument("convergence_threshold must not be negative");
    if (config.tournament_size < 1)
        throw std::invalid_argument("tournament_size must be at least 1");
    if (config.stagnation_limit < 0)
        throw std::invalid_argument("stagnation_limit must not be negative");
    if (config.refinement_iterations < 0)
        throw std::invalid_argument("refinement_iterations must not be negative");
}

AlgorithmConfig derive_parent_config(const AlgorithmConfig& base, char parent) {
    AlgorithmConfig derived = base;
    if (parent == 'A') {
        derived.population_size = std::max(1, static_cast<int>(std::floor(base.population_size * 0.8)));
        derived.mutation_rate = base.mutation_rate * 0.8;
    } else if (parent == 'B') {
        derived.population_size = std::max(1, static_cast<int>(std::floor(base.population_size * 1.2)));
        derived.mutation_rate = std::min(1.0, base.mutation_rate * 1.2);
        derived.crossover_rate = base.crossover_rate * 0.9;
    } else {
        throw std::invalid_argument(std::string("unknown parent '") + parent + "'");
    }
    return derived;
}

void print_parameters(const AlgorithmConfig& config, const Origin& depot) {
    std::cout << "--- GA parameters ---\n";
    std::cout << " Population: " << config.population_size << ", Generations: " << config.max_generations
              << ", Stagnation limit: " << config.stagnation_limit << "\n"
              << " Crossover: " << config.crossover_rate << ", Mutation: " << config.mutation_rate
              << ", Elites: " << config.elite_count
              << ", Tournament: " << config.tournament_size << "\n"
              << " Dual route: " << (config.dual_route_comparison ? "on" : "off")
              << ", Refinement iterations: " << config.refinement_iterations
              << ", Parallel parents: " << (config.parallel_parents ? "on" : "off") << "\n";
    std::cout << "--- Depot ---\n";
    std::cout << " " << depot.name << " (" << depot.latitude << ", " << depot.longitude << ") "
              << depot.address << "\n";
}
