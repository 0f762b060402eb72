#ifndef PARAMETERS_HPP
#define PARAMETERS_HPP

#include "delivery.hpp"
#include <string>

// Parameters of one optimization call. Passed by value/const&, never stored.
struct AlgorithmConfig {
    int population_size = 100;
    int max_generations = 500;
    double mutation_rate = 0.02;
    double crossover_rate = 1.0;
    int elite_count = 10;
    double convergence_threshold = 0.001; // km; smaller change = no improvement
    bool dual_route_comparison = true;

    int tournament_size = 5;
    int stagnation_limit = 50;      // generations without improvement before stopping
    int refinement_iterations = 10; // order-crossover passes between the two parents

    // Origin-adjacency bonus
    double adjacency_tolerance_km = 0.1;
    double adjacency_reward = 50.0;
    double adjacency_penalty_per_km = 10.0;
    double adjacency_penalty_cap = 30.0;

    // Constructive heuristics
    double lookahead_weight = 0.3;
    double tail_return_weight = 0.5;
    double optimized_tail_weight = 0.3;

    unsigned int seed = 0;
    bool parallel_parents = false;
    bool verbose = false;
};

Origin default_depot();

/**
 * @brief Overrides 'config' and 'depot' from a "key = value" file.
 *
 * Unknown keys are ignored. Bad values and unreadable files produce a warning
 * on std::cerr and leave the defaults untouched.
 */
void load_parameters_from_file(const std::string& filename, AlgorithmConfig& config, Origin& depot);

// Throws std::invalid_argument if the config cannot drive a search.
void validate_config(const AlgorithmConfig& config);

/**
 * @brief Config of one parent of the dual-route comparison.
 *
 * 'A': 0.8x population, 0.8x mutation.
 * 'B': 1.2x population, 1.2x mutation, 0.9x crossover.
 */
AlgorithmConfig derive_parent_config(const AlgorithmConfig& base, char parent);

void print_parameters(const AlgorithmConfig& config, const Origin& depot);

#endif // PARAMETERS_HPP
