#ifndef GA_HPP
#define GA_HPP

#include "delivery.hpp"
#include "parameters.hpp"
#include "route.hpp"
#include <atomic>
#include <iostream>
#include <random>
#include <string>
#include <vector>

struct GAResult {
    Route best;                // fittest route of the last population, evaluated
    int generation_count = 0;  // generation index reached
    bool cancelled = false;
};

/**
 * @brief Runs the genetic search on one problem.
 *
 * Stops after 'stagnation_limit' generations without the best distance moving
 * by 'convergence_threshold', at 'max_generations', or when *cancel becomes
 * true (polled once per generation).
 *
 * @param seed_label Non-empty in dual-route mode ("route_a", "route_b"); enables
 *                   the seeded share of the initial population and tags log lines.
 * @param log        Progress output when config.verbose is set. Concurrent runs
 *                   must not share a stream.
 */
GAResult run_genetic_algorithm(const DeliveryProblem& problem, const AlgorithmConfig& config,
                               const std::string& seed_label, std::mt19937& rng,
                               const std::atomic<bool>* cancel = nullptr,
                               std::ostream& log = std::cout);

/**
 * @brief Initial generation.
 *
 * index 0        : build_optimized_route
 * index 1..14    : build_lookahead_route
 * index 15..19   : build_priority_route
 * index 20..24   : build_seeded_route (only with a seed label)
 * remaining      : build_random_route
 */
Population make_initial_population(const DeliveryProblem& problem, const AlgorithmConfig& config,
                                   const std::string& seed_label, std::mt19937& rng);

/**
 * @brief Order crossover that never touches position 0.
 *
 * Position 0 comes from parent1. A random segment [start, end], start >= 1, is
 * copied from parent1; the other positions are filled in order with the genes
 * of parent2 not used yet. Skipped (copy of parent1) with probability
 * 1 - crossover_rate.
 */
std::vector<int> order_crossover(const std::vector<int>& parent1, const std::vector<int>& parent2,
                                 double crossover_rate, std::mt19937& rng);

// Each position is swapped with a random one with probability 'mutation_rate'.
void swap_mutation(std::vector<int>& visits, double mutation_rate, std::mt19937& rng);

const Route& tournamentSelect(const Population& pop, int k, std::mt19937& rng);

// Elites verbatim, rest by tournament + crossover + mutation. Expects an evaluated population.
Population evolve_population(const Population& pop, const AlgorithmConfig& config, std::mt19937& rng);

#endif // GA_HPP
