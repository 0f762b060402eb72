/*
 * dual_route.hpp
 * Two differently tuned genetic searches on the same problem, followed by a
 * short order-crossover refinement between their winners.
 */
#ifndef DUAL_ROUTE_HPP
#define DUAL_ROUTE_HPP

#include "delivery.hpp"
#include "ga.hpp"
#include "parameters.hpp"
#include <atomic>
#include <random>
#include <string>
#include <vector>

enum class SelectedRoute { A, B, Crossover };

std::string to_string(SelectedRoute selected);

struct CrossoverRecord {
    int iterations = 0;
    double final_distance = 0.0;
    double final_fitness = 0.0;
    bool improved_from_parents = false;
};

struct ParentRecord {
    std::vector<Stop> stops;
    double total_distance_km = 0.0;
    double fitness_score = 0.0; // distance fitness, no adjacency bonus
};

struct RouteComparison {
    ParentRecord route_a;
    ParentRecord route_b;
    SelectedRoute selected_route = SelectedRoute::A;
    double distance_improvement = 0.0; // km saved versus the better parent, >= 0
    double fitness_improvement = 0.0;
    CrossoverRecord crossover;
};

struct RefinementResult {
    std::vector<int> visits;
    double distance = 0.0;
    int iterations = 0;
};

struct DualRouteResult {
    std::vector<int> visits;
    double distance = 0.0;
    double fitness = 0.0;
    int generation_count = 0;
    bool cancelled = false;
    RouteComparison comparison;
};

/**
 * @brief Order-crossover refinement between two parent routes.
 *
 * Starts from parent_a. Each iteration crosses the running best with parent_b
 * (crossover never skipped) and keeps the offspring if it is strictly shorter.
 * parent_b itself is never replaced.
 */
RefinementResult refine_with_order_crossover(const DeliveryProblem& problem,
                                             const std::vector<int>& parent_a,
                                             const std::vector<int>& parent_b,
                                             int max_iterations, std::mt19937& rng, bool verbose = false);

/**
 * @brief Picks the shortest of {A, B, refined} and builds the comparison record.
 *
 * The refined route is selected only when strictly shorter than both parents.
 * Between the parents, B wins ties.
 */
DualRouteResult compare_parent_routes(const DeliveryProblem& problem, const GAResult& parent_a,
                                      const GAResult& parent_b, const AlgorithmConfig& config,
                                      std::mt19937& rng);

// Runs both parents (optionally concurrently) and compares them.
DualRouteResult run_dual_route_comparison(const DeliveryProblem& problem, const AlgorithmConfig& config,
                                          const std::atomic<bool>* cancel = nullptr);

#endif // DUAL_ROUTE_HPP
