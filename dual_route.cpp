#include "dual_route.hpp"
#include "evaluation.hpp"
#include "utils.hpp"
#include <algorithm>
#include <future>
#include <iomanip>
#include <iostream>
#include <sstream>

using std::vector;

std::string to_string(SelectedRoute selected) {
    switch (selected) {
    case SelectedRoute::A: return "A";
    case SelectedRoute::B: return "B";
    case SelectedRoute::Crossover: return "crossover";
    }
    return "unknown";
}

RefinementResult refine_with_order_crossover(const DeliveryProblem& problem,
                                             const vector<int>& parent_a,
                                             const vector<int>& parent_b,
                                             int max_iterations, std::mt19937& rng, bool verbose) {
    RefinementResult result;
    result.visits = parent_a;
    result.distance = route_distance(problem, parent_a);

    for (int it = 0; it < max_iterations; ++it) {
        vector<int> offspring = order_crossover(result.visits, parent_b, 1.0, rng);
        double distance = route_distance(problem, offspring);
        result.iterations++;

        if (distance < result.distance) {
            if (verbose) {
                std::cout << "  Refinement " << it + 1 << ": " << std::fixed << std::setprecision(2)
                          << result.distance << "km -> " << distance << "km" << std::endl;
            }
            result.visits = offspring;
            result.distance = distance;
        } else if (verbose) {
            std::cout << "  Refinement " << it + 1 << ": no improvement (" << std::fixed
                      << std::setprecision(2) << distance << "km)" << std::endl;
        }
    }
    return result;
}

DualRouteResult compare_parent_routes(const DeliveryProblem& problem, const GAResult& parent_a,
                                      const GAResult& parent_b, const AlgorithmConfig& config,
                                      std::mt19937& rng) {
    const int n = problem.size();
    DualRouteResult result;
    RouteComparison& cmp = result.comparison;

    const double dist_a = route_distance(problem, parent_a.best.visits);
    const double dist_b = route_distance(problem, parent_b.best.visits);
    cmp.route_a.stops = problem.stopsInOrder(parent_a.best.visits);
    cmp.route_a.total_distance_km = dist_a;
    cmp.route_a.fitness_score = distance_fitness(dist_a, n);
    cmp.route_b.stops = problem.stopsInOrder(parent_b.best.visits);
    cmp.route_b.total_distance_km = dist_b;
    cmp.route_b.fitness_score = distance_fitness(dist_b, n);

    if (config.verbose) {
        std::cout << std::fixed << std::setprecision(2)
                  << "Route A: " << dist_a << "km (fitness " << cmp.route_a.fitness_score
                  << ", " << parent_a.generation_count << " generations)\n"
                  << "Route B: " << dist_b << "km (fitness " << cmp.route_b.fitness_score
                  << ", " << parent_b.generation_count << " generations)" << std::endl;
    }

    RefinementResult refined = refine_with_order_crossover(problem, parent_a.best.visits, parent_b.best.visits,
                                                           config.refinement_iterations, rng, config.verbose);
    const double best_parent_distance = std::min(dist_a, dist_b);

    cmp.crossover.iterations = refined.iterations;
    cmp.crossover.final_distance = refined.distance;
    cmp.crossover.final_fitness = distance_fitness(refined.distance, n);
    cmp.crossover.improved_from_parents = refined.distance < best_parent_distance;

    if (cmp.crossover.improved_from_parents) {
        cmp.selected_route = SelectedRoute::Crossover;
        result.visits = refined.visits;
        result.distance = refined.distance;
    } else if (dist_a < dist_b) {
        cmp.selected_route = SelectedRoute::A;
        result.visits = parent_a.best.visits;
        result.distance = dist_a;
    } else {
        cmp.selected_route = SelectedRoute::B;
        result.visits = parent_b.best.visits;
        result.distance = dist_b;
    }

    result.fitness = distance_fitness(result.distance, n);
    result.generation_count = std::max(parent_a.generation_count, parent_b.generation_count);
    result.cancelled = parent_a.cancelled || parent_b.cancelled;

    cmp.distance_improvement = std::max(0.0, best_parent_distance - result.distance);
    cmp.fitness_improvement = result.fitness - std::max(cmp.route_a.fitness_score, cmp.route_b.fitness_score);

    if (config.verbose) {
        std::cout << "Selected route: " << to_string(cmp.selected_route) << " (" << std::fixed
                  << std::setprecision(2) << result.distance << "km, improvement "
                  << cmp.distance_improvement << "km)" << std::endl;
    }
    return result;
}

DualRouteResult run_dual_route_comparison(const DeliveryProblem& problem, const AlgorithmConfig& config,
                                          const std::atomic<bool>* cancel) {
    const AlgorithmConfig config_a = derive_parent_config(config, 'A');
    const AlgorithmConfig config_b = derive_parent_config(config, 'B');

    std::mt19937 rng_a = make_engine(config.seed, "route_a");
    std::mt19937 rng_b = make_engine(config.seed, "route_b");
    std::mt19937 rng_refine = make_engine(config.seed, "crossover");

    GAResult parent_a;
    GAResult parent_b;

    if (config.parallel_parents) {
        // Each task owns its engine and its log buffer; the problem is only read.
        std::ostringstream log_a, log_b;
        auto future_a = std::async(std::launch::async, [&]() {
            return run_genetic_algorithm(problem, config_a, "route_a", rng_a, cancel, log_a);
        });
        auto future_b = std::async(std::launch::async, [&]() {
            return run_genetic_algorithm(problem, config_b, "route_b", rng_b, cancel, log_b);
        });
        parent_a = future_a.get();
        parent_b = future_b.get();
        std::cout << log_a.str() << log_b.str() << std::flush;
    } else {
        parent_a = run_genetic_algorithm(problem, config_a, "route_a", rng_a, cancel);
        parent_b = run_genetic_algorithm(problem, config_b, "route_b", rng_b, cancel);
    }

    return compare_parent_routes(problem, parent_a, parent_b, config, rng_refine);
}
