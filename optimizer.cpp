#include "optimizer.hpp"
#include "evaluation.hpp"
#include "ga.hpp"
#include "geo.hpp"
#include "utils.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>

using std::vector;

std::string to_string(RouteKind kind) {
    switch (kind) {
    case RouteKind::Optimized: return "optimized";
    case RouteKind::Trivial: return "trivial";
    case RouteKind::Fallback: return "fallback";
    }
    return "unknown";
}

void move_nearest_to_front(vector<Stop>& stops, const Origin& origin) {
    if (stops.size() < 2) return;

    size_t nearest = 0;
    double best = calculate_distance_to_origin(stops[0], origin);
    for (size_t i = 1; i < stops.size(); ++i) {
        double d = calculate_distance_to_origin(stops[i], origin);
        if (d < best) {
            best = d;
            nearest = i;
        }
    }
    std::rotate(stops.begin(), stops.begin() + nearest, stops.begin() + nearest + 1);
}

static void fill_reported_metrics(OptimizedRoute& result) {
    result.time_window_penalty = calculate_time_window_penalty(result.stops);
    result.priority_bonus = calculate_priority_bonus(result.stops);
}

static OptimizedRoute build_trivial_route(const vector<Stop>& valid, const vector<Stop>& invalid,
                                          const Origin& start, const Origin& depot) {
    OptimizedRoute result;
    result.kind = RouteKind::Trivial;
    result.stops = valid;
    result.stops.insert(result.stops.end(), invalid.begin(), invalid.end());

    const int n = static_cast<int>(result.stops.size());
    result.total_distance_km = route_distance(valid, start, depot);
    result.estimated_time_hours = estimate_delivery_time(n, result.total_distance_km);
    result.optimization_score = 100.0;
    result.fuel_cost_estimate = estimate_fuel_cost(result.total_distance_km);
    result.generation_count = 0;
    result.fitness_score = distance_fitness(result.total_distance_km, static_cast<int>(valid.size()));
    fill_reported_metrics(result);
    return result;
}

// Fewer than two geocoded stops: keep input order, flat per-stop estimates.
static OptimizedRoute build_fallback_route(const vector<Stop>& stops) {
    OptimizedRoute result;
    result.kind = RouteKind::Fallback;
    result.stops = stops;

    const int n = static_cast<int>(stops.size());
    result.total_distance_km = 3.0 * n;
    result.estimated_time_hours = 0.5 * n;
    result.optimization_score = 60.0;
    result.fuel_cost_estimate = 18.0 * n;
    result.generation_count = 0;
    result.fitness_score = distance_fitness(result.total_distance_km, n);
    fill_reported_metrics(result);
    return result;
}

static OptimizedRoute optimize(const vector<Stop>& stops, const Origin& start, const Origin& depot,
                               const AlgorithmConfig& config, bool nearest_first,
                               const std::atomic<bool>* cancel) {
    validate_config(config);

    vector<Stop> valid, invalid;
    split_by_coordinates(stops, valid, invalid);
    if (nearest_first) {
        move_nearest_to_front(valid, start);
    }

    if (stops.size() <= 2) {
        return build_trivial_route(valid, invalid, start, depot);
    }
    if (valid.size() < 2) {
        if (config.verbose) {
            std::cerr << "WARNING: only " << valid.size() << " of " << stops.size()
                      << " stops have coordinates. Returning fallback route." << std::endl;
        }
        return build_fallback_route(stops);
    }
    if (valid.size() <= 2) {
        return build_trivial_route(valid, invalid, start, depot);
    }

    DeliveryProblem problem;
    problem.build(valid, start, depot);
    if (config.verbose) {
        problem.printData();
    }

    OptimizedRoute result;
    result.kind = RouteKind::Optimized;
    vector<int> visits;

    if (config.dual_route_comparison) {
        DualRouteResult dual = run_dual_route_comparison(problem, config, cancel);
        visits = dual.visits;
        result.generation_count = dual.generation_count;
        result.cancelled = dual.cancelled;
        result.route_comparison = dual.comparison;
    } else {
        std::mt19937 rng = make_engine(config.seed, "single");
        GAResult single = run_genetic_algorithm(problem, config, "", rng, cancel);
        visits = single.best.visits;
        result.generation_count = single.generation_count;
        result.cancelled = single.cancelled;
    }

    result.stops = problem.stopsInOrder(visits);
    result.stops.insert(result.stops.end(), invalid.begin(), invalid.end());

    const int n = static_cast<int>(result.stops.size());
    result.total_distance_km = route_distance(problem, visits);
    result.estimated_time_hours = estimate_delivery_time(n, result.total_distance_km);
    result.optimization_score = calculate_optimization_score(result.total_distance_km, n);
    result.fuel_cost_estimate = estimate_fuel_cost(result.total_distance_km);
    result.fitness_score = distance_fitness(result.total_distance_km, problem.size());
    fill_reported_metrics(result);
    return result;
}

OptimizedRoute optimize_from_depot(const vector<Stop>& stops, const AlgorithmConfig& config,
                                   const Origin& depot, const std::atomic<bool>* cancel) {
    return optimize(stops, depot, depot, config, false, cancel);
}

OptimizedRoute optimize_from_current_position(const vector<Stop>& stops, const Origin& current,
                                              const AlgorithmConfig& config, const Origin& depot,
                                              const std::atomic<bool>* cancel) {
    return optimize(stops, current, depot, config, true, cancel);
}

void print_route_summary(const OptimizedRoute& route) {
    const std::ios_base::fmtflags flags = std::cout.flags();
    const std::streamsize precision = std::cout.precision();

    std::cout << "\n=== Route summary (" << to_string(route.kind) << ") ===\n";
    for (size_t i = 0; i < route.stops.size(); ++i) {
        const Stop& s = route.stops[i];
        std::cout << std::setw(4) << i + 1 << ". " << s.id << " " << s.customer_name;
        if (!s.area.empty()) std::cout << " [" << s.area << "]";
        if (!s.has_coordinates()) std::cout << " (no coordinates)";
        std::cout << "\n";
    }

    std::cout << "\n--- Metrics ---\n";
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "  Total distance (km): ........ " << route.total_distance_km << "\n";
    std::cout << "  Estimated time (h): ......... " << route.estimated_time_hours << "\n";
    std::cout << "  Fuel cost: .................. " << route.fuel_cost_estimate << "\n";
    std::cout << "  Optimization score: ......... " << route.optimization_score << "\n";
    std::cout << "  Fitness: .................... " << route.fitness_score << "\n";
    std::cout << "  Time window penalty: ........ " << route.time_window_penalty << "\n";
    std::cout << "  Priority bonus: ............. " << route.priority_bonus << "\n";
    std::cout << "  Generations: ................ " << route.generation_count << "\n";
    if (route.cancelled) {
        std::cout << "  Run was cancelled before convergence.\n";
    }

    if (route.route_comparison) {
        const RouteComparison& cmp = *route.route_comparison;
        std::cout << "\n--- Dual route comparison ---\n";
        std::cout << "  Route A: " << cmp.route_a.total_distance_km << "km (fitness "
                  << cmp.route_a.fitness_score << ")\n";
        std::cout << "  Route B: " << cmp.route_b.total_distance_km << "km (fitness "
                  << cmp.route_b.fitness_score << ")\n";
        std::cout << "  Crossover: " << cmp.crossover.final_distance << "km after "
                  << cmp.crossover.iterations << " iterations"
                  << (cmp.crossover.improved_from_parents ? " (improved)" : "") << "\n";
        std::cout << "  Selected: " << to_string(cmp.selected_route)
                  << ", distance improvement " << cmp.distance_improvement << "km"
                  << ", fitness improvement " << cmp.fitness_improvement << "\n";
    }
    std::cout.flags(flags);
    std::cout.precision(precision);
}

bool export_route(const OptimizedRoute& route, const Origin& start, const Origin& depot,
                  const std::string& filename) {
    std::ofstream out(filename);
    if (!out.is_open()) return false;

    out << std::fixed << std::setprecision(6);
    out << "START " << start.latitude << " " << start.longitude << " " << start.name << "\n";
    out << "DEPOT " << depot.latitude << " " << depot.longitude << " " << depot.name << "\n";

    out << "STOPS " << route.stops.size() << "\n";
    for (const Stop& s : route.stops) {
        out << s.id << " ";
        if (s.has_coordinates()) {
            out << *s.latitude << " " << *s.longitude;
        } else {
            out << "- -";
        }
        out << " " << s.customer_name << "\n";
    }
    out << "END_STOPS\n";

    out << std::setprecision(2);
    out << "METRICS\n";
    out << "kind " << to_string(route.kind) << "\n";
    out << "distance_km " << route.total_distance_km << "\n";
    out << "time_hours " << route.estimated_time_hours << "\n";
    out << "fuel_cost " << route.fuel_cost_estimate << "\n";
    out << "optimization_score " << route.optimization_score << "\n";
    out << "fitness " << route.fitness_score << "\n";
    out << "generations " << route.generation_count << "\n";
    if (route.route_comparison) {
        out << "selected_route " << to_string(route.route_comparison->selected_route) << "\n";
    }
    out << "END_METRICS\n";
    return static_cast<bool>(out);
}
