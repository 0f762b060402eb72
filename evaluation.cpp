#include "evaluation.hpp"
#include "geo.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

using std::vector;

double route_distance(const DeliveryProblem& problem, const vector<int>& visits) {
    if (visits.empty()) return 0.0;

    double total = problem.startDistance[visits.front()];
    for (size_t i = 0; i + 1 < visits.size(); ++i) {
        total += problem.costMatrix[visits[i]][visits[i + 1]];
    }
    total += problem.depotDistance[visits.back()];

    return total * ROAD_DISTANCE_FACTOR;
}

double route_distance(const vector<Stop>& route, const Origin& start, const Origin& depot) {
    if (route.empty()) return 0.0;

    double total = calculate_distance_to_origin(route.front(), start);
    for (size_t i = 0; i + 1 < route.size(); ++i) {
        total += calculate_distance(route[i], route[i + 1]);
    }
    total += calculate_distance_to_origin(route.back(), depot);

    return total * ROAD_DISTANCE_FACTOR;
}

double distance_fitness(double distance, int stop_count, double bonus) {
    if (stop_count <= 0) return 100.0 + bonus;

    const double baseline = stop_count * BASELINE_KM_PER_STOP;
    const double excess = std::max(0.0, distance - baseline);
    return std::max(0.0, 100.0 - (excess / baseline) * 50.0) + bonus;
}

double origin_adjacency_bonus(const DeliveryProblem& problem, const vector<int>& visits, const AlgorithmConfig& config) {
    if (visits.empty()) return 0.0;

    double min_distance = std::numeric_limits<double>::infinity();
    for (int v : visits) {
        min_distance = std::min(min_distance, problem.startDistance[v]);
    }
    const double first_distance = problem.startDistance[visits.front()];

    if (std::abs(first_distance - min_distance) <= config.adjacency_tolerance_km) {
        return config.adjacency_reward;
    }
    return -std::min(config.adjacency_penalty_cap, (first_distance - min_distance) * config.adjacency_penalty_per_km);
}

void evaluate_route(Route& route, const DeliveryProblem& problem, const AlgorithmConfig& config) {
    route.distance = route_distance(problem, route.visits);
    route.fitness = distance_fitness(route.distance, static_cast<int>(route.visits.size()),
                                     origin_adjacency_bonus(problem, route.visits, config));
}

double estimate_delivery_time(int stop_count, double distance) {
    return distance / AVERAGE_SPEED_KMH + stop_count * HANDLING_HOURS_PER_STOP;
}

double estimate_fuel_cost(double distance) {
    return (distance / FUEL_KM_PER_LITER) * FUEL_PRICE_PER_LITER;
}

double calculate_optimization_score(double distance, int stop_count) {
    if (stop_count <= 0) return 100.0;

    const double ideal = stop_count * IDEAL_KM_PER_STOP;
    const double efficiency = 1.0 - (distance - ideal) / ideal;
    return std::min(100.0, std::max(0.0, efficiency * 100.0));
}

double calculate_time_window_penalty(const vector<Stop>& route) {
    double penalty = 0.0;
    double current_time = 9.0; // departure at 09:00

    for (const Stop& stop : route) {
        if (stop.time_window) {
            if (current_time < stop.time_window->start_hour) {
                penalty += (stop.time_window->start_hour - current_time) * 10.0; // waiting
            } else if (current_time > stop.time_window->end_hour) {
                penalty += (current_time - stop.time_window->end_hour) * 20.0; // late
            }
        }
        current_time += HANDLING_HOURS_PER_STOP;
    }
    return penalty;
}

double calculate_priority_bonus(const vector<Stop>& route) {
    double bonus = 0.0;
    const int n = static_cast<int>(route.size());
    for (int i = 0; i < n; ++i) {
        const Stop& stop = route[i];
        if (stop.priority && *stop.priority <= 2) {
            bonus += (n - i) * (3 - *stop.priority);
        }
    }
    return bonus;
}
