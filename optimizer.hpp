/*
 * optimizer.hpp
 * Public entry points: plan a route from the depot or re-plan it from the
 * driver's current position.
 */
#ifndef OPTIMIZER_HPP
#define OPTIMIZER_HPP

#include "delivery.hpp"
#include "dual_route.hpp"
#include "parameters.hpp"
#include <atomic>
#include <optional>
#include <string>
#include <vector>

enum class RouteKind {
    Optimized, // genetic search ran
    Trivial,   // two stops or fewer, metrics computed directly
    Fallback   // fewer than two geocoded stops, flat estimates
};

std::string to_string(RouteKind kind);

/**
 * @struct OptimizedRoute
 * @brief Final stop order plus its quality metrics.
 *
 * Stops without coordinates are appended after the optimized ones, in input
 * order. total_distance_km only covers the geocoded stops.
 */
struct OptimizedRoute {
    std::vector<Stop> stops;
    double total_distance_km = 0.0;
    double estimated_time_hours = 0.0;
    double optimization_score = 0.0; // 0..100
    double fuel_cost_estimate = 0.0;
    int generation_count = 0;
    double fitness_score = 0.0;
    double time_window_penalty = 0.0;
    double priority_bonus = 0.0;
    RouteKind kind = RouteKind::Optimized;
    bool cancelled = false;
    std::optional<RouteComparison> route_comparison; // dual-route mode only
};

/**
 * @brief Round trip depot -> stops -> depot.
 *
 * @param cancel Optional flag polled once per generation; when set the best
 *               route found so far is returned with 'cancelled' = true.
 * @throws std::invalid_argument if 'config' fails validate_config.
 */
OptimizedRoute optimize_from_depot(const std::vector<Stop>& stops, const AlgorithmConfig& config,
                                   const Origin& depot, const std::atomic<bool>* cancel = nullptr);

/**
 * @brief current -> stops -> depot.
 *
 * The stop nearest 'current' is moved to the front before seeding.
 */
OptimizedRoute optimize_from_current_position(const std::vector<Stop>& stops, const Origin& current,
                                              const AlgorithmConfig& config, const Origin& depot,
                                              const std::atomic<bool>* cancel = nullptr);

// Moves the geocoded stop nearest to 'origin' to index 0; order of the others is kept.
void move_nearest_to_front(std::vector<Stop>& stops, const Origin& origin);

void print_route_summary(const OptimizedRoute& route);

/**
 * @brief Writes the route to a text file (START, DEPOT, STOPS, METRICS blocks).
 * @return false if the file cannot be written.
 */
bool export_route(const OptimizedRoute& route, const Origin& start, const Origin& depot,
                  const std::string& filename);

#endif // OPTIMIZER_HPP
