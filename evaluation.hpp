/*
 * evaluation.hpp
 * Distance, fitness and the delivery metrics reported with a route.
 */
#ifndef EVALUATION_HPP
#define EVALUATION_HPP

#include "delivery.hpp"
#include "parameters.hpp"
#include "route.hpp"
#include <vector>

const double BASELINE_KM_PER_STOP = 1.5;
const double IDEAL_KM_PER_STOP = 2.0;
const double AVERAGE_SPEED_KMH = 30.0;
const double HANDLING_HOURS_PER_STOP = 0.33;
const double FUEL_KM_PER_LITER = 10.0;
const double FUEL_PRICE_PER_LITER = 60.0;

/**
 * @brief Road-corrected length of start -> visits... -> depot.
 *
 * The loop is always closed at the depot, also when the run starts from a
 * live position. An empty route has length 0.
 */
double route_distance(const DeliveryProblem& problem, const std::vector<int>& visits);

// Same, computed directly on stops (missing coordinates cost the penalty distance).
double route_distance(const std::vector<Stop>& route, const Origin& start, const Origin& depot);

/**
 * @brief Distance-based fitness, higher is better.
 *
 * baseline = stop_count * 1.5 km; fitness = max(0, 100 - excess/baseline * 50) + bonus.
 */
double distance_fitness(double distance, int stop_count, double bonus = 0.0);

/**
 * @brief Reward for opening with the stop nearest to the start.
 *
 * +adjacency_reward if the first stop is within adjacency_tolerance_km of the
 * minimum start distance, otherwise a penalty proportional to the gap.
 */
double origin_adjacency_bonus(const DeliveryProblem& problem, const std::vector<int>& visits, const AlgorithmConfig& config);

// Fills route.distance and route.fitness (adjacency bonus included).
void evaluate_route(Route& route, const DeliveryProblem& problem, const AlgorithmConfig& config);

double estimate_delivery_time(int stop_count, double distance);
double estimate_fuel_cost(double distance);
double calculate_optimization_score(double distance, int stop_count);

// Reported only; neither term enters the fitness.
double calculate_time_window_penalty(const std::vector<Stop>& route);
double calculate_priority_bonus(const std::vector<Stop>& route);

#endif // EVALUATION_HPP
