/*
 * route_builder.hpp
 * Constructive heuristics used to seed the genetic search.
 *
 * Every builder returns a permutation of 0..n-1 over DeliveryProblem::stops.
 * All of them open with the stop nearest to the start, except the share of
 * seeded/random routes that is shuffled completely.
 */
#ifndef ROUTE_BUILDER_HPP
#define ROUTE_BUILDER_HPP

#include "delivery.hpp"
#include "parameters.hpp"
#include <random>
#include <string>
#include <vector>

// Index of the candidate closest to the start, -1 if 'candidates' is empty.
int nearest_to_start(const DeliveryProblem& problem, const std::vector<int>& candidates);

/**
 * @brief Greedy nearest-neighbour with a return-leg term.
 *
 * Next stop minimises dist(current, c), plus optimized_tail_weight *
 * dist(c, depot) once two or fewer stops remain.
 */
std::vector<int> build_optimized_route(const DeliveryProblem& problem, const AlgorithmConfig& config);

/**
 * @brief Nearest-neighbour with one step of lookahead.
 *
 * score(c) = dist(current, c) + lookahead_weight * (shortest hop out of c)
 *            [+ tail_return_weight * dist(c, depot) for the last two stops]
 */
std::vector<int> build_lookahead_route(const DeliveryProblem& problem, const AlgorithmConfig& config);

// Nearest stop first, then priority tiers (1 first, unset counts as 3), nearest-neighbour inside each tier.
std::vector<int> build_priority_route(const DeliveryProblem& problem);

/**
 * @brief Deterministic shuffle driven by (seed, index).
 *
 * 80%: nearest stop forced first, rest shuffled. 20%: fully shuffled.
 * Same (seed, index) always gives the same route.
 */
std::vector<int> build_seeded_route(const DeliveryProblem& problem, const std::string& seed, int index);

// Fisher-Yates. 70%: nearest stop forced first, rest shuffled. 30%: fully shuffled.
std::vector<int> build_random_route(const DeliveryProblem& problem, std::mt19937& rng);

#endif // ROUTE_BUILDER_HPP
