/*
 * route.hpp
 * One candidate solution of the genetic search.
 */
#ifndef ROUTE_HPP
#define ROUTE_HPP

#include <vector>

/**
 * @struct Route
 * @brief Visiting order of the geocoded stops of a DeliveryProblem.
 *
 * 'visits' is a permutation of 0..n-1. Depot/start are implicit and are not
 * stored. 'distance' and 'fitness' are only meaningful after evaluate_route.
 */
struct Route {
    std::vector<int> visits;

    double distance; // km, road-corrected, start -> ... -> depot
    double fitness;  // higher is better

    Route() : distance(0.0), fitness(0.0) {}
};

typedef std::vector<Route> Population;

#endif // ROUTE_HPP
