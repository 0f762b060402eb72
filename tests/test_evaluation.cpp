#include "evaluation.hpp"
#include "geo.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

class EvaluationTest : public ::testing::Test {
protected:
    void SetUp() override {
        depot = make_origin(8.4850, 124.6500);
        stops = {
            make_stop("near", 8.4900, 124.6520),
            make_stop("mid", 8.5000, 124.6450),
            make_stop("far", 8.5100, 124.6560),
        };
        problem.build(stops, depot, depot);
    }

    Origin depot;
    std::vector<Stop> stops;
    DeliveryProblem problem;
    AlgorithmConfig config;
};

TEST_F(EvaluationTest, RouteDistanceIsScaledSumOfLegs) {
    std::vector<int> visits = {2, 0, 1};
    double legs = calculate_distance_to_origin(stops[2], depot) +
                  calculate_distance(stops[2], stops[0]) +
                  calculate_distance(stops[0], stops[1]) +
                  calculate_distance_to_origin(stops[1], depot);

    EXPECT_NEAR(route_distance(problem, visits), legs * ROAD_DISTANCE_FACTOR, 1e-9);
    EXPECT_NEAR(route_distance(problem.stopsInOrder(visits), depot, depot), legs * ROAD_DISTANCE_FACTOR, 1e-9);
}

TEST_F(EvaluationTest, OpeningAndClosingLegsUseTheirOwnOrigins) {
    Origin current = make_origin(8.5105, 124.6565, "Current Location");
    std::vector<Stop> route = {stops[2], stops[1], stops[0]};
    double legs = calculate_distance_to_origin(stops[2], current) +
                  calculate_distance(stops[2], stops[1]) +
                  calculate_distance(stops[1], stops[0]) +
                  calculate_distance_to_origin(stops[0], depot);

    EXPECT_NEAR(route_distance(route, current, depot), legs * 1.2, 1e-9);
}

TEST_F(EvaluationTest, DegenerateRouteSizes) {
    EXPECT_DOUBLE_EQ(route_distance(problem, std::vector<int>{}), 0.0);
    EXPECT_DOUBLE_EQ(route_distance(std::vector<Stop>{}, depot, depot), 0.0);
    EXPECT_DOUBLE_EQ(estimate_delivery_time(0, 0.0), 0.0);

    double one = route_distance(std::vector<Stop>{stops[0]}, depot, depot);
    EXPECT_NEAR(one, 2.0 * calculate_distance_to_origin(stops[0], depot) * 1.2, 1e-9);
}

TEST_F(EvaluationTest, DistanceFitness) {
    // baseline = 2 * 1.5 = 3 km
    EXPECT_DOUBLE_EQ(distance_fitness(2.0, 2), 100.0);
    EXPECT_DOUBLE_EQ(distance_fitness(3.0, 2), 100.0);
    EXPECT_DOUBLE_EQ(distance_fitness(6.0, 2), 50.0);
    EXPECT_DOUBLE_EQ(distance_fitness(100.0, 2), 0.0);
    EXPECT_DOUBLE_EQ(distance_fitness(6.0, 2, 50.0), 100.0);
    EXPECT_DOUBLE_EQ(distance_fitness(100.0, 2, -20.0), -20.0);
    EXPECT_DOUBLE_EQ(distance_fitness(0.0, 0), 100.0);
}

TEST_F(EvaluationTest, AdjacencyRewardForNearestFirst) {
    EXPECT_DOUBLE_EQ(origin_adjacency_bonus(problem, {0, 1, 2}, config), 50.0);
    EXPECT_DOUBLE_EQ(origin_adjacency_bonus(problem, {}, config), 0.0);
}

TEST_F(EvaluationTest, AdjacencyPenaltyProportionalToGap) {
    problem.startDistance = {1.0, 1.5, 6.0};

    EXPECT_DOUBLE_EQ(origin_adjacency_bonus(problem, {0, 1, 2}, config), 50.0);
    // within tolerance of the minimum
    problem.startDistance = {1.0, 1.05, 6.0};
    EXPECT_DOUBLE_EQ(origin_adjacency_bonus(problem, {1, 0, 2}, config), 50.0);

    problem.startDistance = {1.0, 1.5, 6.0};
    EXPECT_NEAR(origin_adjacency_bonus(problem, {1, 0, 2}, config), -5.0, 1e-9);
    EXPECT_DOUBLE_EQ(origin_adjacency_bonus(problem, {2, 0, 1}, config), -30.0);
}

TEST_F(EvaluationTest, EvaluateRouteIsIdempotent) {
    Route route;
    route.visits = {1, 0, 2};
    evaluate_route(route, problem, config);
    double distance = route.distance;
    double fitness = route.fitness;

    evaluate_route(route, problem, config);
    EXPECT_DOUBLE_EQ(route.distance, distance);
    EXPECT_DOUBLE_EQ(route.fitness, fitness);
    EXPECT_DOUBLE_EQ(estimate_delivery_time(3, distance), estimate_delivery_time(3, distance));
    EXPECT_DOUBLE_EQ(route.distance, route_distance(problem, route.visits));
    EXPECT_DOUBLE_EQ(route.fitness, distance_fitness(route.distance, 3, origin_adjacency_bonus(problem, route.visits, config)));
}

TEST_F(EvaluationTest, DeliveryMetrics) {
    EXPECT_NEAR(estimate_delivery_time(3, 30.0), 1.0 + 0.99, 1e-9);
    EXPECT_DOUBLE_EQ(estimate_fuel_cost(10.0), 60.0);
    EXPECT_DOUBLE_EQ(estimate_fuel_cost(0.0), 0.0);
}

TEST_F(EvaluationTest, OptimizationScoreIsClamped) {
    // ideal = 2 * 2 = 4 km
    EXPECT_DOUBLE_EQ(calculate_optimization_score(4.0, 2), 100.0);
    EXPECT_DOUBLE_EQ(calculate_optimization_score(6.0, 2), 50.0);
    EXPECT_DOUBLE_EQ(calculate_optimization_score(10.0, 2), 0.0);
    EXPECT_DOUBLE_EQ(calculate_optimization_score(1.0, 2), 100.0);
    EXPECT_DOUBLE_EQ(calculate_optimization_score(0.0, 0), 100.0);
}

TEST_F(EvaluationTest, TimeWindowPenalty) {
    Stop early = make_stop("early", 8.49, 124.65);
    early.time_window = TimeWindow{10, 12};
    Stop late = make_stop("late", 8.50, 124.65);
    late.time_window = TimeWindow{8, 8};
    Stop open = make_stop("open", 8.51, 124.65);

    // early: arrives 09:00, waits 1 h. late: arrives 9.33, 1.33 h late.
    EXPECT_NEAR(calculate_time_window_penalty({early, late, open}), 10.0 + 1.33 * 20.0, 1e-9);
    EXPECT_DOUBLE_EQ(calculate_time_window_penalty({open}), 0.0);
    EXPECT_DOUBLE_EQ(calculate_time_window_penalty({}), 0.0);
}

TEST_F(EvaluationTest, PriorityBonusFavoursEarlyUrgentStops) {
    Stop urgent = make_stop("u", 8.49, 124.65, 1);
    Stop normal = make_stop("n", 8.50, 124.65);
    Stop high = make_stop("h", 8.51, 124.65, 2);
    Stop low = make_stop("l", 8.52, 124.65, 5);

    // (3 - 0) * 2 + (3 - 2) * 1
    EXPECT_DOUBLE_EQ(calculate_priority_bonus({urgent, normal, high}), 7.0);
    // (3 - 2) * 2 + (3 - 0) * 1
    EXPECT_DOUBLE_EQ(calculate_priority_bonus({high, normal, urgent}), 5.0);
    EXPECT_DOUBLE_EQ(calculate_priority_bonus({low, normal}), 0.0);
}
