#include "route_builder.hpp"
#include "utils.hpp"
#include <algorithm>
#include <limits>
#include <numeric>

using std::vector;

static const double INF = std::numeric_limits<double>::infinity();

static vector<int> all_stops(const DeliveryProblem& problem) {
    vector<int> stops(problem.size());
    std::iota(stops.begin(), stops.end(), 0);
    return stops;
}

static void remove_stop(vector<int>& remaining, int stop) {
    remaining.erase(std::find(remaining.begin(), remaining.end(), stop));
}

// Fisher-Yates on [from, end).
static void shuffle_from(vector<int>& visits, int from, std::mt19937& rng) {
    for (int i = static_cast<int>(visits.size()) - 1; i > from; --i) {
        int j = randint(rng, from, i);
        std::swap(visits[i], visits[j]);
    }
}

static void move_nearest_first(const DeliveryProblem& problem, vector<int>& visits) {
    int nearest = nearest_to_start(problem, visits);
    auto it = std::find(visits.begin(), visits.end(), nearest);
    std::swap(*visits.begin(), *it);
}

int nearest_to_start(const DeliveryProblem& problem, const vector<int>& candidates) {
    int best = -1;
    double best_distance = INF;
    for (int c : candidates) {
        if (problem.startDistance[c] < best_distance) {
            best_distance = problem.startDistance[c];
            best = c;
        }
    }
    return best;
}

vector<int> build_optimized_route(const DeliveryProblem& problem, const AlgorithmConfig& config) {
    vector<int> route;
    vector<int> remaining = all_stops(problem);
    if (remaining.empty()) return route;

    int current = nearest_to_start(problem, remaining);
    route.push_back(current);
    remove_stop(remaining, current);

    while (!remaining.empty()) {
        const bool closing = remaining.size() <= 2;
        int best = -1;
        double best_score = INF;

        for (int c : remaining) {
            double score = problem.costMatrix[current][c];
            if (closing) score += config.optimized_tail_weight * problem.depotDistance[c];
            if (score < best_score) {
                best_score = score;
                best = c;
            }
        }

        current = best;
        route.push_back(current);
        remove_stop(remaining, current);
    }
    return route;
}

vector<int> build_lookahead_route(const DeliveryProblem& problem, const AlgorithmConfig& config) {
    vector<int> route;
    vector<int> remaining = all_stops(problem);
    if (remaining.empty()) return route;

    int current = nearest_to_start(problem, remaining);
    route.push_back(current);
    remove_stop(remaining, current);

    while (!remaining.empty()) {
        const bool closing = remaining.size() <= 2;
        int best = -1;
        double best_score = INF;

        for (int c : remaining) {
            double next_hop = INF;
            for (int r : remaining) {
                if (r != c) next_hop = std::min(next_hop, problem.costMatrix[c][r]);
            }
            if (next_hop == INF) next_hop = 0.0; // c is the last stop

            double score = problem.costMatrix[current][c] + config.lookahead_weight * next_hop;
            if (closing) score += config.tail_return_weight * problem.depotDistance[c];
            if (score < best_score) {
                best_score = score;
                best = c;
            }
        }

        current = best;
        route.push_back(current);
        remove_stop(remaining, current);
    }
    return route;
}

vector<int> build_priority_route(const DeliveryProblem& problem) {
    vector<int> route;
    vector<int> remaining = all_stops(problem);
    if (remaining.empty()) return route;

    int current = nearest_to_start(problem, remaining);
    route.push_back(current);
    remove_stop(remaining, current);

    auto priority_of = [&problem](int s) { return problem.stops[s].priority.value_or(3); };
    std::stable_sort(remaining.begin(), remaining.end(), [&priority_of](int a, int b) {
        return priority_of(a) < priority_of(b);
    });

    size_t i = 0;
    while (i < remaining.size()) {
        const int tier = priority_of(remaining[i]);
        size_t j = i;
        while (j < remaining.size() && priority_of(remaining[j]) == tier) ++j;

        vector<int> tier_stops(remaining.begin() + i, remaining.begin() + j);
        while (!tier_stops.empty()) {
            int best = -1;
            double best_distance = INF;
            for (int c : tier_stops) {
                if (problem.costMatrix[current][c] < best_distance) {
                    best_distance = problem.costMatrix[current][c];
                    best = c;
                }
            }
            current = best;
            route.push_back(current);
            remove_stop(tier_stops, current);
        }
        i = j;
    }
    return route;
}

vector<int> build_seeded_route(const DeliveryProblem& problem, const std::string& seed, int index) {
    std::mt19937 engine = make_engine(seed, index);
    vector<int> route = all_stops(problem);
    if (route.size() < 2) return route;

    if (randreal(engine) < 0.8) {
        move_nearest_first(problem, route);
        shuffle_from(route, 1, engine);
    } else {
        shuffle_from(route, 0, engine);
    }
    return route;
}

vector<int> build_random_route(const DeliveryProblem& problem, std::mt19937& rng) {
    vector<int> route = all_stops(problem);
    if (route.size() < 2) return route;

    if (randreal(rng) < 0.7) {
        move_nearest_first(problem, route);
        shuffle_from(route, 1, rng);
    } else {
        shuffle_from(route, 0, rng);
    }
    return route;
}
