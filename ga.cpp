#include "ga.hpp"
#include "evaluation.hpp"
#include "route_builder.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>
#include <numeric>

using std::vector;

Population make_initial_population(const DeliveryProblem& problem, const AlgorithmConfig& config,
                                   const std::string& seed_label, std::mt19937& rng) {
    Population pop;
    pop.reserve(config.population_size);

    // The constructive routes are deterministic, build each once.
    const vector<int> optimized = build_optimized_route(problem, config);
    const vector<int> lookahead = build_lookahead_route(problem, config);
    const vector<int> by_priority = build_priority_route(problem);

    for (int i = 0; i < config.population_size; ++i) {
        Route route;
        if (i == 0) {
            route.visits = optimized;
        } else if (i < 15) {
            route.visits = lookahead;
        } else if (i < 20) {
            route.visits = by_priority;
        } else if (i < 25 && !seed_label.empty()) {
            route.visits = build_seeded_route(problem, seed_label, i);
        } else {
            route.visits = build_random_route(problem, rng);
        }
        pop.push_back(route);
    }
    return pop;
}

vector<int> order_crossover(const vector<int>& parent1, const vector<int>& parent2,
                            double crossover_rate, std::mt19937& rng) {
    if (randreal(rng) >= crossover_rate) {
        return parent1;
    }

    const int length = static_cast<int>(parent1.size());
    if (length <= 1) return parent1;

    int max_gene = 0;
    for (int g : parent1) max_gene = std::max(max_gene, g);
    for (int g : parent2) max_gene = std::max(max_gene, g);
    vector<char> used(max_gene + 1, 0);

    vector<int> offspring(length, -1);
    offspring[0] = parent1[0];
    used[parent1[0]] = 1;

    int start = randint(rng, 1, length - 1);
    int end = randint(rng, start, length - 1);
    for (int i = start; i <= end; ++i) {
        offspring[i] = parent1[i];
        used[parent1[i]] = 1;
    }

    size_t p2_index = 0;
    for (int i = 1; i < length; ++i) {
        if (offspring[i] != -1) continue;
        while (p2_index < parent2.size() && used[parent2[p2_index]]) {
            ++p2_index;
        }
        if (p2_index < parent2.size()) {
            offspring[i] = parent2[p2_index];
            used[parent2[p2_index]] = 1;
            ++p2_index;
        }
    }

    // parent2 ran out (it does not hold the same genes): take what parent1 has left
    for (int i = 1; i < length; ++i) {
        if (offspring[i] != -1) continue;
        for (int g : parent1) {
            if (!used[g]) {
                offspring[i] = g;
                used[g] = 1;
                break;
            }
        }
    }
    return offspring;
}

void swap_mutation(vector<int>& visits, double mutation_rate, std::mt19937& rng) {
    const int length = static_cast<int>(visits.size());
    if (length < 2) return;

    for (int i = 0; i < length; ++i) {
        if (randreal(rng) < mutation_rate) {
            // j may equal i; that draw leaves the route unchanged
            int j = randint(rng, 0, length - 1);
            std::swap(visits[i], visits[j]);
        }
    }
}

const Route& tournamentSelect(const Population& pop, int k, std::mt19937& rng) {
    int n = static_cast<int>(pop.size());
    int best_idx = randint(rng, 0, n - 1);
    for (int i = 1; i < k; ++i) {
        int cand_idx = randint(rng, 0, n - 1);
        if (pop[cand_idx].fitness > pop[best_idx].fitness) {
            best_idx = cand_idx;
        }
    }
    return pop[best_idx];
}

Population evolve_population(const Population& pop, const AlgorithmConfig& config, std::mt19937& rng) {
    Population newPop;
    newPop.reserve(config.population_size);

    // 1. Elitism
    vector<int> order(pop.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&pop](int a, int b) {
        return pop[a].fitness > pop[b].fitness;
    });
    const int num_elites = std::min({config.elite_count, static_cast<int>(pop.size()), config.population_size});
    for (int i = 0; i < num_elites; ++i) {
        newPop.push_back(pop[order[i]]);
    }

    // 2. Offspring
    while (static_cast<int>(newPop.size()) < config.population_size) {
        const Route& parent1 = tournamentSelect(pop, config.tournament_size, rng);
        const Route& parent2 = tournamentSelect(pop, config.tournament_size, rng);

        Route child;
        child.visits = order_crossover(parent1.visits, parent2.visits, config.crossover_rate, rng);
        swap_mutation(child.visits, config.mutation_rate, rng);
        newPop.push_back(child);
    }
    return newPop;
}

static const Route& fittest(const Population& pop) {
    return *std::max_element(pop.begin(), pop.end(), [](const Route& a, const Route& b) {
        return a.fitness < b.fitness;
    });
}

GAResult run_genetic_algorithm(const DeliveryProblem& problem, const AlgorithmConfig& config,
                               const std::string& seed_label, std::mt19937& rng,
                               const std::atomic<bool>* cancel, std::ostream& log) {
    const std::string tag = seed_label.empty() ? "" : "[" + seed_label + "] ";
    GAResult result;

    Population pop = make_initial_population(problem, config, seed_label, rng);

    double best_distance = std::numeric_limits<double>::infinity();
    int stagnation = 0;
    int gen = 0;

    for (gen = 0; gen < config.max_generations; ++gen) {
        if (cancel != nullptr && cancel->load()) {
            result.cancelled = true;
            if (config.verbose) log << tag << "Cancelled at generation " << gen << std::endl;
            break;
        }

        double current_best = std::numeric_limits<double>::infinity();
        for (Route& route : pop) {
            evaluate_route(route, problem, config);
            current_best = std::min(current_best, route.distance);
        }

        if (std::abs(best_distance - current_best) < config.convergence_threshold) {
            stagnation++;
        } else {
            stagnation = 0;
            best_distance = current_best;
        }

        if (stagnation > config.stagnation_limit) {
            if (config.verbose) {
                log << tag << "Converged at generation " << gen << " with distance "
                          << std::fixed << std::setprecision(2) << best_distance << "km" << std::endl;
            }
            break;
        }

        pop = evolve_population(pop, config, rng);

        if (config.verbose && gen % 100 == 0) {
            log << tag << "Gen " << std::setw(4) << gen << "/" << config.max_generations
                      << " | Best distance: " << std::fixed << std::setprecision(2) << best_distance << "km"
                      << " | Stagnation: " << stagnation << std::endl;
        }
    }

    for (Route& route : pop) {
        evaluate_route(route, problem, config);
    }
    result.best = fittest(pop);
    result.generation_count = gen;
    return result;
}
