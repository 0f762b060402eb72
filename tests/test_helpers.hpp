#ifndef TEST_HELPERS_HPP
#define TEST_HELPERS_HPP

#include "delivery.hpp"
#include "parameters.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <fstream>
#include <numeric>
#include <optional>
#include <string>
#include <vector>

inline Stop make_stop(const std::string& id, std::optional<double> lat, std::optional<double> lng,
                      std::optional<int> priority = std::nullopt) {
    Stop s;
    s.id = id;
    s.order_id = "ORD-" + id;
    s.customer_name = "Customer " + id;
    s.latitude = lat;
    s.longitude = lng;
    s.priority = priority;
    s.delivery_status = "pending";
    return s;
}

inline Origin make_origin(double lat, double lng, const std::string& name = "Depot") {
    Origin o;
    o.latitude = lat;
    o.longitude = lng;
    o.name = name;
    return o;
}

// Stops on one meridian north of (8.40, 124.60), 0.005 deg apart, listed out of order.
inline std::vector<Stop> collinear_stops() {
    return {
        make_stop("c3", 8.415, 124.60),
        make_stop("c1", 8.405, 124.60),
        make_stop("c4", 8.420, 124.60),
        make_stop("c2", 8.410, 124.60),
    };
}

inline Origin collinear_depot() { return make_origin(8.40, 124.60); }

// Small config so searches stay fast in tests.
inline AlgorithmConfig small_config() {
    AlgorithmConfig config;
    config.population_size = 40;
    config.max_generations = 200;
    config.elite_count = 4;
    config.seed = 7;
    return config;
}

inline bool is_permutation_of_range(const std::vector<int>& visits, int n) {
    if (static_cast<int>(visits.size()) != n) return false;
    std::vector<int> sorted = visits;
    std::sort(sorted.begin(), sorted.end());
    for (int i = 0; i < n; ++i) {
        if (sorted[i] != i) return false;
    }
    return true;
}

inline std::string write_temp_file(const std::string& name, const std::string& content) {
    std::string path = ::testing::TempDir() + name;
    std::ofstream out(path);
    out << content;
    return path;
}

#endif // TEST_HELPERS_HPP
