#include "parameters.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

TEST(ParametersTest, Defaults) {
    AlgorithmConfig config;
    EXPECT_EQ(config.population_size, 100);
    EXPECT_EQ(config.max_generations, 500);
    EXPECT_DOUBLE_EQ(config.mutation_rate, 0.02);
    EXPECT_DOUBLE_EQ(config.crossover_rate, 1.0);
    EXPECT_EQ(config.elite_count, 10);
    EXPECT_DOUBLE_EQ(config.convergence_threshold, 0.001);
    EXPECT_TRUE(config.dual_route_comparison);
    EXPECT_EQ(config.tournament_size, 5);
    EXPECT_EQ(config.stagnation_limit, 50);
    EXPECT_EQ(config.refinement_iterations, 10);
    EXPECT_FALSE(config.parallel_parents);
    EXPECT_NO_THROW(validate_config(config));

    Origin depot = default_depot();
    EXPECT_EQ(depot.name, "DeliveryEase Depot");
    EXPECT_DOUBLE_EQ(depot.latitude, 8.4542);
    EXPECT_DOUBLE_EQ(depot.longitude, 124.6319);
}

TEST(ParametersTest, LoadsSampleFile) {
    AlgorithmConfig config;
    config.population_size = 1;
    Origin depot;
    load_parameters_from_file(std::string(TEST_DATA_DIR) + "/params.txt", config, depot);

    EXPECT_EQ(config.population_size, 100);
    EXPECT_EQ(config.stagnation_limit, 50);
    EXPECT_TRUE(config.dual_route_comparison);
    EXPECT_EQ(depot.name, "DeliveryEase Depot");
    EXPECT_EQ(depot.address, "Cagayan de Oro City, Philippines");
    EXPECT_DOUBLE_EQ(depot.latitude, 8.4542);
}

TEST(ParametersTest, OverridesAndBadValues) {
    std::string path = write_temp_file("params_override.txt",
        "# overrides\n"
        "population_size = 40\n"
        "mutation_rate=0.1\n"
        "dual_route_comparison = off\n"
        "parallel_parents = yes\n"
        "max_generations = lots\n"
        "verbose = maybe\n"
        "unknown_key = 3\n"
        "depot_name = North Hub\n"
        "depot_latitude = 8.5\n");

    AlgorithmConfig config;
    Origin depot = default_depot();
    load_parameters_from_file(path, config, depot);

    EXPECT_EQ(config.population_size, 40);
    EXPECT_DOUBLE_EQ(config.mutation_rate, 0.1);
    EXPECT_FALSE(config.dual_route_comparison);
    EXPECT_TRUE(config.parallel_parents);
    EXPECT_EQ(config.max_generations, 500);
    EXPECT_FALSE(config.verbose);
    EXPECT_EQ(depot.name, "North Hub");
    EXPECT_DOUBLE_EQ(depot.latitude, 8.5);
    EXPECT_DOUBLE_EQ(depot.longitude, 124.6319);
}

TEST(ParametersTest, MissingFileKeepsDefaults) {
    AlgorithmConfig config;
    Origin depot = default_depot();
    load_parameters_from_file("/nonexistent/dir/params.txt", config, depot);
    EXPECT_EQ(config.population_size, 100);
    EXPECT_EQ(depot.name, "DeliveryEase Depot");
}

TEST(ParametersTest, ValidateRejectsUnusableConfig) {
    AlgorithmConfig config;

    config.population_size = 0;
    EXPECT_THROW(validate_config(config), std::invalid_argument);
    config = AlgorithmConfig();
    config.max_generations = -1;
    EXPECT_THROW(validate_config(config), std::invalid_argument);
    config = AlgorithmConfig();
    config.mutation_rate = -0.1;
    EXPECT_THROW(validate_config(config), std::invalid_argument);
    config = AlgorithmConfig();
    config.crossover_rate = 1.1;
    EXPECT_THROW(validate_config(config), std::invalid_argument);
    config = AlgorithmConfig();
    config.elite_count = -1;
    EXPECT_THROW(validate_config(config), std::invalid_argument);
    config = AlgorithmConfig();
    config.convergence_threshold = -0.5;
    EXPECT_THROW(validate_config(config), std::invalid_argument);
    config = AlgorithmConfig();
    config.tournament_size = 0;
    EXPECT_THROW(validate_config(config), std::invalid_argument);

    config = AlgorithmConfig();
    config.max_generations = 0;
    config.elite_count = 0;
    EXPECT_NO_THROW(validate_config(config));
}

TEST(ParametersTest, ParentConfigsAreAsymmetric) {
    AlgorithmConfig base;
    AlgorithmConfig a = derive_parent_config(base, 'A');
    AlgorithmConfig b = derive_parent_config(base, 'B');

    EXPECT_EQ(a.population_size, 80);
    EXPECT_NEAR(a.mutation_rate, 0.016, 1e-12);
    EXPECT_DOUBLE_EQ(a.crossover_rate, 1.0);

    EXPECT_EQ(b.population_size, 120);
    EXPECT_NEAR(b.mutation_rate, 0.024, 1e-12);
    EXPECT_NEAR(b.crossover_rate, 0.9, 1e-12);

    EXPECT_EQ(a.max_generations, base.max_generations);
    EXPECT_EQ(b.elite_count, base.elite_count);
}

TEST(ParametersTest, ParentConfigEdgeCases) {
    AlgorithmConfig base;
    base.population_size = 1;
    base.mutation_rate = 0.9;
    EXPECT_EQ(derive_parent_config(base, 'A').population_size, 1);
    EXPECT_DOUBLE_EQ(derive_parent_config(base, 'B').mutation_rate, 1.0);
    EXPECT_THROW(derive_parent_config(base, 'C'), std::invalid_argument);
}
