#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include <statfeed/analysis/fairness.hpp>
#include <statfeed/config/config.hpp>
#include <statfeed/statfeed.hpp>

#include "test_helper.hpp"

using namespace statfeed::config;

// Helper function to create temporary TOML file for testing
std::filesystem::path create_temp_toml(const std::string& content) {
    auto temp_path = std::filesystem::temp_directory_path() / "statfeed_test_config.toml";
    std::ofstream file(temp_path);
    file << content;
    file.close();
    return temp_path;
}

bool test_complete_config() {
    TestResult result;

    const std::string toml_content = R"(
        [selector]
        size = 4
        seed = 7
        heterogeneity = 0
        accent = 2.5
        charge_policy = "rank_position"

        [options]
        names = ["x", "y"]
        weights = [3, 1.0]

        [logging]
        verbose = true
        trace_interval = 2

        [replicas]
        count = 8
        parallel = false
    )";

    auto temp_file = create_temp_toml(toml_content);
    auto config = Config::from_file(temp_file.string());

    result.assert_eq(std::size_t{4}, config.selector.size, "Selector size");
    result.assert_eq(std::size_t{7}, static_cast<std::size_t>(config.selector.seed), "Seed");
    result.assert_eq(0.0, config.selector.heterogeneity, "Integer heterogeneity read as number");
    result.assert_eq(2.5, config.selector.accent, "Accent");
    result.assert_eq(std::string("rank_position"), config.selector.charge_policy, "Charge policy");
    result.assert_eq(std::size_t{2}, config.options.names.size(), "Option count");
    result.assert_eq(std::string("y"), config.options.names[1], "Second option name");
    result.assert_eq(3.0, config.options.weights[0], "Integer weight read as number");
    result.assert_true(config.logging.verbose, "Verbose logging");
    result.assert_eq(std::size_t{2}, config.logging.trace_interval, "Trace interval");
    result.assert_eq(std::size_t{8}, config.replicas.count, "Replica count");
    result.assert_true(!config.replicas.parallel, "Parallel replicas disabled");

    std::filesystem::remove(temp_file);
    result.summary();
    return result.all_passed();
}

bool test_defaults() {
    TestResult result;

    auto config = Config::from_string("");

    result.assert_eq(std::size_t{16}, config.selector.size, "Default size");
    result.assert_eq(0.1, config.selector.heterogeneity, "Default heterogeneity");
    result.assert_eq(1.0, config.selector.accent, "Default accent");
    result.assert_eq(std::string("chosen_option"), config.selector.charge_policy,
                     "Default charge policy");
    result.assert_eq(std::size_t{3}, config.options.names.size(), "Default option set");
    result.assert_true(config.options.weights.empty(), "Uniform weights by default");
    result.assert_true(config.plan.weights.empty(), "No plan overrides by default");
    result.assert_eq(std::size_t{0}, config.logging.trace_interval, "Trace disabled by default");
    result.assert_eq(std::size_t{0}, config.replicas.count, "No replicas by default");

    result.summary();
    return result.all_passed();
}

bool test_validation() {
    TestResult result;

    result.assert_throws<ConfigValidationError>(
        [] { (void)Config::from_string("[selector]\nheterogeneity = -0.5\n"); },
        "Negative heterogeneity is rejected");

    result.assert_throws<ConfigValidationError>(
        [] { (void)Config::from_string("[selector]\ncharge_policy = \"by_rank\"\n"); },
        "Unknown charge policy is rejected");

    result.assert_throws<ConfigValidationError>(
        [] { (void)Config::from_string("[options]\nnames = []\n"); },
        "Empty option set is rejected");

    result.assert_throws<ConfigValidationError>(
        [] { (void)Config::from_string("[options]\nnames = [\"a\", \"b\"]\nweights = [1.0]\n"); },
        "Option weights of wrong length are rejected");

    result.assert_throws<ConfigValidationError>(
        [] { (void)Config::from_string("[options]\nnames = [\"a\", \"b\"]\nweights = [0, 0]\n"); },
        "All-zero option weights are rejected");

    result.assert_throws<ConfigValidationError>(
        [] {
            (void)Config::from_string(
                "[selector]\nsize = 3\n[options]\nnames = [\"a\"]\n[plan]\nweights = [[1.0]]\n");
        },
        "Plan weights with too few rows are rejected");

    result.assert_throws<ConfigValidationError>(
        [] {
            (void)Config::from_string("[selector]\nsize = 2\n[plan]\naccents = [1.0, 1.0, 1.0]\n");
        },
        "Plan accents of wrong length are rejected");

    result.assert_throws<std::exception>(
        [] { (void)Config::from_file("/nonexistent/statfeed/config.toml"); },
        "Missing file is reported");

    result.summary();
    return result.all_passed();
}

bool test_plan_construction() {
    TestResult result;

    auto config = Config::from_string(R"(
        [selector]
        size = 3
        heterogeneity = 0.2

        [options]
        names = ["p", "q"]
        weights = [0.7, 0.3]

        [plan]
        accents = [1.0, 2.0, 3.0]
    )");

    const statfeed::core::Matrix randoms(3, std::vector<double>{0.5, 0.5});
    const auto plan = config.to_plan(randoms);

    result.assert_eq(std::size_t{3}, plan.decisions(), "Plan has one row per decision");
    result.assert_eq(0.7, plan.weights[2][0], "Option weights broadcast to every decision");
    result.assert_eq(0.2, plan.heterogeneities[1], "Scalar heterogeneity broadcast");
    result.assert_eq(3.0, plan.accents[2], "Per-decision accents taken from the plan");
    result.assert_eq(0.5, plan.randoms[0][1], "Randoms passed through");

    auto explicit_weights = Config::from_string(R"(
        [selector]
        size = 2

        [options]
        names = ["p", "q"]
        weights = [0.7, 0.3]

        [plan]
        weights = [[1.0, 0.0], [0.0, 1.0]]
    )");
    const auto overridden =
        explicit_weights.to_plan(statfeed::core::Matrix(2, std::vector<double>{0.0, 0.0}));
    result.assert_eq(0.0, overridden.weights[0][1], "Plan weights take precedence");
    result.assert_eq(1.0, overridden.accents[1], "Scalar accent broadcast");

    auto uniform = Config::from_string("[selector]\nsize = 2\n[options]\nnames = [\"a\", \"b\", "
                                       "\"c\", \"d\"]\n");
    const auto uniform_plan =
        uniform.to_plan(statfeed::core::Matrix(2, std::vector<double>(4, 0.0)));
    result.assert_eq(0.25, uniform_plan.weights[1][3], "Uniform weights when none given");

    const auto sel_config = config.to_selector_config();
    result.assert_eq(0.2, sel_config.heterogeneity, "Engine heterogeneity");
    result.assert_true(sel_config.charge_policy == statfeed::core::ChargePolicy::chosen_option,
                       "Engine charge policy");

    result.summary();
    return result.all_passed();
}

bool test_overrides() {
    TestResult result;

    auto config = Config::from_string("[selector]\nsize = 10\nseed = 3\n");

    ConfigOverrides overrides;
    overrides.size = 25;
    overrides.charge_policy = "rank_position";
    overrides.option_names = std::vector<std::string>{"left", "right"};
    overrides.verbose = true;
    config.apply_overrides(overrides);

    result.assert_eq(std::size_t{25}, config.selector.size, "Size overridden");
    result.assert_eq(std::size_t{3}, static_cast<std::size_t>(config.selector.seed),
                     "Seed kept when not overridden");
    result.assert_eq(std::string("rank_position"), config.selector.charge_policy,
                     "Charge policy overridden");
    result.assert_eq(std::string("right"), config.options.names[1], "Option names overridden");
    result.assert_true(config.logging.verbose, "Verbose overridden");

    auto with_plan = Config::from_string(
        "[selector]\nsize = 2\n[options]\nnames = [\"a\"]\n[plan]\nweights = [[1.0], [1.0]]\n");
    ConfigOverrides resize;
    resize.size = 3;
    result.assert_throws<ConfigValidationError>([&] { with_plan.apply_overrides(resize); },
                                                "Override conflicting with the plan is rejected");

    ConfigOverrides bad_policy;
    bad_policy.charge_policy = "random";
    result.assert_throws<ConfigValidationError>([&] { config.apply_overrides(bad_policy); },
                                                "Invalid override is rejected");

    result.summary();
    return result.all_passed();
}

bool test_toml_export() {
    TestResult result;

    auto config = Config::from_string(R"(
        [selector]
        size = 5
        seed = 11
        charge_policy = "rank_position"

        [options]
        names = ["u", "v"]
        weights = [2.0, 1.0]

        [plan]
        heterogeneities = [0.0, 0.1, 0.2, 0.3, 0.4]
    )");

    auto reloaded = Config::from_string(config.to_toml());

    result.assert_eq(std::size_t{5}, reloaded.selector.size, "Size survives export");
    result.assert_eq(std::string("rank_position"), reloaded.selector.charge_policy,
                     "Charge policy survives export");
    result.assert_eq(2.0, reloaded.options.weights[0], "Option weights survive export");
    result.assert_eq(0.3, reloaded.plan.heterogeneities[3], "Plan overrides survive export");
    result.assert_true(reloaded.plan.weights.empty(), "Absent plan weights stay absent");

    result.summary();
    return result.all_passed();
}

bool test_selector_from_config() {
    TestResult result;

    auto config = Config::from_string(R"(
        [selector]
        size = 40
        seed = 5

        [options]
        names = ["heavy", "light"]
        weights = [3.0, 1.0]

        [logging]
        trace_interval = 10
    )");

    auto selector = statfeed::factory::make_selector_from_config(config);
    result.assert_eq(std::size_t{40}, selector.size(), "Selector sized from config");
    result.assert_eq(0.75, selector.weights()[39][0], "Selector uses configured weights");

    selector.populate_choices();
    result.assert_eq(std::size_t{4}, selector.trace().size(), "Trace interval from config");

    const auto report = statfeed::analysis::analyze_fairness(selector);
    result.assert_eq(30.0, report.options[0].expected, "Expected count of the heavy option");
    result.assert_lt(report.max_abs_deviation, 2.0, "Counts follow configured weights");

    auto same = statfeed::factory::make_selector_from_config(config);
    auto other = statfeed::factory::make_selector_from_config(config, 6);
    result.assert_true(same.randoms() == selector.randoms(), "Same seed gives same randoms");
    result.assert_true(other.randoms() != selector.randoms(), "Seed override draws new randoms");

    result.summary();
    return result.all_passed();
}

int main() {
    std::cout << "=== Configuration System Tests ===\n\n";

    bool all_passed = true;

    try {
        std::cout << "Test: Complete Configuration\n";
        all_passed &= test_complete_config();

        std::cout << "\nTest: Configuration Defaults\n";
        all_passed &= test_defaults();

        std::cout << "\nTest: Validation\n";
        all_passed &= test_validation();

        std::cout << "\nTest: Plan Construction\n";
        all_passed &= test_plan_construction();

        std::cout << "\nTest: Command-line Overrides\n";
        all_passed &= test_overrides();

        std::cout << "\nTest: TOML Export\n";
        all_passed &= test_toml_export();

        std::cout << "\nTest: Selector From Configuration\n";
        all_passed &= test_selector_from_config();
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "\n=== All Configuration Tests Completed ===\n";
    return all_passed ? 0 : 1;
}
