#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <statfeed/statfeed.hpp>

#ifdef STATFEED_HAVE_TBB
#include <statfeed/parallel/tbb_replicator.hpp>
#endif

using namespace statfeed;

/// Command-line arguments structure
/// Wraps both the configuration and runtime options
struct CLIConfig {
    std::string config_file;
    std::vector<std::string> option_names;
    std::size_t size = 16;
    std::uint64_t seed = 1;
    double heterogeneity = 0.1;
    std::string charge_policy = "chosen_option";
    std::size_t replicas = 0;
    bool verbose = false;
    bool json_output = false;
    std::string json_file;

    // Track which values were explicitly set via command line
    bool has_options_override = false;
    bool has_size_override = false;
    bool has_seed_override = false;
    bool has_heterogeneity_override = false;
    bool has_charge_policy_override = false;
    bool has_replicas_override = false;

    // Convert CLI overrides to configuration overrides
    config::ConfigOverrides to_overrides() const {
        config::ConfigOverrides overrides;
        // Only set overrides if explicitly provided via command line
        if (has_options_override) {
            overrides.option_names = option_names;
        }
        if (has_size_override) {
            overrides.size = size;
        }
        if (has_seed_override) {
            overrides.seed = seed;
        }
        if (has_heterogeneity_override) {
            overrides.heterogeneity = heterogeneity;
        }
        if (has_charge_policy_override) {
            overrides.charge_policy = charge_policy;
        }
        if (has_replicas_override) {
            overrides.replicas = replicas;
        }
        if (verbose) {
            overrides.verbose = true;
        }
        return overrides;
    }
};

/// Summary of one replica run
struct ReplicaSummary {
    std::uint64_t seed;
    double max_share_error;
    double statistics_spread;
};

/// Get build configuration info
std::string get_build_config() {
#ifdef NDEBUG
    std::string mode = "Release";
#else
    std::string mode = "Debug";
#endif

#ifdef __clang__
    std::string compiler =
        "Clang " + std::to_string(__clang_major__) + "." + std::to_string(__clang_minor__);
#elif defined(__GNUC__)
    std::string compiler = "GCC " + std::to_string(__GNUC__) + "." + std::to_string(__GNUC_MINOR__);
#elif defined(_MSC_VER)
    std::string compiler = "MSVC " + std::to_string(_MSC_VER);
#else
    std::string compiler = "Unknown";
#endif

    return mode + " (" + compiler + ")";
}

/// Print usage information
void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  -h, --help              Show this help message\n"
              << "  --config FILE           Load configuration from TOML file\n"
              << "  -n, --options LIST      Comma-separated option names (default: a,b,c)\n"
              << "  -m, --size NUM          Number of decisions (default: 16)\n"
              << "  -s, --seed SEED         Random seed (default: 1)\n"
              << "  --heterogeneity H       Perturbation strength (default: 0.1)\n"
              << "  --charge-policy P       chosen_option or rank_position\n"
              << "  -r, --replicas NUM      Independent replica runs for a fairness study\n"
              << "  -v, --verbose           Verbose output\n"
              << "  --json                  Enable JSON output format\n"
              << "  --json-file FILE        Write JSON results to file\n"
              << "\nExamples:\n"
              << "  " << program_name << " --config config/weighted.toml\n"
              << "  " << program_name << " --options red,green,blue --size 60 --seed 7\n"
              << "  " << program_name << " --config config/basic.toml --replicas 64 --json\n";
}

/// Split a comma-separated list, dropping empty entries
std::vector<std::string> split_list(const std::string& list) {
    std::vector<std::string> items;
    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

/// Parse command line arguments
CLIConfig parse_args(int argc, char** argv) {
    CLIConfig config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "--config" && i + 1 < argc) {
            config.config_file = argv[++i];
        } else if ((arg == "-n" || arg == "--options") && i + 1 < argc) {
            config.option_names = split_list(argv[++i]);
            config.has_options_override = true;
        } else if ((arg == "-m" || arg == "--size") && i + 1 < argc) {
            config.size = std::stoull(argv[++i]);
            config.has_size_override = true;
        } else if ((arg == "-s" || arg == "--seed") && i + 1 < argc) {
            config.seed = std::stoull(argv[++i]);
            config.has_seed_override = true;
        } else if (arg == "--heterogeneity" && i + 1 < argc) {
            config.heterogeneity = std::stod(argv[++i]);
            config.has_heterogeneity_override = true;
        } else if (arg == "--charge-policy" && i + 1 < argc) {
            config.charge_policy = argv[++i];
            config.has_charge_policy_override = true;
        } else if ((arg == "-r" || arg == "--replicas") && i + 1 < argc) {
            config.replicas = std::stoull(argv[++i]);
            config.has_replicas_override = true;
        } else if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "--json") {
            config.json_output = true;
        } else if (arg == "--json-file" && i + 1 < argc) {
            config.json_file = argv[++i];
            config.json_output = true;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            std::exit(1);
        }
    }

    return config;
}

/// Run the configured number of independent replicas, in parallel when possible
std::vector<ReplicaSummary> run_replicas(const config::Config& cfg) {
    const auto build = [&cfg](std::uint64_t seed) {
        return factory::make_selector_from_config(cfg, seed);
    };
    const auto weights = cfg.to_plan({}).weights;
    const std::size_t num_options = cfg.options.names.size();
    // Replica seeds start after the main run's seed
    const std::uint64_t base_seed = cfg.selector.seed + 1;

    std::vector<ReplicaSummary> summaries;
    summaries.reserve(cfg.replicas.count);

#ifdef STATFEED_HAVE_TBB
    parallel::TBBReplicator replicator;
    const auto results =
        cfg.replicas.parallel
            ? replicator.run(build, cfg.replicas.count, base_seed)
            : parallel::TBBReplicator::run_sequential(build, cfg.replicas.count, base_seed);

    for (const auto& replica : results) {
        const auto report = analysis::analyze_fairness(replica.chosen_indices, weights, num_options);
        summaries.push_back({replica.seed, report.max_share_error(),
                             analysis::statistics_spread(replica.statistics)});
    }
#else
    for (std::size_t r = 0; r < cfg.replicas.count; ++r) {
        auto selector = build(base_seed + r);
        selector.populate_choices();
        const auto report =
            analysis::analyze_fairness(selector.chosen_indices(), weights, num_options);
        summaries.push_back({base_seed + r, report.max_share_error(),
                             analysis::statistics_spread(selector.statistics())});
    }
#endif

    return summaries;
}

/// Write JSON output with full metadata
void write_json_output(const core::Selector<std::string>& selector,
                       const analysis::FairnessReport& report,
                       const std::vector<ReplicaSummary>& replicas, const config::Config& cfg,
                       double runtime, const std::string& filename = "") {
    using json = nlohmann::json;

    // Create JSON object
    json output;

    // Metadata section
    output["metadata"] = {{"version", VERSION},
                          {"build_config", get_build_config()},
                          {"timestamp", std::time(nullptr)},
                          {"runtime_seconds", runtime}};

    // Configuration section
    output["configuration"] = {{"options", cfg.options.names},
                               {"size", cfg.selector.size},
                               {"seed", cfg.selector.seed},
                               {"heterogeneity", cfg.selector.heterogeneity},
                               {"accent", cfg.selector.accent},
                               {"charge_policy", cfg.selector.charge_policy}};

    // Results section
    json results;
    results["choices"] = selector.choices();
    results["chosen_indices"] = selector.chosen_indices();
    results["statistics"] = selector.statistics();
    results["statistics_spread"] = analysis::statistics_spread(selector.statistics());

    json fairness = json::array();
    for (std::size_t i = 0; i < report.options.size(); ++i) {
        const auto& opt = report.options[i];
        fairness.push_back({{"option", selector.options()[i]},
                            {"observed", opt.observed},
                            {"expected", opt.expected},
                            {"observed_share", opt.observed_share},
                            {"expected_share", opt.expected_share}});
    }
    results["fairness"] = fairness;
    results["max_abs_deviation"] = report.max_abs_deviation;
    results["max_share_error"] = report.max_share_error();
    output["results"] = results;

    // Trace section
    json trace = json::array();
    for (const auto& record : selector.trace()) {
        trace.push_back({{"decision", record.decision},
                         {"option", selector.options()[record.option_index]},
                         {"scheduling_value", record.scheduling_value},
                         {"statistics_spread", record.statistics_spread}});
    }
    output["trace"] = trace;

    // Replica study section
    if (!replicas.empty()) {
        json replica_array = json::array();
        for (const auto& replica : replicas) {
            replica_array.push_back({{"seed", replica.seed},
                                     {"max_share_error", replica.max_share_error},
                                     {"statistics_spread", replica.statistics_spread}});
        }
        output["replicas"] = replica_array;
    }

    // Output to file or stdout
    if (!filename.empty()) {
        std::ofstream file(filename);
        if (file) {
            file << output.dump(2); // Pretty print with 2 spaces indentation
        } else {
            std::cerr << "Could not open JSON output file: " << filename << "\n";
        }
    } else {
        std::cout << output.dump(2) << "\n";
    }
}

/// Print results
void print_results(const core::Selector<std::string>& selector,
                   const analysis::FairnessReport& report,
                   const std::vector<ReplicaSummary>& replicas, const config::Config& cfg,
                   double runtime) {
    std::cout << "\n=== Choices ===\n";
    for (std::size_t i = 0; i < selector.choices().size(); ++i) {
        std::cout << selector.choices()[i];
        std::cout << (i + 1 < selector.choices().size() ? " " : "\n");
    }

    std::cout << "\n=== Fairness ===\n";
    std::cout << std::setw(16) << "Option" << std::setw(10) << "Chosen" << std::setw(12)
              << "Expected" << std::setw(14) << "Statistic\n";
    std::cout << std::string(52, '-') << "\n";
    for (std::size_t i = 0; i < report.options.size(); ++i) {
        const auto& opt = report.options[i];
        std::cout << std::setw(16) << selector.options()[i] << std::setw(10) << opt.observed
                  << std::setw(12) << std::fixed << std::setprecision(2) << opt.expected
                  << std::setw(13) << std::fixed << std::setprecision(4)
                  << selector.statistics()[i] << "\n";
    }
    std::cout << "Max deviation: " << std::fixed << std::setprecision(3)
              << report.max_abs_deviation << "\n";
    std::cout << "Statistics spread: " << std::fixed << std::setprecision(4)
              << analysis::statistics_spread(selector.statistics()) << "\n";
    std::cout << "Runtime: " << std::fixed << std::setprecision(3) << runtime << " seconds\n";

    if (cfg.logging.verbose && !selector.trace().empty()) {
        std::cout << "\n=== Decision Trace ===\n";
        std::cout << std::setw(10) << "Decision" << std::setw(16) << "Option" << std::setw(15)
                  << "Value" << std::setw(15) << "Spread\n";
        std::cout << std::string(56, '-') << "\n";

        for (const auto& record : selector.trace()) {
            std::cout << std::setw(10) << record.decision << std::setw(16)
                      << selector.options()[record.option_index] << std::setw(15) << std::fixed
                      << std::setprecision(4) << record.scheduling_value << std::setw(14)
                      << std::fixed << std::setprecision(4) << record.statistics_spread << "\n";
        }
    }

    if (!replicas.empty()) {
        double worst_error = 0.0;
        double worst_spread = 0.0;
        for (const auto& replica : replicas) {
            worst_error = std::max(worst_error, replica.max_share_error);
            worst_spread = std::max(worst_spread, replica.statistics_spread);
        }
        std::cout << "\n=== Replica Study ===\n";
        std::cout << "Replicas: " << replicas.size() << "\n";
        std::cout << "Worst share error: " << std::fixed << std::setprecision(4) << worst_error
                  << "\n";
        std::cout << "Worst statistics spread: " << std::fixed << std::setprecision(4)
                  << worst_spread << "\n";
    }
}

int main(int argc, char** argv) {
    try {
        auto cli_config = parse_args(argc, argv);

        // Only print header if not in JSON output mode
        if (!cli_config.json_output) {
            std::cout << "Statfeed Selector v" << VERSION << "\n";
            std::cout << std::string(30, '=') << "\n";
        }

        // Load or create configuration
        config::Config cfg;
        if (!cli_config.config_file.empty()) {
            if (!cli_config.json_output) {
                std::cout << "Loading configuration from: " << cli_config.config_file << "\n";
            }
            cfg = config::Config::from_file(cli_config.config_file);
        }
        // Command-line values take precedence over the file (or the defaults)
        cfg.apply_overrides(cli_config.to_overrides());

        if (!cli_config.json_output) {
            std::cout << "Options: " << cfg.options.names.size() << "\n";
            std::cout << "Decisions: " << cfg.selector.size << "\n";
            std::cout << "Heterogeneity: " << cfg.selector.heterogeneity << "\n";
            std::cout << "Charge policy: " << cfg.selector.charge_policy << "\n";
            std::cout << "Seed: " << cfg.selector.seed << "\n";
        }

        auto start_time = std::chrono::high_resolution_clock::now();

        auto selector = factory::make_selector_from_config(cfg);
        selector.populate_choices();
        const auto report = analysis::analyze_fairness(selector);

        std::vector<ReplicaSummary> replicas;
        if (cfg.replicas.count > 0) {
            replicas = run_replicas(cfg);
        }

        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration<double>(end_time - start_time).count();

        // Output results based on mode
        if (cli_config.json_output) {
            write_json_output(selector, report, replicas, cfg, duration, cli_config.json_file);
        } else {
            print_results(selector, report, replicas, cfg, duration);
        }

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
