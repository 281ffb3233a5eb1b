#pragma once

#include <cmath>
#include <cstdint>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <toml.hpp>

#include <statfeed/core/plan.hpp>

namespace statfeed::config {

/// Custom exception for configuration validation errors
class ConfigValidationError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/// Engine dimensions and scalar coefficients
struct SelectorConfig {
    std::size_t size = 16;                      // Number of decisions
    std::uint64_t seed = 1;                     // Reproducible seed by default
    double heterogeneity = 0.1;                 // Perturbation strength
    double accent = 1.0;                        // Base cost scale
    std::string charge_policy = "chosen_option"; // Or "rank_position"
};

/// Option set and optional per-option weights applied to every decision
struct OptionsConfig {
    std::vector<std::string> names = {"a", "b", "c"};
    std::vector<double> weights; // Empty = uniform weights
};

/// Explicit per-decision overrides; each field is optional (empty = not set)
struct PlanConfig {
    core::Matrix weights;                // size rows of names.size() entries
    std::vector<double> heterogeneities; // size entries
    std::vector<double> accents;         // size entries
};

/// Logging and output configuration
struct LoggingConfig {
    bool verbose = false;           // Detailed output disabled by default
    std::size_t trace_interval = 0; // Record every N-th decision; 0 disables the trace
};

/// Independent replica study configuration
struct ReplicasConfig {
    std::size_t count = 0; // 0 = single run only
    bool parallel = true;  // Use TBB when available
};

/// Command-line override structure
/// Contains optional overrides for configuration parameters
struct ConfigOverrides {
    std::optional<std::size_t> size;
    std::optional<std::uint64_t> seed;
    std::optional<double> heterogeneity;
    std::optional<std::string> charge_policy;
    std::optional<std::vector<std::string>> option_names;
    std::optional<std::size_t> replicas;
    std::optional<bool> verbose;
};

/// Complete configuration structure
struct Config {
    SelectorConfig selector;
    OptionsConfig options;
    PlanConfig plan;
    LoggingConfig logging;
    ReplicasConfig replicas;

    /// Load configuration from TOML file
    /// Validates all parameters and applies defaults for missing values
    static Config from_file(const std::string& filepath);

    /// Load configuration from TOML string
    static Config from_string(const std::string& toml_string);

    /// Validate configuration parameters
    /// Throws ConfigValidationError if any parameter is invalid
    void validate() const;

    /// Export configuration to TOML string
    std::string to_toml() const;

    /// Apply command-line overrides to configuration
    /// Overrides take precedence over loaded values
    void apply_overrides(const ConfigOverrides& overrides);

    /// Convert to core::SelectorConfig for engine construction
    core::SelectorConfig to_selector_config() const;

    /// Build the per-decision plan described by this configuration
    ///
    /// Weights come from [plan] if given, else from [options] broadcast to every
    /// decision, else uniform. Heterogeneities and accents come from [plan] if given,
    /// else from the [selector] scalars. The perturbation matrix is supplied by the
    /// caller, normally the one the engine drew at construction.
    core::DecisionPlan to_plan(core::Matrix randoms) const;

  private:
    static Config from_value(const toml::value& data);

    /// Parse selector configuration from TOML table
    static SelectorConfig parse_selector(const toml::value& data);

    /// Parse options configuration from TOML table
    static OptionsConfig parse_options(const toml::value& data);

    /// Parse plan overrides from TOML table
    static PlanConfig parse_plan(const toml::value& data);

    /// Parse logging configuration from TOML table
    static LoggingConfig parse_logging(const toml::value& data);

    /// Parse replica study configuration from TOML table
    static ReplicasConfig parse_replicas(const toml::value& data);
};

namespace detail {

// TOML distinguishes 1 from 1.0; accept both wherever a real number is expected
inline double as_number(const toml::value& value) {
    if (value.is_integer()) {
        return static_cast<double>(value.as_integer());
    }
    return value.as_floating();
}

inline double find_number(const toml::value& table, const std::string& key) {
    return as_number(toml::find(table, key));
}

inline std::vector<double> find_numbers(const toml::value& table, const std::string& key) {
    std::vector<double> numbers;
    for (const auto& element : toml::find(table, key).as_array()) {
        numbers.push_back(as_number(element));
    }
    return numbers;
}

inline core::Matrix find_matrix(const toml::value& table, const std::string& key) {
    core::Matrix matrix;
    for (const auto& row : toml::find(table, key).as_array()) {
        std::vector<double> values;
        for (const auto& element : row.as_array()) {
            values.push_back(as_number(element));
        }
        matrix.push_back(std::move(values));
    }
    return matrix;
}

inline bool is_valid_weight(double w) { return std::isfinite(w) && w >= 0.0; }

} // namespace detail

// Implementation of Config methods

inline Config Config::from_file(const std::string& filepath) {
    const auto data = toml::parse(filepath);
    return from_value(data);
}

inline Config Config::from_string(const std::string& toml_string) {
    std::istringstream iss(toml_string);
    const auto data = toml::parse(iss, "config_string");
    return from_value(data);
}

inline Config Config::from_value(const toml::value& data) {
    Config config;

    // Parse each section if it exists, otherwise use defaults
    if (data.contains("selector")) {
        config.selector = parse_selector(data);
    }

    if (data.contains("options")) {
        config.options = parse_options(data);
    }

    if (data.contains("plan")) {
        config.plan = parse_plan(data);
    }

    if (data.contains("logging")) {
        config.logging = parse_logging(data);
    }

    if (data.contains("replicas")) {
        config.replicas = parse_replicas(data);
    }

    // Validate the complete configuration
    config.validate();
    return config;
}

inline void Config::validate() const {
    // Validate selector coefficients
    if (!std::isfinite(selector.heterogeneity) || selector.heterogeneity < 0.0) {
        throw ConfigValidationError("Heterogeneity must be finite and non-negative");
    }

    if (!std::isfinite(selector.accent) || selector.accent < 0.0) {
        throw ConfigValidationError("Accent must be finite and non-negative");
    }

    if (selector.charge_policy != "chosen_option" && selector.charge_policy != "rank_position") {
        throw ConfigValidationError("Charge policy must be 'chosen_option' or 'rank_position'");
    }

    // Validate option set
    if (options.names.empty()) {
        throw ConfigValidationError("At least one option is required");
    }

    const std::size_t n = options.names.size();

    if (!options.weights.empty()) {
        if (options.weights.size() != n) {
            throw ConfigValidationError("Option weights must have one entry per option");
        }
        double total = 0.0;
        for (double w : options.weights) {
            if (!detail::is_valid_weight(w)) {
                throw ConfigValidationError("Option weights must be finite and non-negative");
            }
            total += w;
        }
        if (total == 0.0) {
            throw ConfigValidationError("At least one option weight must be positive");
        }
    }

    // Validate plan overrides against the selector dimensions
    if (!plan.weights.empty()) {
        if (plan.weights.size() != selector.size) {
            throw ConfigValidationError("Plan weights must have one row per decision");
        }
        for (const auto& row : plan.weights) {
            if (row.size() != n) {
                throw ConfigValidationError("Plan weight rows must have one entry per option");
            }
            for (double w : row) {
                if (!detail::is_valid_weight(w)) {
                    throw ConfigValidationError("Plan weights must be finite and non-negative");
                }
            }
        }
    }

    if (!plan.heterogeneities.empty() && plan.heterogeneities.size() != selector.size) {
        throw ConfigValidationError("Plan heterogeneities must have one entry per decision");
    }

    if (!plan.accents.empty() && plan.accents.size() != selector.size) {
        throw ConfigValidationError("Plan accents must have one entry per decision");
    }
}

inline SelectorConfig Config::parse_selector(const toml::value& data) {
    SelectorConfig sel;
    const auto& sel_table = toml::find(data, "selector");

    if (sel_table.contains("size")) {
        sel.size = toml::find<std::size_t>(sel_table, "size");
    }

    if (sel_table.contains("seed")) {
        sel.seed = toml::find<std::uint64_t>(sel_table, "seed");
    }

    if (sel_table.contains("heterogeneity")) {
        sel.heterogeneity = detail::find_number(sel_table, "heterogeneity");
    }

    if (sel_table.contains("accent")) {
        sel.accent = detail::find_number(sel_table, "accent");
    }

    if (sel_table.contains("charge_policy")) {
        sel.charge_policy = toml::find<std::string>(sel_table, "charge_policy");
    }

    return sel;
}

inline OptionsConfig Config::parse_options(const toml::value& data) {
    OptionsConfig opts;
    const auto& opts_table = toml::find(data, "options");

    if (opts_table.contains("names")) {
        opts.names = toml::find<std::vector<std::string>>(opts_table, "names");
    }

    if (opts_table.contains("weights")) {
        opts.weights = detail::find_numbers(opts_table, "weights");
    }

    return opts;
}

inline PlanConfig Config::parse_plan(const toml::value& data) {
    PlanConfig plan;
    const auto& plan_table = toml::find(data, "plan");

    if (plan_table.contains("weights")) {
        plan.weights = detail::find_matrix(plan_table, "weights");
    }

    if (plan_table.contains("heterogeneities")) {
        plan.heterogeneities = detail::find_numbers(plan_table, "heterogeneities");
    }

    if (plan_table.contains("accents")) {
        plan.accents = detail::find_numbers(plan_table, "accents");
    }

    return plan;
}

inline LoggingConfig Config::parse_logging(const toml::value& data) {
    LoggingConfig log;
    const auto& log_table = toml::find(data, "logging");

    if (log_table.contains("verbose")) {
        log.verbose = toml::find<bool>(log_table, "verbose");
    }

    if (log_table.contains("trace_interval")) {
        log.trace_interval = toml::find<std::size_t>(log_table, "trace_interval");
    }

    return log;
}

inline ReplicasConfig Config::parse_replicas(const toml::value& data) {
    ReplicasConfig rep;
    const auto& rep_table = toml::find(data, "replicas");

    if (rep_table.contains("count")) {
        rep.count = toml::find<std::size_t>(rep_table, "count");
    }

    if (rep_table.contains("parallel")) {
        rep.parallel = toml::find<bool>(rep_table, "parallel");
    }

    return rep;
}

inline std::string Config::to_toml() const {
    toml::value root;

    // Selector section
    toml::value sel_table;
    sel_table["size"] = selector.size;
    sel_table["seed"] = selector.seed;
    sel_table["heterogeneity"] = selector.heterogeneity;
    sel_table["accent"] = selector.accent;
    sel_table["charge_policy"] = selector.charge_policy;
    root["selector"] = sel_table;

    // Options section
    toml::value opts_table;
    opts_table["names"] = options.names;
    if (!options.weights.empty()) {
        opts_table["weights"] = options.weights;
    }
    root["options"] = opts_table;

    // Plan section, only when it carries overrides
    if (!plan.weights.empty() || !plan.heterogeneities.empty() || !plan.accents.empty()) {
        toml::value plan_table;
        if (!plan.weights.empty()) {
            plan_table["weights"] = plan.weights;
        }
        if (!plan.heterogeneities.empty()) {
            plan_table["heterogeneities"] = plan.heterogeneities;
        }
        if (!plan.accents.empty()) {
            plan_table["accents"] = plan.accents;
        }
        root["plan"] = plan_table;
    }

    // Logging section
    toml::value log_table;
    log_table["verbose"] = logging.verbose;
    log_table["trace_interval"] = logging.trace_interval;
    root["logging"] = log_table;

    // Replicas section
    toml::value rep_table;
    rep_table["count"] = replicas.count;
    rep_table["parallel"] = replicas.parallel;
    root["replicas"] = rep_table;

    std::stringstream ss;
    ss << toml::format(root);
    return ss.str();
}

inline void Config::apply_overrides(const ConfigOverrides& overrides) {
    // Apply overrides only if they are set
    if (overrides.size.has_value()) {
        selector.size = overrides.size.value();
    }

    if (overrides.seed.has_value()) {
        selector.seed = overrides.seed.value();
    }

    if (overrides.heterogeneity.has_value()) {
        selector.heterogeneity = overrides.heterogeneity.value();
    }

    if (overrides.charge_policy.has_value()) {
        selector.charge_policy = overrides.charge_policy.value();
    }

    if (overrides.option_names.has_value()) {
        options.names = overrides.option_names.value();
    }

    if (overrides.replicas.has_value()) {
        replicas.count = overrides.replicas.value();
    }

    if (overrides.verbose.has_value()) {
        logging.verbose = overrides.verbose.value();
    }

    // Re-validate after applying overrides
    validate();
}

inline core::SelectorConfig Config::to_selector_config() const {
    core::SelectorConfig sel_config;

    sel_config.heterogeneity = selector.heterogeneity;
    sel_config.accent = selector.accent;
    sel_config.charge_policy = core::charge_policy_from_string(selector.charge_policy);
    sel_config.trace_interval = logging.trace_interval;

    return sel_config;
}

inline core::DecisionPlan Config::to_plan(core::Matrix randoms) const {
    const std::size_t m = selector.size;
    const std::size_t n = options.names.size();

    core::DecisionPlan result;

    if (!plan.weights.empty()) {
        result.weights = plan.weights;
    } else if (!options.weights.empty()) {
        result.weights.assign(m, options.weights);
    } else {
        result.weights.assign(m, std::vector<double>(n, 1.0 / static_cast<double>(n)));
    }

    result.randoms = std::move(randoms);

    result.heterogeneities = plan.heterogeneities.empty()
                                 ? std::vector<double>(m, selector.heterogeneity)
                                 : plan.heterogeneities;
    result.accents = plan.accents.empty() ? std::vector<double>(m, selector.accent) : plan.accents;

    return result;
}

} // namespace statfeed::config
