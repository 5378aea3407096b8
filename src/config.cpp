#include "config.h"
#include "enum_utils.h"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <toml++/toml.hpp>

namespace {

// Safe value extraction helpers
template <typename T> T get_or(toml::table const& tbl, std::string_view key, T default_val) {
    if (auto node = tbl.get(key)) {
        if (auto val = node->value<T>()) {
            return *val;
        }
    }
    return default_val;
}

std::string get_string_or(toml::table const& tbl, std::string_view key, std::string default_val) {
    if (auto node = tbl.get(key)) {
        if (auto val = node->value<std::string>()) {
            return *val;
        }
    }
    return default_val;
}

// Enum from snake_case string, falling back to the current value with a message
template <typename E>
E get_enum_or(toml::table const& tbl, std::string_view key, E default_val) {
    auto node = tbl.get(key);
    if (!node) {
        return default_val;
    }
    auto str = node->value<std::string>();
    if (!str) {
        return default_val;
    }
    if (auto parsed = enum_utils::fromString<E>(*str)) {
        return *parsed;
    }
    std::cerr << "Warning: Unknown value for " << key << ": " << *str << " (expected "
              << enum_utils::choices<E>() << "), using " << enum_utils::toString(default_val)
              << "\n";
    return default_val;
}

// Seed is a 3-element numeric array
Vec3 get_vec3_or(toml::table const& tbl, std::string_view key, Vec3 default_val) {
    auto arr = tbl[key].as_array();
    if (!arr) {
        return default_val;
    }
    if (arr->size() != 3) {
        std::cerr << "Warning: " << key << " must have 3 components, ignoring\n";
        return default_val;
    }
    Vec3 result = default_val;
    for (size_t i = 0; i < 3; ++i) {
        auto val = (*arr)[i].value<double>();
        if (!val) {
            std::cerr << "Warning: " << key << " must be numeric, ignoring\n";
            return default_val;
        }
        result[i] = *val;
    }
    return result;
}

// Parses "x,y,z" (brackets optional) for command-line overrides
Vec3 parseVec3(std::string value) {
    for (char& c : value) {
        if (c == '[' || c == ']' || c == ',') {
            c = ' ';
        }
    }
    std::istringstream in(value);
    Vec3 v{};
    if (!(in >> v[0] >> v[1] >> v[2])) {
        throw std::invalid_argument("expected three numbers");
    }
    return v;
}

// Replaces obviously broken values with defaults. Returns one message per
// replaced group, empty when the config was already valid.
std::vector<std::string> repairInvalid(Config& config) {
    Config defaults;
    std::vector<std::string> problems;
    auto check = [&](bool ok, char const* what, auto repair) {
        if (!ok) {
            problems.emplace_back(what);
            repair();
        }
    };

    auto& m = config.model;
    check(m.b > 0 && std::isfinite(m.b), "model.b must be positive and finite",
          [&] { m.b = defaults.model.b; });
    check(m.dt > 0 && std::isfinite(m.dt), "model.dt must be positive and finite",
          [&] { m.dt = defaults.model.dt; });
    check(isFinite(m.seed), "model.seed must be finite", [&] { m.seed = defaults.model.seed; });
    check(m.steps >= 0, "model.steps cannot be negative", [&] { m.steps = defaults.model.steps; });
    check(m.transient_steps >= 0, "model.transient_steps cannot be negative",
          [&] { m.transient_steps = 0; });

    auto& t = config.trajectory;
    check(t.recent_capacity > 1 && t.analysis_capacity > 0, "trajectory capacities must be positive",
          [&] { t = defaults.trajectory; });

    auto& l = config.lyapunov;
    check(l.steps > 0, "lyapunov.steps must be positive", [&] { l.steps = defaults.lyapunov.steps; });
    check(l.skip_transient >= 0, "lyapunov.skip_transient cannot be negative",
          [&] { l.skip_transient = 0; });
    check(l.qr_interval > 0, "lyapunov.qr_interval must be positive", [&] { l.qr_interval = 1; });
    check(l.ftle_window > 0 && l.convergence_interval > 0,
          "lyapunov window sizes must be positive", [&] {
              l.ftle_window = defaults.lyapunov.ftle_window;
              l.convergence_interval = defaults.lyapunov.convergence_interval;
          });
    check(l.quick_window >= 3, "lyapunov.quick_window must be at least 3",
          [&] { l.quick_window = defaults.lyapunov.quick_window; });
    check(l.metric_steps > 0 && l.metric_skip_transient >= 0,
          "lyapunov metric spectrum settings invalid", [&] {
              l.metric_steps = defaults.lyapunov.metric_steps;
              l.metric_skip_transient = defaults.lyapunov.metric_skip_transient;
          });

    auto& f = config.field;
    check(f.resolution >= 3, "field.resolution must be at least 3",
          [&] { f.resolution = defaults.field.resolution; });
    check(f.half_range > 0, "field.half_range must be positive",
          [&] { f.half_range = defaults.field.half_range; });
    check(f.kernel_bandwidth > 0, "field.kernel_bandwidth must be positive",
          [&] { f.kernel_bandwidth = defaults.field.kernel_bandwidth; });
    check(f.local_lyapunov_dt > 0 && f.local_lyapunov_iterations > 0,
          "local Lyapunov probe settings must be positive", [&] {
              f.local_lyapunov_dt = defaults.field.local_lyapunov_dt;
              f.local_lyapunov_iterations = defaults.field.local_lyapunov_iterations;
          });

    auto& sl = config.streamlines;
    check(sl.min_step > 0 && sl.max_step >= sl.min_step,
          "streamline steps must satisfy 0 < min_step <= max_step", [&] {
              sl.min_step = defaults.streamlines.min_step;
              sl.max_step = defaults.streamlines.max_step;
          });
    check(sl.max_points >= 2, "streamlines.max_points must be at least 2",
          [&] { sl.max_points = defaults.streamlines.max_points; });
    check(sl.count >= 0, "streamlines.count cannot be negative",
          [&] { sl.count = defaults.streamlines.count; });

    auto& a = config.acceleration;
    check(a.basis_functions >= 8 && a.basis_functions <= 16,
          "acceleration.basis_functions must be in [8,16]",
          [&] { a.basis_functions = defaults.acceleration.basis_functions; });
    check(a.hash_divisions > 0 && a.hash_radius >= 0, "spatial hash settings invalid", [&] {
        a.hash_divisions = defaults.acceleration.hash_divisions;
        a.hash_radius = defaults.acceleration.hash_radius;
    });
    check(a.importance_grid >= 2 && a.cache_block > 0 && a.rbf_width > 0,
          "stochastic field settings invalid", [&] {
              a.importance_grid = defaults.acceleration.importance_grid;
              a.cache_block = defaults.acceleration.cache_block;
              a.rbf_width = defaults.acceleration.rbf_width;
          });

    auto& sw = config.sweep;
    check(sw.b_min > 0 && sw.b_max >= sw.b_min && sw.b_step > 0, "sweep range invalid", [&] {
        sw.b_min = defaults.sweep.b_min;
        sw.b_max = defaults.sweep.b_max;
        sw.b_step = defaults.sweep.b_step;
    });
    check(sw.steps > 0 && sw.skip_transient >= 0, "sweep spectrum settings invalid", [&] {
        sw.steps = defaults.sweep.steps;
        sw.skip_transient = defaults.sweep.skip_transient;
    });

    return problems;
}

} // namespace

Config Config::defaults() {
    return Config{};
}

// Load config values from a TOML table into an existing config (for include support)
static void loadConfigFromTable(Config& config, toml::table const& tbl) {
    if (auto model = tbl["model"].as_table()) {
        config.model.b = get_or(*model, "b", config.model.b);
        config.model.dt = get_or(*model, "dt", config.model.dt);
        config.model.seed = get_vec3_or(*model, "seed", config.model.seed);
        config.model.steps = get_or(*model, "steps", config.model.steps);
        config.model.transient_steps =
            get_or(*model, "transient_steps", config.model.transient_steps);
    }

    if (auto traj = tbl["trajectory"].as_table()) {
        config.trajectory.recent_capacity =
            get_or(*traj, "recent_capacity", config.trajectory.recent_capacity);
        config.trajectory.analysis_capacity =
            get_or(*traj, "analysis_capacity", config.trajectory.analysis_capacity);
    }

    if (auto lyap = tbl["lyapunov"].as_table()) {
        auto& p = config.lyapunov;
        p.steps = get_or(*lyap, "steps", p.steps);
        p.skip_transient = get_or(*lyap, "skip_transient", p.skip_transient);
        p.qr_interval = get_or(*lyap, "qr_interval", p.qr_interval);
        p.ftle_window = get_or(*lyap, "ftle_window", p.ftle_window);
        p.convergence_interval = get_or(*lyap, "convergence_interval", p.convergence_interval);
        p.convergence_tolerance = get_or(*lyap, "convergence_tolerance", p.convergence_tolerance);
        p.quick_window = get_or(*lyap, "quick_window", p.quick_window);
        p.quick_cache_ms = get_or(*lyap, "quick_cache_ms", p.quick_cache_ms);
        p.metric_steps = get_or(*lyap, "metric_steps", p.metric_steps);
        p.metric_skip_transient = get_or(*lyap, "metric_skip_transient", p.metric_skip_transient);
    }

    if (auto field = tbl["field"].as_table()) {
        auto& p = config.field;
        p.resolution = get_or(*field, "resolution", p.resolution);
        p.half_range = get_or(*field, "half_range", p.half_range);
        p.kernel_bandwidth = get_or(*field, "kernel_bandwidth", p.kernel_bandwidth);
        p.min_density = get_or(*field, "min_density", p.min_density);
        p.critical_threshold = get_or(*field, "critical_threshold", p.critical_threshold);
        p.velocity_mode = get_enum_or(*field, "velocity_mode", p.velocity_mode);
        p.density_method = get_enum_or(*field, "density_method", p.density_method);
        p.exact_budget = get_or(*field, "exact_budget", p.exact_budget);
        p.local_lyapunov_dt = get_or(*field, "local_lyapunov_dt", p.local_lyapunov_dt);
        p.local_lyapunov_iterations =
            get_or(*field, "local_lyapunov_iterations", p.local_lyapunov_iterations);
        p.escape_bound = get_or(*field, "escape_bound", p.escape_bound);
    }

    if (auto sl = tbl["streamlines"].as_table()) {
        auto& p = config.streamlines;
        p.count = get_or(*sl, "count", p.count);
        p.max_points = get_or(*sl, "max_points", p.max_points);
        p.min_points = get_or(*sl, "min_points", p.min_points);
        p.min_step = get_or(*sl, "min_step", p.min_step);
        p.max_step = get_or(*sl, "max_step", p.max_step);
        p.tolerance = get_or(*sl, "tolerance", p.tolerance);
        p.seed = static_cast<unsigned>(get_or<int64_t>(*sl, "seed", p.seed));
    }

    if (auto acc = tbl["acceleration"].as_table()) {
        auto& p = config.acceleration;
        p.hash_divisions = get_or(*acc, "hash_divisions", p.hash_divisions);
        p.hash_radius = get_or(*acc, "hash_radius", p.hash_radius);
        p.monte_carlo_samples = get_or(*acc, "monte_carlo_samples", p.monte_carlo_samples);
        p.importance_grid = get_or(*acc, "importance_grid", p.importance_grid);
        p.basis_functions = get_or(*acc, "basis_functions", p.basis_functions);
        p.rbf_radius = get_or(*acc, "rbf_radius", p.rbf_radius);
        p.rbf_width = get_or(*acc, "rbf_width", p.rbf_width);
        p.fit_samples = get_or(*acc, "fit_samples", p.fit_samples);
        p.cache_block = get_or(*acc, "cache_block", p.cache_block);
        p.cache_expiry_ms = get_or(*acc, "cache_expiry_ms", p.cache_expiry_ms);
        p.torus_radius = get_or(*acc, "torus_radius", p.torus_radius);
        p.tube_radius = get_or(*acc, "tube_radius", p.tube_radius);
        p.seed = static_cast<unsigned>(get_or<int64_t>(*acc, "seed", p.seed));
    }

    if (auto sweep = tbl["sweep"].as_table()) {
        auto& p = config.sweep;
        p.b_min = get_or(*sweep, "b_min", p.b_min);
        p.b_max = get_or(*sweep, "b_max", p.b_max);
        p.b_step = get_or(*sweep, "b_step", p.b_step);
        p.steps = get_or(*sweep, "steps", p.steps);
        p.skip_transient = get_or(*sweep, "skip_transient", p.skip_transient);
        if (auto zones = (*sweep)["refinement"].as_array()) {
            p.refinement.clear();
            for (auto const& node : *zones) {
                if (auto zone = node.as_table()) {
                    RefinementZone z;
                    z.min = get_or(*zone, "min", z.min);
                    z.max = get_or(*zone, "max", z.max);
                    z.step = get_or(*zone, "step", z.step);
                    p.refinement.push_back(z);
                }
            }
        }
    }

    if (auto output = tbl["output"].as_table()) {
        config.output.json_path = get_string_or(*output, "json_path", config.output.json_path);
        config.output.verbose = get_or(*output, "verbose", config.output.verbose);
    }
}

Config Config::load(std::string const& path) {
    Config config;

    if (!std::filesystem::exists(path)) {
        std::cerr << "Config file not found: " << path << ", using defaults\n";
        return config;
    }

    try {
        auto tbl = toml::parse_file(path);
        std::string base_path = std::filesystem::path(path).parent_path().string();
        if (base_path.empty()) base_path = ".";

        // Process includes first (they provide base values that can be overridden)
        if (auto includes = tbl["include"].as_array()) {
            for (auto const& inc : *includes) {
                if (auto inc_path = inc.value<std::string>()) {
                    std::filesystem::path full_path;
                    if (std::filesystem::path(*inc_path).is_absolute()) {
                        full_path = *inc_path;
                    } else {
                        full_path = std::filesystem::path(base_path) / *inc_path;
                    }
                    if (std::filesystem::exists(full_path)) {
                        try {
                            auto inc_tbl = toml::parse_file(full_path.string());
                            loadConfigFromTable(config, inc_tbl);
                        } catch (toml::parse_error const& err) {
                            std::cerr << "Error parsing included config " << full_path << ": "
                                      << err.description() << "\n";
                        }
                    } else {
                        std::cerr << "Warning: Included config not found: " << full_path << "\n";
                    }
                }
            }
        }

        // Load values from this file (override includes)
        loadConfigFromTable(config, tbl);

    } catch (toml::parse_error const& err) {
        std::cerr << "Error parsing config: " << err.description() << "\n";
        std::cerr << "Using defaults\n";
    }

    config.validate();
    return config;
}

bool Config::validate() {
    auto problems = repairInvalid(*this);
    for (auto const& problem : problems) {
        std::cerr << "Warning: " << problem << ", using default\n";
    }
    return problems.empty();
}

bool Config::applyOverride(std::string const& key, std::string const& value) {
    Config const before = *this;
    if (!assignOverride(key, value)) {
        *this = before;
        return false;
    }

    // Out-of-range values are rejected, leaving the config as it was
    Config checked = *this;
    auto problems = repairInvalid(checked);
    if (!problems.empty()) {
        std::cerr << "Rejected override " << key << "=" << value << ": " << problems.front()
                  << "\n";
        *this = before;
        return false;
    }
    return true;
}

bool Config::assignOverride(std::string const& key, std::string const& value) {
    // Parse dot-notation key (e.g., "model.b")
    auto dot_pos = key.find('.');
    if (dot_pos == std::string::npos) {
        std::cerr << "Invalid parameter key (missing section): " << key << "\n";
        return false;
    }

    std::string section = key.substr(0, dot_pos);
    std::string param = key.substr(dot_pos + 1);

    try {
        if (section == "model") {
            if (param == "b") {
                model.b = std::stod(value);
            } else if (param == "dt") {
                model.dt = std::stod(value);
            } else if (param == "seed") {
                model.seed = parseVec3(value);
            } else if (param == "steps") {
                model.steps = std::stoi(value);
            } else if (param == "transient_steps") {
                model.transient_steps = std::stoi(value);
            } else {
                std::cerr << "Unknown model parameter: " << param << "\n";
                return false;
            }
        } else if (section == "trajectory") {
            if (param == "recent_capacity") {
                trajectory.recent_capacity = std::stoi(value);
            } else if (param == "analysis_capacity") {
                trajectory.analysis_capacity = std::stoi(value);
            } else {
                std::cerr << "Unknown trajectory parameter: " << param << "\n";
                return false;
            }
        } else if (section == "lyapunov") {
            if (param == "steps") {
                lyapunov.steps = std::stoi(value);
            } else if (param == "skip_transient") {
                lyapunov.skip_transient = std::stoi(value);
            } else if (param == "qr_interval") {
                lyapunov.qr_interval = std::stoi(value);
            } else if (param == "ftle_window") {
                lyapunov.ftle_window = std::stoi(value);
            } else if (param == "convergence_interval") {
                lyapunov.convergence_interval = std::stoi(value);
            } else if (param == "convergence_tolerance") {
                lyapunov.convergence_tolerance = std::stod(value);
            } else if (param == "quick_window") {
                lyapunov.quick_window = std::stoi(value);
            } else if (param == "quick_cache_ms") {
                lyapunov.quick_cache_ms = std::stoi(value);
            } else if (param == "metric_steps") {
                lyapunov.metric_steps = std::stoi(value);
            } else if (param == "metric_skip_transient") {
                lyapunov.metric_skip_transient = std::stoi(value);
            } else {
                std::cerr << "Unknown lyapunov parameter: " << param << "\n";
                return false;
            }
        } else if (section == "field") {
            if (param == "resolution") {
                field.resolution = std::stoi(value);
            } else if (param == "half_range") {
                field.half_range = std::stod(value);
            } else if (param == "kernel_bandwidth") {
                field.kernel_bandwidth = std::stod(value);
            } else if (param == "min_density") {
                field.min_density = std::stod(value);
            } else if (param == "critical_threshold") {
                field.critical_threshold = std::stod(value);
            } else if (param == "velocity_mode") {
                auto mode = enum_utils::fromString<VelocityMode>(value);
                if (!mode) {
                    std::cerr << "Unknown velocity mode: " << value << " (expected "
                              << enum_utils::choices<VelocityMode>() << ")\n";
                    return false;
                }
                field.velocity_mode = *mode;
            } else if (param == "density_method") {
                auto method = enum_utils::fromString<DensityMethod>(value);
                if (!method) {
                    std::cerr << "Unknown density method: " << value << " (expected "
                              << enum_utils::choices<DensityMethod>() << ")\n";
                    return false;
                }
                field.density_method = *method;
            } else if (param == "exact_budget") {
                field.exact_budget = std::stod(value);
            } else if (param == "local_lyapunov_dt") {
                field.local_lyapunov_dt = std::stod(value);
            } else if (param == "local_lyapunov_iterations") {
                field.local_lyapunov_iterations = std::stoi(value);
            } else if (param == "escape_bound") {
                field.escape_bound = std::stod(value);
            } else {
                std::cerr << "Unknown field parameter: " << param << "\n";
                return false;
            }
        } else if (section == "streamlines") {
            if (param == "count") {
                streamlines.count = std::stoi(value);
            } else if (param == "max_points") {
                streamlines.max_points = std::stoi(value);
            } else if (param == "min_points") {
                streamlines.min_points = std::stoi(value);
            } else if (param == "min_step") {
                streamlines.min_step = std::stod(value);
            } else if (param == "max_step") {
                streamlines.max_step = std::stod(value);
            } else if (param == "tolerance") {
                streamlines.tolerance = std::stod(value);
            } else if (param == "seed") {
                streamlines.seed = static_cast<unsigned>(std::stoul(value));
            } else {
                std::cerr << "Unknown streamlines parameter: " << param << "\n";
                return false;
            }
        } else if (section == "acceleration") {
            if (param == "hash_divisions") {
                acceleration.hash_divisions = std::stoi(value);
            } else if (param == "hash_radius") {
                acceleration.hash_radius = std::stoi(value);
            } else if (param == "monte_carlo_samples") {
                acceleration.monte_carlo_samples = std::stoi(value);
            } else if (param == "importance_grid") {
                acceleration.importance_grid = std::stoi(value);
            } else if (param == "basis_functions") {
                acceleration.basis_functions = std::stoi(value);
            } else if (param == "rbf_radius") {
                acceleration.rbf_radius = std::stod(value);
            } else if (param == "rbf_width") {
                acceleration.rbf_width = std::stod(value);
            } else if (param == "fit_samples") {
                acceleration.fit_samples = std::stoi(value);
            } else if (param == "cache_block") {
                acceleration.cache_block = std::stoi(value);
            } else if (param == "cache_expiry_ms") {
                acceleration.cache_expiry_ms = std::stoi(value);
            } else if (param == "seed") {
                acceleration.seed = static_cast<unsigned>(std::stoul(value));
            } else {
                std::cerr << "Unknown acceleration parameter: " << param << "\n";
                return false;
            }
        } else if (section == "sweep") {
            if (param == "b_min") {
                sweep.b_min = std::stod(value);
            } else if (param == "b_max") {
                sweep.b_max = std::stod(value);
            } else if (param == "b_step") {
                sweep.b_step = std::stod(value);
            } else if (param == "steps") {
                sweep.steps = std::stoi(value);
            } else if (param == "skip_transient") {
                sweep.skip_transient = std::stoi(value);
            } else {
                std::cerr << "Unknown sweep parameter: " << param << "\n";
                return false;
            }
        } else if (section == "output") {
            if (param == "json_path") {
                output.json_path = value;
            } else if (param == "verbose") {
                output.verbose = (value == "true" || value == "1");
            } else {
                std::cerr << "Unknown output parameter: " << param << "\n";
                return false;
            }
        } else {
            std::cerr << "Unknown section: " << section << "\n";
            return false;
        }
    } catch (std::exception const& e) {
        std::cerr << "Invalid value for " << key << ": " << value << " (" << e.what() << ")\n";
        return false;
    }

    return true;
}

void Config::save(std::string const& path) const {
    std::ofstream file(path);
    if (!file) {
        std::cerr << "Error: Could not open " << path << " for writing\n";
        return;
    }

    file << std::setprecision(10);

    file << "[model]\n";
    file << "b = " << model.b << "\n";
    file << "dt = " << model.dt << "\n";
    file << "seed = [" << model.seed[0] << ", " << model.seed[1] << ", " << model.seed[2]
         << "]\n";
    file << "steps = " << model.steps << "\n";
    file << "transient_steps = " << model.transient_steps << "\n";
    file << "\n";

    file << "[trajectory]\n";
    file << "recent_capacity = " << trajectory.recent_capacity << "\n";
    file << "analysis_capacity = " << trajectory.analysis_capacity << "\n";
    file << "\n";

    file << "[lyapunov]\n";
    file << "steps = " << lyapunov.steps << "\n";
    file << "skip_transient = " << lyapunov.skip_transient << "\n";
    file << "qr_interval = " << lyapunov.qr_interval << "\n";
    file << "ftle_window = " << lyapunov.ftle_window << "\n";
    file << "convergence_interval = " << lyapunov.convergence_interval << "\n";
    file << "convergence_tolerance = " << lyapunov.convergence_tolerance << "\n";
    file << "quick_window = " << lyapunov.quick_window << "\n";
    file << "quick_cache_ms = " << lyapunov.quick_cache_ms << "\n";
    file << "metric_steps = " << lyapunov.metric_steps << "\n";
    file << "metric_skip_transient = " << lyapunov.metric_skip_transient << "\n";
    file << "\n";

    file << "[field]\n";
    file << "resolution = " << field.resolution << "\n";
    file << "half_range = " << field.half_range << "\n";
    file << "kernel_bandwidth = " << field.kernel_bandwidth << "\n";
    file << "min_density = " << field.min_density << "\n";
    file << "critical_threshold = " << field.critical_threshold << "\n";
    file << "velocity_mode = \"" << enum_utils::toString(field.velocity_mode) << "\"\n";
    file << "density_method = \"" << enum_utils::toString(field.density_method) << "\"\n";
    file << "exact_budget = " << field.exact_budget << "\n";
    file << "local_lyapunov_dt = " << field.local_lyapunov_dt << "\n";
    file << "local_lyapunov_iterations = " << field.local_lyapunov_iterations << "\n";
    file << "escape_bound = " << field.escape_bound << "\n";
    file << "\n";

    file << "[streamlines]\n";
    file << "count = " << streamlines.count << "\n";
    file << "max_points = " << streamlines.max_points << "\n";
    file << "min_points = " << streamlines.min_points << "\n";
    file << "min_step = " << streamlines.min_step << "\n";
    file << "max_step = " << streamlines.max_step << "\n";
    file << "tolerance = " << streamlines.tolerance << "\n";
    file << "seed = " << streamlines.seed << "\n";
    file << "\n";

    file << "[acceleration]\n";
    file << "hash_divisions = " << acceleration.hash_divisions << "\n";
    file << "hash_radius = " << acceleration.hash_radius << "\n";
    file << "monte_carlo_samples = " << acceleration.monte_carlo_samples << "\n";
    file << "importance_grid = " << acceleration.importance_grid << "\n";
    file << "basis_functions = " << acceleration.basis_functions << "\n";
    file << "rbf_radius = " << acceleration.rbf_radius << "\n";
    file << "rbf_width = " << acceleration.rbf_width << "\n";
    file << "fit_samples = " << acceleration.fit_samples << "\n";
    file << "cache_block = " << acceleration.cache_block << "\n";
    file << "cache_expiry_ms = " << acceleration.cache_expiry_ms << "\n";
    file << "torus_radius = " << acceleration.torus_radius << "\n";
    file << "tube_radius = " << acceleration.tube_radius << "\n";
    file << "seed = " << acceleration.seed << "\n";
    file << "\n";

    file << "[sweep]\n";
    file << "b_min = " << sweep.b_min << "\n";
    file << "b_max = " << sweep.b_max << "\n";
    file << "b_step = " << sweep.b_step << "\n";
    file << "steps = " << sweep.steps << "\n";
    file << "skip_transient = " << sweep.skip_transient << "\n";
    for (auto const& zone : sweep.refinement) {
        file << "\n[[sweep.refinement]]\n";
        file << "min = " << zone.min << "\n";
        file << "max = " << zone.max << "\n";
        file << "step = " << zone.step << "\n";
    }
    file << "\n";

    file << "[output]\n";
    file << "json_path = \"" << output.json_path << "\"\n";
    file << "verbose = " << (output.verbose ? "true" : "false") << "\n";
}
