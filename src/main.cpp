#include "attractor_engine.h"
#include "enum_utils.h"
#include "preset_library.h"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

void printUsage(char const* program) {
    std::cout << "Thomas Attractor Analysis\n\n"
              << "Usage:\n"
              << "  " << program << " [config.toml] [options]  Run trajectory and chaos analysis\n"
              << "  " << program << " -h, --help              Show this help\n\n"
              << "Options:\n"
              << "  --set <key>=<value>    Override config parameter (can be used multiple times)\n"
              << "  --preset <name>        Apply a model preset before overrides\n"
              << "  --presets <path>       Preset file (default: config/presets.toml)\n"
              << "  --list-presets         List available presets and exit\n"
              << "  --steps <n>            Trajectory steps (overrides model.steps)\n"
              << "  --field                Run a spatial field pass over the trajectory\n"
              << "  --grids                Include full field grids in the JSON report\n"
              << "  --json <path>          Write the JSON report to path\n"
              << "  --verbose              Print per-stage progress\n\n"
              << "Parameter keys use dot notation: section.parameter\n"
              << "  Sections: model, trajectory, lyapunov, field, streamlines, acceleration,\n"
              << "            sweep, output\n\n"
              << "Examples:\n"
              << "  " << program << " config/default.toml\n"
              << "  " << program << " config/default.toml --preset chaos_edge --field\n"
              << "  " << program << " config/default.toml --set model.b=0.21 --json out.json\n";
}

// Parsed command-line options
struct CLIOptions {
    std::string config_path = "config/default.toml";
    std::string presets_path = "config/presets.toml";
    std::optional<std::string> preset;
    std::vector<std::pair<std::string, std::string>> overrides;
    std::optional<int> steps;
    std::optional<std::string> json_path;
    bool list_presets = false;
    bool field = false;
    bool grids = false;
    bool verbose = false;
};

// Parse --set key=value argument
std::optional<std::pair<std::string, std::string>> parseSetArg(std::string const& arg) {
    auto eq_pos = arg.find('=');
    if (eq_pos == std::string::npos) {
        std::cerr << "Invalid --set argument (missing '='): " << arg << "\n";
        return std::nullopt;
    }
    return std::make_pair(arg.substr(0, eq_pos), arg.substr(eq_pos + 1));
}

int listPresets(std::string const& path) {
    PresetLibrary lib = PresetLibrary::load(path);
    if (lib.empty()) {
        std::cerr << "No presets found in " << path << "\n";
        return 1;
    }
    std::cout << "Presets (" << path << "):\n";
    for (auto const& name : lib.names()) {
        auto const& preset = lib.presets.at(name);
        std::cout << "  " << std::left << std::setw(18) << name << std::right << "b=" << preset.b;
        if (preset.lambda_max) {
            std::cout << "  lambda_max=" << *preset.lambda_max;
        }
        if (!preset.description.empty()) {
            std::cout << "  " << preset.description;
        }
        std::cout << "\n";
    }
    return 0;
}

void printSummary(Config const& config, bool field) {
    std::cout << "\n=== Thomas Attractor ===\n\n";
    if (!config.preset_name.empty()) {
        std::cout << "Preset:           " << config.preset_name << "\n";
    }
    std::cout << "Model:\n"
              << "  b:              " << config.model.b << "\n"
              << "  dt:             " << config.model.dt << "\n"
              << "  Seed:           (" << config.model.seed[0] << ", " << config.model.seed[1]
              << ", " << config.model.seed[2] << ")\n"
              << "  Steps:          " << config.model.steps << " (+" << config.model.transient_steps
              << " transient)\n\n";

    std::cout << "Lyapunov:\n"
              << "  Steps:          " << config.lyapunov.steps << " (skip "
              << config.lyapunov.skip_transient << ")\n"
              << "  FTLE window:    " << config.lyapunov.ftle_window << "\n\n";

    if (field) {
        std::cout << "Field:\n"
                  << "  Grid:           " << config.field.resolution << "^3 over +/- "
                  << config.field.half_range << "\n"
                  << "  Velocity:       " << enum_utils::toString(config.field.velocity_mode) << "\n"
                  << "  Density:        " << enum_utils::toString(config.field.density_method)
                  << "\n\n";
    }
}

void writeReport(nlohmann::json const& report, std::string const& path) {
    std::filesystem::path out(path);
    if (out.has_parent_path()) {
        std::filesystem::create_directories(out.parent_path());
    }
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open report for writing: " + path);
    }
    file << report.dump(2) << "\n";
    std::cout << "Report written to: " << path << "\n";
}

int run(CLIOptions const& opts) {
    std::cout << "Loading config from: " << opts.config_path << "\n";
    Config config = Config::load(opts.config_path);

    std::optional<ModelPreset> preset;
    if (opts.preset) {
        PresetLibrary lib = PresetLibrary::load(opts.presets_path);
        if (!lib.apply(*opts.preset, config)) {
            return 1;
        }
        preset = lib.get(*opts.preset);
        std::cout << "Preset: " << *opts.preset << "\n";
    }

    for (auto const& [key, value] : opts.overrides) {
        if (!config.applyOverride(key, value)) {
            return 1;
        }
        std::cout << "Override: " << key << " = " << value << "\n";
    }
    if (opts.steps) {
        config.model.steps = *opts.steps;
    }
    if (opts.json_path) {
        config.output.json_path = *opts.json_path;
    }
    if (opts.verbose) {
        config.output.verbose = true;
    }
    config.validate();

    printSummary(config, opts.field);

    AttractorEngine engine(config);
    std::vector<Vec3> positions = engine.step(config.model.steps);
    Vec3 const& s = engine.state();
    std::cout << std::fixed << std::setprecision(4) << "Final state:      (" << s[0] << ", "
              << s[1] << ", " << s[2] << ")\n";

    auto spectrum = engine.computeLyapunovSpectrum();
    auto metric = engine.computeChaosMetric();
    double quick = engine.quickLyapunov();

    std::cout << "Spectrum:         [" << spectrum.exponents[0] << ", " << spectrum.exponents[1]
              << ", " << spectrum.exponents[2] << "]\n"
              << "Sum:              " << spectrum.sum << " (expected " << spectrum.expected_sum
              << ")\n"
              << "Kaplan-Yorke:     " << spectrum.kaplan_yorke << "\n";
    if (spectrum.lambda1_interval) {
        std::cout << "lambda1 95% CI:   [" << spectrum.lambda1_interval->lower << ", "
                  << spectrum.lambda1_interval->upper << "]\n";
    }
    std::cout << "Converged:        " << (spectrum.converged ? "yes" : "no") << "\n"
              << "Quick estimate:   " << quick << "\n"
              << "Chaos metric:     " << metric.ctm << " ("
              << enum_utils::toString(metric.regime) << ")\n";

    nlohmann::json report;
    report["parameters"] = engine.getParameters().toJSON();
    if (!config.preset_name.empty()) {
        report["preset"] = config.preset_name;
    }
    report["spectrum"] = spectrum.toJSON();
    report["chaos_metric"] = metric.toJSON();
    report["quick_lyapunov"] = quick;
    report["trajectory"] = engine.recentTrajectory().statisticsJSON();

    if (preset && preset->lambda_max) {
        double reference = *preset->lambda_max;
        double deviation = spectrum.lambda1() - reference;
        std::cout << "Reference lambda: " << reference << " (deviation " << std::showpos
                  << deviation << std::noshowpos << ")\n";
        report["reference"] = {{"lambda_max", reference}, {"deviation", deviation}};
    }

    if (opts.field) {
        auto snapshot = engine.analyzeSpatialField(positions);
        auto const& stats = snapshot->statistics;
        std::cout << "\nField:\n"
                  << "  Density path:   " << enum_utils::toString(snapshot->density_method) << "\n"
                  << "  Entropy:        " << stats.entropy << " bits\n"
                  << "  D2:             " << stats.correlation_dimension << "\n"
                  << "  D1:             " << stats.information_dimension << "\n"
                  << "  Critical pts:   " << snapshot->topology.total() << " (chi="
                  << snapshot->topology.euler_characteristic << ")\n"
                  << "  Streamlines:    " << snapshot->streamlines.size() << "\n"
                  << "  Pass time:      " << std::setprecision(1) << snapshot->timing.total_ms
                  << " ms\n";
        report["field"] = snapshot->toJSON(opts.grids);
    }

    if (!config.output.json_path.empty()) {
        writeReport(report, config.output.json_path);
    }
    return 0;
}

int parseArgs(int argc, char* argv[], CLIOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string opt = argv[i];
        if (opt == "-h" || opt == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (opt == "--set" && i + 1 < argc) {
            auto parsed = parseSetArg(argv[++i]);
            if (!parsed) return 1;
            opts.overrides.push_back(*parsed);
        } else if (opt == "--preset" && i + 1 < argc) {
            opts.preset = argv[++i];
        } else if (opt == "--presets" && i + 1 < argc) {
            opts.presets_path = argv[++i];
        } else if (opt == "--list-presets") {
            opts.list_presets = true;
        } else if (opt == "--steps" && i + 1 < argc) {
            opts.steps = std::stoi(argv[++i]);
        } else if (opt == "--json" && i + 1 < argc) {
            opts.json_path = argv[++i];
        } else if (opt == "--field") {
            opts.field = true;
        } else if (opt == "--grids") {
            opts.grids = true;
        } else if (opt == "--verbose") {
            opts.verbose = true;
        } else if (!opt.empty() && opt[0] != '-') {
            opts.config_path = opt;
        } else {
            std::cerr << "Unknown option: " << opt << "\n";
            printUsage(argv[0]);
            return 1;
        }
    }
    return -1;
}

int main(int argc, char* argv[]) {
    try {
        CLIOptions opts;
        // Non-negative result means exit immediately (help or bad argument)
        if (int status = parseArgs(argc, argv, opts); status >= 0) {
            return status;
        }
        if (opts.list_presets) {
            return listPresets(opts.presets_path);
        }
        return run(opts);
    } catch (std::exception const& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
