#include "enum_utils.h"
#include "parameter_sweep.h"

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
    std::cout << "Thomas Attractor Parameter Sweep\n\n"
              << "Usage:\n"
              << "  " << program << " [config.toml] [options]\n\n"
              << "Options:\n"
              << "  --set <key>=<value>    Override config parameter (can be used multiple times)\n"
              << "  --json <path>          Write the sweep report to path\n"
              << "  --quiet                Suppress the per-point table\n\n"
              << "Examples:\n"
              << "  " << program << " config/sweep.toml\n"
              << "  " << program << " config/sweep.toml --set sweep.b_step=0.02\n";
}

int main(int argc, char* argv[]) {
    std::string config_path = "config/sweep.toml";
    std::vector<std::pair<std::string, std::string>> overrides;
    std::optional<std::string> json_path;
    bool quiet = false;

    for (int i = 1; i < argc; ++i) {
        std::string opt = argv[i];
        if (opt == "-h" || opt == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (opt == "--set" && i + 1 < argc) {
            std::string arg = argv[++i];
            auto eq_pos = arg.find('=');
            if (eq_pos == std::string::npos) {
                std::cerr << "Invalid --set argument (missing '='): " << arg << "\n";
                return 1;
            }
            overrides.emplace_back(arg.substr(0, eq_pos), arg.substr(eq_pos + 1));
        } else if (opt == "--json" && i + 1 < argc) {
            json_path = argv[++i];
        } else if (opt == "--quiet") {
            quiet = true;
        } else if (!opt.empty() && opt[0] != '-') {
            config_path = opt;
        } else {
            std::cerr << "Unknown option: " << opt << "\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    try {
        std::cout << "Loading config from: " << config_path << "\n";
        Config config = Config::load(config_path);
        for (auto const& [key, value] : overrides) {
            if (!config.applyOverride(key, value)) {
                return 1;
            }
            std::cout << "Override: " << key << " = " << value << "\n";
        }
        if (json_path) {
            config.output.json_path = *json_path;
        }
        config.validate();

        ParameterSweep sweep(config);
        auto grid = sweep.parameterGrid();
        std::cout << "\n=== Parameter Sweep ===\n\n"
                  << "Range:            b in [" << config.sweep.b_min << ", " << config.sweep.b_max
                  << "] step " << config.sweep.b_step << "\n"
                  << "Refinement zones: " << config.sweep.refinement.size() << "\n"
                  << "Points:           " << grid.size() << "\n"
                  << "Steps per point:  " << config.sweep.steps << " (skip "
                  << config.sweep.skip_transient << ")\n\n";

        auto points = sweep.run([&](int done, int total) {
            std::cout << "\r  Progress: " << done << "/" << total << std::flush;
        });
        std::cout << "\n\n";

        if (!quiet) {
            std::cout << std::fixed << std::setprecision(4);
            std::cout << "      b    lambda1    lambda2    lambda3     D_KY     CTM  regime\n";
            for (auto const& p : points) {
                auto const& e = p.spectrum.exponents;
                std::cout << "  " << p.b << std::setw(11) << e[0] << std::setw(11) << e[1]
                          << std::setw(11) << e[2] << std::setw(9) << p.spectrum.kaplan_yorke
                          << std::setw(8) << p.metric.ctm << "  "
                          << enum_utils::toString(p.metric.regime) << "\n";
            }
            std::cout << "\n";
        }

        SweepSummary summary = ParameterSweep::summarize(points);
        std::cout << "Max CTM:          " << summary.max_ctm << " at b=" << summary.max_ctm_b << "\n"
                  << "Max lambda1:      " << summary.max_lambda1 << " at b="
                  << summary.max_lambda1_b << "\n";
        if (summary.chaos_boundary) {
            std::cout << "Chaos boundary:   b=" << *summary.chaos_boundary << "\n";
        }
        std::cout << "Total time:       " << std::setprecision(1) << summary.total_ms / 1000.0
                  << " s\n";

        if (!config.output.json_path.empty()) {
            std::filesystem::path out(config.output.json_path);
            if (out.has_parent_path()) {
                std::filesystem::create_directories(out.parent_path());
            }
            std::ofstream file(out);
            if (!file) {
                throw std::runtime_error("Failed to open report for writing: " +
                                         config.output.json_path);
            }
            file << ParameterSweep::toJSON(points, summary).dump(2) << "\n";
            std::cout << "Report written to: " << config.output.json_path << "\n";
        }
        return 0;
    } catch (std::exception const& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
