#include "preset_library.h"

#include <fstream>
#include <iostream>
#include <toml++/toml.hpp>

namespace {

ModelPreset parsePreset(toml::table const& tbl) {
    ModelPreset preset;
    preset.description = tbl["description"].value_or(std::string{});
    preset.b = tbl["b"].value_or(preset.b);
    preset.dt = tbl["dt"].value_or(preset.dt);
    preset.steps = tbl["steps"].value_or(preset.steps);
    preset.transient_steps = tbl["transient_steps"].value_or(preset.transient_steps);

    if (auto arr = tbl["seed"].as_array(); arr && arr->size() == 3) {
        for (size_t i = 0; i < 3; ++i) {
            preset.seed[i] = (*arr)[i].value_or(preset.seed[i]);
        }
    } else if (arr) {
        std::cerr << "Warning: preset seed must have 3 components, using default\n";
    }

    if (auto lambda = tbl["lambda_max"].value<double>()) {
        preset.lambda_max = *lambda;
    }
    return preset;
}

} // namespace

PresetLibrary PresetLibrary::load(std::string const& path) {
    PresetLibrary lib;
    lib.source_path = path;

    try {
        auto tbl = toml::parse_file(path);

        if (auto preset_tbl = tbl["presets"].as_table()) {
            for (auto const& [name, node] : *preset_tbl) {
                auto preset = node.as_table();
                if (!preset) {
                    continue;
                }
                ModelPreset parsed = parsePreset(*preset);
                if (!(parsed.b > 0.0) || !(parsed.dt > 0.0)) {
                    std::cerr << "Warning: Preset '" << name
                              << "' has non-positive b or dt, skipping\n";
                    continue;
                }
                lib.presets[std::string(name.str())] = parsed;
            }
        }
    } catch (toml::parse_error const& err) {
        std::cerr << "Error parsing preset library: " << err.description() << "\n";
    }

    return lib;
}

bool PresetLibrary::apply(std::string const& name, Config& config) const {
    auto preset = get(name);
    if (!preset) {
        std::cerr << "Unknown preset: " << name << "\n";
        return false;
    }
    config.model.b = preset->b;
    config.model.dt = preset->dt;
    config.model.steps = preset->steps;
    config.model.transient_steps = preset->transient_steps;
    config.model.seed = preset->seed;
    config.preset_name = name;
    return true;
}

bool PresetLibrary::save(std::string const& path) const {
    std::ofstream file(path);
    if (!file) {
        std::cerr << "Failed to open preset file for writing: " << path << "\n";
        return false;
    }

    file << "# Model Presets\n";
    file << "# lambda_max is the reference largest exponent for the preset's b\n\n";

    for (auto const& [name, preset] : presets) {
        file << "[presets." << name << "]\n";
        if (!preset.description.empty()) {
            file << "description = \"" << preset.description << "\"\n";
        }
        file << "b = " << preset.b << "\n";
        file << "dt = " << preset.dt << "\n";
        file << "steps = " << preset.steps << "\n";
        file << "transient_steps = " << preset.transient_steps << "\n";
        file << "seed = [" << preset.seed[0] << ", " << preset.seed[1] << ", " << preset.seed[2]
             << "]\n";
        if (preset.lambda_max) {
            file << "lambda_max = " << *preset.lambda_max << "\n";
        }
        file << "\n";
    }

    return true;
}
