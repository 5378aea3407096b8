#pragma once

#include "config.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

// Named model setup: parameter, integration and the published reference
// largest exponent used to sanity-check a run
struct ModelPreset {
    std::string description;
    double b = 0.19;
    double dt = 0.01;
    int steps = 20000;
    int transient_steps = 0;
    Vec3 seed = {0.1, 0.0, 0.0};
    std::optional<double> lambda_max;
};

// Preset library loaded from TOML file ([presets.<name>] tables)
struct PresetLibrary {
    std::map<std::string, ModelPreset> presets;

    // Path to the loaded preset file (for saving back)
    std::string source_path;

    static PresetLibrary load(std::string const& path);

    bool save(std::string const& path) const;
    bool save() const { return !source_path.empty() && save(source_path); }

    void set(std::string const& name, ModelPreset const& preset) { presets[name] = preset; }

    std::optional<ModelPreset> get(std::string const& name) const {
        auto it = presets.find(name);
        return it != presets.end() ? std::optional{it->second} : std::nullopt;
    }

    // Sorted preset names
    std::vector<std::string> names() const {
        std::vector<std::string> result;
        result.reserve(presets.size());
        for (auto const& [name, _] : presets) {
            result.push_back(name);
        }
        return result;
    }

    // Copies the preset's model fields into config and records its name.
    // Returns false (config untouched) for an unknown name.
    bool apply(std::string const& name, Config& config) const;

    bool empty() const { return presets.empty(); }
};
