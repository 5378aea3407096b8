#pragma once

#include "vec3.h"

#include <string>
#include <vector>

struct ModelParams {
    double b = 0.19;
    double dt = 0.01;
    Vec3 seed = {0.1, 0.0, 0.0};
    int steps = 20000;       // Trajectory length of a command-line run
    int transient_steps = 0; // Steps discarded after every reset
};

struct TrajectoryParams {
    int recent_capacity = 1000;    // Ring read by the quick Lyapunov estimator
    int analysis_capacity = 10000; // Ring folded by spatial field passes
};

struct LyapunovParams {
    int steps = 10000;
    int skip_transient = 1000;
    int qr_interval = 1; // Re-orthonormalize every N steps

    // Finite-time windows for the confidence interval
    int ftle_window = 100;

    // Running-estimate checkpoints for the convergence test
    int convergence_interval = 1000;
    double convergence_tolerance = 1e-3;

    // Quick estimator
    int quick_window = 100;
    int quick_cache_ms = 1000;

    // Short spectrum used by the chaos metric when no current spectrum exists
    int metric_steps = 1000;
    int metric_skip_transient = 100;
};

// How the velocity grid is populated
enum class VelocityMode {
    Analytic, // Closed-form flow evaluated at cell centers
    Sampled   // Distance-weighted average of nearby trajectory velocities
};

// How the smooth density grid is populated
enum class DensityMethod {
    Exact,      // Full Gaussian KDE sum over every stored sample
    Stochastic, // Monte Carlo + radial basis function approximation
    Auto        // Exact unless cells * samples exceeds exact_budget
};

struct FieldParams {
    int resolution = 32;
    double half_range = 10.0;
    double kernel_bandwidth = 0.3;
    double min_density = 1e-6;
    double critical_threshold = 0.01;
    VelocityMode velocity_mode = VelocityMode::Analytic;
    DensityMethod density_method = DensityMethod::Auto;
    double exact_budget = 5e7;

    // Local expansion probes
    double local_lyapunov_dt = 0.01;
    int local_lyapunov_iterations = 200;
    double escape_bound = 50.0;

    double cellSize() const { return 2.0 * half_range / resolution; }
    int cellCount() const { return resolution * resolution * resolution; }
};

struct StreamlineParams {
    int count = 20;
    int max_points = 200;
    int min_points = 10; // Shorter lines are discarded
    double min_step = 0.01;
    double max_step = 0.1;
    double tolerance = 1e-6;
    unsigned seed = 42;
};

struct AccelerationParams {
    // Spatial hash
    int hash_divisions = 8; // Coarse buckets per axis
    int hash_radius = 1;    // Neighbor block radius in buckets

    // Stochastic / RBF path
    int monte_carlo_samples = 2000;
    int importance_grid = 16;
    int basis_functions = 12;
    double rbf_radius = 8.0;
    double rbf_width = 2.0;
    int fit_samples = 1000;
    int cache_block = 4; // Grid cells per cached coarse cell (per axis)
    int cache_expiry_ms = 5000;
    double torus_radius = 5.0;
    double tube_radius = 2.0;
    unsigned seed = 7;
};

struct RefinementZone {
    double min = 0.0;
    double max = 0.0;
    double step = 0.001;
};

struct SweepParams {
    double b_min = 0.10;
    double b_max = 0.40;
    double b_step = 0.01;
    int steps = 5000;
    int skip_transient = 500;
    std::vector<RefinementZone> refinement = {{0.17, 0.21, 0.001}};
};

struct OutputParams {
    std::string json_path; // Empty = no report file
    bool verbose = false;
};

struct Config {
    ModelParams model;
    TrajectoryParams trajectory;
    LyapunovParams lyapunov;
    FieldParams field;
    StreamlineParams streamlines;
    AccelerationParams acceleration;
    SweepParams sweep;
    OutputParams output;

    // Name of the preset applied on top of the file (display only)
    std::string preset_name;

    // Load from TOML file
    static Config load(std::string const& path);

    // Load with defaults
    static Config defaults();

    // Save to TOML file
    void save(std::string const& path) const;

    // Replace out-of-range values with defaults, one warning each.
    // Returns true when nothing had to be replaced.
    bool validate();

    // Apply a parameter override from CLI (e.g., "model.b", "0.2").
    // Returns false, leaving the config unchanged, for an unknown key, an
    // unparsable value or a value that fails validate()
    bool applyOverride(std::string const& key, std::string const& value);

private:
    bool assignOverride(std::string const& key, std::string const& value);
};
