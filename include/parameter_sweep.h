#pragma once

#include "chaos/chaos_metric.h"
#include "chaos/lyapunov.h"
#include "config.h"

#include <array>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <vector>

using ProgressCallback = std::function<void(int, int)>;

struct SweepPoint {
    double b = 0.0;
    chaos::LyapunovSpectrum spectrum;
    chaos::ChaosMetric metric;
    double elapsed_ms = 0.0;

    nlohmann::json toJSON() const;
};

struct SweepSummary {
    int points = 0;
    double max_ctm = 0.0;
    double max_ctm_b = 0.0;
    double max_lambda1 = 0.0;
    double max_lambda1_b = 0.0;
    std::optional<double> chaos_boundary; // Largest b with lambda1 > 0
    std::array<int, 5> regime_counts{};   // Indexed by chaos::ChaosRegime
    double total_ms = 0.0;

    nlohmann::json toJSON() const;
};

// Spectrum and chaos metric across a range of b, with finer sampling inside
// refinement zones. Each point starts from the configured seed.
class ParameterSweep {
public:
    explicit ParameterSweep(Config const& config);

    // Base grid merged with every refinement zone, sorted and de-duplicated
    std::vector<double> parameterGrid() const;

    SweepPoint computePoint(double b) const;

    std::vector<SweepPoint> run(ProgressCallback progress = nullptr) const;

    static SweepSummary summarize(std::vector<SweepPoint> const& points);

    static nlohmann::json toJSON(std::vector<SweepPoint> const& points,
                                 SweepSummary const& summary);

private:
    SweepParams params_;
    ModelParams model_;
    LyapunovParams lyapunov_;
};
