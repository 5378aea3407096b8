#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace chaos {

enum class ChaosRegime { Regular, WeakChaos, ModerateChaos, StrongChaos, Hyperchaos };

// Composite chaos metric (CTM) combining predictability loss and geometric
// complexity of the attractor.
struct ChaosMetric {
    double ctm = 0.0;
    double unpredictability = 0.0; // 1 - exp(-lambda1 / 3b), 0 when lambda1 <= 0
    double complexity = 0.0;       // Kaplan-Yorke dimension above 2, clamped to [0,1]
    double lambda1 = 0.0;
    double kaplan_yorke = 0.0;
    double b = 0.0;
    ChaosRegime regime = ChaosRegime::Regular;

    nlohmann::json toJSON() const;
};

ChaosMetric computeChaosMetric(double lambda1, double kaplan_yorke, double b);

// Regime bands on lambda1: <= 0 regular, then 0.05 / 0.15 / 0.25 thresholds
ChaosRegime classifyRegime(double lambda1);

} // namespace chaos
