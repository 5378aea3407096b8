#include "chaos/chaos_metric.h"
#include "enum_utils.h"

#include <algorithm>
#include <cmath>

namespace chaos {

ChaosRegime classifyRegime(double lambda1) {
    if (lambda1 <= 0.0) {
        return ChaosRegime::Regular;
    }
    if (lambda1 < 0.05) {
        return ChaosRegime::WeakChaos;
    }
    if (lambda1 < 0.15) {
        return ChaosRegime::ModerateChaos;
    }
    if (lambda1 < 0.25) {
        return ChaosRegime::StrongChaos;
    }
    return ChaosRegime::Hyperchaos;
}

ChaosMetric computeChaosMetric(double lambda1, double kaplan_yorke, double b) {
    ChaosMetric m;
    m.lambda1 = lambda1;
    m.kaplan_yorke = kaplan_yorke;
    m.b = b;

    if (lambda1 > 0.0 && b > 0.0) {
        m.unpredictability = 1.0 - std::exp(-lambda1 / (3.0 * b));
    }
    m.complexity = std::clamp(kaplan_yorke - 2.0, 0.0, 1.0);
    m.ctm = std::sqrt(m.unpredictability * m.complexity);
    m.regime = classifyRegime(lambda1);
    return m;
}

nlohmann::json ChaosMetric::toJSON() const {
    nlohmann::json j;
    j["ctm"] = ctm;
    j["unpredictability"] = unpredictability;
    j["complexity"] = complexity;
    j["lambda1"] = lambda1;
    j["kaplan_yorke"] = kaplan_yorke;
    j["b"] = b;
    j["regime"] = enum_utils::toString(regime);
    return j;
}

} // namespace chaos
