#include "field/field_snapshot.h"
#include "enum_utils.h"

namespace field {

namespace {

std::vector<double> flatten(VectorGrid const& grid) {
    std::vector<double> flat;
    flat.reserve(grid.size() * 3);
    for (Vec3 const& v : grid) {
        flat.insert(flat.end(), v.begin(), v.end());
    }
    return flat;
}

} // namespace

nlohmann::json FieldStatistics::toJSON() const {
    nlohmann::json j;
    j["entropy"] = entropy;
    j["correlation_dimension"] = correlation_dimension;
    j["information_dimension"] = information_dimension;
    j["max_density"] = max_density;
    j["mean_local_lyapunov"] = mean_local_lyapunov;
    j["sample_count"] = sample_count;
    j["mean"] = mean;
    j["covariance"] = covariance;
    return j;
}

nlohmann::json PassTiming::toJSON() const {
    return {{"density_ms", density_ms},
            {"statistics_ms", statistics_ms},
            {"velocity_ms", velocity_ms},
            {"topology_ms", topology_ms},
            {"streamline_ms", streamline_ms},
            {"local_lyapunov_ms", local_lyapunov_ms},
            {"total_ms", total_ms}};
}

nlohmann::json FieldSnapshot::toJSON(bool include_grids) const {
    nlohmann::json j;
    j["resolution"] = geometry.resolution;
    j["half_range"] = geometry.half_range;
    j["cell_size"] = geometry.cellSize();
    j["epoch"] = epoch;
    j["b"] = b;
    j["density_method"] = enum_utils::toString(density_method);
    j["velocity_mode"] = enum_utils::toString(velocity_mode);
    j["statistics"] = statistics.toJSON();
    j["topology"] = topology.toJSON();
    j["timing"] = timing.toJSON();

    nlohmann::json cps = nlohmann::json::array();
    for (auto const& cp : critical_points) {
        cps.push_back(cp.toJSON());
    }
    j["critical_points"] = cps;

    nlohmann::json lines = nlohmann::json::array();
    for (auto const& line : streamlines) {
        lines.push_back(line.toJSON());
    }
    j["streamlines"] = lines;

    if (include_grids) {
        nlohmann::json grids;
        grids["histogram_density"] = histogram_density;
        grids["kde_density"] = kde_density;
        grids["velocity"] = flatten(velocity.velocity);
        grids["velocity_magnitude"] = velocity.magnitude;
        grids["divergence"] = divergence;
        grids["vorticity"] = flatten(vorticity);
        grids["local_lyapunov"] = local_lyapunov;

        VectorGrid eigenvalues;
        eigenvalues.reserve(eigen.size());
        for (auto const& e : eigen) {
            eigenvalues.push_back(e.values);
        }
        grids["eigenvalues"] = flatten(eigenvalues);
        j["grids"] = grids;
    }
    return j;
}

} // namespace field
