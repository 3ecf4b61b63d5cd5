#include "bimetal/statistics.hpp"
#include "bimetal/errors.hpp"
#include <algorithm>

namespace bimetal {

namespace {

struct FaceSample {
    double reference;      // reference length coordinate
    Eigen::Vector2d mean;  // mean position (thickness, length)
};

// Face nodes grouped by reference length coordinate, positions averaged per group
std::vector<FaceSample> face_profile(const Mesh& mesh, const Eigen::MatrixXd& positions,
                                     const std::string& set_name) {
    const NodeSet* ns = mesh.find_node_set(set_name);
    if (!ns || ns->node_ids.empty()) {
        throw GeometryInconsistency("Mesh has no node set '" + set_name +
                                    "' needed for the bending statistics");
    }
    std::vector<int> ids = ns->node_ids;
    std::sort(ids.begin(), ids.end(), [&](int a, int b) {
        return mesh.nodes(a, 1) < mesh.nodes(b, 1);
    });

    double extent = mesh.nodes.col(1).maxCoeff() - mesh.nodes.col(1).minCoeff();
    double tol = 1e-9 * std::max(extent, 1.0);

    std::vector<FaceSample> samples;
    size_t i = 0;
    while (i < ids.size()) {
        double y0 = mesh.nodes(ids[i], 1);
        Eigen::Vector2d sum = Eigen::Vector2d::Zero();
        int count = 0;
        while (i < ids.size() && mesh.nodes(ids[i], 1) - y0 <= tol) {
            sum += positions.row(ids[i]).head<2>().transpose();
            count++;
            i++;
        }
        samples.push_back({y0, sum / count});
    }
    return samples;
}

Eigen::Vector2d interpolate(const std::vector<FaceSample>& s, double y) {
    if (y <= s.front().reference) return s.front().mean;
    if (y >= s.back().reference) return s.back().mean;
    auto it = std::upper_bound(s.begin(), s.end(), y,
                               [](double v, const FaceSample& f) { return v < f.reference; });
    const FaceSample& hi = *it;
    const FaceSample& lo = *(it - 1);
    double w = (y - lo.reference) / (hi.reference - lo.reference);
    return (1.0 - w) * lo.mean + w * hi.mean;
}

// Columns: reference length, centreline thickness coordinate, centreline length coordinate
Eigen::MatrixXd centerline_samples(const Mesh& mesh, const Eigen::MatrixXd& positions) {
    std::vector<FaceSample> f1 = face_profile(mesh, positions, "face_region1");
    std::vector<FaceSample> f2 = face_profile(mesh, positions, "face_region2");
    Eigen::MatrixXd c(f1.size(), 3);
    for (size_t k = 0; k < f1.size(); k++) {
        Eigen::Vector2d mid = 0.5 * (f1[k].mean + interpolate(f2, f1[k].reference));
        c(k, 0) = f1[k].reference;
        c(k, 1) = mid(0);
        c(k, 2) = mid(1);
    }
    return c;
}

Eigen::Vector2d sample_at(const Eigen::MatrixXd& c, double y) {
    std::vector<FaceSample> s(c.rows());
    for (int k = 0; k < c.rows(); k++) s[k] = {c(k, 0), Eigen::Vector2d(c(k, 1), c(k, 2))};
    return interpolate(s, y);
}

int sign(double v, double tol) {
    if (v > tol) return 1;
    if (v < -tol) return -1;
    return 0;
}

}  // namespace

Eigen::MatrixXd deformed_centerline(const Mesh& mesh, const DisplacementSolution& solution) {
    return centerline_samples(mesh, solution.deformed_nodes(mesh));
}

double menger_curvature(const Eigen::Vector2d& a, const Eigen::Vector2d& b,
                        const Eigen::Vector2d& c) {
    double ab = (b - a).norm();
    double bc = (c - b).norm();
    double ca = (a - c).norm();
    double denom = ab * bc * ca;
    if (denom <= 0.0) return 0.0;
    Eigen::Vector2d u = b - a, v = c - a;
    double cross = u(0) * v(1) - u(1) * v(0);
    return 2.0 * std::abs(cross) / denom;
}

double bending_angle(double bend_distance, double curvature, int side) {
    double arg = std::min(1.0, std::max(-1.0, 0.5 * bend_distance * curvature));
    double angle = std::asin(arg) * 180.0 / PI;
    return side > 0 ? angle : 180.0 - angle;
}

BendingStatistics compute_statistics(const Mesh& mesh, const DisplacementSolution& solution,
                                     const BimetalGeometry& geometry) {
    geometry.validate();
    Eigen::MatrixXd deformed = centerline_samples(mesh, solution.deformed_nodes(mesh));
    Eigen::MatrixXd reference = centerline_samples(mesh, mesh.nodes);
    if (deformed.rows() < 2) {
        throw GeometryInconsistency("Centreline needs samples at two or more length coordinates");
    }

    BendingStatistics stats;
    stats.centerline = deformed.rightCols(2);

    const int last = static_cast<int>(deformed.rows()) - 1;
    Eigen::Vector2d clamp_end(deformed(0, 1), deformed(0, 2));
    Eigen::Vector2d free_end(deformed(last, 1), deformed(last, 2));

    stats.farthest_point = free_end;
    stats.bend_distance = (free_end - clamp_end).norm();
    stats.farthest_point_side = (free_end(1) - clamp_end(1) > 0.0) ? 1 : -1;

    double lateral = deformed(last, 1) - reference(last, 1);
    stats.bend_direction = sign(lateral, 1e-12 * geometry.length());

    double y0 = deformed(0, 0);
    double span = deformed(last, 0) - y0;
    stats.curvature = menger_curvature(sample_at(deformed, y0 + 0.2 * span),
                                       sample_at(deformed, y0 + 0.5 * span),
                                       sample_at(deformed, y0 + 0.8 * span));
    stats.angle = bending_angle(stats.bend_distance, stats.curvature, stats.farthest_point_side);
    return stats;
}

double analytic_curvature(const std::array<double, 2>& youngs_modulus,
                          const std::array<double, 2>& mismatch,
                          const BimetalGeometry& geometry) {
    geometry.validate();
    if (!(youngs_modulus[0] > 0.0) || !(youngs_modulus[1] > 0.0)) {
        throw ConfigurationError("Young's moduli must be positive");
    }
    const double a1 = mismatch[0];
    const double a2 = mismatch[1];
    const double factor = 0.5 * (a2 - a1) * (2.0 + a1 + a2);

    auto h = geometry.region_thickness();
    const double m = h[0] / h[1];
    const double n = youngs_modulus[0] / youngs_modulus[1];
    const double mp = (1.0 + m) * (1.0 + m);

    return std::abs(6.0 * factor * mp /
                    ((h[0] + h[1]) * (3.0 * mp + (1.0 + m * n) * (m * m + 1.0 / (m * n)))));
}

}  // namespace bimetal
