#pragma once

#include "bimetal/common.hpp"
#include "bimetal/mesh.hpp"
#include "bimetal/geometry.hpp"
#include "bimetal/continuation.hpp"

namespace bimetal {

struct BendingStatistics {
    double angle = 0.0;          // degrees
    double curvature = 0.0;      // 1 / length unit of the mesh
    double bend_distance = 0.0;  // chord from the clamped end to the free end
    int farthest_point_side = 1; // +1 if the free end lies beyond the clamp along the length axis
    int bend_direction = 0;      // sign of the free end's deflection along the thickness axis
    Eigen::Vector2d farthest_point = Eigen::Vector2d::Zero();  // (thickness, length), deformed
    Eigen::MatrixXd centerline;  // deformed (thickness, length) samples ordered by reference length
};

// Deformed centreline: per reference length coordinate, the mean deformed
// position on "face_region1" and on "face_region2", then their midpoint.
// Throws GeometryInconsistency if a face set is missing.
Eigen::MatrixXd deformed_centerline(const Mesh& mesh, const DisplacementSolution& solution);

BendingStatistics compute_statistics(const Mesh& mesh, const DisplacementSolution& solution,
                                     const BimetalGeometry& geometry);

// Curvature of the circle through three points, 0 for collinear points
double menger_curvature(const Eigen::Vector2d& a, const Eigen::Vector2d& b,
                        const Eigen::Vector2d& c);

// asin(bend_distance / 2 * curvature) in degrees, mirrored to 180 - angle for side -1
double bending_angle(double bend_distance, double curvature, int side);

// Closed-form bilayer curvature:
//   factor = (alpha2 - alpha1) (2 + alpha1 + alpha2) / 2
//   m = h1 / h2, n = E1 / E2
//   kappa = |6 factor (1 + m)^2 / ((h1 + h2) (3 (1 + m)^2 + (1 + m n)(m^2 + 1 / (m n))))|
double analytic_curvature(const std::array<double, 2>& youngs_modulus,
                          const std::array<double, 2>& mismatch,
                          const BimetalGeometry& geometry);

}  // namespace bimetal
