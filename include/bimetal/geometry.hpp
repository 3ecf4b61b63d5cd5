#pragma once

#include "bimetal/common.hpp"

namespace bimetal {

// Two-region strip. Region 1 fills [0, mb * scale[0]] of the thickness axis,
// region 2 the rest; both span the full length (and depth in 3D).
struct BimetalGeometry {
    std::vector<double> scale = {50.0, 2000.0};  // (thickness, length[, depth])
    double material_border = 0.5;                // mb in (0, 1)

    BimetalGeometry() = default;
    BimetalGeometry(std::vector<double> scale, double material_border);

    int dimension() const { return static_cast<int>(scale.size()); }
    double thickness() const { return scale.at(0); }
    double length() const { return scale.at(1); }
    double depth() const { return scale.size() > 2 ? scale[2] : 1.0; }
    double border_position() const { return material_border * scale.at(0); }

    // (h1, h2) along the thickness axis
    std::array<double, 2> region_thickness() const;

    // Cross-section measures used as averaging weights: h_i in 2D, h_i * depth in 3D
    std::array<double, 2> region_areas() const;

    // Throws GeometryInconsistency
    void validate() const;
    void validate_order(int order) const;
};

}  // namespace bimetal
