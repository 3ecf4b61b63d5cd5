#include "bimetal/geometry.hpp"
#include "bimetal/errors.hpp"

namespace bimetal {

BimetalGeometry::BimetalGeometry(std::vector<double> scale_in, double material_border_in)
    : scale(std::move(scale_in)), material_border(material_border_in) {
    validate();
}

std::array<double, 2> BimetalGeometry::region_thickness() const {
    return {scale.at(0) * material_border, scale.at(0) * (1.0 - material_border)};
}

std::array<double, 2> BimetalGeometry::region_areas() const {
    auto h = region_thickness();
    double d = depth();
    return {h[0] * d, h[1] * d};
}

void BimetalGeometry::validate() const {
    if (scale.size() != 2 && scale.size() != 3) {
        throw GeometryInconsistency("Geometry scale must have 2 or 3 entries, got " +
                                    std::to_string(scale.size()));
    }
    for (size_t i = 0; i < scale.size(); i++) {
        if (!(scale[i] > 0.0)) {
            throw GeometryInconsistency("Geometry scale[" + std::to_string(i) +
                                        "] must be positive");
        }
    }
    if (!(material_border > 0.0 && material_border < 1.0)) {
        throw GeometryInconsistency("Material border must lie strictly inside (0, 1), got " +
                                    std::to_string(material_border));
    }
}

void BimetalGeometry::validate_order(int order) const {
    if (order < 1) {
        throw ConfigurationError("Discretization order must be at least 1, got " +
                                 std::to_string(order));
    }
    int max_order = (dimension() == 2) ? 3 : 2;
    if (order > max_order) {
        throw GeometryInconsistency("Discretization order " + std::to_string(order) +
                                    " is not available in " + std::to_string(dimension()) +
                                    "D (maximum " + std::to_string(max_order) + ")");
    }
}

}  // namespace bimetal
