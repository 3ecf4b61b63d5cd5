#include "bimetal/misfit.hpp"
#include "bimetal/errors.hpp"

namespace bimetal {

AveragingConvention averaging_from_int(int avgc) {
    switch (avgc) {
        case 1: return AveragingConvention::REFERENCE_REGION;
        case 2: return AveragingConvention::AREA_WEIGHTED_OWN;
        case 3: return AveragingConvention::AREA_WEIGHTED_AVERAGE;
        default:
            throw ConfigurationError("Averaging convention must be 1, 2 or 3, got " +
                                     std::to_string(avgc));
    }
}

MisfitStrain lattice_mismatch(AveragingConvention avgc,
                              const std::array<double, 2>& weights,
                              const std::array<double, 2>& lattice) {
    for (int i = 0; i < 2; i++) {
        if (!(lattice[i] > 0.0)) {
            throw ConfigurationError("Lattice constant of region " + std::to_string(i + 1) +
                                     " must be positive");
        }
        if (!(weights[i] > 0.0)) {
            throw GeometryInconsistency("Averaging weight of region " + std::to_string(i + 1) +
                                        " must be positive");
        }
    }

    double lc_avg = (lattice[0] * weights[0] + lattice[1] * weights[1]) /
                    (weights[0] + weights[1]);

    MisfitStrain m;
    for (int i = 0; i < 2; i++) {
        double alpha = 0.0;
        switch (avgc) {
            case AveragingConvention::REFERENCE_REGION:
                alpha = (lattice[i] - lattice[0]) / lattice[0];
                break;
            case AveragingConvention::AREA_WEIGHTED_OWN:
                alpha = (lattice[i] - lc_avg) / lattice[i];
                break;
            case AveragingConvention::AREA_WEIGHTED_AVERAGE:
                alpha = (lattice[i] - lc_avg) / lc_avg;
                break;
            default:
                throw ConfigurationError("Unsupported averaging convention value: " +
                                         std::to_string(static_cast<int>(avgc)));
        }
        m.mismatch[i] = alpha;
        m.eigenstrain[i] = alpha * (1.0 + alpha / 2.0);
    }
    return m;
}

MisfitStrain lattice_mismatch(int avgc,
                              const std::array<double, 2>& weights,
                              const std::array<double, 2>& lattice) {
    return lattice_mismatch(averaging_from_int(avgc), weights, lattice);
}

MisfitStrain misfit_for_geometry(AveragingConvention avgc,
                                 const BimetalGeometry& geometry,
                                 const std::array<double, 2>& lattice) {
    geometry.validate();
    return lattice_mismatch(avgc, geometry.region_areas(), lattice);
}

}  // namespace bimetal
