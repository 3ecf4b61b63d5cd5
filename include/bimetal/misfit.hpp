#pragma once

#include "bimetal/common.hpp"
#include "bimetal/geometry.hpp"

namespace bimetal {

enum class AveragingConvention {
    REFERENCE_REGION = 1,       // alpha_i = (lc_i - lc_1) / lc_1
    AREA_WEIGHTED_OWN = 2,      // alpha_i = (lc_i - lc_avg) / lc_i
    AREA_WEIGHTED_AVERAGE = 3   // alpha_i = (lc_i - lc_avg) / lc_avg
};

// Throws ConfigurationError for values outside 1..3
AveragingConvention averaging_from_int(int avgc);

// Per region: mismatch alpha_i and eigenstrain eps0_i = alpha_i * (1 + alpha_i / 2)
struct MisfitStrain {
    std::array<double, 2> eigenstrain = {0.0, 0.0};
    std::array<double, 2> mismatch = {0.0, 0.0};
};

// lc_avg = (lc_1 A_1 + lc_2 A_2) / (A_1 + A_2)
MisfitStrain lattice_mismatch(AveragingConvention avgc,
                              const std::array<double, 2>& weights,
                              const std::array<double, 2>& lattice);

MisfitStrain lattice_mismatch(int avgc,
                              const std::array<double, 2>& weights,
                              const std::array<double, 2>& lattice);

// Weights taken from the region cross-sections of the geometry
MisfitStrain misfit_for_geometry(AveragingConvention avgc,
                                 const BimetalGeometry& geometry,
                                 const std::array<double, 2>& lattice);

}  // namespace bimetal
