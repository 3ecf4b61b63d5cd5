#include <gtest/gtest.h>
#include "bimetal/misfit.hpp"
#include "bimetal/errors.hpp"

using namespace bimetal;

// --- Averaging conventions ---

TEST(Misfit, IdenticalLatticesGiveZeroMismatch) {
    for (int avgc = 1; avgc <= 3; avgc++) {
        MisfitStrain m = lattice_mismatch(avgc, {12.5, 37.5}, {5.65, 5.65});
        EXPECT_DOUBLE_EQ(m.mismatch[0], 0.0) << avgc;
        EXPECT_DOUBLE_EQ(m.mismatch[1], 0.0) << avgc;
        EXPECT_DOUBLE_EQ(m.eigenstrain[0], 0.0) << avgc;
        EXPECT_DOUBLE_EQ(m.eigenstrain[1], 0.0) << avgc;
    }
}

TEST(Misfit, ReferenceRegion) {
    MisfitStrain m = lattice_mismatch(AveragingConvention::REFERENCE_REGION,
                                      {1.0, 3.0}, {5.0, 5.1});
    EXPECT_DOUBLE_EQ(m.mismatch[0], 0.0);
    EXPECT_NEAR(m.mismatch[1], 0.02, 1e-15);
}

TEST(Misfit, AreaWeightedOwn) {
    // lc_avg = (5 * 1 + 5.1 * 3) / 4 = 5.075
    MisfitStrain m = lattice_mismatch(AveragingConvention::AREA_WEIGHTED_OWN,
                                      {1.0, 3.0}, {5.0, 5.1});
    EXPECT_NEAR(m.mismatch[0], (5.0 - 5.075) / 5.0, 1e-15);
    EXPECT_NEAR(m.mismatch[1], (5.1 - 5.075) / 5.1, 1e-15);
}

TEST(Misfit, AreaWeightedAverage) {
    MisfitStrain m = lattice_mismatch(AveragingConvention::AREA_WEIGHTED_AVERAGE,
                                      {1.0, 3.0}, {5.0, 5.1});
    EXPECT_NEAR(m.mismatch[0], (5.0 - 5.075) / 5.075, 1e-15);
    EXPECT_NEAR(m.mismatch[1], (5.1 - 5.075) / 5.075, 1e-15);
    // Weighted mismatches cancel about the average lattice
    EXPECT_NEAR(1.0 * m.mismatch[0] + 3.0 * m.mismatch[1], 0.0, 1e-15);
}

TEST(Misfit, EigenstrainIsGreenStrainOfMismatch) {
    MisfitStrain m = lattice_mismatch(1, {1.0, 1.0}, {5.0, 5.5});
    const double a = m.mismatch[1];
    EXPECT_NEAR(m.eigenstrain[1], a * (1.0 + a / 2.0), 1e-15);
    EXPECT_NEAR(m.eigenstrain[1], 0.5 * ((1 + a) * (1 + a) - 1), 1e-15);
}

// --- Geometry weights ---

TEST(Misfit, WeightsFromGeometry) {
    BimetalGeometry g({50.0, 2000.0}, 0.25);
    MisfitStrain m = misfit_for_geometry(AveragingConvention::AREA_WEIGHTED_OWN, g, {5.0, 5.1});
    MisfitStrain direct = lattice_mismatch(2, {12.5, 37.5}, {5.0, 5.1});
    EXPECT_DOUBLE_EQ(m.mismatch[0], direct.mismatch[0]);
    EXPECT_DOUBLE_EQ(m.mismatch[1], direct.mismatch[1]);
}

TEST(Misfit, DepthDoesNotChangeRelativeWeights) {
    BimetalGeometry g2({50.0, 2000.0}, 0.25);
    BimetalGeometry g3({50.0, 2000.0, 80.0}, 0.25);
    MisfitStrain a = misfit_for_geometry(AveragingConvention::AREA_WEIGHTED_OWN, g2, {5.0, 5.1});
    MisfitStrain b = misfit_for_geometry(AveragingConvention::AREA_WEIGHTED_OWN, g3, {5.0, 5.1});
    EXPECT_NEAR(a.mismatch[0], b.mismatch[0], 1e-15);
    EXPECT_NEAR(a.mismatch[1], b.mismatch[1], 1e-15);
}

// --- Errors ---

TEST(Misfit, InvalidConventionThrows) {
    EXPECT_THROW(averaging_from_int(0), ConfigurationError);
    EXPECT_THROW(averaging_from_int(4), ConfigurationError);
    EXPECT_THROW(lattice_mismatch(7, {1.0, 1.0}, {5.0, 5.0}), ConfigurationError);
}

TEST(Misfit, NonPositiveInputsThrow) {
    EXPECT_THROW(lattice_mismatch(2, {1.0, 1.0}, {0.0, 5.0}), ConfigurationError);
    EXPECT_THROW(lattice_mismatch(2, {0.0, 1.0}, {5.0, 5.0}), GeometryInconsistency);
}
