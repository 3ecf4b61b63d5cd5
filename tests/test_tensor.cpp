#include <gtest/gtest.h>
#include "bimetal/tensor.hpp"
#include "bimetal/errors.hpp"
#include <cmath>

using namespace bimetal;

static const CrystalSymmetry kAllSymmetries[] = {
    CrystalSymmetry::ZINC_BLENDE_001, CrystalSymmetry::ZINC_BLENDE_2D,
    CrystalSymmetry::ZINC_BLENDE_111_C14, CrystalSymmetry::ZINC_BLENDE_111_C15,
    CrystalSymmetry::ZINC_BLENDE_111_C14_C15, CrystalSymmetry::WURTZITE_0001,
};

// --- Shape and symmetry ---

TEST(Tensors, SymmetricForEverySymmetryAndAlloy) {
    for (const auto& name : available_alloys()) {
        for (CrystalSymmetry s : kAllSymmetries) {
            MaterialConstants mc = resolve_material(name, 0.3, s);
            MaterialTensors t = build_tensors(mc, s);
            EXPECT_TRUE(is_symmetric(t.elasticity)) << name << " " << to_string(s);
            for (int i = 0; i < t.elasticity.rows(); i++) {
                EXPECT_GT(t.elasticity(i, i), 0.0) << name << " " << to_string(s);
            }
        }
    }
}

TEST(Tensors, ShapesPerSymmetry) {
    for (CrystalSymmetry s : kAllSymmetries) {
        MaterialTensors t = build_tensors(resolve_material("GaAs", 0.0, s), s);
        if (s == CrystalSymmetry::ZINC_BLENDE_2D) {
            EXPECT_EQ(t.elasticity.rows(), 3);
            EXPECT_EQ(t.piezoelectric.rows(), 2);
            EXPECT_EQ(t.dimension(), 2);
        } else {
            EXPECT_EQ(t.elasticity.rows(), 6);
            EXPECT_EQ(t.piezoelectric.rows(), 3);
            EXPECT_EQ(t.dimension(), 3);
        }
        EXPECT_EQ(t.piezoelectric.cols(), 6);
    }
}

TEST(Tensors, ScaledToNewtonPerSquareNanometre) {
    MaterialConstants mc = resolve_material("GaAs", 0.0, CrystalSymmetry::ZINC_BLENDE_001);
    MaterialTensors t = build_tensors(mc, CrystalSymmetry::ZINC_BLENDE_001);
    EXPECT_NEAR(t.elasticity(0, 0), 122.1e-9, 1e-20);
    EXPECT_NEAR(t.elasticity(0, 1), 56.6e-9, 1e-20);
    EXPECT_NEAR(t.elasticity(3, 3), 60.0e-9, 1e-20);
    EXPECT_NEAR(t.piezoelectric(0, 3), -0.2381e-9, 1e-20);
    EXPECT_NEAR(t.piezoelectric(2, 5), -0.2381e-9, 1e-20);
}

TEST(Tensors, ZincBlende2DIsPlaneBlock) {
    MaterialConstants mc = resolve_material("Test", 0.0, CrystalSymmetry::ZINC_BLENDE_2D);
    MaterialTensors t = build_tensors(mc, CrystalSymmetry::ZINC_BLENDE_2D);
    EXPECT_NEAR(t.elasticity(0, 0), 1200e-9, 1e-18);
    EXPECT_NEAR(t.elasticity(0, 1), 300e-9, 1e-18);
    EXPECT_NEAR(t.elasticity(2, 2), 500e-9, 1e-18);
    EXPECT_DOUBLE_EQ(t.elasticity(0, 2), 0.0);
}

// --- Coupling terms ---

TEST(Tensors, CouplingTermsPerVariant) {
    auto build = [](CrystalSymmetry s) {
        return build_tensors(resolve_material("GaAs", 0.0, s), s).elasticity;
    };
    Eigen::MatrixXd c14 = build(CrystalSymmetry::ZINC_BLENDE_111_C14);
    Eigen::MatrixXd c15 = build(CrystalSymmetry::ZINC_BLENDE_111_C15);
    Eigen::MatrixXd both = build(CrystalSymmetry::ZINC_BLENDE_111_C14_C15);

    EXPECT_NE(c14(0, 3), 0.0);
    EXPECT_DOUBLE_EQ(c14(1, 3), -c14(0, 3));
    EXPECT_DOUBLE_EQ(c14(0, 4), 0.0);

    EXPECT_NE(c15(0, 4), 0.0);
    EXPECT_DOUBLE_EQ(c15(1, 4), -c15(0, 4));
    EXPECT_DOUBLE_EQ(c15(0, 3), 0.0);

    EXPECT_DOUBLE_EQ(both(0, 3), c14(0, 3));
    EXPECT_DOUBLE_EQ(both(0, 4), c15(0, 4));
}

TEST(Tensors, CombinedCouplingPattern) {
    MaterialConstants mc = resolve_material("GaAs", 0.0, CrystalSymmetry::ZINC_BLENDE_111_C14_C15);
    Eigen::MatrixXd C = build_tensors(mc, CrystalSymmetry::ZINC_BLENDE_111_C14_C15).elasticity;
    RotatedCubicConstants r = rotate_cubic_111(mc.C11, mc.C12, mc.C44);

    Matrix6d expected;
    expected << r.C11p,  r.C12p, r.C13p,  r.C14p,  r.C15p,  0.0,
                r.C12p,  r.C11p, r.C13p, -r.C14p, -r.C15p,  0.0,
                r.C13p,  r.C13p, r.C33p,  0.0,     0.0,     0.0,
                r.C14p, -r.C14p, 0.0,     r.C44p,  0.0,    -r.C15p,
                r.C15p, -r.C15p, 0.0,     0.0,     r.C44p,  r.C14p,
                0.0,     0.0,    0.0,    -r.C15p,  r.C14p,  r.C66p;
    expected *= GPA_TO_N_PER_NM2;

    ASSERT_EQ(C.rows(), 6);
    for (int i = 0; i < 6; i++) {
        for (int j = 0; j < 6; j++) {
            EXPECT_NEAR(C(i, j), expected(i, j), 1e-20) << i << "," << j;
        }
    }
    EXPECT_NE(r.C14p, 0.0);
    EXPECT_NE(r.C15p, 0.0);
}

// --- Piezoelectric layouts ---

TEST(Tensors, ZincBlende111PiezoLayout) {
    MaterialConstants mc = resolve_material("GaAs", 0.0, CrystalSymmetry::ZINC_BLENDE_111_C14);
    Eigen::MatrixXd e = build_tensors(mc, CrystalSymmetry::ZINC_BLENDE_111_C14).piezoelectric;
    const double e14 = mc.E14 * GPA_TO_N_PER_NM2;
    const double E11 = -std::sqrt(2.0 / 3.0) * e14;
    const double E12 = std::sqrt(2.0 / 3.0) * e14;
    const double E15 = -std::sqrt(1.0 / 3.0) * e14;
    const double E33 = 2.0 / std::sqrt(3.0) * e14;

    Eigen::MatrixXd expected(3, 6);
    expected << E11, E12, 0.0, 0.0, E15, 0.0,
                0.0, 0.0, 0.0, E15, 0.0, E12,
                E15, E15, E33, 0.0, 0.0, 0.0;

    ASSERT_EQ(e.rows(), 3);
    ASSERT_EQ(e.cols(), 6);
    for (int i = 0; i < 3; i++) {
        for (int j = 0; j < 6; j++) {
            EXPECT_NEAR(e(i, j), expected(i, j), 1e-22) << i << "," << j;
        }
    }

    // Every 111 variant shares the same piezoelectric rotation
    for (CrystalSymmetry s : {CrystalSymmetry::ZINC_BLENDE_111_C15,
                              CrystalSymmetry::ZINC_BLENDE_111_C14_C15}) {
        Eigen::MatrixXd other = build_tensors(resolve_material("GaAs", 0.0, s), s).piezoelectric;
        EXPECT_LT((other - e).cwiseAbs().maxCoeff(), 1e-22) << to_string(s);
    }
}

TEST(Tensors, ZincBlende2DPiezoRows) {
    MaterialConstants mc = resolve_material("GaAs", 0.0, CrystalSymmetry::ZINC_BLENDE_2D);
    Eigen::MatrixXd e = build_tensors(mc, CrystalSymmetry::ZINC_BLENDE_2D).piezoelectric;
    const double e14 = mc.E14 * GPA_TO_N_PER_NM2;
    ASSERT_EQ(e.rows(), 2);
    ASSERT_EQ(e.cols(), 6);
    for (int i = 0; i < 2; i++) {
        for (int j = 0; j < 6; j++) {
            EXPECT_NEAR(e(i, j), i == j ? e14 : 0.0, 1e-22) << i << "," << j;
        }
    }
    EXPECT_NEAR(e(0, 0), -0.2381e-9, 1e-20);
}

TEST(Tensors, WurtziteQuasiCubic) {
    WurtziteConstants w = quasi_cubic_wurtzite(1200.0, 300.0, 500.0);
    EXPECT_NEAR(w.C11, (3600.0 + 900.0 + 3000.0) / 6.0, 1e-9);
    EXPECT_NEAR(w.C66, 0.5 * (w.C11 - w.C12), 1e-9);
}

TEST(Tensors, WurtzitePiezoFallsBackToZincBlende) {
    MaterialConstants mc = resolve_material("AlInAs", 0.5, CrystalSymmetry::WURTZITE_0001);
    ASSERT_FALSE(mc.E31_wz.has_value());
    MaterialTensors t = build_tensors(mc, CrystalSymmetry::WURTZITE_0001);
    const double e31 = -mc.E14 / std::sqrt(3.0) * 1e-9;
    EXPECT_NEAR(t.piezoelectric(2, 0), e31, 1e-22);
    EXPECT_NEAR(t.piezoelectric(2, 2), 2.0 * mc.E14 / std::sqrt(3.0) * 1e-9, 1e-22);
    EXPECT_NEAR(t.piezoelectric(0, 4), e31, 1e-22);
}

TEST(Tensors, WurtziteUsesNativeCoefficients) {
    MaterialConstants mc = resolve_material("AlGaAs", 0.0, CrystalSymmetry::WURTZITE_0001);
    MaterialTensors t = build_tensors(mc, CrystalSymmetry::WURTZITE_0001);
    EXPECT_NEAR(t.piezoelectric(2, 0), 0.1328e-9, 1e-22);
    EXPECT_NEAR(t.piezoelectric(2, 2), -0.2656e-9, 1e-22);
}

// --- Rotation consistency ---

TEST(Rotation, ZeroRotationReproducesCubicTensor) {
    MaterialConstants mc = resolve_material("GaAs", 0.0, CrystalSymmetry::ZINC_BLENDE_001);
    MaterialTensors t = build_tensors(mc, CrystalSymmetry::ZINC_BLENDE_001);
    Matrix6d C = t.elasticity;
    Matrix6d R = rotate_stiffness(C, crystal_rotation(CrystalSymmetry::ZINC_BLENDE_001));
    EXPECT_LT((R - C).cwiseAbs().maxCoeff(), 1e-12 * C.cwiseAbs().maxCoeff());
}

TEST(Rotation, C14FrameReproducesClosedForm) {
    Matrix6d C = cubic_stiffness(122.1, 56.6, 60.0);
    Matrix6d R = rotate_stiffness(C, crystal_rotation(CrystalSymmetry::ZINC_BLENDE_111_C14));
    MaterialConstants mc = resolve_material("GaAs", 0.0, CrystalSymmetry::ZINC_BLENDE_111_C14);
    Eigen::MatrixXd closed = build_tensors(mc, CrystalSymmetry::ZINC_BLENDE_111_C14).elasticity / 1e-9;
    EXPECT_LT((R - closed).cwiseAbs().maxCoeff(), 1e-9);
}

TEST(Rotation, C15FrameReproducesClosedForm) {
    Matrix6d C = cubic_stiffness(122.1, 56.6, 60.0);
    Matrix6d R = rotate_stiffness(C, crystal_rotation(CrystalSymmetry::ZINC_BLENDE_111_C15));
    MaterialConstants mc = resolve_material("GaAs", 0.0, CrystalSymmetry::ZINC_BLENDE_111_C15);
    Eigen::MatrixXd closed = build_tensors(mc, CrystalSymmetry::ZINC_BLENDE_111_C15).elasticity / 1e-9;
    EXPECT_LT((R - closed).cwiseAbs().maxCoeff(), 1e-9);
}

TEST(Rotation, CombinedVariantHasNoSingleFrame) {
    EXPECT_THROW(crystal_rotation(CrystalSymmetry::ZINC_BLENDE_111_C14_C15), ConfigurationError);
}

TEST(Rotation, PreservesTrace) {
    Matrix6d C = cubic_stiffness(83.29, 45.26, 39.59);
    Matrix6d R = rotate_stiffness(C, crystal_rotation(CrystalSymmetry::ZINC_BLENDE_111_C15));
    // C_iijj and C_ijij are rotation invariants
    EXPECT_NEAR((R.topLeftCorner<3, 3>().sum()), (C.topLeftCorner<3, 3>().sum()), 1e-10);
}

// --- Isotropic ---

TEST(Isotropic, LameEntries) {
    const double E = 1e-6, nu = 0.15;
    const double mu = E / (2 * (1 + nu));
    const double lambda = E * nu / ((1 - 2 * nu) * (1 + nu));
    Eigen::MatrixXd C2 = isotropic_stiffness(E, nu, 2);
    ASSERT_EQ(C2.rows(), 3);
    EXPECT_NEAR(C2(0, 0), lambda + 2 * mu, 1e-20);
    EXPECT_NEAR(C2(0, 1), lambda, 1e-20);
    EXPECT_NEAR(C2(2, 2), mu, 1e-20);

    Eigen::MatrixXd C3 = isotropic_stiffness(E, nu, 3);
    ASSERT_EQ(C3.rows(), 6);
    EXPECT_NEAR(C3(1, 2), lambda, 1e-20);
    EXPECT_NEAR(C3(4, 4), mu, 1e-20);
}

TEST(Isotropic, PlaneProjectionOfThreeDimensionalTensor) {
    Matrix6d C3 = isotropic_stiffness(2.0, 0.3, 3);
    Eigen::Matrix3d P = plane_projection(C3);
    Eigen::MatrixXd C2 = isotropic_stiffness(2.0, 0.3, 2);
    EXPECT_LT((P - C2).cwiseAbs().maxCoeff(), 1e-14);
}

TEST(Isotropic, RejectsInvalidParameters) {
    EXPECT_THROW(isotropic_stiffness(0.0, 0.3, 2), ConfigurationError);
    EXPECT_THROW(isotropic_stiffness(1.0, 0.5, 2), ConfigurationError);
    EXPECT_THROW(isotropic_stiffness(1.0, -1.0, 3), ConfigurationError);
    EXPECT_THROW(isotropic_stiffness(1.0, 0.3, 4), ConfigurationError);
}

// --- Validation ---

TEST(Validation, RejectsAsymmetricTensor) {
    Eigen::MatrixXd C = isotropic_stiffness(1.0, 0.2, 2);
    C(0, 1) += 0.1;
    EXPECT_FALSE(is_symmetric(C));
    EXPECT_THROW(validate_elasticity(C, "test"), ConfigurationError);
}

TEST(Validation, RejectsNonPositiveDiagonal) {
    Eigen::MatrixXd C = isotropic_stiffness(1.0, 0.2, 3);
    C(5, 5) = 0.0;
    EXPECT_THROW(validate_elasticity(C, "test"), ConfigurationError);
}

TEST(Validation, RejectsWrongSize) {
    EXPECT_THROW(validate_elasticity(Eigen::MatrixXd::Identity(4, 4), "test"),
                 ConfigurationError);
}
