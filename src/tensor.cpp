#include "bimetal/tensor.hpp"
#include "bimetal/errors.hpp"
#include <algorithm>

namespace bimetal {

RotatedCubicConstants rotate_cubic_111(double C11, double C12, double C44) {
    const double sr2 = std::sqrt(2.0);
    RotatedCubicConstants r;
    r.C11p = 0.5 * (C11 + C12) + C44;
    r.C12p = (C11 + 5.0 * C12) / 6.0 - C44 / 3.0;
    r.C44p = (C11 - C12 + C44) / 3.0;
    r.C33p = 1.5 * r.C11p - 0.5 * r.C12p - r.C44p;
    r.C13p = -0.5 * r.C11p + 1.5 * r.C12p + r.C44p;
    r.C14p = sr2 / 6.0 * (-C11 + C12 + 2.0 * C44);
    r.C15p = r.C11p / sr2 - r.C12p / sr2 - sr2 * r.C44p;
    r.C66p = 0.5 * (r.C11p - r.C12p);
    return r;
}

WurtziteConstants quasi_cubic_wurtzite(double C11, double C12, double C44) {
    WurtziteConstants w;
    w.C11 = (3.0 * C11 + 3.0 * C12 + 6.0 * C44) / 6.0;
    w.C33 = (2.0 * C11 + 4.0 * C12 + 8.0 * C44) / 6.0;
    w.C12 = (C11 + 5.0 * C12 - 2.0 * C44) / 6.0;
    w.C13 = (2.0 * C11 + 4.0 * C12 - 4.0 * C44) / 6.0;
    w.C44 = (2.0 * C11 - 2.0 * C12 + 2.0 * C44) / 6.0;
    w.C66 = (C11 - C12 + 4.0 * C44) / 6.0;
    return w;
}

Matrix6d cubic_stiffness(double C11, double C12, double C44) {
    Matrix6d C = Matrix6d::Zero();
    for (int i = 0; i < 3; i++) {
        for (int j = 0; j < 3; j++) {
            C(i, j) = (i == j) ? C11 : C12;
        }
        C(i + 3, i + 3) = C44;
    }
    return C;
}

// --- One builder per symmetry ---

static MaterialTensors zinc_blende_001(const MaterialConstants& mc) {
    MaterialTensors t;
    t.elasticity = cubic_stiffness(mc.C11, mc.C12, mc.C44);
    t.piezoelectric = Eigen::MatrixXd::Zero(3, 6);
    t.piezoelectric(0, 3) = mc.E14;
    t.piezoelectric(1, 4) = mc.E14;
    t.piezoelectric(2, 5) = mc.E14;
    return t;
}

static MaterialTensors zinc_blende_2d(const MaterialConstants& mc) {
    MaterialTensors t;
    t.elasticity = Eigen::MatrixXd::Zero(3, 3);
    t.elasticity << mc.C11, mc.C12, 0.0,
                    mc.C12, mc.C11, 0.0,
                    0.0,    0.0,    mc.C44;
    t.piezoelectric = Eigen::MatrixXd::Zero(2, 6);
    t.piezoelectric(0, 0) = mc.E14;
    t.piezoelectric(1, 1) = mc.E14;
    return t;
}

static MaterialTensors zinc_blende_111(const MaterialConstants& mc,
                                       bool c14, bool c15) {
    RotatedCubicConstants r = rotate_cubic_111(mc.C11, mc.C12, mc.C44);
    Matrix6d C = Matrix6d::Zero();
    C(0, 0) = C(1, 1) = r.C11p;
    C(0, 1) = C(1, 0) = r.C12p;
    C(0, 2) = C(2, 0) = C(1, 2) = C(2, 1) = r.C13p;
    C(2, 2) = r.C33p;
    C(3, 3) = C(4, 4) = r.C44p;
    C(5, 5) = r.C66p;
    if (c14) {
        C(0, 3) = C(3, 0) = r.C14p;
        C(1, 3) = C(3, 1) = -r.C14p;
        C(4, 5) = C(5, 4) = r.C14p;
    }
    if (c15) {
        C(0, 4) = C(4, 0) = r.C15p;
        C(1, 4) = C(4, 1) = -r.C15p;
        C(3, 5) = C(5, 3) = -r.C15p;
    }

    const double E11 = -std::sqrt(2.0 / 3.0) * mc.E14;
    const double E12 = std::sqrt(2.0 / 3.0) * mc.E14;
    const double E15 = -std::sqrt(1.0 / 3.0) * mc.E14;
    const double E31 = E15;
    const double E33 = 2.0 / std::sqrt(3.0) * mc.E14;

    MaterialTensors t;
    t.elasticity = C;
    t.piezoelectric = Eigen::MatrixXd::Zero(3, 6);
    t.piezoelectric << E11, E12, 0.0, 0.0, E15, 0.0,
                       0.0, 0.0, 0.0, E15, 0.0, E12,
                       E31, E31, E33, 0.0, 0.0, 0.0;
    return t;
}

static MaterialTensors wurtzite_0001(const MaterialConstants& mc) {
    WurtziteConstants w = quasi_cubic_wurtzite(mc.C11, mc.C12, mc.C44);
    Matrix6d C = Matrix6d::Zero();
    C(0, 0) = C(1, 1) = w.C11;
    C(0, 1) = C(1, 0) = w.C12;
    C(0, 2) = C(2, 0) = C(1, 2) = C(2, 1) = w.C13;
    C(2, 2) = w.C33;
    C(3, 3) = C(4, 4) = w.C44;
    C(5, 5) = w.C66;

    // Missing native coefficients follow the quasi-cubic relations
    const double E31 = mc.E31_wz ? *mc.E31_wz : -mc.E14 / std::sqrt(3.0);
    const double E33 = mc.E33_wz ? *mc.E33_wz : 2.0 * mc.E14 / std::sqrt(3.0);
    const double E15 = mc.E15_wz ? *mc.E15_wz : E31;

    MaterialTensors t;
    t.elasticity = C;
    t.piezoelectric = Eigen::MatrixXd::Zero(3, 6);
    t.piezoelectric(0, 4) = E15;
    t.piezoelectric(1, 3) = E15;
    t.piezoelectric(2, 0) = E31;
    t.piezoelectric(2, 1) = E31;
    t.piezoelectric(2, 2) = E33;
    return t;
}

MaterialTensors build_tensors(const MaterialConstants& constants,
                              CrystalSymmetry symmetry) {
    MaterialTensors t;
    switch (symmetry) {
        case CrystalSymmetry::ZINC_BLENDE_001:
            t = zinc_blende_001(constants);
            break;
        case CrystalSymmetry::ZINC_BLENDE_2D:
            t = zinc_blende_2d(constants);
            break;
        case CrystalSymmetry::ZINC_BLENDE_111_C14:
            t = zinc_blende_111(constants, true, false);
            break;
        case CrystalSymmetry::ZINC_BLENDE_111_C15:
            t = zinc_blende_111(constants, false, true);
            break;
        case CrystalSymmetry::ZINC_BLENDE_111_C14_C15:
            t = zinc_blende_111(constants, true, true);
            break;
        case CrystalSymmetry::WURTZITE_0001:
            t = wurtzite_0001(constants);
            break;
        default:
            throw ConfigurationError("Unsupported crystal symmetry value: " +
                                     std::to_string(static_cast<int>(symmetry)));
    }

    t.elasticity *= GPA_TO_N_PER_NM2;
    t.piezoelectric *= GPA_TO_N_PER_NM2;
    validate_elasticity(t.elasticity, constants.formula + " (" + to_string(symmetry) + ")");
    return t;
}

// Voigt index of the symmetric pair (i, j): xx, yy, zz, yz, xz, xy
static int voigt_index(int i, int j) {
    if (i == j) return i;
    return 6 - i - j;
}

Matrix6d rotate_stiffness(const Matrix6d& C, const Eigen::Matrix3d& R) {
    static const int pairs[6][2] = {{0, 0}, {1, 1}, {2, 2}, {1, 2}, {0, 2}, {0, 1}};

    // Expand to the 3x3x3x3 tensor, stored as a 9x9 matrix over (ij, kl)
    Eigen::Matrix<double, 9, 9> T;
    for (int i = 0; i < 3; i++)
        for (int j = 0; j < 3; j++)
            for (int k = 0; k < 3; k++)
                for (int l = 0; l < 3; l++)
                    T(3 * i + j, 3 * k + l) = C(voigt_index(i, j), voigt_index(k, l));

    // Q_(ab),(ij) = R_ai R_bj, so T' = Q T Q^T
    Eigen::Matrix<double, 9, 9> Q;
    for (int a = 0; a < 3; a++)
        for (int b = 0; b < 3; b++)
            for (int i = 0; i < 3; i++)
                for (int j = 0; j < 3; j++)
                    Q(3 * a + b, 3 * i + j) = R(a, i) * R(b, j);
    Eigen::Matrix<double, 9, 9> Tr = Q * T * Q.transpose();

    Matrix6d out;
    for (int p = 0; p < 6; p++)
        for (int q = 0; q < 6; q++)
            out(p, q) = Tr(3 * pairs[p][0] + pairs[p][1], 3 * pairs[q][0] + pairs[q][1]);
    return out;
}

Eigen::Matrix3d crystal_rotation(CrystalSymmetry symmetry) {
    const double s2 = std::sqrt(2.0);
    const double s3 = std::sqrt(3.0);
    const double s6 = std::sqrt(6.0);
    Eigen::Matrix3d R;
    switch (symmetry) {
        case CrystalSymmetry::ZINC_BLENDE_111_C14:
            // x' = [-1 1 0], y' = [-1 -1 2], z' = [1 1 1]
            R << -1.0 / s2,  1.0 / s2, 0.0,
                 -1.0 / s6, -1.0 / s6, 2.0 / s6,
                  1.0 / s3,  1.0 / s3, 1.0 / s3;
            return R;
        case CrystalSymmetry::ZINC_BLENDE_111_C15:
            // x' = [1 1 -2], y' = [-1 1 0], z' = [1 1 1]
            R <<  1.0 / s6, 1.0 / s6, -2.0 / s6,
                 -1.0 / s2, 1.0 / s2, 0.0,
                  1.0 / s3, 1.0 / s3, 1.0 / s3;
            return R;
        case CrystalSymmetry::ZINC_BLENDE_111_C14_C15:
            throw ConfigurationError(
                "ZincBlende111_C14_C15 has no single frame rotation from the cubic tensor");
        default:
            return Eigen::Matrix3d::Identity();
    }
}

Eigen::MatrixXd isotropic_stiffness(double E, double nu, int dim) {
    if (E <= 0.0)
        throw ConfigurationError("Young's modulus E must be positive");
    if (nu <= -1.0 || nu >= 0.5)
        throw ConfigurationError("Poisson's ratio nu must be in (-1, 0.5)");
    double mu = E / (2.0 * (1.0 + nu));
    double lambda = E * nu / ((1.0 - 2.0 * nu) * (1.0 + nu));

    if (dim == 2) {
        Eigen::MatrixXd C(3, 3);
        C << lambda + 2.0 * mu, lambda, 0.0,
             lambda, lambda + 2.0 * mu, 0.0,
             0.0, 0.0, mu;
        return C;
    }
    if (dim == 3) {
        Eigen::MatrixXd C = Eigen::MatrixXd::Zero(6, 6);
        for (int i = 0; i < 3; i++) {
            for (int j = 0; j < 3; j++) C(i, j) = lambda;
            C(i, i) = lambda + 2.0 * mu;
            C(i + 3, i + 3) = mu;
        }
        return C;
    }
    throw ConfigurationError("Isotropic stiffness needs dim 2 or 3, got " + std::to_string(dim));
}

Eigen::Matrix3d plane_projection(const Matrix6d& C) {
    static const int keep[3] = {0, 1, 5};
    Eigen::Matrix3d P;
    for (int i = 0; i < 3; i++)
        for (int j = 0; j < 3; j++)
            P(i, j) = C(keep[i], keep[j]);
    return P;
}

bool is_symmetric(const Eigen::MatrixXd& C, double rel_tol) {
    if (C.rows() != C.cols()) return false;
    double scale = std::max(C.cwiseAbs().maxCoeff(), 1e-300);
    return (C - C.transpose()).cwiseAbs().maxCoeff() <= rel_tol * scale;
}

void validate_elasticity(const Eigen::MatrixXd& C, const std::string& context) {
    if (C.rows() != C.cols() || (C.rows() != 3 && C.rows() != 6)) {
        throw ConfigurationError("Elasticity tensor for " + context +
                                 " must be 3x3 or 6x6, got " + std::to_string(C.rows()) +
                                 "x" + std::to_string(C.cols()));
    }
    if (!is_symmetric(C)) {
        throw ConfigurationError("Elasticity tensor for " + context + " is not symmetric");
    }
    for (int i = 0; i < C.rows(); i++) {
        if (!(C(i, i) > 0.0)) {
            throw ConfigurationError("Elasticity tensor for " + context +
                                     " has a non-positive diagonal entry at " + std::to_string(i));
        }
    }
}

}  // namespace bimetal
