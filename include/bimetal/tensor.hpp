#pragma once

#include "bimetal/common.hpp"
#include "bimetal/material.hpp"

namespace bimetal {

// Voigt elasticity (6x6, or 3x3 in 2D) and piezoelectric (3x6, or 2x6 in 2D)
// tensors, in N/nm^2 and C/nm^2
struct MaterialTensors {
    Eigen::MatrixXd elasticity;
    Eigen::MatrixXd piezoelectric;

    int dimension() const { return elasticity.rows() == 3 ? 2 : 3; }
};

// Constants of the cubic tensor expressed in a [111]-aligned frame
struct RotatedCubicConstants {
    double C11p, C12p, C13p, C14p, C15p, C33p, C44p, C66p;
};

struct WurtziteConstants {
    double C11, C12, C13, C33, C44, C66;
};

RotatedCubicConstants rotate_cubic_111(double C11, double C12, double C44);
WurtziteConstants quasi_cubic_wurtzite(double C11, double C12, double C44);

// Build both tensors for a resolved material (scaled by GPA_TO_N_PER_NM2).
// Throws ConfigurationError for an unsupported symmetry or a tensor that is
// not symmetric with a positive diagonal.
MaterialTensors build_tensors(const MaterialConstants& constants,
                              CrystalSymmetry symmetry);

// Cubic 6x6 stiffness in the crystal frame (unscaled)
Matrix6d cubic_stiffness(double C11, double C12, double C44);

// C'_abcd = R_ai R_bj R_ck R_dl C_ijkl on a 6x6 Voigt stiffness
Matrix6d rotate_stiffness(const Matrix6d& C, const Eigen::Matrix3d& R);

// Rows are the new axes in crystal coordinates. Identity for 001, 2D and wurtzite.
Eigen::Matrix3d crystal_rotation(CrystalSymmetry symmetry);

// Lame tensor with lambda = E nu / ((1 - 2 nu)(1 + nu)), mu = E / (2 (1 + nu))
Eigen::MatrixXd isotropic_stiffness(double E, double nu, int dim);

// Rows/columns xx, yy, xy of a 6x6 Voigt stiffness
Eigen::Matrix3d plane_projection(const Matrix6d& C);

bool is_symmetric(const Eigen::MatrixXd& C, double rel_tol = 1e-12);

// Throws ConfigurationError unless C is square, symmetric and has a positive diagonal
void validate_elasticity(const Eigen::MatrixXd& C, const std::string& context);

}  // namespace bimetal
