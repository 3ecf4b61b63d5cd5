#pragma once

#include <Eigen/Dense>
#include <Eigen/Sparse>
#include <vector>
#include <string>
#include <array>
#include <cmath>
#include <stdexcept>

namespace bimetal {

// Voigt stiffness (3D: xx, yy, zz, yz, xz, xy; 2D: xx, yy, xy)
using Matrix6d = Eigen::Matrix<double, 6, 6>;

// Sparse matrix types
using SpMatd = Eigen::SparseMatrix<double>;
using Triplet = Eigen::Triplet<double>;

// Constants
constexpr double PI = 3.14159265358979323846;

// Material tables are in GPa (elasticity) and C/m^2 (piezo); the solver works in N/nm^2
constexpr double GPA_TO_N_PER_NM2 = 1e-9;

}  // namespace bimetal
