#pragma once

#include "bimetal/common.hpp"
#include <optional>

namespace bimetal {

enum class CrystalSymmetry {
    ZINC_BLENDE_001,
    ZINC_BLENDE_2D,          // plane-strain reduction of the (001) cubic tensor
    ZINC_BLENDE_111_C14,
    ZINC_BLENDE_111_C15,
    ZINC_BLENDE_111_C14_C15,
    WURTZITE_0001
};

std::string to_string(CrystalSymmetry symmetry);

// Accepts "ZincBlende001", "ZincBlende2D", "ZincBlende111_C14", "ZincBlende111_C15",
// "ZincBlende111_C14_C15", "Wurtzite0001"; throws ConfigurationError otherwise
CrystalSymmetry parse_crystal_symmetry(const std::string& name);

// Spatial dimension of the tensors built for a symmetry (2 or 3)
int symmetry_dimension(CrystalSymmetry symmetry);

// Constants of one end member of an alloy (x = 0 or x = 1)
struct EndMember {
    std::string name;
    double C11 = 0.0;          // GPa
    double C12 = 0.0;          // GPa
    double C44 = 0.0;          // GPa
    double E14 = 0.0;          // C/m^2, zinc-blende
    std::optional<double> E31_wz;  // C/m^2, native wurtzite values where tabulated
    std::optional<double> E33_wz;
    std::optional<double> E15_wz;
    double lattice_zb = 0.0;   // Angstrom
    double lattice_wz_a = 0.0;
    double lattice_wz_c = 0.0;
    double kappar = 1.0;       // relative dielectric constant
};

struct AlloyModel {
    enum class Kind {
        BINARY,     // composition has no effect
        TERNARY,    // A_x B_(1-x) C
        SYNTHETIC   // test material with an isotropic lattice
    };

    std::string name;
    Kind kind = Kind::BINARY;
    std::string cation_one;    // cation weighted by x (ternary formula)
    std::string cation_zero;   // cation weighted by 1-x
    std::string anion;
    EndMember at_zero;
    EndMember at_one;
    bool isotropic_lattice = false;

    std::string formula(double x) const;
};

// Built-in catalogue: "GaAs", "AlInAs", "AlGaAs", "InGaAs", "Test"
const AlloyModel& find_alloy(const std::string& name);
std::vector<std::string> available_alloys();

struct MaterialConstants {
    std::string formula;
    CrystalSymmetry symmetry = CrystalSymmetry::ZINC_BLENDE_001;
    double composition = 0.0;

    double C11 = 0.0;   // GPa
    double C12 = 0.0;
    double C44 = 0.0;
    double E14 = 0.0;   // C/m^2
    std::optional<double> E31_wz;
    std::optional<double> E33_wz;
    std::optional<double> E15_wz;

    Eigen::Vector3d lattice_constants = Eigen::Vector3d::Zero();        // Angstrom
    Eigen::Vector3d spontaneous_polarization = Eigen::Vector3d::Zero(); // C/m^2
    double kappar = 1.0;
};

// Linear interpolation value(x) = x * at_one + (1 - x) * at_zero, followed by
// the symmetry-specific lattice vector. Throws ConfigurationError for x outside [0, 1].
MaterialConstants resolve_material(const AlloyModel& alloy, double x,
                                   CrystalSymmetry symmetry);
MaterialConstants resolve_material(const std::string& alloy_name, double x,
                                   CrystalSymmetry symmetry);

// Young's modulus along <100> of a cubic crystal (same unit as the C_ij)
double cubic_youngs_modulus(double C11, double C12);

}  // namespace bimetal
