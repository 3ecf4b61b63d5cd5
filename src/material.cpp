#include "bimetal/material.hpp"
#include "bimetal/errors.hpp"
#include <sstream>

namespace bimetal {

std::string to_string(CrystalSymmetry symmetry) {
    switch (symmetry) {
        case CrystalSymmetry::ZINC_BLENDE_001: return "ZincBlende001";
        case CrystalSymmetry::ZINC_BLENDE_2D: return "ZincBlende2D";
        case CrystalSymmetry::ZINC_BLENDE_111_C14: return "ZincBlende111_C14";
        case CrystalSymmetry::ZINC_BLENDE_111_C15: return "ZincBlende111_C15";
        case CrystalSymmetry::ZINC_BLENDE_111_C14_C15: return "ZincBlende111_C14_C15";
        case CrystalSymmetry::WURTZITE_0001: return "Wurtzite0001";
    }
    throw ConfigurationError("Unsupported crystal symmetry value: " +
                             std::to_string(static_cast<int>(symmetry)));
}

CrystalSymmetry parse_crystal_symmetry(const std::string& name) {
    static const CrystalSymmetry all[] = {
        CrystalSymmetry::ZINC_BLENDE_001,
        CrystalSymmetry::ZINC_BLENDE_2D,
        CrystalSymmetry::ZINC_BLENDE_111_C14,
        CrystalSymmetry::ZINC_BLENDE_111_C15,
        CrystalSymmetry::ZINC_BLENDE_111_C14_C15,
        CrystalSymmetry::WURTZITE_0001,
    };
    for (CrystalSymmetry s : all) {
        if (to_string(s) == name) return s;
    }
    throw ConfigurationError("Unsupported crystal symmetry: '" + name + "'");
}

int symmetry_dimension(CrystalSymmetry symmetry) {
    return symmetry == CrystalSymmetry::ZINC_BLENDE_2D ? 2 : 3;
}

std::string AlloyModel::formula(double x) const {
    std::ostringstream os;
    switch (kind) {
        case Kind::BINARY:
            os << name;
            break;
        case Kind::TERNARY:
            os << cation_one << "_" << x << cation_zero << "_" << (1.0 - x) << anion;
            break;
        case Kind::SYNTHETIC:
            os << name << "(" << x << ")";
            break;
    }
    return os.str();
}

// --- Catalogue ---
//
// Elastic constants after Vurgaftman et al.; E14 after Beya-Wakata et al.,
// Phys. Rev. B 84, 195207 (2011). Wurtzite E31/E33/E15 are tabulated only for
// the Ga- and In/Al-rich ends of AlGaAs and InGaAs; elsewhere they are derived
// from E14 when the wurtzite tensor is built.

static EndMember gaas() {
    EndMember m;
    m.name = "GaAs";
    m.C11 = 122.1;
    m.C12 = 56.6;
    m.C44 = 60.0;
    m.E14 = -0.2381;
    m.lattice_zb = 5.6532;
    m.lattice_wz_a = 3.994;
    m.lattice_wz_c = 6.586;
    m.kappar = 12.9;
    return m;
}

// GaAs end of the Ga-containing ternaries uses the Catti wurtzite set
static EndMember gaas_ternary_end() {
    EndMember m = gaas();
    double e15 = -0.2656 / 6.4825 * 3.9697;
    m.E14 = e15;
    m.E31_wz = 0.1328;
    m.E33_wz = -0.2656;
    m.E15_wz = e15;
    return m;
}

static EndMember alas() {
    EndMember m;
    m.name = "AlAs";
    m.C11 = 125.0;
    m.C12 = 53.4;
    m.C44 = 54.2;
    m.E14 = -0.048;
    m.lattice_zb = 5.6611;
    m.lattice_wz_a = 4.002;
    m.lattice_wz_c = 6.582;
    m.kappar = 10.06;
    return m;
}

static EndMember inas() {
    EndMember m;
    m.name = "InAs";
    m.C11 = 83.29;
    m.C12 = 45.26;
    m.C44 = 39.59;
    m.E14 = -0.115;
    m.lattice_zb = 6.0583;
    m.lattice_wz_a = 4.311;
    m.lattice_wz_c = 7.093;
    m.kappar = 15.15;
    return m;
}

static EndMember test_end(double lattice) {
    EndMember m;
    m.name = "Test";
    m.C11 = 1200.0;
    m.C12 = 300.0;
    m.C44 = 500.0;
    m.E14 = -0.08;
    m.E31_wz = 0.05;
    m.E33_wz = -0.02;
    m.lattice_zb = lattice;
    m.lattice_wz_a = lattice;
    m.lattice_wz_c = lattice;
    m.kappar = 10.0;
    return m;
}

static std::vector<AlloyModel> build_catalogue() {
    std::vector<AlloyModel> alloys;

    AlloyModel ga;
    ga.name = "GaAs";
    ga.kind = AlloyModel::Kind::BINARY;
    ga.anion = "As";
    ga.at_zero = gaas();
    ga.at_one = gaas();
    alloys.push_back(ga);

    AlloyModel alin;
    alin.name = "AlInAs";
    alin.kind = AlloyModel::Kind::TERNARY;
    alin.cation_one = "Al";
    alin.cation_zero = "In";
    alin.anion = "As";
    alin.at_zero = inas();
    alin.at_one = alas();
    alloys.push_back(alin);

    AlloyModel alga;
    alga.name = "AlGaAs";
    alga.kind = AlloyModel::Kind::TERNARY;
    alga.cation_one = "Al";
    alga.cation_zero = "Ga";
    alga.anion = "As";
    alga.at_zero = gaas_ternary_end();
    alga.at_one = alas();
    alga.at_one.E31_wz = 0.1;
    alga.at_one.E33_wz = -0.01;
    alga.at_one.E15_wz = 0.1;
    alloys.push_back(alga);

    AlloyModel inga;
    inga.name = "InGaAs";
    inga.kind = AlloyModel::Kind::TERNARY;
    inga.cation_one = "In";
    inga.cation_zero = "Ga";
    inga.anion = "As";
    inga.at_zero = gaas_ternary_end();
    inga.at_one = inas();
    inga.at_one.E31_wz = 0.1;
    inga.at_one.E33_wz = -0.03;
    inga.at_one.E15_wz = 0.1;
    alloys.push_back(inga);

    AlloyModel test;
    test.name = "Test";
    test.kind = AlloyModel::Kind::SYNTHETIC;
    test.at_zero = test_end(5.0);
    test.at_one = test_end(10.0);
    test.isotropic_lattice = true;
    alloys.push_back(test);

    return alloys;
}

static const std::vector<AlloyModel>& catalogue() {
    static const std::vector<AlloyModel> alloys = build_catalogue();
    return alloys;
}

const AlloyModel& find_alloy(const std::string& name) {
    for (const auto& alloy : catalogue()) {
        if (alloy.name == name) return alloy;
    }
    throw ConfigurationError("Unknown alloy: '" + name + "'");
}

std::vector<std::string> available_alloys() {
    std::vector<std::string> names;
    for (const auto& alloy : catalogue()) names.push_back(alloy.name);
    return names;
}

// --- Interpolation ---

static double mix(double x, double at_zero, double at_one) {
    return x * at_one + (1.0 - x) * at_zero;
}

static std::optional<double> mix(double x, const std::optional<double>& at_zero,
                                 const std::optional<double>& at_one) {
    if (!at_zero || !at_one) return std::nullopt;
    return mix(x, *at_zero, *at_one);
}

MaterialConstants resolve_material(const AlloyModel& alloy, double x,
                                   CrystalSymmetry symmetry) {
    if (!(x >= 0.0 && x <= 1.0)) {
        throw ConfigurationError("Alloy composition must lie in [0, 1], got " +
                                 std::to_string(x) + " for " + alloy.name);
    }
    const EndMember& a = alloy.at_zero;
    const EndMember& b = alloy.at_one;

    MaterialConstants mc;
    mc.formula = alloy.formula(x);
    mc.symmetry = symmetry;
    mc.composition = x;
    mc.C11 = mix(x, a.C11, b.C11);
    mc.C12 = mix(x, a.C12, b.C12);
    mc.C44 = mix(x, a.C44, b.C44);
    mc.E14 = mix(x, a.E14, b.E14);
    mc.E31_wz = mix(x, a.E31_wz, b.E31_wz);
    mc.E33_wz = mix(x, a.E33_wz, b.E33_wz);
    mc.E15_wz = mix(x, a.E15_wz, b.E15_wz);
    mc.kappar = mix(x, a.kappar, b.kappar);

    double a_zb = mix(x, a.lattice_zb, b.lattice_zb);
    if (alloy.isotropic_lattice) {
        mc.lattice_constants = Eigen::Vector3d::Constant(a_zb);
        return mc;
    }

    switch (symmetry) {
        case CrystalSymmetry::ZINC_BLENDE_001:
        case CrystalSymmetry::ZINC_BLENDE_2D:
            mc.lattice_constants = Eigen::Vector3d::Constant(a_zb);
            break;
        case CrystalSymmetry::ZINC_BLENDE_111_C14:
        case CrystalSymmetry::ZINC_BLENDE_111_C15:
        case CrystalSymmetry::ZINC_BLENDE_111_C14_C15:
            mc.lattice_constants = Eigen::Vector3d(a_zb / std::sqrt(2.0),
                                                   a_zb / std::sqrt(2.0),
                                                   a_zb / std::sqrt(0.75));
            break;
        case CrystalSymmetry::WURTZITE_0001: {
            double a_wz = mix(x, a.lattice_wz_a, b.lattice_wz_a);
            double c_wz = mix(x, a.lattice_wz_c, b.lattice_wz_c);
            mc.lattice_constants = Eigen::Vector3d(a_wz, a_wz, c_wz);
            break;
        }
        default:
            throw ConfigurationError("Unsupported crystal symmetry value: " +
                                     std::to_string(static_cast<int>(symmetry)));
    }
    return mc;
}

MaterialConstants resolve_material(const std::string& alloy_name, double x,
                                   CrystalSymmetry symmetry) {
    return resolve_material(find_alloy(alloy_name), x, symmetry);
}

double cubic_youngs_modulus(double C11, double C12) {
    if (C11 + C12 <= 0.0)
        throw ConfigurationError("Cubic constants must satisfy C11 + C12 > 0");
    return (C11 - C12) * (C11 + 2.0 * C12) / (C11 + C12);
}

}  // namespace bimetal
