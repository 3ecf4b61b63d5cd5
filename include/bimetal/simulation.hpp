#pragma once

#include "bimetal/common.hpp"
#include "bimetal/material.hpp"
#include "bimetal/tensor.hpp"
#include "bimetal/misfit.hpp"
#include "bimetal/geometry.hpp"
#include "bimetal/mesh.hpp"
#include "bimetal/assembler.hpp"
#include "bimetal/continuation.hpp"
#include "bimetal/statistics.hpp"
#include <optional>

namespace bimetal {

struct RegionMaterial {
    enum class Kind {
        ISOTROPIC,  // Lame tensor from E and nu
        ALLOY       // catalogue alloy at a composition, tensors from the crystal symmetry
    };

    Kind kind = Kind::ISOTROPIC;
    double E = 1e-6;
    double nu = 0.15;
    std::string alloy;
    double composition = 0.0;

    static RegionMaterial isotropic(double E, double nu);
    static RegionMaterial from_alloy(const std::string& alloy, double composition);
};

struct SimulationConfig {
    std::array<RegionMaterial, 2> materials = {RegionMaterial(), RegionMaterial()};
    CrystalSymmetry symmetry = CrystalSymmetry::ZINC_BLENDE_2D;
    std::vector<double> scale = {50.0, 2000.0};
    double material_border = 0.25;
    double lattice_factor = 0.0;   // isotropic lattice constants are [5, 5 (1 + lattice_factor)]
    int averaging = 2;             // AveragingConvention 1..3
    bool nonlinear_strain = true;
    SolverConfig solver;
    int order = 2;
    int refinements = 0;

    BimetalGeometry geometry() const { return BimetalGeometry(scale, material_border); }

    // Throws ConfigurationError or GeometryInconsistency
    void validate() const;
};

struct SimulationResult {
    SimulationConfig config;
    std::array<std::optional<MaterialConstants>, 2> constants;  // alloy regions only
    std::array<MaterialTensors, 2> tensors;
    std::array<double, 2> lattice_constants = {0.0, 0.0};
    std::array<double, 2> youngs_modulus = {0.0, 0.0};
    MisfitStrain misfit;
    Mesh mesh;
    DisplacementSolution solution;
    BendingStatistics statistics;
    double analytic_curvature = 0.0;
    double analytic_angle = 0.0;
};

// Per-region data the pipeline derives before meshing
struct ResolvedRegions {
    std::array<std::optional<MaterialConstants>, 2> constants;
    std::array<MaterialTensors, 2> tensors;
    std::array<double, 2> lattice_constants = {0.0, 0.0};
    std::array<double, 2> youngs_modulus = {0.0, 0.0};
};

ResolvedRegions resolve_regions(const SimulationConfig& config);

ElasticityProblem build_problem(const SimulationConfig& config, const ResolvedRegions& regions,
                                const MisfitStrain& misfit);

// Tensors, misfit, mesh, continuation solve and statistics for one configuration
SimulationResult run_simulation(const SimulationConfig& config);
SimulationResult run_simulation(const SimulationConfig& config, NonlinearSolver& solver);

struct SweepOutcome {
    bool converged = false;
    std::optional<SimulationResult> result;
    std::string message;     // non-convergence report
    int failed_step = 0;
    double failed_embedding = 0.0;
};

// Validates every configuration first, then runs them in parallel (OpenMP).
// Non-convergence is recorded per configuration; other errors propagate.
std::vector<SweepOutcome> run_sweep(const std::vector<SimulationConfig>& configs,
                                    int max_threads = 0);

}  // namespace bimetal
