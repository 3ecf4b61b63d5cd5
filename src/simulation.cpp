#include "bimetal/simulation.hpp"
#include "bimetal/errors.hpp"
#include "bimetal/nonlinear_solver.hpp"
#include <exception>
#include <iostream>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace bimetal {

RegionMaterial RegionMaterial::isotropic(double E, double nu) {
    RegionMaterial m;
    m.kind = Kind::ISOTROPIC;
    m.E = E;
    m.nu = nu;
    return m;
}

RegionMaterial RegionMaterial::from_alloy(const std::string& alloy, double composition) {
    RegionMaterial m;
    m.kind = Kind::ALLOY;
    m.alloy = alloy;
    m.composition = composition;
    return m;
}

void SimulationConfig::validate() const {
    BimetalGeometry g = geometry();
    g.validate_order(order);
    if (refinements < 0) {
        throw ConfigurationError("Refinement count must be non-negative");
    }
    averaging_from_int(averaging);
    solver.validate();
    if (!(lattice_factor > -1.0)) {
        throw ConfigurationError("Lattice factor must exceed -1");
    }

    bool any_alloy = false;
    for (int i = 0; i < 2; i++) {
        const RegionMaterial& m = materials[i];
        if (m.kind == RegionMaterial::Kind::ALLOY) {
            any_alloy = true;
            resolve_material(m.alloy, m.composition, symmetry);
        } else {
            isotropic_stiffness(m.E, m.nu, g.dimension());
        }
    }
    if (any_alloy && symmetry_dimension(symmetry) == 2 && g.dimension() == 3) {
        throw ConfigurationError("Crystal symmetry " + to_string(symmetry) +
                                 " cannot be used on a 3D geometry");
    }
}

ResolvedRegions resolve_regions(const SimulationConfig& config) {
    const int dim = static_cast<int>(config.scale.size());
    ResolvedRegions r;
    bool both_alloys = true;

    for (int i = 0; i < 2; i++) {
        const RegionMaterial& m = config.materials[i];
        if (m.kind == RegionMaterial::Kind::ALLOY) {
            MaterialConstants mc = resolve_material(m.alloy, m.composition, config.symmetry);
            r.tensors[i] = build_tensors(mc, config.symmetry);
            r.youngs_modulus[i] = cubic_youngs_modulus(mc.C11, mc.C12);
            r.constants[i] = std::move(mc);
        } else {
            both_alloys = false;
            r.tensors[i].elasticity = isotropic_stiffness(m.E, m.nu, dim);
            r.tensors[i].piezoelectric = Eigen::MatrixXd::Zero(dim == 2 ? 2 : 3, 6);
            r.youngs_modulus[i] = m.E;
        }
    }

    if (both_alloys) {
        r.lattice_constants = {r.constants[0]->lattice_constants(0),
                               r.constants[1]->lattice_constants(0)};
    } else {
        r.lattice_constants = {5.0, 5.0 * (1.0 + config.lattice_factor)};
    }
    return r;
}

ElasticityProblem build_problem(const SimulationConfig& config, const ResolvedRegions& regions,
                                const MisfitStrain& misfit) {
    ElasticityProblem problem;
    problem.name = "bimetal";
    problem.nonlinear_strain = config.nonlinear_strain;
    for (int i = 0; i < 2; i++) {
        RegionOperator op;
        op.region = i + 1;
        op.elasticity = regions.tensors[i].elasticity;
        op.piezoelectric = regions.tensors[i].piezoelectric;
        op.eigenstrain = misfit.eigenstrain[i];
        op.mismatch = misfit.mismatch[i];
        problem.operators.push_back(std::move(op));
    }
    return problem;
}

SimulationResult run_simulation(const SimulationConfig& config, NonlinearSolver& solver) {
    config.validate();
    BimetalGeometry geometry = config.geometry();

    SimulationResult result;
    result.config = config;

    ResolvedRegions regions = resolve_regions(config);
    result.constants = regions.constants;
    result.tensors = regions.tensors;
    result.lattice_constants = regions.lattice_constants;
    result.youngs_modulus = regions.youngs_modulus;

    result.misfit = misfit_for_geometry(averaging_from_int(config.averaging), geometry,
                                        regions.lattice_constants);

    result.mesh = build_bimetal_mesh(geometry, config.order, config.refinements);
    ElasticityProblem problem = build_problem(config, regions, result.misfit);

    if (config.solver.verbosity >= 1) {
        std::cerr << "[Simulation] " << result.mesh.num_elements() << " elements, "
                  << result.mesh.num_dof() << " DOFs, mismatch "
                  << result.misfit.mismatch[0] << " / " << result.misfit.mismatch[1]
                  << std::endl;
    }

    ContinuationDriver driver(result.mesh, problem, solver);
    result.solution = driver.solve(config.solver);

    result.statistics = compute_statistics(result.mesh, result.solution, geometry);
    result.analytic_curvature = analytic_curvature(result.youngs_modulus,
                                                   result.misfit.mismatch, geometry);
    result.analytic_angle = bending_angle(result.statistics.bend_distance,
                                          result.analytic_curvature,
                                          result.statistics.farthest_point_side);
    return result;
}

SimulationResult run_simulation(const SimulationConfig& config) {
    NewtonSolver solver;
    return run_simulation(config, solver);
}

std::vector<SweepOutcome> run_sweep(const std::vector<SimulationConfig>& configs,
                                    int max_threads) {
    for (const auto& config : configs) {
        config.validate();
    }

    const int n = static_cast<int>(configs.size());
    std::vector<SweepOutcome> outcomes(n);
    std::vector<std::exception_ptr> errors(n);

#ifdef _OPENMP
    int n_threads = (max_threads > 0) ? max_threads : omp_get_max_threads();
    #pragma omp parallel for schedule(dynamic, 1) num_threads(n_threads)
#else
    (void)max_threads;
#endif
    for (int i = 0; i < n; i++) {
        try {
            outcomes[i].result = run_simulation(configs[i]);
            outcomes[i].converged = true;
        } catch (const SolverNonConvergence& e) {
            outcomes[i].converged = false;
            outcomes[i].message = e.what();
            outcomes[i].failed_step = e.step();
            outcomes[i].failed_embedding = e.embedding();
            if (configs[i].solver.verbosity >= 1) {
                #pragma omp critical
                std::cerr << "[Sweep] configuration " << i << " failed: " << e.what() << std::endl;
            }
        } catch (...) {
            errors[i] = std::current_exception();
        }
    }

    for (const auto& ep : errors) {
        if (ep) std::rethrow_exception(ep);
    }
    return outcomes;
}

}  // namespace bimetal
