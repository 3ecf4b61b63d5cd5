#include <gtest/gtest.h>
#include "bimetal/simulation.hpp"
#include "bimetal/errors.hpp"
#include <cmath>

using namespace bimetal;

static SimulationConfig isotropic_config(double lattice_factor) {
    SimulationConfig config;
    config.materials = {RegionMaterial::isotropic(1e-6, 0.15),
                        RegionMaterial::isotropic(1e-6, 0.15)};
    config.lattice_factor = lattice_factor;
    return config;
}

// ---- Reference strip ----

TEST(Simulation, ReferenceStripBendsTowardSmallerLattice) {
    SimulationResult r = run_simulation(isotropic_config(0.02));

    EXPECT_EQ(r.lattice_constants[0], 5.0);
    EXPECT_DOUBLE_EQ(r.lattice_constants[1], 5.1);
    EXPECT_LT(r.misfit.mismatch[0], 0.0);
    EXPECT_GT(r.misfit.mismatch[1], 0.0);

    ASSERT_EQ(r.solution.steps.size(), 4u);
    for (const auto& s : r.solution.steps) EXPECT_TRUE(s.converged);

    EXPECT_GT(r.statistics.curvature, 0.0);
    EXPECT_EQ(r.statistics.bend_direction, -1);
    EXPECT_EQ(r.statistics.farthest_point_side, 1);
    EXPECT_NEAR(r.analytic_curvature, 4.4553319636678e-4, 1e-12);
    EXPECT_NEAR(r.statistics.curvature, r.analytic_curvature, 0.05 * r.analytic_curvature);
    EXPECT_NEAR(r.statistics.angle, r.analytic_angle, 0.05 * r.analytic_angle);
}

TEST(Simulation, CurvatureMatchesBeamTheory) {
    SimulationResult r = run_simulation(isotropic_config(0.01));
    EXPECT_GT(r.analytic_curvature, 0.0);
    EXPECT_NEAR(r.statistics.curvature, r.analytic_curvature, 0.05 * r.analytic_curvature);
    EXPECT_EQ(r.statistics.bend_direction, -1);
}

TEST(Simulation, NoMismatchLeavesStripStraight) {
    SimulationResult r = run_simulation(isotropic_config(0.0));
    EXPECT_EQ(r.statistics.bend_direction, 0);
    EXPECT_NEAR(r.statistics.curvature, 0.0, 1e-12);
    EXPECT_DOUBLE_EQ(r.analytic_curvature, 0.0);
    EXPECT_EQ(r.solution.total_iterations(), 0);
}

TEST(Simulation, DampedModeMatchesEmbedding) {
    SimulationConfig config = isotropic_config(0.005);
    SimulationResult embedded = run_simulation(config);
    config.solver.use_embedding = false;
    SimulationResult damped = run_simulation(config);
    ASSERT_EQ(damped.solution.steps.size(), 1u);
    EXPECT_NEAR(damped.statistics.curvature, embedded.statistics.curvature,
                1e-3 * embedded.statistics.curvature);
}

TEST(Simulation, ThreeDimensionalStripBends) {
    SimulationConfig config = isotropic_config(0.02);
    config.scale = {50.0, 200.0, 25.0};
    config.material_border = 0.5;
    SimulationResult r = run_simulation(config);
    EXPECT_EQ(r.mesh.dim, 3);
    EXPECT_EQ(r.tensors[0].elasticity.rows(), 6);
    EXPECT_GT(r.statistics.curvature, 0.0);
    EXPECT_EQ(r.statistics.bend_direction, -1);
}

TEST(Simulation, AlloyPairOnPlaneStrip) {
    SimulationConfig config;
    config.materials = {RegionMaterial::from_alloy("InGaAs", 0.0),
                        RegionMaterial::from_alloy("InGaAs", 0.1)};
    config.scale = {50.0, 400.0};
    SimulationResult r = run_simulation(config);

    ASSERT_TRUE(r.constants[0].has_value());
    ASSERT_TRUE(r.constants[1].has_value());
    EXPECT_DOUBLE_EQ(r.lattice_constants[0], r.constants[0]->lattice_constants(0));
    EXPECT_DOUBLE_EQ(r.lattice_constants[1], r.constants[1]->lattice_constants(0));
    EXPECT_NE(r.lattice_constants[0], r.lattice_constants[1]);
    EXPECT_EQ(r.tensors[0].elasticity.rows(), 3);
    EXPECT_GT(r.youngs_modulus[0], 0.0);
    EXPECT_GT(r.statistics.curvature, 0.0);
    EXPECT_NE(r.statistics.bend_direction, 0);
}

// ---- Configuration errors ----

TEST(Simulation, SingleMaterialLayoutIsRejected) {
    SimulationConfig config = isotropic_config(0.02);
    config.material_border = 0.0;
    EXPECT_THROW(run_simulation(config), GeometryInconsistency);
    config.material_border = 1.0;
    EXPECT_THROW(run_simulation(config), GeometryInconsistency);
}

TEST(Simulation, InvalidConfigurationsAreRejected) {
    SimulationConfig config = isotropic_config(0.02);
    config.averaging = 4;
    EXPECT_THROW(run_simulation(config), ConfigurationError);

    config = isotropic_config(0.02);
    config.materials[1] = RegionMaterial::from_alloy("Unobtainium", 0.5);
    EXPECT_THROW(run_simulation(config), ConfigurationError);

    config = isotropic_config(0.02);
    config.materials[0] = RegionMaterial::from_alloy("AlGaAs", 1.5);
    EXPECT_THROW(run_simulation(config), ConfigurationError);

    // Plane-strain symmetry on a 3D strip
    config = isotropic_config(0.02);
    config.scale = {50.0, 200.0, 25.0};
    config.materials[0] = RegionMaterial::from_alloy("GaAs", 0.0);
    EXPECT_THROW(run_simulation(config), ConfigurationError);

    config = isotropic_config(0.02);
    config.order = 4;
    EXPECT_THROW(run_simulation(config), GeometryInconsistency);
}

// ---- Region resolution ----

TEST(Simulation, MixedRegionsUseSyntheticLattice) {
    SimulationConfig config = isotropic_config(0.04);
    config.materials[0] = RegionMaterial::from_alloy("Test", 0.5);
    ResolvedRegions regions = resolve_regions(config);
    EXPECT_TRUE(regions.constants[0].has_value());
    EXPECT_FALSE(regions.constants[1].has_value());
    EXPECT_DOUBLE_EQ(regions.lattice_constants[0], 5.0);
    EXPECT_DOUBLE_EQ(regions.lattice_constants[1], 5.2);
    EXPECT_DOUBLE_EQ(regions.youngs_modulus[0], cubic_youngs_modulus(1200.0, 300.0));
    EXPECT_DOUBLE_EQ(regions.youngs_modulus[1], 1e-6);
}

TEST(Simulation, BuildProblemCarriesMisfit) {
    SimulationConfig config = isotropic_config(0.02);
    ResolvedRegions regions = resolve_regions(config);
    MisfitStrain misfit = misfit_for_geometry(averaging_from_int(config.averaging),
                                              config.geometry(), regions.lattice_constants);
    ElasticityProblem problem = build_problem(config, regions, misfit);
    ASSERT_EQ(problem.operators.size(), 2u);
    EXPECT_EQ(problem.region(1).eigenstrain, misfit.eigenstrain[0]);
    EXPECT_EQ(problem.region(2).eigenstrain, misfit.eigenstrain[1]);
    EXPECT_TRUE(problem.nonlinear_strain);
}

// ---- Sweep ----

TEST(Sweep, RecordsNonConvergencePerConfiguration) {
    SimulationConfig good = isotropic_config(0.01);
    SimulationConfig bad = isotropic_config(0.01);
    bad.solver.max_iterations = 1;
    bad.solver.target_residual = 1e-30;

    std::vector<SweepOutcome> outcomes = run_sweep({good, bad}, 2);
    ASSERT_EQ(outcomes.size(), 2u);

    EXPECT_TRUE(outcomes[0].converged);
    ASSERT_TRUE(outcomes[0].result.has_value());
    EXPECT_GT(outcomes[0].result->statistics.curvature, 0.0);

    EXPECT_FALSE(outcomes[1].converged);
    EXPECT_FALSE(outcomes[1].result.has_value());
    EXPECT_EQ(outcomes[1].failed_step, 1);
    EXPECT_DOUBLE_EQ(outcomes[1].failed_embedding, 0.25);
    EXPECT_FALSE(outcomes[1].message.empty());
}

TEST(Sweep, InvalidConfigurationAbortsBeforeRunning) {
    SimulationConfig good = isotropic_config(0.01);
    SimulationConfig bad = isotropic_config(0.01);
    bad.material_border = 1.0;
    EXPECT_THROW(run_sweep({good, bad}), GeometryInconsistency);
}
