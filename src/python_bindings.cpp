#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/stl.h>

#include "bimetal/common.hpp"
#include "bimetal/errors.hpp"
#include "bimetal/material.hpp"
#include "bimetal/tensor.hpp"
#include "bimetal/misfit.hpp"
#include "bimetal/geometry.hpp"
#include "bimetal/element.hpp"
#include "bimetal/mesh.hpp"
#include "bimetal/assembler.hpp"
#include "bimetal/nonlinear_solver.hpp"
#include "bimetal/continuation.hpp"
#include "bimetal/statistics.hpp"
#include "bimetal/simulation.hpp"

#include <cstring>

namespace py = pybind11;
using namespace bimetal;

// Helper: convert Eigen sparse matrix to scipy.sparse.csc_matrix
template <typename Scalar>
py::object eigen_sparse_to_scipy(const Eigen::SparseMatrix<Scalar>& mat) {
    Eigen::SparseMatrix<Scalar> compressed = mat;
    compressed.makeCompressed();

    int nnz = static_cast<int>(compressed.nonZeros());
    int rows = static_cast<int>(compressed.rows());
    int cols = static_cast<int>(compressed.cols());
    int outer_size = static_cast<int>(compressed.outerSize());

    py::array_t<Scalar> data(nnz);
    py::array_t<int> indices(nnz);
    py::array_t<int> indptr(outer_size + 1);

    std::memcpy(data.mutable_data(), compressed.valuePtr(), nnz * sizeof(Scalar));
    std::memcpy(indices.mutable_data(), compressed.innerIndexPtr(), nnz * sizeof(int));
    std::memcpy(indptr.mutable_data(), compressed.outerIndexPtr(), (outer_size + 1) * sizeof(int));

    py::module_ scipy_sparse = py::module_::import("scipy.sparse");
    return scipy_sparse.attr("csc_matrix")(
        py::make_tuple(data, indices, indptr),
        py::make_tuple(rows, cols)
    );
}

PYBIND11_MODULE(_core, m) {
    m.doc() = "Lattice-mismatch bending of two-region (bimetal) strips";

    // --- Errors ---
    py::register_exception<ConfigurationError>(m, "ConfigurationError", PyExc_ValueError);
    py::register_exception<GeometryInconsistency>(m, "GeometryInconsistency", PyExc_ValueError);
    static py::exception<SolverNonConvergence> non_convergence(
        m, "SolverNonConvergence", PyExc_RuntimeError);
    // Carry the failed step details as attributes of the raised exception
    py::register_exception_translator([](std::exception_ptr p) {
        try {
            if (p) std::rethrow_exception(p);
        } catch (const SolverNonConvergence& e) {
            py::object err = non_convergence(e.what());
            err.attr("step") = e.step();
            err.attr("embedding") = e.embedding();
            err.attr("iterations") = e.iterations();
            err.attr("residual") = e.residual();
            PyErr_SetObject(non_convergence.ptr(), err.ptr());
        }
    });

    // --- Materials ---
    py::enum_<CrystalSymmetry>(m, "CrystalSymmetry")
        .value("ZINC_BLENDE_001", CrystalSymmetry::ZINC_BLENDE_001)
        .value("ZINC_BLENDE_2D", CrystalSymmetry::ZINC_BLENDE_2D)
        .value("ZINC_BLENDE_111_C14", CrystalSymmetry::ZINC_BLENDE_111_C14)
        .value("ZINC_BLENDE_111_C15", CrystalSymmetry::ZINC_BLENDE_111_C15)
        .value("ZINC_BLENDE_111_C14_C15", CrystalSymmetry::ZINC_BLENDE_111_C14_C15)
        .value("WURTZITE_0001", CrystalSymmetry::WURTZITE_0001);

    m.def("parse_crystal_symmetry", &parse_crystal_symmetry, py::arg("name"),
          "Parse a symmetry name such as 'ZincBlende001' or 'Wurtzite0001'");
    m.def("symmetry_name", [](CrystalSymmetry s) { return to_string(s); }, py::arg("symmetry"));
    m.def("available_alloys", &available_alloys);

    py::class_<MaterialConstants>(m, "MaterialConstants")
        .def(py::init<>())
        .def_readonly("formula", &MaterialConstants::formula)
        .def_readonly("symmetry", &MaterialConstants::symmetry)
        .def_readonly("composition", &MaterialConstants::composition)
        .def_readonly("C11", &MaterialConstants::C11, "GPa")
        .def_readonly("C12", &MaterialConstants::C12, "GPa")
        .def_readonly("C44", &MaterialConstants::C44, "GPa")
        .def_readonly("E14", &MaterialConstants::E14, "C/m^2")
        .def_readonly("E31_wz", &MaterialConstants::E31_wz)
        .def_readonly("E33_wz", &MaterialConstants::E33_wz)
        .def_readonly("E15_wz", &MaterialConstants::E15_wz)
        .def_readonly("lattice_constants", &MaterialConstants::lattice_constants, "Angstrom")
        .def_readonly("spontaneous_polarization", &MaterialConstants::spontaneous_polarization)
        .def_readonly("kappar", &MaterialConstants::kappar)
        .def("__repr__", [](const MaterialConstants& c) {
            return "<MaterialConstants " + c.formula + " " + to_string(c.symmetry) + ">";
        });

    m.def("resolve_material",
          py::overload_cast<const std::string&, double, CrystalSymmetry>(&resolve_material),
          py::arg("alloy"), py::arg("x"), py::arg("symmetry"),
          "Interpolate an alloy's constants at composition x");
    m.def("cubic_youngs_modulus", &cubic_youngs_modulus, py::arg("C11"), py::arg("C12"));

    // --- Tensors ---
    py::class_<MaterialTensors>(m, "MaterialTensors")
        .def(py::init<>())
        .def_readwrite("elasticity", &MaterialTensors::elasticity, "Voigt stiffness (N/nm^2)")
        .def_readwrite("piezoelectric", &MaterialTensors::piezoelectric, "Piezoelectric tensor (C/nm^2)")
        .def("dimension", &MaterialTensors::dimension);

    m.def("build_tensors", &build_tensors, py::arg("constants"), py::arg("symmetry"));
    m.def("rotate_stiffness", &rotate_stiffness, py::arg("C"), py::arg("R"));
    m.def("crystal_rotation", &crystal_rotation, py::arg("symmetry"));
    m.def("isotropic_stiffness", &isotropic_stiffness, py::arg("E"), py::arg("nu"), py::arg("dim"));

    // --- Misfit ---
    py::enum_<AveragingConvention>(m, "AveragingConvention")
        .value("REFERENCE_REGION", AveragingConvention::REFERENCE_REGION)
        .value("AREA_WEIGHTED_OWN", AveragingConvention::AREA_WEIGHTED_OWN)
        .value("AREA_WEIGHTED_AVERAGE", AveragingConvention::AREA_WEIGHTED_AVERAGE);

    py::class_<MisfitStrain>(m, "MisfitStrain")
        .def(py::init<>())
        .def_readonly("eigenstrain", &MisfitStrain::eigenstrain)
        .def_readonly("mismatch", &MisfitStrain::mismatch);

    m.def("lattice_mismatch",
          py::overload_cast<int, const std::array<double, 2>&, const std::array<double, 2>&>(
              &lattice_mismatch),
          py::arg("avgc"), py::arg("weights"), py::arg("lattice"));

    // --- Geometry / Mesh ---
    py::class_<BimetalGeometry>(m, "BimetalGeometry")
        .def(py::init<std::vector<double>, double>(),
             py::arg("scale"), py::arg("material_border"))
        .def_readwrite("scale", &BimetalGeometry::scale)
        .def_readwrite("material_border", &BimetalGeometry::material_border)
        .def("dimension", &BimetalGeometry::dimension)
        .def("region_thickness", &BimetalGeometry::region_thickness)
        .def("region_areas", &BimetalGeometry::region_areas)
        .def("validate", &BimetalGeometry::validate);

    py::class_<NodeSet>(m, "NodeSet")
        .def(py::init<>())
        .def_readwrite("name", &NodeSet::name)
        .def_readwrite("node_ids", &NodeSet::node_ids)
        .def("__repr__", [](const NodeSet& ns) {
            return "<NodeSet '" + ns.name + "' with " +
                   std::to_string(ns.node_ids.size()) + " nodes>";
        });

    py::class_<Mesh>(m, "Mesh")
        .def(py::init<>())
        .def_readwrite("dim", &Mesh::dim)
        .def_readwrite("order", &Mesh::order)
        .def_readwrite("nodes", &Mesh::nodes, "Node coordinates (N x dim)")
        .def_readwrite("elements", &Mesh::elements, "Simplex connectivity (E x nodes per element)")
        .def_readwrite("element_regions", &Mesh::element_regions, "Region tag per element")
        .def_readwrite("node_sets", &Mesh::node_sets)
        .def("load_from_gmsh", &Mesh::load_from_gmsh, py::arg("filename"),
             "Load mesh from Gmsh MSH 2.x file",
             py::call_guard<py::gil_scoped_release>())
        .def("load_from_arrays", &Mesh::load_from_arrays,
             py::arg("node_coords"), py::arg("element_connectivity"),
             py::arg("regions"), py::arg("node_sets"))
        .def("find_node_set", &Mesh::find_node_set, py::arg("name"),
             py::return_value_policy::reference_internal)
        .def("validate", &Mesh::validate)
        .def("num_nodes", &Mesh::num_nodes)
        .def("num_elements", &Mesh::num_elements)
        .def("num_dof", &Mesh::num_dof)
        .def("__repr__", [](const Mesh& m) {
            return "<Mesh " + std::to_string(m.dim) + "D order " + std::to_string(m.order) +
                   ", " + std::to_string(m.num_nodes()) + " nodes, " +
                   std::to_string(m.num_elements()) + " elements>";
        });

    m.def("build_bimetal_mesh", &build_bimetal_mesh,
          py::arg("geometry"), py::arg("order"), py::arg("refinements") = 0);

    // --- Problem / assembly ---
    py::class_<RegionOperator>(m, "RegionOperator")
        .def(py::init<>())
        .def_readwrite("region", &RegionOperator::region)
        .def_readwrite("elasticity", &RegionOperator::elasticity)
        .def_readwrite("piezoelectric", &RegionOperator::piezoelectric)
        .def_readwrite("eigenstrain", &RegionOperator::eigenstrain)
        .def_readwrite("mismatch", &RegionOperator::mismatch);

    py::class_<ElasticityProblem>(m, "ElasticityProblem")
        .def(py::init<>())
        .def_readwrite("name", &ElasticityProblem::name)
        .def_readwrite("operators", &ElasticityProblem::operators)
        .def_readwrite("clamped_sets", &ElasticityProblem::clamped_sets)
        .def_readwrite("nonlinear_strain", &ElasticityProblem::nonlinear_strain)
        .def_readwrite("quadrature_degree", &ElasticityProblem::quadrature_degree);

    py::class_<GlobalAssembler>(m, "GlobalAssembler")
        .def(py::init<const Mesh&, const ElasticityProblem&>(),
             py::arg("mesh"), py::arg("problem"),
             py::keep_alive<1, 2>(), py::keep_alive<1, 3>())
        .def("assemble", &GlobalAssembler::assemble, py::arg("u"), py::arg("t"))
        .def("residual", &GlobalAssembler::residual, py::arg("u"), py::arg("t"))
        .def("energy", &GlobalAssembler::energy, py::arg("u"), py::arg("t"))
        .def("expand", &GlobalAssembler::expand, py::arg("u_free"))
        .def_property_readonly("free_dof_map", &GlobalAssembler::free_dof_map)
        .def_property_readonly("R", &GlobalAssembler::R)
        .def_property_readonly("K", [](const GlobalAssembler& a) {
            return eigen_sparse_to_scipy(a.K());
        }, "Tangent on the free DOFs (scipy.sparse.csc_matrix)");

    // --- Solvers ---
    py::class_<StepStatus>(m, "StepStatus")
        .def(py::init<>())
        .def_readonly("converged", &StepStatus::converged)
        .def_readonly("iterations", &StepStatus::iterations)
        .def_readonly("residual", &StepStatus::residual)
        .def_readonly("residual_history", &StepStatus::residual_history)
        .def_readonly("message", &StepStatus::message)
        .def("__repr__", [](const StepStatus& s) {
            return "<StepStatus converged=" + std::string(s.converged ? "True" : "False") +
                   " iterations=" + std::to_string(s.iterations) + ">";
        });

    py::class_<SolverConfig>(m, "SolverConfig")
        .def(py::init<>())
        .def_readwrite("use_embedding", &SolverConfig::use_embedding)
        .def_readwrite("nsteps", &SolverConfig::nsteps)
        .def_readwrite("target_residual", &SolverConfig::target_residual)
        .def_readwrite("max_iterations", &SolverConfig::max_iterations)
        .def_readwrite("verbosity", &SolverConfig::verbosity);

    py::class_<EmbeddingSchedule>(m, "EmbeddingSchedule")
        .def(py::init<>())
        .def_readwrite("values", &EmbeddingSchedule::values)
        .def_readwrite("target_residuals", &EmbeddingSchedule::target_residuals)
        .def_readwrite("max_iterations", &EmbeddingSchedule::max_iterations)
        .def_static("uniform", &EmbeddingSchedule::uniform,
                    py::arg("nsteps"), py::arg("target_residual"), py::arg("max_iterations"))
        .def("validate", &EmbeddingSchedule::validate);

    py::class_<NonlinearSolver>(m, "NonlinearSolver");
    py::class_<NewtonSolver, NonlinearSolver>(m, "NewtonSolver")
        .def(py::init<>())
        .def_readwrite("min_damping", &NewtonSolver::min_damping);

    py::class_<DisplacementSolution>(m, "DisplacementSolution")
        .def(py::init<>())
        .def_readonly("dim", &DisplacementSolution::dim)
        .def_readonly("values", &DisplacementSolution::values)
        .def_readonly("steps", &DisplacementSolution::steps)
        .def("displacement", &DisplacementSolution::displacement, py::arg("node"))
        .def("deformed_nodes", &DisplacementSolution::deformed_nodes, py::arg("mesh"))
        .def("total_iterations", &DisplacementSolution::total_iterations);

    py::class_<ContinuationDriver>(m, "ContinuationDriver")
        .def(py::init<const Mesh&, const ElasticityProblem&, NonlinearSolver&>(),
             py::arg("mesh"), py::arg("problem"), py::arg("solver"),
             py::keep_alive<1, 2>(), py::keep_alive<1, 3>(), py::keep_alive<1, 4>())
        .def("solve_by_embedding", &ContinuationDriver::solve_by_embedding,
             py::arg("schedule"), py::arg("verbosity") = 0,
             py::call_guard<py::gil_scoped_release>())
        .def("solve_by_damping", &ContinuationDriver::solve_by_damping,
             py::arg("target_residual"), py::arg("max_iterations"), py::arg("verbosity") = 0,
             py::call_guard<py::gil_scoped_release>())
        .def("solve", &ContinuationDriver::solve, py::arg("config"),
             py::call_guard<py::gil_scoped_release>())
        .def_property_readonly("state", [](const ContinuationDriver& d) {
            return to_string(d.state());
        })
        .def_property_readonly("current_step", &ContinuationDriver::current_step)
        .def_property_readonly("current_embedding", &ContinuationDriver::current_embedding);

    // --- Statistics ---
    py::class_<BendingStatistics>(m, "BendingStatistics")
        .def(py::init<>())
        .def_readonly("angle", &BendingStatistics::angle, "degrees")
        .def_readonly("curvature", &BendingStatistics::curvature)
        .def_readonly("bend_distance", &BendingStatistics::bend_distance)
        .def_readonly("farthest_point_side", &BendingStatistics::farthest_point_side)
        .def_readonly("bend_direction", &BendingStatistics::bend_direction)
        .def_readonly("farthest_point", &BendingStatistics::farthest_point)
        .def_readonly("centerline", &BendingStatistics::centerline)
        .def("__repr__", [](const BendingStatistics& s) {
            return "<BendingStatistics angle=" + std::to_string(s.angle) +
                   " curvature=" + std::to_string(s.curvature) + ">";
        });

    m.def("compute_statistics", &compute_statistics,
          py::arg("mesh"), py::arg("solution"), py::arg("geometry"));
    m.def("analytic_curvature", &analytic_curvature,
          py::arg("youngs_modulus"), py::arg("mismatch"), py::arg("geometry"));
    m.def("bending_angle", &bending_angle,
          py::arg("bend_distance"), py::arg("curvature"), py::arg("side"));
    m.def("menger_curvature", &menger_curvature, py::arg("a"), py::arg("b"), py::arg("c"));

    // --- Simulation ---
    py::enum_<RegionMaterial::Kind>(m, "RegionMaterialKind")
        .value("ISOTROPIC", RegionMaterial::Kind::ISOTROPIC)
        .value("ALLOY", RegionMaterial::Kind::ALLOY);

    py::class_<RegionMaterial>(m, "RegionMaterial")
        .def(py::init<>())
        .def_readwrite("kind", &RegionMaterial::kind)
        .def_readwrite("E", &RegionMaterial::E)
        .def_readwrite("nu", &RegionMaterial::nu)
        .def_readwrite("alloy", &RegionMaterial::alloy)
        .def_readwrite("composition", &RegionMaterial::composition)
        .def_static("isotropic", &RegionMaterial::isotropic, py::arg("E"), py::arg("nu"))
        .def_static("from_alloy", &RegionMaterial::from_alloy,
                    py::arg("alloy"), py::arg("composition"));

    py::class_<SimulationConfig>(m, "SimulationConfig")
        .def(py::init<>())
        .def_readwrite("materials", &SimulationConfig::materials)
        .def_readwrite("symmetry", &SimulationConfig::symmetry)
        .def_readwrite("scale", &SimulationConfig::scale)
        .def_readwrite("material_border", &SimulationConfig::material_border)
        .def_readwrite("lattice_factor", &SimulationConfig::lattice_factor)
        .def_readwrite("averaging", &SimulationConfig::averaging)
        .def_readwrite("nonlinear_strain", &SimulationConfig::nonlinear_strain)
        .def_readwrite("solver", &SimulationConfig::solver)
        .def_readwrite("order", &SimulationConfig::order)
        .def_readwrite("refinements", &SimulationConfig::refinements)
        .def("geometry", &SimulationConfig::geometry)
        .def("validate", &SimulationConfig::validate);

    py::class_<SimulationResult>(m, "SimulationResult")
        .def_readonly("config", &SimulationResult::config)
        .def_readonly("constants", &SimulationResult::constants)
        .def_readonly("tensors", &SimulationResult::tensors)
        .def_readonly("lattice_constants", &SimulationResult::lattice_constants)
        .def_readonly("youngs_modulus", &SimulationResult::youngs_modulus)
        .def_readonly("misfit", &SimulationResult::misfit)
        .def_readonly("mesh", &SimulationResult::mesh)
        .def_readonly("solution", &SimulationResult::solution)
        .def_readonly("statistics", &SimulationResult::statistics)
        .def_readonly("analytic_curvature", &SimulationResult::analytic_curvature)
        .def_readonly("analytic_angle", &SimulationResult::analytic_angle)
        .def("__repr__", [](const SimulationResult& r) {
            return "<SimulationResult curvature=" + std::to_string(r.statistics.curvature) +
                   " analytic=" + std::to_string(r.analytic_curvature) + ">";
        });

    py::class_<SweepOutcome>(m, "SweepOutcome")
        .def_readonly("converged", &SweepOutcome::converged)
        .def_readonly("result", &SweepOutcome::result)
        .def_readonly("message", &SweepOutcome::message)
        .def_readonly("failed_step", &SweepOutcome::failed_step)
        .def_readonly("failed_embedding", &SweepOutcome::failed_embedding);

    m.def("run_simulation",
          py::overload_cast<const SimulationConfig&>(&run_simulation),
          py::arg("config"),
          "Run one bimetal configuration end to end",
          py::call_guard<py::gil_scoped_release>());
    m.def("run_sweep", &run_sweep, py::arg("configs"), py::arg("max_threads") = 0,
          "Run configurations in parallel; non-convergence is reported per outcome",
          py::call_guard<py::gil_scoped_release>());
}
