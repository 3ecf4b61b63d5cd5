#include "bimetal/nonlinear_solver.hpp"
#include <Eigen/SparseLU>
#include <iostream>

namespace bimetal {

StepStatus NewtonSolver::solve(const Mesh& mesh, const ElasticityProblem& problem,
                               double t, Eigen::VectorXd& u,
                               const StepControl& control) {
    return iterate(mesh, problem, t, u, control, false);
}

StepStatus NewtonSolver::solve_damped(const Mesh& mesh, const ElasticityProblem& problem,
                                      double t, Eigen::VectorXd& u,
                                      const StepControl& control) {
    return iterate(mesh, problem, t, u, control, true);
}

StepStatus NewtonSolver::iterate(const Mesh& mesh, const ElasticityProblem& problem,
                                 double t, Eigen::VectorXd& u,
                                 const StepControl& control, bool damped) {
    GlobalAssembler assembler(mesh, problem);
    if (u.size() != assembler.num_dofs()) {
        u = Eigen::VectorXd::Zero(assembler.num_dofs());
    }
    // Clamped DOFs stay at zero
    const std::vector<int>& free_dofs = assembler.free_dof_map();
    Eigen::VectorXd u_free(free_dofs.size());
    for (size_t i = 0; i < free_dofs.size(); i++) u_free(i) = u(free_dofs[i]);
    u = assembler.expand(u_free);

    StepStatus status;
    Eigen::SparseLU<SpMatd> lu;
    bool pattern_analyzed = false;

    for (int it = 0; ; it++) {
        assembler.assemble(u, t);
        status.residual = assembler.R().norm();
        status.residual_history.push_back(status.residual);
        status.iterations = it;

        if (control.verbosity >= 2) {
            std::cerr << "[Newton] it=" << it << " residual=" << status.residual << "\n";
        }
        if (!std::isfinite(status.residual)) {
            status.message = "Residual is not finite";
            return status;
        }
        if (status.residual <= control.target_residual) {
            status.converged = true;
            status.message = "Converged";
            return status;
        }
        if (it >= control.max_iterations) {
            status.message = "Iteration budget exhausted";
            return status;
        }

        if (!pattern_analyzed) {
            lu.analyzePattern(assembler.K());
            pattern_analyzed = true;
        }
        lu.factorize(assembler.K());
        if (lu.info() != Eigen::Success) {
            status.message = "SparseLU factorization failed (singular tangent)";
            return status;
        }
        Eigen::VectorXd du = lu.solve(-assembler.R());
        if (lu.info() != Eigen::Success) {
            status.message = "SparseLU solve failed";
            return status;
        }
        Eigen::VectorXd step = assembler.expand(du);

        if (!damped) {
            u += step;
            continue;
        }

        // Halve the step while the energy increases
        double W0 = assembler.energy(u, t);
        double tol = 1e-12 * std::max(std::abs(W0), 1e-300);
        double lambda = 1.0;
        Eigen::VectorXd trial = u + step;
        while (lambda > min_damping && !(assembler.energy(trial, t) <= W0 + tol)) {
            lambda *= 0.5;
            trial = u + lambda * step;
        }
        if (control.verbosity >= 2 && lambda < 1.0) {
            std::cerr << "[Newton] damping=" << lambda << "\n";
        }
        u = trial;
    }
}

}  // namespace bimetal
