#pragma once

#include "bimetal/common.hpp"
#include "bimetal/assembler.hpp"

namespace bimetal {

struct StepControl {
    double target_residual = 1e-12;  // absolute, Euclidean norm over the free DOFs
    int max_iterations = 100;
    int verbosity = 0;
};

struct StepStatus {
    bool converged = false;
    int iterations = 0;
    double residual = 0.0;
    std::vector<double> residual_history;  // residual before each iteration, then the final one
    std::string message;
};

// Solves the full nonlinear system of a problem at one embedding value.
// u holds the initial guess on entry and the last iterate on return.
class NonlinearSolver {
public:
    virtual ~NonlinearSolver() = default;

    virtual StepStatus solve(const Mesh& mesh, const ElasticityProblem& problem,
                             double t, Eigen::VectorXd& u,
                             const StepControl& control) = 0;

    // Damped iteration guided by the energy functional
    virtual StepStatus solve_damped(const Mesh& mesh, const ElasticityProblem& problem,
                                    double t, Eigen::VectorXd& u,
                                    const StepControl& control) = 0;
};

class NewtonSolver : public NonlinearSolver {
public:
    double min_damping = 1.0 / 1024.0;

    StepStatus solve(const Mesh& mesh, const ElasticityProblem& problem,
                     double t, Eigen::VectorXd& u,
                     const StepControl& control) override;

    StepStatus solve_damped(const Mesh& mesh, const ElasticityProblem& problem,
                            double t, Eigen::VectorXd& u,
                            const StepControl& control) override;

private:
    StepStatus iterate(const Mesh& mesh, const ElasticityProblem& problem,
                       double t, Eigen::VectorXd& u,
                       const StepControl& control, bool damped);
};

}  // namespace bimetal
