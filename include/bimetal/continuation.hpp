#pragma once

#include "bimetal/common.hpp"
#include "bimetal/mesh.hpp"
#include "bimetal/assembler.hpp"
#include "bimetal/nonlinear_solver.hpp"

namespace bimetal {

// Strictly increasing embedding values in (0, 1] ending at 1, each with its
// own residual target and iteration budget. t = 0 is the undeformed start.
struct EmbeddingSchedule {
    std::vector<double> values;
    std::vector<double> target_residuals;
    std::vector<int> max_iterations;

    // t_k = k / nsteps, k = 1..nsteps
    static EmbeddingSchedule uniform(int nsteps, double target_residual, int max_iterations);

    int num_steps() const { return static_cast<int>(values.size()); }

    // Throws ConfigurationError
    void validate() const;
};

struct SolverConfig {
    bool use_embedding = true;   // false: damped iteration on the full problem
    int nsteps = 4;
    double target_residual = 1e-12;
    int max_iterations = 100;
    int verbosity = 0;           // 0 silent, 1 per step, 2 per iteration

    void validate() const;
};

struct DisplacementSolution {
    int dim = 2;
    Eigen::VectorXd values;          // node-major (u_x, u_y[, u_z]) per node
    std::vector<StepStatus> steps;   // one per continuation step

    Eigen::VectorXd displacement(int node) const;
    Eigen::MatrixXd deformed_nodes(const Mesh& mesh) const;
    int total_iterations() const;
};

class ContinuationDriver {
public:
    enum class State { IDLE, ASSEMBLING, ITERATING, CONVERGED, FAILED };

    ContinuationDriver(const Mesh& mesh, const ElasticityProblem& problem,
                       NonlinearSolver& solver);

    // Solve at each scheduled embedding value, starting every step from the
    // previous solution. Throws SolverNonConvergence at the first failed step.
    DisplacementSolution solve_by_embedding(const EmbeddingSchedule& schedule,
                                            int verbosity = 0);

    // Damped iteration on the fully embedded (t = 1) problem
    DisplacementSolution solve_by_damping(double target_residual, int max_iterations,
                                          int verbosity = 0);

    DisplacementSolution solve(const SolverConfig& config);

    State state() const { return state_; }
    int current_step() const { return step_; }
    double current_embedding() const { return embedding_; }

private:
    const Mesh& mesh_;
    const ElasticityProblem& problem_;
    NonlinearSolver& solver_;

    State state_ = State::IDLE;
    int step_ = 0;
    double embedding_ = 0.0;

    void fail(int step, double t, const StepStatus& status, const std::string& mode);
};

std::string to_string(ContinuationDriver::State state);

}  // namespace bimetal
