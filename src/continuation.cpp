#include "bimetal/continuation.hpp"
#include "bimetal/errors.hpp"
#include <iostream>
#include <sstream>

namespace bimetal {

EmbeddingSchedule EmbeddingSchedule::uniform(int nsteps, double target_residual,
                                             int max_iterations) {
    if (nsteps < 1) {
        throw ConfigurationError("Embedding step count must be at least 1, got " +
                                 std::to_string(nsteps));
    }
    EmbeddingSchedule s;
    for (int k = 1; k <= nsteps; k++) {
        s.values.push_back(k == nsteps ? 1.0 : static_cast<double>(k) / nsteps);
        s.target_residuals.push_back(target_residual);
        s.max_iterations.push_back(max_iterations);
    }
    return s;
}

void EmbeddingSchedule::validate() const {
    if (values.empty()) {
        throw ConfigurationError("Embedding schedule is empty");
    }
    if (target_residuals.size() != values.size() || max_iterations.size() != values.size()) {
        throw ConfigurationError("Embedding schedule needs one residual target and one "
                                 "iteration budget per step");
    }
    double prev = 0.0;
    for (size_t k = 0; k < values.size(); k++) {
        if (!(values[k] > prev && values[k] <= 1.0)) {
            throw ConfigurationError("Embedding values must increase strictly within (0, 1]");
        }
        if (!(target_residuals[k] > 0.0)) {
            throw ConfigurationError("Residual target of step " + std::to_string(k + 1) +
                                     " must be positive");
        }
        if (max_iterations[k] < 1) {
            throw ConfigurationError("Iteration budget of step " + std::to_string(k + 1) +
                                     " must be at least 1");
        }
        prev = values[k];
    }
    if (values.back() != 1.0) {
        throw ConfigurationError("Embedding schedule must end at 1");
    }
}

void SolverConfig::validate() const {
    if (nsteps < 1)
        throw ConfigurationError("nsteps must be at least 1");
    if (!(target_residual > 0.0))
        throw ConfigurationError("target_residual must be positive");
    if (max_iterations < 1)
        throw ConfigurationError("max_iterations must be at least 1");
}

Eigen::VectorXd DisplacementSolution::displacement(int node) const {
    if (dim <= 0 || node < 0 || node >= values.size() / dim) {
        throw std::out_of_range("Node " + std::to_string(node) +
                                " is outside the displacement solution");
    }
    return values.segment(dim * node, dim);
}

Eigen::MatrixXd DisplacementSolution::deformed_nodes(const Mesh& mesh) const {
    if (values.size() != mesh.num_dof()) {
        throw std::invalid_argument("Displacement does not match the mesh");
    }
    Eigen::MatrixXd x = mesh.nodes;
    for (int n = 0; n < mesh.num_nodes(); n++) {
        x.row(n) += values.segment(dim * n, dim).transpose();
    }
    return x;
}

int DisplacementSolution::total_iterations() const {
    int total = 0;
    for (const auto& s : steps) total += s.iterations;
    return total;
}

std::string to_string(ContinuationDriver::State state) {
    switch (state) {
        case ContinuationDriver::State::IDLE: return "Idle";
        case ContinuationDriver::State::ASSEMBLING: return "Assembling";
        case ContinuationDriver::State::ITERATING: return "Iterating";
        case ContinuationDriver::State::CONVERGED: return "Converged";
        case ContinuationDriver::State::FAILED: return "Failed";
    }
    return "Unknown";
}

ContinuationDriver::ContinuationDriver(const Mesh& mesh, const ElasticityProblem& problem,
                                       NonlinearSolver& solver)
    : mesh_(mesh), problem_(problem), solver_(solver) {}

void ContinuationDriver::fail(int step, double t, const StepStatus& status,
                              const std::string& mode) {
    state_ = State::FAILED;
    std::ostringstream os;
    os << mode << " step " << step << " (t=" << t << ") did not converge after "
       << status.iterations << " iterations, residual " << status.residual;
    if (!status.message.empty()) os << ": " << status.message;
    throw SolverNonConvergence(step, t, status.iterations, status.residual, os.str());
}

DisplacementSolution ContinuationDriver::solve_by_embedding(const EmbeddingSchedule& schedule,
                                                            int verbosity) {
    schedule.validate();
    state_ = State::ASSEMBLING;
    step_ = 0;
    embedding_ = 0.0;

    // Raises geometry and operator errors before any solve
    GlobalAssembler check(mesh_, problem_);

    DisplacementSolution solution;
    solution.dim = mesh_.dim;
    Eigen::VectorXd u = Eigen::VectorXd::Zero(mesh_.num_dof());

    const int n = schedule.num_steps();
    for (int k = 0; k < n; k++) {
        step_ = k + 1;
        embedding_ = schedule.values[k];
        state_ = State::ITERATING;

        StepControl control;
        control.target_residual = schedule.target_residuals[k];
        control.max_iterations = schedule.max_iterations[k];
        control.verbosity = verbosity;

        StepStatus status = solver_.solve(mesh_, problem_, embedding_, u, control);
        if (verbosity >= 1) {
            std::cerr << "[Embedding] step " << step_ << "/" << n
                      << " t=" << embedding_
                      << " iterations=" << status.iterations
                      << " residual=" << status.residual
                      << (status.converged ? "" : " FAILED") << std::endl;
        }
        if (!status.converged) {
            fail(step_, embedding_, status, "Embedding");
        }
        solution.steps.push_back(std::move(status));
    }

    state_ = State::CONVERGED;
    solution.values = u;
    return solution;
}

DisplacementSolution ContinuationDriver::solve_by_damping(double target_residual,
                                                          int max_iterations,
                                                          int verbosity) {
    if (!(target_residual > 0.0) || max_iterations < 1) {
        throw ConfigurationError("Damped solve needs a positive residual target and "
                                 "at least one iteration");
    }
    state_ = State::ASSEMBLING;
    step_ = 0;
    embedding_ = 0.0;
    GlobalAssembler check(mesh_, problem_);

    DisplacementSolution solution;
    solution.dim = mesh_.dim;
    Eigen::VectorXd u = Eigen::VectorXd::Zero(mesh_.num_dof());

    step_ = 1;
    embedding_ = 1.0;
    state_ = State::ITERATING;

    StepControl control;
    control.target_residual = target_residual;
    control.max_iterations = max_iterations;
    control.verbosity = verbosity;

    StepStatus status = solver_.solve_damped(mesh_, problem_, 1.0, u, control);
    if (verbosity >= 1) {
        std::cerr << "[Damping] iterations=" << status.iterations
                  << " residual=" << status.residual
                  << (status.converged ? "" : " FAILED") << std::endl;
    }
    if (!status.converged) {
        fail(1, 1.0, status, "Damped");
    }
    solution.steps.push_back(std::move(status));

    state_ = State::CONVERGED;
    solution.values = u;
    return solution;
}

DisplacementSolution ContinuationDriver::solve(const SolverConfig& config) {
    config.validate();
    if (config.use_embedding) {
        return solve_by_embedding(
            EmbeddingSchedule::uniform(config.nsteps, config.target_residual,
                                       config.max_iterations),
            config.verbosity);
    }
    return solve_by_damping(config.target_residual, config.max_iterations, config.verbosity);
}

}  // namespace bimetal
