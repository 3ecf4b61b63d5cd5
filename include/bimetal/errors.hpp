#pragma once

#include <stdexcept>
#include <string>

namespace bimetal {

// Invalid symmetry, alloy, composition, averaging convention or tensor.
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what)
        : std::invalid_argument(what) {}
};

// Bimetal shape, region layout or mesh that cannot be simulated.
class GeometryInconsistency : public std::invalid_argument {
public:
    explicit GeometryInconsistency(const std::string& what)
        : std::invalid_argument(what) {}
};

// A continuation (or damped) step exhausted its iteration budget.
class SolverNonConvergence : public std::runtime_error {
public:
    SolverNonConvergence(int step, double embedding, int iterations,
                         double residual, const std::string& what)
        : std::runtime_error(what),
          step_(step), embedding_(embedding),
          iterations_(iterations), residual_(residual) {}

    int step() const { return step_; }
    double embedding() const { return embedding_; }
    int iterations() const { return iterations_; }
    double residual() const { return residual_; }

private:
    int step_;
    double embedding_;
    int iterations_;
    double residual_;
};

}  // namespace bimetal
