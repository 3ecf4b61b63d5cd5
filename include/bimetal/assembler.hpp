#pragma once

#include "bimetal/common.hpp"
#include "bimetal/mesh.hpp"

namespace bimetal {

// Per-region data of the misfit operator
struct RegionOperator {
    int region = 1;
    Eigen::MatrixXd elasticity;     // Voigt, N/nm^2 (6x6 is projected to the plane on 2D meshes)
    Eigen::MatrixXd piezoelectric;  // carried with the region; no electric field is solved
    double eigenstrain = 0.0;       // eps0, applied isotropically
    double mismatch = 0.0;          // alpha
};

// St. Venant-Kirchhoff elasticity with an isotropic eigenstrain per region:
//   E = 1/2 (G + G^T + s G^T G) - t eps0 I,  S = C : E,  P = (I + s G) S
// with s = t when nonlinear_strain is set and s = 0 otherwise.
struct ElasticityProblem {
    std::string name = "bimetal";
    std::vector<RegionOperator> operators;
    std::vector<std::string> clamped_sets = {"clamp"};
    bool nonlinear_strain = true;
    int quadrature_degree = 0;  // 0 = 2 (k - 1) for element order k

    // Throws ConfigurationError if no operator has this region tag
    const RegionOperator& region(int tag) const;
};

class GlobalAssembler {
public:
    GlobalAssembler(const Mesh& mesh, const ElasticityProblem& problem);

    // Tangent K and residual R on the free DOFs for the full displacement u
    void assemble(const Eigen::VectorXd& u, double t);

    Eigen::VectorXd residual(const Eigen::VectorXd& u, double t) const;
    double energy(const Eigen::VectorXd& u, double t) const;

    const SpMatd& K() const { return K_; }
    const Eigen::VectorXd& R() const { return R_; }

    const std::vector<int>& free_dof_map() const { return free_dof_map_; }
    int num_free_dofs() const { return static_cast<int>(free_dof_map_.size()); }
    int num_dofs() const { return mesh_.num_dof(); }

    // Scatter a free-DOF vector into the full vector (zeros at clamped DOFs)
    Eigen::VectorXd expand(const Eigen::VectorXd& u_free) const;

    double nonlinear_strength(double t) const { return problem_.nonlinear_strain ? t : 0.0; }

private:
    const Mesh& mesh_;
    const ElasticityProblem& problem_;

    std::vector<int> full_to_free_;
    std::vector<int> free_dof_map_;

    // Per element: projected elasticity index, eigenstrain and quadrature data
    std::vector<Eigen::MatrixXd> elasticity_;  // one per operator
    std::vector<int> element_operator_;
    std::vector<std::vector<Eigen::MatrixXd>> dNdX_;
    std::vector<std::vector<double>> weights_;

    SpMatd K_;
    Eigen::VectorXd R_;

    void classify_dofs();
    void precompute_elements();
    void element_dofs(int e, Eigen::VectorXi& dof_map) const;

    // Element residual (and tangent when Ke is non-null); returns the element energy
    double element_response(int e, const Eigen::VectorXd& u, double t,
                            Eigen::VectorXd& Re, Eigen::MatrixXd* Ke) const;

    void add_element_matrix(std::vector<Triplet>& triplets,
                            const Eigen::MatrixXd& Ke,
                            const Eigen::VectorXi& dof_map) const;
};

}  // namespace bimetal
