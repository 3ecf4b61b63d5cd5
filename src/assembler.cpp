#include "bimetal/assembler.hpp"
#include "bimetal/errors.hpp"
#include "bimetal/tensor.hpp"
#include <set>

namespace bimetal {

const RegionOperator& ElasticityProblem::region(int tag) const {
    for (const auto& op : operators) {
        if (op.region == tag) return op;
    }
    throw ConfigurationError("Problem '" + name + "' has no operator for region " +
                             std::to_string(tag));
}

GlobalAssembler::GlobalAssembler(const Mesh& mesh, const ElasticityProblem& problem)
    : mesh_(mesh), problem_(problem) {
    mesh_.validate();
    classify_dofs();
    precompute_elements();
}

void GlobalAssembler::classify_dofs() {
    const int dim = mesh_.dim;
    std::set<int> constrained;
    for (const auto& name : problem_.clamped_sets) {
        const NodeSet* ns = mesh_.find_node_set(name);
        if (!ns) {
            throw GeometryInconsistency("Mesh has no node set '" + name +
                                        "' for the clamped boundary");
        }
        for (int n : ns->node_ids) {
            for (int d = 0; d < dim; d++) constrained.insert(dim * n + d);
        }
    }
    if (constrained.empty()) {
        throw GeometryInconsistency("Problem '" + problem_.name + "' has no clamped DOFs");
    }

    int ndof = mesh_.num_dof();
    full_to_free_.assign(ndof, -1);
    free_dof_map_.clear();
    free_dof_map_.reserve(ndof - constrained.size());
    for (int i = 0; i < ndof; i++) {
        if (constrained.find(i) == constrained.end()) {
            full_to_free_[i] = static_cast<int>(free_dof_map_.size());
            free_dof_map_.push_back(i);
        }
    }
}

void GlobalAssembler::precompute_elements() {
    const int dim = mesh_.dim;
    const int nvoigt = (dim == 2) ? 3 : 6;

    elasticity_.clear();
    for (const auto& op : problem_.operators) {
        const Eigen::MatrixXd& C = op.elasticity;
        std::string context = "region " + std::to_string(op.region);
        if (dim == 2 && C.rows() == 6 && C.cols() == 6) {
            Matrix6d C6 = C;
            elasticity_.push_back(plane_projection(C6));
        } else if (C.rows() == nvoigt && C.cols() == nvoigt) {
            elasticity_.push_back(C);
        } else {
            throw ConfigurationError("Elasticity tensor of " + context + " is " +
                                     std::to_string(C.rows()) + "x" + std::to_string(C.cols()) +
                                     ", incompatible with a " + std::to_string(dim) + "D mesh");
        }
        validate_elasticity(elasticity_.back(), context);
    }

    int degree = problem_.quadrature_degree > 0
        ? problem_.quadrature_degree
        : SimplexElement::default_quadrature_degree(mesh_.order);
    QuadratureRule rule = SimplexElement::quadrature(dim, degree);

    int n_elem = mesh_.num_elements();
    element_operator_.assign(n_elem, -1);
    dNdX_.assign(n_elem, {});
    weights_.assign(n_elem, {});
    for (int e = 0; e < n_elem; e++) {
        int tag = mesh_.element_regions(e);
        for (size_t k = 0; k < problem_.operators.size(); k++) {
            if (problem_.operators[k].region == tag) element_operator_[e] = static_cast<int>(k);
        }
        if (element_operator_[e] < 0) {
            throw ConfigurationError("Problem '" + problem_.name + "' has no operator for region " +
                                     std::to_string(tag));
        }

        SimplexElement elem = mesh_.element(e);
        for (size_t q = 0; q < rule.points.size(); q++) {
            double det_J = 0.0;
            dNdX_[e].push_back(elem.physical_derivatives(rule.points[q], det_J));
            weights_[e].push_back(rule.weights[q] * det_J);
        }
    }
}

void GlobalAssembler::element_dofs(int e, Eigen::VectorXi& dof_map) const {
    const int dim = mesh_.dim;
    const int npe = mesh_.nodes_per_element();
    dof_map.resize(dim * npe);
    for (int n = 0; n < npe; n++) {
        int node_id = mesh_.elements(e, n);
        for (int d = 0; d < dim; d++) dof_map(dim * n + d) = dim * node_id + d;
    }
}

double GlobalAssembler::element_response(int e, const Eigen::VectorXd& u, double t,
                                         Eigen::VectorXd& Re, Eigen::MatrixXd* Ke) const {
    const int dim = mesh_.dim;
    const int npe = mesh_.nodes_per_element();
    const int nvoigt = (dim == 2) ? 3 : 6;
    const int nedof = dim * npe;
    const double s = nonlinear_strength(t);

    const int k = element_operator_[e];
    const Eigen::MatrixXd& C = elasticity_[k];
    const double eps0 = t * problem_.operators[k].eigenstrain;

    // Voigt pairs: 3D xx, yy, zz, yz, xz, xy; 2D xx, yy, xy
    static const int pairs3[6][2] = {{0, 0}, {1, 1}, {2, 2}, {1, 2}, {0, 2}, {0, 1}};
    static const int pairs2[3][2] = {{0, 0}, {1, 1}, {0, 1}};
    auto pair = [&](int v, int c) { return dim == 2 ? pairs2[v][c] : pairs3[v][c]; };

    Eigen::MatrixXd U(npe, dim);
    for (int n = 0; n < npe; n++) {
        int node_id = mesh_.elements(e, n);
        for (int d = 0; d < dim; d++) U(n, d) = u(dim * node_id + d);
    }

    Re = Eigen::VectorXd::Zero(nedof);
    if (Ke) *Ke = Eigen::MatrixXd::Zero(nedof, nedof);
    double energy = 0.0;

    Eigen::MatrixXd B(nvoigt, nedof);
    for (size_t q = 0; q < dNdX_[e].size(); q++) {
        const Eigen::MatrixXd& dN = dNdX_[e][q];
        const double w = weights_[e][q];

        // G(i, I) = du_i / dX_I
        Eigen::MatrixXd G = U.transpose() * dN;
        Eigen::MatrixXd F = Eigen::MatrixXd::Identity(dim, dim) + s * G;
        Eigen::MatrixXd E = 0.5 * (G + G.transpose() + s * G.transpose() * G);
        E.diagonal().array() -= eps0;

        Eigen::VectorXd strain(nvoigt);
        for (int v = 0; v < nvoigt; v++) {
            int I = pair(v, 0), J = pair(v, 1);
            strain(v) = (I == J) ? E(I, J) : 2.0 * E(I, J);
        }
        Eigen::VectorXd stress = C * strain;
        energy += 0.5 * w * strain.dot(stress);

        // Variation of the Green strain for u = N_a e_j
        for (int a = 0; a < npe; a++) {
            for (int j = 0; j < dim; j++) {
                int col = dim * a + j;
                for (int v = 0; v < nvoigt; v++) {
                    int I = pair(v, 0), J = pair(v, 1);
                    B(v, col) = (I == J) ? F(j, I) * dN(a, I)
                                         : F(j, I) * dN(a, J) + F(j, J) * dN(a, I);
                }
            }
        }

        Re.noalias() += w * B.transpose() * stress;

        if (Ke) {
            Ke->noalias() += w * B.transpose() * C * B;
            if (s != 0.0) {
                Eigen::MatrixXd S(dim, dim);
                for (int v = 0; v < nvoigt; v++) {
                    int I = pair(v, 0), J = pair(v, 1);
                    S(I, J) = S(J, I) = stress(v);
                }
                Eigen::MatrixXd geo = s * w * (dN * S * dN.transpose());
                for (int a = 0; a < npe; a++) {
                    for (int b = 0; b < npe; b++) {
                        for (int j = 0; j < dim; j++) {
                            (*Ke)(dim * a + j, dim * b + j) += geo(a, b);
                        }
                    }
                }
            }
        }
    }
    return energy;
}

void GlobalAssembler::assemble(const Eigen::VectorXd& u, double t) {
    if (u.size() != mesh_.num_dof()) {
        throw std::invalid_argument("Displacement has " + std::to_string(u.size()) +
                                    " entries, expected " + std::to_string(mesh_.num_dof()));
    }
    const int n_elem = mesh_.num_elements();
    const int nedof = mesh_.dim * mesh_.nodes_per_element();

    std::vector<Triplet> triplets;
    triplets.reserve(static_cast<size_t>(n_elem) * nedof * nedof);
    R_ = Eigen::VectorXd::Zero(num_free_dofs());

    Eigen::VectorXi dof_map;
    Eigen::VectorXd Re;
    Eigen::MatrixXd Ke;
    for (int e = 0; e < n_elem; e++) {
        element_dofs(e, dof_map);
        element_response(e, u, t, Re, &Ke);
        add_element_matrix(triplets, Ke, dof_map);
        for (int i = 0; i < nedof; i++) {
            int fi = full_to_free_[dof_map(i)];
            if (fi >= 0) R_(fi) += Re(i);
        }
    }

    K_.resize(num_free_dofs(), num_free_dofs());
    K_.setFromTriplets(triplets.begin(), triplets.end());
}

Eigen::VectorXd GlobalAssembler::residual(const Eigen::VectorXd& u, double t) const {
    if (u.size() != mesh_.num_dof()) {
        throw std::invalid_argument("Displacement has " + std::to_string(u.size()) +
                                    " entries, expected " + std::to_string(mesh_.num_dof()));
    }
    Eigen::VectorXd R = Eigen::VectorXd::Zero(num_free_dofs());
    Eigen::VectorXi dof_map;
    Eigen::VectorXd Re;
    for (int e = 0; e < mesh_.num_elements(); e++) {
        element_dofs(e, dof_map);
        element_response(e, u, t, Re, nullptr);
        for (int i = 0; i < dof_map.size(); i++) {
            int fi = full_to_free_[dof_map(i)];
            if (fi >= 0) R(fi) += Re(i);
        }
    }
    return R;
}

double GlobalAssembler::energy(const Eigen::VectorXd& u, double t) const {
    if (u.size() != mesh_.num_dof()) {
        throw std::invalid_argument("Displacement has " + std::to_string(u.size()) +
                                    " entries, expected " + std::to_string(mesh_.num_dof()));
    }
    double W = 0.0;
    Eigen::VectorXd Re;
    for (int e = 0; e < mesh_.num_elements(); e++) {
        W += element_response(e, u, t, Re, nullptr);
    }
    return W;
}

Eigen::VectorXd GlobalAssembler::expand(const Eigen::VectorXd& u_free) const {
    Eigen::VectorXd u = Eigen::VectorXd::Zero(mesh_.num_dof());
    for (int i = 0; i < static_cast<int>(free_dof_map_.size()); i++) {
        u(free_dof_map_[i]) = u_free(i);
    }
    return u;
}

void GlobalAssembler::add_element_matrix(
    std::vector<Triplet>& triplets,
    const Eigen::MatrixXd& Ke,
    const Eigen::VectorXi& dof_map) const {
    int n = static_cast<int>(dof_map.size());
    for (int i = 0; i < n; i++) {
        int fi = full_to_free_[dof_map(i)];
        if (fi < 0) continue;
        for (int j = 0; j < n; j++) {
            int fj = full_to_free_[dof_map(j)];
            // Explicit zeros keep the pattern fixed across Newton iterations
            if (fj >= 0) {
                triplets.emplace_back(fi, fj, Ke(i, j));
            }
        }
    }
}

}  // namespace bimetal
