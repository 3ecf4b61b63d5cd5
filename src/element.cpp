#include "bimetal/element.hpp"
#include "bimetal/errors.hpp"
#include <algorithm>

namespace bimetal {

SimplexElement::SimplexElement(int dim, int order)
    : dim_(dim), order_(order) {
    int n = nodes_per_element(dim, order);
    node_coords = Eigen::MatrixXd::Zero(n, dim);

    Eigen::MatrixXd ref = reference_nodes(dim, order);
    lattice_.resize(n, dim + 1);
    for (int a = 0; a < n; a++) {
        int sum = 0;
        for (int i = 0; i < dim; i++) {
            int c = static_cast<int>(std::lround(order * ref(a, i)));
            lattice_(a, i + 1) = c;
            sum += c;
        }
        lattice_(a, 0) = order - sum;
    }
}

int SimplexElement::nodes_per_element(int dim, int order) {
    if (dim == 2 && order >= 1 && order <= 3) return (order + 1) * (order + 2) / 2;
    if (dim == 3 && order >= 1 && order <= 2) return (order + 1) * (order + 2) * (order + 3) / 6;
    throw GeometryInconsistency("No simplex element of order " + std::to_string(order) +
                                " in " + std::to_string(dim) + "D");
}

Eigen::MatrixXd SimplexElement::reference_nodes(int dim, int order) {
    int n = nodes_per_element(dim, order);
    Eigen::MatrixXd R(n, dim);
    if (dim == 2) {
        const double t = 1.0 / 3.0;
        switch (order) {
            case 1:
                R << 0.0, 0.0,
                     1.0, 0.0,
                     0.0, 1.0;
                break;
            case 2:
                R << 0.0, 0.0,
                     1.0, 0.0,
                     0.0, 1.0,
                     0.5, 0.0,
                     0.5, 0.5,
                     0.0, 0.5;
                break;
            default:
                R << 0.0, 0.0,
                     1.0, 0.0,
                     0.0, 1.0,
                     t, 0.0,
                     2.0 * t, 0.0,
                     2.0 * t, t,
                     t, 2.0 * t,
                     0.0, 2.0 * t,
                     0.0, t,
                     t, t;
                break;
        }
        return R;
    }

    if (order == 1) {
        R << 0.0, 0.0, 0.0,
             1.0, 0.0, 0.0,
             0.0, 1.0, 0.0,
             0.0, 0.0, 1.0;
    } else {
        R << 0.0, 0.0, 0.0,
             1.0, 0.0, 0.0,
             0.0, 1.0, 0.0,
             0.0, 0.0, 1.0,
             0.5, 0.0, 0.0,   // mid 0-1
             0.5, 0.5, 0.0,   // mid 1-2
             0.0, 0.5, 0.0,   // mid 0-2
             0.0, 0.0, 0.5,   // mid 0-3
             0.5, 0.0, 0.5,   // mid 1-3
             0.0, 0.5, 0.5;   // mid 2-3
    }
    return R;
}

// f_c(L) = prod_{m<c} (kL - m) / (m + 1), the 1D factor of a Lagrange simplex basis
static double lagrange_factor(int c, int k, double L) {
    double f = 1.0;
    for (int m = 0; m < c; m++) f *= (k * L - m) / (m + 1);
    return f;
}

static double lagrange_factor_derivative(int c, int k, double L) {
    double df = 0.0;
    for (int p = 0; p < c; p++) {
        double term = static_cast<double>(k) / (p + 1);
        for (int m = 0; m < c; m++) {
            if (m != p) term *= (k * L - m) / (m + 1);
        }
        df += term;
    }
    return df;
}

static Eigen::VectorXd barycentric(const Eigen::VectorXd& xi) {
    int dim = static_cast<int>(xi.size());
    Eigen::VectorXd L(dim + 1);
    L(0) = 1.0 - xi.sum();
    L.tail(dim) = xi;
    return L;
}

Eigen::VectorXd SimplexElement::shape_functions(const Eigen::VectorXd& xi) const {
    Eigen::VectorXd L = barycentric(xi);
    int n = num_nodes();
    Eigen::VectorXd N(n);
    for (int a = 0; a < n; a++) {
        double v = 1.0;
        for (int i = 0; i <= dim_; i++) v *= lagrange_factor(lattice_(a, i), order_, L(i));
        N(a) = v;
    }
    return N;
}

Eigen::MatrixXd SimplexElement::shape_derivatives(const Eigen::VectorXd& xi) const {
    Eigen::VectorXd L = barycentric(xi);
    int n = num_nodes();
    Eigen::MatrixXd dN(n, dim_);
    Eigen::VectorXd f(dim_ + 1), df(dim_ + 1);

    for (int a = 0; a < n; a++) {
        for (int i = 0; i <= dim_; i++) {
            f(i) = lagrange_factor(lattice_(a, i), order_, L(i));
            df(i) = lagrange_factor_derivative(lattice_(a, i), order_, L(i));
        }
        // dN/dL_i
        Eigen::VectorXd dNdL(dim_ + 1);
        for (int i = 0; i <= dim_; i++) {
            double v = df(i);
            for (int j = 0; j <= dim_; j++) {
                if (j != i) v *= f(j);
            }
            dNdL(i) = v;
        }
        // dL0/dxi_j = -1, dL(j+1)/dxi_j = 1
        for (int j = 0; j < dim_; j++) {
            dN(a, j) = dNdL(j + 1) - dNdL(0);
        }
    }
    return dN;
}

Eigen::MatrixXd SimplexElement::jacobian(const Eigen::VectorXd& xi) const {
    return shape_derivatives(xi).transpose() * node_coords;
}

Eigen::MatrixXd SimplexElement::physical_derivatives(const Eigen::VectorXd& xi,
                                                     double& det_J) const {
    Eigen::MatrixXd dNdxi = shape_derivatives(xi);
    Eigen::MatrixXd J = dNdxi.transpose() * node_coords;
    double det = J.determinant();

    double h = (node_coords.colwise().maxCoeff() - node_coords.colwise().minCoeff()).maxCoeff();
    if (!(std::abs(det) > 1e-12 * std::pow(h, dim_))) {
        throw GeometryInconsistency("Degenerate simplex element (det J = " +
                                    std::to_string(det) + ")");
    }
    det_J = std::abs(det);

    // dN/dX = dN/dxi * J^{-T}
    return dNdxi * J.inverse().transpose();
}

double SimplexElement::measure() const {
    QuadratureRule rule = quadrature(dim_, default_quadrature_degree(order_));
    double m = 0.0;
    for (size_t q = 0; q < rule.points.size(); q++) {
        double det_J = 0.0;
        physical_derivatives(rule.points[q], det_J);
        m += rule.weights[q] * det_J;
    }
    return m;
}

int SimplexElement::default_quadrature_degree(int order) {
    return std::max(1, 2 * (order - 1));
}

static Eigen::VectorXd point(double a, double b) {
    Eigen::VectorXd p(2);
    p << a, b;
    return p;
}

static Eigen::VectorXd point(double a, double b, double c) {
    Eigen::VectorXd p(3);
    p << a, b, c;
    return p;
}

QuadratureRule SimplexElement::quadrature(int dim, int degree) {
    QuadratureRule rule;
    if (dim == 2) {
        if (degree <= 1) {
            rule.degree = 1;
            rule.points = {point(1.0 / 3.0, 1.0 / 3.0)};
            rule.weights = {0.5};
        } else if (degree == 2) {
            rule.degree = 2;
            rule.points = {point(1.0 / 6.0, 1.0 / 6.0),
                           point(2.0 / 3.0, 1.0 / 6.0),
                           point(1.0 / 6.0, 2.0 / 3.0)};
            rule.weights = {1.0 / 6.0, 1.0 / 6.0, 1.0 / 6.0};
        } else if (degree <= 4) {
            // Dunavant 6-point rule, weights halved for the reference triangle area
            const double a = 0.445948490915965;
            const double wa = 0.223381589678011 / 2.0;
            const double b = 0.091576213509771;
            const double wb = 0.109951743655322 / 2.0;
            rule.degree = 4;
            rule.points = {point(a, a), point(1.0 - 2.0 * a, a), point(a, 1.0 - 2.0 * a),
                           point(b, b), point(1.0 - 2.0 * b, b), point(b, 1.0 - 2.0 * b)};
            rule.weights = {wa, wa, wa, wb, wb, wb};
        } else {
            throw ConfigurationError("No triangle quadrature of degree " + std::to_string(degree));
        }
        return rule;
    }

    if (dim == 3) {
        if (degree <= 1) {
            rule.degree = 1;
            rule.points = {point(0.25, 0.25, 0.25)};
            rule.weights = {1.0 / 6.0};
        } else if (degree == 2) {
            // 4-point rule, each weight 1/24
            const double a = 0.1381966011250105;
            const double b = 0.5854101966249685;
            rule.degree = 2;
            rule.points = {point(a, a, a), point(b, a, a), point(a, b, a), point(a, a, b)};
            rule.weights = {1.0 / 24.0, 1.0 / 24.0, 1.0 / 24.0, 1.0 / 24.0};
        } else if (degree == 3) {
            // 5-point Stroud rule (negative centroid weight)
            rule.degree = 3;
            rule.points = {point(0.25, 0.25, 0.25),
                           point(1.0 / 6.0, 1.0 / 6.0, 1.0 / 6.0),
                           point(0.5, 1.0 / 6.0, 1.0 / 6.0),
                           point(1.0 / 6.0, 0.5, 1.0 / 6.0),
                           point(1.0 / 6.0, 1.0 / 6.0, 0.5)};
            rule.weights = {-2.0 / 15.0, 3.0 / 40.0, 3.0 / 40.0, 3.0 / 40.0, 3.0 / 40.0};
        } else {
            throw ConfigurationError("No tetrahedron quadrature of degree " + std::to_string(degree));
        }
        return rule;
    }

    throw ConfigurationError("Quadrature requested for dimension " + std::to_string(dim));
}

}  // namespace bimetal
