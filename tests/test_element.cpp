#include <gtest/gtest.h>
#include "bimetal/element.hpp"
#include "bimetal/errors.hpp"
#include <cmath>

using namespace bimetal;

// (dim, order) of every supported simplex
static const int kElementTypes[5][2] = {{2, 1}, {2, 2}, {2, 3}, {3, 1}, {3, 2}};

static SimplexElement make_reference(int dim, int order) {
    SimplexElement elem(dim, order);
    elem.node_coords = SimplexElement::reference_nodes(dim, order);
    return elem;
}

static double factorial(int n) {
    double f = 1.0;
    for (int i = 2; i <= n; i++) f *= i;
    return f;
}

// --- Shape functions ---

TEST(Simplex, NodeCounts) {
    EXPECT_EQ(SimplexElement::nodes_per_element(2, 1), 3);
    EXPECT_EQ(SimplexElement::nodes_per_element(2, 2), 6);
    EXPECT_EQ(SimplexElement::nodes_per_element(2, 3), 10);
    EXPECT_EQ(SimplexElement::nodes_per_element(3, 1), 4);
    EXPECT_EQ(SimplexElement::nodes_per_element(3, 2), 10);
    EXPECT_THROW(SimplexElement::nodes_per_element(3, 3), GeometryInconsistency);
    EXPECT_THROW(SimplexElement::nodes_per_element(1, 1), GeometryInconsistency);
}

TEST(Simplex, PartitionOfUnity) {
    for (const auto& t : kElementTypes) {
        SimplexElement elem(t[0], t[1]);
        Eigen::VectorXd xi = Eigen::VectorXd::Constant(t[0], 0.17);
        xi(0) = 0.31;
        EXPECT_NEAR(elem.shape_functions(xi).sum(), 1.0, 1e-13) << t[0] << "D order " << t[1];
        Eigen::MatrixXd dN = elem.shape_derivatives(xi);
        for (int j = 0; j < t[0]; j++) {
            EXPECT_NEAR(dN.col(j).sum(), 0.0, 1e-12) << t[0] << "D order " << t[1];
        }
    }
}

TEST(Simplex, KroneckerAtNodes) {
    for (const auto& t : kElementTypes) {
        SimplexElement elem(t[0], t[1]);
        Eigen::MatrixXd ref = SimplexElement::reference_nodes(t[0], t[1]);
        for (int a = 0; a < ref.rows(); a++) {
            Eigen::VectorXd N = elem.shape_functions(ref.row(a).transpose());
            for (int b = 0; b < ref.rows(); b++) {
                EXPECT_NEAR(N(b), a == b ? 1.0 : 0.0, 1e-12)
                    << t[0] << "D order " << t[1] << " node " << a << " fn " << b;
            }
        }
    }
}

TEST(Simplex, DerivativesMatchFiniteDifference) {
    const double h = 1e-6;
    for (const auto& t : kElementTypes) {
        SimplexElement elem(t[0], t[1]);
        Eigen::VectorXd xi = Eigen::VectorXd::Constant(t[0], 0.2);
        Eigen::MatrixXd dN = elem.shape_derivatives(xi);
        for (int j = 0; j < t[0]; j++) {
            Eigen::VectorXd xp = xi, xm = xi;
            xp(j) += h;
            xm(j) -= h;
            Eigen::VectorXd fd = (elem.shape_functions(xp) - elem.shape_functions(xm)) / (2 * h);
            EXPECT_LT((fd - dN.col(j)).cwiseAbs().maxCoeff(), 1e-7)
                << t[0] << "D order " << t[1] << " direction " << j;
        }
    }
}

TEST(Simplex, Tri10EdgeNodesFollowGmshOrdering) {
    Eigen::MatrixXd ref = SimplexElement::reference_nodes(2, 3);
    // Nodes 3, 4 lie on edge 0->1 at 1/3 and 2/3
    EXPECT_NEAR(ref(3, 0), 1.0 / 3.0, 1e-15);
    EXPECT_NEAR(ref(4, 0), 2.0 / 3.0, 1e-15);
    EXPECT_NEAR(ref(3, 1), 0.0, 1e-15);
    // Node 9 is the centroid
    EXPECT_NEAR(ref(9, 0), 1.0 / 3.0, 1e-15);
    EXPECT_NEAR(ref(9, 1), 1.0 / 3.0, 1e-15);
}

// --- Mapping ---

TEST(Simplex, ReferenceMeasure) {
    for (const auto& t : kElementTypes) {
        SimplexElement elem = make_reference(t[0], t[1]);
        EXPECT_NEAR(elem.measure(), t[0] == 2 ? 0.5 : 1.0 / 6.0, 1e-13);
    }
}

TEST(Simplex, ScaledTriangleAreaAndGradients) {
    SimplexElement elem = make_reference(2, 2);
    elem.node_coords.col(0) *= 4.0;
    elem.node_coords.col(1) *= 2.0;
    EXPECT_NEAR(elem.measure(), 4.0, 1e-12);

    // Interpolating x reproduces dx/dX = 1, dx/dY = 0
    Eigen::VectorXd xi(2);
    xi << 0.2, 0.3;
    double det_J = 0.0;
    Eigen::MatrixXd dNdX = elem.physical_derivatives(xi, det_J);
    EXPECT_NEAR(det_J, 8.0, 1e-12);
    Eigen::VectorXd grad_x = dNdX.transpose() * elem.node_coords.col(0);
    EXPECT_NEAR(grad_x(0), 1.0, 1e-12);
    EXPECT_NEAR(grad_x(1), 0.0, 1e-12);
}

TEST(Simplex, ReversedOrientationUsesAbsoluteDeterminant) {
    SimplexElement elem(2, 1);
    elem.node_coords << 0.0, 0.0,
                        0.0, 1.0,
                        1.0, 0.0;
    EXPECT_NEAR(elem.measure(), 0.5, 1e-14);
}

TEST(Simplex, DegenerateElementThrows) {
    SimplexElement elem(2, 1);
    elem.node_coords << 0.0, 0.0,
                        1.0, 0.0,
                        2.0, 0.0;
    double det_J = 0.0;
    Eigen::VectorXd xi = Eigen::VectorXd::Constant(2, 1.0 / 3.0);
    EXPECT_THROW(elem.physical_derivatives(xi, det_J), GeometryInconsistency);
}

TEST(Simplex, Tet10LinearFieldPatch) {
    SimplexElement elem = make_reference(3, 2);
    elem.node_coords.col(2) *= 3.0;
    // u = 2x - y + 0.5z has a constant gradient
    Eigen::VectorXd u = 2.0 * elem.node_coords.col(0) - elem.node_coords.col(1)
                      + 0.5 * elem.node_coords.col(2);
    Eigen::VectorXd xi(3);
    xi << 0.1, 0.2, 0.3;
    double det_J = 0.0;
    Eigen::VectorXd grad = elem.physical_derivatives(xi, det_J).transpose() * u;
    EXPECT_NEAR(grad(0), 2.0, 1e-12);
    EXPECT_NEAR(grad(1), -1.0, 1e-12);
    EXPECT_NEAR(grad(2), 0.5, 1e-12);
}

// --- Quadrature ---

TEST(Quadrature, TriangleRulesAreExact) {
    for (int degree : {1, 2, 4}) {
        QuadratureRule rule = SimplexElement::quadrature(2, degree);
        EXPECT_EQ(rule.degree, degree);
        for (int a = 0; a <= degree; a++) {
            for (int b = 0; a + b <= degree; b++) {
                double q = 0.0;
                for (size_t k = 0; k < rule.points.size(); k++) {
                    q += rule.weights[k] * std::pow(rule.points[k](0), a) *
                         std::pow(rule.points[k](1), b);
                }
                double exact = factorial(a) * factorial(b) / factorial(a + b + 2);
                EXPECT_NEAR(q, exact, 1e-12) << "degree " << degree << " x^" << a << " y^" << b;
            }
        }
    }
}

TEST(Quadrature, TetrahedronRulesAreExact) {
    for (int degree : {1, 2, 3}) {
        QuadratureRule rule = SimplexElement::quadrature(3, degree);
        EXPECT_EQ(rule.degree, degree);
        for (int a = 0; a <= degree; a++) {
            for (int b = 0; a + b <= degree; b++) {
                for (int c = 0; a + b + c <= degree; c++) {
                    double q = 0.0;
                    for (size_t k = 0; k < rule.points.size(); k++) {
                        q += rule.weights[k] * std::pow(rule.points[k](0), a) *
                             std::pow(rule.points[k](1), b) * std::pow(rule.points[k](2), c);
                    }
                    double exact = factorial(a) * factorial(b) * factorial(c) /
                                   factorial(a + b + c + 3);
                    EXPECT_NEAR(q, exact, 1e-12)
                        << "degree " << degree << " x^" << a << " y^" << b << " z^" << c;
                }
            }
        }
    }
}

TEST(Quadrature, Degree3TriangleUsesDegree4Rule) {
    EXPECT_EQ(SimplexElement::quadrature(2, 3).degree, 4);
}

TEST(Quadrature, UnavailableDegreeThrows) {
    EXPECT_THROW(SimplexElement::quadrature(2, 5), ConfigurationError);
    EXPECT_THROW(SimplexElement::quadrature(3, 4), ConfigurationError);
    EXPECT_THROW(SimplexElement::quadrature(1, 1), ConfigurationError);
}

TEST(Quadrature, DefaultDegree) {
    EXPECT_EQ(SimplexElement::default_quadrature_degree(1), 1);
    EXPECT_EQ(SimplexElement::default_quadrature_degree(2), 2);
    EXPECT_EQ(SimplexElement::default_quadrature_degree(3), 4);
}
