#pragma once

#include "bimetal/common.hpp"

namespace bimetal {

struct QuadratureRule {
    int degree = 0;
    std::vector<Eigen::VectorXd> points;  // natural coordinates
    std::vector<double> weights;          // sum to the reference simplex measure
};

// Lagrange simplex element: triangles of order 1..3 and tetrahedra of order 1..2.
//
// Internal node ordering (the Gmsh loader swaps TET10 nodes 8/9):
//   TRI3/TRI6:  corners 0,1,2; mid-edge 3(0-1), 4(1-2), 5(2-0)
//   TRI10:      corners 0,1,2; edge nodes 3,4 (0->1), 5,6 (1->2), 7,8 (2->0); 9 interior
//   TET4/TET10: corners 0..3; mid-edge 4(0-1), 5(1-2), 6(0-2), 7(0-3), 8(1-3), 9(2-3)
//
// Barycentric coordinates: L0 = 1 - sum(xi), L(i+1) = xi(i)
class SimplexElement {
public:
    SimplexElement(int dim, int order);

    Eigen::MatrixXd node_coords;  // num_nodes x dim

    int dim() const { return dim_; }
    int order() const { return order_; }
    int num_nodes() const { return nodes_per_element(dim_, order_); }

    Eigen::VectorXd shape_functions(const Eigen::VectorXd& xi) const;

    // Derivatives w.r.t. natural coordinates (num_nodes x dim)
    Eigen::MatrixXd shape_derivatives(const Eigen::VectorXd& xi) const;

    // J = dN/dxi^T * node_coords (dim x dim)
    Eigen::MatrixXd jacobian(const Eigen::VectorXd& xi) const;

    // Physical derivatives dN/dX (num_nodes x dim); det_J receives |det J|.
    // Throws GeometryInconsistency for a degenerate element.
    Eigen::MatrixXd physical_derivatives(const Eigen::VectorXd& xi, double& det_J) const;

    double measure() const;

    static int nodes_per_element(int dim, int order);

    // Natural coordinates of the element nodes (num_nodes x dim)
    static Eigen::MatrixXd reference_nodes(int dim, int order);

    // Smallest built-in rule of at least the requested degree
    static QuadratureRule quadrature(int dim, int degree);

    // 2 (k - 1), at least 1
    static int default_quadrature_degree(int order);

private:
    int dim_;
    int order_;
    Eigen::MatrixXi lattice_;  // barycentric lattice counts per node (num_nodes x (dim + 1))
};

}  // namespace bimetal
