#pragma once

#include "bimetal/common.hpp"
#include "bimetal/element.hpp"
#include "bimetal/geometry.hpp"

namespace bimetal {

struct NodeSet {
    std::string name;
    std::vector<int> node_ids;
};

// Region-tagged simplex mesh. Axis 0 is the thickness axis, axis 1 the length
// axis and axis 2 (3D only) the depth axis.
class Mesh {
public:
    int dim = 2;
    int order = 1;
    Eigen::MatrixXd nodes;            // N_nodes x dim
    Eigen::MatrixXi elements;         // N_elements x nodes_per_element (0-based, Gmsh ordering)
    Eigen::VectorXi element_regions;  // region tag (1 or 2) per element
    std::vector<NodeSet> node_sets;

    // ASCII MSH 2.x with TRI3/TRI6/TRI10 or TET4/TET10 cells. The physical tag of
    // each cell is its region; named physical groups become node sets.
    void load_from_gmsh(const std::string& filename);

    void load_from_arrays(const Eigen::MatrixXd& node_coords,
                          const Eigen::MatrixXi& element_connectivity,
                          const Eigen::VectorXi& regions,
                          const std::vector<NodeSet>& node_sets_in);

    // Find a node set by name, returns nullptr if not found
    const NodeSet* find_node_set(const std::string& name) const;

    // Element e with its node coordinates filled in
    SimplexElement element(int e) const;

    // Throws GeometryInconsistency unless both regions 1 and 2 are present,
    // every element is tagged 1 or 2 and all connectivity is in range
    void validate() const;

    int num_nodes() const { return static_cast<int>(nodes.rows()); }
    int num_elements() const { return static_cast<int>(elements.rows()); }
    int num_dof() const { return dim * num_nodes(); }
    int nodes_per_element() const { return static_cast<int>(elements.cols()); }
};

// Structured two-region mesh of the bimetal strip. Four base cells across the
// thickness (split at the material border), cells of aspect 2 along the length,
// square cells along the depth; every refinement halves all cell sizes.
// Node sets: "clamp" (length 0), "tip" (length L), "face_region1" (thickness 0),
// "face_region2" (thickness scale[0]).
Mesh build_bimetal_mesh(const BimetalGeometry& geometry, int order, int refinements = 0);

}  // namespace bimetal
