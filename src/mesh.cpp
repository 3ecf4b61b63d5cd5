#include "bimetal/mesh.hpp"
#include "bimetal/errors.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <set>
#include <map>

namespace bimetal {

// Gmsh element type node counts
static int gmsh_element_node_count(int type) {
    switch (type) {
        case 1: return 2;   // 2-node line
        case 2: return 3;   // 3-node triangle
        case 3: return 4;   // 4-node quadrangle
        case 4: return 4;   // 4-node tetrahedron
        case 8: return 3;   // 3-node second order line
        case 9: return 6;   // 6-node second order triangle (TRI6)
        case 11: return 10; // 10-node second order tetrahedron (TET10)
        case 15: return 1;  // 1-node point
        case 21: return 10; // 10-node third order triangle (TRI10)
        case 26: return 4;  // 4-node third order line
        default: return -1; // unknown
    }
}

// (dimension, order) of the simplex cell types we solve on, {0, 0} otherwise
static std::pair<int, int> gmsh_simplex_cell(int type) {
    switch (type) {
        case 2: return {2, 1};
        case 9: return {2, 2};
        case 21: return {2, 3};
        case 4: return {3, 1};
        case 11: return {3, 2};
        default: return {0, 0};
    }
}

void Mesh::load_from_gmsh(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open mesh file: " + filename);
    }

    // Physical name mappings: tag -> (dimension, name)
    std::map<int, std::pair<int, std::string>> physical_names;

    std::vector<Eigen::Vector3d> node_list;
    std::map<int, int> gmsh_to_local;  // Gmsh 1-based ID -> 0-based index

    struct Cell {
        int dim;
        int order;
        int region;
        std::vector<int> nodes;
    };
    std::vector<Cell> cells;

    // Node sets keyed by physical group name, collecting unique node IDs
    std::map<std::string, std::set<int>> node_set_map;

    std::string line;
    while (std::getline(file, line)) {
        while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
            line.pop_back();
        }

        if (line == "$MeshFormat") {
            std::getline(file, line);
            std::istringstream iss(line);
            double version;
            int file_type, data_size;
            iss >> version >> file_type >> data_size;
            if (version < 2.0 || version >= 3.0) {
                throw std::runtime_error("Unsupported Gmsh format version: " + std::to_string(version) + ". Only v2.x supported.");
            }
            if (file_type != 0) {
                throw std::runtime_error("Only ASCII Gmsh files supported (file-type must be 0).");
            }
            std::getline(file, line);
        }
        else if (line == "$PhysicalNames") {
            std::getline(file, line);
            int num_names = std::stoi(line);
            for (int i = 0; i < num_names; i++) {
                std::getline(file, line);
                std::istringstream iss(line);
                int dim, tag;
                std::string name;
                iss >> dim >> tag >> name;
                if (!name.empty() && name.front() == '"') name = name.substr(1);
                if (!name.empty() && name.back() == '"') name.pop_back();
                physical_names[tag] = {dim, name};
            }
            std::getline(file, line);
        }
        else if (line == "$Nodes") {
            std::getline(file, line);
            int num_nodes_in_file = std::stoi(line);
            node_list.reserve(num_nodes_in_file);

            for (int i = 0; i < num_nodes_in_file; i++) {
                std::getline(file, line);
                std::istringstream iss(line);
                int node_id;
                double x, y, z;
                iss >> node_id >> x >> y >> z;
                gmsh_to_local[node_id] = static_cast<int>(node_list.size());
                node_list.push_back({x, y, z});
            }
            std::getline(file, line);
        }
        else if (line == "$Elements") {
            std::getline(file, line);
            int num_elements_in_file = std::stoi(line);

            for (int i = 0; i < num_elements_in_file; i++) {
                std::getline(file, line);
                std::istringstream iss(line);
                int elem_id, elem_type, num_tags;
                iss >> elem_id >> elem_type >> num_tags;

                // First tag is the physical group, second the geometric entity
                std::vector<int> tags(num_tags);
                for (int t = 0; t < num_tags; t++) {
                    iss >> tags[t];
                }
                int phys_tag = (num_tags > 0) ? tags[0] : -1;

                int nnodes = gmsh_element_node_count(elem_type);
                if (nnodes < 0) {
                    throw std::runtime_error("Unknown Gmsh element type: " + std::to_string(elem_type));
                }

                std::vector<int> elem_nodes(nnodes);
                for (int n = 0; n < nnodes; n++) {
                    int gmsh_id;
                    iss >> gmsh_id;
                    auto it = gmsh_to_local.find(gmsh_id);
                    if (it == gmsh_to_local.end()) {
                        throw std::runtime_error("Element references unknown node ID: " + std::to_string(gmsh_id));
                    }
                    elem_nodes[n] = it->second;
                }

                if (elem_type == 11) {
                    // Gmsh documents 8=edge(2,3), 9=edge(1,3); our TET10 uses 8=edge(1,3),
                    // 9=edge(2,3). Some meshing algorithms already write ours, so detect.
                    Eigen::Vector3d p8 = node_list[elem_nodes[8]];
                    Eigen::Vector3d mid_13 = (node_list[elem_nodes[1]] + node_list[elem_nodes[3]]) * 0.5;
                    Eigen::Vector3d mid_23 = (node_list[elem_nodes[2]] + node_list[elem_nodes[3]]) * 0.5;
                    if ((p8 - mid_23).squaredNorm() < (p8 - mid_13).squaredNorm()) {
                        std::swap(elem_nodes[8], elem_nodes[9]);
                    }
                }

                auto [cell_dim, cell_order] = gmsh_simplex_cell(elem_type);
                if (cell_dim > 0) {
                    cells.push_back({cell_dim, cell_order, phys_tag, elem_nodes});
                }

                if (phys_tag > 0 && physical_names.count(phys_tag)) {
                    auto& ns = node_set_map[physical_names[phys_tag].second];
                    for (int n : elem_nodes) {
                        ns.insert(n);
                    }
                }
            }
            std::getline(file, line);
        }
        // Skip unknown sections
    }

    file.close();

    if (cells.empty()) {
        throw std::runtime_error("Mesh file contains no triangle or tetrahedron cells: " + filename);
    }

    // Solve on the highest-dimensional cells; lower-dimensional ones only feed node sets
    int top_dim = 0;
    for (const auto& c : cells) top_dim = std::max(top_dim, c.dim);
    int top_order = -1;
    std::vector<const Cell*> volume;
    for (const auto& c : cells) {
        if (c.dim != top_dim) continue;
        if (top_order < 0) top_order = c.order;
        if (c.order != top_order) {
            throw std::runtime_error("Mixed element orders in mesh file: " + filename);
        }
        volume.push_back(&c);
    }

    dim = top_dim;
    order = top_order;

    int n_nodes = static_cast<int>(node_list.size());
    nodes.resize(n_nodes, dim);
    for (int i = 0; i < n_nodes; i++) {
        nodes.row(i) = node_list[i].head(dim).transpose();
    }

    int n_elems = static_cast<int>(volume.size());
    int npe = static_cast<int>(volume.front()->nodes.size());
    elements.resize(n_elems, npe);
    element_regions.resize(n_elems);
    for (int e = 0; e < n_elems; e++) {
        for (int n = 0; n < npe; n++) {
            elements(e, n) = volume[e]->nodes[n];
        }
        element_regions(e) = volume[e]->region;
    }

    node_sets.clear();
    for (auto& [name, id_set] : node_set_map) {
        NodeSet ns;
        ns.name = name;
        ns.node_ids.assign(id_set.begin(), id_set.end());
        node_sets.push_back(std::move(ns));
    }

    validate();
}

void Mesh::load_from_arrays(const Eigen::MatrixXd& node_coords,
                            const Eigen::MatrixXi& element_connectivity,
                            const Eigen::VectorXi& regions,
                            const std::vector<NodeSet>& node_sets_in) {
    int d = static_cast<int>(node_coords.cols());
    if (d != 2 && d != 3) {
        throw GeometryInconsistency("node_coords must have 2 or 3 columns");
    }
    int npe = static_cast<int>(element_connectivity.cols());
    int k = 0;
    for (int trial = 1; trial <= 3; trial++) {
        if ((d == 2 || trial <= 2) && SimplexElement::nodes_per_element(d, trial) == npe) {
            k = trial;
        }
    }
    if (k == 0) {
        throw GeometryInconsistency("element_connectivity has " + std::to_string(npe) +
                                    " columns, which is no simplex element in " +
                                    std::to_string(d) + "D");
    }
    if (regions.size() != element_connectivity.rows()) {
        throw GeometryInconsistency("regions must have one entry per element");
    }

    dim = d;
    order = k;
    nodes = node_coords;
    elements = element_connectivity;
    element_regions = regions;
    node_sets = node_sets_in;
    validate();
}

const NodeSet* Mesh::find_node_set(const std::string& name) const {
    for (const auto& ns : node_sets) {
        if (ns.name == name) {
            return &ns;
        }
    }
    return nullptr;
}

SimplexElement Mesh::element(int e) const {
    SimplexElement elem(dim, order);
    for (int n = 0; n < elem.num_nodes(); n++) {
        elem.node_coords.row(n) = nodes.row(elements(e, n));
    }
    return elem;
}

void Mesh::validate() const {
    if (nodes.cols() != dim) {
        throw GeometryInconsistency("Node coordinates do not match the mesh dimension");
    }
    if (elements.cols() != SimplexElement::nodes_per_element(dim, order)) {
        throw GeometryInconsistency("Connectivity width does not match the element order");
    }
    if (element_regions.size() != elements.rows()) {
        throw GeometryInconsistency("Region tags do not match the element count");
    }
    if (elements.size() > 0 &&
        (elements.minCoeff() < 0 || elements.maxCoeff() >= num_nodes())) {
        throw GeometryInconsistency("Element connectivity references a missing node");
    }

    bool has_region[2] = {false, false};
    for (int e = 0; e < num_elements(); e++) {
        int r = element_regions(e);
        if (r != 1 && r != 2) {
            throw GeometryInconsistency("Element " + std::to_string(e) +
                                        " has region tag " + std::to_string(r) +
                                        " (expected 1 or 2)");
        }
        has_region[r - 1] = true;
    }
    if (!has_region[0] || !has_region[1]) {
        throw GeometryInconsistency("Mesh must contain elements of both region 1 and region 2");
    }
}

// --- Structured mesher ---

namespace {

// Lattice coordinates along one axis: cell boundaries subdivided into `order` steps
std::vector<double> axis_lattice(const std::vector<double>& cell_bounds, int order) {
    int n_cells = static_cast<int>(cell_bounds.size()) - 1;
    std::vector<double> x(order * n_cells + 1);
    for (int c = 0; c < n_cells; c++) {
        for (int s = 0; s < order; s++) {
            x[order * c + s] = cell_bounds[c] +
                (cell_bounds[c + 1] - cell_bounds[c]) * s / static_cast<double>(order);
        }
    }
    x.back() = cell_bounds.back();
    return x;
}

std::vector<double> uniform_bounds(double x0, double x1, int n) {
    std::vector<double> b(n + 1);
    for (int i = 0; i <= n; i++) b[i] = x0 + (x1 - x0) * i / static_cast<double>(n);
    b.back() = x1;
    return b;
}

}  // namespace

Mesh build_bimetal_mesh(const BimetalGeometry& geometry, int order, int refinements) {
    geometry.validate();
    geometry.validate_order(order);
    if (refinements < 0) {
        throw ConfigurationError("Refinement count must be non-negative");
    }

    const int dim = geometry.dimension();
    const int factor = 1 << refinements;
    const double d = geometry.thickness();
    const double L = geometry.length();
    const double border = geometry.border_position();

    // Thickness: four base cells, the material border lies on a cell boundary
    int n1 = static_cast<int>(std::lround(4.0 * geometry.material_border));
    n1 = std::min(3, std::max(1, n1));
    int n2 = 4 - n1;
    n1 *= factor;
    n2 *= factor;
    std::vector<double> tb = uniform_bounds(0.0, border, n1);
    std::vector<double> tb2 = uniform_bounds(border, d, n2);
    tb.insert(tb.end(), tb2.begin() + 1, tb2.end());

    int nl = std::max(2, static_cast<int>(std::lround(L / (2.0 * d / 4.0)))) * factor;
    std::vector<double> lb = uniform_bounds(0.0, L, nl);

    std::vector<double> xt = axis_lattice(tb, order);
    std::vector<double> xl = axis_lattice(lb, order);
    std::vector<double> xd = {0.0};
    int nd = 0;
    if (dim == 3) {
        double D = geometry.depth();
        nd = std::max(1, static_cast<int>(std::lround(D / (d / 4.0)))) * factor;
        xd = axis_lattice(uniform_bounds(0.0, D, nd), order);
    }

    const int mt = static_cast<int>(xt.size());
    const int ml = static_cast<int>(xl.size());
    const int md = static_cast<int>(xd.size());
    auto node_id = [&](int i, int j, int l) { return (l * ml + j) * mt + i; };

    Mesh mesh;
    mesh.dim = dim;
    mesh.order = order;
    mesh.nodes.resize(mt * ml * md, dim);
    for (int l = 0; l < md; l++) {
        for (int j = 0; j < ml; j++) {
            for (int i = 0; i < mt; i++) {
                int id = node_id(i, j, l);
                mesh.nodes(id, 0) = xt[i];
                mesh.nodes(id, 1) = xl[j];
                if (dim == 3) mesh.nodes(id, 2) = xd[l];
            }
        }
    }

    const Eigen::MatrixXd ref = SimplexElement::reference_nodes(dim, order);
    const int npe = static_cast<int>(ref.rows());
    const int nt = n1 + n2;
    std::vector<Eigen::VectorXi> conn;
    std::vector<int> regions;

    // Local simplex: lattice origin plus integer edge vectors (in cell units)
    auto add_simplex = [&](const Eigen::Vector3i& origin,
                           const std::vector<Eigen::Vector3i>& edges) {
        Eigen::VectorXi c(npe);
        for (int a = 0; a < npe; a++) {
            Eigen::Vector3i p = origin * order;
            for (int k = 0; k < dim; k++) {
                p += edges[k] * static_cast<int>(std::lround(order * ref(a, k)));
            }
            c(a) = node_id(p(0), p(1), p(2));
        }
        // Region from the thickness coordinate of the corner centroid
        double xc = 0.0;
        for (int a = 0; a <= dim; a++) xc += mesh.nodes(c(a), 0) / (dim + 1);
        conn.push_back(c);
        regions.push_back(xc < border ? 1 : 2);
    };

    if (dim == 2) {
        for (int cj = 0; cj < nl; cj++) {
            for (int ci = 0; ci < nt; ci++) {
                add_simplex(Eigen::Vector3i(ci, cj, 0),
                            {Eigen::Vector3i(1, 0, 0), Eigen::Vector3i(0, 1, 0)});
                add_simplex(Eigen::Vector3i(ci + 1, cj + 1, 0),
                            {Eigen::Vector3i(-1, 0, 0), Eigen::Vector3i(0, -1, 0)});
            }
        }
    } else {
        // Kuhn subdivision: one tetrahedron per axis permutation, all sharing
        // the cell diagonal (0,0,0)-(1,1,1)
        static const int perms[6][3] = {{0, 1, 2}, {0, 2, 1}, {1, 0, 2},
                                        {1, 2, 0}, {2, 0, 1}, {2, 1, 0}};
        for (int cl = 0; cl < nd; cl++) {
            for (int cj = 0; cj < nl; cj++) {
                for (int ci = 0; ci < nt; ci++) {
                    for (const auto& p : perms) {
                        Eigen::Vector3i e0 = Eigen::Vector3i::Unit(p[0]);
                        Eigen::Vector3i e1 = e0 + Eigen::Vector3i::Unit(p[1]);
                        Eigen::Vector3i e2 = Eigen::Vector3i::Ones();
                        Eigen::Matrix3i M;
                        M << e0, e1, e2;
                        if (M.cast<double>().determinant() < 0.0) std::swap(e0, e1);
                        add_simplex(Eigen::Vector3i(ci, cj, cl), {e0, e1, e2});
                    }
                }
            }
        }
    }

    int n_elems = static_cast<int>(conn.size());
    mesh.elements.resize(n_elems, npe);
    mesh.element_regions.resize(n_elems);
    for (int e = 0; e < n_elems; e++) {
        mesh.elements.row(e) = conn[e].transpose();
        mesh.element_regions(e) = regions[e];
    }

    NodeSet clamp{"clamp", {}}, tip{"tip", {}}, face1{"face_region1", {}}, face2{"face_region2", {}};
    for (int l = 0; l < md; l++) {
        for (int j = 0; j < ml; j++) {
            for (int i = 0; i < mt; i++) {
                int id = node_id(i, j, l);
                if (j == 0) clamp.node_ids.push_back(id);
                if (j == ml - 1) tip.node_ids.push_back(id);
                if (i == 0) face1.node_ids.push_back(id);
                if (i == mt - 1) face2.node_ids.push_back(id);
            }
        }
    }
    for (NodeSet* ns : {&clamp, &tip, &face1, &face2}) {
        std::sort(ns->node_ids.begin(), ns->node_ids.end());
        mesh.node_sets.push_back(std::move(*ns));
    }

    mesh.validate();
    return mesh;
}

}  // namespace bimetal
