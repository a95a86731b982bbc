// element_mesh.cpp - Fixed-table decomposition of hexahedra and tetrahedra.

#include "element_mesh.hpp"
#include <cstdio>
#include <string>
#include <utility>

// Each quad face {a,b,c,d} is split along the a-c diagonal into (a,b,c), (a,c,d).
const uint32_t kHexFaceTriangles[12][3] = {
    {0, 1, 2}, {0, 2, 3},  // face 0-1-2-3
    {4, 5, 6}, {4, 6, 7},  // face 4-5-6-7
    {0, 1, 5}, {0, 5, 4},  // face 0-1-5-4
    {1, 2, 6}, {1, 6, 5},  // face 1-2-6-5
    {0, 3, 7}, {0, 7, 4},  // face 0-3-7-4
    {3, 2, 6}, {3, 6, 7},  // face 3-2-6-7
};

// One face per omitted node: 3, 2, 1, 0.
const uint32_t kTetFaceTriangles[4][3] = {
    {0, 1, 2},
    {0, 1, 3},
    {0, 2, 3},
    {1, 2, 3},
};

const char* element_kind_name(ElementKind kind) {
    switch (kind) {
        case ElementKind::Tetrahedron: return "tetrahedron";
        case ElementKind::Hexahedron:  return "hexahedron";
    }
    return "unknown";
}

size_t nodes_per_element(ElementKind kind) {
    return kind == ElementKind::Hexahedron ? kHexNodes : kTetNodes;
}

size_t triangles_per_element(ElementKind kind) {
    return kind == ElementKind::Hexahedron ? 12 : 4;
}

void decompose_element(ElementKind kind, const uint32_t* local_to_global, Triangle* out) {
    const uint32_t (*table)[3] = kind == ElementKind::Hexahedron ? kHexFaceTriangles : kTetFaceTriangles;
    const size_t n = triangles_per_element(kind);
    for (size_t t = 0; t < n; ++t) {
        out[t] = Triangle{local_to_global[table[t][0]], local_to_global[table[t][1]], local_to_global[table[t][2]]};
    }
}

bool ElementMesh::element_of_triangle(size_t triangle, size_t& element) const {
    if (triangle >= triangle_count()) return false;
    element = triangle / triangles_per_element();
    return true;
}

bool build_element_mesh(const std::shared_ptr<GeometryScene>& scene,
                        const DenseArray<float>& vertices,
                        const DenseArray<uint32_t>& indices,
                        const BuildOptions& opt,
                        ElementMesh& out, BuildError& err) {
    MESHRT_CHECK(scene != nullptr, "mesh construction needs a scene");
    if (!check_vertex_pool(vertices, err)) return false;
    if (indices.rank() != 2)
        return err.fail(BuildErrc::InvalidInputShape,
                        "element indices must be 2-dimensional, got rank " + std::to_string(indices.rank()));

    ElementKind kind;
    switch (indices.dim(1)) {
        case kHexNodes: kind = ElementKind::Hexahedron; break;
        case kTetNodes: kind = ElementKind::Tetrahedron; break;
        default:
            return err.fail(BuildErrc::UnsupportedElementArity,
                            "elements must have 4 (tetrahedron) or 8 (hexahedron) nodes, got " +
                            std::to_string(indices.dim(1)));
    }
    if (!check_index_array(indices, nodes_per_element(kind), err)) return false;

    const size_t ne = indices.dim(0);
    const size_t per = triangles_per_element(kind);
    if (!check_index_capacity(ne * per, "triangle", err)) return false;
    if (opt.validate_indices && !check_index_range(indices, vertices.dim(0), err)) return false;

    const size_t nodes = nodes_per_element(kind);
    const uint32_t* elems = indices.data;

    ElementMesh mesh;
    publish_triangle_geometry(
        scene, ne * per, vertices.dim(0),
        [&](WriteBuffer<Vertex>& vb) { fill_vertex_pool(vb, vertices); },
        [&](WriteBuffer<Triangle>& ib) {
            Triangle tris[12];
            for (size_t e = 0; e < ne; ++e) {
                decompose_element(kind, elems + nodes * e, tris);
                for (size_t t = 0; t < per; ++t) ib.set(per * e + t, tris[t]);
            }
        },
        mesh.triangles_);
    mesh.kind_ = kind;
    mesh.element_count_ = ne;
    out = std::move(mesh);

    if (opt.verbose)
        fprintf(stderr, "[meshrt] %s elements: elements=%zu triangles=%zu vertices=%zu id=%u\n",
                element_kind_name(kind), ne, out.triangle_count(), out.vertex_count(), out.id().value());
    return true;
}
