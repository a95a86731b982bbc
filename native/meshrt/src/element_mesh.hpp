// element_mesh.hpp - Hexahedral and tetrahedral element meshes lowered to triangles.
//
// The element type is picked from the width of the index array: 8 nodes per row is
// a hexahedron, 4 is a tetrahedron. Every element is split with a fixed table into
// triangles that share the original vertex pool, so the triangle count is always
// 12 * elements (hex) or 4 * elements (tet) and the vertex count is unchanged.
//
// Hexahedron node ordering: 0-3 one quad face, 4-7 the opposite face, with node
// i+4 opposite node i. Faces are not reoriented; winding follows the table.
//
#pragma once
#include "mesh.hpp"
#include "scene.hpp"
#include "triangle_mesh.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>

enum class ElementKind { Tetrahedron, Hexahedron };

const char* element_kind_name(ElementKind kind);

// Local node triples of each output triangle, in output order.
extern const uint32_t kHexFaceTriangles[12][3];
extern const uint32_t kTetFaceTriangles[4][3];

constexpr size_t kHexNodes = 8;
constexpr size_t kTetNodes = 4;

size_t nodes_per_element(ElementKind kind);
size_t triangles_per_element(ElementKind kind);

// Lower one element: `local_to_global` holds nodes_per_element(kind) global vertex
// indices, `out` receives triangles_per_element(kind) triangles.
void decompose_element(ElementKind kind, const uint32_t* local_to_global, Triangle* out);

class ElementMesh {
public:
    ElementMesh() = default;
    ElementMesh(ElementMesh&&) = default;
    ElementMesh& operator=(ElementMesh&&) = default;

    ElementKind kind() const { return kind_; }
    size_t element_count() const { return element_count_; }
    size_t triangles_per_element() const { return ::triangles_per_element(kind_); }

    // Map a primitive id (e.g. from a ray hit) back to the element it was cut from.
    // Returns false and leaves `element` untouched if `triangle` is not a
    // triangle of this mesh.
    bool element_of_triangle(size_t triangle, size_t& element) const;

    const TriangleMesh& triangles() const { return triangles_; }
    GeometryId id() const { return triangles_.id(); }
    size_t vertex_count() const { return triangles_.vertex_count(); }
    size_t triangle_count() const { return triangles_.triangle_count(); }
    const Vertex* vertices() const { return triangles_.vertices(); }
    const Triangle* indices() const { return triangles_.indices(); }

private:
    friend bool build_element_mesh(const std::shared_ptr<GeometryScene>& scene,
                                   const DenseArray<float>& vertices,
                                   const DenseArray<uint32_t>& indices,
                                   const BuildOptions& opt,
                                   ElementMesh& out, BuildError& err);

    TriangleMesh triangles_;
    ElementKind kind_ = ElementKind::Tetrahedron;
    size_t element_count_ = 0;
};

// Build an element mesh into `scene`. vertices: (V,3); indices: (E,8) or (E,4).
// On failure returns false, fills `err`, and allocates nothing in the scene.
bool build_element_mesh(const std::shared_ptr<GeometryScene>& scene,
                        const DenseArray<float>& vertices,
                        const DenseArray<uint32_t>& indices,
                        const BuildOptions& opt,
                        ElementMesh& out, BuildError& err);
