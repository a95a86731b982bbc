// triangle_mesh.hpp - Triangle geometry registered with a GeometryScene.
//
// Two construction paths:
// - flat soup: vertices (N,3,3), no sharing; triangle i uses vertices 3i, 3i+1, 3i+2.
//   Coincident corners of neighbouring triangles stay separate slots, so shading
//   that relies on shared-vertex normals can show cracks along edges.
// - indexed: vertices (V,3) and indices (N,3), both copied verbatim.
//
// The mesh keeps a strong reference to its scene; the vertex/index pointers point
// into scene-owned storage and stay valid as long as the mesh exists.
//
#pragma once
#include "buffer.hpp"
#include "mesh.hpp"
#include "scene.hpp"
#include <cstddef>
#include <functional>
#include <memory>

class TriangleMesh {
public:
    TriangleMesh() = default;
    TriangleMesh(TriangleMesh&& o) noexcept;
    TriangleMesh& operator=(TriangleMesh&& o) noexcept;
    TriangleMesh(const TriangleMesh&) = delete;
    TriangleMesh& operator=(const TriangleMesh&) = delete;

    GeometryId id() const { return id_; }
    bool empty() const { return !id_.valid(); }
    size_t vertex_count() const { return vertex_count_; }
    size_t triangle_count() const { return triangle_count_; }
    const Vertex* vertices() const { return vertices_; }
    const Triangle* indices() const { return indices_; }
    const std::shared_ptr<GeometryScene>& scene() const { return scene_; }

private:
    friend void publish_triangle_geometry(const std::shared_ptr<GeometryScene>& scene,
                                          size_t triangle_count, size_t vertex_count,
                                          const std::function<void(WriteBuffer<Vertex>&)>& fill_vertices,
                                          const std::function<void(WriteBuffer<Triangle>&)>& fill_triangles,
                                          TriangleMesh& out);

    std::shared_ptr<GeometryScene> scene_;
    GeometryId id_;
    const Vertex* vertices_ = nullptr;
    const Triangle* indices_ = nullptr;
    size_t vertex_count_ = 0;
    size_t triangle_count_ = 0;
};

// Build a triangle mesh into `scene`. `indices == nullptr` selects the flat soup path.
// On failure returns false, fills `err`, and allocates nothing in the scene.
bool build_triangle_mesh(const std::shared_ptr<GeometryScene>& scene,
                         const DenseArray<float>& vertices,
                         const DenseArray<uint32_t>* indices,
                         const BuildOptions& opt,
                         TriangleMesh& out, BuildError& err);

// Shared finalize step for every mesh type: allocate a static slot of the given
// size, fill vertex then index buffer in one pass each, release both, and bind
// `out` to the published buffers. If a fill throws, both buffers are released,
// the slot is discarded and the exception propagates.
void publish_triangle_geometry(const std::shared_ptr<GeometryScene>& scene,
                               size_t triangle_count, size_t vertex_count,
                               const std::function<void(WriteBuffer<Vertex>&)>& fill_vertices,
                               const std::function<void(WriteBuffer<Triangle>&)>& fill_triangles,
                               TriangleMesh& out);

// Copy a (V,3) float array verbatim into the vertex buffer.
void fill_vertex_pool(WriteBuffer<Vertex>& vb, const DenseArray<float>& vertices);

// Input checks shared with the element path. All run before any allocation.
bool check_vertex_pool(const DenseArray<float>& vertices, BuildError& err);
bool check_index_array(const DenseArray<uint32_t>& indices, size_t width, BuildError& err);
bool check_index_range(const DenseArray<uint32_t>& indices, size_t vertex_count, BuildError& err);
bool check_index_capacity(size_t count, const char* what, BuildError& err);
