// triangle_mesh.cpp - Flat and indexed triangle construction plus the shared
// publish step used by every mesh type.
//
// Flow for both paths:
// 1) Validate ranks/shapes (and index range unless disabled) without touching the scene.
// 2) Allocate one static slot sized for the final triangle/vertex counts.
// 3) Fill the vertex buffer, then the index buffer, each through a WriteBuffer.
// 4) Release both buffers and record the published pointers on the mesh.

#include "triangle_mesh.hpp"
#include <cstdio>
#include <string>
#include <utility>

static std::string shape_str(const std::vector<size_t>& shape) {
    std::string s = "(";
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i) s += ", ";
        s += std::to_string(shape[i]);
    }
    if (shape.size() == 1) s += ",";
    return s + ")";
}

TriangleMesh::TriangleMesh(TriangleMesh&& o) noexcept
    : scene_(std::move(o.scene_)),
      id_(std::exchange(o.id_, GeometryId::invalid())),
      vertices_(std::exchange(o.vertices_, nullptr)),
      indices_(std::exchange(o.indices_, nullptr)),
      vertex_count_(std::exchange(o.vertex_count_, 0)),
      triangle_count_(std::exchange(o.triangle_count_, 0)) {}

TriangleMesh& TriangleMesh::operator=(TriangleMesh&& o) noexcept {
    if (this != &o) {
        scene_ = std::move(o.scene_);
        id_ = std::exchange(o.id_, GeometryId::invalid());
        vertices_ = std::exchange(o.vertices_, nullptr);
        indices_ = std::exchange(o.indices_, nullptr);
        vertex_count_ = std::exchange(o.vertex_count_, 0);
        triangle_count_ = std::exchange(o.triangle_count_, 0);
    }
    return *this;
}

bool check_index_capacity(size_t count, const char* what, BuildError& err) {
    // Indices are 32-bit; the last value is reserved as the invalid geometry/index marker.
    if (count >= 0xFFFFFFFFull)
        return err.fail(BuildErrc::InvalidInputShape,
                        std::string(what) + " count " + std::to_string(count) + " exceeds 32-bit indexing");
    return true;
}

bool check_vertex_pool(const DenseArray<float>& vertices, BuildError& err) {
    if (vertices.rank() != 2 || vertices.dim(1) != 3)
        return err.fail(BuildErrc::InvalidInputShape,
                        "vertices must have shape (num_vertices, 3), got " + shape_str(vertices.shape));
    if (!vertices.data && vertices.size() > 0)
        return err.fail(BuildErrc::InvalidInputShape, "vertices array has no data");
    return check_index_capacity(vertices.dim(0), "vertex", err);
}

bool check_index_array(const DenseArray<uint32_t>& indices, size_t width, BuildError& err) {
    if (indices.rank() != 2 || indices.dim(1) != width)
        return err.fail(BuildErrc::InvalidInputShape,
                        "indices must have shape (num_rows, " + std::to_string(width) + "), got " + shape_str(indices.shape));
    if (!indices.data && indices.size() > 0)
        return err.fail(BuildErrc::InvalidInputShape, "indices array has no data");
    return true;
}

bool check_index_range(const DenseArray<uint32_t>& indices, size_t vertex_count, BuildError& err) {
    const size_t n = indices.size();
    for (size_t i = 0; i < n; ++i) {
        if (indices.data[i] >= vertex_count) {
            const size_t width = indices.dim(1);
            return err.fail(BuildErrc::OutOfRangeIndex,
                            "index " + std::to_string(indices.data[i]) + " at row " + std::to_string(i / width) +
                            ", column " + std::to_string(i % width) + " is out of range for " +
                            std::to_string(vertex_count) + " vertices");
        }
    }
    return true;
}

void publish_triangle_geometry(const std::shared_ptr<GeometryScene>& scene,
                               size_t triangle_count, size_t vertex_count,
                               const std::function<void(WriteBuffer<Vertex>&)>& fill_vertices,
                               const std::function<void(WriteBuffer<Triangle>&)>& fill_triangles,
                               TriangleMesh& out) {
    MESHRT_CHECK(scene != nullptr, "mesh construction needs a scene");
    GeometryId id = scene->allocate_triangle_geometry(triangle_count, vertex_count, kGeometryStatic);
    try {
        {
            WriteBuffer<Vertex> vb(*scene, id, BufferKind::Vertex, vertex_count);
            fill_vertices(vb);
            vb.commit();
        }
        {
            WriteBuffer<Triangle> ib(*scene, id, BufferKind::Index, triangle_count);
            fill_triangles(ib);
            ib.commit();
        }
    } catch (...) {
        // Buffers are already released by the WriteBuffer destructors; a half-filled slot must not be used.
        scene->discard_geometry(id);
        throw;
    }

    out = TriangleMesh();
    out.scene_ = scene;
    out.id_ = id;
    out.vertex_count_ = vertex_count;
    out.triangle_count_ = triangle_count;
    out.vertices_ = static_cast<const Vertex*>(scene->buffer(id, BufferKind::Vertex));
    out.indices_ = static_cast<const Triangle*>(scene->buffer(id, BufferKind::Index));
}

void fill_vertex_pool(WriteBuffer<Vertex>& vb, const DenseArray<float>& vertices) {
    const float* p = vertices.data;
    for (size_t v = 0; v < vb.size(); ++v) vb.set(v, Vertex{p[3 * v], p[3 * v + 1], p[3 * v + 2]});
}

static void build_flat(const std::shared_ptr<GeometryScene>& scene, const DenseArray<float>& vertices, TriangleMesh& out) {
    const size_t n = vertices.dim(0);
    publish_triangle_geometry(
        scene, n, 3 * n,
        // Row-major [triangle][corner][xyz] is already a (3N,3) pool: corner k of triangle i is slot 3i+k.
        [&](WriteBuffer<Vertex>& vb) { fill_vertex_pool(vb, vertices); },
        [&](WriteBuffer<Triangle>& ib) {
            for (size_t i = 0; i < n; ++i) {
                uint32_t b = static_cast<uint32_t>(3 * i);
                ib.set(i, Triangle{b, b + 1, b + 2});
            }
        },
        out);
}

static void build_indexed(const std::shared_ptr<GeometryScene>& scene, const DenseArray<float>& vertices,
                          const DenseArray<uint32_t>& indices, TriangleMesh& out) {
    const size_t nt = indices.dim(0);
    const uint32_t* t = indices.data;
    publish_triangle_geometry(
        scene, nt, vertices.dim(0),
        [&](WriteBuffer<Vertex>& vb) { fill_vertex_pool(vb, vertices); },
        [&](WriteBuffer<Triangle>& ib) {
            for (size_t i = 0; i < nt; ++i) ib.set(i, Triangle{t[3 * i], t[3 * i + 1], t[3 * i + 2]});
        },
        out);
}

bool build_triangle_mesh(const std::shared_ptr<GeometryScene>& scene,
                         const DenseArray<float>& vertices,
                         const DenseArray<uint32_t>* indices,
                         const BuildOptions& opt,
                         TriangleMesh& out, BuildError& err) {
    MESHRT_CHECK(scene != nullptr, "mesh construction needs a scene");
    if (!indices) {
        if (vertices.rank() != 3 || vertices.dim(1) != 3 || vertices.dim(2) != 3)
            return err.fail(BuildErrc::InvalidInputShape,
                            "triangle soup must have shape (num_triangles, 3, 3), got " + shape_str(vertices.shape));
        if (!vertices.data && vertices.size() > 0)
            return err.fail(BuildErrc::InvalidInputShape, "vertices array has no data");
        // 3N vertices are addressed by 32-bit indices.
        if (!check_index_capacity(3 * vertices.dim(0), "vertex", err)) return false;

        build_flat(scene, vertices, out);
        if (opt.verbose)
            fprintf(stderr, "[meshrt] triangle soup: triangles=%zu vertices=%zu id=%u\n",
                    out.triangle_count(), out.vertex_count(), out.id().value());
        return true;
    }

    if (!check_vertex_pool(vertices, err)) return false;
    if (!check_index_array(*indices, 3, err)) return false;
    if (!check_index_capacity(indices->dim(0), "triangle", err)) return false;
    if (opt.validate_indices && !check_index_range(*indices, vertices.dim(0), err)) return false;

    build_indexed(scene, vertices, *indices, out);
    if (opt.verbose)
        fprintf(stderr, "[meshrt] indexed triangles: triangles=%zu vertices=%zu id=%u\n",
                out.triangle_count(), out.vertex_count(), out.id().value());
    return true;
}
