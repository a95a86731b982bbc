// scene.hpp - The narrow interface through which meshrt talks to the
// acceleration-structure scene, plus an in-process implementation.
//
// A scene owns one slot per triangle geometry. Each slot has a vertex buffer and
// an index buffer whose sizes are fixed when the slot is allocated. Writers must
// acquire a buffer, fill it, and release it exactly once; releasing publishes the
// buffer to the engine. Buffers stay owned by the scene for the scene's lifetime.
//
#pragma once
#include "mesh.hpp"
#include <cstddef>
#include <vector>

class GeometryScene {
public:
    virtual ~GeometryScene() = default;

    // Create a triangle geometry slot sized for the final counts.
    virtual GeometryId allocate_triangle_geometry(size_t triangle_count, size_t vertex_count, unsigned flags) = 0;

    // Exclusive write access to one buffer of a slot. Must be paired with release_buffer.
    virtual void* acquire_buffer(GeometryId id, BufferKind kind) = 0;

    // Finalize/publish a buffer previously acquired for writing.
    virtual void release_buffer(GeometryId id, BufferKind kind) = 0;

    // Read-only view of a published buffer; valid for the scene's lifetime.
    virtual const void* buffer(GeometryId id, BufferKind kind) const = 0;

    // Drop a slot whose fill did not complete. The id is not handed out again.
    virtual void discard_geometry(GeometryId id) = 0;

    virtual size_t triangle_count(GeometryId id) const = 0;
    virtual size_t vertex_count(GeometryId id) const = 0;
};

// Scene that keeps every buffer in host memory. Enforces the buffer protocol with
// MESHRT_CHECK and counts acquisitions/releases so callers can audit them.
class MemoryScene : public GeometryScene {
public:
    GeometryId allocate_triangle_geometry(size_t triangle_count, size_t vertex_count, unsigned flags) override;
    void* acquire_buffer(GeometryId id, BufferKind kind) override;
    void release_buffer(GeometryId id, BufferKind kind) override;
    const void* buffer(GeometryId id, BufferKind kind) const override;
    void discard_geometry(GeometryId id) override;
    size_t triangle_count(GeometryId id) const override;
    size_t vertex_count(GeometryId id) const override;

    // Number of slots ever allocated (discarded ones included).
    size_t geometry_count() const { return slots_.size(); }
    bool is_live(GeometryId id) const;
    bool is_acquired(GeometryId id, BufferKind kind) const;
    unsigned flags(GeometryId id) const;
    size_t acquire_count(GeometryId id, BufferKind kind) const;
    size_t release_count(GeometryId id, BufferKind kind) const;  // counters survive discard_geometry

private:
    struct BufferState {
        bool acquired = false;
        size_t acquires = 0;
        size_t releases = 0;
    };

    struct Slot {
        std::vector<Vertex> vertices;
        std::vector<Triangle> triangles;
        unsigned flags = 0;
        bool discarded = false;
        BufferState state[2];
    };

    Slot& slot(GeometryId id);
    const Slot& slot(GeometryId id) const;
    const Slot& known_slot(GeometryId id) const;
    static size_t kind_index(BufferKind kind) { return kind == BufferKind::Vertex ? 0 : 1; }

    std::vector<Slot> slots_;
};
