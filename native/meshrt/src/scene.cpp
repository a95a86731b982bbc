// scene.cpp - MemoryScene: host-memory geometry slots with protocol bookkeeping.

#include "scene.hpp"
#include <utility>

GeometryId MemoryScene::allocate_triangle_geometry(size_t triangle_count, size_t vertex_count, unsigned flags) {
    MESHRT_CHECK(slots_.size() < 0xFFFFFFFFu, "geometry id space exhausted");
    Slot s;
    s.vertices.resize(vertex_count);
    s.triangles.resize(triangle_count);
    s.flags = flags;
    slots_.push_back(std::move(s));
    return GeometryId(static_cast<uint32_t>(slots_.size() - 1));
}

void* MemoryScene::acquire_buffer(GeometryId id, BufferKind kind) {
    Slot& s = slot(id);
    BufferState& st = s.state[kind_index(kind)];
    MESHRT_CHECK(!st.acquired, "buffer acquired twice without release");
    st.acquired = true;
    st.acquires++;
    if (kind == BufferKind::Vertex) return s.vertices.data();
    return s.triangles.data();
}

void MemoryScene::release_buffer(GeometryId id, BufferKind kind) {
    BufferState& st = slot(id).state[kind_index(kind)];
    MESHRT_CHECK(st.acquired, "buffer released without a matching acquire");
    st.acquired = false;
    st.releases++;
}

const void* MemoryScene::buffer(GeometryId id, BufferKind kind) const {
    const Slot& s = slot(id);
    MESHRT_CHECK(!s.state[kind_index(kind)].acquired, "buffer read while still acquired for writing");
    if (kind == BufferKind::Vertex) return s.vertices.data();
    return s.triangles.data();
}

void MemoryScene::discard_geometry(GeometryId id) {
    Slot& s = slot(id);
    MESHRT_CHECK(!s.state[0].acquired && !s.state[1].acquired, "geometry discarded while a buffer is acquired");
    // Storage is dropped, bookkeeping stays so the id keeps failing loudly.
    s.vertices = std::vector<Vertex>();
    s.triangles = std::vector<Triangle>();
    s.discarded = true;
}

size_t MemoryScene::triangle_count(GeometryId id) const { return slot(id).triangles.size(); }
size_t MemoryScene::vertex_count(GeometryId id) const { return slot(id).vertices.size(); }

bool MemoryScene::is_live(GeometryId id) const {
    return id.valid() && id.value() < slots_.size() && !slots_[id.value()].discarded;
}

bool MemoryScene::is_acquired(GeometryId id, BufferKind kind) const {
    return known_slot(id).state[kind_index(kind)].acquired;
}

unsigned MemoryScene::flags(GeometryId id) const { return known_slot(id).flags; }

size_t MemoryScene::acquire_count(GeometryId id, BufferKind kind) const {
    return known_slot(id).state[kind_index(kind)].acquires;
}

size_t MemoryScene::release_count(GeometryId id, BufferKind kind) const {
    return known_slot(id).state[kind_index(kind)].releases;
}

MemoryScene::Slot& MemoryScene::slot(GeometryId id) {
    MESHRT_CHECK(is_live(id), "unknown or discarded geometry id");
    return slots_[id.value()];
}

const MemoryScene::Slot& MemoryScene::slot(GeometryId id) const {
    MESHRT_CHECK(is_live(id), "unknown or discarded geometry id");
    return slots_[id.value()];
}

// Counters stay readable after discard_geometry.
const MemoryScene::Slot& MemoryScene::known_slot(GeometryId id) const {
    MESHRT_CHECK(id.valid() && id.value() < slots_.size(), "unknown geometry id");
    return slots_[id.value()];
}
