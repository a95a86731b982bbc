// buffer.hpp - Scoped, bounds-checked write access to one scene buffer.
//
// WriteBuffer<T> acquires the buffer on construction and releases it either in
// commit() or in the destructor, so every acquire is paired with exactly one
// release on success and on unwinding alike. Writes are checked against the
// length declared when the geometry slot was allocated, and each slot may be
// written only once.
//
#pragma once
#include "mesh.hpp"
#include "scene.hpp"
#include <cstddef>
#include <vector>

template <typename T>
class WriteBuffer {
public:
    WriteBuffer(GeometryScene& scene, GeometryId id, BufferKind kind, size_t length)
        : scene_(scene), id_(id), kind_(kind), length_(length), filled_(length, false) {
        data_ = static_cast<T*>(scene_.acquire_buffer(id_, kind_));
        MESHRT_CHECK(data_ != nullptr || length_ == 0, "scene returned a null buffer");
    }

    ~WriteBuffer() {
        if (!released_) release();
    }

    WriteBuffer(const WriteBuffer&) = delete;
    WriteBuffer& operator=(const WriteBuffer&) = delete;

    size_t size() const { return length_; }
    size_t written() const { return written_; }

    void set(size_t i, const T& value) {
        MESHRT_CHECK(!released_, "write after buffer release");
        MESHRT_CHECK(i < length_, "write outside the allocated buffer");
        MESHRT_CHECK(!filled_[i], "buffer slot written twice");
        data_[i] = value;
        filled_[i] = true;
        written_++;
    }

    // Release after a complete fill. set() refuses repeats, so written_ == length_
    // means every slot was written exactly once.
    void commit() {
        MESHRT_CHECK(!released_, "buffer committed twice");
        MESHRT_CHECK(written_ == length_, "buffer released before it was fully written");
        release();
    }

private:
    void release() {
        released_ = true;
        data_ = nullptr;
        scene_.release_buffer(id_, kind_);
    }

    GeometryScene& scene_;
    GeometryId id_;
    BufferKind kind_;
    size_t length_;
    T* data_ = nullptr;
    std::vector<bool> filled_;
    size_t written_ = 0;
    bool released_ = false;
};
