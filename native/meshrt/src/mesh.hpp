// mesh.hpp - Core value types shared by the meshrt lowering layer.
//
// Conventions used across meshrt:
// - Positions are single-precision (x,y,z), the layout the ray-tracing scene expects.
// - Triangles are 3 unsigned 32-bit indices into the vertex buffer (0-based).
// - Input arrays arrive as dense row-major numeric arrays with an explicit shape;
//   the builders check rank/shape before touching the scene.
// - Recoverable input errors are returned as bool + BuildError; broken buffer
//   protocol is a programming error and goes through MESHRT_CHECK (fatal).
//
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Vertex position as stored in the scene's vertex buffer (12 bytes, no padding).
struct Vertex { float x{}, y{}, z{}; };

// Triangle made of 3 vertex indices. Winding order is kept exactly as produced.
struct Triangle { uint32_t v0{}, v1{}, v2{}; };

static_assert(sizeof(Vertex) == 3 * sizeof(float), "Vertex must be tightly packed");
static_assert(sizeof(Triangle) == 3 * sizeof(uint32_t), "Triangle must be tightly packed");

// Opaque geometry handle handed out by a scene. Wrapping the integer keeps it
// from being mixed up with counts or indices.
class GeometryId {
public:
    GeometryId() = default;
    explicit GeometryId(uint32_t value) : value_(value) {}

    static GeometryId invalid() { return GeometryId(); }

    uint32_t value() const { return value_; }
    bool valid() const { return value_ != kInvalid; }

    bool operator==(const GeometryId& o) const { return value_ == o.value_; }
    bool operator!=(const GeometryId& o) const { return value_ != o.value_; }

private:
    static constexpr uint32_t kInvalid = 0xFFFFFFFFu;
    uint32_t value_ = kInvalid;
};

// Which of the two per-geometry buffers an access refers to.
enum class BufferKind { Vertex, Index };

const char* buffer_kind_name(BufferKind kind);

// Allocation hint: the geometry is never modified after its buffers are released.
constexpr unsigned kGeometryStatic = 1u << 0;

// Non-owning view of a dense, row-major numeric array.
template <typename T>
struct DenseArray {
    const T* data = nullptr;
    std::vector<size_t> shape;

    size_t rank() const { return shape.size(); }
    size_t dim(size_t i) const { return i < shape.size() ? shape[i] : 0; }
    size_t size() const {
        size_t n = 1;
        for (size_t d : shape) n *= d;
        return n;
    }
};

// Recoverable construction failures; all are detected before any allocation.
enum class BuildErrc {
    None,
    InvalidInputShape,        // rank/dimension mismatch, or counts beyond 32-bit indexing
    UnsupportedElementArity,  // element width is neither 4 nor 8
    OutOfRangeIndex,          // index >= vertex count (only with validate_indices)
};

struct BuildError {
    BuildErrc code = BuildErrc::None;
    std::string message;

    // Fill both fields and return false so callers can `return err.fail(...)`.
    bool fail(BuildErrc c, std::string msg);
};

const char* build_error_name(BuildErrc code);

// Tuning knobs for a single construction. See python_bindings.cpp for the Python wiring.
struct BuildOptions {
    bool validate_indices = true;  // reject index >= vertex count instead of writing it through
    bool verbose = false;          // one summary line per construction on stderr
};

// Fatal check for internal invariants (buffer protocol). Prints location and aborts.
[[noreturn]] void meshrt_fatal(const char* file, int line, const char* message);

#define MESHRT_CHECK(cond, message) \
    do { if (!(cond)) meshrt_fatal(__FILE__, __LINE__, (message)); } while (0)
