// mesh.cpp - Small helpers on top of the value types in mesh.hpp.

#include "mesh.hpp"
#include <cstdio>
#include <cstdlib>
#include <utility>

const char* buffer_kind_name(BufferKind kind) {
    switch (kind) {
        case BufferKind::Vertex: return "vertex";
        case BufferKind::Index:  return "index";
    }
    return "unknown";
}

bool BuildError::fail(BuildErrc c, std::string msg) {
    code = c;
    message = std::move(msg);
    return false;
}

const char* build_error_name(BuildErrc code) {
    switch (code) {
        case BuildErrc::None:                    return "None";
        case BuildErrc::InvalidInputShape:       return "InvalidInputShape";
        case BuildErrc::UnsupportedElementArity: return "UnsupportedElementArity";
        case BuildErrc::OutOfRangeIndex:         return "OutOfRangeIndex";
    }
    return "Unknown";
}

void meshrt_fatal(const char* file, int line, const char* message) {
    // Buffer protocol violations mean the lowering itself is wrong; there is nothing to recover.
    fprintf(stderr, "[meshrt] FATAL: %s\n  at %s:%d\n", message, file, line);
    fflush(stderr);
    std::abort();
}
