//======================================================================
// python_bindings.cpp
//
// pybind11 bindings exposing the meshrt builders to Python as module meshrt_py.
//
// From Python:
//   scene = meshrt_py.Scene()
//   tm = meshrt_py.TriangleMesh(scene, verts)            # soup, verts (N,3,3)
//   tm = meshrt_py.TriangleMesh(scene, verts, faces)     # indexed, (V,3) + (N,3)
//   em = meshrt_py.ElementMesh(scene, verts, elems)      # elems (E,8) or (E,4)
//
// Input arrays are force-cast to C-contiguous float32 / uint32. The vertices and
// indices attributes are read-only numpy views of the scene-owned buffers; each
// view keeps its mesh (and through it the scene) alive.
//======================================================================

#include "element_mesh.hpp"
#include "mesh.hpp"
#include "scene.hpp"
#include "triangle_mesh.hpp"

#include <pybind11/numpy.h>
#include <pybind11/pybind11.h>

#include <memory>
#include <string>
#include <vector>

namespace py = pybind11;

#ifndef MESHRT_VERSION
#define MESHRT_VERSION "dev"
#endif

using FloatArray = py::array_t<float, py::array::c_style | py::array::forcecast>;
using IndexArray = py::array_t<uint32_t, py::array::c_style | py::array::forcecast>;

template <typename T>
static DenseArray<T> dense_view(const py::array_t<T, py::array::c_style | py::array::forcecast>& a) {
    DenseArray<T> view;
    view.data = a.data();
    for (py::ssize_t i = 0; i < a.ndim(); ++i) view.shape.push_back(static_cast<size_t>(a.shape(i)));
    return view;
}

// Map a BuildError to the Python exception type callers are expected to catch.
[[noreturn]] static void raise_build_error(const BuildError& err) {
    std::string msg = std::string(build_error_name(err.code)) + ": " + err.message;
    if (err.code == BuildErrc::UnsupportedElementArity) {
        PyErr_SetString(PyExc_NotImplementedError, msg.c_str());
        throw py::error_already_set();
    }
    throw py::value_error(msg);
}

static GeometryId live_id(const MemoryScene& scene, uint32_t value) {
    GeometryId id(value);
    if (!scene.is_live(id)) throw py::key_error("no geometry with id " + std::to_string(value));
    return id;
}

static BuildOptions make_options(bool validate_indices, bool verbose) {
    BuildOptions opt;
    opt.validate_indices = validate_indices;
    opt.verbose = verbose;
    return opt;
}

// Read-only (rows, 3) numpy view over a published buffer, owned by `base`.
template <typename T>
static py::array rows3_view(const T* first, size_t rows, py::object base) {
    py::array_t<T> arr({static_cast<py::ssize_t>(rows), static_cast<py::ssize_t>(3)}, first, base);
    arr.attr("setflags")(py::arg("write") = false);
    return arr;
}

// Vertex and Triangle are packed triples (static_asserts in mesh.hpp), so the
// first field addresses the whole row-major buffer. Empty meshes have no buffer.
static py::array buffer_view(const Vertex* data, size_t rows, py::object base) {
    return rows3_view<float>(data ? &data->x : nullptr, rows, base);
}

static py::array buffer_view(const Triangle* data, size_t rows, py::object base) {
    return rows3_view<uint32_t>(data ? &data->v0 : nullptr, rows, base);
}

static TriangleMesh make_triangle_mesh(const std::shared_ptr<MemoryScene>& scene, const FloatArray& vertices,
                                       py::object indices_obj, bool validate_indices, bool verbose) {
    DenseArray<float> verts = dense_view(vertices);
    BuildOptions opt = make_options(validate_indices, verbose);
    TriangleMesh mesh;
    BuildError err;
    bool ok;
    if (indices_obj.is_none()) {
        ok = build_triangle_mesh(scene, verts, nullptr, opt, mesh, err);
    } else {
        IndexArray indices = indices_obj.cast<IndexArray>();
        DenseArray<uint32_t> idx = dense_view(indices);
        ok = build_triangle_mesh(scene, verts, &idx, opt, mesh, err);
    }
    if (!ok) raise_build_error(err);
    return mesh;
}

static ElementMesh make_element_mesh(const std::shared_ptr<MemoryScene>& scene, const FloatArray& vertices,
                                     const IndexArray& indices, bool validate_indices, bool verbose) {
    ElementMesh mesh;
    BuildError err;
    if (!build_element_mesh(scene, dense_view(vertices), dense_view(indices),
                            make_options(validate_indices, verbose), mesh, err))
        raise_build_error(err);
    return mesh;
}

PYBIND11_MODULE(meshrt_py, m) {
    m.doc() = "Lower triangle soups, indexed meshes and hex/tet element meshes into ray-tracing scene buffers";
    m.attr("__version__") = MESHRT_VERSION;

    py::class_<MemoryScene, std::shared_ptr<MemoryScene>>(m, "Scene")
        .def(py::init<>())
        .def_property_readonly("geometry_count", &MemoryScene::geometry_count)
        .def("triangle_count", [](const MemoryScene& s, uint32_t id) { return s.triangle_count(live_id(s, id)); },
             py::arg("mesh_id"))
        .def("vertex_count", [](const MemoryScene& s, uint32_t id) { return s.vertex_count(live_id(s, id)); },
             py::arg("mesh_id"));

    py::class_<TriangleMesh>(m, "TriangleMesh")
        .def(py::init(&make_triangle_mesh),
             py::arg("scene"), py::arg("vertices"), py::arg("indices") = py::none(),
             py::arg("validate_indices") = true, py::arg("verbose") = false,
             R"doc(
Register a triangle mesh with `scene`.

Parameters
----------
scene : Scene
vertices : ndarray
    (N,3,3) triangle soup when `indices` is None, otherwise (V,3) shared vertices.
indices : Optional[ndarray]
    (N,3) zero-based triangle indices.
validate_indices : bool
    Reject indices >= V with ValueError (OutOfRangeIndex).
verbose : bool
    Print a one-line summary to stderr.
)doc")
        .def_property_readonly("mesh_id", [](const TriangleMesh& tm) { return tm.id().value(); })
        .def_property_readonly("vertices", [](py::object self) {
            const TriangleMesh& tm = self.cast<const TriangleMesh&>();
            return buffer_view(tm.vertices(), tm.vertex_count(), self);
        })
        .def_property_readonly("indices", [](py::object self) {
            const TriangleMesh& tm = self.cast<const TriangleMesh&>();
            return buffer_view(tm.indices(), tm.triangle_count(), self);
        });

    py::class_<ElementMesh>(m, "ElementMesh")
        .def(py::init(&make_element_mesh),
             py::arg("scene"), py::arg("vertices"), py::arg("indices"),
             py::arg("validate_indices") = true, py::arg("verbose") = false,
             R"doc(
Register a hexahedral (indices (E,8)) or tetrahedral (indices (E,4)) mesh with
`scene`. Each hexahedron becomes 12 triangles, each tetrahedron 4; vertices are
shared. Any other element width raises NotImplementedError.
)doc")
        .def_property_readonly("mesh_id", [](const ElementMesh& em) { return em.id().value(); })
        .def_property_readonly("element_type", [](const ElementMesh& em) { return element_kind_name(em.kind()); })
        .def_property_readonly("element_count", &ElementMesh::element_count)
        .def("element_of_triangle", [](const ElementMesh& em, size_t prim_id) {
            size_t element = 0;
            if (!em.element_of_triangle(prim_id, element)) throw py::index_error("triangle id out of range");
            return element;
        }, py::arg("prim_id"))
        .def_property_readonly("vertices", [](py::object self) {
            const ElementMesh& em = self.cast<const ElementMesh&>();
            return buffer_view(em.vertices(), em.vertex_count(), self);
        })
        .def_property_readonly("indices", [](py::object self) {
            const ElementMesh& em = self.cast<const ElementMesh&>();
            return buffer_view(em.indices(), em.triangle_count(), self);
        });
}
