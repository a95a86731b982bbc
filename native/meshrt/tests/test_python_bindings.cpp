// Drives the built meshrt_py module through an embedded interpreter, the way a
// Python caller would: numpy arrays in, exceptions and read-only views out.
#include <gtest/gtest.h>
#include <pybind11/embed.h>
#include <pybind11/numpy.h>

#include <algorithm>
#include <string>
#include <vector>

namespace py = pybind11;
using namespace pybind11::literals;

#ifndef MESHRT_PY_DIR
#define MESHRT_PY_DIR "."
#endif

template <typename T>
static py::array_t<T> array(const std::vector<T>& data, std::vector<py::ssize_t> shape) {
    py::array_t<T> a(shape);
    std::copy(data.begin(), data.end(), a.mutable_data());
    return a;
}

// True if `f` raised a Python exception of exactly the family `type`.
template <typename F>
static bool raises(PyObject* type, F&& f, std::string* message = nullptr) {
    try {
        f();
    } catch (py::error_already_set& e) {
        if (message) *message = e.what();
        return e.matches(type);
    }
    return false;
}

static std::vector<float> unit_cube() {
    return {
        0, 0, 0,  1, 0, 0,  1, 1, 0,  0, 1, 0,
        0, 0, 1,  1, 0, 1,  1, 1, 1,  0, 1, 1,
    };
}

class PythonBindingsTest : public ::testing::Test {
protected:
    void SetUp() override {
        meshrt = py::module_::import("meshrt_py");
        scene = meshrt.attr("Scene")();
    }

    size_t geometry_count() const { return scene.attr("geometry_count").cast<size_t>(); }

    py::module_ meshrt;
    py::object scene;
};

TEST_F(PythonBindingsTest, NoIndicesBuildsTriangleSoup) {
    std::vector<float> soup(2 * 9, 0.25f);
    py::object mesh = meshrt.attr("TriangleMesh")(scene, array(soup, {2, 3, 3}));

    py::array verts = mesh.attr("vertices").cast<py::array>();
    py::array_t<uint32_t> idx = mesh.attr("indices").cast<py::array_t<uint32_t>>();
    EXPECT_EQ(verts.ndim(), 2);
    EXPECT_EQ(verts.shape(0), 6);
    EXPECT_EQ(verts.shape(1), 3);
    ASSERT_EQ(idx.shape(0), 2);
    EXPECT_EQ(idx.at(1, 0), 3u);
    EXPECT_EQ(idx.at(1, 2), 5u);
    EXPECT_EQ(geometry_count(), 1u);
}

TEST_F(PythonBindingsTest, IndicesSelectTheIndexedPath) {
    std::vector<float> verts = {0, 0, 0, 1, 0, 0, 0, 1, 0, 1, 1, 0};
    std::vector<uint32_t> faces = {0, 1, 2, 1, 3, 2};
    py::object mesh = meshrt.attr("TriangleMesh")(scene, array(verts, {4, 3}), array(faces, {2, 3}));

    py::array_t<float> v = mesh.attr("vertices").cast<py::array_t<float>>();
    py::array_t<uint32_t> idx = mesh.attr("indices").cast<py::array_t<uint32_t>>();
    EXPECT_EQ(v.shape(0), 4);
    EXPECT_FLOAT_EQ(v.at(3, 1), 1.0f);
    EXPECT_EQ(idx.at(1, 1), 3u);

    uint32_t id = mesh.attr("mesh_id").cast<uint32_t>();
    EXPECT_EQ(scene.attr("triangle_count")(id).cast<size_t>(), 2u);
    EXPECT_EQ(scene.attr("vertex_count")(id).cast<size_t>(), 4u);
}

TEST_F(PythonBindingsTest, ViewsAreReadOnly) {
    std::vector<float> soup(9, 1.0f);
    py::object mesh = meshrt.attr("TriangleMesh")(scene, array(soup, {1, 3, 3}));
    py::object verts = mesh.attr("vertices");
    py::object idx = mesh.attr("indices");

    EXPECT_FALSE(verts.attr("flags").attr("writeable").cast<bool>());
    EXPECT_FALSE(idx.attr("flags").attr("writeable").cast<bool>());
    EXPECT_TRUE(raises(PyExc_ValueError, [&]() { verts.attr("__setitem__")(0, 5.0f); }));
}

TEST_F(PythonBindingsTest, ViewOutlivesItsMeshHandle) {
    std::vector<float> soup(9, 2.5f);
    py::object verts;
    {
        py::object mesh = meshrt.attr("TriangleMesh")(scene, array(soup, {1, 3, 3}));
        verts = mesh.attr("vertices");
        EXPECT_TRUE(verts.attr("base").is(mesh));
    }
    scene = py::none();
    py::module_::import("gc").attr("collect")();

    py::object base = verts.attr("base");
    EXPECT_TRUE(py::isinstance(base, meshrt.attr("TriangleMesh")));
    py::array_t<float> v = verts.cast<py::array_t<float>>();
    EXPECT_FLOAT_EQ(v.at(2, 2), 2.5f);
}

TEST_F(PythonBindingsTest, WrongSoupShapeRaisesValueError) {
    std::vector<float> flat(12);
    std::string message;
    EXPECT_TRUE(raises(PyExc_ValueError,
                       [&]() { meshrt.attr("TriangleMesh")(scene, array(flat, {4, 3})); }, &message));
    EXPECT_NE(message.find("InvalidInputShape"), std::string::npos) << message;
    EXPECT_EQ(geometry_count(), 0u);
}

TEST_F(PythonBindingsTest, OutOfRangeIndexRaisesValueError) {
    std::vector<float> verts(9);
    std::vector<uint32_t> faces = {0, 1, 3};
    std::string message;
    EXPECT_TRUE(raises(PyExc_ValueError,
                       [&]() { meshrt.attr("TriangleMesh")(scene, array(verts, {3, 3}), array(faces, {1, 3})); },
                       &message));
    EXPECT_NE(message.find("OutOfRangeIndex"), std::string::npos) << message;
    EXPECT_EQ(geometry_count(), 0u);

    py::object mesh = meshrt.attr("TriangleMesh")(scene, array(verts, {3, 3}), array(faces, {1, 3}),
                                                  "validate_indices"_a = false);
    py::array_t<uint32_t> idx = mesh.attr("indices").cast<py::array_t<uint32_t>>();
    EXPECT_EQ(idx.at(0, 2), 3u);
}

TEST_F(PythonBindingsTest, UnsupportedArityRaisesNotImplementedError) {
    std::vector<float> verts(6 * 3);
    std::vector<uint32_t> wedge = {0, 1, 2, 3, 4, 5};
    std::string message;
    EXPECT_TRUE(raises(PyExc_NotImplementedError,
                       [&]() { meshrt.attr("ElementMesh")(scene, array(verts, {6, 3}), array(wedge, {1, 6})); },
                       &message));
    EXPECT_NE(message.find("UnsupportedElementArity"), std::string::npos) << message;
    EXPECT_EQ(geometry_count(), 0u);
}

TEST_F(PythonBindingsTest, HexMeshMapsTrianglesBackToElements) {
    std::vector<uint32_t> hex = {0, 1, 2, 3, 4, 5, 6, 7};
    py::object mesh = meshrt.attr("ElementMesh")(scene, array(unit_cube(), {8, 3}), array(hex, {1, 8}));

    EXPECT_EQ(mesh.attr("element_type").cast<std::string>(), "hexahedron");
    EXPECT_EQ(mesh.attr("element_count").cast<size_t>(), 1u);
    py::array idx = mesh.attr("indices").cast<py::array>();
    py::array verts = mesh.attr("vertices").cast<py::array>();
    EXPECT_EQ(idx.shape(0), 12);
    EXPECT_EQ(verts.shape(0), 8);

    EXPECT_EQ(mesh.attr("element_of_triangle")(11).cast<size_t>(), 0u);
    EXPECT_TRUE(raises(PyExc_IndexError, [&]() { mesh.attr("element_of_triangle")(12); }));
}

TEST_F(PythonBindingsTest, UnknownMeshIdRaisesKeyError) {
    EXPECT_TRUE(raises(PyExc_KeyError, [&]() { scene.attr("triangle_count")(7); }));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    py::scoped_interpreter guard;
    py::module_::import("sys").attr("path").attr("insert")(0, MESHRT_PY_DIR);
    return RUN_ALL_TESTS();
}
