//======================================================================
// python_bindings.cpp — pybind11 module `meshcoll_py`.
//
// Exposes the collision core to DCC-side Python scripts:
//   generate_collision(meshes, method=..., ...) -> list of proxy dicts
//   wheel_collision(mesh, radius_offset=0, width_offset=0, ...) -> proxy dict
//   center_of_mass(size=0.15, height_offset=-0.15) -> proxy dict
//
// A mesh is a dict {"name": str, "verts": [(x,y,z)], "faces": [[i,j,k,...]],
// "world": optional 16 floats, row-major}. A proxy dict carries
// name / verts / faces / usage / layer_preset / parent_bone / origin.
//
// Failures raise CollisionError subclasses named after the error code
// (EmptyInputError, DegenerateInputError, InvalidRequestError, CancelledError).
//======================================================================

#include "collision.hpp"
#include "wheels.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <array>
#include <stdexcept>

namespace py = pybind11;

struct CollisionError : std::runtime_error { using std::runtime_error::runtime_error; };
struct EmptyInputError : CollisionError { using CollisionError::CollisionError; };
struct DegenerateInputError : CollisionError { using CollisionError::CollisionError; };
struct InvalidRequestError : CollisionError { using CollisionError::CollisionError; };
struct CancelledError : CollisionError { using CollisionError::CollisionError; };

[[noreturn]] static void raise(const CollisionStatus& st) {
    switch (st.code) {
        case CollisionErrc::EmptyInput:      throw EmptyInputError(st.message);
        case CollisionErrc::DegenerateInput: throw DegenerateInputError(st.message);
        case CollisionErrc::InvalidRequest:  throw InvalidRequestError(st.message);
        case CollisionErrc::Cancelled:       throw CancelledError(st.message);
        case CollisionErrc::Ok:              break;
    }
    throw CollisionError(st.message);
}

static SourceMesh to_source(const py::dict& d) {
    SourceMesh m;
    if (d.contains("name")) m.name = d["name"].cast<std::string>();
    for (const auto& v : d["verts"].cast<std::vector<std::array<double, 3>>>())
        m.verts.push_back(Vec3{v[0], v[1], v[2]});
    if (d.contains("faces")) m.polys = d["faces"].cast<std::vector<std::vector<int>>>();
    if (d.contains("world") && !d["world"].is_none()) {
        auto w = d["world"].cast<std::vector<double>>();
        if (w.size() != 16) throw InvalidRequestError("world matrix must have 16 values");
        for (size_t i = 0; i < 16; ++i) m.world[i] = w[i];
    }
    return m;
}

static py::dict to_dict(const ProxyMesh& p) {
    std::vector<std::array<double, 3>> verts;
    verts.reserve(p.mesh.verts.size());
    for (const auto& v : p.mesh.verts) verts.push_back({v.x, v.y, v.z});
    std::vector<std::array<int, 3>> faces;
    faces.reserve(p.mesh.faces.size());
    for (const auto& f : p.mesh.faces) faces.push_back({f.a, f.b, f.c});

    py::dict d;
    d["name"] = p.name;
    d["verts"] = verts;
    d["faces"] = faces;
    d["usage"] = p.usage;
    d["layer_preset"] = p.layer_preset;
    d["parent_bone"] = p.parent_bone;
    d["origin"] = std::array<double, 3>{{p.origin.x, p.origin.y, p.origin.z}};
    return d;
}

static py::list generate(const py::list& meshes, const std::string& method, int target_face_count,
                  double offset_thickness, bool preserve_details, bool merge_sources,
                  const std::string& category, const std::string& layer_preset,
                  const std::string& usage, const std::string& name_stem, const std::string& parent_bone,
                  bool share_target_across_parts, size_t per_mesh_cap, size_t aggregate_cap,
                  double flat_min_ratio, double time_limit, int progress_interval, bool verbose) {
    CollisionRequest req;
    if (!parse_method(method, req.method)) throw InvalidRequestError("unknown method: " + method);
    if (!parse_category(category, req.category)) throw InvalidRequestError("unknown category: " + category);
    req.target_face_count = target_face_count;
    req.offset_thickness = offset_thickness;
    req.preserve_details = preserve_details;
    req.merge_sources = merge_sources;
    req.layer_preset = layer_preset;
    req.usage = usage;
    req.name_stem = name_stem;
    req.parent_bone = parent_bone;
    req.flat_min_ratio = flat_min_ratio;
    req.share_target_across_parts = share_target_across_parts;
    req.sampling.per_mesh_cap = per_mesh_cap;
    req.sampling.aggregate_cap = aggregate_cap;
    req.time_limit = time_limit;
    req.progress_interval = progress_interval;
    req.verbose = verbose;

    std::vector<SourceMesh> sources;
    for (const auto& item : meshes) sources.push_back(to_source(item.cast<py::dict>()));

    ProxySet proxies;
    CollisionStatus st;
    bool ok;
    {
        // Pure C++ from here on; let other Python threads run.
        py::gil_scoped_release release;
        ok = generate_collision(sources, req, proxies, st);
    }
    if (!ok) raise(st);

    py::list out;
    for (const auto& p : proxies) out.append(to_dict(p));
    return out;
}

static py::dict wheel(const py::dict& mesh, double radius_offset, double width_offset,
               const std::string& layer_preset, int segments) {
    WheelOptions opt;
    opt.radius_offset = radius_offset;
    opt.width_offset = width_offset;
    opt.layer_preset = layer_preset;
    opt.segments = segments;
    ProxyMesh p;
    CollisionStatus st;
    if (!make_wheel_collision(to_source(mesh), opt, p, st)) raise(st);
    return to_dict(p);
}

PYBIND11_MODULE(meshcoll_py, m) {
    m.doc() = "Python bindings for the native meshcoll collision proxy generator";

    auto base = py::register_exception<CollisionError>(m, "CollisionError");
    py::register_exception<EmptyInputError>(m, "EmptyInputError", base.ptr());
    py::register_exception<DegenerateInputError>(m, "DegenerateInputError", base.ptr());
    py::register_exception<InvalidRequestError>(m, "InvalidRequestError", base.ptr());
    py::register_exception<CancelledError>(m, "CancelledError", base.ptr());

    m.def("generate_collision", &generate,
          py::arg("meshes"),
          py::arg("method") = "ucx",
          py::arg("target_face_count") = 50,
          py::arg("offset_thickness") = 0.0,
          py::arg("preserve_details") = true,
          py::arg("merge_sources") = false,
          py::arg("category") = "vehicle",
          py::arg("layer_preset") = "",
          py::arg("usage") = "",
          py::arg("name_stem") = "body",
          py::arg("parent_bone") = "",
          py::arg("share_target_across_parts") = false,
          py::arg("per_mesh_cap") = 100,
          py::arg("aggregate_cap") = 1000,
          py::arg("flat_min_ratio") = 0.8,
          py::arg("time_limit") = -1.0,
          py::arg("progress_interval") = 0,
          py::arg("verbose") = false,
          R"doc(
Generate collision proxies for a list of meshes.

Parameters
----------
meshes : List[dict]
    {"name", "verts": [(x,y,z)], "faces": [[i,j,k,...]], "world": 16 floats or None}.
method : str
    ucx (convex), ucl (cylinder), ubx (box), usp (sphere) or utm (detailed).
target_face_count : int
    Face target per proxy (>= 4). Applies to ucx and utm.
offset_thickness : float
    Outward shell offset (>= 0). Applies to ucx and utm.
preserve_details : bool
    utm only: allow the voxel pre-pass on very dense meshes.
merge_sources : bool
    Produce a single proxy for all meshes.
category : str
    weapon, vehicle or building; selects default usage / layer tags.
parent_bone : str
    Bone every proxy is parented to by the exporter; empty for none.
flat_min_ratio : float
    utm only: flat meshes are decimated once, never below this ratio (0 disables).

Returns
-------
List[dict] with name, verts, faces, usage, layer_preset, parent_bone, origin.

Raises
------
EmptyInputError, DegenerateInputError, InvalidRequestError, CancelledError
        )doc");

    m.def("wheel_collision", &wheel,
          py::arg("mesh"),
          py::arg("radius_offset") = 0.0,
          py::arg("width_offset") = 0.0,
          py::arg("layer_preset") = "Collision_Vehicle",
          py::arg("segments") = 32,
          "X-axis UCL cylinder sized from a wheel mesh's dimensions.");

    m.def("center_of_mass", [](double size, double height_offset) {
              return to_dict(make_center_of_mass(size, height_offset));
          },
          py::arg("size") = 0.15,
          py::arg("height_offset") = -0.15,
          "COM_vehicle marker box.");
}
