// mesh.cpp — Helpers on top of the Mesh/SourceMesh containers.
// Kept minimal so the algorithmic code in the pipeline stages is easy to follow.

#include "mesh.hpp"
#include <map>
#include <utility>

// Clear geometry buffers; the hull builder reuses one Mesh across passes.
void Mesh::clear() {
    verts.clear();
    faces.clear();
    face_normals.clear();
}

Vec3 SourceMesh::world_point(size_t i) const {
    const Vec3& p = verts[i];
    const auto& m = world;
    return { m[0]*p.x + m[1]*p.y + m[2]*p.z  + m[3],
             m[4]*p.x + m[5]*p.y + m[6]*p.z  + m[7],
             m[8]*p.x + m[9]*p.y + m[10]*p.z + m[11] };
}

size_t SourceMesh::num_triangles() const {
    size_t n = 0;
    for (const auto& p : polys) if (p.size() >= 3) n += p.size() - 2;
    return n;
}

std::vector<Vec3> world_points(const SourceMesh& src) {
    std::vector<Vec3> pts;
    pts.reserve(src.verts.size());
    for (size_t i = 0; i < src.verts.size(); ++i) pts.push_back(src.world_point(i));
    return pts;
}

PolyMesh world_poly_mesh(const SourceMesh& src) {
    PolyMesh pm;
    pm.verts = world_points(src);
    pm.polys = src.polys;
    return pm;
}

Mesh merge_meshes(const std::vector<Mesh>& parts) {
    Mesh out;
    for (const auto& m : parts) {
        int base = (int)out.verts.size();
        out.verts.insert(out.verts.end(), m.verts.begin(), m.verts.end());
        for (const auto& f : m.faces) out.faces.push_back({f.a+base, f.b+base, f.c+base});
    }
    return out;
}

PolyMesh to_poly_mesh(const Mesh& mesh) {
    PolyMesh pm;
    pm.verts = mesh.verts;
    pm.polys.reserve(mesh.faces.size());
    for (const auto& f : mesh.faces) pm.polys.push_back({f.a, f.b, f.c});
    return pm;
}

Vec3 face_normal(const Mesh& mesh, size_t f) {
    const Tri& t = mesh.faces[f];
    const Vec3& p = mesh.verts[t.a];
    return normalized(cross(sub(mesh.verts[t.b], p), sub(mesh.verts[t.c], p)));
}

void compute_face_normals(Mesh& mesh) {
    mesh.face_normals.resize(mesh.faces.size());
    for (size_t f = 0; f < mesh.faces.size(); ++f) mesh.face_normals[f] = face_normal(mesh, f);
}

double signed_volume(const Mesh& mesh) {
    double v = 0;
    for (const auto& f : mesh.faces)
        v += dot3(mesh.verts[f.a], cross(mesh.verts[f.b], mesh.verts[f.c]));
    return v / 6.0;
}

bool is_closed_manifold(const Mesh& mesh) {
    if (mesh.faces.empty()) return false;
    // directed edge -> use count; a closed, consistently wound mesh uses each
    // directed edge once and its reverse once.
    std::map<std::pair<int,int>, int> directed;
    for (const auto& f : mesh.faces) {
        int e[3][2] = {{f.a,f.b},{f.b,f.c},{f.c,f.a}};
        for (auto& p : e) {
            if (p[0] == p[1]) return false;
            if (++directed[{p[0],p[1]}] > 1) return false;
        }
    }
    for (const auto& kv : directed)
        if (!directed.count({kv.first.second, kv.first.first})) return false;
    return true;
}
