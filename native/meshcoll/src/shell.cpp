// shell.cpp — Vertex-normal offset.

#include "shell.hpp"
#include <algorithm>
#include <cmath>

static double corner_angle(const Vec3& p, const Vec3& a, const Vec3& b) {
    Vec3 u = normalized(sub(a, p)), v = normalized(sub(b, p));
    double c = std::max(-1.0, std::min(1.0, dot3(u, v)));
    return std::acos(c);
}

std::vector<Vec3> vertex_normals(const Mesh& mesh) {
    std::vector<Vec3> n(mesh.verts.size());
    for (size_t f = 0; f < mesh.faces.size(); ++f) {
        const Tri& t = mesh.faces[f];
        Vec3 fn = face_normal(mesh, f);
        const Vec3& a = mesh.verts[t.a];
        const Vec3& b = mesh.verts[t.b];
        const Vec3& c = mesh.verts[t.c];
        n[t.a] = add(n[t.a], scale(fn, corner_angle(a, b, c)));
        n[t.b] = add(n[t.b], scale(fn, corner_angle(b, c, a)));
        n[t.c] = add(n[t.c], scale(fn, corner_angle(c, a, b)));
    }
    for (auto& v : n) v = normalized(v);
    return n;
}

Mesh offset_shell(const Mesh& in, double thickness, const ShellOptions& opt) {
    if (thickness == 0.0) return in;

    Mesh out = in;
    out.face_normals.clear();
    std::vector<Vec3> vn = vertex_normals(in);

    std::vector<double> stretch(in.verts.size(), 1.0);
    if (opt.even_thickness) {
        std::vector<double> min_dot(in.verts.size(), 1.0);
        for (size_t f = 0; f < in.faces.size(); ++f) {
            Vec3 fn = face_normal(in, f);
            if (len3(fn) == 0) continue;
            const Tri& t = in.faces[f];
            for (int v : {t.a, t.b, t.c}) min_dot[v] = std::min(min_dot[v], dot3(vn[v], fn));
        }
        for (size_t i = 0; i < stretch.size(); ++i)
            stretch[i] = min_dot[i] > 0 ? std::min(opt.max_stretch, 1.0 / min_dot[i]) : 1.0;
    }

    for (size_t i = 0; i < out.verts.size(); ++i)
        out.verts[i] = add(out.verts[i], scale(vn[i], thickness * stretch[i]));
    return out;
}
