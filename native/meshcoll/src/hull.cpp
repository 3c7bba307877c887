// hull.cpp — Quickhull.
//
// High-level flow:
// 1) Drop duplicate points and pick an initial tetrahedron from the axis
//    extremes: most distant pair, farthest point from that line, farthest point
//    from that plane. Failing any step means the input is degenerate.
// 2) Assign every remaining point to the outside set of a face it lies above.
// 3) Repeatedly take an eye point, delete the faces it sees, and stitch the
//    horizon to the eye point with new faces; redistribute orphaned points.
// 4) Compact to the referenced vertices.
// 5) Rebuild from the true corners when a pass kept points lying on a facet or
//    an edge of the final hull.

#include "hull.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <numeric>
#include <utility>

struct QhFace {
    int a, b, c;
    Vec3 normal;
    double dist;  // normal . verts[a]
    std::vector<int> outside;
    bool alive = true;
};

static void set_plane(QhFace& f, const std::vector<Vec3>& v) {
    f.normal = normalized(cross(sub(v[f.b], v[f.a]), sub(v[f.c], v[f.a])));
    f.dist = dot3(f.normal, v[f.a]);
}

static inline double height(const QhFace& f, const Vec3& p) { return dot3(f.normal, p) - f.dist; }

static double hull_epsilon(const std::vector<Vec3>& v) {
    double mx = 0, my = 0, mz = 0;
    for (const auto& p : v) {
        mx = std::max(mx, std::abs(p.x));
        my = std::max(my, std::abs(p.y));
        mz = std::max(mz, std::abs(p.z));
    }
    return std::max(1e-12, 1e-9 * (mx + my + mz));
}

// Initial simplex indices; false when the points do not span a volume.
static bool initial_simplex(const std::vector<Vec3>& v, double eps, int out[4]) {
    int ext[6] = {0,0,0,0,0,0};
    for (int i = 1; i < (int)v.size(); ++i) {
        if (v[i].x < v[ext[0]].x) ext[0] = i;
        if (v[i].x > v[ext[1]].x) ext[1] = i;
        if (v[i].y < v[ext[2]].y) ext[2] = i;
        if (v[i].y > v[ext[3]].y) ext[3] = i;
        if (v[i].z < v[ext[4]].z) ext[4] = i;
        if (v[i].z > v[ext[5]].z) ext[5] = i;
    }

    int p0 = 0, p1 = 0;
    double best = -1;
    for (int i = 0; i < 6; ++i) for (int j = i + 1; j < 6; ++j) {
        Vec3 d = sub(v[ext[i]], v[ext[j]]);
        double d2 = dot3(d, d);
        if (d2 > best) { best = d2; p0 = ext[i]; p1 = ext[j]; }
    }
    if (best <= eps * eps) return false;

    // Farthest from line p0-p1.
    Vec3 dir = normalized(sub(v[p1], v[p0]));
    int p2 = -1; best = -1;
    for (int i = 0; i < (int)v.size(); ++i) {
        if (i == p0 || i == p1) continue;
        Vec3 d = sub(v[i], v[p0]);
        Vec3 perp = sub(d, scale(dir, dot3(d, dir)));
        double d2 = dot3(perp, perp);
        if (d2 > best) { best = d2; p2 = i; }
    }
    if (p2 < 0 || best <= eps * eps) return false;

    // Farthest from plane p0-p1-p2.
    Vec3 n = normalized(cross(sub(v[p1], v[p0]), sub(v[p2], v[p0])));
    int p3 = -1; best = -1;
    for (int i = 0; i < (int)v.size(); ++i) {
        if (i == p0 || i == p1 || i == p2) continue;
        double d = std::abs(dot3(sub(v[i], v[p0]), n));
        if (d > best) { best = d; p3 = i; }
    }
    if (p3 < 0 || best <= eps) return false;

    out[0] = p0; out[1] = p1; out[2] = p2; out[3] = p3;
    return true;
}

std::vector<Vec3> unique_points(const std::vector<Vec3>& pts) {
    std::vector<int> order(pts.size());
    std::iota(order.begin(), order.end(), 0);
    auto less = [&](int i, int j) {
        const Vec3& a = pts[i]; const Vec3& b = pts[j];
        if (a.x != b.x) return a.x < b.x;
        if (a.y != b.y) return a.y < b.y;
        if (a.z != b.z) return a.z < b.z;
        return i < j;
    };
    std::sort(order.begin(), order.end(), less);
    std::vector<char> keep(pts.size(), 1);
    for (size_t k = 1; k < order.size(); ++k) {
        const Vec3& a = pts[order[k-1]]; const Vec3& b = pts[order[k]];
        if (a.x == b.x && a.y == b.y && a.z == b.z) keep[order[k]] = 0;
    }
    std::vector<Vec3> out;
    for (size_t i = 0; i < pts.size(); ++i) if (keep[i]) out.push_back(pts[i]);
    return out;
}

bool spans_volume(const std::vector<Vec3>& pts) {
    std::vector<Vec3> v = unique_points(pts);
    if (v.size() < 4) return false;
    int simplex[4];
    return initial_simplex(v, hull_epsilon(v), simplex);
}

// One quickhull run over unique points; false when they span no volume.
static bool quickhull(const std::vector<Vec3>& v, double eps, Mesh& out) {
    int s[4];
    if (!initial_simplex(v, eps, s)) return false;

    std::vector<QhFace> faces;
    Vec3 inner = scale(add(add(v[s[0]], v[s[1]]), add(v[s[2]], v[s[3]])), 0.25);
    int tris[4][3] = {{s[0],s[1],s[2]}, {s[0],s[3],s[1]}, {s[0],s[2],s[3]}, {s[1],s[3],s[2]}};
    for (auto& t : tris) {
        QhFace f; f.a = t[0]; f.b = t[1]; f.c = t[2];
        set_plane(f, v);
        // Orient away from the tetrahedron's interior.
        if (height(f, inner) > 0) { std::swap(f.b, f.c); set_plane(f, v); }
        faces.push_back(f);
    }

    auto assign = [&](int pi, int first_face) {
        double best = eps;
        int best_face = -1;
        for (int f = first_face; f < (int)faces.size(); ++f) {
            if (!faces[f].alive) continue;
            double h = height(faces[f], v[pi]);
            if (h > best) { best = h; best_face = f; }
        }
        if (best_face >= 0) faces[best_face].outside.push_back(pi);
    };
    for (int i = 0; i < (int)v.size(); ++i) {
        if (i == s[0] || i == s[1] || i == s[2] || i == s[3]) continue;
        assign(i, 0);
    }

    for (;;) {
        int work = -1;
        for (int f = 0; f < (int)faces.size(); ++f)
            if (faces[f].alive && !faces[f].outside.empty()) { work = f; break; }
        if (work < 0) break;

        int eye = -1; double far_h = -1;
        for (int pi : faces[work].outside) {
            double h = height(faces[work], v[pi]);
            if (h > far_h || (h == far_h && pi < eye)) { far_h = h; eye = pi; }
        }

        std::vector<char> visible(faces.size(), 0);
        for (int f = 0; f < (int)faces.size(); ++f)
            if (faces[f].alive && height(faces[f], v[eye]) > eps) visible[f] = 1;

        // Directed edge -> owning live face, to find each edge's twin.
        std::map<std::pair<int,int>, int> owner;
        for (int f = 0; f < (int)faces.size(); ++f) {
            if (!faces[f].alive) continue;
            owner[{faces[f].a, faces[f].b}] = f;
            owner[{faces[f].b, faces[f].c}] = f;
            owner[{faces[f].c, faces[f].a}] = f;
        }

        std::vector<std::pair<int,int>> horizon;
        std::vector<int> orphans;
        for (int f = 0; f < (int)faces.size(); ++f) {
            if (!visible[f]) continue;
            int e[3][2] = {{faces[f].a,faces[f].b},{faces[f].b,faces[f].c},{faces[f].c,faces[f].a}};
            for (auto& ed : e) {
                auto it = owner.find({ed[1], ed[0]});
                if (it != owner.end() && !visible[it->second]) horizon.push_back({ed[0], ed[1]});
            }
            for (int pi : faces[f].outside) if (pi != eye) orphans.push_back(pi);
            faces[f].outside.clear();
            faces[f].alive = false;
        }

        int first_new = (int)faces.size();
        for (const auto& ed : horizon) {
            QhFace nf; nf.a = ed.first; nf.b = ed.second; nf.c = eye;
            set_plane(nf, v);
            faces.push_back(nf);
        }
        std::sort(orphans.begin(), orphans.end());
        for (int pi : orphans) assign(pi, first_new);
    }

    // Compact to referenced vertices, in first-reference order.
    std::vector<int> remap(v.size(), -1);
    out.clear();
    for (const auto& f : faces) {
        if (!f.alive) continue;
        int idx[3] = {f.a, f.b, f.c};
        for (int& i : idx) {
            if (remap[i] < 0) { remap[i] = (int)out.verts.size(); out.verts.push_back(v[i]); }
            i = remap[i];
        }
        out.faces.push_back({idx[0], idx[1], idx[2]});
        out.face_normals.push_back(f.normal);
    }
    return true;
}

// Hull vertices whose incident faces lie in at least three distinct planes.
// A vertex with fewer sits inside a facet or on an edge: an earlier step took it
// as an extreme point before the true corners were known.
static std::vector<Vec3> corner_points(const Mesh& hull) {
    std::vector<std::vector<Vec3>> planes(hull.verts.size());
    for (size_t f = 0; f < hull.faces.size(); ++f) {
        const Tri& t = hull.faces[f];
        const Vec3& n = hull.face_normals[f];
        if (len3(n) == 0) continue;
        for (int vi : {t.a, t.b, t.c}) {
            auto& ns = planes[vi];
            bool seen = false;
            for (const auto& m : ns) if (dot3(m, n) > 1.0 - 1e-9) { seen = true; break; }
            if (!seen) ns.push_back(n);
        }
    }
    std::vector<Vec3> corners;
    for (size_t i = 0; i < hull.verts.size(); ++i)
        if (planes[i].size() >= 3) corners.push_back(hull.verts[i]);
    return corners;
}

bool build_convex_hull(const std::vector<Vec3>& pts, Mesh& out, CollisionStatus& st) {
    std::vector<Vec3> v = unique_points(pts);
    if (v.size() < 4)
        return fail(st, CollisionErrc::DegenerateInput,
                    "convex hull needs 4 unique points, got " + std::to_string(v.size()));

    const double eps = hull_epsilon(v);
    Mesh hull;
    for (;;) {
        if (!quickhull(v, eps, hull))
            return fail(st, CollisionErrc::DegenerateInput, "all points are collinear or coplanar");
        std::vector<Vec3> corners = corner_points(hull);
        if (corners.size() == hull.verts.size() || corners.size() < 4) break;
        v.swap(corners);
    }
    out = std::move(hull);
    return true;
}
