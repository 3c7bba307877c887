// repair.cpp — Vertex merge, loose-geometry removal, triangulation and winding repair.

#include "repair.hpp"
#include "bounds.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <map>
#include <queue>
#include <set>
#include <utility>

using Cell = std::array<long long, 3>;

static Cell cell_of(const Vec3& p, double size) {
    return {{ grid_cell(p.x, size), grid_cell(p.y, size), grid_cell(p.z, size) }};
}

// Greedy weld: each vertex (in index order) snaps to the first earlier
// representative within eps, otherwise becomes a representative itself.
// Representatives end up pairwise farther apart than eps.
static std::vector<int> weld(const std::vector<Vec3>& verts, const std::vector<char>& used, double eps) {
    std::vector<int> rep(verts.size(), -1);
    std::map<Cell, std::vector<int>> grid;
    const double eps2 = eps * eps;
    for (size_t i = 0; i < verts.size(); ++i) {
        if (!used[i]) continue;
        Cell c = cell_of(verts[i], eps);
        int found = -1;
        for (long long dx = -1; dx <= 1 && found < 0; ++dx)
        for (long long dy = -1; dy <= 1 && found < 0; ++dy)
        for (long long dz = -1; dz <= 1 && found < 0; ++dz) {
            auto it = grid.find({{c[0]+dx, c[1]+dy, c[2]+dz}});
            if (it == grid.end()) continue;
            for (int r : it->second) {
                Vec3 d = sub(verts[i], verts[r]);
                if (dot3(d, d) <= eps2 && (found < 0 || r < found)) found = r;
            }
        }
        if (found >= 0) rep[i] = found;
        else { rep[i] = (int)i; grid[c].push_back((int)i); }
    }
    return rep;
}

// Newell normal of a polygon (robust for non-planar input).
static Vec3 newell_normal(const std::vector<Vec3>& v, const std::vector<int>& poly) {
    Vec3 n;
    for (size_t i = 0; i < poly.size(); ++i) {
        const Vec3& a = v[poly[i]];
        const Vec3& b = v[poly[(i + 1) % poly.size()]];
        n.x += (a.y - b.y) * (a.z + b.z);
        n.y += (a.z - b.z) * (a.x + b.x);
        n.z += (a.x - b.x) * (a.y + b.y);
    }
    return normalized(n);
}

struct P2 { double x, y; };

static inline double cross2(const P2& o, const P2& a, const P2& b) {
    return (a.x - o.x) * (b.y - o.y) - (a.y - o.y) * (b.x - o.x);
}

// Inclusive: a vertex on an ear's edge blocks it, otherwise the last triangle
// of the fan can come out collinear.
static bool inside_tri(const P2& p, const P2& a, const P2& b, const P2& c) {
    double d1 = cross2(a, b, p), d2 = cross2(b, c, p), d3 = cross2(c, a, p);
    return d1 >= 0 && d2 >= 0 && d3 >= 0;
}

// Flip triangle winding.
static inline void flip(Tri& t) { std::swap(t.b, t.c); }

void triangulate_polygon(const std::vector<Vec3>& verts, const std::vector<int>& poly,
                         std::vector<Tri>& out) {
    const size_t n = poly.size();
    if (n < 3) return;
    if (n == 3) { out.push_back({poly[0], poly[1], poly[2]}); return; }
    if (n == 4) {
        out.push_back({poly[0], poly[1], poly[2]});
        out.push_back({poly[0], poly[2], poly[3]});
        return;
    }

    // Project to the best-fit plane; the normal's winding makes the 2D polygon CCW.
    Vec3 nrm = newell_normal(verts, poly);
    Vec3 ref = std::abs(nrm.x) < 0.9 ? Vec3{1,0,0} : Vec3{0,1,0};
    Vec3 ax = normalized(cross(ref, nrm));
    Vec3 ay = cross(nrm, ax);
    std::vector<P2> p(n);
    for (size_t i = 0; i < n; ++i) p[i] = { dot3(verts[poly[i]], ax), dot3(verts[poly[i]], ay) };

    std::vector<size_t> idx(n);
    for (size_t i = 0; i < n; ++i) idx[i] = i;
    size_t guard = 0;
    while (idx.size() > 3 && guard < n * n) {
        ++guard;
        bool clipped = false;
        for (size_t k = 0; k < idx.size(); ++k) {
            size_t i0 = idx[(k + idx.size() - 1) % idx.size()], i1 = idx[k], i2 = idx[(k + 1) % idx.size()];
            if (cross2(p[i0], p[i1], p[i2]) <= 0) continue; // reflex or degenerate corner
            bool blocked = false;
            for (size_t j : idx) {
                if (j == i0 || j == i1 || j == i2) continue;
                if (inside_tri(p[j], p[i0], p[i1], p[i2])) { blocked = true; break; }
            }
            if (blocked) continue;
            out.push_back({poly[i0], poly[i1], poly[i2]});
            idx.erase(idx.begin() + k);
            clipped = true;
            break;
        }
        if (!clipped) break;
    }
    // Whatever is left (a triangle, or a polygon with no clean ear) is fanned.
    for (size_t k = 1; k + 1 < idx.size(); ++k)
        out.push_back({poly[idx[0]], poly[idx[k]], poly[idx[k + 1]]});
}

Mesh triangulate(const PolyMesh& in) {
    Mesh m;
    m.verts = in.verts;
    for (const auto& poly : in.polys) triangulate_polygon(in.verts, poly, m.faces);
    return m;
}

Mesh repair_mesh(const Mesh& in, const RepairOptions& opt, RepairReport* rep) {
    return repair_mesh(to_poly_mesh(in), opt, rep);
}

Mesh repair_mesh(const PolyMesh& in, const RepairOptions& opt, RepairReport* rep) {
    RepairReport r;
    const size_t nv = in.verts.size();

    std::vector<char> used(nv, 0);
    std::vector<Vec3> used_pts;
    for (const auto& poly : in.polys) for (int i : poly) used[i] = 1;
    for (size_t i = 0; i < nv; ++i) if (used[i]) used_pts.push_back(in.verts[i]);

    // 1) merge by distance
    Bounds b = bounds_of(used_pts);
    r.epsilon = is_flat(b, opt.flat_ratio) ? opt.flat_epsilon : opt.default_epsilon;
    std::vector<int> rep_of = weld(in.verts, used, r.epsilon);
    for (size_t i = 0; i < nv; ++i) if (used[i] && rep_of[i] != (int)i) r.merged_vertices++;

    std::vector<std::vector<int>> polys;
    polys.reserve(in.polys.size());
    for (const auto& poly : in.polys) {
        std::vector<int> q;
        for (int i : poly) {
            int v = rep_of[i];
            if (q.empty() || q.back() != v) q.push_back(v);
        }
        while (q.size() > 1 && q.front() == q.back()) q.pop_back();
        if (q.size() < 3) { r.removed_faces++; continue; }
        polys.push_back(std::move(q));
    }

    // 3) triangulate, dropping collapsed and duplicate triangles
    std::vector<Tri> tris;
    for (const auto& poly : polys) triangulate_polygon(in.verts, poly, tris);
    std::vector<Tri> kept;
    std::set<std::array<int,3>> seen;
    for (const auto& t : tris) {
        if (t.a == t.b || t.b == t.c || t.a == t.c) { r.removed_faces++; continue; }
        std::array<int,3> key{{t.a, t.b, t.c}};
        std::sort(key.begin(), key.end());
        if (!seen.insert(key).second) { r.removed_faces++; continue; }
        kept.push_back(t);
    }

    // 2) drop loose vertices, keeping the relative order of the survivors
    Mesh out;
    std::vector<int> remap(nv, -1);
    std::vector<char> referenced(nv, 0);
    for (const auto& t : kept) { referenced[t.a] = referenced[t.b] = referenced[t.c] = 1; }
    for (size_t i = 0; i < nv; ++i) {
        if (!referenced[i]) continue;
        remap[i] = (int)out.verts.size();
        out.verts.push_back(in.verts[i]);
    }
    for (size_t i = 0; i < nv; ++i) if (used[i] && rep_of[i] == (int)i && !referenced[i]) r.removed_vertices++;
    for (size_t i = 0; i < nv; ++i) if (!used[i]) r.removed_vertices++;
    out.faces.reserve(kept.size());
    for (const auto& t : kept) out.faces.push_back({remap[t.a], remap[t.b], remap[t.c]});

    // 4) consistent winding: seed each connected piece with its lowest face and
    // propagate across shared edges, then turn closed pieces outward.
    const size_t nf = out.faces.size();
    std::map<std::pair<int,int>, std::vector<int>> edge_faces;
    for (size_t f = 0; f < nf; ++f) {
        const Tri& t = out.faces[f];
        int e[3][2] = {{t.a,t.b},{t.b,t.c},{t.c,t.a}};
        for (auto& p : e) edge_faces[{std::min(p[0],p[1]), std::max(p[0],p[1])}].push_back((int)f);
    }
    auto has_directed = [](const Tri& t, int a, int b) {
        return (t.a == a && t.b == b) || (t.b == a && t.c == b) || (t.c == a && t.a == b);
    };

    std::vector<char> visited(nf, 0);
    for (size_t seed = 0; seed < nf; ++seed) {
        if (visited[seed]) continue;
        std::vector<int> piece;
        std::queue<int> q;
        q.push((int)seed); visited[seed] = 1;
        while (!q.empty()) {
            int f = q.front(); q.pop();
            piece.push_back(f);
            const Tri t = out.faces[f];
            int e[3][2] = {{t.a,t.b},{t.b,t.c},{t.c,t.a}};
            for (auto& p : e) {
                for (int g : edge_faces[{std::min(p[0],p[1]), std::max(p[0],p[1])}]) {
                    if (visited[g]) continue;
                    // a consistently wound neighbor walks the shared edge the other way
                    if (has_directed(out.faces[g], p[0], p[1])) { flip(out.faces[g]); r.flipped_faces++; }
                    visited[g] = 1;
                    q.push(g);
                }
            }
        }

        // Signed volume about the piece's centroid; closed pieces come out positive.
        Vec3 c;
        size_t cnt = 0;
        for (int f : piece) {
            const Tri& t = out.faces[f];
            c = add(c, add(out.verts[t.a], add(out.verts[t.b], out.verts[t.c])));
            cnt += 3;
        }
        c = scale(c, 1.0 / (double)cnt);
        double vol = 0;
        for (int f : piece) {
            const Tri& t = out.faces[f];
            vol += dot3(sub(out.verts[t.a], c), cross(sub(out.verts[t.b], c), sub(out.verts[t.c], c)));
        }
        if (vol < 0) {
            for (int f : piece) flip(out.faces[f]);
            r.flipped_faces += piece.size();
        }
    }

    compute_face_normals(out);
    if (rep) *rep = r;
    return out;
}
