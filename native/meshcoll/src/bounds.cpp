// bounds.cpp — Running min/max over world-space vertices.

#include "bounds.hpp"
#include <algorithm>

double Bounds::max_extent() const {
    Vec3 e = extent();
    return std::max(e.x, std::max(e.y, e.z));
}

double Bounds::min_extent() const {
    Vec3 e = extent();
    return std::min(e.x, std::min(e.y, e.z));
}

int Bounds::longest_axis() const {
    Vec3 e = extent();
    int axis = 0;
    if (e.y > axis_of(e, axis)) axis = 1;
    if (e.z > axis_of(e, axis)) axis = 2;
    return axis;
}

static inline void extend(Bounds& b, const Vec3& p) {
    b.min.x = std::min(b.min.x, p.x); b.max.x = std::max(b.max.x, p.x);
    b.min.y = std::min(b.min.y, p.y); b.max.y = std::max(b.max.y, p.y);
    b.min.z = std::min(b.min.z, p.z); b.max.z = std::max(b.max.z, p.z);
}

static inline void finish(Bounds& b) {
    b.center = scale(add(b.min, b.max), 0.5);
}

bool compute_bounds(const std::vector<SourceMesh>& meshes, Bounds& out, CollisionStatus& st) {
    bool any = false;
    Bounds b;
    for (const auto& m : meshes) {
        for (size_t i = 0; i < m.verts.size(); ++i) {
            Vec3 p = m.world_point(i);
            if (!any) { b.min = p; b.max = p; any = true; }
            else extend(b, p);
        }
    }
    if (!any) return fail(st, CollisionErrc::EmptyInput, "no source vertices");
    finish(b);
    out = b;
    return true;
}

Bounds bounds_of(const std::vector<Vec3>& pts) {
    Bounds b;
    if (pts.empty()) return b;
    b.min = pts[0]; b.max = pts[0];
    for (size_t i = 1; i < pts.size(); ++i) extend(b, pts[i]);
    finish(b);
    return b;
}

bool is_flat(const Bounds& b, double ratio) {
    return b.min_extent() < b.max_extent() * ratio;
}
