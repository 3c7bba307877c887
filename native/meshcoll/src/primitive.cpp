// primitive.cpp — Cylinder / box / UV-sphere generation.

#include "primitive.hpp"
#include <algorithm>
#include <cmath>

static const double kPi = 3.14159265358979323846;

PrimitiveFit fit_primitive(const Bounds& b, PrimitiveShape shape) {
    PrimitiveFit fit;
    fit.shape = shape;
    fit.center = b.center;
    Vec3 e = b.extent();
    switch (shape) {
        case PrimitiveShape::Cylinder: {
            fit.axis = b.longest_axis();
            double other = 0;
            for (int i = 0; i < 3; ++i) if (i != fit.axis) other = std::max(other, axis_of(e, i));
            fit.radius = other * 0.5;
            fit.depth = axis_of(e, fit.axis);
            break;
        }
        case PrimitiveShape::Box:
            fit.half_extents = scale(e, 0.5);
            break;
        case PrimitiveShape::Sphere:
            fit.radius = b.max_extent() * 0.5;
            break;
        case PrimitiveShape::None:
            break;
    }
    return fit;
}

Mesh primitive_mesh(const PrimitiveFit& fit, const PrimitiveOptions& opt) {
    switch (fit.shape) {
        case PrimitiveShape::Cylinder: return cylinder_mesh(fit.center, fit.radius, fit.depth, fit.axis, opt.segments);
        case PrimitiveShape::Box:      return box_mesh(fit.center, fit.half_extents);
        case PrimitiveShape::Sphere:   return sphere_mesh(fit.center, fit.radius, opt.segments, opt.rings);
        case PrimitiveShape::None:     break;
    }
    return Mesh();
}

// Rotate a local +Z-aligned point onto world axis: 90 degrees about Y for X,
// 90 degrees about X for Y. Both are proper rotations, so winding survives.
static Vec3 onto_axis(const Vec3& p, int axis) {
    if (axis == 0) return {p.z, p.y, -p.x};
    if (axis == 1) return {p.x, -p.z, p.y};
    return p;
}

Mesh cylinder_mesh(const Vec3& center, double radius, double depth, int axis, int segments) {
    Mesh m;
    segments = std::max(3, segments);
    const double h = depth * 0.5;
    for (int ring = 0; ring < 2; ++ring) {
        double z = ring == 0 ? -h : h;
        for (int i = 0; i < segments; ++i) {
            double t = 2.0 * kPi * i / segments;
            m.verts.push_back({radius * std::cos(t), radius * std::sin(t), z});
        }
    }
    const int bottom = (int)m.verts.size(); m.verts.push_back({0, 0, -h});
    const int top = (int)m.verts.size();    m.verts.push_back({0, 0, h});

    for (int i = 0; i < segments; ++i) {
        int j = (i + 1) % segments;
        int b0 = i, b1 = j, t0 = segments + i, t1 = segments + j;
        m.faces.push_back({b0, b1, t1});
        m.faces.push_back({b0, t1, t0});
        m.faces.push_back({top, t0, t1});
        m.faces.push_back({bottom, b1, b0});
    }
    for (auto& v : m.verts) v = add(onto_axis(v, axis), center);
    compute_face_normals(m);
    return m;
}

Mesh box_mesh(const Vec3& center, const Vec3& half) {
    Mesh m;
    // corner i has +x when bit 0 is set, +y for bit 1, +z for bit 2
    for (int i = 0; i < 8; ++i) {
        m.verts.push_back({ center.x + ((i & 1) ? half.x : -half.x),
                            center.y + ((i & 2) ? half.y : -half.y),
                            center.z + ((i & 4) ? half.z : -half.z) });
    }
    const int quads[6][4] = {
        {0,4,6,2}, {1,3,7,5},   // -X, +X
        {0,1,5,4}, {2,6,7,3},   // -Y, +Y
        {0,2,3,1}, {4,5,7,6},   // -Z, +Z
    };
    for (const auto& q : quads) {
        m.faces.push_back({q[0], q[1], q[2]});
        m.faces.push_back({q[0], q[2], q[3]});
    }
    compute_face_normals(m);
    return m;
}

Mesh sphere_mesh(const Vec3& center, double radius, int segments, int rings) {
    Mesh m;
    segments = std::max(3, segments);
    rings = std::max(2, rings);
    const int top = 0;
    m.verts.push_back({0, 0, radius});
    for (int k = 1; k < rings; ++k) {
        double phi = kPi * k / rings;
        for (int j = 0; j < segments; ++j) {
            double t = 2.0 * kPi * j / segments;
            m.verts.push_back({radius * std::sin(phi) * std::cos(t),
                               radius * std::sin(phi) * std::sin(t),
                               radius * std::cos(phi)});
        }
    }
    const int bottom = (int)m.verts.size();
    m.verts.push_back({0, 0, -radius});

    auto ring_vert = [&](int k, int j) { return 1 + (k - 1) * segments + (j % segments); };
    for (int j = 0; j < segments; ++j)
        m.faces.push_back({top, ring_vert(1, j), ring_vert(1, j + 1)});
    for (int k = 1; k + 1 < rings; ++k) {
        for (int j = 0; j < segments; ++j) {
            int u0 = ring_vert(k, j), u1 = ring_vert(k, j + 1);
            int l0 = ring_vert(k + 1, j), l1 = ring_vert(k + 1, j + 1);
            m.faces.push_back({u0, l0, l1});
            m.faces.push_back({u0, l1, u1});
        }
    }
    for (int j = 0; j < segments; ++j)
        m.faces.push_back({bottom, ring_vert(rings - 1, j + 1), ring_vert(rings - 1, j)});

    for (auto& v : m.verts) v = add(v, center);
    compute_face_normals(m);
    return m;
}
