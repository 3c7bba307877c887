// primitive.hpp — Oriented primitives fitted to bounds.
//
// Cylinder: axis = longest extent (first axis on ties), radius = half the larger
// of the two remaining extents, depth = extent along the axis. It is generated
// along local +Z and the rotation onto the world axis is baked into the vertices.
// Box: unit cube scaled per axis to half of (max - min).
// Sphere: radius = half of the largest extent.
// All primitives are centered on the bounds center and emitted triangulated,
// closed and outward-wound, so they skip the repair stage.
//
#pragma once
#include "mesh.hpp"
#include "bounds.hpp"

enum class PrimitiveShape { None, Cylinder, Box, Sphere };

struct PrimitiveFit {
    PrimitiveShape shape = PrimitiveShape::None;
    Vec3 center;
    int axis = 2;          // cylinder axis (0=x, 1=y, 2=z)
    double radius = 0;     // cylinder, sphere
    double depth = 0;      // cylinder length along `axis`
    Vec3 half_extents;     // box
};

struct PrimitiveOptions {
    int segments = 32;  // cylinder sides / sphere longitude steps
    int rings = 16;     // sphere latitude bands
};

PrimitiveFit fit_primitive(const Bounds& b, PrimitiveShape shape);

// Triangle mesh of a fitted primitive, with face_normals filled.
Mesh primitive_mesh(const PrimitiveFit& fit, const PrimitiveOptions& opt = PrimitiveOptions());

Mesh cylinder_mesh(const Vec3& center, double radius, double depth, int axis, int segments);
Mesh box_mesh(const Vec3& center, const Vec3& half_extents);
Mesh sphere_mesh(const Vec3& center, double radius, int segments, int rings);
