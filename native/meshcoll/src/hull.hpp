// hull.hpp — 3D convex hull (quickhull) producing a closed triangle mesh.
//
// Tie-break rules, since coplanar/collinear input has no unique answer:
// - a point whose distance above a face plane is <= eps counts as inside, so
//   points on hull facets or edges never become hull vertices;
// - coplanar facets are kept as separate triangles (a cube gives 12);
// - each iteration expands the lowest-index live face that still has outside
//   points, using its farthest point (lowest input index on equal distance).
// eps scales with the coordinate magnitude of the input.
//
#pragma once
#include "mesh.hpp"
#include "status.hpp"
#include <vector>

// Build the hull of `pts`. Fails with DegenerateInput when fewer than 4
// unique points remain or every point lies in one plane. Output vertices are
// the hull's corner points only; faces are wound counter-clockwise seen from
// outside and face_normals are filled.
bool build_convex_hull(const std::vector<Vec3>& pts, Mesh& out, CollisionStatus& st);

// Distinct points (exact duplicates removed), first occurrence order kept.
std::vector<Vec3> unique_points(const std::vector<Vec3>& pts);

// True when at least 4 unique points exist and they span a volume.
bool spans_volume(const std::vector<Vec3>& pts);
