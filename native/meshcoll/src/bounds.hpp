// bounds.hpp — World-space axis-aligned bounds of source meshes.
#pragma once
#include "mesh.hpp"
#include "status.hpp"
#include <vector>

struct Bounds {
    Vec3 min, max, center;

    Vec3 extent() const { return sub(max, min); }
    double max_extent() const;
    double min_extent() const;
    // Index (0=x, 1=y, 2=z) of the largest extent; first axis wins on ties.
    int longest_axis() const;
};

// Single pass over every vertex of every mesh, in world space.
// Fails with EmptyInput when there are no vertices at all.
bool compute_bounds(const std::vector<SourceMesh>& meshes, Bounds& out, CollisionStatus& st);

// Bounds of a plain point list (no failure: an empty list yields zero bounds).
Bounds bounds_of(const std::vector<Vec3>& pts);

// A mesh is "flat" when its smallest extent is below `ratio` times its largest.
bool is_flat(const Bounds& b, double ratio);
