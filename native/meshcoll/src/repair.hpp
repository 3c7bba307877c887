// repair.hpp — Cleanup pass run after hull / decimation / offset.
//
// Order matters and is fixed:
//   1) merge vertices closer than eps (eps depends on whether the mesh is flat),
//   2) drop vertices no face references,
//   3) split every polygon into triangles (a triangle is always planar, which is
//      what removes "non-planar face" artifacts),
//   4) make winding consistent per connected piece and turn closed pieces outward.
// Running it on its own output changes nothing.
//
#pragma once
#include "mesh.hpp"
#include <vector>

struct RepairOptions {
    double flat_epsilon = 1e-4;     // merge distance for flat meshes
    double default_epsilon = 1e-3;  // merge distance otherwise
    double flat_ratio = 0.1;        // flat when min(extent) < flat_ratio * max(extent)
};

struct RepairReport {
    double epsilon = 0;
    size_t merged_vertices = 0;
    size_t removed_vertices = 0;  // loose vertices deleted after merging
    size_t removed_faces = 0;     // collapsed or duplicate faces
    size_t flipped_faces = 0;
};

Mesh repair_mesh(const PolyMesh& in, const RepairOptions& opt, RepairReport* rep = nullptr);
Mesh repair_mesh(const Mesh& in, const RepairOptions& opt, RepairReport* rep = nullptr);

// Append the triangles of one polygon to `out`. Quads split along their first
// diagonal (0-2); larger polygons are ear-clipped in their best-fit plane.
void triangulate_polygon(const std::vector<Vec3>& verts, const std::vector<int>& poly,
                         std::vector<Tri>& out);

// Triangulate every polygon; vertices are copied unchanged.
Mesh triangulate(const PolyMesh& in);
