// remesh.hpp — Voxel-grid vertex clustering, the detail-preserving pre-pass.
//
// Vertices sharing a voxel collapse to their mean; faces that lose a corner are
// dropped, as are duplicates. This evens out very dense regions before
// decimation. The result may be non-manifold; the repair stage cleans up.
//
#pragma once
#include "mesh.hpp"

// voxel_size <= 0 returns the input unchanged.
Mesh voxel_cluster(const Mesh& in, double voxel_size);
