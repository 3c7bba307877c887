// sampler.hpp — Stride sampling that bounds the hull builder's working set.
//
// Policy: a mesh with more than per_mesh_cap points keeps every
// ceil(count/per_mesh_cap)-th point starting at index 0. The concatenation is
// strided again by ceil(total/aggregate_cap) when it exceeds aggregate_cap.
// Stride sampling can miss extreme points of thin protrusions; the hull then
// under-covers them. That is an accepted approximation.
//
#pragma once
#include "mesh.hpp"
#include <vector>

struct SampleOptions {
    size_t per_mesh_cap = 100;
    size_t aggregate_cap = 1000;
};

// Keep every ceil(n/cap)-th point; no-op when n <= cap.
std::vector<Vec3> stride_sample(const std::vector<Vec3>& pts, size_t cap);

// Per-mesh pass then aggregate pass. Deterministic: no hidden randomness.
std::vector<Vec3> sample_points(const std::vector<std::vector<Vec3>>& per_mesh,
                                const SampleOptions& opt);
