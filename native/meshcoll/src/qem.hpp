#pragma once
#include "mesh.hpp"
#include "status.hpp"
#include <vector>
#include <array>
#include <queue>

// Quadric — a 4x4 symmetric matrix representing the squared distance to a set
// of planes (from triangles' plane equations). We store in row-major order.
// The error at a homogeneous point v'=[x,y,z,1] is: E(v') = v'^T Q v'.
struct Quadric { double m[16]; };

// Edge candidate stored in a min-heap. We invert the comparator to get a min-heap
// using std::priority_queue (which is a max-heap by default). Equal costs are
// ordered by vertex index so runs are reproducible.
struct EdgeCand {
    int u, v;          // vertex indices forming the edge (u<v canonicalized before push)
    double cost;       // collapse cost evaluated at `pos`
    Vec3 pos;          // position the merged vertex moves to
    unsigned su, sv;   // vertex stamps at push time; a mismatch marks the entry stale
    bool operator<(const EdgeCand& o) const {
        if (cost != o.cost) return cost > o.cost;
        if (u != o.u) return u > o.u;
        return v > o.v;
    }
};

// Tuning knobs for the simplification run.
struct SimplifyOptions {
    double ratio = 0.5;           // target face ratio (0..1]; used when target_faces<0
    int    target_faces = -1;     // absolute target face count; overrides ratio if >0
    int    max_collapses = -1;    // safety cap on number of edge collapses; default derived from target
    double time_limit = -1.0;     // per-mesh time limit in seconds; <0 disables
    int    progress_interval = 20000; // emit a progress line every N collapses; 0 disables
    double boundary_weight = 100.0;   // weight of the planes pinning open borders in place
    const CancelToken* cancel = nullptr; // polled once per collapse
};

// Summary counters.
struct SimplifyReport {
    size_t faces_before = 0;
    size_t faces_after = 0;
    size_t verts_before = 0;
    size_t verts_after = 0;
    int collapses = 0;
    int rejected = 0;         // candidates refused by the topology/flip guards
    bool timed_out = false;
    bool cancelled = false;
};

// In-place simplification: mutates `mesh` to contain the decimated geometry.
// Returns false only when cancelled through opt.cancel (mesh is then left in
// its partially simplified, still valid state). Collapses that would break
// manifoldness (link condition), fold a face over, or duplicate a face are
// skipped, so a closed manifold input stays closed and manifold.
bool qem_simplify(Mesh& mesh, const SimplifyOptions& opt, SimplifyReport& rep);

// ratio = min(1, target / max(1, current)), never below min_ratio.
double decimation_ratio(size_t target, size_t current, double min_ratio);
