// collision.hpp — Collision proxy generation: request, proxies and the pipeline driver.
//
// One call runs a whole request synchronously:
//
//   Idle -> Validating -> { HullPath | PrimitivePath | DetailedPath } -> Tagging -> Done
//                    \-> Failed
//
//   Validating    : request checks; for Convex also the hull input cloud
//                   ([pre-decimate dense sources] -> sample), which must span a volume
//   HullPath      : convex hull -> decimate to target -> shell offset -> repair
//   DetailedPath  : decimate -> [voxel cluster + decimate when still > 2x target
//                   and preserve_details] -> shell offset -> repair
//                   (flat parts: one pass, ratio never below flat_min_ratio)
//   PrimitivePath : bounds -> fitted cylinder / box / sphere
//
// Every request problem is reported before any proxy is handed back: on
// failure `out` is left untouched.
//
#pragma once
#include "mesh.hpp"
#include "status.hpp"
#include "sampler.hpp"
#include "repair.hpp"
#include "shell.hpp"
#include "primitive.hpp"
#include <string>
#include <vector>

enum class CollisionMethod { Convex, Cylinder, Box, Sphere, Detailed };

// Asset family; selects the default export tags.
enum class AssetCategory { Weapon, Vehicle, Building };

enum class AssemblerState { Idle, Validating, HullPath, PrimitivePath, DetailedPath, Tagging, Done, Failed };

struct CollisionRequest {
    CollisionMethod method = CollisionMethod::Convex;
    int    target_face_count = 50;    // >= 4
    double offset_thickness = 0.0;    // >= 0
    bool   preserve_details = true;   // Detailed only: allow the voxel pre-pass
    bool   merge_sources = false;     // one proxy for all sources

    AssetCategory category = AssetCategory::Vehicle;
    std::string layer_preset;         // empty: category default
    std::string usage;                // empty: follows the layer preset
    std::string name_stem = "body";   // "{prefix}_{stem}" / "{prefix}_{stem}_part_{nn}"
    std::string parent_bone;          // copied to every proxy; empty: no parenting
    bool share_target_across_parts = false; // split the target between parts

    SampleOptions sampling;
    RepairOptions repair;
    ShellOptions shell;
    PrimitiveOptions primitive;
    double min_ratio = 0.1;           // lower clamp of every decimation ratio
    int    max_post_passes = 3;       // decimation passes allowed to land on target
    double voxel_factor = 0.05;       // voxel size as a fraction of the largest extent
    double flat_min_ratio = 0.8;      // Detailed: lowest ratio for flat parts; 0 disables

    double time_limit = -1.0;         // per decimation pass, seconds; <=0 disables
    int    progress_interval = 0;     // simplifier progress lines; 0 disables
    bool   verbose = false;           // log state transitions and proxy sizes
    const CancelToken* cancel = nullptr;
};

struct ProxyMesh {
    std::string name;
    Mesh mesh;
    std::string usage;
    std::string layer_preset;
    std::string parent_bone;   // attachment hint for the exporter; empty when none
    Vec3 origin;               // geometric center the exporter uses as object origin
    PrimitiveFit primitive;    // shape None unless the proxy is a fitted primitive
};

using ProxySet = std::vector<ProxyMesh>;

struct CollisionReport {
    std::vector<AssemblerState> trace;  // every state entered, in order
    size_t source_faces = 0;            // triangles across all sources
    size_t proxy_faces = 0;             // triangles across all proxies
    size_t pre_decimated_sources = 0;   // hull sources thinned by the 2x target pre-pass
    size_t pre_decimated_faces = 0;     // their triangles after that pass
};

// Checks the request invariants only (no geometry).
bool validate_request(const CollisionRequest& req, CollisionStatus& st);

// Run one request. On success `out` holds one proxy per source (or exactly one
// when merge_sources), in input order.
bool generate_collision(const std::vector<SourceMesh>& sources, const CollisionRequest& req,
                        ProxySet& out, CollisionStatus& st, CollisionReport* rep = nullptr);

// "UCX", "UCL", "UBX", "USP", "UTM".
const char* method_prefix(CollisionMethod m);
const char* state_name(AssemblerState s);

// Accepts prefixes ("ucx") and names ("convex"), case-insensitive.
bool parse_method(const std::string& s, CollisionMethod& m);
bool parse_category(const std::string& s, AssetCategory& c);

// "{prefix}_{stem}" for a single proxy, "{prefix}_{stem}_part_{index:02}" otherwise.
std::string proxy_name(CollisionMethod m, const std::string& stem, size_t index, size_t count);

// Export tags for a request: explicit values win, then the category profile.
void resolve_tags(const CollisionRequest& req, std::string& usage, std::string& layer_preset);

// Usage implied by a layer preset ("MineTrigger", "FireGeo"), else `fallback`.
std::string usage_for_layer(const std::string& layer_preset, const std::string& fallback);
