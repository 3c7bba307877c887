// collision.cpp — Pipeline driver: validation, the three geometry paths, tagging.

#include "collision.hpp"
#include "bounds.hpp"
#include "hull.hpp"
#include "qem.hpp"
#include "remesh.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>

const char* method_prefix(CollisionMethod m) {
    switch (m) {
        case CollisionMethod::Convex:   return "UCX";
        case CollisionMethod::Cylinder: return "UCL";
        case CollisionMethod::Box:      return "UBX";
        case CollisionMethod::Sphere:   return "USP";
        case CollisionMethod::Detailed: return "UTM";
    }
    return "UCX";
}

const char* state_name(AssemblerState s) {
    switch (s) {
        case AssemblerState::Idle:          return "Idle";
        case AssemblerState::Validating:    return "Validating";
        case AssemblerState::HullPath:      return "HullPath";
        case AssemblerState::PrimitivePath: return "PrimitivePath";
        case AssemblerState::DetailedPath:  return "DetailedPath";
        case AssemblerState::Tagging:       return "Tagging";
        case AssemblerState::Done:          return "Done";
        case AssemblerState::Failed:        return "Failed";
    }
    return "?";
}

static std::string lower(std::string s) {
    for (auto& ch : s) ch = (char)std::tolower((unsigned char)ch);
    return s;
}

bool parse_method(const std::string& s, CollisionMethod& m) {
    const std::string k = lower(s);
    if (k == "ucx" || k == "convex")   { m = CollisionMethod::Convex;   return true; }
    if (k == "ucl" || k == "cylinder") { m = CollisionMethod::Cylinder; return true; }
    if (k == "ubx" || k == "box")      { m = CollisionMethod::Box;      return true; }
    if (k == "usp" || k == "sphere")   { m = CollisionMethod::Sphere;   return true; }
    if (k == "utm" || k == "detailed") { m = CollisionMethod::Detailed; return true; }
    return false;
}

bool parse_category(const std::string& s, AssetCategory& c) {
    const std::string k = lower(s);
    if (k == "weapon")   { c = AssetCategory::Weapon;   return true; }
    if (k == "vehicle")  { c = AssetCategory::Vehicle;  return true; }
    if (k == "building") { c = AssetCategory::Building; return true; }
    return false;
}

std::string proxy_name(CollisionMethod m, const std::string& stem, size_t index, size_t count) {
    std::string name = std::string(method_prefix(m)) + "_" + stem;
    if (count > 1) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "_part_%02zu", index);
        name += buf;
    }
    return name;
}

// Default tags per asset family. Detailed proxies are fire geometry, the rest
// are physics colliders.
struct TagProfile {
    const char* physics_layer;
    const char* physics_usage;
    const char* firegeo_layer;
};

static TagProfile profile_of(AssetCategory c) {
    switch (c) {
        case AssetCategory::Weapon:   return {"Weapon", "Weapon", "FireGeo"};
        case AssetCategory::Vehicle:  return {"Vehicle", "Vehicle", "Collision_Vehicle"};
        case AssetCategory::Building: return {"Collision_Building", "Building", "Collision_Building"};
    }
    return {"Vehicle", "Vehicle", "Collision_Vehicle"};
}

std::string usage_for_layer(const std::string& layer_preset, const std::string& fallback) {
    if (layer_preset == "MineTrigger") return "MineTrigger";
    if (layer_preset == "FireGeo") return "FireGeo";
    return fallback;
}

void resolve_tags(const CollisionRequest& req, std::string& usage, std::string& layer_preset) {
    const TagProfile p = profile_of(req.category);
    const bool firegeo = req.method == CollisionMethod::Detailed;
    layer_preset = !req.layer_preset.empty() ? req.layer_preset
                                             : std::string(firegeo ? p.firegeo_layer : p.physics_layer);
    if (!req.usage.empty()) {
        usage = req.usage;
    } else {
        usage = usage_for_layer(layer_preset, firegeo ? "FireGeo" : p.physics_usage);
    }
}

bool validate_request(const CollisionRequest& req, CollisionStatus& st) {
    if (req.target_face_count < 4)
        return fail(st, CollisionErrc::InvalidRequest,
                    "target_face_count must be >= 4 (got " + std::to_string(req.target_face_count) + ")");
    if (!std::isfinite(req.offset_thickness) || req.offset_thickness < 0)
        return fail(st, CollisionErrc::InvalidRequest, "offset_thickness must be a finite value >= 0");
    if (req.sampling.per_mesh_cap == 0 || req.sampling.aggregate_cap == 0)
        return fail(st, CollisionErrc::InvalidRequest, "sampling caps must be >= 1");
    if (!(req.min_ratio > 0 && req.min_ratio <= 1))
        return fail(st, CollisionErrc::InvalidRequest, "min_ratio must be in (0, 1]");
    if (!(req.flat_min_ratio >= 0 && req.flat_min_ratio <= 1))
        return fail(st, CollisionErrc::InvalidRequest, "flat_min_ratio must be in [0, 1]");
    if (req.max_post_passes < 1)
        return fail(st, CollisionErrc::InvalidRequest, "max_post_passes must be >= 1");
    if (req.name_stem.empty())
        return fail(st, CollisionErrc::InvalidRequest, "name_stem must not be empty");
    return true;
}

struct PipelineRun {
    const CollisionRequest& req;
    CollisionStatus& st;
    CollisionReport& rep;
    AssemblerState state = AssemblerState::Idle;

    void enter(AssemblerState s) {
        state = s;
        rep.trace.push_back(s);
        if (req.verbose) std::fprintf(stderr, "[meshcoll] state=%s\n", state_name(s));
    }

    bool failed(CollisionErrc code, const std::string& msg) {
        enter(AssemblerState::Failed);
        if (req.verbose) std::fprintf(stderr, "[meshcoll] %s: %s\n", errc_name(code), msg.c_str());
        return fail(st, code, msg);
    }

    // A failure already recorded in `st` by a lower stage.
    bool failed() {
        enter(AssemblerState::Failed);
        if (req.verbose) std::fprintf(stderr, "[meshcoll] %s: %s\n", errc_name(st.code), st.message.c_str());
        return false;
    }

    bool check_cancel() {
        if (is_cancelled(req.cancel)) return failed(CollisionErrc::Cancelled, "cancelled");
        return true;
    }

    SimplifyOptions simplify_options(double ratio) const {
        SimplifyOptions opt;
        opt.ratio = ratio;
        opt.time_limit = req.time_limit;
        opt.progress_interval = req.progress_interval;
        opt.cancel = req.cancel;
        return opt;
    }

    // One decimation pass towards `target` faces, ratio clamped by min_ratio.
    bool decimate_pass(Mesh& m, size_t target) {
        if (m.faces.size() <= target) return true;
        return decimate_by(m, decimation_ratio(target, m.faces.size(), req.min_ratio));
    }

    bool decimate_by(Mesh& m, double ratio) {
        if (ratio >= 1.0) return true;
        SimplifyReport r;
        if (!qem_simplify(m, simplify_options(ratio), r))
            return failed(CollisionErrc::Cancelled, "cancelled during decimation");
        if (req.verbose)
            std::fprintf(stderr, "[meshcoll] decimate ratio=%.3f faces %zu -> %zu\n",
                         ratio, r.faces_before, r.faces_after);
        return true;
    }

    // Repeat clamped passes until the target is met, max_post_passes is spent,
    // or a pass makes no progress.
    bool decimate_to(Mesh& m, size_t target) {
        for (int pass = 0; pass < req.max_post_passes && m.faces.size() > target; ++pass) {
            const size_t before = m.faces.size();
            if (!decimate_pass(m, target)) return false;
            if (m.faces.size() >= before) break;
        }
        return true;
    }

    bool finish_mesh(Mesh& m) {
        if (!check_cancel()) return false;
        m = offset_shell(m, req.offset_thickness, req.shell);
        m = repair_mesh(m, req.repair);
        if (m.faces.size() < 4)
            return failed(CollisionErrc::DegenerateInput, "proxy collapsed to fewer than 4 faces");
        return true;
    }

    // Points the hull is built from: sources above 2x target are decimated to
    // 2x target first, then everything is stride sampled.
    bool hull_cloud(const std::vector<const SourceMesh*>& group, size_t target, std::vector<Vec3>& pts) {
        std::vector<std::vector<Vec3>> clouds;
        for (const SourceMesh* src : group) {
            if (!check_cancel()) return false;
            if (src->num_triangles() > 2 * target) {
                Mesh dense = triangulate(world_poly_mesh(*src));
                if (!decimate_pass(dense, 2 * target)) return false;
                rep.pre_decimated_sources++;
                rep.pre_decimated_faces += dense.faces.size();
                clouds.push_back(dense.verts);
            } else {
                clouds.push_back(world_points(*src));
            }
        }
        pts = sample_points(clouds, req.sampling);
        if (req.verbose) std::fprintf(stderr, "[meshcoll] hull input points=%zu\n", pts.size());
        return true;
    }

    bool hull_proxy(const std::vector<Vec3>& pts, size_t target, Mesh& out) {
        if (!build_convex_hull(pts, out, st)) return failed();
        if (!check_cancel()) return false;
        if (!decimate_to(out, target)) return false;
        return finish_mesh(out);
    }

    bool detailed_proxy(const std::vector<const SourceMesh*>& group, size_t target, Mesh& out) {
        std::vector<Mesh> parts;
        for (const SourceMesh* src : group) parts.push_back(triangulate(world_poly_mesh(*src)));
        out = merge_meshes(parts);

        // Thin panels keep most of their faces: one pass, never below flat_min_ratio.
        if (req.flat_min_ratio > 0 && is_flat(bounds_of(out.verts), req.repair.flat_ratio)) {
            if (out.faces.size() > target) {
                const double ratio = std::max(req.flat_min_ratio, (double)target / out.faces.size());
                if (!decimate_by(out, std::max(req.min_ratio, ratio))) return false;
            }
            return finish_mesh(out);
        }

        if (!decimate_pass(out, target)) return false;
        if (req.preserve_details && out.faces.size() > 2 * target) {
            const double voxel = req.voxel_factor * bounds_of(out.verts).max_extent();
            out = voxel_cluster(out, voxel);
            if (req.verbose)
                std::fprintf(stderr, "[meshcoll] voxel=%.6g faces_now=%zu\n", voxel, out.faces.size());
        }
        if (!decimate_to(out, target)) return false;
        return finish_mesh(out);
    }

    bool primitive_proxy(const std::vector<const SourceMesh*>& group, ProxyMesh& proxy) {
        std::vector<SourceMesh> copies;
        for (const SourceMesh* src : group) copies.push_back(*src);
        Bounds b;
        if (!compute_bounds(copies, b, st)) return failed();

        PrimitiveShape shape = PrimitiveShape::Box;
        if (req.method == CollisionMethod::Cylinder) shape = PrimitiveShape::Cylinder;
        else if (req.method == CollisionMethod::Sphere) shape = PrimitiveShape::Sphere;
        proxy.primitive = fit_primitive(b, shape);
        proxy.mesh = primitive_mesh(proxy.primitive, req.primitive);
        return true;
    }
};

static bool finite(const Vec3& v) {
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

bool generate_collision(const std::vector<SourceMesh>& sources, const CollisionRequest& req,
                        ProxySet& out, CollisionStatus& st, CollisionReport* rep_out) {
    CollisionReport local_rep;
    CollisionReport& rep = rep_out ? *rep_out : local_rep;
    rep = CollisionReport();
    st = CollisionStatus();
    PipelineRun run{req, st, rep};
    run.enter(AssemblerState::Idle);

    // ---- validation: nothing below may fail for a reason known here ----
    run.enter(AssemblerState::Validating);
    if (!validate_request(req, st)) return run.failed();

    size_t total_verts = 0;
    for (const auto& src : sources) {
        total_verts += src.verts.size();
        for (const auto& p : src.verts)
            if (!finite(p))
                return run.failed(CollisionErrc::DegenerateInput, "source '" + src.name + "' has a non-finite coordinate");
        for (const auto& poly : src.polys)
            for (int idx : poly)
                if (idx < 0 || (size_t)idx >= src.verts.size())
                    return run.failed(CollisionErrc::InvalidRequest,
                                      "source '" + src.name + "' references vertex " + std::to_string(idx) +
                                      " out of " + std::to_string(src.verts.size()));
        rep.source_faces += src.num_triangles();
    }
    if (sources.empty() || total_verts == 0)
        return run.failed(CollisionErrc::EmptyInput, "no source vertices");

    std::vector<std::vector<const SourceMesh*>> groups;
    if (req.merge_sources) {
        groups.emplace_back();
        for (const auto& src : sources) groups.back().push_back(&src);
    } else {
        for (const auto& src : sources) {
            if (src.verts.empty())
                return run.failed(CollisionErrc::EmptyInput, "source '" + src.name + "' has no vertices");
            groups.push_back({&src});
        }
    }

    size_t target = (size_t)req.target_face_count;
    if (req.share_target_across_parts && groups.size() > 1)
        target = std::max<size_t>(4, target / groups.size());

    std::vector<std::vector<Vec3>> hull_inputs(groups.size());
    for (size_t g = 0; g < groups.size(); ++g) {
        const auto& group = groups[g];
        if (req.method == CollisionMethod::Convex) {
            std::vector<Vec3> pts;
            for (const SourceMesh* src : group) {
                std::vector<Vec3> w = world_points(*src);
                pts.insert(pts.end(), w.begin(), w.end());
            }
            if (!spans_volume(pts))
                return run.failed(CollisionErrc::DegenerateInput,
                                  "points of '" + group.front()->name + "' do not span a volume");
            // Sampling can still drop the only off-plane points.
            if (!run.hull_cloud(group, target, hull_inputs[g])) return false;
            if (!spans_volume(hull_inputs[g]))
                return run.failed(CollisionErrc::DegenerateInput,
                                  "sampled points of '" + group.front()->name + "' do not span a volume");
        } else if (req.method == CollisionMethod::Detailed) {
            size_t tris = 0;
            for (const SourceMesh* src : group) tris += src->num_triangles();
            if (tris == 0)
                return run.failed(CollisionErrc::DegenerateInput,
                                  "source '" + group.front()->name + "' has no faces to decimate");
        }
    }

    // ---- geometry ----
    AssemblerState path = AssemblerState::PrimitivePath;
    if (req.method == CollisionMethod::Convex) path = AssemblerState::HullPath;
    else if (req.method == CollisionMethod::Detailed) path = AssemblerState::DetailedPath;
    run.enter(path);

    ProxySet result(groups.size());
    for (size_t i = 0; i < groups.size(); ++i) {
        if (!run.check_cancel()) return false;
        ProxyMesh& proxy = result[i];
        bool ok = true;
        if (path == AssemblerState::HullPath)          ok = run.hull_proxy(hull_inputs[i], target, proxy.mesh);
        else if (path == AssemblerState::DetailedPath) ok = run.detailed_proxy(groups[i], target, proxy.mesh);
        else                                           ok = run.primitive_proxy(groups[i], proxy);
        if (!ok) return false;
    }

    // ---- tagging ----
    run.enter(AssemblerState::Tagging);
    std::string usage, layer;
    resolve_tags(req, usage, layer);
    for (size_t i = 0; i < result.size(); ++i) {
        ProxyMesh& proxy = result[i];
        proxy.name = proxy_name(req.method, req.name_stem, i, result.size());
        proxy.usage = usage;
        proxy.layer_preset = layer;
        proxy.parent_bone = req.parent_bone;
        proxy.origin = proxy.primitive.shape != PrimitiveShape::None ? proxy.primitive.center
                                                                     : bounds_of(proxy.mesh.verts).center;
        rep.proxy_faces += proxy.mesh.faces.size();
        if (req.verbose)
            std::fprintf(stderr, "[meshcoll] proxy=%s faces=%zu verts=%zu\n",
                         proxy.name.c_str(), proxy.mesh.faces.size(), proxy.mesh.verts.size());
    }

    run.enter(AssemblerState::Done);
    out.swap(result);
    return true;
}
