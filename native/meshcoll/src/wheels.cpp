// wheels.cpp — Wheel cylinders and center-of-mass box.

#include "wheels.hpp"
#include "bounds.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <utility>

static std::string lower(std::string s) {
    for (auto& ch : s) ch = (char)std::tolower((unsigned char)ch);
    return s;
}

// Last run of decimal digits in `s`, empty when there is none.
static std::string last_digits(const std::string& s) {
    std::string run, last;
    for (char ch : s) {
        if (std::isdigit((unsigned char)ch)) {
            run += ch;
        } else if (!run.empty()) {
            last = run;
            run.clear();
        }
    }
    return run.empty() ? last : run;
}

static bool contains(const std::string& s, const char* needle) {
    return s.find(needle) != std::string::npos;
}

std::string wheel_collision_name(const std::string& wheel_name) {
    const std::string n = lower(wheel_name);
    const std::string digits = last_digits(n);
    if (!digits.empty()) return "UCL_wheel_" + digits;
    if (contains(n, "left") || contains(n, "_l") || contains(n, ".l")) return "UCL_wheel_L";
    if (contains(n, "right") || contains(n, "_r") || contains(n, ".r")) return "UCL_wheel_R";
    return "UCL_" + wheel_name;
}

std::string wheel_bone_name(const std::string& wheel_name) {
    const std::string n = lower(wheel_name);
    const std::string digits = last_digits(n);
    if (!digits.empty()) return "v_wheel_" + digits;
    if (contains(n, "left") || contains(n, "_l")) return "v_wheel_L";
    if (contains(n, "right") || contains(n, "_r")) return "v_wheel_R";
    return std::string();
}

// Object dimensions: local bounds scaled by the length of each matrix column.
static Vec3 scaled_dimensions(const SourceMesh& m) {
    Vec3 e = bounds_of(m.verts).extent();
    const auto& w = m.world;
    double sx = len3({w[0], w[4], w[8]});
    double sy = len3({w[1], w[5], w[9]});
    double sz = len3({w[2], w[6], w[10]});
    return {e.x * sx, e.y * sy, e.z * sz};
}

bool make_wheel_collision(const SourceMesh& wheel, const WheelOptions& opt,
                          ProxyMesh& out, CollisionStatus& st) {
    if (wheel.verts.empty())
        return fail(st, CollisionErrc::EmptyInput, "wheel '" + wheel.name + "' has no vertices");
    if (!std::isfinite(opt.radius_offset) || !std::isfinite(opt.width_offset))
        return fail(st, CollisionErrc::InvalidRequest, "wheel offsets must be finite");
    if (opt.segments < 3)
        return fail(st, CollisionErrc::InvalidRequest, "wheel cylinder needs at least 3 segments");

    Vec3 d = scaled_dimensions(wheel);
    double dims[3] = {d.x, d.y, d.z};
    std::sort(dims, dims + 3);
    double width = dims[0] + opt.width_offset;
    double radius = (dims[1] + dims[2]) * 0.5 * 0.5 + opt.radius_offset;
    radius = std::max(kMinWheelRadius, radius);
    width = std::max(kMinWheelWidth, width);

    ProxyMesh p;
    p.primitive.shape = PrimitiveShape::Cylinder;
    p.primitive.center = wheel.world_translation();
    p.primitive.axis = 0;
    p.primitive.radius = radius;
    p.primitive.depth = width;
    p.mesh = cylinder_mesh(p.primitive.center, radius, width, 0, opt.segments);
    p.name = wheel_collision_name(wheel.name);
    p.parent_bone = wheel_bone_name(wheel.name);
    p.layer_preset = opt.layer_preset;
    p.usage = opt.layer_preset == "MineTrigger" ? "MineTrigger" : "PhyCol";
    p.origin = p.primitive.center;
    out = std::move(p);
    st = CollisionStatus();
    return true;
}

ProxyMesh make_center_of_mass(double size, double height_offset) {
    ProxyMesh p;
    p.primitive.shape = PrimitiveShape::Box;
    p.primitive.center = {0, 0, height_offset};
    p.primitive.half_extents = {size * 0.5, size, size * 0.5};
    p.mesh = box_mesh(p.primitive.center, p.primitive.half_extents);
    p.name = "COM_vehicle";
    p.layer_preset = "Collision_Vehicle";
    p.usage = "CenterOfMass";
    p.origin = p.primitive.center;
    return p;
}
