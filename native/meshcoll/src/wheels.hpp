// wheels.hpp — Vehicle helpers: wheel collision cylinders and the center-of-mass marker.
//
// A wheel collider is always a UCL cylinder along X (the axle direction). Its
// size comes from the wheel's scaled local dimensions: the smallest one is the
// tire width, the mean of the other two is the diameter.
//
#pragma once
#include "collision.hpp"
#include <string>

struct WheelOptions {
    double radius_offset = 0.0;   // added to the measured radius
    double width_offset = 0.0;    // added to the measured width
    std::string layer_preset = "Collision_Vehicle";
    int segments = 32;
};

// Clamped after the offsets are applied.
static const double kMinWheelRadius = 0.05;
static const double kMinWheelWidth = 0.02;

// Fails with EmptyInput for a wheel without vertices and InvalidRequest for
// non-finite offsets or fewer than 3 segments.
bool make_wheel_collision(const SourceMesh& wheel, const WheelOptions& opt,
                          ProxyMesh& out, CollisionStatus& st);

// "UCL_wheel_3", "UCL_wheel_L", "UCL_wheel_R" or "UCL_{name}".
std::string wheel_collision_name(const std::string& wheel_name);

// "v_wheel_3", "v_wheel_L", "v_wheel_R", or empty when the name gives no hint.
std::string wheel_bone_name(const std::string& wheel_name);

// Small box below the origin marking the vehicle's center of mass.
ProxyMesh make_center_of_mass(double size = 0.15, double height_offset = -0.15);
