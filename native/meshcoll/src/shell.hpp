// shell.hpp — Outward "solidify" offset of a mesh.
//
// Every vertex moves along its angle-weighted vertex normal. This is not a
// Minkowski offset: concave regions can self-intersect and nothing detects it.
//
#pragma once
#include "mesh.hpp"

struct ShellOptions {
    // Scale each displacement so the incident face planes move by the full
    // thickness (sharp corners travel farther), capped at max_stretch.
    bool even_thickness = false;
    double max_stretch = 2.0;
};

// thickness == 0 returns the input unchanged.
Mesh offset_shell(const Mesh& in, double thickness, const ShellOptions& opt = ShellOptions());

// Angle-weighted unit vertex normals; zero for vertices without faces.
std::vector<Vec3> vertex_normals(const Mesh& mesh);
