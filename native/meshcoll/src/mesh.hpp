// mesh.hpp — Geometry containers shared by every stage of the collision pipeline.
//
// Conventions used across meshcoll:
// - Mesh is triangle-only (Tri). It is what every pipeline stage produces.
// - SourceMesh is what the host hands us: polygons of any size plus a world
//   transform. It is read-only to the core; stages copy out of it.
// - Indices are 0-based in memory (OBJ uses 1-based; we convert in I/O layer).
// - double precision for positions, as the quadric solver needs it.
//
#pragma once
#include <vector>
#include <array>
#include <string>
#include <cmath>
#include <cstddef>

// 3D point/vector. We use a plain struct for cache-friendly access.
struct Vec3 { double x{}, y{}, z{}; };

// Triangle face made of 3 vertex indices (0-based).
struct Tri { int a{}, b{}, c{}; };

static inline Vec3 add(const Vec3& a, const Vec3& b){ return {a.x+b.x, a.y+b.y, a.z+b.z}; }
static inline Vec3 sub(const Vec3& a, const Vec3& b){ return {a.x-b.x, a.y-b.y, a.z-b.z}; }
static inline Vec3 scale(const Vec3& a, double s){ return {a.x*s, a.y*s, a.z*s}; }
static inline Vec3 cross(const Vec3& a, const Vec3& b){ return {a.y*b.z-a.z*b.y, a.z*b.x-a.x*b.z, a.x*b.y-a.y*b.x}; }
static inline double dot3(const Vec3& a, const Vec3& b){ return a.x*b.x+a.y*b.y+a.z*b.z; }
static inline double len3(const Vec3& a){ return std::sqrt(dot3(a,a)); }
static inline double axis_of(const Vec3& a, int i){ return i==0? a.x : (i==1? a.y : a.z); }

// Unit vector, or zero when the input is (numerically) zero.
static inline Vec3 normalized(const Vec3& a){
    double L = len3(a);
    return L > 1e-300 ? scale(a, 1.0/L) : Vec3{};
}

// Index of the grid cell holding coordinate v for cells of `size`. Clamped to
// +-4e18 so far-out or NaN coordinates still give a valid integer key.
static inline long long grid_cell(double v, double size){
    const double c = std::floor(v / size);
    const double lim = 4e18;
    if (c != c) return 0;
    if (c > lim) return (long long)lim;
    if (c < -lim) return -(long long)lim;
    return (long long)c;
}

// Minimal mesh container: a list of points and a list of triangles.
struct Mesh {
    // Vertex positions in world units.
    std::vector<Vec3> verts;
    // Triangle faces. Each entry is a 3-tuple of indices into verts.
    std::vector<Tri>  faces; // triangles only

    // Optional per-face unit normals, same length/order as faces.
    // Filled by the repair stage and by primitive generation; any stage that
    // changes topology or positions clears it.
    std::vector<Vec3> face_normals;

    // Clear all geometry. Does not shrink capacity (standard vector behavior).
    void clear();

    // Convenience counters.
    size_t num_faces() const { return faces.size(); }
    size_t num_verts() const { return verts.size(); }
};

// Polygon soup with faces of arbitrary size (n >= 3 for a usable face).
struct PolyMesh {
    std::vector<Vec3> verts;
    std::vector<std::vector<int>> polys;
};

// A mesh as exposed by the host scene: local positions, polygons and the
// object's world matrix (row-major 4x4 affine, identity by default).
struct SourceMesh {
    std::string name;
    std::vector<Vec3> verts;
    std::vector<std::vector<int>> polys;
    std::array<double, 16> world{{1,0,0,0, 0,1,0,0, 0,0,1,0, 0,0,0,1}};

    // Position of vertex i after applying the world matrix.
    Vec3 world_point(size_t i) const;
    // Translation part of the world matrix.
    Vec3 world_translation() const { return {world[3], world[7], world[11]}; }
    // Sum of triangles after fan-splitting every polygon.
    size_t num_triangles() const;
};

// World-space positions of every vertex of `src`.
std::vector<Vec3> world_points(const SourceMesh& src);

// World-space copy of `src` as a polygon mesh.
PolyMesh world_poly_mesh(const SourceMesh& src);

// Concatenate several meshes into one, offsetting indices.
Mesh merge_meshes(const std::vector<Mesh>& parts);

// Wrap a triangle mesh as polygons (for the repair stage).
PolyMesh to_poly_mesh(const Mesh& mesh);

// Unit normal of triangle f; zero for degenerate triangles.
Vec3 face_normal(const Mesh& mesh, size_t f);

// Recompute mesh.face_normals from current positions and winding.
void compute_face_normals(Mesh& mesh);

// Signed volume enclosed by the triangles (positive for outward winding of a
// closed mesh).
double signed_volume(const Mesh& mesh);

// True when every undirected edge is used by exactly two faces, with
// opposite orientation.
bool is_closed_manifold(const Mesh& mesh);
