// remesh.cpp — Vertex clustering on a uniform grid.

#include "remesh.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <map>
#include <set>

Mesh voxel_cluster(const Mesh& in, double voxel_size) {
    if (voxel_size <= 0 || in.verts.empty()) return in;

    std::map<std::array<long long,3>, int> cell_index;
    std::vector<int> cluster(in.verts.size());
    std::vector<Vec3> sum;
    std::vector<int> count;
    for (size_t i = 0; i < in.verts.size(); ++i) {
        const Vec3& p = in.verts[i];
        std::array<long long,3> key{{ grid_cell(p.x, voxel_size),
                                      grid_cell(p.y, voxel_size),
                                      grid_cell(p.z, voxel_size) }};
        auto it = cell_index.find(key);
        int c;
        if (it == cell_index.end()) {
            c = (int)sum.size();
            cell_index.emplace(key, c);
            sum.push_back(Vec3{});
            count.push_back(0);
        } else {
            c = it->second;
        }
        cluster[i] = c;
        sum[c] = add(sum[c], p);
        count[c]++;
    }

    Mesh out;
    out.verts.resize(sum.size());
    for (size_t c = 0; c < sum.size(); ++c) out.verts[c] = scale(sum[c], 1.0 / count[c]);

    std::set<std::array<int,3>> seen;
    for (const auto& f : in.faces) {
        Tri t{cluster[f.a], cluster[f.b], cluster[f.c]};
        if (t.a == t.b || t.b == t.c || t.a == t.c) continue;
        std::array<int,3> key{{t.a, t.b, t.c}};
        std::sort(key.begin(), key.end());
        if (!seen.insert(key).second) continue;
        out.faces.push_back(t);
    }
    return out;
}
