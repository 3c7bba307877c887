// sampler.cpp — Stride sampling of point clouds.

#include "sampler.hpp"

std::vector<Vec3> stride_sample(const std::vector<Vec3>& pts, size_t cap) {
    if (cap == 0 || pts.size() <= cap) return pts;
    size_t stride = (pts.size() + cap - 1) / cap; // ceil(n/cap)
    std::vector<Vec3> out;
    out.reserve(pts.size() / stride + 1);
    for (size_t i = 0; i < pts.size(); i += stride) out.push_back(pts[i]);
    return out;
}

std::vector<Vec3> sample_points(const std::vector<std::vector<Vec3>>& per_mesh,
                                const SampleOptions& opt) {
    std::vector<Vec3> all;
    for (const auto& pts : per_mesh) {
        std::vector<Vec3> s = stride_sample(pts, opt.per_mesh_cap);
        all.insert(all.end(), s.begin(), s.end());
    }
    return stride_sample(all, opt.aggregate_cap);
}
