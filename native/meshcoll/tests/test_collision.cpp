/**
 * @file test_collision.cpp
 * @brief End-to-end tests for collision proxy generation
 */

#include <gtest/gtest.h>

#include "bounds.hpp"
#include "collision.hpp"
#include "hull.hpp"
#include "test_helpers.hpp"

#include <cmath>
#include <limits>

using namespace meshcoll_test;

namespace {

ProxyMesh sentinel() {
    ProxyMesh p;
    p.name = "untouched";
    return p;
}

std::vector<AssemblerState> states(std::initializer_list<AssemblerState> s) { return s; }

} // namespace

class CollisionTest : public ::testing::Test {
protected:
    SourceMesh dense_box = grid_box("hull", 18, {1.0, 1.0, 1.0});   // 1946 vertices
    SourceMesh small_box = grid_box("small", 3, {1.0, 1.0, 1.0});

    ProxySet out;
    CollisionStatus st;
    CollisionReport rep;
};

// =============================================================================
// Convex hull path
// =============================================================================

TEST_F(CollisionTest, DenseBoxGivesOneClosedHullWithinTarget) {
    CollisionRequest req;
    req.method = CollisionMethod::Convex;
    req.target_face_count = 50;

    ASSERT_TRUE(generate_collision({dense_box}, req, out, st, &rep)) << st.message;
    ASSERT_EQ(1u, out.size());
    const ProxyMesh& p = out[0];
    EXPECT_EQ("UCX_body", p.name);
    EXPECT_LE(p.mesh.faces.size(), 50u);
    EXPECT_GE(p.mesh.faces.size(), 4u);
    EXPECT_TRUE(is_closed_manifold(p.mesh));
    EXPECT_GT(signed_volume(p.mesh), 0.0);
    EXPECT_EQ(p.mesh.faces.size(), p.mesh.face_normals.size());
    EXPECT_EQ(3888u, rep.source_faces);
    EXPECT_EQ(states({AssemblerState::Idle, AssemblerState::Validating, AssemblerState::HullPath,
                      AssemblerState::Tagging, AssemblerState::Done}), rep.trace);
}

TEST_F(CollisionTest, OffsetKeepsTopologyAndMovesVerticesOut) {
    CollisionRequest req;
    req.target_face_count = 50;
    ProxySet plain, grown;
    ASSERT_TRUE(generate_collision({dense_box}, req, plain, st));
    req.offset_thickness = 0.01;
    ASSERT_TRUE(generate_collision({dense_box}, req, grown, st));

    ASSERT_EQ(1u, grown.size());
    const Mesh& a = plain[0].mesh;
    const Mesh& b = grown[0].mesh;
    ASSERT_EQ(a.verts.size(), b.verts.size());
    ASSERT_EQ(a.faces.size(), b.faces.size());
    Vec3 c = centroid(a.verts);
    for (size_t i = 0; i < a.verts.size(); ++i)
        EXPECT_GE(len3(sub(b.verts[i], c)), len3(sub(a.verts[i], c)));
    EXPECT_GT(signed_volume(b), signed_volume(a));
}

TEST_F(CollisionTest, SmallHullKeepsExactBox) {
    CollisionRequest req;
    ASSERT_TRUE(generate_collision({small_box}, req, out, st));
    ASSERT_EQ(1u, out.size());
    EXPECT_EQ(8u, out[0].mesh.verts.size());
    EXPECT_EQ(12u, out[0].mesh.faces.size());
    EXPECT_NEAR(8.0, signed_volume(out[0].mesh), 1e-9);
    EXPECT_VEC3_NEAR((Vec3{0, 0, 0}), out[0].origin, 1e-12);
    EXPECT_TRUE(out[0].parent_bone.empty());
}

TEST_F(CollisionTest, DenseSourceIsPreDecimatedBeforeTheHull) {
    CollisionRequest req;
    req.target_face_count = 50;
    ASSERT_TRUE(generate_collision({dense_box}, req, out, st, &rep));
    EXPECT_EQ(1u, rep.pre_decimated_sources);
    // 3888 triangles above 2 x 50: one pass at the 0.1 floor.
    EXPECT_GT(rep.pre_decimated_faces, 100u);
    EXPECT_LE(rep.pre_decimated_faces, 388u);
}

TEST_F(CollisionTest, SmallSourceSkipsThePreDecimation) {
    CollisionRequest req;
    req.target_face_count = 50;   // small_box has 54 triangles, under 2 x 50
    ASSERT_TRUE(generate_collision({small_box}, req, out, st, &rep));
    EXPECT_EQ(0u, rep.pre_decimated_sources);
    EXPECT_EQ(0u, rep.pre_decimated_faces);

    req.target_face_count = 20;   // now above 2 x 20
    ASSERT_TRUE(generate_collision({small_box}, req, out, st, &rep));
    EXPECT_EQ(1u, rep.pre_decimated_sources);
    EXPECT_LE(rep.pre_decimated_faces, 40u);
}

TEST_F(CollisionTest, OneProxyPerSourceInInputOrder) {
    SourceMesh other = small_box;
    other.name = "other";
    other.world = translation(5.0, 0.0, 0.0);

    CollisionRequest req;
    ASSERT_TRUE(generate_collision({small_box, other}, req, out, st));
    ASSERT_EQ(2u, out.size());
    EXPECT_EQ("UCX_body_part_00", out[0].name);
    EXPECT_EQ("UCX_body_part_01", out[1].name);
    EXPECT_VEC3_NEAR((Vec3{0, 0, 0}), out[0].origin, 1e-9);
    EXPECT_VEC3_NEAR((Vec3{5, 0, 0}), out[1].origin, 1e-9);
}

TEST_F(CollisionTest, MergedSourcesGiveOneHull) {
    SourceMesh other = small_box;
    other.world = translation(5.0, 0.0, 0.0);

    CollisionRequest req;
    req.merge_sources = true;
    ASSERT_TRUE(generate_collision({small_box, other}, req, out, st));
    ASSERT_EQ(1u, out.size());
    EXPECT_EQ("UCX_body", out[0].name);
    EXPECT_EQ(8u, out[0].mesh.verts.size());
    Bounds b = bounds_of(out[0].mesh.verts);
    EXPECT_NEAR(-1.0, b.min.x, 1e-9);
    EXPECT_NEAR(6.0, b.max.x, 1e-9);
    EXPECT_NEAR(7.0 * 2.0 * 2.0, signed_volume(out[0].mesh), 1e-9);
}

TEST_F(CollisionTest, MergeToleratesAnEmptySource) {
    SourceMesh empty;
    empty.name = "empty";
    CollisionRequest req;
    req.merge_sources = true;
    ASSERT_TRUE(generate_collision({empty, small_box}, req, out, st));
    EXPECT_EQ(1u, out.size());
}

// =============================================================================
// Primitive path
// =============================================================================

TEST_F(CollisionTest, CylinderAlongLongestAxis) {
    SourceMesh src = grid_box("strut", 2, {0.5, 2.0, 1.0});
    CollisionRequest req;
    req.method = CollisionMethod::Cylinder;
    ASSERT_TRUE(generate_collision({src}, req, out, st, &rep));
    ASSERT_EQ(1u, out.size());
    const ProxyMesh& p = out[0];
    EXPECT_EQ("UCL_body", p.name);
    EXPECT_EQ(PrimitiveShape::Cylinder, p.primitive.shape);
    EXPECT_EQ(1, p.primitive.axis);
    EXPECT_DOUBLE_EQ(1.0, p.primitive.radius);
    EXPECT_DOUBLE_EQ(4.0, p.primitive.depth);
    EXPECT_EQ(128u, p.mesh.faces.size());
    EXPECT_TRUE(is_closed_manifold(p.mesh));
    EXPECT_EQ(AssemblerState::PrimitivePath, rep.trace[2]);
}

TEST_F(CollisionTest, TallSourceGivesZCylinder) {
    SourceMesh post = grid_box("post", 2, {1.0, 1.0, 3.0}, {0.0, 0.0, 2.0});
    CollisionRequest req;
    req.method = CollisionMethod::Cylinder;
    ASSERT_TRUE(generate_collision({post}, req, out, st));
    ASSERT_EQ(1u, out.size());
    EXPECT_EQ(2, out[0].primitive.axis);
    EXPECT_DOUBLE_EQ(1.0, out[0].primitive.radius);
    EXPECT_DOUBLE_EQ(6.0, out[0].primitive.depth);
    EXPECT_VEC3_NEAR((Vec3{0, 0, 2}), out[0].origin, 1e-12);
    Bounds b = bounds_of(out[0].mesh.verts);
    EXPECT_NEAR(-1.0, b.min.z, 1e-12);
    EXPECT_NEAR(5.0, b.max.z, 1e-12);
}

TEST_F(CollisionTest, BoxFollowsWorldTransform) {
    SourceMesh src = small_box;
    src.world = translation(10.0, 0.0, 0.0);
    CollisionRequest req;
    req.method = CollisionMethod::Box;
    ASSERT_TRUE(generate_collision({src}, req, out, st));
    ASSERT_EQ(1u, out.size());
    EXPECT_EQ("UBX_body", out[0].name);
    EXPECT_EQ(12u, out[0].mesh.faces.size());
    Bounds b = bounds_of(out[0].mesh.verts);
    EXPECT_NEAR(9.0, b.min.x, 1e-12);
    EXPECT_NEAR(11.0, b.max.x, 1e-12);
    EXPECT_VEC3_NEAR((Vec3{10, 0, 0}), out[0].origin, 1e-12);
}

TEST_F(CollisionTest, SphereProxy) {
    CollisionRequest req;
    req.method = CollisionMethod::Sphere;
    ASSERT_TRUE(generate_collision({small_box}, req, out, st));
    ASSERT_EQ(1u, out.size());
    EXPECT_EQ("USP_body", out[0].name);
    EXPECT_DOUBLE_EQ(1.0, out[0].primitive.radius);
    EXPECT_TRUE(is_closed_manifold(out[0].mesh));
}

TEST_F(CollisionTest, PrimitiveIgnoresFlatness) {
    SourceMesh plane = quad_plane("plane", 2, 2, 1.0);
    CollisionRequest req;
    req.method = CollisionMethod::Box;
    EXPECT_TRUE(generate_collision({plane}, req, out, st)) << st.message;
}

// =============================================================================
// Detailed path
// =============================================================================

TEST_F(CollisionTest, DetailedDecimatesToTarget) {
    CollisionRequest req;
    req.method = CollisionMethod::Detailed;
    req.target_face_count = 50;
    req.preserve_details = false;
    ASSERT_TRUE(generate_collision({dense_box}, req, out, st, &rep)) << st.message;
    ASSERT_EQ(1u, out.size());
    EXPECT_EQ("UTM_body", out[0].name);
    EXPECT_LE(out[0].mesh.faces.size(), 50u);
    EXPECT_GT(signed_volume(out[0].mesh), 0.0);
    EXPECT_EQ("FireGeo", out[0].usage);
    EXPECT_EQ("Collision_Vehicle", out[0].layer_preset);
    EXPECT_EQ(AssemblerState::DetailedPath, rep.trace[2]);
}

TEST_F(CollisionTest, DetailedWithVoxelPrePass) {
    CollisionRequest req;
    req.method = CollisionMethod::Detailed;
    req.target_face_count = 50;
    req.preserve_details = true;
    ASSERT_TRUE(generate_collision({dense_box}, req, out, st)) << st.message;
    ASSERT_EQ(1u, out.size());
    EXPECT_GE(out[0].mesh.faces.size(), 4u);
    EXPECT_LT(out[0].mesh.faces.size(), 3888u);
}

TEST_F(CollisionTest, FlatPanelKeepsMostFaces) {
    SourceMesh panel = quad_plane("panel", 20, 20, 2.0);   // 800 triangles
    CollisionRequest req;
    req.method = CollisionMethod::Detailed;
    req.target_face_count = 50;
    ASSERT_TRUE(generate_collision({panel}, req, out, st)) << st.message;
    ASSERT_EQ(1u, out.size());
    const size_t kept = out[0].mesh.faces.size();
    EXPECT_LE(kept, 640u);   // one pass at ratio 0.8
    EXPECT_GE(kept, 600u);

    ProxySet thin;
    req.flat_min_ratio = 0.0;
    ASSERT_TRUE(generate_collision({panel}, req, thin, st)) << st.message;
    ASSERT_EQ(1u, thin.size());
    EXPECT_LT(thin[0].mesh.faces.size(), kept);
}

TEST_F(CollisionTest, SharedTargetIsSplitBetweenParts) {
    SourceMesh a = grid_box("a", 6, {1.0, 1.0, 1.0});
    SourceMesh b = a;
    b.world = translation(4.0, 0.0, 0.0);

    CollisionRequest req;
    req.method = CollisionMethod::Detailed;
    req.preserve_details = false;
    req.target_face_count = 100;
    req.share_target_across_parts = true;
    ASSERT_TRUE(generate_collision({a, b}, req, out, st)) << st.message;
    ASSERT_EQ(2u, out.size());
    for (const auto& p : out) EXPECT_LE(p.mesh.faces.size(), 50u);
}

// =============================================================================
// Failures
// =============================================================================

TEST_F(CollisionTest, CoplanarSourceIsDegenerateAndOutputUntouched) {
    SourceMesh plane = quad_plane("plane", 4, 4, 2.0);
    out.push_back(sentinel());

    CollisionRequest req;
    EXPECT_FALSE(generate_collision({plane}, req, out, st, &rep));
    EXPECT_EQ(CollisionErrc::DegenerateInput, st.code);
    EXPECT_STREQ("DegenerateInputError", errc_name(st.code));
    ASSERT_EQ(1u, out.size());
    EXPECT_EQ("untouched", out[0].name);
    EXPECT_EQ(states({AssemblerState::Idle, AssemblerState::Validating, AssemblerState::Failed}), rep.trace);
}

TEST_F(CollisionTest, SampledAwayApexIsDegenerateDuringValidation) {
    // 199 points on z = 0 and one apex at an odd index: stride 2 sampling
    // keeps only the plane.
    SourceMesh cloud;
    cloud.name = "cloud";
    for (int i = 0; i < 200; ++i) cloud.verts.push_back({(double)(i % 20), (double)(i / 20), 0.0});
    cloud.verts[101] = {5.5, 5.5, 3.0};
    ASSERT_TRUE(spans_volume(cloud.verts));

    out.push_back(sentinel());
    CollisionRequest req;
    EXPECT_FALSE(generate_collision({cloud}, req, out, st, &rep));
    EXPECT_EQ(CollisionErrc::DegenerateInput, st.code);
    EXPECT_EQ(states({AssemblerState::Idle, AssemblerState::Validating, AssemblerState::Failed}), rep.trace);
    EXPECT_EQ("untouched", out[0].name);

    // With a cap that keeps every point the apex survives.
    req.sampling.per_mesh_cap = 200;
    EXPECT_TRUE(generate_collision({cloud}, req, out, st)) << st.message;
}

TEST_F(CollisionTest, TargetBelowFourIsInvalid) {
    CollisionRequest req;
    req.target_face_count = 3;
    EXPECT_FALSE(generate_collision({small_box}, req, out, st));
    EXPECT_EQ(CollisionErrc::InvalidRequest, st.code);
    EXPECT_TRUE(out.empty());
}

TEST_F(CollisionTest, NegativeOrNonFiniteOffsetIsInvalid) {
    CollisionRequest req;
    req.offset_thickness = -0.1;
    EXPECT_FALSE(generate_collision({small_box}, req, out, st));
    EXPECT_EQ(CollisionErrc::InvalidRequest, st.code);

    req.offset_thickness = std::numeric_limits<double>::quiet_NaN();
    EXPECT_FALSE(generate_collision({small_box}, req, out, st));
    EXPECT_EQ(CollisionErrc::InvalidRequest, st.code);
}

TEST_F(CollisionTest, FlatMinRatioOutOfRangeIsInvalid) {
    CollisionRequest req;
    req.flat_min_ratio = 1.5;
    EXPECT_FALSE(generate_collision({small_box}, req, out, st));
    EXPECT_EQ(CollisionErrc::InvalidRequest, st.code);
}

TEST_F(CollisionTest, ZeroSamplingCapIsInvalid) {
    CollisionRequest req;
    req.sampling.per_mesh_cap = 0;
    EXPECT_FALSE(generate_collision({small_box}, req, out, st));
    EXPECT_EQ(CollisionErrc::InvalidRequest, st.code);
}

TEST_F(CollisionTest, NoSourcesIsEmptyInput) {
    CollisionRequest req;
    EXPECT_FALSE(generate_collision({}, req, out, st));
    EXPECT_EQ(CollisionErrc::EmptyInput, st.code);
}

TEST_F(CollisionTest, SourceWithoutVerticesIsEmptyInput) {
    SourceMesh empty;
    empty.name = "empty";
    CollisionRequest req;
    EXPECT_FALSE(generate_collision({small_box, empty}, req, out, st));
    EXPECT_EQ(CollisionErrc::EmptyInput, st.code);
    EXPECT_TRUE(out.empty());
}

TEST_F(CollisionTest, IndexOutOfRangeIsInvalid) {
    SourceMesh bad = tetrahedron();
    bad.polys.push_back({0, 1, 9});
    CollisionRequest req;
    EXPECT_FALSE(generate_collision({bad}, req, out, st));
    EXPECT_EQ(CollisionErrc::InvalidRequest, st.code);
}

TEST_F(CollisionTest, NonFiniteCoordinateIsDegenerate) {
    SourceMesh bad = tetrahedron();
    bad.verts[2].y = std::numeric_limits<double>::infinity();
    CollisionRequest req;
    req.method = CollisionMethod::Box;
    EXPECT_FALSE(generate_collision({bad}, req, out, st));
    EXPECT_EQ(CollisionErrc::DegenerateInput, st.code);
}

TEST_F(CollisionTest, DetailedWithoutFacesIsDegenerate) {
    SourceMesh cloud;
    cloud.name = "cloud";
    cloud.verts = tetrahedron().verts;
    CollisionRequest req;
    req.method = CollisionMethod::Detailed;
    EXPECT_FALSE(generate_collision({cloud}, req, out, st));
    EXPECT_EQ(CollisionErrc::DegenerateInput, st.code);

    // A point cloud is enough for a hull.
    req.method = CollisionMethod::Convex;
    EXPECT_TRUE(generate_collision({cloud}, req, out, st));
}

TEST_F(CollisionTest, CancelledBeforeGeometry) {
    CancelToken tok;
    tok.cancel();
    out.push_back(sentinel());

    CollisionRequest req;
    req.cancel = &tok;
    EXPECT_FALSE(generate_collision({dense_box}, req, out, st, &rep));
    EXPECT_EQ(CollisionErrc::Cancelled, st.code);
    EXPECT_STREQ("CancelledError", errc_name(st.code));
    ASSERT_EQ(1u, out.size());
    EXPECT_EQ("untouched", out[0].name);
    ASSERT_FALSE(rep.trace.empty());
    EXPECT_EQ(AssemblerState::Failed, rep.trace.back());
}

// =============================================================================
// Naming and tags
// =============================================================================

TEST(CollisionNamingTest, PrefixesAndParts) {
    EXPECT_STREQ("UCX", method_prefix(CollisionMethod::Convex));
    EXPECT_STREQ("UCL", method_prefix(CollisionMethod::Cylinder));
    EXPECT_STREQ("UBX", method_prefix(CollisionMethod::Box));
    EXPECT_STREQ("USP", method_prefix(CollisionMethod::Sphere));
    EXPECT_STREQ("UTM", method_prefix(CollisionMethod::Detailed));

    EXPECT_EQ("UCX_body", proxy_name(CollisionMethod::Convex, "body", 0, 1));
    EXPECT_EQ("UTM_body_part_03", proxy_name(CollisionMethod::Detailed, "body", 3, 12));
    EXPECT_EQ("UBX_hull_part_10", proxy_name(CollisionMethod::Box, "hull", 10, 11));
}

TEST(CollisionNamingTest, ParsesMethodAndCategory) {
    CollisionMethod m = CollisionMethod::Convex;
    EXPECT_TRUE(parse_method("UTM", m));
    EXPECT_EQ(CollisionMethod::Detailed, m);
    EXPECT_TRUE(parse_method("cylinder", m));
    EXPECT_EQ(CollisionMethod::Cylinder, m);
    EXPECT_FALSE(parse_method("capsule", m));

    AssetCategory c = AssetCategory::Vehicle;
    EXPECT_TRUE(parse_category("Weapon", c));
    EXPECT_EQ(AssetCategory::Weapon, c);
    EXPECT_FALSE(parse_category("tree", c));
}

TEST(CollisionTagsTest, CategoryProfiles) {
    CollisionRequest req;
    std::string usage, layer;

    req.category = AssetCategory::Weapon;
    resolve_tags(req, usage, layer);
    EXPECT_EQ("Weapon", usage);
    EXPECT_EQ("Weapon", layer);

    req.method = CollisionMethod::Detailed;
    resolve_tags(req, usage, layer);
    EXPECT_EQ("FireGeo", usage);
    EXPECT_EQ("FireGeo", layer);

    req.category = AssetCategory::Building;
    resolve_tags(req, usage, layer);
    EXPECT_EQ("FireGeo", usage);
    EXPECT_EQ("Collision_Building", layer);

    req.method = CollisionMethod::Box;
    resolve_tags(req, usage, layer);
    EXPECT_EQ("Building", usage);
    EXPECT_EQ("Collision_Building", layer);

    req.category = AssetCategory::Vehicle;
    resolve_tags(req, usage, layer);
    EXPECT_EQ("Vehicle", usage);
    EXPECT_EQ("Vehicle", layer);
}

TEST(CollisionTagsTest, ExplicitValuesWin) {
    CollisionRequest req;
    std::string usage, layer;

    req.layer_preset = "MineTrigger";
    resolve_tags(req, usage, layer);
    EXPECT_EQ("MineTrigger", layer);
    EXPECT_EQ("MineTrigger", usage);

    req.layer_preset = "Collision_Vehicle";
    resolve_tags(req, usage, layer);
    EXPECT_EQ("Vehicle", usage);

    req.usage = "PhyCol";
    resolve_tags(req, usage, layer);
    EXPECT_EQ("PhyCol", usage);
    EXPECT_EQ("Collision_Vehicle", layer);
}

TEST_F(CollisionTest, TagsAreAppliedToEveryProxy) {
    SourceMesh other = small_box;
    other.world = translation(3.0, 0.0, 0.0);
    CollisionRequest req;
    req.category = AssetCategory::Weapon;
    req.name_stem = "stock";
    req.parent_bone = "w_stock";
    ASSERT_TRUE(generate_collision({small_box, other}, req, out, st));
    ASSERT_EQ(2u, out.size());
    for (const auto& p : out) {
        EXPECT_EQ("Weapon", p.usage);
        EXPECT_EQ("Weapon", p.layer_preset);
        EXPECT_EQ("w_stock", p.parent_bone);
    }
    EXPECT_EQ("UCX_stock_part_00", out[0].name);
}
