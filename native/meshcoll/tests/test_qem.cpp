/**
 * @file test_qem.cpp
 * @brief Unit tests for the quadric edge-collapse simplifier
 */

#include <gtest/gtest.h>

#include "bounds.hpp"
#include "qem.hpp"
#include "test_helpers.hpp"

using namespace meshcoll_test;

TEST(DecimationRatioTest, ClampedBetweenMinAndOne) {
    EXPECT_DOUBLE_EQ(0.1, decimation_ratio(50, 4000, 0.1));
    EXPECT_DOUBLE_EQ(0.5, decimation_ratio(50, 100, 0.1));
    EXPECT_DOUBLE_EQ(1.0, decimation_ratio(50, 40, 0.1));
    EXPECT_DOUBLE_EQ(1.0, decimation_ratio(50, 0, 0.1));
}

class QemTest : public ::testing::Test {
protected:
    Mesh box = to_mesh(grid_box("box", 10, {1.0, 1.0, 1.0}));   // 1200 triangles
};

TEST_F(QemTest, ReachesRatioTarget) {
    SimplifyOptions opt;
    opt.ratio = 0.1;
    opt.progress_interval = 0;
    SimplifyReport rep;
    ASSERT_TRUE(qem_simplify(box, opt, rep));
    EXPECT_EQ(1200u, rep.faces_before);
    EXPECT_LE(rep.faces_after, 120u);
    EXPECT_EQ(box.faces.size(), rep.faces_after);
    EXPECT_EQ(box.verts.size(), rep.verts_after);
    EXPECT_GT(rep.collapses, 0);
}

TEST_F(QemTest, TargetFacesOverridesRatio) {
    SimplifyOptions opt;
    opt.ratio = 0.9;
    opt.target_faces = 300;
    opt.progress_interval = 0;
    SimplifyReport rep;
    ASSERT_TRUE(qem_simplify(box, opt, rep));
    EXPECT_LE(box.faces.size(), 300u);
}

TEST_F(QemTest, ClosedManifoldStaysClosed) {
    SimplifyOptions opt;
    opt.ratio = 0.05;
    opt.progress_interval = 0;
    SimplifyReport rep;
    ASSERT_TRUE(qem_simplify(box, opt, rep));
    EXPECT_TRUE(is_closed_manifold(box));
    EXPECT_GT(signed_volume(box), 0.0);
}

TEST_F(QemTest, KeepsTheBoxShape) {
    SimplifyOptions opt;
    opt.ratio = 0.05;
    opt.progress_interval = 0;
    SimplifyReport rep;
    ASSERT_TRUE(qem_simplify(box, opt, rep));
    Bounds b = bounds_of(box.verts);
    EXPECT_VEC3_NEAR((Vec3{-1, -1, -1}), b.min, 1e-6);
    EXPECT_VEC3_NEAR((Vec3{1, 1, 1}), b.max, 1e-6);
    EXPECT_NEAR(8.0, signed_volume(box), 1e-6);
}

TEST_F(QemTest, OpenBorderDoesNotShrink) {
    Mesh plane = to_mesh(quad_plane("plane", 10, 10, 4.0));
    SimplifyOptions opt;
    opt.ratio = 0.2;
    opt.progress_interval = 0;
    SimplifyReport rep;
    ASSERT_TRUE(qem_simplify(plane, opt, rep));
    EXPECT_LT(plane.faces.size(), 200u);
    Bounds b = bounds_of(plane.verts);
    EXPECT_VEC3_NEAR((Vec3{0, 0, 0}), b.min, 1e-6);
    EXPECT_VEC3_NEAR((Vec3{4, 4, 0}), b.max, 1e-6);
}

TEST_F(QemTest, CancelledTokenStopsAndKeepsMeshValid) {
    CancelToken tok;
    tok.cancel();
    SimplifyOptions opt;
    opt.ratio = 0.1;
    opt.cancel = &tok;
    SimplifyReport rep;
    EXPECT_FALSE(qem_simplify(box, opt, rep));
    EXPECT_TRUE(rep.cancelled);
    EXPECT_EQ(1200u, box.faces.size());
    EXPECT_TRUE(is_closed_manifold(box));
}

TEST_F(QemTest, MaxCollapsesCapsWork) {
    SimplifyOptions opt;
    opt.ratio = 0.1;
    opt.max_collapses = 10;
    opt.progress_interval = 0;
    SimplifyReport rep;
    ASSERT_TRUE(qem_simplify(box, opt, rep));
    EXPECT_EQ(10, rep.collapses);
    EXPECT_EQ(1180u, box.faces.size());   // each interior collapse removes two faces
}

TEST(QemEmptyTest, EmptyMeshIsNoop) {
    Mesh m;
    SimplifyOptions opt;
    SimplifyReport rep;
    EXPECT_TRUE(qem_simplify(m, opt, rep));
    EXPECT_EQ(0u, rep.faces_after);
}
