#include <gtest/gtest.h>
#include "parallel_transport.hpp"
#include <cmath>
#include <numbers>

using namespace serpent;

TEST(ParallelTransportTest, SameTangentKeepsNormal) {
    Vec3 n = parallel_transport(vec3::unit_y(), vec3::unit_x(), vec3::unit_x());
    EXPECT_EQ(n, vec3::unit_y());
}

TEST(ParallelTransportTest, SameTangentKeepsOffAxisNormal) {
    Vec3 t = Vec3(1.0f, 1.0f, 0.0f).normalized();
    Vec3 n0 = Vec3(-1.0f, 1.0f, 0.0f).normalized();
    Vec3 n = parallel_transport(n0, t, t);
    EXPECT_NEAR(n.distance_to(n0), 0.0f, 1e-6f);
    EXPECT_NEAR(n.dot(t), 0.0f, 1e-6f);
}

TEST(ParallelTransportTest, NearlyParallelOnlyProjects) {
    Vec3 t1 = Vec3(1.0f, 0.001f, 0.0f).normalized();
    Vec3 n = parallel_transport(vec3::unit_y(), vec3::unit_x(), t1);
    EXPECT_NEAR(n.length(), 1.0f, 1e-5f);
    EXPECT_NEAR(n.dot(t1), 0.0f, 1e-5f);
    EXPECT_GT(n.dot(vec3::unit_y()), 0.999f);
}

TEST(ParallelTransportTest, QuarterTurnInPlane) {
    // Tangent turns from +x to +y about +z; a normal along z is untouched
    Vec3 n = parallel_transport(vec3::unit_z(), vec3::unit_x(), vec3::unit_y());
    EXPECT_NEAR(n.x, 0.0f, 1e-6f);
    EXPECT_NEAR(n.y, 0.0f, 1e-6f);
    EXPECT_NEAR(n.z, 1.0f, 1e-6f);

    // A normal in the turning plane rotates with the tangent
    Vec3 m = parallel_transport(vec3::unit_y(), vec3::unit_x(), vec3::unit_y());
    EXPECT_NEAR(m.x, -1.0f, 1e-6f);
    EXPECT_NEAR(m.y, 0.0f, 1e-6f);
}

TEST(ParallelTransportTest, AntiparallelStaysOrthogonal) {
    Vec3 n = parallel_transport(vec3::unit_y(), vec3::unit_x(), -vec3::unit_x());
    EXPECT_TRUE(n.is_finite());
    EXPECT_NEAR(n.length(), 1.0f, 1e-5f);
    EXPECT_NEAR(n.dot(vec3::unit_x()), 0.0f, 1e-5f);
}

TEST(ParallelTransportTest, ResultIsUnitAndOrthogonal) {
    Vec3 tangent = vec3::unit_x();
    Vec3 normal = vec3::unit_y();
    for (int i = 1; i <= 500; ++i) {
        float a = static_cast<float>(i) * 0.05f;
        Vec3 next = Vec3(std::cos(a), 0.3f * std::sin(2.0f * a), std::sin(a)).normalized();
        normal = parallel_transport(normal, tangent, next);
        tangent = next;
        ASSERT_NEAR(normal.length(), 1.0f, 1e-4f) << "step " << i;
        ASSERT_NEAR(normal.dot(tangent), 0.0f, 1e-4f) << "step " << i;
    }
}

TEST(ParallelTransportTest, SmallStepsTwistLittle) {
    // Tiny turns must move the normal by at most the tangent's angle
    Vec3 t0 = vec3::unit_x();
    Vec3 t1 = vec3::unit_x().rotated(vec3::unit_z(), 0.02f);
    Vec3 n0 = vec3::unit_y();
    Vec3 n1 = parallel_transport(n0, t0, t1);
    EXPECT_LE(n0.angle_to(n1), 0.02f + 1e-4f);
}

TEST(ArbitraryPerpendicularTest, IsPerpendicular) {
    for (const Vec3& v : {vec3::unit_x(), vec3::unit_y(), vec3::unit_z(),
                          Vec3(1.0f, 2.0f, 3.0f).normalized(), Vec3(0.0f, -1.0f, 0.01f).normalized()}) {
        Vec3 p = arbitrary_perpendicular(v);
        EXPECT_NEAR(p.length(), 1.0f, 1e-5f);
        EXPECT_NEAR(p.dot(v), 0.0f, 1e-5f);
    }
}

TEST(ArbitraryPerpendicularTest, ZeroVectorGivesUnitVector) {
    Vec3 p = arbitrary_perpendicular(vec3::zero());
    EXPECT_NEAR(p.length(), 1.0f, 1e-6f);
}
