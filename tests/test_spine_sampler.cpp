#include <gtest/gtest.h>
#include "spine_sampler.hpp"
#include "test_helpers.hpp"
#include <memory>

using namespace serpent;

TEST(SpineSamplerTest, BufferLayout) {
    SpineSampler sampler(100);
    EXPECT_EQ(sampler.texture_points(), 100u);
    EXPECT_EQ(sampler.positions().size(), 400u);
    EXPECT_EQ(sampler.normals().size(), 400u);
}

TEST(SpineSamplerTest, RejectsZeroPoints) {
    EXPECT_THROW(SpineSampler{0}, std::invalid_argument);
}

TEST(SpineSamplerTest, SampleU) {
    SpineSampler sampler(5);
    EXPECT_FLOAT_EQ(sampler.sample_u(0), 0.0f);
    EXPECT_FLOAT_EQ(sampler.sample_u(2), 0.5f);
    EXPECT_FLOAT_EQ(sampler.sample_u(4), 1.0f);

    SpineSampler single(1);
    EXPECT_FLOAT_EQ(single.sample_u(0), 0.0f);
}

TEST(SpineSamplerTest, NormalEncoding) {
    Vec3 encoded = SpineSampler::encode_normal(Vec3(-1.0f, 0.0f, 1.0f));
    EXPECT_FLOAT_EQ(encoded.x, 0.0f);
    EXPECT_FLOAT_EQ(encoded.y, 0.5f);
    EXPECT_FLOAT_EQ(encoded.z, 1.0f);

    Vec3 n = Vec3(0.2f, -0.6f, 0.3f).normalized();
    Vec3 decoded = SpineSampler::decode_normal(SpineSampler::encode_normal(n));
    EXPECT_NEAR(decoded.x, n.x, 1e-6f);
    EXPECT_NEAR(decoded.y, n.y, 1e-6f);
    EXPECT_NEAR(decoded.z, n.z, 1e-6f);
}

TEST(SpineSamplerTest, SamplesWindow) {
    auto source = std::make_shared<test::StraightSource>();
    EndlessCurve curve(test::straight_source(source));
    curve.configure_start_end(20.0f, 5.0f);

    SpineSampler sampler(11);
    sampler.update(curve);

    for (size_t i = 0; i < sampler.texture_points(); ++i) {
        Vec3 p = sampler.position(i);
        EXPECT_NEAR(p.x, 20.0f + 0.5f * static_cast<float>(i), 1e-3f);
        EXPECT_NEAR(p.y, 0.0f, 1e-6f);
        EXPECT_FLOAT_EQ(sampler.positions()[i * 4 + 3], 1.0f);

        // Straight along x: the seeded normal is +z, encoded to (0.5, 0.5, 1)
        EXPECT_NEAR(sampler.normals()[i * 4], 0.5f, 1e-5f);
        EXPECT_NEAR(sampler.normals()[i * 4 + 1], 0.5f, 1e-5f);
        EXPECT_NEAR(sampler.normals()[i * 4 + 2], 1.0f, 1e-5f);
        EXPECT_FLOAT_EQ(sampler.normals()[i * 4 + 3], 1.0f);
    }
}

TEST(SpineSamplerTest, EncodedNormalsStayInUnitRange) {
    EndlessCurve curve(test::generator_source(9));
    SpineSampler sampler(64);
    for (int tick = 0; tick < 100; ++tick) {
        curve.configure_start_end(static_cast<float>(tick), 26.0f);
        sampler.update(curve);
        for (float value : sampler.normals()) {
            ASSERT_GE(value, -1e-5f);
            ASSERT_LE(value, 1.0f + 1e-5f);
        }
        for (size_t i = 0; i < sampler.texture_points(); ++i) {
            ASSERT_NEAR(sampler.normal(i).length(), 1.0f, 1e-3f);
        }
    }
}
