#include <gtest/gtest.h>
#include "simplex_noise.hpp"
#include <algorithm>
#include <cmath>

using namespace serpent;

TEST(SimplexNoiseTest, StaysInRange) {
    SimplexNoise2D noise(7);
    float lo = 0.0f;
    float hi = 0.0f;
    for (int i = 0; i < 200; ++i) {
        for (int j = 0; j < 200; ++j) {
            float v = noise.sample(static_cast<float>(i) * 0.137f, static_cast<float>(j) * 0.091f);
            ASSERT_TRUE(std::isfinite(v));
            lo = std::min(lo, v);
            hi = std::max(hi, v);
        }
    }
    EXPECT_GE(lo, -1.05f);
    EXPECT_LE(hi, 1.05f);
    // Not degenerate
    EXPECT_LT(lo, -0.3f);
    EXPECT_GT(hi, 0.3f);
}

TEST(SimplexNoiseTest, IsContinuous) {
    SimplexNoise2D noise(11);
    float prev = noise.sample(0.0f, 3.0f);
    for (int i = 1; i < 5000; ++i) {
        float v = noise.sample(static_cast<float>(i) * 0.001f, 3.0f);
        EXPECT_LT(std::abs(v - prev), 0.08f) << "at step " << i;
        prev = v;
    }
}

TEST(SimplexNoiseTest, SameSeedSameField) {
    SimplexNoise2D a(1234);
    SimplexNoise2D b(1234);
    for (int i = 0; i < 100; ++i) {
        float x = static_cast<float>(i) * 0.37f;
        EXPECT_EQ(a.sample(x, 0.5f), b.sample(x, 0.5f));
    }
    EXPECT_EQ(a.seed(), 1234u);
}

TEST(SimplexNoiseTest, DifferentSeedsDiffer) {
    SimplexNoise2D a(1);
    SimplexNoise2D b(2);
    int differing = 0;
    for (int i = 0; i < 100; ++i) {
        float x = static_cast<float>(i) * 0.37f + 0.1f;
        if (std::abs(a.sample(x, 0.5f) - b.sample(x, 0.5f)) > 1e-4f) {
            ++differing;
        }
    }
    EXPECT_GT(differing, 50);
}
