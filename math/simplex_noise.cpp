#include "simplex_noise.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>

namespace serpent {

namespace {

constexpr float F2 = 0.366025403f;  // (sqrt(3) - 1) / 2
constexpr float G2 = 0.211324865f;  // (3 - sqrt(3)) / 6

float gradient(int hash, float x, float y) {
    static constexpr float grad2[8][2] = {
        {1.0f, 0.0f}, {-1.0f, 0.0f}, {0.0f, 1.0f}, {0.0f, -1.0f},
        {0.7071067811865476f, 0.7071067811865476f},
        {-0.7071067811865476f, 0.7071067811865476f},
        {0.7071067811865476f, -0.7071067811865476f},
        {-0.7071067811865476f, -0.7071067811865476f}
    };
    int h = hash & 7;
    return grad2[h][0] * x + grad2[h][1] * y;
}

float corner(float t, int hash, float x, float y) {
    if (t < 0.0f) {
        return 0.0f;
    }
    t *= t;
    return t * t * gradient(hash, x, y);
}

}  // namespace

SimplexNoise2D::SimplexNoise2D(uint32_t seed) : seed_(seed) {
    std::array<uint8_t, 256> base;
    std::iota(base.begin(), base.end(), static_cast<uint8_t>(0));

    std::mt19937 rng(seed);
    std::shuffle(base.begin(), base.end(), rng);

    for (size_t i = 0; i < perm_.size(); ++i) {
        perm_[i] = base[i & 255];
    }
}

float SimplexNoise2D::sample(float x, float y) const {
    // Skew input space to find the simplex cell
    float s = (x + y) * F2;
    int i = static_cast<int>(std::floor(x + s));
    int j = static_cast<int>(std::floor(y + s));

    float t = static_cast<float>(i + j) * G2;
    float x0 = x - (static_cast<float>(i) - t);
    float y0 = y - (static_cast<float>(j) - t);

    // Upper or lower triangle of the cell
    int i1 = (x0 > y0) ? 1 : 0;
    int j1 = (x0 > y0) ? 0 : 1;

    float x1 = x0 - static_cast<float>(i1) + G2;
    float y1 = y0 - static_cast<float>(j1) + G2;
    float x2 = x0 - 1.0f + 2.0f * G2;
    float y2 = y0 - 1.0f + 2.0f * G2;

    int ii = i & 255;
    int jj = j & 255;

    float n0 = corner(0.5f - x0 * x0 - y0 * y0, perm_[ii + perm_[jj]], x0, y0);
    float n1 = corner(0.5f - x1 * x1 - y1 * y1, perm_[ii + i1 + perm_[jj + j1]], x1, y1);
    float n2 = corner(0.5f - x2 * x2 - y2 * y2, perm_[ii + 1 + perm_[jj + 1]], x2, y2);

    // Scale to approximately [-1, 1]
    return 45.23065f * (n0 + n1 + n2);
}

}  // namespace serpent
