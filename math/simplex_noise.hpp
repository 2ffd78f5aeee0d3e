#ifndef SERPENT_MATH_SIMPLEX_NOISE_HPP
#define SERPENT_MATH_SIMPLEX_NOISE_HPP

#include <array>
#include <cstdint>

namespace serpent {

// Seeded 2D simplex noise. Output is continuous and roughly in [-1, 1].
class SimplexNoise2D {
public:
    explicit SimplexNoise2D(uint32_t seed);

    float sample(float x, float y) const;

    uint32_t seed() const { return seed_; }

private:
    uint32_t seed_;
    // Permutation of 0..255 repeated twice to avoid index wrapping
    std::array<uint8_t, 512> perm_;
};

}  // namespace serpent

#endif // SERPENT_MATH_SIMPLEX_NOISE_HPP
