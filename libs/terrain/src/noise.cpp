#include "terratools/terrain.h"

#include <algorithm>
#include <cmath>

namespace terratools::terrain {

namespace {

// corner_value maps one lattice corner of one octave to [-1, 1].
[[nodiscard]] double corner_value(int64_t x, int64_t z, uint64_t octave_seed) {
    uint64_t k = octave_seed + static_cast<uint64_t>(x) * 0xD1B54A32D192ED03ULL +
                 static_cast<uint64_t>(z) * 0xABC98388FB8FAC03ULL;
    k = (k ^ (k >> 30)) * 0xBF58476D1CE4E5B9ULL;
    k = (k ^ (k >> 27)) * 0x94D049BB133111EBULL;
    k ^= k >> 31;
    return static_cast<double>(k >> 11) / 4503599627370495.5 - 1.0;
}

[[nodiscard]] double smootherstep(double t) { return t * t * t * (t * (t * 6.0 - 15.0) + 10.0); }

[[nodiscard]] uint64_t octave_seed(uint32_t seed, int octave) {
    return (static_cast<uint64_t>(seed) << 32) ^ (static_cast<uint64_t>(octave) * 0x9E3779B97F4A7C15ULL);
}

// sample_octave interpolates the four lattice corners around (px, pz).
[[nodiscard]] double sample_octave(double px, double pz, uint64_t seed) {
    const double fx = std::floor(px);
    const double fz = std::floor(pz);
    const auto ix = static_cast<int64_t>(fx);
    const auto iz = static_cast<int64_t>(fz);
    const double ux = smootherstep(px - fx);
    const double uz = smootherstep(pz - fz);

    const double v00 = corner_value(ix, iz, seed);
    const double v10 = corner_value(ix + 1, iz, seed);
    const double v01 = corner_value(ix, iz + 1, seed);
    const double v11 = corner_value(ix + 1, iz + 1, seed);

    const double near_row = v00 + (v10 - v00) * ux;
    const double far_row = v01 + (v11 - v01) * ux;
    return near_row + (far_row - near_row) * uz;
}

} // namespace

float noise_height(const NoiseParams& params, int grid_x, int grid_z) {
    const double px = static_cast<double>(grid_x) * params.frequency;
    const double pz = static_cast<double>(grid_z) * params.frequency;

    double amplitude = 1.0;
    double scale = 1.0;
    double sum = 0.0;
    double total = 0.0;
    for (int octave = 0; octave < params.octaves; ++octave) {
        sum += amplitude * sample_octave(px * scale, pz * scale, octave_seed(params.seed, octave));
        total += amplitude;
        amplitude *= 0.5;
        scale *= 2.0;
    }
    if (total <= 0.0) return 0.0f;
    return static_cast<float>(std::clamp(sum / total, -1.0, 1.0));
}

} // namespace terratools::terrain
