#pragma once

#include <array>
#include <cstdint>

namespace terratools::texslot {

// Color is a linear RGBA value. Grid colors store texture selections as
// one-hot values where exactly one channel is ~1.0.
struct Color {
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
    float a = 0.0f;

    [[nodiscard]] float operator[](int channel) const;
    bool operator==(const Color&) const = default;
};

enum class Channel : uint8_t { R = 0, G = 1, B = 2, A = 3 };

inline constexpr int slot_count = 16;
inline constexpr Color default_texture_color{1.0f, 0.0f, 0.0f, 0.0f};

// dominant_channel returns the argmax channel; ties resolve to the earlier
// channel in R, G, B, A order.
[[nodiscard]] Channel dominant_channel(const Color& c);
[[nodiscard]] Color one_hot(Channel ch);
[[nodiscard]] Color snap_to_one_hot(const Color& c);

[[nodiscard]] Color lerp(const Color& a, const Color& b, float t);

struct ColorPair {
    Color c0;
    Color c1;
};

// encode packs the dominant channels of a color pair into a slot 0..15 as
// dominant(c0) * 4 + dominant(c1).
[[nodiscard]] uint8_t encode(const Color& c0, const Color& c1);

// decode is the exact inverse of encode. Out-of-range slots wrap modulo 16.
[[nodiscard]] ColorPair decode(uint8_t slot);

} // namespace terratools::texslot
