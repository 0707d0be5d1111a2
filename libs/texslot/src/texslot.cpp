#include "terratools/texslot.h"

namespace terratools::texslot {

float Color::operator[](int channel) const {
    switch (channel) {
        case 0: return r;
        case 1: return g;
        case 2: return b;
        default: return a;
    }
}

Channel dominant_channel(const Color& c) {
    float best = c.r;
    Channel ch = Channel::R;
    if (c.g > best) {
        best = c.g;
        ch = Channel::G;
    }
    if (c.b > best) {
        best = c.b;
        ch = Channel::B;
    }
    if (c.a > best) {
        ch = Channel::A;
    }
    return ch;
}

Color one_hot(Channel ch) {
    switch (ch) {
        case Channel::R: return {1.0f, 0.0f, 0.0f, 0.0f};
        case Channel::G: return {0.0f, 1.0f, 0.0f, 0.0f};
        case Channel::B: return {0.0f, 0.0f, 1.0f, 0.0f};
        case Channel::A: return {0.0f, 0.0f, 0.0f, 1.0f};
    }
    return default_texture_color;
}

Color snap_to_one_hot(const Color& c) {
    return one_hot(dominant_channel(c));
}

Color lerp(const Color& a, const Color& b, float t) {
    return {
        a.r + (b.r - a.r) * t,
        a.g + (b.g - a.g) * t,
        a.b + (b.b - a.b) * t,
        a.a + (b.a - a.a) * t,
    };
}

uint8_t encode(const Color& c0, const Color& c1) {
    const auto row = static_cast<uint8_t>(dominant_channel(c0));
    const auto col = static_cast<uint8_t>(dominant_channel(c1));
    return static_cast<uint8_t>(row * 4 + col);
}

ColorPair decode(uint8_t slot) {
    slot = static_cast<uint8_t>(slot % slot_count);
    return {one_hot(static_cast<Channel>(slot / 4)), one_hot(static_cast<Channel>(slot % 4))};
}

} // namespace terratools::texslot
