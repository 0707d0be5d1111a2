#include "terratools/texslot.h"

#include <gtest/gtest.h>

namespace ts = terratools::texslot;

TEST(Texslot, DecodeThenEncodeIsIdentityForAllSlots) {
    for (int i = 0; i < ts::slot_count; ++i) {
        const auto pair = ts::decode(static_cast<uint8_t>(i));
        EXPECT_EQ(ts::encode(pair.c0, pair.c1), i);
    }
}

TEST(Texslot, DecodeProducesOneHotPairs) {
    const auto pair = ts::decode(6); // row 1, column 2
    EXPECT_EQ(pair.c0, (ts::Color{0.0f, 1.0f, 0.0f, 0.0f}));
    EXPECT_EQ(pair.c1, (ts::Color{0.0f, 0.0f, 1.0f, 0.0f}));
}

TEST(Texslot, EncodeUsesDominantChannelOfBlendedColors) {
    const ts::Color mostly_blue{0.1f, 0.2f, 0.6f, 0.1f};
    const ts::Color mostly_alpha{0.0f, 0.3f, 0.2f, 0.5f};
    EXPECT_EQ(ts::encode(mostly_blue, mostly_alpha), 2 * 4 + 3);
}

TEST(Texslot, DominantChannelTiesPickEarlierChannel) {
    EXPECT_EQ(ts::dominant_channel({0.5f, 0.5f, 0.0f, 0.0f}), ts::Channel::R);
    EXPECT_EQ(ts::dominant_channel({0.0f, 0.4f, 0.4f, 0.4f}), ts::Channel::G);
    EXPECT_EQ(ts::dominant_channel({0.0f, 0.0f, 0.0f, 0.0f}), ts::Channel::R);
}

TEST(Texslot, SnapToOneHotKeepsOnlyDominantChannel) {
    EXPECT_EQ(ts::snap_to_one_hot({0.2f, 0.3f, 0.25f, 0.25f}), (ts::Color{0.0f, 1.0f, 0.0f, 0.0f}));
}

TEST(Texslot, OutOfRangeSlotWraps) {
    const auto wrapped = ts::decode(17);
    EXPECT_EQ(ts::encode(wrapped.c0, wrapped.c1), 1);
}

TEST(Texslot, LerpEndpoints) {
    const ts::Color a{1.0f, 0.0f, 0.0f, 0.0f};
    const ts::Color b{0.0f, 0.0f, 1.0f, 0.0f};
    EXPECT_EQ(ts::lerp(a, b, 0.0f), a);
    EXPECT_EQ(ts::lerp(a, b, 1.0f), b);
    EXPECT_FLOAT_EQ(ts::lerp(a, b, 0.25f).r, 0.75f);
}
