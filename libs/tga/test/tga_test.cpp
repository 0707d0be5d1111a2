#include "terratools/tga.h"

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <string>

namespace tga = terratools::tga;

namespace {

std::string header(uint8_t type, int w, int h, int bpp, uint8_t desc) {
    std::string hdr(18, '\0');
    hdr[2] = static_cast<char>(type);
    hdr[12] = static_cast<char>(w & 0xFF);
    hdr[13] = static_cast<char>((w >> 8) & 0xFF);
    hdr[14] = static_cast<char>(h & 0xFF);
    hdr[15] = static_cast<char>((h >> 8) & 0xFF);
    hdr[16] = static_cast<char>(bpp);
    hdr[17] = static_cast<char>(desc);
    return hdr;
}

} // namespace

TEST(Tga, EncodedImageDecodesToSamePixels) {
    auto img = tga::make_image(3, 2, {10, 20, 30, 255});
    tga::set_pixel(img, 2, 1, {200, 100, 50, 128});

    std::stringstream buf;
    tga::encode(buf, img);
    const auto back = tga::decode(buf);

    EXPECT_EQ(back.width, 3);
    EXPECT_EQ(back.height, 2);
    EXPECT_EQ(back.pixels, img.pixels);
}

TEST(Tga, BottomOriginRowsAreFlipped) {
    // 1x2, 24 bpp, bottom-left origin: first stored row is the bottom one
    std::string data = header(2, 1, 2, 24, 0x00);
    data += std::string("\x00\x00\xFF", 3); // red, bottom
    data += std::string("\xFF\x00\x00", 3); // blue, top

    std::istringstream in(data);
    const auto img = tga::decode(in);
    EXPECT_EQ(img.pixels[0], 0);   // top pixel R
    EXPECT_EQ(img.pixels[2], 255); // top pixel B
    EXPECT_EQ(img.pixels[4], 255); // bottom pixel R
    EXPECT_EQ(img.pixels[7], 255); // alpha filled for 24 bpp
}

TEST(Tga, RunLengthPacketsExpand) {
    // 3x1, 32 bpp, top-left origin; one run of 2 then one raw pixel
    std::string data = header(10, 3, 1, 32, 0x28);
    data += std::string("\x81\x01\x02\x03\x04", 5);
    data += std::string("\x00\x05\x06\x07\x08", 5);

    std::istringstream in(data);
    const auto img = tga::decode(in);
    ASSERT_EQ(img.pixels.size(), 12u);
    EXPECT_EQ(img.pixels[0], 3);
    EXPECT_EQ(img.pixels[4], 3);
    EXPECT_EQ(img.pixels[8], 7);
    EXPECT_EQ(img.pixels[11], 8);
}

TEST(Tga, RejectsColorMappedAndTruncatedInput) {
    std::string mapped = header(1, 1, 1, 24, 0);
    mapped[1] = 1;
    std::istringstream a(mapped);
    EXPECT_THROW(tga::decode(a), std::runtime_error);

    std::istringstream b(header(2, 4, 4, 32, 0x28) + "abc");
    EXPECT_THROW(tga::decode(b), std::runtime_error);
}

TEST(Tga, SampleWrapsAroundEdges) {
    auto img = tga::make_image(2, 2, {0, 0, 0, 255});
    tga::set_pixel(img, 1, 0, {255, 0, 0, 255});

    EXPECT_FLOAT_EQ(tga::sample_wrapped(img, 0.75f, 0.25f)[0], 1.0f);
    EXPECT_FLOAT_EQ(tga::sample_wrapped(img, 1.75f, 0.25f)[0], 1.0f);
    EXPECT_FLOAT_EQ(tga::sample_wrapped(img, -0.25f, 0.25f)[0], 1.0f);
    EXPECT_FLOAT_EQ(tga::sample_wrapped(img, 0.25f, 0.25f)[0], 0.0f);
}
