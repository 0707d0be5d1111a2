#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <ostream>
#include <vector>

namespace terratools::tga {

struct Image {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> pixels; // RGBA, row-major, top-to-bottom, 4 bytes per pixel

    [[nodiscard]] bool empty() const { return width <= 0 || height <= 0 || pixels.empty(); }
};

// make_image allocates a width x height image filled with one RGBA value.
[[nodiscard]] Image make_image(int width, int height, std::array<uint8_t, 4> fill = {0, 0, 0, 255});

void set_pixel(Image& img, int x, int y, std::array<uint8_t, 4> rgba);

// decode reads a true-color TGA (24/32 bpp), uncompressed (type 2) or
// run-length encoded (type 10).
Image decode(std::istream& r);

// encode writes an uncompressed 32-bit true-color TGA with top-left origin.
void encode(std::ostream& w, const Image& img);

Image read_file(const std::filesystem::path& path);
void write_file(const std::filesystem::path& path, const Image& img);

// sample_wrapped returns the nearest pixel at normalized (u, v) as floats in
// [0, 1]; coordinates outside [0, 1) wrap around so the image tiles.
[[nodiscard]] std::array<float, 4> sample_wrapped(const Image& img, float u, float v);

} // namespace terratools::tga
