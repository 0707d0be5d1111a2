#include "terratools/tga.h"

#include <algorithm>
#include <cmath>
#include <format>
#include <fstream>
#include <stdexcept>

namespace terratools::tga {

namespace {

constexpr uint8_t type_true_color = 2;
constexpr uint8_t type_true_color_rle = 10;

void put_bgra(Image& img, size_t pixel, const uint8_t* src, int bytes_per_pixel) {
    const size_t dst = pixel * 4;
    img.pixels[dst] = src[2];
    img.pixels[dst + 1] = src[1];
    img.pixels[dst + 2] = src[0];
    img.pixels[dst + 3] = bytes_per_pixel == 4 ? src[3] : uint8_t(255);
}

// read_rle expands packets into file order (row 0 first as stored).
std::vector<uint8_t> read_rle(std::istream& r, size_t pixel_count, int bytes_per_pixel) {
    std::vector<uint8_t> out(pixel_count * static_cast<size_t>(bytes_per_pixel));
    size_t done = 0;
    uint8_t px[4] = {};
    while (done < pixel_count) {
        uint8_t packet = 0;
        if (!r.read(reinterpret_cast<char*>(&packet), 1))
            throw std::runtime_error("tga: truncated RLE packet");
        const size_t count = static_cast<size_t>(packet & 0x7F) + 1;
        if (done + count > pixel_count)
            throw std::runtime_error(std::format("tga: RLE packet overruns image ({} > {})", done + count, pixel_count));

        if (packet & 0x80) {
            if (!r.read(reinterpret_cast<char*>(px), bytes_per_pixel))
                throw std::runtime_error("tga: truncated RLE run");
            for (size_t i = 0; i < count; ++i) {
                std::copy(px, px + bytes_per_pixel, out.begin() + static_cast<std::ptrdiff_t>((done + i) * bytes_per_pixel));
            }
        } else {
            const auto n = static_cast<std::streamsize>(count * static_cast<size_t>(bytes_per_pixel));
            if (!r.read(reinterpret_cast<char*>(out.data() + done * static_cast<size_t>(bytes_per_pixel)), n))
                throw std::runtime_error("tga: truncated RLE raw packet");
        }
        done += count;
    }
    return out;
}

} // namespace

Image make_image(int width, int height, std::array<uint8_t, 4> fill) {
    if (width <= 0 || height <= 0)
        throw std::runtime_error(std::format("tga: invalid dimensions {}x{}", width, height));
    Image img;
    img.width = width;
    img.height = height;
    img.pixels.resize(static_cast<size_t>(width) * static_cast<size_t>(height) * 4);
    for (size_t i = 0; i < img.pixels.size(); i += 4) {
        img.pixels[i] = fill[0];
        img.pixels[i + 1] = fill[1];
        img.pixels[i + 2] = fill[2];
        img.pixels[i + 3] = fill[3];
    }
    return img;
}

void set_pixel(Image& img, int x, int y, std::array<uint8_t, 4> rgba) {
    if (x < 0 || y < 0 || x >= img.width || y >= img.height) return;
    const size_t dst = (static_cast<size_t>(y) * static_cast<size_t>(img.width) + static_cast<size_t>(x)) * 4;
    img.pixels[dst] = rgba[0];
    img.pixels[dst + 1] = rgba[1];
    img.pixels[dst + 2] = rgba[2];
    img.pixels[dst + 3] = rgba[3];
}

Image decode(std::istream& r) {
    uint8_t hdr[18];
    if (!r.read(reinterpret_cast<char*>(hdr), 18))
        throw std::runtime_error("tga: failed to read header");

    const int id_len = hdr[0];
    const uint8_t color_map_type = hdr[1];
    const uint8_t image_type = hdr[2];

    if (color_map_type != 0)
        throw std::runtime_error("tga: color-mapped images are not supported");
    if (image_type != type_true_color && image_type != type_true_color_rle)
        throw std::runtime_error(std::format("tga: only true-color images (type 2 or 10) are supported, got {}", image_type));

    const int w = static_cast<int>(hdr[12]) | (static_cast<int>(hdr[13]) << 8);
    const int h = static_cast<int>(hdr[14]) | (static_cast<int>(hdr[15]) << 8);
    const int bpp = hdr[16];
    const uint8_t desc = hdr[17];

    if (w <= 0 || h <= 0)
        throw std::runtime_error(std::format("tga: invalid dimensions {}x{}", w, h));
    if (bpp != 24 && bpp != 32)
        throw std::runtime_error(std::format("tga: only 24/32 bpp is supported, got {}", bpp));

    if (id_len > 0 && !r.ignore(id_len))
        throw std::runtime_error("tga: failed to skip ID field");

    const bool top_origin = (desc & 0x20) != 0;
    const int bytes_per_pixel = bpp / 8;
    const size_t pixel_count = static_cast<size_t>(w) * static_cast<size_t>(h);

    std::vector<uint8_t> raw;
    if (image_type == type_true_color_rle) {
        raw = read_rle(r, pixel_count, bytes_per_pixel);
    } else {
        raw.resize(pixel_count * static_cast<size_t>(bytes_per_pixel));
        if (!r.read(reinterpret_cast<char*>(raw.data()), static_cast<std::streamsize>(raw.size())))
            throw std::runtime_error("tga: failed to read pixel data");
    }

    Image img;
    img.width = w;
    img.height = h;
    img.pixels.resize(pixel_count * 4);
    for (int yy = 0; yy < h; ++yy) {
        const int y = top_origin ? yy : (h - 1 - yy);
        for (int x = 0; x < w; ++x) {
            const size_t src = (static_cast<size_t>(yy) * static_cast<size_t>(w) + static_cast<size_t>(x)) *
                               static_cast<size_t>(bytes_per_pixel);
            put_bgra(img, static_cast<size_t>(y) * static_cast<size_t>(w) + static_cast<size_t>(x), raw.data() + src,
                     bytes_per_pixel);
        }
    }
    return img;
}

void encode(std::ostream& w, const Image& img) {
    if (img.width <= 0 || img.height <= 0 || img.width > 65535 || img.height > 65535)
        throw std::runtime_error(std::format("tga: invalid dimensions {}x{}", img.width, img.height));
    if (img.pixels.size() != static_cast<size_t>(img.width) * static_cast<size_t>(img.height) * 4)
        throw std::runtime_error(std::format("tga: pixel buffer holds {} bytes, expected {}", img.pixels.size(),
                                             static_cast<size_t>(img.width) * static_cast<size_t>(img.height) * 4));

    uint8_t hdr[18] = {};
    hdr[2] = type_true_color;
    hdr[12] = static_cast<uint8_t>(img.width & 0xFF);
    hdr[13] = static_cast<uint8_t>((img.width >> 8) & 0xFF);
    hdr[14] = static_cast<uint8_t>(img.height & 0xFF);
    hdr[15] = static_cast<uint8_t>((img.height >> 8) & 0xFF);
    hdr[16] = 32;
    hdr[17] = 0x28; // 8 alpha bits, top-left origin
    if (!w.write(reinterpret_cast<const char*>(hdr), 18))
        throw std::runtime_error("tga: failed to write header");

    std::vector<uint8_t> row(static_cast<size_t>(img.width) * 4);
    for (int y = 0; y < img.height; ++y) {
        const size_t base = static_cast<size_t>(y) * static_cast<size_t>(img.width) * 4;
        for (size_t i = 0; i < row.size(); i += 4) {
            row[i] = img.pixels[base + i + 2];
            row[i + 1] = img.pixels[base + i + 1];
            row[i + 2] = img.pixels[base + i];
            row[i + 3] = img.pixels[base + i + 3];
        }
        if (!w.write(reinterpret_cast<const char*>(row.data()), static_cast<std::streamsize>(row.size())))
            throw std::runtime_error("tga: failed to write pixel row");
    }
}

Image read_file(const std::filesystem::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error(std::format("tga: cannot open {}", path.string()));
    return decode(f);
}

void write_file(const std::filesystem::path& path, const Image& img) {
    std::ofstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error(std::format("tga: cannot create {}", path.string()));
    encode(f, img);
}

std::array<float, 4> sample_wrapped(const Image& img, float u, float v) {
    if (img.empty() || !std::isfinite(u) || !std::isfinite(v)) return {0.0f, 0.0f, 0.0f, 0.0f};

    const float fu = u - std::floor(u);
    const float fv = v - std::floor(v);
    const int x = std::min(static_cast<int>(fu * static_cast<float>(img.width)), img.width - 1);
    const int y = std::min(static_cast<int>(fv * static_cast<float>(img.height)), img.height - 1);
    const size_t src = (static_cast<size_t>(y) * static_cast<size_t>(img.width) + static_cast<size_t>(x)) * 4;
    return {
        static_cast<float>(img.pixels[src]) / 255.0f,
        static_cast<float>(img.pixels[src + 1]) / 255.0f,
        static_cast<float>(img.pixels[src + 2]) / 255.0f,
        static_cast<float>(img.pixels[src + 3]) / 255.0f,
    };
}

} // namespace terratools::tga
