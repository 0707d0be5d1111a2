#include "terratools/grass.h"
#include "terratools/settings.h"
#include "terratools/terrain.h"
#include "terratools/tga.h"

#include "../common/cli_logger.h"

#include <algorithm>
#include <array>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;
namespace gr = terratools::grass;
namespace st = terratools::settings;
namespace tr = terratools::terrain;

struct Cli {
    std::string heights_path;
    int width = 0;
    int depth = 0;
    std::string config_path;
    std::optional<uint64_t> seed;
    bool noise = false;
    std::string mesh_path;
    std::string grass_path;
    std::string preview_path;
    bool validate = false;
};

static void usage() {
    std::cerr
        << "Usage: terragen [heights.rawf32] [--width N --depth N] [--config file.json]\n"
        << "       [--seed N] [--noise] [--mesh out.rawf32] [--grass out.rawf32]\n"
        << "       [--preview out.tga] [--validate] [-v|-vv]\n\n"
        << "RAW format: little-endian float32 array, row-major (z * width + x), no header.\n"
        << "Mesh output: 3 floats per vertex. Grass output: 16 floats per instance.\n";
}

static int parse_cli(int argc, char** argv, Cli& cli) {
    std::vector<std::string> pos;
    int verbosity = 0;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--width") == 0 && i + 1 < argc) cli.width = std::stoi(argv[++i]);
        else if (std::strcmp(argv[i], "--depth") == 0 && i + 1 < argc) cli.depth = std::stoi(argv[++i]);
        else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) cli.config_path = argv[++i];
        else if (std::strcmp(argv[i], "--seed") == 0 && i + 1 < argc) cli.seed = std::stoull(argv[++i]);
        else if (std::strcmp(argv[i], "--noise") == 0) cli.noise = true;
        else if (std::strcmp(argv[i], "--mesh") == 0 && i + 1 < argc) cli.mesh_path = argv[++i];
        else if (std::strcmp(argv[i], "--grass") == 0 && i + 1 < argc) cli.grass_path = argv[++i];
        else if (std::strcmp(argv[i], "--preview") == 0 && i + 1 < argc) cli.preview_path = argv[++i];
        else if (std::strcmp(argv[i], "--validate") == 0) cli.validate = true;
        else if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--verbose") == 0) {
            verbosity = std::min(verbosity + 1, 2);
        } else if (std::strcmp(argv[i], "-vv") == 0 || std::strcmp(argv[i], "--debug") == 0) {
            verbosity = 2;
        } else if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            usage();
            return 1;
        } else {
            pos.emplace_back(argv[i]);
        }
    }

    terratools::cli::set_verbosity(verbosity);

    if (pos.size() > 1) {
        usage();
        return -1;
    }
    if (!pos.empty()) cli.heights_path = pos[0];
    if (!cli.heights_path.empty() && cli.noise) {
        LOGE("--noise and a heights file are mutually exclusive");
        return -1;
    }
    if ((cli.width != 0 || cli.depth != 0) && (cli.width < 2 || cli.depth < 2)) {
        LOGE("--width and --depth must be given together and be at least 2");
        return -1;
    }
    return 0;
}

static std::vector<float> read_raw(const std::string& path, size_t count) {
    std::vector<float> data(count, 0.0f);
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error(std::format("terragen: cannot open input: {}", path));
    in.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size() * sizeof(float)));
    if (in.gcount() != static_cast<std::streamsize>(data.size() * sizeof(float))) {
        throw std::runtime_error(std::format("terragen: input size mismatch for {}", path));
    }
    return data;
}

static void write_raw(const std::string& path, const std::vector<float>& data) {
    fs::path p(path);
    if (!p.parent_path().empty()) fs::create_directories(p.parent_path());
    std::ofstream out(path, std::ios::binary);
    if (!out) throw std::runtime_error(std::format("terragen: cannot write output: {}", path));
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size() * sizeof(float)));
    if (!out) throw std::runtime_error(std::format("terragen: failed while writing: {}", path));
}

static void load_ground_images(const st::Settings& settings, gr::GrassConfig& config) {
    for (size_t i = 0; i < settings.ground_images.size(); ++i) {
        const auto& path = settings.ground_images[i];
        if (path.empty()) continue;
        config.ground_images[i] = std::make_shared<const terratools::tga::Image>(terratools::tga::read_file(path));
        LOGI("ground image", i, path, config.ground_images[i]->width, "x", config.ground_images[i]->height);
    }
}

static std::vector<float> flatten_positions(const terratools::marching::CellGeometry& mesh) {
    std::vector<float> out;
    out.reserve(mesh.positions.size() * 3);
    for (const auto& p : mesh.positions) {
        out.push_back(p.x);
        out.push_back(p.y);
        out.push_back(p.z);
    }
    return out;
}

// Top-down preview: one block of pixels per cell, walls dark, bare floor
// brown, grass shaded by how many of the cell's slots are visible.
static terratools::tga::Image render_preview(const tr::Chunk& chunk, const gr::InstanceBuffer& buffer) {
    constexpr int px = 4;
    auto img = terratools::tga::make_image(chunk.cells_x() * px, chunk.cells_z() * px, {0, 0, 0, 255});
    const size_t per_cell = static_cast<size_t>(std::max(buffer.per_cell(), 1));

    for (int cz = 0; cz < chunk.cells_z(); ++cz) {
        for (int cx = 0; cx < chunk.cells_x(); ++cx) {
            const auto* geo = chunk.cell_geometry(cx, cz);
            const bool has_wall = std::find(geo->is_floor.begin(), geo->is_floor.end(), false) != geo->is_floor.end();

            size_t visible = 0;
            const size_t base = buffer.cell_base(cx, cz);
            for (size_t i = base; i < base + per_cell && i < buffer.capacity(); ++i) {
                if (buffer.instances()[i].origin.y > gr::hidden_origin_y) ++visible;
            }

            std::array<uint8_t, 4> rgba{120, 96, 64, 255};
            if (visible > 0) {
                const auto g = static_cast<uint8_t>(96 + (159 * visible) / per_cell);
                rgba = {40, g, 40, 255};
            } else if (has_wall) {
                rgba = {60, 60, 60, 255};
            }
            for (int y = 0; y < px; ++y) {
                for (int x = 0; x < px; ++x) terratools::tga::set_pixel(img, cx * px + x, cz * px + y, rgba);
            }
        }
    }
    return img;
}

int main(int argc, char** argv) {
    Cli cli;
    const int parse_result = parse_cli(argc, argv, cli);
    if (parse_result != 0) {
        if (parse_result > 0) return 0;
        return 1;
    }

    try {
        const fs::path config_path = cli.config_path.empty() ? st::settings_path() : fs::path(cli.config_path);
        st::Settings settings = st::load_settings(config_path);
        LOGI("settings", config_path.string());

        if (cli.width > 0) {
            settings.terrain.dimensions.x = cli.width;
            settings.terrain.dimensions.z = cli.depth;
        }
        if (cli.seed) settings.seed = *cli.seed;
        settings.grass.dimensions = {settings.terrain.dimensions.x, settings.terrain.dimensions.y,
                                     settings.terrain.dimensions.z};
        settings.grass.cell_size = settings.terrain.cell_size;
        settings.grass.seed = settings.seed;

        tr::Chunk chunk(settings.terrain);
        if (!cli.heights_path.empty()) {
            const auto& cfg = chunk.config();
            const size_t count = static_cast<size_t>(cfg.dimensions.x) * static_cast<size_t>(cfg.dimensions.z);
            const auto heights = read_raw(cli.heights_path, count);
            tr::SavedChunk saved;
            saved.heights = heights;
            if (!chunk.restore(saved)) {
                throw std::runtime_error(std::format("terragen: {} does not match a {}x{} grid", cli.heights_path,
                                                     cfg.dimensions.x, cfg.dimensions.z));
            }
        } else if (cli.noise) {
            chunk.generate_heights(settings.noise);
        }

        const size_t rebuilt = chunk.regenerate();
        LOGI("rebuilt", rebuilt, "cells");

        load_ground_images(settings, settings.grass);
        gr::GrassPlanter planter(settings.grass);
        gr::Rng rng(settings.seed);
        const auto stats = planter.regenerate(chunk.cells(), rng);
        LOGD("ledge", stats.rejected_ledge, "ridge", stats.rejected_ridge, "mask", stats.rejected_mask, "slot",
             stats.rejected_slot, "degenerate", stats.degenerate_skipped);

        size_t open_edges = 0;
        if (cli.validate) open_edges = chunk.validate();

        for (const auto& w : chunk.warnings()) {
            LOGW_ONCE(terratools::log::detail::fnv1a_hash(w.code.c_str()), w.code, w.message);
        }

        const auto mesh = chunk.assemble();
        if (!cli.mesh_path.empty()) write_raw(cli.mesh_path, flatten_positions(mesh));
        if (!cli.grass_path.empty()) write_raw(cli.grass_path, planter.buffer().flatten());
        if (!cli.preview_path.empty()) {
            terratools::tga::write_file(cli.preview_path, render_preview(chunk, planter.buffer()));
        }

        std::cerr << "terragen: " << chunk.cells_x() << "x" << chunk.cells_z() << " cells, "
                  << mesh.triangle_count() << " triangles, " << stats.placed << "/" << planter.buffer().capacity()
                  << " grass instances, " << chunk.warnings().size() << " warnings";
        if (cli.validate) std::cerr << ", " << open_edges << " open edges";
        std::cerr << "\n";
        return cli.validate && open_edges > 0 ? 2 : 0;
    } catch (const std::exception& e) {
        LOGE("Error:", e.what());
        return 1;
    }
}
