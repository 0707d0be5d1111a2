#pragma once

#include <terratools/grass.h>
#include <terratools/terrain.h>

#include <array>
#include <cstdint>
#include <filesystem>
#include <string>

namespace terratools::settings {

struct Settings {
    terrain::TerrainConfig terrain;
    grass::GrassConfig grass;
    terrain::NoiseParams noise;
    uint64_t seed = 1;
    // Ground tint images per grass slot; empty means use the ground color.
    std::array<std::string, grass::grass_slot_count> ground_images;
};

// settings_path resolves TERRATOOLS_CONFIG, then terratools.json beside the
// executable, then $HOME/.config/terratools/terratools.json.
std::filesystem::path settings_path();

// load_settings never throws; a missing or malformed file yields defaults.
// The grass grid always mirrors the terrain grid.
Settings load_settings(const std::filesystem::path& path);
Settings load_settings();

bool save_settings(const Settings& s, const std::filesystem::path& path);
bool save_settings(const Settings& s);

} // namespace terratools::settings
