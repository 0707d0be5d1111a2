#include "terratools/settings.h"

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdlib>
#include <fstream>

namespace terratools::settings {

namespace {

namespace fs = std::filesystem;
using json = nlohmann::json;

fs::path executable_dir() {
    std::error_code ec;
    auto link_path = fs::read_symlink("/proc/self/exe", ec);
    if (!ec) {
        return link_path.parent_path();
    }
    return fs::current_path();
}

bool positive(float v) { return std::isfinite(v) && v > 0.0f; }
bool unit(float v) { return std::isfinite(v) && v >= 0.0f && v <= 1.0f; }

json color_json(const texslot::Color& c) { return json::array({c.r, c.g, c.b, c.a}); }

void read_color(const json& node, texslot::Color& out) {
    if (!node.is_array() || node.size() != 4) return;
    out = {node.at(0).get<float>(), node.at(1).get<float>(), node.at(2).get<float>(), node.at(3).get<float>()};
}

void read_vec2(const json& node, const char* key, marching::Vec2& out) {
    if (!node.contains(key)) return;
    const auto& v = node.at(key);
    if (!v.is_array() || v.size() != 2) return;
    const marching::Vec2 parsed{v.at(0).get<float>(), v.at(1).get<float>()};
    if (positive(parsed.x) && positive(parsed.y)) out = parsed;
}

void read_unit(const json& node, const char* key, float& out) {
    if (!node.contains(key)) return;
    const float v = node.at(key).get<float>();
    if (unit(v)) out = v;
}

void read_terrain(const json& t, terrain::TerrainConfig& cfg) {
    if (t.contains("dimensions")) {
        const auto& d = t.at("dimensions");
        if (d.is_array() && d.size() == 3) {
            const terrain::Dimensions parsed{d.at(0).get<int>(), d.at(1).get<int>(), d.at(2).get<int>()};
            if (parsed.x >= 2 && parsed.z >= 2 && parsed.y > 0) cfg.dimensions = parsed;
        }
    }
    read_vec2(t, "cell_size", cfg.cell_size);
    if (t.contains("merge_mode")) {
        cfg.merge_mode = marching::merge_mode_from_index(t.at("merge_mode").get<int>());
    }
    if (t.contains("blend_mode")) {
        cfg.blend_mode = t.at("blend_mode").get<int>() == 1 ? marching::BlendMode::Direct
                                                            : marching::BlendMode::Interpolated;
    }
    if (t.contains("higher_poly_floors")) cfg.higher_poly_floors = t.at("higher_poly_floors").get<bool>();
    if (t.contains("use_ridge_texture")) cfg.use_ridge_texture = t.at("use_ridge_texture").get<bool>();
    read_unit(t, "ridge_threshold", cfg.ridge_threshold);
    read_unit(t, "lower_threshold", cfg.lower_threshold);
    read_unit(t, "upper_threshold", cfg.upper_threshold);
    if (cfg.lower_threshold >= cfg.upper_threshold) {
        cfg.lower_threshold = terrain::TerrainConfig{}.lower_threshold;
        cfg.upper_threshold = terrain::TerrainConfig{}.upper_threshold;
    }
}

void read_grass(const json& g, Settings& s) {
    auto& cfg = s.grass;
    if (g.contains("subdivisions")) {
        const int subs = g.at("subdivisions").get<int>();
        if (subs >= 1 && subs <= 16) cfg.subdivisions = subs;
    }
    read_vec2(g, "grass_size", cfg.grass_size);
    read_unit(g, "ledge_threshold", cfg.ledge_threshold);
    read_unit(g, "ridge_threshold", cfg.ridge_threshold);

    if (g.contains("ground_colors") && g.at("ground_colors").is_array()) {
        const auto& arr = g.at("ground_colors");
        for (size_t i = 0; i < arr.size() && i < cfg.ground_colors.size(); ++i) read_color(arr.at(i), cfg.ground_colors[i]);
    }
    if (g.contains("tex_has_grass") && g.at("tex_has_grass").is_array()) {
        const auto& arr = g.at("tex_has_grass");
        for (size_t i = 0; i < arr.size() && i < cfg.tex_has_grass.size(); ++i) cfg.tex_has_grass[i] = arr.at(i).get<bool>();
    }
    if (g.contains("texture_scales") && g.at("texture_scales").is_array()) {
        const auto& arr = g.at("texture_scales");
        for (size_t i = 0; i < arr.size() && i < cfg.texture_scales.size(); ++i) {
            const float v = arr.at(i).get<float>();
            if (positive(v)) cfg.texture_scales[i] = v;
        }
    }
    if (g.contains("ground_images") && g.at("ground_images").is_array()) {
        const auto& arr = g.at("ground_images");
        for (size_t i = 0; i < arr.size() && i < s.ground_images.size(); ++i) {
            s.ground_images[i] = arr.at(i).get<std::string>();
        }
    }
}

void read_noise(const json& n, terrain::NoiseParams& cfg) {
    if (n.contains("frequency")) {
        const float f = n.at("frequency").get<float>();
        if (positive(f)) cfg.frequency = f;
    }
    if (n.contains("octaves")) {
        const int o = n.at("octaves").get<int>();
        if (o >= 1 && o <= 12) cfg.octaves = o;
    }
    if (n.contains("seed")) cfg.seed = n.at("seed").get<uint32_t>();
}

void sync_grass_grid(Settings& s) {
    s.grass.dimensions = {s.terrain.dimensions.x, s.terrain.dimensions.y, s.terrain.dimensions.z};
    s.grass.cell_size = s.terrain.cell_size;
    s.grass.seed = s.seed;
}

} // namespace

std::filesystem::path settings_path() {
    const char* override_path = std::getenv("TERRATOOLS_CONFIG");
    if (override_path && override_path[0] != '\0') {
        return std::filesystem::path(override_path);
    }

    const auto beside_exe = executable_dir() / "terratools.json";
    if (std::filesystem::exists(beside_exe)) {
        return beside_exe;
    }

    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return std::filesystem::path(home) / ".config" / "terratools" / "terratools.json";
    }

    return beside_exe;
}

Settings load_settings(const std::filesystem::path& path) {
    Settings s;

    std::ifstream stream(path);
    if (!stream.is_open()) {
        sync_grass_grid(s);
        return s;
    }

    try {
        const json parsed = json::parse(stream);
        if (parsed.contains("seed")) s.seed = parsed.at("seed").get<uint64_t>();
        if (parsed.contains("terrain") && parsed.at("terrain").is_object()) read_terrain(parsed.at("terrain"), s.terrain);
        if (parsed.contains("grass") && parsed.at("grass").is_object()) read_grass(parsed.at("grass"), s);
        if (parsed.contains("noise") && parsed.at("noise").is_object()) read_noise(parsed.at("noise"), s.noise);
    } catch (const json::exception&) {
        s = Settings{};
    }

    sync_grass_grid(s);
    return s;
}

Settings load_settings() {
    return load_settings(settings_path());
}

bool save_settings(const Settings& s, const std::filesystem::path& path) {
    const auto& t = s.terrain;
    const auto& g = s.grass;

    json ground_colors = json::array();
    for (const auto& c : g.ground_colors) ground_colors.push_back(color_json(c));

    json parsed;
    parsed["seed"] = s.seed;
    parsed["terrain"] = {
        {"dimensions", {t.dimensions.x, t.dimensions.y, t.dimensions.z}},
        {"cell_size", {t.cell_size.x, t.cell_size.y}},
        {"merge_mode", marching::merge_mode_index(t.merge_mode)},
        {"blend_mode", static_cast<int>(t.blend_mode)},
        {"higher_poly_floors", t.higher_poly_floors},
        {"use_ridge_texture", t.use_ridge_texture},
        {"ridge_threshold", t.ridge_threshold},
        {"lower_threshold", t.lower_threshold},
        {"upper_threshold", t.upper_threshold},
    };
    parsed["grass"] = {
        {"subdivisions", g.subdivisions},
        {"grass_size", {g.grass_size.x, g.grass_size.y}},
        {"ledge_threshold", g.ledge_threshold},
        {"ridge_threshold", g.ridge_threshold},
        {"ground_colors", ground_colors},
        {"tex_has_grass", g.tex_has_grass},
        {"texture_scales", g.texture_scales},
        {"ground_images", s.ground_images},
    };
    parsed["noise"] = {
        {"frequency", s.noise.frequency},
        {"octaves", s.noise.octaves},
        {"seed", s.noise.seed},
    };

    std::error_code ec;
    if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);

    std::ofstream stream(path);
    if (!stream.is_open()) {
        return false;
    }

    stream << parsed.dump(2) << "\n";
    return static_cast<bool>(stream);
}

bool save_settings(const Settings& s) {
    return save_settings(s, settings_path());
}

} // namespace terratools::settings
