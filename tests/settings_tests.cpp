#include "terratools/settings.h"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

namespace {

namespace fs = std::filesystem;
namespace st = terratools::settings;
using json = nlohmann::json;

class ScopedEnvVar {
public:
    ScopedEnvVar(const char* name, const std::string& value)
        : name_(name), had_original_(false) {
        const char* original = std::getenv(name);
        if (original) {
            had_original_ = true;
            original_value_ = original;
        }
        setenv(name_.c_str(), value.c_str(), 1);
    }

    ~ScopedEnvVar() {
        if (had_original_) {
            setenv(name_.c_str(), original_value_.c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
    }

private:
    std::string name_;
    bool had_original_;
    std::string original_value_;
};

fs::path unique_test_root() {
    const auto base = fs::temp_directory_path() / "terratools-settings-tests";
    const auto unique = base / std::to_string(static_cast<unsigned long long>(std::rand()));
    fs::create_directories(unique);
    return unique;
}

void write_text_file(const fs::path& path, const std::string& text) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path);
    ASSERT_TRUE(out.is_open());
    out << text;
}

}  // namespace

TEST(SettingsTests, SettingsPathUsesEnvironmentOverrideWhenSet) {
    const auto root = unique_test_root();
    const auto config_path = root / "custom.json";
    ScopedEnvVar env("TERRATOOLS_CONFIG", config_path.string());

    EXPECT_EQ(st::settings_path(), config_path);
}

TEST(SettingsTests, MissingFileYieldsDefaults) {
    const auto root = unique_test_root();
    const auto s = st::load_settings(root / "absent.json");

    EXPECT_EQ(s.terrain.dimensions.x, 33);
    EXPECT_EQ(s.terrain.merge_mode, terratools::marching::MergeMode::Polyhedron);
    EXPECT_EQ(s.grass.subdivisions, 3);
    EXPECT_EQ(s.grass.dimensions[0], 33);
    EXPECT_EQ(s.noise.octaves, 4);
}

TEST(SettingsTests, SaveAndLoadRoundTripsValues) {
    const auto root = unique_test_root();
    const auto config_path = root / "nested" / "terratools.json";

    st::Settings s;
    s.seed = 77;
    s.terrain.dimensions = {9, 16, 5};
    s.terrain.cell_size = {1.5f, 3.0f};
    s.terrain.merge_mode = terratools::marching::MergeMode::Spherical;
    s.terrain.blend_mode = terratools::marching::BlendMode::Direct;
    s.terrain.higher_poly_floors = false;
    s.terrain.use_ridge_texture = true;
    s.grass.subdivisions = 5;
    s.grass.tex_has_grass[2] = false;
    s.grass.ground_colors[4] = {0.1f, 0.2f, 0.3f, 0.5f};
    s.noise.frequency = 0.2f;
    s.ground_images[1] = "dirt.tga";

    ASSERT_TRUE(st::save_settings(s, config_path));
    ASSERT_TRUE(fs::exists(config_path));

    std::ifstream in(config_path);
    ASSERT_TRUE(in.is_open());
    const json saved = json::parse(in);
    EXPECT_EQ(saved.at("seed").get<uint64_t>(), 77u);
    EXPECT_TRUE(saved.at("terrain").contains("merge_mode"));
    EXPECT_EQ(saved.at("terrain").at("merge_mode").get<int>(), 4);
    EXPECT_TRUE(saved.at("grass").contains("ground_colors"));

    const auto loaded = st::load_settings(config_path);
    EXPECT_EQ(loaded.seed, 77u);
    EXPECT_EQ(loaded.terrain.dimensions.x, 9);
    EXPECT_EQ(loaded.terrain.dimensions.z, 5);
    EXPECT_FLOAT_EQ(loaded.terrain.cell_size.y, 3.0f);
    EXPECT_EQ(loaded.terrain.merge_mode, terratools::marching::MergeMode::Spherical);
    EXPECT_EQ(loaded.terrain.blend_mode, terratools::marching::BlendMode::Direct);
    EXPECT_FALSE(loaded.terrain.higher_poly_floors);
    EXPECT_TRUE(loaded.terrain.use_ridge_texture);
    EXPECT_EQ(loaded.grass.subdivisions, 5);
    EXPECT_FALSE(loaded.grass.tex_has_grass[2]);
    EXPECT_FLOAT_EQ(loaded.grass.ground_colors[4].a, 0.5f);
    EXPECT_FLOAT_EQ(loaded.noise.frequency, 0.2f);
    EXPECT_EQ(loaded.ground_images[1], "dirt.tga");

    // grass grid follows the terrain grid
    EXPECT_EQ(loaded.grass.dimensions[0], 9);
    EXPECT_EQ(loaded.grass.dimensions[2], 5);
    EXPECT_FLOAT_EQ(loaded.grass.cell_size.x, 1.5f);
    EXPECT_EQ(loaded.grass.seed, 77u);
}

TEST(SettingsTests, InvalidJsonFallsBackToDefaults) {
    const auto root = unique_test_root();
    const auto config_path = root / "broken.json";
    write_text_file(config_path, "{ \"terrain\": { \"merge_mode\": 0, ");

    const auto s = st::load_settings(config_path);
    EXPECT_EQ(s.terrain.merge_mode, terratools::marching::MergeMode::Polyhedron);
    EXPECT_EQ(s.grass.subdivisions, 3);
}

TEST(SettingsTests, WrongTypeFallsBackToDefaults) {
    const auto root = unique_test_root();
    const auto config_path = root / "typed.json";
    write_text_file(config_path, R"({"seed": 5, "grass": {"subdivisions": "many"}})");

    const auto s = st::load_settings(config_path);
    EXPECT_EQ(s.seed, 1u);
    EXPECT_EQ(s.grass.subdivisions, 3);
}

TEST(SettingsTests, OutOfRangeValuesAreIgnored) {
    const auto root = unique_test_root();
    const auto config_path = root / "range.json";
    write_text_file(config_path, R"({
        "terrain": {"dimensions": [1, 8, 40], "cell_size": [-2.0, 2.0], "ridge_threshold": 3.0,
                    "merge_mode": 17, "lower_threshold": 0.9, "upper_threshold": 0.2},
        "grass": {"subdivisions": 0, "texture_scales": [0.0, 2.0]},
        "noise": {"octaves": 40}
    })");

    const auto s = st::load_settings(config_path);
    EXPECT_EQ(s.terrain.dimensions.x, 33);
    EXPECT_FLOAT_EQ(s.terrain.cell_size.x, 2.0f);
    EXPECT_FLOAT_EQ(s.terrain.ridge_threshold, 1.0f);
    EXPECT_EQ(s.terrain.merge_mode, terratools::marching::MergeMode::Polyhedron);
    EXPECT_FLOAT_EQ(s.terrain.lower_threshold, 0.3f);
    EXPECT_FLOAT_EQ(s.terrain.upper_threshold, 0.7f);
    EXPECT_EQ(s.grass.subdivisions, 3);
    EXPECT_FLOAT_EQ(s.grass.texture_scales[0], 1.0f);
    EXPECT_FLOAT_EQ(s.grass.texture_scales[1], 2.0f);
    EXPECT_EQ(s.noise.octaves, 4);
}
