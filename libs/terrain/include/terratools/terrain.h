#pragma once

#include <terratools/marching.h>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace terratools::terrain {

using marching::Color;
using marching::Vec2;
using marching::Vec3;
using marching::Warning;

struct Dimensions {
    int x = 33; // grid points along x
    int y = 32; // height scale
    int z = 33; // grid points along z
};

struct TerrainConfig {
    Dimensions dimensions;
    Vec2 cell_size{2.0f, 2.0f};
    marching::MergeMode merge_mode = marching::MergeMode::Polyhedron;
    marching::BlendMode blend_mode = marching::BlendMode::Interpolated;
    bool higher_poly_floors = true;
    bool use_ridge_texture = false;
    float ridge_threshold = 1.0f;
    float lower_threshold = 0.3f;
    float upper_threshold = 0.7f;

    [[nodiscard]] int cells_x() const { return dimensions.x - 1; }
    [[nodiscard]] int cells_z() const { return dimensions.z - 1; }
};

struct NoiseParams {
    float frequency = 0.05f;
    int octaves = 4;
    uint32_t seed = 1;
};

// noise_height returns a height factor in [-1, 1] for the world grid point
// (grid_x, grid_z). Chunks that share a grid point read the same value.
[[nodiscard]] float noise_height(const NoiseParams& params, int grid_x, int grid_z);

// SavedChunk is the flat-array form used for persistence; every array is
// row-major with index z * x_points + x.
struct SavedChunk {
    std::vector<float> heights;
    std::vector<Color> color_0;
    std::vector<Color> color_1;
    std::vector<Color> wall_color_0;
    std::vector<Color> wall_color_1;
    std::vector<Color> grass_mask;
};

inline constexpr Color default_grass_mask{1.0f, 1.0f, 1.0f, 1.0f};

// Chunk owns one grid of terrain data and the cached geometry of its cells.
class Chunk {
public:
    explicit Chunk(TerrainConfig config, int chunk_x = 0, int chunk_z = 0);

    [[nodiscard]] const TerrainConfig& config() const { return config_; }
    [[nodiscard]] const marching::GridMaps& maps() const { return maps_; }
    [[nodiscard]] int chunk_x() const { return chunk_x_; }
    [[nodiscard]] int chunk_z() const { return chunk_z_; }
    [[nodiscard]] int cells_x() const { return config_.cells_x(); }
    [[nodiscard]] int cells_z() const { return config_.cells_z(); }
    [[nodiscard]] bool is_new() const { return new_chunk_; }

    // position is the world offset of grid point (0, 0).
    [[nodiscard]] Vec3 position() const;

    // Bounds-checked grid access; reads outside the grid return defaults and
    // writes outside it are ignored.
    [[nodiscard]] float height(int x, int z) const;
    void set_height(int x, int z, float h);
    [[nodiscard]] Color color_0(int x, int z) const;
    void set_color_0(int x, int z, const Color& c);
    [[nodiscard]] Color color_1(int x, int z) const;
    void set_color_1(int x, int z, const Color& c);
    [[nodiscard]] Color wall_color_0(int x, int z) const;
    void set_wall_color_0(int x, int z, const Color& c);
    [[nodiscard]] Color wall_color_1(int x, int z) const;
    void set_wall_color_1(int x, int z, const Color& c);
    [[nodiscard]] Color grass_mask(int x, int z) const;
    void set_grass_mask(int x, int z, const Color& c);

    // mark_cell_dirty flags the cell and its eight neighbours for rebuild.
    void mark_cell_dirty(int cell_x, int cell_z);
    void mark_all_dirty();
    [[nodiscard]] bool is_cell_dirty(int cell_x, int cell_z) const;
    [[nodiscard]] size_t dirty_count() const;

    // regenerate rebuilds every dirty cell and returns how many were rebuilt.
    size_t regenerate();

    [[nodiscard]] const std::vector<marching::CellGeometry>& cells() const { return cells_; }
    [[nodiscard]] const marching::CellGeometry* cell_geometry(int cell_x, int cell_z) const;

    // assemble concatenates all cached cells in row-major order.
    [[nodiscard]] marching::CellGeometry assemble() const;

    [[nodiscard]] SavedChunk save() const;
    // restore replaces the grid from saved arrays. Returns false and leaves
    // the chunk untouched when the height array has the wrong size.
    bool restore(const SavedChunk& saved);

    void generate_heights(const NoiseParams& params);

    // validate checks every cached cell for open edges and returns the total.
    size_t validate();

    [[nodiscard]] const std::vector<Warning>& warnings() const { return warnings_; }
    void clear_warnings() { warnings_.clear(); }

private:
    [[nodiscard]] size_t cell_index(int cell_x, int cell_z) const {
        return static_cast<size_t>(cell_z) * static_cast<size_t>(cells_x()) + static_cast<size_t>(cell_x);
    }
    [[nodiscard]] bool has_cell(int cell_x, int cell_z) const {
        return cell_x >= 0 && cell_z >= 0 && cell_x < cells_x() && cell_z < cells_z();
    }
    [[nodiscard]] marching::CellConfig cell_config() const;
    void touch_point(int x, int z);
    void set_color(std::vector<Color>& map, int x, int z, const Color& c);
    [[nodiscard]] Color get_color(const std::vector<Color>& map, int x, int z, const Color& fallback) const;
    void reset_maps();

    TerrainConfig config_;
    int chunk_x_ = 0;
    int chunk_z_ = 0;
    marching::GridMaps maps_;
    std::vector<uint8_t> dirty_;
    std::vector<marching::CellGeometry> cells_;
    std::vector<Warning> warnings_;
    bool new_chunk_ = true;
};

} // namespace terratools::terrain
