#include "terratools/grass.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <memory>
#include <vector>

namespace gr = terratools::grass;
namespace mc = terratools::marching;
namespace ts = terratools::texslot;

namespace {

constexpr ts::Color red{1.0f, 0.0f, 0.0f, 0.0f};
constexpr ts::Color green{0.0f, 1.0f, 0.0f, 0.0f};
constexpr ts::Color blue{0.0f, 0.0f, 1.0f, 0.0f};

gr::Sample sample_with(ts::Color mask, ts::Color c0, ts::Color c1) {
    gr::Sample s;
    s.grass_mask = mask;
    s.color_0 = c0;
    s.color_1 = c1;
    return s;
}

// flat_cells builds geometry for a flat (cells_x x cells_z) grid.
std::vector<mc::CellGeometry> flat_cells(int cells_x, int cells_z, ts::Color mask) {
    mc::GridMaps maps;
    maps.width = cells_x + 1;
    maps.depth = cells_z + 1;
    const size_t n = static_cast<size_t>(maps.width * maps.depth);
    maps.heights.assign(n, 0.0f);
    maps.color_0.assign(n, red);
    maps.color_1.assign(n, red);
    maps.wall_color_0.assign(n, red);
    maps.wall_color_1.assign(n, red);
    maps.grass_mask.assign(n, mask);

    mc::CellConfig config;
    std::vector<mc::CellGeometry> cells;
    for (int z = 0; z < cells_z; ++z) {
        for (int x = 0; x < cells_x; ++x) {
            cells.emplace_back();
            mc::generate_cell(maps, config, x, z, cells.back());
        }
    }
    return cells;
}

gr::GrassConfig small_config() {
    gr::GrassConfig config;
    config.dimensions = {3, 32, 3};
    config.subdivisions = 2;
    return config;
}

} // namespace

TEST(Grass, StratifiedSamplesStayInsideTheirSubCells) {
    gr::Rng rng(42);
    const auto points = gr::stratified_samples(2, 1, 3, {2.0f, 2.0f}, rng);
    ASSERT_EQ(points.size(), 9u);
    for (int z = 0; z < 3; ++z) {
        for (int x = 0; x < 3; ++x) {
            const auto& p = points[static_cast<size_t>(z * 3 + x)];
            const float x0 = 4.0f + static_cast<float>(x) * 2.0f / 3.0f;
            const float z0 = 2.0f + static_cast<float>(z) * 2.0f / 3.0f;
            EXPECT_GE(p.x, x0 - 1e-5f);
            EXPECT_LE(p.x, x0 + 2.0f / 3.0f + 1e-5f);
            EXPECT_GE(p.y, z0 - 1e-5f);
            EXPECT_LE(p.y, z0 + 2.0f / 3.0f + 1e-5f);
        }
    }
}

TEST(Grass, RngDrawsInsideRequestedRange) {
    gr::Rng rng(5);
    gr::Rng replay(5);
    std::array<int, 4> quarters{};
    for (int i = 0; i < 2000; ++i) {
        const float v = rng.next_in(-3.0f, 5.0f);
        EXPECT_EQ(v, replay.next_in(-3.0f, 5.0f));
        ASSERT_GE(v, -3.0f);
        ASSERT_LT(v, 5.0f);
        ++quarters[std::min<size_t>(3, static_cast<size_t>((v + 3.0f) / 2.0f))];
    }
    for (int q : quarters) EXPECT_GT(q, 400);

    EXPECT_FLOAT_EQ(rng.next_in(2.0f, 2.0f), 2.0f);
    EXPECT_FLOAT_EQ(rng.next_in(4.0f, 1.0f), 4.0f);

    gr::Rng zero(0);
    const float u = zero.next();
    EXPECT_GE(u, 0.0f);
    EXPECT_LT(u, 1.0f);
}

TEST(Grass, PointIsClaimedByOneTriangleOnly) {
    const mc::Vec3 a1{0.0f, 0.0f, 0.0f}, b1{1.0f, 0.0f, 0.0f}, c1{0.0f, 0.0f, 1.0f};
    const mc::Vec3 a2{2.0f, 0.0f, 0.0f}, b2{3.0f, 0.0f, 0.0f}, c2{2.0f, 0.0f, 1.0f};
    std::vector<mc::Vec2> pool = {{0.25f, 0.25f}, {2.25f, 0.25f}, {5.0f, 5.0f}};

    const auto first = gr::claim_points(a1, b1, c1, pool);
    ASSERT_EQ(first.size(), 1u);
    EXPECT_FLOAT_EQ(first[0].point.x, 0.25f);
    EXPECT_FLOAT_EQ(first[0].weights.u, 0.25f);
    EXPECT_FLOAT_EQ(first[0].weights.v, 0.25f);
    EXPECT_FLOAT_EQ(first[0].weights.w, 0.5f);
    EXPECT_EQ(pool.size(), 2u);

    EXPECT_TRUE(gr::claim_points(a1, b1, c1, pool).empty());

    const auto second = gr::claim_points(a2, b2, c2, pool);
    ASSERT_EQ(second.size(), 1u);
    EXPECT_FLOAT_EQ(second[0].point.x, 2.25f);
    ASSERT_EQ(pool.size(), 1u);
    EXPECT_FLOAT_EQ(pool[0].x, 5.0f);
}

TEST(Grass, DegenerateTriangleClaimsNothing) {
    std::vector<mc::Vec2> pool = {{0.5f, 0.0f}};
    const auto hits = gr::claim_points({0.0f, 0.0f, 0.0f}, {1.0f, 0.0f, 0.0f}, {2.0f, 0.0f, 0.0f}, pool);
    EXPECT_TRUE(hits.empty());
    EXPECT_EQ(pool.size(), 1u);
}

TEST(Grass, GreenMaskForcesGrassPastMaskAndSlotToggle) {
    auto config = small_config();
    config.tex_has_grass[3] = false; // slot 4
    int slot = -1;

    const auto forced = sample_with({0.0f, 1.0f, 1.0f, 1.0f}, green, red);
    EXPECT_EQ(gr::classify_sample(forced, config, slot), gr::Rejection::None);
    EXPECT_EQ(slot, 4);

    const auto masked = sample_with({0.0f, 0.0f, 1.0f, 1.0f}, red, red);
    EXPECT_EQ(gr::classify_sample(masked, config, slot), gr::Rejection::Masked);

    const auto disabled = sample_with({1.0f, 0.0f, 1.0f, 1.0f}, green, red);
    EXPECT_EQ(gr::classify_sample(disabled, config, slot), gr::Rejection::Slot);
}

TEST(Grass, LedgeAndRidgeAreRejectedFirst) {
    auto config = small_config();
    config.ridge_threshold = 0.5f;
    int slot = -1;

    auto s = sample_with({1.0f, 1.0f, 1.0f, 1.0f}, red, red);
    s.uv = {0.9f, 0.0f};
    EXPECT_EQ(gr::classify_sample(s, config, slot), gr::Rejection::Ledge);

    s.uv = {0.0f, 0.6f};
    EXPECT_EQ(gr::classify_sample(s, config, slot), gr::Rejection::Ridge);

    s.uv = {0.0f, 0.4f};
    EXPECT_EQ(gr::classify_sample(s, config, slot), gr::Rejection::None);
}

TEST(Grass, SlotsBeyondGrassRangeNeverGrow) {
    const auto config = small_config();
    int slot = -1;
    const auto s = sample_with({1.0f, 1.0f, 1.0f, 1.0f}, green, blue); // slot 6
    EXPECT_EQ(gr::classify_sample(s, config, slot), gr::Rejection::Slot);
    EXPECT_EQ(slot, 6);
}

TEST(Grass, InstanceAlphaStepsBySlot) {
    EXPECT_FLOAT_EQ(gr::instance_alpha(0), 1.0f);
    EXPECT_FLOAT_EQ(gr::instance_alpha(2), 0.6f);
    EXPECT_NEAR(gr::instance_alpha(5), 0.0f, 1e-6f);
}

TEST(Grass, BillboardOnFlatGroundIsUpright) {
    const auto inst = gr::billboard_instance({1.0f, 2.0f, 3.0f}, {0.0f, 4.0f, 0.0f}, {0.5f, 2.0f}, red);
    EXPECT_FLOAT_EQ(inst.basis_x.x, 0.5f);
    EXPECT_FLOAT_EQ(inst.basis_y.y, 2.0f);
    EXPECT_FLOAT_EQ(inst.basis_z.z, 0.5f);
    EXPECT_FLOAT_EQ(inst.origin.y, 2.0f);
}

TEST(Grass, CapacityNeverShrinks) {
    gr::InstanceBuffer buffer(2, 2, 4);
    EXPECT_EQ(buffer.capacity(), 16u);
    buffer.reserve(1, 1, 4);
    EXPECT_EQ(buffer.capacity(), 16u);
    EXPECT_EQ(buffer.visible_count(), 0u);
    EXPECT_EQ(buffer.cell_base(0, 0), 0u);
}

TEST(Grass, FlatTerrainFillsEverySlotThenHidesOnEmptyRebuild) {
    gr::GrassPlanter planter(small_config());
    ASSERT_EQ(planter.buffer().capacity(), 16u);

    const auto cells = flat_cells(2, 2, {1.0f, 1.0f, 1.0f, 1.0f});
    gr::Rng rng(7);
    const auto stats = planter.regenerate(cells, rng);
    EXPECT_EQ(stats.placed, 16u);
    EXPECT_EQ(stats.hidden, 0u);
    EXPECT_EQ(planter.buffer().visible_count(), 16u);

    // instances of cell (1, 0) live in its own block
    const auto& inst = planter.buffer().instances()[planter.buffer().cell_base(1, 0)];
    EXPECT_GE(inst.origin.x, 2.0f);
    EXPECT_LE(inst.origin.x, 4.0f);
    EXPECT_LE(inst.origin.z, 2.0f);
    EXPECT_FLOAT_EQ(inst.color.a, 1.0f);
    EXPECT_FLOAT_EQ(inst.color.g, 0.5f); // ground color fallback

    const std::vector<mc::CellGeometry> empty(4);
    const auto cleared = planter.regenerate(empty, rng);
    EXPECT_EQ(cleared.placed, 0u);
    EXPECT_EQ(cleared.hidden, 16u);
    EXPECT_EQ(planter.buffer().visible_count(), 0u);
    EXPECT_EQ(planter.buffer().capacity(), 16u);
}

TEST(Grass, PaintedMaskSuppressesWholeCell) {
    gr::GrassPlanter planter(small_config());
    const auto cells = flat_cells(2, 2, {0.0f, 0.0f, 0.0f, 1.0f});
    gr::Rng rng(9);
    const auto stats = planter.regenerate(cells, rng);
    EXPECT_EQ(stats.placed, 0u);
    EXPECT_EQ(stats.rejected_mask, 16u);
}

TEST(Grass, GroundImageTintsInstances) {
    auto config = small_config();
    auto img = std::make_shared<terratools::tga::Image>(terratools::tga::make_image(1, 1, {255, 0, 0, 255}));
    config.ground_images[0] = img;
    gr::GrassPlanter planter(config);

    const auto cells = flat_cells(2, 2, {1.0f, 1.0f, 1.0f, 1.0f});
    gr::Rng rng(3);
    planter.plant_cell(0, 0, cells[0], rng);
    const auto& inst = planter.buffer().instances()[0];
    EXPECT_FLOAT_EQ(inst.color.r, 1.0f);
    EXPECT_FLOAT_EQ(inst.color.g, 0.0f);
    EXPECT_FLOAT_EQ(inst.color.a, 1.0f);
}

TEST(Grass, SameSeedGivesSameInstances) {
    const auto cells = flat_cells(2, 2, {1.0f, 1.0f, 1.0f, 1.0f});
    gr::GrassPlanter a(small_config());
    gr::GrassPlanter b(small_config());
    gr::Rng ra(11);
    gr::Rng rb(11);
    a.regenerate(cells, ra);
    b.regenerate(cells, rb);
    EXPECT_EQ(a.buffer().flatten(), b.buffer().flatten());
    EXPECT_EQ(a.buffer().flatten().size(), 16u * 16u);
}
