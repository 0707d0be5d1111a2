#include "terratools/marching.h"

#include <bit>
#include <cmath>
#include <map>

namespace terratools::marching {

namespace {

constexpr float perimeter_epsilon = 1e-5f;

using PointKey = std::array<uint32_t, 3>;
using EdgeKey = std::pair<PointKey, PointKey>;

[[nodiscard]] PointKey point_key(const Vec3& v) {
    return {std::bit_cast<uint32_t>(v.x), std::bit_cast<uint32_t>(v.y), std::bit_cast<uint32_t>(v.z)};
}

[[nodiscard]] bool near(float a, float b) {
    return std::abs(a - b) <= perimeter_epsilon;
}

} // namespace

WatertightResult validate_watertight(const CellGeometry& geo, int cell_x, int cell_z, Vec2 cell_size) {
    WatertightResult result;

    struct EdgeUse {
        int count = 0;
        Vec3 a;
        Vec3 b;
    };
    std::map<EdgeKey, EdgeUse> edges;

    const size_t tri_count = geo.positions.size() / 3;
    for (size_t t = 0; t < tri_count; ++t) {
        for (size_t e = 0; e < 3; ++e) {
            const Vec3& a = geo.positions[t * 3 + e];
            const Vec3& b = geo.positions[t * 3 + (e + 1) % 3];
            PointKey ka = point_key(a);
            PointKey kb = point_key(b);
            if (ka == kb) continue;
            if (kb < ka) std::swap(ka, kb);

            auto& use = edges[{ka, kb}];
            if (use.count++ == 0) {
                use.a = a;
                use.b = b;
            }
        }
    }

    const float x0 = static_cast<float>(cell_x) * cell_size.x;
    const float x1 = static_cast<float>(cell_x + 1) * cell_size.x;
    const float z0 = static_cast<float>(cell_z) * cell_size.y;
    const float z1 = static_cast<float>(cell_z + 1) * cell_size.y;

    for (const auto& [key, use] : edges) {
        if (use.count != 1) continue;
        const bool on_perimeter = (near(use.a.x, x0) && near(use.b.x, x0)) ||
                                  (near(use.a.x, x1) && near(use.b.x, x1)) ||
                                  (near(use.a.z, z0) && near(use.b.z, z0)) ||
                                  (near(use.a.z, z1) && near(use.b.z, z1));
        if (on_perimeter) continue;
        result.watertight = false;
        result.open_edges.emplace_back(use.a, use.b);
    }
    return result;
}

} // namespace terratools::marching
