#include "tile_grid.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

#include "errors.hpp"

namespace gfc_extract {

namespace {

constexpr int kColumns =
    static_cast<int>((kCoverageMaxLon - kCoverageMinLon) / kTileSizeDegrees);
constexpr int kRows = static_cast<int>((kCoverageMaxLat - kCoverageMinLat) / kTileSizeDegrees);

// [lo, hi] を覆うセル番号の範囲。境界上の辺は隣のセルを選ばない
std::pair<int, int> cell_range(double lo, double hi, int count) {
    int first = static_cast<int>(std::floor(lo / kTileSizeDegrees));
    int last = static_cast<int>(std::ceil(hi / kTileSizeDegrees)) - 1;
    last = std::max(first, last);
    first = std::clamp(first, 0, count - 1);
    last = std::clamp(last, 0, count - 1);
    return {first, last};
}

}  // namespace

Envelope tile_extent(const TileId& tile) {
    return {static_cast<double>(tile.lon), static_cast<double>(tile.lat - kTileSizeDegrees),
            static_cast<double>(tile.lon + kTileSizeDegrees), static_cast<double>(tile.lat)};
}

std::optional<std::vector<TileId>> tiles_for(const AreaOfInterest& aoi, std::error_code& ec) {
    auto geographic = normalize_aoi(aoi, ec);
    if (!geographic) {
        return std::nullopt;
    }

    const Envelope coverage{kCoverageMinLon, kCoverageMinLat, kCoverageMaxLon, kCoverageMaxLat};
    Envelope env = geographic->envelope();
    if (!env.intersects(coverage)) {
        std::cerr << "AOIがデータセットの範囲外です" << std::endl;
        ec = make_error_code(errc::empty_result);
        return std::nullopt;
    }

    // 列は西端から、行は北端から数える
    auto cols = cell_range(env.min_x - kCoverageMinLon, env.max_x - kCoverageMinLon, kColumns);
    auto rows = cell_range(kCoverageMaxLat - env.max_y, kCoverageMaxLat - env.min_y, kRows);

    std::vector<TileId> tiles;
    for (int row = rows.first; row <= rows.second; ++row) {
        for (int col = cols.first; col <= cols.second; ++col) {
            tiles.push_back({static_cast<int>(kCoverageMaxLat) - row * kTileSizeDegrees,
                             static_cast<int>(kCoverageMinLon) + col * kTileSizeDegrees});
        }
    }
    std::sort(tiles.begin(), tiles.end());
    return tiles;
}

}  // namespace gfc_extract
