#pragma once

#include <optional>
#include <system_error>
#include <vector>

#include "geometry.hpp"

namespace gfc_extract {

// グリッドセルの大きさ（度）
constexpr int kTileSizeDegrees = 10;

// データセットの全球カバレッジ（タイル上端は80Nから50Sまで）
constexpr double kCoverageMinLon = -180.0;
constexpr double kCoverageMaxLon = 180.0;
constexpr double kCoverageMinLat = -60.0;
constexpr double kCoverageMaxLat = 80.0;

// タイルの左上（北西）隅の座標（整数度）
struct TileId {
    int lat;
    int lon;

    bool operator==(const TileId& other) const { return lat == other.lat && lon == other.lon; }
    bool operator!=(const TileId& other) const { return !(*this == other); }

    // 北から南、西から東の順
    bool operator<(const TileId& other) const {
        return lat != other.lat ? lat > other.lat : lon < other.lon;
    }
};

Envelope tile_extent(const TileId& tile);

// AOIの外接矩形と交差するタイルを返す（EPSG:4326に変換してから判定）
[[nodiscard]] std::optional<std::vector<TileId>> tiles_for(const AreaOfInterest& aoi,
                                                           std::error_code& ec);

}  // namespace gfc_extract
