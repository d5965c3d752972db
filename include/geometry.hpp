#pragma once

#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace gfc_extract {

struct Point {
    double x;
    double y;
};

using Ring = std::vector<Point>;

struct Polygon {
    Ring exterior;
    std::vector<Ring> holes;
};

// 軸に平行な外接矩形
struct Envelope {
    double min_x;
    double min_y;
    double max_x;
    double max_y;

    double width() const { return max_x - min_x; }
    double height() const { return max_y - min_y; }
    Point center() const { return {(min_x + max_x) / 2.0, (min_y + max_y) / 2.0}; }

    bool intersects(const Envelope& other) const {
        return min_x <= other.max_x && other.min_x <= max_x && min_y <= other.max_y &&
               other.min_y <= max_y;
    }
};

// 対象領域（ポリゴンまたはマルチポリゴン＋CRS）
// 生成後は変更せず、別のCRSでの表現は transformed() が新しい値として返す
class AreaOfInterest {
   public:
    AreaOfInterest(std::vector<Polygon> polygons, std::string crs);

    static AreaOfInterest from_envelope(const Envelope& envelope, std::string crs);

    const std::vector<Polygon>& polygons() const { return polygons_; }
    const std::string& crs() const { return crs_; }

    // 頂点を一つも持たない場合true
    bool empty() const;

    // 空のAOIでは呼ばないこと
    Envelope envelope() const;

    // 辺を細分化してから dst_crs へ変換する
    [[nodiscard]] std::optional<AreaOfInterest> transformed(const std::string& dst_crs,
                                                            std::error_code& ec) const;

   private:
    std::vector<Polygon> polygons_;
    std::string crs_;
};

// AOIをデータセットの地理座標系（EPSG:4326）で表現し直す
[[nodiscard]] std::optional<AreaOfInterest> normalize_aoi(const AreaOfInterest& aoi,
                                                          std::error_code& ec);

// 辺ごとに補間点を挿入したリング（投影変換時に曲線となる辺の外接矩形を保つため）
Ring densify(const Ring& ring, int segments_per_edge);

}  // namespace gfc_extract
