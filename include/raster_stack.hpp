#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "geometry.hpp"

namespace gfc_extract {

// 北が上のグリッド定義（pixel_width, pixel_height は正の値）
struct GeoTransform {
    double origin_x = 0.0;  // 左上隅のX
    double pixel_width = 1.0;
    double origin_y = 0.0;  // 左上隅のY
    double pixel_height = 1.0;

    bool operator==(const GeoTransform& o) const {
        return origin_x == o.origin_x && pixel_width == o.pixel_width &&
               origin_y == o.origin_y && pixel_height == o.pixel_height;
    }
};

// 出力時のサンプル型
enum class SampleType {
    uint8,
    float32,
};

// 同一グリッドを共有する名前付きバンドの集合
// 値はすべてfloatで保持し、NoData値は必須フィールドとして各変換で引き継ぐ
class RasterStack {
   public:
    RasterStack() = default;

    // 全ピクセルをNoData値で初期化
    RasterStack(int width, int height, GeoTransform transform, std::string crs,
                std::vector<std::string> band_names, float nodata,
                SampleType sample_type = SampleType::uint8);

    int width() const { return width_; }
    int height() const { return height_; }
    size_t band_count() const { return bands_.size(); }
    size_t pixel_count() const { return static_cast<size_t>(width_) * height_; }

    const GeoTransform& transform() const { return transform_; }
    const std::string& crs() const { return crs_; }
    float nodata() const { return nodata_; }
    SampleType sample_type() const { return sample_type_; }
    const std::vector<std::string>& band_names() const { return band_names_; }

    void set_sample_type(SampleType type) { sample_type_ = type; }
    void set_band_names(std::vector<std::string> names) { band_names_ = std::move(names); }

    // 同じグリッドのバンドを末尾に追加する（データ長が一致しなければfalse）
    [[nodiscard]] bool append_band(std::string name, std::vector<float> data);

    bool is_nodata(float value) const { return value == nodata_; }

    std::vector<float>& band(size_t b) { return bands_[b]; }
    const std::vector<float>& band(size_t b) const { return bands_[b]; }

    // (col, row)の値にアクセスするヘルパー関数
    inline float& at(size_t b, int col, int row) {
        return bands_[b][static_cast<size_t>(row) * width_ + col];
    }
    inline const float& at(size_t b, int col, int row) const {
        return bands_[b][static_cast<size_t>(row) * width_ + col];
    }

    Envelope envelope() const;

    // バンド名・データ長・グリッドが整合しているか
    bool is_consistent() const;

    bool operator==(const RasterStack& other) const;
    bool operator!=(const RasterStack& other) const { return !(*this == other); }

   private:
    int width_ = 0;
    int height_ = 0;
    GeoTransform transform_;
    std::string crs_;
    std::vector<std::string> band_names_;
    std::vector<std::vector<float>> bands_;
    float nodata_ = 0.0f;
    SampleType sample_type_ = SampleType::uint8;
};

}  // namespace gfc_extract
