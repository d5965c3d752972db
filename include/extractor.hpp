#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <system_error>

#include "geometry.hpp"
#include "geotiff_io.hpp"
#include "mosaic.hpp"
#include "product_variant.hpp"
#include "raster_stack.hpp"
#include "tile_naming.hpp"

namespace gfc_extract {

// ダウンロード済みのタイルからAOIのラスターを組み立てる
// タイル選択 -> ファイル名解決 -> 読み込み・切り出し -> モザイク -> [UTM投影] -> [反射率変換]
class Extractor {
   public:
    struct Config {
        std::filesystem::path data_folder;                // タイルファイルのあるフォルダ
        std::string dataset_version = kDefaultDatasetVersion;
        std::string stack = "change";                     // "change" / "first" / "last"
        bool to_utm = false;                              // 重心のUTMゾーンへ投影する
        bool scale_reflectance = false;                   // first/lastのみ
        WriteOptions write;
        MosaicOptions mosaic;
    };

    explicit Extractor(Config config);

    // AOIの最終プロダクトを返す。write.output_path があればファイルにも書き出す
    [[nodiscard]] std::optional<RasterStack> run(const AreaOfInterest& aoi,
                                                 std::error_code& ec) const;

    // 投影・反射率変換を行わないタイルモザイク
    [[nodiscard]] std::optional<RasterStack> make_tile_mosaic(const AreaOfInterest& aoi,
                                                              ProductVariant variant,
                                                              std::error_code& ec) const;

   private:
    Config config_;
};

}  // namespace gfc_extract
