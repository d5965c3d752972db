#include "extractor.hpp"

#include <tbb/parallel_for.h>

#include <iostream>
#include <mutex>
#include <utility>
#include <vector>

#include "console.hpp"
#include "errors.hpp"
#include "reflectance.hpp"
#include "reprojection.hpp"
#include "tile_grid.hpp"
#include "tile_loader.hpp"

namespace gfc_extract {

Extractor::Extractor(Config config) : config_(std::move(config)) {}

std::optional<RasterStack> Extractor::make_tile_mosaic(const AreaOfInterest& aoi,
                                                       ProductVariant variant,
                                                       std::error_code& ec) const {
    auto tiles = tiles_for(aoi, ec);
    if (!tiles) {
        return std::nullopt;
    }
    std::cout << tiles->size() << " 個のタイルを選択しました" << std::endl;

    std::vector<std::vector<std::filesystem::path>> tile_files;
    tile_files.reserve(tiles->size());
    for (const auto& tile : *tiles) {
        tile_files.push_back(
            filenames_for(tile, variant, config_.dataset_version, config_.data_folder));
    }

    // タイルごとの読み込み・切り出しは互いに独立なので並列に行う
    std::vector<std::optional<RasterStack>> tile_stacks(tile_files.size());
    std::vector<std::error_code> errors(tile_files.size());

    tbb::parallel_for(size_t(0), tile_files.size(), [&](size_t i) {
        {
            std::lock_guard<std::mutex> lock(console_mutex());
            std::cout << "タイルを読み込み中: " << tile_suffix((*tiles)[i]) << std::endl;
        }
        tile_stacks[i] = load_and_crop(tile_files[i], aoi, variant, errors[i]);
    });

    // タイル順で最初のエラーを返す
    std::vector<RasterStack> stacks;
    stacks.reserve(tile_stacks.size());
    for (size_t i = 0; i < tile_stacks.size(); ++i) {
        if (!tile_stacks[i]) {
            ec = errors[i] ? errors[i] : make_error_code(errc::invalid_raster);
            return std::nullopt;
        }
        stacks.push_back(std::move(*tile_stacks[i]));
    }
    tile_stacks.clear();

    auto tile_mosaic = mosaic(std::move(stacks), config_.mosaic, ec);
    if (!tile_mosaic) {
        return std::nullopt;
    }
    tile_mosaic->set_band_names(variant_info(variant).band_names);
    return tile_mosaic;
}

std::optional<RasterStack> Extractor::run(const AreaOfInterest& aoi, std::error_code& ec) const {
    // タイルI/Oの前にスタック指定を検証する
    auto variant = parse_product_variant(config_.stack, ec);
    if (!variant) {
        std::cerr << "\"stack\" は \"change\"、\"first\"、\"last\" のいずれかです: "
                  << config_.stack << std::endl;
        return std::nullopt;
    }
    const VariantInfo& info = variant_info(*variant);
    if (config_.scale_reflectance && info.categorical) {
        std::cerr << "反射率変換は first / last のみ対応しています" << std::endl;
        ec = make_error_code(errc::unsupported_variant);
        return std::nullopt;
    }

    auto product = make_tile_mosaic(aoi, *variant, ec);
    if (!product) {
        return std::nullopt;
    }

    if (config_.to_utm) {
        // モザイク自身の範囲からUTMゾーンを決める。分類データは最近傍法
        product = reproject_to_utm(*product, info.categorical, ec);
        if (!product) {
            return std::nullopt;
        }
    }

    if (config_.scale_reflectance) {
        product = rescale_reflectance(*product, ec);
        if (!product) {
            return std::nullopt;
        }
    }

    if (config_.write.output_path) {
        if (!write_geotiff(*product, config_.write, ec)) {
            std::cerr << "GeoTIFFの作成に失敗しました: " << *config_.write.output_path
                      << std::endl;
            return std::nullopt;
        }
    }

    return product;
}

}  // namespace gfc_extract
