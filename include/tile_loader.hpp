#pragma once

#include <filesystem>
#include <optional>
#include <system_error>
#include <vector>

#include "geometry.hpp"
#include "product_variant.hpp"
#include "raster_stack.hpp"

namespace gfc_extract {

// 1タイル分のファイル群を読み込み、AOIの外接矩形で切り出して1つのスタックにまとめる
// AOIは先にタイルのCRSへ変換する。ファイルは読み取り専用で開き、関数を抜けるときに閉じる
[[nodiscard]] std::optional<RasterStack> load_and_crop(
    const std::vector<std::filesystem::path>& paths, const AreaOfInterest& aoi,
    ProductVariant variant, std::error_code& ec);

}  // namespace gfc_extract
