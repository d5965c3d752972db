#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "product_variant.hpp"
#include "tile_grid.hpp"

namespace gfc_extract {

constexpr char kFilePrefix[] = "Hansen";
constexpr char kDefaultDatasetVersion[] = "GFC-2022-v1.10";

// 例: (10, -20) -> "_10N_020W.tif"
std::string tile_suffix(const TileId& tile);

// <prefix>_<dataset_version>_<image_name>_<NN><N|S>_<NNN><E|W>.tif
// バリアントの画像名の順に並ぶ。存在確認はしない
std::vector<std::filesystem::path> filenames_for(const TileId& tile, ProductVariant variant,
                                                 const std::string& dataset_version,
                                                 const std::filesystem::path& data_folder);

}  // namespace gfc_extract
