#pragma once

#include <optional>
#include <string>
#include <system_error>

#include "geometry.hpp"
#include "raster_stack.hpp"

namespace gfc_extract {

// 外接矩形の重心が属するUTMゾーンのCRS（例: "EPSG:32632"）
// 6度幅のゾーン、半球は緯度の符号から決める。UTMの定義域外ならunsupported_crs
[[nodiscard]] std::optional<std::string> utm_crs_for(const Envelope& envelope,
                                                     const std::string& crs, std::error_code& ec);

// categorical=true なら最近傍法、false なら有効な近傍のみを使う双一次補間
[[nodiscard]] std::optional<RasterStack> reproject(const RasterStack& stack,
                                                   const std::string& target_crs, bool categorical,
                                                   std::error_code& ec);

// スタック自身の範囲から決めたUTMゾーンへ投影する
[[nodiscard]] std::optional<RasterStack> reproject_to_utm(const RasterStack& stack,
                                                          bool categorical, std::error_code& ec);

}  // namespace gfc_extract
