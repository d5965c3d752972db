#pragma once

#include <array>
#include <optional>
#include <system_error>

#include "raster_stack.hpp"

namespace gfc_extract {

// Band3, Band4, Band5, Band7 の順のスケール係数
constexpr std::array<double, 4> kReflectanceScaleFactors = {508.0, 254.0, 363.0, 423.0};

// 整数値のTOA反射率を浮動小数点の反射率に変換: (raw - 1) / factor
// 4バンドでなければband_count_mismatch。NoDataのピクセルはNoDataのまま
[[nodiscard]] std::optional<RasterStack> rescale_reflectance(const RasterStack& stack,
                                                             std::error_code& ec);

// 逆変換: raw = value * factor + 1
[[nodiscard]] std::optional<RasterStack> unscale_reflectance(const RasterStack& stack,
                                                             std::error_code& ec);

}  // namespace gfc_extract
