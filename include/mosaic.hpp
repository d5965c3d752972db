#pragma once

#include <optional>
#include <system_error>
#include <vector>

#include "raster_stack.hpp"

namespace gfc_extract {

struct MosaicOptions {
    // 許容するグリッドのずれ（1ピクセル幅に対する割合）
    double tolerance = 0.05;
};

// 切り出し済みのタイルスタックを1枚のラスターにまとめる
// 1枚だけなら再サンプリングせずにそのまま返す。重なるセルは有効値の算術平均
// 不整合なスタックが1枚でもあればマージ全体を中断する
[[nodiscard]] std::optional<RasterStack> mosaic(std::vector<RasterStack> stacks,
                                                const MosaicOptions& options, std::error_code& ec);

}  // namespace gfc_extract
