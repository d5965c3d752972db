#pragma once

#include <string>
#include <system_error>

namespace gfc_extract {

// パイプラインのエラー分類（いずれも呼び出し全体を中断する）
enum class errc {
    empty_result = 1,     // AOIがデータセットの範囲と交差しない
    missing_tile_file,    // 必要なタイルファイルが存在しない
    band_count_mismatch,  // バンド数がバリアントの想定と一致しない
    grid_alignment,       // タイルのグリッドが許容誤差を超えてずれている
    unsupported_crs,      // 座標系が不正または投影先を決定できない
    unsupported_variant,  // "change" / "first" / "last" 以外のスタック指定
    invalid_raster,       // 欠損・不整合のあるラスター
    output_exists,        // 上書き不可の出力ファイルが既に存在する
};

const std::error_category& gfc_category() noexcept;

std::error_code make_error_code(errc e) noexcept;

}  // namespace gfc_extract

namespace std {
template <>
struct is_error_code_enum<gfc_extract::errc> : true_type {};
}  // namespace std
