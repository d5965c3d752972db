#pragma once

#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace gfc_extract {

// 全バリアント共通のNoData値
constexpr float kNoDataValue = -1.0f;

enum class ProductVariant {
    change,  // 森林変化レイヤー
    first,   // 2000年のTOA反射率コンポジット
    last,    // 最終年のTOA反射率コンポジット
};

struct VariantInfo {
    std::string name;
    std::vector<std::string> image_names;  // タイルごとのソース画像名（ファイル名の一部）
    std::vector<std::string> band_names;   // 出力のバンド名
    bool categorical;                      // クラスコードのため補間してはならない
};

const VariantInfo& variant_info(ProductVariant variant);

[[nodiscard]] std::optional<ProductVariant> parse_product_variant(const std::string& name,
                                                                  std::error_code& ec);

std::string to_string(ProductVariant variant);

}  // namespace gfc_extract
