#pragma once

#include <proj.h>

#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace gfc_extract {

// データセットのネイティブ座標系（WGS84 地理座標）
inline const std::string kGeographicCrs = "EPSG:4326";

struct CrsInfo {
    int epsg;         // EPSGコード
    bool geographic;  // 地理座標系ならtrue、投影座標系ならfalse
};

// "EPSG:xxxx" などのCRS定義からEPSGコードと種別を取得
[[nodiscard]] std::optional<CrsInfo> describe_crs(const std::string& crs, std::error_code& ec);

// 2つのCRS定義が同等かどうか
[[nodiscard]] bool crs_equivalent(const std::string& a, const std::string& b, std::error_code& ec);

// PROJ変換のRAIIラッパー（東向き・北向きの軸順序に正規化済み）
// PJオブジェクトはスレッド間で共有できないため、インスタンスごとにコンテキストを持つ
class CrsTransformer {
   public:
    [[nodiscard]] static std::optional<CrsTransformer> create(const std::string& src_crs,
                                                              const std::string& dst_crs,
                                                              std::error_code& ec);

    CrsTransformer(CrsTransformer&&) noexcept = default;
    CrsTransformer& operator=(CrsTransformer&&) noexcept = default;
    CrsTransformer(const CrsTransformer&) = delete;
    CrsTransformer& operator=(const CrsTransformer&) = delete;

    bool is_identity() const { return identity_; }

    // 1点を変換。変換不能な点ではfalse
    bool transform(double& x, double& y) const;

    // 配列をその場で変換。変換不能な点はHUGE_VALになる
    void transform(std::vector<double>& xs, std::vector<double>& ys) const;

   private:
    struct ContextDeleter {
        void operator()(PJ_CONTEXT* ctx) const noexcept { proj_context_destroy(ctx); }
    };
    struct PjDeleter {
        void operator()(PJ* pj) const noexcept { proj_destroy(pj); }
    };

    CrsTransformer() = default;

    // メンバの破棄順序: pj_ をコンテキストより先に解放する
    std::unique_ptr<PJ_CONTEXT, ContextDeleter> ctx_;
    std::unique_ptr<PJ, PjDeleter> pj_;
    bool identity_ = false;
};

}  // namespace gfc_extract
