#include "crs_transform.hpp"

#include <cmath>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>

#include "console.hpp"
#include "errors.hpp"

namespace gfc_extract {

namespace {

struct ContextHandle {
    PJ_CONTEXT* ctx = proj_context_create();
    ~ContextHandle() {
        if (ctx) proj_context_destroy(ctx);
    }
};

struct PjHandle {
    PJ* pj = nullptr;
    ~PjHandle() {
        if (pj) proj_destroy(pj);
    }
};

}  // namespace

std::optional<CrsInfo> describe_crs(const std::string& crs, std::error_code& ec) {
    ContextHandle ctx;
    if (!ctx.ctx) {
        ec = std::make_error_code(std::errc::not_enough_memory);
        return std::nullopt;
    }

    PjHandle pj{proj_create(ctx.ctx, crs.c_str())};
    if (!pj.pj) {
        ec = make_error_code(errc::unsupported_crs);
        return std::nullopt;
    }

    CrsInfo info{};
    switch (proj_get_type(pj.pj)) {
        case PJ_TYPE_GEOGRAPHIC_2D_CRS:
        case PJ_TYPE_GEOGRAPHIC_3D_CRS:
            info.geographic = true;
            break;
        case PJ_TYPE_PROJECTED_CRS:
            info.geographic = false;
            break;
        default:
            ec = make_error_code(errc::unsupported_crs);
            return std::nullopt;
    }

    // GeoTIFFのキーにはEPSGコードしか書けない
    const char* auth = proj_get_id_auth_name(pj.pj, 0);
    const char* code = proj_get_id_code(pj.pj, 0);
    if (!auth || !code || std::strcmp(auth, "EPSG") != 0) {
        ec = make_error_code(errc::unsupported_crs);
        return std::nullopt;
    }
    info.epsg = std::atoi(code);
    return info;
}

bool crs_equivalent(const std::string& a, const std::string& b, std::error_code& ec) {
    if (a == b) {
        return true;
    }

    ContextHandle ctx;
    if (!ctx.ctx) {
        ec = std::make_error_code(std::errc::not_enough_memory);
        return false;
    }

    PjHandle pa{proj_create(ctx.ctx, a.c_str())};
    PjHandle pb{proj_create(ctx.ctx, b.c_str())};
    if (!pa.pj || !pb.pj) {
        ec = make_error_code(errc::unsupported_crs);
        return false;
    }
    return proj_is_equivalent_to(pa.pj, pb.pj, PJ_COMP_EQUIVALENT) != 0;
}

std::optional<CrsTransformer> CrsTransformer::create(const std::string& src_crs,
                                                     const std::string& dst_crs,
                                                     std::error_code& ec) {
    CrsTransformer t;
    t.ctx_.reset(proj_context_create());
    if (!t.ctx_) {
        ec = std::make_error_code(std::errc::not_enough_memory);
        return std::nullopt;
    }

    {
        PjHandle src{proj_create(t.ctx_.get(), src_crs.c_str())};
        PjHandle dst{proj_create(t.ctx_.get(), dst_crs.c_str())};
        if (!src.pj || !dst.pj) {
            std::lock_guard<std::mutex> lock(console_mutex());
            std::cerr << "CRSを解釈できません: " << src_crs << " / " << dst_crs << std::endl;
            ec = make_error_code(errc::unsupported_crs);
            return std::nullopt;
        }
        t.identity_ = proj_is_equivalent_to(src.pj, dst.pj, PJ_COMP_EQUIVALENT) != 0;
    }

    PJ* transform = proj_create_crs_to_crs(t.ctx_.get(), src_crs.c_str(), dst_crs.c_str(), nullptr);
    if (!transform) {
        ec = make_error_code(errc::unsupported_crs);
        return std::nullopt;
    }

    // 正規化された変換を取得（東向き・北向き軸順序）
    PJ* norm = proj_normalize_for_visualization(t.ctx_.get(), transform);
    if (norm) {
        proj_destroy(transform);
        transform = norm;
    }
    t.pj_.reset(transform);
    return t;
}

bool CrsTransformer::transform(double& x, double& y) const {
    if (identity_) {
        return true;
    }
    PJ_COORD out = proj_trans(pj_.get(), PJ_FWD, proj_coord(x, y, 0, 0));
    if (out.xy.x == HUGE_VAL || !std::isfinite(out.xy.x) || !std::isfinite(out.xy.y)) {
        return false;
    }
    x = out.xy.x;
    y = out.xy.y;
    return true;
}

void CrsTransformer::transform(std::vector<double>& xs, std::vector<double>& ys) const {
    if (identity_ || xs.empty()) {
        return;
    }
    proj_trans_generic(pj_.get(), PJ_FWD, xs.data(), sizeof(double), xs.size(), ys.data(),
                       sizeof(double), ys.size(), nullptr, 0, 0, nullptr, 0, 0);
}

}  // namespace gfc_extract
