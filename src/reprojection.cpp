#include "reprojection.hpp"

#include <tbb/blocked_range.h>
#include <tbb/enumerable_thread_specific.h>
#include <tbb/parallel_for.h>

#include <algorithm>
#include <atomic>
#include <cmath>
#include <iostream>
#include <limits>
#include <vector>

#include "crs_transform.hpp"
#include "errors.hpp"

namespace gfc_extract {

namespace {

constexpr double kUtmMinLat = -80.0;
constexpr double kUtmMaxLat = 84.0;
constexpr int kEdgeSamples = 20;

bool valid_coord(double x, double y) {
    return x != HUGE_VAL && std::isfinite(x) && std::isfinite(y);
}

// ソース範囲の辺上の点を変換して出力範囲を求める
std::optional<Envelope> transformed_extent(const CrsTransformer& fwd, const Envelope& env) {
    Ring ring = densify({{env.min_x, env.max_y},
                         {env.max_x, env.max_y},
                         {env.max_x, env.min_y},
                         {env.min_x, env.min_y},
                         {env.min_x, env.max_y}},
                        kEdgeSamples);
    std::vector<double> xs;
    std::vector<double> ys;
    for (const auto& p : ring) {
        xs.push_back(p.x);
        ys.push_back(p.y);
    }
    fwd.transform(xs, ys);

    Envelope out{std::numeric_limits<double>::max(), std::numeric_limits<double>::max(),
                 std::numeric_limits<double>::lowest(), std::numeric_limits<double>::lowest()};
    bool any = false;
    for (size_t i = 0; i < xs.size(); ++i) {
        if (!valid_coord(xs[i], ys[i])) {
            continue;
        }
        any = true;
        out.min_x = std::min(out.min_x, xs[i]);
        out.max_x = std::max(out.max_x, xs[i]);
        out.min_y = std::min(out.min_y, ys[i]);
        out.max_y = std::max(out.max_y, ys[i]);
    }
    if (!any || out.width() <= 0.0 || out.height() <= 0.0) {
        return std::nullopt;
    }
    return out;
}

void sample_nearest(const RasterStack& src, double fx, double fy, RasterStack& dst, int col,
                    int row) {
    int sc = static_cast<int>(std::floor(fx));
    int sr = static_cast<int>(std::floor(fy));
    if (sc < 0 || sc >= src.width() || sr < 0 || sr >= src.height()) {
        return;
    }
    for (size_t b = 0; b < src.band_count(); ++b) {
        dst.at(b, col, row) = src.at(b, sc, sr);
    }
}

void sample_bilinear(const RasterStack& src, double fx, double fy, RasterStack& dst, int col,
                     int row) {
    // ピクセル中心基準の座標
    double cx = fx - 0.5;
    double cy = fy - 0.5;
    int x0 = static_cast<int>(std::floor(cx));
    int y0 = static_cast<int>(std::floor(cy));
    double wx = cx - x0;
    double wy = cy - y0;

    if (fx < 0.0 || fy < 0.0 || fx >= src.width() || fy >= src.height()) {
        return;
    }

    const int xs[2] = {x0, x0 + 1};
    const int ys[2] = {y0, y0 + 1};
    const double wxs[2] = {1.0 - wx, wx};
    const double wys[2] = {1.0 - wy, wy};

    for (size_t b = 0; b < src.band_count(); ++b) {
        double acc = 0.0;
        double weight = 0.0;
        for (int j = 0; j < 2; ++j) {
            for (int i = 0; i < 2; ++i) {
                int sc = std::clamp(xs[i], 0, src.width() - 1);
                int sr = std::clamp(ys[j], 0, src.height() - 1);
                float v = src.at(b, sc, sr);
                double w = wxs[i] * wys[j];
                if (src.is_nodata(v) || w <= 0.0) {
                    continue;
                }
                acc += v * w;
                weight += w;
            }
        }
        if (weight > 0.0) {
            dst.at(b, col, row) = static_cast<float>(acc / weight);
        }
    }
}

}  // namespace

std::optional<std::string> utm_crs_for(const Envelope& envelope, const std::string& crs,
                                       std::error_code& ec) {
    Point c = envelope.center();

    auto to_geographic = CrsTransformer::create(crs, kGeographicCrs, ec);
    if (!to_geographic) {
        return std::nullopt;
    }
    if (!to_geographic->transform(c.x, c.y)) {
        ec = make_error_code(errc::unsupported_crs);
        return std::nullopt;
    }

    const double lon = c.x;
    const double lat = c.y;
    if (!std::isfinite(lon) || !std::isfinite(lat) || lon < -180.0 || lon > 180.0 ||
        lat < kUtmMinLat || lat > kUtmMaxLat) {
        std::cerr << "重心 (" << lon << ", " << lat << ") はUTMゾーンの範囲外です" << std::endl;
        ec = make_error_code(errc::unsupported_crs);
        return std::nullopt;
    }

    int zone = static_cast<int>(std::floor((lon + 180.0) / 6.0)) + 1;
    zone = std::min(zone, 60);
    int epsg = (lat >= 0.0 ? 32600 : 32700) + zone;
    return "EPSG:" + std::to_string(epsg);
}

std::optional<RasterStack> reproject(const RasterStack& stack, const std::string& target_crs,
                                     bool categorical, std::error_code& ec) {
    if (!stack.is_consistent()) {
        ec = make_error_code(errc::invalid_raster);
        return std::nullopt;
    }

    auto fwd = CrsTransformer::create(stack.crs(), target_crs, ec);
    if (!fwd) {
        return std::nullopt;
    }
    if (fwd->is_identity()) {
        std::cout << "既に " << target_crs << " です。再投影をスキップします" << std::endl;
        return stack;
    }

    auto dst_env = transformed_extent(*fwd, stack.envelope());
    if (!dst_env) {
        ec = make_error_code(errc::unsupported_crs);
        return std::nullopt;
    }

    // 対角線の長さとピクセル数の比から正方形ピクセルの大きさを決める
    double src_diagonal_pixels = std::hypot(stack.width(), stack.height());
    double resolution = std::hypot(dst_env->width(), dst_env->height()) / src_diagonal_pixels;
    int dst_width = std::max(1, static_cast<int>(std::ceil(dst_env->width() / resolution)));
    int dst_height = std::max(1, static_cast<int>(std::ceil(dst_env->height() / resolution)));

    GeoTransform dst_gt{dst_env->min_x, resolution, dst_env->max_y, resolution};
    RasterStack output(dst_width, dst_height, dst_gt, target_crs, stack.band_names(),
                       stack.nodata(), stack.sample_type());

    std::cout << target_crs << " に再投影中: " << dst_width << " x " << dst_height << " ("
              << (categorical ? "nearest" : "bilinear") << ")" << std::endl;

    // 逆変換はスレッドごとに作成する（PJは共有できない）
    std::atomic<bool> failed{false};
    tbb::enumerable_thread_specific<std::optional<CrsTransformer>> local_inverse;
    const GeoTransform& sgt = stack.transform();

    tbb::parallel_for(tbb::blocked_range<int>(0, dst_height), [&](const tbb::blocked_range<int>& r) {
        auto& inverse = local_inverse.local();
        if (!inverse) {
            std::error_code local_ec;
            inverse = CrsTransformer::create(target_crs, stack.crs(), local_ec);
            if (!inverse) {
                failed = true;
                return;
            }
        }

        std::vector<double> xs(dst_width);
        std::vector<double> ys(dst_width);
        for (int row = r.begin(); row != r.end(); ++row) {
            // 出力ピクセルの中心座標をソースCRSに逆変換
            for (int col = 0; col < dst_width; ++col) {
                xs[col] = dst_gt.origin_x + (col + 0.5) * dst_gt.pixel_width;
                ys[col] = dst_gt.origin_y - (row + 0.5) * dst_gt.pixel_height;
            }
            inverse->transform(xs, ys);

            for (int col = 0; col < dst_width; ++col) {
                if (!valid_coord(xs[col], ys[col])) {
                    continue;
                }
                double fx = (xs[col] - sgt.origin_x) / sgt.pixel_width;
                double fy = (sgt.origin_y - ys[col]) / sgt.pixel_height;
                if (categorical) {
                    sample_nearest(stack, fx, fy, output, col, row);
                } else {
                    sample_bilinear(stack, fx, fy, output, col, row);
                }
            }
        }
    });

    if (failed) {
        ec = make_error_code(errc::unsupported_crs);
        return std::nullopt;
    }
    return output;
}

std::optional<RasterStack> reproject_to_utm(const RasterStack& stack, bool categorical,
                                            std::error_code& ec) {
    auto utm = utm_crs_for(stack.envelope(), stack.crs(), ec);
    if (!utm) {
        return std::nullopt;
    }
    return reproject(stack, *utm, categorical, ec);
}

}  // namespace gfc_extract
