#include "geometry.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <mutex>

#include "console.hpp"
#include "crs_transform.hpp"
#include "errors.hpp"

namespace gfc_extract {

namespace {

constexpr int kDensifySegments = 16;

void extend(Envelope& env, const Ring& ring) {
    for (const auto& p : ring) {
        env.min_x = std::min(env.min_x, p.x);
        env.min_y = std::min(env.min_y, p.y);
        env.max_x = std::max(env.max_x, p.x);
        env.max_y = std::max(env.max_y, p.y);
    }
}

bool transform_ring(const CrsTransformer& transformer, const Ring& ring, Ring& out) {
    Ring dense = densify(ring, kDensifySegments);
    std::vector<double> xs(dense.size());
    std::vector<double> ys(dense.size());
    for (size_t i = 0; i < dense.size(); ++i) {
        xs[i] = dense[i].x;
        ys[i] = dense[i].y;
    }
    transformer.transform(xs, ys);

    out.clear();
    out.reserve(dense.size());
    for (size_t i = 0; i < dense.size(); ++i) {
        if (xs[i] == HUGE_VAL || !std::isfinite(xs[i]) || !std::isfinite(ys[i])) {
            return false;
        }
        out.push_back({xs[i], ys[i]});
    }
    return true;
}

}  // namespace

AreaOfInterest::AreaOfInterest(std::vector<Polygon> polygons, std::string crs)
    : polygons_(std::move(polygons)), crs_(std::move(crs)) {}

AreaOfInterest AreaOfInterest::from_envelope(const Envelope& envelope, std::string crs) {
    Polygon poly;
    poly.exterior = {{envelope.min_x, envelope.min_y},
                     {envelope.max_x, envelope.min_y},
                     {envelope.max_x, envelope.max_y},
                     {envelope.min_x, envelope.max_y},
                     {envelope.min_x, envelope.min_y}};
    return AreaOfInterest({std::move(poly)}, std::move(crs));
}

bool AreaOfInterest::empty() const {
    return std::none_of(polygons_.begin(), polygons_.end(),
                        [](const Polygon& p) { return !p.exterior.empty(); });
}

Envelope AreaOfInterest::envelope() const {
    Envelope env{std::numeric_limits<double>::max(), std::numeric_limits<double>::max(),
                 std::numeric_limits<double>::lowest(), std::numeric_limits<double>::lowest()};
    // 外周リングだけで外接矩形は決まる
    for (const auto& poly : polygons_) {
        extend(env, poly.exterior);
    }
    return env;
}

std::optional<AreaOfInterest> AreaOfInterest::transformed(const std::string& dst_crs,
                                                          std::error_code& ec) const {
    auto transformer = CrsTransformer::create(crs_, dst_crs, ec);
    if (!transformer) {
        return std::nullopt;
    }
    if (transformer->is_identity()) {
        return AreaOfInterest(polygons_, dst_crs);
    }

    std::vector<Polygon> out;
    out.reserve(polygons_.size());
    for (const auto& poly : polygons_) {
        Polygon p;
        bool ok = transform_ring(*transformer, poly.exterior, p.exterior);
        for (const auto& hole : poly.holes) {
            Ring r;
            ok = ok && transform_ring(*transformer, hole, r);
            p.holes.push_back(std::move(r));
        }
        if (!ok) {
            std::lock_guard<std::mutex> lock(console_mutex());
            std::cerr << "AOIを " << dst_crs << " に変換できません" << std::endl;
            ec = make_error_code(errc::unsupported_crs);
            return std::nullopt;
        }
        out.push_back(std::move(p));
    }
    return AreaOfInterest(std::move(out), dst_crs);
}

std::optional<AreaOfInterest> normalize_aoi(const AreaOfInterest& aoi, std::error_code& ec) {
    if (aoi.empty()) {
        ec = make_error_code(errc::empty_result);
        return std::nullopt;
    }
    return aoi.transformed(kGeographicCrs, ec);
}

Ring densify(const Ring& ring, int segments_per_edge) {
    if (ring.size() < 2 || segments_per_edge <= 1) {
        return ring;
    }

    Ring out;
    out.reserve((ring.size() - 1) * segments_per_edge + 1);
    for (size_t i = 0; i + 1 < ring.size(); ++i) {
        const Point& a = ring[i];
        const Point& b = ring[i + 1];
        for (int s = 0; s < segments_per_edge; ++s) {
            double t = static_cast<double>(s) / segments_per_edge;
            out.push_back({a.x + (b.x - a.x) * t, a.y + (b.y - a.y) * t});
        }
    }
    out.push_back(ring.back());
    return out;
}

}  // namespace gfc_extract
