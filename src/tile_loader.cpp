#include "tile_loader.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <mutex>

#include "console.hpp"
#include "errors.hpp"
#include "geotiff_io.hpp"

namespace gfc_extract {

namespace {

struct PixelWindow {
    int col0;
    int row0;
    int ncols;
    int nrows;
};

// 外接矩形を最も近いセル境界に合わせる（最低1ピクセル）
std::optional<PixelWindow> crop_window(const GeoTiffReader& reader, const Envelope& env) {
    const GeoTransform& gt = reader.transform();
    const Envelope extent{gt.origin_x, gt.origin_y - reader.height() * gt.pixel_height,
                          gt.origin_x + reader.width() * gt.pixel_width, gt.origin_y};
    if (!env.intersects(extent)) {
        return std::nullopt;
    }

    auto snap = [](double v, int limit) {
        return std::clamp(static_cast<int>(std::lround(v)), 0, limit);
    };
    int c0 = snap((env.min_x - gt.origin_x) / gt.pixel_width, reader.width());
    int c1 = snap((env.max_x - gt.origin_x) / gt.pixel_width, reader.width());
    int r0 = snap((gt.origin_y - env.max_y) / gt.pixel_height, reader.height());
    int r1 = snap((gt.origin_y - env.min_y) / gt.pixel_height, reader.height());

    if (c1 <= c0) {
        c0 = std::min(c0, reader.width() - 1);
        c1 = c0 + 1;
    }
    if (r1 <= r0) {
        r0 = std::min(r0, reader.height() - 1);
        r1 = r0 + 1;
    }
    return PixelWindow{c0, r0, c1 - c0, r1 - r0};
}

}  // namespace

std::optional<RasterStack> load_and_crop(const std::vector<std::filesystem::path>& paths,
                                         const AreaOfInterest& aoi, ProductVariant variant,
                                         std::error_code& ec) {
    const VariantInfo& info = variant_info(variant);

    if (paths.empty()) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return std::nullopt;
    }
    for (const auto& path : paths) {
        // フォルダを検索できない場合などはエラーコードをそのまま返す
        const bool exists = std::filesystem::exists(path, ec);
        if (ec) {
            return std::nullopt;
        }
        if (!exists) {
            std::lock_guard<std::mutex> lock(console_mutex());
            std::cerr << "タイルファイルが見つかりません: " << path << std::endl;
            ec = make_error_code(errc::missing_tile_file);
            return std::nullopt;
        }
    }

    std::optional<RasterStack> tile_stack;
    std::optional<PixelWindow> window;

    for (const auto& path : paths) {
        GeoTiffReader reader(path);
        if (!reader.open(ec)) {
            return std::nullopt;
        }

        if (!window) {
            // AOIをタイルのCRSに変換してから切り出し範囲を決める
            auto tile_aoi = aoi.transformed(reader.crs(), ec);
            if (!tile_aoi) {
                return std::nullopt;
            }
            window = crop_window(reader, tile_aoi->envelope());
            if (!window) {
                std::lock_guard<std::mutex> lock(console_mutex());
                std::cerr << "AOIがタイルと交差しません: " << path << std::endl;
                ec = make_error_code(errc::empty_result);
                return std::nullopt;
            }
        }

        auto part = reader.read_window(window->col0, window->row0, window->ncols, window->nrows,
                                       kNoDataValue, ec);
        if (!part) {
            std::lock_guard<std::mutex> lock(console_mutex());
            std::cerr << "読み込みに失敗しました: " << path << std::endl;
            return std::nullopt;
        }

        if (!tile_stack) {
            tile_stack = std::move(part);
            continue;
        }

        // 同じタイルの画像はすべて同じグリッドでなければならない
        if (part->width() != tile_stack->width() || part->height() != tile_stack->height() ||
            !(part->transform() == tile_stack->transform()) || part->crs() != tile_stack->crs()) {
            std::lock_guard<std::mutex> lock(console_mutex());
            std::cerr << "グリッドが一致しません: " << path << std::endl;
            ec = make_error_code(errc::invalid_raster);
            return std::nullopt;
        }
        for (size_t b = 0; b < part->band_count(); ++b) {
            if (!tile_stack->append_band(part->band_names()[b], std::move(part->band(b)))) {
                ec = make_error_code(errc::invalid_raster);
                return std::nullopt;
            }
        }
    }

    if (tile_stack->band_count() != info.band_names.size()) {
        std::lock_guard<std::mutex> lock(console_mutex());
        std::cerr << "バンド数が一致しません: " << tile_stack->band_count() << " (期待値 "
                  << info.band_names.size() << ")" << std::endl;
        ec = make_error_code(errc::band_count_mismatch);
        return std::nullopt;
    }
    tile_stack->set_band_names(info.band_names);

    return tile_stack;
}

}  // namespace gfc_extract
