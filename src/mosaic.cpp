#include "mosaic.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>

#include "crs_transform.hpp"
#include "errors.hpp"

namespace gfc_extract {

namespace {

// 浮動小数点の丸め誤差で許容値ちょうどのずれが弾かれないようにする
constexpr double kToleranceSlack = 1e-9;

bool within(double fraction, double tolerance) {
    return fraction <= tolerance + kToleranceSlack;
}

// 基準グリッドに対する位置（ピクセル単位）を整数に丸める。ずれが大きすぎればnullopt
std::optional<long> grid_offset(double delta_pixels, double tolerance) {
    double nearest = std::round(delta_pixels);
    if (!within(std::abs(delta_pixels - nearest), tolerance)) {
        return std::nullopt;
    }
    return static_cast<long>(nearest);
}

}  // namespace

std::optional<RasterStack> mosaic(std::vector<RasterStack> stacks, const MosaicOptions& options,
                                  std::error_code& ec) {
    if (stacks.empty()) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return std::nullopt;
    }

    for (size_t i = 0; i < stacks.size(); ++i) {
        if (!stacks[i].is_consistent()) {
            std::cerr << "不正なラスターが含まれています (index " << i << ")" << std::endl;
            ec = make_error_code(errc::invalid_raster);
            return std::nullopt;
        }
    }

    if (stacks.size() == 1) {
        return std::move(stacks.front());
    }

    const RasterStack& ref = stacks.front();
    const GeoTransform& rgt = ref.transform();

    struct Placement {
        long col;
        long row;
    };
    std::vector<Placement> placements;
    placements.reserve(stacks.size());

    long min_col = std::numeric_limits<long>::max();
    long min_row = std::numeric_limits<long>::max();
    long max_col = std::numeric_limits<long>::lowest();
    long max_row = std::numeric_limits<long>::lowest();
    SampleType sample_type = ref.sample_type();

    for (size_t i = 0; i < stacks.size(); ++i) {
        const RasterStack& s = stacks[i];
        const GeoTransform& gt = s.transform();

        if (s.band_count() != ref.band_count()) {
            std::cerr << "バンド数が一致しません (index " << i << ")" << std::endl;
            ec = make_error_code(errc::band_count_mismatch);
            return std::nullopt;
        }
        if (s.band_names() != ref.band_names()) {
            std::cerr << "バンド名が一致しません (index " << i << ")" << std::endl;
            ec = make_error_code(errc::invalid_raster);
            return std::nullopt;
        }
        // 異なるCRSのグリッドは揃えようがない（表記違いの同一CRSは許容）
        if (!crs_equivalent(s.crs(), ref.crs(), ec)) {
            if (!ec) {
                std::cerr << "CRSが一致しません (index " << i << ")" << std::endl;
                ec = make_error_code(errc::grid_alignment);
            }
            return std::nullopt;
        }

        // 解像度と原点のずれをピクセル幅に対する割合で検査する
        double res_x = std::abs(gt.pixel_width - rgt.pixel_width) / rgt.pixel_width;
        double res_y = std::abs(gt.pixel_height - rgt.pixel_height) / rgt.pixel_height;
        auto col = grid_offset((gt.origin_x - rgt.origin_x) / rgt.pixel_width, options.tolerance);
        auto row = grid_offset((rgt.origin_y - gt.origin_y) / rgt.pixel_height, options.tolerance);
        if (!within(res_x, options.tolerance) || !within(res_y, options.tolerance) || !col ||
            !row) {
            std::cerr << "グリッドのずれが許容値 " << options.tolerance << " を超えています (index "
                      << i << ")" << std::endl;
            ec = make_error_code(errc::grid_alignment);
            return std::nullopt;
        }

        placements.push_back({*col, *row});
        min_col = std::min(min_col, *col);
        min_row = std::min(min_row, *row);
        max_col = std::max(max_col, *col + s.width());
        max_row = std::max(max_row, *row + s.height());
        if (s.sample_type() == SampleType::float32) {
            sample_type = SampleType::float32;
        }
    }

    const int out_width = static_cast<int>(max_col - min_col);
    const int out_height = static_cast<int>(max_row - min_row);

    GeoTransform out_gt = rgt;
    out_gt.origin_x = rgt.origin_x + min_col * rgt.pixel_width;
    out_gt.origin_y = rgt.origin_y - min_row * rgt.pixel_height;

    RasterStack output(out_width, out_height, out_gt, ref.crs(), ref.band_names(), ref.nodata(),
                       sample_type);

    std::cout << stacks.size() << " 個のタイルをマージ中: " << out_width << " x " << out_height
              << std::endl;

    // 重なりは寄与したタイル数によらない単純平均
    std::vector<double> sum(output.pixel_count());
    std::vector<int> count(output.pixel_count());

    for (size_t b = 0; b < output.band_count(); ++b) {
        std::fill(sum.begin(), sum.end(), 0.0);
        std::fill(count.begin(), count.end(), 0);

        for (size_t i = 0; i < stacks.size(); ++i) {
            const RasterStack& src = stacks[i];
            const long dst_col_start = placements[i].col - min_col;
            const long dst_row_start = placements[i].row - min_row;

            for (int row = 0; row < src.height(); ++row) {
                for (int col = 0; col < src.width(); ++col) {
                    float value = src.at(b, col, row);
                    if (src.is_nodata(value)) {
                        continue;
                    }
                    size_t dst = static_cast<size_t>(dst_row_start + row) * out_width +
                                 static_cast<size_t>(dst_col_start + col);
                    sum[dst] += value;
                    ++count[dst];
                }
            }
        }

        std::vector<float>& band = output.band(b);
        for (size_t p = 0; p < band.size(); ++p) {
            if (count[p] > 0) {
                band[p] = static_cast<float>(sum[p] / count[p]);
            }
        }
    }

    return output;
}

}  // namespace gfc_extract
