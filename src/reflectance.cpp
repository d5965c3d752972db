#include "reflectance.hpp"

#include <iostream>

#include "errors.hpp"

namespace gfc_extract {

namespace {

template <typename Func>
std::optional<RasterStack> apply_per_band(const RasterStack& stack, SampleType type, Func func,
                                          std::error_code& ec) {
    if (stack.band_count() != kReflectanceScaleFactors.size()) {
        std::cerr << "入力画像は4バンドである必要があります (" << stack.band_count() << " バンド)"
                  << std::endl;
        ec = make_error_code(errc::band_count_mismatch);
        return std::nullopt;
    }
    if (!stack.is_consistent()) {
        ec = make_error_code(errc::invalid_raster);
        return std::nullopt;
    }

    RasterStack output = stack;
    output.set_sample_type(type);
    for (size_t b = 0; b < output.band_count(); ++b) {
        const double factor = kReflectanceScaleFactors[b];
        for (float& v : output.band(b)) {
            if (!output.is_nodata(v)) {
                v = func(v, factor);
            }
        }
    }
    return output;
}

}  // namespace

std::optional<RasterStack> rescale_reflectance(const RasterStack& stack, std::error_code& ec) {
    return apply_per_band(
        stack, SampleType::float32,
        [](float raw, double factor) { return static_cast<float>((raw - 1.0) / factor); }, ec);
}

std::optional<RasterStack> unscale_reflectance(const RasterStack& stack, std::error_code& ec) {
    return apply_per_band(
        stack, SampleType::uint8,
        [](float value, double factor) { return static_cast<float>(value * factor + 1.0); }, ec);
}

}  // namespace gfc_extract
