#include "errors.hpp"

namespace gfc_extract {

namespace {

class GfcCategory : public std::error_category {
   public:
    const char* name() const noexcept override { return "gfc_extract"; }

    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
            case errc::empty_result:
                return "AOI does not intersect the dataset coverage";
            case errc::missing_tile_file:
                return "expected tile file is missing";
            case errc::band_count_mismatch:
                return "band count does not match the product variant";
            case errc::grid_alignment:
                return "tile grids are misaligned beyond the mosaic tolerance";
            case errc::unsupported_crs:
                return "coordinate reference system is unsupported or undeterminable";
            case errc::unsupported_variant:
                return "stack must be \"change\", \"first\" or \"last\"";
            case errc::invalid_raster:
                return "raster is malformed or inconsistent";
            case errc::output_exists:
                return "output file exists and overwrite is disabled";
        }
        return "unknown gfc_extract error";
    }
};

}  // namespace

const std::error_category& gfc_category() noexcept {
    static const GfcCategory category;
    return category;
}

std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), gfc_category()};
}

}  // namespace gfc_extract
