#include "raster_stack.hpp"

#include <algorithm>
#include <utility>

namespace gfc_extract {

RasterStack::RasterStack(int width, int height, GeoTransform transform, std::string crs,
                         std::vector<std::string> band_names, float nodata,
                         SampleType sample_type)
    : width_(width),
      height_(height),
      transform_(transform),
      crs_(std::move(crs)),
      band_names_(std::move(band_names)),
      nodata_(nodata),
      sample_type_(sample_type) {
    bands_.assign(band_names_.size(),
                  std::vector<float>(static_cast<size_t>(width_) * height_, nodata_));
}

bool RasterStack::append_band(std::string name, std::vector<float> data) {
    if (data.size() != pixel_count()) {
        return false;
    }
    band_names_.push_back(std::move(name));
    bands_.push_back(std::move(data));
    return true;
}

Envelope RasterStack::envelope() const {
    return {transform_.origin_x, transform_.origin_y - height_ * transform_.pixel_height,
            transform_.origin_x + width_ * transform_.pixel_width, transform_.origin_y};
}

bool RasterStack::is_consistent() const {
    if (width_ <= 0 || height_ <= 0 || bands_.empty() || bands_.size() != band_names_.size()) {
        return false;
    }
    if (!(transform_.pixel_width > 0.0) || !(transform_.pixel_height > 0.0)) {
        return false;
    }
    return std::all_of(bands_.begin(), bands_.end(),
                       [this](const std::vector<float>& b) { return b.size() == pixel_count(); });
}

bool RasterStack::operator==(const RasterStack& other) const {
    return width_ == other.width_ && height_ == other.height_ &&
           transform_ == other.transform_ && crs_ == other.crs_ &&
           band_names_ == other.band_names_ && nodata_ == other.nodata_ &&
           sample_type_ == other.sample_type_ && bands_ == other.bands_;
}

}  // namespace gfc_extract
