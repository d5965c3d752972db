#include "tile_naming.hpp"

#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace gfc_extract {

std::string tile_suffix(const TileId& tile) {
    std::ostringstream oss;
    oss << '_' << std::setfill('0') << std::setw(2) << std::abs(tile.lat)
        << (tile.lat < 0 ? 'S' : 'N') << '_' << std::setw(3) << std::abs(tile.lon)
        << (tile.lon < 0 ? 'W' : 'E') << ".tif";
    return oss.str();
}

std::vector<std::filesystem::path> filenames_for(const TileId& tile, ProductVariant variant,
                                                 const std::string& dataset_version,
                                                 const std::filesystem::path& data_folder) {
    const std::string file_root = std::string(kFilePrefix) + "_" + dataset_version + "_";
    const std::string suffix = tile_suffix(tile);

    std::vector<std::filesystem::path> paths;
    for (const auto& image_name : variant_info(variant).image_names) {
        paths.push_back(data_folder / (file_root + image_name + suffix));
    }
    return paths;
}

}  // namespace gfc_extract
