#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "raster_stack.hpp"

namespace gfc_extract {

enum class Compression {
    none,
    lzw,
    deflate,
};

// 出力ファイルの書き込み設定
struct WriteOptions {
    std::optional<std::filesystem::path> output_path;
    bool overwrite = false;
    Compression compression = Compression::lzw;
};

// 読み取り専用のGeoTIFFハンドル。TIFFハンドルはデストラクタで必ず閉じる
class GeoTiffReader {
   public:
    explicit GeoTiffReader(std::filesystem::path path);
    ~GeoTiffReader();

    GeoTiffReader(const GeoTiffReader&) = delete;
    GeoTiffReader& operator=(const GeoTiffReader&) = delete;
    GeoTiffReader(GeoTiffReader&&) noexcept;
    GeoTiffReader& operator=(GeoTiffReader&&) noexcept;

    [[nodiscard]] bool open(std::error_code& ec);

    int width() const;
    int height() const;
    int samples_per_pixel() const;
    const GeoTransform& transform() const;
    const std::string& crs() const;
    std::optional<double> file_nodata() const;
    const std::vector<std::string>& band_names() const;

    // ピクセル窓 [col0, col0+ncols) x [row0, row0+nrows) を読み込む
    // ファイル側のNoData値を持つピクセルは nodata に置き換える
    [[nodiscard]] std::optional<RasterStack> read_window(int col0, int row0, int ncols, int nrows,
                                                         float nodata, std::error_code& ec) const;

   private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

// ファイル全体を読み込む
[[nodiscard]] std::optional<RasterStack> read_geotiff(const std::filesystem::path& path,
                                                      float nodata, std::error_code& ec);

// タイル形式のGeoTIFFとして書き出す（UInt8またはFloat32、サンプル型はstackに従う）
[[nodiscard]] bool write_geotiff(const RasterStack& stack, const WriteOptions& options,
                                 std::error_code& ec);

}  // namespace gfc_extract
