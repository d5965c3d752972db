#include "geotiff_io.hpp"

#include <geo_normalize.h>
#include <geo_tiffp.h>
#include <geotiff.h>
#include <geotiffio.h>
#include <tiffio.h>
#include <xtiffio.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <limits>
#include <mutex>
#include <sstream>
#include <utility>
#include <vector>

#include "console.hpp"
#include "crs_transform.hpp"
#include "errors.hpp"

namespace gfc_extract {

// GDAL互換のメタデータ (42112) とNODATA (42113) タグを libtiff に登録
#ifndef TIFFTAG_GDAL_METADATA
#define TIFFTAG_GDAL_METADATA 42112
#endif
#ifndef TIFFTAG_GDAL_NODATA
#define TIFFTAG_GDAL_NODATA 42113
#endif

namespace {

const TIFFFieldInfo gdal_field_info[] = {
    {TIFFTAG_GDAL_METADATA, -1, -1, TIFF_ASCII, FIELD_CUSTOM, TRUE, FALSE,
     const_cast<char*>("GDALMetadata")},
    {TIFFTAG_GDAL_NODATA, -1, -1, TIFF_ASCII, FIELD_CUSTOM, TRUE, FALSE,
     const_cast<char*>("GDALNoDataValue")}};

TIFFExtendProc parent_extender = nullptr;

void gdal_tiff_extender(TIFF* tif) {
    TIFFMergeFieldInfo(tif, gdal_field_info,
                       sizeof(gdal_field_info) / sizeof(gdal_field_info[0]));
    if (parent_extender) {
        (*parent_extender)(tif);
    }
}

void register_gdal_tags() {
    // 複数のワーカースレッドから同時に呼ばれても一度だけ登録する
    static std::once_flag once;
    std::call_once(once, [] { parent_extender = TIFFSetTagExtender(gdal_tiff_extender); });
}

struct TiffCloser {
    void operator()(TIFF* tif) const noexcept { XTIFFClose(tif); }
};
using TiffPtr = std::unique_ptr<TIFF, TiffCloser>;

struct GtifDeleter {
    void operator()(GTIF* gtif) const noexcept { GTIFFree(gtif); }
};
using GtifPtr = std::unique_ptr<GTIF, GtifDeleter>;

constexpr uint32_t kTileWidth = 256;
constexpr uint32_t kTileHeight = 256;

float decode_sample(const unsigned char* buf, size_t index, uint16_t bps, uint16_t format) {
    switch (bps) {
        case 8:
            return static_cast<float>(buf[index]);
        case 16:
            if (format == SAMPLEFORMAT_INT) {
                int16_t v;
                std::memcpy(&v, buf + index * 2, sizeof(v));
                return static_cast<float>(v);
            } else {
                uint16_t v;
                std::memcpy(&v, buf + index * 2, sizeof(v));
                return static_cast<float>(v);
            }
        default: {
            float v;
            std::memcpy(&v, buf + index * 4, sizeof(v));
            return v;
        }
    }
}

// <Item name="DESCRIPTION" sample="N" role="description">名前</Item> からバンド名を取り出す
std::vector<std::string> parse_band_descriptions(const std::string& xml, size_t band_count) {
    std::vector<std::string> names(band_count);
    size_t pos = 0;
    while ((pos = xml.find("<Item", pos)) != std::string::npos) {
        size_t tag_end = xml.find('>', pos);
        size_t close = xml.find("</Item>", pos);
        if (tag_end == std::string::npos || close == std::string::npos || close < tag_end) {
            break;
        }
        std::string attrs = xml.substr(pos, tag_end - pos);
        pos = close + 7;

        if (attrs.find("role=\"description\"") == std::string::npos) {
            continue;
        }
        size_t s = attrs.find("sample=\"");
        if (s == std::string::npos) {
            continue;
        }
        size_t sample = static_cast<size_t>(std::atoi(attrs.c_str() + s + 8));
        if (sample < band_count) {
            names[sample] = xml.substr(tag_end + 1, close - tag_end - 1);
        }
    }
    return names;
}

std::string build_band_descriptions(const std::vector<std::string>& names) {
    std::ostringstream oss;
    oss << "<GDALMetadata>\n";
    for (size_t i = 0; i < names.size(); ++i) {
        oss << "  <Item name=\"DESCRIPTION\" sample=\"" << i << "\" role=\"description\">"
            << names[i] << "</Item>\n";
    }
    oss << "</GDALMetadata>\n";
    return oss.str();
}

// NoDataで初期化したタイルバッファに値を詰めて書き込む
template <typename T, typename Encode>
bool write_tiles(TIFF* tif, const RasterStack& stack, T disk_nodata, Encode encode) {
    const size_t spp = stack.band_count();
    const uint32_t width = static_cast<uint32_t>(stack.width());
    const uint32_t height = static_cast<uint32_t>(stack.height());
    std::vector<T> tile_buffer(static_cast<size_t>(kTileWidth) * kTileHeight * spp);

    for (uint32_t ty = 0; ty < height; ty += kTileHeight) {
        for (uint32_t tx = 0; tx < width; tx += kTileWidth) {
            std::fill(tile_buffer.begin(), tile_buffer.end(), disk_nodata);

            uint32_t actual_tile_width = std::min(kTileWidth, width - tx);
            uint32_t actual_tile_height = std::min(kTileHeight, height - ty);

            for (uint32_t row = 0; row < actual_tile_height; ++row) {
                for (uint32_t col = 0; col < actual_tile_width; ++col) {
                    size_t dst_idx = (static_cast<size_t>(row) * kTileWidth + col) * spp;
                    for (size_t b = 0; b < spp; ++b) {
                        float value = stack.at(b, static_cast<int>(tx + col),
                                               static_cast<int>(ty + row));
                        tile_buffer[dst_idx + b] =
                            stack.is_nodata(value) ? disk_nodata : encode(value);
                    }
                }
            }

            if (TIFFWriteTile(tif, tile_buffer.data(), tx, ty, 0, 0) < 0) {
                return false;
            }
        }
    }
    return true;
}

}  // namespace

class GeoTiffReader::Impl {
   public:
    explicit Impl(std::filesystem::path p) : path(std::move(p)) {}

    std::filesystem::path path;
    TiffPtr tif;
    uint32_t width = 0;
    uint32_t height = 0;
    uint16_t spp = 1;
    uint16_t bps = 8;
    uint16_t sample_format = SAMPLEFORMAT_UINT;
    uint16_t planar = PLANARCONFIG_CONTIG;
    GeoTransform transform;
    std::string crs;
    std::optional<double> nodata;
    std::vector<std::string> band_names;

    bool read_georeference(std::error_code& ec);
    float value_at(const unsigned char* buf, size_t index, float nodata_value) const {
        float v = decode_sample(buf, index, bps, sample_format);
        if (nodata && v == static_cast<float>(*nodata)) {
            return nodata_value;
        }
        return v;
    }
};

bool GeoTiffReader::Impl::read_georeference(std::error_code& ec) {
    GtifPtr gtif(GTIFNew(tif.get()));
    if (!gtif) {
        ec = std::make_error_code(std::errc::io_error);
        return false;
    }

    unsigned short model_type = 0;
    unsigned short raster_type = RasterPixelIsArea;
    unsigned short code = 0;
    GTIFKeyGet(gtif.get(), GTModelTypeGeoKey, &model_type, 0, 1);
    GTIFKeyGet(gtif.get(), GTRasterTypeGeoKey, &raster_type, 0, 1);

    if (model_type == ModelTypeGeographic &&
        GTIFKeyGet(gtif.get(), GeographicTypeGeoKey, &code, 0, 1)) {
        crs = "EPSG:" + std::to_string(code);
    } else if (model_type == ModelTypeProjected &&
               GTIFKeyGet(gtif.get(), ProjectedCSTypeGeoKey, &code, 0, 1)) {
        crs = "EPSG:" + std::to_string(code);
    } else {
        std::lock_guard<std::mutex> lock(console_mutex());
        std::cerr << "EPSGコードを持たないGeoTIFFです: " << path << std::endl;
        ec = make_error_code(errc::unsupported_crs);
        return false;
    }

    // PixelScaleとTiepointを読み込み
    double* pixel_scale = nullptr;
    double* tiepoints = nullptr;
    uint16_t count = 0;

    if (!TIFFGetField(tif.get(), GTIFF_PIXELSCALE, &count, &pixel_scale) || count < 2) {
        ec = make_error_code(errc::invalid_raster);
        return false;
    }
    transform.pixel_width = pixel_scale[0];
    transform.pixel_height = pixel_scale[1];

    if (!TIFFGetField(tif.get(), GTIFF_TIEPOINTS, &count, &tiepoints) || count < 6) {
        ec = make_error_code(errc::invalid_raster);
        return false;
    }
    // タイポイント (I, J) -> (X, Y) から左上隅を求める
    transform.origin_x = tiepoints[3] - tiepoints[0] * transform.pixel_width;
    transform.origin_y = tiepoints[4] + tiepoints[1] * transform.pixel_height;
    if (raster_type == RasterPixelIsPoint) {
        transform.origin_x -= transform.pixel_width / 2.0;
        transform.origin_y += transform.pixel_height / 2.0;
    }
    return true;
}

GeoTiffReader::GeoTiffReader(std::filesystem::path path)
    : pImpl(std::make_unique<Impl>(std::move(path))) {}

GeoTiffReader::~GeoTiffReader() = default;

GeoTiffReader::GeoTiffReader(GeoTiffReader&&) noexcept = default;
GeoTiffReader& GeoTiffReader::operator=(GeoTiffReader&&) noexcept = default;

bool GeoTiffReader::open(std::error_code& ec) {
    register_gdal_tags();

    pImpl->tif.reset(XTIFFOpen(pImpl->path.string().c_str(), "r"));
    if (!pImpl->tif) {
        std::lock_guard<std::mutex> lock(console_mutex());
        std::cerr << "ファイルを開けませんでした: " << pImpl->path << std::endl;
        ec = std::make_error_code(std::errc::io_error);
        return false;
    }
    TIFF* tif = pImpl->tif.get();

    TIFFGetField(tif, TIFFTAG_IMAGEWIDTH, &pImpl->width);
    TIFFGetField(tif, TIFFTAG_IMAGELENGTH, &pImpl->height);
    TIFFGetFieldDefaulted(tif, TIFFTAG_SAMPLESPERPIXEL, &pImpl->spp);
    TIFFGetFieldDefaulted(tif, TIFFTAG_BITSPERSAMPLE, &pImpl->bps);
    TIFFGetFieldDefaulted(tif, TIFFTAG_SAMPLEFORMAT, &pImpl->sample_format);
    TIFFGetFieldDefaulted(tif, TIFFTAG_PLANARCONFIG, &pImpl->planar);

    bool supported = (pImpl->bps == 8 && pImpl->sample_format == SAMPLEFORMAT_UINT) ||
                     (pImpl->bps == 16 && (pImpl->sample_format == SAMPLEFORMAT_UINT ||
                                           pImpl->sample_format == SAMPLEFORMAT_INT)) ||
                     (pImpl->bps == 32 && pImpl->sample_format == SAMPLEFORMAT_IEEEFP);
    if (!supported || pImpl->width == 0 || pImpl->height == 0 || pImpl->spp == 0) {
        std::lock_guard<std::mutex> lock(console_mutex());
        std::cerr << "対応していないサンプル形式です: " << pImpl->path << std::endl;
        ec = std::make_error_code(std::errc::not_supported);
        return false;
    }

    if (!pImpl->read_georeference(ec)) {
        return false;
    }

    // NODATA値を読み込み
    char* nodata_str = nullptr;
    if (TIFFGetField(tif, TIFFTAG_GDAL_NODATA, &nodata_str) && nodata_str) {
        pImpl->nodata = std::atof(nodata_str);
    }

    char* metadata_str = nullptr;
    if (TIFFGetField(tif, TIFFTAG_GDAL_METADATA, &metadata_str) && metadata_str) {
        pImpl->band_names = parse_band_descriptions(metadata_str, pImpl->spp);
    } else {
        pImpl->band_names.assign(pImpl->spp, std::string());
    }
    for (size_t i = 0; i < pImpl->band_names.size(); ++i) {
        if (pImpl->band_names[i].empty()) {
            pImpl->band_names[i] = "band" + std::to_string(i + 1);
        }
    }

    return true;
}

int GeoTiffReader::width() const { return static_cast<int>(pImpl->width); }
int GeoTiffReader::height() const { return static_cast<int>(pImpl->height); }
int GeoTiffReader::samples_per_pixel() const { return pImpl->spp; }
const GeoTransform& GeoTiffReader::transform() const { return pImpl->transform; }
const std::string& GeoTiffReader::crs() const { return pImpl->crs; }
std::optional<double> GeoTiffReader::file_nodata() const { return pImpl->nodata; }
const std::vector<std::string>& GeoTiffReader::band_names() const { return pImpl->band_names; }

std::optional<RasterStack> GeoTiffReader::read_window(int col0, int row0, int ncols, int nrows,
                                                      float nodata, std::error_code& ec) const {
    if (!pImpl->tif) {
        ec = std::make_error_code(std::errc::bad_file_descriptor);
        return std::nullopt;
    }
    if (col0 < 0 || row0 < 0 || ncols <= 0 || nrows <= 0 || col0 + ncols > width() ||
        row0 + nrows > height()) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return std::nullopt;
    }

    TIFF* tif = pImpl->tif.get();
    const Impl& im = *pImpl;
    const bool contig = im.planar == PLANARCONFIG_CONTIG;
    const uint16_t planes = contig ? 1 : im.spp;
    const uint16_t per_pixel = contig ? im.spp : 1;

    GeoTransform window = im.transform;
    window.origin_x += col0 * im.transform.pixel_width;
    window.origin_y -= row0 * im.transform.pixel_height;

    SampleType type = im.bps == 8 ? SampleType::uint8 : SampleType::float32;
    RasterStack out(ncols, nrows, window, im.crs, im.band_names, nodata, type);

    if (TIFFIsTiled(tif)) {
        uint32_t tile_width = 0;
        uint32_t tile_height = 0;
        TIFFGetField(tif, TIFFTAG_TILEWIDTH, &tile_width);
        TIFFGetField(tif, TIFFTAG_TILELENGTH, &tile_height);
        std::vector<unsigned char> tile_buffer(static_cast<size_t>(TIFFTileSize(tif)));

        const uint32_t c_end = static_cast<uint32_t>(col0 + ncols);
        const uint32_t r_end = static_cast<uint32_t>(row0 + nrows);

        for (uint16_t plane = 0; plane < planes; ++plane) {
            for (uint32_t ty = (row0 / tile_height) * tile_height; ty < r_end; ty += tile_height) {
                for (uint32_t tx = (col0 / tile_width) * tile_width; tx < c_end;
                     tx += tile_width) {
                    if (TIFFReadTile(tif, tile_buffer.data(), tx, ty, 0, plane) < 0) {
                        ec = std::make_error_code(std::errc::io_error);
                        return std::nullopt;
                    }

                    uint32_t r0 = std::max(ty, static_cast<uint32_t>(row0));
                    uint32_t r1 = std::min(ty + tile_height, r_end);
                    uint32_t cc0 = std::max(tx, static_cast<uint32_t>(col0));
                    uint32_t cc1 = std::min(tx + tile_width, c_end);

                    for (uint32_t r = r0; r < r1; ++r) {
                        for (uint32_t c = cc0; c < cc1; ++c) {
                            size_t base =
                                (static_cast<size_t>(r - ty) * tile_width + (c - tx)) * per_pixel;
                            for (uint16_t s = 0; s < per_pixel; ++s) {
                                size_t b = contig ? s : plane;
                                out.at(b, static_cast<int>(c) - col0, static_cast<int>(r) - row0) =
                                    im.value_at(tile_buffer.data(), base + s, nodata);
                            }
                        }
                    }
                }
            }
        }
    } else {
        // ストリップ形式
        std::vector<unsigned char> line(static_cast<size_t>(TIFFScanlineSize(tif)));

        for (uint16_t plane = 0; plane < planes; ++plane) {
            for (int row = row0; row < row0 + nrows; ++row) {
                if (TIFFReadScanline(tif, line.data(), static_cast<uint32_t>(row), plane) < 0) {
                    ec = std::make_error_code(std::errc::io_error);
                    return std::nullopt;
                }
                for (int col = 0; col < ncols; ++col) {
                    size_t base = static_cast<size_t>(col0 + col) * per_pixel;
                    for (uint16_t s = 0; s < per_pixel; ++s) {
                        size_t b = contig ? s : plane;
                        out.at(b, col, row - row0) = im.value_at(line.data(), base + s, nodata);
                    }
                }
            }
        }
    }

    return out;
}

std::optional<RasterStack> read_geotiff(const std::filesystem::path& path, float nodata,
                                        std::error_code& ec) {
    GeoTiffReader reader(path);
    if (!reader.open(ec)) {
        return std::nullopt;
    }
    return reader.read_window(0, 0, reader.width(), reader.height(), nodata, ec);
}

bool write_geotiff(const RasterStack& stack, const WriteOptions& options, std::error_code& ec) {
    register_gdal_tags();

    if (!options.output_path) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }
    const std::filesystem::path& output_path = *options.output_path;

    if (!stack.is_consistent()) {
        ec = make_error_code(errc::invalid_raster);
        return false;
    }
    const bool exists = std::filesystem::exists(output_path, ec);
    if (ec) {
        return false;
    }
    if (exists && !options.overwrite) {
        std::cerr << "出力ファイルが既に存在します: " << output_path << std::endl;
        ec = make_error_code(errc::output_exists);
        return false;
    }

    auto crs_info = describe_crs(stack.crs(), ec);
    if (!crs_info) {
        return false;
    }

    // 出力ディレクトリが存在しない場合は作成
    if (output_path.has_parent_path()) {
        std::filesystem::create_directories(output_path.parent_path(), ec);
        if (ec) {
            return false;
        }
    }

    TiffPtr tif(XTIFFOpen(output_path.string().c_str(), "w"));
    if (!tif) {
        ec = std::make_error_code(std::errc::io_error);
        return false;
    }

    const bool is_byte = stack.sample_type() == SampleType::uint8;
    const uint16_t spp = static_cast<uint16_t>(stack.band_count());

    // 基本TIFFタグを設定
    TIFFSetField(tif.get(), TIFFTAG_IMAGEWIDTH, static_cast<uint32_t>(stack.width()));
    TIFFSetField(tif.get(), TIFFTAG_IMAGELENGTH, static_cast<uint32_t>(stack.height()));
    TIFFSetField(tif.get(), TIFFTAG_SAMPLESPERPIXEL, spp);
    TIFFSetField(tif.get(), TIFFTAG_BITSPERSAMPLE, is_byte ? 8 : 32);
    TIFFSetField(tif.get(), TIFFTAG_SAMPLEFORMAT, is_byte ? SAMPLEFORMAT_UINT : SAMPLEFORMAT_IEEEFP);
    TIFFSetField(tif.get(), TIFFTAG_PHOTOMETRIC, PHOTOMETRIC_MINISBLACK);
    TIFFSetField(tif.get(), TIFFTAG_PLANARCONFIG, PLANARCONFIG_CONTIG);
    if (spp > 1) {
        std::vector<uint16_t> extra(spp - 1, EXTRASAMPLE_UNSPECIFIED);
        TIFFSetField(tif.get(), TIFFTAG_EXTRASAMPLES, static_cast<uint16_t>(extra.size()),
                     extra.data());
    }

    // タイル形式で圧縮
    TIFFSetField(tif.get(), TIFFTAG_TILEWIDTH, kTileWidth);
    TIFFSetField(tif.get(), TIFFTAG_TILELENGTH, kTileHeight);
    switch (options.compression) {
        case Compression::none:
            TIFFSetField(tif.get(), TIFFTAG_COMPRESSION, COMPRESSION_NONE);
            break;
        case Compression::lzw:
            TIFFSetField(tif.get(), TIFFTAG_COMPRESSION, COMPRESSION_LZW);
            break;
        case Compression::deflate:
            TIFFSetField(tif.get(), TIFFTAG_COMPRESSION, COMPRESSION_ADOBE_DEFLATE);
            break;
    }

    {
        GtifPtr gtif(GTIFNew(tif.get()));
        if (!gtif) {
            ec = std::make_error_code(std::errc::io_error);
            return false;
        }

        const GeoTransform& gt = stack.transform();

        // ModelPixelScaleTag: [ScaleX, ScaleY, ScaleZ]
        double pixel_scale[3] = {gt.pixel_width, gt.pixel_height, 0.0};
        TIFFSetField(tif.get(), GTIFF_PIXELSCALE, 3, pixel_scale);

        // ModelTiepointTag: [I, J, K, X, Y, Z]
        double tiepoint[6] = {0.0, 0.0, 0.0, gt.origin_x, gt.origin_y, 0.0};
        TIFFSetField(tif.get(), GTIFF_TIEPOINTS, 6, tiepoint);

        GTIFKeySet(gtif.get(), GTRasterTypeGeoKey, TYPE_SHORT, 1, RasterPixelIsArea);
        if (crs_info->geographic) {
            GTIFKeySet(gtif.get(), GTModelTypeGeoKey, TYPE_SHORT, 1, ModelTypeGeographic);
            GTIFKeySet(gtif.get(), GeographicTypeGeoKey, TYPE_SHORT, 1, crs_info->epsg);
        } else {
            GTIFKeySet(gtif.get(), GTModelTypeGeoKey, TYPE_SHORT, 1, ModelTypeProjected);
            GTIFKeySet(gtif.get(), ProjectedCSTypeGeoKey, TYPE_SHORT, 1, crs_info->epsg);
        }
        GTIFWriteKeys(gtif.get());
    }

    // UInt8では0..255の範囲外のNoData値（-1など）を255として格納する
    const float nodata = stack.nodata();
    std::string nodata_str;
    bool ok = false;
    if (is_byte) {
        const uint8_t disk_nodata =
            (nodata >= 0.0f && nodata <= 255.0f) ? static_cast<uint8_t>(nodata) : 255;
        nodata_str = std::to_string(disk_nodata);
        TIFFSetField(tif.get(), TIFFTAG_GDAL_NODATA, nodata_str.c_str());
        TIFFSetField(tif.get(), TIFFTAG_GDAL_METADATA,
                     build_band_descriptions(stack.band_names()).c_str());
        ok = write_tiles<uint8_t>(tif.get(), stack, disk_nodata, [](float v) {
            return static_cast<uint8_t>(std::clamp(std::lround(v), 0L, 255L));
        });
    } else {
        std::ostringstream oss;
        oss << std::setprecision(std::numeric_limits<float>::max_digits10) << nodata;
        nodata_str = oss.str();
        TIFFSetField(tif.get(), TIFFTAG_GDAL_NODATA, nodata_str.c_str());
        TIFFSetField(tif.get(), TIFFTAG_GDAL_METADATA,
                     build_band_descriptions(stack.band_names()).c_str());
        ok = write_tiles<float>(tif.get(), stack, nodata, [](float v) { return v; });
    }

    if (!ok) {
        ec = std::make_error_code(std::errc::io_error);
        return false;
    }
    tif.reset();

    std::cout << "GeoTIFFを作成しました: " << output_path << std::endl;

    return true;
}

}  // namespace gfc_extract
