#include <geo_tiffp.h>
#include <geotiffio.h>
#include <gtest/gtest.h>
#include <tiffio.h>
#include <xtiffio.h>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include "errors.hpp"
#include "geotiff_io.hpp"
#include "test_helpers.hpp"

using namespace gfc_extract;
using gfc_extract::testing::make_stack;
using gfc_extract::testing::TempDir;

namespace {

RasterStack numbered_stack() {
    RasterStack stack = make_stack(300, 5, -20.0, 10.0, 0.00025, 0.0f,
                                   {"treecover2000", "lossyear", "gain", "datamask"});
    for (size_t b = 0; b < 4; ++b) {
        for (int row = 0; row < 5; ++row) {
            for (int col = 0; col < 300; ++col) {
                stack.at(b, col, row) = static_cast<float>((col + row + b) % 200);
            }
        }
    }
    stack.at(1, 7, 2) = stack.nodata();
    return stack;
}

uint8_t striped_value(size_t band, int col, int row) {
    return static_cast<uint8_t>(band * 80 + row * 7 + col);
}

// libtiffで直接ストリップ形式のUInt8 GeoTIFFを書く（LZW圧縮、NODATAタグなし）
void write_striped_tiff(const std::filesystem::path& path, int width, int height, uint16_t spp,
                        uint16_t planar, uint32_t rows_per_strip, double origin_x,
                        double origin_y, double pixel_size) {
    TIFF* tif = XTIFFOpen(path.string().c_str(), "w");
    ASSERT_NE(tif, nullptr);

    TIFFSetField(tif, TIFFTAG_IMAGEWIDTH, static_cast<uint32_t>(width));
    TIFFSetField(tif, TIFFTAG_IMAGELENGTH, static_cast<uint32_t>(height));
    TIFFSetField(tif, TIFFTAG_SAMPLESPERPIXEL, spp);
    TIFFSetField(tif, TIFFTAG_BITSPERSAMPLE, 8);
    TIFFSetField(tif, TIFFTAG_SAMPLEFORMAT, SAMPLEFORMAT_UINT);
    TIFFSetField(tif, TIFFTAG_PHOTOMETRIC, PHOTOMETRIC_MINISBLACK);
    TIFFSetField(tif, TIFFTAG_PLANARCONFIG, planar);
    if (spp > 1) {
        std::vector<uint16_t> extra(spp - 1, EXTRASAMPLE_UNSPECIFIED);
        TIFFSetField(tif, TIFFTAG_EXTRASAMPLES, static_cast<uint16_t>(extra.size()), extra.data());
    }
    TIFFSetField(tif, TIFFTAG_COMPRESSION, COMPRESSION_LZW);
    TIFFSetField(tif, TIFFTAG_ROWSPERSTRIP, rows_per_strip);

    double pixel_scale[3] = {pixel_size, pixel_size, 0.0};
    TIFFSetField(tif, GTIFF_PIXELSCALE, 3, pixel_scale);
    double tiepoint[6] = {0.0, 0.0, 0.0, origin_x, origin_y, 0.0};
    TIFFSetField(tif, GTIFF_TIEPOINTS, 6, tiepoint);

    GTIF* gtif = GTIFNew(tif);
    ASSERT_NE(gtif, nullptr);
    GTIFKeySet(gtif, GTModelTypeGeoKey, TYPE_SHORT, 1, ModelTypeGeographic);
    GTIFKeySet(gtif, GTRasterTypeGeoKey, TYPE_SHORT, 1, RasterPixelIsArea);
    GTIFKeySet(gtif, GeographicTypeGeoKey, TYPE_SHORT, 1, 4326);
    GTIFWriteKeys(gtif);
    GTIFFree(gtif);

    const bool contig = planar == PLANARCONFIG_CONTIG;
    std::vector<uint8_t> line(static_cast<size_t>(width) * (contig ? spp : 1));
    for (uint16_t plane = 0; plane < (contig ? 1 : spp); ++plane) {
        for (int row = 0; row < height; ++row) {
            for (int col = 0; col < width; ++col) {
                if (contig) {
                    for (uint16_t b = 0; b < spp; ++b) {
                        line[static_cast<size_t>(col) * spp + b] = striped_value(b, col, row);
                    }
                } else {
                    line[col] = striped_value(plane, col, row);
                }
            }
            ASSERT_GE(TIFFWriteScanline(tif, line.data(), static_cast<uint32_t>(row), plane), 0);
        }
    }
    XTIFFClose(tif);
}

}  // namespace

TEST(GeoTiffIo, ByteProductRoundTrip) {
    TempDir dir;
    const RasterStack stack = numbered_stack();

    WriteOptions options;
    options.output_path = dir.path() / "change.tif";
    std::error_code ec;
    ASSERT_TRUE(write_geotiff(stack, options, ec)) << ec.message();

    auto read = read_geotiff(*options.output_path, -1.0f, ec);
    ASSERT_TRUE(read) << ec.message();
    EXPECT_TRUE(*read == stack);
}

TEST(GeoTiffIo, ByteNoDataIsStoredAs255) {
    TempDir dir;
    WriteOptions options;
    options.output_path = dir.path() / "nodata.tif";
    std::error_code ec;
    ASSERT_TRUE(write_geotiff(numbered_stack(), options, ec)) << ec.message();

    GeoTiffReader reader(*options.output_path);
    ASSERT_TRUE(reader.open(ec)) << ec.message();
    ASSERT_TRUE(reader.file_nodata().has_value());
    EXPECT_DOUBLE_EQ(*reader.file_nodata(), 255.0);
    EXPECT_EQ(reader.crs(), "EPSG:4326");
    EXPECT_EQ(reader.samples_per_pixel(), 4);
    EXPECT_EQ(reader.band_names()[3], "datamask");
}

TEST(GeoTiffIo, FloatProductKeepsFractionalValues) {
    TempDir dir;
    RasterStack projected(3, 2, GeoTransform{500000.0, 30.0, 200000.0, 30.0}, "EPSG:32632",
                          {"Band3"}, -1.0f, SampleType::float32);
    std::fill(projected.band(0).begin(), projected.band(0).end(), 0.125f);
    projected.at(0, 2, 1) = projected.nodata();
    projected.at(0, 0, 0) = -0.0019685f;

    WriteOptions options;
    options.output_path = dir.path() / "float.tif";
    options.compression = Compression::deflate;
    std::error_code ec;
    ASSERT_TRUE(write_geotiff(projected, options, ec)) << ec.message();

    auto read = read_geotiff(*options.output_path, -1.0f, ec);
    ASSERT_TRUE(read) << ec.message();
    EXPECT_TRUE(*read == projected);
}

TEST(GeoTiffIo, WindowReadMatchesFullRead) {
    TempDir dir;
    const RasterStack stack = numbered_stack();
    WriteOptions options;
    options.output_path = dir.path() / "window.tif";
    options.compression = Compression::none;
    std::error_code ec;
    ASSERT_TRUE(write_geotiff(stack, options, ec)) << ec.message();

    GeoTiffReader reader(*options.output_path);
    ASSERT_TRUE(reader.open(ec)) << ec.message();
    auto window = reader.read_window(250, 1, 40, 3, -1.0f, ec);
    ASSERT_TRUE(window) << ec.message();

    EXPECT_EQ(window->width(), 40);
    EXPECT_EQ(window->height(), 3);
    EXPECT_DOUBLE_EQ(window->transform().origin_x, -20.0 + 250 * 0.00025);
    EXPECT_DOUBLE_EQ(window->transform().origin_y, 10.0 - 1 * 0.00025);
    for (size_t b = 0; b < 4; ++b) {
        for (int row = 0; row < 3; ++row) {
            for (int col = 0; col < 40; ++col) {
                EXPECT_EQ(window->at(b, col, row), stack.at(b, col + 250, row + 1));
            }
        }
    }

    EXPECT_FALSE(reader.read_window(290, 0, 20, 1, -1.0f, ec).has_value());
    EXPECT_TRUE(ec == std::errc::invalid_argument);
}

TEST(GeoTiffIo, RefusesToOverwriteWithoutPermission) {
    TempDir dir;
    WriteOptions options;
    options.output_path = dir.path() / "out.tif";
    std::error_code ec;
    ASSERT_TRUE(write_geotiff(numbered_stack(), options, ec)) << ec.message();

    EXPECT_FALSE(write_geotiff(numbered_stack(), options, ec));
    EXPECT_EQ(ec, make_error_code(errc::output_exists));

    ec.clear();
    options.overwrite = true;
    EXPECT_TRUE(write_geotiff(numbered_stack(), options, ec)) << ec.message();
}

TEST(GeoTiffIo, MissingFileFailsToOpen) {
    TempDir dir;
    GeoTiffReader reader(dir.path() / "absent.tif");
    std::error_code ec;
    EXPECT_FALSE(reader.open(ec));
    EXPECT_TRUE(ec);
}

TEST(GeoTiffIo, StripedWindowStartsInsideStrip) {
    TempDir dir;
    const auto path = dir.path() / "striped.tif";
    write_striped_tiff(path, 7, 10, 2, PLANARCONFIG_CONTIG, 4, 30.0, -5.0, 0.00025);

    GeoTiffReader reader(path);
    std::error_code ec;
    ASSERT_TRUE(reader.open(ec)) << ec.message();
    EXPECT_FALSE(reader.file_nodata().has_value());
    EXPECT_EQ(reader.samples_per_pixel(), 2);

    // 5行目は2番目のストリップ（4〜7行目）の途中
    auto window = reader.read_window(2, 5, 4, 3, -1.0f, ec);
    ASSERT_TRUE(window) << ec.message();
    ASSERT_EQ(window->band_count(), 2u);
    EXPECT_EQ(window->sample_type(), SampleType::uint8);
    EXPECT_DOUBLE_EQ(window->transform().origin_x, 30.0 + 2 * 0.00025);
    EXPECT_DOUBLE_EQ(window->transform().origin_y, -5.0 - 5 * 0.00025);
    for (size_t b = 0; b < 2; ++b) {
        for (int row = 0; row < 3; ++row) {
            for (int col = 0; col < 4; ++col) {
                EXPECT_EQ(window->at(b, col, row), striped_value(b, col + 2, row + 5))
                    << "band " << b << " col " << col << " row " << row;
            }
        }
    }
}

TEST(GeoTiffIo, SeparatePlanesAreReadAsBands) {
    TempDir dir;
    const auto path = dir.path() / "planar.tif";
    write_striped_tiff(path, 7, 10, 3, PLANARCONFIG_SEPARATE, 3, 30.0, -5.0, 0.00025);

    std::error_code ec;
    auto stack = read_geotiff(path, -1.0f, ec);
    ASSERT_TRUE(stack) << ec.message();
    EXPECT_EQ(stack->width(), 7);
    EXPECT_EQ(stack->height(), 10);
    EXPECT_EQ(stack->crs(), "EPSG:4326");
    EXPECT_EQ(stack->band_names(), (std::vector<std::string>{"band1", "band2", "band3"}));
    for (size_t b = 0; b < 3; ++b) {
        for (int row = 0; row < 10; ++row) {
            for (int col = 0; col < 7; ++col) {
                EXPECT_EQ(stack->at(b, col, row), striped_value(b, col, row));
            }
        }
    }

    GeoTiffReader reader(path);
    ASSERT_TRUE(reader.open(ec)) << ec.message();
    auto window = reader.read_window(6, 4, 1, 2, -1.0f, ec);
    ASSERT_TRUE(window) << ec.message();
    EXPECT_EQ(window->at(2, 0, 1), striped_value(2, 6, 5));
}

TEST(GeoTiffIo, UnreachableOutputPathIsReportedAsError) {
    TempDir dir;
    WriteOptions options;
    options.output_path = dir.path() / std::string(300, 'x') / "out.tif";

    std::error_code ec;
    bool written = true;
    EXPECT_NO_THROW(written = write_geotiff(numbered_stack(), options, ec));
    EXPECT_FALSE(written);
    EXPECT_TRUE(ec == std::errc::filename_too_long) << ec.message();
}
