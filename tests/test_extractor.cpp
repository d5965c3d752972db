#include <gtest/gtest.h>

#include <filesystem>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

#include "errors.hpp"
#include "extractor.hpp"
#include "test_helpers.hpp"

using namespace gfc_extract;
using gfc_extract::testing::TempDir;
using gfc_extract::testing::write_tile;

namespace {

constexpr double kPixel = 0.25;

AreaOfInterest box(double min_x, double min_y, double max_x, double max_y) {
    return AreaOfInterest::from_envelope({min_x, min_y, max_x, max_y}, "EPSG:4326");
}

// 経度0〜10度、緯度-10〜0度のchangeタイル（画像ごとに1バンド）
void write_change_tile(const std::filesystem::path& folder) {
    const std::vector<float> values = {80.0f, 12.0f, 0.0f, 1.0f};
    auto paths = filenames_for({0, 0}, ProductVariant::change, kDefaultDatasetVersion, folder);
    ASSERT_EQ(paths.size(), values.size());
    for (size_t i = 0; i < paths.size(); ++i) {
        float value = values[i];
        write_tile(paths[i], 40, 40, 0.0, 0.0, kPixel, 1,
                   [value](size_t, int, int) { return value; });
    }
}

// 緯度0〜10度の隣接する2枚のfirstタイル。西側は1列だけ東に重なる
void write_first_tiles(const std::filesystem::path& folder) {
    auto west = filenames_for({10, 0}, ProductVariant::first, kDefaultDatasetVersion, folder);
    auto east = filenames_for({10, 10}, ProductVariant::first, kDefaultDatasetVersion, folder);
    ASSERT_EQ(west.size(), 1u);
    ASSERT_EQ(east.size(), 1u);
    write_tile(west[0], 41, 40, 0.0, 10.0, kPixel, 4, [](size_t, int, int) { return 100.0f; });
    write_tile(east[0], 40, 40, 10.0, 10.0, kPixel, 4, [](size_t, int, int) { return 50.0f; });
}

Extractor::Config config_for(const std::filesystem::path& folder, const std::string& stack) {
    Extractor::Config config;
    config.data_folder = folder;
    config.stack = stack;
    return config;
}

}  // namespace

TEST(Extractor, ChangeProductFromSingleTile) {
    TempDir dir;
    write_change_tile(dir.path());

    Extractor extractor(config_for(dir.path(), "change"));
    std::error_code ec;
    auto product = extractor.run(box(2.0, -3.0, 3.0, -2.0), ec);
    ASSERT_TRUE(product) << ec.message();

    EXPECT_EQ(product->width(), 4);
    EXPECT_EQ(product->height(), 4);
    EXPECT_EQ(product->crs(), "EPSG:4326");
    EXPECT_FLOAT_EQ(product->nodata(), -1.0f);
    EXPECT_EQ(product->band_names(),
              (std::vector<std::string>{"treecover2000", "lossyear", "gain", "datamask"}));
    EXPECT_DOUBLE_EQ(product->transform().origin_x, 2.0);
    EXPECT_DOUBLE_EQ(product->transform().origin_y, -2.0);
    EXPECT_FLOAT_EQ(product->at(0, 0, 0), 80.0f);
    EXPECT_FLOAT_EQ(product->at(1, 3, 3), 12.0f);
    EXPECT_FLOAT_EQ(product->at(3, 2, 1), 1.0f);
}

TEST(Extractor, FirstProductAveragesTileOverlap) {
    TempDir dir;
    write_first_tiles(dir.path());

    Extractor extractor(config_for(dir.path(), "first"));
    std::error_code ec;
    auto product = extractor.run(box(8.0, 1.0, 12.0, 2.0), ec);
    ASSERT_TRUE(product) << ec.message();

    EXPECT_EQ(product->width(), 16);
    EXPECT_EQ(product->height(), 4);
    EXPECT_EQ(product->band_names(),
              (std::vector<std::string>{"Band3", "Band4", "Band5", "Band7"}));
    for (size_t b = 0; b < product->band_count(); ++b) {
        EXPECT_FLOAT_EQ(product->at(b, 0, 0), 100.0f);
        EXPECT_FLOAT_EQ(product->at(b, 8, 2), 75.0f);
        EXPECT_FLOAT_EQ(product->at(b, 15, 3), 50.0f);
    }
}

TEST(Extractor, UtmProductUsesCentroidZone) {
    TempDir dir;
    write_first_tiles(dir.path());

    auto config = config_for(dir.path(), "first");
    config.to_utm = true;
    Extractor extractor(std::move(config));
    std::error_code ec;
    auto product = extractor.run(box(8.0, 1.0, 12.0, 2.0), ec);
    ASSERT_TRUE(product) << ec.message();
    EXPECT_EQ(product->crs(), "EPSG:32632");
    EXPECT_EQ(product->band_count(), 4u);
}

TEST(Extractor, ReflectanceScalingYieldsFloatProduct) {
    TempDir dir;
    write_first_tiles(dir.path());

    auto config = config_for(dir.path(), "first");
    config.scale_reflectance = true;
    Extractor extractor(std::move(config));
    std::error_code ec;
    auto product = extractor.run(box(8.0, 1.0, 12.0, 2.0), ec);
    ASSERT_TRUE(product) << ec.message();

    EXPECT_EQ(product->sample_type(), SampleType::float32);
    EXPECT_FLOAT_EQ(product->at(0, 0, 0), 99.0f / 508.0f);
    EXPECT_FLOAT_EQ(product->at(3, 15, 0), 49.0f / 423.0f);
}

TEST(Extractor, ReflectanceScalingRejectsChangeProduct) {
    TempDir dir;
    write_change_tile(dir.path());

    auto config = config_for(dir.path(), "change");
    config.scale_reflectance = true;
    Extractor extractor(std::move(config));
    std::error_code ec;
    EXPECT_FALSE(extractor.run(box(2.0, -3.0, 3.0, -2.0), ec).has_value());
    EXPECT_EQ(ec, make_error_code(errc::unsupported_variant));
}

TEST(Extractor, UnknownStackFailsBeforeTileIo) {
    Extractor extractor(config_for("/nonexistent/gfc/tiles", "mean"));
    std::error_code ec;
    EXPECT_FALSE(extractor.run(box(2.0, -3.0, 3.0, -2.0), ec).has_value());
    EXPECT_EQ(ec, make_error_code(errc::unsupported_variant));
}

TEST(Extractor, MissingTilesAreReported) {
    TempDir dir;
    Extractor extractor(config_for(dir.path(), "change"));
    std::error_code ec;
    EXPECT_FALSE(extractor.run(box(2.0, -3.0, 3.0, -2.0), ec).has_value());
    EXPECT_EQ(ec, make_error_code(errc::missing_tile_file));
}

TEST(Extractor, AoiOutsideCoverageIsEmptyResult) {
    TempDir dir;
    Extractor extractor(config_for(dir.path(), "change"));
    std::error_code ec;
    EXPECT_FALSE(extractor.run(box(10.0, 82.0, 11.0, 83.0), ec).has_value());
    EXPECT_EQ(ec, make_error_code(errc::empty_result));
}

TEST(Extractor, WritesProductWhenOutputPathIsSet) {
    TempDir dir;
    write_change_tile(dir.path());

    auto config = config_for(dir.path(), "change");
    config.write.output_path = dir.path() / "out" / "change.tif";
    Extractor extractor(std::move(config));
    std::error_code ec;
    auto product = extractor.run(box(2.0, -3.0, 3.0, -2.0), ec);
    ASSERT_TRUE(product) << ec.message();
    ASSERT_TRUE(std::filesystem::exists(dir.path() / "out" / "change.tif"));

    auto written = read_geotiff(dir.path() / "out" / "change.tif", -1.0f, ec);
    ASSERT_TRUE(written) << ec.message();
    EXPECT_TRUE(*written == *product);

    // 2回目は上書き許可がないので失敗する
    EXPECT_FALSE(extractor.run(box(2.0, -3.0, 3.0, -2.0), ec).has_value());
    EXPECT_EQ(ec, make_error_code(errc::output_exists));
}

TEST(Extractor, ReflectanceTileWithWrongBandCountIsRejected) {
    TempDir dir;
    auto paths = filenames_for({0, 0}, ProductVariant::first, kDefaultDatasetVersion, dir.path());
    ASSERT_EQ(paths.size(), 1u);
    write_tile(paths[0], 40, 40, 0.0, 0.0, kPixel, 3, [](size_t, int, int) { return 60.0f; });

    Extractor extractor(config_for(dir.path(), "first"));
    std::error_code ec;
    EXPECT_FALSE(extractor.run(box(2.0, -3.0, 3.0, -2.0), ec).has_value());
    EXPECT_EQ(ec, make_error_code(errc::band_count_mismatch));
}

TEST(Extractor, ChangeImageWithExtraBandIsRejected) {
    TempDir dir;
    auto paths = filenames_for({0, 0}, ProductVariant::change, kDefaultDatasetVersion, dir.path());
    ASSERT_EQ(paths.size(), 4u);
    write_tile(paths[0], 40, 40, 0.0, 0.0, kPixel, 2, [](size_t, int, int) { return 80.0f; });
    for (size_t i = 1; i < paths.size(); ++i) {
        write_tile(paths[i], 40, 40, 0.0, 0.0, kPixel, 1, [](size_t, int, int) { return 1.0f; });
    }

    Extractor extractor(config_for(dir.path(), "change"));
    std::error_code ec;
    EXPECT_FALSE(extractor.run(box(2.0, -3.0, 3.0, -2.0), ec).has_value());
    EXPECT_EQ(ec, make_error_code(errc::band_count_mismatch));
}

TEST(Extractor, UnreadableDataFolderIsReportedAsError) {
    // 長すぎるパス要素は stat が ENAMETOOLONG で失敗する
    TempDir dir;
    Extractor extractor(config_for(dir.path() / std::string(300, 'x'), "change"));
    std::error_code ec;
    std::optional<RasterStack> product;
    EXPECT_NO_THROW(product = extractor.run(box(2.0, -3.0, 3.0, -2.0), ec));
    EXPECT_FALSE(product.has_value());
    EXPECT_TRUE(ec == std::errc::filename_too_long) << ec.message();
}

TEST(Extractor, ParallelTileErrorsAreLoggedLineByLine) {
    TempDir dir;
    Extractor extractor(config_for(dir.path(), "change"));

    // 4タイルすべてでファイルが見つからない
    ::testing::internal::CaptureStderr();
    std::error_code ec;
    auto product = extractor.run(box(-5.0, -5.0, 5.0, 5.0), ec);
    const std::string log = ::testing::internal::GetCapturedStderr();

    EXPECT_FALSE(product.has_value());
    EXPECT_EQ(ec, make_error_code(errc::missing_tile_file));

    const std::string prefix = "タイルファイルが見つかりません: ";
    std::istringstream lines(log);
    std::string line;
    int count = 0;
    while (std::getline(lines, line)) {
        EXPECT_EQ(line.compare(0, prefix.size(), prefix), 0) << line;
        EXPECT_EQ(line.substr(line.size() - 5), ".tif\"") << line;
        ++count;
    }
    EXPECT_EQ(count, 4);
}
