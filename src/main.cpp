#include <cxxopts.hpp>

#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "crs_transform.hpp"
#include "extractor.hpp"

namespace fs = std::filesystem;
using namespace gfc_extract;

// "minx,miny,maxx,maxy" を解析する
static bool parse_bbox(const std::string& text, Envelope& env) {
    std::vector<double> values;
    std::istringstream iss(text);
    std::string item;
    try {
        while (std::getline(iss, item, ',')) {
            values.push_back(std::stod(item));
        }
    } catch (const std::exception& e) {
        std::cerr << "bboxの解析エラー: " << e.what() << std::endl;
        return false;
    }
    if (values.size() != 4 || values[0] > values[2] || values[1] > values[3]) {
        return false;
    }
    env = {values[0], values[1], values[2], values[3]};
    return true;
}

static bool parse_compression(const std::string& name, Compression& compression) {
    if (name == "none") {
        compression = Compression::none;
    } else if (name == "lzw") {
        compression = Compression::lzw;
    } else if (name == "deflate") {
        compression = Compression::deflate;
    } else {
        return false;
    }
    return true;
}

int main(int argc, char* argv[]) {
    cxxopts::Options options("gfc_extract", "ダウンロード済みのGFCタイルからAOIのラスターを作成");

    options.add_options()("d,data-folder", "タイルファイルを含むフォルダ",
                          cxxopts::value<std::string>())(
        "b,bbox", "AOIの範囲 minx,miny,maxx,maxy", cxxopts::value<std::string>())(
        "aoi-crs", "AOIのCRS", cxxopts::value<std::string>()->default_value(kGeographicCrs))(
        "s,stack", "change / first / last", cxxopts::value<std::string>()->default_value("change"))(
        "dataset", "データセットのバージョン",
        cxxopts::value<std::string>()->default_value(kDefaultDatasetVersion))(
        "utm", "重心のUTMゾーンに投影する")("scale", "TOA反射率に変換する (first / last)")(
        "o,output", "出力GeoTIFF", cxxopts::value<std::string>())(
        "overwrite", "既存の出力ファイルを上書きする")(
        "compression", "none / lzw / deflate",
        cxxopts::value<std::string>()->default_value("lzw"))(
        "tolerance", "モザイクの許容誤差（ピクセル幅に対する割合）",
        cxxopts::value<double>()->default_value("0.05"))("h,help", "使用方法を表示");

    auto result = options.parse(argc, argv);

    if (result.count("help") || !result.count("data-folder") || !result.count("bbox")) {
        std::cout << options.help() << std::endl;
        return 0;
    }

    Envelope bbox{};
    if (!parse_bbox(result["bbox"].as<std::string>(), bbox)) {
        std::cerr << "エラー: bboxは minx,miny,maxx,maxy の形式で指定してください" << std::endl;
        return 1;
    }

    Extractor::Config config;
    config.data_folder = fs::path(result["data-folder"].as<std::string>()).lexically_normal();
    config.dataset_version = result["dataset"].as<std::string>();
    config.stack = result["stack"].as<std::string>();
    config.to_utm = result.count("utm") > 0;
    config.scale_reflectance = result.count("scale") > 0;
    config.write.overwrite = result.count("overwrite") > 0;
    config.mosaic.tolerance = result["tolerance"].as<double>();
    if (result.count("output")) {
        config.write.output_path = fs::path(result["output"].as<std::string>());
    }
    if (!parse_compression(result["compression"].as<std::string>(), config.write.compression)) {
        std::cerr << "エラー: 不明な圧縮方式です" << std::endl;
        return 1;
    }

    std::error_code dir_ec;
    if (!fs::is_directory(config.data_folder, dir_ec)) {
        std::cerr << "エラー: ディレクトリが存在しません: " << config.data_folder << std::endl;
        return 1;
    }

    std::cout << "\n=== GFCタイルの抽出を開始 ===" << std::endl;
    std::cout << "データフォルダ: " << config.data_folder << std::endl;
    std::cout << "スタック: " << config.stack << std::endl;
    std::cout << "データセット: " << config.dataset_version << std::endl;

    AreaOfInterest aoi = AreaOfInterest::from_envelope(bbox, result["aoi-crs"].as<std::string>());
    Extractor extractor(std::move(config));

    std::error_code ec;
    auto product = extractor.run(aoi, ec);
    if (!product) {
        std::cerr << "エラー: " << ec.message() << std::endl;
        return 1;
    }

    std::cout << "\n=== 抽出完了 ===" << std::endl;
    std::cout << "サイズ: " << product->width() << " x " << product->height() << ", "
              << product->band_count() << " バンド, " << product->crs() << std::endl;

    return 0;
}
