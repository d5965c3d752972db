#include "product_variant.hpp"

#include "errors.hpp"

namespace gfc_extract {

namespace {

const std::vector<std::string> kReflectanceBands = {"Band3", "Band4", "Band5", "Band7"};

const VariantInfo kChange{"change",
                          {"treecover2000", "lossyear", "gain", "datamask"},
                          {"treecover2000", "lossyear", "gain", "datamask"},
                          true};
const VariantInfo kFirst{"first", {"first"}, kReflectanceBands, false};
const VariantInfo kLast{"last", {"last"}, kReflectanceBands, false};

}  // namespace

const VariantInfo& variant_info(ProductVariant variant) {
    switch (variant) {
        case ProductVariant::first:
            return kFirst;
        case ProductVariant::last:
            return kLast;
        case ProductVariant::change:
            break;
    }
    return kChange;
}

std::optional<ProductVariant> parse_product_variant(const std::string& name, std::error_code& ec) {
    for (auto v : {ProductVariant::change, ProductVariant::first, ProductVariant::last}) {
        if (variant_info(v).name == name) {
            return v;
        }
    }
    ec = make_error_code(errc::unsupported_variant);
    return std::nullopt;
}

std::string to_string(ProductVariant variant) { return variant_info(variant).name; }

}  // namespace gfc_extract
