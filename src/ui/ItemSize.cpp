#include "ui/ItemSize.h"

#include "ui/VirtualScrollError.h"
#include "utils/Logger.h"

#include <cmath>
#include <memory>
#include <string>

namespace VirtualScroll {

namespace {

bool isValidExtent(double value) { return std::isfinite(value) && value >= 0.0; }

[[noreturn]] void reject(const std::string &message) {
    Logger::log(Logger::Level::ERROR, "VirtualList", message);
    throw ConfigurationError(message);
}

} // namespace

PerIndexSize sizeTable(std::vector<double> sizes, uint64_t revision) {
    auto table = std::make_shared<const std::vector<double>>(std::move(sizes));
    PerIndexSize perIndex;
    perIndex.revision = revision;
    perIndex.getter = [table](int index) -> std::optional<double> {
        if (index < 0 || static_cast<size_t>(index) >= table->size()) {
            return std::nullopt;
        }
        return (*table)[index];
    };
    return perIndex;
}

ItemSizeGetter getItemSizeGetter(const ItemSize &itemSize) {
    if (const auto *fixed = std::get_if<FixedSize>(&itemSize)) {
        const double value = fixed->value;
        return [value](int) -> std::optional<double> { return value; };
    }
    if (const auto *perIndex = std::get_if<PerIndexSize>(&itemSize)) {
        return perIndex->getter;
    }
    return [](int) -> std::optional<double> { return std::nullopt; };
}

EstimatedSizeGetter getEstimatedGetter(std::optional<double> estimatedSize, const ItemSize &itemSize) {
    double value = 0.0;
    if (const auto *fixed = std::get_if<FixedSize>(&itemSize)) {
        value = estimatedSize.value_or(fixed->value);
    } else if (const auto *estimated = std::get_if<EstimatedSize>(&itemSize)) {
        value = estimatedSize.value_or(estimated->value);
    } else if (estimatedSize.has_value()) {
        value = *estimatedSize;
    } else {
        reject("estimatedSize is required when itemSize is a per-index getter");
    }

    if (!isValidExtent(value)) {
        reject("estimatedSize must be a finite non-negative number, got " + std::to_string(value));
    }
    return [value]() { return value; };
}

SizeGetters makeSizeGetters(const ItemSize &itemSize, std::optional<double> estimatedSize) {
    SizeGetters getters;

    if (const auto *fixed = std::get_if<FixedSize>(&itemSize)) {
        if (!isValidExtent(fixed->value)) {
            reject("Fixed itemSize must be a finite non-negative number, got " + std::to_string(fixed->value));
        }
        getters.fixedSize = fixed->value;
    } else if (const auto *perIndex = std::get_if<PerIndexSize>(&itemSize)) {
        if (!perIndex->getter) {
            reject("Per-index itemSize getter is not callable");
        }
    } else {
        getters.allEstimated = true;
    }

    getters.itemSizeGetter = getItemSizeGetter(itemSize);
    getters.estimatedSizeGetter = getEstimatedGetter(estimatedSize, itemSize);
    return getters;
}

bool sameItemSize(const ItemSize &a, const ItemSize &b) {
    if (a.index() != b.index()) {
        return false;
    }
    if (const auto *fa = std::get_if<FixedSize>(&a)) {
        return fa->value == std::get<FixedSize>(b).value;
    }
    if (const auto *ea = std::get_if<EstimatedSize>(&a)) {
        return ea->value == std::get<EstimatedSize>(b).value;
    }
    return std::get<PerIndexSize>(a).revision == std::get<PerIndexSize>(b).revision;
}

} // namespace VirtualScroll
