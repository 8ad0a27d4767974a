#include "models/ListConfig.h"

#include "ui/VirtualScrollError.h"
#include "utils/Logger.h"

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <string>
#include <unordered_set>

using VirtualScroll::ConfigurationError;

namespace {

constexpr const char *kLogPrefix = "VirtualList";

[[noreturn]] void reject(const std::string &message) {
    Logger::log(Logger::Level::ERROR, kLogPrefix, message);
    throw ConfigurationError(message);
}

double parseExtent(const nlohmann::json &value, const char *field) {
    if (value.is_number()) {
        return value.get<double>();
    }

    if (value.is_string()) {
        std::string text = value.get<std::string>();
        if (text.size() > 2 && text.compare(text.size() - 2, 2, "px") == 0) {
            text.resize(text.size() - 2);
        }

        char *end = nullptr;
        const double parsed = std::strtod(text.c_str(), &end);
        if (!text.empty() && end == text.c_str() + text.size()) {
            return parsed;
        }
    }

    reject(std::string("Field '") + field + "' must be a number or a pixel string, got " + value.dump());
}

// JSON floats and integers outside int range are rejected, never truncated.
int parseInteger(const nlohmann::json &value, const std::string &field) {
    constexpr int64_t kMin = std::numeric_limits<int>::min();
    constexpr int64_t kMax = std::numeric_limits<int>::max();

    if (value.is_number_unsigned()) {
        const uint64_t number = value.get<uint64_t>();
        if (number <= static_cast<uint64_t>(kMax)) {
            return static_cast<int>(number);
        }
    } else if (value.is_number_integer()) {
        const int64_t number = value.get<int64_t>();
        if (number >= kMin && number <= kMax) {
            return static_cast<int>(number);
        }
    }

    reject("Field '" + field + "' must be an integer in int range, got " + value.dump());
}

VirtualScroll::ItemSize parseItemSize(const nlohmann::json &j, const std::optional<double> &estimatedSize) {
    if (!j.contains("itemSize") || j["itemSize"].is_null()) {
        if (!estimatedSize) {
            reject("estimatedSize is required when itemSize is not given");
        }
        return VirtualScroll::EstimatedSize{*estimatedSize};
    }

    const auto &itemSize = j["itemSize"];
    if (itemSize.is_number()) {
        return VirtualScroll::FixedSize{itemSize.get<double>()};
    }
    if (itemSize.is_array()) {
        return VirtualScroll::sizeTable(itemSize.get<std::vector<double>>());
    }

    reject("Field 'itemSize' must be a number, an array of numbers or null, got " + itemSize.dump());
}

} // namespace

VirtualScroll::Align alignFromString(const std::string &value) {
    if (value == "auto")
        return VirtualScroll::Align::Auto;
    if (value == "start")
        return VirtualScroll::Align::Start;
    if (value == "center")
        return VirtualScroll::Align::Center;
    if (value == "end")
        return VirtualScroll::Align::End;
    reject("Unknown align '" + value + "'");
}

VirtualScroll::ScrollDirection scrollDirectionFromString(const std::string &value) {
    if (value == "vertical")
        return VirtualScroll::ScrollDirection::Vertical;
    if (value == "horizontal")
        return VirtualScroll::ScrollDirection::Horizontal;
    reject("Unknown scrollDirection '" + value + "'");
}

ListConfig ListConfig::fromJson(const nlohmann::json &j) {
    if (!j.is_object()) {
        reject("List configuration must be a JSON object");
    }

    ListConfig config;
    try {
        if (j.contains("itemCount") && !j["itemCount"].is_null()) {
            config.itemCount = parseInteger(j["itemCount"], "itemCount");
        }

        if (j.contains("estimatedSize") && !j["estimatedSize"].is_null()) {
            config.estimatedSize = j["estimatedSize"].get<double>();
        }
        config.itemSize = parseItemSize(j, config.estimatedSize);

        if (j.contains("overscan") && !j["overscan"].is_null()) {
            config.overscan = parseInteger(j["overscan"], "overscan");
        }

        if (j.contains("align")) {
            config.align = alignFromString(j["align"].get<std::string>());
        }

        if (j.contains("scrollDirection")) {
            config.scrollDirection = scrollDirectionFromString(j["scrollDirection"].get<std::string>());
        }

        if (j.contains("stickyIndices") && !j["stickyIndices"].is_null()) {
            const auto &sticky = j["stickyIndices"];
            if (!sticky.is_array()) {
                reject("Field 'stickyIndices' must be an array of integers, got " + sticky.dump());
            }
            for (const auto &index : sticky) {
                config.stickyIndices.push_back(parseInteger(index, "stickyIndices"));
            }
        }

        if (j.contains("scrollToIndex") && !j["scrollToIndex"].is_null()) {
            config.scrollToIndex = parseInteger(j["scrollToIndex"], "scrollToIndex");
        }

        if (j.contains("width")) {
            config.width = parseExtent(j["width"], "width");
        }
        if (j.contains("height")) {
            config.height = parseExtent(j["height"], "height");
        }
    } catch (const nlohmann::json::exception &e) {
        reject(std::string("Malformed list configuration: ") + e.what());
    }

    config.validate();
    return config;
}

void ListConfig::validate() const {
    if (itemCount < 0) {
        reject("itemCount must be >= 0, got " + std::to_string(itemCount));
    }
    if (overscan < 0) {
        reject("overscan must be >= 0, got " + std::to_string(overscan));
    }
    if (!std::isfinite(width) || width < 0.0 || !std::isfinite(height) || height < 0.0) {
        reject("width and height must be finite non-negative numbers");
    }

    std::unordered_set<int> seen;
    for (int index : stickyIndices) {
        if (index < 0 || index >= itemCount) {
            reject("Sticky index " + std::to_string(index) + " is outside [0, " + std::to_string(itemCount) + ")");
        }
        if (!seen.insert(index).second) {
            reject("Sticky index " + std::to_string(index) + " is listed twice");
        }
    }

    if (scrollToIndex && (*scrollToIndex < 0 || *scrollToIndex >= itemCount)) {
        reject("scrollToIndex " + std::to_string(*scrollToIndex) + " is outside [0, " + std::to_string(itemCount) +
               ")");
    }

    sizeGetters();
}

VirtualScroll::SizeGetters ListConfig::sizeGetters() const {
    return VirtualScroll::makeSizeGetters(itemSize, estimatedSize);
}

double ListConfig::containerSize() const {
    return scrollDirection == VirtualScroll::ScrollDirection::Vertical ? height : width;
}

double ListConfig::crossAxisSize() const {
    return scrollDirection == VirtualScroll::ScrollDirection::Vertical ? width : height;
}

bool sizeConfigEquals(const ListConfig &a, const ListConfig &b) {
    return VirtualScroll::sameItemSize(a.itemSize, b.itemSize) && a.estimatedSize == b.estimatedSize;
}
