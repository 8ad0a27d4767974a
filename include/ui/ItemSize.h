#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <variant>
#include <vector>

namespace VirtualScroll {

/// Exact size of an item, or nullopt while it has not been measured yet.
using ItemSizeGetter = std::function<std::optional<double>(int index)>;
/// Uniform extent assumed for every item that has no exact size.
using EstimatedSizeGetter = std::function<double()>;

struct FixedSize {
    double value = 0.0;
};

struct PerIndexSize {
    ItemSizeGetter getter;
    /// Bump whenever the getter's answers change; std::function has no identity to compare.
    uint64_t revision = 0;
};

struct EstimatedSize {
    double value = 0.0;
};

using ItemSize = std::variant<FixedSize, PerIndexSize, EstimatedSize>;

/**
 * @brief Getter set handed to SizeAndPositionManager
 *
 * fixedSize is set only for FixedSize configurations and allEstimated only for
 * EstimatedSize ones; both lay items out uniformly with O(1) lookups.
 */
struct SizeGetters {
    ItemSizeGetter itemSizeGetter;
    EstimatedSizeGetter estimatedSizeGetter;
    std::optional<double> fixedSize;
    bool allEstimated = false;
};

/**
 * @brief Build a per-index getter backed by a table of known sizes
 * @param sizes Sizes for indices [0, sizes.size()); later indices report unmeasured
 */
PerIndexSize sizeTable(std::vector<double> sizes, uint64_t revision = 0);

ItemSizeGetter getItemSizeGetter(const ItemSize &itemSize);

/**
 * @brief Resolve the uniform estimate for a configuration
 * @param estimatedSize Caller-provided estimate, required unless itemSize is Fixed or Estimated
 * @throws ConfigurationError when no estimate can be derived
 */
EstimatedSizeGetter getEstimatedGetter(std::optional<double> estimatedSize, const ItemSize &itemSize);

/**
 * @brief Resolve and validate the full getter set for a configuration
 * @throws ConfigurationError on negative/non-finite sizes or an empty per-index getter
 */
SizeGetters makeSizeGetters(const ItemSize &itemSize, std::optional<double> estimatedSize);

bool sameItemSize(const ItemSize &a, const ItemSize &b);

} // namespace VirtualScroll
