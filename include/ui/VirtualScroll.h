#ifndef VIRTUAL_SCROLL_H
#define VIRTUAL_SCROLL_H

#include <optional>
#include <vector>

#include "ui/ItemSize.h"
#include "ui/VirtualScrollError.h"

namespace VirtualScroll {

enum class Align { Auto, Start, Center, End };

enum class ScrollDirection { Vertical, Horizontal };

struct SizeAndPosition {
    double offset = 0.0;
    double size = 0.0;
};

/// Inclusive index range to render; end < start means nothing to render.
struct VisibleRange {
    int start = 0;
    int end = -1;

    bool empty() const { return end < start; }
};

struct VisibleRangeQuery {
    double containerSize = 0.0;
    double currentOffset = 0.0;
    int overscan = 0;
};

struct OffsetForIndexQuery {
    Align align = Align::Auto;
    double containerSize = 0.0;
    double currentOffset = 0.0;
    int targetIndex = 0;
};

/**
 * Lazily-built table of cumulative item offsets along the scroll axis.
 *
 * Indices up to lastMeasuredIndex hold exact sizes and are never recomputed
 * until resetItem() invalidates them. Entries past it are projections (the
 * getter's size where it has one, the estimate elsewhere) kept until the
 * measured prefix moves or resetItem() drops them. Fixed and all-estimated
 * configurations bypass the table entirely.
 */
class SizeAndPositionManager {
  public:
    struct Config {
        int itemCount = 0;
        SizeGetters getters;
    };

    /// Fields left empty keep their current value.
    struct ConfigUpdate {
        std::optional<int> itemCount;
        std::optional<SizeGetters> getters;
    };

    /**
     * @throws ConfigurationError if itemCount is negative or the estimate getter is missing
     */
    explicit SizeAndPositionManager(Config config);

    /**
     * @brief Merge a partial configuration
     *
     * Shrinking itemCount clamps lastMeasuredIndex; new getters drop
     * projections but keep measurements, call resetItem(0) to drop those too.
     * @throws ConfigurationError on the same conditions as the constructor
     */
    void updateConfig(const ConfigUpdate &update);

    int getItemCount() const { return m_itemCount; }
    int getLastMeasuredIndex() const;
    bool isFixedSize() const { return m_getters.fixedSize.has_value(); }
    bool isUniform() const { return isFixedSize() || m_getters.allEstimated; }
    double getEstimatedSize() const { return m_getters.estimatedSizeGetter(); }

    /**
     * @brief Offset and size of one item, measuring every unmeasured index before it
     * @throws IndexOutOfRange if index is outside [0, itemCount)
     */
    SizeAndPosition getSizeAndPositionForIndex(int index);

    /**
     * @return Cached record at lastMeasuredIndex, or {0, 0} when nothing is measured
     */
    SizeAndPosition getSizeAndPositionOfLastMeasuredItem() const;

    /**
     * @return Measured extent plus the estimate for every unmeasured item
     */
    double getTotalSize() const;

    /**
     * @brief Indices intersecting [currentOffset, currentOffset + containerSize), widened by overscan
     *
     * An item occupies [offset, offset + size). Returns an empty range when
     * there are no items or the container has no extent.
     */
    VisibleRange getVisibleRange(const VisibleRangeQuery &query);

    /**
     * @brief Scroll offset that brings targetIndex into view under the given alignment
     * @return Offset clamped to [0, totalSize - containerSize]
     * @throws IndexOutOfRange if targetIndex is outside [0, itemCount)
     */
    double getUpdatedOffsetForIndex(const OffsetForIndexQuery &query);

    /**
     * @brief Forget every size from index onward; recomputation happens on the next lookup
     * @throws IndexOutOfRange if index is outside [0, itemCount]
     */
    void resetItem(int index);

  private:
    static void validate(int itemCount, const SizeGetters &getters);

    std::optional<double> exactSize(int index) const;
    void extendMeasured(int index);
    void ensureCache(int index);

    int findNearestItem(double offset);
    int binarySearch(int low, int high, double offset);
    int exponentialSearch(int index, double offset);

    double uniformSize() const;
    VisibleRange uniformVisibleRange(double containerSize, double currentOffset) const;

    int m_itemCount = 0;
    SizeGetters m_getters;
    std::vector<SizeAndPosition> m_cache;
    int m_lastMeasuredIndex = -1;
    int m_lastProjectedIndex = -1;
};

} // namespace VirtualScroll

#endif
