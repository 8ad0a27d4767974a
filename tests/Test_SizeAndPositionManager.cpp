#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <vector>

#include "ui/VirtualScroll.h"

using namespace VirtualScroll;

namespace {

SizeAndPositionManager makeManager(int itemCount, const ItemSize &itemSize,
                                   std::optional<double> estimatedSize = std::nullopt) {
    return SizeAndPositionManager({itemCount, makeSizeGetters(itemSize, estimatedSize)});
}

// Getter over a shared, mutable size table that counts its calls.
struct CountingSizes {
    std::shared_ptr<std::vector<double>> sizes;
    std::shared_ptr<int> calls = std::make_shared<int>(0);

    explicit CountingSizes(std::vector<double> initial)
        : sizes(std::make_shared<std::vector<double>>(std::move(initial))) {}

    PerIndexSize itemSize() const {
        auto table = sizes;
        auto counter = calls;
        return PerIndexSize{[table, counter](int index) -> std::optional<double> {
            ++*counter;
            return (*table)[index];
        }};
    }
};

} // namespace

// ---------------------------------------------------------------------------
// Fixed sizes
// ---------------------------------------------------------------------------

TEST(SizeAndPositionManager, FixedSizeOffsetsAreMultiplesOfTheSize) {
    auto manager = makeManager(7, FixedSize{20.0});

    for (int i = 0; i < 7; ++i) {
        const auto datum = manager.getSizeAndPositionForIndex(i);
        EXPECT_DOUBLE_EQ(datum.offset, i * 20.0);
        EXPECT_DOUBLE_EQ(datum.size, 20.0);
    }
    EXPECT_DOUBLE_EQ(manager.getTotalSize(), 140.0);
    EXPECT_EQ(manager.getLastMeasuredIndex(), 6);
    EXPECT_TRUE(manager.isFixedSize());
}

TEST(SizeAndPositionManager, FixedSizeLookupDoesNotWalkPrecedingItems) {
    const int itemCount = 1000000000;
    auto manager = makeManager(itemCount, FixedSize{2.0});

    const auto datum = manager.getSizeAndPositionForIndex(itemCount - 1);
    EXPECT_DOUBLE_EQ(datum.offset, (itemCount - 1) * 2.0);
    EXPECT_DOUBLE_EQ(manager.getTotalSize(), itemCount * 2.0);
}

TEST(SizeAndPositionManager, EstimatedSizeLookupDoesNotWalkPrecedingItems) {
    const int itemCount = 1000000000;
    auto manager = makeManager(itemCount, EstimatedSize{2.0});

    const auto datum = manager.getSizeAndPositionForIndex(itemCount - 1);
    EXPECT_DOUBLE_EQ(datum.offset, (itemCount - 1) * 2.0);
    EXPECT_DOUBLE_EQ(datum.size, 2.0);
    EXPECT_EQ(manager.getLastMeasuredIndex(), -1);
    EXPECT_TRUE(manager.isUniform());
    EXPECT_FALSE(manager.isFixedSize());

    const auto range = manager.getVisibleRange({100.0, 1e9, 0});
    EXPECT_EQ(range.start, 500000000);
    EXPECT_EQ(range.end, 500000049);
}

TEST(SizeAndPositionManager, EmptyListHasZeroTotalSize) {
    auto fixed = makeManager(0, FixedSize{20.0});
    auto estimated = makeManager(0, EstimatedSize{20.0});

    EXPECT_DOUBLE_EQ(fixed.getTotalSize(), 0.0);
    EXPECT_DOUBLE_EQ(estimated.getTotalSize(), 0.0);
    EXPECT_EQ(estimated.getLastMeasuredIndex(), -1);
}

// ---------------------------------------------------------------------------
// Lazy measurement
// ---------------------------------------------------------------------------

TEST(SizeAndPositionManager, TotalSizeUsesEstimateBeforeMeasurement) {
    auto manager = makeManager(5, sizeTable({10, 20, 30, 40, 50}), 15.0);

    EXPECT_EQ(manager.getLastMeasuredIndex(), -1);
    EXPECT_DOUBLE_EQ(manager.getTotalSize(), 75.0);

    const auto last = manager.getSizeAndPositionOfLastMeasuredItem();
    EXPECT_DOUBLE_EQ(last.offset, 0.0);
    EXPECT_DOUBLE_EQ(last.size, 0.0);
}

TEST(SizeAndPositionManager, LookupMeasuresEveryPrecedingItem) {
    auto manager = makeManager(5, sizeTable({10, 20, 30, 40, 50}), 15.0);

    const auto datum = manager.getSizeAndPositionForIndex(2);
    EXPECT_DOUBLE_EQ(datum.offset, 30.0);
    EXPECT_DOUBLE_EQ(datum.size, 30.0);
    EXPECT_EQ(manager.getLastMeasuredIndex(), 2);

    // 10 + 20 + 30 measured, two items estimated at 15.
    EXPECT_DOUBLE_EQ(manager.getTotalSize(), 90.0);

    manager.getSizeAndPositionForIndex(4);
    EXPECT_DOUBLE_EQ(manager.getTotalSize(), 150.0);
}

TEST(SizeAndPositionManager, UnmeasuredItemStopsLastMeasuredIndex) {
    auto itemSize = PerIndexSize{[](int index) -> std::optional<double> {
        if (index == 2) {
            return std::nullopt;
        }
        return 10.0;
    }};
    auto manager = makeManager(5, itemSize, 15.0);

    const auto datum = manager.getSizeAndPositionForIndex(4);
    EXPECT_DOUBLE_EQ(datum.offset, 45.0);
    EXPECT_DOUBLE_EQ(datum.size, 10.0);
    EXPECT_EQ(manager.getLastMeasuredIndex(), 1);
    EXPECT_DOUBLE_EQ(manager.getTotalSize(), 20.0 + 3 * 15.0);
}

TEST(SizeAndPositionManager, MeasuredItemsAreServedFromTheCache) {
    CountingSizes sizes({10, 10, 10, 10});
    auto manager = makeManager(4, sizes.itemSize(), 10.0);

    manager.getSizeAndPositionForIndex(3);
    const int callsAfterFill = *sizes.calls;

    manager.getSizeAndPositionForIndex(0);
    manager.getSizeAndPositionForIndex(2);
    manager.getSizeAndPositionForIndex(3);
    EXPECT_EQ(*sizes.calls, callsAfterFill);
}

TEST(SizeAndPositionManager, UnmeasuredItemsAreNotReprojectedOnEveryLookup) {
    const int itemCount = 200000;
    auto calls = std::make_shared<long>(0);
    PerIndexSize itemSize{[calls](int) -> std::optional<double> {
        ++*calls;
        return std::nullopt;
    }};
    auto manager = makeManager(itemCount, itemSize, 30.0);

    const VisibleRangeQuery query{300.0, 30.0 * 199000, 0};
    const auto first = manager.getVisibleRange(query);
    EXPECT_EQ(first.start, 199000);
    EXPECT_EQ(first.end, 199009);

    const long callsAfterFirst = *calls;
    const auto second = manager.getVisibleRange(query);
    EXPECT_EQ(second.start, first.start);
    EXPECT_EQ(second.end, first.end);
    EXPECT_LT(*calls - callsAfterFirst, 200);
}

TEST(SizeAndPositionManager, MeasuringTheNextItemRefreshesProjections) {
    auto sizes = std::make_shared<std::vector<std::optional<double>>>(4, std::nullopt);
    PerIndexSize itemSize{[sizes](int index) { return (*sizes)[index]; }};
    auto manager = makeManager(4, itemSize, 10.0);

    EXPECT_DOUBLE_EQ(manager.getSizeAndPositionForIndex(3).offset, 30.0);
    EXPECT_EQ(manager.getLastMeasuredIndex(), -1);

    (*sizes)[0] = 40.0;
    EXPECT_DOUBLE_EQ(manager.getSizeAndPositionForIndex(3).offset, 60.0);
    EXPECT_EQ(manager.getLastMeasuredIndex(), 0);
}

TEST(SizeAndPositionManager, OffsetsAreNonDecreasing) {
    std::vector<double> table;
    for (int i = 0; i < 50; ++i) {
        table.push_back((i % 4) * 7.0);
    }
    auto manager = makeManager(50, sizeTable(table), 5.0);

    for (int i = 0; i + 1 < 50; ++i) {
        const auto current = manager.getSizeAndPositionForIndex(i);
        const auto next = manager.getSizeAndPositionForIndex(i + 1);
        EXPECT_GE(next.offset, current.offset + current.size);
    }
}

// ---------------------------------------------------------------------------
// Invalidation
// ---------------------------------------------------------------------------

TEST(SizeAndPositionManager, ResetItemOnlyInvalidatesLaterIndices) {
    CountingSizes sizes({10, 10, 10, 10, 10});
    auto manager = makeManager(5, sizes.itemSize(), 10.0);
    manager.getSizeAndPositionForIndex(4);

    (*sizes.sizes)[1] = 99.0;
    (*sizes.sizes)[3] = 30.0;
    manager.resetItem(2);

    EXPECT_EQ(manager.getLastMeasuredIndex(), 1);

    const auto before = manager.getSizeAndPositionForIndex(1);
    EXPECT_DOUBLE_EQ(before.offset, 10.0);
    EXPECT_DOUBLE_EQ(before.size, 10.0);

    const auto after = manager.getSizeAndPositionForIndex(3);
    EXPECT_DOUBLE_EQ(after.offset, 30.0);
    EXPECT_DOUBLE_EQ(after.size, 30.0);

    manager.getSizeAndPositionForIndex(4);
    EXPECT_DOUBLE_EQ(manager.getTotalSize(), 70.0);
}

TEST(SizeAndPositionManager, ResetItemDefersRemeasurement) {
    CountingSizes sizes({10, 10, 10});
    auto manager = makeManager(3, sizes.itemSize(), 10.0);
    manager.getSizeAndPositionForIndex(2);

    const int callsBeforeReset = *sizes.calls;
    manager.resetItem(0);
    EXPECT_EQ(*sizes.calls, callsBeforeReset);
    EXPECT_EQ(manager.getLastMeasuredIndex(), -1);
    EXPECT_DOUBLE_EQ(manager.getTotalSize(), 30.0);
}

TEST(SizeAndPositionManager, ResetItemRejectsIndicesPastTheEnd) {
    auto manager = makeManager(3, EstimatedSize{10.0});

    EXPECT_NO_THROW(manager.resetItem(3));
    EXPECT_THROW(manager.resetItem(4), IndexOutOfRange);
    EXPECT_THROW(manager.resetItem(-1), IndexOutOfRange);
}

// ---------------------------------------------------------------------------
// Configuration
// ---------------------------------------------------------------------------

TEST(SizeAndPositionManager, ShrinkingItemCountClampsLastMeasuredIndex) {
    auto manager = makeManager(5, sizeTable({10, 10, 10, 10, 10}), 25.0);
    manager.getSizeAndPositionForIndex(4);

    manager.updateConfig({3, std::nullopt});
    EXPECT_EQ(manager.getItemCount(), 3);
    EXPECT_EQ(manager.getLastMeasuredIndex(), 2);
    EXPECT_DOUBLE_EQ(manager.getTotalSize(), 30.0);

    manager.updateConfig({5, std::nullopt});
    EXPECT_EQ(manager.getLastMeasuredIndex(), 2);
    EXPECT_DOUBLE_EQ(manager.getTotalSize(), 30.0 + 2 * 25.0);
}

TEST(SizeAndPositionManager, NewGettersKeepExistingMeasurements) {
    auto manager = makeManager(3, sizeTable({10, 10, 10}), 10.0);
    manager.getSizeAndPositionForIndex(2);

    manager.updateConfig({std::nullopt, makeSizeGetters(sizeTable({50, 50, 50}), 10.0)});
    EXPECT_DOUBLE_EQ(manager.getTotalSize(), 30.0);

    manager.resetItem(0);
    manager.getSizeAndPositionForIndex(2);
    EXPECT_DOUBLE_EQ(manager.getTotalSize(), 150.0);
}

TEST(SizeAndPositionManager, RejectsInvalidConfiguration) {
    EXPECT_THROW(makeManager(-1, FixedSize{10.0}), ConfigurationError);

    SizeGetters missingEstimate = makeSizeGetters(FixedSize{10.0}, std::nullopt);
    missingEstimate.estimatedSizeGetter = nullptr;
    EXPECT_THROW(SizeAndPositionManager({3, missingEstimate}), ConfigurationError);

    auto manager = makeManager(3, FixedSize{10.0});
    EXPECT_THROW(manager.updateConfig({-2, std::nullopt}), ConfigurationError);
    EXPECT_EQ(manager.getItemCount(), 3);
}

TEST(SizeAndPositionManager, RejectsNegativeMeasuredSize) {
    auto manager = makeManager(3, sizeTable({10, -5, 10}), 10.0);
    EXPECT_THROW(manager.getSizeAndPositionForIndex(2), ConfigurationError);
}

TEST(SizeAndPositionManager, LookupOutsideRangeThrows) {
    auto manager = makeManager(3, EstimatedSize{10.0});

    EXPECT_THROW(manager.getSizeAndPositionForIndex(-1), IndexOutOfRange);
    EXPECT_THROW(manager.getSizeAndPositionForIndex(3), IndexOutOfRange);

    auto empty = makeManager(0, FixedSize{10.0});
    EXPECT_THROW(empty.getSizeAndPositionForIndex(0), IndexOutOfRange);

    try {
        manager.getSizeAndPositionForIndex(7);
        FAIL() << "expected IndexOutOfRange";
    } catch (const IndexOutOfRange &e) {
        EXPECT_EQ(e.index(), 7);
        EXPECT_EQ(e.itemCount(), 3);
    }
}

// ---------------------------------------------------------------------------
// Scroll-to-index offsets
// ---------------------------------------------------------------------------

class UpdatedOffsetTest : public ::testing::Test {
  protected:
    double offsetFor(Align align, int targetIndex, double currentOffset = 0.0) {
        return m_manager.getUpdatedOffsetForIndex({align, 50.0, currentOffset, targetIndex});
    }

    SizeAndPositionManager m_manager = makeManager(10, FixedSize{20.0});
};

TEST_F(UpdatedOffsetTest, StartPlacesLeadingEdgeAtViewportStart) { EXPECT_DOUBLE_EQ(offsetFor(Align::Start, 3), 60.0); }

TEST_F(UpdatedOffsetTest, EndPlacesTrailingEdgeAtViewportEnd) { EXPECT_DOUBLE_EQ(offsetFor(Align::End, 3), 30.0); }

TEST_F(UpdatedOffsetTest, CenterCentersTheItem) { EXPECT_DOUBLE_EQ(offsetFor(Align::Center, 3), 45.0); }

TEST_F(UpdatedOffsetTest, AutoScrollsAsLittleAsPossible) {
    EXPECT_DOUBLE_EQ(offsetFor(Align::Auto, 3, 0.0), 30.0);
    EXPECT_DOUBLE_EQ(offsetFor(Align::Auto, 3, 100.0), 60.0);
    EXPECT_DOUBLE_EQ(offsetFor(Align::Auto, 3, 40.0), 40.0);
}

TEST_F(UpdatedOffsetTest, ResultIsClampedToScrollableRange) {
    EXPECT_DOUBLE_EQ(offsetFor(Align::Start, 9), 150.0);
    EXPECT_DOUBLE_EQ(offsetFor(Align::End, 0), 0.0);
}

TEST_F(UpdatedOffsetTest, TargetOutsideRangeThrows) {
    EXPECT_THROW(offsetFor(Align::Start, 10), IndexOutOfRange);
    EXPECT_THROW(offsetFor(Align::Start, -1), IndexOutOfRange);
}
