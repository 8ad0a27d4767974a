#include "ui/VirtualScroll.h"

#include "utils/Logger.h"

#include <algorithm>
#include <cmath>
#include <string>

namespace VirtualScroll {

namespace {
constexpr const char *kLogPrefix = "SizeAndPositionManager";
}

SizeAndPositionManager::SizeAndPositionManager(Config config) {
    validate(config.itemCount, config.getters);
    m_itemCount = config.itemCount;
    m_getters = std::move(config.getters);
}

void SizeAndPositionManager::validate(int itemCount, const SizeGetters &getters) {
    std::string problem;
    if (itemCount < 0) {
        problem = "itemCount must be >= 0, got " + std::to_string(itemCount);
    } else if (!getters.estimatedSizeGetter) {
        problem = "estimatedSizeGetter is required";
    } else if (!getters.fixedSize && !getters.allEstimated && !getters.itemSizeGetter) {
        problem = "itemSizeGetter is required unless the item size is fixed";
    }

    if (!problem.empty()) {
        Logger::log(Logger::Level::ERROR, kLogPrefix, problem);
        throw ConfigurationError(problem);
    }
}

void SizeAndPositionManager::updateConfig(const ConfigUpdate &update) {
    const int itemCount = update.itemCount.value_or(m_itemCount);
    validate(itemCount, update.getters ? *update.getters : m_getters);

    if (update.getters) {
        m_getters = *update.getters;
        m_lastProjectedIndex = m_lastMeasuredIndex;
    }

    if (itemCount != m_itemCount) {
        Logger::log(Logger::Level::DEBUG, kLogPrefix,
                    "itemCount " + std::to_string(m_itemCount) + " -> " + std::to_string(itemCount));
        m_itemCount = itemCount;
        m_lastMeasuredIndex = std::min(m_lastMeasuredIndex, m_itemCount - 1);
        m_lastProjectedIndex = std::min(m_lastProjectedIndex, m_itemCount - 1);
        if (m_cache.size() > static_cast<size_t>(m_itemCount)) {
            m_cache.resize(m_itemCount);
        }
    }
}

int SizeAndPositionManager::getLastMeasuredIndex() const {
    if (isFixedSize()) {
        return m_itemCount - 1;
    }
    return m_lastMeasuredIndex;
}

std::optional<double> SizeAndPositionManager::exactSize(int index) const {
    if (!m_getters.itemSizeGetter) {
        return std::nullopt;
    }

    auto size = m_getters.itemSizeGetter(index);
    if (size && (!std::isfinite(*size) || *size < 0.0)) {
        const std::string problem = "itemSizeGetter returned " + std::to_string(*size) + " for index " +
                                    std::to_string(index);
        Logger::log(Logger::Level::ERROR, kLogPrefix, problem);
        throw ConfigurationError(problem);
    }
    return size;
}

SizeAndPosition SizeAndPositionManager::getSizeAndPositionForIndex(int index) {
    if (index < 0 || index >= m_itemCount) {
        throw IndexOutOfRange(index, m_itemCount);
    }

    if (isUniform()) {
        const double size = uniformSize();
        return {index * size, size};
    }

    if (index <= m_lastMeasuredIndex) {
        return m_cache[index];
    }

    extendMeasured(index);
    if (index <= m_lastProjectedIndex) {
        return m_cache[index];
    }

    ensureCache(index);

    double offset = 0.0;
    if (m_lastProjectedIndex >= 0) {
        const SizeAndPosition &last = m_cache[m_lastProjectedIndex];
        offset = last.offset + last.size;
    }

    for (int i = m_lastProjectedIndex + 1; i <= index; ++i) {
        const double size = exactSize(i).value_or(m_getters.estimatedSizeGetter());
        m_cache[i] = {offset, size};
        offset += size;
    }
    m_lastProjectedIndex = index;

    return m_cache[index];
}

// Grow the measured prefix towards index while the getter has exact sizes.
// A measurement that disagrees with its projection drops every later projection.
void SizeAndPositionManager::extendMeasured(int index) {
    while (m_lastMeasuredIndex < index) {
        const int next = m_lastMeasuredIndex + 1;
        const auto exact = exactSize(next);
        if (!exact) {
            return;
        }

        const SizeAndPosition last = getSizeAndPositionOfLastMeasuredItem();
        const SizeAndPosition datum{last.offset + last.size, *exact};

        ensureCache(next);
        if (next > m_lastProjectedIndex || m_cache[next].offset != datum.offset || m_cache[next].size != datum.size) {
            m_lastProjectedIndex = next;
        }
        m_cache[next] = datum;
        m_lastMeasuredIndex = next;
    }
}

void SizeAndPositionManager::ensureCache(int index) {
    if (m_cache.size() < static_cast<size_t>(index) + 1) {
        m_cache.resize(index + 1);
    }
}

SizeAndPosition SizeAndPositionManager::getSizeAndPositionOfLastMeasuredItem() const {
    if (isFixedSize()) {
        if (m_itemCount == 0) {
            return {};
        }
        const double size = *m_getters.fixedSize;
        return {(m_itemCount - 1) * size, size};
    }

    if (m_getters.allEstimated || m_lastMeasuredIndex < 0) {
        return {};
    }
    return m_cache[m_lastMeasuredIndex];
}

double SizeAndPositionManager::getTotalSize() const {
    if (m_itemCount == 0) {
        return 0.0;
    }

    if (isUniform()) {
        return m_itemCount * uniformSize();
    }

    const SizeAndPosition last = getSizeAndPositionOfLastMeasuredItem();
    const int unmeasured = m_itemCount - 1 - m_lastMeasuredIndex;
    return last.offset + last.size + unmeasured * m_getters.estimatedSizeGetter();
}

double SizeAndPositionManager::uniformSize() const {
    return isFixedSize() ? *m_getters.fixedSize : m_getters.estimatedSizeGetter();
}

VisibleRange SizeAndPositionManager::uniformVisibleRange(double containerSize, double currentOffset) const {
    const double size = uniformSize();
    const int lastIndex = m_itemCount - 1;

    if (size <= 0.0) {
        return {lastIndex, lastIndex};
    }

    VisibleRange range;
    range.start = static_cast<int>(std::min<double>(lastIndex, std::floor(currentOffset / size)));
    const double endIndex = std::ceil((currentOffset + containerSize) / size) - 1;
    range.end = static_cast<int>(std::clamp<double>(endIndex, range.start, lastIndex));
    return range;
}

VisibleRange SizeAndPositionManager::getVisibleRange(const VisibleRangeQuery &query) {
    if (m_itemCount == 0 || query.containerSize <= 0.0) {
        return {};
    }

    const double currentOffset = std::max(0.0, query.currentOffset);
    const double maxOffset = currentOffset + query.containerSize;

    VisibleRange range;
    if (isUniform()) {
        range = uniformVisibleRange(query.containerSize, currentOffset);
    } else {
        range.start = findNearestItem(currentOffset);
        range.end = range.start;

        const SizeAndPosition datum = getSizeAndPositionForIndex(range.start);
        double offset = datum.offset + datum.size;

        while (offset < maxOffset && range.end < m_itemCount - 1) {
            ++range.end;
            offset += getSizeAndPositionForIndex(range.end).size;
        }
    }

    const int overscan = std::max(0, query.overscan);
    range.start = std::max(0, range.start - overscan);
    range.end = std::min(m_itemCount - 1, range.end + overscan);
    return range;
}

double SizeAndPositionManager::getUpdatedOffsetForIndex(const OffsetForIndexQuery &query) {
    const SizeAndPosition datum = getSizeAndPositionForIndex(query.targetIndex);

    const double maxOffset = datum.offset;
    const double minOffset = maxOffset - query.containerSize + datum.size;

    double idealOffset = 0.0;
    switch (query.align) {
    case Align::Start:
        idealOffset = maxOffset;
        break;
    case Align::End:
        idealOffset = minOffset;
        break;
    case Align::Center:
        idealOffset = maxOffset - (query.containerSize - datum.size) / 2;
        break;
    case Align::Auto:
    default:
        idealOffset = std::max(minOffset, std::min(maxOffset, query.currentOffset));
        break;
    }

    const double totalSize = getTotalSize();
    return std::max(0.0, std::min(totalSize - query.containerSize, idealOffset));
}

void SizeAndPositionManager::resetItem(int index) {
    if (index < 0 || index > m_itemCount) {
        throw IndexOutOfRange(index, m_itemCount);
    }

    m_lastMeasuredIndex = std::min(m_lastMeasuredIndex, index - 1);
    m_lastProjectedIndex = std::min(m_lastProjectedIndex, index - 1);
    if (m_cache.size() > static_cast<size_t>(index)) {
        m_cache.resize(index);
    }
}

int SizeAndPositionManager::findNearestItem(double offset) {
    const SizeAndPosition last = getSizeAndPositionOfLastMeasuredItem();
    const int lastMeasuredIndex = std::max(0, m_lastMeasuredIndex);

    if (m_lastMeasuredIndex >= 0 && last.offset + last.size > offset) {
        return binarySearch(0, lastMeasuredIndex, offset);
    }
    if (m_lastMeasuredIndex + 1 >= m_itemCount) {
        return m_itemCount - 1;
    }

    return exponentialSearch(m_lastMeasuredIndex + 1, offset);
}

// Smallest index in [low, high] whose trailing edge lies past offset; high if none does.
int SizeAndPositionManager::binarySearch(int low, int high, double offset) {
    while (low < high) {
        const int middle = low + (high - low) / 2;
        const SizeAndPosition datum = getSizeAndPositionForIndex(middle);

        if (datum.offset + datum.size > offset) {
            high = middle;
        } else {
            low = middle + 1;
        }
    }
    return low;
}

int SizeAndPositionManager::exponentialSearch(int index, double offset) {
    int interval = 1;
    int previous = index;

    while (index < m_itemCount) {
        const SizeAndPosition datum = getSizeAndPositionForIndex(index);
        if (datum.offset + datum.size > offset) {
            break;
        }
        previous = index;
        index += interval;
        interval *= 2;
    }

    return binarySearch(previous, std::min(index, m_itemCount - 1), offset);
}

} // namespace VirtualScroll
