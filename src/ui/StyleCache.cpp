#include "ui/StyleCache.h"

namespace VirtualScroll {

namespace {

template <class Map> void eraseFrom(Map &map, int index) {
    for (auto it = map.begin(); it != map.end();) {
        if (it->first >= index) {
            it = map.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace

nlohmann::json toJson(const ItemStyle &style) {
    nlohmann::json j;
    j["position"] = style.position == StylePosition::Sticky ? "sticky" : "absolute";
    j["scrollAxisOffset"] = style.scrollAxisOffset;
    if (style.scrollAxisSize) {
        j["scrollAxisSize"] = *style.scrollAxisSize;
    } else {
        j["scrollAxisSize"] = "auto";
    }
    j["crossAxisSize"] = ItemStyle::kCrossAxisSize;
    j["layering"] = style.layering == Layering::Elevated ? "elevated" : "default";
    return j;
}

nlohmann::json toJson(const InnerStyle &style) {
    return {{"position", "relative"}, {"scrollAxisSize", style.scrollAxisSize}};
}

ItemStyle StyleCache::getStyle(int index, bool sticky) {
    auto &cache = sticky ? m_sticky : m_normal;

    auto it = cache.find(index);
    if (it != cache.end()) {
        return it->second;
    }

    ItemStyle style = computeStyle(index, sticky);
    if (style.scrollAxisSize) {
        cache.emplace(index, style);
    }
    return style;
}

ItemStyle StyleCache::computeStyle(int index, bool sticky) const {
    const SizeAndPosition datum = m_manager.getSizeAndPositionForIndex(index);

    ItemStyle style;
    if (index <= m_manager.getLastMeasuredIndex()) {
        style.scrollAxisSize = datum.size;
    }

    if (sticky) {
        style.position = StylePosition::Sticky;
        style.scrollAxisOffset = 0.0;
        style.layering = Layering::Elevated;
    } else {
        style.position = StylePosition::Absolute;
        style.scrollAxisOffset = datum.offset;
        style.layering = Layering::Default;
    }
    return style;
}

bool StyleCache::contains(int index, bool sticky) const {
    const auto &cache = sticky ? m_sticky : m_normal;
    return cache.find(index) != cache.end();
}

void StyleCache::invalidate(int index) {
    m_normal.erase(index);
    m_sticky.erase(index);
}

void StyleCache::invalidateFrom(int index) {
    eraseFrom(m_normal, index);
    eraseFrom(m_sticky, index);
}

void StyleCache::clear() {
    m_normal.clear();
    m_sticky.clear();
}

} // namespace VirtualScroll
