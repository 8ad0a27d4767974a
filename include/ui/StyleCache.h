#pragma once

#include <cstddef>
#include <optional>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "ui/VirtualScroll.h"

namespace VirtualScroll {

enum class StylePosition { Absolute, Sticky };
enum class Layering { Default, Elevated };

/**
 * @brief Placement of one rendered item along the scroll axis
 *
 * The cross axis always spans the whole container.
 */
struct ItemStyle {
    static constexpr const char *kCrossAxisSize = "100%";

    StylePosition position = StylePosition::Absolute;
    double scrollAxisOffset = 0.0;
    std::optional<double> scrollAxisSize; ///< nullopt renders as "auto" (size still estimated)
    Layering layering = Layering::Default;
};

/// Style of the scroll content box that holds every item.
struct InnerStyle {
    double scrollAxisSize = 0.0;
};

nlohmann::json toJson(const ItemStyle &style);
nlohmann::json toJson(const InnerStyle &style);

/**
 * Memoized per-index styles derived from a SizeAndPositionManager.
 *
 * Sticky and normal styles are cached separately since an index can move in
 * and out of the sticky set. Styles of items whose size is still an estimate
 * are not memoized.
 */
class StyleCache {
  public:
    explicit StyleCache(SizeAndPositionManager &manager) : m_manager(manager) {}

    /**
     * @throws IndexOutOfRange if index is outside the manager's item range
     */
    ItemStyle getStyle(int index, bool sticky = false);

    bool contains(int index, bool sticky = false) const;
    void invalidate(int index);
    void invalidateFrom(int index);
    void clear();
    size_t size() const { return m_normal.size() + m_sticky.size(); }

  private:
    ItemStyle computeStyle(int index, bool sticky) const;

    SizeAndPositionManager &m_manager;
    std::unordered_map<int, ItemStyle> m_normal;
    std::unordered_map<int, ItemStyle> m_sticky;
};

} // namespace VirtualScroll
