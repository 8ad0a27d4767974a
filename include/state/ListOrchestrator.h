#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "models/ListConfig.h"
#include "state/TickSource.h"
#include "state/UpdateScheduler.h"
#include "ui/StyleCache.h"
#include "ui/VirtualScroll.h"

struct RenderSlot {
    int index = 0;
    VirtualScroll::ItemStyle style;
};

/**
 * @brief One entry of the list handed to a renderer
 *
 * item points into the caller's data and is null when the data is shorter
 * than itemCount. It stays valid until that data is modified.
 */
template <class T> struct RenderItem {
    int index = 0;
    VirtualScroll::ItemStyle style;
    const T *item = nullptr;
};

/**
 * Drives one virtual list: owns the size/position table, the style cache and
 * the update scheduler, and turns scroll and configuration changes into
 * coalesced render lists.
 *
 * After destroy() every mutation is ignored and every query returns an empty
 * result.
 */
class ListOrchestrator {
  public:
    enum class State { Configured, Active, Destroyed };

    using ListenerId = uint64_t;
    using RenderListener = std::function<void(const std::vector<RenderSlot> &)>;
    using RecomputeListener = std::function<void()>;
    using ScrollListener = std::function<void(double offset)>;

    /**
     * @throws VirtualScroll::ConfigurationError if config is invalid
     */
    explicit ListOrchestrator(ListConfig config, TickSource &ticks = FlTickSource::get());
    ~ListOrchestrator();

    ListOrchestrator(const ListOrchestrator &) = delete;
    ListOrchestrator &operator=(const ListOrchestrator &) = delete;

    const ListConfig &config() const { return m_config; }
    State state() const { return m_state; }
    double scrollOffset() const { return m_offset; }
    bool isDirty() const { return m_dirty; }
    bool isRecomputePending() const { return m_scheduler && m_scheduler->isPending(); }

    /**
     * @brief Move the viewport; ignored when the offset is unchanged
     */
    void setScrollOffset(double offset);

    /**
     * @brief Validate and apply a new configuration
     * @throws VirtualScroll::ConfigurationError leaving the current configuration untouched
     */
    void setConfig(ListConfig next);

    /**
     * @brief Apply the difference between two configurations and adopt next
     *
     * Size-related changes drop every cached style and measurement.
     */
    void onConfigChange(const ListConfig &prev, const ListConfig &next);

    /**
     * @brief An item's size changed; forget it and everything after it
     * @throws VirtualScroll::IndexOutOfRange if index is outside [0, itemCount]
     */
    void resetItem(int index);

    void recomputeSizes(int index = 0);

    /**
     * @brief Scroll so that index is placed according to align (the configured alignment by default)
     * @return The new scroll offset
     * @throws VirtualScroll::IndexOutOfRange if index is outside [0, itemCount)
     */
    double scrollToIndex(int index, std::optional<VirtualScroll::Align> align = std::nullopt);

    VirtualScroll::VisibleRange getVisibleRange();
    double getTotalSize() const;
    VirtualScroll::InnerStyle getInnerStyle() const;

    /**
     * @brief Sticky items in configured order, then the visible range minus sticky items
     */
    std::vector<RenderSlot> produceRenderList();

    template <class T> std::vector<RenderItem<T>> produceRenderList(const std::vector<T> &data) {
        std::vector<RenderItem<T>> items;
        for (auto &slot : produceRenderList()) {
            RenderItem<T> entry;
            entry.index = slot.index;
            entry.style = slot.style;
            if (static_cast<size_t>(slot.index) < data.size()) {
                entry.item = &data[slot.index];
            }
            items.push_back(std::move(entry));
        }
        return items;
    }

    /**
     * @brief Rebuild the render list now and deliver it to render listeners
     *
     * Runs on the scheduler tick, so a failing size getter is logged and the
     * delivery skipped instead of propagating.
     */
    void recompute();

    ListenerId subscribe(RenderListener listener);
    ListenerId subscribeRecomputeRequested(RecomputeListener listener);
    ListenerId subscribeScrollRequested(ScrollListener listener);
    void unsubscribe(ListenerId id);

    /**
     * @brief Cancel any pending recompute and release all state; idempotent
     */
    void destroy();

  private:
    void requestRecompute();
    bool rejectIfDestroyed(const char *operation) const;
    void applyScrollToIndex(const ListConfig &prev);

    template <class Listener, class... Args>
    void notify(const std::unordered_map<ListenerId, Listener> &listeners, const Args &...args);

    ListConfig m_config;
    std::unordered_set<int> m_stickySet;
    double m_offset = 0.0;
    bool m_dirty = true;
    State m_state = State::Configured;

    std::unique_ptr<VirtualScroll::SizeAndPositionManager> m_manager;
    std::unique_ptr<VirtualScroll::StyleCache> m_styleCache;
    std::unique_ptr<UpdateScheduler> m_scheduler;

    std::unordered_map<ListenerId, RenderListener> m_renderListeners;
    std::unordered_map<ListenerId, RecomputeListener> m_recomputeListeners;
    std::unordered_map<ListenerId, ScrollListener> m_scrollListeners;
    ListenerId m_nextId = 0;
};
