#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <iterator>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "models/ListConfig.h"
#include "state/ListOrchestrator.h"
#include "utils/Logger.h"

/**
 * Owns the items of a virtual list and keeps itemCount in step with them.
 *
 * Every edit schedules one coalesced recompute; subscribers receive the
 * rendered items once per tick.
 */
template <class T> class VirtualListDataManager {
  public:
    using ListenerId = ListOrchestrator::ListenerId;
    using Listener = std::function<void(const std::vector<RenderItem<T>> &)>;

    explicit VirtualListDataManager(ListConfig config, std::vector<T> data = {},
                                    TickSource &ticks = FlTickSource::get())
        : m_data(std::move(data)), m_list(syncedConfig(std::move(config), m_data.size()), ticks) {
        m_renderSubscription = m_list.subscribe([this](const std::vector<RenderSlot> &) { deliver(); });
    }

    VirtualListDataManager(const VirtualListDataManager &) = delete;
    VirtualListDataManager &operator=(const VirtualListDataManager &) = delete;

    ListOrchestrator &list() { return m_list; }
    const std::vector<T> &data() const { return m_data; }
    const ListConfig &config() const { return m_list.config(); }

    void setData(std::vector<T> data) {
        m_data = std::move(data);
        dataChanged();
    }

    void push(T item) {
        m_data.push_back(std::move(item));
        dataChanged();
    }

    void concat(std::vector<T> items) {
        m_data.insert(m_data.end(), std::make_move_iterator(items.begin()), std::make_move_iterator(items.end()));
        dataChanged();
    }

    /**
     * @brief Remove deleteCount items at start and insert items in their place
     * @return The removed items
     */
    std::vector<T> splice(size_t start, size_t deleteCount, std::vector<T> items = {}) {
        start = std::min(start, m_data.size());
        deleteCount = std::min(deleteCount, m_data.size() - start);

        auto first = m_data.begin() + start;
        std::vector<T> removed(std::make_move_iterator(first), std::make_move_iterator(first + deleteCount));
        first = m_data.erase(first, first + deleteCount);
        m_data.insert(first, std::make_move_iterator(items.begin()), std::make_move_iterator(items.end()));

        // Items at and after start may now have different sizes.
        const int count = static_cast<int>(m_data.size());
        dataChanged();
        if (m_list.state() != ListOrchestrator::State::Destroyed) {
            m_list.resetItem(std::min(static_cast<int>(start), count));
        }
        return removed;
    }

    void clear() {
        m_data.clear();
        dataChanged();
    }

    void setItemCount(int itemCount) {
        update([itemCount](ListConfig &config) { config.itemCount = itemCount; });
    }

    void setItemSize(VirtualScroll::ItemSize itemSize) {
        update([&itemSize](ListConfig &config) { config.itemSize = std::move(itemSize); });
    }

    void setEstimatedSize(std::optional<double> estimatedSize) {
        update([estimatedSize](ListConfig &config) { config.estimatedSize = estimatedSize; });
    }

    void setOverscan(int overscan) {
        update([overscan](ListConfig &config) { config.overscan = overscan; });
    }

    void setStickyIndices(std::vector<int> stickyIndices) {
        update([&stickyIndices](ListConfig &config) { config.stickyIndices = std::move(stickyIndices); });
    }

    void setViewport(double width, double height) {
        update([width, height](ListConfig &config) {
            config.width = width;
            config.height = height;
        });
    }

    /**
     * @brief Apply an arbitrary edit to a copy of the configuration
     * @throws VirtualScroll::ConfigurationError if the edited configuration is invalid
     */
    void update(const std::function<void(ListConfig &)> &mutator) {
        ListConfig next = m_list.config();
        mutator(next);
        m_list.setConfig(std::move(next));
    }

    void setScrollOffset(double offset) { m_list.setScrollOffset(offset); }

    std::vector<RenderItem<T>> produceRenderList() { return m_list.produceRenderList(m_data); }

    ListenerId subscribe(Listener listener) {
        const auto id = ++m_nextId;
        m_listeners.emplace(id, std::move(listener));
        return id;
    }

    void unsubscribe(ListenerId id) { m_listeners.erase(id); }

    void destroy() {
        m_listeners.clear();
        m_list.destroy();
    }

  private:
    static ListConfig syncedConfig(ListConfig config, size_t count) {
        config.itemCount = static_cast<int>(count);
        return config;
    }

    void dataChanged() {
        if (m_list.state() == ListOrchestrator::State::Destroyed) {
            Logger::log(Logger::Level::WARN, "VirtualList", "Data edit ignored: list is destroyed");
            return;
        }

        const int count = static_cast<int>(m_data.size());
        update([count](ListConfig &config) {
            config.itemCount = count;

            const auto outOfRange = [count](int index) { return index >= count; };
            auto removed = std::remove_if(config.stickyIndices.begin(), config.stickyIndices.end(), outOfRange);
            if (removed != config.stickyIndices.end()) {
                Logger::log(Logger::Level::WARN, "VirtualList", "Dropping sticky indices past the end of the data");
                config.stickyIndices.erase(removed, config.stickyIndices.end());
            }

            if (config.scrollToIndex && *config.scrollToIndex >= count) {
                config.scrollToIndex.reset();
            }
        });
    }

    void deliver() {
        const auto items = produceRenderList();
        const auto listenersCopy = m_listeners;
        for (auto &[id, listener] : listenersCopy) {
            listener(items);
        }
    }

    std::vector<T> m_data;
    ListOrchestrator m_list;
    ListOrchestrator::ListenerId m_renderSubscription = 0;
    std::unordered_map<ListenerId, Listener> m_listeners;
    ListenerId m_nextId = 0;
};

/**
 * @brief Serialize a render list as {index, style, item} objects; T must be JSON-convertible
 */
template <class T> nlohmann::json toJson(const std::vector<RenderItem<T>> &items) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto &entry : items) {
        nlohmann::json j;
        j["index"] = entry.index;
        j["style"] = VirtualScroll::toJson(entry.style);
        j["item"] = entry.item ? nlohmann::json(*entry.item) : nlohmann::json();
        out.push_back(std::move(j));
    }
    return out;
}
