#include "state/ListOrchestrator.h"

#include "utils/Logger.h"

#include <exception>
#include <string>
#include <utility>

using namespace VirtualScroll;

namespace {
constexpr const char *kLogPrefix = "VirtualList";
}

ListOrchestrator::ListOrchestrator(ListConfig config, TickSource &ticks) : m_config(std::move(config)) {
    m_config.validate();

    m_manager = std::make_unique<SizeAndPositionManager>(
        SizeAndPositionManager::Config{m_config.itemCount, m_config.sizeGetters()});
    m_styleCache = std::make_unique<StyleCache>(*m_manager);
    m_scheduler = std::make_unique<UpdateScheduler>(ticks, [this]() { recompute(); });
    m_stickySet.insert(m_config.stickyIndices.begin(), m_config.stickyIndices.end());

    if (m_config.scrollToIndex) {
        m_offset = m_manager->getUpdatedOffsetForIndex(
            {m_config.align, m_config.containerSize(), m_offset, *m_config.scrollToIndex});
    }

    Logger::log(Logger::Level::DEBUG, kLogPrefix,
                "Configured with " + std::to_string(m_config.itemCount) + " items");
}

ListOrchestrator::~ListOrchestrator() { destroy(); }

template <class Listener, class... Args>
void ListOrchestrator::notify(const std::unordered_map<ListenerId, Listener> &listeners, const Args &...args) {
    const auto listenersCopy = listeners;
    for (auto &[id, callback] : listenersCopy) {
        if (m_state == State::Destroyed) {
            return;
        }
        try {
            callback(args...);
        } catch (const std::exception &e) {
            Logger::log(Logger::Level::ERROR, kLogPrefix,
                        "Listener " + std::to_string(id) + " threw: " + std::string(e.what()));
        }
    }
}

bool ListOrchestrator::rejectIfDestroyed(const char *operation) const {
    if (m_state != State::Destroyed) {
        return false;
    }
    Logger::log(Logger::Level::WARN, kLogPrefix, std::string(operation) + " ignored: list is destroyed");
    return true;
}

void ListOrchestrator::setScrollOffset(double offset) {
    if (rejectIfDestroyed("setScrollOffset")) {
        return;
    }
    if (m_offset == offset) {
        return;
    }

    m_offset = offset;
    m_dirty = true;
    requestRecompute();
}

void ListOrchestrator::setConfig(ListConfig next) {
    if (rejectIfDestroyed("setConfig")) {
        return;
    }

    const ListConfig prev = m_config;
    onConfigChange(prev, next);
}

void ListOrchestrator::onConfigChange(const ListConfig &prev, const ListConfig &next) {
    if (rejectIfDestroyed("onConfigChange")) {
        return;
    }
    next.validate();

    const bool countChanged = prev.itemCount != next.itemCount;
    const bool sizeChanged = !sizeConfigEquals(prev, next);

    SizeAndPositionManager::ConfigUpdate update;
    if (countChanged) {
        update.itemCount = next.itemCount;
    }
    if (sizeChanged) {
        update.getters = next.sizeGetters();
    }
    if (countChanged || sizeChanged) {
        m_manager->updateConfig(update);
    }

    m_config = next;
    m_stickySet.clear();
    m_stickySet.insert(m_config.stickyIndices.begin(), m_config.stickyIndices.end());

    if (sizeChanged) {
        recomputeSizes(0);
    } else if (countChanged) {
        m_styleCache->invalidateFrom(m_config.itemCount);
    }

    applyScrollToIndex(prev);

    m_dirty = true;
    requestRecompute();
}

void ListOrchestrator::applyScrollToIndex(const ListConfig &prev) {
    if (!m_config.scrollToIndex || m_config.scrollToIndex == prev.scrollToIndex) {
        return;
    }
    scrollToIndex(*m_config.scrollToIndex);
}

void ListOrchestrator::resetItem(int index) {
    if (rejectIfDestroyed("resetItem")) {
        return;
    }

    m_manager->resetItem(index);
    m_styleCache->invalidateFrom(index);
    m_dirty = true;
    requestRecompute();
}

void ListOrchestrator::recomputeSizes(int index) {
    if (rejectIfDestroyed("recomputeSizes")) {
        return;
    }

    m_styleCache->clear();
    m_manager->resetItem(index);
}

double ListOrchestrator::scrollToIndex(int index, std::optional<Align> align) {
    if (rejectIfDestroyed("scrollToIndex")) {
        return m_offset;
    }

    const double offset = m_manager->getUpdatedOffsetForIndex(
        {align.value_or(m_config.align), m_config.containerSize(), m_offset, index});

    if (offset != m_offset) {
        setScrollOffset(offset);
        notify(m_scrollListeners, offset);
    }
    return offset;
}

VisibleRange ListOrchestrator::getVisibleRange() {
    if (m_state == State::Destroyed) {
        return {};
    }

    m_state = State::Active;
    return m_manager->getVisibleRange({m_config.containerSize(), m_offset, m_config.overscan});
}

double ListOrchestrator::getTotalSize() const {
    if (m_state == State::Destroyed) {
        return 0.0;
    }
    return m_manager->getTotalSize();
}

InnerStyle ListOrchestrator::getInnerStyle() const { return {getTotalSize()}; }

std::vector<RenderSlot> ListOrchestrator::produceRenderList() {
    std::vector<RenderSlot> slots;
    if (m_state == State::Destroyed) {
        return slots;
    }

    const VisibleRange range = getVisibleRange();

    for (int index : m_config.stickyIndices) {
        slots.push_back({index, m_styleCache->getStyle(index, true)});
    }

    for (int index = range.start; index <= range.end; ++index) {
        if (m_stickySet.count(index)) {
            continue;
        }
        slots.push_back({index, m_styleCache->getStyle(index)});
    }

    return slots;
}

void ListOrchestrator::recompute() {
    if (m_state == State::Destroyed) {
        return;
    }

    std::vector<RenderSlot> slots;
    try {
        slots = produceRenderList();
    } catch (const std::exception &e) {
        // The list stays dirty; the next change schedules another attempt.
        Logger::log(Logger::Level::ERROR, kLogPrefix, std::string("Recompute failed: ") + e.what());
        return;
    }
    m_dirty = false;

    Logger::log(Logger::Level::DEBUG, kLogPrefix,
                "Recomputed " + std::to_string(slots.size()) + " items at offset " + std::to_string(m_offset));
    notify(m_renderListeners, slots);
}

void ListOrchestrator::requestRecompute() {
    const bool alreadyPending = m_scheduler->isPending();
    m_scheduler->scheduleRecompute();
    if (!alreadyPending) {
        notify(m_recomputeListeners);
    }
}

ListOrchestrator::ListenerId ListOrchestrator::subscribe(RenderListener listener) {
    const auto id = ++m_nextId;
    m_renderListeners.emplace(id, std::move(listener));
    return id;
}

ListOrchestrator::ListenerId ListOrchestrator::subscribeRecomputeRequested(RecomputeListener listener) {
    const auto id = ++m_nextId;
    m_recomputeListeners.emplace(id, std::move(listener));
    return id;
}

ListOrchestrator::ListenerId ListOrchestrator::subscribeScrollRequested(ScrollListener listener) {
    const auto id = ++m_nextId;
    m_scrollListeners.emplace(id, std::move(listener));
    return id;
}

void ListOrchestrator::unsubscribe(ListenerId id) {
    m_renderListeners.erase(id);
    m_recomputeListeners.erase(id);
    m_scrollListeners.erase(id);
}

void ListOrchestrator::destroy() {
    if (m_state == State::Destroyed) {
        return;
    }

    if (m_scheduler) {
        m_scheduler->cancel();
    }
    m_state = State::Destroyed;

    m_scheduler.reset();
    m_styleCache.reset();
    m_manager.reset();

    m_renderListeners.clear();
    m_recomputeListeners.clear();
    m_scrollListeners.clear();
    Logger::log(Logger::Level::DEBUG, kLogPrefix, "Destroyed");
}
