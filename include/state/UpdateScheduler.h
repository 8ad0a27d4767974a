#pragma once

#include <cstdint>
#include <functional>

#include "state/TickSource.h"

/**
 * Collapses any number of recompute requests made within one tick into a
 * single callback. The callback reads live state when it runs, so the last
 * write before the tick wins.
 */
class UpdateScheduler {
  public:
    using Callback = std::function<void()>;

    UpdateScheduler(TickSource &ticks, Callback onFire);
    ~UpdateScheduler();

    UpdateScheduler(const UpdateScheduler &) = delete;
    UpdateScheduler &operator=(const UpdateScheduler &) = delete;

    /**
     * @brief Arm the deferred callback unless it is already armed
     */
    void scheduleRecompute();

    /**
     * @brief Disarm a pending callback; safe when nothing is pending
     */
    void cancel();

    bool isPending() const { return m_pending; }
    uint64_t fireCount() const { return m_fireCount; }

  private:
    void fire();

    TickSource &m_ticks;
    Callback m_onFire;
    bool m_pending = false;
    TickSource::TaskId m_taskId = 0;
    uint64_t m_fireCount = 0;
};
