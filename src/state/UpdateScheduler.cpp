#include "state/UpdateScheduler.h"

#include "utils/Logger.h"

#include <utility>

namespace {
constexpr const char *kLogPrefix = "UpdateScheduler";
}

UpdateScheduler::UpdateScheduler(TickSource &ticks, Callback onFire) : m_ticks(ticks), m_onFire(std::move(onFire)) {}

UpdateScheduler::~UpdateScheduler() { cancel(); }

void UpdateScheduler::scheduleRecompute() {
    if (m_pending) {
        return;
    }

    m_pending = true;
    m_taskId = m_ticks.post([this]() { fire(); });
}

void UpdateScheduler::cancel() {
    if (!m_pending) {
        return;
    }

    m_ticks.cancel(m_taskId);
    m_pending = false;
    m_taskId = 0;
    Logger::log(Logger::Level::DEBUG, kLogPrefix, "Cancelled pending recompute");
}

void UpdateScheduler::fire() {
    m_pending = false;
    m_taskId = 0;
    ++m_fireCount;

    // The callback may destroy this scheduler.
    Callback onFire = m_onFire;
    if (onFire) {
        onFire();
    }
}
