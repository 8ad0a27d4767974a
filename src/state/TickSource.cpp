#include "state/TickSource.h"

#include <FL/Fl.H>

#include <utility>

FlTickSource &FlTickSource::get() {
    static FlTickSource instance;
    return instance;
}

TickSource::TaskId FlTickSource::post(Task task) {
    const TaskId id = ++m_nextId;

    auto pending = std::make_unique<PendingTask>();
    pending->owner = this;
    pending->id = id;
    pending->task = std::move(task);

    Fl::add_timeout(0.0, timeoutCallback, pending.get());
    m_pending.emplace(id, std::move(pending));
    return id;
}

void FlTickSource::cancel(TaskId id) {
    auto it = m_pending.find(id);
    if (it == m_pending.end()) {
        return;
    }

    Fl::remove_timeout(timeoutCallback, it->second.get());
    m_pending.erase(it);
}

void FlTickSource::timeoutCallback(void *data) {
    auto *pending = static_cast<PendingTask *>(data);
    FlTickSource *owner = pending->owner;

    auto it = owner->m_pending.find(pending->id);
    if (it == owner->m_pending.end()) {
        return;
    }

    Task task = std::move(it->second->task);
    owner->m_pending.erase(it);
    task();
}

TickSource::TaskId ManualTickSource::post(Task task) {
    const TaskId id = ++m_nextId;
    m_tasks.emplace(id, std::move(task));
    return id;
}

void ManualTickSource::cancel(TaskId id) { m_tasks.erase(id); }

size_t ManualTickSource::runPending() {
    const TaskId lastId = m_nextId;
    size_t executed = 0;

    while (!m_tasks.empty()) {
        auto it = m_tasks.begin();
        if (it->first > lastId) {
            break;
        }

        Task task = std::move(it->second);
        m_tasks.erase(it);
        task();
        ++executed;
    }

    return executed;
}
