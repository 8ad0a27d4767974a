#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <unordered_map>

/**
 * Defers work to the next turn of an event loop.
 *
 * Tasks run on the loop's thread, in posting order, after the code that
 * posted them has returned.
 */
class TickSource {
  public:
    using TaskId = uint64_t;
    using Task = std::function<void()>;

    virtual ~TickSource() = default;

    /**
     * @brief Queue a task for the next tick
     * @return Non-zero id usable with cancel()
     */
    virtual TaskId post(Task task) = 0;

    /**
     * @brief Drop a queued task; unknown or already-run ids are ignored
     */
    virtual void cancel(TaskId id) = 0;
};

/**
 * Zero-delay FLTK timeouts. Must be used from the thread running Fl::run().
 */
class FlTickSource : public TickSource {
  public:
    static FlTickSource &get();

    TaskId post(Task task) override;
    void cancel(TaskId id) override;

  private:
    FlTickSource() = default;
    FlTickSource(const FlTickSource &) = delete;
    FlTickSource &operator=(const FlTickSource &) = delete;

    struct PendingTask {
        FlTickSource *owner = nullptr;
        TaskId id = 0;
        Task task;
    };

    static void timeoutCallback(void *data);

    std::unordered_map<TaskId, std::unique_ptr<PendingTask>> m_pending;
    TaskId m_nextId = 0;
};

/**
 * Tick source pumped by its owner, for hosts that drive their own frame loop.
 */
class ManualTickSource : public TickSource {
  public:
    TaskId post(Task task) override;
    void cancel(TaskId id) override;

    /**
     * @brief Run every task posted before this call
     *
     * Tasks posted while running wait for the next call.
     * @return Number of tasks executed
     */
    size_t runPending();

    size_t pendingCount() const { return m_tasks.size(); }

  private:
    std::map<TaskId, Task> m_tasks;
    TaskId m_nextId = 0;
};
