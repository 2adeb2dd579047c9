/**
 * @file event_loop.hpp
 * @brief Cooperative task queue for the UI/event-loop thread
 *
 * The bridge and its engines are single-threaded: every operation and
 * every engine callback runs on the thread that drains this loop.
 * Background work (media probing) hands its result back with post().
 */

#pragma once

#include <scenebridge/core/types.hpp>

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>

namespace scenebridge {

class EventLoop {
public:
    using Task = std::function<void()>;

    EventLoop() = default;

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    /// Queue a task. Callable from any thread.
    void post(Task task);

    /**
     * @brief Run the tasks queued before this call
     *
     * Tasks posted while draining wait for the next call, so a task that
     * re-posts itself cannot starve the caller.
     *
     * @return Number of tasks run
     */
    size_t runPending();

    /**
     * @brief Block until a task is queued or the timeout expires
     *
     * @return true if at least one task is pending
     */
    bool waitFor(Milliseconds timeout);

    [[nodiscard]] size_t pendingCount() const;

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<Task> m_tasks;
};

} // namespace scenebridge
