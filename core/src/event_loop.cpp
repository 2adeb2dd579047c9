/**
 * @file event_loop.cpp
 * @brief EventLoop implementation
 */

#include <scenebridge/core/event_loop.hpp>
#include <scenebridge/core/logger.hpp>

#include <exception>

namespace scenebridge {

void EventLoop::post(Task task) {
    if (!task) return;
    {
        std::lock_guard lock(m_mutex);
        m_tasks.push_back(std::move(task));
    }
    m_cv.notify_one();
}

size_t EventLoop::runPending() {
    std::deque<Task> batch;
    {
        std::lock_guard lock(m_mutex);
        batch.swap(m_tasks);
    }

    size_t count = 0;
    for (auto& task : batch) {
        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR("[EventLoop] Task threw: {}", e.what());
        }
        ++count;
    }
    return count;
}

bool EventLoop::waitFor(Milliseconds timeout) {
    std::unique_lock lock(m_mutex);
    return m_cv.wait_for(lock, timeout, [this] { return !m_tasks.empty(); });
}

size_t EventLoop::pendingCount() const {
    std::lock_guard lock(m_mutex);
    return m_tasks.size();
}

} // namespace scenebridge
