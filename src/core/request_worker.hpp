/**
 * @file   request_worker.hpp
 * @brief  Declares RequestWorker: a single background thread running queued
 *         tasks in FIFO order.
 *
 * Provider calls may block; running them here keeps the channel-servicing
 * thread free to forward extension-point events in the meantime.
 *
 * @date   2026-10-19
 */

#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace provider_bridge {

/**
 * @class RequestWorker
 * @brief Serial task runner. Tasks accepted before stop() still run.
 */
class RequestWorker {
public:
    using Task = std::function<void()>;

    explicit RequestWorker(std::string name);

    /** @brief Runs the remaining tasks, then joins the thread. */
    ~RequestWorker();

    RequestWorker(const RequestWorker&) = delete;
    RequestWorker& operator=(const RequestWorker&) = delete;

    /**
     * @brief Queue a task.
     * @return False if the worker is stopping and the task was not accepted.
     */
    bool post(Task task);

    /** @brief Refuse new tasks; the queue drains and the thread exits. */
    void stop() noexcept;

    /** @return Tasks queued and not yet started. */
    std::size_t queued() const;

private:
    void run();

    std::string             m_name;
    mutable std::mutex      m_mtx;      // Protects the queue
    std::condition_variable m_cv;       // For run loop wakeup
    std::queue<Task>        m_tasks;
    bool                    m_stop{false};
    std::thread             m_thread;   // Started last
};

} // namespace provider_bridge
