/**
 * @file   request_worker.cpp
 * @brief  Implements RequestWorker's queue and run loop.
 *
 * @date   2026-10-19
 */

#include "request_worker.hpp"
#include "logging.hpp"

#include <exception>

namespace provider_bridge {

RequestWorker::RequestWorker(std::string name)
  : m_name(std::move(name))
  , m_thread([this]{ run(); })
{}

RequestWorker::~RequestWorker() {
    stop();
    if (m_thread.joinable())
        m_thread.join();
}

bool RequestWorker::post(Task task) {
    {
        std::lock_guard<std::mutex> lk(m_mtx);
        if (m_stop) return false;
        m_tasks.push(std::move(task));
    }
    m_cv.notify_one();
    return true;
}

void RequestWorker::stop() noexcept {
    {
        std::lock_guard<std::mutex> lk(m_mtx);
        m_stop = true;
    }
    m_cv.notify_one();
}

std::size_t RequestWorker::queued() const {
    std::lock_guard<std::mutex> lk(m_mtx);
    return m_tasks.size();
}

void RequestWorker::run() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lk(m_mtx);
            m_cv.wait(lk, [&]{ return m_stop || !m_tasks.empty(); });
            if (m_tasks.empty()) break;  // stopping and drained
            task = std::move(m_tasks.front());
            m_tasks.pop();
        }

        // Tasks complete their own responders; anything escaping is a bug
        try {
            task();
        }
        catch (const std::exception& e) {
            qCCritical(lcEndpoint) << m_name.c_str() << "task escaped with:" << e.what();
        }
    }
}

} // namespace provider_bridge
