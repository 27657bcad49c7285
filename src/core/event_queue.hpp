/**
 * @file   event_queue.hpp
 * @brief  Thread-safe FIFO of extension-point events waiting to be sent.
 *
 * Providers push from whatever thread they run on; the channel-servicing
 * thread drains. Emission order is kept.
 *
 * @date   2026-10-19
 */

#pragma once

#include <deque>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace provider_bridge {

/**
 * @struct ExtensionEvent
 * @brief  One callback invocation: its kind and its payload.
 */
struct ExtensionEvent {
    std::string    type;  ///< progressCallback | reportMetadataCallback | notifyPlayerManager
    nlohmann::json data;
};

/**
 * @class EventQueue
 * @brief Mutex-protected queue that can be sealed.
 *
 * Once sealed, pushes are dropped and the queue stays empty.
 */
class EventQueue {
public:
    /** @return False if the queue is sealed and the event was dropped. */
    bool push(ExtensionEvent ev) {
        std::lock_guard<std::mutex> lk(m_mtx);
        if (m_sealed) return false;
        m_events.push_back(std::move(ev));
        return true;
    }

    /** @brief Remove and return every queued event, oldest first. */
    std::vector<ExtensionEvent> drain() {
        std::lock_guard<std::mutex> lk(m_mtx);
        std::vector<ExtensionEvent> out(std::make_move_iterator(m_events.begin()),
                                        std::make_move_iterator(m_events.end()));
        m_events.clear();
        return out;
    }

    /** @brief Drop queued events and refuse any further push. */
    void seal() {
        std::lock_guard<std::mutex> lk(m_mtx);
        m_sealed = true;
        m_events.clear();
    }

    bool sealed() const {
        std::lock_guard<std::mutex> lk(m_mtx);
        return m_sealed;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lk(m_mtx);
        return m_events.size();
    }

private:
    mutable std::mutex         m_mtx;
    std::deque<ExtensionEvent> m_events;
    bool                       m_sealed{false};
};

} // namespace provider_bridge
