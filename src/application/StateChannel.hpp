/**
 * @file StateChannel.hpp
 * @brief Mutex-guarded state container with snapshot reads and change listeners.
 */

#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <utility>
#include <vector>

namespace podscribe::application {

/**
 * @class StateChannel
 * @brief Holds a value owned by a single component and broadcasts snapshots of it.
 *
 * Only the owner calls update(). Everyone else reads snapshot() or subscribes.
 * Listeners run on the updating thread, after the lock is released.
 */
template <typename T>
class StateChannel {
public:
    using Listener = std::function<void(const T&)>;
    using ListenerId = int;

    explicit StateChannel(T initial = T{}) : m_value(std::move(initial)) {}

    StateChannel(const StateChannel&) = delete;
    StateChannel& operator=(const StateChannel&) = delete;

    T snapshot() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_value;
    }

    /**
     * @brief Applies a mutation under the lock.
     * @param mutator Callable taking T&; returns false to signal "nothing changed".
     * @return True if listeners were notified.
     */
    template <typename Mutator>
    bool update(Mutator&& mutator) {
        T copy;
        std::vector<Listener> listeners;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!mutator(m_value)) return false;
            copy = m_value;
            listeners.reserve(m_listeners.size());
            for (const auto& [id, listener] : m_listeners) {
                listeners.push_back(listener);
            }
        }
        for (const auto& listener : listeners) {
            listener(copy);
        }
        return true;
    }

    ListenerId subscribe(Listener listener) {
        std::lock_guard<std::mutex> lock(m_mutex);
        ListenerId id = m_nextId++;
        m_listeners.emplace(id, std::move(listener));
        return id;
    }

    void unsubscribe(ListenerId id) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_listeners.erase(id);
    }

private:
    mutable std::mutex m_mutex;
    T m_value;
    std::map<ListenerId, Listener> m_listeners;
    ListenerId m_nextId = 1;
};

} // namespace podscribe::application
