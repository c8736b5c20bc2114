/**
 * @file BackgroundPoller.cpp
 * @brief Implementation of BackgroundPoller.
 */

#include "application/BackgroundPoller.hpp"

#include <algorithm>
#include <iostream>

namespace podscribe::application {

BackgroundPoller::~BackgroundPoller() {
    cancel();
}

void BackgroundPoller::start(PollPolicy policy, Probe probe, Completion onFinished) {
    cancel();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_cancelled = false;
    }
    m_worker = std::thread(&BackgroundPoller::workerLoop, this, policy, std::move(probe), std::move(onFinished));
}

void BackgroundPoller::cancel() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_cancelled = true;
    }
    m_cv.notify_all();

    if (!m_worker.joinable()) return;
    if (m_worker.get_id() == std::this_thread::get_id()) {
        // Cancelled from inside the completion callback; the loop is already on its way out.
        m_worker.detach();
    } else {
        m_worker.join();
    }
}

void BackgroundPoller::workerLoop(PollPolicy policy, Probe probe, Completion onFinished) {
    const auto deadline = std::chrono::steady_clock::now() + policy.timeout;
    bool resolved = false;

    while (true) {
        try {
            resolved = probe();
        } catch (const std::exception& e) {
            std::cerr << "[BackgroundPoller] Probe failed: " << e.what() << std::endl;
            resolved = false;
            break;
        }
        if (resolved) break;

        std::unique_lock<std::mutex> lock(m_mutex);
        if (m_cv.wait_until(lock, std::min(deadline, std::chrono::steady_clock::now() + policy.interval),
                            [this] { return m_cancelled; })) {
            return;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            std::cerr << "[BackgroundPoller] Gave up after " << policy.timeout.count() << " ms" << std::endl;
            break;
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_cancelled) return;
    }
    if (onFinished) onFinished(resolved);
}

} // namespace podscribe::application
