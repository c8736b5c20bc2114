/**
 * @file BackgroundPoller.hpp
 * @brief Bounded polling on a worker thread, used while waiting on external readiness.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace podscribe::application {

/**
 * @struct PollPolicy
 * @brief How often to probe and when to give up.
 */
struct PollPolicy {
    std::chrono::milliseconds interval{200};
    std::chrono::milliseconds timeout{30000};
};

/**
 * @class BackgroundPoller
 * @brief Runs a probe every interval until it succeeds, the timeout elapses, or cancel() is called.
 */
class BackgroundPoller {
public:
    /** @brief Returns true when polling should stop. */
    using Probe = std::function<bool()>;

    /** @brief Receives true if the probe succeeded, false on timeout. Not called after cancel(). */
    using Completion = std::function<void(bool resolved)>;

    BackgroundPoller() = default;
    ~BackgroundPoller();

    BackgroundPoller(const BackgroundPoller&) = delete;
    BackgroundPoller& operator=(const BackgroundPoller&) = delete;

    /** @brief Cancels any previous poll, then starts a new one. */
    void start(PollPolicy policy, Probe probe, Completion onFinished);

    /** @brief Stops the worker and waits for it. Safe to call from the worker itself. */
    void cancel();

private:
    void workerLoop(PollPolicy policy, Probe probe, Completion onFinished);

    std::thread m_worker;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_cancelled = false;
};

} // namespace podscribe::application
