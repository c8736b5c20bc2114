/**
 * @file AsyncTaskManager.hpp
 * @brief Background execution for long-running episode work, with unified status tracking.
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace podscribe::application {

/**
 * @enum TaskType
 * @brief Categories of background work.
 */
enum class TaskType {
    Transcription,
    Summarization
};

/**
 * @struct TaskStatus
 * @brief Information about a running or completed task.
 */
struct TaskStatus {
    int id = 0;
    TaskType type = TaskType::Transcription;
    std::string description;
    std::atomic<float> progress{0.0f};
    std::atomic<bool> isCompleted{false};
    std::atomic<bool> failed{false};
    std::string errorMessage; ///< Written once, before isCompleted is set.
};

/**
 * @class AsyncTaskManager
 * @brief Runs tasks on their own threads. The destructor waits for every task.
 */
class AsyncTaskManager {
public:
    AsyncTaskManager() = default;
    ~AsyncTaskManager() { waitAll(); }

    AsyncTaskManager(const AsyncTaskManager&) = delete;
    AsyncTaskManager& operator=(const AsyncTaskManager&) = delete;

    /**
     * @brief Submits a new task. The callable receives the task's status as its first argument.
     *
     * An exception escaping the callable marks the task failed with its message.
     */
    template<typename F, typename... Args>
    std::shared_ptr<TaskStatus> SubmitTask(TaskType type, const std::string& description, F&& f, Args&&... args) {
        auto status = std::make_shared<TaskStatus>();
        status->id = m_nextId++;
        status->type = type;
        status->description = description;

        std::vector<std::thread> finished;
        {
            std::lock_guard<std::mutex> lock(m_tasksMutex);
            TakeExitedWorkers(finished);
            m_activeTasks.push_back(status);

            auto exited = std::make_shared<std::atomic<bool>>(false);
            std::thread thread([this, status, exited](auto userFunc, auto... userArgs) {
                try {
                    userFunc(status, std::move(userArgs)...);
                    status->progress = 1.0f;
                } catch (const std::exception& e) {
                    std::cerr << "[AsyncTaskManager] Task '" << status->description << "' failed: " << e.what() << std::endl;
                    status->failed = true;
                    status->errorMessage = e.what();
                } catch (...) {
                    std::cerr << "[AsyncTaskManager] Task '" << status->description << "' failed with an unknown error" << std::endl;
                    status->failed = true;
                    status->errorMessage = "Unknown error during task execution.";
                }
                status->isCompleted = true;
                CleanupCompletedTasks();
                *exited = true;
            }, std::forward<F>(f), std::forward<Args>(args)...);
            m_workers.push_back(Worker{std::move(thread), std::move(exited)});
        }
        for (auto& t : finished) t.join();

        return status;
    }

    /** @brief Returns snapshots of all active tasks. */
    std::vector<std::shared_ptr<TaskStatus>> GetActiveTasks() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        return m_activeTasks;
    }

    /** @brief Blocks until every submitted task has finished. */
    void waitAll() {
        std::vector<Worker> workers;
        {
            std::lock_guard<std::mutex> lock(m_tasksMutex);
            workers.swap(m_workers);
        }
        for (auto& w : workers) {
            if (w.thread.joinable()) w.thread.join();
        }
    }

    /** @brief Threads not yet reclaimed. Exited ones are joined on the next SubmitTask. */
    size_t GetThreadCount() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        return m_workers.size();
    }

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> exited; ///< Set after the task's last lock is released.
    };

    // Caller holds m_tasksMutex; the returned threads are joined after it is released.
    void TakeExitedWorkers(std::vector<std::thread>& out) {
        std::vector<Worker> running;
        for (auto& w : m_workers) {
            if (w.exited->load()) {
                out.push_back(std::move(w.thread));
            } else {
                running.push_back(std::move(w));
            }
        }
        m_workers.swap(running);
    }

    void CleanupCompletedTasks() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        m_activeTasks.erase(
            std::remove_if(m_activeTasks.begin(), m_activeTasks.end(),
                [](const auto& s) { return s->isCompleted.load(); }),
            m_activeTasks.end()
        );
    }

    std::atomic<int> m_nextId{0};
    std::vector<std::shared_ptr<TaskStatus>> m_activeTasks;
    std::vector<Worker> m_workers;
    std::mutex m_tasksMutex;
};

} // namespace podscribe::application
