/**
 * @file AsyncTaskManager.hpp
 * @brief Background execution of analytics work with shared status handles.
 */

#pragma once

#include <string>
#include <vector>
#include <functional>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <memory>
#include <thread>
#include <algorithm>

namespace sessionlens::application {

/**
 * @enum TaskType
 * @brief Categories of background work.
 */
enum class TaskType {
    EventProcessing,
    Query,
    Export
};

inline std::string TaskTypeToString(TaskType type) {
    switch (type) {
        case TaskType::EventProcessing: return "event_processing";
        case TaskType::Query: return "query";
        case TaskType::Export: return "export";
        default: return "event_processing";
    }
}

/**
 * @struct TaskStatus
 * @brief Progress and outcome of a submitted task. Shared between the worker and the caller.
 */
struct TaskStatus {
    int id = 0;
    TaskType type = TaskType::EventProcessing;
    std::string description;
    std::atomic<float> progress{0.0f};
    std::atomic<bool> isCompleted{false};
    std::atomic<bool> failed{false};
    std::string errorMessage;  ///< Written before isCompleted is set.
};

/**
 * @class AsyncTaskManager
 * @brief Runs tasks on detached threads and tracks the ones still in flight.
 *
 * A task is marked completed and removed from the active list under one lock,
 * and the worker touches nothing of the manager afterwards. The destructor
 * therefore only returns once no worker can reach the manager again.
 */
class AsyncTaskManager {
public:
    AsyncTaskManager() = default;
    ~AsyncTaskManager() { WaitAll(); }

    AsyncTaskManager(const AsyncTaskManager&) = delete;
    AsyncTaskManager& operator=(const AsyncTaskManager&) = delete;

    /**
     * @brief Submits a task; `f` receives the status handle followed by `args`.
     * Exceptions thrown by `f` mark the task failed.
     */
    template<typename F, typename... Args>
    std::shared_ptr<TaskStatus> SubmitTask(TaskType type, const std::string& description, F&& f, Args&&... args) {
        auto status = std::make_shared<TaskStatus>();
        status->id = m_nextId++;
        status->type = type;
        status->description = description;

        {
            std::lock_guard<std::mutex> lock(m_tasksMutex);
            m_activeTasks.push_back(status);
        }

        std::thread([this, status](auto userFunc, auto... userArgs) {
            try {
                userFunc(status, std::move(userArgs)...);
                status->progress = 1.0f;
            } catch (const std::exception& e) {
                status->errorMessage = e.what();
                status->failed = true;
            } catch (...) {
                status->errorMessage = "Unknown error during task execution.";
                status->failed = true;
            }
            // Last access to the manager; it may be destroyed once the lock is released.
            Complete(status);
        }, std::forward<F>(f), std::forward<Args>(args)...).detach();

        return status;
    }

    /** @brief Snapshot of the tasks that have not completed yet. */
    std::vector<std::shared_ptr<TaskStatus>> GetActiveTasks() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        return m_activeTasks;
    }

    /** @brief Blocks until no submitted task is still running. */
    void WaitAll() {
        std::unique_lock<std::mutex> lock(m_tasksMutex);
        m_changed.wait(lock, [this] { return m_activeTasks.empty(); });
    }

    /** @brief Blocks until the given task has completed. */
    void Wait(const std::shared_ptr<TaskStatus>& status) {
        if (!status) return;
        std::unique_lock<std::mutex> lock(m_tasksMutex);
        m_changed.wait(lock, [&status] { return status->isCompleted.load(); });
    }

private:
    void Complete(const std::shared_ptr<TaskStatus>& status) {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        status->isCompleted = true;
        m_activeTasks.erase(std::remove(m_activeTasks.begin(), m_activeTasks.end(), status),
                            m_activeTasks.end());
        m_changed.notify_all();
    }

    std::atomic<int> m_nextId{0};
    std::vector<std::shared_ptr<TaskStatus>> m_activeTasks;
    std::mutex m_tasksMutex;
    std::condition_variable m_changed;
};

} // namespace sessionlens::application
