//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TaskManager.h
// Purpose: Durable state machine for long-running operations, bounded task store and worker threads
//==========================================================================================================

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>

#include "mcphost/JSONRPCTypes.h"

namespace mcphost {

///////////////////////////////////////// Task model ///////////////////////////////////////////
enum class TaskState {
    Pending,
    Running,
    Completed,
    Failed,
    Cancelled
};

const char* toString(TaskState state);
std::optional<TaskState> taskStateFromString(std::string_view s);
bool isTerminal(TaskState state);

struct TaskProgress {
    double current{0.0};
    std::optional<double> total;
    std::optional<std::string> message;
};

//==========================================================================================================
// TaskRecord
// Purpose: Snapshot of a task. Records handed out by TaskManager are copies; the store owns the original.
//==========================================================================================================
struct TaskRecord {
    using Clock = std::chrono::system_clock;

    std::string id;
    std::string method;
    JSONValue params;
    TaskState state{TaskState::Pending};
    std::optional<TaskProgress> progress;
    std::optional<JSONValue> result;
    std::optional<JSONValue> error; // { code, message }
    Clock::time_point createdAt{};
    Clock::time_point updatedAt{};
    std::optional<Clock::time_point> completedAt;
    std::optional<std::string> sessionId;

    JSONValue toJSON() const;
};

//==========================================================================================================
// TaskStore
// Purpose: Mutex-guarded task table in creation order, bounded by capacity and a retention window.
// Notes:
//   Only terminal tasks whose completion is older than the retention window are evicted. When the store is
//   full and nothing is evictable the new task is admitted anyway and a warning is logged.
//==========================================================================================================
class TaskStore {
public:
    TaskStore(std::size_t capacity, std::chrono::seconds retention);

    void Insert(TaskRecord record);
    std::optional<TaskRecord> Get(const std::string& id) const;

    // Apply fn to the stored record under the lock. Returns the updated copy, or nullopt when unknown.
    std::optional<TaskRecord> Update(const std::string& id, const std::function<void(TaskRecord&)>& fn);

    std::vector<TaskRecord> List(const std::optional<std::string>& sessionId,
                                 const std::optional<TaskState>& state) const;

    // Remove terminal tasks older than the retention window. Returns how many were removed.
    std::size_t Sweep();

    // Block until the task is terminal or the timeout elapses.
    std::optional<TaskRecord> WaitForTerminal(const std::string& id, std::chrono::milliseconds timeout) const;

    std::size_t Size() const;

private:
    std::size_t evictLocked(std::size_t wanted, TaskRecord::Clock::time_point now);
    bool expiredLocked(const TaskRecord& r, TaskRecord::Clock::time_point now) const;

    std::size_t capacity;
    std::chrono::seconds retention;
    mutable std::mutex mutex;
    mutable std::condition_variable changed;
    std::unordered_map<std::string, TaskRecord> records;
    std::deque<std::string> order;
};

//==========================================================================================================
// TaskContext
// Purpose: Handed to task work. stopToken is signalled by Cancel(); ReportProgress writes the record.
//==========================================================================================================
struct TaskContext {
    std::string taskId;
    std::stop_token stopToken;
    std::function<void(double current, std::optional<double> total, std::optional<std::string> message)> progress;

    void ReportProgress(double current, std::optional<double> total = std::nullopt,
                        std::optional<std::string> message = std::nullopt) const {
        if (progress) {
            progress(current, total, std::move(message));
        }
    }
};

using TaskWork = std::function<JSONValue(const TaskContext& ctx)>;

//==========================================================================================================
// TaskManager
// Purpose: Creates tasks, runs their work on dedicated threads and applies cancellation.
// States:
//   pending -> running -> completed | failed | cancelled. Terminal states are final.
//==========================================================================================================
class TaskManager {
public:
    struct Options {
        std::size_t capacity = 1000;
        std::chrono::seconds retention{3600};
        std::chrono::milliseconds cancelGrace{100};
    };

    TaskManager();
    explicit TaskManager(Options options);
    ~TaskManager();

    TaskManager(const TaskManager&) = delete;
    TaskManager& operator=(const TaskManager&) = delete;

    // Register a pending task; its id resolves before any work starts.
    TaskRecord CreateTask(const std::string& method, const JSONValue& params,
                          const std::optional<std::string>& sessionId = std::nullopt);

    // Run work for a created task on its own thread. Returns false when the task is unknown or no longer pending.
    bool Start(const std::string& taskId, TaskWork work);

    // CreateTask + Start
    TaskRecord Submit(const std::string& method, const JSONValue& params, TaskWork work,
                      const std::optional<std::string>& sessionId = std::nullopt);

    // Overwrite progress; never changes state. False when unknown or terminal.
    bool UpdateProgress(const std::string& taskId, double current, std::optional<double> total = std::nullopt,
                        std::optional<std::string> message = std::nullopt);

    //======================================================================================================
    // Cancel
    // Purpose: Cancel a pending or running task. The worker is asked to stop and given a short grace period
    //          to unwind, then the state becomes cancelled exactly once. Cancelling a terminal task is a no-op.
    //          Cancellation is cooperative: work that ignores its stop token keeps running to completion.
    // Returns:
    //   The task after cancellation, or nullopt when the id is unknown.
    //======================================================================================================
    std::optional<TaskRecord> Cancel(const std::string& taskId);

    std::optional<TaskRecord> Get(const std::string& taskId) const;
    std::vector<TaskRecord> List(const std::optional<std::string>& sessionId = std::nullopt,
                                 const std::optional<TaskState>& state = std::nullopt) const;
    std::optional<TaskRecord> WaitForTerminal(const std::string& taskId, std::chrono::milliseconds timeout) const;

    // Purge expired terminal tasks and reap finished worker threads.
    std::size_t Sweep();

private:
    struct Worker {
        std::stop_source stop;
        std::jthread thread;
        bool finished{false};
    };

    void reapFinishedLocked();
    void runWorker(const std::string& taskId, Worker* worker, const TaskWork& work);

    Options options;
    TaskStore store;
    std::mutex workersMutex;
    std::condition_variable workersCv;
    std::unordered_map<std::string, std::unique_ptr<Worker>> workers;
};

} // namespace mcphost
