//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TaskManager.cpp
// Purpose: Task store eviction, worker lifecycle and cooperative cancellation
//==========================================================================================================

#include "mcphost/TaskManager.h"
#include "mcphost/errors/Errors.h"
#include "logging/Logger.h"

#include <algorithm>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fmt/chrono.h>
#include <fmt/format.h>

namespace mcphost {

///////////////////////////////////////// Task model ///////////////////////////////////////////
const char* toString(TaskState state) {
    switch (state) {
        case TaskState::Pending: return "pending";
        case TaskState::Running: return "running";
        case TaskState::Completed: return "completed";
        case TaskState::Failed: return "failed";
        case TaskState::Cancelled: return "cancelled";
    }
    return "unknown";
}

std::optional<TaskState> taskStateFromString(std::string_view s) {
    if (s == "pending") return TaskState::Pending;
    if (s == "running") return TaskState::Running;
    if (s == "completed") return TaskState::Completed;
    if (s == "failed") return TaskState::Failed;
    if (s == "cancelled") return TaskState::Cancelled;
    return std::nullopt;
}

bool isTerminal(TaskState state) {
    return state == TaskState::Completed || state == TaskState::Failed || state == TaskState::Cancelled;
}

namespace {
std::string isoTimestamp(TaskRecord::Clock::time_point tp) {
    const auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp - secs).count();
    const std::time_t t = TaskRecord::Clock::to_time_t(secs);
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03d}Z", fmt::gmtime(t), static_cast<int>(ms));
}

std::string newTaskId() {
    static thread_local boost::uuids::random_generator gen;
    return boost::uuids::to_string(gen());
}
} // namespace

JSONValue TaskRecord::toJSON() const {
    JSONValue::Object o;
    o["taskId"] = std::make_shared<JSONValue>(id);
    o["method"] = std::make_shared<JSONValue>(method);
    o["status"] = std::make_shared<JSONValue>(toString(state));
    o["createdAt"] = std::make_shared<JSONValue>(isoTimestamp(createdAt));
    o["updatedAt"] = std::make_shared<JSONValue>(isoTimestamp(updatedAt));
    if (completedAt.has_value()) {
        o["completedAt"] = std::make_shared<JSONValue>(isoTimestamp(*completedAt));
    }
    if (progress.has_value()) {
        JSONValue::Object p;
        p["current"] = std::make_shared<JSONValue>(progress->current);
        if (progress->total.has_value()) p["total"] = std::make_shared<JSONValue>(*progress->total);
        if (progress->message.has_value()) p["message"] = std::make_shared<JSONValue>(*progress->message);
        o["progress"] = std::make_shared<JSONValue>(std::move(p));
    }
    if (result.has_value()) o["result"] = std::make_shared<JSONValue>(*result);
    if (error.has_value()) o["error"] = std::make_shared<JSONValue>(*error);
    if (sessionId.has_value()) o["sessionId"] = std::make_shared<JSONValue>(*sessionId);
    return JSONValue(std::move(o));
}

///////////////////////////////////////// TaskStore ///////////////////////////////////////////
TaskStore::TaskStore(std::size_t capacity, std::chrono::seconds retention)
    : capacity(capacity == 0 ? 1 : capacity), retention(retention) {}

bool TaskStore::expiredLocked(const TaskRecord& r, TaskRecord::Clock::time_point now) const {
    return isTerminal(r.state) && r.completedAt.has_value() && (now - *r.completedAt) >= retention;
}

std::size_t TaskStore::evictLocked(std::size_t wanted, TaskRecord::Clock::time_point now) {
    // order is creation order; evict the oldest expired terminal tasks first
    std::size_t removed = 0;
    for (auto it = order.begin(); it != order.end() && removed < wanted;) {
        auto rec = records.find(*it);
        if (rec != records.end() && expiredLocked(rec->second, now)) {
            records.erase(rec);
            it = order.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void TaskStore::Insert(TaskRecord record) {
    std::lock_guard<std::mutex> lock(mutex);
    if (records.size() >= capacity) {
        const std::size_t wanted = records.size() - capacity + 1;
        const std::size_t removed = evictLocked(wanted, TaskRecord::Clock::now());
        if (removed < wanted) {
            LOG_WARN("Task store at capacity ({}); admitting task {} over the limit", capacity, record.id);
        }
    }
    order.push_back(record.id);
    records.emplace(record.id, std::move(record));
    changed.notify_all();
}

std::optional<TaskRecord> TaskStore::Get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = records.find(id);
    if (it == records.end()) return std::nullopt;
    return it->second;
}

std::optional<TaskRecord> TaskStore::Update(const std::string& id, const std::function<void(TaskRecord&)>& fn) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = records.find(id);
    if (it == records.end()) return std::nullopt;
    fn(it->second);
    changed.notify_all();
    return it->second;
}

std::vector<TaskRecord> TaskStore::List(const std::optional<std::string>& sessionId,
                                        const std::optional<TaskState>& state) const {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<TaskRecord> out;
    for (const auto& id : order) {
        auto it = records.find(id);
        if (it == records.end()) continue;
        const TaskRecord& r = it->second;
        if (sessionId.has_value() && r.sessionId != sessionId) continue;
        if (state.has_value() && r.state != *state) continue;
        out.push_back(r);
    }
    return out;
}

std::size_t TaskStore::Sweep() {
    std::lock_guard<std::mutex> lock(mutex);
    return evictLocked(records.size(), TaskRecord::Clock::now());
}

std::optional<TaskRecord> TaskStore::WaitForTerminal(const std::string& id, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex);
    changed.wait_for(lock, timeout, [&] {
        auto it = records.find(id);
        return it == records.end() || isTerminal(it->second.state);
    });
    auto it = records.find(id);
    if (it == records.end()) return std::nullopt;
    return it->second;
}

std::size_t TaskStore::Size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return records.size();
}

///////////////////////////////////////// TaskManager ///////////////////////////////////////////
TaskManager::TaskManager() : TaskManager(Options{}) {}

TaskManager::TaskManager(Options opts)
    : options(opts), store(opts.capacity, opts.retention) {}

TaskManager::~TaskManager() {
    std::unordered_map<std::string, std::unique_ptr<Worker>> toJoin;
    {
        std::lock_guard<std::mutex> lock(workersMutex);
        toJoin.swap(workers);
    }
    for (auto& [id, w] : toJoin) {
        w->stop.request_stop();
    }
    // jthread destructors join here
    toJoin.clear();
}

TaskRecord TaskManager::CreateTask(const std::string& method, const JSONValue& params,
                                   const std::optional<std::string>& sessionId) {
    TaskRecord r;
    r.id = newTaskId();
    r.method = method;
    r.params = params;
    r.state = TaskState::Pending;
    r.createdAt = TaskRecord::Clock::now();
    r.updatedAt = r.createdAt;
    r.sessionId = sessionId;
    store.Insert(r);
    {
        std::lock_guard<std::mutex> lock(workersMutex);
        reapFinishedLocked();
        workers.emplace(r.id, std::make_unique<Worker>());
    }
    LOG_DEBUG("Task created: {} ({})", r.id, method);
    return r;
}

bool TaskManager::Start(const std::string& taskId, TaskWork work) {
    auto current = store.Get(taskId);
    if (!current.has_value() || current->state != TaskState::Pending) {
        return false;
    }
    std::lock_guard<std::mutex> lock(workersMutex);
    auto it = workers.find(taskId);
    if (it == workers.end() || it->second->thread.joinable()) {
        return false;
    }
    Worker* w = it->second.get();
    w->thread = std::jthread([this, taskId, w, work = std::move(work)]() {
        runWorker(taskId, w, work);
    });
    return true;
}

TaskRecord TaskManager::Submit(const std::string& method, const JSONValue& params, TaskWork work,
                               const std::optional<std::string>& sessionId) {
    TaskRecord r = CreateTask(method, params, sessionId);
    if (!Start(r.id, std::move(work))) {
        LOG_WARN("Task {} was not started (state changed before start)", r.id);
    }
    return r;
}

void TaskManager::runWorker(const std::string& taskId, Worker* worker, const TaskWork& work) {
    bool proceed = false;
    store.Update(taskId, [&](TaskRecord& r) {
        if (r.state == TaskState::Pending) {
            r.state = TaskState::Running;
            r.updatedAt = TaskRecord::Clock::now();
            proceed = true;
        }
    });

    if (proceed) {
        TaskContext ctx;
        ctx.taskId = taskId;
        ctx.stopToken = worker->stop.get_token();
        ctx.progress = [this, taskId](double current, std::optional<double> total, std::optional<std::string> message) {
            UpdateProgress(taskId, current, total, std::move(message));
        };

        std::optional<JSONValue> result;
        std::optional<JSONValue> error;
        try {
            result = work(ctx);
        } catch (const std::exception& e) {
            LOG_WARN("Task {} failed: {}", taskId, e.what());
            error = CreateErrorObject(JSONRPCErrorCodes::InternalError, e.what());
        } catch (...) {
            LOG_WARN("Task {} failed with a non-standard exception", taskId);
            error = CreateErrorObject(JSONRPCErrorCodes::InternalError, "Unknown error");
        }

        store.Update(taskId, [&](TaskRecord& r) {
            // cancelled (or any terminal state) is final; a stop request leaves the mark to Cancel()
            if (isTerminal(r.state) || worker->stop.stop_requested()) return;
            const auto now = TaskRecord::Clock::now();
            r.updatedAt = now;
            r.completedAt = now;
            if (error.has_value()) {
                r.state = TaskState::Failed;
                r.error = std::move(error);
            } else {
                r.state = TaskState::Completed;
                r.result = std::move(result);
            }
        });
    }

    std::lock_guard<std::mutex> lock(workersMutex);
    worker->finished = true;
    workersCv.notify_all();
}

bool TaskManager::UpdateProgress(const std::string& taskId, double current, std::optional<double> total,
                                 std::optional<std::string> message) {
    bool applied = false;
    store.Update(taskId, [&](TaskRecord& r) {
        if (isTerminal(r.state)) return;
        r.progress = TaskProgress{current, total, std::move(message)};
        r.updatedAt = TaskRecord::Clock::now();
        applied = true;
    });
    return applied;
}

std::optional<TaskRecord> TaskManager::Cancel(const std::string& taskId) {
    auto current = store.Get(taskId);
    if (!current.has_value() || isTerminal(current->state)) {
        return current;
    }

    {
        std::unique_lock<std::mutex> lock(workersMutex);
        auto it = workers.find(taskId);
        if (it != workers.end()) {
            Worker* w = it->second.get();
            w->stop.request_stop();
            if (w->thread.joinable()) {
                workersCv.wait_for(lock, options.cancelGrace, [w] { return w->finished; });
            }
        }
    }

    bool transitioned = false;
    auto updated = store.Update(taskId, [&](TaskRecord& r) {
        if (isTerminal(r.state)) return;
        const auto now = TaskRecord::Clock::now();
        r.state = TaskState::Cancelled;
        r.updatedAt = now;
        r.completedAt = now;
        transitioned = true;
    });
    if (transitioned) {
        LOG_INFO("Task cancelled: {}", taskId);
    }
    return updated;
}

std::optional<TaskRecord> TaskManager::Get(const std::string& taskId) const {
    return store.Get(taskId);
}

std::vector<TaskRecord> TaskManager::List(const std::optional<std::string>& sessionId,
                                          const std::optional<TaskState>& state) const {
    return store.List(sessionId, state);
}

std::optional<TaskRecord> TaskManager::WaitForTerminal(const std::string& taskId, std::chrono::milliseconds timeout) const {
    return store.WaitForTerminal(taskId, timeout);
}

std::size_t TaskManager::Sweep() {
    {
        std::lock_guard<std::mutex> lock(workersMutex);
        reapFinishedLocked();
    }
    return store.Sweep();
}

void TaskManager::reapFinishedLocked() {
    for (auto it = workers.begin(); it != workers.end();) {
        const bool started = it->second->thread.joinable();
        bool drop = it->second->finished;
        if (!started && !drop) {
            // never started: drop once the task is terminal or gone
            auto rec = store.Get(it->first);
            drop = !rec.has_value() || isTerminal(rec->state);
        }
        if (drop) {
            it = workers.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace mcphost
