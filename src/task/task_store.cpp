#include "task/task_store.hpp"

#include <algorithm>
#include <utility>
#include "core/config/timestamp.hpp"
#include "core/logging/logger.hpp"
#include "task/state_machine.hpp"

namespace a2a::task {

using core::errors::A2AError;
using core::errors::ErrorCategory;
using core::errors::Result;
using protocol::Artifact;
using protocol::Message;
using protocol::Task;
using protocol::TaskState;
using protocol::TextPart;

namespace {

Task make_task(const CreateTaskOptions& options) {
    Task task;
    task.id = options.id;
    task.context_id = options.context_id;
    task.status.state = TaskState::Submitted;
    task.status.timestamp = core::config::now_iso8601();
    task.metadata = options.metadata;
    return task;
}

}  // namespace

protocol::Task TaskStore::create(const CreateTaskOptions& options) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(options.id);
    if (it != tasks_.end()) {
        return it->second;
    }

    Task task = make_task(options);
    tasks_.emplace(options.id, task);
    order_.push_back(options.id);
    A2A_LOG_DEBUG("TaskStore: created task " + options.id);
    return task;
}

std::optional<protocol::Task> TaskStore::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Result<protocol::Task> TaskStore::get_or_fail(const std::string& id) const {
    auto task = get(id);
    if (!task.has_value()) {
        return core::errors::task_not_found(id);
    }
    return std::move(task.value());
}

bool TaskStore::has(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.find(id) != tasks_.end();
}

Result<protocol::Task> TaskStore::update_status(const std::string& id,
                                                const TaskState target,
                                                std::optional<Message> message) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return core::errors::task_not_found(id);
    }

    const TaskState current = it->second.status.state;
    if (!task_state_machine().can_transition(current, target)) {
        return A2AError{ErrorCategory::InvalidTransition,
                        "Invalid state transition for task \"" + id + "\": " +
                            protocol::to_string(current) + " -> " +
                            protocol::to_string(target),
                        "invalid_state_transition",
                        "",
                        {{"taskId", id},
                         {"from", protocol::to_string(current)},
                         {"to", protocol::to_string(target)}}};
    }

    protocol::TaskStatus status;
    status.state = target;
    status.timestamp = core::config::now_iso8601();
    status.message = std::move(message);
    it->second.status = std::move(status);

    A2A_LOG_INFO("TaskStore: task " + id + " transition " +
                 protocol::to_string(current) + " -> " + protocol::to_string(target));
    return it->second;
}

Result<protocol::Task> TaskStore::set_working(const std::string& id) {
    return update_status(id, TaskState::Working);
}

Result<protocol::Task> TaskStore::set_completed(const std::string& id,
                                                std::optional<Message> message) {
    return update_status(id, TaskState::Completed, std::move(message));
}

Result<protocol::Task> TaskStore::set_failed(const std::string& id,
                                             std::optional<Message> message) {
    return update_status(id, TaskState::Failed, std::move(message));
}

Result<protocol::Task> TaskStore::set_canceled(const std::string& id) {
    return update_status(id, TaskState::Canceled);
}

Result<protocol::Task> TaskStore::set_input_required(const std::string& id,
                                                     std::optional<Message> message) {
    return update_status(id, TaskState::InputRequired, std::move(message));
}

Result<protocol::Task> TaskStore::append_history(const std::string& id,
                                                 Message message) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return core::errors::task_not_found(id);
    }
    it->second.history.push_back(std::move(message));
    return it->second;
}

Result<protocol::Task> TaskStore::begin_turn(const CreateTaskOptions& options,
                                             Message message) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(options.id);
    if (it != tasks_.end()) {
        const TaskState current = it->second.status.state;
        if (!task_state_machine().can_transition(current, TaskState::Working)) {
            return A2AError{ErrorCategory::InvalidTransition,
                            "Task \"" + options.id +
                                "\" cannot accept a new message in state: " +
                                protocol::to_string(current),
                            "invalid_state_transition",
                            "",
                            {{"taskId", options.id},
                             {"from", protocol::to_string(current)},
                             {"to", protocol::to_string(TaskState::Working)}}};
        }
    } else {
        it = tasks_.emplace(options.id, make_task(options)).first;
        order_.push_back(options.id);
        A2A_LOG_DEBUG("TaskStore: created task " + options.id);
    }

    Task& task = it->second;
    const TaskState previous = task.status.state;
    task.history.push_back(std::move(message));
    task.status.state = TaskState::Working;
    task.status.timestamp = core::config::now_iso8601();
    task.status.message.reset();

    A2A_LOG_INFO("TaskStore: task " + options.id + " transition " +
                 protocol::to_string(previous) + " -> working");
    return task;
}

Result<protocol::Task> TaskStore::add_artifact(const std::string& id,
                                               Artifact artifact) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return core::errors::task_not_found(id);
    }
    it->second.artifacts.push_back(std::move(artifact));
    return it->second;
}

Result<protocol::Task> TaskStore::update_artifact(const std::string& id,
                                                  const std::size_t index,
                                                  const Artifact& delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return core::errors::task_not_found(id);
    }

    auto& artifacts = it->second.artifacts;
    if (index >= artifacts.size()) {
        artifacts.push_back(delta);
        return it->second;
    }

    Artifact& existing = artifacts[index];
    if (delta.append.value_or(false) && !existing.parts.empty() &&
        !delta.parts.empty()) {
        auto* last_text = std::get_if<TextPart>(&existing.parts.back());
        const auto* new_text = std::get_if<TextPart>(&delta.parts.front());
        if (last_text != nullptr && new_text != nullptr) {
            last_text->text += new_text->text;
        } else {
            existing.parts.push_back(delta.parts.front());
        }
    }
    if (delta.last_chunk.has_value()) {
        existing.last_chunk = delta.last_chunk;
    }
    return it->second;
}

bool TaskStore::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (tasks_.erase(id) == 0) {
        return false;
    }
    order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
    return true;
}

void TaskStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    tasks_.clear();
    order_.clear();
}

std::vector<std::string> TaskStore::keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return order_;
}

std::size_t TaskStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

}  // namespace a2a::task
