#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/a2a_errors.hpp"
#include "protocol/task_contract.hpp"

namespace a2a::task {

struct CreateTaskOptions {
    std::string id;
    std::optional<std::string> context_id;
    std::optional<nlohmann::json> metadata;
};

// Sole owner of Task records. Every operation runs in one critical section
// and hands back a snapshot, so callers never hold a reference into the store.
class TaskStore {
public:
    // Existing tasks are returned unchanged (first write wins).
    protocol::Task create(const CreateTaskOptions& options);

    std::optional<protocol::Task> get(const std::string& id) const;
    core::errors::Result<protocol::Task> get_or_fail(const std::string& id) const;
    bool has(const std::string& id) const;

    core::errors::Result<protocol::Task> update_status(
        const std::string& id, protocol::TaskState target,
        std::optional<protocol::Message> message = std::nullopt);

    core::errors::Result<protocol::Task> set_working(const std::string& id);
    core::errors::Result<protocol::Task> set_completed(
        const std::string& id, std::optional<protocol::Message> message = std::nullopt);
    core::errors::Result<protocol::Task> set_failed(
        const std::string& id, std::optional<protocol::Message> message = std::nullopt);
    core::errors::Result<protocol::Task> set_canceled(const std::string& id);
    core::errors::Result<protocol::Task> set_input_required(
        const std::string& id, std::optional<protocol::Message> message = std::nullopt);

    core::errors::Result<protocol::Task> append_history(const std::string& id,
                                                        protocol::Message message);

    // Starts a turn in one critical section: creates the task when absent,
    // records the inbound message and moves the task to working. When the
    // task cannot move to working the store is left untouched.
    core::errors::Result<protocol::Task> begin_turn(const CreateTaskOptions& options,
                                                    protocol::Message message);
    core::errors::Result<protocol::Task> add_artifact(const std::string& id,
                                                      protocol::Artifact artifact);

    // Merges a streaming delta into the artifact at index. An index past the
    // end is accepted and appended as a new artifact.
    core::errors::Result<protocol::Task> update_artifact(const std::string& id,
                                                         std::size_t index,
                                                         const protocol::Artifact& delta);

    bool remove(const std::string& id);
    void clear();
    std::vector<std::string> keys() const;
    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, protocol::Task> tasks_;
    std::vector<std::string> order_;
};

}  // namespace a2a::task
