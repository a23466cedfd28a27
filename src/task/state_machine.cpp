#include "task/state_machine.hpp"

#include <algorithm>

namespace a2a::task {

using core::errors::A2AError;
using core::errors::ErrorCategory;
using protocol::TaskState;

std::vector<TaskState> TaskStateMachine::valid_transitions(const TaskState from) const {
    switch (from) {
        case TaskState::Submitted:
            return {TaskState::Working, TaskState::Canceled, TaskState::Failed};
        case TaskState::Working:
            return {TaskState::Completed, TaskState::Failed, TaskState::Canceled,
                    TaskState::InputRequired};
        case TaskState::InputRequired:
            return {TaskState::Working, TaskState::Canceled, TaskState::Failed};
        case TaskState::Unknown:
            return {TaskState::Submitted, TaskState::Working, TaskState::Completed,
                    TaskState::Failed, TaskState::Canceled, TaskState::InputRequired};
        case TaskState::Completed:
        case TaskState::Canceled:
        case TaskState::Failed:
        default:
            return {};
    }
}

bool TaskStateMachine::can_transition(const TaskState from, const TaskState to) const {
    const auto targets = valid_transitions(from);
    return std::find(targets.begin(), targets.end(), to) != targets.end();
}

core::errors::Result<core::errors::Ok> TaskStateMachine::assert_transition(
    const TaskState from, const TaskState to) const {
    if (!can_transition(from, to)) {
        return A2AError{ErrorCategory::InvalidTransition,
                        "Invalid state transition: " + protocol::to_string(from) +
                            " -> " + protocol::to_string(to),
                        "invalid_state_transition",
                        "",
                        {{"from", protocol::to_string(from)},
                         {"to", protocol::to_string(to)}}};
    }
    return core::errors::Ok{};
}

bool TaskStateMachine::is_terminal(const TaskState state) const {
    return state == TaskState::Completed || state == TaskState::Canceled ||
           state == TaskState::Failed;
}

const TaskStateMachine& task_state_machine() {
    static const TaskStateMachine instance{};
    return instance;
}

}  // namespace a2a::task
