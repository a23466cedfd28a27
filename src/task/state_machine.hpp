#pragma once

#include <string>
#include <vector>
#include "core/errors/a2a_errors.hpp"
#include "protocol/task_contract.hpp"

namespace a2a::task {

// Stateless transition rules for the task lifecycle. One shared instance or
// one per call behave identically.
class TaskStateMachine {
public:
    bool can_transition(protocol::TaskState from, protocol::TaskState to) const;

    // InvalidTransition error when can_transition is false.
    core::errors::Result<core::errors::Ok> assert_transition(
        protocol::TaskState from, protocol::TaskState to) const;

    bool is_terminal(protocol::TaskState state) const;

    // Targets in table order.
    std::vector<protocol::TaskState> valid_transitions(protocol::TaskState from) const;
};

const TaskStateMachine& task_state_machine();

}  // namespace a2a::task
