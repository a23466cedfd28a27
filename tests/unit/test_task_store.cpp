#include <atomic>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "core/errors/a2a_errors.hpp"
#include "task/state_machine.hpp"
#include "task/task_store.hpp"

namespace {

using a2a::core::errors::ErrorCategory;
using a2a::core::errors::get_error;
using a2a::core::errors::get_value;
using a2a::core::errors::is_error;
using a2a::protocol::Artifact;
using a2a::protocol::Role;
using a2a::protocol::TaskState;
using a2a::protocol::TextPart;
using a2a::task::CreateTaskOptions;
using a2a::task::TaskStore;

Artifact text_chunk(const std::string& text, bool append, bool last_chunk) {
    Artifact artifact;
    artifact.parts.emplace_back(TextPart{text, std::nullopt});
    artifact.index = 0;
    artifact.append = append;
    artifact.last_chunk = last_chunk;
    return artifact;
}

TEST(TaskStoreTest, CreateStartsSubmitted) {
    TaskStore store;
    const auto task = store.create(CreateTaskOptions{"t1", std::string("ctx"), std::nullopt});
    EXPECT_EQ(task.id, "t1");
    EXPECT_EQ(task.status.state, TaskState::Submitted);
    EXPECT_EQ(task.context_id.value_or(""), "ctx");
    EXPECT_FALSE(task.status.timestamp.empty());
    EXPECT_TRUE(task.history.empty());
    EXPECT_TRUE(store.has("t1"));
}

TEST(TaskStoreTest, CreateIsIdempotent) {
    TaskStore store;
    store.create(CreateTaskOptions{"t1", std::string("first"), std::nullopt});
    ASSERT_FALSE(is_error(store.set_working("t1")));

    const auto again = store.create(CreateTaskOptions{"t1", std::string("second"), std::nullopt});
    EXPECT_EQ(again.status.state, TaskState::Working);
    EXPECT_EQ(again.context_id.value_or(""), "first");
    EXPECT_EQ(store.size(), 1u);
}

TEST(TaskStoreTest, UnknownIdIsTaskNotFound) {
    TaskStore store;
    EXPECT_FALSE(store.get("missing").has_value());

    auto result = store.set_working("missing");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::TaskNotFound);
    EXPECT_TRUE(is_error(store.append_history("missing", a2a::protocol::make_text_message(Role::User, "x"))));
    EXPECT_TRUE(is_error(store.get_or_fail("missing")));
}

TEST(TaskStoreTest, DeniedTransitionLeavesTaskUnchanged) {
    TaskStore store;
    store.create(CreateTaskOptions{"t1", std::nullopt, std::nullopt});

    auto result = store.set_completed("t1");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::InvalidTransition);
    EXPECT_EQ(get_error(result).data["from"], "submitted");
    EXPECT_EQ(store.get("t1")->status.state, TaskState::Submitted);
}

TEST(TaskStoreTest, StatusCarriesOptionalMessage) {
    TaskStore store;
    store.create(CreateTaskOptions{"t1", std::nullopt, std::nullopt});
    ASSERT_FALSE(is_error(store.set_working("t1")));

    auto result = store.set_input_required(
        "t1", a2a::protocol::make_text_message(Role::Agent, "Which file?"));
    ASSERT_FALSE(is_error(result));
    const auto& status = get_value(result).status;
    EXPECT_EQ(status.state, TaskState::InputRequired);
    ASSERT_TRUE(status.message.has_value());
    EXPECT_EQ(std::get<TextPart>(status.message->parts.front()).text, "Which file?");
}

TEST(TaskStoreTest, SnapshotsAreIndependentOfStore) {
    TaskStore store;
    store.create(CreateTaskOptions{"t1", std::nullopt, std::nullopt});

    auto snapshot = store.get("t1").value();
    snapshot.history.push_back(a2a::protocol::make_text_message(Role::User, "local only"));
    EXPECT_TRUE(store.get("t1")->history.empty());
}

TEST(TaskStoreTest, UpdateArtifactConcatenatesAppendedText) {
    TaskStore store;
    store.create(CreateTaskOptions{"t1", std::nullopt, std::nullopt});
    ASSERT_FALSE(is_error(store.add_artifact("t1", text_chunk("Hel", false, false))));
    ASSERT_FALSE(is_error(store.update_artifact("t1", 0, text_chunk("lo", true, false))));

    auto result = store.update_artifact("t1", 0, text_chunk("", true, true));
    ASSERT_FALSE(is_error(result));
    const auto& artifacts = get_value(result).artifacts;
    ASSERT_EQ(artifacts.size(), 1u);
    EXPECT_EQ(std::get<TextPart>(artifacts[0].parts.back()).text, "Hello");
    EXPECT_TRUE(artifacts[0].last_chunk.value_or(false));
}

TEST(TaskStoreTest, UpdateArtifactPastEndAppendsNewArtifact) {
    TaskStore store;
    store.create(CreateTaskOptions{"t1", std::nullopt, std::nullopt});

    auto result = store.update_artifact("t1", 5, text_chunk("x", false, true));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).artifacts.size(), 1u);
}

TEST(TaskStoreTest, KeysKeepInsertionOrder) {
    TaskStore store;
    store.create(CreateTaskOptions{"b", std::nullopt, std::nullopt});
    store.create(CreateTaskOptions{"a", std::nullopt, std::nullopt});
    store.create(CreateTaskOptions{"c", std::nullopt, std::nullopt});
    EXPECT_TRUE(store.remove("a"));
    EXPECT_FALSE(store.remove("a"));

    const std::vector<std::string> expected{"b", "c"};
    EXPECT_EQ(store.keys(), expected);

    store.clear();
    EXPECT_EQ(store.size(), 0u);
    EXPECT_TRUE(store.keys().empty());
}

const std::vector<TaskState> kAllStates{
    TaskState::Submitted, TaskState::Working,  TaskState::InputRequired, TaskState::Completed,
    TaskState::Canceled,  TaskState::Failed,   TaskState::Unknown};

// Drives a fresh task "t1" into the given non-terminal state.
void drive_to(TaskStore& store, TaskState state) {
    store.create(CreateTaskOptions{"t1", std::nullopt, std::nullopt});
    if (state == TaskState::Working || state == TaskState::InputRequired) {
        ASSERT_FALSE(is_error(store.set_working("t1")));
    }
    if (state == TaskState::InputRequired) {
        ASSERT_FALSE(is_error(store.set_input_required("t1")));
    }
}

TEST(TaskStoreTest, EveryDisallowedTargetIsRejectedWithoutChange) {
    const auto& machine = a2a::task::task_state_machine();
    for (TaskState from : {TaskState::Submitted, TaskState::Working, TaskState::InputRequired}) {
        for (TaskState target : kAllStates) {
            TaskStore store;
            drive_to(store, from);
            const auto before = store.get("t1").value();

            auto result = store.update_status("t1", target);
            const std::string label = a2a::protocol::to_string(from) + " -> " +
                                      a2a::protocol::to_string(target);
            if (machine.can_transition(from, target)) {
                ASSERT_FALSE(is_error(result)) << label;
                EXPECT_EQ(get_value(result).status.state, target) << label;
                continue;
            }

            ASSERT_TRUE(is_error(result)) << label;
            EXPECT_EQ(get_error(result).category, ErrorCategory::InvalidTransition) << label;
            const auto after = store.get("t1").value();
            EXPECT_EQ(after.status.state, before.status.state) << label;
            EXPECT_EQ(after.status.timestamp, before.status.timestamp) << label;
        }
    }
}

TEST(TaskStoreTest, BeginTurnCreatesRecordsAndStartsWork) {
    TaskStore store;
    auto result = store.begin_turn(CreateTaskOptions{"t1", std::string("ctx"), std::nullopt},
                                   a2a::protocol::make_text_message(Role::User, "hi"));
    ASSERT_FALSE(is_error(result));

    const auto& task = get_value(result);
    EXPECT_EQ(task.status.state, TaskState::Working);
    EXPECT_EQ(task.context_id.value_or(""), "ctx");
    ASSERT_EQ(task.history.size(), 1u);
    EXPECT_EQ(std::get<TextPart>(task.history[0].parts.front()).text, "hi");
}

TEST(TaskStoreTest, BeginTurnOnTerminalTaskLeavesItUntouched) {
    TaskStore store;
    store.create(CreateTaskOptions{"t1", std::nullopt, std::nullopt});
    ASSERT_FALSE(is_error(store.set_canceled("t1")));

    auto result = store.begin_turn(CreateTaskOptions{"t1", std::nullopt, std::nullopt},
                                   a2a::protocol::make_text_message(Role::User, "late"));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::InvalidTransition);
    EXPECT_EQ(get_error(result).message,
              "Task \"t1\" cannot accept a new message in state: canceled");

    const auto task = store.get("t1").value();
    EXPECT_EQ(task.status.state, TaskState::Canceled);
    EXPECT_TRUE(task.history.empty());
}

TEST(TaskStoreTest, ConcurrentTurnsOnSameIdAdmitExactlyOne) {
    TaskStore store;
    std::atomic_bool go{false};
    std::atomic_int admitted{0};

    std::vector<std::thread> senders;
    for (int s = 0; s < 8; ++s) {
        senders.emplace_back([&]() {
            while (!go.load()) {
                std::this_thread::yield();
            }
            auto result = store.begin_turn(CreateTaskOptions{"t1", std::nullopt, std::nullopt},
                                           a2a::protocol::make_text_message(Role::User, "m"));
            if (!is_error(result)) {
                ++admitted;
            } else {
                EXPECT_EQ(get_error(result).category, ErrorCategory::InvalidTransition);
            }
        });
    }
    go.store(true);
    for (auto& sender : senders) {
        sender.join();
    }

    EXPECT_EQ(admitted.load(), 1);
    const auto task = store.get("t1").value();
    EXPECT_EQ(task.status.state, TaskState::Working);
    EXPECT_EQ(task.history.size(), 1u);
    EXPECT_EQ(store.size(), 1u);
}

TEST(TaskStoreTest, TurnRacingCancelNeverLeavesStrayMessage) {
    for (int round = 0; round < 50; ++round) {
        TaskStore store;
        store.create(CreateTaskOptions{"t1", std::nullopt, std::nullopt});
        std::atomic_bool go{false};
        bool turn_started = false;

        std::thread sender([&]() {
            while (!go.load()) {
                std::this_thread::yield();
            }
            auto result = store.begin_turn(CreateTaskOptions{"t1", std::nullopt, std::nullopt},
                                           a2a::protocol::make_text_message(Role::User, "m"));
            turn_started = !is_error(result);
        });
        std::thread canceler([&]() {
            while (!go.load()) {
                std::this_thread::yield();
            }
            EXPECT_FALSE(is_error(store.set_canceled("t1")));
        });
        go.store(true);
        sender.join();
        canceler.join();

        const auto task = store.get("t1").value();
        EXPECT_EQ(task.status.state, TaskState::Canceled);
        EXPECT_EQ(task.history.size(), turn_started ? 1u : 0u);
    }
}

TEST(TaskStoreTest, ConcurrentHistoryAppendsAreAllRecorded) {
    TaskStore store;
    store.create(CreateTaskOptions{"t1", std::nullopt, std::nullopt});

    std::vector<std::thread> writers;
    for (int w = 0; w < 4; ++w) {
        writers.emplace_back([&store]() {
            for (int i = 0; i < 50; ++i) {
                auto appended = store.append_history(
                    "t1", a2a::protocol::make_text_message(Role::User, "m"));
                EXPECT_FALSE(is_error(appended));
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }
    EXPECT_EQ(store.get("t1")->history.size(), 200u);
}

}  // namespace
