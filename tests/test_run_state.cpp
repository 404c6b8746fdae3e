#include <gtest/gtest.h>
#include "core/RunResult.h"
#include <stdexcept>

namespace pattern_harness {

TEST(RunStateTest, HappyPath) {
    RunTracker t;
    EXPECT_EQ(t.state(), RunState::Pending);
    t.advance(RunState::Setup);
    t.advance(RunState::Running);
    t.advance(RunState::Succeeded);
    EXPECT_EQ(t.state(), RunState::Succeeded);
    EXPECT_EQ(t.trace().size(), 4u);
}

TEST(RunStateTest, ErroredReachableFromSetupAndRunning) {
    EXPECT_TRUE(is_legal_transition(RunState::Setup, RunState::Errored));
    EXPECT_TRUE(is_legal_transition(RunState::Running, RunState::Errored));
    EXPECT_FALSE(is_legal_transition(RunState::Pending, RunState::Errored));
}

TEST(RunStateTest, FailedOnlyFromRunning) {
    EXPECT_TRUE(is_legal_transition(RunState::Running, RunState::Failed));
    EXPECT_FALSE(is_legal_transition(RunState::Setup, RunState::Failed));
    EXPECT_FALSE(is_legal_transition(RunState::Pending, RunState::Failed));
}

TEST(RunStateTest, NoSkippingSetup) {
    RunTracker t;
    EXPECT_THROW(t.advance(RunState::Running), std::logic_error);
    EXPECT_THROW(t.advance(RunState::Succeeded), std::logic_error);
    EXPECT_EQ(t.state(), RunState::Pending);
    EXPECT_EQ(t.trace().size(), 1u);
}

TEST(RunStateTest, TerminalStatesAreFinal) {
    for(RunState terminal : {RunState::Succeeded, RunState::Failed, RunState::Errored}) {
        EXPECT_TRUE(is_terminal(terminal));
        for(RunState next : {RunState::Pending, RunState::Setup, RunState::Running,
                             RunState::Succeeded, RunState::Failed, RunState::Errored}) {
            EXPECT_FALSE(is_legal_transition(terminal, next)) << state_name(terminal) << " -> " << state_name(next);
        }
    }
    RunTracker t;
    t.advance(RunState::Setup);
    t.advance(RunState::Errored);
    EXPECT_THROW(t.advance(RunState::Running), std::logic_error);
}

TEST(RunStateTest, Names) {
    EXPECT_STREQ(status_name(RunStatus::Success), "SUCCESS");
    EXPECT_STREQ(status_name(RunStatus::Failure), "FAILED");
    EXPECT_STREQ(status_name(RunStatus::Error), "ERRORED");
    EXPECT_STREQ(state_name(RunState::Running), "running");
    EXPECT_FALSE(is_terminal(RunState::Running));
}

}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
