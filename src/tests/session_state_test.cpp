#include <gtest/gtest.h>
#include <sstream>
#include "server/session_state.hpp"

using namespace vault::server;

class SessionStateTest : public ::testing::Test {
protected:
    SessionState state;

    void advance_to_ready() {
        ASSERT_TRUE(state.transition_to(SessionState::State::HANDSHAKING));
        ASSERT_TRUE(state.transition_to(SessionState::State::AUTHENTICATING));
        ASSERT_TRUE(state.transition_to(SessionState::State::READY));
    }
};

// Test initial state
TEST_F(SessionStateTest, InitialState) {
    EXPECT_EQ(state.get_state(), SessionState::State::CONNECTING);
    EXPECT_EQ(state.get_state_string(), "CONNECTING");
    EXPECT_FALSE(state.is_terminal());
}

// Handshake, authentication and transfers in protocol order
TEST_F(SessionStateTest, ProtocolOrderTransitions) {
    advance_to_ready();
    EXPECT_EQ(state.get_state(), SessionState::State::READY);

    EXPECT_TRUE(state.transition_to(SessionState::State::UPLOADING));
    EXPECT_TRUE(state.transition_to(SessionState::State::READY));
    EXPECT_TRUE(state.transition_to(SessionState::State::DOWNLOADING));
    EXPECT_TRUE(state.transition_to(SessionState::State::READY));
    EXPECT_TRUE(state.transition_to(SessionState::State::TERMINATED));
    EXPECT_TRUE(state.is_terminal());
}

// Commands cannot be reached without authenticating
TEST_F(SessionStateTest, SkippingStepsIsRejected) {
    EXPECT_FALSE(state.transition_to(SessionState::State::READY));
    EXPECT_FALSE(state.transition_to(SessionState::State::AUTHENTICATING));

    ASSERT_TRUE(state.transition_to(SessionState::State::HANDSHAKING));
    EXPECT_FALSE(state.transition_to(SessionState::State::READY));
    EXPECT_FALSE(state.transition_to(SessionState::State::UPLOADING));
    EXPECT_EQ(state.get_state(), SessionState::State::HANDSHAKING);
}

// One transfer at a time
TEST_F(SessionStateTest, TransfersDoNotNest) {
    advance_to_ready();
    ASSERT_TRUE(state.transition_to(SessionState::State::UPLOADING));
    EXPECT_FALSE(state.transition_to(SessionState::State::DOWNLOADING));
    EXPECT_FALSE(state.transition_to(SessionState::State::UPLOADING));
    EXPECT_EQ(state.get_state(), SessionState::State::UPLOADING);
}

// Every state may terminate
TEST_F(SessionStateTest, TerminateFromAnyState) {
    for (auto from : {SessionState::State::CONNECTING, SessionState::State::HANDSHAKING,
                      SessionState::State::AUTHENTICATING, SessionState::State::READY,
                      SessionState::State::UPLOADING, SessionState::State::DOWNLOADING}) {
        EXPECT_TRUE(SessionState::is_valid_transition(from, SessionState::State::TERMINATED))
            << SessionState::state_to_string(from);
    }
}

// Terminated is final
TEST_F(SessionStateTest, TerminatedHasNoExits) {
    ASSERT_TRUE(state.transition_to(SessionState::State::TERMINATED));
    EXPECT_FALSE(state.transition_to(SessionState::State::HANDSHAKING));
    EXPECT_FALSE(state.transition_to(SessionState::State::READY));
    EXPECT_FALSE(state.transition_to(SessionState::State::TERMINATED));
    EXPECT_EQ(state.get_state(), SessionState::State::TERMINATED);
}

TEST_F(SessionStateTest, StreamOperator) {
    std::ostringstream out;
    out << SessionState::State::DOWNLOADING;
    EXPECT_EQ(out.str(), "DOWNLOADING");
}
