#include <gtest/gtest.h>
#include <tollgate/schema/error_code.hpp>
#include <tollgate/schema/execution_state.hpp>

using tollgate::schema::can_transition;
using tollgate::schema::execution_state_t;

TEST(execution_state, forward_edges_are_allowed) {
  EXPECT_TRUE(can_transition(execution_state_t::received,
                             execution_state_t::blocked));
  EXPECT_TRUE(can_transition(execution_state_t::received,
                             execution_state_t::dispatched));
  EXPECT_TRUE(can_transition(execution_state_t::blocked,
                             execution_state_t::approved));
  EXPECT_TRUE(can_transition(execution_state_t::approved,
                             execution_state_t::dispatched));
  EXPECT_TRUE(can_transition(execution_state_t::dispatched,
                             execution_state_t::completed));
  EXPECT_TRUE(can_transition(execution_state_t::dispatched,
                             execution_state_t::failed));
}

TEST(execution_state, blocked_cannot_skip_approval) {
  EXPECT_FALSE(can_transition(execution_state_t::blocked,
                              execution_state_t::dispatched));
  EXPECT_FALSE(can_transition(execution_state_t::blocked,
                              execution_state_t::completed));
}

TEST(execution_state, terminal_states_never_move) {
  for (auto next : {execution_state_t::received, execution_state_t::blocked,
                    execution_state_t::approved, execution_state_t::dispatched,
                    execution_state_t::completed, execution_state_t::failed}) {
    EXPECT_FALSE(can_transition(execution_state_t::completed, next));
    EXPECT_FALSE(can_transition(execution_state_t::failed, next));
  }
  EXPECT_TRUE(tollgate::schema::is_terminal(execution_state_t::completed));
  EXPECT_TRUE(tollgate::schema::is_terminal(execution_state_t::failed));
  EXPECT_FALSE(tollgate::schema::is_terminal(execution_state_t::blocked));
}

TEST(execution_state, wire_names_round_trip) {
  EXPECT_EQ(tollgate::schema::to_string(execution_state_t::dispatched),
            "DISPATCHED");
  EXPECT_EQ(tollgate::schema::try_from_string<execution_state_t>("BLOCKED"),
            execution_state_t::blocked);
  EXPECT_FALSE(
      tollgate::schema::try_from_string<execution_state_t>("blocked"));
  EXPECT_EQ(tollgate::schema::to_string(
                tollgate::schema::error_code::approval_conflict),
            "APPROVAL_CONFLICT");
  EXPECT_EQ(tollgate::schema::to_code(
                tollgate::schema::error_code::no_available_agent),
            6u);
}
