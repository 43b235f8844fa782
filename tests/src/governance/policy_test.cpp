#include <gtest/gtest.h>
#include <tollgate/governance/policy.hpp>
#include <tollgate/testing/common.hpp>

namespace {

using tollgate::governance::evaluate_policy;
using tollgate::governance::policy_config;
using tollgate::governance::resolve_initiator;
using tollgate::schema::initiator_tier_t;
using tollgate::schema::policy_verdict_t;

tollgate::schema::policy_decision_t evaluate(
    const tollgate::schema::command_t& command,
    const policy_config& config) {
  return evaluate_policy(resolve_initiator(command, config), command, config);
}

policy_config privileged_config() {
  auto config = policy_config{};
  config.privileged_initiators = {"root"};
  config.privileged_token = "t0ken";
  return config;
}

}  // namespace

TEST(policy, plain_command_is_allowed) {
  auto decision = evaluate(tollgate::testing::make_command("e1"), {});
  EXPECT_EQ(decision.verdict, policy_verdict_t::allowed);
  EXPECT_EQ(decision.reason, tollgate::governance::kReasonAllowed);
  EXPECT_EQ(decision.tier, initiator_tier_t::standard);
}

TEST(policy, safe_mode_rejects_writes_but_not_reads) {
  auto config = policy_config{};
  config.safe_mode = true;
  auto write = tollgate::testing::make_command("e1");
  EXPECT_EQ(evaluate(write, config).reason,
            tollgate::governance::kReasonSafeMode);

  auto read = tollgate::testing::make_command("e2");
  read.read_only = true;
  auto decision = evaluate(read, config);
  EXPECT_EQ(decision.verdict, policy_verdict_t::allowed);
  EXPECT_EQ(decision.reason, tollgate::governance::kReasonReadOnly);
}

TEST(policy, deny_list_precedes_allow_list) {
  auto config = policy_config{};
  config.denied_kinds = {"crm.update"};
  config.allowed_kinds = {"crm.update"};
  auto decision = evaluate(tollgate::testing::make_command("e1"), config);
  EXPECT_EQ(decision.verdict, policy_verdict_t::rejected);
  EXPECT_EQ(decision.reason, tollgate::governance::kReasonKindDenied);
}

TEST(policy, allow_list_rejects_unlisted_kinds) {
  auto config = policy_config{};
  config.allowed_kinds = {"crm.read"};
  EXPECT_EQ(evaluate(tollgate::testing::make_command("e1"), config).reason,
            tollgate::governance::kReasonKindNotAllowed);
}

TEST(policy, approval_rules_block_standard_initiators) {
  auto config = policy_config{};
  config.approval_required_kinds = {"crm.update"};
  auto decision = evaluate(tollgate::testing::make_command("e1"), config);
  EXPECT_EQ(decision.verdict, policy_verdict_t::blocked);
  EXPECT_EQ(decision.reason, tollgate::governance::kReasonApprovalRequired);

  auto requested = tollgate::testing::make_command("e2", "crm.note");
  requested.requires_approval = true;
  EXPECT_EQ(evaluate(requested, {}).reason,
            tollgate::governance::kReasonApprovalRequested);
}

TEST(policy, read_only_skips_default_approval) {
  auto config = policy_config{};
  config.approval_required_by_default = true;
  auto read = tollgate::testing::make_command("e1");
  read.read_only = true;
  EXPECT_EQ(evaluate(read, config).verdict, policy_verdict_t::allowed);
  EXPECT_EQ(evaluate(tollgate::testing::make_command("e2"), config).verdict,
            policy_verdict_t::blocked);
}

TEST(policy, privileged_initiator_bypasses_blanket_restrictions) {
  auto config = privileged_config();
  config.safe_mode = true;
  config.denied_kinds = {"crm.update"};
  config.allowed_kinds = {"crm.read"};
  config.approval_required_by_default = true;
  auto command = tollgate::testing::make_command("e1", "crm.update", "root");
  auto decision = evaluate(command, config);
  EXPECT_EQ(decision.verdict, policy_verdict_t::allowed);
  EXPECT_EQ(decision.tier, initiator_tier_t::privileged);
}

TEST(policy, privileged_denied_kind_still_rejects) {
  auto config = privileged_config();
  config.privileged_denied_kinds = {"erp.purge"};
  auto command = tollgate::testing::make_command("e1", "erp.purge", "root");
  auto decision = evaluate(command, config);
  EXPECT_EQ(decision.verdict, policy_verdict_t::rejected);
  EXPECT_EQ(decision.reason, tollgate::governance::kReasonPrivilegedKindDenied);
}

TEST(policy, privileged_credential_is_checked_before_kind_rules) {
  auto config = privileged_config();
  config.credential_enforcement = true;
  config.privileged_denied_kinds = {"erp.purge"};
  auto command = tollgate::testing::make_command("e1", "erp.purge", "root");
  command.credential = std::string{"wrong"};
  EXPECT_EQ(evaluate(command, config).reason,
            tollgate::governance::kReasonPrivilegedCredentialInvalid);

  command.credential.reset();
  EXPECT_EQ(evaluate(command, config).reason,
            tollgate::governance::kReasonPrivilegedCredentialInvalid);

  command.credential = std::string{"t0ken"};
  EXPECT_EQ(evaluate(command, config).reason,
            tollgate::governance::kReasonPrivilegedKindDenied);
}

TEST(policy, privileged_explicit_approval_request_is_honored) {
  auto command = tollgate::testing::make_command("e1", "crm.update", "root");
  command.requires_approval = true;
  auto decision = evaluate(command, privileged_config());
  EXPECT_EQ(decision.verdict, policy_verdict_t::blocked);
  EXPECT_EQ(decision.reason, tollgate::governance::kReasonApprovalRequested);
}

TEST(policy, unknown_initiator_resolves_standard) {
  auto command = tollgate::testing::make_command("e1", "crm.update", "mallory");
  command.credential = std::string{"t0ken"};
  auto context = resolve_initiator(command, privileged_config());
  EXPECT_EQ(context.tier, initiator_tier_t::standard);
}
