#include "caprouter/policy/compliance_proof.hpp"
#include "caprouter/policy/policy.hpp"
#include "caprouter/policy/policy_router.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <string>
#include <vector>

using namespace caprouter;
using caprouter::test::run_coro;

namespace {

struct FakeInvoker {
  std::vector<InvocationRequest> seen;
  bool succeed{true};
};

auto answer(InvocationRequest req, FakeInvoker *fake)
    -> task<InvocationResult> {
  fake->seen.push_back(req);
  if (!fake->succeed) {
    co_return InvocationResult::failure(RequestId{"req_fail"},
                                        req.capability_id,
                                        make_error_code(Error::ExecutionFailed),
                                        "route offline");
  }
  InvocationResult r;
  r.success = true;
  r.request_id = RequestId{"req_ok"};
  r.capability_id = req.capability_id;
  r.outputs = JsonValue{{"routed_to", req.capability_id.str()}};
  r.metadata.execution.cost_actual = 0.0008;
  co_return r;
}

auto router_for(FakeInvoker &fake) -> PolicyRouter {
  return PolicyRouter([&fake](InvocationRequest req) {
    return answer(std::move(req), &fake);
  });
}

auto swap_request(RouteConstraints policy) -> PolicyExecutionRequest {
  return PolicyExecutionRequest{.agent_id = AgentId{"agent-a"},
                                .capability_type = "swap",
                                .inputs = {{"amount", std::int64_t{10}}},
                                .policy = std::move(policy)};
}

auto step_names(const ComplianceProof &proof) -> std::vector<std::string> {
  std::vector<std::string> names;
  for (const auto &s : proof.steps) {
    names.push_back(s.step);
  }
  return names;
}

} // namespace

TEST(PolicyCheckTest, ReportsEveryViolation) {
  AgentPolicy policy;
  policy.privacy = PrivacyTier::High;
  policy.max_cost = 0.001;
  policy.max_slippage = 1.0;
  policy.blocked_counterparties = {"mallory"};

  auto v = check_policy(policy, ProposedParameters{.privacy = PrivacyTier::Low,
                                                   .estimated_cost = 0.002,
                                                   .slippage = 2.5,
                                                   .counterparty = "mallory"});
  EXPECT_FALSE(v.valid);
  const std::vector<std::string> expected = {
      "Privacy level low below required high",
      "Estimated cost 0.002 exceeds budget 0.001",
      "Slippage 2.5% exceeds max 1%",
      "Counterparty mallory is blocked"};
  EXPECT_EQ(v.violations, expected);
}

TEST(PolicyCheckTest, WarningsDoNotInvalidate) {
  AgentPolicy policy;
  policy.max_cost = 0.001;
  policy.max_latency_ms = 1000;
  policy.trusted_counterparties = {"alice"};

  auto v = check_policy(policy,
                        ProposedParameters{.estimated_cost = 0.0009,
                                           .counterparty = "bob",
                                           .estimated_latency_ms = 2500});
  EXPECT_TRUE(v.valid);
  EXPECT_TRUE(v.violations.empty());
  const std::vector<std::string> expected = {
      "Cost approaching budget limit (90%)",
      "Counterparty bob not in trusted list",
      "Estimated latency 2500ms exceeds preference 1000ms"};
  EXPECT_EQ(v.warnings, expected);
}

TEST(PolicyCheckTest, AbsentFieldsAreNotChecked) {
  AgentPolicy policy;
  policy.privacy = PrivacyTier::High;
  policy.max_cost = 0.001;
  auto v = check_policy(policy, ProposedParameters{});
  EXPECT_TRUE(v.valid);
  EXPECT_TRUE(v.warnings.empty());
}

TEST(RouteTest, ComplianceAndRelaxation) {
  Route route{.id = "r1",
              .capability_id = CapabilityId{"cap.x"},
              .privacy = PrivacyTier::Medium,
              .estimated_cost = 0.003,
              .estimated_latency_ms = 800};

  EXPECT_TRUE(route_complies(route, RouteConstraints{}));
  EXPECT_FALSE(route_complies(route, RouteConstraints{.privacy = PrivacyTier::High}));
  EXPECT_FALSE(route_complies(route, RouteConstraints{.max_cost = 0.002}));
  EXPECT_TRUE(route_complies(
      route, relax(RouteConstraints{.max_cost = 0.002}, PolicyConfig{})));
  EXPECT_FALSE(route_complies(route, RouteConstraints{.max_latency_ms = 500}));
  EXPECT_TRUE(route_complies(
      route, relax(RouteConstraints{.max_latency_ms = 500}, PolicyConfig{})));
  EXPECT_FALSE(route_complies(route, RouteConstraints{.excluded_routes = {"r1"}}));
  EXPECT_FALSE(
      route_complies(route, RouteConstraints{.preferred_routes = {"r2"}}));
  EXPECT_TRUE(route_complies(route, RouteConstraints{.preferred_routes = {"r1"}}));
}

TEST(ComplianceProofTest, DigestCoversSteps) {
  std::vector<ProofStep> steps = {
      {"policy_validation", true, JsonValue{{"valid", true}}},
      {"route_selection", true, JsonValue{{"id", "jupiter"}}}};
  auto proof = make_compliance_proof(steps);
  EXPECT_EQ(proof.version, "1.0");
  EXPECT_TRUE(proof.all_passed);
  EXPECT_EQ(proof.digest.size(), 64u);
  EXPECT_EQ(proof.digest, proof_digest(steps));
  EXPECT_TRUE(verify_proof(proof));

  auto tampered = proof;
  tampered.steps[1].details = JsonValue{{"id", "private-swap"}};
  EXPECT_FALSE(verify_proof(tampered));

  auto flipped = proof;
  flipped.all_passed = false;
  EXPECT_FALSE(verify_proof(flipped));
}

TEST(PolicyRouterTest, SeededCatalog) {
  FakeInvoker fake;
  auto router = router_for(fake);
  EXPECT_EQ(router.routes("swap").size(), 2u);
  EXPECT_EQ(router.routes("price").size(), 1u);
  EXPECT_TRUE(router.routes("bridge").empty());
}

TEST(PolicyRouterTest, SelectsCheapestCompliantRoute) {
  FakeInvoker fake;
  auto router = router_for(fake);
  EXPECT_EQ(router.select_route("swap", {})->id, "jupiter");
  EXPECT_EQ(router.select_route("swap", {.privacy = PrivacyTier::High})->id,
            "private-swap");
  EXPECT_FALSE(router.select_route("swap", {.max_cost = 0.0005}).has_value());
  EXPECT_FALSE(router.select_route("bridge", {}).has_value());
}

TEST(PolicyRouterTest, SelectedRouteNeverExceedsBudget) {
  FakeInvoker fake;
  auto router = router_for(fake);
  for (double budget : {0.0001, 0.0009, 0.001, 0.004, 0.005, 1.0}) {
    for (auto tier : {PrivacyTier::None, PrivacyTier::High}) {
      auto route =
          router.select_route("swap", {.privacy = tier, .max_cost = budget});
      if (route) {
        EXPECT_LE(route->estimated_cost, budget);
        EXPECT_GE(route->privacy, tier);
      }
    }
  }
}

TEST(PolicyRouterTest, RegisterRouteReplacesById) {
  FakeInvoker fake;
  auto router = router_for(fake);
  router.register_route("swap", Route{.id = "jupiter",
                                      .capability_id = CapabilityId{"cap.swap.execute.v2"},
                                      .estimated_cost = 0.0005});
  auto routes = router.routes("swap");
  ASSERT_EQ(routes.size(), 2u);
  EXPECT_EQ(router.select_route("swap", {})->capability_id.value(),
            "cap.swap.execute.v2");
}

TEST(PolicyRouterTest, ExecutesWithProof) {
  FakeInvoker fake;
  auto router = router_for(fake);
  auto result = run_coro(
      router.execute_with_policy(swap_request({.max_cost = 0.002})));

  ASSERT_TRUE(result.success) << result.error.value_or("");
  ASSERT_TRUE(result.route_used.has_value());
  EXPECT_EQ(result.route_used->id, "jupiter");
  EXPECT_DOUBLE_EQ(result.cost_actual, 0.0008);
  EXPECT_EQ(result.request_id->value(), "req_ok");
  EXPECT_EQ(step_names(result.proof),
            (std::vector<std::string>{"policy_validation", "route_selection",
                                      "execution"}));
  EXPECT_TRUE(result.proof.all_passed);
  EXPECT_TRUE(verify_proof(result.proof));

  ASSERT_EQ(fake.seen.size(), 1u);
  EXPECT_EQ(fake.seen[0].capability_id.value(), "cap.swap.execute.v1");
}

TEST(PolicyRouterTest, RouteParamsAreMergedIntoInputs) {
  FakeInvoker fake;
  auto router = router_for(fake);
  router.register_route("bridge", Route{.id = "wormhole",
                                        .capability_id = CapabilityId{"cap.bridge.v1"},
                                        .estimated_cost = 0.002,
                                        .params = {{"slippage_bps", std::int64_t{50}}}});
  auto req = swap_request({});
  req.capability_type = "bridge";
  auto result = run_coro(router.execute_with_policy(std::move(req)));

  ASSERT_TRUE(result.success);
  ASSERT_EQ(fake.seen.size(), 1u);
  EXPECT_TRUE(fake.seen[0].inputs.contains("amount"));
  EXPECT_EQ(fake.seen[0].inputs.at("slippage_bps").get<std::int64_t>(), 50);
}

TEST(PolicyRouterTest, NoRouteWithoutFallback) {
  FakeInvoker fake;
  auto router = router_for(fake);
  auto result = run_coro(router.execute_with_policy(
      swap_request({.privacy = PrivacyTier::High, .max_cost = 0.004})));

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, "No compliant route found");
  EXPECT_EQ(result.error_code, make_error_code(Error::NoCompliantRoute));
  EXPECT_FALSE(result.proof.all_passed);
  EXPECT_EQ(result.proof.steps.size(), 2u);
  EXPECT_TRUE(fake.seen.empty());
}

TEST(PolicyRouterTest, FallbackRelaxesCeilings) {
  FakeInvoker fake;
  auto router = router_for(fake);
  auto req = swap_request({.privacy = PrivacyTier::High, .max_cost = 0.004});
  req.fallbacks = true;
  auto result = run_coro(router.execute_with_policy(std::move(req)));

  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.route_used->id, "private-swap");
  EXPECT_EQ(step_names(result.proof),
            (std::vector<std::string>{"policy_validation", "route_selection",
                                      "fallback_route", "execution"}));
  EXPECT_FALSE(result.proof.steps[1].passed);
  EXPECT_TRUE(verify_proof(result.proof));
}

TEST(PolicyRouterTest, FallbackStillBounded) {
  FakeInvoker fake;
  auto router = router_for(fake);
  // 0.003 * 1.5 stays below the private route's 0.005.
  auto req = swap_request({.privacy = PrivacyTier::High, .max_cost = 0.003});
  req.fallbacks = true;
  auto result = run_coro(router.execute_with_policy(std::move(req)));
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error_code, make_error_code(Error::NoCompliantRoute));
}

TEST(PolicyRouterTest, RegisteredPolicyRejectsRequest) {
  FakeInvoker fake;
  auto router = router_for(fake);
  AgentPolicy policy;
  policy.max_cost = 0.001;
  policy.blocked_counterparties = {"mallory"};
  router.register_policy(AgentId{"agent-a"}, policy);
  ASSERT_NE(router.policy(AgentId{"agent-a"}), nullptr);

  auto req = swap_request({.max_cost = 0.002});
  req.counterparty = "mallory";
  auto result = run_coro(router.execute_with_policy(std::move(req)));

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error,
            "Policy violations: Estimated cost 0.002 exceeds budget 0.001, "
            "Counterparty mallory is blocked");
  EXPECT_EQ(result.error_code, make_error_code(Error::PolicyViolation));
  EXPECT_TRUE(result.fallback_available);
  EXPECT_EQ(result.proof.steps.size(), 1u);
  EXPECT_FALSE(result.proof.all_passed);
  EXPECT_TRUE(fake.seen.empty());
}

TEST(PolicyRouterTest, UnregisteredAgentIsUnconstrained) {
  FakeInvoker fake;
  auto router = router_for(fake);
  auto v = router.validate(AgentId{"nobody"},
                           ProposedParameters{.estimated_cost = 1000.0});
  EXPECT_TRUE(v.valid);
  EXPECT_TRUE(v.warnings.empty());
}

TEST(PolicyRouterTest, FailedExecutionCarriesError) {
  FakeInvoker fake;
  fake.succeed = false;
  auto router = router_for(fake);
  auto result = run_coro(router.execute_with_policy(swap_request({})));
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, "route offline");
  EXPECT_DOUBLE_EQ(result.cost_actual, 0.0);
  EXPECT_FALSE(result.proof.all_passed);
  EXPECT_EQ(result.proof.steps.back().step, "execution");
}
