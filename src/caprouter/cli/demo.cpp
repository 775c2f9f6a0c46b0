#include "caprouter/cli/commands.hpp"
#include "caprouter/cli/formatting.hpp"
#include "caprouter/config/config.hpp"
#include "caprouter/executor/handler_executor.hpp"
#include "caprouter/io/context.hpp"
#include "caprouter/registry/registry.hpp"
#include "caprouter/router/orchestrator.hpp"
#include "caprouter/telemetry/health_monitor.hpp"
#include "caprouter/telemetry/metrics.hpp"
#include "caprouter/telemetry/usage_signal.hpp"
#include "caprouter/util/json.hpp"
#include "caprouter/util/log.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_future.hpp>

#include <print>

namespace caprouter::cli {

namespace {

template <typename T>
auto run_async(boost::asio::io_context &io, task<T> op) -> T {
  auto fut = boost::asio::co_spawn(io, std::move(op), boost::asio::use_future);
  io.run();
  io.restart();
  return fut.get();
}

auto make_capability(std::string id, std::string name, ExecutionMode mode,
                     double cost, std::vector<std::string> required)
    -> Capability {
  Capability cap;
  cap.id = CapabilityId{std::move(id)};
  cap.name = std::move(name);
  cap.mode = mode;
  cap.required_inputs = std::move(required);
  cap.economics.cost_hint = cost;
  cap.economics.x402 = PaymentSignalTerms{.enabled = true};
  cap.economics.privacy_cash_compatible = mode == ExecutionMode::Confidential;
  return cap;
}

auto demo_registry() -> std::shared_ptr<InMemoryRegistry> {
  auto registry = std::make_shared<InMemoryRegistry>();
  registry->add(make_capability("cap.price.lookup.v1", "Price Lookup",
                                ExecutionMode::Public, 0.0001, {"base_token"}));
  registry->add(make_capability("cap.wallet.snapshot.v1", "Wallet Snapshot",
                                ExecutionMode::Public, 0.001, {"address"}));
  registry->add(make_capability("cap.swap.execute.v1", "Swap",
                                ExecutionMode::Public, 0.001,
                                {"input_token", "output_token", "amount"}));
  registry->add(make_capability("cap.document.parse.v1",
                                "Confidential Document Parse",
                                ExecutionMode::Confidential, 0.01,
                                {"document_url"}));
  return registry;
}

auto simulate(std::chrono::milliseconds latency, HandlerOutput out)
    -> task<HandlerOutput> {
  co_await io::async_sleep(latency);
  co_return out;
}

auto simulated(std::chrono::milliseconds latency, JsonValue outputs,
               double cost, std::string provider) -> HandlerExecutor::Handler {
  return [=](const ExecutionContext &) {
    return simulate(latency, HandlerOutput{outputs, cost, provider});
  };
}

auto price_lookup(const ExecutionContext &ctx) -> task<HandlerOutput> {
  using namespace std::chrono_literals;
  const auto base = json_string(ctx.inputs.at("base_token"));
  co_await io::async_sleep(20ms);
  co_return HandlerOutput{JsonValue{{"base_token", base.value_or("?")},
                                    {"quote_token", "USD"},
                                    {"price", 142.5},
                                    {"source", "simulated"}},
                          0.0001, "simulated-oracle"};
}

auto demo_executors() -> ExecutorSet {
  using namespace std::chrono_literals;

  auto pub = std::make_shared<HandlerExecutor>("public-executor",
                                               ExecutionMode::Public);
  pub->register_handler("price.lookup", price_lookup);
  pub->register_handler(
      "wallet.snapshot",
      simulated(40ms, JsonValue{{"balances", std::vector<JsonValue>{}}}, 0.001,
                "simulated-rpc"));
  pub->register_handler(
      "swap.execute",
      simulated(60ms, JsonValue{{"status", "filled"}}, 0.001, "simulated-dex"));

  auto conf = std::make_shared<HandlerExecutor>("confidential-executor",
                                                ExecutionMode::Confidential);
  conf->register_handler(
      "document.parse",
      simulated(80ms, JsonValue{{"confidence_score", 0.97}}, 0.01,
                "simulated-enclave"));

  ExecutorSet set;
  set.add(conf);
  set.add(pub);
  return set;
}

auto price_request(std::string_view token) -> InvocationRequest {
  return InvocationRequest{
      .capability_id = CapabilityId{"cap.price.lookup.v1"},
      .inputs = Inputs{{"base_token", JsonValue{std::string{token}}}}};
}

auto print_result(std::string_view label, const InvocationResult &r) -> void {
  if (r.success) {
    std::println("{} {:<24} {} {}ms{}", fmt::outcome(true), label,
                 r.capability_id, r.metadata.execution.execution_time_ms,
                 fmt::served_flags(r.metadata.cached, r.metadata.coalesced,
                                   r.metadata.deduplicated));
  } else {
    std::println("{} {:<24} {} {}", fmt::outcome(false), label,
                 r.capability_id, fmt::ansi::red(r.error.value_or("")));
  }
}

auto run_demo(Orchestrator &orch, const DemoOptions &opts) -> task<JsonValue> {
  const bool quiet = opts.json;
  auto show = [&](std::string_view label, const InvocationResult &r) {
    if (!quiet) {
      print_result(label, r);
    }
  };

  for (int i = 0; i < opts.calls; ++i) {
    show("invoke", co_await orch.invoke(price_request("SOL")));
  }

  show("missing input",
       co_await orch.invoke(InvocationRequest{
           .capability_id = CapabilityId{"cap.wallet.snapshot.v1"}}));
  show("unknown capability",
       co_await orch.invoke(InvocationRequest{
           .capability_id = CapabilityId{"cap.unknown.v1"}}));

  std::vector<InvocationRequest> batch{
      price_request("BONK"), price_request("JUP"),
      InvocationRequest{
          .capability_id = CapabilityId{"cap.wallet.snapshot.v1"},
          .inputs = Inputs{{"address", JsonValue{"demo-wallet"}}}},
      InvocationRequest{
          .capability_id = CapabilityId{"cap.document.parse.v1"},
          .inputs = Inputs{{"document_url", JsonValue{"ipfs://demo"}}}}};
  auto batch_result = co_await orch.batch_invoke(std::move(batch));
  if (!quiet) {
    std::println("{} batch of {} in {}ms (saved {}ms)",
                 fmt::outcome(batch_result.success),
                 batch_result.results.size(), batch_result.total_time_ms,
                 batch_result.parallelism_benefit_ms);
  }

  show("queued (critical)",
       co_await orch.queued_invoke(price_request("WIF"), Priority::Critical));
  show("deduplicated", co_await orch.deduplicated_invoke(price_request("WIF")));
  show("deduplicated", co_await orch.deduplicated_invoke(price_request("WIF")));

  const AgentId agent{"demo-agent"};
  for (int i = 0; i < 3; ++i) {
    show("prefetch: price",
         co_await orch.invoke_with_prefetch(agent, price_request("SOL")));
    show("prefetch: swap",
         co_await orch.invoke_with_prefetch(
             agent, InvocationRequest{
                        .capability_id = CapabilityId{"cap.swap.execute.v1"},
                        .inputs = Inputs{{"input_token", JsonValue{"SOL"}},
                                         {"output_token", JsonValue{"USDC"}},
                                         {"amount", JsonValue{1.0}}}}));
  }

  AgentPolicy policy;
  policy.max_cost = 0.002;
  policy.blocked_counterparties = {"mallory"};
  orch.policies().register_policy(agent, policy);

  auto policy_result = co_await orch.execute_with_policy(PolicyExecutionRequest{
      .agent_id = agent,
      .capability_type = "price",
      .inputs = Inputs{{"base_token", JsonValue{"SOL"}}},
      .policy = RouteConstraints{.max_cost = 0.001},
  });
  if (!quiet) {
    std::println("{} policy route {} proof {}",
                 fmt::outcome(policy_result.success),
                 policy_result.route_used ? policy_result.route_used->id
                                          : std::string{"-"},
                 policy_result.proof.digest.substr(0, 16));
  }

  orch.perform_maintenance();

  co_return JsonValue{
      {"status", orch.status()},
      {"health", orch.health_check()},
      {"batch", to_json(batch_result)},
      {"policy_execution", to_json(policy_result)},
      {"recommendations",
       to_json(orch.recommendations(CapabilityId{"cap.price.lookup.v1"}))},
  };
}

} // namespace

auto cmd_demo(const DemoOptions &opts) -> int {
  // Without a file the built-in defaults apply, still subject to env overrides.
  auto config_res = opts.config_file.empty()
                        ? ConfigLoader::load_from_string("")
                        : ConfigLoader::load_from_file(opts.config_file);
  if (!config_res) {
    std::println(stderr, "Error: {}", config_res.error().message());
    return 1;
  }
  auto config = std::move(*config_res);

  log::set_output_stderr();
  log::set_level(opts.log_level.empty() ? config.log.level : opts.log_level);
  if (!config.log.file.empty() && !log::set_output_file(config.log.file)) {
    std::println(stderr, "Error: cannot open log file {}", config.log.file);
    return 1;
  }
  log::start();

  io::IoContext io;
  auto metrics = std::make_shared<InMemoryMetrics>();
  Orchestrator orch(io, config, demo_registry(), demo_executors(),
                    Collaborators{
                        .health = std::make_shared<CapabilityHealthMonitor>(),
                        .metrics = metrics,
                        .settlement = std::make_shared<UsageSignalEmitter>(),
                    });

  JsonValue report;
  try {
    report = run_async(io, run_demo(orch, opts));
  } catch (const std::exception &e) {
    log::stop();
    std::println(stderr, "Error: {}", e.what());
    return 1;
  }
  report["metrics"] = metrics->to_json();
  log::stop();

  std::println("{}", dump_json(report));
  return 0;
}

} // namespace caprouter::cli
