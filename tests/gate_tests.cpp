#include <boost/ut.hpp>
#include <cmath>
#include <limits>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <stepflow/workflow.hpp>
#include <string>
#include <vector>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

namespace {

using namespace stepflow;

auto capturing_logger(std::ostringstream& out) -> std::shared_ptr<spdlog::logger> {
  auto sink   = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
  auto logger = std::make_shared<spdlog::logger>("gate_tests", sink);
  logger->set_pattern("%v");
  return logger;
}

// start -(foreach accuracies)-> evaluate -> register(gate) -> end
auto registration_graph(std::vector<double> accuracies, bool& registered, bool throwing = false)
    -> graph {
  graph_builder builder("registration");
  builder
      .foreach(
          "start",
          [accuracies](step_input&) -> step_output {
            return step_output{}.foreach_over(accuracies);
          },
          "evaluate")
      .linear(
          "evaluate",
          [](step_input& in) -> step_output {
            return step_output{}.set("test_accuracy", in.input_as<double>());
          },
          "register")
      .join(
          "register",
          [&registered, throwing](join_input& in) -> step_output {
            auto           accuracy = in.aggregate("test_accuracy").value;
            threshold_gate gate("test_accuracy", in.parameter<double>("accuracy_threshold"));
            auto           outcome = gate.run(
                accuracy,
                [&] -> void {
                  if (throwing) {
                    throw std::runtime_error("registry unavailable");
                  }
                  registered = true;
                },
                in.logger());
            return step_output{}.set("test_accuracy", accuracy).set("registration", outcome);
          },
          1, "end")
      .end("end");
  return builder.build();
}

}  // namespace

int main() {
  using namespace boost::ut;

  "gate_opens_at_threshold"_test = [] {
    threshold_gate gate("test_accuracy", 0.7);

    expect(gate.is_open(0.7));
    expect(gate.is_open(0.95));
    expect(!gate.is_open(0.6999));
    expect(!gate.is_open(std::numeric_limits<double>::quiet_NaN()));
    expect(gate.metric() == "test_accuracy");
    expect(gate.threshold() == 0.7_d);
  };

  "closed_gate_logs_and_skips"_test = [] {
    std::ostringstream out;
    auto               logger = capturing_logger(out);
    threshold_gate     gate("test_accuracy", 0.75);
    bool               ran = false;

    auto outcome = gate.run(0.7, [&] -> void { ran = true; }, *logger);
    logger->flush();

    expect(outcome == gate_outcome::skipped);
    expect(!ran);
    expect(out.str().find("below the threshold") != std::string::npos);
    expect(to_string(outcome) == "skipped");
  };

  "open_gate_runs_action_once"_test = [] {
    std::ostringstream out;
    auto               logger = capturing_logger(out);
    threshold_gate     gate("test_accuracy", 0.75);
    int                calls = 0;

    auto outcome = gate.run(0.75, [&] -> void { ++calls; }, *logger);

    expect(outcome == gate_outcome::fired);
    expect(calls == 1_i);
  };

  "action_error_propagates"_test = [] {
    threshold_gate gate("test_accuracy", 0.5);
    expect(throws<std::runtime_error>([&] {
      static_cast<void>(gate.run(0.9, [] -> void { throw std::runtime_error("registry"); }));
    }));
  };

  "below_threshold_skips_action_and_succeeds"_test = [] {
    bool registered = false;
    auto result     = engine{}.run(registration_graph({0.6, 0.7, 0.8}, registered),
                                   run_parameters{{"accuracy_threshold", 0.75}});

    expect(result.succeeded()) << result.error_message();
    expect(!registered);
    expect(result.artifacts().get<gate_outcome>("registration") == gate_outcome::skipped);
    expect(std::abs(result.artifacts().get<double>("test_accuracy") - 0.7) < 1e-12);
  };

  "gate_fires_when_mean_meets_threshold"_test = [] {
    bool registered = false;
    auto result     = engine{}.run(registration_graph({0.7, 0.8, 0.9}, registered),
                                   run_parameters{{"accuracy_threshold", 0.75}});

    expect(result.succeeded());
    expect(registered);
    expect(result.artifacts().get<gate_outcome>("registration") == gate_outcome::fired);
  };

  "empty_foreach_never_opens_gate"_test = [] {
    bool registered = false;
    auto result     = engine{}.run(registration_graph({}, registered),
                                   run_parameters{{"accuracy_threshold", 0.0}});

    expect(result.succeeded());
    expect(!registered);
    expect(result.artifacts().get<gate_outcome>("registration") == gate_outcome::skipped);
  };

  "action_failure_fails_the_run"_test = [] {
    bool registered = false;
    auto result     = engine{}.run(registration_graph({0.9, 0.9}, registered, true),
                                   run_parameters{{"accuracy_threshold", 0.75}});

    expect(result.state() == run_state::failed);
    expect(result.error_kind() == "step_execution_error");
    expect(result.executions_of("register").front().state == step_state::failed);
    expect(result.executions_of("end").empty());
  };
}
