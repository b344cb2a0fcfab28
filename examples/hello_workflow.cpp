#include <iostream>
#include <stepflow/workflow.hpp>
#include <vector>

using namespace stepflow;

auto main() -> int {
  // Fan out over three scores on a pool of 4 threads
  execution::thread_pool pool{4};
  engine                 runner{engine_options{.scheduler = pool.get_scheduler()}};

  graph_builder builder("hello");
  builder
      .foreach(
          "start",
          [](step_input&) -> step_output {
            return step_output{}.foreach_over(std::vector<double>{0.6, 0.7, 0.8});
          },
          "score")
      .linear(
          "score",
          [](step_input& in) -> step_output {
            in.logger().info("scoring branch {}", in.path().to_string());
            return step_output{}.set("accuracy", in.input_as<double>());
          },
          "average")
      .join(
          "average",
          [](join_input& in) -> step_output {
            auto accuracy = in.aggregate("accuracy");
            return step_output{}.set("accuracy", accuracy.value).set("spread", accuracy.spread);
          },
          1, "end")
      .end("end");

  auto result = runner.run(builder.build());

  if (result.succeeded()) {
    std::cout << "Mean accuracy: " << result.artifacts().get<double>("accuracy") << " +- "
              << result.artifacts().get<double>("spread") << '\n';
    return 0;
  }
  std::cout << "Run failed: " << result.error_message() << '\n';
  return 1;
}
