#include <boost/program_options.hpp>
#include <ferry/common/context.hpp>
#include <ferry/config/settings.hpp>
#include <ferry/daemon/scheduler.hpp>
#include <ferry/execution/orchestrator.hpp>
#include <ferry/health/server.hpp>
#include <ferry/provider/factory.hpp>
#include <ferry/state/state_store.hpp>
#include <ferry/transfer/executor.hpp>
#include <spdlog/logger.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

constexpr auto kExitSuccess = 0;
constexpr auto kExitFailure = 1;
constexpr auto kExitConfig = 2;
constexpr auto kExitConnectivity = 3;

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

/// Everything a command needs, wired in dependency order.
struct application final {
  std::unique_ptr<ferry::provider::source_catalog> source;
  std::unique_ptr<ferry::provider::destination_store> destination;
  std::unique_ptr<ferry::state::state_store> state;
  std::unique_ptr<ferry::transfer::executor> executor;
  std::unique_ptr<ferry::execution::orchestrator> orchestrator;
};

application make_application(const ferry::common::context& context,
                             const ferry::config::settings& settings) {
  auto app = application{};
  app.source = ferry::provider::make_source(settings);
  app.destination = ferry::provider::make_destination(settings);
  app.state = std::make_unique<ferry::state::state_store>(
      context, settings.state.file);
  app.state->load();
  app.executor = std::make_unique<ferry::transfer::executor>(
      context, *app.source, *app.destination,
      ferry::retry::retry_policy{ferry::config::make_retry_options(settings)},
      ferry::config::make_executor_options(settings));
  app.orchestrator = std::make_unique<ferry::execution::orchestrator>(
      context, *app.source, *app.state, *app.executor,
      ferry::config::make_orchestrator_options(settings));
  return app;
}

/// Poll the signal flag until `finished` and hand it to `stop` when raised.
std::thread watch_for_shutdown(const ferry::common::context& context,
                               std::atomic<bool>& finished,
                               std::function<void()> stop) {
  return std::thread{[&finished, stop = std::move(stop),
                      logger = context.logger("main")] {
    while (!finished) {
      if (shutdown_requested()) {
        logger->info("shutdown signal received, finishing in-flight work");
        stop();
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds{200});
    }
  }};
}

int execute_stats(const ferry::common::context& context,
                  const ferry::config::settings& settings) {
  auto state = ferry::state::state_store{context, settings.state.file};
  state.load();
  auto summary = state.stats();
  std::cout << "State file:    " << state.path().string() << "\n"
            << "Tracked files: " << summary.total_files << "\n"
            << "Total size:    "
            << ferry::schema::format_size(summary.total_bytes) << "\n"
            << "Last sync:     "
            << (summary.last_sync_at
                    ? ferry::schema::to_iso8601(*summary.last_sync_at)
                    : std::string{"never"})
            << std::endl;
  return kExitSuccess;
}

int execute_test(const ferry::common::context& context,
                 const ferry::config::settings& settings) {
  std::cout << "Configuration: OK" << std::endl;
  auto failed = false;

  try {
    auto source = ferry::provider::make_source(settings);
    source->test_connectivity();
    std::cout << "Source " << source->describe() << ": OK" << std::endl;
  } catch (const std::exception& e) {
    std::cout << "Source connectivity: FAILED - " << e.what() << std::endl;
    failed = true;
  }

  try {
    auto destination = ferry::provider::make_destination(settings);
    destination->test_connectivity();
    std::cout << "Destination " << destination->describe() << ": OK"
              << std::endl;
  } catch (const std::exception& e) {
    std::cout << "Destination connectivity: FAILED - " << e.what()
              << std::endl;
    failed = true;
  }

  auto state = ferry::state::state_store{context, settings.state.file};
  state.load();
  std::cout << "State file " << state.path().string() << ": "
            << state.size() << " tracked files" << std::endl;

  if (failed) {
    return kExitConnectivity;
  }
  std::cout << "All checks passed" << std::endl;
  return kExitSuccess;
}

int execute_sync(const ferry::common::context& context,
                 const ferry::config::settings& settings,
                 bool force) {
  auto logger = context.logger("main");
  auto app = make_application(context, settings);
  auto finished = std::atomic<bool>{false};
  auto watcher = watch_for_shutdown(
      context, finished, [&] { app.orchestrator->request_stop(); });

  auto code = kExitSuccess;
  try {
    auto stats = app.orchestrator->sync(force);
    if (stats.files_failed > 0) {
      logger->warn("sync completed with {} failures", stats.files_failed);
      code = kExitFailure;
    }
  } catch (const ferry::execution::sync_error& e) {
    logger->error("sync aborted: {}", e.what());
    code = kExitFailure;
  }

  finished = true;
  watcher.join();
  return code;
}

int execute_run(const ferry::common::context& context,
                const ferry::config::settings& settings,
                bool force) {
  auto logger = context.logger("main");
  auto app = make_application(context, settings);
  auto options = ferry::config::make_scheduler_options(settings);
  options.force_first_pass = force;
  auto scheduler =
      ferry::daemon::scheduler{context, *app.orchestrator, options};

  auto health = std::unique_ptr<ferry::health::server>{};
  if (!settings.health.listen_address.empty()) {
    health = std::make_unique<ferry::health::server>(context);
    health->start(settings.health.listen_address);
    health->set_serving(true);
    scheduler.set_observer(
        [&health](const auto& stats) { health->report_pass(stats); });
  }

  auto finished = std::atomic<bool>{false};
  auto watcher = watch_for_shutdown(context, finished, [&] {
    if (health) {
      health->set_serving(false);
    }
    scheduler.request_stop();
  });

  logger->info("running in foreground; send SIGINT or SIGTERM to stop");
  scheduler.run();

  finished = true;
  watcher.join();
  if (health) {
    health->shutdown();
  }
  return kExitSuccess;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto command = std::string{};
  auto config_path = std::string{};

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{
      "Usage: ferry <run|sync|test|stats> [options]"};
  description.add_options()("help,h", "Show the help message")(
      "command", boost::program_options::value<std::string>(&command),
      "run | sync | test | stats")(
      "config,c",
      boost::program_options::value<std::string>(&config_path)
          ->default_value("config.ini"),
      "Path to the configuration file")(
      "force,f", "Transfer every file, ignoring recorded state")(
      "verbose,v", "Log at debug level");
  auto positional = boost::program_options::positional_options_description{};
  positional.add("command", 1);

  try {
    boost::program_options::store(
        boost::program_options::command_line_parser(argc, argv)
            .options(description)
            .positional(positional)
            .run(),
        vm);
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& e) {
    std::cerr << e.what() << "\n" << description << std::endl;
    return kExitFailure;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return kExitSuccess;
  }

  static const auto kCommands =
      std::vector<std::string>{"run", "sync", "test", "stats"};
  if (std::ranges::find(kCommands, command) == std::end(kCommands)) {
    if (!command.empty()) {
      std::cerr << "unknown command '" << command << "'" << std::endl;
    }
    std::cout << description << std::endl;
    return kExitFailure;
  }

  auto settings = ferry::config::settings{};
  try {
    settings = ferry::config::load_settings(config_path);
  } catch (const ferry::config::config_error& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return kExitConfig;
  }
  auto errors = ferry::config::validate(settings);
  if (!errors.empty()) {
    std::cerr << "Configuration errors:" << std::endl;
    for (const auto& error : errors) {
      std::cerr << "  - " << error << std::endl;
    }
    return kExitConfig;
  }

  if (vm.contains("verbose")) {
    settings.logging.level = "debug";
  }
  settings.logging.async = command == "run";
  auto context = ferry::common::make_context(settings.logging);
  auto logger = context->logger("main");

  auto force = vm.contains("force");
  auto code = kExitSuccess;
  try {
    if (command == "stats") {
      code = execute_stats(*context, settings);
    } else if (command == "test") {
      code = execute_test(*context, settings);
    } else if (command == "sync") {
      code = execute_sync(*context, settings, force);
    } else {
      code = execute_run(*context, settings, force);
    }
  } catch (const std::invalid_argument& e) {
    logger->error("{}", e.what());
    code = kExitConfig;
  } catch (const std::exception& e) {
    logger->error("{} failed: {}", command, e.what());
    code = kExitFailure;
  }

  context->flush();
  return code;
}
