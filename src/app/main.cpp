/* @file main.cpp
 * @brief pztsweep command-line front end: load config, run the sweep on a worker thread
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

// PZT headers
#include "core/AcquisitionGateway.hpp"
#include "core/ChannelLink.hpp"
#include "core/ConfigLoader.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/ExperimentEngine.hpp"
#include "core/ExperimentObserver.hpp"
#include "core/Logger.hpp"

using namespace pzt::core;

namespace {

  std::atomic<bool> g_stopRequested{ false };

  void onSignal(int) { g_stopRequested = true; }

  class ConsoleObserver : public ExperimentObserver {
  public:
    void onProgress(std::size_t current, std::size_t total) override {
      std::cout << "[pztsweep] progress " << current << "/" << total << "\n";
    }
    void onError(const std::string& message) override {
      std::cerr << "[pztsweep] experiment failed: " << message << "\n";
    }
    void onComplete() override { std::cout << "[pztsweep] experiment complete\n"; }
    void onStopped(std::size_t current, std::size_t total) override {
      std::cout << "[pztsweep] experiment stopped after " << current << "/" << total << " steps\n";
    }
  };

  int exitCodeFor(ExperimentEngine::State s) {
    switch (s) {
    case ExperimentEngine::State::Completed:
      return 0;
    case ExperimentEngine::State::Stopped:
      return 130;
    default:
      return 1;
    }
  }

} // namespace

int main(int argc, char* argv[]) {
  std::string configPath = "config.json";
  std::optional<std::chrono::milliseconds> dwell;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--dwell" && i + 1 < argc) {
      long long ms = -1;
      try {
        ms = std::stoll(argv[++i]);
      } catch (const std::logic_error&) {
        ms = -1; // not a number
      }
      if (ms < 0) {
        std::cerr << "[pztsweep] --dwell expects a non-negative number of milliseconds\n";
        return 2;
      }
      dwell = std::chrono::milliseconds{ ms };
    } else if (arg.starts_with("--")) {
      std::cerr << "usage: pztsweep [--dwell <ms>] [config.json]\n";
      return 2;
    } else {
      configPath = arg;
    }
  }

  ExperimentConfig config;
  try {
    config = ConfigLoader(configPath).load();
  } catch (const ConfigError& e) {
    std::cerr << e.what() << "\n";
    return 2;
  }

  auto errorMonitor = std::make_shared<ErrorMonitor>();
  errorMonitor->registerEscalation(
      [](const std::string& msg) { std::cerr << "[ErrorMonitor] " << msg << "\n"; });

  std::unique_ptr<ExperimentEngine> engine;
  try {
    std::shared_ptr<AcquisitionGateway> gateway;
    if (dwell) {
      std::cout << "[pztsweep] piezo-only sweep, dwell " << dwell->count() << " ms per step\n";
      gateway = std::make_shared<DwellAcquisitionGateway>(*dwell);
    } else {
      gateway = std::make_shared<ProcessAcquisitionGateway>(config.acquisition, config.nfiles,
                                                            config.nrefls);
    }
    engine = std::make_unique<ExperimentEngine>(
        config, std::make_shared<ChannelLink>(errorMonitor), std::move(gateway), errorMonitor,
        std::make_shared<ConsoleObserver>(), std::make_shared<Logger>());
  } catch (const std::filesystem::filesystem_error& e) {
    std::cerr << "[pztsweep] cannot prepare acquisition directory: " << e.what() << "\n";
    return 1;
  } catch (const std::invalid_argument& e) {
    std::cerr << "[pztsweep] " << e.what() << "\n";
    return 2;
  }

  std::signal(SIGINT, onSignal);
  std::signal(SIGTERM, onSignal);

  std::atomic<bool> finished{ false };
  ExperimentEngine::State outcome = ExperimentEngine::State::Failed;
  std::thread worker([&] {
    outcome = engine->run();
    finished = true;
  });

  while (!finished.load()) {
    if (g_stopRequested.load())
      engine->stop();
    std::this_thread::sleep_for(std::chrono::milliseconds{ 100 });
  }
  worker.join();

  return exitCodeFor(outcome);
}
