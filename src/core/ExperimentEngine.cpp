/* @file ExperimentEngine.cpp
 * @brief sweep FSM with a mandatory zero-and-close on every exit path
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <charconv>
#include <filesystem>
#include <iostream>
#include <system_error>
#include <utility>
#include <variant>

// PZT headers
#include "core/AcquisitionGateway.hpp"
#include "core/ChannelLink.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/ExperimentEngine.hpp"
#include "core/ExperimentObserver.hpp"
#include "core/Logger.hpp"
#include "core/StepCounter.hpp"

namespace fs = std::filesystem;

namespace pzt::core {

  namespace {

    // shortest round-trip text, integral values keep a trailing ".0"
    std::string formatValue(double v) {
      char buf[64];
      auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), v);
      if (ec != std::errc{})
        return std::to_string(v);
      std::string out(buf, end);
      if (out.find_first_of(".ein") == std::string::npos)
        out += ".0";
      return out;
    }

    std::string describe(const SweepStep& step) {
      std::string out;
      for (std::size_t ch = 0; ch < kNumChannels; ++ch) {
        const auto& sp = step.setpoints[ch];
        if (ch)
          out += ' ';
        out += "ch" + std::to_string(ch + 1) + ":" + protocols::toWireCode(step.waveforms[ch]) +
               " v=" + formatValue(sp.voltage) + " b=" + formatValue(sp.bias) +
               " f=" + formatValue(sp.frequency);
      }
      return out;
    }

  } // namespace

  const char* toString(ExperimentEngine::State s) {
    switch (s) {
    case ExperimentEngine::State::Idle:
      return "Idle";
    case ExperimentEngine::State::Running:
      return "Running";
    case ExperimentEngine::State::SafeShutdown:
      return "SafeShutdown";
    case ExperimentEngine::State::Completed:
      return "Completed";
    case ExperimentEngine::State::Stopped:
      return "Stopped";
    case ExperimentEngine::State::Failed:
      return "Failed";
    default:
      return "Unknown";
    }
  }

  ExperimentEngine::ExperimentEngine(ExperimentConfig config, std::shared_ptr<ChannelLink> link,
                                     std::shared_ptr<AcquisitionGateway> gateway,
                                     std::shared_ptr<ErrorMonitor> errMonitor,
                                     std::shared_ptr<ExperimentObserver> observer,
                                     std::shared_ptr<Logger> logger)
      : config_(std::move(config)), planner_(SweepPlanner::fromConfig(config_)),
        link_(std::move(link)), gateway_(std::move(gateway)), errorMonitor_(std::move(errMonitor)),
        observer_(std::move(observer)), logger_(std::move(logger)) {
    if (!link_)
      throw std::invalid_argument("[ExperimentEngine] channel link is nullptr");
    if (!gateway_)
      throw std::invalid_argument("[ExperimentEngine] acquisition gateway is nullptr");
    if (!errorMonitor_)
      throw std::invalid_argument("[ExperimentEngine] error monitor is nullptr");

    progress_.totalSteps = planner_.totalSteps();
  }

  ExperimentEngine::~ExperimentEngine() = default;

  ExperimentEngine::State ExperimentEngine::run() {
    State expected = State::Idle;
    if (!state_.compare_exchange_strong(expected, State::Running))
      throw std::logic_error("[ExperimentEngine] run() called twice");

    progress_.currentStep = 0;
    progress_.running = true;
    if (stopRequested_.load())
      progress_.running = false;
    std::cout << "[ExperimentEngine] " << toString(state_.load()) << ": "
              << progress_.totalSteps << " steps ("
              << (planner_.mode() == SweepPlanner::Mode::Parallel ? "parallel" : "sequential")
              << ")\n";

    const fs::path runLog = fs::path(config_.prefix) / "run_log.csv";
    if (logger_ && !logger_->startNewRun(runLog.string()))
      std::cerr << "[ExperimentEngine] warning: run log " << runLog << " unavailable\n";
    record("start", config_.serialPort);

    State outcome = State::Completed;
    std::string error;
    try {
      fs::create_directories(config_.prefix);
      link_->open(config_.serialPort);
      link_->startMonitoring();

      StepCounter counter;
      for (const auto& step : planner_.plan()) {
        if (!progress_.running.load()) {
          outcome = State::Stopped;
          break;
        }
        runStep(step, counter);
      }
    } catch (const std::exception& e) {
      outcome = State::Failed;
      error = e.what();
      std::cerr << "[ExperimentEngine] step " << (progress_.currentStep.load() + 1) << "/"
                << progress_.totalSteps << " failed: " << error << "\n";
      record("error", error);
    }

    safeShutdown();
    progress_.running = false;
    transitionTo(outcome);

    switch (outcome) {
    case State::Failed:
      errorMonitor_->notifyFailure("[ExperimentEngine] " + error);
      if (observer_)
        observer_->onError(error);
      break;
    case State::Stopped:
      record("stopped", "");
      if (observer_)
        observer_->onStopped(progress_.currentStep.load(), progress_.totalSteps);
      break;
    default:
      record("complete", "");
      if (observer_)
        observer_->onComplete();
      break;
    }

    if (logger_)
      logger_->finishRun();
    return outcome;
  }

  void ExperimentEngine::stop() {
    stopRequested_ = true;
    if (progress_.running.exchange(false))
      std::cout << "[ExperimentEngine] stop requested, finishing current step\n";
  }

  void ExperimentEngine::runStep(const SweepStep& step, StepCounter& counter) {
    const std::size_t number = step.index + 1;
    std::cout << "[ExperimentEngine] step " << number << "/" << progress_.totalSteps << ": "
              << describe(step) << "\n";
    record("step", describe(step));

    const std::size_t configured = link_->configureStep(step);
    if (configured < kNumChannels)
      std::cerr << "[ExperimentEngine] warning: only " << configured << "/" << kNumChannels
                << " channels configured for step " << number << "\n";

    AcquisitionResult result = gateway_->acquire();
    if (const auto* failed = std::get_if<ProcessFailed>(&result))
      throw AcquisitionError("data acquisition failed: process exited with code " +
                             std::to_string(failed->exitCode));
    if (std::holds_alternative<NothingAcquired>(result))
      throw AcquisitionError("no data files were acquired");

    const auto& files = std::get<Acquired>(result).files;
    std::array<bool, kNumChannels> active{};
    for (ChannelIndex ch = 0; ch < kNumChannels; ++ch)
      active[ch] = planner_.isActive(ch);

    const fs::path folder =
        fs::path(config_.prefix) / folderName(config_.prefix, counter.label(), step, active);
    gateway_->relocate(files, folder);
    record("acquired", std::to_string(files.size()) + " files -> " + folder.string());

    counter.advance();
    const std::size_t done = ++progress_.currentStep;
    if (observer_)
      observer_->onProgress(done, progress_.totalSteps);
  }

  void ExperimentEngine::safeShutdown() {
    transitionTo(State::SafeShutdown);

    // failures here are logged only, the original error (if any) is what gets reported
    try {
      const std::size_t zeroed = link_->zeroAll(config_.waveform);
      if (zeroed < kNumChannels)
        std::cerr << "[ExperimentEngine] warning: only " << zeroed << "/" << kNumChannels
                  << " channels confirmed zeroed\n";
    } catch (const std::exception& e) {
      std::cerr << "[ExperimentEngine] zeroing channels failed: " << e.what() << "\n";
    }
    try {
      link_->close();
    } catch (const std::exception& e) {
      std::cerr << "[ExperimentEngine] closing link failed: " << e.what() << "\n";
    }
    gateway_->cleanup();
    record("shutdown", "channels zeroed, link closed");
  }

  void ExperimentEngine::transitionTo(State next) { state_ = next; }

  void ExperimentEngine::record(const char* event, const std::string& detail) {
    if (logger_)
      logger_->log(LogEvent{ "", progress_.currentStep.load(), progress_.totalSteps, event, detail });
  }

  std::string ExperimentEngine::folderName(const std::string& prefix, const std::string& label,
                                           const SweepStep& step,
                                           const std::array<bool, kNumChannels>& active) {
    std::size_t primary = 0;
    for (std::size_t ch = 0; ch < kNumChannels; ++ch) {
      if (active[ch]) {
        primary = ch;
        break;
      }
    }

    const auto& p = step.setpoints[primary];
    std::string name = label + "_" + prefix + " f=" + formatValue(p.frequency) +
                       " a=" + formatValue(p.voltage) + " b=" + formatValue(p.bias);

    for (std::size_t ch = primary + 1; ch < kNumChannels; ++ch) {
      if (!active[ch])
        continue;
      const auto& sp = step.setpoints[ch];
      name += " ch" + std::to_string(ch + 1) + " f=" + formatValue(sp.frequency) +
              " a=" + formatValue(sp.voltage) + " b=" + formatValue(sp.bias);
    }
    return name;
  }

} // namespace pzt::core
