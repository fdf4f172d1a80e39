#pragma once

/** @file  ExperimentEngine.hpp
 *  @brief Sweep state machine: configure channels, acquire, file, repeat.
 *
 *  © 2025 Milo Medical — licensed under MIT.
 */

#include <array>
#include <atomic>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/ExperimentConfig.hpp"
#include "core/SweepPlanner.hpp"

namespace pzt {
  namespace core {

    class AcquisitionGateway;
    class ChannelLink;
    class ErrorMonitor;
    class ExperimentObserver;
    class Logger;
    class StepCounter;

    /// Acquisition process failed or left no files.
    class AcquisitionError : public std::runtime_error {
    public:
      explicit AcquisitionError(const std::string& what) : std::runtime_error(what) {}
    };

    /// Progress shared with other threads; `running` doubles as the stop flag.
    struct ExperimentState {
      std::atomic<std::size_t> currentStep{ 0 };
      std::size_t totalSteps{ 0 };
      std::atomic<bool> running{ false };
    };

    /**
 * @class ExperimentEngine
 * @brief Walks the planned sweep on the caller's thread.
 *
 *  Idle -> Running -> SafeShutdown -> {Completed | Stopped | Failed}
 *
 *  * Every exit path zeroes all channels and closes the link before the
 *    observer hears about the outcome.
 *  * stop() only clears the running flag; it is honoured at the next step
 *    boundary. A stop that arrives before run() is latched and ends the run
 *    before its first step.
 *  * One run per engine instance.
 */
    class ExperimentEngine {

    public:
      enum class State { Idle, Running, SafeShutdown, Completed, Stopped, Failed };

      ExperimentEngine(ExperimentConfig config, std::shared_ptr<ChannelLink> link,
                       std::shared_ptr<AcquisitionGateway> gateway,
                       std::shared_ptr<ErrorMonitor> errMonitor,
                       std::shared_ptr<ExperimentObserver> observer = nullptr,
                       std::shared_ptr<Logger> logger = nullptr);
      ~ExperimentEngine();

      // ---- public API ----
      State run();  ///< blocking; returns Completed, Stopped or Failed
      void stop();  ///< cooperative, callable from any thread

      State state() const { return state_.load(); }
      std::size_t currentStep() const { return progress_.currentStep.load(); }
      std::size_t totalSteps() const { return progress_.totalSteps; }
      bool isRunning() const { return progress_.running.load(); }

      /// "{label}_{prefix} f={f} a={a} b={b}" using the lowest active channel;
      /// further active channels append " chN f=.. a=.. b=..".
      static std::string folderName(const std::string& prefix, const std::string& label,
                                    const SweepStep& step,
                                    const std::array<bool, kNumChannels>& active);

      ExperimentEngine(const ExperimentEngine&) = delete;
      ExperimentEngine& operator=(const ExperimentEngine&) = delete;

    private:
      void runStep(const SweepStep& step, StepCounter& counter);
      void safeShutdown();
      void transitionTo(State next);
      void record(const char* event, const std::string& detail);

      ExperimentConfig config_;
      SweepPlanner planner_;
      std::shared_ptr<ChannelLink> link_;
      std::shared_ptr<AcquisitionGateway> gateway_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      std::shared_ptr<ExperimentObserver> observer_;
      std::shared_ptr<Logger> logger_;

      ExperimentState progress_;
      std::atomic<bool> stopRequested_{ false };
      std::atomic<State> state_{ State::Idle };
    };

    const char* toString(ExperimentEngine::State s);

  } // namespace core
} // namespace pzt
