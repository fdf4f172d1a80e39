#pragma once
/** @file  SweepPlanner.hpp
 *  @brief Expands per-channel ranges into the ordered list of sweep steps.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <array>
#include <cstddef>
#include <vector>

#include "core/ExperimentConfig.hpp"
#include "protocols/Waveform.hpp"

namespace pzt::core {

  /// Physical quantities commanded to one channel for one step.
  struct ChannelSetpoint {
    double voltage{ 0.0 };
    double bias{ 0.0 };
    double frequency{ 0.0 };
  };

  /// One point of the sweep; built by SweepPlanner, consumed once by the engine.
  struct SweepStep {
    std::size_t index{ 0 }; ///< 0-based position in the plan
    std::array<ChannelSetpoint, kNumChannels> setpoints{};
    std::array<protocols::WaveformKind, kNumChannels> waveforms{};
  };

  /**
 * @class SweepPlanner
 * @brief Per-run value object: ranges in, ordered SweepSteps out.
 *
 *  * Sequential: full factorial, ch0 outermost, amplitude > bias > frequency
 *    nesting inside each channel, frequency varying fastest.
 *  * Parallel: every range walked in lockstep, short ranges hold their last value.
 *  * Inactive channels (all min/max zero) are pinned to {0,0,0} and do not
 *    contribute an axis.
 */
  class SweepPlanner {
  public:
    enum class Mode { Sequential, Parallel };

    /// Upper bound on planned steps and on the values of a single range.
    static constexpr std::size_t kMaxSteps = 1'000'000;

    /// @throws std::invalid_argument if an active channel has a negative step or min > max,
    ///         or the sweep would exceed kMaxSteps.
    SweepPlanner(const std::array<ChannelRange, kNumChannels>& channels, Mode mode);

    static SweepPlanner fromConfig(const ExperimentConfig& cfg);

    /// min, min+step, ... while <= max; step == 0 gives just {min}.
    /// @throws std::invalid_argument if that is more than kMaxSteps values.
    static std::vector<double> range(const ParameterRange& param);

    std::vector<SweepStep> plan() const;
    std::size_t totalSteps() const { return totalSteps_; }
    bool isActive(ChannelIndex ch) const { return !channels_.at(ch).isInactive(); }
    Mode mode() const { return mode_; }

  private:
    struct Axis {
      ChannelIndex channel;
      double ChannelSetpoint::*field;
      std::vector<double> values;
    };

    SweepStep baseStep() const;

    std::array<ChannelRange, kNumChannels> channels_;
    Mode mode_;
    std::vector<Axis> axes_;
    std::size_t totalSteps_{ 1 };
  };

} // namespace pzt::core
