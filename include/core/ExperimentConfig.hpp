#pragma once
/** @file  ExperimentConfig.hpp
 *  @brief Typed, validated run configuration consumed by the sweep engine.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <array>
#include <cstdint>
#include <string>

#include "protocols/Waveform.hpp"

namespace pzt::core {

  using ChannelIndex = std::uint8_t;
  inline constexpr std::size_t kNumChannels = 3;

  /// {min, max, step}; step == 0 pins the parameter to `min`.
  struct ParameterRange {
    double min{ 0.0 };
    double max{ 0.0 };
    double step{ 0.0 };
  };

  struct ChannelRange {
    ParameterRange amplitude{};
    ParameterRange bias{};
    ParameterRange frequency{};
    protocols::WaveformKind waveform{ protocols::WaveformKind::Sine };

    /// Every min and max exactly zero: channel is held at {0,0,0}.
    bool isInactive() const {
      return amplitude.min == 0.0 && amplitude.max == 0.0 && bias.min == 0.0 &&
             bias.max == 0.0 && frequency.min == 0.0 && frequency.max == 0.0;
    }
  };

  struct AcquisitionSettings {
    std::string executable{ "./read_udp_das" };
    std::string workDir{ "refls1" };
  };

  struct ExperimentConfig {
    std::string serialPort;
    std::string prefix;
    int nfiles{ 0 };
    int nrefls{ 0 };
    bool parallelSweep{ false };
    protocols::WaveformKind waveform{ protocols::WaveformKind::Sine }; ///< default for channels
    std::array<ChannelRange, kNumChannels> channels{};
    AcquisitionSettings acquisition{};
  };

} // namespace pzt::core
