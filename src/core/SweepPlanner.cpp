/* @file SweepPlanner.cpp
 * @brief sequential (cartesian) and parallel (zipped) sweep expansion
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

// PZT headers
#include "core/SweepPlanner.hpp"

namespace pzt::core {

  SweepPlanner::SweepPlanner(const std::array<ChannelRange, kNumChannels>& channels, Mode mode)
      : channels_(channels), mode_(mode) {

    for (std::size_t ch = 0; ch < kNumChannels; ++ch) {
      const ChannelRange& r = channels_[ch];
      if (r.isInactive())
        continue;

      const std::pair<const ParameterRange*, double ChannelSetpoint::*> params[] = {
        { &r.amplitude, &ChannelSetpoint::voltage },
        { &r.bias, &ChannelSetpoint::bias },
        { &r.frequency, &ChannelSetpoint::frequency },
      };
      for (const auto& [param, field] : params) {
        if (param->step < 0.0)
          throw std::invalid_argument("[SweepPlanner] negative step on channel " +
                                      std::to_string(ch));
        auto values = range(*param);
        if (values.empty())
          throw std::invalid_argument("[SweepPlanner] empty range (min > max) on channel " +
                                      std::to_string(ch));
        axes_.push_back(Axis{ static_cast<ChannelIndex>(ch), field, std::move(values) });
      }
    }

    totalSteps_ = 1;
    for (const auto& axis : axes_) {
      if (mode_ == Mode::Parallel) {
        totalSteps_ = std::max(totalSteps_, axis.values.size());
        continue;
      }
      if (totalSteps_ > kMaxSteps / axis.values.size())
        throw std::invalid_argument("[SweepPlanner] sequential sweep exceeds " +
                                    std::to_string(kMaxSteps) + " steps");
      totalSteps_ *= axis.values.size();
    }
  }

  SweepPlanner SweepPlanner::fromConfig(const ExperimentConfig& cfg) {
    return SweepPlanner(cfg.channels, cfg.parallelSweep ? Mode::Parallel : Mode::Sequential);
  }

  std::vector<double> SweepPlanner::range(const ParameterRange& param) {
    if (!std::isfinite(param.min) || !std::isfinite(param.max) || !std::isfinite(param.step))
      throw std::invalid_argument("[SweepPlanner] non-finite range bound");
    if (param.step == 0.0)
      return { param.min };

    std::vector<double> out;
    if (param.step < 0.0 || param.min > param.max)
      return out;
    if ((param.max - param.min) / param.step >= static_cast<double>(kMaxSteps))
      throw std::invalid_argument("[SweepPlanner] range [" + std::to_string(param.min) + ", " +
                                  std::to_string(param.max) + "] step " +
                                  std::to_string(param.step) + " exceeds " +
                                  std::to_string(kMaxSteps) + " values");
    // min + i*step, never accumulated
    for (std::size_t i = 0;; ++i) {
      const double v = param.min + static_cast<double>(i) * param.step;
      if (v > param.max)
        break;
      out.push_back(v);
    }
    return out;
  }

  SweepStep SweepPlanner::baseStep() const {
    SweepStep s;
    for (std::size_t ch = 0; ch < kNumChannels; ++ch)
      s.waveforms[ch] = channels_[ch].waveform;
    return s;
  }

  std::vector<SweepStep> SweepPlanner::plan() const {
    std::vector<SweepStep> steps;
    steps.reserve(totalSteps_);

    if (mode_ == Mode::Parallel) {
      for (std::size_t i = 0; i < totalSteps_; ++i) {
        SweepStep s = baseStep();
        s.index = i;
        for (const auto& axis : axes_) {
          const double v = i < axis.values.size() ? axis.values[i] : axis.values.back();
          s.setpoints[axis.channel].*axis.field = v;
        }
        steps.push_back(s);
      }
      return steps;
    }

    // odometer over the axes, last axis turning fastest
    std::vector<std::size_t> digits(axes_.size(), 0);
    for (std::size_t i = 0; i < totalSteps_; ++i) {
      SweepStep s = baseStep();
      s.index = i;
      for (std::size_t a = 0; a < axes_.size(); ++a)
        s.setpoints[axes_[a].channel].*axes_[a].field = axes_[a].values[digits[a]];
      steps.push_back(s);

      for (std::size_t a = axes_.size(); a-- > 0;) {
        if (++digits[a] < axes_[a].values.size())
          break;
        digits[a] = 0;
      }
    }
    return steps;
  }

} // namespace pzt::core
