#include "core/StepCounter.hpp"
#include "core/SweepPlanner.hpp"

#include <gtest/gtest.h>

#include <set>
#include <tuple>

using namespace pzt::core;

namespace {

  ChannelRange activeChannel(ParameterRange a, ParameterRange b, ParameterRange f) {
    ChannelRange r;
    r.amplitude = a;
    r.bias = b;
    r.frequency = f;
    return r;
  }

  const ParameterRange kThree{ 0.0, 2.0, 1.0 }; // 0,1,2

} // namespace

TEST(sweep_range, inclusive_upper_bound) {
  EXPECT_EQ(SweepPlanner::range({ 0.0, 10.0, 5.0 }), (std::vector<double>{ 0.0, 5.0, 10.0 }));
  EXPECT_EQ(SweepPlanner::range({ 0.0, 9.0, 5.0 }), (std::vector<double>{ 0.0, 5.0 }));
  EXPECT_EQ(SweepPlanner::range({ -2.0, 2.0, 2.0 }), (std::vector<double>{ -2.0, 0.0, 2.0 }));
}

TEST(sweep_range, zero_step_pins_to_min) {
  EXPECT_EQ(SweepPlanner::range({ 5.0, 5.0, 0.0 }), (std::vector<double>{ 5.0 }));
  EXPECT_EQ(SweepPlanner::range({ 1.0, 8.0, 0.0 }), (std::vector<double>{ 1.0 }));
}

TEST(sweep_range, fractional_step_has_expected_length) {
  const auto r = SweepPlanner::range({ 0.0, 1.0, 0.25 });
  ASSERT_EQ(r.size(), 5u);
  EXPECT_DOUBLE_EQ(r.back(), 1.0);
}

TEST(sweep_range, min_above_max_is_empty) {
  EXPECT_TRUE(SweepPlanner::range({ 3.0, 1.0, 1.0 }).empty());
}

TEST(sweep_planner, sequential_single_channel_nesting_order) {
  std::array<ChannelRange, kNumChannels> ch{};
  ch[0] = activeChannel({ 1.0, 2.0, 1.0 }, { 0.0, 1.0, 1.0 }, { 10.0, 30.0, 10.0 });

  SweepPlanner planner(ch, SweepPlanner::Mode::Sequential);
  const auto steps = planner.plan();
  ASSERT_EQ(planner.totalSteps(), 12u);
  ASSERT_EQ(steps.size(), 12u);

  // amplitude outer, bias middle, frequency inner
  EXPECT_DOUBLE_EQ(steps[0].setpoints[0].voltage, 1.0);
  EXPECT_DOUBLE_EQ(steps[0].setpoints[0].bias, 0.0);
  EXPECT_DOUBLE_EQ(steps[0].setpoints[0].frequency, 10.0);
  EXPECT_DOUBLE_EQ(steps[1].setpoints[0].frequency, 20.0);
  EXPECT_DOUBLE_EQ(steps[2].setpoints[0].frequency, 30.0);
  EXPECT_DOUBLE_EQ(steps[3].setpoints[0].bias, 1.0);
  EXPECT_DOUBLE_EQ(steps[3].setpoints[0].frequency, 10.0);
  EXPECT_DOUBLE_EQ(steps[6].setpoints[0].voltage, 2.0);
  EXPECT_DOUBLE_EQ(steps[11].setpoints[0].voltage, 2.0);
  EXPECT_DOUBLE_EQ(steps[11].setpoints[0].bias, 1.0);
  EXPECT_DOUBLE_EQ(steps[11].setpoints[0].frequency, 30.0);

  for (std::size_t i = 0; i < steps.size(); ++i)
    EXPECT_EQ(steps[i].index, i);
}

TEST(sweep_planner, sequential_count_is_product_across_active_channels) {
  std::array<ChannelRange, kNumChannels> ch{};
  for (auto& c : ch)
    c = activeChannel(kThree, { 1.0, 3.0, 1.0 }, { 5.0, 7.0, 1.0 });

  SweepPlanner planner(ch, SweepPlanner::Mode::Sequential);
  EXPECT_EQ(planner.totalSteps(), 27u * 27u * 27u);
}

TEST(sweep_planner, sequential_covers_every_combination_once) {
  std::array<ChannelRange, kNumChannels> ch{};
  ch[0] = activeChannel(kThree, { 0.0, 0.0, 0.0 }, { 1.0, 1.0, 0.0 });
  ch[2] = activeChannel({ 1.0, 2.0, 1.0 }, { 0.0, 0.0, 0.0 }, { 1.0, 1.0, 0.0 });

  const auto steps = SweepPlanner(ch, SweepPlanner::Mode::Sequential).plan();
  ASSERT_EQ(steps.size(), 6u);

  std::set<std::pair<double, double>> seen;
  for (const auto& s : steps)
    seen.emplace(s.setpoints[0].voltage, s.setpoints[2].voltage);
  EXPECT_EQ(seen.size(), 6u);

  // channel 0 is the outer axis
  EXPECT_DOUBLE_EQ(steps[0].setpoints[2].voltage, 1.0);
  EXPECT_DOUBLE_EQ(steps[1].setpoints[2].voltage, 2.0);
  EXPECT_DOUBLE_EQ(steps[1].setpoints[0].voltage, 0.0);
  EXPECT_DOUBLE_EQ(steps[2].setpoints[0].voltage, 1.0);
}

TEST(sweep_planner, parallel_pads_short_ranges_with_last_value) {
  std::array<ChannelRange, kNumChannels> ch{};
  ch[0] = activeChannel({ 1.0, 2.0, 1.0 },        // 2 values
                        { 0.0, 4.0, 1.0 },        // 5 values
                        { 10.0, 30.0, 10.0 });    // 3 values

  SweepPlanner planner(ch, SweepPlanner::Mode::Parallel);
  const auto steps = planner.plan();
  ASSERT_EQ(planner.totalSteps(), 5u);
  ASSERT_EQ(steps.size(), 5u);

  const double amps[] = { 1.0, 2.0, 2.0, 2.0, 2.0 };
  const double biases[] = { 0.0, 1.0, 2.0, 3.0, 4.0 };
  const double freqs[] = { 10.0, 20.0, 30.0, 30.0, 30.0 };
  for (std::size_t i = 0; i < 5; ++i) {
    EXPECT_DOUBLE_EQ(steps[i].setpoints[0].voltage, amps[i]) << "step " << i;
    EXPECT_DOUBLE_EQ(steps[i].setpoints[0].bias, biases[i]) << "step " << i;
    EXPECT_DOUBLE_EQ(steps[i].setpoints[0].frequency, freqs[i]) << "step " << i;
  }
}

TEST(sweep_planner, parallel_zips_across_channels) {
  std::array<ChannelRange, kNumChannels> ch{};
  ch[0] = activeChannel({ 0.0, 3.0, 1.0 }, { 0.0, 0.0, 0.0 }, { 1.0, 1.0, 0.0 });
  ch[1] = activeChannel({ 10.0, 11.0, 1.0 }, { 0.0, 0.0, 0.0 }, { 1.0, 1.0, 0.0 });

  const auto steps = SweepPlanner(ch, SweepPlanner::Mode::Parallel).plan();
  ASSERT_EQ(steps.size(), 4u);
  EXPECT_DOUBLE_EQ(steps[3].setpoints[0].voltage, 3.0);
  EXPECT_DOUBLE_EQ(steps[3].setpoints[1].voltage, 11.0);
}

TEST(sweep_planner, inactive_channel_is_held_at_zero_and_not_counted) {
  std::array<ChannelRange, kNumChannels> ch{};
  ch[0] = activeChannel(kThree, kThree, kThree);
  ch[1].amplitude = { 0.0, 0.0, 5.0 }; // step set, but min/max zero: still inactive
  ch[2] = activeChannel({ 1.0, 2.0, 1.0 }, { 0.0, 0.0, 0.0 }, { 1.0, 1.0, 0.0 });

  SweepPlanner planner(ch, SweepPlanner::Mode::Sequential);
  EXPECT_FALSE(planner.isActive(1));
  EXPECT_TRUE(planner.isActive(0));
  ASSERT_EQ(planner.totalSteps(), 27u * 2u);

  for (const auto& s : planner.plan()) {
    EXPECT_EQ(s.setpoints[1].voltage, 0.0);
    EXPECT_EQ(s.setpoints[1].bias, 0.0);
    EXPECT_EQ(s.setpoints[1].frequency, 0.0);
  }
}

TEST(sweep_planner, all_inactive_yields_single_zero_step) {
  std::array<ChannelRange, kNumChannels> ch{};
  for (auto mode : { SweepPlanner::Mode::Sequential, SweepPlanner::Mode::Parallel }) {
    SweepPlanner planner(ch, mode);
    const auto steps = planner.plan();
    ASSERT_EQ(steps.size(), 1u);
    EXPECT_EQ(steps[0].setpoints[0].voltage, 0.0);
  }
}

TEST(sweep_planner, waveforms_follow_channel_config) {
  std::array<ChannelRange, kNumChannels> ch{};
  ch[0] = activeChannel(kThree, kThree, kThree);
  ch[0].waveform = pzt::protocols::WaveformKind::Square;
  ch[2].waveform = pzt::protocols::WaveformKind::Sawtooth;

  const auto steps = SweepPlanner(ch, SweepPlanner::Mode::Parallel).plan();
  ASSERT_FALSE(steps.empty());
  EXPECT_EQ(steps[0].waveforms[0], pzt::protocols::WaveformKind::Square);
  EXPECT_EQ(steps[0].waveforms[1], pzt::protocols::WaveformKind::Sine);
  EXPECT_EQ(steps[0].waveforms[2], pzt::protocols::WaveformKind::Sawtooth);
}

TEST(sweep_planner, rejects_invalid_active_ranges) {
  std::array<ChannelRange, kNumChannels> ch{};
  ch[0] = activeChannel({ 5.0, 1.0, 1.0 }, kThree, kThree);
  EXPECT_THROW(SweepPlanner(ch, SweepPlanner::Mode::Sequential), std::invalid_argument);

  ch[0] = activeChannel({ 0.0, 1.0, -1.0 }, kThree, kThree);
  EXPECT_THROW(SweepPlanner(ch, SweepPlanner::Mode::Parallel), std::invalid_argument);
}

TEST(sweep_planner, sequential_product_is_bounded_instead_of_wrapping) {
  const ParameterRange wide{ 0.0, 32767.5, 0.5 }; // 65536 values
  std::array<ChannelRange, kNumChannels> ch{};
  ch[0] = activeChannel(wide, wide, wide);
  ch[1] = activeChannel(wide, { 0.0, 0.0, 0.0 }, { 1.0, 1.0, 0.0 });
  EXPECT_THROW(SweepPlanner(ch, SweepPlanner::Mode::Sequential), std::invalid_argument);

  // each axis alone is fine in lockstep
  EXPECT_EQ(SweepPlanner(ch, SweepPlanner::Mode::Parallel).totalSteps(), 65536u);
}

TEST(sweep_planner, step_count_limit_is_inclusive) {
  std::array<ChannelRange, kNumChannels> ch{};
  ch[0] = activeChannel({ 0.0, 999.0, 1.0 }, { 0.0, 999.0, 1.0 }, { 1.0, 1.0, 0.0 });
  EXPECT_EQ(SweepPlanner(ch, SweepPlanner::Mode::Sequential).totalSteps(), SweepPlanner::kMaxSteps);

  ch[0].bias.max = 1000.0;
  EXPECT_THROW(SweepPlanner(ch, SweepPlanner::Mode::Sequential), std::invalid_argument);
}

TEST(sweep_range, tiny_step_is_rejected_before_allocating) {
  EXPECT_THROW(SweepPlanner::range({ 0.0, 32767.0, 1e-9 }), std::invalid_argument);
  EXPECT_EQ(SweepPlanner::range({ 0.0, 999999.0, 1.0 }).size(), SweepPlanner::kMaxSteps);
}

TEST(sweep_planner, from_config_picks_mode) {
  ExperimentConfig cfg;
  cfg.channels[0] = activeChannel({ 1.0, 2.0, 1.0 }, { 0.0, 4.0, 1.0 }, { 1.0, 1.0, 0.0 });
  EXPECT_EQ(SweepPlanner::fromConfig(cfg).totalSteps(), 10u);
  cfg.parallelSweep = true;
  EXPECT_EQ(SweepPlanner::fromConfig(cfg).totalSteps(), 5u);
}

TEST(step_counter, rolls_over_at_ten) {
  StepCounter c;
  EXPECT_EQ(c.label(), "1_1_1");
  for (int n = 0; n < 8; ++n)
    c.advance();
  EXPECT_EQ(c.label(), "1_1_9");
  c.advance();
  EXPECT_EQ(c.label(), "1_2_1");
  for (int n = 0; n < 9 * 7; ++n)
    c.advance();
  EXPECT_EQ(c.label(), "1_9_1");
  for (int n = 0; n < 9; ++n)
    c.advance();
  EXPECT_EQ(c.label(), "2_1_1");
}
