/* @file ChannelLink.cpp
 * @brief frames setpoints onto the serial link, one channel at a time
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <iostream>
#include <string>

// PZT headers
#include "core/ChannelLink.hpp"
#include "core/Logger.hpp" // isoTimestamp()
#include "protocols/FixedPoint.hpp" // ProtocolError

using namespace pzt::core;
using pzt::protocols::Command;
using pzt::protocols::WaveformKind;

namespace {
  constexpr auto kMonitorPeriod = std::chrono::milliseconds{ 10 };
}

ChannelLink::ChannelLink(std::shared_ptr<ErrorMonitor> errMonitor)
    : ChannelLink(std::make_unique<io::SerialChannel>(), std::move(errMonitor)) {}

ChannelLink::ChannelLink(std::unique_ptr<io::SerialChannel> serial,
                         std::shared_ptr<ErrorMonitor> errMonitor)
    : serial_(std::move(serial)), errorMonitor_(std::move(errMonitor)) {
  if (!serial_)
    throw std::invalid_argument("[ChannelLink] serial channel is nullptr");
  if (!errorMonitor_)
    throw std::invalid_argument("[ChannelLink] error monitor is nullptr");
}

ChannelLink::~ChannelLink() { ChannelLink::close(); }

void ChannelLink::open(const std::string& port) {
  std::lock_guard<std::mutex> lock(lifecycleMtx_);
  if (serial_->isOpen())
    return;

  if (!serial_->open(port, kDefaultBaud)) {
    std::string errMsg = "[ChannelLink] serial port " + port + " open failed";
    errorMonitor_->notifyFailure(errMsg);
    throw LinkError(errMsg);
  }
  std::cout << "[ChannelLink] connected to " << port << " @ 115200 baud\n";
}

std::size_t ChannelLink::configureChannels(WaveformKind waveform, const SetpointMap& setpoints) {
  for (const auto& [ch, sp] : setpoints) {
    if (ch >= kNumChannels)
      std::cerr << "[ChannelLink] warning: ignoring setpoint for unknown channel "
                << static_cast<int>(ch) << "\n";
  }

  std::size_t ok = 0;
  for (ChannelIndex ch = 0; ch < kNumChannels; ++ch) {
    ChannelSetpoint sp{};
    if (auto it = setpoints.find(ch); it != setpoints.end()) {
      sp = it->second;
    } else {
      std::cerr << "[ChannelLink] warning: missing ch" << (ch + 1)
                << ", using v=0 b=0 f=0\n";
    }
    if (configureChannel(ch, waveform, sp))
      ++ok;
  }
  return ok;
}

std::size_t ChannelLink::configureStep(const SweepStep& step) {
  std::size_t ok = 0;
  for (ChannelIndex ch = 0; ch < kNumChannels; ++ch) {
    if (configureChannel(ch, step.waveforms[ch], step.setpoints[ch]))
      ++ok;
  }
  return ok;
}

std::size_t ChannelLink::zeroAll(WaveformKind waveform) {
  return configureChannels(waveform, SetpointMap{ { 0, {} }, { 1, {} }, { 2, {} } });
}

bool ChannelLink::configureChannel(ChannelIndex ch, WaveformKind waveform,
                                   const ChannelSetpoint& sp) {
  try {
    send(ch, Command::setVoltage(ch, sp.voltage));
    send(ch, Command::setBias(ch, sp.bias));
    send(ch, Command::setWaveform(ch, waveform, sp.voltage, sp.frequency));
    return true;
  } catch (const protocols::ProtocolError& e) {
    reportChannelFailure(ch, e.what());
  } catch (const LinkError& e) {
    reportChannelFailure(ch, e.what());
  }
  return false;
}

void ChannelLink::reportChannelFailure(ChannelIndex ch, const std::string& what) {
  const std::string errMsg =
      "[ChannelLink] ch" + std::to_string(ch + 1) + " configuration error: " + what;
  std::cerr << errMsg << "\n";
  errorMonitor_->notifyFailure(errMsg);
}

void ChannelLink::send(ChannelIndex ch, const Command& cmd) {
  if (!serial_->isOpen())
    throw LinkError("serial link not open");

  if (!serial_->writeBytes(cmd.toWire()))
    throw LinkError("write failed for frame " + protocols::toHex(cmd.toWire()) + " on ch" +
                    std::to_string(ch + 1));
}

void ChannelLink::startMonitoring() {
  std::lock_guard<std::mutex> lock(lifecycleMtx_);
  if (monitoring_.exchange(true))
    return;
  monitor_ = std::thread(&ChannelLink::monitorLoop, this);
}

void ChannelLink::monitorLoop() {
  while (monitoring_.load() && serial_->isOpen()) {
    if (auto rx = serial_->readAvailable(std::chrono::milliseconds{ 0 })) {
      std::cout << "[ChannelLink] RX: " << isoTimestamp() << " - " << protocols::toHex(*rx)
                << "\n";
    }
    std::this_thread::sleep_for(kMonitorPeriod);
  }
}

void ChannelLink::stopMonitoring() {
  monitoring_ = false;
  if (monitor_.joinable() && monitor_.get_id() != std::this_thread::get_id())
    monitor_.join();
}

void ChannelLink::close() {
  std::lock_guard<std::mutex> lock(lifecycleMtx_);
  stopMonitoring();
  if (serial_->isOpen()) {
    serial_->close();
    std::cout << "[ChannelLink] serial port closed\n";
  }
}

bool ChannelLink::isOpen() const { return serial_->isOpen(); }
