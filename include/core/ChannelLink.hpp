#pragma once
/** @file  ChannelLink.hpp
 *  @brief Serial link to the 3-channel PZT controller.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

// PZT headers
#include "core/ErrorMonitor.hpp"   // ChannelLink reports per-channel faults here
#include "core/SweepPlanner.hpp"   // ChannelSetpoint / SweepStep
#include "io/SerialChannel.hpp"    // ChannelLink owns the transport
#include "protocols/Command.hpp"

namespace pzt {
  namespace core {

    /// Serial port unavailable or a frame could not be written.
    class LinkError : public std::runtime_error {
    public:
      explicit LinkError(const std::string& what) : std::runtime_error(what) {}
    };

    using SetpointMap = std::map<ChannelIndex, ChannelSetpoint>;

    /**
 * @class ChannelLink
 * @brief Owns the serial handle and turns setpoints into voltage, move and
 *        waveform frames, channel by channel.
 *
 *  * Per-channel failures are logged and reported, the next channel is still
 *    attempted.
 *  * Optional background monitor dumps inbound bytes as hex; it never writes.
 *  * close() is idempotent and also stops the monitor.
 */
    class ChannelLink {
    public:
      explicit ChannelLink(std::shared_ptr<ErrorMonitor> errMonitor);
      ChannelLink(std::unique_ptr<io::SerialChannel> serial, std::shared_ptr<ErrorMonitor> errMonitor);
      virtual ~ChannelLink();

      //---public APIs------------------------------------------------------
      /// @throws LinkError if the port cannot be opened.
      virtual void open(const std::string& port);

      /// Missing channels are sent {0,0,0}. Returns the number of channels fully configured.
      virtual std::size_t configureChannels(protocols::WaveformKind waveform,
                                            const SetpointMap& setpoints);

      /// Same as configureChannels() but with each channel's own waveform.
      virtual std::size_t configureStep(const SweepStep& step);

      /// Drive every channel to zero volts, zero bias, zero Hz.
      virtual std::size_t zeroAll(protocols::WaveformKind waveform);

      void startMonitoring();
      virtual void close();
      bool isOpen() const;

      ChannelLink(const ChannelLink&) = delete;
      ChannelLink& operator=(const ChannelLink&) = delete;

    private:
      bool configureChannel(ChannelIndex ch, protocols::WaveformKind waveform,
                            const ChannelSetpoint& sp);
      void send(ChannelIndex ch, const protocols::Command& cmd);
      void reportChannelFailure(ChannelIndex ch, const std::string& what);
      void monitorLoop();
      void stopMonitoring();

      static constexpr speed_t kDefaultBaud = B115200;
      std::unique_ptr<io::SerialChannel> serial_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;

      std::thread monitor_;
      std::atomic<bool> monitoring_{ false };
      std::mutex lifecycleMtx_; ///< serialises open/close against each other
    };

  } // namespace core
} // namespace pzt
