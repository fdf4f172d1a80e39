#pragma once
/** @file  Logger.hpp
 *  @brief Asynchronous CSV run logger (runs its own worker thread).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "io/FileLogger.hpp"

namespace pzt {
  namespace core {

    /// One row of run_log.csv: timestamp,step,total,event,detail
    struct LogEvent {
      std::string timestamp; ///< filled by log() when empty
      std::size_t step{ 0 };
      std::size_t total{ 0 };
      std::string event;
      std::string detail;
    };

    template <typename T> class RingBuffer; // forward decl to avoid heavy include

    /// Local time, ISO-8601 with milliseconds.
    std::string isoTimestamp();

    class Logger {

    public:
      explicit Logger(std::size_t capacity = 1024);
      ~Logger(); ///< finishRun()

      // --- public API ---
      bool startNewRun(const std::string& csvPath); ///< open file + launch worker thread
      void log(LogEvent event);                     ///< enqueue event (non-blocking)
      void finishRun();                             ///< drain + flush + join worker thread

      bool isRunning() const { return running_.load(); }
      std::size_t dropped() const { return dropped_.load(); } ///< events lost to a full ring

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

    private:
      void workerLoop();
      static std::string toCsv(const LogEvent& e);

      io::FileLogger csvFile_;
      std::unique_ptr<RingBuffer<LogEvent>> buffer_;
      std::mutex mtx_;
      std::condition_variable cv_;
      std::thread worker_;
      std::atomic<bool> running_{ false };
      std::atomic<std::size_t> dropped_{ 0 };
    };

  } // namespace core
} // namespace pzt
