/* @file Logger.cpp
 * @brief ring-buffered CSV event log drained by a worker thread
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>

// PZT headers
#include "core/Logger.hpp"
#include "core/RingBuffer.hpp"

namespace pzt::core {

  std::string isoTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&t, &local);

    std::ostringstream os;
    os << std::put_time(&local, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
       << std::setfill('0') << ms.count();
    return os.str();
  }

  Logger::Logger(std::size_t capacity)
      : buffer_(std::make_unique<RingBuffer<LogEvent>>(capacity)) {}

  Logger::~Logger() { finishRun(); }

  bool Logger::startNewRun(const std::string& csvPath) {
    finishRun();

    const std::filesystem::path parent = std::filesystem::path(csvPath).parent_path();
    if (!parent.empty()) {
      std::error_code ec;
      std::filesystem::create_directories(parent, ec);
      if (ec) {
        std::cerr << "[Logger] cannot create " << parent << ": " << ec.message() << "\n";
        return false;
      }
    }
    if (!csvFile_.open(csvPath))
      return false;

    csvFile_.write("timestamp,step,total,event,detail\n");
    dropped_ = 0;
    running_ = true;
    worker_ = std::thread(&Logger::workerLoop, this);
    return true;
  }

  void Logger::log(LogEvent event) {
    if (event.timestamp.empty())
      event.timestamp = isoTimestamp();

    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (!running_.load())
        return;
      if (!buffer_->push(std::move(event))) {
        ++dropped_;
        return;
      }
    }
    cv_.notify_one();
  }

  void Logger::finishRun() {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (!running_.exchange(false) && !worker_.joinable())
        return;
    }
    cv_.notify_one();
    if (worker_.joinable())
      worker_.join();
    while (auto ev = buffer_->pop())
      csvFile_.write(toCsv(*ev));
    csvFile_.close();
    if (dropped_.load() > 0)
      std::cerr << "[Logger] " << dropped_.load() << " events dropped (ring full)\n";
  }

  void Logger::workerLoop() {
    std::unique_lock<std::mutex> lock(mtx_);
    for (;;) {
      cv_.wait(lock, [this] { return !buffer_->empty() || !running_.load(); });

      while (auto ev = buffer_->pop()) {
        lock.unlock();
        csvFile_.write(toCsv(*ev));
        lock.lock();
      }
      lock.unlock();
      csvFile_.flush();
      lock.lock();

      if (!running_.load() && buffer_->empty())
        return;
    }
  }

  std::string Logger::toCsv(const LogEvent& e) {
    std::string detail;
    detail.reserve(e.detail.size() + 2);
    detail.push_back('"');
    for (char c : e.detail) {
      if (c == '"')
        detail.push_back('"');
      detail.push_back(c);
    }
    detail.push_back('"');

    std::ostringstream os;
    os << e.timestamp << ',' << e.step << ',' << e.total << ',' << e.event << ',' << detail
       << '\n';
    return os.str();
  }

} // namespace pzt::core
