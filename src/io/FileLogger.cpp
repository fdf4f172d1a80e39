/* @file FileLogger.cpp
 * @brief 4 kB chunked fwrite wrapper
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cerrno>
#include <cstring>
#include <iostream>

// PZT headers
#include "io/FileLogger.hpp"

using namespace pzt::io;

FileLogger::~FileLogger() { close(); }

bool FileLogger::open(const std::string& path) {
  close();
  fp_ = std::fopen(path.c_str(), "w");
  if (!fp_) {
    std::cerr << "[FileLogger] cannot open " << path << ": " << strerror(errno) << "\n";
    return false;
  }
  buffer_.reserve(kChunk);
  return true;
}

void FileLogger::write(const std::string& csv) {
  if (!fp_)
    return;
  buffer_.insert(buffer_.end(), csv.begin(), csv.end());
  if (buffer_.size() >= kChunk)
    flush();
}

bool FileLogger::flush() {
  if (!fp_)
    return false;

  bool ok = true;
  if (!buffer_.empty()) {
    ok = std::fwrite(buffer_.data(), 1, buffer_.size(), fp_) == buffer_.size();
    buffer_.clear();
  }
  ok = (std::fflush(fp_) == 0) && ok;
  if (!ok)
    std::cerr << "[FileLogger] write failed: " << strerror(errno) << "\n";
  return ok;
}

void FileLogger::close() {
  if (!fp_)
    return;
  flush();
  std::fclose(fp_);
  fp_ = nullptr;
}
