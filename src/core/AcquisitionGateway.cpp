/* @file AcquisitionGateway.cpp
 * @brief runs the acquisition executable and moves what it produced
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cerrno>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

// Linux headers
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h> // fork(), execvp(), _exit()

// PZT headers
#include "core/AcquisitionGateway.hpp"

namespace fs = std::filesystem;

namespace pzt::core {

  ProcessAcquisitionGateway::ProcessAcquisitionGateway(AcquisitionSettings settings, int nfiles,
                                                       int nrefls)
      : settings_(std::move(settings)), workDir_(settings_.workDir), nfiles_(nfiles),
        nrefls_(nrefls) {
    fs::create_directories(workDir_);
  }

  std::vector<std::string> ProcessAcquisitionGateway::commandLine() const {
    return { settings_.executable, "--dir", workDir_.string(), "--nfiles",
             std::to_string(nfiles_), "--nrefls", std::to_string(nrefls_) };
  }

  AcquisitionResult ProcessAcquisitionGateway::acquire() {
    clearWorkDir();

    const int rc = runProcess(commandLine());
    if (rc != 0) {
      std::cerr << "[Acquisition] " << settings_.executable << " exited with code " << rc << "\n";
      return ProcessFailed{ rc };
    }

    auto files = listWorkDir();
    if (files.empty())
      return NothingAcquired{};
    return Acquired{ std::move(files) };
  }

  void ProcessAcquisitionGateway::relocate(const std::vector<fs::path>& files,
                                           const fs::path& targetDir) {
    fs::create_directories(targetDir);

    for (const auto& src : files) {
      const fs::path dst = targetDir / src.filename();
      std::error_code ec;
      fs::rename(src, dst, ec);
      if (ec == std::errc::cross_device_link) {
        // different mount: copy then unlink, like mv(1)
        fs::copy_file(src, dst, fs::copy_options::overwrite_existing);
        fs::remove(src);
      } else if (ec) {
        throw fs::filesystem_error("[Acquisition] cannot move file", src, dst, ec);
      }
    }
  }

  void ProcessAcquisitionGateway::cleanup() {
    try {
      clearWorkDir();
    } catch (const fs::filesystem_error& e) {
      std::cerr << "[Acquisition] cleanup of " << workDir_ << " failed: " << e.what() << "\n";
    }
  }

  int ProcessAcquisitionGateway::runProcess(const std::vector<std::string>& argv) {
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv)
      args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    std::cout.flush();
    std::cerr.flush();

    const pid_t pid = ::fork();
    if (pid < 0)
      throw std::system_error(errno, std::generic_category(), "[Acquisition] fork");

    if (pid == 0) {
      ::execvp(args[0], args.data());
      ::_exit(127); // exec failed
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
      if (errno != EINTR)
        throw std::system_error(errno, std::generic_category(), "[Acquisition] waitpid");
    }

    if (WIFEXITED(status))
      return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
      return 128 + WTERMSIG(status);
    return -1;
  }

  void ProcessAcquisitionGateway::clearWorkDir() {
    fs::create_directories(workDir_);
    for (const auto& entry : fs::directory_iterator(workDir_)) {
      if (entry.is_regular_file())
        fs::remove(entry.path());
    }
  }

  std::vector<fs::path> ProcessAcquisitionGateway::listWorkDir() const {
    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(workDir_)) {
      if (entry.is_regular_file())
        files.push_back(entry.path());
    }
    std::sort(files.begin(), files.end());
    return files;
  }

  DwellAcquisitionGateway::DwellAcquisitionGateway(std::chrono::milliseconds dwell)
      : dwell_(dwell) {
    if (dwell_.count() < 0)
      throw std::invalid_argument("[Acquisition] dwell time must be >= 0");
  }

  AcquisitionResult DwellAcquisitionGateway::acquire() {
    std::this_thread::sleep_for(dwell_);
    return Acquired{};
  }

  void DwellAcquisitionGateway::relocate(const std::vector<fs::path>&, const fs::path&) {}

} // namespace pzt::core
