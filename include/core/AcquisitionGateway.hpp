#pragma once
/** @file  AcquisitionGateway.hpp
 *  @brief Adapter around the external acquisition executable and its output dir.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <filesystem>
#include <string>
#include <variant>
#include <vector>

#include "core/ExperimentConfig.hpp"

namespace pzt::core {

  /// Exit code 0 and at least one file in the work dir.
  struct Acquired {
    std::vector<std::filesystem::path> files;
  };
  /// Exit code 0 but the work dir stayed empty.
  struct NothingAcquired {};
  /// Non-zero exit code (127: could not exec, 128+N: killed by signal N).
  struct ProcessFailed {
    int exitCode{ 0 };
  };

  using AcquisitionResult = std::variant<Acquired, NothingAcquired, ProcessFailed>;

  /**
 * @class AcquisitionGateway
 * @brief Seam between the engine and whatever produces the data files.
 */
  class AcquisitionGateway {
  public:
    virtual ~AcquisitionGateway() = default;

    /// Run one acquisition into an emptied work dir. Blocks until it finishes.
    virtual AcquisitionResult acquire() = 0;

    /// Move \p files into \p targetDir (created if missing).
    /// @throws std::filesystem::filesystem_error
    virtual void relocate(const std::vector<std::filesystem::path>& files,
                          const std::filesystem::path& targetDir) = 0;

    /// Best-effort removal of leftovers; never throws.
    virtual void cleanup() {}
  };

  /**
 * @class ProcessAcquisitionGateway
 * @brief Spawns `<exe> --dir <work> --nfiles <n> --nrefls <n>` and waits for it.
 *
 *  * The work dir is created on construction and its files are removed before
 *    every run.
 *  * No timeout: acquire() returns when the child exits.
 */
  class ProcessAcquisitionGateway : public AcquisitionGateway {
  public:
    ProcessAcquisitionGateway(AcquisitionSettings settings, int nfiles, int nrefls);

    AcquisitionResult acquire() override;
    void relocate(const std::vector<std::filesystem::path>& files,
                  const std::filesystem::path& targetDir) override;
    void cleanup() override;

    std::vector<std::string> commandLine() const;
    const std::filesystem::path& workDir() const { return workDir_; }

  protected:
    /// fork/execvp/waitpid; returns the child's exit status.
    virtual int runProcess(const std::vector<std::string>& argv);

  private:
    void clearWorkDir();
    std::vector<std::filesystem::path> listWorkDir() const;

    AcquisitionSettings settings_;
    std::filesystem::path workDir_;
    int nfiles_;
    int nrefls_;
  };

  /**
 * @class DwellAcquisitionGateway
 * @brief Piezo-only sweeps: holds each step for a fixed dwell, produces no files.
 */
  class DwellAcquisitionGateway : public AcquisitionGateway {
  public:
    explicit DwellAcquisitionGateway(std::chrono::milliseconds dwell);

    /// Sleeps for the dwell, then reports an empty Acquired.
    AcquisitionResult acquire() override;
    /// Nothing to move.
    void relocate(const std::vector<std::filesystem::path>& files,
                  const std::filesystem::path& targetDir) override;

    std::chrono::milliseconds dwell() const { return dwell_; }

  private:
    std::chrono::milliseconds dwell_;
  };

} // namespace pzt::core
