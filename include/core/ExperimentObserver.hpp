#pragma once
/** @file  ExperimentObserver.hpp
 *  @brief Callback interface through which a front end follows a sweep run.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <string>

namespace pzt::core {

  /**
 * @class ExperimentObserver
 * @brief Invoked synchronously on the engine's worker thread; keep it short.
 *
 *  Exactly one of onComplete / onStopped / onError ends every run, and only
 *  after the hardware has been zeroed and the link closed.
 */
  class ExperimentObserver {
  public:
    virtual ~ExperimentObserver() = default;

    virtual void onProgress(std::size_t current, std::size_t total) = 0;
    virtual void onError(const std::string& message) = 0;
    virtual void onComplete() = 0;
    virtual void onStopped(std::size_t current, std::size_t total) = 0;
  };

} // namespace pzt::core
