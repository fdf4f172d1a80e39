#pragma once
/** @file  StepCounter.hpp
 *  @brief Three-digit i_j_k folder label that rolls over at 10.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

namespace pzt::core {

  /// Starts at 1_1_1; k counts 1..9 then carries into j, j carries into i.
  class StepCounter {
  public:
    std::string label() const {
      return std::to_string(i_) + "_" + std::to_string(j_) + "_" + std::to_string(k_);
    }

    void advance() {
      if (++k_ > 9) {
        k_ = 1;
        ++j_;
      }
      if (j_ > 9) {
        j_ = 1;
        ++i_;
      }
    }

  private:
    int i_{ 1 };
    int j_{ 1 };
    int k_{ 1 };
  };

} // namespace pzt::core
