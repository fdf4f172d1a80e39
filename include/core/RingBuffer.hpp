#pragma once
/** @file  RingBuffer.hpp
 *  @brief Fixed-capacity FIFO used to hand log events to the writer thread.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace pzt::core {

  /**
 * @class RingBuffer
 * @brief Bounded FIFO over a preallocated vector. Not synchronised: the owner
 *        guards it with its own mutex.
 */
  template <typename T> class RingBuffer {
  public:
    explicit RingBuffer(std::size_t capacity) : slots_(capacity ? capacity : 1) {}

    /// @returns false (and drops \p value) when full.
    bool push(T value) {
      if (count_ == slots_.size())
        return false;
      slots_[(head_ + count_) % slots_.size()] = std::move(value);
      ++count_;
      return true;
    }

    std::optional<T> pop() {
      if (count_ == 0)
        return std::nullopt;
      T out = std::move(slots_[head_]);
      head_ = (head_ + 1) % slots_.size();
      --count_;
      return out;
    }

    bool empty() const { return count_ == 0; }
    std::size_t size() const { return count_; }
    std::size_t capacity() const { return slots_.size(); }

  private:
    std::vector<T> slots_;
    std::size_t head_{ 0 };
    std::size_t count_{ 0 };
  };

} // namespace pzt::core
