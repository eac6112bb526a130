#pragma once
/** @file  RingBuffer.hpp
 *  @brief Fixed-capacity FIFO used by the logger and the broker publisher.
 *
 *  © 2025 EchoMe Labs — MIT-licensed.
 */

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace echome {
  namespace core {

    /**
 * @class RingBuffer
 * @brief Bounded queue over a pre-allocated vector.
 *
 *  * Not thread-safe; owners guard it with their own mutex.
 *  * `push()` refuses new items when full (oldest entries are never overwritten).
 */
    template <typename T> class RingBuffer {
    public:
      explicit RingBuffer(std::size_t capacity) : slots_(capacity == 0 ? 1 : capacity) {}

      /// @returns false if the buffer is full and \p item was dropped.
      bool push(T item) {
        if (count_ == slots_.size())
          return false;
        slots_[(head_ + count_) % slots_.size()] = std::move(item);
        ++count_;
        return true;
      }

      std::optional<T> pop() {
        if (count_ == 0)
          return std::nullopt;
        T item = std::move(slots_[head_]);
        head_ = (head_ + 1) % slots_.size();
        --count_;
        return item;
      }

      std::size_t size() const { return count_; }
      std::size_t capacity() const { return slots_.size(); }
      bool empty() const { return count_ == 0; }
      bool full() const { return count_ == slots_.size(); }

    private:
      std::vector<T> slots_;
      std::size_t head_{ 0 };
      std::size_t count_{ 0 };
    };

  } // namespace core
} // namespace echome
