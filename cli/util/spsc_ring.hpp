#pragma once

#include <atomic>
#include <bit>
#include <cstddef>
#include <type_traits>
#include <utility>
#include <vector>

namespace cmsketch::cli::util {

// Single-producer single-consumer ring carrying lines from the reader to one worker.
// Capacity is rounded up to a power of two; one slot stays empty to tell full from empty.
template <typename T> class spsc_ring {
public:
  static_assert(std::is_move_constructible_v<T>, "spsc_ring requires T to be move-constructible");

  explicit spsc_ring(std::size_t capacity)
      : mask_(std::bit_ceil(capacity < 2 ? std::size_t{2} : capacity) - 1U), data_(mask_ + 1U) {}

  // Consumes value only on success, so std::move(x) is safe in a retry loop.
  auto try_push(T&& value) noexcept(std::is_nothrow_move_assignable_v<T>) -> bool {
    const std::size_t head = head_.load(std::memory_order_relaxed);
    const std::size_t next = (head + 1U) & mask_;
    if (next == tail_.load(std::memory_order_acquire)) {
      return false;
    }
    data_[head] = std::move(value);
    head_.store(next, std::memory_order_release);
    return true;
  }

  auto pop(T& out) noexcept(std::is_nothrow_move_assignable_v<T>) -> bool {
    const std::size_t tail = tail_.load(std::memory_order_relaxed);
    if (tail == head_.load(std::memory_order_acquire)) {
      return false;
    }
    out = std::move(data_[tail]);
    tail_.store((tail + 1U) & mask_, std::memory_order_release);
    return true;
  }

  [[nodiscard]] auto empty() const noexcept -> bool {
    return tail_.load(std::memory_order_acquire) == head_.load(std::memory_order_acquire);
  }

private:
  std::size_t mask_;
  std::vector<T> data_;
  std::atomic<std::size_t> head_{0};
  std::atomic<std::size_t> tail_{0};
};

} // namespace cmsketch::cli::util
