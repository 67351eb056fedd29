#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>

namespace kefctl {

/**
 * Single-capacity handoff for racing tasks: the first `Offer()` wins and every
 * later offer is dropped. The waiting side learns whether it got a value, all
 * producers finished empty-handed, the deadline passed, or the race was
 * cancelled.
 *
 * Producers register with `AddProducer()` before they start and call
 * `ProducerDone()` when they finish; `Seal()` marks that no more producers
 * will be registered, so `WaitUntil()` can report exhaustion.
 */
template <typename T>
class ResultSlot {
 public:
  enum class Outcome {
    kValue,
    kExhausted,
    kTimeout,
    kCancelled,
  };

  /// External cancel flags are sampled at least this often while waiting.
  static constexpr std::chrono::milliseconds kCancelPollInterval{50};

  ResultSlot() = default;
  ResultSlot(const ResultSlot&) = delete;
  ResultSlot& operator=(const ResultSlot&) = delete;

  /// Store `value` if the slot is still empty. Returns true if this offer won.
  bool Offer(T value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (value_.has_value() || cancelled_) {
      return false;
    }
    value_ = std::move(value);
    cv_.notify_all();
    return true;
  }

  void AddProducer() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++producers_;
  }

  void ProducerDone() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (producers_ > 0) {
      --producers_;
    }
    cv_.notify_all();
  }

  void Seal() {
    std::lock_guard<std::mutex> lock(mutex_);
    sealed_ = true;
    cv_.notify_all();
  }

  /// Refuse all further offers and wake the waiter.
  void Cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = true;
    cv_.notify_all();
  }

  /// True once a value has been stored or the slot was cancelled.
  bool Settled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return value_.has_value() || cancelled_;
  }

  /**
   * Block until a value arrives, all producers are done, `deadline` passes,
   * or the slot (or `cancel_flag`, if given) is cancelled.
   *
   * @param out Receives the winning value when the outcome is kValue.
   */
  Outcome WaitUntil(std::chrono::steady_clock::time_point deadline,
                    const std::atomic<bool>* cancel_flag,
                    T* out) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
      if (value_.has_value()) {
        if (out) {
          *out = *value_;
        }
        return Outcome::kValue;
      }
      if (cancelled_ || (cancel_flag && cancel_flag->load())) {
        return Outcome::kCancelled;
      }
      if (sealed_ && producers_ == 0) {
        return Outcome::kExhausted;
      }
      const auto now = std::chrono::steady_clock::now();
      if (now >= deadline) {
        return Outcome::kTimeout;
      }
      cv_.wait_until(lock, std::min(deadline, now + kCancelPollInterval));
    }
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::optional<T> value_;
  int producers_ = 0;
  bool sealed_ = false;
  bool cancelled_ = false;
};

}  // namespace kefctl
