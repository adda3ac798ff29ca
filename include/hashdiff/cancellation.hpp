#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

namespace hashdiff {

/**
 * Cooperative cancellation signal shared between a requester and any number
 * of long-running operations (AddStream, EachN).
 *
 * Operations poll IsCancelled() between items; blocking waits (ObjectQueue)
 * register an OnCancel callback to wake up.
 *
 * Thread-safe: All methods can be called from any thread.
 */
class CancellationToken {
 public:
  using CallbackId = uint64_t;

  CancellationToken() = default;

  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  /**
   * Request cancellation. Idempotent: callbacks run once, on the first call,
   * in registration order.
   * Returns true if this call performed the cancellation.
   */
  bool Cancel();

  bool IsCancelled() const { return cancelled_.load(std::memory_order_acquire); }

  /**
   * Register fn to run on cancellation. If already cancelled, fn runs
   * immediately on the calling thread and 0 is returned.
   */
  CallbackId OnCancel(std::function<void()> fn) const;

  /**
   * Remove a callback registered with OnCancel. Unknown ids are ignored.
   * If the callback is running on another thread, waits for it to return, so
   * whatever it captured can be released afterwards.
   */
  void RemoveCallback(CallbackId id) const;

  /** Block up to timeout. Returns true if cancelled. */
  bool WaitFor(std::chrono::milliseconds timeout) const;

  /** Block until cancelled. */
  void Wait() const;

 private:
  std::atomic<bool> cancelled_{false};
  mutable std::mutex mu_;
  mutable std::condition_variable cv_;
  mutable std::condition_variable callback_done_;
  mutable std::map<CallbackId, std::function<void()>> callbacks_;
  mutable CallbackId next_id_ = 1;
  // Callback currently run by Cancel(), 0 if none; guarded by mu_.
  CallbackId running_id_ = 0;
  std::thread::id running_thread_;
};

}  // namespace hashdiff
