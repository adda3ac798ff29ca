#include <hashdiff/cancellation.hpp>

#include <utility>

namespace hashdiff {

bool CancellationToken::Cancel() {
  std::unique_lock<std::mutex> lock(mu_);
  bool expected = false;
  if (!cancelled_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
    return false;
  }
  cv_.notify_all();

  // One at a time, outside the lock, so callbacks may touch the token. A
  // callback still in callbacks_ can be removed before it runs.
  while (!callbacks_.empty()) {
    auto it = callbacks_.begin();
    std::function<void()> fn = std::move(it->second);
    running_id_ = it->first;
    running_thread_ = std::this_thread::get_id();
    callbacks_.erase(it);

    lock.unlock();
    if (fn) fn();
    lock.lock();

    running_id_ = 0;
    running_thread_ = std::thread::id();
    callback_done_.notify_all();
  }
  return true;
}

CancellationToken::CallbackId CancellationToken::OnCancel(std::function<void()> fn) const {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!cancelled_.load(std::memory_order_acquire)) {
      CallbackId id = next_id_++;
      callbacks_.emplace(id, std::move(fn));
      return id;
    }
  }
  if (fn) fn();
  return 0;
}

void CancellationToken::RemoveCallback(CallbackId id) const {
  if (id == 0) return;
  std::unique_lock<std::mutex> lock(mu_);
  callbacks_.erase(id);
  // A callback removing itself must not wait for its own return.
  callback_done_.wait(lock, [&] {
    return running_id_ != id || running_thread_ == std::this_thread::get_id();
  });
}

bool CancellationToken::WaitFor(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mu_);
  return cv_.wait_for(lock, timeout, [this] { return IsCancelled(); });
}

void CancellationToken::Wait() const {
  std::unique_lock<std::mutex> lock(mu_);
  cv_.wait(lock, [this] { return IsCancelled(); });
}

}  // namespace hashdiff
