#include <hashdiff/object_queue.hpp>

#include <utility>

#include <hashdiff/cancellation.hpp>

namespace hashdiff {

ObjectQueue::ObjectQueue(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

bool ObjectQueue::Push(std::shared_ptr<const Object> obj) {
  {
    std::unique_lock<std::mutex> lock(mu_);
    not_full_.wait(lock, [this] { return closed_ || items_.size() < capacity_; });
    if (closed_) return false;
    items_.push_back(std::move(obj));
  }
  not_empty_.notify_one();
  return true;
}

void ObjectQueue::Close() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    closed_ = true;
  }
  not_empty_.notify_all();
  not_full_.notify_all();
}

ObjectQueue::PopResult ObjectQueue::Pop(std::shared_ptr<const Object>* out,
                                        const CancellationToken* cancel) {
  // Registered before taking mu_: OnCancel runs the callback inline if the
  // token is already cancelled. Taking mu_ in the callback orders the notify
  // after any waiter's predicate check.
  CancellationToken::CallbackId cb = 0;
  if (cancel) {
    cb = cancel->OnCancel([this] {
      { std::lock_guard<std::mutex> lock(mu_); }
      not_empty_.notify_all();
    });
  }

  PopResult result = PopResult::kEnd;
  {
    std::unique_lock<std::mutex> lock(mu_);
    not_empty_.wait(lock, [&] {
      return (cancel && cancel->IsCancelled()) || closed_ || !items_.empty();
    });

    if (cancel && cancel->IsCancelled()) {
      result = PopResult::kCancelled;
    } else if (!items_.empty()) {
      std::shared_ptr<const Object> item = std::move(items_.front());
      items_.pop_front();
      if (item) {
        *out = std::move(item);
        result = PopResult::kItem;
      }
    }
  }
  not_full_.notify_one();

  if (cb != 0) cancel->RemoveCallback(cb);
  return result;
}

size_t ObjectQueue::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return items_.size();
}

bool ObjectQueue::closed() const {
  std::lock_guard<std::mutex> lock(mu_);
  return closed_;
}

}  // namespace hashdiff
