#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>

#include <hashdiff/object.hpp>

namespace hashdiff {

class CancellationToken;

/**
 * Bounded blocking queue feeding Differential::AddStream.
 *
 * Producers Push objects and either push a null sentinel or Close() the queue
 * to end the stream. The consumer closes the queue when it stops, so a
 * producer blocked on a full queue is released instead of hanging.
 */
class ObjectQueue {
 public:
  enum class PopResult {
    kItem,       // *out holds the next object
    kEnd,        // sentinel received, or closed and drained
    kCancelled   // the token was cancelled while waiting
  };

  explicit ObjectQueue(size_t capacity = 1024);

  ObjectQueue(const ObjectQueue&) = delete;
  ObjectQueue& operator=(const ObjectQueue&) = delete;

  /**
   * Blocks while the queue is full. A null obj is the end-of-stream sentinel.
   * Returns false (and drops obj) if the queue is closed.
   */
  bool Push(std::shared_ptr<const Object> obj);

  /** Mark the end of input. Items already queued can still be popped. */
  void Close();

  /** Wait for the next item, the end of the stream, or cancellation. */
  PopResult Pop(std::shared_ptr<const Object>* out, const CancellationToken* cancel = nullptr);

  size_t size() const;
  bool closed() const;

 private:
  const size_t capacity_;

  mutable std::mutex mu_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<std::shared_ptr<const Object>> items_;
  bool closed_ = false;
};

}  // namespace hashdiff
