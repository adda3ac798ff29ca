#pragma once

#include <atomic>
#include <condition_variable>
#include <csignal>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include <hashdiff/cancellation.hpp>

namespace hashdiff {

class DB;

/**
 * Process shutdown for programs that run long streams or apply loops.
 *
 * Shutdown() happens in three steps:
 *   1. token() is cancelled, so AddStream rolls back and EachN stops between
 *      items.
 *   2. Registered databases are closed. DB::Close waits for in-flight
 *      transactions, which step 1 has asked to finish.
 *   3. OnShutdown callbacks run in registration order.
 *
 * InstallSignalHandlers() routes SIGTERM, SIGINT and SIGHUP to Shutdown().
 * The signal handler only writes the signal number to a pipe; a watcher
 * thread reads it and does the actual work outside signal context.
 *
 * Thread-safe.
 */
class ShutdownHandler {
 public:
  ShutdownHandler() = default;
  ~ShutdownHandler();

  ShutdownHandler(const ShutdownHandler&) = delete;
  ShutdownHandler& operator=(const ShutdownHandler&) = delete;

  /** db must stay valid until UnregisterDB() or Shutdown(). */
  void RegisterDB(DB* db);
  void UnregisterDB(DB* db);

  const CancellationToken& token() const { return token_; }

  /**
   * Route SIGTERM/SIGINT/SIGHUP to this handler. Only one handler per
   * process can own the signals; returns false if another does or if
   * installation fails.
   */
  bool InstallSignalHandlers();

  /** Restore the previous dispositions and stop the watcher thread. */
  void RestoreSignalHandlers();

  /** Idempotent. Returns true for the call that performed the shutdown. */
  bool Shutdown();

  bool IsShutdownRequested() const { return requested_.load(); }

  /** Last signal that triggered shutdown, or 0. */
  int signal_received() const { return signal_received_.load(); }

  void OnShutdown(std::function<void()> callback);

  /** Block until a Shutdown() call has finished all three steps. */
  void WaitForShutdown();

 private:
  void WatchSignals(int read_fd);

  std::mutex mutex_;
  std::condition_variable done_cv_;
  std::vector<DB*> dbs_;
  std::vector<std::function<void()>> callbacks_;
  CancellationToken token_;
  std::atomic<bool> requested_{false};
  bool complete_ = false;  // guarded by mutex_
  std::atomic<int> signal_received_{0};

  // Signal routing; guarded by mutex_.
  bool handlers_installed_ = false;
  int pipe_fds_[2] = {-1, -1};
  std::thread watcher_;
  struct sigaction old_sigterm_;
  struct sigaction old_sigint_;
  struct sigaction old_sighup_;
};

/** Process-wide instance for programs with a single shutdown path. */
ShutdownHandler& GlobalShutdownHandler();

}  // namespace hashdiff
