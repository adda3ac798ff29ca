#include <hashdiff/shutdown.hpp>

#include <algorithm>
#include <cerrno>

#include <fcntl.h>
#include <unistd.h>

#include <hashdiff/db.hpp>

namespace hashdiff {

namespace {

// Write end of the installed handler's pipe. Read from signal context, so it
// is a lock-free atomic rather than a pointer to the handler.
std::atomic<int> g_signal_fd{-1};

static_assert(std::atomic<int>::is_always_lock_free, "signal handler needs lock-free atomics");

// Byte written by RestoreSignalHandlers to stop the watcher.
constexpr unsigned char kStopWatcher = 0;

void OnSignal(int signum) {
  const int saved_errno = errno;
  const int fd = g_signal_fd.load();
  if (fd >= 0) {
    const unsigned char b = static_cast<unsigned char>(signum);
    // A full pipe means a shutdown is already queued.
    ssize_t n = write(fd, &b, 1);
    (void)n;
  }
  errno = saved_errno;
}

}  // namespace

ShutdownHandler::~ShutdownHandler() {
  RestoreSignalHandlers();
  Shutdown();
}

void ShutdownHandler::RegisterDB(DB* db) {
  if (!db) return;
  std::lock_guard<std::mutex> lock(mutex_);
  if (std::find(dbs_.begin(), dbs_.end(), db) == dbs_.end()) dbs_.push_back(db);
}

void ShutdownHandler::UnregisterDB(DB* db) {
  std::lock_guard<std::mutex> lock(mutex_);
  dbs_.erase(std::remove(dbs_.begin(), dbs_.end(), db), dbs_.end());
}

bool ShutdownHandler::InstallSignalHandlers() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (handlers_installed_) return true;

  int fds[2];
  if (pipe(fds) != 0) return false;
  fcntl(fds[1], F_SETFL, fcntl(fds[1], F_GETFL) | O_NONBLOCK);

  int expected = -1;
  if (!g_signal_fd.compare_exchange_strong(expected, fds[1])) {
    // Another handler owns the signals.
    close(fds[0]);
    close(fds[1]);
    return false;
  }

  struct sigaction sa;
  sa.sa_handler = OnSignal;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = SA_RESTART;

  bool ok = sigaction(SIGTERM, &sa, &old_sigterm_) == 0;
  if (ok && sigaction(SIGINT, &sa, &old_sigint_) != 0) {
    sigaction(SIGTERM, &old_sigterm_, nullptr);
    ok = false;
  }
  if (ok && sigaction(SIGHUP, &sa, &old_sighup_) != 0) {
    sigaction(SIGTERM, &old_sigterm_, nullptr);
    sigaction(SIGINT, &old_sigint_, nullptr);
    ok = false;
  }
  if (!ok) {
    g_signal_fd.store(-1);
    close(fds[0]);
    close(fds[1]);
    return false;
  }

  pipe_fds_[0] = fds[0];
  pipe_fds_[1] = fds[1];
  watcher_ = std::thread(&ShutdownHandler::WatchSignals, this, fds[0]);
  handlers_installed_ = true;
  return true;
}

void ShutdownHandler::RestoreSignalHandlers() {
  std::thread watcher;
  int fds[2];
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!handlers_installed_) return;

    sigaction(SIGTERM, &old_sigterm_, nullptr);
    sigaction(SIGINT, &old_sigint_, nullptr);
    sigaction(SIGHUP, &old_sighup_, nullptr);
    g_signal_fd.store(-1);

    // Blocking write: the watcher must see the stop byte.
    fcntl(pipe_fds_[1], F_SETFL, fcntl(pipe_fds_[1], F_GETFL) & ~O_NONBLOCK);
    ssize_t n;
    do {
      n = write(pipe_fds_[1], &kStopWatcher, 1);
    } while (n < 0 && errno == EINTR);

    watcher = std::move(watcher_);
    fds[0] = pipe_fds_[0];
    fds[1] = pipe_fds_[1];
    pipe_fds_[0] = pipe_fds_[1] = -1;
    handlers_installed_ = false;
  }

  // Joined outside mutex_: the watcher may be inside Shutdown().
  if (watcher.joinable() && watcher.get_id() != std::this_thread::get_id()) {
    watcher.join();
  } else if (watcher.joinable()) {
    watcher.detach();
  }
  close(fds[0]);
  close(fds[1]);
}

void ShutdownHandler::WatchSignals(int read_fd) {
  for (;;) {
    unsigned char b = 0;
    ssize_t n = read(read_fd, &b, 1);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0 || b == kStopWatcher) return;

    signal_received_.store(b);
    Shutdown();
  }
}

bool ShutdownHandler::Shutdown() {
  bool expected = false;
  if (!requested_.compare_exchange_strong(expected, true)) {
    WaitForShutdown();
    return false;
  }

  token_.Cancel();

  std::vector<DB*> dbs;
  std::vector<std::function<void()>> callbacks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    dbs.swap(dbs_);
    callbacks = callbacks_;
  }

  for (DB* db : dbs) db->Close();

  for (const auto& callback : callbacks) {
    if (callback) callback();
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    complete_ = true;
  }
  done_cv_.notify_all();
  return true;
}

void ShutdownHandler::OnShutdown(std::function<void()> callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.push_back(std::move(callback));
}

void ShutdownHandler::WaitForShutdown() {
  std::unique_lock<std::mutex> lock(mutex_);
  done_cv_.wait(lock, [this] { return complete_; });
}

ShutdownHandler& GlobalShutdownHandler() {
  static ShutdownHandler instance;
  return instance;
}

}  // namespace hashdiff
