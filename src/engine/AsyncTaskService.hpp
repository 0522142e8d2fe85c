#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace ts::engine {

// One background thread for blocking work (torrent-file downloads, seed
// directory scans) so neither the engine loop nor the HTTP loop stalls.
// Tasks still queued at stop() run before the worker exits.
class AsyncTaskService {
public:
  explicit AsyncTaskService(std::string name = "async");
  AsyncTaskService(AsyncTaskService const &) = delete;
  AsyncTaskService &operator=(AsyncTaskService const &) = delete;
  ~AsyncTaskService();

  void start();
  void stop();
  bool is_running() const noexcept;
  // Returns false once stop() has been requested; the task is dropped.
  bool submit(std::function<void()> task);
  std::size_t queued() const;

private:
  void loop();

  std::string name_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::function<void()>> tasks_;
  std::thread worker_;
  std::atomic<bool> running_{false};
  std::atomic<bool> exit_requested_{false};
};

} // namespace ts::engine
