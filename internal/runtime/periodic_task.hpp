#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace stagesync::runtime {

/*
  Runs a callback on a background thread every interval until stopped.

  Stop() wakes the thread immediately instead of waiting out the interval.
  Exceptions thrown by the callback are logged and the schedule continues.

  The thread owns its run state and a copy of the callback, so the callback
  may stop the task and even destroy it; the loop exits once it returns.
*/
class PeriodicTask {
 public:
  PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> fn);
  ~PeriodicTask();

  PeriodicTask(const PeriodicTask&)            = delete;
  PeriodicTask& operator=(const PeriodicTask&) = delete;

  void Start();
  void Stop();

  bool IsRunning() const {
    return state_ && state_->running;
  }

  const std::string& Name() const {
    return name_;
  }

 private:
  struct RunState {
    std::mutex              mutex;
    std::condition_variable cv;
    std::atomic<bool>       running{false};
  };

  static void Loop(std::shared_ptr<RunState> state, std::string name, std::chrono::milliseconds interval, std::function<void()> fn);

  std::string               name_;
  std::chrono::milliseconds interval_;
  std::function<void()>     fn_;

  std::shared_ptr<RunState> state_;
  std::thread               thread_;
};

} // namespace stagesync::runtime
