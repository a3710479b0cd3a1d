#include "internal/runtime/periodic_task.hpp"

#include "internal/observability/logging.hpp"

namespace stagesync::runtime {

using observability::StringField;

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> fn)
    : name_(std::move(name)), interval_(interval), fn_(std::move(fn)) {
}

PeriodicTask::~PeriodicTask() {
  Stop();
}

void PeriodicTask::Start() {
  if (IsRunning()) return;
  if (thread_.joinable()) thread_.join();

  // A fresh state per run: a thread detached by an earlier Stop keeps its own.
  state_          = std::make_shared<RunState>();
  state_->running = true;
  thread_         = std::thread(&PeriodicTask::Loop, state_, name_, interval_, fn_);
}

void PeriodicTask::Stop() {
  if (state_) {
    {
      std::lock_guard lock(state_->mutex);
      state_->running = false;
    }
    state_->cv.notify_all();
  }
  if (!thread_.joinable()) return;
  if (thread_.get_id() == std::this_thread::get_id()) {
    // stopped from inside the callback; the loop exits on its own
    thread_.detach();
    return;
  }
  thread_.join();
}

void PeriodicTask::Loop(std::shared_ptr<RunState> state, std::string name, std::chrono::milliseconds interval, std::function<void()> fn) {
  while (state->running) {
    {
      std::unique_lock lock(state->mutex);
      if (state->cv.wait_for(lock, interval, [&] { return !state->running; })) break;
    }

    try {
      fn();
    } catch (const std::exception& e) {
      STAGESYNC_LOG_ERROR("Periodic task failed", {StringField("task", name), StringField("error", e.what())});
    }
  }
}

} // namespace stagesync::runtime
