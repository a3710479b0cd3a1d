#include "internal/runtime/periodic_task.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

namespace {

using stagesync::runtime::PeriodicTask;

bool WaitFor(const std::function<bool()>& condition, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (condition()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return condition();
}

void TestRunsRepeatedly() {
  std::atomic<int> runs{0};
  PeriodicTask     task("count", std::chrono::milliseconds(10), [&] { ++runs; });

  task.Start();
  task.Start();
  assert(task.IsRunning());
  assert(WaitFor([&] { return runs.load() >= 3; }, std::chrono::seconds(5)));

  task.Stop();
  assert(!task.IsRunning());
  const int after_stop = runs.load();
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  assert(runs.load() == after_stop);
}

void TestFailuresDoNotStopTheSchedule() {
  std::atomic<int> runs{0};
  PeriodicTask     task("flaky", std::chrono::milliseconds(10), [&] {
    ++runs;
    throw std::runtime_error("boom");
  });

  task.Start();
  assert(WaitFor([&] { return runs.load() >= 2; }, std::chrono::seconds(5)));
}

void TestStopDoesNotWaitOutTheInterval() {
  PeriodicTask task("slow", std::chrono::hours(1), [] {});
  task.Start();

  const auto started = std::chrono::steady_clock::now();
  task.Stop();
  assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(5));
}

void TestCallbackMayStopAndDestroyItsTask() {
  std::atomic<int>              runs{0};
  std::atomic<bool>             returned{false};
  std::unique_ptr<PeriodicTask> task;

  task = std::make_unique<PeriodicTask>("self-stop", std::chrono::milliseconds(20), [&] {
    ++runs;
    task->Stop();
    task.reset();
    returned = true;
  });
  task->Start();

  assert(WaitFor([&] { return returned.load(); }, std::chrono::seconds(5)));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  assert(runs.load() == 1);
  assert(task == nullptr);
}

void TestRestartAfterStop() {
  std::atomic<int> runs{0};
  PeriodicTask     task("restart", std::chrono::milliseconds(5), [&] { ++runs; });

  task.Start();
  task.Stop();
  const int before = runs.load();
  task.Start();
  assert(task.IsRunning());
  assert(WaitFor([&] { return runs.load() > before; }, std::chrono::seconds(5)));
}

} // namespace

int main() {
  TestRunsRepeatedly();
  TestFailuresDoNotStopTheSchedule();
  TestStopDoesNotWaitOutTheInterval();
  TestCallbackMayStopAndDestroyItsTask();
  TestRestartAfterStop();

  std::cout << "stagesync_unit_periodic_task: pass\n";
  return 0;
}
