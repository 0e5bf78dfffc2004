#include "devices/command_worker.hpp"

#include <utility>

namespace fleetcap::devices {

CommandWorker::CommandWorker() : thread_([this]() { Run(); }) {}

CommandWorker::~CommandWorker() {
  Stop();
}

bool CommandWorker::Post(std::function<void()> task) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (stop_requested_) {
      return false;
    }
    queue_.push_back(std::move(task));
  }
  cv_.notify_one();
  return true;
}

void CommandWorker::Stop() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stop_requested_ = true;
  }
  cv_.notify_one();

  // Stop() may race with itself from Close() and the destructor; only one
  // caller can observe a joinable thread under the lock.
  std::thread to_join;
  {
    std::lock_guard<std::mutex> lock(mu_);
    to_join = std::move(thread_);
  }
  if (to_join.joinable()) {
    to_join.join();
  }
}

bool CommandWorker::stopped() const {
  std::lock_guard<std::mutex> lock(mu_);
  return stop_requested_;
}

void CommandWorker::Run() {
  while (true) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(mu_);
      cv_.wait(lock, [this]() { return stop_requested_ || !queue_.empty(); });
      if (queue_.empty()) {
        return;
      }
      task = std::move(queue_.front());
      queue_.pop_front();
    }
    task();
  }
}

} // namespace fleetcap::devices
