#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace fleetcap::devices {

// Dedicated execution context for one device's control channel.
//
// Tasks run one at a time on a single thread in submission order, which is
// what keeps a camera's blocking channel free of pipelined commands while
// other cameras are driven from their own workers.
class CommandWorker {
public:
  CommandWorker();
  ~CommandWorker();

  CommandWorker(const CommandWorker&) = delete;
  CommandWorker& operator=(const CommandWorker&) = delete;
  CommandWorker(CommandWorker&&) = delete;
  CommandWorker& operator=(CommandWorker&&) = delete;

  // Queues `task`. Returns false once Stop() has been requested.
  bool Post(std::function<void()> task);

  // Runs every task already queued, then joins the thread. Idempotent.
  // Blocks for as long as the task in flight blocks.
  void Stop();

  bool stopped() const;

private:
  void Run();

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<std::function<void()>> queue_;
  bool stop_requested_ = false;
  std::thread thread_;
};

} // namespace fleetcap::devices
