#pragma once

#include <cstddef>
#include <functional>
#include <thread>

namespace fleetcap::fleet {

// Default bound on concurrent per-device tasks in one fan-out round.
constexpr std::size_t kDefaultMaxParallel = 8U;

// Runs `task(i)` for every i in [0, count) on at most `max_parallel` threads
// and returns once all of them finished. Tasks are unordered relative to each
// other. `max_parallel == 0` is treated as 1.
//
// Tasks report failures through their own result slots. An exception escaping
// a task does not cancel its siblings; the first one is rethrown here after
// every task completed.
void RunBounded(std::size_t count, std::size_t max_parallel,
                const std::function<void(std::size_t)>& task);

// Starts one worker thread. May throw std::system_error when the process is
// out of threads.
using ThreadSpawner = std::function<std::thread(std::function<void()>)>;

// RunBounded with a caller-supplied spawner. A worker that fails to start
// lowers the parallelism of the round; the calling thread and the workers
// already running still finish every task.
void RunBounded(std::size_t count, std::size_t max_parallel,
                const std::function<void(std::size_t)>& task, const ThreadSpawner& spawn);

} // namespace fleetcap::fleet
