#include "fleet/fan_out.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace fleetcap::fleet {

void RunBounded(const std::size_t count, const std::size_t max_parallel,
                const std::function<void(std::size_t)>& task) {
  RunBounded(count, max_parallel, task,
             [](std::function<void()> body) { return std::thread(std::move(body)); });
}

void RunBounded(const std::size_t count, const std::size_t max_parallel,
                const std::function<void(std::size_t)>& task, const ThreadSpawner& spawn) {
  if (count == 0U) {
    return;
  }

  const std::size_t worker_count = std::min(count, std::max<std::size_t>(max_parallel, 1U));
  std::atomic<std::size_t> next_index{0U};
  std::mutex error_mu;
  std::exception_ptr first_error;

  auto drain = [&]() {
    while (true) {
      const std::size_t index = next_index.fetch_add(1U);
      if (index >= count) {
        return;
      }
      try {
        task(index);
      } catch (...) {
        std::lock_guard<std::mutex> lock(error_mu);
        if (!first_error) {
          first_error = std::current_exception();
        }
      }
    }
  };

  // The calling thread takes a share of the work instead of idling in join.
  std::vector<std::thread> workers;
  workers.reserve(worker_count - 1U);
  for (std::size_t i = 1; i < worker_count; ++i) {
    try {
      workers.push_back(spawn(drain));
    } catch (const std::system_error&) {
      // Out of threads: run the round with the workers already started.
      break;
    }
  }
  drain();
  for (std::thread& worker : workers) {
    if (worker.joinable()) {
      worker.join();
    }
  }

  if (first_error) {
    std::rethrow_exception(first_error);
  }
}

} // namespace fleetcap::fleet
