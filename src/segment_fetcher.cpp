#include "segment_fetcher.hpp"

#include <algorithm>
#include <deque>
#include <exception>
#include <mutex>
#include <numeric>
#include <optional>
#include <thread>
#include <vector>

#include "transfer_errors.hpp"

void run_segment_fetch(std::size_t total_jobs,
                       const SegmentFetchConfig& config,
                       const SegmentJob& run_job,
                       const SegmentJobDone& on_done) {
  if(total_jobs == 0) return;

  std::mutex job_mutex;
  std::deque<std::size_t> job_queue(total_jobs);
  std::iota(job_queue.begin(), job_queue.end(), 0);
  std::exception_ptr first_error;
  bool failure = false;

  auto take_job = [&]() -> std::optional<std::size_t> {
    std::lock_guard<std::mutex> lock(job_mutex);
    if(failure || job_queue.empty()) return std::nullopt;
    std::size_t job = job_queue.front();
    job_queue.pop_front();
    return job;
  };

  auto record_failure = [&](std::exception_ptr error) {
    std::lock_guard<std::mutex> lock(job_mutex);
    if(!failure) {
      failure = true;
      first_error = error;
    }
    job_queue.clear();
  };

  auto worker_fn = [&]() {
    while(true) {
      if(config.stop_requested && config.stop_requested()) {
        record_failure(std::make_exception_ptr(TransferInterrupted()));
        break;
      }
      auto job = take_job();
      if(!job) break;
      try {
        run_job(*job);
      } catch(const std::exception&) {
        record_failure(std::current_exception());
        break;
      }
      if(on_done) on_done(*job);
    }
  };

  std::size_t threads = std::max<std::size_t>(1, std::min(config.parallelism, total_jobs));
  std::vector<std::thread> workers;
  workers.reserve(threads);
  for(std::size_t i = 0; i < threads; ++i) {
    workers.emplace_back(worker_fn);
  }
  for(auto& thread : workers) {
    if(thread.joinable()) thread.join();
  }

  if(first_error) std::rethrow_exception(first_error);
}
