#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

struct SegmentFetchConfig {
  std::size_t parallelism = 4;
  // Polled between jobs; when it returns true the fetch stops and
  // TransferInterrupted is thrown.
  std::function<bool()> stop_requested;
};

// Fetches, verifies and stores one segment. Throws on failure.
using SegmentJob = std::function<void(std::size_t job_index)>;

// Called after each successful job with its index.
using SegmentJobDone = std::function<void(std::size_t job_index)>;

// Runs jobs [0, total_jobs) on up to `parallelism` threads in no particular
// order. The first exception stops the remaining jobs and is rethrown here
// once every thread has joined.
void run_segment_fetch(std::size_t total_jobs,
                       const SegmentFetchConfig& config,
                       const SegmentJob& run_job,
                       const SegmentJobDone& on_done = {});
