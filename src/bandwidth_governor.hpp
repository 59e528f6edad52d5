#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>

// Process-wide throughput ceiling shared by every worker. Each throttle(N)
// call reserves the next N/rate seconds of the timeline and sleeps until its
// reservation starts being honoured, so concurrent callers queue behind one
// another instead of each getting the full rate.
class BandwidthGovernor {
public:
  using clock = std::chrono::steady_clock;

  struct Stats {
    uint64_t bytes = 0;
    uint64_t calls = 0;
    uint64_t throttled_calls = 0;
    std::chrono::nanoseconds total_wait{0};
    double rate_bytes_per_second = 0.0;
  };

  // rate 0 disables limiting. burst is how many bytes may go through
  // immediately after an idle period.
  explicit BandwidthGovernor(double bytes_per_second = 0.0, std::size_t burst_bytes = 0);

  static double mbps_to_bytes_per_second(double mbps);

  // Blocks the caller long enough to keep the aggregate rate at or below the
  // ceiling.
  void throttle(std::size_t bytes);

  void set_rate(double bytes_per_second);
  double rate() const;
  bool unlimited() const;

  Stats stats() const;

private:
  mutable std::mutex m_;
  double rate_ = 0.0;
  std::size_t burst_ = 0;
  clock::time_point next_free_{};
  Stats stats_;
};
