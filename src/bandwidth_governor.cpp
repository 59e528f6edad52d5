#include "bandwidth_governor.hpp"

#include <algorithm>
#include <thread>

BandwidthGovernor::BandwidthGovernor(double bytes_per_second, std::size_t burst_bytes)
  : rate_(bytes_per_second > 0.0 ? bytes_per_second : 0.0),
    burst_(burst_bytes),
    next_free_(clock::now()) {
  stats_.rate_bytes_per_second = rate_;
}

double BandwidthGovernor::mbps_to_bytes_per_second(double mbps) {
  return mbps > 0.0 ? mbps * 1024.0 * 1024.0 / 8.0 : 0.0;
}

void BandwidthGovernor::throttle(std::size_t bytes) {
  clock::time_point wake;
  {
    std::lock_guard lg(m_);
    stats_.bytes += bytes;
    stats_.calls += 1;
    if(rate_ <= 0.0 || bytes == 0) return;

    auto now = clock::now();
    auto credit = std::chrono::duration_cast<clock::duration>(
      std::chrono::duration<double>(static_cast<double>(burst_) / rate_));
    auto cost = std::chrono::duration_cast<clock::duration>(
      std::chrono::duration<double>(static_cast<double>(bytes) / rate_));
    auto start = std::max(next_free_, now - credit);
    next_free_ = start + cost;
    wake = next_free_;
    if(wake > now) {
      stats_.throttled_calls += 1;
      stats_.total_wait += std::chrono::duration_cast<std::chrono::nanoseconds>(wake - now);
    }
  }
  std::this_thread::sleep_until(wake);
}

void BandwidthGovernor::set_rate(double bytes_per_second) {
  std::lock_guard lg(m_);
  rate_ = bytes_per_second > 0.0 ? bytes_per_second : 0.0;
  next_free_ = clock::now();
  stats_.rate_bytes_per_second = rate_;
}

double BandwidthGovernor::rate() const {
  std::lock_guard lg(m_);
  return rate_;
}

bool BandwidthGovernor::unlimited() const {
  std::lock_guard lg(m_);
  return rate_ <= 0.0;
}

BandwidthGovernor::Stats BandwidthGovernor::stats() const {
  std::lock_guard lg(m_);
  return stats_;
}
