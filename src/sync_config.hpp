#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "segment_codec.hpp"
#include "server_descriptor.hpp"

class SettingsManager;

// Typed view of the settings the transfer pipeline reads. Built once at
// startup and copied into each component; nothing here is mutated afterwards.
struct SyncConfig {
  CodecOptions codec;
  std::size_t pack_threshold_bytes = 0;
  int max_retry_count = 3;
  std::size_t workers_per_direction = 4;
  std::size_t segment_fetch_parallelism = 4;
  std::vector<ServerDescriptor> servers;
  double max_rate_mbps = 0.0;
  std::size_t redundancy_copies = 2;
  bool encrypt_segments = true;
  std::string newsgroup = "alt.binaries.backup";
  std::string poster = "usenetsync <poster@usenetsync.invalid>";
  std::chrono::seconds health_check_ttl{300};
  std::chrono::seconds server_cooldown{60};
  int connection_failure_threshold = 3;
  std::chrono::milliseconds acquire_timeout{30000};
  std::chrono::seconds io_timeout{30};
  std::chrono::milliseconds queue_poll_interval{500};
  std::chrono::hours finished_retention{168};
  std::filesystem::path state_dir = ".usenetsync";
  bool verbose = false;

  // Encoded segments smaller than this are packed together.
  std::size_t effective_pack_threshold() const {
    return pack_threshold_bytes != 0 ? pack_threshold_bytes : codec.segment_size / 2;
  }

  // Bytes per second, 0 for unlimited.
  double max_rate_bytes_per_second() const {
    return max_rate_mbps > 0.0 ? max_rate_mbps * 1024.0 * 1024.0 / 8.0 : 0.0;
  }

  // Returns false and fills `errors` if a value is out of range.
  bool validate(std::vector<std::string>& errors) const;

  static SyncConfig from_settings(const SettingsManager& settings,
                                  std::vector<std::string>& errors);
};
