#include "sync_config.hpp"

#include "settings_manager.hpp"

bool SyncConfig::validate(std::vector<std::string>& errors) const {
  auto before = errors.size();
  if(codec.segment_size == 0) errors.push_back("segment_size_bytes must be positive");
  if(codec.compression_threshold_ratio <= 0.0 || codec.compression_threshold_ratio > 1.0) {
    errors.push_back("compression_threshold_ratio must be in (0, 1]");
  }
  if(codec.compression_sample_bytes == 0) errors.push_back("compression_sample_bytes must be positive");
  if(max_retry_count < 0) errors.push_back("max_retry_count must not be negative");
  if(workers_per_direction == 0) errors.push_back("workers_per_direction must be positive");
  if(segment_fetch_parallelism == 0) errors.push_back("segment_fetch_parallelism must be positive");
  if(max_rate_mbps < 0.0) errors.push_back("max_rate_mbps must not be negative");
  if(redundancy_copies == 0) errors.push_back("redundancy_copies must be positive");
  if(connection_failure_threshold <= 0) errors.push_back("connection_failure_threshold must be positive");
  if(newsgroup.empty()) errors.push_back("newsgroup must not be empty");
  if(finished_retention.count() < 0) errors.push_back("finished_retention_hours must not be negative");
  if(state_dir.empty()) errors.push_back("state_dir must not be empty");
  return errors.size() == before;
}

namespace {

std::size_t non_negative(int value) {
  return value < 0 ? 0 : static_cast<std::size_t>(value);
}

} // namespace

SyncConfig SyncConfig::from_settings(const SettingsManager& settings,
                                     std::vector<std::string>& errors) {
  SyncConfig cfg;
  cfg.codec.segment_size = non_negative(settings.get<int>("segment_size_bytes"));
  cfg.codec.compression_threshold_ratio = settings.get<double>("compression_threshold_ratio");
  cfg.codec.compression_sample_bytes = non_negative(settings.get<int>("compression_sample_bytes"));
  cfg.pack_threshold_bytes = non_negative(settings.get<int>("pack_threshold_bytes"));
  cfg.max_retry_count = settings.get<int>("max_retry_count");
  cfg.workers_per_direction = non_negative(settings.get<int>("workers_per_direction"));
  cfg.segment_fetch_parallelism = non_negative(settings.get<int>("segment_fetch_parallelism"));
  cfg.servers = parse_server_list(settings.get<nlohmann::json>("servers"), errors);
  cfg.max_rate_mbps = settings.get<double>("max_rate_mbps");
  cfg.redundancy_copies = non_negative(settings.get<int>("redundancy_copies"));
  cfg.encrypt_segments = settings.get<bool>("encrypt_segments");
  cfg.newsgroup = settings.get<std::string>("newsgroup");
  cfg.poster = settings.get<std::string>("poster");
  cfg.health_check_ttl = std::chrono::seconds(settings.get<int>("health_check_ttl_seconds"));
  cfg.server_cooldown = std::chrono::seconds(settings.get<int>("server_cooldown_seconds"));
  cfg.connection_failure_threshold = settings.get<int>("connection_failure_threshold");
  cfg.acquire_timeout = std::chrono::milliseconds(settings.get<int>("acquire_timeout_ms"));
  cfg.io_timeout = std::chrono::seconds(settings.get<int>("io_timeout_seconds"));
  cfg.queue_poll_interval = std::chrono::milliseconds(settings.get<int>("queue_poll_interval_ms"));
  cfg.finished_retention = std::chrono::hours(settings.get<int>("finished_retention_hours"));
  cfg.state_dir = settings.get<std::string>("state_dir");
  cfg.verbose = settings.get<bool>("verbose");
  cfg.validate(errors);
  return cfg;
}
