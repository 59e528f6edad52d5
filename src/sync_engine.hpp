#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "bandwidth_governor.hpp"
#include "connection_pool.hpp"
#include "log.hpp"
#include "share_manager.hpp"
#include "sync_config.hpp"
#include "transfer_queue.hpp"
#include "transfer_workers.hpp"
#include "versioned_index.hpp"

// Owns every component of the transfer pipeline and exposes the operations
// the enclosing service calls. All enqueue/share calls return immediately;
// the worker pools do the transfers.
class SyncEngine {
public:
  struct Options {
    SyncConfig config;
    // Empty means real NNTP connections.
    ConnectionFactory connection_factory;
    // Snapshot queue, index and shares under config.state_dir.
    bool persist_state = true;
  };

  struct Availability {
    std::size_t segments = 0;
    std::size_t available = 0;
    std::size_t articles_checked = 0;
    std::vector<std::string> missing_segments; // no copy left on any server

    bool complete() const { return missing_segments.empty(); }
  };

  struct Stats {
    TransferQueue::Status uploads;
    TransferQueue::Status downloads;
    std::vector<ConnectionPool::ServerStats> servers;
    BandwidthGovernor::Stats bandwidth;
  };

  explicit SyncEngine(Options options);
  ~SyncEngine();

  SyncEngine(const SyncEngine&) = delete;
  SyncEngine& operator=(const SyncEngine&) = delete;

  // Loads persisted state, requeues items left active by a previous run and
  // starts both worker pools.
  void start();
  void stop();
  bool running() const { return started_; }

  // Drops terminal items that finished more than finished_retention ago.
  // Runs on start and stop.
  std::size_t purge_finished();

  // Throws std::invalid_argument if the source does not exist.
  std::string enqueue_upload(const std::string& folder_id,
                             const std::filesystem::path& source,
                             int priority = 5);
  std::string enqueue_download(const std::string& share_id,
                               const std::filesystem::path& destination,
                               const std::string& user_id = std::string(),
                               int priority = 5);
  // Looks the access string up first; nullopt if it does not resolve.
  std::optional<std::string> enqueue_redeemed_download(const std::string& access_string,
                                                       const std::filesystem::path& destination,
                                                       const std::string& user_id = std::string(),
                                                       int priority = 5);

  std::optional<TransferProgress> get_progress(const std::string& queue_id) const;
  std::optional<TransferItem> wait_for(const std::string& queue_id,
                                       std::chrono::milliseconds timeout) const;
  bool cancel(const std::string& queue_id);

  uint64_t publish_version(const std::string& folder_id, std::vector<FileEntry> files);
  Share create_share(const std::string& folder_id,
                     uint64_t version,
                     ShareType share_type,
                     const std::vector<std::string>& authorized_user_ids = {});
  bool verify_access(const std::string& share_id, const std::string& user_id);
  bool revoke_share(const std::string& share_id);

  // STATs the articles behind a published version without fetching them.
  // Throws std::invalid_argument for an unknown version.
  Availability check_availability(const std::string& folder_id, uint64_t version);

  Stats stats() const;

  const SyncConfig& config() const { return options_.config; }
  std::shared_ptr<TransferQueue> queue() const { return queue_; }
  std::shared_ptr<VersionedIndex> index() const { return index_; }
  std::shared_ptr<ShareManager> shares() const { return shares_; }
  std::shared_ptr<ConnectionPool> pool() const { return pool_; }
  std::shared_ptr<BandwidthGovernor> governor() const { return governor_; }
  std::shared_ptr<Logger> logger() const { return logger_; }

  // Listener on every component logger.
  LogListenerHandle add_log_listener(Logger::Listener listener, void* user_data = nullptr);
  void remove_log_listener(LogListenerHandle handle);

private:
  std::filesystem::path state_file(const char* name) const;

  Options options_;
  std::shared_ptr<Logger> logger_;
  std::vector<std::shared_ptr<Logger>> component_loggers_;
  std::shared_ptr<TransferQueue> queue_;
  std::shared_ptr<VersionedIndex> index_;
  std::shared_ptr<ShareManager> shares_;
  std::shared_ptr<BandwidthGovernor> governor_;
  std::shared_ptr<ConnectionPool> pool_;
  std::unique_ptr<WorkerPool> upload_workers_;
  std::unique_ptr<WorkerPool> download_workers_;
  // One handle per logger for each add_log_listener call.
  std::vector<std::vector<LogListenerHandle>> listener_handles_;
  bool started_ = false;
};
