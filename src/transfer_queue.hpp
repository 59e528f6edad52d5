#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "log.hpp"
#include "transfer_types.hpp"

// Durable priority queue of transfer items for both directions. Every state
// transition happens under one lock together with its progress fields and is
// followed by a snapshot write when a path is configured. Progress-only
// updates are written at most once per progress_snapshot_interval.
class TransferQueue {
public:
  struct Status {
    std::size_t queued = 0;
    std::size_t active = 0;
    std::size_t completed = 0;
    std::size_t failed = 0;
    std::size_t cancelled = 0;
    uint64_t bytes_done = 0;
    uint64_t bytes_total = 0;
  };

  static constexpr std::chrono::milliseconds kDefaultProgressSnapshotInterval{2000};

  explicit TransferQueue(std::filesystem::path snapshot_path = {},
                         std::shared_ptr<Logger> logger = nullptr,
                         std::chrono::milliseconds progress_snapshot_interval = kDefaultProgressSnapshotInterval);

  // Assigns queue_id and FIFO sequence and stores the item as queued.
  std::string enqueue(TransferItem item);

  // Atomically moves the best queued item of `direction` to active. Waits at
  // most `wait` for one to appear; nullopt on timeout or shutdown.
  std::optional<TransferItem> claim_next(Direction direction,
                                         const std::string& worker,
                                         std::chrono::milliseconds wait);

  bool update_progress(const std::string& queue_id, uint64_t bytes_done, uint64_t bytes_total);
  bool complete(const std::string& queue_id, nlohmann::json result = nlohmann::json::object());

  // Transient failures go back to queued while retry_count < max_retry_count;
  // anything else, or an exhausted retry limit, is terminal. Returns the new state.
  TransferState fail(const std::string& queue_id,
                     FailureKind kind,
                     const std::string& error,
                     int max_retry_count,
                     nlohmann::json result = nlohmann::json::object());

  // Treats every active item as crashed. Returns how many were touched.
  std::size_t recover_active(int max_retry_count);

  // Puts an active item back in its old queue position without touching its
  // retry count. For workers that claimed an item they will not run.
  bool release(const std::string& queue_id);

  // Only queued items can be cancelled.
  bool cancel(const std::string& queue_id);

  // Drops terminal items finished before `cutoff`.
  std::size_t purge_finished(Timestamp cutoff);

  std::optional<TransferItem> get(const std::string& queue_id) const;
  std::optional<TransferProgress> progress(const std::string& queue_id) const;
  std::vector<TransferItem> list(std::optional<Direction> direction = std::nullopt,
                                 std::optional<TransferState> state = std::nullopt) const;
  Status status(Direction direction) const;

  std::optional<TransferItem> wait_for_terminal(const std::string& queue_id,
                                                std::chrono::milliseconds timeout) const;

  // Wakes every waiter; claim_next returns nullopt from now on.
  void shutdown();
  void reopen();

  bool load();
  bool save() const;

private:
  using PendingKey = std::pair<int, uint64_t>;

  std::map<PendingKey, std::string>& pending_for(Direction d) {
    return d == Direction::Upload ? pending_upload_ : pending_download_;
  }
  void push_pending_locked(TransferItem& item);
  void erase_pending_locked(const TransferItem& item);
  void persist_locked() const;

  std::filesystem::path snapshot_path_;
  std::shared_ptr<Logger> logger_;
  std::chrono::milliseconds progress_snapshot_interval_;
  mutable std::chrono::steady_clock::time_point last_snapshot_{};

  mutable std::mutex m_;
  mutable std::condition_variable cv_;
  std::unordered_map<std::string, TransferItem> items_;
  std::map<PendingKey, std::string> pending_upload_;
  std::map<PendingKey, std::string> pending_download_;
  uint64_t next_seq_ = 1;
  bool shutdown_ = false;
};
