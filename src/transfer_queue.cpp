#include "transfer_queue.hpp"

#include <algorithm>

#include "json_store.hpp"

TransferQueue::TransferQueue(std::filesystem::path snapshot_path,
                             std::shared_ptr<Logger> logger,
                             std::chrono::milliseconds progress_snapshot_interval)
  : snapshot_path_(std::move(snapshot_path)),
    logger_(std::move(logger)),
    progress_snapshot_interval_(progress_snapshot_interval) {}

void TransferQueue::push_pending_locked(TransferItem& item) {
  item.seq = next_seq_++;
  pending_for(item.direction)[{item.priority, item.seq}] = item.queue_id;
}

void TransferQueue::erase_pending_locked(const TransferItem& item) {
  pending_for(item.direction).erase({item.priority, item.seq});
}

std::string TransferQueue::enqueue(TransferItem item) {
  std::lock_guard lg(m_);
  item.queue_id = random_hex(16);
  item.state = TransferState::Queued;
  item.retry_count = 0;
  item.bytes_done = 0;
  item.error.clear();
  item.failure_kind.reset();
  item.created_at = Clock::now();
  push_pending_locked(item);
  auto id = item.queue_id;
  log_info(logger_.get(), "queued {} {} {} (priority {})",
           to_string(item.direction), to_string(item.entity_type), item.entity_id, item.priority);
  items_.emplace(id, std::move(item));
  persist_locked();
  cv_.notify_all();
  return id;
}

std::optional<TransferItem> TransferQueue::claim_next(Direction direction,
                                                      const std::string& worker,
                                                      std::chrono::milliseconds wait) {
  std::unique_lock lk(m_);
  auto& pending = pending_for(direction);
  cv_.wait_for(lk, wait, [&]{ return shutdown_ || !pending.empty(); });
  if(shutdown_ || pending.empty()) return std::nullopt;

  auto first = pending.begin();
  auto& item = items_.at(first->second);
  pending.erase(first);
  item.state = TransferState::Active;
  item.worker = worker;
  item.started_at = Clock::now();
  persist_locked();
  return item;
}

bool TransferQueue::update_progress(const std::string& queue_id, uint64_t bytes_done, uint64_t bytes_total) {
  std::lock_guard lg(m_);
  auto it = items_.find(queue_id);
  if(it == items_.end() || it->second.state != TransferState::Active) return false;
  it->second.bytes_done = bytes_done;
  it->second.bytes_total = bytes_total;
  if(std::chrono::steady_clock::now() - last_snapshot_ >= progress_snapshot_interval_) persist_locked();
  cv_.notify_all();
  return true;
}

bool TransferQueue::complete(const std::string& queue_id, nlohmann::json result) {
  std::lock_guard lg(m_);
  auto it = items_.find(queue_id);
  if(it == items_.end() || it->second.state != TransferState::Active) return false;
  auto& item = it->second;
  item.state = TransferState::Completed;
  item.bytes_done = item.bytes_total;
  item.finished_at = Clock::now();
  item.result = std::move(result);
  item.error.clear();
  item.failure_kind.reset();
  log_info(logger_.get(), "{} {} completed", to_string(item.direction), item.queue_id);
  persist_locked();
  cv_.notify_all();
  return true;
}

TransferState TransferQueue::fail(const std::string& queue_id,
                                  FailureKind kind,
                                  const std::string& error,
                                  int max_retry_count,
                                  nlohmann::json result) {
  std::lock_guard lg(m_);
  auto it = items_.find(queue_id);
  if(it == items_.end()) return TransferState::Failed;
  auto& item = it->second;
  if(item.state != TransferState::Active) return item.state;

  item.error = error;
  item.failure_kind = kind;
  if(!result.empty()) item.result = std::move(result);
  if(kind == FailureKind::Transient && item.retry_count < max_retry_count) {
    item.retry_count += 1;
    item.state = TransferState::Queued;
    item.worker.clear();
    push_pending_locked(item);
    log_warn(logger_.get(), "{} {} retry {}/{}: {}",
             to_string(item.direction), item.queue_id, item.retry_count, max_retry_count, error);
  } else {
    item.state = TransferState::Failed;
    item.finished_at = Clock::now();
    log_error(logger_.get(), "{} {} failed ({}): {}",
              to_string(item.direction), item.queue_id, to_string(kind), error);
  }
  persist_locked();
  cv_.notify_all();
  return item.state;
}

std::size_t TransferQueue::recover_active(int max_retry_count) {
  std::lock_guard lg(m_);
  std::size_t touched = 0;
  for(auto& [id, item] : items_) {
    if(item.state != TransferState::Active) continue;
    ++touched;
    item.worker.clear();
    if(item.retry_count < max_retry_count) {
      item.retry_count += 1;
      item.state = TransferState::Queued;
      push_pending_locked(item);
      log_info(logger_.get(), "recovered interrupted {} {} (retry {})",
               to_string(item.direction), id, item.retry_count);
    } else {
      item.state = TransferState::Failed;
      item.failure_kind = FailureKind::Transient;
      item.error = "interrupted with no retries left";
      item.finished_at = Clock::now();
      log_warn(logger_.get(), "interrupted {} {} has no retries left", to_string(item.direction), id);
    }
  }
  if(touched > 0) {
    persist_locked();
    cv_.notify_all();
  }
  return touched;
}

bool TransferQueue::release(const std::string& queue_id) {
  std::lock_guard lg(m_);
  auto it = items_.find(queue_id);
  if(it == items_.end() || it->second.state != TransferState::Active) return false;
  auto& item = it->second;
  item.state = TransferState::Queued;
  item.worker.clear();
  pending_for(item.direction)[{item.priority, item.seq}] = item.queue_id;
  persist_locked();
  cv_.notify_all();
  return true;
}

bool TransferQueue::cancel(const std::string& queue_id) {
  std::lock_guard lg(m_);
  auto it = items_.find(queue_id);
  if(it == items_.end() || it->second.state != TransferState::Queued) return false;
  erase_pending_locked(it->second);
  it->second.state = TransferState::Cancelled;
  it->second.finished_at = Clock::now();
  persist_locked();
  cv_.notify_all();
  return true;
}

std::size_t TransferQueue::purge_finished(Timestamp cutoff) {
  std::lock_guard lg(m_);
  std::size_t removed = 0;
  for(auto it = items_.begin(); it != items_.end();) {
    if(is_terminal(it->second.state) && it->second.finished_at < cutoff) {
      it = items_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  if(removed > 0) {
    log_info(logger_.get(), "purged {} finished transfer item(s)", removed);
    persist_locked();
  }
  return removed;
}

std::optional<TransferItem> TransferQueue::get(const std::string& queue_id) const {
  std::lock_guard lg(m_);
  auto it = items_.find(queue_id);
  if(it == items_.end()) return std::nullopt;
  return it->second;
}

std::optional<TransferProgress> TransferQueue::progress(const std::string& queue_id) const {
  std::lock_guard lg(m_);
  auto it = items_.find(queue_id);
  if(it == items_.end()) return std::nullopt;
  const auto& item = it->second;
  TransferProgress p;
  p.queue_id = item.queue_id;
  p.state = item.state;
  p.bytes_done = item.bytes_done;
  p.bytes_total = item.bytes_total;
  p.percent = item.percent();
  p.retry_count = item.retry_count;
  p.error = item.error;
  p.failure_kind = item.failure_kind;
  return p;
}

std::vector<TransferItem> TransferQueue::list(std::optional<Direction> direction,
                                              std::optional<TransferState> state) const {
  std::vector<TransferItem> out;
  {
    std::lock_guard lg(m_);
    for(const auto& [id, item] : items_) {
      if(direction && item.direction != *direction) continue;
      if(state && item.state != *state) continue;
      out.push_back(item);
    }
  }
  std::sort(out.begin(), out.end(), [](const TransferItem& a, const TransferItem& b) {
    if(a.priority != b.priority) return a.priority < b.priority;
    return a.seq < b.seq;
  });
  return out;
}

TransferQueue::Status TransferQueue::status(Direction direction) const {
  std::lock_guard lg(m_);
  Status s;
  for(const auto& [id, item] : items_) {
    if(item.direction != direction) continue;
    switch(item.state) {
      case TransferState::Queued: ++s.queued; break;
      case TransferState::Active:
        ++s.active;
        s.bytes_done += item.bytes_done;
        s.bytes_total += item.bytes_total;
        break;
      case TransferState::Completed: ++s.completed; break;
      case TransferState::Failed: ++s.failed; break;
      case TransferState::Cancelled: ++s.cancelled; break;
    }
  }
  return s;
}

std::optional<TransferItem> TransferQueue::wait_for_terminal(const std::string& queue_id,
                                                             std::chrono::milliseconds timeout) const {
  std::unique_lock lk(m_);
  auto done = [&]{
    auto it = items_.find(queue_id);
    return it == items_.end() || is_terminal(it->second.state);
  };
  cv_.wait_for(lk, timeout, done);
  auto it = items_.find(queue_id);
  if(it == items_.end()) return std::nullopt;
  return it->second;
}

void TransferQueue::shutdown() {
  {
    std::lock_guard lg(m_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

void TransferQueue::reopen() {
  std::lock_guard lg(m_);
  shutdown_ = false;
}

void TransferQueue::persist_locked() const {
  if(snapshot_path_.empty()) return;
  last_snapshot_ = std::chrono::steady_clock::now();
  nlohmann::json doc;
  doc["next_seq"] = next_seq_;
  doc["items"] = nlohmann::json::array();
  for(const auto& [id, item] : items_) doc["items"].push_back(item);
  if(!write_json_atomic(snapshot_path_, doc)) {
    log_warn(logger_.get(), "queue snapshot not written to {}", snapshot_path_.string());
  }
}

bool TransferQueue::save() const {
  std::lock_guard lg(m_);
  if(snapshot_path_.empty()) return false;
  persist_locked();
  return true;
}

bool TransferQueue::load() {
  if(snapshot_path_.empty()) return false;
  auto doc = read_json_file(snapshot_path_);
  if(!doc) return false;

  std::lock_guard lg(m_);
  try {
    items_.clear();
    pending_upload_.clear();
    pending_download_.clear();
    next_seq_ = doc->value("next_seq", uint64_t{1});
    for(const auto& entry : doc->value("items", nlohmann::json::array())) {
      auto item = entry.get<TransferItem>();
      if(item.state == TransferState::Queued) {
        pending_for(item.direction)[{item.priority, item.seq}] = item.queue_id;
      }
      next_seq_ = std::max(next_seq_, item.seq + 1);
      items_.emplace(item.queue_id, std::move(item));
    }
  } catch(const std::exception& e) {
    log_error(logger_.get(), "queue snapshot {} is unreadable: {}", snapshot_path_.string(), e.what());
    items_.clear();
    pending_upload_.clear();
    pending_download_.clear();
    return false;
  }
  log_info(logger_.get(), "loaded {} transfer item(s) from {}", items_.size(), snapshot_path_.string());
  return true;
}
