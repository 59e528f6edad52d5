#include "sync_engine.hpp"

#include <stdexcept>
#include <unordered_map>

#include "download_processor.hpp"
#include "upload_processor.hpp"

SyncEngine::SyncEngine(Options options)
  : options_(std::move(options)),
    logger_(std::make_shared<Logger>("engine")) {
  const auto& cfg = options_.config;
  auto make_logger = [this](const char* name) {
    auto logger = std::make_shared<Logger>(name);
    component_loggers_.push_back(logger);
    return logger;
  };
  component_loggers_.push_back(logger_);
  auto queue_logger = make_logger("queue");
  auto index_logger = make_logger("index");
  auto shares_logger = make_logger("shares");
  auto pool_logger = make_logger("pool");
  auto upload_logger = make_logger("upload");
  auto download_logger = make_logger("download");

  queue_ = std::make_shared<TransferQueue>(state_file("queue.json"), queue_logger);
  index_ = std::make_shared<VersionedIndex>(state_file("index.json"), index_logger);
  shares_ = std::make_shared<ShareManager>(index_, state_file("shares.json"), shares_logger);
  governor_ = std::make_shared<BandwidthGovernor>(cfg.max_rate_bytes_per_second());

  PoolOptions pool_options;
  pool_options.health_ttl = cfg.health_check_ttl;
  pool_options.cooldown = cfg.server_cooldown;
  pool_options.failure_threshold = cfg.connection_failure_threshold;
  pool_options.acquire_timeout = cfg.acquire_timeout;
  auto factory = options_.connection_factory
    ? options_.connection_factory
    : make_nntp_connection_factory(cfg.io_timeout);
  pool_ = std::make_shared<ConnectionPool>(cfg.servers, std::move(factory), pool_options, pool_logger);

  WorkerPool::Options upload_options;
  upload_options.name = "upload";
  upload_options.direction = Direction::Upload;
  upload_options.workers = cfg.workers_per_direction;
  upload_options.max_retry_count = cfg.max_retry_count;
  upload_options.poll_interval = cfg.queue_poll_interval;
  upload_workers_ = std::make_unique<WorkerPool>(
    *queue_,
    std::make_shared<UploadProcessor>(cfg, index_, pool_, governor_, upload_logger),
    upload_options,
    upload_logger);

  WorkerPool::Options download_options = upload_options;
  download_options.name = "download";
  download_options.direction = Direction::Download;
  download_workers_ = std::make_unique<WorkerPool>(
    *queue_,
    std::make_shared<DownloadProcessor>(cfg, index_, shares_, pool_, governor_, download_logger),
    download_options,
    download_logger);
}

SyncEngine::~SyncEngine() {
  stop();
  pool_->shutdown();
}

std::filesystem::path SyncEngine::state_file(const char* name) const {
  if(!options_.persist_state) return {};
  return options_.config.state_dir / name;
}

void SyncEngine::start() {
  if(started_) return;
  if(options_.persist_state) {
    std::error_code ec;
    std::filesystem::create_directories(options_.config.state_dir, ec);
    if(ec) {
      logger_->error("Cannot create state directory {}: {}", options_.config.state_dir.string(), ec.message());
      throw std::runtime_error("cannot create state directory " + options_.config.state_dir.string());
    }
    index_->load();
    shares_->load();
    queue_->load();
  }
  purge_finished();
  auto recovered = queue_->recover_active(options_.config.max_retry_count);
  if(recovered > 0) {
    logger_->info("Recovered {} interrupted transfer(s)", recovered);
  }
  queue_->reopen();
  upload_workers_->start();
  download_workers_->start();
  started_ = true;
  logger_->info("Engine started: {} server(s), {} worker(s) per direction",
                pool_->server_count(), options_.config.workers_per_direction);
}

void SyncEngine::stop() {
  if(!started_) return;
  started_ = false;
  queue_->shutdown();
  upload_workers_->stop();
  download_workers_->stop();
  purge_finished();
  if(options_.persist_state) {
    queue_->save();
    index_->save();
    shares_->save();
  }
  logger_->info("Engine stopped");
}

std::size_t SyncEngine::purge_finished() {
  return queue_->purge_finished(Clock::now() - options_.config.finished_retention);
}

std::string SyncEngine::enqueue_upload(const std::string& folder_id,
                                       const std::filesystem::path& source,
                                       int priority) {
  std::error_code ec;
  if(folder_id.empty()) throw std::invalid_argument("folder id must not be empty");
  if(!std::filesystem::exists(source, ec)) {
    throw std::invalid_argument("upload source does not exist: " + source.string());
  }
  TransferItem item;
  item.direction = Direction::Upload;
  item.entity_id = folder_id;
  item.entity_type = std::filesystem::is_directory(source, ec) ? EntityType::Folder : EntityType::File;
  item.source_path = std::filesystem::absolute(source).string();
  item.priority = priority;
  return queue_->enqueue(std::move(item));
}

std::string SyncEngine::enqueue_download(const std::string& share_id,
                                         const std::filesystem::path& destination,
                                         const std::string& user_id,
                                         int priority) {
  if(share_id.empty()) throw std::invalid_argument("share id must not be empty");
  if(destination.empty()) throw std::invalid_argument("destination must not be empty");
  TransferItem item;
  item.direction = Direction::Download;
  item.entity_id = share_id;
  item.entity_type = EntityType::Folder;
  item.destination = std::filesystem::absolute(destination).string();
  item.user_id = user_id;
  item.priority = priority;
  return queue_->enqueue(std::move(item));
}

std::optional<std::string> SyncEngine::enqueue_redeemed_download(const std::string& access_string,
                                                                 const std::filesystem::path& destination,
                                                                 const std::string& user_id,
                                                                 int priority) {
  auto share = shares_->redeem(access_string, user_id);
  if(!share) return std::nullopt;
  return enqueue_download(share->share_id, destination, user_id, priority);
}

std::optional<TransferProgress> SyncEngine::get_progress(const std::string& queue_id) const {
  return queue_->progress(queue_id);
}

std::optional<TransferItem> SyncEngine::wait_for(const std::string& queue_id,
                                                 std::chrono::milliseconds timeout) const {
  return queue_->wait_for_terminal(queue_id, timeout);
}

bool SyncEngine::cancel(const std::string& queue_id) {
  return queue_->cancel(queue_id);
}

uint64_t SyncEngine::publish_version(const std::string& folder_id, std::vector<FileEntry> files) {
  return index_->publish_version(folder_id, std::move(files));
}

Share SyncEngine::create_share(const std::string& folder_id,
                               uint64_t version,
                               ShareType share_type,
                               const std::vector<std::string>& authorized_user_ids) {
  return shares_->create_share(folder_id, version, share_type, authorized_user_ids);
}

bool SyncEngine::verify_access(const std::string& share_id, const std::string& user_id) {
  return shares_->verify_access(share_id, user_id);
}

bool SyncEngine::revoke_share(const std::string& share_id) {
  return shares_->revoke(share_id);
}

SyncEngine::Availability SyncEngine::check_availability(const std::string& folder_id, uint64_t version) {
  auto resolved = index_->resolve(folder_id, version);
  if(!resolved) {
    throw std::invalid_argument("unknown version " + folder_id + " v" + std::to_string(version));
  }
  Availability report;
  std::unordered_map<std::string, bool> present; // packed articles serve several segments
  for(const auto& file : resolved->version->files) {
    for(const auto& record : resolved->segments_for(file)) {
      ++report.segments;
      bool found = false;
      for(const auto& id : record.article_message_ids) {
        auto it = present.find(id);
        if(it == present.end()) {
          auto lease = pool_->acquire();
          it = present.emplace(id, lease->stat(id)).first;
          ++report.articles_checked;
        }
        if(it->second) {
          found = true;
          break;
        }
      }
      if(found) {
        ++report.available;
      } else {
        report.missing_segments.push_back(record.segment_id);
      }
    }
  }
  logger_->info("{} v{}: {}/{} segment(s) available ({} article(s) checked)",
                folder_id, version, report.available, report.segments, report.articles_checked);
  return report;
}

SyncEngine::Stats SyncEngine::stats() const {
  Stats s;
  s.uploads = queue_->status(Direction::Upload);
  s.downloads = queue_->status(Direction::Download);
  s.servers = pool_->stats();
  s.bandwidth = governor_->stats();
  return s;
}

LogListenerHandle SyncEngine::add_log_listener(Logger::Listener listener, void* user_data) {
  std::vector<LogListenerHandle> handles;
  for(const auto& logger : component_loggers_) {
    handles.push_back(logger->add_listener(listener, user_data));
  }
  listener_handles_.push_back(std::move(handles));
  return listener_handles_.size();
}

void SyncEngine::remove_log_listener(LogListenerHandle handle) {
  if(handle == 0 || handle > listener_handles_.size()) return;
  auto& handles = listener_handles_[handle - 1];
  for(std::size_t i = 0; i < handles.size() && i < component_loggers_.size(); ++i) {
    component_loggers_[i]->remove_listener(handles[i]);
  }
  handles.clear();
}
