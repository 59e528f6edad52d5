#include "download_processor.hpp"

#include <fstream>
#include <vector>

#include "folder_scanner.hpp"
#include "segment_fetcher.hpp"
#include "transfer_errors.hpp"
#include "yenc.hpp"

namespace {

const char* kPartialDirName = ".usenetsync-partial";

// Removes a staging file unless it was moved into place.
class PartialFile {
public:
  explicit PartialFile(std::filesystem::path path) : path_(std::move(path)) {}
  ~PartialFile() {
    if(!committed_) {
      std::error_code ec;
      std::filesystem::remove(path_, ec);
    }
  }
  PartialFile(const PartialFile&) = delete;
  PartialFile& operator=(const PartialFile&) = delete;

  const std::filesystem::path& path() const { return path_; }
  void commit() { committed_ = true; }

private:
  std::filesystem::path path_;
  bool committed_ = false;
};

bool already_present(const std::filesystem::path& target, const FileEntry& file) {
  std::error_code ec;
  if(!std::filesystem::is_regular_file(target, ec)) return false;
  if(std::filesystem::file_size(target, ec) != file.size || ec) return false;
  return sha256_file_hex(target) == file.content_hash;
}

void move_into_place(const std::filesystem::path& from, const std::filesystem::path& to) {
  std::error_code ec;
  if(to.has_parent_path()) std::filesystem::create_directories(to.parent_path(), ec);
  ec.clear();
  std::filesystem::rename(from, to, ec);
  if(ec) {
    std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, ec);
    if(ec) throw std::runtime_error("failed to move " + from.string() + " to " + to.string() + ": " + ec.message());
    std::filesystem::remove(from, ec);
  }
}

} // namespace

std::shared_ptr<const Bytes> ArticleCache::find(const std::string& message_id) const {
  std::lock_guard lg(m_);
  auto it = payloads_.find(message_id);
  return it == payloads_.end() ? nullptr : it->second;
}

void ArticleCache::put(const std::string& message_id, std::shared_ptr<const Bytes> payload) {
  std::lock_guard lg(m_);
  payloads_[message_id] = std::move(payload);
}

void ArticleCache::erase(const std::string& message_id) {
  std::lock_guard lg(m_);
  payloads_.erase(message_id);
}

SegmentRetriever::SegmentRetriever(const SegmentCodec& codec,
                                   ConnectionPool& pool,
                                   BandwidthGovernor& governor,
                                   std::shared_ptr<Logger> logger)
  : codec_(codec), pool_(pool), governor_(governor), logger_(std::move(logger)) {}

Bytes SegmentRetriever::fetch_payload(const std::string& message_id) {
  auto lease = pool_.acquire();
  auto body = lease->fetch(message_id);
  lease.count_fetch(body.size());
  lease.release();
  governor_.throttle(body.size());
  return yenc_decode(body);
}

Bytes SegmentRetriever::retrieve(const SegmentRecord& record,
                                 const EncryptionKey* key,
                                 ArticleCache& cache) {
  if(record.article_message_ids.empty()) {
    throw ExhaustionError("segment " + record.segment_id + " has no article ids");
  }
  bool transient = false;
  bool corrupt = false;
  std::string last_error;

  for(const auto& id : record.article_message_ids) {
    try {
      Bytes payload;
      if(record.pack_slot >= 0) {
        auto shared = cache.find(id);
        if(!shared) {
          shared = std::make_shared<const Bytes>(fetch_payload(id));
          cache.put(id, shared);
        }
        auto parts = SegmentCodec::unpack(*shared);
        if(static_cast<std::size_t>(record.pack_slot) >= parts.size()) {
          throw IntegrityError("article " + id + " has no slot " + std::to_string(record.pack_slot));
        }
        payload = std::move(parts[static_cast<std::size_t>(record.pack_slot)]);
      } else {
        payload = fetch_payload(id);
      }
      return codec_.decode(record, payload, key);
    } catch(const ArticleNotFound& e) {
      last_error = e.what();
      log_debug(logger_.get(), "segment {}: {}", record.segment_id, e.what());
    } catch(const IntegrityError& e) {
      corrupt = true;
      last_error = e.what();
      cache.erase(id);
      log_warn(logger_.get(), "segment {} copy {} rejected: {}", record.segment_id, id, e.what());
    } catch(const TransientError& e) {
      transient = true;
      last_error = e.what();
      log_warn(logger_.get(), "segment {} copy {} unreachable: {}", record.segment_id, id, e.what());
    }
  }

  auto detail = "segment " + record.segment_id + " (" +
                std::to_string(record.article_message_ids.size()) + " article id(s)): " + last_error;
  if(transient) throw TransientError(detail);
  if(corrupt) throw IntegrityError(detail);
  throw ExhaustionError("no copy of " + detail);
}

DownloadProcessor::DownloadProcessor(const SyncConfig& config,
                                     std::shared_ptr<VersionedIndex> index,
                                     std::shared_ptr<ShareManager> shares,
                                     std::shared_ptr<ConnectionPool> pool,
                                     std::shared_ptr<BandwidthGovernor> governor,
                                     std::shared_ptr<Logger> logger)
  : config_(config),
    codec_(config.codec),
    index_(std::move(index)),
    shares_(std::move(shares)),
    pool_(std::move(pool)),
    governor_(std::move(governor)),
    logger_(std::move(logger)) {}

void DownloadProcessor::fetch_file(const FileEntry& file,
                                   const ResolvedVersion& resolved,
                                   const EncryptionKey* key,
                                   const std::filesystem::path& root,
                                   ArticleCache& cache,
                                   TransferContext& ctx,
                                   std::atomic<uint64_t>& done,
                                   uint64_t total) {
  auto records = resolved.segments_for(file);
  std::vector<uint64_t> offsets(records.size());
  uint64_t expected = 0;
  for(std::size_t i = 0; i < records.size(); ++i) {
    offsets[i] = expected;
    expected += records[i].raw_size;
  }
  if(expected != file.size) {
    throw IntegrityError(file.path + ": segments cover " + std::to_string(expected) +
                         " bytes, entry says " + std::to_string(file.size));
  }

  std::error_code ec;
  std::filesystem::create_directories(root / kPartialDirName, ec);
  PartialFile partial(root / kPartialDirName / (file.file_id + ".part"));
  {
    std::ofstream create(partial.path(), std::ios::binary | std::ios::trunc);
    if(!create) throw std::runtime_error("unable to create " + partial.path().string());
  }
  if(file.size > 0) std::filesystem::resize_file(partial.path(), file.size);

  {
    std::fstream out(partial.path(), std::ios::in | std::ios::out | std::ios::binary);
    if(!out) throw std::runtime_error("unable to open " + partial.path().string());
    std::mutex write_mutex;
    SegmentRetriever retriever(codec_, *pool_, *governor_, logger_);

    SegmentFetchConfig fetch_config;
    fetch_config.parallelism = config_.segment_fetch_parallelism;
    fetch_config.stop_requested = [&ctx]{ return ctx.stop_requested(); };

    run_segment_fetch(records.size(), fetch_config,
      [&](std::size_t index) {
        auto data = retriever.retrieve(records[index], key, cache);
        std::lock_guard<std::mutex> lock(write_mutex);
        out.seekp(static_cast<std::streamoff>(offsets[index]));
        out.write(data.data(), static_cast<std::streamsize>(data.size()));
        if(!out) throw std::runtime_error("write failed on " + partial.path().string());
      },
      [&](std::size_t index) {
        auto now_done = done.fetch_add(records[index].raw_size) + records[index].raw_size;
        ctx.report(now_done, total);
      });
    out.flush();
    if(!out) throw std::runtime_error("flush failed on " + partial.path().string());
  }

  if(sha256_file_hex(partial.path()) != file.content_hash) {
    throw IntegrityError(file.path + ": reassembled content hash mismatch");
  }
  move_into_place(partial.path(), root / file.path);
  partial.commit();
}

ProcessOutcome DownloadProcessor::process(const TransferItem& item, TransferContext& ctx) {
  auto share = shares_->require_access(item.entity_id, item.user_id);
  auto resolved = index_->resolve(share.folder_id, share.version);
  if(!resolved) {
    throw IntegrityError("index has no " + share.folder_id + " v" + std::to_string(share.version));
  }
  auto key = index_->find_folder_key(share.folder_id);
  const EncryptionKey* key_ptr = key ? &*key : nullptr;

  std::filesystem::path root(item.destination);
  std::error_code ec;
  std::filesystem::create_directories(root, ec);
  if(ec) throw std::runtime_error("cannot create " + root.string() + ": " + ec.message());

  const auto& version = *resolved->version;
  uint64_t total = version.total_size;
  std::atomic<uint64_t> done{0};
  ctx.report(0, total);

  ArticleCache cache;
  nlohmann::json files = nlohmann::json::array();
  std::size_t failed = 0;
  std::optional<FailureKind> first_failure;

  for(const auto& file : version.files) {
    ctx.check_stop();
    if(is_internal_path(file.path)) {
      throw IntegrityError("refusing to write into internal path " + file.path);
    }
    auto target = root / file.path;
    if(already_present(target, file)) {
      done.fetch_add(file.size);
      ctx.report(done.load(), total);
      files.push_back({{"path", file.path}, {"status", "present"}});
      continue;
    }
    try {
      fetch_file(file, *resolved, key_ptr, root, cache, ctx, done, total);
      files.push_back({{"path", file.path}, {"status", "downloaded"}});
    } catch(const IntegrityError& e) {
      ++failed;
      if(!first_failure) first_failure = FailureKind::Integrity;
      files.push_back({{"path", file.path}, {"status", "failed"}, {"kind", "integrity"}, {"error", e.what()}});
      log_error(logger_.get(), "{}: {}", file.path, e.what());
    } catch(const ExhaustionError& e) {
      ++failed;
      if(!first_failure) first_failure = FailureKind::Exhaustion;
      files.push_back({{"path", file.path}, {"status", "failed"}, {"kind", "exhaustion"}, {"error", e.what()}});
      log_error(logger_.get(), "{}: {}", file.path, e.what());
    }
  }
  std::filesystem::remove(root / kPartialDirName, ec);

  ProcessOutcome outcome;
  outcome.result = {
    {"share_id", share.share_id},
    {"folder_id", share.folder_id},
    {"version", share.version},
    {"files", files},
    {"files_failed", failed}
  };
  if(first_failure) {
    outcome.failure = first_failure;
    outcome.error = std::to_string(failed) + " of " + std::to_string(version.files.size()) +
                    " file(s) could not be recovered";
  }
  return outcome;
}
