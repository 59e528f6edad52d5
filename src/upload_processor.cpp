#include "upload_processor.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <set>

#include "nntp_client.hpp"
#include "transfer_errors.hpp"
#include "yenc.hpp"

namespace {

const std::set<std::string> kArchiveExtensions = {
  ".zip", ".rar", ".7z", ".gz", ".tgz", ".bz2", ".xz", ".zst",
  ".jpg", ".jpeg", ".png", ".gif", ".webp",
  ".mp3", ".aac", ".flac", ".ogg", ".mp4", ".mkv", ".avi", ".mov"
};

const std::set<std::string> kTextExtensions = {
  ".txt", ".log", ".csv", ".json", ".xml", ".html", ".md",
  ".c", ".cpp", ".h", ".hpp", ".py", ".js", ".sql"
};

std::string lower_extension(const std::filesystem::path& path) {
  auto ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return ext;
}

// Small encoded segments waiting to share one article.
struct PendingPack {
  std::vector<std::size_t> record_indices;
  std::vector<Bytes> payloads;
  std::size_t bytes = 0;

  bool empty() const { return payloads.empty(); }
  void clear() {
    record_indices.clear();
    payloads.clear();
    bytes = 0;
  }
};

} // namespace

const char* to_string(UploadStrategy s) {
  switch(s) {
    case UploadStrategy::Simple: return "simple";
    case UploadStrategy::Redundant: return "redundant";
    case UploadStrategy::Optimized: return "optimized";
    case UploadStrategy::Compressed: return "compressed";
  }
  return "optimized";
}

UploadStrategy select_strategy(const std::filesystem::path& path,
                               uint64_t size,
                               std::size_t segment_size) {
  auto ext = lower_extension(path);
  if(kArchiveExtensions.count(ext) != 0) return UploadStrategy::Redundant;
  if(kTextExtensions.count(ext) != 0) return UploadStrategy::Compressed;
  if(size <= segment_size) return UploadStrategy::Simple;
  return UploadStrategy::Optimized;
}

CompressionMode compression_for(UploadStrategy s) {
  switch(s) {
    case UploadStrategy::Redundant: return CompressionMode::Never;
    case UploadStrategy::Compressed: return CompressionMode::Always;
    case UploadStrategy::Simple:
    case UploadStrategy::Optimized:
      return CompressionMode::Auto;
  }
  return CompressionMode::Auto;
}

std::size_t copies_for(UploadStrategy s, std::size_t redundancy_copies) {
  return s == UploadStrategy::Redundant ? std::max<std::size_t>(1, redundancy_copies) : 1;
}

ArticlePoster::ArticlePoster(ConnectionPool& pool, BandwidthGovernor& governor, const SyncConfig& config)
  : pool_(pool), governor_(governor), config_(config) {}

std::vector<std::string> ArticlePoster::post(const Bytes& payload, std::size_t copies) {
  auto body = yenc_encode(payload, random_hex(8) + ".bin");
  std::vector<std::string> ids;
  std::set<std::string> used;
  for(std::size_t copy = 0; copy < copies; ++copy) {
    ConnectionPool::Lease lease;
    try {
      lease = pool_.acquire(used);
    } catch(const NoServerAvailable&) {
      if(used.empty()) throw;
      lease = pool_.acquire();
    } catch(const NntpError&) {
      // The unused servers refused; repeat the copy on one already used.
      if(used.empty()) throw;
      lease = pool_.acquire();
    }
    ArticleHeaders headers;
    headers.from = config_.poster;
    headers.newsgroups = config_.newsgroup;
    headers.subject = make_obfuscated_subject();
    headers.message_id = make_message_id();
    governor_.throttle(body.size());
    ids.push_back(lease->post(headers, body));
    lease.count_post(body.size());
    used.insert(lease.server().name());
  }
  return ids;
}

UploadProcessor::UploadProcessor(const SyncConfig& config,
                                 std::shared_ptr<VersionedIndex> index,
                                 std::shared_ptr<ConnectionPool> pool,
                                 std::shared_ptr<BandwidthGovernor> governor,
                                 std::shared_ptr<Logger> logger)
  : config_(config),
    codec_(config.codec),
    index_(std::move(index)),
    pool_(std::move(pool)),
    governor_(std::move(governor)),
    logger_(std::move(logger)) {}

ProcessOutcome UploadProcessor::process(const TransferItem& item, TransferContext& ctx) {
  const auto& folder_id = item.entity_id;
  auto listing = scan_folder(item.source_path);
  auto changes = index_->detect_changes(folder_id, listing);
  auto latest = index_->latest_version(folder_id);

  ProcessOutcome outcome;
  if(changes.empty() && latest != 0) {
    log_info(logger_.get(), "{} unchanged since v{}", folder_id, latest);
    outcome.result = {{"folder_id", folder_id}, {"version", latest}, {"unchanged", true}};
    return outcome;
  }

  std::map<std::string, const ScannedFile*> by_path;
  for(const auto& f : listing) by_path[f.path] = &f;

  std::vector<const ScannedFile*> to_upload;
  std::vector<std::string> deleted;
  uint64_t total = 0;
  for(const auto& change : changes) {
    if(change.kind == ChangeKind::Deleted) {
      deleted.push_back(change.path);
    } else {
      const auto* f = by_path.at(change.path);
      to_upload.push_back(f);
      total += f->size;
    }
  }
  ctx.report(0, total);

  EncryptionKey key;
  if(config_.encrypt_segments) key = index_->folder_key(folder_id);
  const EncryptionKey* key_ptr = config_.encrypt_segments ? &key : nullptr;

  ArticlePoster poster(*pool_, *governor_, config_);
  const auto pack_threshold = config_.effective_pack_threshold();
  std::vector<SegmentRecord> records;
  std::vector<FileEntry> entries;
  nlohmann::json strategies = nlohmann::json::object();
  PendingPack pack;
  uint64_t done = 0;
  std::size_t articles = 0;

  auto flush_pack = [&]{
    if(pack.empty()) return;
    if(pack.payloads.size() == 1) {
      records[pack.record_indices.front()].article_message_ids = poster.post(pack.payloads.front(), 1);
    } else {
      auto ids = poster.post(SegmentCodec::pack(pack.payloads), 1);
      for(std::size_t slot = 0; slot < pack.record_indices.size(); ++slot) {
        auto& rec = records[pack.record_indices[slot]];
        rec.article_message_ids = ids;
        rec.pack_slot = static_cast<int>(slot);
      }
    }
    ++articles;
    pack.clear();
  };

  for(const auto* file : to_upload) {
    ctx.check_stop();
    auto strategy = select_strategy(file->path, file->size, config_.codec.segment_size);
    strategies[file->path] = to_string(strategy);

    FileEntry entry;
    entry.file_id = random_hex(16);
    entry.path = file->path;
    entry.size = file->size;
    entry.content_hash = file->content_hash;

    FileSegmentReader reader(file->absolute, config_.codec.segment_size);
    auto copies = copies_for(strategy, config_.redundancy_copies);
    Bytes chunk;
    uint32_t seq = 0;
    for(; reader.next(chunk); ++seq) {
      ctx.check_stop();
      auto encoded = codec_.encode(chunk, entry.file_id, seq, compression_for(strategy), key_ptr);
      entry.segment_ids.push_back(encoded.record.segment_id);

      if(copies == 1 && encoded.payload.size() < pack_threshold) {
        auto framed = encoded.payload.size() + 4;
        if(!pack.empty() &&
           SegmentCodec::pack_overhead(0) + pack.bytes + framed > config_.codec.segment_size) {
          flush_pack();
        }
        pack.record_indices.push_back(records.size());
        pack.bytes += framed;
        pack.payloads.push_back(std::move(encoded.payload));
        records.push_back(std::move(encoded.record));
      } else {
        encoded.record.article_message_ids = poster.post(encoded.payload, copies);
        articles += copies;
        records.push_back(std::move(encoded.record));
      }
      done += chunk.size();
      ctx.report(done, total);
    }
    // Articles already posted for a file edited mid-upload are abandoned.
    if(reader.bytes_read() != file->size || reader.content_hash() != file->content_hash) {
      throw TransientError(file->path + " changed while uploading");
    }
    entries.push_back(std::move(entry));
    log_debug(logger_.get(), "{}: {} segment(s), strategy {}", file->path, seq, to_string(strategy));
  }
  flush_pack();

  index_->put_segments(records);
  auto version = index_->publish_merged(folder_id, std::move(entries), deleted);

  outcome.result = {
    {"folder_id", folder_id},
    {"version", version},
    {"files_uploaded", to_upload.size()},
    {"files_deleted", deleted.size()},
    {"segments", records.size()},
    {"articles", articles},
    {"bytes", total},
    {"strategies", strategies}
  };
  return outcome;
}
