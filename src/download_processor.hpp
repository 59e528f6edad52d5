#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "bandwidth_governor.hpp"
#include "connection_pool.hpp"
#include "log.hpp"
#include "segment_codec.hpp"
#include "share_manager.hpp"
#include "sync_config.hpp"
#include "transfer_workers.hpp"
#include "versioned_index.hpp"

// Decoded article payloads shared by the segments packed into them. Scoped
// to one download item.
class ArticleCache {
public:
  std::shared_ptr<const Bytes> find(const std::string& message_id) const;
  void put(const std::string& message_id, std::shared_ptr<const Bytes> payload);
  void erase(const std::string& message_id);

private:
  mutable std::mutex m_;
  std::unordered_map<std::string, std::shared_ptr<const Bytes>> payloads_;
};

// Fetches and verifies one segment, trying each of its article ids in turn.
class SegmentRetriever {
public:
  SegmentRetriever(const SegmentCodec& codec,
                   ConnectionPool& pool,
                   BandwidthGovernor& governor,
                   std::shared_ptr<Logger> logger = nullptr);

  // Plaintext of the segment. Throws TransientError if any id failed for
  // network reasons, IntegrityError if every reachable copy was corrupt and
  // ExhaustionError when no copy could be found at all.
  Bytes retrieve(const SegmentRecord& record, const EncryptionKey* key, ArticleCache& cache);

private:
  Bytes fetch_payload(const std::string& message_id);

  const SegmentCodec& codec_;
  ConnectionPool& pool_;
  BandwidthGovernor& governor_;
  std::shared_ptr<Logger> logger_;
};

// Rebuilds the folder version behind a share into item.destination.
class DownloadProcessor : public TransferProcessor {
public:
  DownloadProcessor(const SyncConfig& config,
                    std::shared_ptr<VersionedIndex> index,
                    std::shared_ptr<ShareManager> shares,
                    std::shared_ptr<ConnectionPool> pool,
                    std::shared_ptr<BandwidthGovernor> governor,
                    std::shared_ptr<Logger> logger = nullptr);

  ProcessOutcome process(const TransferItem& item, TransferContext& ctx) override;

private:
  void fetch_file(const FileEntry& file,
                  const ResolvedVersion& resolved,
                  const EncryptionKey* key,
                  const std::filesystem::path& root,
                  ArticleCache& cache,
                  TransferContext& ctx,
                  std::atomic<uint64_t>& done,
                  uint64_t total);

  SyncConfig config_;
  SegmentCodec codec_;
  std::shared_ptr<VersionedIndex> index_;
  std::shared_ptr<ShareManager> shares_;
  std::shared_ptr<ConnectionPool> pool_;
  std::shared_ptr<BandwidthGovernor> governor_;
  std::shared_ptr<Logger> logger_;
};
