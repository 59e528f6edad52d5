#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "bandwidth_governor.hpp"
#include "connection_pool.hpp"
#include "log.hpp"
#include "segment_codec.hpp"
#include "sync_config.hpp"
#include "transfer_workers.hpp"
#include "versioned_index.hpp"

enum class UploadStrategy { Simple, Redundant, Optimized, Compressed };

const char* to_string(UploadStrategy s);

// Archive and media formats get redundancy without compression, text gets
// forced compression, anything that fits one segment is simple.
UploadStrategy select_strategy(const std::filesystem::path& path,
                               uint64_t size,
                               std::size_t segment_size);
CompressionMode compression_for(UploadStrategy s);
std::size_t copies_for(UploadStrategy s, std::size_t redundancy_copies);

// Posts one payload as yEnc articles, spreading copies over distinct servers
// when more than one is eligible.
class ArticlePoster {
public:
  ArticlePoster(ConnectionPool& pool, BandwidthGovernor& governor, const SyncConfig& config);

  // Message ids of the accepted articles, one per copy.
  std::vector<std::string> post(const Bytes& payload, std::size_t copies);

private:
  ConnectionPool& pool_;
  BandwidthGovernor& governor_;
  const SyncConfig& config_;
};

// Uploads the changed files of a folder and publishes the next version.
class UploadProcessor : public TransferProcessor {
public:
  UploadProcessor(const SyncConfig& config,
                  std::shared_ptr<VersionedIndex> index,
                  std::shared_ptr<ConnectionPool> pool,
                  std::shared_ptr<BandwidthGovernor> governor,
                  std::shared_ptr<Logger> logger = nullptr);

  ProcessOutcome process(const TransferItem& item, TransferContext& ctx) override;

private:
  SyncConfig config_;
  SegmentCodec codec_;
  std::shared_ptr<VersionedIndex> index_;
  std::shared_ptr<ConnectionPool> pool_;
  std::shared_ptr<BandwidthGovernor> governor_;
  std::shared_ptr<Logger> logger_;
};
