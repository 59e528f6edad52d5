#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "folder_scanner.hpp"
#include "log.hpp"
#include "segment_codec.hpp"
#include "utils.hpp"

struct FileEntry {
  std::string file_id;
  std::string path;
  uint64_t size = 0;
  std::string content_hash;
  std::vector<std::string> segment_ids; // reassembly order
};

void to_json(nlohmann::json& j, const FileEntry& f);
void from_json(const nlohmann::json& j, FileEntry& f);

struct FolderVersion {
  std::string folder_id;
  uint64_t version = 0;
  std::vector<FileEntry> files;
  Timestamp created_at{};
  uint64_t total_size = 0;
  uint64_t segment_count = 0;

  const FileEntry* find(const std::string& path) const;
};

void to_json(nlohmann::json& j, const FolderVersion& v);
void from_json(const nlohmann::json& j, FolderVersion& v);

using FolderVersionPtr = std::shared_ptr<const FolderVersion>;

struct ResolvedVersion {
  FolderVersionPtr version;
  std::unordered_map<std::string, SegmentRecord> segments; // by segment_id

  // Records of one file in reassembly order. Throws IntegrityError if the
  // index is missing one of them.
  std::vector<SegmentRecord> segments_for(const FileEntry& file) const;
};

enum class ChangeKind { Added, Modified, Deleted };
const char* to_string(ChangeKind kind);

struct FileChange {
  std::string path;
  ChangeKind kind = ChangeKind::Added;
};

// Append-only map of folder versions to files to segments. Published versions
// are immutable shared snapshots, so readers holding one are never affected
// by later publishes.
class VersionedIndex {
public:
  explicit VersionedIndex(std::filesystem::path snapshot_path = {},
                          std::shared_ptr<Logger> logger = nullptr);

  // Records are keyed by segment_id; an existing record is never replaced.
  void put_segments(const std::vector<SegmentRecord>& records);
  std::optional<SegmentRecord> segment(const std::string& segment_id) const;

  // Always allocates latest_version + 1. Throws IntegrityError if an entry
  // names a segment the index does not hold.
  uint64_t publish_version(const std::string& folder_id, std::vector<FileEntry> files);

  // Publishes latest's entries with `changed` replacing same-path entries and
  // `deleted` paths dropped.
  uint64_t publish_merged(const std::string& folder_id,
                          std::vector<FileEntry> changed,
                          const std::vector<std::string>& deleted);

  FolderVersionPtr get_version(const std::string& folder_id, uint64_t version) const;
  std::optional<ResolvedVersion> resolve(const std::string& folder_id, uint64_t version) const;
  uint64_t latest_version(const std::string& folder_id) const; // 0 when none
  std::vector<uint64_t> versions(const std::string& folder_id) const;
  std::vector<std::string> folders() const;

  std::vector<FileChange> detect_changes(const std::string& folder_id,
                                         const std::vector<ScannedFile>& listing) const;

  // Per-folder symmetric key; created on first use.
  EncryptionKey folder_key(const std::string& folder_id);
  std::optional<EncryptionKey> find_folder_key(const std::string& folder_id) const;

  bool load();
  bool save() const;

private:
  struct FolderRecord {
    std::map<uint64_t, FolderVersionPtr> versions;
    EncryptionKey key;
  };

  void persist_locked() const;

  std::filesystem::path snapshot_path_;
  std::shared_ptr<Logger> logger_;

  mutable std::shared_mutex m_;
  std::unordered_map<std::string, FolderRecord> folders_;
  std::unordered_map<std::string, SegmentRecord> segments_;
};
