#include "versioned_index.hpp"

#include <algorithm>
#include <mutex>
#include <set>

#include "json_store.hpp"
#include "transfer_errors.hpp"

void to_json(nlohmann::json& j, const FileEntry& f) {
  j = nlohmann::json{
    {"file_id", f.file_id},
    {"path", f.path},
    {"size", f.size},
    {"content_hash", f.content_hash},
    {"segment_ids", f.segment_ids}
  };
}

void from_json(const nlohmann::json& j, FileEntry& f) {
  f.file_id = j.at("file_id").get<std::string>();
  f.path = j.at("path").get<std::string>();
  f.size = j.value("size", uint64_t{0});
  f.content_hash = j.value("content_hash", std::string());
  f.segment_ids = j.value("segment_ids", std::vector<std::string>{});
}

const FileEntry* FolderVersion::find(const std::string& path) const {
  for(const auto& f : files) {
    if(f.path == path) return &f;
  }
  return nullptr;
}

void to_json(nlohmann::json& j, const FolderVersion& v) {
  j = nlohmann::json{
    {"folder_id", v.folder_id},
    {"version", v.version},
    {"files", v.files},
    {"created_at", format_timestamp(v.created_at)},
    {"total_size", v.total_size},
    {"segment_count", v.segment_count}
  };
}

void from_json(const nlohmann::json& j, FolderVersion& v) {
  v.folder_id = j.at("folder_id").get<std::string>();
  v.version = j.at("version").get<uint64_t>();
  v.files = j.value("files", std::vector<FileEntry>{});
  v.created_at = parse_timestamp(j.value("created_at", std::string()));
  v.total_size = j.value("total_size", uint64_t{0});
  v.segment_count = j.value("segment_count", uint64_t{0});
}

std::vector<SegmentRecord> ResolvedVersion::segments_for(const FileEntry& file) const {
  std::vector<SegmentRecord> out;
  out.reserve(file.segment_ids.size());
  for(const auto& id : file.segment_ids) {
    auto it = segments.find(id);
    if(it == segments.end()) {
      throw IntegrityError("index has no record for segment " + id + " of " + file.path);
    }
    out.push_back(it->second);
  }
  return out;
}

const char* to_string(ChangeKind kind) {
  switch(kind) {
    case ChangeKind::Added: return "added";
    case ChangeKind::Modified: return "modified";
    case ChangeKind::Deleted: return "deleted";
  }
  return "added";
}

VersionedIndex::VersionedIndex(std::filesystem::path snapshot_path, std::shared_ptr<Logger> logger)
  : snapshot_path_(std::move(snapshot_path)), logger_(std::move(logger)) {}

void VersionedIndex::put_segments(const std::vector<SegmentRecord>& records) {
  std::unique_lock lk(m_);
  for(const auto& r : records) {
    segments_.emplace(r.segment_id, r);
  }
  persist_locked();
}

std::optional<SegmentRecord> VersionedIndex::segment(const std::string& segment_id) const {
  std::shared_lock lk(m_);
  auto it = segments_.find(segment_id);
  if(it == segments_.end()) return std::nullopt;
  return it->second;
}

uint64_t VersionedIndex::publish_version(const std::string& folder_id, std::vector<FileEntry> files) {
  std::sort(files.begin(), files.end(),
            [](const FileEntry& a, const FileEntry& b){ return a.path < b.path; });

  auto snapshot = std::make_shared<FolderVersion>();
  snapshot->folder_id = folder_id;
  snapshot->created_at = Clock::now();

  std::unique_lock lk(m_);
  for(const auto& f : files) {
    for(const auto& id : f.segment_ids) {
      if(segments_.find(id) == segments_.end()) {
        throw IntegrityError("cannot publish " + f.path + ": unknown segment " + id);
      }
    }
    snapshot->total_size += f.size;
    snapshot->segment_count += f.segment_ids.size();
  }
  snapshot->files = std::move(files);

  auto& folder = folders_[folder_id];
  uint64_t previous = folder.versions.empty() ? 0 : folder.versions.rbegin()->first;
  snapshot->version = previous + 1;
  folder.versions.emplace(snapshot->version, snapshot);
  persist_locked();
  log_info(logger_.get(), "published {} v{} ({} files, {} bytes)",
           folder_id, snapshot->version, snapshot->files.size(), snapshot->total_size);
  return snapshot->version;
}

uint64_t VersionedIndex::publish_merged(const std::string& folder_id,
                                        std::vector<FileEntry> changed,
                                        const std::vector<std::string>& deleted) {
  std::vector<FileEntry> merged;
  {
    std::shared_lock lk(m_);
    auto it = folders_.find(folder_id);
    if(it != folders_.end() && !it->second.versions.empty()) {
      merged = it->second.versions.rbegin()->second->files;
    }
  }
  std::set<std::string> drop(deleted.begin(), deleted.end());
  for(const auto& f : changed) drop.insert(f.path);
  merged.erase(std::remove_if(merged.begin(), merged.end(),
                              [&](const FileEntry& f){ return drop.count(f.path) != 0; }),
               merged.end());
  for(auto& f : changed) merged.push_back(std::move(f));
  return publish_version(folder_id, std::move(merged));
}

FolderVersionPtr VersionedIndex::get_version(const std::string& folder_id, uint64_t version) const {
  std::shared_lock lk(m_);
  auto it = folders_.find(folder_id);
  if(it == folders_.end()) return nullptr;
  auto v = it->second.versions.find(version);
  if(v == it->second.versions.end()) return nullptr;
  return v->second;
}

std::optional<ResolvedVersion> VersionedIndex::resolve(const std::string& folder_id, uint64_t version) const {
  std::shared_lock lk(m_);
  auto it = folders_.find(folder_id);
  if(it == folders_.end()) return std::nullopt;
  auto v = it->second.versions.find(version);
  if(v == it->second.versions.end()) return std::nullopt;

  ResolvedVersion out;
  out.version = v->second;
  for(const auto& f : out.version->files) {
    for(const auto& id : f.segment_ids) {
      auto s = segments_.find(id);
      if(s != segments_.end()) out.segments.emplace(id, s->second);
    }
  }
  return out;
}

uint64_t VersionedIndex::latest_version(const std::string& folder_id) const {
  std::shared_lock lk(m_);
  auto it = folders_.find(folder_id);
  if(it == folders_.end() || it->second.versions.empty()) return 0;
  return it->second.versions.rbegin()->first;
}

std::vector<uint64_t> VersionedIndex::versions(const std::string& folder_id) const {
  std::shared_lock lk(m_);
  std::vector<uint64_t> out;
  auto it = folders_.find(folder_id);
  if(it == folders_.end()) return out;
  for(const auto& [number, v] : it->second.versions) out.push_back(number);
  return out;
}

std::vector<std::string> VersionedIndex::folders() const {
  std::shared_lock lk(m_);
  std::vector<std::string> out;
  for(const auto& [id, rec] : folders_) out.push_back(id);
  std::sort(out.begin(), out.end());
  return out;
}

std::vector<FileChange> VersionedIndex::detect_changes(const std::string& folder_id,
                                                       const std::vector<ScannedFile>& listing) const {
  FolderVersionPtr latest;
  {
    std::shared_lock lk(m_);
    auto it = folders_.find(folder_id);
    if(it != folders_.end() && !it->second.versions.empty()) {
      latest = it->second.versions.rbegin()->second;
    }
  }

  std::vector<FileChange> changes;
  std::set<std::string> seen;
  for(const auto& scanned : listing) {
    seen.insert(scanned.path);
    const FileEntry* existing = latest ? latest->find(scanned.path) : nullptr;
    if(!existing) {
      changes.push_back({scanned.path, ChangeKind::Added});
    } else if(existing->content_hash != scanned.content_hash) {
      changes.push_back({scanned.path, ChangeKind::Modified});
    }
  }
  if(latest) {
    for(const auto& f : latest->files) {
      if(seen.count(f.path) == 0) changes.push_back({f.path, ChangeKind::Deleted});
    }
  }
  return changes;
}

EncryptionKey VersionedIndex::folder_key(const std::string& folder_id) {
  {
    std::shared_lock lk(m_);
    auto it = folders_.find(folder_id);
    if(it != folders_.end() && !it->second.key.empty()) return it->second.key;
  }
  std::unique_lock lk(m_);
  auto& folder = folders_[folder_id];
  if(folder.key.empty()) {
    folder.key = SegmentCodec::generate_key();
    persist_locked();
  }
  return folder.key;
}

std::optional<EncryptionKey> VersionedIndex::find_folder_key(const std::string& folder_id) const {
  std::shared_lock lk(m_);
  auto it = folders_.find(folder_id);
  if(it == folders_.end() || it->second.key.empty()) return std::nullopt;
  return it->second.key;
}

void VersionedIndex::persist_locked() const {
  if(snapshot_path_.empty()) return;
  nlohmann::json doc;
  doc["folders"] = nlohmann::json::object();
  for(const auto& [id, rec] : folders_) {
    nlohmann::json folder;
    folder["key"] = hex_from_bytes(rec.key);
    folder["versions"] = nlohmann::json::array();
    for(const auto& [number, v] : rec.versions) folder["versions"].push_back(*v);
    doc["folders"][id] = std::move(folder);
  }
  doc["segments"] = nlohmann::json::array();
  for(const auto& [id, s] : segments_) doc["segments"].push_back(s);
  if(!write_json_atomic(snapshot_path_, doc)) {
    log_warn(logger_.get(), "index snapshot not written to {}", snapshot_path_.string());
  }
}

bool VersionedIndex::save() const {
  std::shared_lock lk(m_);
  if(snapshot_path_.empty()) return false;
  persist_locked();
  return true;
}

bool VersionedIndex::load() {
  if(snapshot_path_.empty()) return false;
  auto doc = read_json_file(snapshot_path_);
  if(!doc) return false;

  std::unique_lock lk(m_);
  try {
    folders_.clear();
    segments_.clear();
    for(const auto& s : doc->value("segments", nlohmann::json::array())) {
      auto record = s.get<SegmentRecord>();
      segments_.emplace(record.segment_id, std::move(record));
    }
    for(const auto& [id, folder] : doc->value("folders", nlohmann::json::object()).items()) {
      FolderRecord rec;
      rec.key = bytes_from_hex(folder.value("key", std::string()));
      for(const auto& v : folder.value("versions", nlohmann::json::array())) {
        auto version = std::make_shared<FolderVersion>(v.get<FolderVersion>());
        rec.versions.emplace(version->version, std::move(version));
      }
      folders_.emplace(id, std::move(rec));
    }
  } catch(const std::exception& e) {
    log_error(logger_.get(), "index snapshot {} is unreadable: {}", snapshot_path_.string(), e.what());
    folders_.clear();
    segments_.clear();
    return false;
  }
  log_info(logger_.get(), "loaded index: {} folder(s), {} segment(s)", folders_.size(), segments_.size());
  return true;
}
