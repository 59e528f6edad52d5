#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"
#include "utils.hpp"

class VersionedIndex;

enum class ShareType { Public, Private };

const char* to_string(ShareType t);
std::optional<ShareType> share_type_from_string(const std::string& text);

struct Share {
  std::string share_id;
  std::string folder_id;
  uint64_t version = 0;
  ShareType share_type = ShareType::Public;
  std::string access_string;
  std::set<std::string> authorized_user_ids;
  Timestamp created_at{};
  std::optional<Timestamp> expires_at;
  bool is_active = true;
  std::optional<Timestamp> revoked_at;
};

void to_json(nlohmann::json& j, const Share& s);
void from_json(const nlohmann::json& j, Share& s);

struct AccessEvent {
  std::string share_id;
  std::string user_id;
  bool granted = false;
  std::string reason;
  Timestamp at{};
};

void to_json(nlohmann::json& j, const AccessEvent& e);
void from_json(const nlohmann::json& j, AccessEvent& e);

// Grants over published folder versions. Shares are never deleted; revoking
// only deactivates them, and every access decision is appended to a log.
class ShareManager {
public:
  ShareManager(std::shared_ptr<VersionedIndex> index,
               std::filesystem::path snapshot_path = {},
               std::shared_ptr<Logger> logger = nullptr);

  // Throws std::invalid_argument if the folder version was never published.
  Share create_share(const std::string& folder_id,
                     uint64_t version,
                     ShareType share_type,
                     const std::vector<std::string>& authorized_user_ids = {},
                     std::optional<Timestamp> expires_at = std::nullopt);

  bool verify_access(const std::string& share_id, const std::string& user_id);
  // verify_access that throws AccessDenied instead of returning false.
  Share require_access(const std::string& share_id, const std::string& user_id);

  // Resolves a bearer access string to its share, subject to verify_access.
  std::optional<Share> redeem(const std::string& access_string, const std::string& user_id);

  bool revoke(const std::string& share_id);
  bool add_authorized_user(const std::string& share_id, const std::string& user_id);
  bool remove_authorized_user(const std::string& share_id, const std::string& user_id);

  std::optional<Share> get(const std::string& share_id) const;
  // Every share ever created for the folder, revoked ones included, oldest first.
  std::vector<Share> get_share_access_history(const std::string& folder_id) const;
  std::vector<AccessEvent> access_log(const std::string& share_id) const;

  static std::string make_share_id(ShareType share_type);
  // Type encoded in a well formed id, nullopt if the format or checksum is wrong.
  static std::optional<ShareType> parse_share_id(const std::string& share_id);

  bool load();
  bool save() const;

private:
  // Decision plus reason; caller holds the lock.
  bool check_locked(const Share& share, const std::string& user_id, std::string& reason) const;
  void record_locked(const std::string& share_id, const std::string& user_id,
                     bool granted, const std::string& reason);
  void persist_locked() const;

  std::shared_ptr<VersionedIndex> index_;
  std::filesystem::path snapshot_path_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex m_;
  std::unordered_map<std::string, Share> shares_;
  std::vector<std::string> creation_order_;
  std::vector<AccessEvent> access_log_;
};
