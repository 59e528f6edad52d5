#include "share_manager.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "json_store.hpp"
#include "transfer_errors.hpp"
#include "versioned_index.hpp"

namespace {

std::string upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
  return s;
}

std::string share_checksum(const std::string& body) {
  return upper(sha256_hex(body).substr(0, 4));
}

void put_optional_time(nlohmann::json& j, const char* key, const std::optional<Timestamp>& tp) {
  if(tp) j[key] = format_timestamp(*tp);
}

std::optional<Timestamp> get_optional_time(const nlohmann::json& j, const char* key) {
  if(!j.contains(key) || !j.at(key).is_string()) return std::nullopt;
  return parse_timestamp(j.at(key).get<std::string>());
}

} // namespace

const char* to_string(ShareType t) {
  switch(t) {
    case ShareType::Public: return "public";
    case ShareType::Private: return "private";
  }
  return "public";
}

std::optional<ShareType> share_type_from_string(const std::string& text) {
  if(text == "public") return ShareType::Public;
  if(text == "private") return ShareType::Private;
  return std::nullopt;
}

void to_json(nlohmann::json& j, const Share& s) {
  j = nlohmann::json{
    {"share_id", s.share_id},
    {"folder_id", s.folder_id},
    {"version", s.version},
    {"share_type", to_string(s.share_type)},
    {"access_string", s.access_string},
    {"authorized_user_ids", s.authorized_user_ids},
    {"created_at", format_timestamp(s.created_at)},
    {"is_active", s.is_active}
  };
  put_optional_time(j, "expires_at", s.expires_at);
  put_optional_time(j, "revoked_at", s.revoked_at);
}

void from_json(const nlohmann::json& j, Share& s) {
  s.share_id = j.at("share_id").get<std::string>();
  s.folder_id = j.at("folder_id").get<std::string>();
  s.version = j.at("version").get<uint64_t>();
  s.share_type = share_type_from_string(j.value("share_type", std::string("public")))
                   .value_or(ShareType::Private);
  s.access_string = j.value("access_string", std::string());
  s.authorized_user_ids = j.value("authorized_user_ids", std::set<std::string>{});
  s.created_at = parse_timestamp(j.value("created_at", std::string()));
  s.is_active = j.value("is_active", false);
  s.expires_at = get_optional_time(j, "expires_at");
  s.revoked_at = get_optional_time(j, "revoked_at");
}

void to_json(nlohmann::json& j, const AccessEvent& e) {
  j = nlohmann::json{
    {"share_id", e.share_id},
    {"user_id", e.user_id},
    {"granted", e.granted},
    {"reason", e.reason},
    {"at", format_timestamp(e.at)}
  };
}

void from_json(const nlohmann::json& j, AccessEvent& e) {
  e.share_id = j.at("share_id").get<std::string>();
  e.user_id = j.value("user_id", std::string());
  e.granted = j.value("granted", false);
  e.reason = j.value("reason", std::string());
  e.at = parse_timestamp(j.value("at", std::string()));
}

ShareManager::ShareManager(std::shared_ptr<VersionedIndex> index,
                           std::filesystem::path snapshot_path,
                           std::shared_ptr<Logger> logger)
  : index_(std::move(index)),
    snapshot_path_(std::move(snapshot_path)),
    logger_(std::move(logger)) {}

std::string ShareManager::make_share_id(ShareType share_type) {
  std::string body = share_type == ShareType::Public ? "P" : "R";
  body += upper(random_hex(8));
  return body + "_" + share_checksum(body);
}

std::optional<ShareType> ShareManager::parse_share_id(const std::string& share_id) {
  if(share_id.size() != 22 || share_id[17] != '_') return std::nullopt;
  std::optional<ShareType> type;
  if(share_id[0] == 'P') type = ShareType::Public;
  else if(share_id[0] == 'R') type = ShareType::Private;
  else return std::nullopt;
  auto body = share_id.substr(0, 17);
  for(std::size_t i = 1; i < body.size(); ++i) {
    if(!std::isxdigit(static_cast<unsigned char>(body[i]))) return std::nullopt;
  }
  if(share_id.substr(18) != share_checksum(body)) return std::nullopt;
  return type;
}

Share ShareManager::create_share(const std::string& folder_id,
                                 uint64_t version,
                                 ShareType share_type,
                                 const std::vector<std::string>& authorized_user_ids,
                                 std::optional<Timestamp> expires_at) {
  if(!index_ || !index_->get_version(folder_id, version)) {
    throw std::invalid_argument("folder " + folder_id + " has no version " + std::to_string(version));
  }
  Share share;
  share.share_id = make_share_id(share_type);
  share.folder_id = folder_id;
  share.version = version;
  share.share_type = share_type;
  share.access_string = "usenetsync:1:" + share.share_id + ":" + random_hex(16);
  if(share_type == ShareType::Private) {
    share.authorized_user_ids.insert(authorized_user_ids.begin(), authorized_user_ids.end());
  }
  share.created_at = Clock::now();
  share.expires_at = expires_at;
  share.is_active = true;

  std::lock_guard lg(m_);
  shares_.emplace(share.share_id, share);
  creation_order_.push_back(share.share_id);
  persist_locked();
  log_info(logger_.get(), "created {} share {} for {} v{}",
           to_string(share_type), share.share_id, folder_id, version);
  return share;
}

bool ShareManager::check_locked(const Share& share, const std::string& user_id, std::string& reason) const {
  if(!share.is_active) {
    reason = "share revoked";
    return false;
  }
  if(share.expires_at && Clock::now() > *share.expires_at) {
    reason = "share expired";
    return false;
  }
  switch(share.share_type) {
    case ShareType::Public:
      reason = "public share";
      return true;
    case ShareType::Private:
      if(share.authorized_user_ids.count(user_id) != 0) {
        reason = "authorized user";
        return true;
      }
      reason = "user not authorized";
      return false;
  }
  reason = "unknown share type";
  return false;
}

void ShareManager::record_locked(const std::string& share_id, const std::string& user_id,
                                 bool granted, const std::string& reason) {
  AccessEvent e;
  e.share_id = share_id;
  e.user_id = user_id;
  e.granted = granted;
  e.reason = reason;
  e.at = Clock::now();
  access_log_.push_back(std::move(e));
  if(!granted) {
    log_warn(logger_.get(), "access to {} denied for '{}': {}", share_id, user_id, reason);
  }
}

bool ShareManager::verify_access(const std::string& share_id, const std::string& user_id) {
  std::lock_guard lg(m_);
  std::string reason = "unknown share";
  bool granted = false;
  auto it = shares_.find(share_id);
  if(it != shares_.end()) granted = check_locked(it->second, user_id, reason);
  record_locked(share_id, user_id, granted, reason);
  persist_locked();
  return granted;
}

Share ShareManager::require_access(const std::string& share_id, const std::string& user_id) {
  std::lock_guard lg(m_);
  std::string reason = "unknown share";
  auto it = shares_.find(share_id);
  bool granted = it != shares_.end() && check_locked(it->second, user_id, reason);
  record_locked(share_id, user_id, granted, reason);
  persist_locked();
  if(!granted) throw AccessDenied("access to share " + share_id + " denied: " + reason);
  return it->second;
}

std::optional<Share> ShareManager::redeem(const std::string& access_string, const std::string& user_id) {
  std::string share_id;
  {
    std::lock_guard lg(m_);
    for(const auto& [id, share] : shares_) {
      if(share.access_string == access_string) {
        share_id = id;
        break;
      }
    }
    if(share_id.empty()) {
      record_locked(std::string(), user_id, false, "unknown access string");
      persist_locked();
      return std::nullopt;
    }
  }
  if(!verify_access(share_id, user_id)) return std::nullopt;
  return get(share_id);
}

bool ShareManager::revoke(const std::string& share_id) {
  std::lock_guard lg(m_);
  auto it = shares_.find(share_id);
  if(it == shares_.end()) return false;
  if(it->second.is_active) {
    it->second.is_active = false;
    it->second.revoked_at = Clock::now();
    persist_locked();
    log_info(logger_.get(), "revoked share {}", share_id);
  }
  return true;
}

bool ShareManager::add_authorized_user(const std::string& share_id, const std::string& user_id) {
  std::lock_guard lg(m_);
  auto it = shares_.find(share_id);
  if(it == shares_.end() || it->second.share_type != ShareType::Private) return false;
  it->second.authorized_user_ids.insert(user_id);
  persist_locked();
  return true;
}

bool ShareManager::remove_authorized_user(const std::string& share_id, const std::string& user_id) {
  std::lock_guard lg(m_);
  auto it = shares_.find(share_id);
  if(it == shares_.end() || it->second.share_type != ShareType::Private) return false;
  bool removed = it->second.authorized_user_ids.erase(user_id) != 0;
  if(removed) persist_locked();
  return removed;
}

std::optional<Share> ShareManager::get(const std::string& share_id) const {
  std::lock_guard lg(m_);
  auto it = shares_.find(share_id);
  if(it == shares_.end()) return std::nullopt;
  return it->second;
}

std::vector<Share> ShareManager::get_share_access_history(const std::string& folder_id) const {
  std::lock_guard lg(m_);
  std::vector<Share> out;
  for(const auto& id : creation_order_) {
    const auto& share = shares_.at(id);
    if(share.folder_id == folder_id) out.push_back(share);
  }
  return out;
}

std::vector<AccessEvent> ShareManager::access_log(const std::string& share_id) const {
  std::lock_guard lg(m_);
  std::vector<AccessEvent> out;
  for(const auto& e : access_log_) {
    if(e.share_id == share_id) out.push_back(e);
  }
  return out;
}

void ShareManager::persist_locked() const {
  if(snapshot_path_.empty()) return;
  nlohmann::json doc;
  doc["shares"] = nlohmann::json::array();
  for(const auto& id : creation_order_) doc["shares"].push_back(shares_.at(id));
  doc["access_log"] = access_log_;
  if(!write_json_atomic(snapshot_path_, doc)) {
    log_warn(logger_.get(), "share snapshot not written to {}", snapshot_path_.string());
  }
}

bool ShareManager::save() const {
  std::lock_guard lg(m_);
  if(snapshot_path_.empty()) return false;
  persist_locked();
  return true;
}

bool ShareManager::load() {
  if(snapshot_path_.empty()) return false;
  auto doc = read_json_file(snapshot_path_);
  if(!doc) return false;
  std::lock_guard lg(m_);
  try {
    shares_.clear();
    creation_order_.clear();
    for(const auto& entry : doc->value("shares", nlohmann::json::array())) {
      auto share = entry.get<Share>();
      creation_order_.push_back(share.share_id);
      shares_.emplace(share.share_id, std::move(share));
    }
    access_log_ = doc->value("access_log", std::vector<AccessEvent>{});
  } catch(const std::exception& e) {
    log_error(logger_.get(), "share snapshot {} is unreadable: {}", snapshot_path_.string(), e.what());
    shares_.clear();
    creation_order_.clear();
    access_log_.clear();
    return false;
  }
  return true;
}
