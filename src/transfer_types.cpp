#include "transfer_types.hpp"

const char* to_string(Direction d) {
  switch(d) {
    case Direction::Upload: return "upload";
    case Direction::Download: return "download";
  }
  return "upload";
}

const char* to_string(EntityType t) {
  switch(t) {
    case EntityType::File: return "file";
    case EntityType::Folder: return "folder";
  }
  return "folder";
}

const char* to_string(TransferState s) {
  switch(s) {
    case TransferState::Queued: return "queued";
    case TransferState::Active: return "active";
    case TransferState::Completed: return "completed";
    case TransferState::Failed: return "failed";
    case TransferState::Cancelled: return "cancelled";
  }
  return "queued";
}

std::optional<Direction> direction_from_string(const std::string& text) {
  if(text == "upload") return Direction::Upload;
  if(text == "download") return Direction::Download;
  return std::nullopt;
}

std::optional<EntityType> entity_type_from_string(const std::string& text) {
  if(text == "file") return EntityType::File;
  if(text == "folder") return EntityType::Folder;
  return std::nullopt;
}

std::optional<TransferState> transfer_state_from_string(const std::string& text) {
  if(text == "queued") return TransferState::Queued;
  if(text == "active") return TransferState::Active;
  if(text == "completed") return TransferState::Completed;
  if(text == "failed") return TransferState::Failed;
  if(text == "cancelled") return TransferState::Cancelled;
  return std::nullopt;
}

namespace {

void put_time(nlohmann::json& j, const char* key, Timestamp tp) {
  if(tp.time_since_epoch().count() != 0) j[key] = format_timestamp(tp);
}

Timestamp get_time(const nlohmann::json& j, const char* key) {
  if(!j.contains(key) || !j.at(key).is_string()) return Timestamp{};
  return parse_timestamp(j.at(key).get<std::string>());
}

} // namespace

void to_json(nlohmann::json& j, const TransferItem& item) {
  j = nlohmann::json{
    {"queue_id", item.queue_id},
    {"entity_id", item.entity_id},
    {"entity_type", to_string(item.entity_type)},
    {"direction", to_string(item.direction)},
    {"state", to_string(item.state)},
    {"priority", item.priority},
    {"seq", item.seq},
    {"retry_count", item.retry_count},
    {"bytes_done", item.bytes_done},
    {"bytes_total", item.bytes_total},
    {"source_path", item.source_path},
    {"destination", item.destination},
    {"user_id", item.user_id},
    {"access_string", item.access_string},
    {"error", item.error},
    {"result", item.result}
  };
  if(item.failure_kind) j["failure_kind"] = to_string(*item.failure_kind);
  put_time(j, "created_at", item.created_at);
  put_time(j, "started_at", item.started_at);
  put_time(j, "finished_at", item.finished_at);
}

void from_json(const nlohmann::json& j, TransferItem& item) {
  item.queue_id = j.at("queue_id").get<std::string>();
  item.entity_id = j.value("entity_id", std::string());
  item.entity_type = entity_type_from_string(j.value("entity_type", std::string("folder")))
                       .value_or(EntityType::Folder);
  item.direction = direction_from_string(j.value("direction", std::string("upload")))
                     .value_or(Direction::Upload);
  item.state = transfer_state_from_string(j.value("state", std::string("queued")))
                 .value_or(TransferState::Queued);
  item.priority = j.value("priority", 5);
  item.seq = j.value("seq", uint64_t{0});
  item.retry_count = j.value("retry_count", 0);
  item.bytes_done = j.value("bytes_done", uint64_t{0});
  item.bytes_total = j.value("bytes_total", uint64_t{0});
  item.source_path = j.value("source_path", std::string());
  item.destination = j.value("destination", std::string());
  item.user_id = j.value("user_id", std::string());
  item.access_string = j.value("access_string", std::string());
  item.error = j.value("error", std::string());
  item.failure_kind.reset();
  if(j.contains("failure_kind")) {
    item.failure_kind = failure_kind_from_string(j.at("failure_kind").get<std::string>());
  }
  item.created_at = get_time(j, "created_at");
  item.started_at = get_time(j, "started_at");
  item.finished_at = get_time(j, "finished_at");
  item.result = j.value("result", nlohmann::json::object());
}
