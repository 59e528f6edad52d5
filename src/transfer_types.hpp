#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "transfer_errors.hpp"
#include "utils.hpp"

enum class Direction { Upload, Download };
enum class EntityType { File, Folder };
enum class TransferState { Queued, Active, Completed, Failed, Cancelled };

const char* to_string(Direction d);
const char* to_string(EntityType t);
const char* to_string(TransferState s);
std::optional<Direction> direction_from_string(const std::string& text);
std::optional<EntityType> entity_type_from_string(const std::string& text);
std::optional<TransferState> transfer_state_from_string(const std::string& text);

inline bool is_terminal(TransferState s) {
  switch(s) {
    case TransferState::Completed:
    case TransferState::Failed:
    case TransferState::Cancelled:
      return true;
    case TransferState::Queued:
    case TransferState::Active:
      return false;
  }
  return false;
}

// One unit of queued work. Uploads carry the folder id in entity_id and the
// local path in source_path; downloads carry the share id in entity_id.
struct TransferItem {
  std::string queue_id;
  std::string entity_id;
  EntityType entity_type = EntityType::Folder;
  Direction direction = Direction::Upload;
  TransferState state = TransferState::Queued;
  int priority = 5; // lower is served first
  uint64_t seq = 0;
  int retry_count = 0;
  uint64_t bytes_done = 0;
  uint64_t bytes_total = 0;
  std::string source_path;
  std::string destination;
  std::string user_id;
  std::string access_string;
  std::string worker;
  std::string error;
  std::optional<FailureKind> failure_kind;
  Timestamp created_at{};
  Timestamp started_at{};
  Timestamp finished_at{};
  nlohmann::json result = nlohmann::json::object();

  double percent() const {
    if(bytes_total == 0) return state == TransferState::Completed ? 100.0 : 0.0;
    return 100.0 * static_cast<double>(bytes_done) / static_cast<double>(bytes_total);
  }
};

void to_json(nlohmann::json& j, const TransferItem& item);
void from_json(const nlohmann::json& j, TransferItem& item);

// Snapshot handed to progress pollers.
struct TransferProgress {
  std::string queue_id;
  TransferState state = TransferState::Queued;
  uint64_t bytes_done = 0;
  uint64_t bytes_total = 0;
  double percent = 0.0;
  int retry_count = 0;
  std::string error;
  std::optional<FailureKind> failure_kind;
};
