#include "json_store.hpp"

#include <fstream>

#include "log.hpp"

bool write_json_atomic(const std::filesystem::path& path, const nlohmann::json& doc) {
  std::error_code ec;
  if(path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);
  auto staging = path;
  staging += ".tmp";
  {
    std::ofstream out(staging, std::ios::trunc);
    if(!out) {
      log_error(nullptr, "Unable to write {}", staging.string());
      return false;
    }
    out << doc.dump(2);
    if(!out) {
      log_error(nullptr, "Short write to {}", staging.string());
      return false;
    }
  }
  std::filesystem::rename(staging, path, ec);
  if(ec) {
    log_error(nullptr, "Failed to move {} into place: {}", path.string(), ec.message());
    std::filesystem::remove(staging, ec);
    return false;
  }
  return true;
}

std::optional<nlohmann::json> read_json_file(const std::filesystem::path& path) {
  std::ifstream in(path);
  if(!in) return std::nullopt;
  try {
    nlohmann::json doc;
    in >> doc;
    return doc;
  } catch(const nlohmann::json::exception& e) {
    log_error(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return std::nullopt;
  }
}
