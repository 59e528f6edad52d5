#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// Connection target. Read-only once the pool is built; the pool keys its live
// connections by name().
struct ServerDescriptor {
  std::string host;
  uint16_t port = 119;
  bool tls = false;
  std::string username;
  std::string password;
  std::size_t max_connections = 4;
  int priority = 0; // lower is preferred
  bool enabled = true;

  std::string name() const { return host + ":" + std::to_string(port); }
  bool has_credentials() const { return !username.empty(); }
};

void to_json(nlohmann::json& j, const ServerDescriptor& s);
void from_json(const nlohmann::json& j, ServerDescriptor& s);

// Parses the `servers` setting. Entries that fail validation are skipped and
// described in `errors`.
std::vector<ServerDescriptor> parse_server_list(const nlohmann::json& doc,
                                                std::vector<std::string>& errors);
