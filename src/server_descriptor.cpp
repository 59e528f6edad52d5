#include "server_descriptor.hpp"

void to_json(nlohmann::json& j, const ServerDescriptor& s) {
  j = nlohmann::json{
    {"host", s.host},
    {"port", s.port},
    {"tls", s.tls},
    {"username", s.username},
    {"password", s.password},
    {"max_connections", s.max_connections},
    {"priority", s.priority},
    {"enabled", s.enabled}
  };
}

void from_json(const nlohmann::json& j, ServerDescriptor& s) {
  s.host = j.at("host").get<std::string>();
  s.tls = j.value("tls", false);
  s.port = j.value("port", static_cast<uint16_t>(s.tls ? 563 : 119));
  s.username = j.value("username", std::string());
  s.password = j.value("password", std::string());
  s.max_connections = j.value("max_connections", static_cast<std::size_t>(4));
  s.priority = j.value("priority", 0);
  s.enabled = j.value("enabled", true);
}

std::vector<ServerDescriptor> parse_server_list(const nlohmann::json& doc,
                                                std::vector<std::string>& errors) {
  std::vector<ServerDescriptor> out;
  if(doc.is_null()) return out;
  if(!doc.is_array()) {
    errors.push_back("servers must be a JSON array");
    return out;
  }
  for(std::size_t i = 0; i < doc.size(); ++i) {
    const auto& entry = doc.at(i);
    if(entry.is_object() && entry.contains("port")) {
      const auto& port = entry.at("port");
      if(!port.is_number_integer() || port.get<int64_t>() <= 0 || port.get<int64_t>() > 65535) {
        errors.push_back("server #" + std::to_string(i) + " has an invalid port");
        continue;
      }
    }
    try {
      auto server = entry.get<ServerDescriptor>();
      if(server.host.empty()) {
        errors.push_back("server #" + std::to_string(i) + " has no host");
        continue;
      }
      if(server.max_connections == 0) {
        errors.push_back("server " + server.name() + " has max_connections 0");
        continue;
      }
      out.push_back(std::move(server));
    } catch(const nlohmann::json::exception& e) {
      errors.push_back("server #" + std::to_string(i) + ": " + e.what());
    }
  }
  return out;
}
