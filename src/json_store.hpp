#pragma once
#include <filesystem>
#include <optional>

#include <nlohmann/json.hpp>

// Writes `doc` next to `path` and renames it into place so readers never see
// a half-written snapshot. Returns false (and logs) on I/O failure.
bool write_json_atomic(const std::filesystem::path& path, const nlohmann::json& doc);

// nullopt when the file does not exist or does not parse.
std::optional<nlohmann::json> read_json_file(const std::filesystem::path& path);
