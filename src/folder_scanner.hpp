#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

struct ScannedFile {
  std::string path; // relative, '/'-separated
  std::filesystem::path absolute;
  uint64_t size = 0;
  std::string content_hash;
};

// Directory names skipped at any depth (state and staging directories).
inline const std::vector<std::string> kInternalDirNames = {".usenetsync", ".usenetsync-partial"};

bool is_internal_path(const std::string& relative);

// Regular files under `root`, sorted by path, each hashed with SHA-256.
// A single file may be passed as root; its entry then carries its file name.
// Throws std::runtime_error if root does not exist.
std::vector<ScannedFile> scan_folder(const std::filesystem::path& root);
