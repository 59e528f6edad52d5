#include "folder_scanner.hpp"

#include <algorithm>
#include <stdexcept>

#include "utils.hpp"

bool is_internal_path(const std::string& relative) {
  std::filesystem::path p(relative);
  for(const auto& part : p) {
    auto name = part.string();
    if(std::find(kInternalDirNames.begin(), kInternalDirNames.end(), name) != kInternalDirNames.end()) {
      return true;
    }
  }
  return false;
}

std::vector<ScannedFile> scan_folder(const std::filesystem::path& root) {
  std::error_code ec;
  if(!std::filesystem::exists(root, ec)) {
    throw std::runtime_error("path does not exist: " + root.string());
  }

  std::vector<ScannedFile> out;
  auto add = [&](const std::filesystem::path& absolute, std::string relative) {
    ScannedFile f;
    f.path = std::move(relative);
    f.absolute = absolute;
    f.size = std::filesystem::file_size(absolute);
    f.content_hash = sha256_file_hex(absolute);
    out.push_back(std::move(f));
  };

  if(std::filesystem::is_regular_file(root, ec)) {
    add(root, root.filename().generic_string());
    return out;
  }

  for(auto it = std::filesystem::recursive_directory_iterator(root, ec);
      !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
    auto rel = it->path().lexically_relative(root).generic_string();
    if(it->is_directory()) {
      if(is_internal_path(rel)) it.disable_recursion_pending();
      continue;
    }
    if(!it->is_regular_file() || is_internal_path(rel)) continue;
    add(it->path(), rel);
  }
  if(ec) {
    throw std::runtime_error("failed to scan " + root.string() + ": " + ec.message());
  }

  std::sort(out.begin(), out.end(),
            [](const ScannedFile& a, const ScannedFile& b){ return a.path < b.path; });
  return out;
}
