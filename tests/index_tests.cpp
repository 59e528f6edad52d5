#include "folder_scanner.hpp"
#include "json_store.hpp"
#include "segment_codec.hpp"
#include "test_runner_utils.hpp"
#include "transfer_errors.hpp"
#include "versioned_index.hpp"

#include <algorithm>

namespace usenetsync::test {
namespace {

SegmentRecord make_record(const std::string& seed) {
  SegmentRecord r;
  r.segment_id = sha256_hex(seed);
  r.file_id = "file-" + seed;
  r.raw_size = seed.size();
  r.packed_size = seed.size();
  r.checksum = sha256_hex(seed);
  r.article_message_ids = {"<" + seed + "@test>"};
  return r;
}

FileEntry make_entry(const std::string& path, const std::vector<SegmentRecord>& records) {
  FileEntry f;
  f.file_id = random_hex(8);
  f.path = path;
  for(const auto& r : records) {
    f.size += r.raw_size;
    f.segment_ids.push_back(r.segment_id);
  }
  f.content_hash = sha256_hex(path + std::to_string(f.size));
  return f;
}

bool test_index_versions_are_immutable(TestContext&) {
  VersionedIndex index;
  auto r1 = make_record("one");
  auto r2 = make_record("two");
  index.put_segments({r1, r2});

  auto v1 = index.publish_version("folder", {make_entry("b.txt", {r2}), make_entry("a.txt", {r1})});
  if(v1 != 1) return false;
  auto held = index.get_version("folder", 1);
  if(!held || held->files.size() != 2 || held->files[0].path != "a.txt") return false;
  if(held->total_size != 6 || held->segment_count != 2) return false;

  auto r3 = make_record("three");
  index.put_segments({r3});
  auto v2 = index.publish_merged("folder", {make_entry("a.txt", {r3})}, {"b.txt"});
  if(v2 != 2 || index.latest_version("folder") != 2) return false;

  // Version 1 is unchanged, both for the held pointer and a fresh lookup.
  auto again = index.get_version("folder", 1);
  if(held->files.size() != 2 || again->files.size() != 2) return false;
  if(again->files[0].segment_ids != std::vector<std::string>{r1.segment_id}) return false;

  auto latest = index.get_version("folder", 2);
  if(latest->files.size() != 1 || latest->files[0].segment_ids.front() != r3.segment_id) return false;
  return index.versions("folder") == std::vector<uint64_t>{1, 2};
}

bool test_index_rejects_unknown_segments(TestContext&) {
  VersionedIndex index;
  auto r1 = make_record("known");
  index.put_segments({r1});
  try {
    index.publish_version("folder", {make_entry("x", {r1, make_record("unknown")})});
  } catch(const IntegrityError&) {
    return index.latest_version("folder") == 0 && index.versions("folder").empty();
  }
  return false;
}

bool test_index_first_record_wins(TestContext&) {
  VersionedIndex index;
  auto original = make_record("dup");
  auto later = original;
  later.article_message_ids = {"<other@test>"};
  index.put_segments({original});
  index.put_segments({later});
  auto stored = index.segment(original.segment_id);
  return stored && stored->article_message_ids == original.article_message_ids &&
         !index.segment("missing");
}

bool test_index_resolve(TestContext&) {
  VersionedIndex index;
  auto r1 = make_record("p1");
  auto r2 = make_record("p2");
  index.put_segments({r1, r2});
  index.publish_version("f", {make_entry("file", {r2, r1})});
  auto resolved = index.resolve("f", 1);
  if(!resolved || resolved->segments.size() != 2) return false;
  auto ordered = resolved->segments_for(resolved->version->files.front());
  if(ordered.size() != 2 || ordered[0].segment_id != r2.segment_id) return false;

  FileEntry ghost;
  ghost.path = "ghost";
  ghost.segment_ids = {"not-there"};
  bool threw = false;
  try {
    resolved->segments_for(ghost);
  } catch(const IntegrityError&) {
    threw = true;
  }
  return threw && !index.resolve("f", 7) && !index.resolve("nope", 1);
}

bool test_index_detects_changes(TestContext&) {
  VersionedIndex index;
  auto r = make_record("c");
  index.put_segments({r});
  auto keep = make_entry("keep", {r});
  auto edit = make_entry("edit", {r});
  auto gone = make_entry("gone", {r});
  index.publish_version("f", {keep, edit, gone});

  std::vector<ScannedFile> listing(3);
  listing[0].path = "keep";
  listing[0].content_hash = keep.content_hash;
  listing[1].path = "edit";
  listing[1].content_hash = "different";
  listing[2].path = "new";
  listing[2].content_hash = "n";
  auto changes = index.detect_changes("f", listing);

  auto kind_of = [&](const std::string& path) -> std::optional<ChangeKind> {
    for(const auto& c : changes) if(c.path == path) return c.kind;
    return std::nullopt;
  };
  if(changes.size() != 3) return false;
  if(kind_of("keep")) return false;
  if(kind_of("edit") != ChangeKind::Modified) return false;
  if(kind_of("new") != ChangeKind::Added) return false;
  if(kind_of("gone") != ChangeKind::Deleted) return false;

  // Unknown folder: everything is new.
  return index.detect_changes("fresh", listing).size() == 3;
}

bool test_index_persists(TestContext&) {
  ScratchDir dir("index");
  auto path = dir / "index.json";
  EncryptionKey key;
  {
    VersionedIndex index(path);
    auto r = make_record("persist");
    index.put_segments({r});
    index.publish_version("f", {make_entry("a", {r})});
    key = index.folder_key("f");
    if(key.size() != SegmentCodec::kKeySize || index.folder_key("f") != key) return false;
  }
  VersionedIndex loaded(path);
  if(!loaded.load()) return false;
  auto found = loaded.find_folder_key("f");
  auto v = loaded.get_version("f", 1);
  if(!found || *found != key || !v || v->files.size() != 1) return false;
  if(!loaded.segment(sha256_hex(std::string("persist")))) return false;
  if(loaded.find_folder_key("other")) return false;

  write_file(path, std::string("{ not json"));
  VersionedIndex broken(path);
  return !broken.load() && broken.folders().empty();
}

bool test_folder_scanner(TestContext&) {
  ScratchDir dir("scan");
  write_file(dir / "b.txt", std::string("bee"));
  write_file(dir / "sub/a.bin", std::string("a"));
  write_file(dir / "empty.dat", std::string());
  write_file(dir / ".usenetsync/queue.json", std::string("{}"));
  write_file(dir / "sub/.usenetsync-partial/x.part", std::string("partial"));

  auto files = scan_folder(dir.path());
  std::vector<std::string> paths;
  for(const auto& f : files) paths.push_back(f.path);
  std::vector<std::string> expected = {"b.txt", "empty.dat", "sub/a.bin"};
  if(paths != expected) return false;
  if(files[0].size != 3 || files[0].content_hash != sha256_hex(std::string("bee"))) return false;
  if(files[1].size != 0 || files[1].content_hash != sha256_hex(std::string())) return false;

  auto single = scan_folder(dir / "b.txt");
  if(single.size() != 1 || single[0].path != "b.txt") return false;

  if(!is_internal_path(".usenetsync/x") || !is_internal_path("a/.usenetsync-partial/y")) return false;
  if(is_internal_path("a/usenetsync/y")) return false;

  try {
    scan_folder(dir / "missing");
  } catch(const std::runtime_error&) {
    return true;
  }
  return false;
}

bool test_json_store_atomic(TestContext&) {
  ScratchDir dir("store");
  auto path = dir / "nested/doc.json";
  if(!write_json_atomic(path, {{"a", 1}})) return false;
  if(!write_json_atomic(path, {{"a", 2}})) return false;
  auto doc = read_json_file(path);
  if(!doc || (*doc)["a"] != 2) return false;
  if(std::filesystem::exists(path.string() + ".tmp")) return false;
  return !read_json_file(dir / "absent.json");
}

} // namespace

void add_index_tests(std::vector<TestCase>& tests) {
  tests.push_back({"index_versions_are_immutable", test_index_versions_are_immutable});
  tests.push_back({"index_rejects_unknown_segments", test_index_rejects_unknown_segments});
  tests.push_back({"index_first_record_wins", test_index_first_record_wins});
  tests.push_back({"index_resolve", test_index_resolve});
  tests.push_back({"index_detects_changes", test_index_detects_changes});
  tests.push_back({"index_persists", test_index_persists});
  tests.push_back({"folder_scanner", test_folder_scanner});
  tests.push_back({"json_store_atomic", test_json_store_atomic});
}

} // namespace usenetsync::test
