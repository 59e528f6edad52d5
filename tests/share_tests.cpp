#include "share_manager.hpp"
#include "test_runner_utils.hpp"
#include "transfer_errors.hpp"
#include "versioned_index.hpp"

#include <regex>

namespace usenetsync::test {
namespace {

// Index holding `versions` published versions of folder "docs".
std::shared_ptr<VersionedIndex> index_with_versions(int versions) {
  auto index = std::make_shared<VersionedIndex>();
  for(int i = 0; i < versions; ++i) {
    FileEntry f;
    f.file_id = random_hex(8);
    f.path = "readme.txt";
    f.size = 0;
    f.content_hash = sha256_hex(std::string());
    index->publish_version("docs", {f});
  }
  return index;
}

bool test_share_id_format(TestContext&) {
  std::regex pattern("[PR][0-9A-F]{16}_[0-9A-F]{4}");
  auto pub = ShareManager::make_share_id(ShareType::Public);
  auto priv = ShareManager::make_share_id(ShareType::Private);
  if(!std::regex_match(pub, pattern) || !std::regex_match(priv, pattern)) return false;
  if(pub[0] != 'P' || priv[0] != 'R') return false;
  if(ShareManager::parse_share_id(pub) != ShareType::Public) return false;
  if(ShareManager::parse_share_id(priv) != ShareType::Private) return false;

  auto tampered = pub;
  tampered[5] = tampered[5] == 'A' ? 'B' : 'A';
  return !ShareManager::parse_share_id(tampered) &&
         !ShareManager::parse_share_id("short") &&
         ShareManager::make_share_id(ShareType::Public) != pub;
}

bool test_public_share_access(TestContext&) {
  ShareManager shares(index_with_versions(1));
  auto share = shares.create_share("docs", 1, ShareType::Public);
  if(!share.is_active || share.access_string.rfind("usenetsync:1:" + share.share_id + ":", 0) != 0) return false;
  if(!shares.verify_access(share.share_id, "") || !shares.verify_access(share.share_id, "anyone")) return false;
  if(shares.verify_access("P0000000000000000_0000", "anyone")) return false;

  auto redeemed = shares.redeem(share.access_string, "someone");
  if(!redeemed || redeemed->share_id != share.share_id) return false;
  return !shares.redeem("usenetsync:1:bogus", "someone");
}

bool test_private_share_membership(TestContext&) {
  ShareManager shares(index_with_versions(1));
  auto share = shares.create_share("docs", 1, ShareType::Private, {"alice"});
  if(!shares.verify_access(share.share_id, "alice")) return false;
  if(shares.verify_access(share.share_id, "bob")) return false;

  if(!shares.add_authorized_user(share.share_id, "bob")) return false;
  if(!shares.verify_access(share.share_id, "bob")) return false;
  if(!shares.remove_authorized_user(share.share_id, "alice")) return false;
  if(shares.verify_access(share.share_id, "alice")) return false;
  if(shares.remove_authorized_user(share.share_id, "alice")) return false;

  bool denied = false;
  try {
    shares.require_access(share.share_id, "mallory");
  } catch(const AccessDenied& e) {
    denied = classify(e) == FailureKind::Policy;
  }
  if(!denied) return false;

  // Membership changes only apply to private shares.
  auto pub = shares.create_share("docs", 1, ShareType::Public);
  return !shares.add_authorized_user(pub.share_id, "carol");
}

bool test_share_requires_published_version(TestContext&) {
  ShareManager shares(index_with_versions(2));
  shares.create_share("docs", 2, ShareType::Public);
  try {
    shares.create_share("docs", 3, ShareType::Public);
  } catch(const std::invalid_argument&) {
    try {
      shares.create_share("other", 1, ShareType::Public);
    } catch(const std::invalid_argument&) {
      return true;
    }
  }
  return false;
}

bool test_share_revocation_and_history(TestContext&) {
  ShareManager shares(index_with_versions(2));
  auto first = shares.create_share("docs", 1, ShareType::Public);
  auto second = shares.create_share("docs", 2, ShareType::Private, {"alice"});
  if(!shares.revoke(first.share_id)) return false;
  if(shares.verify_access(first.share_id, "anyone")) return false;
  if(!shares.revoke(first.share_id) || shares.revoke("unknown")) return false;

  auto revoked = shares.get(first.share_id);
  if(!revoked || revoked->is_active || !revoked->revoked_at) return false;

  auto history = shares.get_share_access_history("docs");
  if(history.size() != 2) return false;
  if(history[0].share_id != first.share_id || history[1].share_id != second.share_id) return false;
  if(history[0].is_active || !history[1].is_active) return false;

  auto log = shares.access_log(first.share_id);
  return !log.empty() && !log.back().granted && log.back().reason == "share revoked";
}

bool test_share_expiry(TestContext&) {
  ShareManager shares(index_with_versions(1));
  auto expired = shares.create_share("docs", 1, ShareType::Public, {}, Clock::now() - std::chrono::seconds(1));
  auto open = shares.create_share("docs", 1, ShareType::Public, {}, Clock::now() + std::chrono::hours(1));
  if(shares.verify_access(expired.share_id, "x")) return false;
  if(!shares.verify_access(open.share_id, "x")) return false;
  auto log = shares.access_log(expired.share_id);
  return log.size() == 1 && log.front().reason == "share expired";
}

bool test_share_persistence(TestContext&) {
  ScratchDir dir("shares");
  auto index = index_with_versions(1);
  std::string id;
  {
    ShareManager shares(index, dir / "shares.json");
    auto share = shares.create_share("docs", 1, ShareType::Private, {"alice", "bob"});
    id = share.share_id;
    shares.verify_access(id, "alice");
    shares.revoke(id);
  }
  ShareManager loaded(index, dir / "shares.json");
  if(!loaded.load()) return false;
  auto share = loaded.get(id);
  if(!share || share->is_active || share->authorized_user_ids.size() != 2) return false;
  if(loaded.access_log(id).size() != 1) return false;
  return loaded.get_share_access_history("docs").size() == 1;
}

} // namespace

void add_share_tests(std::vector<TestCase>& tests) {
  tests.push_back({"share_id_format", test_share_id_format});
  tests.push_back({"public_share_access", test_public_share_access});
  tests.push_back({"private_share_membership", test_private_share_membership});
  tests.push_back({"share_requires_published_version", test_share_requires_published_version});
  tests.push_back({"share_revocation_and_history", test_share_revocation_and_history});
  tests.push_back({"share_expiry", test_share_expiry});
  tests.push_back({"share_persistence", test_share_persistence});
}

} // namespace usenetsync::test
