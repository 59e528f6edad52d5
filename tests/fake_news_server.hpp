#pragma once

#include "connection_pool.hpp"
#include "nntp_client.hpp"
#include "transfer_errors.hpp"
#include "utils.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>

namespace usenetsync::test {

// Article store shared by every FakeConnection of one test. Articles are
// visible from every server, as after propagation; faults are injected per
// server name or per message id.
class MemoryNewsServer {
public:
  struct Article {
    std::string server;
    ArticleHeaders headers;
    std::string body;
  };

  void refuse_connections(const std::string& server_name, bool refuse = true) {
    std::lock_guard lg(m_);
    if(refuse) refused_.insert(server_name); else refused_.erase(server_name);
  }

  // The next `count` connection attempts to `server_name` are refused.
  void refuse_next_connections(const std::string& server_name, int count) {
    std::lock_guard lg(m_);
    refusals_left_[server_name] = count;
  }

  // The next `count` posts fail with a dropped connection.
  void fail_next_posts(int count) {
    std::lock_guard lg(m_);
    failing_posts_ = count;
  }

  void remove_article(const std::string& message_id) {
    std::lock_guard lg(m_);
    articles_.erase(message_id);
  }

  // Flips one byte in the middle of the stored body.
  void corrupt_article(const std::string& message_id) {
    std::lock_guard lg(m_);
    auto it = articles_.find(message_id);
    if(it == articles_.end()) return;
    auto& body = it->second.body;
    auto begin = body.find("\r\n");
    auto end = body.rfind("=yend");
    if(begin == std::string::npos || end == std::string::npos || end <= begin + 3) return;
    auto pos = begin + 2 + (end - begin - 2) / 2;
    body[pos] = body[pos] == 'x' ? 'y' : 'x';
  }

  void set_fetch_delay(std::chrono::milliseconds delay) {
    std::lock_guard lg(m_);
    fetch_delay_ = delay;
  }

  std::string store(const std::string& server_name,
                    const ArticleHeaders& headers,
                    const std::string& body) {
    std::lock_guard lg(m_);
    if(failing_posts_ > 0) {
      --failing_posts_;
      throw NntpError("connection reset during POST");
    }
    auto id = headers.message_id.empty() ? make_message_id() : headers.message_id;
    articles_[id] = Article{server_name, headers, body};
    ++posts_;
    return id;
  }

  std::string load(const std::string& message_id) {
    std::chrono::milliseconds delay{0};
    {
      std::lock_guard lg(m_);
      delay = fetch_delay_;
    }
    if(delay.count() > 0) std::this_thread::sleep_for(delay);
    std::lock_guard lg(m_);
    ++fetches_;
    auto it = articles_.find(message_id);
    if(it == articles_.end()) throw ArticleNotFound(message_id);
    return it->second.body;
  }

  bool exists(const std::string& message_id) const {
    std::lock_guard lg(m_);
    return articles_.count(message_id) != 0;
  }

  std::optional<Article> article(const std::string& message_id) const {
    std::lock_guard lg(m_);
    auto it = articles_.find(message_id);
    if(it == articles_.end()) return std::nullopt;
    return it->second;
  }

  bool refuses(const std::string& server_name) const {
    std::lock_guard lg(m_);
    return refused_.count(server_name) != 0;
  }

  bool take_refusal(const std::string& server_name) {
    std::lock_guard lg(m_);
    auto it = refusals_left_.find(server_name);
    if(it == refusals_left_.end() || it->second <= 0) return false;
    --it->second;
    return true;
  }

  void note_connect() { connects_.fetch_add(1); }

  std::size_t article_count() const {
    std::lock_guard lg(m_);
    return articles_.size();
  }
  uint64_t posts() const {
    std::lock_guard lg(m_);
    return posts_;
  }
  uint64_t fetches() const {
    std::lock_guard lg(m_);
    return fetches_;
  }
  uint64_t connects() const { return connects_.load(); }

  std::map<std::string, Article> articles() const {
    std::lock_guard lg(m_);
    return articles_;
  }

private:
  mutable std::mutex m_;
  std::map<std::string, Article> articles_;
  std::set<std::string> refused_;
  std::map<std::string, int> refusals_left_;
  int failing_posts_ = 0;
  std::chrono::milliseconds fetch_delay_{0};
  uint64_t posts_ = 0;
  uint64_t fetches_ = 0;
  std::atomic<uint64_t> connects_{0};
};

class FakeConnection : public NntpConnection {
public:
  FakeConnection(ServerDescriptor server, std::shared_ptr<MemoryNewsServer> news)
    : server_(std::move(server)), news_(std::move(news)) {}

  const ServerDescriptor& server() const override { return server_; }

  void connect() override {
    news_->note_connect();
    if(news_->refuses(server_.name()) || news_->take_refusal(server_.name())) {
      throw NntpError("connection refused by " + server_.name());
    }
    open_ = true;
  }

  bool is_open() const override { return open_; }

  void probe() override {
    if(!open_) throw NntpError("probe on closed connection");
    if(news_->refuses(server_.name())) {
      open_ = false;
      throw NntpError("probe failed on " + server_.name());
    }
  }

  std::string post(const ArticleHeaders& headers, const std::string& body) override {
    if(!open_) throw NntpError("post on closed connection");
    try {
      return news_->store(server_.name(), headers, body);
    } catch(const NntpError&) {
      open_ = false;
      throw;
    }
  }

  std::string fetch(const std::string& message_id) override {
    if(!open_) throw NntpError("fetch on closed connection");
    return news_->load(message_id);
  }

  bool stat(const std::string& message_id) override {
    if(!open_) throw NntpError("stat on closed connection");
    return news_->exists(message_id);
  }

  void quit() override { open_ = false; }

private:
  ServerDescriptor server_;
  std::shared_ptr<MemoryNewsServer> news_;
  bool open_ = false;
};

inline ConnectionFactory make_fake_factory(const std::shared_ptr<MemoryNewsServer>& news) {
  return [news](const ServerDescriptor& server) -> std::unique_ptr<NntpConnection> {
    return std::make_unique<FakeConnection>(server, news);
  };
}

inline ServerDescriptor fake_server(const std::string& host,
                                    int priority = 0,
                                    std::size_t max_connections = 4) {
  ServerDescriptor s;
  s.host = host;
  s.port = 119;
  s.priority = priority;
  s.max_connections = max_connections;
  return s;
}

} // namespace usenetsync::test
