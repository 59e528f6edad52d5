#include "nntp_client.hpp"
#include "test_runner_utils.hpp"
#include "transfer_errors.hpp"
#include "server_descriptor.hpp"

#include <asio.hpp>

#include <atomic>
#include <iostream>
#include <map>
#include <mutex>
#include <regex>

namespace usenetsync::test {
namespace {

// Minimal blocking NNTP responder for exercising NntpClient over a real
// socket. Serves `sessions` connections one after another, then exits.
class LoopbackNntpServer {
public:
  struct Options {
    std::string greeting = "200 loopback ready";
    std::string username;
    std::string password;
    bool silent = false; // accept but never answer
    bool capabilities = true;
  };

  LoopbackNntpServer(Options options, int sessions)
    : options_(std::move(options)),
      acceptor_(io_, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)) {
    port_ = acceptor_.local_endpoint().port();
    thread_ = std::thread([this, sessions]{ run(sessions); });
  }

  ~LoopbackNntpServer() {
    release_ = true;
    if(thread_.joinable()) thread_.join();
  }

  uint16_t port() const { return port_; }

  std::string error() const {
    std::lock_guard lg(m_);
    return error_;
  }

  std::size_t stored() const {
    std::lock_guard lg(m_);
    return articles_.size();
  }

private:
  void run(int sessions) {
    try {
      for(int i = 0; i < sessions; ++i) {
        asio::ip::tcp::socket socket(io_);
        acceptor_.accept(socket);
        if(options_.silent) {
          while(!release_) std::this_thread::sleep_for(std::chrono::milliseconds(10));
          continue;
        }
        serve(socket);
      }
    } catch(const std::exception& e) {
      std::lock_guard lg(m_);
      error_ = e.what();
    }
  }

  static void write(asio::ip::tcp::socket& socket, const std::string& text) {
    asio::write(socket, asio::buffer(text));
  }

  void serve(asio::ip::tcp::socket& socket) {
    asio::streambuf buf;
    auto read_line = [&](std::string& line) {
      std::error_code ec;
      asio::read_until(socket, buf, "\r\n", ec);
      if(ec) return false;
      std::istream in(&buf);
      std::getline(in, line);
      if(!line.empty() && line.back() == '\r') line.pop_back();
      return true;
    };

    write(socket, options_.greeting + "\r\n");
    std::string line;
    bool user_ok = false;
    while(read_line(line)) {
      if(line == "QUIT") {
        write(socket, "205 bye\r\n");
        return;
      } else if(line == "CAPABILITIES") {
        if(options_.capabilities) {
          write(socket, "101 list follows\r\nVERSION 2\r\nREADER\r\nPOST\r\n.\r\n");
        } else {
          write(socket, "500 unknown command\r\n");
        }
      } else if(line == "DATE") {
        write(socket, "111 20260101000000\r\n");
      } else if(line.rfind("AUTHINFO USER ", 0) == 0) {
        user_ok = line.substr(14) == options_.username;
        write(socket, "381 password required\r\n");
      } else if(line.rfind("AUTHINFO PASS ", 0) == 0) {
        if(user_ok && line.substr(14) == options_.password) {
          write(socket, "281 authenticated\r\n");
        } else {
          write(socket, "481 authentication failed\r\n");
        }
      } else if(line == "POST") {
        write(socket, "340 send article\r\n");
        std::string article;
        std::string message_id;
        while(read_line(line) && line != ".") {
          if(line.rfind("..", 0) == 0) line.erase(0, 1);
          if(line.rfind("Message-ID: ", 0) == 0) message_id = line.substr(12);
          article += line + "\r\n";
        }
        {
          std::lock_guard lg(m_);
          articles_[message_id] = article;
        }
        write(socket, "240 article posted\r\n");
      } else if(line.rfind("ARTICLE ", 0) == 0) {
        auto id = line.substr(8);
        std::string article;
        {
          std::lock_guard lg(m_);
          auto it = articles_.find(id);
          if(it != articles_.end()) article = it->second;
        }
        if(article.empty()) {
          write(socket, "430 no such article\r\n");
        } else {
          write(socket, "220 0 " + id + "\r\n" + dot_stuff(article) + ".\r\n");
        }
      } else if(line.rfind("STAT ", 0) == 0) {
        std::lock_guard lg(m_);
        bool found = articles_.count(line.substr(5)) != 0;
        write(socket, found ? "223 0 " + line.substr(5) + "\r\n" : "430 no such article\r\n");
      } else {
        write(socket, "500 unknown command\r\n");
      }
    }
  }

  Options options_;
  asio::io_context io_;
  asio::ip::tcp::acceptor acceptor_;
  uint16_t port_ = 0;
  std::thread thread_;
  std::atomic<bool> release_{false};
  mutable std::mutex m_;
  std::map<std::string, std::string> articles_;
  std::string error_;
};

ServerDescriptor loopback(uint16_t port) {
  ServerDescriptor s;
  s.host = "127.0.0.1";
  s.port = port;
  return s;
}

bool test_dot_stuffing(TestContext&) {
  std::string text = ".leading\r\nmiddle\r\n..double\r\n.\r\nend";
  auto stuffed = dot_stuff(text);
  if(stuffed != "..leading\r\nmiddle\r\n...double\r\n..\r\nend") return false;
  return dot_unstuff(stuffed) == text;
}

bool test_article_formatting(TestContext&) {
  ArticleHeaders h;
  h.from = "poster <p@example.invalid>";
  h.newsgroups = "alt.test";
  h.subject = make_obfuscated_subject();
  h.message_id = make_message_id();
  auto article = format_article(h, "a\nb\r\nc");
  if(article.find("Message-ID: " + h.message_id + "\r\n") == std::string::npos) return false;
  if(article_body(article) != "a\r\nb\r\nc\r\n") return false;

  std::regex id_pattern("<[0-9a-f]{32}@usenetsync>");
  if(!std::regex_match(h.message_id, id_pattern)) return false;
  if(h.subject.size() != 24) return false;
  // Fresh ids every time.
  return make_message_id() != make_message_id();
}

bool test_server_list_parsing(TestContext&) {
  auto doc = nlohmann::json::parse(R"([
    {"host": "news.example.com", "port": 563, "tls": true, "username": "u", "password": "p",
     "max_connections": 8, "priority": 1},
    {"host": "backup.example.com"},
    {"port": 119},
    {"host": "bad.example.com", "port": 70000}
  ])");
  std::vector<std::string> errors;
  auto servers = parse_server_list(doc, errors);
  if(servers.size() != 2 || errors.size() != 2) return false;
  if(!servers[0].tls || servers[0].max_connections != 8 || !servers[0].has_credentials()) return false;
  if(servers[1].port != 119 || servers[1].max_connections != 4 || servers[1].has_credentials()) return false;
  return servers[0].name() == "news.example.com:563";
}

bool test_client_post_and_fetch(TestContext& ctx) {
  LoopbackNntpServer::Options opts;
  opts.username = "alice";
  opts.password = "secret";
  LoopbackNntpServer server(opts, 1);

  auto desc = loopback(server.port());
  desc.username = "alice";
  desc.password = "secret";
  NntpClient client(desc, std::chrono::seconds(5));
  client.connect();
  if(!client.is_open() || !client.posting_allowed()) return false;
  client.probe();
  if(client.capabilities().empty() || client.capabilities().front() != "VERSION 2") return false;

  ArticleHeaders h;
  h.from = "t <t@example.invalid>";
  h.newsgroups = "alt.test";
  h.subject = "s";
  h.message_id = make_message_id();
  std::string body = "line one\r\n.starts with dot\r\nlast\r\n";
  auto id = client.post(h, body);
  if(id != h.message_id) return false;
  if(!client.stat(id) || client.stat("<missing@x>")) return false;

  auto fetched = client.fetch(id);
  if(fetched != body) {
    if(ctx.verbose) std::cout << "    fetched body differs: [" << fetched << "]\n";
    return false;
  }

  bool not_found = false;
  try {
    client.fetch("<missing@x>");
  } catch(const ArticleNotFound& e) {
    not_found = e.message_id() == "<missing@x>";
  }
  if(!not_found || !client.is_open()) return false;

  client.quit();
  return !client.is_open() && server.error().empty();
}

bool test_client_probe_falls_back_to_date(TestContext&) {
  LoopbackNntpServer::Options opts;
  opts.capabilities = false;
  opts.greeting = "201 no posting";
  LoopbackNntpServer server(opts, 1);
  NntpClient client(loopback(server.port()), std::chrono::seconds(5));
  client.connect();
  if(client.posting_allowed()) return false;
  client.probe();
  client.quit();
  return client.capabilities().empty();
}

bool test_client_rejects_bad_credentials(TestContext&) {
  LoopbackNntpServer::Options opts;
  opts.username = "alice";
  opts.password = "secret";
  LoopbackNntpServer server(opts, 1);
  auto desc = loopback(server.port());
  desc.username = "alice";
  desc.password = "wrong";
  NntpClient client(desc, std::chrono::seconds(5));
  try {
    client.connect();
  } catch(const NntpError& e) {
    return e.code() == 481 && !client.is_open();
  }
  return false;
}

bool test_client_times_out_on_silent_server(TestContext&) {
  LoopbackNntpServer::Options opts;
  opts.silent = true;
  LoopbackNntpServer server(opts, 1);
  NntpClient client(loopback(server.port()), std::chrono::seconds(1));
  auto started = std::chrono::steady_clock::now();
  bool timed_out = false;
  try {
    client.connect();
  } catch(const NntpError&) {
    timed_out = true;
  }
  auto elapsed = std::chrono::steady_clock::now() - started;
  return timed_out && !client.is_open() && elapsed < std::chrono::seconds(5);
}

bool test_client_connection_refused(TestContext&) {
  uint16_t port = 0;
  {
    asio::io_context io;
    asio::ip::tcp::acceptor scout(io, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    port = scout.local_endpoint().port();
  }
  NntpClient client(loopback(port), std::chrono::seconds(2));
  try {
    client.connect();
  } catch(const NntpError& e) {
    return classify(e) == FailureKind::Transient && e.code() == 0;
  }
  return false;
}

} // namespace

void add_nntp_tests(std::vector<TestCase>& tests) {
  tests.push_back({"dot_stuffing", test_dot_stuffing});
  tests.push_back({"article_formatting", test_article_formatting});
  tests.push_back({"server_list_parsing", test_server_list_parsing});
  tests.push_back({"client_post_and_fetch", test_client_post_and_fetch});
  tests.push_back({"client_probe_falls_back_to_date", test_client_probe_falls_back_to_date});
  tests.push_back({"client_rejects_bad_credentials", test_client_rejects_bad_credentials});
  tests.push_back({"client_times_out_on_silent_server", test_client_times_out_on_silent_server});
  tests.push_back({"client_connection_refused", test_client_connection_refused});
}

} // namespace usenetsync::test
