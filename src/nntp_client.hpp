#pragma once

#include <asio.hpp>
#include <asio/ssl.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "server_descriptor.hpp"

struct ArticleHeaders {
  std::string from;
  std::string newsgroups;
  std::string subject;
  std::string message_id;
};

// "<32 hex chars@usenetsync>"; carries nothing derived from the content.
std::string make_message_id();
// Random subject line so posted articles cannot be correlated by title.
std::string make_obfuscated_subject();

// Headers, blank line, body. Line endings normalised to CRLF; no dot-stuffing.
std::string format_article(const ArticleHeaders& headers, const std::string& body);
// Everything after the first blank line of an ARTICLE response.
std::string article_body(const std::string& article);

// Adds the leading '.' required in front of body lines that start with one.
std::string dot_stuff(const std::string& text);
std::string dot_unstuff(const std::string& text);

// One logical session with a news server. The pool owns these and hands them
// out one caller at a time, so implementations need not be thread-safe.
// Every method throws NntpError on protocol or socket failure.
class NntpConnection {
public:
  virtual ~NntpConnection() = default;

  virtual const ServerDescriptor& server() const = 0;

  // Greeting plus AUTHINFO when the server has credentials.
  virtual void connect() = 0;
  virtual bool is_open() const = 0;

  // Cheap liveness check used by the pool's health cache.
  virtual void probe() = 0;

  // Returns the message id the server accepted.
  virtual std::string post(const ArticleHeaders& headers, const std::string& body) = 0;

  // Body of the article. Throws ArticleNotFound on 430.
  virtual std::string fetch(const std::string& message_id) = 0;

  // True on 223, false on 430; no body is transferred.
  virtual bool stat(const std::string& message_id) = 0;

  // Best effort; never throws.
  virtual void quit() = 0;
};

class NntpClient : public NntpConnection {
public:
  NntpClient(ServerDescriptor server, std::chrono::seconds io_timeout);
  ~NntpClient() override;

  NntpClient(const NntpClient&) = delete;
  NntpClient& operator=(const NntpClient&) = delete;

  const ServerDescriptor& server() const override { return server_; }

  void connect() override;
  bool is_open() const override { return open_; }
  void probe() override;
  std::string post(const ArticleHeaders& headers, const std::string& body) override;
  std::string fetch(const std::string& message_id) override;
  bool stat(const std::string& message_id) override;
  void quit() override;

  bool posting_allowed() const { return posting_allowed_; }
  const std::vector<std::string>& capabilities() const { return capabilities_; }

private:
  using tcp = asio::ip::tcp;

  struct Response {
    int code = 0;
    std::string text;
  };

  void authenticate();
  void send_line(const std::string& line);
  void send_raw(const std::string& data);
  std::string read_line();
  Response read_response();
  Response command(const std::string& line);
  // Lines up to the terminating ".", unstuffed, joined with CRLF.
  std::string read_multiline();
  // Runs queued async work for at most io_timeout_, closing the socket if the
  // deadline passes so the pending handler completes with operation_aborted.
  void run_io();
  tcp::socket& lowest_layer();
  void close();
  [[noreturn]] void fail(const std::string& what, int code = 0);

  ServerDescriptor server_;
  std::chrono::seconds io_timeout_;
  asio::io_context io_;
  asio::ssl::context ssl_ctx_;
  std::unique_ptr<tcp::socket> socket_;
  std::unique_ptr<asio::ssl::stream<tcp::socket>> tls_;
  asio::streambuf read_buf_;
  bool open_ = false;
  bool posting_allowed_ = false;
  std::vector<std::string> capabilities_;
};
