#include "nntp_client.hpp"

#include <openssl/ssl.h>

#include <cctype>
#include <istream>
#include <sstream>

#include "transfer_errors.hpp"
#include "utils.hpp"

std::string make_message_id() {
  return "<" + random_hex(16) + "@usenetsync>";
}

std::string make_obfuscated_subject() {
  return random_hex(12);
}

std::string dot_stuff(const std::string& text) {
  std::string out;
  out.reserve(text.size() + text.size() / 64);
  bool line_start = true;
  for(char c : text) {
    if(line_start && c == '.') out.push_back('.');
    out.push_back(c);
    line_start = (c == '\n');
  }
  return out;
}

std::string dot_unstuff(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  bool line_start = true;
  for(std::size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if(line_start && c == '.' && i + 1 < text.size() && text[i + 1] == '.') {
      line_start = false;
      continue;
    }
    out.push_back(c);
    line_start = (c == '\n');
  }
  return out;
}

std::string format_article(const ArticleHeaders& headers, const std::string& body) {
  std::string out;
  out.reserve(body.size() + 256);
  out += "From: " + headers.from + "\r\n";
  out += "Newsgroups: " + headers.newsgroups + "\r\n";
  out += "Subject: " + headers.subject + "\r\n";
  out += "Message-ID: " + headers.message_id + "\r\n";
  out += "\r\n";
  for(std::size_t i = 0; i < body.size(); ++i) {
    if(body[i] == '\n' && (i == 0 || body[i - 1] != '\r')) out.push_back('\r');
    out.push_back(body[i]);
  }
  if(out.size() < 2 || out.compare(out.size() - 2, 2, "\r\n") != 0) out += "\r\n";
  return out;
}

std::string article_body(const std::string& article) {
  auto pos = article.find("\r\n\r\n");
  if(pos != std::string::npos) return article.substr(pos + 4);
  pos = article.find("\n\n");
  if(pos != std::string::npos) return article.substr(pos + 2);
  return article;
}

NntpClient::NntpClient(ServerDescriptor server, std::chrono::seconds io_timeout)
  : server_(std::move(server)),
    io_timeout_(io_timeout),
    ssl_ctx_(asio::ssl::context::tls_client) {
  ssl_ctx_.set_default_verify_paths();
}

NntpClient::~NntpClient() {
  quit();
}

NntpClient::tcp::socket& NntpClient::lowest_layer() {
  return tls_ ? tls_->next_layer() : *socket_;
}

void NntpClient::run_io() {
  io_.restart();
  io_.run_for(io_timeout_);
  if(!io_.stopped()) {
    std::error_code ignored;
    lowest_layer().close(ignored);
    io_.run();
  }
}

void NntpClient::close() {
  open_ = false;
  if(tls_ || socket_) {
    std::error_code ignored;
    lowest_layer().close(ignored);
  }
  tls_.reset();
  socket_.reset();
  read_buf_.consume(read_buf_.size());
}

void NntpClient::fail(const std::string& what, int code) {
  close();
  throw NntpError(server_.name() + ": " + what, code);
}

void NntpClient::connect() {
  close();
  capabilities_.clear();

  tcp::resolver resolver(io_);
  std::error_code ec;
  auto endpoints = resolver.resolve(server_.host, std::to_string(server_.port), ec);
  if(ec) fail("resolve failed: " + ec.message());

  if(server_.tls) {
    tls_ = std::make_unique<asio::ssl::stream<tcp::socket>>(io_, ssl_ctx_);
  } else {
    socket_ = std::make_unique<tcp::socket>(io_);
  }

  std::error_code result = asio::error::would_block;
  asio::async_connect(lowest_layer(), endpoints,
    [&](const std::error_code& e, const tcp::endpoint&){ result = e; });
  run_io();
  if(result) fail("connect failed: " + result.message());

  if(tls_) {
    tls_->set_verify_mode(asio::ssl::verify_peer);
    tls_->set_verify_callback(asio::ssl::rfc2818_verification(server_.host));
    SSL_set_tlsext_host_name(tls_->native_handle(), server_.host.c_str());
    result = asio::error::would_block;
    tls_->async_handshake(asio::ssl::stream_base::client,
      [&](const std::error_code& e){ result = e; });
    run_io();
    if(result) fail("TLS handshake failed: " + result.message());
  }
  open_ = true;

  auto greeting = read_response();
  if(greeting.code == 200) {
    posting_allowed_ = true;
  } else if(greeting.code == 201) {
    posting_allowed_ = false;
  } else {
    fail("unexpected greeting: " + greeting.text, greeting.code);
  }

  if(server_.has_credentials()) authenticate();
}

void NntpClient::authenticate() {
  auto r = command("AUTHINFO USER " + server_.username);
  if(r.code == 281) return;
  if(r.code != 381) fail("AUTHINFO USER rejected: " + r.text, r.code);
  r = command("AUTHINFO PASS " + server_.password);
  if(r.code != 281) fail("authentication failed: " + r.text, r.code);
}

void NntpClient::send_raw(const std::string& data) {
  if(!open_) fail("connection is closed");
  std::error_code result = asio::error::would_block;
  auto handler = [&](const std::error_code& e, std::size_t){ result = e; };
  if(tls_) {
    asio::async_write(*tls_, asio::buffer(data), handler);
  } else {
    asio::async_write(*socket_, asio::buffer(data), handler);
  }
  run_io();
  if(result) fail("write failed: " + result.message());
}

void NntpClient::send_line(const std::string& line) {
  send_raw(line + "\r\n");
}

std::string NntpClient::read_line() {
  if(!open_) fail("connection is closed");
  std::error_code result = asio::error::would_block;
  auto handler = [&](const std::error_code& e, std::size_t){ result = e; };
  if(tls_) {
    asio::async_read_until(*tls_, read_buf_, "\r\n", handler);
  } else {
    asio::async_read_until(*socket_, read_buf_, "\r\n", handler);
  }
  run_io();
  if(result) fail("read failed: " + result.message());
  std::istream in(&read_buf_);
  std::string line;
  std::getline(in, line);
  if(!line.empty() && line.back() == '\r') line.pop_back();
  return line;
}

NntpClient::Response NntpClient::read_response() {
  auto line = read_line();
  if(line.size() < 3 ||
     !std::isdigit(static_cast<unsigned char>(line[0])) ||
     !std::isdigit(static_cast<unsigned char>(line[1])) ||
     !std::isdigit(static_cast<unsigned char>(line[2]))) {
    fail("malformed response: " + line);
  }
  Response r;
  r.code = std::stoi(line.substr(0, 3));
  r.text = line.size() > 4 ? line.substr(4) : std::string();
  return r;
}

NntpClient::Response NntpClient::command(const std::string& line) {
  send_line(line);
  return read_response();
}

std::string NntpClient::read_multiline() {
  std::string out;
  for(;;) {
    auto line = read_line();
    if(line == ".") break;
    if(line.size() >= 2 && line[0] == '.' && line[1] == '.') line.erase(0, 1);
    out += line;
    out += "\r\n";
  }
  return out;
}

void NntpClient::probe() {
  auto r = command("CAPABILITIES");
  if(r.code == 101) {
    std::istringstream in(read_multiline());
    std::string line;
    capabilities_.clear();
    while(std::getline(in, line)) {
      if(!line.empty() && line.back() == '\r') line.pop_back();
      if(!line.empty()) capabilities_.push_back(line);
    }
    return;
  }
  r = command("DATE");
  if(r.code != 111) fail("health probe failed: " + r.text, r.code);
}

std::string NntpClient::post(const ArticleHeaders& headers, const std::string& body) {
  auto r = command("POST");
  if(r.code != 340) fail("POST refused: " + r.text, r.code);
  send_raw(dot_stuff(format_article(headers, body)) + ".\r\n");
  r = read_response();
  if(r.code != 240) fail("article rejected: " + r.text, r.code);
  return headers.message_id;
}

std::string NntpClient::fetch(const std::string& message_id) {
  auto r = command("ARTICLE " + message_id);
  if(r.code == 430) throw ArticleNotFound(message_id);
  if(r.code != 220) fail("ARTICLE failed: " + r.text, r.code);
  return article_body(read_multiline());
}

bool NntpClient::stat(const std::string& message_id) {
  auto r = command("STAT " + message_id);
  if(r.code == 223) return true;
  if(r.code == 430) return false;
  fail("STAT failed: " + r.text, r.code);
}

void NntpClient::quit() {
  if(!open_) return;
  try {
    send_line("QUIT");
    read_response();
  } catch(const NntpError&) {
    // already closed by fail()
  }
  close();
}
