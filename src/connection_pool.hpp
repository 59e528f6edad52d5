#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "log.hpp"
#include "nntp_client.hpp"
#include "server_descriptor.hpp"

using ConnectionFactory = std::function<std::unique_ptr<NntpConnection>(const ServerDescriptor&)>;

// Factory producing real NntpClient sessions.
ConnectionFactory make_nntp_connection_factory(std::chrono::seconds io_timeout);

struct PoolOptions {
  std::chrono::seconds health_ttl{300};
  std::chrono::seconds cooldown{60};
  int failure_threshold = 3;
  std::chrono::milliseconds acquire_timeout{30000};
};

class ConnectionPool {
public:
  using clock = std::chrono::steady_clock;

  // Exclusive use of one connection. Hands it back on destruction; a
  // connection that is no longer open at that point is discarded and counted
  // against its server.
  class Lease {
  public:
    Lease() = default;
    Lease(Lease&& other) noexcept;
    Lease& operator=(Lease&& other) noexcept;
    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;
    ~Lease();

    NntpConnection* operator->() const { return conn_.get(); }
    NntpConnection& operator*() const { return *conn_; }
    explicit operator bool() const { return conn_ != nullptr; }

    const ServerDescriptor& server() const { return conn_->server(); }

    void count_post(std::size_t bytes);
    void count_fetch(std::size_t bytes);

    void release();

  private:
    friend class ConnectionPool;
    Lease(ConnectionPool* pool, std::size_t server_index, std::unique_ptr<NntpConnection> conn);

    ConnectionPool* pool_ = nullptr;
    std::size_t server_index_ = 0;
    std::unique_ptr<NntpConnection> conn_;
  };

  struct ServerStats {
    std::string name;
    int priority = 0;
    bool enabled = true;
    bool cooling_down = false;
    std::size_t idle = 0;
    std::size_t in_use = 0;
    uint64_t connections_created = 0;
    uint64_t connections_reused = 0;
    uint64_t connection_failures = 0;
    uint64_t probes = 0;
    uint64_t posts = 0;
    uint64_t retrievals = 0;
    uint64_t bytes_posted = 0;
    uint64_t bytes_fetched = 0;
    std::string last_error;
  };

  ConnectionPool(std::vector<ServerDescriptor> servers,
                 ConnectionFactory factory,
                 PoolOptions options,
                 std::shared_ptr<Logger> logger = nullptr);
  ~ConnectionPool();

  ConnectionPool(const ConnectionPool&) = delete;
  ConnectionPool& operator=(const ConnectionPool&) = delete;

  // Connection to the most preferred eligible server. Servers named in
  // `avoid` are skipped. Blocks while every eligible server is at
  // max_connections; throws PoolTimeout after acquire_timeout and
  // NoServerAvailable when nothing is eligible at all. Each server is tried
  // at most once per call: when every candidate failed to connect, the last
  // connection error is rethrown.
  Lease acquire(const std::set<std::string>& avoid = {});

  std::vector<ServerStats> stats() const;
  std::size_t server_count() const { return servers_.size(); }
  std::size_t enabled_server_count() const;

  // Closes idle connections and fails pending and future acquisitions.
  void shutdown();

private:
  struct ServerState {
    ServerDescriptor desc;
    std::vector<std::unique_ptr<NntpConnection>> idle;
    std::size_t in_use = 0;
    int consecutive_failures = 0;
    clock::time_point cooldown_until{};
    clock::time_point healthy_until{};
    uint64_t created = 0;
    uint64_t reused = 0;
    uint64_t failures = 0;
    uint64_t probes = 0;
    uint64_t posts = 0;
    uint64_t retrievals = 0;
    uint64_t bytes_posted = 0;
    uint64_t bytes_fetched = 0;
    std::string last_error;
  };

  bool eligible(const ServerState& s, clock::time_point now,
                const std::set<std::string>& avoid) const;
  void record_failure(ServerState& s, const std::string& reason);
  void give_back(std::size_t server_index, std::unique_ptr<NntpConnection> conn);
  void count(std::size_t server_index, bool post, std::size_t bytes);

  ConnectionFactory factory_;
  PoolOptions options_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex m_;
  std::condition_variable cv_;
  std::vector<ServerState> servers_;
  std::vector<std::size_t> order_; // indices by ascending priority
  bool shutdown_ = false;
};
