#include "connection_pool.hpp"

#include <algorithm>
#include <exception>

#include "transfer_errors.hpp"

ConnectionFactory make_nntp_connection_factory(std::chrono::seconds io_timeout) {
  return [io_timeout](const ServerDescriptor& server) -> std::unique_ptr<NntpConnection> {
    return std::make_unique<NntpClient>(server, io_timeout);
  };
}

ConnectionPool::Lease::Lease(ConnectionPool* pool, std::size_t server_index,
                             std::unique_ptr<NntpConnection> conn)
  : pool_(pool), server_index_(server_index), conn_(std::move(conn)) {}

ConnectionPool::Lease::Lease(Lease&& other) noexcept
  : pool_(other.pool_), server_index_(other.server_index_), conn_(std::move(other.conn_)) {
  other.pool_ = nullptr;
}

ConnectionPool::Lease& ConnectionPool::Lease::operator=(Lease&& other) noexcept {
  if(this != &other) {
    release();
    pool_ = other.pool_;
    server_index_ = other.server_index_;
    conn_ = std::move(other.conn_);
    other.pool_ = nullptr;
  }
  return *this;
}

ConnectionPool::Lease::~Lease() {
  release();
}

void ConnectionPool::Lease::count_post(std::size_t bytes) {
  if(pool_) pool_->count(server_index_, true, bytes);
}

void ConnectionPool::Lease::count_fetch(std::size_t bytes) {
  if(pool_) pool_->count(server_index_, false, bytes);
}

void ConnectionPool::Lease::release() {
  if(pool_ && conn_) {
    pool_->give_back(server_index_, std::move(conn_));
  }
  pool_ = nullptr;
  conn_.reset();
}

ConnectionPool::ConnectionPool(std::vector<ServerDescriptor> servers,
                               ConnectionFactory factory,
                               PoolOptions options,
                               std::shared_ptr<Logger> logger)
  : factory_(std::move(factory)),
    options_(options),
    logger_(std::move(logger)) {
  servers_.reserve(servers.size());
  for(auto& desc : servers) {
    ServerState state;
    state.desc = std::move(desc);
    servers_.push_back(std::move(state));
  }
  order_.resize(servers_.size());
  for(std::size_t i = 0; i < order_.size(); ++i) order_[i] = i;
  std::stable_sort(order_.begin(), order_.end(), [this](std::size_t a, std::size_t b) {
    return servers_[a].desc.priority < servers_[b].desc.priority;
  });
}

ConnectionPool::~ConnectionPool() {
  shutdown();
}

void ConnectionPool::shutdown() {
  std::vector<std::unique_ptr<NntpConnection>> closing;
  {
    std::lock_guard lg(m_);
    shutdown_ = true;
    for(auto& s : servers_) {
      for(auto& conn : s.idle) closing.push_back(std::move(conn));
      s.idle.clear();
    }
  }
  cv_.notify_all();
  for(auto& conn : closing) conn->quit();
}

std::size_t ConnectionPool::enabled_server_count() const {
  return static_cast<std::size_t>(std::count_if(servers_.begin(), servers_.end(),
    [](const ServerState& s){ return s.desc.enabled; }));
}

bool ConnectionPool::eligible(const ServerState& s, clock::time_point now,
                              const std::set<std::string>& avoid) const {
  if(!s.desc.enabled) return false;
  if(now < s.cooldown_until) return false;
  return avoid.find(s.desc.name()) == avoid.end();
}

void ConnectionPool::record_failure(ServerState& s, const std::string& reason) {
  s.failures += 1;
  s.consecutive_failures += 1;
  s.last_error = reason;
  s.healthy_until = {};
  if(s.consecutive_failures >= options_.failure_threshold) {
    s.cooldown_until = clock::now() + options_.cooldown;
    s.consecutive_failures = 0;
    log_warn(logger_.get(), "server {} marked unhealthy for {}s: {}",
             s.desc.name(), options_.cooldown.count(), reason);
  } else {
    log_debug(logger_.get(), "connection to {} failed ({}/{}): {}",
              s.desc.name(), s.consecutive_failures, options_.failure_threshold, reason);
  }
}

ConnectionPool::Lease ConnectionPool::acquire(const std::set<std::string>& avoid) {
  auto deadline = clock::now() + options_.acquire_timeout;
  // A server that failed to connect or probe is not dialled twice by one
  // call; its failure count grows across acquisitions instead.
  std::set<std::string> skip = avoid;
  std::exception_ptr last_failure;
  std::unique_lock lk(m_);
  for(;;) {
    if(shutdown_) throw NoServerAvailable("connection pool is shut down");

    auto now = clock::now();
    bool any_eligible = false;
    std::size_t pick = servers_.size();
    for(auto idx : order_) {
      const auto& s = servers_[idx];
      if(!eligible(s, now, skip)) continue;
      any_eligible = true;
      if(!s.idle.empty() || s.in_use < s.desc.max_connections) {
        pick = idx;
        break;
      }
    }

    if(pick == servers_.size()) {
      if(!any_eligible) {
        if(last_failure) std::rethrow_exception(last_failure);
        throw NoServerAvailable("no eligible news server (" + std::to_string(servers_.size()) +
                                " configured)");
      }
      if(cv_.wait_until(lk, deadline) == std::cv_status::timeout && clock::now() >= deadline) {
        throw PoolTimeout("timed out waiting for a free connection");
      }
      continue;
    }

    auto& s = servers_[pick];
    std::unique_ptr<NntpConnection> conn;
    if(!s.idle.empty()) {
      conn = std::move(s.idle.back());
      s.idle.pop_back();
      s.reused += 1;
    }
    s.in_use += 1;
    bool need_probe = now >= s.healthy_until;
    bool fresh = !conn;
    ServerDescriptor desc = s.desc;
    lk.unlock();

    try {
      if(fresh) {
        conn = factory_(desc);
        conn->connect();
      }
      if(need_probe) conn->probe();
    } catch(const TransientError& e) {
      conn.reset();
      lk.lock();
      auto& failed = servers_[pick];
      failed.in_use -= 1;
      record_failure(failed, e.what());
      skip.insert(desc.name());
      last_failure = std::current_exception();
      cv_.notify_all();
      if(clock::now() >= deadline) {
        throw PoolTimeout("timed out connecting to " + desc.name() + ": " + e.what());
      }
      continue;
    }

    lk.lock();
    auto& ok = servers_[pick];
    if(fresh) {
      ok.created += 1;
      log_debug(logger_.get(), "opened connection to {} ({} in use)", desc.name(), ok.in_use);
    }
    if(need_probe) {
      ok.probes += 1;
      ok.healthy_until = clock::now() + options_.health_ttl;
    }
    return Lease(this, pick, std::move(conn));
  }
}

void ConnectionPool::give_back(std::size_t server_index, std::unique_ptr<NntpConnection> conn) {
  std::unique_ptr<NntpConnection> discard;
  {
    std::lock_guard lg(m_);
    auto& s = servers_[server_index];
    s.in_use -= 1;
    if(conn->is_open() && !shutdown_) {
      s.consecutive_failures = 0;
      s.idle.push_back(std::move(conn));
    } else {
      if(!conn->is_open()) record_failure(s, "connection lost during use");
      discard = std::move(conn);
    }
  }
  cv_.notify_all();
  if(discard) discard->quit();
}

void ConnectionPool::count(std::size_t server_index, bool post, std::size_t bytes) {
  std::lock_guard lg(m_);
  auto& s = servers_[server_index];
  if(post) {
    s.posts += 1;
    s.bytes_posted += bytes;
  } else {
    s.retrievals += 1;
    s.bytes_fetched += bytes;
  }
}

std::vector<ConnectionPool::ServerStats> ConnectionPool::stats() const {
  std::lock_guard lg(m_);
  auto now = clock::now();
  std::vector<ServerStats> out;
  out.reserve(servers_.size());
  for(auto idx : order_) {
    const auto& s = servers_[idx];
    ServerStats st;
    st.name = s.desc.name();
    st.priority = s.desc.priority;
    st.enabled = s.desc.enabled;
    st.cooling_down = now < s.cooldown_until;
    st.idle = s.idle.size();
    st.in_use = s.in_use;
    st.connections_created = s.created;
    st.connections_reused = s.reused;
    st.connection_failures = s.failures;
    st.probes = s.probes;
    st.posts = s.posts;
    st.retrievals = s.retrievals;
    st.bytes_posted = s.bytes_posted;
    st.bytes_fetched = s.bytes_fetched;
    st.last_error = s.last_error;
    out.push_back(std::move(st));
  }
  return out;
}
