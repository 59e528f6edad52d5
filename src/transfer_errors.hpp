#pragma once

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>

// How a failed unit of work should be treated by the queue.
enum class FailureKind {
  Transient,   // network trouble; retried up to max_retry_count
  Integrity,   // checksum, decrypt or reassembly mismatch; never retried
  Exhaustion,  // every server / every redundant article exhausted
  Policy       // access denied at the publishing boundary
};

const char* to_string(FailureKind kind);
std::optional<FailureKind> failure_kind_from_string(const std::string& text);

class TransferError : public std::runtime_error {
public:
  TransferError(FailureKind kind, const std::string& what)
    : std::runtime_error(what), kind_(kind) {}

  FailureKind kind() const noexcept { return kind_; }

private:
  FailureKind kind_;
};

class TransientError : public TransferError {
public:
  explicit TransientError(const std::string& what)
    : TransferError(FailureKind::Transient, what) {}
};

// Protocol level failure on one connection. `code` is the NNTP status code if
// the server answered at all, 0 for socket errors.
class NntpError : public TransientError {
public:
  NntpError(const std::string& what, int code = 0)
    : TransientError(what), code_(code) {}

  int code() const noexcept { return code_; }

private:
  int code_;
};

// Every server is at max_connections and nothing was released in time.
class PoolTimeout : public TransientError {
public:
  explicit PoolTimeout(const std::string& what) : TransientError(what) {}
};

class IntegrityError : public TransferError {
public:
  explicit IntegrityError(const std::string& what)
    : TransferError(FailureKind::Integrity, what) {}
};

class ExhaustionError : public TransferError {
public:
  explicit ExhaustionError(const std::string& what)
    : TransferError(FailureKind::Exhaustion, what) {}
};

class NoServerAvailable : public ExhaustionError {
public:
  explicit NoServerAvailable(const std::string& what) : ExhaustionError(what) {}
};

// 430 for one message id. Only becomes an item failure once every alternate
// id of the segment has been tried.
class ArticleNotFound : public ExhaustionError {
public:
  explicit ArticleNotFound(const std::string& message_id)
    : ExhaustionError("article not found: " + message_id), message_id_(message_id) {}

  const std::string& message_id() const noexcept { return message_id_; }

private:
  std::string message_id_;
};

class AccessDenied : public TransferError {
public:
  explicit AccessDenied(const std::string& what)
    : TransferError(FailureKind::Policy, what) {}
};

// Raised by a processor that observed a stop request between segments. The
// worker leaves the item active for the recovery pass.
class TransferInterrupted : public std::runtime_error {
public:
  TransferInterrupted() : std::runtime_error("transfer interrupted by shutdown") {}
};

FailureKind classify(const std::exception& e);
