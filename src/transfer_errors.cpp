#include "transfer_errors.hpp"

const char* to_string(FailureKind kind) {
  switch(kind) {
    case FailureKind::Transient: return "transient";
    case FailureKind::Integrity: return "integrity";
    case FailureKind::Exhaustion: return "exhaustion";
    case FailureKind::Policy: return "policy";
  }
  return "transient";
}

std::optional<FailureKind> failure_kind_from_string(const std::string& text) {
  if(text == "transient") return FailureKind::Transient;
  if(text == "integrity") return FailureKind::Integrity;
  if(text == "exhaustion") return FailureKind::Exhaustion;
  if(text == "policy") return FailureKind::Policy;
  return std::nullopt;
}

FailureKind classify(const std::exception& e) {
  if(const auto* typed = dynamic_cast<const TransferError*>(&e)) {
    return typed->kind();
  }
  // I/O and library errors we did not anticipate stay bounded by retries.
  return FailureKind::Transient;
}
