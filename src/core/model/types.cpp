#include "core/model/types.hpp"

namespace gambit {

std::string_view error_code_name(ErrorCode code) {
  switch (code) {
    case ErrorCode::None:
      return "none";
    case ErrorCode::InvalidInput:
      return "invalid-input";
    case ErrorCode::InvalidPlayerSet:
      return "invalid-player-set";
    case ErrorCode::NotFound:
      return "not-found";
    case ErrorCode::UntrustedContent:
      return "untrusted-content";
    case ErrorCode::Storage:
      return "storage";
    case ErrorCode::Network:
      return "network";
    case ErrorCode::Disabled:
      return "disabled";
    case ErrorCode::Cancelled:
      return "cancelled";
    case ErrorCode::Timeout:
      return "timeout";
    case ErrorCode::Crypto:
      return "crypto";
  }
  return "none";
}

std::string_view joined_via_name(JoinedVia via) {
  switch (via) {
    case JoinedVia::Created:
      return "created";
    case JoinedVia::CreatedMulti:
      return "created_multi";
    case JoinedVia::Joined:
      return "joined";
  }
  return "created";
}

std::optional<JoinedVia> joined_via_from_name(std::string_view name) {
  if (name == "created") {
    return JoinedVia::Created;
  }
  if (name == "created_multi") {
    return JoinedVia::CreatedMulti;
  }
  if (name == "joined") {
    return JoinedVia::Joined;
  }
  return std::nullopt;
}

std::string Profile::display_label() const {
  if (display_name.has_value() && !display_name->empty()) {
    return *display_name;
  }
  if (name.has_value() && !name->empty()) {
    return *name;
  }
  return pubkey_hex.substr(0, 8) + "...";
}

std::vector<std::string> CachedRelayList::write_relays() const {
  std::vector<std::string> out;
  for (const auto& relay : relays) {
    if (relay.is_write()) {
      out.push_back(relay.url);
    }
  }
  return out;
}

std::vector<std::string> CachedRelayList::read_relays() const {
  std::vector<std::string> out;
  for (const auto& relay : relays) {
    if (relay.is_read()) {
      out.push_back(relay.url);
    }
  }
  return out;
}

}  // namespace gambit
