#include "core/relay/relay_transport.hpp"

#include <algorithm>

namespace gambit {
namespace {

bool contains(const std::vector<std::string>& values, std::string_view value) {
  return std::find(values.begin(), values.end(), value) != values.end();
}

bool any_tag_matches(const NetworkEvent& event, std::string_view name, const std::vector<std::string>& wanted) {
  if (wanted.empty()) {
    return true;
  }
  return std::ranges::any_of(event.tag_values(name),
                             [&](const std::string& value) { return contains(wanted, value); });
}

bool same_replaceable_slot(const NetworkEvent& lhs, const NetworkEvent& rhs) {
  if (lhs.pubkey != rhs.pubkey || lhs.kind != rhs.kind) {
    return false;
  }
  if (is_addressable_kind(lhs.kind)) {
    return lhs.d_tag().value_or("") == rhs.d_tag().value_or("");
  }
  return is_replaceable_kind(lhs.kind);
}

}  // namespace

bool RelayFilter::matches(const NetworkEvent& event) const {
  if (!ids.empty() && !contains(ids, event.id)) {
    return false;
  }
  if (!authors.empty() && !contains(authors, event.pubkey)) {
    return false;
  }
  if (!kinds.empty() && std::ranges::find(kinds, event.kind) == kinds.end()) {
    return false;
  }
  if (since.has_value() && event.created_at < *since) {
    return false;
  }
  return any_tag_matches(event, "e", e_tags) && any_tag_matches(event, "d", d_tags) &&
         any_tag_matches(event, "p", p_tags);
}

Result LoopbackRelayTransport::publish(std::string_view relay_url, const NetworkEvent& event) {
  std::lock_guard lock(mutex_);
  ++publish_count_;
  if (offline_locked(relay_url)) {
    return Result::failure(ErrorCode::Network, "Relay unreachable: " + std::string{relay_url});
  }

  const Result verified = verify_event(event);
  if (!verified.ok) {
    return Result::failure(ErrorCode::InvalidInput, "Relay rejected event: " + verified.message);
  }

  auto& stored = relays_[std::string{relay_url}];
  if (std::ranges::any_of(stored, [&](const NetworkEvent& existing) { return existing.id == event.id; })) {
    return Result::success("duplicate: already have this event", event.id);
  }

  if (is_replaceable_kind(event.kind) || is_addressable_kind(event.kind)) {
    const auto current = std::ranges::find_if(
        stored, [&](const NetworkEvent& existing) { return same_replaceable_slot(existing, event); });
    if (current != stored.end()) {
      if (current->created_at > event.created_at) {
        return Result::success("duplicate: have a newer replaceable event", current->id);
      }
      stored.erase(current);
    }
  }

  stored.push_back(event);
  return Result::success("Event stored.", event.id);
}

Result LoopbackRelayTransport::query(std::string_view relay_url, const RelayFilter& filter,
                                     std::vector<NetworkEvent>& out) {
  std::lock_guard lock(mutex_);
  if (offline_locked(relay_url)) {
    return Result::failure(ErrorCode::Network, "Relay unreachable: " + std::string{relay_url});
  }

  out.clear();
  const auto it = relays_.find(relay_url);
  if (it == relays_.end()) {
    return Result::success("Relay has no events.");
  }

  for (const auto& event : it->second) {
    if (filter.matches(event)) {
      out.push_back(event);
    }
  }
  std::ranges::stable_sort(out, [](const NetworkEvent& lhs, const NetworkEvent& rhs) {
    return lhs.created_at > rhs.created_at;
  });
  if (filter.limit.has_value() && out.size() > *filter.limit) {
    out.resize(*filter.limit);
  }
  return Result::success("Query complete.");
}

void LoopbackRelayTransport::set_relay_offline(std::string_view relay_url, bool offline) {
  std::lock_guard lock(mutex_);
  if (offline) {
    offline_relays_.insert(std::string{relay_url});
  } else {
    offline_relays_.erase(std::string{relay_url});
  }
}

void LoopbackRelayTransport::set_all_offline(bool offline) {
  std::lock_guard lock(mutex_);
  all_offline_ = offline;
}

void LoopbackRelayTransport::inject(std::string_view relay_url, const NetworkEvent& event) {
  std::lock_guard lock(mutex_);
  relays_[std::string{relay_url}].push_back(event);
}

std::size_t LoopbackRelayTransport::event_count(std::string_view relay_url) const {
  std::lock_guard lock(mutex_);
  const auto it = relays_.find(relay_url);
  return it == relays_.end() ? 0U : it->second.size();
}

std::size_t LoopbackRelayTransport::publish_count() const {
  std::lock_guard lock(mutex_);
  return publish_count_;
}

bool LoopbackRelayTransport::offline_locked(std::string_view relay_url) const {
  return all_offline_ || offline_relays_.contains(std::string{relay_url});
}

}  // namespace gambit
