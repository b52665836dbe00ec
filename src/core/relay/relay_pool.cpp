#include "core/relay/relay_pool.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>

#include "core/util/canonical.hpp"
#include "core/util/log.hpp"

namespace gambit {
namespace {

constexpr std::string_view kLogComponent = "relay";

bool is_comment_or_empty(std::string_view line) {
  return line.empty() || line.front() == '#';
}

std::vector<std::string> dedupe(std::vector<std::string> urls) {
  std::vector<std::string> out;
  for (auto& url : urls) {
    std::string normalized = RelayPool::normalize_url(url);
    if (!normalized.empty() && std::find(out.begin(), out.end(), normalized) == out.end()) {
      out.push_back(std::move(normalized));
    }
  }
  return out;
}

}  // namespace

RelayPool::RelayPool(std::shared_ptr<IRelayTransport> transport) : transport_(std::move(transport)) {}

std::string RelayPool::normalize_url(std::string_view url) {
  std::string normalized = util::lowercase_copy(util::trim_copy(url));
  if (!normalized.starts_with("wss://") && !normalized.starts_with("ws://")) {
    return {};
  }
  if (std::ranges::any_of(normalized, [](char c) {
        const auto byte = static_cast<unsigned char>(c);
        return byte <= 0x20 || byte == 0x7f || c == ',' || c == '|';
      })) {
    return {};
  }
  while (normalized.ends_with('/')) {
    normalized.pop_back();
  }
  if (normalized == "wss:" || normalized == "ws:") {
    return {};
  }
  return normalized;
}

Result RelayPool::configure(const std::vector<std::string>& publish_relays,
                            const std::vector<std::string>& read_relays) {
  std::lock_guard lock(mutex_);
  relays_.clear();
  const std::vector<std::string> writes = dedupe(publish_relays);
  const std::vector<std::string> reads = dedupe(read_relays);
  for (const auto& url : writes) {
    const bool also_read = std::find(reads.begin(), reads.end(), url) != reads.end();
    relays_.push_back({url, also_read ? "" : "write"});
  }
  for (const auto& url : reads) {
    if (std::find(writes.begin(), writes.end(), url) == writes.end()) {
      relays_.push_back({url, "read"});
    }
  }
  sort_relays_locked();
  return Result::success("Relay pool configured.");
}

Result RelayPool::load_relays_dat(std::string_view path) {
  std::lock_guard lock(mutex_);
  relays_dat_path_ = std::string{path};

  std::ifstream in(std::string{path});
  if (!in) {
    return Result::success("Relays file not found yet; it will be created after first save.");
  }

  std::string line;
  while (std::getline(in, line)) {
    const std::string trimmed = util::trim_copy(line);
    if (is_comment_or_empty(trimmed)) {
      continue;
    }

    const std::size_t space = trimmed.find_first_of(" \t");
    const std::string url = normalize_url(trimmed.substr(0, space));
    const std::string marker =
        space == std::string::npos ? std::string{} : util::trim_copy(std::string_view{trimmed}.substr(space));
    if (url.empty() || !valid_marker(marker)) {
      util::log_warn(kLogComponent, "Skipping malformed relays.dat line: " + trimmed);
      continue;
    }
    relays_.push_back({url, marker});
  }

  sort_relays_locked();
  return Result::success("Loaded relays.dat entries.");
}

Result RelayPool::save_relays_dat(std::string_view path) const {
  if (path.empty()) {
    return Result::failure(ErrorCode::InvalidInput, "save_relays_dat failed: empty path.");
  }

  const std::filesystem::path file_path{std::string{path}};
  std::error_code ec;
  if (file_path.has_parent_path()) {
    std::filesystem::create_directories(file_path.parent_path(), ec);
    if (ec) {
      return Result::failure(ErrorCode::Storage, "Unable to create relays.dat directory: " + ec.message());
    }
  }

  std::ofstream out(file_path, std::ios::out | std::ios::trunc);
  if (!out) {
    return Result::failure(ErrorCode::Storage, "Unable to write relays.dat file.");
  }

  out << "# gambit relays.dat\n";
  out << "# one relay per line: <url> [read|write]\n";
  std::lock_guard lock(mutex_);
  for (const auto& relay : relays_) {
    out << relay.url;
    if (!relay.marker.empty()) {
      out << ' ' << relay.marker;
    }
    out << '\n';
  }

  if (!out.good()) {
    return Result::failure(ErrorCode::Storage, "Failed writing relays.dat file.");
  }
  return Result::success("Saved relays.dat file.");
}

Result RelayPool::add_relay(std::string_view url, std::string_view marker) {
  const std::string normalized = normalize_url(url);
  if (normalized.empty()) {
    return Result::failure(ErrorCode::InvalidInput, "Relay URL must start with wss:// or ws://.");
  }
  if (!valid_marker(marker)) {
    return Result::failure(ErrorCode::InvalidInput, "Relay marker must be empty, read or write.");
  }

  std::lock_guard lock(mutex_);
  relays_.push_back({normalized, std::string{marker}});
  sort_relays_locked();
  return Result::success("Relay added.");
}

Result RelayPool::remove_relay(std::string_view url) {
  const std::string normalized = normalize_url(url);
  std::lock_guard lock(mutex_);
  const auto removed = std::erase_if(relays_, [&](const RelayEntry& entry) { return entry.url == normalized; });
  if (removed == 0) {
    return Result::failure(ErrorCode::NotFound, "Relay is not configured.");
  }
  return Result::success("Relay removed.");
}

std::vector<RelayEntry> RelayPool::relays() const {
  std::lock_guard lock(mutex_);
  return relays_;
}

std::vector<std::string> RelayPool::write_relays() const {
  std::lock_guard lock(mutex_);
  std::vector<std::string> urls;
  for (const auto& relay : relays_) {
    if (relay.is_write()) {
      urls.push_back(relay.url);
    }
  }
  return urls;
}

std::vector<std::string> RelayPool::read_relays() const {
  std::lock_guard lock(mutex_);
  std::vector<std::string> urls;
  for (const auto& relay : relays_) {
    if (relay.is_read()) {
      urls.push_back(relay.url);
    }
  }
  return urls;
}

Result RelayPool::publish(const NetworkEvent& event) {
  return publish_to(write_relays(), event);
}

Result RelayPool::publish_to(const std::vector<std::string>& relay_urls, const NetworkEvent& event) {
  if (event.id.empty()) {
    return Result::failure(ErrorCode::InvalidInput, "Refusing to publish an unsigned event.");
  }
  const std::vector<std::string> targets = dedupe(relay_urls);
  if (targets.empty()) {
    return Result::failure(ErrorCode::Network, "No relays configured for publishing.");
  }

  {
    std::lock_guard lock(mutex_);
    ++publish_attempts_;
  }

  std::size_t accepted = 0;
  std::string last_error;
  for (const auto& url : targets) {
    const Result sent = transport_->publish(url, event);
    if (sent.ok) {
      ++accepted;
    } else {
      last_error = sent.message;
      util::log_debug(kLogComponent, "Publish to " + url + " failed: " + sent.message);
    }
  }

  if (accepted == 0) {
    return Result::failure(ErrorCode::Network, "No relay accepted event " + event.id + ": " + last_error);
  }

  std::lock_guard lock(mutex_);
  remember_seen_locked(event.id);
  return Result::success("Published to " + std::to_string(accepted) + " of " + std::to_string(targets.size()) +
                             " relays.",
                         event.id);
}

Result RelayPool::query(const RelayFilter& filter, std::vector<NetworkEvent>& out) {
  return query_from(read_relays(), filter, out);
}

Result RelayPool::query_from(const std::vector<std::string>& relay_urls, const RelayFilter& filter,
                             std::vector<NetworkEvent>& out) {
  out.clear();
  const std::vector<std::string> targets = dedupe(relay_urls);
  if (targets.empty()) {
    return Result::failure(ErrorCode::Network, "No relays configured for reading.");
  }

  std::size_t answered = 0;
  std::unordered_set<std::string> ids;
  std::size_t rejected = 0;
  for (const auto& url : targets) {
    std::vector<NetworkEvent> events;
    const Result fetched = transport_->query(url, filter, events);
    if (!fetched.ok) {
      util::log_debug(kLogComponent, "Query to " + url + " failed: " + fetched.message);
      continue;
    }
    ++answered;

    for (auto& event : events) {
      if (ids.contains(event.id)) {
        continue;
      }
      const Result verified = verify_event(event);
      if (!verified.ok) {
        ++rejected;
        util::log_warn(kLogComponent, "Discarding event from " + url + ": " + verified.message);
        continue;
      }
      ids.insert(event.id);
      out.push_back(std::move(event));
    }
  }

  {
    std::lock_guard lock(mutex_);
    rejected_event_count_ += rejected;
    for (const auto& id : ids) {
      remember_seen_locked(id);
    }
  }

  if (answered == 0) {
    return Result::failure(ErrorCode::Network, "No relay answered the query.");
  }

  std::ranges::stable_sort(out, [](const NetworkEvent& lhs, const NetworkEvent& rhs) {
    return lhs.created_at > rhs.created_at;
  });
  if (filter.limit.has_value() && out.size() > *filter.limit) {
    out.resize(*filter.limit);
  }
  return Result::success("Query answered by " + std::to_string(answered) + " relays.");
}

Result RelayPool::fetch_event(std::string_view event_id, const std::vector<std::string>& relay_hints,
                              NetworkEvent& out) {
  std::vector<std::string> targets = relay_hints;
  const std::vector<std::string> reads = read_relays();
  targets.insert(targets.end(), reads.begin(), reads.end());

  RelayFilter filter;
  filter.ids = {std::string{event_id}};
  filter.limit = 1;

  std::vector<NetworkEvent> events;
  const Result fetched = query_from(targets, filter, events);
  if (!fetched.ok) {
    return fetched;
  }
  if (events.empty()) {
    return Result::failure(ErrorCode::NotFound, "Event " + std::string{event_id} + " was not found on any relay.");
  }

  out = std::move(events.front());
  return Result::success("Event fetched.", out.id);
}

void RelayPool::remember_seen_locked(const std::string& event_id) {
  if (!seen_event_ids_.insert(event_id).second) {
    return;
  }
  seen_order_.push_back(event_id);
  while (seen_order_.size() > kMaxSeenEvents) {
    seen_event_ids_.erase(seen_order_.front());
    seen_order_.pop_front();
  }
}

bool RelayPool::valid_marker(std::string_view marker) {
  return marker.empty() || marker == "read" || marker == "write";
}

bool RelayPool::seen(std::string_view event_id) const {
  std::lock_guard lock(mutex_);
  return seen_event_ids_.contains(std::string{event_id});
}

RelayPoolStats RelayPool::stats() const {
  std::lock_guard lock(mutex_);
  RelayPoolStats stats{
      .relay_count = relays_.size(),
      .seen_event_count = seen_event_ids_.size(),
      .rejected_event_count = rejected_event_count_,
      .publish_attempts = publish_attempts_,
  };
  for (const auto& relay : relays_) {
    stats.write_relay_count += relay.is_write() ? 1U : 0U;
    stats.read_relay_count += relay.is_read() ? 1U : 0U;
  }
  return stats;
}

std::string RelayPool::relays_dat_path() const {
  std::lock_guard lock(mutex_);
  return relays_dat_path_;
}

void RelayPool::sort_relays_locked() {
  std::ranges::sort(relays_, [](const RelayEntry& lhs, const RelayEntry& rhs) {
    return lhs.url != rhs.url ? lhs.url < rhs.url : lhs.marker < rhs.marker;
  });
  // A URL listed with both markers collapses to a single read+write entry.
  std::vector<RelayEntry> merged;
  for (auto& relay : relays_) {
    if (!merged.empty() && merged.back().url == relay.url) {
      if (merged.back().marker != relay.marker) {
        merged.back().marker.clear();
      }
      continue;
    }
    merged.push_back(std::move(relay));
  }
  relays_ = std::move(merged);
}

}  // namespace gambit
