#pragma once

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "core/model/types.hpp"
#include "core/relay/relay_transport.hpp"

namespace gambit {

struct RelayPoolStats {
  std::size_t relay_count = 0;
  std::size_t write_relay_count = 0;
  std::size_t read_relay_count = 0;
  std::size_t seen_event_count = 0;
  std::size_t rejected_event_count = 0;
  std::uint64_t publish_attempts = 0;
};

class RelayPool {
public:
  explicit RelayPool(std::shared_ptr<IRelayTransport> transport);

  Result configure(const std::vector<std::string>& publish_relays, const std::vector<std::string>& read_relays);
  Result load_relays_dat(std::string_view path);
  Result save_relays_dat(std::string_view path) const;
  Result add_relay(std::string_view url, std::string_view marker = {});
  Result remove_relay(std::string_view url);

  [[nodiscard]] std::vector<RelayEntry> relays() const;
  [[nodiscard]] std::vector<std::string> write_relays() const;
  [[nodiscard]] std::vector<std::string> read_relays() const;

  // Ok when at least one relay accepted the event; Network when every relay failed.
  Result publish(const NetworkEvent& event);
  Result publish_to(const std::vector<std::string>& relay_urls, const NetworkEvent& event);

  // Merged, verified, id-deduplicated results, newest first. Invalid events are dropped.
  Result query(const RelayFilter& filter, std::vector<NetworkEvent>& out);
  Result query_from(const std::vector<std::string>& relay_urls, const RelayFilter& filter,
                    std::vector<NetworkEvent>& out);
  Result fetch_event(std::string_view event_id, const std::vector<std::string>& relay_hints, NetworkEvent& out);

  [[nodiscard]] bool seen(std::string_view event_id) const;
  [[nodiscard]] RelayPoolStats stats() const;
  [[nodiscard]] std::string relays_dat_path() const;

  static std::string normalize_url(std::string_view url);
  // Empty (read and write), "read" or "write".
  static bool valid_marker(std::string_view marker);

  // Oldest ids are forgotten first once the set is full.
  static constexpr std::size_t kMaxSeenEvents = 10000;

private:
  void sort_relays_locked();
  void remember_seen_locked(const std::string& event_id);

  std::shared_ptr<IRelayTransport> transport_;
  mutable std::mutex mutex_;
  std::vector<RelayEntry> relays_;
  std::string relays_dat_path_;
  std::unordered_set<std::string> seen_event_ids_;
  std::deque<std::string> seen_order_;
  std::size_t rejected_event_count_ = 0;
  std::uint64_t publish_attempts_ = 0;
};

}  // namespace gambit
