#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "core/model/types.hpp"
#include "core/protocol/event.hpp"

namespace gambit {

struct RelayFilter {
  std::vector<std::string> ids;
  std::vector<std::string> authors;
  std::vector<int> kinds;
  std::vector<std::string> e_tags;
  std::vector<std::string> d_tags;
  std::vector<std::string> p_tags;
  std::optional<std::int64_t> since;
  std::optional<std::size_t> limit;

  [[nodiscard]] bool matches(const NetworkEvent& event) const;
};

class IRelayTransport {
public:
  virtual ~IRelayTransport() = default;

  virtual Result publish(std::string_view relay_url, const NetworkEvent& event) = 0;
  // Matching events, newest first, capped at filter.limit.
  virtual Result query(std::string_view relay_url, const RelayFilter& filter,
                       std::vector<NetworkEvent>& out) = 0;
};

// In-process relay set. Each URL gets its own event store; replaceable and addressable
// kinds keep only the newest event per key. Individual relays can be taken offline.
class LoopbackRelayTransport final : public IRelayTransport {
public:
  Result publish(std::string_view relay_url, const NetworkEvent& event) override;
  Result query(std::string_view relay_url, const RelayFilter& filter,
               std::vector<NetworkEvent>& out) override;

  void set_relay_offline(std::string_view relay_url, bool offline);
  void set_all_offline(bool offline);
  // Stores an event without validation, as a misbehaving relay would.
  void inject(std::string_view relay_url, const NetworkEvent& event);

  [[nodiscard]] std::size_t event_count(std::string_view relay_url) const;
  [[nodiscard]] std::size_t publish_count() const;

private:
  [[nodiscard]] bool offline_locked(std::string_view relay_url) const;

  mutable std::mutex mutex_;
  std::map<std::string, std::vector<NetworkEvent>, std::less<>> relays_;
  std::unordered_set<std::string> offline_relays_;
  bool all_offline_ = false;
  std::size_t publish_count_ = 0;
};

}  // namespace gambit
