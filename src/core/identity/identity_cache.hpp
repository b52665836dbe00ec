#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"
#include "core/protocol/event.hpp"
#include "core/relay/relay_pool.hpp"
#include "core/storage/store.hpp"
#include "core/sync/event_publisher.hpp"

namespace gambit {

inline constexpr std::string_view kFavoritesListId = "clubhouse";

enum class MergeOutcome {
  Inserted,
  Replaced,
  Unchanged,
  KeptExisting,
};

std::string_view merge_outcome_name(MergeOutcome outcome);

struct IdentityCacheTtl {
  std::int64_t follow_list_seconds = 60 * 60;
  std::int64_t relay_list_seconds = 24 * 60 * 60;
};

// Public key -> profile, follow list, relay lists and favorites, resolved through memory,
// then the durable cache, then the relays. Relay results are merged over what is known;
// an empty or failed fetch never replaces a non-empty cached value.
class IdentityCache {
public:
  IdentityCache(Store& store, RelayPool& pool, EventPublisher& publisher, std::string local_pubkey,
                IdentityCacheTtl ttl);

  // Memory then durable cache; no network.
  [[nodiscard]] std::map<std::string, Profile> cached_profiles(const std::vector<std::string>& pubkeys);
  // Cached entries plus a relay fetch merged field by field.
  Result resolve(const std::vector<std::string>& pubkeys, std::map<std::string, Profile>& out);
  [[nodiscard]] std::vector<Profile> search_profiles(std::string_view query) const;
  Result publish_profile(const Profile& profile);

  static Profile merge_profile(const Profile& existing, const Profile& fetched);
  static Result parse_profile_event(const NetworkEvent& event, Profile& out);

  Result refresh_follow_list(std::string_view pubkey, bool force, CachedFollowList& out);
  Result merge_follow_list(std::string_view pubkey, const std::optional<CachedFollowList>& fetched,
                           MergeOutcome& outcome);
  [[nodiscard]] std::optional<CachedFollowList> follow_list(std::string_view pubkey) const;
  Result follow(std::string_view pubkey);
  Result unfollow(std::string_view pubkey);

  Result refresh_favorites(std::string_view pubkey, bool force, CachedFavorites& out);
  Result merge_favorites(std::string_view pubkey, const std::optional<CachedFavorites>& fetched,
                         MergeOutcome& outcome);
  [[nodiscard]] std::optional<CachedFavorites> favorites(std::string_view pubkey) const;
  Result add_favorite(std::string_view pubkey);
  Result remove_favorite(std::string_view pubkey);

  Result refresh_relay_list(std::string_view pubkey, bool force, CachedRelayList& out);
  Result merge_relay_list(std::string_view pubkey, const std::optional<CachedRelayList>& fetched,
                          MergeOutcome& outcome);
  [[nodiscard]] std::optional<CachedRelayList> relay_list(std::string_view pubkey) const;
  // Cached or fetched kind 10050 relays; empty when the key declared none.
  [[nodiscard]] std::vector<std::string> inbox_relays(std::string_view pubkey);
  Result store_own_inbox_relays(const std::vector<std::string>& relays, std::int64_t created_at);

private:
  Result publish_member_list(int kind, const std::vector<std::string>& members, bool favorites_list);
  Result edit_follows(std::string_view pubkey, bool add);
  Result edit_favorites(std::string_view pubkey, bool add);
  [[nodiscard]] bool fresh(std::int64_t cached_unix, std::int64_t ttl_seconds) const;

  Store& store_;
  RelayPool& pool_;
  EventPublisher& publisher_;
  std::string local_pubkey_;
  IdentityCacheTtl ttl_;

  mutable std::mutex memory_mutex_;
  std::map<std::string, Profile, std::less<>> memory_profiles_;
  std::mutex edit_mutex_;
};

}  // namespace gambit
