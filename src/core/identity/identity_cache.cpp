#include "core/identity/identity_cache.hpp"

#include <algorithm>
#include <set>

#include "core/util/canonical.hpp"
#include "core/util/canonical_json.hpp"
#include "core/util/log.hpp"

namespace gambit {
namespace {

constexpr std::string_view kLogComponent = "identity";

std::optional<std::string> json_string(const nlohmann::json& object, const char* key) {
  const auto it = object.find(key);
  if (it == object.end() || !it->is_string()) {
    return std::nullopt;
  }
  std::string value = util::trim_copy(it->get<std::string>());
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

void take_field(std::optional<std::string>& target, const std::optional<std::string>& incoming, bool newer) {
  if (incoming.has_value() && !incoming->empty() && (newer || !target.has_value())) {
    target = incoming;
  }
}

std::vector<std::string> valid_keys(const std::vector<std::string>& pubkeys) {
  std::set<std::string> unique;
  for (const auto& key : pubkeys) {
    if (util::is_hex_of_size(key, 32)) {
      unique.insert(util::lowercase_copy(key));
    }
  }
  return {unique.begin(), unique.end()};
}

// Keeps tag order; drops anything that is not a 32-byte hex key.
std::vector<std::string> member_keys(const std::vector<std::string>& tag_values) {
  std::vector<std::string> members;
  std::set<std::string> seen;
  for (const auto& value : tag_values) {
    if (!util::is_hex_of_size(value, 32)) {
      continue;
    }
    std::string key = util::lowercase_copy(value);
    if (seen.insert(key).second) {
      members.push_back(std::move(key));
    }
  }
  return members;
}

std::vector<std::string> unique_in_order(const std::vector<std::string>& values) {
  std::vector<std::string> out;
  for (const auto& value : values) {
    if (std::find(out.begin(), out.end(), value) == out.end()) {
      out.push_back(value);
    }
  }
  return out;
}

std::optional<NetworkEvent> newest_event(std::vector<NetworkEvent>& events) {
  if (events.empty()) {
    return std::nullopt;
  }
  return *std::ranges::max_element(events, {}, &NetworkEvent::created_at);
}

}  // namespace

std::string_view merge_outcome_name(MergeOutcome outcome) {
  switch (outcome) {
    case MergeOutcome::Inserted:
      return "inserted";
    case MergeOutcome::Replaced:
      return "replaced";
    case MergeOutcome::Unchanged:
      return "unchanged";
    case MergeOutcome::KeptExisting:
      return "kept-existing";
  }
  return "unchanged";
}

IdentityCache::IdentityCache(Store& store, RelayPool& pool, EventPublisher& publisher, std::string local_pubkey,
                             IdentityCacheTtl ttl)
    : store_(store), pool_(pool), publisher_(publisher), local_pubkey_(std::move(local_pubkey)), ttl_(ttl) {}

bool IdentityCache::fresh(std::int64_t cached_unix, std::int64_t ttl_seconds) const {
  return cached_unix > 0 && util::unix_timestamp_now() - cached_unix < ttl_seconds;
}

std::map<std::string, Profile> IdentityCache::cached_profiles(const std::vector<std::string>& pubkeys) {
  std::map<std::string, Profile> out;
  std::lock_guard lock(memory_mutex_);
  for (const auto& key : valid_keys(pubkeys)) {
    if (const auto it = memory_profiles_.find(key); it != memory_profiles_.end()) {
      out[key] = it->second;
      continue;
    }
    if (auto stored = store_.profile(key); stored.has_value()) {
      memory_profiles_[key] = *stored;
      out[key] = std::move(*stored);
    }
  }
  return out;
}

Result IdentityCache::resolve(const std::vector<std::string>& pubkeys, std::map<std::string, Profile>& out) {
  out = cached_profiles(pubkeys);
  const std::vector<std::string> keys = valid_keys(pubkeys);
  if (keys.empty()) {
    return Result::success("Nothing to resolve.");
  }
  if (!publisher_.account_state().network_activated) {
    return Result::failure(ErrorCode::Disabled, "Network features are not activated; profiles served from cache.");
  }

  RelayFilter filter;
  filter.kinds = {event_kind::kProfile};
  filter.authors = keys;
  std::vector<NetworkEvent> events;
  if (const Result fetched = pool_.query(filter, events); !fetched.ok) {
    util::log_warn(kLogComponent, "Profile fetch failed: " + fetched.message);
    return fetched;
  }

  std::map<std::string, Profile> newest;
  for (const auto& event : events) {
    Profile fetched;
    if (!parse_profile_event(event, fetched).ok) {
      continue;
    }
    const auto it = newest.find(fetched.pubkey_hex);
    if (it == newest.end() || fetched.event_created_unix > it->second.event_created_unix) {
      newest[fetched.pubkey_hex] = std::move(fetched);
    }
  }

  const std::int64_t now = util::unix_timestamp_now();
  for (const auto& [key, fetched] : newest) {
    const auto existing = out.find(key);
    Profile merged = existing != out.end() ? merge_profile(existing->second, fetched) : fetched;
    merged.cached_unix = now;
    if (const Result stored = store_.put_profile(merged); !stored.ok) {
      util::log_error(kLogComponent, "Failed to cache profile " + key + ": " + stored.message);
    }
    {
      std::lock_guard lock(memory_mutex_);
      memory_profiles_[key] = merged;
    }
    out[key] = std::move(merged);
  }
  return Result::success("Resolved " + std::to_string(newest.size()) + " profiles from relays.");
}

std::vector<Profile> IdentityCache::search_profiles(std::string_view query) const {
  const std::string needle = util::trim_copy(query);
  std::vector<Profile> matches;
  for (auto& profile : store_.profiles()) {
    const bool hit = needle.empty() || util::contains_case_insensitive(profile.name.value_or(""), needle) ||
                     util::contains_case_insensitive(profile.display_name.value_or(""), needle) ||
                     util::contains_case_insensitive(profile.nip05.value_or(""), needle) ||
                     profile.pubkey_hex.starts_with(util::lowercase_copy(needle));
    if (hit) {
      matches.push_back(std::move(profile));
    }
  }
  std::ranges::sort(matches, [](const Profile& lhs, const Profile& rhs) {
    return util::lowercase_copy(lhs.display_label()) < util::lowercase_copy(rhs.display_label());
  });
  return matches;
}

Result IdentityCache::publish_profile(const Profile& profile) {
  nlohmann::json content = nlohmann::json::object();
  const auto put = [&](const char* key, const std::optional<std::string>& value) {
    if (value.has_value() && !value->empty()) {
      content[key] = *value;
    }
  };
  put("name", profile.name);
  put("display_name", profile.display_name);
  put("about", profile.about);
  put("picture", profile.picture);
  put("banner", profile.banner);
  put("nip05", profile.nip05);

  const Result text = util::canonical_json(content);
  if (!text.ok) {
    return text;
  }

  NetworkEvent event;
  event.kind = event_kind::kProfile;
  event.created_at = util::unix_timestamp_now();
  event.content = text.data;
  if (const Result published = publisher_.sign_and_publish(event); !published.ok) {
    return published;
  }

  Profile own = profile;
  own.pubkey_hex = local_pubkey_;
  own.event_created_unix = event.created_at;
  own.cached_unix = event.created_at;
  if (const Result stored = store_.put_profile(own); !stored.ok) {
    return stored;
  }
  std::lock_guard lock(memory_mutex_);
  memory_profiles_[local_pubkey_] = own;
  return Result::success("Profile published.", event.id);
}

Profile IdentityCache::merge_profile(const Profile& existing, const Profile& fetched) {
  Profile merged = existing;
  const bool newer = fetched.event_created_unix >= existing.event_created_unix;
  take_field(merged.name, fetched.name, newer);
  take_field(merged.display_name, fetched.display_name, newer);
  take_field(merged.about, fetched.about, newer);
  take_field(merged.picture, fetched.picture, newer);
  take_field(merged.banner, fetched.banner, newer);
  take_field(merged.nip05, fetched.nip05, newer);
  merged.event_created_unix = std::max(existing.event_created_unix, fetched.event_created_unix);
  if (merged.pubkey_hex.empty()) {
    merged.pubkey_hex = fetched.pubkey_hex;
  }
  return merged;
}

Result IdentityCache::parse_profile_event(const NetworkEvent& event, Profile& out) {
  if (event.kind != event_kind::kProfile) {
    return Result::failure(ErrorCode::InvalidInput, "Event is not profile metadata.");
  }

  nlohmann::json content;
  if (const Result parsed = util::parse_json(event.content, content); !parsed.ok) {
    return parsed;
  }
  if (!content.is_object()) {
    return Result::failure(ErrorCode::InvalidInput, "Profile content must be a JSON object.");
  }

  Profile profile;
  profile.pubkey_hex = event.pubkey;
  profile.name = json_string(content, "name");
  profile.display_name = json_string(content, "display_name");
  if (!profile.display_name.has_value()) {
    profile.display_name = json_string(content, "displayName");
  }
  profile.about = json_string(content, "about");
  profile.picture = json_string(content, "picture");
  profile.banner = json_string(content, "banner");
  profile.nip05 = json_string(content, "nip05");
  profile.event_created_unix = event.created_at;
  out = std::move(profile);
  return Result::success();
}

Result IdentityCache::merge_follow_list(std::string_view pubkey, const std::optional<CachedFollowList>& fetched,
                                        MergeOutcome& outcome) {
  const auto existing = store_.follow_list(pubkey);
  if (!fetched.has_value() || fetched->follows.empty()) {
    outcome = existing.has_value() && !existing->follows.empty() ? MergeOutcome::KeptExisting
                                                                 : MergeOutcome::Unchanged;
    return Result::success("Empty fetch ignored.");
  }
  if (existing.has_value() && fetched->event_created_unix < existing->event_created_unix) {
    outcome = MergeOutcome::KeptExisting;
    return Result::success("Cached follow list is newer.");
  }

  CachedFollowList next = *fetched;
  next.pubkey_hex = std::string{pubkey};
  next.follows = unique_in_order(next.follows);
  next.cached_unix = util::unix_timestamp_now();
  if (existing.has_value() && existing->follows == next.follows) {
    outcome = MergeOutcome::Unchanged;
    next.event_created_unix = std::max(existing->event_created_unix, next.event_created_unix);
  } else {
    outcome = existing.has_value() ? MergeOutcome::Replaced : MergeOutcome::Inserted;
  }
  return store_.put_follow_list(next);
}

Result IdentityCache::refresh_follow_list(std::string_view pubkey, bool force, CachedFollowList& out) {
  const auto cached = store_.follow_list(pubkey);
  if (cached.has_value() && !force && fresh(cached->cached_unix, ttl_.follow_list_seconds)) {
    out = *cached;
    return Result::success("Follow list served from cache.");
  }
  out = cached.value_or(CachedFollowList{.pubkey_hex = std::string{pubkey}});
  if (!publisher_.account_state().network_activated) {
    return Result::failure(ErrorCode::Disabled, "Network features are not activated.");
  }

  RelayFilter filter;
  filter.kinds = {event_kind::kContacts};
  filter.authors = {std::string{pubkey}};
  filter.limit = 1;
  std::vector<NetworkEvent> events;
  const Result fetched = pool_.query(filter, events);
  if (!fetched.ok) {
    util::log_warn(kLogComponent, "Follow list fetch failed for " + std::string{pubkey} + ": " + fetched.message);
  }

  std::optional<CachedFollowList> incoming;
  if (const auto event = newest_event(events); event.has_value()) {
    incoming = CachedFollowList{
        .pubkey_hex = std::string{pubkey},
        .follows = member_keys(event->tag_values("p")),
        .event_created_unix = event->created_at,
    };
  }

  MergeOutcome outcome = MergeOutcome::Unchanged;
  if (const Result merged = merge_follow_list(pubkey, incoming, outcome); !merged.ok) {
    return merged;
  }
  out = store_.follow_list(pubkey).value_or(out);
  if (!fetched.ok) {
    return fetched;
  }
  return Result::success("Follow list refreshed.", std::string{merge_outcome_name(outcome)});
}

std::optional<CachedFollowList> IdentityCache::follow_list(std::string_view pubkey) const {
  return store_.follow_list(pubkey);
}

Result IdentityCache::follow(std::string_view pubkey) {
  return edit_follows(pubkey, true);
}

Result IdentityCache::unfollow(std::string_view pubkey) {
  return edit_follows(pubkey, false);
}

Result IdentityCache::edit_follows(std::string_view pubkey, bool add) {
  const std::string key = util::lowercase_copy(pubkey);
  if (!util::is_hex_of_size(key, 32)) {
    return Result::failure(ErrorCode::InvalidInput, "Public key must be 64 hex characters.");
  }

  std::lock_guard lock(edit_mutex_);
  CachedFollowList list = store_.follow_list(local_pubkey_).value_or(CachedFollowList{.pubkey_hex = local_pubkey_});
  const auto it = std::find(list.follows.begin(), list.follows.end(), key);
  if (add == (it != list.follows.end())) {
    return Result::success("Follow list unchanged.", "unchanged");
  }
  if (add) {
    list.follows.push_back(key);
  } else {
    list.follows.erase(it);
  }
  list.event_created_unix = util::unix_timestamp_now();
  list.cached_unix = list.event_created_unix;
  if (const Result stored = store_.put_follow_list(list); !stored.ok) {
    return stored;
  }
  return publish_member_list(event_kind::kContacts, list.follows, false);
}

Result IdentityCache::merge_favorites(std::string_view pubkey, const std::optional<CachedFavorites>& fetched,
                                      MergeOutcome& outcome) {
  const auto existing = store_.favorites(pubkey);
  if (!fetched.has_value() || fetched->members.empty()) {
    outcome = existing.has_value() && !existing->members.empty() ? MergeOutcome::KeptExisting
                                                                 : MergeOutcome::Unchanged;
    return Result::success("Empty fetch ignored.");
  }
  if (existing.has_value() && fetched->event_created_unix < existing->event_created_unix) {
    outcome = MergeOutcome::KeptExisting;
    return Result::success("Cached favorites are newer.");
  }

  CachedFavorites next = *fetched;
  next.pubkey_hex = std::string{pubkey};
  next.members = unique_in_order(next.members);
  next.cached_unix = util::unix_timestamp_now();
  const auto sorted = [](std::vector<std::string> members) {
    std::ranges::sort(members);
    return members;
  };
  if (existing.has_value() && sorted(existing->members) == sorted(next.members)) {
    outcome = MergeOutcome::Unchanged;
    next.event_created_unix = std::max(existing->event_created_unix, next.event_created_unix);
  } else {
    outcome = existing.has_value() ? MergeOutcome::Replaced : MergeOutcome::Inserted;
  }
  return store_.put_favorites(next);
}

Result IdentityCache::refresh_favorites(std::string_view pubkey, bool force, CachedFavorites& out) {
  const auto cached = store_.favorites(pubkey);
  if (cached.has_value() && !force && fresh(cached->cached_unix, ttl_.follow_list_seconds)) {
    out = *cached;
    return Result::success("Favorites served from cache.");
  }
  out = cached.value_or(CachedFavorites{.pubkey_hex = std::string{pubkey}});
  if (!publisher_.account_state().network_activated) {
    return Result::failure(ErrorCode::Disabled, "Network features are not activated.");
  }

  RelayFilter filter;
  filter.kinds = {event_kind::kFollowSet};
  filter.authors = {std::string{pubkey}};
  filter.d_tags = {std::string{kFavoritesListId}};
  filter.limit = 1;
  std::vector<NetworkEvent> events;
  const Result fetched = pool_.query(filter, events);
  if (!fetched.ok) {
    util::log_warn(kLogComponent, "Favorites fetch failed for " + std::string{pubkey} + ": " + fetched.message);
  }

  std::optional<CachedFavorites> incoming;
  if (const auto event = newest_event(events); event.has_value()) {
    incoming = CachedFavorites{
        .pubkey_hex = std::string{pubkey},
        .members = member_keys(event->tag_values("p")),
        .event_created_unix = event->created_at,
    };
  }

  MergeOutcome outcome = MergeOutcome::Unchanged;
  if (const Result merged = merge_favorites(pubkey, incoming, outcome); !merged.ok) {
    return merged;
  }
  out = store_.favorites(pubkey).value_or(out);
  if (!fetched.ok) {
    return fetched;
  }
  return Result::success("Favorites refreshed.", std::string{merge_outcome_name(outcome)});
}

std::optional<CachedFavorites> IdentityCache::favorites(std::string_view pubkey) const {
  return store_.favorites(pubkey);
}

Result IdentityCache::add_favorite(std::string_view pubkey) {
  return edit_favorites(pubkey, true);
}

Result IdentityCache::remove_favorite(std::string_view pubkey) {
  return edit_favorites(pubkey, false);
}

Result IdentityCache::edit_favorites(std::string_view pubkey, bool add) {
  const std::string key = util::lowercase_copy(pubkey);
  if (!util::is_hex_of_size(key, 32)) {
    return Result::failure(ErrorCode::InvalidInput, "Public key must be 64 hex characters.");
  }

  std::lock_guard lock(edit_mutex_);
  CachedFavorites favorites = store_.favorites(local_pubkey_).value_or(CachedFavorites{.pubkey_hex = local_pubkey_});
  const auto it = std::find(favorites.members.begin(), favorites.members.end(), key);
  if (add == (it != favorites.members.end())) {
    return Result::success("Favorites unchanged.", "unchanged");
  }
  if (add) {
    favorites.members.push_back(key);
  } else {
    favorites.members.erase(it);
  }
  favorites.event_created_unix = util::unix_timestamp_now();
  favorites.cached_unix = favorites.event_created_unix;
  if (const Result stored = store_.put_favorites(favorites); !stored.ok) {
    return stored;
  }
  return publish_member_list(event_kind::kFollowSet, favorites.members, true);
}

Result IdentityCache::publish_member_list(int kind, const std::vector<std::string>& members, bool favorites_list) {
  NetworkEvent event;
  event.kind = kind;
  event.created_at = util::unix_timestamp_now();
  if (favorites_list) {
    event.tags.push_back({"d", std::string{kFavoritesListId}});
  }
  for (const auto& member : members) {
    event.tags.push_back({"p", member});
  }

  if (const Result published = publisher_.sign_and_publish(event); !published.ok) {
    util::log_warn(kLogComponent, "List updated locally; publish failed: " + published.message);
    return Result::success("Updated locally; publish failed: " + published.message, "unpublished");
  }
  return Result::success("Updated and published.", "published");
}

Result IdentityCache::merge_relay_list(std::string_view pubkey, const std::optional<CachedRelayList>& fetched,
                                       MergeOutcome& outcome) {
  const auto existing = store_.relay_list(pubkey);
  if (!fetched.has_value() || (fetched->relays.empty() && fetched->inbox_relays.empty())) {
    outcome = existing.has_value() ? MergeOutcome::KeptExisting : MergeOutcome::Unchanged;
    return Result::success("Empty fetch ignored.");
  }
  if (existing.has_value() && fetched->event_created_unix < existing->event_created_unix) {
    outcome = MergeOutcome::KeptExisting;
    return Result::success("Cached relay list is newer.");
  }

  CachedRelayList next = *fetched;
  next.pubkey_hex = std::string{pubkey};
  next.cached_unix = util::unix_timestamp_now();
  if (existing.has_value()) {
    // Each half survives an empty counterpart in the fetch.
    if (next.relays.empty()) {
      next.relays = existing->relays;
    }
    if (next.inbox_relays.empty()) {
      next.inbox_relays = existing->inbox_relays;
    }
    outcome = existing->relays == next.relays && existing->inbox_relays == next.inbox_relays
                  ? MergeOutcome::Unchanged
                  : MergeOutcome::Replaced;
  } else {
    outcome = MergeOutcome::Inserted;
  }
  return store_.put_relay_list(next);
}

Result IdentityCache::refresh_relay_list(std::string_view pubkey, bool force, CachedRelayList& out) {
  const auto cached = store_.relay_list(pubkey);
  if (cached.has_value() && !force && fresh(cached->cached_unix, ttl_.relay_list_seconds)) {
    out = *cached;
    return Result::success("Relay list served from cache.");
  }
  out = cached.value_or(CachedRelayList{.pubkey_hex = std::string{pubkey}});
  if (!publisher_.account_state().network_activated) {
    return Result::failure(ErrorCode::Disabled, "Network features are not activated.");
  }

  RelayFilter filter;
  filter.kinds = {event_kind::kRelayList, event_kind::kInboxRelays};
  filter.authors = {std::string{pubkey}};
  std::vector<NetworkEvent> events;
  const Result fetched = pool_.query(filter, events);
  if (!fetched.ok) {
    util::log_warn(kLogComponent, "Relay list fetch failed for " + std::string{pubkey} + ": " + fetched.message);
  }

  std::optional<CachedRelayList> incoming;
  std::int64_t relay_list_at = -1;
  std::int64_t inbox_at = -1;
  for (const auto& event : events) {
    if (!incoming.has_value()) {
      incoming = CachedRelayList{.pubkey_hex = std::string{pubkey}};
    }
    if (event.kind == event_kind::kRelayList && event.created_at > relay_list_at) {
      relay_list_at = event.created_at;
      incoming->relays.clear();
      for (const auto& tag : event.tags) {
        if (tag.size() < 2 || tag[0] != "r") {
          continue;
        }
        const std::string url = RelayPool::normalize_url(tag[1]);
        const std::string marker = tag.size() >= 3 ? tag[2] : "";
        if (!url.empty() && RelayPool::valid_marker(marker)) {
          incoming->relays.push_back({url, marker});
        }
      }
    } else if (event.kind == event_kind::kInboxRelays && event.created_at > inbox_at) {
      inbox_at = event.created_at;
      incoming->inbox_relays.clear();
      for (const auto& url : event.tag_values("relay")) {
        if (const std::string normalized = RelayPool::normalize_url(url); !normalized.empty()) {
          incoming->inbox_relays.push_back(normalized);
        }
      }
    }
    incoming->event_created_unix = std::max(incoming->event_created_unix, event.created_at);
  }

  MergeOutcome outcome = MergeOutcome::Unchanged;
  if (const Result merged = merge_relay_list(pubkey, incoming, outcome); !merged.ok) {
    return merged;
  }
  out = store_.relay_list(pubkey).value_or(out);
  if (!fetched.ok) {
    return fetched;
  }
  return Result::success("Relay list refreshed.", std::string{merge_outcome_name(outcome)});
}

std::optional<CachedRelayList> IdentityCache::relay_list(std::string_view pubkey) const {
  return store_.relay_list(pubkey);
}

std::vector<std::string> IdentityCache::inbox_relays(std::string_view pubkey) {
  CachedRelayList list;
  const Result refreshed = refresh_relay_list(pubkey, false, list);
  if (!refreshed.ok) {
    util::log_debug(kLogComponent, "Inbox relay lookup for " + std::string{pubkey} + ": " + refreshed.message);
  }
  return list.inbox_relays;
}

Result IdentityCache::store_own_inbox_relays(const std::vector<std::string>& relays, std::int64_t created_at) {
  std::lock_guard lock(edit_mutex_);
  CachedRelayList list = store_.relay_list(local_pubkey_).value_or(CachedRelayList{.pubkey_hex = local_pubkey_});
  list.inbox_relays = relays;
  list.event_created_unix = std::max(list.event_created_unix, created_at);
  list.cached_unix = util::unix_timestamp_now();
  return store_.put_relay_list(list);
}

}  // namespace gambit
