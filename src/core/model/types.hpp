#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gambit {

enum class ErrorCode {
  None,
  InvalidInput,
  InvalidPlayerSet,
  NotFound,
  UntrustedContent,
  Storage,
  Network,
  Disabled,
  Cancelled,
  Timeout,
  Crypto,
};

struct Result {
  bool ok = false;
  ErrorCode code = ErrorCode::None;
  std::string message;
  std::string data;

  static Result success(std::string msg = {}, std::string payload = {}) {
    return {true, ErrorCode::None, std::move(msg), std::move(payload)};
  }

  static Result failure(ErrorCode code, std::string msg) {
    return {false, code, std::move(msg), {}};
  }
};

std::string_view error_code_name(ErrorCode code);

using HoleNumber = int;
using Strokes = int;
using RoundId = std::int64_t;
using ScoreMap = std::map<HoleNumber, Strokes>;

inline constexpr int kMinStrokes = 1;
inline constexpr int kMaxStrokes = 20;

struct HoleDefinition {
  int hole_number = 0;
  int par = 0;
};

struct CourseSnapshot {
  std::string content_hash;
  std::string course_name;
  std::string tee_set;
  std::vector<HoleDefinition> holes;
  std::string canonical_json;
  std::int64_t created_unix = 0;

  [[nodiscard]] int hole_count() const { return static_cast<int>(holes.size()); }
};

struct Round {
  RoundId round_id = 0;
  std::string course_hash;
  std::string round_date;
  std::int64_t created_unix = 0;
};

struct RoundPlayer {
  RoundId round_id = 0;
  int player_index = 0;
  std::string pubkey_hex;
};

struct HoleScoreEvent {
  std::int64_t score_id = 0;
  RoundId round_id = 0;
  int player_index = 0;
  HoleNumber hole_number = 0;
  Strokes strokes = 0;
  std::int64_t recorded_at_ms = 0;
};

enum class JoinedVia {
  Created,
  CreatedMulti,
  Joined,
};

std::string_view joined_via_name(JoinedVia via);
std::optional<JoinedVia> joined_via_from_name(std::string_view name);

struct RoundNetworkRecord {
  RoundId round_id = 0;
  std::string initiation_event_id;
  JoinedVia joined_via = JoinedVia::Created;
  std::int64_t published_unix = 0;
};

struct RoundListItem {
  RoundId round_id = 0;
  std::string course_name;
  std::string tee_set;
  std::string round_date;
  int hole_count = 0;
  bool completed = false;
  std::optional<int> total_strokes;
  int holes_scored = 0;
};

struct Profile {
  std::string pubkey_hex;
  std::optional<std::string> name;
  std::optional<std::string> display_name;
  std::optional<std::string> about;
  std::optional<std::string> picture;
  std::optional<std::string> banner;
  std::optional<std::string> nip05;
  std::int64_t event_created_unix = 0;
  std::int64_t cached_unix = 0;

  [[nodiscard]] std::string display_label() const;
};

struct CachedFollowList {
  std::string pubkey_hex;
  std::vector<std::string> follows;
  std::int64_t event_created_unix = 0;
  std::int64_t cached_unix = 0;
};

struct RelayEntry {
  std::string url;
  std::string marker;  // empty = read+write, "read", "write"

  [[nodiscard]] bool is_read() const { return marker.empty() || marker == "read"; }
  [[nodiscard]] bool is_write() const { return marker.empty() || marker == "write"; }
  bool operator==(const RelayEntry&) const = default;
};

struct CachedRelayList {
  std::string pubkey_hex;
  std::vector<RelayEntry> relays;
  std::vector<std::string> inbox_relays;
  std::int64_t event_created_unix = 0;
  std::int64_t cached_unix = 0;

  [[nodiscard]] std::vector<std::string> write_relays() const;
  [[nodiscard]] std::vector<std::string> read_relays() const;
};

struct CachedFavorites {
  std::string pubkey_hex;
  std::vector<std::string> members;
  std::int64_t event_created_unix = 0;
  std::int64_t cached_unix = 0;
};

struct AccountState {
  bool network_activated = true;
  bool read_only = false;
};

struct InitConfig {
  std::string app_data_dir;
  std::string passphrase;
  AccountState account{};
  std::vector<std::string> publish_relays;
  std::vector<std::string> read_relays;
  std::vector<std::string> dm_fallback_relays;
  std::string relays_dat_path;
  std::int64_t follow_list_ttl_seconds = 60 * 60;
  std::int64_t relay_list_ttl_seconds = 24 * 60 * 60;
  int invite_poll_attempts = 10;
  std::int64_t invite_poll_interval_ms = 2000;
  std::int64_t invite_lookback_seconds = 7 * 24 * 60 * 60;
  std::size_t background_workers = 2;
};

}  // namespace gambit
