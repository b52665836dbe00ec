#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "core/model/types.hpp"

namespace gambit {

// File-backed local tables. Every mutation is appended (or rewritten, for caches) to disk
// before the in-memory view changes, so a failed write leaves the view untouched.
// Writers are serialized; readers run concurrently and observe the last committed state.
class Store {
public:
  struct RoundEvent {
    RoundId round_id = 0;
    std::string kind;
    std::int64_t unix_ts = 0;
  };

  Result open(std::string_view app_data_dir);

  // Inserts when the hash is new; data is "inserted" or "existing".
  Result insert_course_if_absent(const CourseSnapshot& snapshot);
  [[nodiscard]] std::optional<CourseSnapshot> course(std::string_view content_hash) const;
  [[nodiscard]] std::size_t course_count() const;

  // Player rows are written before the round row; the round row commits the whole set.
  Result insert_round(std::string_view course_hash, std::string_view round_date,
                      const std::vector<std::string>& player_pubkeys, Round& out);
  // Writes the players, the network record and the round event before the committing round
  // row, all under one lock. Returns the existing round when the initiation is already joined.
  Result insert_joined_round(std::string_view course_hash, std::string_view round_date,
                             const std::vector<std::string>& player_pubkeys, const RoundNetworkRecord& record,
                             std::string_view round_event_kind, Round& out);
  [[nodiscard]] std::optional<Round> round(RoundId round_id) const;
  [[nodiscard]] std::vector<Round> rounds() const;
  [[nodiscard]] std::vector<RoundPlayer> players(RoundId round_id) const;

  Result append_score(RoundId round_id, int player_index, HoleNumber hole_number, Strokes strokes,
                      std::int64_t recorded_at_ms, HoleScoreEvent& out);
  [[nodiscard]] std::vector<HoleScoreEvent> score_events(RoundId round_id) const;
  [[nodiscard]] ScoreMap current_scores(RoundId round_id, int player_index) const;

  Result append_round_event(RoundId round_id, std::string_view kind);
  [[nodiscard]] bool has_round_event(RoundId round_id, std::string_view kind) const;

  // One-shot guard. When a record already exists it is left as is and returned in `stored`.
  Result record_network_once(const RoundNetworkRecord& record, RoundNetworkRecord& stored, bool& inserted);
  [[nodiscard]] std::optional<RoundNetworkRecord> network_record(RoundId round_id) const;
  [[nodiscard]] std::optional<RoundId> round_for_initiation(std::string_view initiation_event_id) const;

  // Replaces the stored snapshot for (round, pubkey) when the event is at least as new.
  Result upsert_remote_scores(RoundId round_id, std::string_view pubkey_hex, const ScoreMap& scores,
                              std::int64_t event_created_at);
  [[nodiscard]] std::map<std::string, ScoreMap> remote_scores(RoundId round_id) const;

  Result put_profile(const Profile& profile);
  [[nodiscard]] std::optional<Profile> profile(std::string_view pubkey_hex) const;
  [[nodiscard]] std::vector<Profile> profiles() const;

  Result put_follow_list(const CachedFollowList& list);
  [[nodiscard]] std::optional<CachedFollowList> follow_list(std::string_view pubkey_hex) const;

  Result put_relay_list(const CachedRelayList& list);
  [[nodiscard]] std::optional<CachedRelayList> relay_list(std::string_view pubkey_hex) const;

  Result put_favorites(const CachedFavorites& favorites);
  [[nodiscard]] std::optional<CachedFavorites> favorites(std::string_view pubkey_hex) const;

  [[nodiscard]] std::size_t skipped_line_count() const;

private:
  [[nodiscard]] std::string path_for(std::string_view file_name) const;
  Result insert_round_locked(std::string_view course_hash, std::string_view round_date,
                             const std::vector<std::string>& player_pubkeys,
                             const std::function<Result(RoundId)>& before_commit, Round& out);
  Result append_line(std::string_view file_name, std::string_view line) const;
  Result rewrite_cache_file(std::string_view file_name, const std::vector<std::string>& lines) const;

  Result load_courses();
  Result load_rounds();
  Result load_scores();
  Result load_round_events();
  Result load_network_records();
  Result load_remote_scores();
  Result load_caches();

  Result persist_profiles_locked() const;
  Result persist_follow_lists_locked() const;
  Result persist_relay_lists_locked() const;
  Result persist_favorites_locked() const;

  mutable std::shared_mutex mutex_;
  std::string app_data_dir_;
  bool open_ = false;
  std::size_t skipped_lines_ = 0;

  std::map<std::string, CourseSnapshot, std::less<>> courses_;
  std::map<RoundId, Round> rounds_;
  std::map<RoundId, std::vector<RoundPlayer>> players_;
  std::vector<HoleScoreEvent> scores_;
  std::vector<RoundEvent> round_events_;
  std::map<RoundId, RoundNetworkRecord> network_records_;
  std::map<std::pair<RoundId, std::string>, std::pair<ScoreMap, std::int64_t>> remote_scores_;
  std::map<std::string, Profile, std::less<>> profiles_;
  std::map<std::string, CachedFollowList, std::less<>> follow_lists_;
  std::map<std::string, CachedRelayList, std::less<>> relay_lists_;
  std::map<std::string, CachedFavorites, std::less<>> favorites_;

  RoundId next_round_id_ = 1;
  std::int64_t next_score_id_ = 1;
};

}  // namespace gambit
