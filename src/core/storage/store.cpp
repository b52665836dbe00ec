#include "core/storage/store.hpp"

#include <algorithm>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <sstream>
#include <system_error>
#include <utility>

#include "core/util/canonical.hpp"
#include "core/util/log.hpp"

namespace gambit {
namespace {

constexpr std::string_view kCoursesFile = "course_snapshots.log";
constexpr std::string_view kRoundsFile = "rounds.log";
constexpr std::string_view kPlayersFile = "round_players.log";
constexpr std::string_view kScoresFile = "hole_scores.log";
constexpr std::string_view kRoundEventsFile = "round_events.log";
constexpr std::string_view kNetworkFile = "round_network_records.log";
constexpr std::string_view kRemoteScoresFile = "remote_scores.log";
constexpr std::string_view kProfilesFile = "profiles.dat";
constexpr std::string_view kFollowListsFile = "follow_lists.dat";
constexpr std::string_view kRelayListsFile = "relay_lists.dat";
constexpr std::string_view kFavoritesFile = "favorites.dat";
constexpr std::string_view kLogComponent = "store";

bool parse_int64(std::string_view text, std::int64_t& out) {
  std::int64_t value = 0;
  const auto result = std::from_chars(text.data(), text.data() + text.size(), value);
  if (result.ec != std::errc() || result.ptr != text.data() + text.size()) {
    return false;
  }
  out = value;
  return true;
}

bool parse_int(std::string_view text, int& out) {
  std::int64_t value = 0;
  if (!parse_int64(text, value)) {
    return false;
  }
  out = static_cast<int>(value);
  return true;
}

std::string join(const std::vector<std::string>& values, char delimiter) {
  std::string out;
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out.push_back(delimiter);
    }
    out += values[i];
  }
  return out;
}

bool list_field_safe(std::string_view value) {
  return !value.empty() && std::ranges::none_of(value, [](char c) {
    const auto byte = static_cast<unsigned char>(c);
    return byte < 0x20 || byte == 0x7f || c == ',' || c == '|';
  });
}

Result check_member_list(std::string_view owner, const std::vector<std::string>& members) {
  if (!util::is_hex_of_size(owner, 32)) {
    return Result::failure(ErrorCode::InvalidInput, "Cached list owner must be 64 hex characters.");
  }
  for (const auto& member : members) {
    if (!util::is_hex_of_size(member, 32)) {
      return Result::failure(ErrorCode::InvalidInput, "Cached list member must be 64 hex characters.");
    }
  }
  return Result::success();
}

std::vector<std::string> split_list(std::string_view text) {
  std::vector<std::string> values;
  for (auto& value : util::split(text, ',')) {
    if (!value.empty()) {
      values.push_back(std::move(value));
    }
  }
  return values;
}

std::string serialize_score_map(const ScoreMap& scores) {
  std::vector<std::string> parts;
  for (const auto& [hole, strokes] : scores) {
    parts.push_back(std::to_string(hole) + ":" + std::to_string(strokes));
  }
  return join(parts, ',');
}

bool parse_score_map(std::string_view text, ScoreMap& out) {
  out.clear();
  for (const auto& part : split_list(text)) {
    const std::size_t colon = part.find(':');
    int hole = 0;
    int strokes = 0;
    if (colon == std::string::npos || !parse_int(std::string_view{part}.substr(0, colon), hole) ||
        !parse_int(std::string_view{part}.substr(colon + 1U), strokes)) {
      return false;
    }
    out[hole] = strokes;
  }
  return true;
}

std::string serialize_holes(const std::vector<HoleDefinition>& holes) {
  std::vector<std::string> parts;
  for (const auto& hole : holes) {
    parts.push_back(std::to_string(hole.hole_number) + ":" + std::to_string(hole.par));
  }
  return join(parts, ',');
}

bool parse_holes(std::string_view text, std::vector<HoleDefinition>& out) {
  ScoreMap pairs;
  if (!parse_score_map(text, pairs)) {
    return false;
  }
  out.clear();
  for (const auto& [hole_number, par] : pairs) {
    out.push_back({hole_number, par});
  }
  return true;
}

void put_optional(std::vector<std::pair<std::string, std::string>>& fields, std::string key,
                  const std::optional<std::string>& value) {
  if (value.has_value()) {
    fields.emplace_back(std::move(key), *value);
  }
}

std::optional<std::string> get_optional(const std::unordered_map<std::string, std::string>& values,
                                        const std::string& key) {
  const auto it = values.find(key);
  if (it == values.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::int64_t get_int64(const std::unordered_map<std::string, std::string>& values, const std::string& key) {
  std::int64_t out = 0;
  const auto it = values.find(key);
  if (it != values.end()) {
    parse_int64(it->second, out);
  }
  return out;
}

template <typename Fn>
Result read_lines(const std::string& path, Fn&& on_line) {
  std::ifstream in(path);
  if (!in) {
    return Result::success("Table will be created on first write.");
  }

  std::string line;
  while (std::getline(in, line)) {
    if (line.empty() || line.front() == '#') {
      continue;
    }
    on_line(util::split(line, '\t'));
  }
  if (in.bad()) {
    return Result::failure(ErrorCode::Storage, "Failed reading " + path);
  }
  return Result::success();
}

}  // namespace

Result Store::open(std::string_view app_data_dir) {
  std::unique_lock lock(mutex_);
  app_data_dir_ = std::string{app_data_dir};
  open_ = false;
  skipped_lines_ = 0;

  std::error_code ec;
  std::filesystem::create_directories(app_data_dir_, ec);
  if (ec) {
    return Result::failure(ErrorCode::Storage, "Failed to create store directory: " + ec.message());
  }

  for (const auto& loader : {&Store::load_courses, &Store::load_rounds, &Store::load_scores,
                             &Store::load_round_events, &Store::load_network_records,
                             &Store::load_remote_scores, &Store::load_caches}) {
    if (const Result loaded = (this->*loader)(); !loaded.ok) {
      return loaded;
    }
  }

  if (skipped_lines_ > 0) {
    util::log_warn(kLogComponent, "Skipped " + std::to_string(skipped_lines_) + " malformed lines while loading.");
  }
  open_ = true;
  return Result::success("Store opened.");
}

Result Store::insert_course_if_absent(const CourseSnapshot& snapshot) {
  std::unique_lock lock(mutex_);
  if (courses_.contains(snapshot.content_hash)) {
    return Result::success("Course snapshot already stored.", "existing");
  }

  std::ostringstream line;
  line << snapshot.content_hash << '\t' << util::to_hex(snapshot.course_name) << '\t'
       << util::to_hex(snapshot.tee_set) << '\t' << serialize_holes(snapshot.holes) << '\t'
       << util::to_hex(snapshot.canonical_json) << '\t' << snapshot.created_unix;
  if (const Result written = append_line(kCoursesFile, line.str()); !written.ok) {
    return written;
  }

  courses_.emplace(snapshot.content_hash, snapshot);
  return Result::success("Course snapshot stored.", "inserted");
}

std::optional<CourseSnapshot> Store::course(std::string_view content_hash) const {
  std::shared_lock lock(mutex_);
  const auto it = courses_.find(content_hash);
  if (it == courses_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t Store::course_count() const {
  std::shared_lock lock(mutex_);
  return courses_.size();
}

Result Store::insert_round(std::string_view course_hash, std::string_view round_date,
                           const std::vector<std::string>& player_pubkeys, Round& out) {
  std::unique_lock lock(mutex_);
  return insert_round_locked(course_hash, round_date, player_pubkeys, {}, out);
}

Result Store::insert_joined_round(std::string_view course_hash, std::string_view round_date,
                                  const std::vector<std::string>& player_pubkeys, const RoundNetworkRecord& record,
                                  std::string_view round_event_kind, Round& out) {
  if (!util::is_hex_of_size(record.initiation_event_id, 32)) {
    return Result::failure(ErrorCode::InvalidInput, "Initiation event id must be 64 hex characters.");
  }

  std::unique_lock lock(mutex_);
  for (const auto& [round_id, existing] : network_records_) {
    if (existing.initiation_event_id == record.initiation_event_id) {
      out = rounds_.at(round_id);
      return Result::success("Round already joined.", std::to_string(round_id));
    }
  }

  RoundNetworkRecord stored = record;
  RoundEvent event{0, std::string{round_event_kind}, util::unix_timestamp_now()};
  const auto write_links = [&](RoundId round_id) {
    stored.round_id = round_id;
    event.round_id = round_id;
    std::ostringstream line;
    line << stored.round_id << '\t' << stored.initiation_event_id << '\t' << joined_via_name(stored.joined_via)
         << '\t' << stored.published_unix;
    if (const Result written = append_line(kNetworkFile, line.str()); !written.ok) {
      return written;
    }
    return append_line(kRoundEventsFile,
                       std::to_string(event.round_id) + "\t" + event.kind + "\t" + std::to_string(event.unix_ts));
  };
  if (const Result inserted = insert_round_locked(course_hash, round_date, player_pubkeys, write_links, out);
      !inserted.ok) {
    return inserted;
  }

  network_records_.emplace(stored.round_id, stored);
  round_events_.push_back(std::move(event));
  return Result::success("Joined round stored.", std::to_string(out.round_id));
}

Result Store::insert_round_locked(std::string_view course_hash, std::string_view round_date,
                                  const std::vector<std::string>& player_pubkeys,
                                  const std::function<Result(RoundId)>& before_commit, Round& out) {
  if (player_pubkeys.empty()) {
    return Result::failure(ErrorCode::InvalidPlayerSet, "A round needs at least one player.");
  }
  if (!courses_.contains(course_hash)) {
    return Result::failure(ErrorCode::NotFound, "Course snapshot is not stored: " + std::string{course_hash});
  }

  const RoundId round_id = next_round_id_;
  std::string player_lines;
  std::vector<RoundPlayer> players;
  for (std::size_t i = 0; i < player_pubkeys.size(); ++i) {
    players.push_back({round_id, static_cast<int>(i), player_pubkeys[i]});
    if (i > 0) {
      player_lines.push_back('\n');
    }
    player_lines += std::to_string(round_id) + "\t" + std::to_string(i) + "\t" + player_pubkeys[i];
  }
  if (const Result written = append_line(kPlayersFile, player_lines); !written.ok) {
    return written;
  }
  // Orphaned player rows from a failed round write must never be reused.
  next_round_id_ = round_id + 1;

  if (before_commit) {
    if (const Result linked = before_commit(round_id); !linked.ok) {
      return linked;
    }
  }

  Round round{
      .round_id = round_id,
      .course_hash = std::string{course_hash},
      .round_date = std::string{round_date},
      .created_unix = util::unix_timestamp_now(),
  };
  std::ostringstream line;
  line << round.round_id << '\t' << round.course_hash << '\t' << util::to_hex(round.round_date) << '\t'
       << round.created_unix << '\t' << players.size();
  if (const Result written = append_line(kRoundsFile, line.str()); !written.ok) {
    return written;
  }

  rounds_.emplace(round_id, round);
  players_[round_id] = std::move(players);
  out = round;
  return Result::success("Round created.", std::to_string(round_id));
}

std::optional<Round> Store::round(RoundId round_id) const {
  std::shared_lock lock(mutex_);
  const auto it = rounds_.find(round_id);
  if (it == rounds_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<Round> Store::rounds() const {
  std::shared_lock lock(mutex_);
  std::vector<Round> out;
  out.reserve(rounds_.size());
  for (const auto& [id, round] : rounds_) {
    out.push_back(round);
  }
  return out;
}

std::vector<RoundPlayer> Store::players(RoundId round_id) const {
  std::shared_lock lock(mutex_);
  const auto it = players_.find(round_id);
  if (it == players_.end() || !rounds_.contains(round_id)) {
    return {};
  }
  return it->second;
}

Result Store::append_score(RoundId round_id, int player_index, HoleNumber hole_number, Strokes strokes,
                           std::int64_t recorded_at_ms, HoleScoreEvent& out) {
  std::unique_lock lock(mutex_);
  if (!rounds_.contains(round_id)) {
    return Result::failure(ErrorCode::NotFound, "Round " + std::to_string(round_id) + " does not exist.");
  }

  const HoleScoreEvent event{
      .score_id = next_score_id_,
      .round_id = round_id,
      .player_index = player_index,
      .hole_number = hole_number,
      .strokes = strokes,
      .recorded_at_ms = recorded_at_ms,
  };
  std::ostringstream line;
  line << event.score_id << '\t' << event.round_id << '\t' << event.player_index << '\t' << event.hole_number
       << '\t' << event.strokes << '\t' << event.recorded_at_ms;
  if (const Result written = append_line(kScoresFile, line.str()); !written.ok) {
    return written;
  }

  ++next_score_id_;
  scores_.push_back(event);
  out = event;
  return Result::success("Score recorded.", std::to_string(event.score_id));
}

std::vector<HoleScoreEvent> Store::score_events(RoundId round_id) const {
  std::shared_lock lock(mutex_);
  std::vector<HoleScoreEvent> out;
  for (const auto& event : scores_) {
    if (event.round_id == round_id) {
      out.push_back(event);
    }
  }
  return out;
}

ScoreMap Store::current_scores(RoundId round_id, int player_index) const {
  std::shared_lock lock(mutex_);
  std::map<HoleNumber, const HoleScoreEvent*> latest;
  for (const auto& event : scores_) {
    if (event.round_id != round_id || event.player_index != player_index) {
      continue;
    }
    const HoleScoreEvent*& current = latest[event.hole_number];
    // Equal timestamps resolve to the later append.
    if (current == nullptr || event.recorded_at_ms > current->recorded_at_ms ||
        (event.recorded_at_ms == current->recorded_at_ms && event.score_id > current->score_id)) {
      current = &event;
    }
  }

  ScoreMap scores;
  for (const auto& [hole, event] : latest) {
    scores[hole] = event->strokes;
  }
  return scores;
}

Result Store::append_round_event(RoundId round_id, std::string_view kind) {
  std::unique_lock lock(mutex_);
  if (!rounds_.contains(round_id)) {
    return Result::failure(ErrorCode::NotFound, "Round " + std::to_string(round_id) + " does not exist.");
  }

  const RoundEvent event{round_id, std::string{kind}, util::unix_timestamp_now()};
  if (const Result written = append_line(kRoundEventsFile, std::to_string(event.round_id) + "\t" + event.kind +
                                                               "\t" + std::to_string(event.unix_ts));
      !written.ok) {
    return written;
  }
  round_events_.push_back(event);
  return Result::success("Round event recorded.");
}

bool Store::has_round_event(RoundId round_id, std::string_view kind) const {
  std::shared_lock lock(mutex_);
  return std::ranges::any_of(round_events_, [&](const RoundEvent& event) {
    return event.round_id == round_id && event.kind == kind;
  });
}

Result Store::record_network_once(const RoundNetworkRecord& record, RoundNetworkRecord& stored, bool& inserted) {
  std::unique_lock lock(mutex_);
  inserted = false;
  if (!rounds_.contains(record.round_id)) {
    return Result::failure(ErrorCode::NotFound, "Round " + std::to_string(record.round_id) + " does not exist.");
  }
  if (const auto it = network_records_.find(record.round_id); it != network_records_.end()) {
    stored = it->second;
    return Result::success("Network record already set.", stored.initiation_event_id);
  }
  if (!util::is_hex_of_size(record.initiation_event_id, 32)) {
    return Result::failure(ErrorCode::InvalidInput, "Initiation event id must be 64 hex characters.");
  }

  std::ostringstream line;
  line << record.round_id << '\t' << record.initiation_event_id << '\t' << joined_via_name(record.joined_via)
       << '\t' << record.published_unix;
  if (const Result written = append_line(kNetworkFile, line.str()); !written.ok) {
    return written;
  }

  network_records_.emplace(record.round_id, record);
  stored = record;
  inserted = true;
  return Result::success("Network record stored.", record.initiation_event_id);
}

std::optional<RoundNetworkRecord> Store::network_record(RoundId round_id) const {
  std::shared_lock lock(mutex_);
  const auto it = network_records_.find(round_id);
  if (it == network_records_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<RoundId> Store::round_for_initiation(std::string_view initiation_event_id) const {
  std::shared_lock lock(mutex_);
  for (const auto& [round_id, record] : network_records_) {
    if (record.initiation_event_id == initiation_event_id) {
      return round_id;
    }
  }
  return std::nullopt;
}

Result Store::upsert_remote_scores(RoundId round_id, std::string_view pubkey_hex, const ScoreMap& scores,
                                   std::int64_t event_created_at) {
  std::unique_lock lock(mutex_);
  const auto key = std::make_pair(round_id, std::string{pubkey_hex});
  if (const auto it = remote_scores_.find(key); it != remote_scores_.end() && it->second.second > event_created_at) {
    return Result::success("Stored remote snapshot is newer.", "stale");
  }

  std::ostringstream line;
  line << round_id << '\t' << pubkey_hex << '\t' << event_created_at << '\t' << serialize_score_map(scores);
  if (const Result written = append_line(kRemoteScoresFile, line.str()); !written.ok) {
    return written;
  }
  remote_scores_[key] = {scores, event_created_at};
  return Result::success("Remote snapshot stored.", "stored");
}

std::map<std::string, ScoreMap> Store::remote_scores(RoundId round_id) const {
  std::shared_lock lock(mutex_);
  std::map<std::string, ScoreMap> out;
  for (const auto& [key, value] : remote_scores_) {
    if (key.first == round_id) {
      out[key.second] = value.first;
    }
  }
  return out;
}

Result Store::put_profile(const Profile& profile) {
  std::unique_lock lock(mutex_);
  const auto previous = profiles_.find(profile.pubkey_hex);
  std::optional<Profile> backup;
  if (previous != profiles_.end()) {
    backup = previous->second;
  }
  profiles_[profile.pubkey_hex] = profile;
  const Result persisted = persist_profiles_locked();
  if (!persisted.ok) {
    if (backup.has_value()) {
      profiles_[profile.pubkey_hex] = *backup;
    } else {
      profiles_.erase(profile.pubkey_hex);
    }
  }
  return persisted;
}

std::optional<Profile> Store::profile(std::string_view pubkey_hex) const {
  std::shared_lock lock(mutex_);
  const auto it = profiles_.find(pubkey_hex);
  if (it == profiles_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<Profile> Store::profiles() const {
  std::shared_lock lock(mutex_);
  std::vector<Profile> out;
  for (const auto& [key, profile] : profiles_) {
    out.push_back(profile);
  }
  return out;
}

Result Store::put_follow_list(const CachedFollowList& list) {
  if (const Result valid = check_member_list(list.pubkey_hex, list.follows); !valid.ok) {
    return valid;
  }
  std::unique_lock lock(mutex_);
  auto previous = follow_lists_;
  follow_lists_[list.pubkey_hex] = list;
  const Result persisted = persist_follow_lists_locked();
  if (!persisted.ok) {
    follow_lists_ = std::move(previous);
  }
  return persisted;
}

std::optional<CachedFollowList> Store::follow_list(std::string_view pubkey_hex) const {
  std::shared_lock lock(mutex_);
  const auto it = follow_lists_.find(pubkey_hex);
  if (it == follow_lists_.end()) {
    return std::nullopt;
  }
  return it->second;
}

Result Store::put_relay_list(const CachedRelayList& list) {
  if (!util::is_hex_of_size(list.pubkey_hex, 32)) {
    return Result::failure(ErrorCode::InvalidInput, "Cached list owner must be 64 hex characters.");
  }
  for (const auto& relay : list.relays) {
    if (!list_field_safe(relay.url) || (!relay.marker.empty() && !list_field_safe(relay.marker))) {
      return Result::failure(ErrorCode::InvalidInput, "Relay entry contains a reserved character.");
    }
  }
  if (!std::ranges::all_of(list.inbox_relays, list_field_safe)) {
    return Result::failure(ErrorCode::InvalidInput, "Inbox relay contains a reserved character.");
  }
  std::unique_lock lock(mutex_);
  auto previous = relay_lists_;
  relay_lists_[list.pubkey_hex] = list;
  const Result persisted = persist_relay_lists_locked();
  if (!persisted.ok) {
    relay_lists_ = std::move(previous);
  }
  return persisted;
}

std::optional<CachedRelayList> Store::relay_list(std::string_view pubkey_hex) const {
  std::shared_lock lock(mutex_);
  const auto it = relay_lists_.find(pubkey_hex);
  if (it == relay_lists_.end()) {
    return std::nullopt;
  }
  return it->second;
}

Result Store::put_favorites(const CachedFavorites& favorites) {
  if (const Result valid = check_member_list(favorites.pubkey_hex, favorites.members); !valid.ok) {
    return valid;
  }
  std::unique_lock lock(mutex_);
  auto previous = favorites_;
  favorites_[favorites.pubkey_hex] = favorites;
  const Result persisted = persist_favorites_locked();
  if (!persisted.ok) {
    favorites_ = std::move(previous);
  }
  return persisted;
}

std::optional<CachedFavorites> Store::favorites(std::string_view pubkey_hex) const {
  std::shared_lock lock(mutex_);
  const auto it = favorites_.find(pubkey_hex);
  if (it == favorites_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t Store::skipped_line_count() const {
  std::shared_lock lock(mutex_);
  return skipped_lines_;
}

std::string Store::path_for(std::string_view file_name) const {
  return (std::filesystem::path{app_data_dir_} / std::string{file_name}).string();
}

Result Store::append_line(std::string_view file_name, std::string_view line) const {
  if (app_data_dir_.empty()) {
    return Result::failure(ErrorCode::Storage, "Store is not open.");
  }

  std::ofstream out(path_for(file_name), std::ios::out | std::ios::app);
  if (!out) {
    return Result::failure(ErrorCode::Storage, "Failed to open " + std::string{file_name} + " for append.");
  }

  out << line << '\n';
  out.flush();
  if (!out.good()) {
    return Result::failure(ErrorCode::Storage, "Failed to flush " + std::string{file_name} + ".");
  }
  return Result::success();
}

Result Store::rewrite_cache_file(std::string_view file_name, const std::vector<std::string>& lines) const {
  const std::string path = path_for(file_name);
  const std::string temp_path = path + ".tmp";
  {
    std::ofstream out(temp_path, std::ios::out | std::ios::trunc);
    if (!out) {
      return Result::failure(ErrorCode::Storage, "Failed to rewrite " + std::string{file_name} + ".");
    }
    for (const auto& line : lines) {
      out << line << '\n';
    }
    if (!out.good()) {
      return Result::failure(ErrorCode::Storage, "Failed flushing " + std::string{file_name} + ".");
    }
  }

  std::error_code ec;
  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    return Result::failure(ErrorCode::Storage, "Failed to replace " + std::string{file_name} + ": " + ec.message());
  }
  return Result::success();
}

Result Store::load_courses() {
  courses_.clear();
  return read_lines(path_for(kCoursesFile), [&](const std::vector<std::string>& fields) {
    CourseSnapshot snapshot;
    if (fields.size() != 6 || !parse_holes(fields[3], snapshot.holes) ||
        !parse_int64(fields[5], snapshot.created_unix)) {
      ++skipped_lines_;
      return;
    }
    snapshot.content_hash = fields[0];
    snapshot.course_name = util::from_hex(fields[1]);
    snapshot.tee_set = util::from_hex(fields[2]);
    snapshot.canonical_json = util::from_hex(fields[4]);
    courses_.emplace(snapshot.content_hash, std::move(snapshot));
  });
}

Result Store::load_rounds() {
  rounds_.clear();
  players_.clear();
  next_round_id_ = 1;

  const Result players_loaded = read_lines(path_for(kPlayersFile), [&](const std::vector<std::string>& fields) {
    RoundPlayer player;
    if (fields.size() != 3 || !parse_int64(fields[0], player.round_id) ||
        !parse_int(fields[1], player.player_index)) {
      ++skipped_lines_;
      return;
    }
    player.pubkey_hex = fields[2];
    next_round_id_ = std::max(next_round_id_, player.round_id + 1);
    players_[player.round_id].push_back(std::move(player));
  });
  if (!players_loaded.ok) {
    return players_loaded;
  }

  const Result rounds_loaded = read_lines(path_for(kRoundsFile), [&](const std::vector<std::string>& fields) {
    Round round;
    std::int64_t player_count = 0;
    if (fields.size() != 5 || !parse_int64(fields[0], round.round_id) || !parse_int64(fields[3], round.created_unix) ||
        !parse_int64(fields[4], player_count)) {
      ++skipped_lines_;
      return;
    }
    const auto players = players_.find(round.round_id);
    if (players == players_.end() || static_cast<std::int64_t>(players->second.size()) != player_count) {
      ++skipped_lines_;
      return;
    }
    round.course_hash = fields[1];
    round.round_date = util::from_hex(fields[2]);
    next_round_id_ = std::max(next_round_id_, round.round_id + 1);
    rounds_.emplace(round.round_id, std::move(round));
  });
  if (!rounds_loaded.ok) {
    return rounds_loaded;
  }

  std::erase_if(players_, [&](const auto& entry) { return !rounds_.contains(entry.first); });
  for (auto& [round_id, players] : players_) {
    std::ranges::sort(players, {}, &RoundPlayer::player_index);
  }
  return Result::success();
}

Result Store::load_scores() {
  scores_.clear();
  next_score_id_ = 1;
  return read_lines(path_for(kScoresFile), [&](const std::vector<std::string>& fields) {
    HoleScoreEvent event;
    if (fields.size() != 6 || !parse_int64(fields[0], event.score_id) || !parse_int64(fields[1], event.round_id) ||
        !parse_int(fields[2], event.player_index) || !parse_int(fields[3], event.hole_number) ||
        !parse_int(fields[4], event.strokes) || !parse_int64(fields[5], event.recorded_at_ms)) {
      ++skipped_lines_;
      return;
    }
    next_score_id_ = std::max(next_score_id_, event.score_id + 1);
    scores_.push_back(event);
  });
}

Result Store::load_round_events() {
  round_events_.clear();
  return read_lines(path_for(kRoundEventsFile), [&](const std::vector<std::string>& fields) {
    RoundEvent event;
    if (fields.size() != 3 || !parse_int64(fields[0], event.round_id) || !parse_int64(fields[2], event.unix_ts)) {
      ++skipped_lines_;
      return;
    }
    event.kind = fields[1];
    // Rows written for a round whose commit row never landed.
    if (!rounds_.contains(event.round_id)) {
      return;
    }
    round_events_.push_back(std::move(event));
  });
}

Result Store::load_network_records() {
  network_records_.clear();
  return read_lines(path_for(kNetworkFile), [&](const std::vector<std::string>& fields) {
    RoundNetworkRecord record;
    const auto via = fields.size() == 4 ? joined_via_from_name(fields[2]) : std::nullopt;
    if (!via.has_value() || !parse_int64(fields[0], record.round_id) ||
        !parse_int64(fields[3], record.published_unix)) {
      ++skipped_lines_;
      return;
    }
    record.initiation_event_id = fields[1];
    record.joined_via = *via;
    if (!rounds_.contains(record.round_id)) {
      return;
    }
    // First write wins.
    network_records_.emplace(record.round_id, std::move(record));
  });
}

Result Store::load_remote_scores() {
  remote_scores_.clear();
  return read_lines(path_for(kRemoteScoresFile), [&](const std::vector<std::string>& fields) {
    RoundId round_id = 0;
    std::int64_t created_at = 0;
    ScoreMap scores;
    if (fields.size() != 4 || !parse_int64(fields[0], round_id) || !parse_int64(fields[2], created_at) ||
        !parse_score_map(fields[3], scores)) {
      ++skipped_lines_;
      return;
    }
    auto& slot = remote_scores_[{round_id, fields[1]}];
    if (slot.first.empty() || created_at >= slot.second) {
      slot = {std::move(scores), created_at};
    }
  });
}

Result Store::load_caches() {
  profiles_.clear();
  follow_lists_.clear();
  relay_lists_.clear();
  favorites_.clear();

  const Result profiles_loaded = read_lines(path_for(kProfilesFile), [&](const std::vector<std::string>& fields) {
    if (fields.size() != 2) {
      ++skipped_lines_;
      return;
    }
    const auto values = util::parse_canonical_map(util::from_hex(fields[1]));
    Profile profile;
    profile.pubkey_hex = fields[0];
    profile.name = get_optional(values, "name");
    profile.display_name = get_optional(values, "display_name");
    profile.about = get_optional(values, "about");
    profile.picture = get_optional(values, "picture");
    profile.banner = get_optional(values, "banner");
    profile.nip05 = get_optional(values, "nip05");
    profile.event_created_unix = get_int64(values, "event_created_unix");
    profile.cached_unix = get_int64(values, "cached_unix");
    profiles_[profile.pubkey_hex] = std::move(profile);
  });
  if (!profiles_loaded.ok) {
    return profiles_loaded;
  }

  const Result follows_loaded = read_lines(path_for(kFollowListsFile), [&](const std::vector<std::string>& fields) {
    CachedFollowList list;
    if (fields.size() != 4 || !parse_int64(fields[1], list.event_created_unix) ||
        !parse_int64(fields[2], list.cached_unix)) {
      ++skipped_lines_;
      return;
    }
    list.pubkey_hex = fields[0];
    list.follows = split_list(fields[3]);
    follow_lists_[list.pubkey_hex] = std::move(list);
  });
  if (!follows_loaded.ok) {
    return follows_loaded;
  }

  const Result relays_loaded = read_lines(path_for(kRelayListsFile), [&](const std::vector<std::string>& fields) {
    CachedRelayList list;
    if (fields.size() != 5 || !parse_int64(fields[1], list.event_created_unix) ||
        !parse_int64(fields[2], list.cached_unix)) {
      ++skipped_lines_;
      return;
    }
    list.pubkey_hex = fields[0];
    for (const auto& entry : split_list(fields[3])) {
      const std::size_t bar = entry.find('|');
      list.relays.push_back({entry.substr(0, bar), bar == std::string::npos ? "" : entry.substr(bar + 1U)});
    }
    list.inbox_relays = split_list(fields[4]);
    relay_lists_[list.pubkey_hex] = std::move(list);
  });
  if (!relays_loaded.ok) {
    return relays_loaded;
  }

  return read_lines(path_for(kFavoritesFile), [&](const std::vector<std::string>& fields) {
    CachedFavorites favorites;
    if (fields.size() != 4 || !parse_int64(fields[1], favorites.event_created_unix) ||
        !parse_int64(fields[2], favorites.cached_unix)) {
      ++skipped_lines_;
      return;
    }
    favorites.pubkey_hex = fields[0];
    favorites.members = split_list(fields[3]);
    favorites_[favorites.pubkey_hex] = std::move(favorites);
  });
}

Result Store::persist_profiles_locked() const {
  std::vector<std::string> lines{"# gambit cached_profiles"};
  for (const auto& [pubkey, profile] : profiles_) {
    std::vector<std::pair<std::string, std::string>> fields{
        {"event_created_unix", std::to_string(profile.event_created_unix)},
        {"cached_unix", std::to_string(profile.cached_unix)},
    };
    put_optional(fields, "name", profile.name);
    put_optional(fields, "display_name", profile.display_name);
    put_optional(fields, "about", profile.about);
    put_optional(fields, "picture", profile.picture);
    put_optional(fields, "banner", profile.banner);
    put_optional(fields, "nip05", profile.nip05);
    lines.push_back(pubkey + "\t" + util::to_hex(util::canonical_join(std::move(fields))));
  }
  return rewrite_cache_file(kProfilesFile, lines);
}

Result Store::persist_follow_lists_locked() const {
  std::vector<std::string> lines{"# gambit cached_follow_lists"};
  for (const auto& [pubkey, list] : follow_lists_) {
    lines.push_back(pubkey + "\t" + std::to_string(list.event_created_unix) + "\t" +
                    std::to_string(list.cached_unix) + "\t" + join(list.follows, ','));
  }
  return rewrite_cache_file(kFollowListsFile, lines);
}

Result Store::persist_relay_lists_locked() const {
  std::vector<std::string> lines{"# gambit cached_relay_lists"};
  for (const auto& [pubkey, list] : relay_lists_) {
    std::vector<std::string> relays;
    for (const auto& relay : list.relays) {
      relays.push_back(relay.marker.empty() ? relay.url : relay.url + "|" + relay.marker);
    }
    lines.push_back(pubkey + "\t" + std::to_string(list.event_created_unix) + "\t" +
                    std::to_string(list.cached_unix) + "\t" + join(relays, ',') + "\t" +
                    join(list.inbox_relays, ','));
  }
  return rewrite_cache_file(kRelayListsFile, lines);
}

Result Store::persist_favorites_locked() const {
  std::vector<std::string> lines{"# gambit cached_favorites"};
  for (const auto& [pubkey, favorites] : favorites_) {
    lines.push_back(pubkey + "\t" + std::to_string(favorites.event_created_unix) + "\t" +
                    std::to_string(favorites.cached_unix) + "\t" + join(favorites.members, ','));
  }
  return rewrite_cache_file(kFavoritesFile, lines);
}

}  // namespace gambit
