#include "core/round/round_aggregate.hpp"

#include <algorithm>
#include <set>

#include "core/util/canonical.hpp"
#include "core/util/log.hpp"

namespace gambit {
namespace {

constexpr std::string_view kCompletedEvent = "completed";
constexpr std::string_view kMultiDeviceEvent = "multi_device";

}  // namespace

Result RoundAggregate::validate_players(const std::vector<std::string>& player_pubkeys) {
  if (player_pubkeys.empty()) {
    return Result::failure(ErrorCode::InvalidPlayerSet, "A round needs at least the creator.");
  }

  std::set<std::string> seen;
  for (const auto& pubkey : player_pubkeys) {
    if (!util::is_hex_of_size(pubkey, 32) || util::lowercase_copy(pubkey) != pubkey) {
      return Result::failure(ErrorCode::InvalidPlayerSet, "Player key is not 64 lowercase hex characters: " + pubkey);
    }
    if (!seen.insert(pubkey).second) {
      return Result::failure(ErrorCode::InvalidPlayerSet, "Player key appears twice: " + pubkey);
    }
  }
  return Result::success();
}

Result RoundAggregate::create_round(const CourseSnapshot& course, const std::vector<std::string>& player_pubkeys,
                                    std::string_view round_date, bool multi_device, Round& out) {
  if (const Result valid = validate_players(player_pubkeys); !valid.ok) {
    return valid;
  }
  if (!store_.course(course.content_hash).has_value()) {
    return Result::failure(ErrorCode::NotFound, "Course snapshot is not stored locally.");
  }

  const std::string date =
      round_date.empty() ? util::iso8601_utc(util::unix_timestamp_now()).substr(0, 10) : std::string{round_date};

  Round round;
  if (const Result inserted = store_.insert_round(course.content_hash, date, player_pubkeys, round); !inserted.ok) {
    return inserted;
  }
  if (multi_device) {
    if (const Result marked = store_.append_round_event(round.round_id, kMultiDeviceEvent); !marked.ok) {
      return marked;
    }
  }

  util::log_info("round", "Created round " + std::to_string(round.round_id) + " at " + course.course_name +
                              " with " + std::to_string(player_pubkeys.size()) + " players.");
  out = round;
  return Result::success("Round created.", std::to_string(round.round_id));
}

Result RoundAggregate::create_joined_round(const CourseSnapshot& course,
                                           const std::vector<std::string>& player_pubkeys,
                                           std::string_view round_date, std::string_view initiation_event_id,
                                           Round& out) {
  if (const Result valid = validate_players(player_pubkeys); !valid.ok) {
    return valid;
  }
  const std::string date =
      round_date.empty() ? util::iso8601_utc(util::unix_timestamp_now()).substr(0, 10) : std::string{round_date};

  const RoundNetworkRecord record{
      .initiation_event_id = std::string{initiation_event_id},
      .joined_via = JoinedVia::Joined,
      .published_unix = util::unix_timestamp_now(),
  };
  if (const Result inserted =
          store_.insert_joined_round(course.content_hash, date, player_pubkeys, record, kMultiDeviceEvent, out);
      !inserted.ok) {
    return inserted;
  }
  util::log_info("round", "Joined round " + std::to_string(out.round_id) + " at " + course.course_name + ".");
  return Result::success("Round joined.", std::to_string(out.round_id));
}

Result RoundAggregate::record_score(RoundId round_id, int player_index, HoleNumber hole_number, Strokes strokes) {
  return record_score_at(round_id, player_index, hole_number, strokes, util::unix_millis_now());
}

Result RoundAggregate::record_score_at(RoundId round_id, int player_index, HoleNumber hole_number, Strokes strokes,
                                       std::int64_t recorded_at_ms) {
  if (strokes < kMinStrokes || strokes > kMaxStrokes) {
    return Result::failure(ErrorCode::InvalidInput, "Strokes must be between 1 and 20.");
  }

  const auto course = course_for(round_id);
  if (!course.has_value()) {
    return Result::failure(ErrorCode::NotFound, "Round " + std::to_string(round_id) + " does not exist.");
  }
  if (std::ranges::none_of(course->holes, [&](const HoleDefinition& hole) { return hole.hole_number == hole_number; })) {
    return Result::failure(ErrorCode::InvalidInput, "Hole " + std::to_string(hole_number) + " is not on this course.");
  }
  const auto players = store_.players(round_id);
  if (player_index < 0 || player_index >= static_cast<int>(players.size())) {
    return Result::failure(ErrorCode::InvalidInput, "Player index " + std::to_string(player_index) +
                                                        " is not in round " + std::to_string(round_id) + ".");
  }

  HoleScoreEvent event;
  return store_.append_score(round_id, player_index, hole_number, strokes, recorded_at_ms, event);
}

ScoreMap RoundAggregate::current_scores(RoundId round_id, int player_index) const {
  return store_.current_scores(round_id, player_index);
}

bool RoundAggregate::is_finish_enabled(RoundId round_id, int player_index) const {
  const auto course = course_for(round_id);
  if (!course.has_value() || course->holes.empty()) {
    return false;
  }

  const ScoreMap scores = store_.current_scores(round_id, player_index);
  return std::ranges::all_of(course->holes,
                             [&](const HoleDefinition& hole) { return scores.contains(hole.hole_number); });
}

Result RoundAggregate::complete_round(RoundId round_id) {
  if (!store_.round(round_id).has_value()) {
    return Result::failure(ErrorCode::NotFound, "Round " + std::to_string(round_id) + " does not exist.");
  }
  if (store_.has_round_event(round_id, kCompletedEvent)) {
    return Result::success("Round already completed.");
  }
  if (const Result appended = store_.append_round_event(round_id, kCompletedEvent); !appended.ok) {
    return appended;
  }
  return Result::success("Round completed.");
}

bool RoundAggregate::is_completed(RoundId round_id) const {
  return store_.has_round_event(round_id, kCompletedEvent);
}

bool RoundAggregate::is_multi_device(RoundId round_id) const {
  return store_.has_round_event(round_id, kMultiDeviceEvent);
}

std::vector<RoundListItem> RoundAggregate::list_rounds() const {
  std::vector<RoundListItem> items;
  for (const auto& round : store_.rounds()) {
    RoundListItem item;
    item.round_id = round.round_id;
    item.round_date = round.round_date;
    item.completed = is_completed(round.round_id);
    if (const auto course = store_.course(round.course_hash); course.has_value()) {
      item.course_name = course->course_name;
      item.tee_set = course->tee_set;
      item.hole_count = course->hole_count();
    }

    const ScoreMap scores = store_.current_scores(round.round_id, kLocalPlayerIndex);
    item.holes_scored = static_cast<int>(scores.size());
    if (!scores.empty()) {
      int total = 0;
      for (const auto& [hole, strokes] : scores) {
        total += strokes;
      }
      item.total_strokes = total;
    }
    items.push_back(std::move(item));
  }

  std::ranges::sort(items, [](const RoundListItem& lhs, const RoundListItem& rhs) {
    return lhs.round_id > rhs.round_id;
  });
  return items;
}

std::optional<Round> RoundAggregate::round(RoundId round_id) const {
  return store_.round(round_id);
}

std::vector<RoundPlayer> RoundAggregate::players(RoundId round_id) const {
  return store_.players(round_id);
}

std::vector<std::string> RoundAggregate::player_pubkeys(RoundId round_id) const {
  std::vector<std::string> keys;
  for (const auto& player : store_.players(round_id)) {
    keys.push_back(player.pubkey_hex);
  }
  return keys;
}

std::optional<CourseSnapshot> RoundAggregate::course_for(RoundId round_id) const {
  const auto round = store_.round(round_id);
  if (!round.has_value()) {
    return std::nullopt;
  }
  return store_.course(round->course_hash);
}

}  // namespace gambit
