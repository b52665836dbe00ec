#include "core/protocol/round_events.hpp"

#include <charconv>

#include "core/course/course_store.hpp"
#include "core/model/app_meta.hpp"
#include "core/util/canonical.hpp"
#include "core/util/canonical_json.hpp"
#include "core/util/hash.hpp"

namespace gambit {
namespace {

bool parse_int(std::string_view text, int& out) {
  int value = 0;
  const auto result = std::from_chars(text.data(), text.data() + text.size(), value);
  if (result.ec != std::errc() || result.ptr != text.data() + text.size()) {
    return false;
  }
  out = value;
  return true;
}

void append_common_tags(std::vector<EventTag>& tags) {
  tags.push_back({"t", "golf"});
  tags.push_back({"t", std::string{kHashtag}});
  tags.push_back({"client", std::string{kClientTag}});
}

void append_score_tags(std::vector<EventTag>& tags, const ScoreMap& scores) {
  for (const auto& [hole, strokes] : scores) {
    tags.push_back({"score", std::to_string(hole), std::to_string(strokes)});
  }
}

Result read_score_tags(const NetworkEvent& event, ScoreMap& out) {
  out.clear();
  for (const auto& tag : event.tags) {
    if (tag.empty() || tag[0] != "score") {
      continue;
    }
    int hole = 0;
    int strokes = 0;
    if (tag.size() < 3 || !parse_int(tag[1], hole) || !parse_int(tag[2], strokes) || strokes < kMinStrokes ||
        strokes > kMaxStrokes) {
      return Result::failure(ErrorCode::InvalidInput, "Malformed score tag in event " + event.id);
    }
    out[hole] = strokes;
  }
  return Result::success();
}

}  // namespace

int score_total(const ScoreMap& scores) {
  int total = 0;
  for (const auto& [hole, strokes] : scores) {
    total += strokes;
  }
  return total;
}

Result build_initiation_event(const CourseSnapshot& course, const std::vector<std::string>& players,
                              std::string_view round_date, NetworkEvent& out) {
  nlohmann::json snapshot;
  if (const Result parsed = util::parse_json(course.canonical_json, snapshot); !parsed.ok) {
    return Result::failure(ErrorCode::Storage, "Stored course snapshot is not valid JSON.");
  }

  const Result content = util::canonical_json({
      {"course_snapshot", snapshot},
      {"rules_template", CourseStore::rules_template()},
  });
  if (!content.ok) {
    return content;
  }

  NetworkEvent event;
  event.kind = event_kind::kRoundInitiation;
  event.created_at = util::unix_timestamp_now();
  event.content = content.data;
  event.tags = {
      {"course_hash", course.content_hash},
      {"rules_hash", CourseStore::rules_hash()},
      {"date", std::string{round_date}},
  };
  append_common_tags(event.tags);
  for (const auto& pubkey : players) {
    event.tags.push_back({"p", pubkey});
  }

  out = std::move(event);
  return Result::success();
}

Result build_final_record_event(std::string_view initiation_event_id, const ScoreMap& scores,
                                std::string_view scored_pubkey, const std::vector<std::string>& players,
                                NetworkEvent& out) {
  if (initiation_event_id.empty()) {
    return Result::failure(ErrorCode::InvalidInput, "A final record must reference an initiation event.");
  }

  nlohmann::json score_array = nlohmann::json::array();
  for (const auto& [hole, strokes] : scores) {
    score_array.push_back({{"hole_number", hole}, {"strokes", strokes}});
  }
  const int total = score_total(scores);
  const Result content = util::canonical_json({{"scores", score_array}, {"total", total}});
  if (!content.ok) {
    return content;
  }

  NetworkEvent event;
  event.kind = event_kind::kFinalRecord;
  event.created_at = util::unix_timestamp_now();
  event.content = content.data;
  event.tags = {
      {"e", std::string{initiation_event_id}},
      {"total", std::to_string(total)},
  };
  append_common_tags(event.tags);
  append_score_tags(event.tags, scores);
  event.tags.push_back({"scored_by", std::string{scored_pubkey}});
  event.tags.push_back({"p", std::string{scored_pubkey}});
  for (const auto& pubkey : players) {
    if (pubkey != scored_pubkey) {
      event.tags.push_back({"p", pubkey});
    }
  }

  out = std::move(event);
  return Result::success();
}

Result build_live_scorecard_event(std::string_view initiation_event_id, const ScoreMap& scores,
                                  std::string_view status, const std::vector<std::string>& players,
                                  NetworkEvent& out) {
  if (initiation_event_id.empty()) {
    return Result::failure(ErrorCode::InvalidInput, "A live scorecard must reference an initiation event.");
  }

  NetworkEvent event;
  event.kind = event_kind::kLiveScorecard;
  event.created_at = util::unix_timestamp_now();
  event.tags = {
      {"d", std::string{initiation_event_id}},
      {"e", std::string{initiation_event_id}},
      {"status", std::string{status}},
  };
  append_common_tags(event.tags);
  append_score_tags(event.tags, scores);
  for (const auto& pubkey : players) {
    event.tags.push_back({"p", pubkey});
  }

  out = std::move(event);
  return Result::success();
}

Result parse_initiation_event(const NetworkEvent& event, InitiationData& out) {
  if (event.kind != event_kind::kRoundInitiation) {
    return Result::failure(ErrorCode::InvalidInput, "Event is not a round initiation.");
  }

  const auto course_hash = event.first_tag_value("course_hash");
  const auto rules_hash = event.first_tag_value("rules_hash");
  if (!course_hash.has_value() || !rules_hash.has_value()) {
    return Result::failure(ErrorCode::InvalidInput, "Round initiation is missing course_hash or rules_hash.");
  }

  nlohmann::json content;
  if (const Result parsed = util::parse_json(event.content, content); !parsed.ok) {
    return parsed;
  }
  if (!content.is_object() || !content.contains("course_snapshot") || !content.contains("rules_template")) {
    return Result::failure(ErrorCode::InvalidInput, "Round initiation content is incomplete.");
  }

  const Result course_text = util::canonical_json(content["course_snapshot"]);
  if (!course_text.ok) {
    return course_text;
  }
  if (const Result verified = CourseStore::verify_embedded(course_text.data, *course_hash); !verified.ok) {
    return verified;
  }
  const Result rules_text = util::canonical_json(content["rules_template"]);
  if (!rules_text.ok) {
    return rules_text;
  }
  if (util::sha256_hex(rules_text.data) != *rules_hash) {
    return Result::failure(ErrorCode::UntrustedContent, "Rules hash does not match the embedded rules template.");
  }

  InitiationData data;
  if (const Result course = CourseStore::parse_course_json(content["course_snapshot"], data.course_name,
                                                          data.tee_set, data.holes);
      !course.ok) {
    return course;
  }
  data.event_id = event.id;
  data.author = event.pubkey;
  data.course_hash = *course_hash;
  data.rules_hash = *rules_hash;
  data.round_date = event.first_tag_value("date").value_or("");
  data.players = event.tag_values("p");
  out = std::move(data);
  return Result::success("Round initiation verified.", out.event_id);
}

Result parse_final_record(const NetworkEvent& event, FinalRecord& out) {
  if (event.kind != event_kind::kFinalRecord) {
    return Result::failure(ErrorCode::InvalidInput, "Event is not a final round record.");
  }

  FinalRecord record;
  const auto initiation = event.first_tag_value("e");
  if (!initiation.has_value()) {
    return Result::failure(ErrorCode::InvalidInput, "Final record does not reference an initiation event.");
  }
  if (const Result scores = read_score_tags(event, record.scores); !scores.ok) {
    return scores;
  }

  const auto total = event.first_tag_value("total");
  if (!total.has_value() || !parse_int(*total, record.total)) {
    record.total = score_total(record.scores);
  }

  record.event_id = event.id;
  record.author = event.pubkey;
  record.initiation_event_id = *initiation;
  record.scored_pubkey = event.first_tag_value("scored_by").value_or(event.pubkey);
  record.created_at = event.created_at;
  out = std::move(record);
  return Result::success();
}

Result parse_live_scorecard(const NetworkEvent& event, LiveScorecard& out) {
  if (event.kind != event_kind::kLiveScorecard) {
    return Result::failure(ErrorCode::InvalidInput, "Event is not a live scorecard.");
  }

  LiveScorecard card;
  const auto d_tag = event.d_tag();
  if (!d_tag.has_value()) {
    return Result::failure(ErrorCode::InvalidInput, "Live scorecard has no d tag.");
  }
  if (const Result scores = read_score_tags(event, card.scores); !scores.ok) {
    return scores;
  }

  card.author = event.pubkey;
  card.initiation_event_id = *d_tag;
  card.status = event.first_tag_value("status").value_or(std::string{kStatusInProgress});
  card.created_at = event.created_at;
  out = std::move(card);
  return Result::success();
}

}  // namespace gambit
