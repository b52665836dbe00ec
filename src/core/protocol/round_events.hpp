#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"
#include "core/protocol/event.hpp"

namespace gambit {

struct InitiationData {
  std::string event_id;
  std::string author;
  std::string course_hash;
  std::string rules_hash;
  std::string round_date;
  std::vector<std::string> players;
  std::string course_name;
  std::string tee_set;
  std::vector<HoleDefinition> holes;
};

struct FinalRecord {
  std::string event_id;
  std::string author;
  std::string scored_pubkey;
  std::string initiation_event_id;
  ScoreMap scores;
  int total = 0;
  std::int64_t created_at = 0;
};

struct LiveScorecard {
  std::string author;
  std::string initiation_event_id;
  std::string status;
  ScoreMap scores;
  std::int64_t created_at = 0;
};

inline constexpr std::string_view kStatusInProgress = "in_progress";
inline constexpr std::string_view kStatusCompleted = "completed";

// Builders return unsigned events with created_at set to now.
Result build_initiation_event(const CourseSnapshot& course, const std::vector<std::string>& players,
                              std::string_view round_date, NetworkEvent& out);
Result build_final_record_event(std::string_view initiation_event_id, const ScoreMap& scores,
                                std::string_view scored_pubkey, const std::vector<std::string>& players,
                                NetworkEvent& out);
Result build_live_scorecard_event(std::string_view initiation_event_id, const ScoreMap& scores,
                                  std::string_view status, const std::vector<std::string>& players,
                                  NetworkEvent& out);

// Recomputes course and rules hashes from the content. UntrustedContent on mismatch.
Result parse_initiation_event(const NetworkEvent& event, InitiationData& out);
Result parse_final_record(const NetworkEvent& event, FinalRecord& out);
Result parse_live_scorecard(const NetworkEvent& event, LiveScorecard& out);

int score_total(const ScoreMap& scores);

}  // namespace gambit
