#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/model/types.hpp"
#include "core/round/round_aggregate.hpp"

namespace gambit {

struct ScorecardState {
  RoundId round_id = 0;
  int player_index = 0;
  int player_count = 0;
  HoleNumber current_hole = 0;
  int current_par = 0;
  Strokes current_strokes = 0;  // par until the hole is scored
  bool current_hole_scored = false;
  bool on_last_hole = false;
  int holes_scored = 0;
  int hole_count = 0;
  int total_strokes = 0;
  int scored_par = 0;
  std::string score_to_par = "E";
  bool finish_enabled = false;
  bool completed = false;
};

std::string score_to_par_label(int strokes_minus_par);

// Headless scorecard for one round. Each stroke change is appended to the score log
// before the command returns.
class ScorecardSession {
public:
  explicit ScorecardSession(RoundAggregate& rounds) : rounds_(rounds) {}

  // Resumes at the local player's first unscored hole, or the last hole when all are scored.
  Result load(RoundId round_id);

  Result confirm_at_par();
  Result increment();
  Result decrement();
  Result advance_hole();
  Result retreat_hole();
  Result switch_player(int player_index);
  Result request_finish();

  [[nodiscard]] ScorecardState snapshot() const;
  [[nodiscard]] bool loaded() const { return loaded_; }

private:
  [[nodiscard]] const HoleDefinition* current_hole() const;
  [[nodiscard]] bool finish_enabled() const;
  Result write_strokes(Strokes strokes);
  Result confirm_if_unscored();

  RoundAggregate& rounds_;
  RoundId round_id_ = 0;
  std::vector<HoleDefinition> holes_;
  int player_count_ = 0;
  std::size_t hole_index_ = 0;
  int player_index_ = kLocalPlayerIndex;
  bool multi_device_ = false;
  bool loaded_ = false;
};

}  // namespace gambit
