#include "core/round/scorecard_session.hpp"

#include <algorithm>

namespace gambit {

std::string score_to_par_label(int strokes_minus_par) {
  if (strokes_minus_par == 0) {
    return "E";
  }
  return strokes_minus_par > 0 ? "+" + std::to_string(strokes_minus_par) : std::to_string(strokes_minus_par);
}

Result ScorecardSession::load(RoundId round_id) {
  const auto course = rounds_.course_for(round_id);
  if (!course.has_value()) {
    return Result::failure(ErrorCode::NotFound, "Round " + std::to_string(round_id) + " does not exist.");
  }

  round_id_ = round_id;
  holes_ = course->holes;
  player_count_ = static_cast<int>(rounds_.players(round_id).size());
  player_index_ = kLocalPlayerIndex;
  multi_device_ = rounds_.is_multi_device(round_id);

  const ScoreMap scores = rounds_.current_scores(round_id, kLocalPlayerIndex);
  const auto first_unscored = std::ranges::find_if(
      holes_, [&](const HoleDefinition& hole) { return !scores.contains(hole.hole_number); });
  hole_index_ = first_unscored != holes_.end() ? static_cast<std::size_t>(first_unscored - holes_.begin())
                                               : holes_.size() - 1U;
  loaded_ = true;
  return Result::success("Scorecard loaded.");
}

const HoleDefinition* ScorecardSession::current_hole() const {
  if (!loaded_ || hole_index_ >= holes_.size()) {
    return nullptr;
  }
  return &holes_[hole_index_];
}

Result ScorecardSession::write_strokes(Strokes strokes) {
  const HoleDefinition* hole = current_hole();
  if (hole == nullptr) {
    return Result::failure(ErrorCode::InvalidInput, "No scorecard is loaded.");
  }
  return rounds_.record_score(round_id_, player_index_, hole->hole_number,
                              std::clamp(strokes, kMinStrokes, kMaxStrokes));
}

Result ScorecardSession::confirm_if_unscored() {
  const HoleDefinition* hole = current_hole();
  if (hole == nullptr) {
    return Result::failure(ErrorCode::InvalidInput, "No scorecard is loaded.");
  }
  if (rounds_.current_scores(round_id_, player_index_).contains(hole->hole_number)) {
    return Result::success("Hole already scored.");
  }
  return write_strokes(hole->par);
}

Result ScorecardSession::confirm_at_par() {
  return confirm_if_unscored();
}

Result ScorecardSession::increment() {
  const HoleDefinition* hole = current_hole();
  if (hole == nullptr) {
    return Result::failure(ErrorCode::InvalidInput, "No scorecard is loaded.");
  }
  const ScoreMap scores = rounds_.current_scores(round_id_, player_index_);
  const auto it = scores.find(hole->hole_number);
  const Strokes current = it != scores.end() ? it->second : hole->par;
  if (current >= kMaxStrokes && it != scores.end()) {
    return Result::success("Strokes already at maximum.");
  }
  return write_strokes(current + 1);
}

Result ScorecardSession::decrement() {
  const HoleDefinition* hole = current_hole();
  if (hole == nullptr) {
    return Result::failure(ErrorCode::InvalidInput, "No scorecard is loaded.");
  }
  const ScoreMap scores = rounds_.current_scores(round_id_, player_index_);
  const auto it = scores.find(hole->hole_number);
  const Strokes current = it != scores.end() ? it->second : hole->par;
  if (current <= kMinStrokes && it != scores.end()) {
    return Result::success("Strokes already at minimum.");
  }
  return write_strokes(current - 1);
}

Result ScorecardSession::advance_hole() {
  if (const Result confirmed = confirm_if_unscored(); !confirmed.ok) {
    return confirmed;
  }
  if (hole_index_ + 1U < holes_.size()) {
    ++hole_index_;
  }
  return Result::success();
}

Result ScorecardSession::retreat_hole() {
  if (const Result confirmed = confirm_if_unscored(); !confirmed.ok) {
    return confirmed;
  }
  if (hole_index_ > 0) {
    --hole_index_;
  }
  return Result::success();
}

Result ScorecardSession::switch_player(int player_index) {
  if (!loaded_) {
    return Result::failure(ErrorCode::InvalidInput, "No scorecard is loaded.");
  }
  if (player_index < 0 || player_index >= player_count_) {
    return Result::failure(ErrorCode::InvalidInput, "Player index is not in this round.");
  }
  // Remote players score on their own devices.
  if (multi_device_ && player_index != kLocalPlayerIndex) {
    return Result::failure(ErrorCode::InvalidInput, "Only the local player is scored on this device.");
  }
  if (const Result confirmed = confirm_if_unscored(); !confirmed.ok) {
    return confirmed;
  }
  player_index_ = player_index;
  return Result::success();
}

bool ScorecardSession::finish_enabled() const {
  if (!loaded_ || rounds_.is_completed(round_id_)) {
    return false;
  }
  if (multi_device_) {
    return rounds_.is_finish_enabled(round_id_, kLocalPlayerIndex);
  }
  for (int index = 0; index < player_count_; ++index) {
    if (!rounds_.is_finish_enabled(round_id_, index)) {
      return false;
    }
  }
  return true;
}

Result ScorecardSession::request_finish() {
  if (const Result confirmed = confirm_if_unscored(); !confirmed.ok) {
    return confirmed;
  }
  if (rounds_.is_completed(round_id_)) {
    return Result::success("Round already completed.");
  }
  if (!finish_enabled()) {
    return Result::failure(ErrorCode::InvalidInput, "Every hole must be scored before finishing.");
  }
  return rounds_.complete_round(round_id_);
}

ScorecardState ScorecardSession::snapshot() const {
  ScorecardState state;
  const HoleDefinition* hole = current_hole();
  if (hole == nullptr) {
    return state;
  }

  const ScoreMap scores = rounds_.current_scores(round_id_, player_index_);
  state.round_id = round_id_;
  state.player_index = player_index_;
  state.player_count = player_count_;
  state.current_hole = hole->hole_number;
  state.current_par = hole->par;
  state.hole_count = static_cast<int>(holes_.size());
  state.on_last_hole = hole_index_ + 1U == holes_.size();

  const auto current = scores.find(hole->hole_number);
  state.current_hole_scored = current != scores.end();
  state.current_strokes = state.current_hole_scored ? current->second : hole->par;

  for (const auto& definition : holes_) {
    const auto it = scores.find(definition.hole_number);
    if (it == scores.end()) {
      continue;
    }
    ++state.holes_scored;
    state.total_strokes += it->second;
    state.scored_par += definition.par;
  }
  state.score_to_par = score_to_par_label(state.total_strokes - state.scored_par);
  state.completed = rounds_.is_completed(round_id_);
  state.finish_enabled = finish_enabled();
  return state;
}

}  // namespace gambit
