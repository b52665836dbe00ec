#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"
#include "core/storage/store.hpp"

namespace gambit {

inline constexpr int kLocalPlayerIndex = 0;

// Local round bookkeeping over the append-only score log. Index 0 is always the
// device owner; other players follow in selection order.
class RoundAggregate {
public:
  explicit RoundAggregate(Store& store) : store_(store) {}

  // InvalidPlayerSet for an empty list, a malformed key or a duplicate key.
  // An empty round_date means today (UTC).
  Result create_round(const CourseSnapshot& course, const std::vector<std::string>& player_pubkeys,
                      std::string_view round_date, bool multi_device, Round& out);

  // Multi-device round bound to a fetched initiation event in a single store write.
  Result create_joined_round(const CourseSnapshot& course, const std::vector<std::string>& player_pubkeys,
                             std::string_view round_date, std::string_view initiation_event_id, Round& out);

  Result record_score(RoundId round_id, int player_index, HoleNumber hole_number, Strokes strokes);
  Result record_score_at(RoundId round_id, int player_index, HoleNumber hole_number, Strokes strokes,
                         std::int64_t recorded_at_ms);

  [[nodiscard]] ScoreMap current_scores(RoundId round_id, int player_index) const;

  // True iff every hole of the course has at least one score row for the player.
  [[nodiscard]] bool is_finish_enabled(RoundId round_id, int player_index) const;

  // One-shot; completing an already completed round is a no-op success.
  Result complete_round(RoundId round_id);
  [[nodiscard]] bool is_completed(RoundId round_id) const;
  [[nodiscard]] bool is_multi_device(RoundId round_id) const;

  [[nodiscard]] std::vector<RoundListItem> list_rounds() const;
  [[nodiscard]] std::optional<Round> round(RoundId round_id) const;
  [[nodiscard]] std::vector<RoundPlayer> players(RoundId round_id) const;
  [[nodiscard]] std::vector<std::string> player_pubkeys(RoundId round_id) const;
  [[nodiscard]] std::optional<CourseSnapshot> course_for(RoundId round_id) const;

  static Result validate_players(const std::vector<std::string>& player_pubkeys);

private:
  Store& store_;
};

}  // namespace gambit
