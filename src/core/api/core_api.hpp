#pragma once

#include <future>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"
#include "core/service/gambit_service.hpp"

namespace gambit {

class CoreApi {
public:
  Result init(const InitConfig& config);

  Result create_round(const RoundDraft& draft, Round& out);
  Result record_score(RoundId round_id, int player_index, HoleNumber hole_number, Strokes strokes);
  Result finish_round(RoundId round_id);

  Result refresh_remote_scores(RoundId round_id, std::map<std::string, ScoreMap>& out);
  Result final_scorecard(RoundId round_id, std::vector<FinalRecord>& out);
  std::future<Result> await_initiation_record(RoundId round_id, util::CancellationToken token);

  Result invite_token(RoundId round_id, std::string& token);
  Result send_invites(RoundId round_id, std::vector<InviteDelivery>& deliveries);
  Result fetch_incoming_invites(std::vector<IncomingInvite>& out);
  Result join_round(std::string_view invite_token, RoundId& out);

  Result resolve_profiles(const std::vector<std::string>& pubkeys, std::map<std::string, Profile>& out);
  Result follow(std::string_view pubkey);
  Result unfollow(std::string_view pubkey);
  Result add_favorite(std::string_view pubkey);
  Result remove_favorite(std::string_view pubkey);

  Result add_relay(std::string_view url, std::string_view marker);
  Result remove_relay(std::string_view url);
  void set_account_state(AccountState account);
  void drain();

  ScoreMap current_scores(RoundId round_id, int player_index) const;
  bool is_finish_enabled(RoundId round_id, int player_index) const;
  std::vector<RoundListItem> list_rounds() const;
  std::vector<RoundPlayer> players(RoundId round_id) const;
  std::optional<CourseSnapshot> course_for(RoundId round_id) const;
  std::map<std::string, ScoreMap> remote_scores(RoundId round_id) const;
  ScorecardSession scorecard();
  std::string public_key() const;
  ServiceStatus status() const;

private:
  GambitService service_;
};

}  // namespace gambit
