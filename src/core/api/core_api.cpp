#include "core/api/core_api.hpp"

#include <utility>

namespace gambit {

Result CoreApi::init(const InitConfig& config) {
  return service_.init(config);
}

Result CoreApi::create_round(const RoundDraft& draft, Round& out) {
  return service_.create_round(draft, out);
}

Result CoreApi::record_score(RoundId round_id, int player_index, HoleNumber hole_number, Strokes strokes) {
  return service_.record_score(round_id, player_index, hole_number, strokes);
}

Result CoreApi::finish_round(RoundId round_id) {
  return service_.finish_round(round_id);
}

Result CoreApi::refresh_remote_scores(RoundId round_id, std::map<std::string, ScoreMap>& out) {
  return service_.refresh_remote_scores(round_id, out);
}

Result CoreApi::final_scorecard(RoundId round_id, std::vector<FinalRecord>& out) {
  return service_.final_scorecard(round_id, out);
}

std::future<Result> CoreApi::await_initiation_record(RoundId round_id, util::CancellationToken token) {
  return service_.await_initiation_record_async(round_id, std::move(token));
}

Result CoreApi::invite_token(RoundId round_id, std::string& token) {
  return service_.invite_token(round_id, token);
}

Result CoreApi::send_invites(RoundId round_id, std::vector<InviteDelivery>& deliveries) {
  return service_.send_invites(round_id, deliveries);
}

Result CoreApi::fetch_incoming_invites(std::vector<IncomingInvite>& out) {
  return service_.fetch_incoming_invites(out);
}

Result CoreApi::join_round(std::string_view invite_token, RoundId& out) {
  return service_.join_round(invite_token, out);
}

Result CoreApi::resolve_profiles(const std::vector<std::string>& pubkeys, std::map<std::string, Profile>& out) {
  return service_.resolve_profiles(pubkeys, out);
}

Result CoreApi::follow(std::string_view pubkey) {
  return service_.follow(pubkey);
}

Result CoreApi::unfollow(std::string_view pubkey) {
  return service_.unfollow(pubkey);
}

Result CoreApi::add_favorite(std::string_view pubkey) {
  return service_.add_favorite(pubkey);
}

Result CoreApi::remove_favorite(std::string_view pubkey) {
  return service_.remove_favorite(pubkey);
}

Result CoreApi::add_relay(std::string_view url, std::string_view marker) {
  return service_.add_relay(url, marker);
}

Result CoreApi::remove_relay(std::string_view url) {
  return service_.remove_relay(url);
}

void CoreApi::set_account_state(AccountState account) {
  service_.set_account_state(account);
}

void CoreApi::drain() {
  service_.drain();
}

ScoreMap CoreApi::current_scores(RoundId round_id, int player_index) const {
  return service_.current_scores(round_id, player_index);
}

bool CoreApi::is_finish_enabled(RoundId round_id, int player_index) const {
  return service_.is_finish_enabled(round_id, player_index);
}

std::vector<RoundListItem> CoreApi::list_rounds() const {
  return service_.list_rounds();
}

std::vector<RoundPlayer> CoreApi::players(RoundId round_id) const {
  return service_.players(round_id);
}

std::optional<CourseSnapshot> CoreApi::course_for(RoundId round_id) const {
  return service_.course_for(round_id);
}

std::map<std::string, ScoreMap> CoreApi::remote_scores(RoundId round_id) const {
  return service_.remote_scores(round_id);
}

ScorecardSession CoreApi::scorecard() {
  return service_.scorecard();
}

std::string CoreApi::public_key() const {
  return service_.public_key();
}

ServiceStatus CoreApi::status() const {
  return service_.status();
}

}  // namespace gambit
