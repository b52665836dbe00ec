#include "core/sync/event_publisher.hpp"

#include "core/protocol/round_events.hpp"
#include "core/util/canonical.hpp"
#include "core/util/log.hpp"

namespace gambit {
namespace {

constexpr std::string_view kLogComponent = "publisher";

std::string round_label(RoundId round_id) {
  return "round " + std::to_string(round_id);
}

}  // namespace

EventPublisher::EventPublisher(Store& store, RoundAggregate& rounds, RelayPool& pool, const CryptoEngine& crypto,
                               AccountState account)
    : store_(store), rounds_(rounds), pool_(pool), crypto_(crypto), account_(account) {}

void EventPublisher::set_account_state(AccountState account) {
  std::lock_guard lock(account_mutex_);
  account_ = account;
}

AccountState EventPublisher::account_state() const {
  std::lock_guard lock(account_mutex_);
  return account_;
}

Result EventPublisher::check_can_publish() const {
  const AccountState account = account_state();
  if (!account.network_activated) {
    return Result::failure(ErrorCode::Disabled, "Network features are not activated for this account.");
  }
  if (account.read_only) {
    return Result::failure(ErrorCode::Disabled, "Account is read-only; publishing is disabled.");
  }
  if (!crypto_.ready()) {
    return Result::failure(ErrorCode::Crypto, "Identity is locked.");
  }
  return Result::success();
}

Result EventPublisher::sign_and_publish(NetworkEvent& event) {
  if (const Result allowed = check_can_publish(); !allowed.ok) {
    return allowed;
  }
  if (const Result signed_event = finalize_event(event, crypto_.identity()); !signed_event.ok) {
    return signed_event;
  }
  return pool_.publish(event);
}

JoinedVia EventPublisher::default_joined_via(RoundId round_id) const {
  return rounds_.is_multi_device(round_id) ? JoinedVia::CreatedMulti : JoinedVia::Created;
}

Result EventPublisher::publish_initiation(RoundId round_id) {
  return publish_initiation(round_id, default_joined_via(round_id));
}

Result EventPublisher::publish_initiation(RoundId round_id, JoinedVia joined_via) {
  std::lock_guard lock(initiation_mutex_);
  if (const auto existing = store_.network_record(round_id); existing.has_value()) {
    return Result::success("Round already has an initiation event.", existing->initiation_event_id);
  }
  if (const Result allowed = check_can_publish(); !allowed.ok) {
    return allowed;
  }

  const auto round = rounds_.round(round_id);
  const auto course = rounds_.course_for(round_id);
  if (!round.has_value() || !course.has_value()) {
    return Result::failure(ErrorCode::NotFound, "Cannot publish unknown " + round_label(round_id) + ".");
  }

  NetworkEvent event;
  if (const Result built = build_initiation_event(*course, rounds_.player_pubkeys(round_id), round->round_date, event);
      !built.ok) {
    return built;
  }
  if (const Result published = sign_and_publish(event); !published.ok) {
    util::log_warn(kLogComponent, "Initiation publish failed for " + round_label(round_id) + ": " + published.message);
    return published;
  }

  RoundNetworkRecord stored;
  bool inserted = false;
  const Result recorded = store_.record_network_once(
      {
          .round_id = round_id,
          .initiation_event_id = event.id,
          .joined_via = joined_via,
          .published_unix = util::unix_timestamp_now(),
      },
      stored, inserted);
  if (!recorded.ok) {
    util::log_error(kLogComponent, "Failed to persist initiation id for " + round_label(round_id) + ": " +
                                       recorded.message);
    return recorded;
  }

  util::log_info(kLogComponent, "Published initiation " + stored.initiation_event_id + " for " +
                                    round_label(round_id) + " (" + std::string{joined_via_name(stored.joined_via)} +
                                    ").");
  return Result::success("Initiation published.", stored.initiation_event_id);
}

Result EventPublisher::publish_final_record(RoundId round_id, int player_index) {
  if (const Result allowed = check_can_publish(); !allowed.ok) {
    return allowed;
  }

  const std::vector<std::string> players = rounds_.player_pubkeys(round_id);
  if (player_index < 0 || player_index >= static_cast<int>(players.size())) {
    return Result::failure(ErrorCode::InvalidInput, "Player index is not in " + round_label(round_id) + ".");
  }

  const ScoreMap scores = rounds_.current_scores(round_id, player_index);
  if (scores.empty()) {
    return Result::failure(ErrorCode::InvalidInput, "No scores recorded for player " +
                                                        std::to_string(player_index) + ".");
  }

  std::string initiation_id;
  if (const auto record = store_.network_record(round_id); record.has_value()) {
    initiation_id = record->initiation_event_id;
  } else {
    util::log_info(kLogComponent, "No initiation stored for " + round_label(round_id) + "; publishing it first.");
    const Result initiated = publish_initiation(round_id);
    if (!initiated.ok) {
      return initiated;
    }
    initiation_id = initiated.data;
  }

  NetworkEvent event;
  if (const Result built = build_final_record_event(initiation_id, scores, players[player_index], players, event);
      !built.ok) {
    return built;
  }
  if (const Result published = sign_and_publish(event); !published.ok) {
    util::log_warn(kLogComponent, "Final record publish failed for " + round_label(round_id) + ": " +
                                      published.message);
    return published;
  }
  return Result::success("Final record published.", event.id);
}

Result EventPublisher::publish_all_final_records(RoundId round_id) {
  const std::vector<std::string> players = rounds_.player_pubkeys(round_id);
  if (players.empty()) {
    return Result::failure(ErrorCode::NotFound, "Cannot publish unknown " + round_label(round_id) + ".");
  }

  const auto record = store_.network_record(round_id);
  const bool local_only = rounds_.is_multi_device(round_id) ||
                          (record.has_value() && record->joined_via != JoinedVia::Created);
  const int count = local_only ? 1 : static_cast<int>(players.size());

  std::vector<std::string> ids;
  for (int index = 0; index < count; ++index) {
    const Result published = publish_final_record(round_id, index);
    if (!published.ok) {
      return published;
    }
    ids.push_back(published.data);
  }

  std::string joined;
  for (const auto& id : ids) {
    joined += joined.empty() ? id : "," + id;
  }
  return Result::success("Published " + std::to_string(ids.size()) + " final records.", joined);
}

Result EventPublisher::publish_live_scorecard(RoundId round_id) {
  if (const Result allowed = check_can_publish(); !allowed.ok) {
    return allowed;
  }

  const auto record = store_.network_record(round_id);
  if (!record.has_value()) {
    return Result::success("Live scorecard skipped: no initiation event yet.");
  }

  NetworkEvent event;
  const std::string_view status = rounds_.is_completed(round_id) ? kStatusCompleted : kStatusInProgress;
  if (const Result built = build_live_scorecard_event(record->initiation_event_id,
                                                      rounds_.current_scores(round_id, kLocalPlayerIndex), status,
                                                      rounds_.player_pubkeys(round_id), event);
      !built.ok) {
    return built;
  }
  if (const Result published = sign_and_publish(event); !published.ok) {
    util::log_warn(kLogComponent, "Live scorecard publish failed for " + round_label(round_id) + ": " +
                                      published.message);
    return published;
  }
  return Result::success("Live scorecard published.", event.id);
}

}  // namespace gambit
