#include "core/sync/sync_poller.hpp"

#include <algorithm>
#include <set>

#include "core/util/log.hpp"

namespace gambit {
namespace {

constexpr std::string_view kLogComponent = "sync";

}  // namespace

SyncPoller::SyncPoller(Store& store, RoundAggregate& rounds, RelayPool& pool, AccountState account)
    : store_(store), rounds_(rounds), pool_(pool), account_(account) {}

void SyncPoller::set_account_state(AccountState account) {
  std::lock_guard lock(account_mutex_);
  account_ = account;
}

void SyncPoller::stop() {
  stop_.cancel();
}

Result SyncPoller::check_can_read() const {
  std::lock_guard lock(account_mutex_);
  if (!account_.network_activated) {
    return Result::failure(ErrorCode::Disabled, "Network features are not activated for this account.");
  }
  return Result::success();
}

Result SyncPoller::refresh_remote_scores(RoundId round_id, std::map<std::string, ScoreMap>& out) {
  out = store_.remote_scores(round_id);
  if (const Result allowed = check_can_read(); !allowed.ok) {
    return allowed;
  }

  const auto record = store_.network_record(round_id);
  if (!record.has_value()) {
    return Result::success("Round has no initiation event yet; nothing to sync.");
  }

  std::set<std::string> remote_players;
  for (const auto& player : rounds_.players(round_id)) {
    if (player.player_index != kLocalPlayerIndex) {
      remote_players.insert(player.pubkey_hex);
    }
  }
  if (remote_players.empty()) {
    return Result::success("Round has no remote players.");
  }

  RelayFilter filter;
  filter.kinds = {event_kind::kLiveScorecard};
  filter.authors.assign(remote_players.begin(), remote_players.end());
  filter.d_tags = {record->initiation_event_id};

  std::vector<NetworkEvent> events;
  if (const Result fetched = pool_.query(filter, events); !fetched.ok) {
    util::log_warn(kLogComponent, "Remote score refresh failed for round " + std::to_string(round_id) + ": " +
                                      fetched.message);
    return fetched;
  }

  std::map<std::string, LiveScorecard> newest;
  for (const auto& event : events) {
    LiveScorecard card;
    if (!parse_live_scorecard(event, card).ok) {
      util::log_debug(kLogComponent, "Ignoring malformed live scorecard " + event.id);
      continue;
    }
    if (!remote_players.contains(card.author) || card.initiation_event_id != record->initiation_event_id) {
      continue;
    }
    const auto it = newest.find(card.author);
    if (it == newest.end() || card.created_at > it->second.created_at) {
      newest[card.author] = std::move(card);
    }
  }

  for (const auto& [author, card] : newest) {
    if (const Result stored = store_.upsert_remote_scores(round_id, author, card.scores, card.created_at);
        !stored.ok) {
      return stored;
    }
  }

  out = store_.remote_scores(round_id);
  return Result::success("Merged " + std::to_string(newest.size()) + " remote scorecards.");
}

Result SyncPoller::await_initiation_record(RoundId round_id, int max_attempts, std::chrono::milliseconds interval,
                                           const util::CancellationToken& token) {
  for (int attempt = 0; attempt < max_attempts; ++attempt) {
    if (token.cancelled() || stop_.cancelled()) {
      return Result::failure(ErrorCode::Cancelled, "Waiting for the initiation event was cancelled.");
    }
    if (const auto record = store_.network_record(round_id); record.has_value()) {
      return Result::success("Initiation event available.", record->initiation_event_id);
    }
    if (attempt + 1 < max_attempts && token.wait_for(interval)) {
      return Result::failure(ErrorCode::Cancelled, "Waiting for the initiation event was cancelled.");
    }
  }
  return Result::failure(ErrorCode::Timeout, "Initiation event for round " + std::to_string(round_id) +
                                                 " not available after " + std::to_string(max_attempts) +
                                                 " attempts.");
}

Result SyncPoller::fetch_final_records(RoundId round_id, std::vector<FinalRecord>& out) {
  out.clear();
  if (const Result allowed = check_can_read(); !allowed.ok) {
    return allowed;
  }

  const auto record = store_.network_record(round_id);
  if (!record.has_value()) {
    return Result::failure(ErrorCode::NotFound, "Round has no initiation event.");
  }

  const std::vector<std::string> players = rounds_.player_pubkeys(round_id);
  RelayFilter filter;
  filter.kinds = {event_kind::kFinalRecord};
  filter.e_tags = {record->initiation_event_id};
  filter.authors = players;

  std::vector<NetworkEvent> events;
  if (const Result fetched = pool_.query(filter, events); !fetched.ok) {
    util::log_warn(kLogComponent, "Final record fetch failed for round " + std::to_string(round_id) + ": " +
                                      fetched.message);
    return fetched;
  }

  const std::string initiator = initiation_author(*record, players);
  for (const auto& event : events) {
    FinalRecord parsed;
    if (!parse_final_record(event, parsed).ok || parsed.initiation_event_id != record->initiation_event_id) {
      continue;
    }
    if (std::find(players.begin(), players.end(), parsed.scored_pubkey) == players.end()) {
      continue;
    }
    // Only the round's initiator may record a card on another player's behalf.
    if (parsed.author != parsed.scored_pubkey && parsed.author != initiator) {
      util::log_warn(kLogComponent, "Ignored final record " + parsed.event_id + ": " + parsed.author.substr(0, 8) +
                                        " scored another player without initiating the round.");
      continue;
    }
    out.push_back(std::move(parsed));
  }
  return Result::success("Fetched " + std::to_string(out.size()) + " final records.");
}

std::string SyncPoller::initiation_author(const RoundNetworkRecord& record, const std::vector<std::string>& players) {
  if (record.joined_via != JoinedVia::Joined) {
    return players.empty() ? std::string{} : players.front();
  }
  NetworkEvent initiation;
  if (const Result fetched = pool_.fetch_event(record.initiation_event_id, {}, initiation); !fetched.ok) {
    util::log_warn(kLogComponent, "Initiation " + record.initiation_event_id +
                                      " unavailable; trusting self-authored final records only: " + fetched.message);
    return {};
  }
  return initiation.pubkey;
}

std::vector<FinalRecord> SyncPoller::combined_scorecard(const std::vector<FinalRecord>& records) {
  std::map<std::string, FinalRecord> latest;
  for (const auto& record : records) {
    const auto it = latest.find(record.scored_pubkey);
    if (it == latest.end()) {
      latest[record.scored_pubkey] = record;
      continue;
    }
    const bool self_authored = record.author == record.scored_pubkey;
    const bool kept_self_authored = it->second.author == it->second.scored_pubkey;
    if (self_authored != kept_self_authored) {
      if (self_authored) {
        it->second = record;
      }
    } else if (record.created_at > it->second.created_at) {
      it->second = record;
    }
  }

  std::vector<FinalRecord> combined;
  for (auto& [pubkey, record] : latest) {
    combined.push_back(std::move(record));
  }
  std::ranges::sort(combined, [](const FinalRecord& lhs, const FinalRecord& rhs) {
    return lhs.total != rhs.total ? lhs.total < rhs.total : lhs.scored_pubkey < rhs.scored_pubkey;
  });
  return combined;
}

}  // namespace gambit
