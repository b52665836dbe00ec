#include "core/invite/round_join.hpp"

#include <algorithm>

#include "core/protocol/invite_codec.hpp"
#include "core/util/canonical.hpp"
#include "core/util/log.hpp"

namespace gambit {
namespace {

constexpr std::string_view kLogComponent = "join";

}  // namespace

RoundJoiner::RoundJoiner(Store& store, CourseStore& courses, RoundAggregate& rounds, RelayPool& pool,
                         EventPublisher& publisher, std::string local_pubkey)
    : store_(store),
      courses_(courses),
      rounds_(rounds),
      pool_(pool),
      publisher_(publisher),
      local_pubkey_(std::move(local_pubkey)) {}

std::vector<std::string> RoundJoiner::joined_player_order(const std::vector<std::string>& tagged_players,
                                                          std::string_view local_pubkey) {
  std::vector<std::string> ordered{std::string{local_pubkey}};
  for (const auto& player : tagged_players) {
    const std::string key = util::lowercase_copy(player);
    if (std::find(ordered.begin(), ordered.end(), key) == ordered.end()) {
      ordered.push_back(key);
    }
  }
  return ordered;
}

Result RoundJoiner::join_round(std::string_view invite_token, RoundId& out) {
  InvitePointer pointer;
  if (const Result decoded = decode_invite(strip_nostr_uri(invite_token), pointer); !decoded.ok) {
    return decoded;
  }

  std::lock_guard lock(join_mutex_);
  if (const auto existing = store_.round_for_initiation(pointer.event_id); existing.has_value()) {
    out = *existing;
    return Result::success("Round already joined.", std::to_string(out));
  }
  if (!publisher_.account_state().network_activated) {
    return Result::failure(ErrorCode::Disabled, "Network features are not activated.");
  }

  NetworkEvent event;
  if (const Result fetched = pool_.fetch_event(pointer.event_id, pointer.relay_hints, event); !fetched.ok) {
    util::log_warn(kLogComponent, "Initiation " + pointer.event_id + " unavailable: " + fetched.message);
    return fetched;
  }
  if (const Result verified = verify_event(event); !verified.ok) {
    return verified;
  }
  if (event.id != pointer.event_id) {
    return Result::failure(ErrorCode::UntrustedContent, "Relay returned a different event than the invite names.");
  }
  if (event.kind != event_kind::kRoundInitiation) {
    return Result::failure(ErrorCode::InvalidInput, "Invite does not point at a round.");
  }

  InitiationData initiation;
  if (const Result parsed = parse_initiation_event(event, initiation); !parsed.ok) {
    util::log_warn(kLogComponent, "Rejected initiation " + event.id + ": " + parsed.message);
    return parsed;
  }
  if (std::find(initiation.players.begin(), initiation.players.end(), local_pubkey_) == initiation.players.end()) {
    return Result::failure(ErrorCode::InvalidPlayerSet, "This identity is not a player in the invited round.");
  }

  CourseSnapshot course;
  if (const Result created = courses_.get_or_create(initiation.course_name, initiation.tee_set, initiation.holes,
                                                    course);
      !created.ok) {
    return created;
  }
  if (course.content_hash != initiation.course_hash) {
    return Result::failure(ErrorCode::UntrustedContent, "Course hash does not match the local snapshot.");
  }

  Round round;
  if (const Result joined = rounds_.create_joined_round(course, joined_player_order(initiation.players, local_pubkey_),
                                                        initiation.round_date, event.id, round);
      !joined.ok) {
    util::log_error(kLogComponent, "Could not store joined round for " + event.id + ": " + joined.message);
    return joined;
  }

  out = round.round_id;
  return Result::success("Round joined.", std::to_string(out));
}

}  // namespace gambit
