#include "core/invite/direct_message_inviter.hpp"

#include <algorithm>
#include <map>
#include <set>

#include <sodium.h>

#include "core/protocol/invite_codec.hpp"
#include "core/util/canonical.hpp"
#include "core/util/canonical_json.hpp"
#include "core/util/hash.hpp"
#include "core/util/log.hpp"

namespace gambit {
namespace {

constexpr std::string_view kLogComponent = "invites";
constexpr std::size_t kMaxRelayHints = 2;
// Gift wraps are backdated up to two days so relays cannot correlate send times.
constexpr std::uint32_t kWrapTimestampJitterSeconds = 2 * 24 * 60 * 60;

std::int64_t randomized_timestamp() {
  util::ensure_sodium();
  return util::unix_timestamp_now() - static_cast<std::int64_t>(randombytes_uniform(kWrapTimestampJitterSeconds));
}

Result serialize_event(const NetworkEvent& event) {
  return util::canonical_json(event_to_json(event));
}

Result open_layer(const IdentityKeyPair& recipient, std::string_view sender_pubkey, std::string_view payload,
                  NetworkEvent& out) {
  const Result plain = CryptoEngine::decrypt_with(recipient, sender_pubkey, payload);
  if (!plain.ok) {
    return Result::failure(ErrorCode::UntrustedContent, "Cannot decrypt message layer: " + plain.message);
  }
  nlohmann::json value;
  if (const Result parsed = util::parse_json(plain.data, value); !parsed.ok) {
    return Result::failure(ErrorCode::UntrustedContent, "Message layer is not JSON.");
  }
  if (const Result decoded = event_from_json(value, out); !decoded.ok) {
    return Result::failure(ErrorCode::UntrustedContent, decoded.message);
  }
  return Result::success();
}

}  // namespace

DirectMessageInviter::DirectMessageInviter(Store& store, RoundAggregate& rounds, RelayPool& pool,
                                           const CryptoEngine& crypto, EventPublisher& publisher,
                                           IdentityCache& identities, std::vector<std::string> fallback_relays,
                                           std::int64_t lookback_seconds)
    : store_(store),
      rounds_(rounds),
      pool_(pool),
      crypto_(crypto),
      publisher_(publisher),
      identities_(identities),
      fallback_relays_(std::move(fallback_relays)),
      lookback_seconds_(lookback_seconds) {}

Result DirectMessageInviter::wrap_message(const IdentityKeyPair& sender, std::string_view recipient_pubkey,
                                          std::string_view body, NetworkEvent& out) {
  if (!util::is_hex_of_size(recipient_pubkey, 32)) {
    return Result::failure(ErrorCode::InvalidInput, "Recipient key must be 64 hex characters.");
  }
  if (sender.empty()) {
    return Result::failure(ErrorCode::Crypto, "Cannot wrap a message without a sender key.");
  }

  NetworkEvent rumor;
  rumor.kind = event_kind::kDirectMessage;
  rumor.pubkey = sender.public_key;
  rumor.created_at = util::unix_timestamp_now();
  rumor.tags = {{"p", std::string{recipient_pubkey}}};
  rumor.content = std::string{body};
  const Result commitment = event_commitment(rumor);
  if (!commitment.ok) {
    return commitment;
  }
  rumor.id = util::sha256_hex(commitment.data);

  const Result rumor_json = serialize_event(rumor);
  if (!rumor_json.ok) {
    return rumor_json;
  }
  const Result sealed = CryptoEngine::encrypt_with(sender, recipient_pubkey, rumor_json.data);
  if (!sealed.ok) {
    return sealed;
  }
  NetworkEvent seal;
  seal.kind = event_kind::kSeal;
  seal.created_at = randomized_timestamp();
  seal.content = sealed.data;
  if (const Result signed_seal = finalize_event(seal, sender); !signed_seal.ok) {
    return signed_seal;
  }

  const Result seal_json = serialize_event(seal);
  if (!seal_json.ok) {
    return seal_json;
  }
  const IdentityKeyPair one_time = CryptoEngine::generate_keypair();
  const Result wrapped = CryptoEngine::encrypt_with(one_time, recipient_pubkey, seal_json.data);
  if (!wrapped.ok) {
    return wrapped;
  }
  NetworkEvent gift_wrap;
  gift_wrap.kind = event_kind::kGiftWrap;
  gift_wrap.created_at = randomized_timestamp();
  gift_wrap.tags = {{"p", std::string{recipient_pubkey}}};
  gift_wrap.content = wrapped.data;
  if (const Result signed_wrap = finalize_event(gift_wrap, one_time); !signed_wrap.ok) {
    return signed_wrap;
  }

  out = std::move(gift_wrap);
  return Result::success("Message wrapped.", out.id);
}

Result DirectMessageInviter::unwrap_message(const IdentityKeyPair& recipient, const NetworkEvent& gift_wrap,
                                            NetworkEvent& rumor) {
  if (gift_wrap.kind != event_kind::kGiftWrap) {
    return Result::failure(ErrorCode::InvalidInput, "Event is not a gift wrap.");
  }
  if (const Result verified = verify_event(gift_wrap); !verified.ok) {
    return verified;
  }

  NetworkEvent seal;
  if (const Result opened = open_layer(recipient, gift_wrap.pubkey, gift_wrap.content, seal); !opened.ok) {
    return opened;
  }
  if (seal.kind != event_kind::kSeal) {
    return Result::failure(ErrorCode::UntrustedContent, "Gift wrap does not contain a seal.");
  }
  if (const Result verified = verify_event(seal); !verified.ok) {
    return verified;
  }

  NetworkEvent inner;
  if (const Result opened = open_layer(recipient, seal.pubkey, seal.content, inner); !opened.ok) {
    return opened;
  }
  if (inner.pubkey != seal.pubkey) {
    return Result::failure(ErrorCode::UntrustedContent, "Rumor author does not match the seal signer.");
  }
  const Result commitment = event_commitment(inner);
  if (!commitment.ok || util::sha256_hex(commitment.data) != inner.id) {
    return Result::failure(ErrorCode::UntrustedContent, "Rumor id does not match its content.");
  }

  rumor = std::move(inner);
  return Result::success("Message unwrapped.", rumor.id);
}

Result DirectMessageInviter::invite_token(RoundId round_id, std::string& token) {
  std::string initiation_id;
  if (const auto record = store_.network_record(round_id); record.has_value()) {
    initiation_id = record->initiation_event_id;
  } else {
    const Result initiated = publisher_.publish_initiation(round_id);
    if (!initiated.ok) {
      return initiated;
    }
    initiation_id = initiated.data;
  }

  InvitePointer pointer{.event_id = initiation_id};
  for (const auto& relay : pool_.write_relays()) {
    if (pointer.relay_hints.size() == kMaxRelayHints) {
      break;
    }
    pointer.relay_hints.push_back(relay);
  }
  const Result encoded = encode_invite(pointer);
  if (!encoded.ok) {
    return encoded;
  }
  token = encoded.data;
  return Result::success("Invite token ready.", token);
}

std::vector<std::string> DirectMessageInviter::delivery_relays(std::string_view recipient_pubkey) {
  std::vector<std::string> relays = identities_.inbox_relays(recipient_pubkey);
  if (relays.empty()) {
    relays = fallback_relays_;
  }
  return relays;
}

Result DirectMessageInviter::send_invites(RoundId round_id, std::vector<InviteDelivery>& deliveries) {
  std::vector<std::string> recipients = rounds_.player_pubkeys(round_id);
  if (!recipients.empty()) {
    recipients.erase(recipients.begin());
  }
  return send_invites(round_id, recipients, deliveries);
}

Result DirectMessageInviter::send_invites(RoundId round_id, const std::vector<std::string>& recipients,
                                          std::vector<InviteDelivery>& deliveries) {
  deliveries.clear();
  if (const Result allowed = publisher_.check_can_publish(); !allowed.ok) {
    return allowed;
  }
  const auto course = rounds_.course_for(round_id);
  if (!course.has_value()) {
    return Result::failure(ErrorCode::NotFound, "Unknown round " + std::to_string(round_id) + ".");
  }

  std::string token;
  if (const Result prepared = invite_token(round_id, token); !prepared.ok) {
    util::log_warn(kLogComponent, "No invite token for round " + std::to_string(round_id) + ": " + prepared.message);
    return prepared;
  }
  const std::string body = invite_message_body(course->course_name, token);
  const std::string& local = crypto_.identity().public_key;

  std::set<std::string> attempted;
  std::size_t delivered = 0;
  for (const auto& raw_recipient : recipients) {
    const std::string recipient = util::lowercase_copy(raw_recipient);
    if (recipient == local || !attempted.insert(recipient).second) {
      continue;
    }

    InviteDelivery delivery{.recipient_pubkey = recipient};
    NetworkEvent gift_wrap;
    if (const Result wrapped = wrap_message(crypto_.identity(), recipient, body, gift_wrap); !wrapped.ok) {
      delivery.message = wrapped.message;
    } else {
      delivery.relays = delivery_relays(recipient);
      const Result sent = pool_.publish_to(delivery.relays, gift_wrap);
      delivery.delivered = sent.ok;
      delivery.message = sent.message;
    }

    if (delivery.delivered) {
      ++delivered;
    } else {
      util::log_warn(kLogComponent, "Invite to " + recipient.substr(0, 8) + " for round " +
                                        std::to_string(round_id) + " failed: " + delivery.message);
    }
    deliveries.push_back(std::move(delivery));
  }

  return Result::success("Delivered " + std::to_string(delivered) + " of " + std::to_string(deliveries.size()) +
                             " invites.",
                         std::to_string(delivered));
}

Result DirectMessageInviter::fetch_incoming_invites(std::vector<IncomingInvite>& out) {
  out.clear();
  if (!publisher_.account_state().network_activated) {
    return Result::failure(ErrorCode::Disabled, "Network features are not activated.");
  }
  if (!crypto_.ready()) {
    return Result::failure(ErrorCode::Crypto, "Identity is locked.");
  }
  const std::string& local = crypto_.identity().public_key;

  std::vector<std::string> relays = pool_.read_relays();
  for (const auto& relay : delivery_relays(local)) {
    if (std::find(relays.begin(), relays.end(), relay) == relays.end()) {
      relays.push_back(relay);
    }
  }

  RelayFilter filter;
  filter.kinds = {event_kind::kGiftWrap};
  filter.p_tags = {local};
  // Wraps are backdated, so the window is widened by the jitter.
  filter.since = util::unix_timestamp_now() - lookback_seconds_ - kWrapTimestampJitterSeconds;
  std::vector<NetworkEvent> wraps;
  if (const Result fetched = pool_.query_from(relays, filter, wraps); !fetched.ok) {
    util::log_warn(kLogComponent, "Invite fetch failed: " + fetched.message);
    return fetched;
  }

  const std::int64_t cutoff = util::unix_timestamp_now() - lookback_seconds_;
  std::map<std::string, IncomingInvite> by_initiation;
  for (const auto& wrap : wraps) {
    NetworkEvent rumor;
    if (const Result opened = unwrap_message(crypto_.identity(), wrap, rumor); !opened.ok) {
      util::log_debug(kLogComponent, "Skipping gift wrap " + wrap.id + ": " + opened.message);
      continue;
    }
    if (rumor.kind != event_kind::kDirectMessage || rumor.created_at < cutoff) {
      continue;
    }
    const auto token = extract_invite_token(rumor.content);
    if (!token.has_value()) {
      continue;
    }
    InvitePointer pointer;
    if (!decode_invite(*token, pointer).ok) {
      continue;
    }
    if (store_.round_for_initiation(pointer.event_id).has_value()) {
      continue;
    }

    IncomingInvite invite{
        .gift_wrap_id = wrap.id,
        .sender_pubkey = rumor.pubkey,
        .token = *token,
        .initiation_event_id = pointer.event_id,
        .relay_hints = pointer.relay_hints,
        .course_name = extract_course_name(rumor.content).value_or(""),
        .sent_at = rumor.created_at,
    };
    const auto existing = by_initiation.find(invite.initiation_event_id);
    if (existing == by_initiation.end() || invite.sent_at > existing->second.sent_at) {
      by_initiation[invite.initiation_event_id] = std::move(invite);
    }
  }

  std::vector<std::string> senders;
  for (const auto& [id, invite] : by_initiation) {
    senders.push_back(invite.sender_pubkey);
  }
  std::map<std::string, Profile> profiles;
  if (const Result resolved = identities_.resolve(senders, profiles); !resolved.ok) {
    util::log_debug(kLogComponent, "Sender profiles from cache only: " + resolved.message);
  }

  for (auto& [id, invite] : by_initiation) {
    const auto profile = profiles.find(invite.sender_pubkey);
    invite.sender_label = profile != profiles.end() ? profile->second.display_label()
                                                    : Profile{.pubkey_hex = invite.sender_pubkey}.display_label();
    out.push_back(std::move(invite));
  }
  std::ranges::sort(out, [](const IncomingInvite& lhs, const IncomingInvite& rhs) {
    return lhs.sent_at > rhs.sent_at;
  });
  return Result::success("Found " + std::to_string(out.size()) + " invites.");
}

Result DirectMessageInviter::publish_inbox_relays(const std::vector<std::string>& relays) {
  std::vector<std::string> normalized;
  for (const auto& relay : relays) {
    const std::string url = RelayPool::normalize_url(relay);
    if (!url.empty() && std::find(normalized.begin(), normalized.end(), url) == normalized.end()) {
      normalized.push_back(url);
    }
  }
  if (normalized.empty()) {
    return Result::failure(ErrorCode::InvalidInput, "At least one ws:// or wss:// relay is required.");
  }

  NetworkEvent event;
  event.kind = event_kind::kInboxRelays;
  event.created_at = util::unix_timestamp_now();
  for (const auto& url : normalized) {
    event.tags.push_back({"relay", url});
  }
  if (const Result published = publisher_.sign_and_publish(event); !published.ok) {
    return published;
  }
  if (const Result stored = identities_.store_own_inbox_relays(normalized, event.created_at); !stored.ok) {
    return stored;
  }
  return Result::success("Inbox relays published.", event.id);
}

}  // namespace gambit
