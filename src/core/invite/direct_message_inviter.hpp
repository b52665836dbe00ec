#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "core/crypto/crypto.hpp"
#include "core/identity/identity_cache.hpp"
#include "core/model/types.hpp"
#include "core/protocol/event.hpp"
#include "core/relay/relay_pool.hpp"
#include "core/round/round_aggregate.hpp"
#include "core/storage/store.hpp"
#include "core/sync/event_publisher.hpp"

namespace gambit {

struct InviteDelivery {
  std::string recipient_pubkey;
  bool delivered = false;
  std::vector<std::string> relays;
  std::string message;
};

struct IncomingInvite {
  std::string gift_wrap_id;
  std::string sender_pubkey;
  std::string sender_label;
  std::string token;
  std::string initiation_event_id;
  std::vector<std::string> relay_hints;
  std::string course_name;
  std::int64_t sent_at = 0;
};

// Round invites delivered as gift-wrapped private messages: the relays see only a
// one-time key and the recipient tag.
class DirectMessageInviter {
public:
  DirectMessageInviter(Store& store, RoundAggregate& rounds, RelayPool& pool, const CryptoEngine& crypto,
                       EventPublisher& publisher, IdentityCache& identities,
                       std::vector<std::string> fallback_relays, std::int64_t lookback_seconds);

  // Token for the round's initiation event. Publishes the initiation first when the round has none.
  Result invite_token(RoundId round_id, std::string& token);

  // Best-effort per recipient; one failure never stops the rest. The local key is skipped.
  Result send_invites(RoundId round_id, const std::vector<std::string>& recipients,
                      std::vector<InviteDelivery>& deliveries);
  // Invites every non-local player of the round.
  Result send_invites(RoundId round_id, std::vector<InviteDelivery>& deliveries);

  // Newest first, one entry per round, rounds already joined left out.
  Result fetch_incoming_invites(std::vector<IncomingInvite>& out);

  Result publish_inbox_relays(const std::vector<std::string>& relays);

  // rumor (14) -> seal (13, signed by sender) -> gift wrap (1059, signed by a one-time key).
  static Result wrap_message(const IdentityKeyPair& sender, std::string_view recipient_pubkey,
                             std::string_view body, NetworkEvent& out);
  // Opens a gift wrap addressed to `recipient`. UntrustedContent when a layer fails to verify
  // or the rumor author differs from the seal signer.
  static Result unwrap_message(const IdentityKeyPair& recipient, const NetworkEvent& gift_wrap, NetworkEvent& rumor);

private:
  [[nodiscard]] std::vector<std::string> delivery_relays(std::string_view recipient_pubkey);

  Store& store_;
  RoundAggregate& rounds_;
  RelayPool& pool_;
  const CryptoEngine& crypto_;
  EventPublisher& publisher_;
  IdentityCache& identities_;
  std::vector<std::string> fallback_relays_;
  std::int64_t lookback_seconds_;
};

}  // namespace gambit
