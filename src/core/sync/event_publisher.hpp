#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "core/crypto/crypto.hpp"
#include "core/model/types.hpp"
#include "core/protocol/event.hpp"
#include "core/relay/relay_pool.hpp"
#include "core/round/round_aggregate.hpp"
#include "core/storage/store.hpp"

namespace gambit {

class EventPublisher {
public:
  EventPublisher(Store& store, RoundAggregate& rounds, RelayPool& pool, const CryptoEngine& crypto,
                 AccountState account);

  void set_account_state(AccountState account);
  [[nodiscard]] AccountState account_state() const;
  // Disabled when the account is not network-activated or is read-only.
  [[nodiscard]] Result check_can_publish() const;

  // Publishes the round's initiation once and stores its id. When a network record already
  // exists nothing is sent and the stored id is returned in Result::data.
  Result publish_initiation(RoundId round_id, JoinedVia joined_via);
  Result publish_initiation(RoundId round_id);

  // Publishes the initiation first when the round has none yet, so a final record never
  // precedes the event it references.
  Result publish_final_record(RoundId round_id, int player_index);
  Result publish_all_final_records(RoundId round_id);

  // Kind 30501 snapshot of the local player's scores. Skipped (ok, empty data) without an
  // initiation id.
  Result publish_live_scorecard(RoundId round_id);

  // Signs with the local identity and publishes to the write relays.
  Result sign_and_publish(NetworkEvent& event);

  [[nodiscard]] JoinedVia default_joined_via(RoundId round_id) const;

private:
  Store& store_;
  RoundAggregate& rounds_;
  RelayPool& pool_;
  const CryptoEngine& crypto_;

  mutable std::mutex account_mutex_;
  AccountState account_;
  std::mutex initiation_mutex_;
};

}  // namespace gambit
