#pragma once

#include <mutex>
#include <string>
#include <string_view>

#include "core/course/course_store.hpp"
#include "core/model/types.hpp"
#include "core/protocol/round_events.hpp"
#include "core/relay/relay_pool.hpp"
#include "core/round/round_aggregate.hpp"
#include "core/storage/store.hpp"
#include "core/sync/event_publisher.hpp"

namespace gambit {

// Rebuilds a round on this device from an invite token. The initiation event is the only
// input, so every hash it embeds is recomputed before anything is stored.
class RoundJoiner {
public:
  RoundJoiner(Store& store, CourseStore& courses, RoundAggregate& rounds, RelayPool& pool,
              EventPublisher& publisher, std::string local_pubkey);

  // Idempotent per initiation event: a second join returns the round created by the first.
  Result join_round(std::string_view invite_token, RoundId& out);

  // Local key first, the other participants in tag order.
  static std::vector<std::string> joined_player_order(const std::vector<std::string>& tagged_players,
                                                      std::string_view local_pubkey);

private:
  Store& store_;
  CourseStore& courses_;
  RoundAggregate& rounds_;
  RelayPool& pool_;
  EventPublisher& publisher_;
  std::string local_pubkey_;
  std::mutex join_mutex_;
};

}  // namespace gambit
