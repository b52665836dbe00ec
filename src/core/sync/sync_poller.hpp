#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "core/model/types.hpp"
#include "core/protocol/round_events.hpp"
#include "core/relay/relay_pool.hpp"
#include "core/round/round_aggregate.hpp"
#include "core/storage/store.hpp"
#include "core/util/cancellation.hpp"

namespace gambit {

// On-demand merge of remote players' progress. Remote snapshots land in the remote_scores
// side table; the local hole_scores log is never written here.
class SyncPoller {
public:
  SyncPoller(Store& store, RoundAggregate& rounds, RelayPool& pool, AccountState account);

  void set_account_state(AccountState account);
  // Ends every current and future await with Cancelled, at the latest one poll interval later.
  void stop();

  Result refresh_remote_scores(RoundId round_id, std::map<std::string, ScoreMap>& out);

  // Polls the local network record until the background initiation publish has stored it.
  // Timeout after max_attempts, Cancelled as soon as the token fires or stop() is called.
  Result await_initiation_record(RoundId round_id, int max_attempts, std::chrono::milliseconds interval,
                                 const util::CancellationToken& token);

  Result fetch_final_records(RoundId round_id, std::vector<FinalRecord>& out);

  // One record per scored player, lowest total first. A player's own record beats one written
  // for them by the initiator; otherwise the latest wins.
  static std::vector<FinalRecord> combined_scorecard(const std::vector<FinalRecord>& records);

private:
  [[nodiscard]] Result check_can_read() const;
  // Empty when the initiation event cannot be fetched.
  std::string initiation_author(const RoundNetworkRecord& record, const std::vector<std::string>& players);

  Store& store_;
  RoundAggregate& rounds_;
  RelayPool& pool_;
  mutable std::mutex account_mutex_;
  AccountState account_;
  util::CancellationSource stop_;
};

}  // namespace gambit
