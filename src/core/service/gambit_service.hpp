#pragma once

#include <atomic>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "core/course/course_store.hpp"
#include "core/crypto/crypto.hpp"
#include "core/identity/identity_cache.hpp"
#include "core/invite/direct_message_inviter.hpp"
#include "core/invite/round_join.hpp"
#include "core/model/types.hpp"
#include "core/protocol/round_events.hpp"
#include "core/relay/relay_pool.hpp"
#include "core/relay/relay_transport.hpp"
#include "core/round/round_aggregate.hpp"
#include "core/round/scorecard_session.hpp"
#include "core/service/task_queue.hpp"
#include "core/storage/store.hpp"
#include "core/sync/event_publisher.hpp"
#include "core/sync/sync_poller.hpp"
#include "core/util/cancellation.hpp"

namespace gambit {

struct RoundDraft {
  std::string course_name;
  std::string tee_set;
  std::vector<HoleDefinition> holes;
  // Everyone except the local player, in selection order.
  std::vector<std::string> other_players;
  std::string round_date;
  bool multi_device = false;
};

struct ServiceStatus {
  std::string public_key;
  std::string data_dir;
  std::string relays_dat_path;
  std::vector<RelayEntry> relays;
  RelayPoolStats relay_stats;
  AccountState account;
  std::size_t course_count = 0;
  std::size_t round_count = 0;
  std::size_t pending_tasks = 0;
  std::size_t skipped_store_lines = 0;
};

class GambitService {
public:
  GambitService() = default;
  ~GambitService();

  GambitService(const GambitService&) = delete;
  GambitService& operator=(const GambitService&) = delete;

  // Without a transport the service talks to an in-process loopback relay set.
  Result init(const InitConfig& config, std::shared_ptr<IRelayTransport> transport = nullptr);
  [[nodiscard]] bool initialized() const { return initialized_; }

  Result create_course(std::string_view course_name, std::string_view tee_set,
                       const std::vector<HoleDefinition>& holes, CourseSnapshot& out);
  // Creates the round locally and queues the initiation publish.
  Result create_round(const RoundDraft& draft, Round& out);
  Result record_score(RoundId round_id, int player_index, HoleNumber hole_number, Strokes strokes);
  // Completes the round once the local player can finish, then queues the final records.
  Result finish_round(RoundId round_id);

  [[nodiscard]] ScoreMap current_scores(RoundId round_id, int player_index) const;
  [[nodiscard]] bool is_finish_enabled(RoundId round_id, int player_index) const;
  [[nodiscard]] std::vector<RoundListItem> list_rounds() const;
  [[nodiscard]] std::vector<RoundPlayer> players(RoundId round_id) const;
  [[nodiscard]] std::optional<CourseSnapshot> course_for(RoundId round_id) const;
  [[nodiscard]] std::optional<RoundNetworkRecord> network_record(RoundId round_id) const;
  [[nodiscard]] ScorecardSession scorecard();

  Result publish_initiation(RoundId round_id);
  Result publish_final_records(RoundId round_id);
  Result publish_live_scorecard(RoundId round_id);
  void publish_live_scorecard_async(RoundId round_id);

  Result refresh_remote_scores(RoundId round_id, std::map<std::string, ScoreMap>& out);
  [[nodiscard]] std::map<std::string, ScoreMap> remote_scores(RoundId round_id) const;
  // Combined scorecard: latest record per player, lowest total first.
  Result final_scorecard(RoundId round_id, std::vector<FinalRecord>& out);
  // Polls on a service-owned thread. Destroying the service cancels the wait and joins the
  // thread, so the future always becomes ready and may outlive the service.
  std::future<Result> await_initiation_record_async(RoundId round_id, util::CancellationToken token);

  Result invite_token(RoundId round_id, std::string& token);
  Result send_invites(RoundId round_id, std::vector<InviteDelivery>& deliveries);
  void send_invites_async(RoundId round_id);
  Result fetch_incoming_invites(std::vector<IncomingInvite>& out);
  Result join_round(std::string_view invite_token, RoundId& out);
  Result publish_inbox_relays(const std::vector<std::string>& relays);

  Result resolve_profiles(const std::vector<std::string>& pubkeys, std::map<std::string, Profile>& out);
  [[nodiscard]] std::vector<Profile> search_profiles(std::string_view query) const;
  Result publish_profile(const Profile& profile);
  Result follow(std::string_view pubkey);
  Result unfollow(std::string_view pubkey);
  Result refresh_follow_list(bool force, CachedFollowList& out);
  Result add_favorite(std::string_view pubkey);
  Result remove_favorite(std::string_view pubkey);
  Result refresh_favorites(bool force, CachedFavorites& out);

  Result add_relay(std::string_view url, std::string_view marker = {});
  Result remove_relay(std::string_view url);
  Result reload_relays_dat();

  void set_account_state(AccountState account);
  // Waits for every queued background task.
  void drain();

  [[nodiscard]] std::string public_key() const;
  [[nodiscard]] ServiceStatus status() const;

private:
  Result ensure_initialized(std::string_view operation) const;
  void post_network_task(std::string label, std::function<Result()> task);

  InitConfig config_;
  bool initialized_ = false;

  CryptoEngine crypto_;
  Store store_;
  CourseStore courses_{store_};
  RoundAggregate rounds_{store_};
  std::shared_ptr<IRelayTransport> transport_;
  std::unique_ptr<RelayPool> pool_;
  std::unique_ptr<EventPublisher> publisher_;
  std::unique_ptr<SyncPoller> poller_;
  std::unique_ptr<IdentityCache> identities_;
  std::unique_ptr<DirectMessageInviter> inviter_;
  std::unique_ptr<RoundJoiner> joiner_;
  std::unique_ptr<TaskQueue> tasks_;

  struct Waiter {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };
  std::mutex waiters_mutex_;
  std::vector<Waiter> waiters_;
};

}  // namespace gambit
