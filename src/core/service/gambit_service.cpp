#include "core/service/gambit_service.hpp"

#include <array>
#include <chrono>
#include <filesystem>
#include <utility>

#include "core/model/app_meta.hpp"
#include "core/util/canonical.hpp"
#include "core/util/log.hpp"

namespace gambit {
namespace {

constexpr std::string_view kLogComponent = "service";

template <std::size_t N>
std::vector<std::string> relay_defaults(const std::vector<std::string>& configured,
                                        const std::array<std::string_view, N>& defaults) {
  if (!configured.empty()) {
    return configured;
  }
  return {defaults.begin(), defaults.end()};
}

std::string round_label(RoundId round_id) {
  return "round " + std::to_string(round_id);
}

bool all_players_scored(const RoundAggregate& rounds, RoundId round_id) {
  for (const auto& player : rounds.players(round_id)) {
    if (!rounds.is_finish_enabled(round_id, player.player_index)) {
      return false;
    }
  }
  return true;
}

}  // namespace

GambitService::~GambitService() {
  // Background tasks and waiters hold references to the components below.
  if (poller_) {
    poller_->stop();
  }
  {
    std::lock_guard lock(waiters_mutex_);
    for (auto& waiter : waiters_) {
      waiter.thread.join();
    }
    waiters_.clear();
  }
  if (tasks_) {
    tasks_->shutdown();
  }
}

Result GambitService::init(const InitConfig& config, std::shared_ptr<IRelayTransport> transport) {
  if (initialized_) {
    return Result::failure(ErrorCode::InvalidInput, "Init failed: service is already initialized.");
  }
  config_ = config;
  if (config_.app_data_dir.empty()) {
    return Result::failure(ErrorCode::InvalidInput, "Init failed: app_data_dir is required.");
  }
  if (config_.passphrase.empty()) {
    return Result::failure(ErrorCode::InvalidInput, "Init failed: passphrase is required.");
  }

  std::error_code ec;
  std::filesystem::create_directories(config_.app_data_dir, ec);
  if (ec) {
    return Result::failure(ErrorCode::Storage, "Init failed: unable to create app_data_dir: " + ec.message());
  }

  if (const Result crypto_init = crypto_.initialize(config_.app_data_dir, config_.passphrase); !crypto_init.ok) {
    return crypto_init;
  }
  if (const Result opened = store_.open((std::filesystem::path{config_.app_data_dir} / "store").string());
      !opened.ok) {
    return opened;
  }

  transport_ = transport ? std::move(transport) : std::make_shared<LoopbackRelayTransport>();
  pool_ = std::make_unique<RelayPool>(transport_);
  if (const Result configured = pool_->configure(relay_defaults(config_.publish_relays, kDefaultPublishRelays),
                                                 relay_defaults(config_.read_relays, kDefaultReadRelays));
      !configured.ok) {
    return configured;
  }
  if (config_.relays_dat_path.empty()) {
    config_.relays_dat_path = (std::filesystem::path{config_.app_data_dir} / "relays.dat").string();
  }
  if (const Result loaded = pool_->load_relays_dat(config_.relays_dat_path); !loaded.ok) {
    return loaded;
  }
  if (const Result saved = pool_->save_relays_dat(config_.relays_dat_path); !saved.ok) {
    util::log_warn(kLogComponent, "Could not write relays.dat: " + saved.message);
  }
  config_.dm_fallback_relays = relay_defaults(config_.dm_fallback_relays, kDefaultDmRelays);

  const std::string local = crypto_.identity().public_key;
  publisher_ = std::make_unique<EventPublisher>(store_, rounds_, *pool_, crypto_, config_.account);
  poller_ = std::make_unique<SyncPoller>(store_, rounds_, *pool_, config_.account);
  identities_ = std::make_unique<IdentityCache>(store_, *pool_, *publisher_, local,
                                                IdentityCacheTtl{
                                                    .follow_list_seconds = config_.follow_list_ttl_seconds,
                                                    .relay_list_seconds = config_.relay_list_ttl_seconds,
                                                });
  inviter_ = std::make_unique<DirectMessageInviter>(store_, rounds_, *pool_, crypto_, *publisher_, *identities_,
                                                    config_.dm_fallback_relays, config_.invite_lookback_seconds);
  joiner_ = std::make_unique<RoundJoiner>(store_, courses_, rounds_, *pool_, *publisher_, local);
  tasks_ = std::make_unique<TaskQueue>(config_.background_workers);

  initialized_ = true;
  util::log_info(kLogComponent, std::string{kAppDisplayName} + " core " + std::string{kAppVersion} +
                                    " ready for " + local.substr(0, 8) + "...");
  return Result::success("Initialized.", local);
}

Result GambitService::ensure_initialized(std::string_view operation) const {
  if (!initialized_) {
    return Result::failure(ErrorCode::InvalidInput, std::string{operation} + " failed: service is not initialized.");
  }
  return Result::success();
}

void GambitService::post_network_task(std::string label, std::function<Result()> task) {
  const std::string name = label;
  const bool queued = tasks_->post(std::move(label), [name, task = std::move(task)] {
    const Result result = task();
    if (!result.ok) {
      util::log_warn(kLogComponent, name + " failed (" + std::string{error_code_name(result.code)} +
                                        "): " + result.message);
    }
  });
  if (!queued) {
    util::log_warn(kLogComponent, name + " dropped: task queue is shut down.");
  }
}

Result GambitService::create_course(std::string_view course_name, std::string_view tee_set,
                                    const std::vector<HoleDefinition>& holes, CourseSnapshot& out) {
  if (const Result ready = ensure_initialized("create_course"); !ready.ok) {
    return ready;
  }
  return courses_.get_or_create(course_name, tee_set, holes, out);
}

Result GambitService::create_round(const RoundDraft& draft, Round& out) {
  if (const Result ready = ensure_initialized("create_round"); !ready.ok) {
    return ready;
  }

  CourseSnapshot course;
  if (const Result created = courses_.get_or_create(draft.course_name, draft.tee_set, draft.holes, course);
      !created.ok) {
    return created;
  }

  std::vector<std::string> players{crypto_.identity().public_key};
  players.insert(players.end(), draft.other_players.begin(), draft.other_players.end());
  if (const Result created = rounds_.create_round(course, players, draft.round_date, draft.multi_device, out);
      !created.ok) {
    return created;
  }

  if (publisher_->check_can_publish().ok) {
    const RoundId round_id = out.round_id;
    post_network_task("initiation for " + round_label(round_id),
                      [this, round_id] { return publisher_->publish_initiation(round_id); });
  }
  return Result::success("Round created.", std::to_string(out.round_id));
}

Result GambitService::record_score(RoundId round_id, int player_index, HoleNumber hole_number, Strokes strokes) {
  if (const Result ready = ensure_initialized("record_score"); !ready.ok) {
    return ready;
  }
  return rounds_.record_score(round_id, player_index, hole_number, strokes);
}

Result GambitService::finish_round(RoundId round_id) {
  if (const Result ready = ensure_initialized("finish_round"); !ready.ok) {
    return ready;
  }
  if (!rounds_.round(round_id).has_value()) {
    return Result::failure(ErrorCode::NotFound, "Unknown " + round_label(round_id) + ".");
  }
  if (rounds_.is_completed(round_id)) {
    return Result::success("Round already completed.");
  }

  // Multi-device rounds finish on the local player's card alone; remote progress never gates it.
  const bool can_finish = rounds_.is_multi_device(round_id) ? rounds_.is_finish_enabled(round_id, kLocalPlayerIndex)
                                                            : all_players_scored(rounds_, round_id);
  if (!can_finish) {
    return Result::failure(ErrorCode::InvalidInput, "Every hole must be scored before finishing.");
  }
  if (const Result completed = rounds_.complete_round(round_id); !completed.ok) {
    return completed;
  }

  if (publisher_->check_can_publish().ok) {
    post_network_task("final records for " + round_label(round_id),
                      [this, round_id] { return publisher_->publish_all_final_records(round_id); });
    if (rounds_.is_multi_device(round_id)) {
      post_network_task("live scorecard for " + round_label(round_id),
                        [this, round_id] { return publisher_->publish_live_scorecard(round_id); });
    }
  }
  return Result::success("Round completed.");
}

ScoreMap GambitService::current_scores(RoundId round_id, int player_index) const {
  return rounds_.current_scores(round_id, player_index);
}

bool GambitService::is_finish_enabled(RoundId round_id, int player_index) const {
  return rounds_.is_finish_enabled(round_id, player_index);
}

std::vector<RoundListItem> GambitService::list_rounds() const {
  return rounds_.list_rounds();
}

std::vector<RoundPlayer> GambitService::players(RoundId round_id) const {
  return rounds_.players(round_id);
}

std::optional<CourseSnapshot> GambitService::course_for(RoundId round_id) const {
  return rounds_.course_for(round_id);
}

std::optional<RoundNetworkRecord> GambitService::network_record(RoundId round_id) const {
  return store_.network_record(round_id);
}

ScorecardSession GambitService::scorecard() {
  return ScorecardSession{rounds_};
}

Result GambitService::publish_initiation(RoundId round_id) {
  if (const Result ready = ensure_initialized("publish_initiation"); !ready.ok) {
    return ready;
  }
  return publisher_->publish_initiation(round_id);
}

Result GambitService::publish_final_records(RoundId round_id) {
  if (const Result ready = ensure_initialized("publish_final_records"); !ready.ok) {
    return ready;
  }
  return publisher_->publish_all_final_records(round_id);
}

Result GambitService::publish_live_scorecard(RoundId round_id) {
  if (const Result ready = ensure_initialized("publish_live_scorecard"); !ready.ok) {
    return ready;
  }
  return publisher_->publish_live_scorecard(round_id);
}

void GambitService::publish_live_scorecard_async(RoundId round_id) {
  if (!initialized_ || !publisher_->check_can_publish().ok) {
    return;
  }
  post_network_task("live scorecard for " + round_label(round_id),
                    [this, round_id] { return publisher_->publish_live_scorecard(round_id); });
}

Result GambitService::refresh_remote_scores(RoundId round_id, std::map<std::string, ScoreMap>& out) {
  if (const Result ready = ensure_initialized("refresh_remote_scores"); !ready.ok) {
    return ready;
  }
  return poller_->refresh_remote_scores(round_id, out);
}

std::map<std::string, ScoreMap> GambitService::remote_scores(RoundId round_id) const {
  return store_.remote_scores(round_id);
}

Result GambitService::final_scorecard(RoundId round_id, std::vector<FinalRecord>& out) {
  if (const Result ready = ensure_initialized("final_scorecard"); !ready.ok) {
    return ready;
  }
  std::vector<FinalRecord> records;
  if (const Result fetched = poller_->fetch_final_records(round_id, records); !fetched.ok) {
    return fetched;
  }
  out = SyncPoller::combined_scorecard(records);
  return Result::success("Final scorecard ready.");
}

std::future<Result> GambitService::await_initiation_record_async(RoundId round_id, util::CancellationToken token) {
  if (const Result ready = ensure_initialized("await_initiation_record"); !ready.ok) {
    std::promise<Result> failed;
    failed.set_value(ready);
    return failed.get_future();
  }
  const int attempts = config_.invite_poll_attempts;
  const std::chrono::milliseconds interval{config_.invite_poll_interval_ms};
  std::promise<Result> promise;
  std::future<Result> future = promise.get_future();
  auto done = std::make_shared<std::atomic<bool>>(false);

  std::lock_guard lock(waiters_mutex_);
  std::erase_if(waiters_, [](Waiter& waiter) {
    if (!waiter.done->load()) {
      return false;
    }
    waiter.thread.join();
    return true;
  });
  // Runs outside the task queue: the publish it waits for may be queued behind it.
  SyncPoller* poller = poller_.get();
  waiters_.push_back({
      .thread = std::thread([poller, round_id, attempts, interval, token = std::move(token), done,
                             promise = std::move(promise)]() mutable {
        promise.set_value(poller->await_initiation_record(round_id, attempts, interval, token));
        done->store(true);
      }),
      .done = done,
  });
  return future;
}

Result GambitService::invite_token(RoundId round_id, std::string& token) {
  if (const Result ready = ensure_initialized("invite_token"); !ready.ok) {
    return ready;
  }
  return inviter_->invite_token(round_id, token);
}

Result GambitService::send_invites(RoundId round_id, std::vector<InviteDelivery>& deliveries) {
  if (const Result ready = ensure_initialized("send_invites"); !ready.ok) {
    return ready;
  }
  return inviter_->send_invites(round_id, deliveries);
}

void GambitService::send_invites_async(RoundId round_id) {
  if (!initialized_ || !publisher_->check_can_publish().ok) {
    return;
  }
  post_network_task("invites for " + round_label(round_id), [this, round_id] {
    std::vector<InviteDelivery> deliveries;
    return inviter_->send_invites(round_id, deliveries);
  });
}

Result GambitService::fetch_incoming_invites(std::vector<IncomingInvite>& out) {
  if (const Result ready = ensure_initialized("fetch_incoming_invites"); !ready.ok) {
    return ready;
  }
  return inviter_->fetch_incoming_invites(out);
}

Result GambitService::join_round(std::string_view invite_token, RoundId& out) {
  if (const Result ready = ensure_initialized("join_round"); !ready.ok) {
    return ready;
  }
  return joiner_->join_round(invite_token, out);
}

Result GambitService::publish_inbox_relays(const std::vector<std::string>& relays) {
  if (const Result ready = ensure_initialized("publish_inbox_relays"); !ready.ok) {
    return ready;
  }
  return inviter_->publish_inbox_relays(relays);
}

Result GambitService::resolve_profiles(const std::vector<std::string>& pubkeys, std::map<std::string, Profile>& out) {
  if (const Result ready = ensure_initialized("resolve_profiles"); !ready.ok) {
    return ready;
  }
  return identities_->resolve(pubkeys, out);
}

std::vector<Profile> GambitService::search_profiles(std::string_view query) const {
  if (!initialized_) {
    return {};
  }
  return identities_->search_profiles(query);
}

Result GambitService::publish_profile(const Profile& profile) {
  if (const Result ready = ensure_initialized("publish_profile"); !ready.ok) {
    return ready;
  }
  return identities_->publish_profile(profile);
}

Result GambitService::follow(std::string_view pubkey) {
  if (const Result ready = ensure_initialized("follow"); !ready.ok) {
    return ready;
  }
  return identities_->follow(pubkey);
}

Result GambitService::unfollow(std::string_view pubkey) {
  if (const Result ready = ensure_initialized("unfollow"); !ready.ok) {
    return ready;
  }
  return identities_->unfollow(pubkey);
}

Result GambitService::refresh_follow_list(bool force, CachedFollowList& out) {
  if (const Result ready = ensure_initialized("refresh_follow_list"); !ready.ok) {
    return ready;
  }
  return identities_->refresh_follow_list(crypto_.identity().public_key, force, out);
}

Result GambitService::add_favorite(std::string_view pubkey) {
  if (const Result ready = ensure_initialized("add_favorite"); !ready.ok) {
    return ready;
  }
  return identities_->add_favorite(pubkey);
}

Result GambitService::remove_favorite(std::string_view pubkey) {
  if (const Result ready = ensure_initialized("remove_favorite"); !ready.ok) {
    return ready;
  }
  return identities_->remove_favorite(pubkey);
}

Result GambitService::refresh_favorites(bool force, CachedFavorites& out) {
  if (const Result ready = ensure_initialized("refresh_favorites"); !ready.ok) {
    return ready;
  }
  return identities_->refresh_favorites(crypto_.identity().public_key, force, out);
}

Result GambitService::add_relay(std::string_view url, std::string_view marker) {
  if (const Result ready = ensure_initialized("add_relay"); !ready.ok) {
    return ready;
  }
  if (const Result added = pool_->add_relay(url, marker); !added.ok) {
    return added;
  }
  return pool_->save_relays_dat(config_.relays_dat_path);
}

Result GambitService::remove_relay(std::string_view url) {
  if (const Result ready = ensure_initialized("remove_relay"); !ready.ok) {
    return ready;
  }
  if (const Result removed = pool_->remove_relay(url); !removed.ok) {
    return removed;
  }
  return pool_->save_relays_dat(config_.relays_dat_path);
}

Result GambitService::reload_relays_dat() {
  if (const Result ready = ensure_initialized("reload_relays_dat"); !ready.ok) {
    return ready;
  }
  return pool_->load_relays_dat(config_.relays_dat_path);
}

void GambitService::set_account_state(AccountState account) {
  config_.account = account;
  if (!initialized_) {
    return;
  }
  publisher_->set_account_state(account);
  poller_->set_account_state(account);
}

void GambitService::drain() {
  if (tasks_) {
    tasks_->drain();
  }
}

std::string GambitService::public_key() const {
  return crypto_.identity().public_key;
}

ServiceStatus GambitService::status() const {
  ServiceStatus status;
  status.public_key = crypto_.identity().public_key;
  status.data_dir = config_.app_data_dir;
  status.relays_dat_path = config_.relays_dat_path;
  status.account = config_.account;
  if (!initialized_) {
    return status;
  }
  status.relays = pool_->relays();
  status.relay_stats = pool_->stats();
  status.course_count = store_.course_count();
  status.round_count = store_.rounds().size();
  status.pending_tasks = tasks_->pending();
  status.skipped_store_lines = store_.skipped_line_count();
  return status;
}

}  // namespace gambit
