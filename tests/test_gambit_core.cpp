#include <algorithm>
#include <atomic>
#include <cassert>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "core/api/core_api.hpp"
#include "core/course/course_store.hpp"
#include "core/crypto/crypto.hpp"
#include "core/identity/identity_cache.hpp"
#include "core/invite/direct_message_inviter.hpp"
#include "core/protocol/event.hpp"
#include "core/protocol/invite_codec.hpp"
#include "core/protocol/round_events.hpp"
#include "core/relay/relay_pool.hpp"
#include "core/relay/relay_transport.hpp"
#include "core/round/round_aggregate.hpp"
#include "core/round/scorecard_session.hpp"
#include "core/service/gambit_service.hpp"
#include "core/service/task_queue.hpp"
#include "core/storage/store.hpp"
#include "core/sync/event_publisher.hpp"
#include "core/sync/sync_poller.hpp"
#include "core/util/canonical.hpp"
#include "core/util/canonical_json.hpp"
#include "core/util/log.hpp"

namespace {

const std::string kRelayA = "wss://relay-a.test";
const std::string kRelayB = "wss://relay-b.test";

std::filesystem::path temp_dir(const std::string& name) {
  const auto root = std::filesystem::temp_directory_path() / "gambit-tests" / name;
  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  std::filesystem::create_directories(root, ec);
  return root;
}

std::vector<gambit::HoleDefinition> alternating_holes(int count) {
  constexpr int kPars[] = {4, 3, 5};
  std::vector<gambit::HoleDefinition> holes;
  for (int hole = 1; hole <= count; ++hole) {
    holes.push_back({.hole_number = hole, .par = kPars[(hole - 1) % 3]});
  }
  return holes;
}

std::string random_pubkey() {
  return gambit::CryptoEngine::generate_keypair().public_key;
}

// Store, identity, loopback relays and the round/publish components over them.
struct CoreFixture {
  explicit CoreFixture(const std::string& name)
      : dir(temp_dir(name)), transport(std::make_shared<gambit::LoopbackRelayTransport>()), pool(transport) {
    const gambit::Result opened = store.open((dir / "store").string());
    assert(opened.ok);
    const gambit::Result unlocked = crypto.initialize(dir.string(), "fixture-passphrase");
    assert(unlocked.ok);
    const gambit::Result configured = pool.configure({kRelayA, kRelayB}, {kRelayA, kRelayB});
    assert(configured.ok);
  }

  gambit::CourseSnapshot course(int hole_count = 18) {
    gambit::CourseSnapshot snapshot;
    const gambit::Result created =
        courses.get_or_create("Pebble Creek", "White", alternating_holes(hole_count), snapshot);
    assert(created.ok);
    return snapshot;
  }

  std::filesystem::path dir;
  gambit::Store store;
  gambit::CryptoEngine crypto;
  std::shared_ptr<gambit::LoopbackRelayTransport> transport;
  gambit::RelayPool pool;
  gambit::CourseStore courses{store};
  gambit::RoundAggregate rounds{store};
  gambit::EventPublisher publisher{store, rounds, pool, crypto, gambit::AccountState{}};
};

gambit::InitConfig service_config(const std::filesystem::path& dir) {
  gambit::InitConfig config;
  config.app_data_dir = dir.string();
  config.passphrase = "service-passphrase";
  config.publish_relays = {kRelayA, kRelayB};
  config.read_relays = {kRelayA, kRelayB};
  config.dm_fallback_relays = {kRelayA};
  config.invite_poll_attempts = 5;
  config.invite_poll_interval_ms = 20;
  return config;
}

void score_all_holes(gambit::GambitService& service, gambit::RoundId round_id, int player_index, int hole_count,
                     int strokes) {
  for (int hole = 1; hole <= hole_count; ++hole) {
    const gambit::Result recorded = service.record_score(round_id, player_index, hole, strokes);
    assert(recorded.ok);
  }
}

void test_course_snapshot_is_content_addressed() {
  CoreFixture fx("course-snapshot");

  gambit::CourseSnapshot first;
  gambit::CourseSnapshot second;
  const gambit::Result a = fx.courses.get_or_create("Pebble Creek", "White", alternating_holes(18), first);
  const gambit::Result b = fx.courses.get_or_create("Pebble Creek", "White", alternating_holes(18), second);
  assert(a.ok && b.ok);
  assert(a.data == first.content_hash);
  assert(first.content_hash == second.content_hash);
  assert(first.content_hash.size() == 64);
  assert(fx.store.course_count() == 1);

  // Input order does not matter; holes are canonicalized by number.
  auto reversed = alternating_holes(18);
  std::reverse(reversed.begin(), reversed.end());
  gambit::CourseSnapshot reordered;
  assert(fx.courses.get_or_create("Pebble Creek", "White", reversed, reordered).ok);
  assert(reordered.content_hash == first.content_hash);
  assert(fx.store.course_count() == 1);

  gambit::CourseSnapshot blue;
  assert(fx.courses.get_or_create("Pebble Creek", "Blue", alternating_holes(18), blue).ok);
  assert(blue.content_hash != first.content_hash);
  assert(fx.store.course_count() == 2);

  assert(first.canonical_json.find("\"handicap_index\":null") != std::string::npos);
  assert(gambit::CourseStore::verify_embedded(first.canonical_json, first.content_hash).ok);
  const gambit::Result mismatch = gambit::CourseStore::verify_embedded(first.canonical_json, blue.content_hash);
  assert(!mismatch.ok && mismatch.code == gambit::ErrorCode::UntrustedContent);
  const gambit::Result unreadable = gambit::CourseStore::verify_embedded("not json", first.content_hash);
  assert(!unreadable.ok && unreadable.code == gambit::ErrorCode::InvalidInput);

  auto bad_par = alternating_holes(9);
  bad_par[2].par = 7;
  gambit::CourseSnapshot rejected;
  assert(fx.courses.get_or_create("Short", "Red", bad_par, rejected).code == gambit::ErrorCode::InvalidInput);
  assert(fx.courses.get_or_create("Short", "Red", alternating_holes(7), rejected).code ==
         gambit::ErrorCode::InvalidInput);

  // A reopened store keeps exactly the same rows.
  gambit::Store reopened;
  assert(reopened.open((fx.dir / "store").string()).ok);
  assert(reopened.course_count() == 2);
  assert(reopened.course(first.content_hash)->holes.size() == 18);
}

void test_create_round_assigns_indices() {
  CoreFixture fx("create-round");
  const gambit::CourseSnapshot course = fx.course();
  const std::string local = fx.crypto.identity().public_key;
  const std::string p2 = random_pubkey();
  const std::string p3 = random_pubkey();

  gambit::Round round;
  const gambit::Result created = fx.rounds.create_round(course, {local, p2, p3}, "2026-05-02", false, round);
  assert(created.ok);
  const auto players = fx.rounds.players(round.round_id);
  assert(players.size() == 3);
  assert(players[0].player_index == 0 && players[0].pubkey_hex == local);
  assert(players[1].player_index == 1 && players[1].pubkey_hex == p2);
  assert(players[2].player_index == 2 && players[2].pubkey_hex == p3);
  assert(fx.rounds.round(round.round_id)->round_date == "2026-05-02");

  gambit::Round rejected;
  assert(fx.rounds.create_round(course, {local, p2, p2}, "", false, rejected).code ==
         gambit::ErrorCode::InvalidPlayerSet);
  assert(fx.rounds.create_round(course, {local, "not-a-key"}, "", false, rejected).code ==
         gambit::ErrorCode::InvalidPlayerSet);
  assert(fx.rounds.create_round(course, {}, "", false, rejected).code == gambit::ErrorCode::InvalidPlayerSet);
  assert(fx.rounds.list_rounds().size() == 1);

  gambit::Round dated_today;
  assert(fx.rounds.create_round(course, {local}, "", false, dated_today).ok);
  assert(dated_today.round_date.size() == 10);
  assert(dated_today.round_id > round.round_id);
}

void test_latest_score_wins() {
  CoreFixture fx("latest-score");
  const gambit::CourseSnapshot course = fx.course();
  gambit::Round round;
  assert(fx.rounds.create_round(course, {fx.crypto.identity().public_key}, "", false, round).ok);

  assert(fx.rounds.record_score_at(round.round_id, 0, 3, 5, 1000).ok);
  assert(fx.rounds.record_score_at(round.round_id, 0, 3, 4, 2000).ok);
  auto scores = fx.rounds.current_scores(round.round_id, 0);
  assert(scores.at(3) == 4);

  // Arrival order does not matter, the recorded time does.
  assert(fx.rounds.record_score_at(round.round_id, 0, 4, 6, 3000).ok);
  assert(fx.rounds.record_score_at(round.round_id, 0, 4, 2, 2500).ok);
  // Equal times resolve to the later append.
  assert(fx.rounds.record_score_at(round.round_id, 0, 5, 3, 4000).ok);
  assert(fx.rounds.record_score_at(round.round_id, 0, 5, 7, 4000).ok);

  scores = fx.rounds.current_scores(round.round_id, 0);
  assert(scores.size() == 3);
  assert(scores.at(4) == 6);
  assert(scores.at(5) == 7);
  assert(!scores.contains(1));
  assert(fx.store.score_events(round.round_id).size() == 6);

  assert(fx.rounds.record_score(round.round_id, 0, 3, 0).code == gambit::ErrorCode::InvalidInput);
  assert(fx.rounds.record_score(round.round_id, 0, 3, 21).code == gambit::ErrorCode::InvalidInput);
  assert(fx.rounds.record_score(round.round_id, 0, 19, 4).code == gambit::ErrorCode::InvalidInput);
  assert(fx.rounds.record_score(round.round_id, 1, 3, 4).code == gambit::ErrorCode::InvalidInput);

  gambit::Store reopened;
  assert(reopened.open((fx.dir / "store").string()).ok);
  const auto replayed = reopened.current_scores(round.round_id, 0);
  assert(replayed.at(3) == 4 && replayed.at(4) == 6 && replayed.at(5) == 7);
}

void test_finish_predicate_uses_local_scores() {
  CoreFixture fx("finish-predicate");
  const gambit::CourseSnapshot course = fx.course();
  const std::string local = fx.crypto.identity().public_key;
  gambit::Round round;
  assert(fx.rounds.create_round(course, {local, random_pubkey()}, "", true, round).ok);
  assert(fx.rounds.is_multi_device(round.round_id));

  for (int hole = 1; hole <= 17; ++hole) {
    assert(fx.rounds.record_score(round.round_id, 0, hole, 4).ok);
  }
  assert(!fx.rounds.is_finish_enabled(round.round_id, 0));
  assert(fx.rounds.record_score(round.round_id, 0, 18, 5).ok);
  assert(fx.rounds.is_finish_enabled(round.round_id, 0));

  // The remote player has nothing synced and does not block the local finish.
  assert(!fx.rounds.is_finish_enabled(round.round_id, 1));
  assert(fx.rounds.record_score(round.round_id, 0, 7, 6).ok);
  assert(fx.rounds.is_finish_enabled(round.round_id, 0));

  assert(fx.rounds.complete_round(round.round_id).ok);
  assert(fx.rounds.complete_round(round.round_id).ok);
  assert(fx.rounds.is_completed(round.round_id));
  const auto listed = fx.rounds.list_rounds();
  assert(listed.size() == 1 && listed.front().completed);
  assert(listed.front().holes_scored == 18);
  assert(listed.front().total_strokes.value() == 17 * 4 + 5 + 2);
}

void test_scorecard_session_commands() {
  CoreFixture fx("scorecard-session");
  const gambit::CourseSnapshot course = fx.course(9);
  const std::string local = fx.crypto.identity().public_key;
  gambit::Round round;
  assert(fx.rounds.create_round(course, {local, random_pubkey()}, "", false, round).ok);

  gambit::ScorecardSession session(fx.rounds);
  assert(session.load(round.round_id).ok);
  auto state = session.snapshot();
  assert(state.current_hole == 1 && state.current_par == 4);
  assert(state.current_strokes == 4 && !state.current_hole_scored);
  assert(state.holes_scored == 0 && state.score_to_par == "E");

  assert(session.increment().ok);
  assert(fx.rounds.current_scores(round.round_id, 0).at(1) == 5);
  assert(session.decrement().ok);
  assert(fx.rounds.current_scores(round.round_id, 0).at(1) == 4);
  assert(session.increment().ok);

  assert(session.advance_hole().ok);
  state = session.snapshot();
  assert(state.current_hole == 2 && !state.current_hole_scored && state.holes_scored == 1);
  assert(state.score_to_par == "+1");

  // Leaving an unscored hole confirms it at par.
  assert(session.advance_hole().ok);
  assert(fx.rounds.current_scores(round.round_id, 0).at(2) == 3);

  gambit::ScorecardSession resumed(fx.rounds);
  assert(resumed.load(round.round_id).ok);
  assert(resumed.snapshot().current_hole == 3);
  for (int i = 0; i < 10; ++i) {
    assert(resumed.decrement().ok);
  }
  assert(fx.rounds.current_scores(round.round_id, 0).at(3) == 1);
  assert(resumed.snapshot().score_to_par == "-3");

  assert(!resumed.request_finish().ok);
  while (!resumed.snapshot().on_last_hole) {
    assert(resumed.advance_hole().ok);
  }
  assert(resumed.confirm_at_par().ok);
  state = resumed.snapshot();
  assert(state.holes_scored == 9);
  // Player 2 has no scores yet on this shared device.
  assert(!state.finish_enabled);

  assert(resumed.switch_player(1).ok);
  for (int hole = 1; hole <= 9; ++hole) {
    assert(fx.rounds.record_score(round.round_id, 1, hole, 4).ok);
  }
  assert(resumed.snapshot().finish_enabled);
  assert(resumed.request_finish().ok);
  assert(resumed.snapshot().completed);
  assert(!resumed.snapshot().finish_enabled);

  assert(gambit::score_to_par_label(0) == "E");
  assert(gambit::score_to_par_label(3) == "+3");
  assert(gambit::score_to_par_label(-2) == "-2");

  gambit::Round multi;
  assert(fx.rounds.create_round(course, {local, random_pubkey()}, "", true, multi).ok);
  gambit::ScorecardSession remote_guard(fx.rounds);
  assert(remote_guard.load(multi.round_id).ok);
  assert(!remote_guard.switch_player(1).ok);
}

void test_event_signing_and_tamper_detection() {
  const gambit::IdentityKeyPair keys = gambit::CryptoEngine::generate_keypair();
  gambit::NetworkEvent event;
  event.kind = gambit::event_kind::kProfile;
  event.created_at = 1700000000;
  event.content = "{\"name\":\"ace\"}";
  assert(gambit::finalize_event(event, keys).ok);
  assert(event.pubkey == keys.public_key);
  assert(event.id.size() == 64 && event.sig.size() == 128);
  assert(gambit::verify_event(event).ok);

  gambit::NetworkEvent parsed;
  assert(gambit::event_from_json(gambit::event_to_json(event), parsed).ok);
  assert(parsed.id == event.id && gambit::verify_event(parsed).ok);

  gambit::NetworkEvent altered = event;
  altered.content = "{\"name\":\"eagle\"}";
  assert(gambit::verify_event(altered).code == gambit::ErrorCode::UntrustedContent);

  gambit::NetworkEvent forged = event;
  forged.pubkey = random_pubkey();
  assert(gambit::verify_event(forged).code == gambit::ErrorCode::UntrustedContent);
}

void test_round_event_builders() {
  CoreFixture fx("round-events");
  const gambit::CourseSnapshot course = fx.course(9);
  const std::string local = fx.crypto.identity().public_key;
  const std::string other = random_pubkey();

  gambit::NetworkEvent initiation;
  assert(gambit::build_initiation_event(course, {local, other}, "2026-06-01", initiation).ok);
  assert(gambit::finalize_event(initiation, fx.crypto.identity()).ok);
  gambit::InitiationData data;
  assert(gambit::parse_initiation_event(initiation, data).ok);
  assert(data.course_hash == course.content_hash);
  assert(data.rules_hash == gambit::CourseStore::rules_hash());
  assert(data.round_date == "2026-06-01");
  assert((data.players == std::vector<std::string>{local, other}));
  assert(data.holes.size() == 9 && data.course_name == "Pebble Creek");
  assert(initiation.tag_values("t") == (std::vector<std::string>{"golf", "gambitgolf"}));

  const gambit::ScoreMap scores{{1, 4}, {2, 3}, {3, 6}};
  gambit::NetworkEvent final_event;
  assert(gambit::build_final_record_event(initiation.id, scores, other, {local, other}, final_event).ok);
  assert(final_event.tag_values("p").front() == other);
  assert(gambit::finalize_event(final_event, fx.crypto.identity()).ok);
  gambit::FinalRecord record;
  assert(gambit::parse_final_record(final_event, record).ok);
  assert(record.initiation_event_id == initiation.id);
  assert(record.scored_pubkey == other);
  assert(record.total == 13 && record.scores == scores);

  gambit::NetworkEvent live;
  assert(gambit::build_live_scorecard_event(initiation.id, scores, gambit::kStatusInProgress, {local, other}, live)
             .ok);
  assert(live.d_tag().value() == initiation.id);
  assert(live.content.empty());
  assert(gambit::finalize_event(live, fx.crypto.identity()).ok);
  gambit::LiveScorecard card;
  assert(gambit::parse_live_scorecard(live, card).ok);
  assert(card.status == gambit::kStatusInProgress && card.scores == scores);
}

void test_tampered_initiation_is_untrusted() {
  CoreFixture fx("untrusted-initiation");
  const gambit::CourseSnapshot course = fx.course(9);
  const gambit::IdentityKeyPair host = gambit::CryptoEngine::generate_keypair();

  gambit::NetworkEvent event;
  assert(gambit::build_initiation_event(course, {host.public_key, fx.crypto.identity().public_key}, "", event).ok);
  nlohmann::json content;
  assert(gambit::util::parse_json(event.content, content).ok);
  content["course_snapshot"]["course_name"] = "Pebble Creek Championship";
  event.content = gambit::util::canonical_json(content).data;
  assert(gambit::finalize_event(event, host).ok);

  // Validly signed, but the embedded course hash no longer matches.
  assert(gambit::verify_event(event).ok);
  gambit::InitiationData data;
  const gambit::Result parsed = gambit::parse_initiation_event(event, data);
  assert(!parsed.ok && parsed.code == gambit::ErrorCode::UntrustedContent);

  const auto service_dir = temp_dir("untrusted-initiation-service");
  auto transport = std::make_shared<gambit::LoopbackRelayTransport>();
  gambit::GambitService service;
  assert(service.init(service_config(service_dir), transport).ok);

  gambit::NetworkEvent addressed;
  assert(gambit::build_initiation_event(course, {host.public_key, service.public_key()}, "", addressed).ok);
  nlohmann::json addressed_content;
  assert(gambit::util::parse_json(addressed.content, addressed_content).ok);
  addressed_content["course_snapshot"]["holes"][0]["par"] = 5;
  addressed.content = gambit::util::canonical_json(addressed_content).data;
  assert(gambit::finalize_event(addressed, host).ok);
  transport->inject(kRelayA, addressed);

  const gambit::Result token = gambit::encode_invite({.event_id = addressed.id, .relay_hints = {kRelayA}});
  assert(token.ok);
  gambit::RoundId joined = 0;
  const gambit::Result rejected = service.join_round(token.data, joined);
  assert(!rejected.ok && rejected.code == gambit::ErrorCode::UntrustedContent);
  assert(service.list_rounds().empty());

  const gambit::Result missing_token = gambit::encode_invite({.event_id = random_pubkey(), .relay_hints = {}});
  const gambit::Result missing = service.join_round(missing_token.data, joined);
  assert(!missing.ok && missing.code == gambit::ErrorCode::NotFound);
}

void test_invite_codec() {
  const std::string event_id = random_pubkey();
  const gambit::Result encoded =
      gambit::encode_invite({.event_id = event_id, .relay_hints = {kRelayA, "wss://relay-b.test/inbox"}});
  assert(encoded.ok);
  assert(encoded.data.starts_with("nevent1"));

  gambit::InvitePointer pointer;
  assert(gambit::decode_invite(encoded.data, pointer).ok);
  assert(pointer.event_id == event_id);
  assert((pointer.relay_hints == std::vector<std::string>{kRelayA, "wss://relay-b.test/inbox"}));

  const std::string uri = gambit::to_nostr_uri(encoded.data);
  assert(uri == "nostr:" + encoded.data);
  assert(gambit::strip_nostr_uri(uri) == encoded.data);
  assert(gambit::strip_nostr_uri("NOSTR:" + encoded.data) == encoded.data);

  std::string corrupted = encoded.data;
  corrupted[corrupted.size() - 2] = corrupted[corrupted.size() - 2] == 'q' ? 'p' : 'q';
  assert(!gambit::decode_invite(corrupted, pointer).ok);
  assert(!gambit::decode_invite("npub1xyz", pointer).ok);

  const std::string body = gambit::invite_message_body("Pebble Creek", encoded.data);
  assert(body == "You've been invited to play golf at Pebble Creek!\n\nJoin: nostr:" + encoded.data +
                     "\n\nSent from Gambit Golf");
  assert(gambit::extract_invite_token(body).value() == encoded.data);
  assert(gambit::extract_course_name(body).value() == "Pebble Creek");
  assert(!gambit::extract_invite_token("see you at the range").has_value());
}

void test_gift_wrap_hides_sender() {
  const gambit::IdentityKeyPair sender = gambit::CryptoEngine::generate_keypair();
  const gambit::IdentityKeyPair recipient = gambit::CryptoEngine::generate_keypair();
  const gambit::IdentityKeyPair stranger = gambit::CryptoEngine::generate_keypair();

  gambit::NetworkEvent wrap;
  assert(gambit::DirectMessageInviter::wrap_message(sender, recipient.public_key, "tee time at nine", wrap).ok);
  assert(wrap.kind == gambit::event_kind::kGiftWrap);
  assert(wrap.pubkey != sender.public_key);
  assert(wrap.first_tag_value("p").value() == recipient.public_key);
  assert(wrap.content.find("tee time") == std::string::npos);
  assert(wrap.created_at <= gambit::util::unix_timestamp_now());
  assert(gambit::verify_event(wrap).ok);

  gambit::NetworkEvent rumor;
  assert(gambit::DirectMessageInviter::unwrap_message(recipient, wrap, rumor).ok);
  assert(rumor.kind == gambit::event_kind::kDirectMessage);
  assert(rumor.pubkey == sender.public_key);
  assert(rumor.content == "tee time at nine");
  assert(rumor.sig.empty());

  assert(!gambit::DirectMessageInviter::unwrap_message(stranger, wrap, rumor).ok);
}

void test_publish_initiation_is_one_shot() {
  CoreFixture fx("initiation-once");
  const gambit::CourseSnapshot course = fx.course(9);
  gambit::Round round;
  assert(fx.rounds.create_round(course, {fx.crypto.identity().public_key}, "", false, round).ok);

  const gambit::Result first = fx.publisher.publish_initiation(round.round_id);
  assert(first.ok && first.data.size() == 64);
  const std::size_t sends = fx.transport->publish_count();
  const gambit::Result second = fx.publisher.publish_initiation(round.round_id);
  assert(second.ok && second.data == first.data);
  assert(fx.transport->publish_count() == sends);

  const auto record = fx.store.network_record(round.round_id);
  assert(record.has_value() && record->joined_via == gambit::JoinedVia::Created);
  assert(fx.transport->event_count(kRelayA) == 1);
  assert(fx.transport->event_count(kRelayB) == 1);

  gambit::RoundNetworkRecord stored;
  bool inserted = true;
  assert(fx.store
             .record_network_once({.round_id = round.round_id, .initiation_event_id = random_pubkey()}, stored,
                                  inserted)
             .ok);
  assert(!inserted && stored.initiation_event_id == first.data);
}

void test_final_record_falls_back_to_initiation() {
  CoreFixture fx("final-fallback");
  const gambit::CourseSnapshot course = fx.course(9);
  const std::string local = fx.crypto.identity().public_key;
  const std::string guest = random_pubkey();
  gambit::Round round;
  assert(fx.rounds.create_round(course, {local, guest}, "", false, round).ok);

  // The initial publish fails while every relay is down.
  std::vector<gambit::util::LogRecord> warnings;
  gambit::util::set_log_level(gambit::util::LogLevel::Warn);
  gambit::util::set_log_sink([&warnings](const gambit::util::LogRecord& record) { warnings.push_back(record); });
  fx.transport->set_all_offline(true);
  const gambit::Result offline = fx.publisher.publish_initiation(round.round_id);
  assert(!offline.ok && offline.code == gambit::ErrorCode::Network);
  gambit::util::set_log_sink({});
  gambit::util::set_log_level(gambit::util::LogLevel::Error);
  assert(std::ranges::any_of(warnings, [](const gambit::util::LogRecord& record) {
    return record.level == gambit::util::LogLevel::Warn && record.component == "publisher";
  }));
  assert(!fx.store.network_record(round.round_id).has_value());
  fx.transport->set_all_offline(false);

  for (int hole = 1; hole <= 9; ++hole) {
    assert(fx.rounds.record_score(round.round_id, 0, hole, 4).ok);
    assert(fx.rounds.record_score(round.round_id, 1, hole, 5).ok);
  }

  const gambit::Result published = fx.publisher.publish_all_final_records(round.round_id);
  assert(published.ok);
  const auto record = fx.store.network_record(round.round_id);
  assert(record.has_value());
  assert(gambit::util::split(published.data, ',').size() == 2);

  gambit::SyncPoller poller(fx.store, fx.rounds, fx.pool, gambit::AccountState{});
  std::vector<gambit::FinalRecord> records;
  assert(poller.fetch_final_records(round.round_id, records).ok);
  assert(records.size() == 2);
  for (const auto& final_record : records) {
    assert(final_record.initiation_event_id == record->initiation_event_id);
    assert(final_record.author == local);
  }
  const auto combined = gambit::SyncPoller::combined_scorecard(records);
  assert(combined.front().scored_pubkey == local && combined.front().total == 36);
  assert(combined.back().scored_pubkey == guest && combined.back().total == 45);

  gambit::Round empty_round;
  assert(fx.rounds.create_round(course, {local}, "", false, empty_round).ok);
  assert(fx.publisher.publish_final_record(empty_round.round_id, 0).code == gambit::ErrorCode::InvalidInput);
}

void test_account_state_gates_network() {
  CoreFixture fx("account-state");
  const gambit::CourseSnapshot course = fx.course(9);
  gambit::Round round;
  assert(fx.rounds.create_round(course, {fx.crypto.identity().public_key}, "", false, round).ok);

  fx.publisher.set_account_state({.network_activated = false, .read_only = false});
  assert(fx.publisher.publish_initiation(round.round_id).code == gambit::ErrorCode::Disabled);
  fx.publisher.set_account_state({.network_activated = true, .read_only = true});
  assert(fx.publisher.publish_initiation(round.round_id).code == gambit::ErrorCode::Disabled);
  assert(fx.transport->publish_count() == 0);
  assert(fx.rounds.record_score(round.round_id, 0, 1, 4).ok);

  gambit::SyncPoller poller(fx.store, fx.rounds, fx.pool, {.network_activated = false, .read_only = false});
  std::map<std::string, gambit::ScoreMap> remote;
  assert(poller.refresh_remote_scores(round.round_id, remote).code == gambit::ErrorCode::Disabled);
}

void test_storage_failures_propagate() {
  CoreFixture fx("storage-failure");
  const gambit::CourseSnapshot course = fx.course(9);
  gambit::Round round;
  assert(fx.rounds.create_round(course, {fx.crypto.identity().public_key}, "", false, round).ok);
  assert(fx.rounds.record_score(round.round_id, 0, 1, 4).ok);

  const auto store_dir = fx.dir / "store";
  std::filesystem::remove(store_dir / "hole_scores.log");
  std::filesystem::create_directory(store_dir / "hole_scores.log");
  const gambit::Result failed = fx.rounds.record_score(round.round_id, 0, 2, 3);
  assert(!failed.ok && failed.code == gambit::ErrorCode::Storage);
  assert(!fx.rounds.current_scores(round.round_id, 0).contains(2));

  std::error_code ec;
  std::filesystem::remove(store_dir / "round_network_records.log", ec);
  std::filesystem::create_directory(store_dir / "round_network_records.log");
  const gambit::Result guard = fx.publisher.publish_initiation(round.round_id);
  assert(!guard.ok && guard.code == gambit::ErrorCode::Storage);
  assert(!fx.store.network_record(round.round_id).has_value());
}

void test_relay_pool_rejects_invalid_events() {
  CoreFixture fx("relay-pool");
  const gambit::IdentityKeyPair author = gambit::CryptoEngine::generate_keypair();

  gambit::NetworkEvent good;
  good.kind = gambit::event_kind::kProfile;
  good.created_at = 100;
  good.content = "{\"name\":\"old\"}";
  assert(gambit::finalize_event(good, author).ok);
  assert(fx.pool.publish(good).ok);
  assert(fx.pool.seen(good.id));

  gambit::NetworkEvent newer = good;
  newer.created_at = 200;
  newer.content = "{\"name\":\"new\"}";
  assert(gambit::finalize_event(newer, author).ok);
  fx.transport->set_relay_offline(kRelayB, true);
  assert(fx.pool.publish(newer).ok);
  fx.transport->set_relay_offline(kRelayB, false);

  gambit::NetworkEvent forged = newer;
  forged.created_at = 300;
  forged.content = "{\"name\":\"forged\"}";
  forged.id = random_pubkey();
  fx.transport->inject(kRelayB, forged);

  gambit::RelayFilter filter;
  filter.kinds = {gambit::event_kind::kProfile};
  filter.authors = {author.public_key};
  std::vector<gambit::NetworkEvent> events;
  assert(fx.pool.query(filter, events).ok);
  // Relay A replaced the profile; relay B still serves the older one and the forgery.
  assert(events.size() == 2);
  assert(events.front().id == newer.id);
  assert(fx.pool.stats().rejected_event_count == 1);

  fx.transport->set_all_offline(true);
  assert(fx.pool.query(filter, events).code == gambit::ErrorCode::Network);
  assert(fx.pool.publish(good).code == gambit::ErrorCode::Network);
  fx.transport->set_all_offline(false);

  const auto dat = fx.dir / "relays.dat";
  assert(fx.pool.add_relay("WSS://Relay-C.test/", "read").ok);
  assert(fx.pool.add_relay("https://not-a-relay", "").code == gambit::ErrorCode::InvalidInput);
  assert(fx.pool.save_relays_dat(dat.string()).ok);

  gambit::RelayPool reloaded(fx.transport);
  assert(reloaded.load_relays_dat(dat.string()).ok);
  assert(reloaded.relays().size() == 3);
  const auto reads = reloaded.read_relays();
  assert(std::find(reads.begin(), reads.end(), "wss://relay-c.test") != reads.end());
  const auto writes = reloaded.write_relays();
  assert(std::find(writes.begin(), writes.end(), "wss://relay-c.test") == writes.end());
}

void test_follow_list_merge_keeps_known_data() {
  CoreFixture fx("follow-merge");
  const std::string local = fx.crypto.identity().public_key;
  gambit::IdentityCache cache(fx.store, fx.pool, fx.publisher, local, {});
  const std::string subject = random_pubkey();
  const std::string a = random_pubkey();
  const std::string b = random_pubkey();
  const std::string c = random_pubkey();

  gambit::MergeOutcome outcome = gambit::MergeOutcome::Unchanged;
  assert(cache.merge_follow_list(subject, gambit::CachedFollowList{.follows = {a, b}, .event_created_unix = 100},
                                 outcome)
             .ok);
  assert(outcome == gambit::MergeOutcome::Inserted);

  assert(cache.merge_follow_list(subject, std::nullopt, outcome).ok);
  assert(outcome == gambit::MergeOutcome::KeptExisting);
  assert(cache.merge_follow_list(subject, gambit::CachedFollowList{.follows = {}, .event_created_unix = 500}, outcome)
             .ok);
  assert(outcome == gambit::MergeOutcome::KeptExisting);
  assert((cache.follow_list(subject)->follows == std::vector<std::string>{a, b}));

  assert(cache.merge_follow_list(subject, gambit::CachedFollowList{.follows = {a, b}, .event_created_unix = 150},
                                 outcome)
             .ok);
  assert(outcome == gambit::MergeOutcome::Unchanged);
  assert(cache.merge_follow_list(subject, gambit::CachedFollowList{.follows = {c}, .event_created_unix = 50}, outcome)
             .ok);
  assert(outcome == gambit::MergeOutcome::KeptExisting);

  assert(cache.merge_follow_list(subject, gambit::CachedFollowList{.follows = {a, c}, .event_created_unix = 200},
                                 outcome)
             .ok);
  assert(outcome == gambit::MergeOutcome::Replaced);
  assert((cache.follow_list(subject)->follows == std::vector<std::string>{a, c}));

  // A failed refresh serves the cache and leaves it intact.
  fx.transport->set_all_offline(true);
  gambit::CachedFollowList refreshed;
  const gambit::Result offline = cache.refresh_follow_list(subject, true, refreshed);
  assert(!offline.ok && offline.code == gambit::ErrorCode::Network);
  assert((refreshed.follows == std::vector<std::string>{a, c}));
  fx.transport->set_all_offline(false);

  // Local edits are stored and published as a replacement kind 3 list.
  assert(cache.follow(a).ok);
  assert(cache.follow(b).ok);
  assert(cache.follow(b).data == "unchanged");
  assert(cache.unfollow(a).ok);
  assert((cache.follow_list(local)->follows == std::vector<std::string>{b}));
  assert(cache.unfollow(b).ok);
  assert(cache.follow_list(local)->follows.empty());

  gambit::RelayFilter filter;
  filter.kinds = {gambit::event_kind::kContacts};
  filter.authors = {local};
  std::vector<gambit::NetworkEvent> events;
  assert(fx.pool.query(filter, events).ok);
  assert(events.size() == 1 && events.front().tag_values("p").empty());

  assert(cache.add_favorite(c).ok);
  gambit::CachedFavorites favorites;
  assert(cache.refresh_favorites(local, true, favorites).ok);
  assert((favorites.members == std::vector<std::string>{c}));
  filter.kinds = {gambit::event_kind::kFollowSet};
  assert(fx.pool.query(filter, events).ok);
  assert(events.size() == 1 && events.front().d_tag().value() == gambit::kFavoritesListId);

  fx.transport->set_all_offline(true);
  const gambit::Result unpublished = cache.add_favorite(a);
  assert(unpublished.ok && unpublished.data == "unpublished");
  assert(cache.favorites(local)->members.size() == 2);
  fx.transport->set_all_offline(false);
}

void test_profile_merge_never_blanks_fields() {
  gambit::Profile known{.pubkey_hex = random_pubkey(), .name = "ace", .about = "plays off 4",
                        .picture = "https://img.test/a.png", .event_created_unix = 100};
  gambit::Profile sparse{.pubkey_hex = known.pubkey_hex, .display_name = "Ace Ventura",
                         .event_created_unix = 200};
  const gambit::Profile merged = gambit::IdentityCache::merge_profile(known, sparse);
  assert(merged.name.value() == "ace");
  assert(merged.about.value() == "plays off 4");
  assert(merged.display_name.value() == "Ace Ventura");
  assert(merged.event_created_unix == 200);
  assert(merged.display_label() == "Ace Ventura");

  gambit::Profile stale{.pubkey_hex = known.pubkey_hex, .name = "old-name", .nip05 = "ace@golf.test",
                        .event_created_unix = 50};
  const gambit::Profile kept = gambit::IdentityCache::merge_profile(merged, stale);
  assert(kept.name.value() == "ace");
  assert(kept.nip05.value() == "ace@golf.test");

  gambit::Profile anonymous{.pubkey_hex = "abcdef0123456789abcdef0123456789abcdef0123456789abcdef0123456789"};
  assert(anonymous.display_label() == "abcdef01...");

  const gambit::IdentityKeyPair author = gambit::CryptoEngine::generate_keypair();
  gambit::NetworkEvent event;
  event.kind = gambit::event_kind::kProfile;
  event.created_at = 300;
  event.content = "{\"displayName\":\"Birdie\",\"name\":\"\",\"about\":\"scratch\"}";
  assert(gambit::finalize_event(event, author).ok);
  gambit::Profile parsed;
  assert(gambit::IdentityCache::parse_profile_event(event, parsed).ok);
  assert(parsed.display_name.value() == "Birdie");
  assert(!parsed.name.has_value());
  assert(parsed.about.value() == "scratch");
}

void test_profile_resolve_through_cache_tiers() {
  CoreFixture fx("profile-resolve");
  const std::string local = fx.crypto.identity().public_key;
  gambit::IdentityCache cache(fx.store, fx.pool, fx.publisher, local, {});
  const gambit::IdentityKeyPair friend_keys = gambit::CryptoEngine::generate_keypair();

  gambit::NetworkEvent full;
  full.kind = gambit::event_kind::kProfile;
  full.created_at = gambit::util::unix_timestamp_now() - 10;
  full.content = "{\"name\":\"sam\",\"picture\":\"https://img.test/sam.png\"}";
  assert(gambit::finalize_event(full, friend_keys).ok);
  assert(fx.pool.publish(full).ok);

  std::map<std::string, gambit::Profile> resolved;
  assert(cache.resolve({friend_keys.public_key}, resolved).ok);
  assert(resolved.at(friend_keys.public_key).name.value() == "sam");

  gambit::NetworkEvent sparse;
  sparse.kind = gambit::event_kind::kProfile;
  sparse.created_at = gambit::util::unix_timestamp_now();
  sparse.content = "{\"about\":\"weekend hacker\"}";
  assert(gambit::finalize_event(sparse, friend_keys).ok);
  assert(fx.pool.publish(sparse).ok);
  assert(cache.resolve({friend_keys.public_key}, resolved).ok);
  const gambit::Profile& merged = resolved.at(friend_keys.public_key);
  assert(merged.name.value() == "sam");
  assert(merged.picture.value() == "https://img.test/sam.png");
  assert(merged.about.value() == "weekend hacker");

  fx.transport->set_all_offline(true);
  std::map<std::string, gambit::Profile> offline;
  assert(!cache.resolve({friend_keys.public_key}, offline).ok);
  assert(offline.at(friend_keys.public_key).about.value() == "weekend hacker");
  fx.transport->set_all_offline(false);

  assert(cache.search_profiles("SA").size() == 1);
  assert(cache.search_profiles("nobody").empty());

  gambit::IdentityCache cold(fx.store, fx.pool, fx.publisher, local, {});
  assert(cold.cached_profiles({friend_keys.public_key}).at(friend_keys.public_key).name.value() == "sam");
}

void test_multi_device_round_trip() {
  auto transport = std::make_shared<gambit::LoopbackRelayTransport>();
  gambit::GambitService host;
  gambit::GambitService guest;
  assert(host.init(service_config(temp_dir("multi-host")), transport).ok);
  assert(guest.init(service_config(temp_dir("multi-guest")), transport).ok);

  gambit::Round round;
  const gambit::Result created = host.create_round(
      {
          .course_name = "Pebble Creek",
          .tee_set = "White",
          .holes = alternating_holes(18),
          .other_players = {guest.public_key()},
          .round_date = "2026-07-04",
          .multi_device = true,
      },
      round);
  assert(created.ok);

  gambit::util::CancellationSource source;
  std::future<gambit::Result> waiting = host.await_initiation_record_async(round.round_id, source.token());
  const gambit::Result awaited = waiting.get();
  assert(awaited.ok && awaited.data.size() == 64);
  assert(host.network_record(round.round_id)->joined_via == gambit::JoinedVia::CreatedMulti);

  assert(guest.publish_inbox_relays({kRelayB}).ok);
  std::vector<gambit::InviteDelivery> deliveries;
  const gambit::Result sent = host.send_invites(round.round_id, deliveries);
  assert(sent.ok && sent.data == "1");
  assert(deliveries.size() == 1 && deliveries.front().delivered);
  assert((deliveries.front().relays == std::vector<std::string>{kRelayB}));

  std::vector<gambit::IncomingInvite> invites;
  assert(guest.fetch_incoming_invites(invites).ok);
  assert(invites.size() == 1);
  assert(invites.front().initiation_event_id == awaited.data);
  assert(invites.front().sender_pubkey == host.public_key());
  assert(invites.front().course_name == "Pebble Creek");

  gambit::RoundId joined = 0;
  assert(guest.join_round(gambit::to_nostr_uri(invites.front().token), joined).ok);
  const auto guest_players = guest.players(joined);
  assert(guest_players.size() == 2);
  assert(guest_players[0].pubkey_hex == guest.public_key());
  assert(guest_players[1].pubkey_hex == host.public_key());
  assert(guest.course_for(joined)->content_hash == host.course_for(round.round_id)->content_hash);
  assert(guest.network_record(joined)->joined_via == gambit::JoinedVia::Joined);

  gambit::RoundId again = 0;
  assert(guest.join_round(invites.front().token, again).ok);
  assert(again == joined && guest.list_rounds().size() == 1);
  assert(guest.fetch_incoming_invites(invites).ok && invites.empty());

  // Host scores every hole while the guest has synced nothing: finish stays enabled.
  score_all_holes(host, round.round_id, 0, 18, 4);
  std::map<std::string, gambit::ScoreMap> synced;
  assert(host.refresh_remote_scores(round.round_id, synced).ok);
  assert(synced.empty());
  assert(host.is_finish_enabled(round.round_id, 0));

  for (int hole = 1; hole <= 3; ++hole) {
    assert(guest.record_score(joined, 0, hole, 5).ok);
  }
  assert(guest.publish_live_scorecard(joined).ok);
  assert(host.refresh_remote_scores(round.round_id, synced).ok);
  assert(synced.size() == 1);
  assert(synced.at(guest.public_key()).size() == 3);
  assert(host.current_scores(round.round_id, 1).empty());

  assert(host.finish_round(round.round_id).ok);
  host.drain();
  score_all_holes(guest, joined, 0, 18, 5);
  assert(guest.finish_round(joined).ok);
  guest.drain();

  std::vector<gambit::FinalRecord> board;
  assert(host.final_scorecard(round.round_id, board).ok);
  assert(board.size() == 2);
  assert(board.front().scored_pubkey == host.public_key() && board.front().total == 72);
  assert(board.back().scored_pubkey == guest.public_key() && board.back().total == 90);
  assert(board.back().author == guest.public_key());

  const gambit::ServiceStatus status = host.status();
  assert(status.round_count == 1 && status.pending_tasks == 0);
}

void test_same_device_round_through_api() {
  gambit::CoreApi api;
  const auto dir = temp_dir("core-api");
  assert(api.init(service_config(dir)).ok);

  gambit::Round round;
  const std::string partner = random_pubkey();
  assert(api.create_round(
                {
                    .course_name = "Pebble Creek",
                    .tee_set = "White",
                    .holes = alternating_holes(9),
                    .other_players = {partner},
                    .round_date = {},
                    .multi_device = false,
                },
                round)
             .ok);
  for (int hole = 1; hole <= 9; ++hole) {
    assert(api.record_score(round.round_id, 0, hole, 4).ok);
  }
  // Co-located players all need a full card.
  assert(api.finish_round(round.round_id).code == gambit::ErrorCode::InvalidInput);
  for (int hole = 1; hole <= 9; ++hole) {
    assert(api.record_score(round.round_id, 1, hole, 6).ok);
  }
  assert(api.finish_round(round.round_id).ok);
  api.drain();

  std::vector<gambit::FinalRecord> board;
  assert(api.final_scorecard(round.round_id, board).ok);
  assert(board.size() == 2);
  assert(board.front().total == 36 && board.back().total == 54);
  assert(board.back().scored_pubkey == partner && board.back().author == api.public_key());

  const auto listed = api.list_rounds();
  assert(listed.size() == 1 && listed.front().completed && listed.front().total_strokes.value() == 36);
  assert(std::filesystem::exists(dir / "relays.dat"));
  assert(std::filesystem::exists(dir / "identity.vault"));
}

void test_await_initiation_cancellation() {
  auto transport = std::make_shared<gambit::LoopbackRelayTransport>();
  transport->set_all_offline(true);
  gambit::GambitService service;
  gambit::InitConfig config = service_config(temp_dir("await-cancel"));
  config.invite_poll_attempts = 200;
  config.invite_poll_interval_ms = 50;
  assert(service.init(config, transport).ok);

  gambit::Round round;
  assert(service
             .create_round({.course_name = "Pebble Creek", .tee_set = "White", .holes = alternating_holes(9),
                            .other_players = {random_pubkey()}, .round_date = {}, .multi_device = true},
                           round)
             .ok);
  service.drain();
  assert(!service.network_record(round.round_id).has_value());

  gambit::util::CancellationSource source;
  const auto started = std::chrono::steady_clock::now();
  std::future<gambit::Result> waiting = service.await_initiation_record_async(round.round_id, source.token());
  std::this_thread::sleep_for(std::chrono::milliseconds(80));
  source.cancel();
  const gambit::Result cancelled = waiting.get();
  assert(!cancelled.ok && cancelled.code == gambit::ErrorCode::Cancelled);
  assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(5));

}

void test_remote_lists_cannot_forge_cache_rows() {
  CoreFixture fx("remote-list-fields");
  const std::string local = fx.crypto.identity().public_key;
  gambit::IdentityCache cache(fx.store, fx.pool, fx.publisher, local, {});
  const gambit::IdentityKeyPair subject = gambit::CryptoEngine::generate_keypair();
  const std::string friend_key = random_pubkey();
  const std::string victim = random_pubkey();
  const std::string victim_follow = random_pubkey();
  std::string shouted = friend_key;
  std::ranges::transform(shouted, shouted.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  assert(fx.store.put_follow_list({.pubkey_hex = victim, .follows = {victim_follow}, .event_created_unix = 10}).ok);

  gambit::NetworkEvent contacts;
  contacts.kind = gambit::event_kind::kContacts;
  contacts.created_at = gambit::util::unix_timestamp_now();
  contacts.tags = {
      {"p", friend_key},
      {"p", friend_key + "," + victim},
      {"p", "x\n" + victim + "\t9999999999\t1\tforged"},
      {"p", shouted},
  };
  assert(gambit::finalize_event(contacts, subject).ok);
  fx.transport->inject(kRelayA, contacts);

  gambit::NetworkEvent relay_list;
  relay_list.kind = gambit::event_kind::kRelayList;
  relay_list.created_at = contacts.created_at;
  relay_list.tags = {
      {"r", kRelayB, "read\tx"},
      {"r", "wss://inbox.test,wss://evil.test"},
      {"r", "wss://good.test", "write"},
  };
  assert(gambit::finalize_event(relay_list, subject).ok);
  fx.transport->inject(kRelayA, relay_list);

  gambit::NetworkEvent inbox;
  inbox.kind = gambit::event_kind::kInboxRelays;
  inbox.created_at = contacts.created_at;
  inbox.tags = {
      {"relay", "wss://inbox.test|wss://evil.test"},
      {"relay", "wss://in\nbox.test"},
      {"relay", kRelayB},
  };
  assert(gambit::finalize_event(inbox, subject).ok);
  fx.transport->inject(kRelayA, inbox);

  gambit::CachedFollowList follows;
  assert(cache.refresh_follow_list(subject.public_key, true, follows).ok);
  assert((follows.follows == std::vector<std::string>{friend_key}));

  gambit::CachedRelayList relays;
  assert(cache.refresh_relay_list(subject.public_key, true, relays).ok);
  assert((relays.relays == std::vector<gambit::RelayEntry>{{"wss://good.test", "write"}}));
  assert((relays.inbox_relays == std::vector<std::string>{kRelayB}));

  gambit::Store reopened;
  assert(reopened.open((fx.dir / "store").string()).ok);
  assert(reopened.skipped_line_count() == 0);
  assert((reopened.follow_list(subject.public_key)->follows == std::vector<std::string>{friend_key}));
  assert((reopened.follow_list(victim)->follows == std::vector<std::string>{victim_follow}));
  assert(reopened.follow_list(victim)->event_created_unix == 10);
  assert(reopened.relay_list(subject.public_key)->relays.size() == 1);
  assert((reopened.relay_list(subject.public_key)->inbox_relays == std::vector<std::string>{kRelayB}));

  // The store refuses delimiter-bearing fields even when a caller skips the filters.
  assert(fx.store.put_follow_list({.pubkey_hex = subject.public_key, .follows = {"x\ty"}}).code ==
         gambit::ErrorCode::InvalidInput);
  assert(fx.store.put_relay_list({.pubkey_hex = subject.public_key, .relays = {{"wss://a.test", "read\tx"}}}).code ==
         gambit::ErrorCode::InvalidInput);
  assert(fx.store.put_relay_list({.pubkey_hex = subject.public_key, .inbox_relays = {"wss://a.test|b"}}).code ==
         gambit::ErrorCode::InvalidInput);
  assert(gambit::RelayPool::normalize_url("wss://a.test,wss://b.test").empty());
  assert(gambit::RelayPool::normalize_url("wss://a.test\tx").empty());
  assert(gambit::RelayPool::normalize_url("wss://a.test|x").empty());
}

void test_relay_pool_bounds_seen_ids() {
  CoreFixture fx("seen-bound");
  const gambit::IdentityKeyPair author = gambit::CryptoEngine::generate_keypair();
  const std::size_t total = gambit::RelayPool::kMaxSeenEvents + 25;
  for (std::size_t i = 0; i < total; ++i) {
    gambit::NetworkEvent note;
    note.kind = gambit::event_kind::kProfile;
    note.created_at = 1000 + static_cast<std::int64_t>(i);
    note.content = "{\"name\":\"n" + std::to_string(i) + "\"}";
    assert(gambit::finalize_event(note, author).ok);
    fx.transport->inject(kRelayA, note);
  }

  gambit::RelayFilter filter;
  filter.kinds = {gambit::event_kind::kProfile};
  filter.authors = {author.public_key};
  std::vector<gambit::NetworkEvent> events;
  assert(fx.pool.query(filter, events).ok);
  assert(events.size() == total);
  assert(fx.pool.stats().seen_event_count == gambit::RelayPool::kMaxSeenEvents);

  gambit::NetworkEvent latest;
  latest.kind = gambit::event_kind::kProfile;
  latest.created_at = gambit::util::unix_timestamp_now();
  latest.content = "{\"name\":\"latest\"}";
  assert(gambit::finalize_event(latest, author).ok);
  assert(fx.pool.publish(latest).ok);
  assert(fx.pool.seen(latest.id));
  assert(fx.pool.stats().seen_event_count == gambit::RelayPool::kMaxSeenEvents);
}

void test_final_records_trust_only_initiator_for_others() {
  CoreFixture fx("final-trust");
  const gambit::CourseSnapshot course = fx.course(9);
  const std::string local = fx.crypto.identity().public_key;
  const gambit::IdentityKeyPair guest = gambit::CryptoEngine::generate_keypair();
  const gambit::IdentityKeyPair third = gambit::CryptoEngine::generate_keypair();
  const std::vector<std::string> players{local, guest.public_key, third.public_key};
  gambit::Round round;
  assert(fx.rounds.create_round(course, players, "", true, round).ok);
  assert(fx.publisher.publish_initiation(round.round_id).ok);
  const std::string initiation_id = fx.store.network_record(round.round_id)->initiation_event_id;

  for (int hole = 1; hole <= 9; ++hole) {
    assert(fx.rounds.record_score(round.round_id, 0, hole, 4).ok);
    assert(fx.rounds.record_score(round.round_id, 2, hole, 5).ok);
  }
  assert(fx.publisher.publish_final_record(round.round_id, 0).ok);
  assert(fx.publisher.publish_final_record(round.round_id, 2).ok);

  gambit::ScoreMap flattering;
  for (int hole = 1; hole <= 9; ++hole) {
    flattering[hole] = 2;
  }
  gambit::NetworkEvent forged;
  assert(gambit::build_final_record_event(initiation_id, flattering, third.public_key, players, forged).ok);
  forged.created_at += 60;
  assert(gambit::finalize_event(forged, guest).ok);
  fx.transport->inject(kRelayA, forged);

  gambit::SyncPoller poller(fx.store, fx.rounds, fx.pool, gambit::AccountState{});
  std::vector<gambit::FinalRecord> records;
  assert(poller.fetch_final_records(round.round_id, records).ok);
  assert(records.size() == 2);
  assert(std::ranges::none_of(records, [&](const gambit::FinalRecord& record) {
    return record.author == guest.public_key;
  }));
  auto combined = gambit::SyncPoller::combined_scorecard(records);
  assert(combined.back().scored_pubkey == third.public_key && combined.back().total == 45);

  // An older card from the player themselves beats the initiator's copy.
  gambit::ScoreMap own;
  for (int hole = 1; hole <= 9; ++hole) {
    own[hole] = 6;
  }
  gambit::NetworkEvent self_card;
  assert(gambit::build_final_record_event(initiation_id, own, third.public_key, players, self_card).ok);
  self_card.created_at -= 600;
  assert(gambit::finalize_event(self_card, third).ok);
  fx.transport->inject(kRelayB, self_card);

  assert(poller.fetch_final_records(round.round_id, records).ok);
  assert(records.size() == 3);
  combined = gambit::SyncPoller::combined_scorecard(records);
  assert(combined.size() == 2);
  assert(combined.back().author == third.public_key && combined.back().total == 54);
}

void test_await_initiation_times_out() {
  CoreFixture fx("await-timeout");
  const gambit::CourseSnapshot course = fx.course(9);
  gambit::Round round;
  assert(fx.rounds.create_round(course, {fx.crypto.identity().public_key, random_pubkey()}, "", true, round).ok);

  gambit::SyncPoller poller(fx.store, fx.rounds, fx.pool, gambit::AccountState{});
  gambit::util::CancellationSource source;
  const gambit::Result timed_out =
      poller.await_initiation_record(round.round_id, 3, std::chrono::milliseconds(5), source.token());
  assert(!timed_out.ok && timed_out.code == gambit::ErrorCode::Timeout);

  poller.stop();
  const gambit::Result stopped =
      poller.await_initiation_record(round.round_id, 3, std::chrono::milliseconds(5), source.token());
  assert(!stopped.ok && stopped.code == gambit::ErrorCode::Cancelled);
}

void test_await_future_outlives_service() {
  auto transport = std::make_shared<gambit::LoopbackRelayTransport>();
  transport->set_all_offline(true);
  auto service = std::make_unique<gambit::GambitService>();
  gambit::InitConfig config = service_config(temp_dir("await-teardown"));
  config.invite_poll_attempts = 1000;
  config.invite_poll_interval_ms = 20;
  assert(service->init(config, transport).ok);

  gambit::Round round;
  assert(service
             ->create_round({.course_name = "Pebble Creek", .tee_set = "White", .holes = alternating_holes(9),
                             .other_players = {random_pubkey()}, .round_date = {}, .multi_device = true},
                            round)
             .ok);

  std::future<gambit::Result> waiting = service->await_initiation_record_async(round.round_id, {});
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  const auto started = std::chrono::steady_clock::now();
  service.reset();
  assert(waiting.wait_for(std::chrono::seconds(0)) == std::future_status::ready);
  const gambit::Result ended = waiting.get();
  assert(!ended.ok && ended.code == gambit::ErrorCode::Cancelled);
  assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(5));
}

void test_invites_fall_back_without_inbox_relays() {
  auto transport = std::make_shared<gambit::LoopbackRelayTransport>();
  gambit::GambitService host;
  gambit::GambitService guest;
  assert(host.init(service_config(temp_dir("fallback-host")), transport).ok);
  assert(guest.init(service_config(temp_dir("fallback-guest")), transport).ok);

  gambit::Round round;
  assert(host.create_round({.course_name = "Pebble Creek", .tee_set = "White", .holes = alternating_holes(9),
                            .other_players = {guest.public_key()}, .round_date = {}, .multi_device = true},
                           round)
             .ok);
  assert(host.await_initiation_record_async(round.round_id, {}).get().ok);

  std::vector<gambit::InviteDelivery> deliveries;
  const gambit::Result sent = host.send_invites(round.round_id, deliveries);
  assert(sent.ok && sent.data == "1");
  assert(deliveries.size() == 1 && deliveries.front().delivered);
  assert((deliveries.front().relays == std::vector<std::string>{kRelayA}));

  std::vector<gambit::IncomingInvite> invites;
  assert(guest.fetch_incoming_invites(invites).ok);
  assert(invites.size() == 1 && invites.front().sender_pubkey == host.public_key());
}

void test_invite_deliveries_are_independent() {
  const std::string relay_c = "wss://relay-c.test";
  auto transport = std::make_shared<gambit::LoopbackRelayTransport>();
  gambit::GambitService host;
  gambit::GambitService stranded;
  gambit::GambitService reachable;
  assert(host.init(service_config(temp_dir("independent-host")), transport).ok);
  assert(stranded.init(service_config(temp_dir("independent-stranded")), transport).ok);
  assert(reachable.init(service_config(temp_dir("independent-reachable")), transport).ok);
  assert(stranded.publish_inbox_relays({relay_c}).ok);
  assert(reachable.publish_inbox_relays({kRelayB}).ok);

  gambit::Round round;
  assert(host.create_round({.course_name = "Pebble Creek", .tee_set = "White", .holes = alternating_holes(9),
                            .other_players = {stranded.public_key(), reachable.public_key()}, .round_date = {},
                            .multi_device = true},
                           round)
             .ok);
  assert(host.await_initiation_record_async(round.round_id, {}).get().ok);

  transport->set_relay_offline(relay_c, true);
  std::vector<gambit::InviteDelivery> deliveries;
  const gambit::Result sent = host.send_invites(round.round_id, deliveries);
  assert(sent.ok && sent.data == "1");
  assert(deliveries.size() == 2);
  for (const auto& delivery : deliveries) {
    if (delivery.recipient_pubkey == stranded.public_key()) {
      assert(!delivery.delivered);
      assert((delivery.relays == std::vector<std::string>{relay_c}));
    } else {
      assert(delivery.recipient_pubkey == reachable.public_key());
      assert(delivery.delivered);
      assert((delivery.relays == std::vector<std::string>{kRelayB}));
    }
  }

  std::vector<gambit::IncomingInvite> invites;
  assert(reachable.fetch_incoming_invites(invites).ok && invites.size() == 1);
}

void test_failed_join_leaves_no_round_behind() {
  auto transport = std::make_shared<gambit::LoopbackRelayTransport>();
  gambit::GambitService host;
  gambit::GambitService guest;
  const auto guest_dir = temp_dir("join-retry-guest");
  assert(host.init(service_config(temp_dir("join-retry-host")), transport).ok);
  assert(guest.init(service_config(guest_dir), transport).ok);

  gambit::Round round;
  assert(host.create_round({.course_name = "Pebble Creek", .tee_set = "White", .holes = alternating_holes(9),
                            .other_players = {guest.public_key()}, .round_date = {}, .multi_device = true},
                           round)
             .ok);
  const gambit::Result awaited = host.await_initiation_record_async(round.round_id, {}).get();
  assert(awaited.ok);
  std::string token;
  assert(host.invite_token(round.round_id, token).ok);

  const auto network_log = guest_dir / "store" / "round_network_records.log";
  std::error_code ec;
  std::filesystem::remove(network_log, ec);
  std::filesystem::create_directory(network_log);
  gambit::RoundId joined = 0;
  const gambit::Result failed = guest.join_round(token, joined);
  assert(!failed.ok && failed.code == gambit::ErrorCode::Storage);
  assert(guest.list_rounds().empty());

  std::filesystem::remove(network_log);
  assert(guest.join_round(token, joined).ok);
  gambit::RoundId again = 0;
  assert(guest.join_round(token, again).ok && again == joined);
  assert(guest.list_rounds().size() == 1);
  assert(guest.network_record(joined)->joined_via == gambit::JoinedVia::Joined);

  gambit::Store reopened;
  assert(reopened.open((guest_dir / "store").string()).ok);
  assert(reopened.rounds().size() == 1);
  assert(reopened.round_for_initiation(awaited.data).value() == joined);
  assert(reopened.has_round_event(joined, "multi_device"));
}

void test_task_queue_drains() {
  gambit::TaskQueue queue(3);
  std::atomic<int> ran{0};
  for (int i = 0; i < 20; ++i) {
    assert(queue.post("count", [&ran] {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
      ++ran;
    }));
  }
  queue.drain();
  assert(ran == 20);
  assert(queue.pending() == 0 && queue.completed() == 20);

  assert(queue.post("throws", [] { throw std::runtime_error("boom"); }));
  queue.drain();
  assert(queue.completed() == 21);

  queue.shutdown();
  assert(!queue.post("late", [] {}));
}

}  // namespace

int main() {
  gambit::util::set_log_level(gambit::util::LogLevel::Error);

  test_course_snapshot_is_content_addressed();
  test_create_round_assigns_indices();
  test_latest_score_wins();
  test_finish_predicate_uses_local_scores();
  test_scorecard_session_commands();
  test_event_signing_and_tamper_detection();
  test_round_event_builders();
  test_tampered_initiation_is_untrusted();
  test_invite_codec();
  test_gift_wrap_hides_sender();
  test_publish_initiation_is_one_shot();
  test_final_record_falls_back_to_initiation();
  test_account_state_gates_network();
  test_storage_failures_propagate();
  test_relay_pool_rejects_invalid_events();
  test_follow_list_merge_keeps_known_data();
  test_profile_merge_never_blanks_fields();
  test_profile_resolve_through_cache_tiers();
  test_multi_device_round_trip();
  test_same_device_round_through_api();
  test_await_initiation_cancellation();
  test_remote_lists_cannot_forge_cache_rows();
  test_relay_pool_bounds_seen_ids();
  test_final_records_trust_only_initiator_for_others();
  test_await_initiation_times_out();
  test_await_future_outlives_service();
  test_invites_fall_back_without_inbox_relays();
  test_invite_deliveries_are_independent();
  test_failed_join_leaves_no_round_behind();
  test_task_queue_drains();

  std::cout << "gambit core tests passed\n";
  return 0;
}
