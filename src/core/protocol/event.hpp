#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/crypto/crypto.hpp"
#include "core/model/types.hpp"

namespace gambit {

namespace event_kind {
inline constexpr int kProfile = 0;
inline constexpr int kContacts = 3;
inline constexpr int kSeal = 13;
inline constexpr int kDirectMessage = 14;
inline constexpr int kGiftWrap = 1059;
inline constexpr int kRoundInitiation = 1501;
inline constexpr int kFinalRecord = 1502;
inline constexpr int kRelayList = 10002;
inline constexpr int kInboxRelays = 10050;
inline constexpr int kFollowSet = 30000;
inline constexpr int kLiveScorecard = 30501;
}  // namespace event_kind

using EventTag = std::vector<std::string>;

struct NetworkEvent {
  std::string id;
  std::string pubkey;
  std::int64_t created_at = 0;
  int kind = 0;
  std::vector<EventTag> tags;
  std::string content;
  std::string sig;

  [[nodiscard]] std::optional<std::string> first_tag_value(std::string_view name) const;
  [[nodiscard]] std::vector<std::string> tag_values(std::string_view name) const;
  [[nodiscard]] std::optional<std::string> d_tag() const { return first_tag_value("d"); }
};

[[nodiscard]] bool is_replaceable_kind(int kind);
[[nodiscard]] bool is_addressable_kind(int kind);

// Serialization of [0, pubkey, created_at, kind, tags, content] hashed for the event id.
Result event_commitment(const NetworkEvent& event);

// Sets pubkey from the signing keys, then the id and the Ed25519 signature over the id bytes.
Result finalize_event(NetworkEvent& event, const IdentityKeyPair& keys);

// UntrustedContent when the id does not match the content or the signature does not verify.
Result verify_event(const NetworkEvent& event);

nlohmann::json event_to_json(const NetworkEvent& event);
Result event_from_json(const nlohmann::json& value, NetworkEvent& out);

}  // namespace gambit
