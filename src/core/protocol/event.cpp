#include "core/protocol/event.hpp"

#include "core/util/canonical.hpp"
#include "core/util/canonical_json.hpp"
#include "core/util/hash.hpp"

namespace gambit {

std::optional<std::string> NetworkEvent::first_tag_value(std::string_view name) const {
  for (const auto& tag : tags) {
    if (tag.size() >= 2 && tag[0] == name) {
      return tag[1];
    }
  }
  return std::nullopt;
}

std::vector<std::string> NetworkEvent::tag_values(std::string_view name) const {
  std::vector<std::string> values;
  for (const auto& tag : tags) {
    if (tag.size() >= 2 && tag[0] == name) {
      values.push_back(tag[1]);
    }
  }
  return values;
}

bool is_replaceable_kind(int kind) {
  return kind == event_kind::kProfile || kind == event_kind::kContacts ||
         (kind >= 10000 && kind < 20000);
}

bool is_addressable_kind(int kind) {
  return kind >= 30000 && kind < 40000;
}

Result event_commitment(const NetworkEvent& event) {
  nlohmann::json tags = nlohmann::json::array();
  for (const auto& tag : event.tags) {
    tags.push_back(tag);
  }
  const nlohmann::json commitment = nlohmann::json::array(
      {0, event.pubkey, event.created_at, event.kind, tags, event.content});
  return util::canonical_json(commitment);
}

Result finalize_event(NetworkEvent& event, const IdentityKeyPair& keys) {
  if (keys.empty()) {
    return Result::failure(ErrorCode::Crypto, "Cannot sign event without a key pair.");
  }

  event.pubkey = keys.public_key;
  const Result commitment = event_commitment(event);
  if (!commitment.ok) {
    return commitment;
  }

  event.id = util::sha256_hex(commitment.data);
  event.sig = CryptoEngine::sign_with(keys, util::from_hex(event.id));
  if (event.sig.empty()) {
    return Result::failure(ErrorCode::Crypto, "Event signing failed.");
  }
  return Result::success("Event signed.", event.id);
}

Result verify_event(const NetworkEvent& event) {
  if (!util::is_hex_of_size(event.id, 32) || !util::is_hex_of_size(event.pubkey, 32) ||
      !util::is_hex_of_size(event.sig, 64)) {
    return Result::failure(ErrorCode::UntrustedContent, "Event fields are malformed.");
  }

  const Result commitment = event_commitment(event);
  if (!commitment.ok) {
    return Result::failure(ErrorCode::UntrustedContent, commitment.message);
  }
  if (util::sha256_hex(commitment.data) != event.id) {
    return Result::failure(ErrorCode::UntrustedContent, "Event id does not match its content.");
  }
  if (!CryptoEngine::verify(util::from_hex(event.id), event.sig, event.pubkey)) {
    return Result::failure(ErrorCode::UntrustedContent, "Event signature is invalid.");
  }
  return Result::success("Event verified.", event.id);
}

nlohmann::json event_to_json(const NetworkEvent& event) {
  nlohmann::json tags = nlohmann::json::array();
  for (const auto& tag : event.tags) {
    tags.push_back(tag);
  }
  return {
      {"id", event.id},
      {"pubkey", event.pubkey},
      {"created_at", event.created_at},
      {"kind", event.kind},
      {"tags", tags},
      {"content", event.content},
      {"sig", event.sig},
  };
}

Result event_from_json(const nlohmann::json& value, NetworkEvent& out) {
  if (!value.is_object()) {
    return Result::failure(ErrorCode::InvalidInput, "Event JSON must be an object.");
  }

  const auto string_field = [&](const char* key, std::string& target) {
    const auto it = value.find(key);
    if (it == value.end() || !it->is_string()) {
      return false;
    }
    target = it->get<std::string>();
    return true;
  };

  NetworkEvent event;
  if (!string_field("pubkey", event.pubkey) || !string_field("content", event.content)) {
    return Result::failure(ErrorCode::InvalidInput, "Event JSON is missing pubkey or content.");
  }
  // Unsigned rumors carry no sig; the id is optional as well.
  string_field("id", event.id);
  string_field("sig", event.sig);

  const auto created = value.find("created_at");
  const auto kind = value.find("kind");
  if (created == value.end() || !created->is_number_integer() || kind == value.end() ||
      !kind->is_number_integer()) {
    return Result::failure(ErrorCode::InvalidInput, "Event JSON has no integer created_at or kind.");
  }
  event.created_at = created->get<std::int64_t>();
  event.kind = kind->get<int>();

  const auto tags = value.find("tags");
  if (tags != value.end()) {
    if (!tags->is_array()) {
      return Result::failure(ErrorCode::InvalidInput, "Event tags must be an array.");
    }
    for (const auto& tag : *tags) {
      if (!tag.is_array()) {
        return Result::failure(ErrorCode::InvalidInput, "Event tag must be an array.");
      }
      EventTag parsed;
      for (const auto& item : tag) {
        if (!item.is_string()) {
          return Result::failure(ErrorCode::InvalidInput, "Event tag items must be strings.");
        }
        parsed.push_back(item.get<std::string>());
      }
      event.tags.push_back(std::move(parsed));
    }
  }

  out = std::move(event);
  return Result::success();
}

}  // namespace gambit
