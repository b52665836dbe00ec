#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"

namespace gambit {

struct InvitePointer {
  std::string event_id;  // 64 hex chars
  std::vector<std::string> relay_hints;
};

// Bech32 "nevent1..." token: TLV type 0 carries the event id, type 1 each relay URL.
Result encode_invite(const InvitePointer& pointer);
Result decode_invite(std::string_view token, InvitePointer& out);

std::string to_nostr_uri(std::string_view token);
// Accepts a bare token or a "nostr:" URI and returns the bare token.
std::string strip_nostr_uri(std::string_view text);

std::string invite_message_body(std::string_view course_name, std::string_view token);
std::optional<std::string> extract_invite_token(std::string_view message_body);
std::optional<std::string> extract_course_name(std::string_view message_body);

}  // namespace gambit
