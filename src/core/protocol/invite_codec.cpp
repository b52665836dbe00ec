#include "core/protocol/invite_codec.hpp"

#include <array>
#include <cctype>
#include <cstdint>

#include "core/model/app_meta.hpp"
#include "core/util/canonical.hpp"

namespace gambit {
namespace {

constexpr std::string_view kInviteHrp = "nevent";
constexpr std::string_view kUriPrefix = "nostr:";
constexpr std::string_view kCharset = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";
constexpr std::string_view kInvitePrefix = "You've been invited to play golf at ";
constexpr std::string_view kInviteSuffix = "!\n\nJoin: ";

constexpr std::uint8_t kTlvSpecial = 0;
constexpr std::uint8_t kTlvRelay = 1;
constexpr std::size_t kMaxTokenLength = 5000;

std::uint32_t polymod(const std::vector<std::uint8_t>& values) {
  static constexpr std::array<std::uint32_t, 5> kGenerator = {
      0x3b6a57b2U, 0x26508e6dU, 0x1ea119faU, 0x3d4233ddU, 0x2a1462b3U,
  };

  std::uint32_t chk = 1;
  for (const std::uint8_t value : values) {
    const std::uint32_t top = chk >> 25U;
    chk = ((chk & 0x1ffffffU) << 5U) ^ value;
    for (std::size_t i = 0; i < kGenerator.size(); ++i) {
      if (((top >> i) & 1U) != 0U) {
        chk ^= kGenerator[i];
      }
    }
  }
  return chk;
}

std::vector<std::uint8_t> expand_hrp(std::string_view hrp) {
  std::vector<std::uint8_t> out;
  out.reserve(hrp.size() * 2U + 1U);
  for (const char c : hrp) {
    out.push_back(static_cast<std::uint8_t>(static_cast<unsigned char>(c) >> 5U));
  }
  out.push_back(0);
  for (const char c : hrp) {
    out.push_back(static_cast<std::uint8_t>(static_cast<unsigned char>(c) & 0x1fU));
  }
  return out;
}

std::vector<std::uint8_t> create_checksum(std::string_view hrp, const std::vector<std::uint8_t>& data) {
  std::vector<std::uint8_t> values = expand_hrp(hrp);
  values.insert(values.end(), data.begin(), data.end());
  values.insert(values.end(), 6, 0);
  const std::uint32_t mod = polymod(values) ^ 1U;

  std::vector<std::uint8_t> checksum(6);
  for (std::size_t i = 0; i < checksum.size(); ++i) {
    checksum[i] = static_cast<std::uint8_t>((mod >> (5U * (5U - i))) & 0x1fU);
  }
  return checksum;
}

bool convert_bits(const std::vector<std::uint8_t>& in, unsigned from_bits, unsigned to_bits, bool pad,
                  std::vector<std::uint8_t>& out) {
  std::uint32_t acc = 0;
  unsigned bits = 0;
  const std::uint32_t max_value = (1U << to_bits) - 1U;
  for (const std::uint8_t value : in) {
    if ((value >> from_bits) != 0U) {
      return false;
    }
    acc = (acc << from_bits) | value;
    bits += from_bits;
    while (bits >= to_bits) {
      bits -= to_bits;
      out.push_back(static_cast<std::uint8_t>((acc >> bits) & max_value));
    }
  }

  if (pad) {
    if (bits > 0) {
      out.push_back(static_cast<std::uint8_t>((acc << (to_bits - bits)) & max_value));
    }
  } else if (bits >= from_bits || ((acc << (to_bits - bits)) & max_value) != 0U) {
    return false;
  }
  return true;
}

void append_tlv(std::vector<std::uint8_t>& out, std::uint8_t type, std::string_view value) {
  out.push_back(type);
  out.push_back(static_cast<std::uint8_t>(value.size()));
  for (const char c : value) {
    out.push_back(static_cast<std::uint8_t>(static_cast<unsigned char>(c)));
  }
}

}  // namespace

Result encode_invite(const InvitePointer& pointer) {
  if (!util::is_hex_of_size(pointer.event_id, 32)) {
    return Result::failure(ErrorCode::InvalidInput, "Invite event id must be 64 hex characters.");
  }

  std::vector<std::uint8_t> tlv;
  append_tlv(tlv, kTlvSpecial, util::from_hex(pointer.event_id));
  for (const auto& relay : pointer.relay_hints) {
    if (relay.empty() || relay.size() > 255U) {
      continue;
    }
    append_tlv(tlv, kTlvRelay, relay);
  }

  std::vector<std::uint8_t> data;
  convert_bits(tlv, 8, 5, true, data);
  const std::vector<std::uint8_t> checksum = create_checksum(kInviteHrp, data);
  data.insert(data.end(), checksum.begin(), checksum.end());

  std::string token{kInviteHrp};
  token.push_back('1');
  for (const std::uint8_t value : data) {
    token.push_back(kCharset[value]);
  }
  return Result::success("Invite encoded.", token);
}

Result decode_invite(std::string_view token, InvitePointer& out) {
  const std::string text = util::lowercase_copy(util::trim_copy(strip_nostr_uri(token)));
  if (text.size() > kMaxTokenLength) {
    return Result::failure(ErrorCode::InvalidInput, "Invite token is too long.");
  }

  const std::size_t separator = text.rfind('1');
  if (separator == std::string::npos || std::string_view{text}.substr(0, separator) != kInviteHrp ||
      text.size() < separator + 7U) {
    return Result::failure(ErrorCode::InvalidInput, "Invite token is not an nevent.");
  }

  std::vector<std::uint8_t> data;
  data.reserve(text.size() - separator - 1U);
  for (std::size_t i = separator + 1U; i < text.size(); ++i) {
    const std::size_t pos = kCharset.find(text[i]);
    if (pos == std::string_view::npos) {
      return Result::failure(ErrorCode::InvalidInput, "Invite token has an invalid character.");
    }
    data.push_back(static_cast<std::uint8_t>(pos));
  }

  std::vector<std::uint8_t> check = expand_hrp(kInviteHrp);
  check.insert(check.end(), data.begin(), data.end());
  if (polymod(check) != 1U) {
    return Result::failure(ErrorCode::InvalidInput, "Invite token checksum mismatch.");
  }

  data.resize(data.size() - 6U);
  std::vector<std::uint8_t> tlv;
  if (!convert_bits(data, 5, 8, false, tlv)) {
    return Result::failure(ErrorCode::InvalidInput, "Invite token padding is invalid.");
  }

  InvitePointer pointer;
  std::size_t offset = 0;
  while (offset + 2U <= tlv.size()) {
    const std::uint8_t type = tlv[offset];
    const std::size_t length = tlv[offset + 1U];
    offset += 2U;
    if (offset + length > tlv.size()) {
      return Result::failure(ErrorCode::InvalidInput, "Invite token TLV is truncated.");
    }

    const std::string value{reinterpret_cast<const char*>(tlv.data() + offset), length};
    offset += length;
    if (type == kTlvSpecial) {
      if (length != 32U) {
        return Result::failure(ErrorCode::InvalidInput, "Invite token event id has the wrong size.");
      }
      pointer.event_id = util::to_hex(value);
    } else if (type == kTlvRelay) {
      pointer.relay_hints.push_back(value);
    }
  }

  if (pointer.event_id.empty()) {
    return Result::failure(ErrorCode::InvalidInput, "Invite token carries no event id.");
  }

  out = std::move(pointer);
  return Result::success("Invite decoded.", out.event_id);
}

std::string to_nostr_uri(std::string_view token) {
  return std::string{kUriPrefix} + std::string{token};
}

std::string strip_nostr_uri(std::string_view text) {
  const std::string trimmed = util::trim_copy(text);
  if (util::lowercase_copy(std::string_view{trimmed}.substr(0, kUriPrefix.size())) == kUriPrefix) {
    return trimmed.substr(kUriPrefix.size());
  }
  return trimmed;
}

std::string invite_message_body(std::string_view course_name, std::string_view token) {
  std::string body{kInvitePrefix};
  body += course_name;
  body += kInviteSuffix;
  body += to_nostr_uri(token);
  body += "\n\nSent from ";
  body += kAppDisplayName;
  return body;
}

std::optional<std::string> extract_invite_token(std::string_view message_body) {
  const std::string needle = std::string{kUriPrefix} + std::string{kInviteHrp} + "1";
  const std::size_t start = message_body.find(needle);
  if (start == std::string_view::npos) {
    return std::nullopt;
  }

  std::size_t end = start + kUriPrefix.size();
  while (end < message_body.size() && std::isalnum(static_cast<unsigned char>(message_body[end])) != 0) {
    ++end;
  }
  return std::string{message_body.substr(start + kUriPrefix.size(), end - start - kUriPrefix.size())};
}

std::optional<std::string> extract_course_name(std::string_view message_body) {
  const std::size_t start = message_body.find(kInvitePrefix);
  if (start == std::string_view::npos) {
    return std::nullopt;
  }

  const std::size_t name_begin = start + kInvitePrefix.size();
  const std::size_t name_end = message_body.find(kInviteSuffix, name_begin);
  if (name_end == std::string_view::npos) {
    return std::nullopt;
  }
  return std::string{message_body.substr(name_begin, name_end - name_begin)};
}

}  // namespace gambit
