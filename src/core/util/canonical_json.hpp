#pragma once

#include <string_view>

#include <nlohmann/json.hpp>

#include "core/model/types.hpp"

namespace gambit::util {

// Compact JSON with lexicographically sorted object keys and raw UTF-8 strings.
// Non-finite numbers are rejected. On success the canonical text is in Result::data.
Result canonical_json(const nlohmann::json& value);

// Parses text into JSON without throwing; InvalidInput on malformed input.
Result parse_json(std::string_view text, nlohmann::json& out);

}  // namespace gambit::util
