#include "core/util/canonical_json.hpp"

#include <cmath>
#include <string>

namespace gambit::util {
namespace {

bool all_numbers_finite(const nlohmann::json& value) {
  if (value.is_number_float()) {
    return std::isfinite(value.get<double>());
  }
  if (value.is_array() || value.is_object()) {
    for (const auto& item : value) {
      if (!all_numbers_finite(item)) {
        return false;
      }
    }
  }
  return true;
}

}  // namespace

Result canonical_json(const nlohmann::json& value) {
  if (!all_numbers_finite(value)) {
    return Result::failure(ErrorCode::InvalidInput, "NaN or Infinity is not allowed in canonical JSON.");
  }

  // nlohmann::json keeps object members in a std::map, so dump() emits keys sorted.
  try {
    return Result::success("Canonicalized.",
                           value.dump(-1, ' ', false, nlohmann::json::error_handler_t::strict));
  } catch (const nlohmann::json::type_error& e) {
    return Result::failure(ErrorCode::InvalidInput, std::string{"Canonical JSON rejected: "} + e.what());
  }
}

Result parse_json(std::string_view text, nlohmann::json& out) {
  out = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
  if (out.is_discarded()) {
    return Result::failure(ErrorCode::InvalidInput, "Malformed JSON.");
  }
  return Result::success();
}

}  // namespace gambit::util
