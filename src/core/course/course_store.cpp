#include "core/course/course_store.hpp"

#include <algorithm>

#include "core/util/canonical.hpp"
#include "core/util/canonical_json.hpp"
#include "core/util/hash.hpp"
#include "core/util/log.hpp"

namespace gambit {
namespace {

constexpr int kMinPar = 3;
constexpr int kMaxPar = 6;

std::vector<HoleDefinition> sorted_holes(std::vector<HoleDefinition> holes) {
  std::ranges::sort(holes, {}, &HoleDefinition::hole_number);
  return holes;
}

bool numbered_run(const std::vector<HoleDefinition>& sorted, int first) {
  for (std::size_t i = 0; i < sorted.size(); ++i) {
    if (sorted[i].hole_number != first + static_cast<int>(i)) {
      return false;
    }
  }
  return true;
}

}  // namespace

Result CourseStore::validate(std::string_view course_name, std::string_view tee_set,
                             const std::vector<HoleDefinition>& holes) {
  if (util::trim_copy(course_name).empty()) {
    return Result::failure(ErrorCode::InvalidInput, "Course name is required.");
  }
  if (util::trim_copy(tee_set).empty()) {
    return Result::failure(ErrorCode::InvalidInput, "Tee set is required.");
  }
  if (holes.size() != 9 && holes.size() != 18) {
    return Result::failure(ErrorCode::InvalidInput, "A course has 9 or 18 holes, got " +
                                                        std::to_string(holes.size()) + ".");
  }

  const std::vector<HoleDefinition> sorted = sorted_holes(holes);
  const bool numbered = holes.size() == 18 ? numbered_run(sorted, 1)
                                           : (numbered_run(sorted, 1) || numbered_run(sorted, 10));
  if (!numbered) {
    return Result::failure(ErrorCode::InvalidInput, "Hole numbers must be 1-9, 10-18 or 1-18.");
  }

  for (const auto& hole : sorted) {
    if (hole.par < kMinPar || hole.par > kMaxPar) {
      return Result::failure(ErrorCode::InvalidInput, "Hole " + std::to_string(hole.hole_number) +
                                                          " has par " + std::to_string(hole.par) +
                                                          "; par must be 3 to 6.");
    }
  }
  return Result::success();
}

nlohmann::json CourseStore::course_json(std::string_view course_name, std::string_view tee_set,
                                        const std::vector<HoleDefinition>& holes) {
  nlohmann::json hole_array = nlohmann::json::array();
  for (const auto& hole : sorted_holes(holes)) {
    hole_array.push_back({
        {"handicap_index", nullptr},
        {"hole_number", hole.hole_number},
        {"par", hole.par},
    });
  }
  return {
      {"course_name", std::string{course_name}},
      {"hole_count", static_cast<int>(holes.size())},
      {"holes", hole_array},
      {"tee_set", std::string{tee_set}},
  };
}

Result CourseStore::build_snapshot(std::string_view course_name, std::string_view tee_set,
                                   const std::vector<HoleDefinition>& holes, CourseSnapshot& out) {
  if (const Result valid = validate(course_name, tee_set, holes); !valid.ok) {
    return valid;
  }

  const Result canonical = util::canonical_json(course_json(course_name, tee_set, holes));
  if (!canonical.ok) {
    return canonical;
  }

  out.content_hash = util::sha256_hex(canonical.data);
  out.course_name = std::string{course_name};
  out.tee_set = std::string{tee_set};
  out.holes = sorted_holes(holes);
  out.canonical_json = canonical.data;
  out.created_unix = util::unix_timestamp_now();
  return Result::success("Course snapshot built.", out.content_hash);
}

Result CourseStore::get_or_create(std::string_view course_name, std::string_view tee_set,
                                  const std::vector<HoleDefinition>& holes, CourseSnapshot& out) {
  CourseSnapshot snapshot;
  if (const Result built = build_snapshot(course_name, tee_set, holes, snapshot); !built.ok) {
    return built;
  }

  const Result stored = store_.insert_course_if_absent(snapshot);
  if (!stored.ok) {
    return stored;
  }

  if (stored.data == "existing") {
    if (const auto existing = store_.course(snapshot.content_hash); existing.has_value()) {
      snapshot = *existing;
    }
  } else {
    util::log_debug("course", "Stored course snapshot " + snapshot.content_hash);
  }

  out = std::move(snapshot);
  return Result::success("Course snapshot ready.", out.content_hash);
}

Result CourseStore::parse_course_json(const nlohmann::json& value, std::string& course_name, std::string& tee_set,
                                      std::vector<HoleDefinition>& holes) {
  if (!value.is_object()) {
    return Result::failure(ErrorCode::InvalidInput, "Course snapshot must be a JSON object.");
  }

  const auto name = value.find("course_name");
  const auto tee = value.find("tee_set");
  const auto hole_array = value.find("holes");
  if (name == value.end() || !name->is_string() || tee == value.end() || !tee->is_string() ||
      hole_array == value.end() || !hole_array->is_array()) {
    return Result::failure(ErrorCode::InvalidInput, "Course snapshot is missing course_name, tee_set or holes.");
  }

  std::vector<HoleDefinition> parsed;
  for (const auto& hole : *hole_array) {
    const auto number = hole.find("hole_number");
    const auto par = hole.find("par");
    if (!hole.is_object() || number == hole.end() || !number->is_number_integer() || par == hole.end() ||
        !par->is_number_integer()) {
      return Result::failure(ErrorCode::InvalidInput, "Course hole entry is malformed.");
    }
    parsed.push_back({number->get<int>(), par->get<int>()});
  }

  course_name = name->get<std::string>();
  tee_set = tee->get<std::string>();
  holes = std::move(parsed);
  return validate(course_name, tee_set, holes);
}

Result CourseStore::verify_embedded(std::string_view course_json_text, std::string_view embedded_hash) {
  nlohmann::json value;
  if (const Result parsed = util::parse_json(course_json_text, value); !parsed.ok) {
    return parsed;
  }

  const Result canonical = util::canonical_json(value);
  if (!canonical.ok) {
    return canonical;
  }

  const std::string recomputed = util::sha256_hex(canonical.data);
  if (recomputed != embedded_hash) {
    return Result::failure(ErrorCode::UntrustedContent, "Course hash mismatch: embedded " +
                                                            std::string{embedded_hash} + ", recomputed " +
                                                            recomputed + ".");
  }
  return Result::success("Course hash verified.", recomputed);
}

nlohmann::json CourseStore::rules_template() {
  return {{"format", "stroke_play"}};
}

std::string CourseStore::rules_hash() {
  // A fixed object of ASCII strings always canonicalizes.
  return util::sha256_hex(util::canonical_json(rules_template()).data);
}

}  // namespace gambit
