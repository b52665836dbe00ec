#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/model/types.hpp"
#include "core/storage/store.hpp"

namespace gambit {

// Content-addressed course+tee snapshots. Two devices given the same course, tee set and
// holes derive the same hash with no coordination; rows are insert-if-absent only.
class CourseStore {
public:
  explicit CourseStore(Store& store) : store_(store) {}

  Result get_or_create(std::string_view course_name, std::string_view tee_set,
                       const std::vector<HoleDefinition>& holes, CourseSnapshot& out);

  // 9 or 18 holes numbered 1..9, 10..18 or 1..18, par 3..6.
  static Result validate(std::string_view course_name, std::string_view tee_set,
                         const std::vector<HoleDefinition>& holes);
  static nlohmann::json course_json(std::string_view course_name, std::string_view tee_set,
                                    const std::vector<HoleDefinition>& holes);
  // Builds a snapshot (hash, canonical JSON, sorted holes) without touching storage.
  static Result build_snapshot(std::string_view course_name, std::string_view tee_set,
                               const std::vector<HoleDefinition>& holes, CourseSnapshot& out);
  static Result parse_course_json(const nlohmann::json& value, std::string& course_name, std::string& tee_set,
                                  std::vector<HoleDefinition>& holes);

  // Recomputes the hash of received course JSON. UntrustedContent on mismatch,
  // InvalidInput when the content cannot be read as a course.
  static Result verify_embedded(std::string_view course_json_text, std::string_view embedded_hash);

  static nlohmann::json rules_template();
  static std::string rules_hash();

private:
  Store& store_;
};

}  // namespace gambit
