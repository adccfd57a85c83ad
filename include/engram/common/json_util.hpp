#pragma once

#include "engram/common/result.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace engram::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Unescape the body of a JSON string literal, including \uXXXX sequences.
[[nodiscard]] std::string json_unescape(const std::string &raw);

[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Find matching bracket/brace for nested JSON structures.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// Extract a nested JSON array field (including brackets) from a JSON document.
[[nodiscard]] std::string json_get_array(const std::string &json, const std::string &field);

/// Split a JSON array of objects into individual object strings.
[[nodiscard]] std::vector<std::string> json_split_top_level_objects(const std::string &array_json);

/// Parse a JSON array of numbers like [0.1, -2e-3]. Fails on any non-numeric element.
[[nodiscard]] Result<std::vector<double>> json_parse_number_array(const std::string &array_json);

/// One member of a flat JSON object. Strings hold their unescaped text; every other
/// value (number, bool, null, array, object) holds its raw JSON fragment.
class JsonFlatValue {
public:
  JsonFlatValue() = default;
  JsonFlatValue(std::string text) : text_(std::move(text)) {}
  JsonFlatValue(const char *text) : text_(text) {}

  [[nodiscard]] static JsonFlatValue raw(std::string fragment) {
    JsonFlatValue value(std::move(fragment));
    value.is_string_ = false;
    return value;
  }

  [[nodiscard]] bool is_string() const { return is_string_; }
  [[nodiscard]] const std::string &text() const { return text_; }
  [[nodiscard]] std::string to_json() const;

  bool operator==(const JsonFlatValue &other) const = default;

private:
  std::string text_;
  bool is_string_ = true;
};

using JsonFlatMap = std::map<std::string, JsonFlatValue>;

/// Parse a flat JSON object. Anything that is not a well-formed top-level object fails.
[[nodiscard]] Result<JsonFlatMap> json_parse_flat(const std::string &json);

/// Serialize a flat map as a JSON object. Raw fragments are written unquoted.
[[nodiscard]] std::string json_serialize_flat(const JsonFlatMap &values);

} // namespace engram::common
