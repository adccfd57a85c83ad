#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "engram/common/fs.hpp"
#include "engram/common/json_util.hpp"
#include "engram/common/result.hpp"
#include "engram/common/toml.hpp"
#include "engram/memory/memory.hpp"

#include <cmath>
#include <set>

void register_common_tests(std::vector<engram::tests::TestCase> &tests) {
  using engram::tests::require;
  namespace common = engram::common;
  namespace mem = engram::memory;

  tests.push_back({"result_success_and_failure", [] {
                     auto ok = common::Result<int>::success(7);
                     require(ok.ok(), "success should be ok");
                     require(ok.value() == 7, "value mismatch");

                     auto bad = common::Result<int>::failure("boom");
                     require(!bad.ok(), "failure should not be ok");
                     require(bad.error() == "boom", "error mismatch");
                     require(bad.value_or(3) == 3, "value_or should return fallback");

                     auto forwarded = bad.forward_error<std::string>();
                     require(!forwarded.ok() && forwarded.error() == "boom",
                             "forwarded error mismatch");

                     bool threw = false;
                     try {
                       (void)bad.value();
                     } catch (const std::logic_error &) {
                       threw = true;
                     }
                     require(threw, "value() on failure should throw");
                   }});

  tests.push_back({"string_helpers", [] {
                     require(common::trim("  a b \n") == "a b", "trim mismatch");
                     require(common::trim("   ").empty(), "trim of blanks should be empty");
                     require(common::to_lower("MiXeD") == "mixed", "to_lower mismatch");
                   }});

  tests.push_back({"expand_path_home_and_env", [] {
                     engram::testing::EnvGuard home("HOME", "/tmp/engram-home");
                     engram::testing::EnvGuard var("ENGRAM_TEST_DIR", "data");
                     require(common::expand_path("~/x.db") == "/tmp/engram-home/x.db",
                             "tilde expansion mismatch");
                     require(common::expand_path("/srv/$ENGRAM_TEST_DIR/m.db") == "/srv/data/m.db",
                             "env expansion mismatch");
                     require(common::expand_path("/srv/${ENGRAM_TEST_DIR}/m.db") ==
                                 "/srv/data/m.db",
                             "braced env expansion mismatch");
                     require(common::expand_path("plain") == "plain", "plain path changed");
                   }});

  tests.push_back({"ensure_dir_creates_nested", [] {
                     engram::testing::TempWorkspace ws;
                     const auto nested = ws.path() / "a" / "b";
                     auto result = common::ensure_dir(nested);
                     require(result.ok(), result.error());
                     require(std::filesystem::is_directory(nested), "directory not created");
                   }});

  tests.push_back({"json_escape_unescape", [] {
                     const std::string raw = "line\n\"quoted\"\\tab\t";
                     const std::string escaped = common::json_escape(raw);
                     require(escaped.find('\n') == std::string::npos, "newline not escaped");
                     require(common::json_unescape(escaped) == raw, "unescape mismatch");
                     require(common::json_unescape("\\u00e9") == "\xC3\xA9", "BMP unescape");
                     require(common::json_unescape("\\ud83d\\ude00") == "\xF0\x9F\x98\x80",
                             "surrogate pair unescape");
                   }});

  tests.push_back({"json_parse_flat_object", [] {
                     auto parsed = common::json_parse_flat(
                         R"({"source":"chat","score":0.5,"nested":{"a":1},"ok":true})");
                     require(parsed.ok(), parsed.error());
                     const auto &map = parsed.value();
                     require(map.at("source") == "chat", "string value mismatch");
                     require(map.at("source").is_string(), "string lost its kind");
                     require(map.at("score") == common::JsonFlatValue::raw("0.5"),
                             "number should stay raw");
                     require(map.at("nested") == common::JsonFlatValue::raw(R"({"a":1})"),
                             "nested should stay raw");
                     require(!map.at("ok").is_string() && map.at("ok").text() == "true",
                             "bool should stay raw");
                   }});

  tests.push_back({"json_flat_keeps_value_types_on_rewrite", [] {
                     const std::string source =
                         R"({"n":3,"ok":true,"none":null,"tags":["a","b"],"who":"3"})";
                     auto parsed = common::json_parse_flat(source);
                     require(parsed.ok(), parsed.error());
                     require(common::json_serialize_flat(parsed.value()) == source,
                             "rewrite changed value types");
                   }});

  tests.push_back({"json_parse_flat_rejects_malformed", [] {
                     require(!common::json_parse_flat("not json").ok(), "plain text accepted");
                     require(!common::json_parse_flat("[1,2]").ok(), "array accepted");
                     require(!common::json_parse_flat(R"({"a":"b")").ok(), "unterminated accepted");
                     require(!common::json_parse_flat(R"({"a":"b"} trailing)").ok(),
                             "trailing text accepted");
                     require(!common::json_parse_flat(R"({"a":bogus})").ok(),
                             "bare word accepted");
                   }});

  tests.push_back({"json_serialize_flat_roundtrip_escapes", [] {
                     const common::JsonFlatMap map = {{"k\"ey", "va\nlue"},
                                                     {"b", common::JsonFlatValue::raw("2")}};
                     auto parsed = common::json_parse_flat(common::json_serialize_flat(map));
                     require(parsed.ok(), parsed.error());
                     require(parsed.value() == map, "flat map mismatch");
                   }});

  tests.push_back({"json_parse_number_array", [] {
                     auto parsed = common::json_parse_number_array("[0.25, -1e-3, 3]");
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().size() == 3, "size mismatch");
                     require(std::abs(parsed.value()[1] + 0.001) < 1e-12, "exponent parse");

                     require(!common::json_parse_number_array("[1, \"x\"]").ok(), "string accepted");
                     require(!common::json_parse_number_array("[1,,2]").ok(), "double comma");
                     require(!common::json_parse_number_array("[1, 2").ok(), "unterminated");
                     auto empty = common::json_parse_number_array("[]");
                     require(empty.ok() && empty.value().empty(), "empty array should parse");
                   }});

  tests.push_back({"json_get_array_and_split_objects", [] {
                     const std::string body =
                         R"({"data":[{"embedding":[1,2]},{"embedding":[3,4]}],"model":"m"})";
                     const std::string data = common::json_get_array(body, "data");
                     require(!data.empty(), "data array missing");
                     const auto objects = common::json_split_top_level_objects(data);
                     require(objects.size() == 2, "object count mismatch");
                     require(common::json_get_array(objects[1], "embedding") == "[3,4]",
                             "second embedding mismatch");
                     require(common::json_get_array(body, "missing").empty(),
                             "missing field should be empty");
                   }});

  tests.push_back({"toml_parse_sections", [] {
                     auto doc = common::parse_toml(R"(
# comment
[memory]
db_path = "/tmp/m.db"   # trailing comment
fallback_dimensions = 1_024
semantic_weight = 0.75

[embeddings]
provider = 'openai'
)");
                     require(doc.ok(), doc.error());
                     require(doc.value().get_string("memory.db_path") == "/tmp/m.db",
                             "string mismatch");
                     require(doc.value().get_u64("memory.fallback_dimensions", 0) == 1024,
                             "u64 with underscores mismatch");
                     require(doc.value().get_double("memory.semantic_weight", 0.0) == 0.75,
                             "double mismatch");
                     require(doc.value().get_string("embeddings.provider") == "openai",
                             "literal string mismatch");
                     require(!doc.value().has("memory.missing"), "unexpected key");
                   }});

  tests.push_back({"timestamp_format_and_parse", [] {
                     const mem::Timestamp ts{std::chrono::milliseconds(1'714'566'600'250)};
                     const std::string text = mem::format_timestamp(ts);
                     require(text == "2024-05-01T12:30:00.250Z", "format mismatch: " + text);

                     const auto parsed = mem::parse_timestamp(text);
                     require(parsed.has_value() && *parsed == ts, "parse roundtrip mismatch");

                     const auto seconds = mem::parse_timestamp("2024-05-01T12:30:00Z");
                     require(seconds.has_value() &&
                                 seconds->time_since_epoch().count() == 1'714'566'600'000,
                             "second precision parse mismatch");

                     const auto sqlite_style = mem::parse_timestamp("2024-05-01 12:30:00");
                     require(sqlite_style.has_value() && *sqlite_style == *seconds,
                             "sqlite datetime parse mismatch");

                     require(!mem::parse_timestamp("yesterday").has_value(), "garbage parsed");
                     require(!mem::parse_timestamp("2024-05-01T12:30:00Zjunk").has_value(),
                             "trailing junk parsed");
                   }});

  tests.push_back({"memory_type_strings", [] {
                     require(mem::memory_type_to_string(mem::MemoryType::Episodic) == "episodic",
                             "to_string mismatch");
                     auto parsed = mem::memory_type_from_string("Preference");
                     require(parsed.ok() && parsed.value() == mem::MemoryType::Preference,
                             "case-insensitive parse failed");
                     require(!mem::memory_type_from_string("opinion").ok(),
                             "unknown type accepted");
                   }});

  tests.push_back({"memory_ids_are_uuid_v4", [] {
                     std::set<std::string> seen;
                     for (int i = 0; i < 64; ++i) {
                       auto id = mem::generate_memory_id();
                       require(id.ok(), id.error());
                       const std::string &v = id.value();
                       require(v.size() == 36, "uuid length mismatch");
                       require(v[8] == '-' && v[13] == '-' && v[18] == '-' && v[23] == '-',
                               "uuid dashes misplaced");
                       require(v[14] == '4', "uuid version nibble should be 4");
                       require(std::string("89ab").find(v[19]) != std::string::npos,
                               "uuid variant mismatch");
                       seen.insert(v);
                     }
                     require(seen.size() == 64, "ids should be unique");
                   }});
}
