#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

#include "wordcount/arena.hpp"
#include "wordcount/c_api.h"
#include "wordcount/codec.hpp"
#include "wordcount/descriptor.hpp"
#include "wordcount/dispatcher.hpp"
#include "wordcount/hash.hpp"
#include "wordcount/jsonlite.hpp"
#include "wordcount/observability.hpp"
#include "wordcount/phases.hpp"
#include "wordcount/text.hpp"
#include "wordcount/types.hpp"
#include "wordcount/version.hpp"

namespace jl = wordcount::jsonlite;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

std::vector<wordcount::InvocationEvent> g_events;
std::vector<std::string> g_warnings;

void capture_event(const wordcount::InvocationEvent& ev) { g_events.push_back(ev); }
void capture_warning(std::string_view component, std::string_view message) {
  g_warnings.push_back(std::string(component) + ": " + std::string(message));
}

wordcount::Request make_request(const std::string& function, std::optional<jl::Value> input,
                                std::optional<jl::Value> config = std::nullopt) {
  wordcount::Request r;
  r.node = "word-count";
  r.function = function;
  r.input = std::move(input);
  r.config = std::move(config);
  return r;
}

jl::Value text_input(const std::string& text, bool case_sensitive = false) {
  jl::Object o;
  o["text"] = text;
  o["case_sensitive"] = case_sensitive;
  return o;
}

// prep -> exec through the dispatcher; returns the exec response.
wordcount::Response prep_then_exec(const std::string& text, bool case_sensitive = false,
                                   std::optional<jl::Value> config = std::nullopt) {
  const auto prep = wordcount::dispatch(make_request("prep", text_input(text, case_sensitive)));
  expect(prep.success, "prep must succeed for: " + text);
  return wordcount::dispatch(make_request("exec", prep.output, std::move(config)));
}

wordcount::AggregationResult aggregation_of(const wordcount::Response& r) {
  expect(r.success && r.output.has_value(), "exec must succeed with output");
  auto agg = wordcount::AggregationResult::from_value(*r.output);
  expect(agg.has_value(), "exec output must decode as AggregationResult");
  return *agg;
}

wordcount::Response post_for(std::uint64_t total_words) {
  wordcount::AggregationResult agg;
  agg.total_words = total_words;
  return wordcount::dispatch(make_request("post", agg.to_value()));
}

std::string call_abi(const std::string& request, std::size_t capacity, std::size_t* true_size = nullptr) {
  std::vector<std::uint8_t> out(capacity);
  const std::size_t n = wordcount_call(reinterpret_cast<const std::uint8_t*>(request.data()), request.size(),
                                       out.data(), out.size());
  if (true_size) *true_size = n;
  return std::string(reinterpret_cast<const char*>(out.data()), n < capacity ? n : capacity);
}

// ============================================================================
// Memory arena
// ============================================================================

void test_arena_allocate_release() {
  std::uint8_t* p = wordcount::arena_allocate(64);
  expect(p != nullptr, "allocate must never return null");
  std::memset(p, 0xAB, 64);
  expect(p[63] == 0xAB, "allocated block must be writable");
  expect(wordcount::arena_release(p, 64) == wordcount::ReleaseStatus::released, "matching release succeeds");
}

void test_arena_zero_size_unique() {
  std::uint8_t* a = wordcount::arena_allocate(0);
  std::uint8_t* b = wordcount::arena_allocate(0);
  expect(a != nullptr && b != nullptr, "zero-size allocations return valid addresses");
  expect(a != b, "zero-size allocations are unique");
  expect(wordcount::arena_release(a, 0) == wordcount::ReleaseStatus::released, "release zero-size a");
  expect(wordcount::arena_release(b, 0) == wordcount::ReleaseStatus::released, "release zero-size b");
}

void test_arena_size_mismatch_refused() {
  g_warnings.clear();
  wordcount::set_warning_hook(capture_warning);
  std::uint8_t* p = wordcount::arena_allocate(32);
  expect(wordcount::arena_release(p, 31) == wordcount::ReleaseStatus::size_mismatch, "short size refused");
  expect(wordcount::arena_release(p, 33) == wordcount::ReleaseStatus::size_mismatch, "long size refused");
  expect(g_warnings.size() == 2, "each refusal is logged");
  expect(g_warnings[0].find("size 31") != std::string::npos, "warning names the bad size");
  expect(g_warnings[0].find("(size_mismatch)") != std::string::npos, "warning names the release status");
  expect(wordcount::arena_release(p, 32) == wordcount::ReleaseStatus::released, "block survives a refusal");
  wordcount::set_warning_hook(nullptr);
}

void test_arena_foreign_address_refused() {
  wordcount::set_warning_hook(capture_warning);
  g_warnings.clear();
  alignas(16) std::uint8_t foreign[48] = {};
  expect(wordcount::arena_release(foreign + 16, 32) == wordcount::ReleaseStatus::not_owned,
         "address without an ownership tag is refused");
  expect(g_warnings.size() == 1 && g_warnings[0].find("(not_owned)") != std::string::npos,
         "foreign release is logged with its status");
  expect(wordcount::arena_release(nullptr, 10) == wordcount::ReleaseStatus::null_address, "null is a no-op");
  wordcount::set_warning_hook(nullptr);
}

void test_owned_buffer_moves() {
  wordcount::OwnedBuffer a(16);
  expect(!a.empty() && a.size() == 16, "owned buffer holds its block");
  std::uint8_t* addr = a.data();

  wordcount::OwnedBuffer b(std::move(a));
  expect(a.empty() && b.data() == addr, "move transfers ownership");

  std::uint8_t* raw = b.into_raw();
  expect(b.empty() && raw == addr, "into_raw hands the address over");

  auto back = wordcount::OwnedBuffer::adopt(raw, 16);
  expect(back.data() == addr && back.size() == 16, "adopt takes it back");
}

void test_copy_truncated() {
  std::uint8_t buf[8];
  std::memset(buf, '#', sizeof(buf));
  expect(wordcount::copy_truncated("hello world", buf, 5) == 11, "returns true length");
  expect(std::memcmp(buf, "hello", 5) == 0, "prefix written");
  expect(buf[5] == '#', "no byte beyond capacity written");
  expect(wordcount::copy_truncated("abc", nullptr, 100) == 3, "null out queries the size");
}

// ============================================================================
// jsonlite
// ============================================================================

void test_json_parse_and_sorted_output() {
  std::optional<jl::JsonError> err;
  auto v = jl::parse_value(R"({"b":[1,2.5,"x"],"a":{"n":null,"t":true}})", &err);
  expect(!err, "valid JSON parses");
  expect(jl::to_json(v) == R"({"a":{"n":null,"t":true},"b":[1,2.5,"x"]})", "keys are emitted sorted");
}

void test_json_rejects_invalid() {
  std::optional<jl::JsonError> err;
  jl::parse(R"({"a":1,"a":2})", &err);
  expect(err && err->code == "json_duplicate_key", "duplicate key rejected");
  jl::parse(R"({"a":1} x)", &err);
  expect(err.has_value(), "trailing data rejected");
  jl::parse(R"({"a":NaN})", &err);
  expect(err.has_value(), "NaN rejected");
  jl::parse(R"({"a":01})", &err);
  expect(err.has_value(), "leading zero rejected");
  jl::parse("[1,2]", &err);
  expect(err.has_value(), "non-object root rejected by parse()");
}

void test_json_unicode_escapes() {
  std::optional<jl::JsonError> err;
  auto v = jl::parse_value(R"("caf\u00e9 \ud83d\ude00\n")", &err);
  expect(!err, "escapes parse");
  expect(std::get<std::string>(v.v) == "caf\xC3\xA9 \xF0\x9F\x98\x80\n", "escapes decode to UTF-8");
  expect(jl::to_json(jl::Value{"a\"b\\c\x01"}) == R"("a\"b\\c\u0001")", "control characters are escaped");
}

void test_format_double() {
  expect(jl::format_double(3.0) == "3.0", "integral doubles keep a fraction");
  expect(jl::format_double(0.0) == "0.0", "zero formats as 0.0");
  const double d = 29.0 / 7.0;
  std::optional<jl::JsonError> err;
  auto v = jl::parse_value(jl::format_double(d), &err);
  expect(!err && std::get<double>(v.v) == d, "doubles round-trip exactly");
  expect(jl::to_json(jl::Value{std::numeric_limits<double>::infinity()}) == "null", "non-finite numbers encode as null");
}

// ============================================================================
// Text utilities
// ============================================================================

void test_utf8_validation() {
  expect(wordcount::text::is_valid_utf8("h\xC3\xA9llo"), "valid multi-byte text accepted");
  expect(!wordcount::text::is_valid_utf8("\xC0\x80"), "overlong encoding rejected");
  expect(!wordcount::text::is_valid_utf8("\xED\xA0\x80"), "surrogate rejected");
  expect(!wordcount::text::is_valid_utf8("abc\xFF"), "invalid byte rejected");
  expect(!wordcount::text::is_valid_utf8("\xE2\x82"), "truncated sequence rejected");
}

void test_text_length_and_lowercase() {
  expect(wordcount::text::length("caf\xC3\xA9") == 4, "length counts code points");
  expect(wordcount::text::to_lower("\xC3\x89" "COLE") == "\xC3\xA9" "cole", "Latin-1 lowercases");
  expect(wordcount::text::to_lower("\xD0\x9C\xD0\x98\xD0\xA0") == "\xD0\xBC\xD0\xB8\xD1\x80", "Cyrillic lowercases");
  expect(wordcount::text::to_lower("VI\xE1\xBB\x86T") == "vi\xE1\xBB\x87t", "Latin Extended Additional lowercases");
  expect(wordcount::text::to_lower("\xEF\xBC\xA1\xEF\xBC\xA2") == "\xEF\xBD\x81\xEF\xBD\x82", "fullwidth Latin lowercases");
  expect(wordcount::text::to_lower("\xD4\xB1") == "\xD5\xA1", "Armenian lowercases");
  expect(wordcount::text::to_lower("\xC4\xB0") == "i\xCC\x87", "dotted capital I expands to i + combining dot");
  expect(wordcount::text::to_lower("\xCE\x9F\xCE\x94\xCE\x9F\xCE\xA3") == "\xCE\xBF\xCE\xB4\xCE\xBF\xCF\x82",
         "word-final sigma lowercases to final form");
  expect(wordcount::text::to_lower("\xCE\xA3\xCE\x91") == "\xCF\x83\xCE\xB1", "non-final sigma stays medial");
}

void test_character_classes() {
  using wordcount::text::is_alphanumeric;
  using wordcount::text::is_whitespace;
  expect(is_alphanumeric(U'a') && is_alphanumeric(U'7'), "ASCII letters and digits");
  expect(is_alphanumeric(0x30A2) && is_alphanumeric(0x4E2D), "katakana and CJK letters");
  expect(is_alphanumeric(0x0663) && is_alphanumeric(0x00BD) && is_alphanumeric(0x216B), "Nd, No and Nl numbers");
  expect(!is_alphanumeric(0x060C), "Arabic comma is punctuation");
  expect(!is_alphanumeric(0x30FB), "katakana middle dot is punctuation");
  expect(!is_alphanumeric(0x2122) && !is_alphanumeric(0x1F600), "symbols are not alphanumeric");
  expect(!is_alphanumeric(U'-') && !is_alphanumeric(U'_'), "ASCII punctuation");
  expect(is_whitespace(0x3000) && is_whitespace(0x2029) && is_whitespace(0x85), "Unicode White_Space");
  expect(!is_whitespace(0x200B), "zero width space is not White_Space");
}

void test_split_whitespace() {
  auto tokens = wordcount::text::split_whitespace("  one\ttwo\xC2\xA0three \n");
  expect(tokens.size() == 3, "splits on runs including NBSP");
  expect(tokens[0] == "one" && tokens[1] == "two" && tokens[2] == "three", "tokens in order");
  expect(wordcount::text::split_whitespace(" \t ").empty(), "whitespace only yields nothing");
}

// ============================================================================
// Wire codec
// ============================================================================

void test_decode_request() {
  wordcount::DecodeError err;
  auto r = wordcount::decode_request(
      R"({"node":"word-count","function":"prep","config":null,"input":{"text":"hi"}})", &err);
  expect(r.has_value(), "well-formed request decodes");
  expect(r->node == "word-count" && r->function == "prep", "node/function decoded");
  expect(!r->config.has_value(), "null config is absent");
  expect(r->input.has_value() && r->input->is_object(), "input decoded");
}

void test_decode_request_failures() {
  wordcount::DecodeError err;
  expect(!wordcount::decode_request("{\"node\":\"x\",\"function\":\"prep\xFF\"}", &err), "bad UTF-8 fails");
  expect(err.code == wordcount::ErrorCode::invalid_encoding, "bad UTF-8 is invalid_encoding");
  expect(err.message == "Invalid UTF-8 input", "encoding error message");

  expect(!wordcount::decode_request(R"({"function":"prep"})", &err), "missing node fails");
  expect(err.code == wordcount::ErrorCode::malformed_request, "missing node is malformed_request");
  expect(err.message.find("node") != std::string::npos, "message names the field");

  expect(!wordcount::decode_request(R"({"node":"n","function":7})", &err), "non-string function fails");
  expect(err.code == wordcount::ErrorCode::malformed_request, "wrong type is malformed_request");

  expect(!wordcount::decode_request("not json", &err), "non-JSON fails");
  expect(err.message.rfind("Failed to parse request: ", 0) == 0, "parse error message prefix");
}

void test_response_round_trip() {
  jl::Object out;
  out["total_words"] = std::uint64_t{2};
  out["average_word_length"] = 10.0 / 3.0;
  out["nested"] = jl::Array{jl::Value{"x"}, jl::Value{true}, jl::Value{}};

  const std::vector<wordcount::Response> cases = {
      wordcount::Response::ok(out),
      wordcount::Response::ok(out, std::string("short")),
      wordcount::Response::fail(wordcount::ErrorCode::unknown_function, "Unknown function: \"x\"\n"),
  };
  for (const auto& original : cases) {
    wordcount::DecodeError err;
    auto decoded = wordcount::decode_response(wordcount::encode_response(original), &err);
    expect(decoded.has_value(), "encoded response decodes");
    expect(*decoded == original, "response round-trips");
  }
}

void test_encode_response_shape() {
  const auto json = wordcount::encode_response(wordcount::Response::fail(wordcount::ErrorCode::missing_input, "x"));
  expect(json == R"({"error":"x","next":null,"output":null,"success":false})", "absent optionals encode as null");
}

// ============================================================================
// Capability descriptor
// ============================================================================

void test_describe_idempotent() {
  expect(wordcount::descriptor_json() == wordcount::descriptor_json(), "descriptor is byte-identical");
  std::vector<std::uint8_t> a(16384), b(16384);
  const std::size_t na = wordcount_metadata(a.data(), a.size());
  const std::size_t nb = wordcount_metadata(b.data(), b.size());
  expect(na == nb && na <= a.size(), "metadata fits and is stable");
  expect(std::memcmp(a.data(), b.data(), na) == 0, "metadata bytes identical");
}

void test_describe_truncation() {
  const std::string full = wordcount::descriptor_json();
  std::vector<std::uint8_t> buf(32 + 8, '#');
  const std::size_t n = wordcount::describe(buf.data(), 32);
  expect(n == full.size(), "describe returns the true size when truncated");
  expect(std::memcmp(buf.data(), full.data(), 32) == 0, "truncated prefix matches");
  expect(buf[32] == '#', "nothing written past capacity");
  expect(wordcount_metadata(nullptr, 0) == full.size(), "null buffer queries the size");
}

void test_descriptor_contents() {
  const auto doc = wordcount::descriptor_document();
  const auto& o = std::get<jl::Object>(doc.v);
  expect(jl::get_string(o, "name") == "word-counter", "module name");
  expect(jl::get_string(o, "version") == wordcount::version::MODULE_SEMVER, "module version");
  const auto& perms = std::get<jl::Object>(jl::find(o, "permissions")->v);
  expect(jl::get_string(perms, "memory") == "5MB", "memory ceiling declared");
  expect(jl::get_u64(perms, "timeout") == 3000, "timeout declared");
  const auto& nodes = std::get<jl::Array>(jl::find(o, "nodes")->v);
  expect(nodes.size() == 1, "one node type");
  const auto& node = std::get<jl::Object>(nodes[0].v);
  expect(jl::get_string(node, "type") == "word-count", "node type");
  for (const char* key : {"configSchema", "inputSchema", "outputSchema"}) {
    expect(jl::find(node, key) && jl::find(node, key)->is_object(), std::string(key) + " present");
  }
}

void test_descriptor_example_reproduces() {
  const auto doc = wordcount::descriptor_document();
  const auto& node = std::get<jl::Object>(std::get<jl::Array>(jl::find(std::get<jl::Object>(doc.v), "nodes")->v)[0].v);
  const auto& example = std::get<jl::Object>(std::get<jl::Array>(jl::find(node, "examples")->v)[0].v);

  const auto prep = wordcount::dispatch(make_request("prep", *jl::find(example, "input")));
  const auto exec = wordcount::dispatch(make_request("exec", prep.output));
  expect(exec.success, "example exec succeeds");
  expect(*exec.output == *jl::find(example, "output"), "advertised example output matches the pipeline");
}

// ============================================================================
// Phase handlers + dispatcher
// ============================================================================

void test_scenario_the_cat_sat() {
  const auto prep = wordcount::dispatch(make_request("prep", text_input("The cat sat.")));
  expect(prep.success, "prep succeeds");
  const auto& po = std::get<jl::Object>(prep.output->v);
  expect(jl::get_string(po, "cleaned_text") == "The cat sat ", "punctuation becomes a space");
  expect(jl::get_string(po, "original_text") == "The cat sat.", "original text kept");
  expect(!jl::get_bool(po, "case_sensitive", true), "case_sensitive defaults false");

  const auto agg = aggregation_of(wordcount::dispatch(make_request("exec", prep.output)));
  expect(agg.total_words == 2, "total_words");
  expect(agg.unique_words == 2, "unique_words");
  expect(agg.average_word_length == 3.0, "average_word_length");
  expect(agg.longest_word == "cat", "longest tie keeps first");
  expect(agg.shortest_word == "cat", "shortest tie keeps first");
  expect(agg.word_frequencies.count("the") == 0, "stop word removed");
}

void test_empty_after_filtering() {
  const auto r = prep_then_exec("The and of, it!");
  expect(r.success, "all-stop-word input is still a success");
  const auto agg = aggregation_of(r);
  expect(agg.total_words == 0 && agg.unique_words == 0, "zero counts");
  expect(agg.word_frequencies.empty(), "no frequencies");
  expect(agg.average_word_length == 0.0, "zero average");
  expect(agg.longest_word.empty() && agg.shortest_word.empty(), "empty extremes");
  const auto& o = std::get<jl::Object>(r.output->v);
  expect(std::holds_alternative<double>(jl::find(o, "average_word_length")->v), "average is a float");
}

void test_case_sensitivity() {
  auto agg = aggregation_of(prep_then_exec("Dog dog DOG The", true));
  expect(agg.total_words == 4 && agg.unique_words == 4, "case-sensitive keeps variants and 'The'");
  agg = aggregation_of(prep_then_exec("Dog dog DOG The", false));
  expect(agg.total_words == 3 && agg.unique_words == 1, "case-insensitive folds variants");
  expect(agg.word_frequencies.at("dog") == 3, "folded frequency");
}

void test_tie_break_first_occurrence() {
  const auto agg = aggregation_of(prep_then_exec("bb cc dddd eeee f g"));
  expect(agg.longest_word == "dddd", "first maximal word wins");
  expect(agg.shortest_word == "f", "first minimal word wins");
}

void test_exec_config() {
  jl::Object cfg;
  cfg["min_word_length"] = std::uint64_t{4};
  auto agg = aggregation_of(prep_then_exec("the quick brown fox", false, jl::Value{cfg}));
  expect(agg.total_words == 2, "min_word_length filters short tokens");

  jl::Object stop;
  stop["stop_words"] = jl::Array{jl::Value{"quick"}};
  agg = aggregation_of(prep_then_exec("the quick brown fox", false, jl::Value{stop}));
  expect(agg.total_words == 3 && agg.word_frequencies.count("the") == 1, "custom stop words replace defaults");
}

void test_exec_invalid_config_falls_back() {
  g_warnings.clear();
  wordcount::set_warning_hook(capture_warning);
  jl::Object cfg;
  cfg["min_word_length"] = "long";
  const auto agg = aggregation_of(prep_then_exec("the quick brown fox", false, jl::Value{cfg}));
  expect(agg.total_words == 3, "invalid config uses defaults");
  expect(!g_warnings.empty() && g_warnings.back().find("using defaults") != std::string::npos,
         "fallback is logged");

  const auto v = wordcount::validate_config(jl::Value{jl::Object{{"colour", jl::Value{"red"}}}});
  expect(v.ok && v.warnings.size() == 1, "unknown keys are warnings");
  wordcount::set_warning_hook(nullptr);
}

void test_min_word_length_must_fit_machine_word() {
  const std::uint64_t wide = (std::uint64_t{1} << 32) | 4u;
  jl::Object cfg;
  cfg["min_word_length"] = wide;
  const auto v = wordcount::validate_config(jl::Value{cfg});
  const auto agg = aggregation_of(prep_then_exec("the quick brown fox", false, jl::Value{cfg}));
  if constexpr (sizeof(std::size_t) < sizeof(std::uint64_t)) {
    expect(!v.ok && v.errors.size() == 1, "value wider than size_t is rejected");
    expect(agg.total_words == 3, "rejected value falls back to defaults instead of wrapping");
  } else {
    expect(v.ok, "value fits in a 64-bit size_t");
    expect(agg.total_words == 0, "huge minimum filters every word instead of wrapping");
  }
}

void test_frequency_invariants() {
  for (const char* t : {"a b c a b a", "one, two; two. three three three!", "", "x", "Hello hello HELLO world"}) {
    const auto agg = aggregation_of(prep_then_exec(t));
    std::uint64_t sum = 0;
    for (const auto& [w, c] : agg.word_frequencies) sum += c;
    expect(agg.unique_words <= agg.total_words, std::string("unique <= total for: ") + t);
    expect(sum == agg.total_words, std::string("frequencies sum to total for: ") + t);
    expect(agg.unique_words == agg.word_frequencies.size(), "unique equals distinct count");
  }
}

void test_prep_unicode() {
  const auto prep = wordcount::dispatch(make_request("prep", text_input("Caf\xC3\xA9\xE2\x80\x94na\xC3\xAFve!")));
  const auto& po = std::get<jl::Object>(prep.output->v);
  expect(jl::get_string(po, "cleaned_text") == "Caf\xC3\xA9 na\xC3\xAFve ", "em dash and bang become single spaces");
  const auto agg = aggregation_of(wordcount::dispatch(make_request("exec", prep.output)));
  expect(agg.word_frequencies.count("caf\xC3\xA9") == 1, "accented word lowercased intact");
  expect(agg.longest_word == "na\xC3\xAFve", "length counts characters, not bytes");

  expect(wordcount::clean_text("\xE3\x82\xA2\xE3\x83\xBB\xE3\x82\xA4") == "\xE3\x82\xA2 \xE3\x82\xA4",
         "katakana middle dot becomes a space");
  expect(wordcount::clean_text("a\xD8\x8C" "b") == "a b", "Arabic comma becomes a space");
  expect(wordcount::clean_text("X\xE2\x84\xA2") == "X ", "trademark sign becomes a space");
  expect(wordcount::clean_text("\xD9\xA3 \xC2\xBD") == "\xD9\xA3 \xC2\xBD", "non-ASCII numbers survive");
}

void test_exec_unicode_case_folding() {
  auto agg = aggregation_of(prep_then_exec("VI\xE1\xBB\x86T vi\xE1\xBB\x87t"));
  expect(agg.total_words == 2 && agg.unique_words == 1, "Vietnamese capitals fold into one word");
  expect(agg.word_frequencies.count("vi\xE1\xBB\x87t") == 1, "folded Vietnamese key");

  agg = aggregation_of(prep_then_exec("\xEF\xBC\xA1\xEF\xBC\xA2 \xEF\xBD\x81\xEF\xBD\x82"));
  expect(agg.total_words == 2 && agg.unique_words == 1, "fullwidth capitals fold into one word");

  agg = aggregation_of(prep_then_exec("\xCE\x9F\xCE\x94\xCE\x9F\xCE\xA3 \xCE\xBF\xCE\xB4\xCE\xBF\xCF\x82"));
  expect(agg.unique_words == 1, "final sigma folds consistently");

  agg = aggregation_of(prep_then_exec("\xE3\x82\xA2\xE3\x83\xBB\xE3\x82\xA4 a\xD8\x8C" "b"));
  expect(agg.total_words == 3 && agg.word_frequencies.count("b") == 1,
         "punctuation-separated words split (the stop word 'a' drops out)");
}

void test_prep_failures() {
  auto r = wordcount::dispatch(make_request("prep", std::nullopt));
  expect(!r.success && r.error_code == wordcount::ErrorCode::missing_input, "missing input");
  expect(!r.output.has_value() && r.error.has_value(), "failure has error, no output");

  r = wordcount::dispatch(make_request("prep", jl::Value{"just a string"}));
  expect(r.error_code == wordcount::ErrorCode::invalid_input_shape, "non-object input");

  r = wordcount::dispatch(make_request("prep", jl::Value{jl::Object{{"txt", jl::Value{"x"}}}}));
  expect(r.error_code == wordcount::ErrorCode::invalid_input_shape, "missing text");

  r = wordcount::dispatch(make_request(
      "prep", jl::Value{jl::Object{{"text", jl::Value{"x"}}, {"case_sensitive", jl::Value{"yes"}}}}));
  expect(r.error_code == wordcount::ErrorCode::invalid_input_shape, "non-boolean case_sensitive");
}

void test_exec_and_post_missing_input() {
  auto r = wordcount::dispatch(make_request("exec", std::nullopt));
  expect(!r.success && r.error_code == wordcount::ErrorCode::missing_prep_data, "exec without input");
  expect(*r.error == "No prep data provided", "exec error message");
  r = wordcount::dispatch(make_request("post", std::nullopt));
  expect(!r.success && r.error_code == wordcount::ErrorCode::missing_exec_result, "post without input");
  expect(!r.next.has_value(), "no routing label on failure");
}

void test_post_routing() {
  expect(*post_for(0).next == "empty", "0 -> empty");
  expect(*post_for(1).next == "short", "1 -> short");
  expect(*post_for(99).next == "short", "99 -> short");
  expect(*post_for(100).next == "medium", "100 -> medium");
  expect(*post_for(999).next == "medium", "999 -> medium");
  expect(*post_for(1000).next == "long", "1000 -> long");
  expect(*post_for(1500).next == "long", "1500 -> long");
}

void test_post_passes_output_through() {
  const auto exec = prep_then_exec("alpha beta gamma alpha");
  const auto post = wordcount::dispatch(make_request("post", exec.output));
  expect(post.success && *post.output == *exec.output, "post output equals its input");
  expect(*post.next == "short", "post routes on total_words");
}

void test_phase_names() {
  for (const auto phase : {wordcount::Phase::prep, wordcount::Phase::exec, wordcount::Phase::post}) {
    const auto parsed = wordcount::phase_from_string(wordcount::to_string(phase));
    expect(parsed.has_value() && *parsed == phase, "phase name round-trips: " + wordcount::to_string(phase));
  }
  expect(!wordcount::phase_from_string("Prep").has_value(), "phase names are case-sensitive");
}

void test_unknown_function() {
  const auto r = wordcount::dispatch(make_request("finalize", text_input("x")));
  expect(!r.success, "unknown function fails");
  expect(r.error_code == wordcount::ErrorCode::unknown_function, "unknown_function code");
  expect(r.error->find("finalize") != std::string::npos, "error names the function");
  expect(!r.next.has_value() && !r.output.has_value(), "no next, no output");
}

// ============================================================================
// C ABI boundary
// ============================================================================

void test_abi_version() {
  expect(wordcount_abi_version() == WORDCOUNT_ABI_VERSION, "ABI version exported");
  expect(wordcount::version::current_manifest().guest_abi == WORDCOUNT_ABI_VERSION, "manifest agrees");
}

void test_abi_call_full_pipeline() {
  const std::string prep_req = R"({"node":"word-count","function":"prep","input":{"text":"The cat sat."}})";
  wordcount::DecodeError err;
  auto prep = wordcount::decode_response(call_abi(prep_req, 4096), &err);
  expect(prep && prep->success, "prep over the ABI");

  jl::Object exec_req;
  exec_req["node"] = "word-count";
  exec_req["function"] = "exec";
  exec_req["input"] = *prep->output;
  auto exec = wordcount::decode_response(call_abi(jl::to_json(exec_req), 4096), &err);
  expect(exec && exec->success, "exec over the ABI");

  jl::Object post_req;
  post_req["node"] = "word-count";
  post_req["function"] = "post";
  post_req["input"] = *exec->output;
  auto post = wordcount::decode_response(call_abi(jl::to_json(post_req), 4096), &err);
  expect(post && post->success && *post->next == "short", "post over the ABI");
  expect(wordcount::AggregationResult::from_value(*post->output)->total_words == 2, "aggregation survives the wire");
}

void test_abi_call_truncation() {
  const std::string req = R"({"node":"n","function":"prep","input":{"text":"some longer text here"}})";
  std::size_t full = 0;
  const std::string complete = call_abi(req, 4096, &full);
  expect(full == complete.size(), "untruncated call returns its length");

  std::vector<std::uint8_t> small(10 + 4, '#');
  const std::size_t n = wordcount_call(reinterpret_cast<const std::uint8_t*>(req.data()), req.size(), small.data(), 10);
  expect(n == full, "truncated call still returns the true size");
  expect(std::memcmp(small.data(), complete.data(), 10) == 0, "truncated prefix matches");
  expect(small[10] == '#', "no write beyond capacity");
  expect(wordcount_call(reinterpret_cast<const std::uint8_t*>(req.data()), req.size(), nullptr, 0) == full,
         "null output queries the size");
}

void test_abi_call_never_fails() {
  wordcount::DecodeError err;
  auto r = wordcount::decode_response(call_abi(std::string("\xFF\xFE", 2), 1024), &err);
  expect(r && !r->success && *r->error == "Invalid UTF-8 input", "invalid UTF-8 yields a failure response");

  r = wordcount::decode_response(call_abi("{\"node\":1}", 1024), &err);
  expect(r && !r->success, "malformed request yields a failure response");

  const std::size_t n = wordcount_call(nullptr, 0, nullptr, 0);
  expect(n > 0, "empty request still produces a response");
}

void test_abi_alloc_dealloc() {
  g_warnings.clear();
  wordcount::set_warning_hook(capture_warning);
  std::uint8_t* p = wordcount_alloc(100);
  std::memset(p, 0, 100);
  wordcount_dealloc(p, 99);
  expect(g_warnings.size() == 1, "mismatched dealloc is refused and logged");
  wordcount_dealloc(p, 100);
  expect(g_warnings.size() == 1, "matching dealloc is silent");
  wordcount_dealloc(nullptr, 0);
  wordcount::set_warning_hook(nullptr);
}

// ============================================================================
// Observability + hashing
// ============================================================================

void test_blake3_known_vector() {
  expect(wordcount::blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(wordcount::invocation_digest("x") != wordcount::descriptor_digest("x"), "domains are separated");
}

void test_invocation_events() {
  g_events.clear();
  wordcount::set_invocation_event_hook(capture_event);

  const std::string req = R"({"node":"word-count","function":"post","input":{"total_words":5}})";
  std::size_t n = 0;
  call_abi(req, 8, &n);
  expect(g_events.size() == 1, "one event per call");
  const auto& ev = g_events[0];
  expect(ev.kind == "invoke" && ev.function == "post" && ev.node == "word-count", "event identifies the call");
  expect(ev.ok && ev.next == "short", "event records outcome and route");
  expect(ev.invocation_id == wordcount::invocation_digest(req), "invocation id is the request digest");
  expect(ev.bytes_in == req.size() && ev.bytes_out == n, "byte counts recorded");
  expect(ev.truncated, "truncation recorded");

  call_abi(R"({"node":"word-count","function":"finalize"})", 4096);
  expect(g_events.size() == 2 && !g_events[1].ok && g_events[1].error_code == "unknown_function",
         "failure event carries the error code");

  wordcount_metadata(nullptr, 0);
  expect(g_events.size() == 3 && g_events[2].kind == "describe", "describe emits an event");
  expect(g_events[2].to_json().find("\"kind\":\"describe\"") != std::string::npos, "event serializes");

  wordcount::set_invocation_event_hook(nullptr);
}

}  // namespace

int main() {
  std::cout << "=== wordcount tests ===\n";

  std::cout << "\n[Arena] Guest-owned buffers\n";
  run_test("allocate + release", test_arena_allocate_release);
  run_test("zero-size allocations unique", test_arena_zero_size_unique);
  run_test("size mismatch refused", test_arena_size_mismatch_refused);
  run_test("foreign address refused", test_arena_foreign_address_refused);
  run_test("OwnedBuffer ownership moves", test_owned_buffer_moves);
  run_test("copy_truncated contract", test_copy_truncated);

  std::cout << "\n[jsonlite] Value model\n";
  run_test("parse + sorted output", test_json_parse_and_sorted_output);
  run_test("strict rejection", test_json_rejects_invalid);
  run_test("unicode escapes", test_json_unicode_escapes);
  run_test("format_double", test_format_double);

  std::cout << "\n[Text] UTF-8 helpers\n";
  run_test("UTF-8 validation", test_utf8_validation);
  run_test("length + lowercase", test_text_length_and_lowercase);
  run_test("character classes", test_character_classes);
  run_test("split on whitespace", test_split_whitespace);

  std::cout << "\n[Codec] Request/Response envelope\n";
  run_test("decode request", test_decode_request);
  run_test("decode request failures", test_decode_request_failures);
  run_test("response round-trip", test_response_round_trip);
  run_test("response shape", test_encode_response_shape);

  std::cout << "\n[Descriptor] Capability document\n";
  run_test("describe idempotent", test_describe_idempotent);
  run_test("describe truncation", test_describe_truncation);
  run_test("descriptor contents", test_descriptor_contents);
  run_test("descriptor example reproduces", test_descriptor_example_reproduces);

  std::cout << "\n[Phases] Dispatcher + handlers\n";
  run_test("scenario: The cat sat.", test_scenario_the_cat_sat);
  run_test("empty after filtering", test_empty_after_filtering);
  run_test("case sensitivity", test_case_sensitivity);
  run_test("tie-break first occurrence", test_tie_break_first_occurrence);
  run_test("exec config", test_exec_config);
  run_test("invalid config falls back", test_exec_invalid_config_falls_back);
  run_test("min_word_length fits machine word", test_min_word_length_must_fit_machine_word);
  run_test("frequency invariants", test_frequency_invariants);
  run_test("prep unicode", test_prep_unicode);
  run_test("exec unicode case folding", test_exec_unicode_case_folding);
  run_test("prep failures", test_prep_failures);
  run_test("exec/post missing input", test_exec_and_post_missing_input);
  run_test("post routing boundaries", test_post_routing);
  run_test("post passes output through", test_post_passes_output_through);
  run_test("phase names", test_phase_names);
  run_test("unknown function", test_unknown_function);

  std::cout << "\n[ABI] Host boundary\n";
  run_test("ABI version", test_abi_version);
  run_test("full pipeline over the ABI", test_abi_call_full_pipeline);
  run_test("call truncation", test_abi_call_truncation);
  run_test("call never fails", test_abi_call_never_fails);
  run_test("alloc/dealloc", test_abi_alloc_dealloc);

  std::cout << "\n[Observability] Events + hashing\n";
  run_test("BLAKE3 known vector", test_blake3_known_vector);
  run_test("invocation events", test_invocation_events);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
