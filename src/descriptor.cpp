#include "wordcount/descriptor.hpp"

#include "wordcount/arena.hpp"
#include "wordcount/types.hpp"
#include "wordcount/version.hpp"

namespace wordcount {

namespace {

using jsonlite::Array;
using jsonlite::Object;
using jsonlite::Value;

Value typed(const char* type, const char* description = nullptr) {
  Object o;
  o["type"] = type;
  if (description) o["description"] = description;
  return o;
}

Array string_array(const std::vector<std::string>& items) {
  Array a;
  for (const auto& s : items) a.emplace_back(s);
  return a;
}

Value config_schema() {
  Object min_len;
  min_len["type"] = "integer";
  min_len["default"] = std::uint64_t{1};
  min_len["minimum"] = std::uint64_t{1};
  min_len["description"] = "Minimum word length to count";

  Object stop_words;
  stop_words["type"] = "array";
  stop_words["items"] = typed("string");
  stop_words["default"] = string_array(PhaseConfig::default_stop_words());
  stop_words["description"] = "Words to exclude from counting";

  Object props;
  props["min_word_length"] = std::move(min_len);
  props["stop_words"] = std::move(stop_words);

  Object o;
  o["type"] = "object";
  o["properties"] = std::move(props);
  return o;
}

Value input_schema() {
  Object text;
  text["type"] = "string";
  text["minLength"] = std::uint64_t{1};
  text["description"] = "Text to analyze";

  Object case_sensitive;
  case_sensitive["type"] = "boolean";
  case_sensitive["default"] = false;
  case_sensitive["description"] = "Whether to treat words case-sensitively";

  Object props;
  props["text"] = std::move(text);
  props["case_sensitive"] = std::move(case_sensitive);

  Object o;
  o["type"] = "object";
  o["properties"] = std::move(props);
  o["required"] = string_array({"text"});
  return o;
}

Value output_schema() {
  Object freq;
  freq["type"] = "object";
  freq["additionalProperties"] = typed("integer");
  freq["description"] = "Word frequency map";

  Object props;
  props["total_words"] = typed("integer", "Total number of words");
  props["unique_words"] = typed("integer", "Number of unique words");
  props["word_frequencies"] = std::move(freq);
  props["average_word_length"] = typed("number", "Average length of words");
  props["longest_word"] = typed("string", "The longest word found");
  props["shortest_word"] = typed("string", "The shortest word found");

  Object o;
  o["type"] = "object";
  o["properties"] = std::move(props);
  o["required"] = string_array({"total_words", "unique_words", "word_frequencies", "average_word_length",
                                "longest_word", "shortest_word"});
  return o;
}

// Worked example; the test suite replays it through all three phases.
Value basic_example() {
  AggregationResult out;
  for (const char* w : {"quick", "brown", "fox", "jumps", "over", "lazy", "dog"}) out.word_frequencies[w] = 1;
  out.total_words = 7;
  out.unique_words = 7;
  out.average_word_length = 29.0 / 7.0;
  out.longest_word = "quick";
  out.shortest_word = "fox";

  Object input;
  input["text"] = "The quick brown fox jumps over the lazy dog";
  input["case_sensitive"] = false;

  Object o;
  o["name"] = "Basic text analysis";
  o["input"] = std::move(input);
  o["output"] = out.to_value();
  return o;
}

Value word_count_node() {
  Object node;
  node["type"] = "word-count";
  node["category"] = "text";
  node["description"] = "Count words and analyze text statistics";
  node["configSchema"] = config_schema();
  node["inputSchema"] = input_schema();
  node["outputSchema"] = output_schema();
  node["examples"] = Array{basic_example()};
  return node;
}

}  // namespace

Value descriptor_document() {
  const ResourceLimits limits;

  Object permissions;
  permissions["memory"] = limits.memory;
  permissions["timeout"] = limits.timeout_ms;

  Object requirements;
  requirements["pocket"] = ">=1.0.0";

  Object doc;
  doc["name"] = "word-counter";
  doc["version"] = version::MODULE_SEMVER;
  doc["description"] = "Word counting and analysis plugin for Pocket";
  doc["author"] = "Pocket Team";
  doc["license"] = "MIT";
  doc["runtime"] = "wasm";
  doc["binary"] = "plugin.wasm";
  doc["nodes"] = Array{word_count_node()};
  doc["permissions"] = std::move(permissions);
  doc["requirements"] = std::move(requirements);
  return doc;
}

std::string descriptor_json() {
  return jsonlite::to_json(descriptor_document());
}

std::size_t describe(std::uint8_t* out, std::size_t capacity) {
  return copy_truncated(descriptor_json(), out, capacity);
}

}  // namespace wordcount
