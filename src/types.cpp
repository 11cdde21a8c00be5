#include "wordcount/types.hpp"

namespace wordcount {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::invalid_encoding: return "invalid_encoding";
    case ErrorCode::malformed_request: return "malformed_request";
    case ErrorCode::unknown_function: return "unknown_function";
    case ErrorCode::missing_input: return "missing_input";
    case ErrorCode::missing_prep_data: return "missing_prep_data";
    case ErrorCode::missing_exec_result: return "missing_exec_result";
    case ErrorCode::invalid_input_shape: return "invalid_input_shape";
    case ErrorCode::internal_error: return "internal_error";
  }
  return "";
}

std::optional<Phase> phase_from_string(std::string_view name) {
  if (name == "prep") return Phase::prep;
  if (name == "exec") return Phase::exec;
  if (name == "post") return Phase::post;
  return std::nullopt;
}

std::string to_string(Phase phase) {
  switch (phase) {
    case Phase::prep: return "prep";
    case Phase::exec: return "exec";
    case Phase::post: return "post";
  }
  return "";
}

Response Response::ok(jsonlite::Value output, std::optional<std::string> next) {
  Response r;
  r.success = true;
  r.output = std::move(output);
  r.next = std::move(next);
  return r;
}

Response Response::fail(ErrorCode code, std::string message) {
  Response r;
  r.success = false;
  r.error = std::move(message);
  r.error_code = code;
  return r;
}

std::vector<std::string> PhaseConfig::default_stop_words() {
  return {"a",   "an",   "and", "are",  "as",   "at", "be",  "by",
          "for", "from", "has", "he",   "in",   "is", "it",  "its",
          "of",  "on",   "that", "the", "to",   "was", "will", "with"};
}

jsonlite::Value PrepResult::to_value() const {
  jsonlite::Object o;
  o["original_text"] = original_text;
  o["cleaned_text"] = cleaned_text;
  o["case_sensitive"] = case_sensitive;
  return o;
}

jsonlite::Value AggregationResult::to_value() const {
  jsonlite::Object freq;
  for (const auto& [word, count] : word_frequencies) freq[word] = count;

  jsonlite::Object o;
  o["total_words"] = total_words;
  o["unique_words"] = unique_words;
  o["word_frequencies"] = std::move(freq);
  o["average_word_length"] = average_word_length;
  o["longest_word"] = longest_word;
  o["shortest_word"] = shortest_word;
  return o;
}

std::optional<AggregationResult> AggregationResult::from_value(const jsonlite::Value& v) {
  const auto* o = std::get_if<jsonlite::Object>(&v.v);
  if (!o) return std::nullopt;

  const auto* total = jsonlite::find(*o, "total_words");
  const auto* unique = jsonlite::find(*o, "unique_words");
  const auto* freq = jsonlite::find(*o, "word_frequencies");
  const auto* avg = jsonlite::find(*o, "average_word_length");
  if (!total || !std::holds_alternative<std::uint64_t>(total->v)) return std::nullopt;
  if (!unique || !std::holds_alternative<std::uint64_t>(unique->v)) return std::nullopt;
  if (!freq || !freq->is_object()) return std::nullopt;
  if (!avg || !(std::holds_alternative<double>(avg->v) || std::holds_alternative<std::uint64_t>(avg->v))) {
    return std::nullopt;
  }

  AggregationResult r;
  r.total_words = std::get<std::uint64_t>(total->v);
  r.unique_words = std::get<std::uint64_t>(unique->v);
  for (const auto& [word, count] : std::get<jsonlite::Object>(freq->v)) {
    if (!std::holds_alternative<std::uint64_t>(count.v)) return std::nullopt;
    r.word_frequencies[word] = std::get<std::uint64_t>(count.v);
  }
  r.average_word_length = jsonlite::get_double(*o, "average_word_length", 0.0);
  r.longest_word = jsonlite::get_string(*o, "longest_word");
  r.shortest_word = jsonlite::get_string(*o, "shortest_word");
  return r;
}

}  // namespace wordcount
