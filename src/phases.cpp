#include "wordcount/phases.hpp"

#include <limits>
#include <unordered_set>

#include "wordcount/observability.hpp"
#include "wordcount/text.hpp"

namespace wordcount {

namespace {

const jsonlite::Object& empty_object() {
  static const jsonlite::Object kEmpty;
  return kEmpty;
}

const jsonlite::Object& as_object(const jsonlite::Value& v) {
  const auto* o = std::get_if<jsonlite::Object>(&v.v);
  return o ? *o : empty_object();
}

std::string join(const std::vector<std::string>& items) {
  std::string out;
  for (const auto& s : items) {
    if (!out.empty()) out += "; ";
    out += s;
  }
  return out;
}

Response shape_error(const std::string& reason) {
  return Response::fail(ErrorCode::invalid_input_shape, "Failed to parse input: " + reason);
}

}  // namespace

// ---------------------------------------------------------------------------
// Configuration
// ---------------------------------------------------------------------------

ConfigValidationResult validate_config(const jsonlite::Value& config) {
  ConfigValidationResult r;
  const auto* obj = std::get_if<jsonlite::Object>(&config.v);
  if (!obj) {
    r.errors.push_back("config must be a JSON object");
    return r;
  }

  for (const auto& [key, value] : *obj) {
    if (key == "min_word_length") {
      const auto* n = std::get_if<std::uint64_t>(&value.v);
      if (!n) {
        r.errors.push_back("min_word_length must be a non-negative integer");
      } else if (*n > std::numeric_limits<std::size_t>::max()) {
        r.errors.push_back("min_word_length " + std::to_string(*n) + " does not fit in a machine word");
      } else if (*n == 0) {
        r.warnings.push_back("min_word_length 0 behaves like 1");
      }
    } else if (key == "stop_words") {
      const auto* arr = std::get_if<jsonlite::Array>(&value.v);
      if (!arr) {
        r.errors.push_back("stop_words must be an array of strings");
        continue;
      }
      for (const auto& item : *arr) {
        if (!std::holds_alternative<std::string>(item.v)) {
          r.errors.push_back("stop_words must contain only strings");
          break;
        }
      }
    } else {
      r.warnings.push_back("unknown config key: " + key);
    }
  }
  r.ok = r.errors.empty();
  return r;
}

PhaseConfig phase_config_from(const std::optional<jsonlite::Value>& config) {
  PhaseConfig cfg;
  if (!config) return cfg;

  const auto validation = validate_config(*config);
  if (!validation.warnings.empty()) log_warning("config", join(validation.warnings));
  if (!validation.ok) {
    log_warning("config", "invalid config, using defaults: " + join(validation.errors));
    return cfg;
  }

  const auto& obj = as_object(*config);
  cfg.min_word_length = static_cast<std::size_t>(jsonlite::get_u64(obj, "min_word_length", 1));
  if (jsonlite::find(obj, "stop_words")) cfg.stop_words = jsonlite::get_string_array(obj, "stop_words");
  return cfg;
}

// ---------------------------------------------------------------------------
// Algorithms
// ---------------------------------------------------------------------------

std::string clean_text(std::string_view input) {
  std::string out;
  out.reserve(input.size());
  for (char32_t cp : text::decode(input)) {
    if (text::is_alphanumeric(cp) || text::is_whitespace(cp)) {
      text::append(out, cp);
    } else {
      out += ' ';
    }
  }
  return out;
}

AggregationResult aggregate_words(std::string_view cleaned_text, bool case_sensitive, const PhaseConfig& config) {
  const std::unordered_set<std::string> stop_words(config.stop_words.begin(), config.stop_words.end());

  std::vector<std::string> words;
  for (auto& token : text::split_whitespace(cleaned_text)) {
    if (text::length(token) < config.min_word_length) continue;
    std::string word = case_sensitive ? std::move(token) : text::to_lower(token);
    if (stop_words.contains(word)) continue;
    words.push_back(std::move(word));
  }

  AggregationResult r;
  if (words.empty()) return r;

  std::size_t total_length = 0;
  std::size_t longest_len = text::length(words.front());
  std::size_t shortest_len = longest_len;
  const std::string* longest = &words.front();
  const std::string* shortest = &words.front();

  for (const auto& word : words) {
    ++r.word_frequencies[word];
    const std::size_t len = text::length(word);
    total_length += len;
    // Strict comparisons: on a tie the earliest word of that length is kept.
    if (len > longest_len) {
      longest_len = len;
      longest = &word;
    }
    if (len < shortest_len) {
      shortest_len = len;
      shortest = &word;
    }
  }

  r.total_words = static_cast<std::uint64_t>(words.size());
  r.unique_words = static_cast<std::uint64_t>(r.word_frequencies.size());
  r.average_word_length = static_cast<double>(total_length) / static_cast<double>(words.size());
  r.longest_word = *longest;
  r.shortest_word = *shortest;
  return r;
}

std::string route_for(std::uint64_t total_words) {
  if (total_words == 0) return "empty";
  if (total_words < 100) return "short";
  if (total_words < 1000) return "medium";
  return "long";
}

// ---------------------------------------------------------------------------
// Handlers
// ---------------------------------------------------------------------------

Response handle_prep(const Request& request) {
  if (!request.input) return Response::fail(ErrorCode::missing_input, "No input provided");

  const auto* obj = std::get_if<jsonlite::Object>(&request.input->v);
  if (!obj) return shape_error("expected an object with a `text` field");

  const jsonlite::Value* text_value = jsonlite::find(*obj, "text");
  if (!text_value) return shape_error("missing field `text`");
  const auto* raw = std::get_if<std::string>(&text_value->v);
  if (!raw) return shape_error("invalid type for `text`, expected a string");

  bool case_sensitive = false;
  if (const jsonlite::Value* cs = jsonlite::find(*obj, "case_sensitive"); cs && !cs->is_null()) {
    const auto* b = std::get_if<bool>(&cs->v);
    if (!b) return shape_error("invalid type for `case_sensitive`, expected a boolean");
    case_sensitive = *b;
  }

  PrepResult prep;
  prep.original_text = *raw;
  prep.cleaned_text = clean_text(*raw);
  prep.case_sensitive = case_sensitive;
  return Response::ok(prep.to_value());
}

Response handle_exec(const Request& request) {
  if (!request.input) return Response::fail(ErrorCode::missing_prep_data, "No prep data provided");

  const auto& prep = as_object(*request.input);
  const std::string cleaned = jsonlite::get_string(prep, "cleaned_text", "");
  const bool case_sensitive = jsonlite::get_bool(prep, "case_sensitive", false);
  const PhaseConfig config = phase_config_from(request.config);

  return Response::ok(aggregate_words(cleaned, case_sensitive, config).to_value());
}

Response handle_post(const Request& request) {
  if (!request.input) return Response::fail(ErrorCode::missing_exec_result, "No exec result provided");

  const auto total = static_cast<std::uint64_t>(jsonlite::get_u64(as_object(*request.input), "total_words", 0));
  return Response::ok(*request.input, route_for(total));
}

}  // namespace wordcount
