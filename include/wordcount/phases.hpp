#pragma once

// wordcount/phases.hpp — The three pipeline stages of the word-count node.
//
//   prep: sanitize raw text       {text, case_sensitive?} -> PrepResult
//   exec: aggregate statistics    PrepResult + PhaseConfig -> AggregationResult
//   post: choose a routing label  AggregationResult -> same document + next
//
// Handlers are pure functions of the Request. Failures come back as
// Response{success=false}; nothing here throws on bad input.

#include <string>
#include <string_view>
#include <vector>

#include "wordcount/jsonlite.hpp"
#include "wordcount/types.hpp"

namespace wordcount {

struct ConfigValidationResult {
  bool ok{false};
  std::vector<std::string> errors;    // wrong types / out-of-range values
  std::vector<std::string> warnings;  // unknown keys
};

ConfigValidationResult validate_config(const jsonlite::Value& config);

// Missing fields default individually. An invalid document falls back to
// PhaseConfig{} as a whole, with a logged warning.
PhaseConfig phase_config_from(const std::optional<jsonlite::Value>& config);

// Replace every code point that is neither alphanumeric nor whitespace with
// a single space.
std::string clean_text(std::string_view text);

AggregationResult aggregate_words(std::string_view cleaned_text, bool case_sensitive, const PhaseConfig& config);

// "empty" | "short" | "medium" | "long"
std::string route_for(std::uint64_t total_words);

Response handle_prep(const Request& request);
Response handle_exec(const Request& request);
Response handle_post(const Request& request);

}  // namespace wordcount
