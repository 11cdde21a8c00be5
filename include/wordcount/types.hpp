#pragma once

// wordcount/types.hpp — Core data structures for the word-counter guest module.
//
// MEMORY OWNERSHIP:
//   - Request/Response are value types, constructed fresh per boundary call and
//     discarded when the call returns. Nothing here outlives a call.
//   - Open payloads (config, input, output) are jsonlite::Value trees. Each
//     phase handler validates only the sub-fields it reads.
//
// STATELESSNESS:
//   - The three phases run prep -> exec -> post per node instance, each input
//     being the previous output. Continuity is the host's job; no type here
//     carries state from one call to the next.

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "wordcount/jsonlite.hpp"

namespace wordcount {

enum class ErrorCode {
  none,
  invalid_encoding,
  malformed_request,
  unknown_function,
  missing_input,
  missing_prep_data,
  missing_exec_result,
  invalid_input_shape,
  internal_error,
};

std::string to_string(ErrorCode code);

// Closed set of pipeline phases. Function names outside this set are
// rejected by the dispatcher before any handler runs.
enum class Phase { prep, exec, post };

std::optional<Phase> phase_from_string(std::string_view name);
std::string to_string(Phase phase);

struct Request {
  std::string node;
  std::string function;
  std::optional<jsonlite::Value> config;
  std::optional<jsonlite::Value> input;
};

struct Response {
  bool success{false};
  std::optional<jsonlite::Value> output;
  std::optional<std::string> error;
  std::optional<std::string> next;
  // Not serialized. Lets the boundary layer report the failure category.
  ErrorCode error_code{ErrorCode::none};

  static Response ok(jsonlite::Value output, std::optional<std::string> next = std::nullopt);
  static Response fail(ErrorCode code, std::string message);

  // Compares the serialized fields only.
  bool operator==(const Response& other) const {
    return success == other.success && output == other.output &&
           error == other.error && next == other.next;
  }
};

// Word-count algorithm parameters. Immutable for the duration of one exec call.
struct PhaseConfig {
  std::size_t min_word_length{1};
  std::vector<std::string> stop_words{default_stop_words()};

  static std::vector<std::string> default_stop_words();
};

struct PrepResult {
  std::string original_text;
  std::string cleaned_text;
  bool case_sensitive{false};

  jsonlite::Value to_value() const;
};

struct AggregationResult {
  std::uint64_t total_words{0};
  std::uint64_t unique_words{0};
  std::map<std::string, std::uint64_t> word_frequencies;
  double average_word_length{0.0};
  std::string longest_word;
  std::string shortest_word;

  jsonlite::Value to_value() const;
  static std::optional<AggregationResult> from_value(const jsonlite::Value& v);
};

}  // namespace wordcount
