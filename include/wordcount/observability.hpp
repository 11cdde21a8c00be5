#pragma once

// wordcount/observability.hpp — Structured invocation events and warnings.
//
// DESIGN:
//   InvocationEvent is the canonical observable unit. Every boundary call
//   (describe, invoke) emits exactly one event, which is:
//     - passed to the registered hook, if any (embedders, tests);
//     - otherwise appended as one JSONL line to $WORDCOUNT_EVENT_LOG, if set;
//     - otherwise dropped.
//   Warnings (arena refusals, config fallbacks) travel the same route as
//   {"type":"warning",...} lines.
//
// Invariant: emission must never fail or alter the call it describes. Sink
// errors are swallowed after the fact; nothing here throws.
//
// The module keeps no counters between calls. Aggregation is the host's (or
// the log consumer's) job.

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace wordcount {

struct InvocationEvent {
  std::string invocation_id;    // blake3 "req:" digest of the raw request bytes
  std::string kind;             // "invoke" | "describe"
  std::string node;
  std::string function;
  bool ok{false};
  std::string error_code;
  std::string next;

  uint64_t duration_ns{0};
  size_t bytes_in{0};
  size_t bytes_out{0};          // true encoded size, even when truncated
  bool truncated{false};        // bytes_out exceeded the caller's capacity

  std::string to_json() const;
};

void emit_invocation_event(const InvocationEvent& ev);
void log_warning(std::string_view component, std::string_view message);

using InvocationEventHook = void (*)(const InvocationEvent&);
using WarningHook = void (*)(std::string_view component, std::string_view message);

// Passing nullptr restores the default (environment-configured) sink.
void set_invocation_event_hook(InvocationEventHook hook);
void set_warning_hook(WarningHook hook);

// Reads WORDCOUNT_EVENT_LOG. Empty when unset.
std::string event_log_path();

// ---------------------------------------------------------------------------
// ScopeTimer — RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  uint64_t& out_ns;
  explicit ScopeTimer(uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    out_ns = static_cast<uint64_t>(
        std::chrono::duration_cast<NS>(Clock::now() - start).count());
  }
};

}  // namespace wordcount
