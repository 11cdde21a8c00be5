#include "wordcount/observability.hpp"

#include <atomic>
#include <cstdio>
#include <cstdlib>

#include "wordcount/jsonlite.hpp"

namespace wordcount {

namespace {

std::atomic<InvocationEventHook> g_event_hook{nullptr};
std::atomic<WarningHook> g_warning_hook{nullptr};

// Append one line to the JSONL sink. O_APPEND keeps concurrent writers from
// interleaving lines shorter than PIPE_BUF.
void append_line(const std::string& line) {
  const std::string path = event_log_path();
  if (path.empty()) return;
  if (FILE* f = std::fopen(path.c_str(), "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

}  // namespace

std::string InvocationEvent::to_json() const {
  std::string line;
  line.reserve(256);
  line += "{\"type\":\"invocation\",\"invocation_id\":\"";
  line += invocation_id;
  line += "\",\"kind\":\"";
  line += kind;
  line += "\",\"node\":\"";
  line += jsonlite::escape(node);
  line += "\",\"function\":\"";
  line += jsonlite::escape(function);
  line += "\",\"ok\":";
  line += ok ? "true" : "false";
  line += ",\"error_code\":\"";
  line += error_code;
  line += "\",\"next\":\"";
  line += next;
  line += "\",\"duration_ns\":";
  line += std::to_string(duration_ns);
  line += ",\"bytes_in\":";
  line += std::to_string(bytes_in);
  line += ",\"bytes_out\":";
  line += std::to_string(bytes_out);
  line += ",\"truncated\":";
  line += truncated ? "true" : "false";
  line += '}';
  return line;
}

std::string event_log_path() {
  const char* p = std::getenv("WORDCOUNT_EVENT_LOG");
  return (p && p[0]) ? std::string(p) : std::string();
}

void set_invocation_event_hook(InvocationEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void set_warning_hook(WarningHook hook) {
  g_warning_hook.store(hook, std::memory_order_release);
}

void emit_invocation_event(const InvocationEvent& ev) {
  if (InvocationEventHook hook = g_event_hook.load(std::memory_order_acquire)) {
    hook(ev);
    return;
  }
  append_line(ev.to_json() + "\n");
}

void log_warning(std::string_view component, std::string_view message) {
  if (WarningHook hook = g_warning_hook.load(std::memory_order_acquire)) {
    hook(component, message);
    return;
  }
  std::string line = "{\"type\":\"warning\",\"component\":\"";
  line += jsonlite::escape(component);
  line += "\",\"message\":\"";
  line += jsonlite::escape(message);
  line += "\"}\n";
  append_line(line);
}

}  // namespace wordcount
