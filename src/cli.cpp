// wordcount — native developer harness for the guest module.
//
// Plays the host's role: allocates guest buffers, calls the exported ABI and
// retries on truncation, exactly as the pipeline engine does through wasm.
//
//   wordcount describe
//   wordcount version
//   wordcount call [--request FILE]          (request JSON on stdin by default)
//   wordcount run --text TEXT [--case-sensitive] [--config FILE] [--node NAME]
//
// Exit codes: 0 success, 1 success=false response, 2 usage / IO error.

#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>

#include "wordcount/arena.hpp"
#include "wordcount/c_api.h"
#include "wordcount/codec.hpp"
#include "wordcount/jsonlite.hpp"
#include "wordcount/types.hpp"
#include "wordcount/version.hpp"

namespace {

constexpr std::size_t kInitialCapacity = 4096;

std::optional<std::string> read_file(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return std::nullopt;
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

std::string read_stdin() {
  return std::string((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
}

// Runs one guest call with host-style buffer management.
template <typename Call>
std::string call_with_retry(Call&& call) {
  wordcount::OwnedBuffer out(kInitialCapacity);
  std::size_t need = call(out.data(), out.size());
  if (need > out.size()) {
    out = wordcount::OwnedBuffer(need);
    need = call(out.data(), out.size());
  }
  return std::string(reinterpret_cast<const char*>(out.data()), need);
}

std::string call_guest(const std::string& request) {
  wordcount::OwnedBuffer in(request.size());
  if (!request.empty()) std::memcpy(in.data(), request.data(), request.size());
  return call_with_retry([&](std::uint8_t* out, std::size_t cap) {
    return wordcount_call(in.data(), in.size(), out, cap);
  });
}

int exit_code_for(const std::string& response_json) {
  wordcount::DecodeError err;
  const auto r = wordcount::decode_response(response_json, &err);
  if (!r) {
    std::cerr << "undecodable response: " << err.message << "\n";
    return 2;
  }
  return r->success ? 0 : 1;
}

std::string build_request(const std::string& node, const std::string& function,
                          const std::optional<wordcount::jsonlite::Value>& config,
                          const wordcount::jsonlite::Value& input) {
  wordcount::jsonlite::Object req;
  req["node"] = node;
  req["function"] = function;
  if (config) req["config"] = *config;
  req["input"] = input;
  return wordcount::jsonlite::to_json(req);
}

// prep -> exec -> post, threading each output into the next input.
int run_pipeline(const std::string& node, const std::string& text, bool case_sensitive,
                 const std::optional<wordcount::jsonlite::Value>& config) {
  wordcount::jsonlite::Object input;
  input["text"] = text;
  input["case_sensitive"] = case_sensitive;
  wordcount::jsonlite::Value payload = input;

  std::string response;
  for (const wordcount::Phase phase : {wordcount::Phase::prep, wordcount::Phase::exec, wordcount::Phase::post}) {
    const std::string function = wordcount::to_string(phase);
    response = call_guest(build_request(node, function, config, payload));
    wordcount::DecodeError err;
    const auto decoded = wordcount::decode_response(response, &err);
    if (!decoded) {
      std::cerr << "undecodable " << function << " response: " << err.message << "\n";
      return 2;
    }
    if (!decoded->success) {
      std::cout << response << "\n";
      return 1;
    }
    payload = decoded->output.value_or(wordcount::jsonlite::Value{});
  }
  std::cout << response << "\n";
  return 0;
}

int usage() {
  std::cerr << "usage: wordcount <describe|version|call|run> [options]\n"
               "  call [--request FILE]\n"
               "  run --text TEXT [--case-sensitive] [--config FILE] [--node NAME]\n";
  return 2;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2) return usage();
  const std::string cmd = argv[1];

  if (cmd == "version") {
    std::cout << wordcount::version::manifest_to_json(wordcount::version::current_manifest()) << "\n";
    return 0;
  }

  if (cmd == "describe") {
    std::cout << call_with_retry([](std::uint8_t* out, std::size_t cap) { return wordcount_metadata(out, cap); })
              << "\n";
    return 0;
  }

  if (cmd == "call") {
    std::string request_path;
    for (int i = 2; i < argc; ++i) {
      if (std::string(argv[i]) == "--request" && i + 1 < argc) request_path = argv[++i];
    }
    std::string request;
    if (request_path.empty()) {
      request = read_stdin();
    } else {
      auto contents = read_file(request_path);
      if (!contents) {
        std::cerr << "cannot read " << request_path << "\n";
        return 2;
      }
      request = std::move(*contents);
    }
    const std::string response = call_guest(request);
    std::cout << response << "\n";
    return exit_code_for(response);
  }

  if (cmd == "run") {
    std::optional<std::string> text;
    std::string node = "word-count";
    std::string config_path;
    bool case_sensitive = false;
    for (int i = 2; i < argc; ++i) {
      const std::string arg = argv[i];
      if (arg == "--text" && i + 1 < argc) text = argv[++i];
      else if (arg == "--config" && i + 1 < argc) config_path = argv[++i];
      else if (arg == "--node" && i + 1 < argc) node = argv[++i];
      else if (arg == "--case-sensitive") case_sensitive = true;
      else return usage();
    }
    if (!text) return usage();

    std::optional<wordcount::jsonlite::Value> config;
    if (!config_path.empty()) {
      auto contents = read_file(config_path);
      if (!contents) {
        std::cerr << "cannot read " << config_path << "\n";
        return 2;
      }
      std::optional<wordcount::jsonlite::JsonError> err;
      config = wordcount::jsonlite::parse_value(*contents, &err);
      if (err) {
        std::cerr << "invalid config: " << err->message << "\n";
        return 2;
      }
    }
    return run_pipeline(node, *text, case_sensitive, config);
  }

  return usage();
}
