// MiniYaml language server (stdio JSON-RPC)
//
// Thin transport around miniyaml::lsp::QuerySystem: reads Content-Length framed
// JSON-RPC from stdin, posts Messages to the query system actor, and writes the
// actor's Responses back to stdout. Logging goes to stderr only.
//
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <miniyaml/lsp/messages.hpp>
#include <miniyaml/lsp/protocol.hpp>
#include <miniyaml/lsp/query_system.hpp>
#include <miniyaml/project/server_config.hpp>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

using nlohmann::json;

namespace
{

namespace lsp = miniyaml::lsp;

bool starts_with(std::string_view s, std::string_view prefix)
{
  return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

// ============================================================================
// Framing
// ============================================================================

std::mutex g_stdout_mutex;

void write_message(const json & msg)
{
  const std::string body = msg.dump();
  std::lock_guard<std::mutex> lock(g_stdout_mutex);
  std::cout << "Content-Length: " << body.size() << "\r\n\r\n";
  std::cout << body;
  std::cout.flush();
}

std::optional<json> read_message()
{
  std::string line;
  size_t content_length = 0;
  bool saw_length = false;

  while (std::getline(std::cin, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }

    if (line.empty()) {
      break;
    }

    const std::string_view sv(line);
    if (starts_with(sv, "Content-Length:")) {
      const std::string_view rest = sv.substr(std::string_view("Content-Length:").size());
      content_length = static_cast<size_t>(std::strtoul(std::string(rest).c_str(), nullptr, 10));
      saw_length = true;
    }
  }

  if (!saw_length || content_length == 0) {
    return std::nullopt;
  }

  std::string body(content_length, '\0');
  std::cin.read(body.data(), static_cast<std::streamsize>(content_length));
  if (std::cin.gcount() != static_cast<std::streamsize>(content_length)) {
    return std::nullopt;
  }

  try {
    return json::parse(body);
  } catch (const json::parse_error & e) {
    spdlog::warn("ignoring malformed message: {}", e.what());
    return std::nullopt;
  }
}

void respond(const json & id, const json & result)
{
  json resp;
  resp["jsonrpc"] = "2.0";
  resp["id"] = id;
  resp["result"] = result;
  write_message(resp);
}

void respond_error(const json & id, int code, std::string message)
{
  json resp;
  resp["jsonrpc"] = "2.0";
  resp["id"] = id;
  resp["error"] = json{{"code", code}, {"message", std::move(message)}};
  write_message(resp);
}

void write_response(lsp::Response response) { write_message(lsp::response_to_json(response)); }

void setup_logging(bool & level_from_env)
{
  auto logger = spdlog::stderr_color_mt("miniyaml");
  spdlog::set_default_logger(logger);
  spdlog::set_level(spdlog::level::warn);

  level_from_env = false;
  if (const char * env = std::getenv("MINIYAML_LOG")) {
    if (const auto level = miniyaml::parse_log_level(env)) {
      spdlog::set_level(*level);
      level_from_env = true;
    } else {
      spdlog::warn("ignoring unknown MINIYAML_LOG level '{}'", env);
    }
  }
}

/// Handle one client message. Returns false on `exit`.
bool dispatch(lsp::QuerySystem & system, const json & msg)
{
  const std::string method = msg.value("method", "");
  const bool is_request = msg.contains("id");
  const json params = msg.value("params", json::object());

  if (method == "initialize" && is_request) {
    const auto encoding = lsp::negotiate_position_encoding(params);
    system.post(lsp::Initialize{lsp::workspace_root_from(params), encoding});

    json caps;
    caps["positionEncoding"] = lsp::position_encoding_name(encoding);
    caps["textDocumentSync"] = json{{"openClose", true}, {"change", 2}};  // Incremental
    caps["hoverProvider"] = true;
    caps["definitionProvider"] = true;
    caps["documentSymbolProvider"] = true;

    respond(msg["id"], json{{"capabilities", caps}, {"serverInfo", {{"name", "miniyaml"}}}});
    return true;
  }

  if (method == "initialized") {
    return true;
  }

  if (method == "shutdown" && is_request) {
    respond(msg["id"], json());
    return true;
  }

  if (method == "exit") {
    return false;
  }

  if (method == "textDocument/didOpen") {
    const auto td = params.value("textDocument", json::object());
    const std::string uri = td.value("uri", "");
    if (!uri.empty()) {
      system.post(lsp::FileOpened{uri, td.value("text", "")});
    }
    return true;
  }

  if (method == "textDocument/didChange") {
    const auto td = params.value("textDocument", json::object());
    const std::string uri = td.value("uri", "");
    if (uri.empty()) {
      return true;
    }
    auto edits = lsp::edits_from_json(params.value("contentChanges", json::array()));
    if (!edits) {
      spdlog::warn("ignoring didChange for {}: malformed contentChanges", uri);
      return true;
    }
    system.post(lsp::FileChanged{uri, std::move(*edits)});
    return true;
  }

  if (method == "textDocument/didClose") {
    const auto td = params.value("textDocument", json::object());
    const std::string uri = td.value("uri", "");
    if (!uri.empty()) {
      system.post(lsp::FileClosed{uri});
    }
    return true;
  }

  if (
    is_request && (method == "textDocument/hover" || method == "textDocument/definition" ||
                   method == "textDocument/documentSymbol")) {
    const auto id = lsp::request_id_from_json(msg["id"]);
    if (!id) {
      respond_error(msg["id"], lsp::k_invalid_request, "Invalid request id");
      return true;
    }
    const std::string uri = params.value("textDocument", json::object()).value("uri", "");

    if (method == "textDocument/documentSymbol") {
      system.post(lsp::DocumentSymbolsRequest{*id, uri});
      return true;
    }

    const auto pos = lsp::position_from_json(params.value("position", json::object()));
    if (!pos) {
      respond_error(msg["id"], lsp::k_invalid_params, "Missing or invalid position");
      return true;
    }
    if (method == "textDocument/hover") {
      system.post(lsp::HoverRequest{*id, uri, *pos});
    } else {
      system.post(lsp::DefinitionRequest{*id, uri, *pos});
    }
    return true;
  }

  if (is_request) {
    respond_error(msg["id"], lsp::k_method_not_found, "Method not found");
  }
  return true;
}

}  // namespace

int main()
{
  try {
    bool level_from_env = false;
    setup_logging(level_from_env);

    lsp::QuerySystemOptions options;
    options.apply_config_log_level = !level_from_env;
    lsp::QuerySystem system(write_response, options);
    system.start();

    bool running = true;
    while (running) {
      const auto msg_opt = read_message();
      if (!msg_opt) {
        if (!std::cin.good()) {
          break;
        }
        continue;
      }

      const json & msg = *msg_opt;
      try {
        running = dispatch(system, msg);
      } catch (const json::exception & e) {
        // Wrongly typed fields; the server keeps going.
        spdlog::warn("ignoring malformed message: {}", e.what());
        if (msg.is_object() && msg.contains("id")) {
          respond_error(msg["id"], lsp::k_invalid_params, "Invalid params");
        }
      }
    }

    system.stop();
    return 0;
  } catch (const std::exception & e) {
    spdlog::critical("miniyaml_lsp_server: fatal error: {}", e.what());
    return 1;
  }
}
