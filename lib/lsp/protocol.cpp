#include "miniyaml/lsp/protocol.hpp"

#include <cstdint>
#include <limits>
#include <string>
#include <utility>

namespace miniyaml::lsp
{

using nlohmann::json;

namespace
{

bool starts_with(std::string_view s, std::string_view prefix)
{
  return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

int hex_to_int(char c)
{
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

std::string url_decode(std::string_view s)
{
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (c == '%' && i + 2 < s.size()) {
      const int hi = hex_to_int(s[i + 1]);
      const int lo = hex_to_int(s[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
        continue;
      }
    }
    out.push_back(c);
  }
  return out;
}

std::optional<uint32_t> u32_member(const json & j, const char * name)
{
  const auto it = j.find(name);
  if (it == j.end() || !it->is_number_integer()) {
    return std::nullopt;
  }
  std::uint64_t value = 0;
  if (it->is_number_unsigned()) {
    value = it->get<std::uint64_t>();
  } else {
    const auto signed_value = it->get<std::int64_t>();
    if (signed_value < 0) {
      return std::nullopt;
    }
    value = static_cast<std::uint64_t>(signed_value);
  }
  if (value > std::numeric_limits<uint32_t>::max()) {
    return std::nullopt;
  }
  return static_cast<uint32_t>(value);
}

json symbol_to_json(const query::Symbol & s, bool top_level)
{
  // LSP SymbolKind: 5 Class for top-level definitions, 7 Property below them
  json out;
  out["name"] = s.name;
  if (s.detail) {
    out["detail"] = *s.detail;
  }
  out["kind"] = top_level ? 5 : 7;
  out["range"] = range_to_json(s.range);
  out["selectionRange"] = range_to_json(s.range);
  if (s.children) {
    json children = json::array();
    for (const auto & c : *s.children) {
      children.push_back(symbol_to_json(c, false));
    }
    out["children"] = std::move(children);
  }
  return out;
}

json result_message(const RequestId & id, json result)
{
  return json{{"jsonrpc", "2.0"}, {"id", request_id_to_json(id)}, {"result", std::move(result)}};
}

}  // namespace

// ============================================================================
// Client -> server
// ============================================================================

std::optional<Position> position_from_json(const json & j)
{
  if (!j.is_object()) {
    return std::nullopt;
  }
  const auto line = u32_member(j, "line");
  const auto character = u32_member(j, "character");
  if (!line || !character) {
    return std::nullopt;
  }
  return Position{*line, *character};
}

std::optional<PositionRange> range_from_json(const json & j)
{
  if (!j.is_object() || !j.contains("start") || !j.contains("end")) {
    return std::nullopt;
  }
  const auto start = position_from_json(j["start"]);
  const auto end = position_from_json(j["end"]);
  if (!start || !end) {
    return std::nullopt;
  }
  return PositionRange{*start, *end};
}

std::optional<std::vector<query::TextEdit>> edits_from_json(const json & changes)
{
  if (!changes.is_array()) {
    return std::nullopt;
  }

  std::vector<query::TextEdit> edits;
  for (const auto & c : changes) {
    if (!c.is_object() || !c.contains("text") || !c["text"].is_string()) {
      return std::nullopt;
    }
    query::TextEdit edit;
    edit.text = c["text"].get<std::string>();
    if (c.contains("range")) {
      edit.range = range_from_json(c["range"]);
      if (!edit.range) {
        return std::nullopt;
      }
    }
    edits.push_back(std::move(edit));
  }
  return edits;
}

std::optional<RequestId> request_id_from_json(const json & id)
{
  if (id.is_number_integer()) {
    return RequestId{id.get<std::int64_t>()};
  }
  if (id.is_string()) {
    return RequestId{id.get<std::string>()};
  }
  return std::nullopt;
}

std::optional<std::filesystem::path> file_uri_to_path(std::string_view uri)
{
  if (!starts_with(uri, "file:")) {
    return std::nullopt;
  }

  std::string_view rest = uri.substr(std::string_view("file:").size());
  if (starts_with(rest, "///")) {
    rest = rest.substr(2);  // keep one leading slash
  } else if (starts_with(rest, "//")) {
    // file://hostname/path
    return std::nullopt;
  }
  return std::filesystem::path(url_decode(rest));
}

std::optional<std::filesystem::path> workspace_root_from(const json & params)
{
  if (!params.is_object()) {
    return std::nullopt;
  }
  if (params.contains("rootUri") && params["rootUri"].is_string()) {
    if (auto p = file_uri_to_path(params["rootUri"].get<std::string>())) {
      return p;
    }
  }
  if (params.contains("rootPath") && params["rootPath"].is_string()) {
    return std::filesystem::path(params["rootPath"].get<std::string>());
  }
  return std::nullopt;
}

PositionEncoding negotiate_position_encoding(const json & params)
{
  const json * offered = nullptr;
  if (params.is_object()) {
    const auto caps = params.find("capabilities");
    if (caps != params.end() && caps->is_object()) {
      const auto general = caps->find("general");
      if (general != caps->end() && general->is_object()) {
        const auto encodings = general->find("positionEncodings");
        if (encodings != general->end() && encodings->is_array()) {
          offered = &*encodings;
        }
      }
    }
  }

  if (offered != nullptr) {
    for (const auto & e : *offered) {
      if (e.is_string() && e.get<std::string>() == "utf-32") {
        return PositionEncoding::Utf32;
      }
    }
  }
  return PositionEncoding::Utf16;
}

const char * position_encoding_name(PositionEncoding encoding) noexcept
{
  switch (encoding) {
    case PositionEncoding::Utf32:
      return "utf-32";
    case PositionEncoding::Utf16:
      return "utf-16";
  }
  return "utf-16";
}

// ============================================================================
// Server -> client
// ============================================================================

json request_id_to_json(const RequestId & id)
{
  if (const auto * n = std::get_if<std::int64_t>(&id)) {
    return *n;
  }
  return std::get<std::string>(id);
}

json position_to_json(const Position & p)
{
  return json{{"line", p.line_idx}, {"character", p.character_idx}};
}

json range_to_json(const PositionRange & r)
{
  return json{{"start", position_to_json(r.start)}, {"end", position_to_json(r.end_exclusive)}};
}

int lsp_severity(Severity s) noexcept
{
  // 1 Error, 2 Warning, 3 Information, 4 Hint
  switch (s) {
    case Severity::Bug:
    case Severity::Error:
      return 1;
    case Severity::Warning:
      return 2;
    case Severity::Note:
      return 3;
    case Severity::Help:
      return 4;
  }
  return 3;
}

json response_to_json(const Response & response)
{
  if (const auto * hover = std::get_if<HoverResponse>(&response)) {
    if (!hover->contents) {
      return result_message(hover->id, nullptr);
    }
    return result_message(
      hover->id, json{{"contents", json{{"kind", "markdown"}, {"value", *hover->contents}}}});
  }

  if (const auto * def = std::get_if<DefinitionResponse>(&response)) {
    if (!def->location) {
      return result_message(def->id, nullptr);
    }
    return result_message(
      def->id, json{{"uri", def->location->uri}, {"range", range_to_json(def->location->range)}});
  }

  if (const auto * symbols = std::get_if<DocumentSymbolsResponse>(&response)) {
    json out = json::array();
    if (symbols->symbols) {
      for (const auto & s : *symbols->symbols) {
        out.push_back(symbol_to_json(s, true));
      }
    }
    return result_message(symbols->id, std::move(out));
  }

  if (const auto * diags = std::get_if<PublishDiagnostics>(&response)) {
    json items = json::array();
    for (const auto & d : diags->diagnostics) {
      json item;
      item["range"] = range_to_json(d.range);
      item["severity"] = lsp_severity(d.severity);
      if (!d.code.empty()) {
        item["code"] = d.code;
      }
      item["source"] = "miniyaml";
      item["message"] = d.message;
      items.push_back(std::move(item));
    }
    return json{
      {"jsonrpc", "2.0"},
      {"method", "textDocument/publishDiagnostics"},
      {"params", json{{"uri", diags->uri}, {"diagnostics", std::move(items)}}}};
  }

  const auto & err = std::get<ErrorResponse>(response);
  return json{
    {"jsonrpc", "2.0"},
    {"id", request_id_to_json(err.id)},
    {"error", json{{"code", err.code}, {"message", err.message}}}};
}

}  // namespace miniyaml::lsp
