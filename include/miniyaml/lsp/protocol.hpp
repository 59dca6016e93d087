// miniyaml/lsp/protocol.hpp - JSON-RPC <-> Message / Response conversion
//
// Parsing helpers return an empty optional for anything that does not have the
// expected shape; they never throw on malformed client input.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "miniyaml/basic/diagnostic.hpp"
#include "miniyaml/basic/line_index.hpp"
#include "miniyaml/basic/span.hpp"
#include "miniyaml/lsp/messages.hpp"

namespace miniyaml::lsp
{

// ============================================================================
// Client -> server
// ============================================================================

/// `{"line": n, "character": n}` with unsigned 32-bit values.
[[nodiscard]] std::optional<Position> position_from_json(const nlohmann::json & j);

/// `{"start": Position, "end": Position}`.
[[nodiscard]] std::optional<PositionRange> range_from_json(const nlohmann::json & j);

/**
 * `contentChanges` of a didChange notification.
 *
 * A change without `range` replaces the whole document. The whole list is
 * rejected when any change carries a malformed `range` or lacks `text`.
 */
[[nodiscard]] std::optional<std::vector<query::TextEdit>> edits_from_json(
  const nlohmann::json & changes);

[[nodiscard]] std::optional<RequestId> request_id_from_json(const nlohmann::json & id);

/// `file:///a/b%20c` -> `/a/b c`. Remote authorities are not supported.
[[nodiscard]] std::optional<std::filesystem::path> file_uri_to_path(std::string_view uri);

/// `rootUri`, falling back to `rootPath`, of initialize params.
[[nodiscard]] std::optional<std::filesystem::path> workspace_root_from(
  const nlohmann::json & params);

/**
 * Encoding to use given initialize params.
 *
 * UTF-32 when the client lists it in `capabilities.general.positionEncodings`,
 * otherwise UTF-16, which every client must support.
 */
[[nodiscard]] PositionEncoding negotiate_position_encoding(const nlohmann::json & params);

[[nodiscard]] const char * position_encoding_name(PositionEncoding encoding) noexcept;

// ============================================================================
// Server -> client
// ============================================================================

[[nodiscard]] nlohmann::json request_id_to_json(const RequestId & id);
[[nodiscard]] nlohmann::json position_to_json(const Position & p);
[[nodiscard]] nlohmann::json range_to_json(const PositionRange & r);

/// LSP DiagnosticSeverity.
[[nodiscard]] int lsp_severity(Severity s) noexcept;

/// Complete JSON-RPC response or notification for `response`.
[[nodiscard]] nlohmann::json response_to_json(const Response & response);

}  // namespace miniyaml::lsp
