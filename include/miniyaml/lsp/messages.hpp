// miniyaml/lsp/messages.hpp - Requests to and responses from the query system
//
// These are transport-independent: the language server executable translates
// JSON-RPC into Messages and Responses back into JSON-RPC.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "miniyaml/basic/diagnostic.hpp"
#include "miniyaml/basic/line_index.hpp"
#include "miniyaml/basic/span.hpp"
#include "miniyaml/query/ide.hpp"

namespace miniyaml::lsp
{

/// JSON-RPC request id (number or string).
using RequestId = std::variant<std::int64_t, std::string>;

// ============================================================================
// Messages
// ============================================================================

struct Initialize
{
  std::optional<std::filesystem::path> workspace_root;

  /// Unit the client counts columns in; unset keeps the current one.
  std::optional<PositionEncoding> position_encoding;
};

struct FileOpened
{
  std::string uri;
  std::string text;
};

struct FileChanged
{
  std::string uri;
  std::vector<query::TextEdit> edits;
};

struct FileClosed
{
  std::string uri;
};

struct HoverRequest
{
  RequestId id;
  std::string uri;
  Position position;
};

struct DefinitionRequest
{
  RequestId id;
  std::string uri;
  Position position;
};

struct DocumentSymbolsRequest
{
  RequestId id;
  std::string uri;
};

using Message = std::variant<
  Initialize, FileOpened, FileChanged, FileClosed, HoverRequest, DefinitionRequest,
  DocumentSymbolsRequest>;

/// Messages that change server state; everything else is served read-only.
[[nodiscard]] bool is_mutating(const Message & message) noexcept;

/// Method-like name used for logging and work-pool descriptions.
[[nodiscard]] const char * message_name(const Message & message) noexcept;

// ============================================================================
// Responses
// ============================================================================

struct Location
{
  std::string uri;
  PositionRange range;
};

struct ProtocolDiagnostic
{
  PositionRange range;
  Severity severity = Severity::Error;
  std::string code;
  std::string message;
};

struct HoverResponse
{
  RequestId id;
  std::optional<std::string> contents;
};

struct DefinitionResponse
{
  RequestId id;
  std::optional<Location> location;
};

struct DocumentSymbolsResponse
{
  RequestId id;
  std::optional<std::vector<query::Symbol>> symbols;
};

struct PublishDiagnostics
{
  std::string uri;
  std::vector<ProtocolDiagnostic> diagnostics;
};

struct ErrorResponse
{
  RequestId id;
  int code = 0;
  std::string message;
};

// JSON-RPC error codes
inline constexpr int k_invalid_request = -32600;
inline constexpr int k_method_not_found = -32601;
inline constexpr int k_invalid_params = -32602;
inline constexpr int k_internal_error = -32603;

using Response = std::variant<
  HoverResponse, DefinitionResponse, DocumentSymbolsResponse, PublishDiagnostics, ErrorResponse>;

/// Must be safe to call from several threads at once.
using ResponseSink = std::function<void(Response)>;

}  // namespace miniyaml::lsp
