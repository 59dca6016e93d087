#include "miniyaml/lsp/messages.hpp"

namespace miniyaml::lsp
{

bool is_mutating(const Message & message) noexcept
{
  return std::holds_alternative<Initialize>(message) ||
         std::holds_alternative<FileOpened>(message) ||
         std::holds_alternative<FileChanged>(message) ||
         std::holds_alternative<FileClosed>(message);
}

const char * message_name(const Message & message) noexcept
{
  if (std::holds_alternative<Initialize>(message)) return "initialize";
  if (std::holds_alternative<FileOpened>(message)) return "textDocument/didOpen";
  if (std::holds_alternative<FileChanged>(message)) return "textDocument/didChange";
  if (std::holds_alternative<FileClosed>(message)) return "textDocument/didClose";
  if (std::holds_alternative<HoverRequest>(message)) return "textDocument/hover";
  if (std::holds_alternative<DefinitionRequest>(message)) return "textDocument/definition";
  return "textDocument/documentSymbol";
}

}  // namespace miniyaml::lsp
