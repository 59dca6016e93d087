// myc - MiniYaml command line interface
//
// Usage:
//   myc parse <files...>
//   myc check <files...>
//   myc find-definition <name> <files...>
//   myc hover <file> <line> <character> [--type-data path]
//
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "miniyaml/basic/diagnostic_printer.hpp"
#include "miniyaml/basic/source_file.hpp"
#include "miniyaml/project/server_config.hpp"
#include "miniyaml/query/database.hpp"
#include "miniyaml/query/type_data.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "MiniYaml tool v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  parse <files...>                    List top-level definitions\n"
            << "  check <files...>                    Report diagnostics\n"
            << "  find-definition <name> <files...>   Locate a top-level definition\n"
            << "  hover <file> <line> <character>     Show trait documentation (1-based)\n\n"
            << "Options:\n"
            << "  --type-data <path>       Type data JSON (default: from miniyaml.yaml)\n"
            << "  --no-color               Disable colored diagnostics\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::vector<std::string> positional;
  std::string type_data_path;
  bool no_color = false;
  bool verbose = false;
  bool show_help = false;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--type-data") {
      if (i + 1 < argc) {
        args.type_data_path = argv[++i];
      }
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else {
      args.positional.push_back(std::move(arg));
    }
  }

  return args;
}

// ============================================================================
// Loading
// ============================================================================

std::optional<std::string> read_file(const fs::path & path)
{
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return std::nullopt;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

struct LoadedFile
{
  miniyaml::FileId id;
  miniyaml::SourceFile source;
};

// Adds every file to the database. Reports unreadable files and returns false.
bool load_files(
  miniyaml::query::Database & db, const std::vector<std::string> & paths,
  std::vector<LoadedFile> & out)
{
  bool ok = true;
  for (const auto & p : paths) {
    const fs::path path = fs::absolute(p);
    auto text = read_file(path);
    if (!text) {
      std::cerr << "error: failed to open file: " << path.string() << "\n";
      ok = false;
      continue;
    }
    spdlog::debug("loaded {} ({} bytes)", path.string(), text->size());
    const miniyaml::FileId id = db.add_file(path.string(), *text);
    out.push_back(LoadedFile{id, miniyaml::SourceFile(path, std::move(*text))});
  }
  return ok;
}

std::string location_of(const miniyaml::SourceFile & source, miniyaml::ByteIndex index)
{
  std::ostringstream os;
  os << source.display_name();
  if (const auto pos = source.position(index)) {
    os << ":" << (pos->line_idx + 1) << ":" << (pos->character_idx + 1);
  }
  return os.str();
}

// ============================================================================
// Commands
// ============================================================================

int cmd_parse(const CommandArgs & args)
{
  if (args.positional.empty()) {
    std::cerr << "error: at least one file required\n";
    std::cerr << "usage: myc parse <files...>\n";
    return 1;
  }

  miniyaml::query::Database db;
  std::vector<LoadedFile> files;
  const bool all_loaded = load_files(db, args.positional, files);

  for (const auto & file : files) {
    const auto nodes = db.all_top_level_nodes(file.id);
    if (!nodes) {
      continue;
    }
    for (const auto & node : *nodes) {
      const auto key = node.key_text(file.source.text());
      const auto span = node.key_span();
      if (!key || !span) {
        continue;
      }
      std::cout << location_of(file.source, span->start()) << ": " << *key << "\n";
    }
  }

  return all_loaded ? 0 : 1;
}

int cmd_check(const CommandArgs & args)
{
  if (args.positional.empty()) {
    std::cerr << "error: at least one file required\n";
    std::cerr << "usage: myc check <files...>\n";
    return 1;
  }

  miniyaml::query::Database db;
  std::vector<LoadedFile> files;
  const bool all_loaded = load_files(db, args.positional, files);

  const bool use_color = !args.no_color && isatty(fileno(stderr)) != 0;
  miniyaml::DiagnosticPrinter printer(std::cerr, use_color);

  bool has_errors = false;
  for (const auto & file : files) {
    const auto diags = db.file_diagnostics(file.id);
    if (!diags || diags->empty()) {
      std::cout << file.source.display_name() << ": OK\n";
      continue;
    }
    printer.print_all(*diags, file.source);
    for (const auto & d : *diags) {
      has_errors = has_errors || d.is_error();
    }
  }

  return (all_loaded && !has_errors) ? 0 : 1;
}

int cmd_find_definition(const CommandArgs & args)
{
  if (args.positional.size() < 2) {
    std::cerr << "error: a name and at least one file required\n";
    std::cerr << "usage: myc find-definition <name> <files...>\n";
    return 1;
  }

  const std::string & name = args.positional.front();
  const std::vector<std::string> paths(args.positional.begin() + 1, args.positional.end());

  miniyaml::query::Database db;
  std::vector<LoadedFile> files;
  if (!load_files(db, paths, files)) {
    return 1;
  }

  for (const auto & file : files) {
    const auto node = db.top_level_node_by_key(file.id, name);
    if (!node) {
      continue;
    }
    const auto span = node->key_span();
    if (!span) {
      continue;
    }
    std::cout << location_of(file.source, span->start()) << ": " << name << "\n";
    return 0;
  }

  std::cerr << "error: no top-level definition named '" << name << "'\n";
  return 1;
}

int cmd_hover(const CommandArgs & args)
{
  if (args.positional.size() != 3) {
    std::cerr << "error: file, line and character required\n";
    std::cerr << "usage: myc hover <file> <line> <character> [--type-data path]\n";
    return 1;
  }

  char * end = nullptr;
  const long line = std::strtol(args.positional[1].c_str(), &end, 10);
  const bool line_ok = end && *end == '\0' && line >= 1;
  const long character = std::strtol(args.positional[2].c_str(), &end, 10);
  const bool character_ok = end && *end == '\0' && character >= 1;
  if (!line_ok || !character_ok) {
    std::cerr << "error: line and character must be positive integers\n";
    return 1;
  }

  miniyaml::query::Database db;
  std::vector<LoadedFile> files;
  if (!load_files(db, {args.positional[0]}, files)) {
    return 1;
  }

  fs::path type_data_path;
  if (!args.type_data_path.empty()) {
    type_data_path = fs::absolute(args.type_data_path);
  } else {
    const auto config = miniyaml::resolve_server_config(files.front().source.path().parent_path());
    if (!config.success) {
      std::cerr << "error: " << config.error << "\n";
      return 1;
    }
    type_data_path = config.config.type_data_path();
  }

  auto type_data = miniyaml::query::load_type_data(type_data_path);
  if (!type_data.success) {
    std::cerr << "error: " << type_data.error << "\n";
    return 1;
  }
  spdlog::debug("loaded {} trait(s) from {}", type_data.data->size(), type_data_path.string());
  db.set_type_data(std::move(type_data.data));

  const miniyaml::Position position(
    static_cast<uint32_t>(line - 1), static_cast<uint32_t>(character - 1));
  const auto hover = db.hover_at(files.front().id, position);
  if (!hover) {
    std::cerr << "no documentation at " << line << ":" << character << "\n";
    return 1;
  }

  std::cout << *hover << "\n";
  return 0;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  spdlog::set_default_logger(spdlog::stderr_color_mt("myc"));
  spdlog::set_level(args.verbose ? spdlog::level::debug : spdlog::level::warn);

  try {
    if (args.command == "parse") {
      return cmd_parse(args);
    }

    if (args.command == "check") {
      return cmd_check(args);
    }

    if (args.command == "find-definition") {
      return cmd_find_definition(args);
    }

    if (args.command == "hover") {
      return cmd_hover(args);
    }
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
