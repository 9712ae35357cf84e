// compdoc - Composite document resolution command line interface
//
// Usage:
//   compdoc resolve  <doc-id> [--override KEY=REF]...
//   compdoc validate <doc-id> --component KEY=REF...
//   compdoc group    <group-id> [--type T]
//   compdoc context  <doc-id> [--with ID]... [--prefer TYPE]...
//
#include <charconv>
#include <cstddef>
#include <system_error>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "compdoc/basic/diagnostic_printer.hpp"
#include "compdoc/driver/context_assembler.hpp"
#include "compdoc/driver/engine.hpp"
#include "compdoc/driver/report_writer.hpp"
#include "compdoc/project/project_config.hpp"
#include "compdoc/store/json_store.hpp"

namespace fs = std::filesystem;

namespace
{

constexpr int k_exit_ok = 0;
constexpr int k_exit_failed = 1;
constexpr int k_exit_usage = 2;

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "Composite Document Resolver v0.1.0\n\n"
            << "Usage: " << program_name << " <command> <id> [options]\n\n"
            << "Commands:\n"
            << "  resolve <doc-id>         Expand a document's component tokens\n"
            << "  validate <doc-id>        Check a proposed component map for cycles\n"
            << "  group <group-id>         Pick a group representative and resolve it\n"
            << "  context <doc-id>         Assemble prompt context around a document\n\n"
            << "Options:\n"
            << "  --store <file>           Document snapshot (JSON)\n"
            << "  --config <file>          Project configuration (default: compdoc.yaml)\n"
            << "  --project <id>           Project scope\n"
            << "  --override <key>=<ref>   Override a token reference (repeatable)\n"
            << "  --component <key>=<ref>  Proposed component entry (repeatable)\n"
            << "  --type <type>            Preferred document type for 'group'\n"
            << "  --with <doc-id>          Additional context document (repeatable)\n"
            << "  --prefer <type>          Preferred related document type (repeatable)\n"
            << "  --max-tokens <n>         Context token budget\n"
            << "  --max-depth <n>          Maximum expansion depth\n"
            << "  --json                   Print results as JSON\n"
            << "  --no-color               Disable colored diagnostics\n"
            << "  -h, --help               Show this help message\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string target_id;
  std::string store_path;
  std::string config_path;
  std::string project;
  std::optional<std::string> type;
  std::vector<std::pair<std::string, std::string>> overrides;
  std::vector<std::pair<std::string, std::string>> components;
  std::vector<std::string> with_ids;
  std::vector<std::string> preferred_types;
  std::optional<size_t> max_depth;
  std::optional<size_t> max_tokens;
  bool json = false;
  bool no_color = false;
  bool show_help = false;

  /// Set when the command line is malformed
  std::string error;
};

std::optional<std::pair<std::string, std::string>> parse_assignment(const std::string & text)
{
  const auto eq = text.find('=');
  if (eq == std::string::npos || eq == 0) {
    return std::nullopt;
  }
  return std::make_pair(text.substr(0, eq), text.substr(eq + 1));
}

std::optional<size_t> parse_count(const std::string & text)
{
  size_t value = 0;
  const char * end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (ec != std::errc{} || ptr != end || value == 0) {
    return std::nullopt;
  }
  return value;
}

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.error = "no command given";
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];

    const auto next_value = [&]() -> std::optional<std::string> {
      if (i + 1 < argc) {
        return std::string(argv[++i]);
      }
      args.error = "missing value for " + arg;
      return std::nullopt;
    };

    if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg == "--json") {
      args.json = true;
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "--store" || arg == "--config" || arg == "--project" || arg == "--type") {
      const auto value = next_value();
      if (!value) return args;
      if (arg == "--store") {
        args.store_path = *value;
      } else if (arg == "--config") {
        args.config_path = *value;
      } else if (arg == "--project") {
        args.project = *value;
      } else {
        args.type = *value;
      }
    } else if (arg == "--override" || arg == "--component") {
      const auto value = next_value();
      if (!value) return args;
      auto assignment = parse_assignment(*value);
      if (!assignment) {
        args.error = "expected KEY=REF after " + arg + ", got '" + *value + "'";
        return args;
      }
      (arg == "--override" ? args.overrides : args.components).push_back(std::move(*assignment));
    } else if (arg == "--with") {
      const auto value = next_value();
      if (!value) return args;
      args.with_ids.push_back(*value);
    } else if (arg == "--prefer") {
      const auto value = next_value();
      if (!value) return args;
      args.preferred_types.push_back(*value);
    } else if (arg == "--max-depth" || arg == "--max-tokens") {
      const auto value = next_value();
      if (!value) return args;
      const auto count = parse_count(*value);
      if (!count) {
        args.error = arg + " expects a positive integer, got '" + *value + "'";
        return args;
      }
      (arg == "--max-depth" ? args.max_depth : args.max_tokens) = *count;
    } else if (arg[0] != '-' && args.target_id.empty()) {
      args.target_id = arg;
    } else {
      args.error = "unexpected argument '" + arg + "'";
      return args;
    }
  }

  return args;
}

// ============================================================================
// Environment
// ============================================================================

/// Configuration and document store shared by every command.
struct Environment
{
  compdoc::ProjectConfig config;
  std::unique_ptr<compdoc::InMemoryDocumentStore> store;
  bool use_color = false;

  [[nodiscard]] compdoc::EngineOptions engine_options() const
  {
    return compdoc::EngineOptions::from_config(config);
  }
};

bool detect_color(compdoc::ColorMode mode)
{
  switch (mode) {
    case compdoc::ColorMode::Always:
      return true;
    case compdoc::ColorMode::Never:
      return false;
    case compdoc::ColorMode::Auto:
      break;
  }
  // Detect if terminal supports colors (simple check for TTY)
  return isatty(fileno(stderr)) != 0;
}

void print_diagnostics(
  const compdoc::DiagnosticBag & diagnostics, const compdoc::DocumentStore * store, bool use_color)
{
  if (diagnostics.empty()) {
    return;
  }
  compdoc::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(diagnostics, store);
}

int report_load_failure(const std::string & message, bool use_color)
{
  compdoc::DiagnosticBag diags;
  diags.report_error({}, {}, message).with_code(compdoc::diag_code::k_load_failure);
  print_diagnostics(diags, nullptr, use_color);
  return k_exit_usage;
}

/// Load config and store; prints the failure and returns false on error.
bool load_environment(const CommandArgs & args, Environment & env, int & exit_code)
{
  const bool fallback_color = !args.no_color && detect_color(compdoc::ColorMode::Auto);

  std::optional<fs::path> config_path;
  if (!args.config_path.empty()) {
    config_path = fs::path(args.config_path);
  } else {
    config_path = compdoc::find_project_config(fs::current_path());
  }

  if (config_path) {
    auto config_result = compdoc::load_project_config(*config_path);
    if (!config_result.success) {
      exit_code = report_load_failure(
        config_path->string() + ": " + config_result.error, fallback_color);
      return false;
    }
    env.config = std::move(config_result.config);
  } else {
    env.config.project_root = fs::current_path();
  }

  // Command-line flags override file values
  if (args.no_color) {
    env.config.output.color = compdoc::ColorMode::Never;
  }
  if (!args.project.empty()) {
    env.config.project.id = args.project;
  }
  if (args.max_depth) {
    env.config.resolver.limits.max_depth = *args.max_depth;
  }
  if (args.max_tokens) {
    env.config.context.max_tokens = *args.max_tokens;
  }
  env.use_color = detect_color(env.config.output.color);

  std::optional<fs::path> store_path;
  if (!args.store_path.empty()) {
    store_path = fs::path(args.store_path);
  } else {
    store_path = env.config.store_path();
  }
  if (!store_path) {
    exit_code = report_load_failure(
      "no document store given (use --store or set project.store in compdoc.yaml)",
      env.use_color);
    return false;
  }

  auto store_result = compdoc::load_document_store(*store_path);
  if (!store_result.success) {
    exit_code = report_load_failure(store_result.error, env.use_color);
    return false;
  }
  env.store = std::move(store_result.store);
  return true;
}

/// Project of the command: --project / compdoc.yaml, else the document's own.
std::string project_for(const Environment & env, const std::string & document_id)
{
  if (!env.config.project.id.empty()) {
    return env.config.project.id;
  }
  if (const auto doc = env.store->get_document(document_id)) {
    return doc->project_id;
  }
  return {};
}

// ============================================================================
// Commands
// ============================================================================

int cmd_resolve(const CommandArgs & args, const Environment & env)
{
  compdoc::OverrideSet overrides;
  for (const auto & [key, ref] : args.overrides) {
    overrides.set(key, ref);
  }

  const compdoc::Engine engine(*env.store, env.engine_options());
  const compdoc::ResolveResult result = engine.resolve(args.target_id, overrides);

  print_diagnostics(result.diagnostics, env.store.get(), env.use_color);

  if (args.json) {
    std::cout << compdoc::to_json(result).dump(2) << "\n";
  } else if (result.success) {
    std::cout << result.text << "\n";
  }

  return result.success ? k_exit_ok : k_exit_failed;
}

int cmd_validate(const CommandArgs & args, const Environment & env)
{
  compdoc::ComponentMap components;
  for (const auto & [key, ref] : args.components) {
    components[key] = ref;
  }

  const std::string project = project_for(env, args.target_id);
  if (project.empty()) {
    std::cerr << "error: cannot determine project of '" << args.target_id
              << "' (use --project)\n";
    return k_exit_usage;
  }

  const compdoc::Engine engine(*env.store, env.engine_options());
  compdoc::DiagnosticBag diags;
  const compdoc::ValidationResult result =
    engine.validate(args.target_id, components, project, &diags);

  print_diagnostics(diags, env.store.get(), env.use_color);

  if (args.json) {
    std::cout << compdoc::to_json(result, diags).dump(2) << "\n";
  } else if (result.ok()) {
    std::cout << args.target_id << ": OK\n";
  }

  return result.ok() ? k_exit_ok : k_exit_failed;
}

int cmd_group(const CommandArgs & args, const Environment & env)
{
  const std::string & project = env.config.project.id;
  if (project.empty()) {
    std::cerr << "error: 'group' requires a project (use --project)\n";
    return k_exit_usage;
  }

  const compdoc::Engine engine(*env.store, env.engine_options());
  const compdoc::GroupResolution result = engine.resolve_group(project, args.target_id, args.type);

  print_diagnostics(result.diagnostics, env.store.get(), env.use_color);

  if (args.json) {
    std::cout << compdoc::to_json(result).dump(2) << "\n";
  } else if (result.success) {
    std::cout << result.resolved_content << "\n";
  }

  return result.success ? k_exit_ok : k_exit_failed;
}

int cmd_context(const CommandArgs & args, const Environment & env)
{
  const std::string project = project_for(env, args.target_id);

  compdoc::ContextOptions options;
  options.max_tokens = env.config.context.max_tokens;
  options.related_limit = env.config.context.related_limit;
  options.preferred_types = args.preferred_types;

  const compdoc::ContextAssembler assembler(*env.store, env.engine_options());
  const compdoc::AssembledContext result =
    assembler.assemble(project, args.target_id, args.with_ids, options);

  print_diagnostics(result.diagnostics, env.store.get(), env.use_color);

  if (args.json) {
    std::cout << compdoc::to_json(result).dump(2) << "\n";
  } else if (result.success) {
    std::cout << result.context << "\n";
  }

  return result.success ? k_exit_ok : k_exit_failed;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return k_exit_ok;
  }

  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n";
    print_usage(argv[0]);
    return k_exit_usage;
  }

  using Command = int (*)(const CommandArgs &, const Environment &);
  Command command = nullptr;
  if (args.command == "resolve") {
    command = cmd_resolve;
  } else if (args.command == "validate") {
    command = cmd_validate;
  } else if (args.command == "group") {
    command = cmd_group;
  } else if (args.command == "context") {
    command = cmd_context;
  } else {
    std::cerr << "error: unknown command '" << args.command << "'\n";
    print_usage(argv[0]);
    return k_exit_usage;
  }

  if (args.target_id.empty()) {
    std::cerr << "error: '" << args.command << "' requires an id\n";
    return k_exit_usage;
  }

  Environment env;
  int exit_code = k_exit_ok;
  if (!load_environment(args, env, exit_code)) {
    return exit_code;
  }

  return command(args, env);
}
