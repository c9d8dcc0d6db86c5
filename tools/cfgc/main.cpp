// cfgc - simpleC control-flow graph builder
//
// Usage:
//   cfgc <input.c>
//   cfgc build [file.c | --project] [-o dir] [--emit text|json] [-v]
//   cfgc check [file.c | --project] [-v]
//   cfgc init <project-name>
//
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "cfgc/basic/diagnostic_printer.hpp"
#include "cfgc/driver/compiler.hpp"
#include "cfgc/project/project_config.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage()
{
  std::cerr << "    [Usage]\tcfgc <input.c>\n\n"
            << "Commands:\n"
            << "  <input.c>                Print the CFG of a file to stdout\n"
            << "  build [file.c]           Build a file or project\n"
            << "  check [file.c]           Check syntax only\n"
            << "  init <project-name>      Initialize a new project\n\n"
            << "Options:\n"
            << "  -o, --output <dir>       Output directory\n"
            << "  --emit <text|json>       Output format (default: text)\n"
            << "  --project                Use cfgc.yaml from the current directory or parents\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

void print_diagnostics(const cfgc::CompileResult & result)
{
  if (result.diagnostics.empty()) {
    return;
  }
  cfgc::DiagnosticPrinter printer(
    std::cerr, cfgc::DiagnosticPrinter::stream_is_terminal(std::cerr));
  printer.print_all(result.diagnostics, result.sources);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::string output_path;
  std::string emit;
  bool use_project = false;
  bool verbose = false;
  bool show_help = false;
  std::string error;
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
    const std::string arg = argv[i];

    if (arg == "-o" || arg == "--output" || arg == "--emit") {
      if (i + 1 >= argc) {
        args.error = "missing value for " + arg;
        return args;
      }
      (arg == "--emit" ? args.emit : args.output_path) = argv[++i];
    } else if (arg == "--project") {
      args.use_project = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.input_file.empty()) {
      args.input_file = arg;
    } else {
      args.error = "unexpected argument '" + arg + "'";
      return args;
    }
  }

  return args;
}

// ============================================================================
// Commands
// ============================================================================

/// `cfgc <input.c>`: render to stdout.
int cmd_print(const std::string & input)
{
  cfgc::CompileOptions options;
  options.mode = cfgc::CompileMode::Build;

  const cfgc::CompileResult result = cfgc::Compiler::compile_single_file(input, options);
  print_diagnostics(result);
  if (!result.success) {
    return 1;
  }
  for (const auto & out : result.outputs) {
    std::cout << out.content;
  }
  return 0;
}

int run_compile(const CommandArgs & args, cfgc::CompileMode mode)
{
  cfgc::CompileOptions options;
  options.mode = mode;
  options.verbose = args.verbose;
  if (!args.output_path.empty()) {
    options.output_dir = args.output_path;
  }
  if (!args.emit.empty()) {
    options.emit = cfgc::parse_emit_format(args.emit);
    if (!options.emit) {
      std::cerr << "error: invalid --emit value '" << args.emit << "' (must be text or json)\n";
      return 1;
    }
  }

  const bool project_mode = args.use_project || args.input_file.empty();
  cfgc::CompileResult result;

  if (project_mode) {
    auto config_path = cfgc::find_project_config(fs::current_path());
    if (!config_path) {
      std::cerr << "error: no " << cfgc::k_project_config_file_name
                << " found in current directory or parents\n";
      return 1;
    }

    const auto config_result = cfgc::load_project_config(*config_path);
    if (!config_result.success) {
      std::cerr << "error: " << config_result.error << "\n";
      return 1;
    }

    result = cfgc::Compiler::compile_project(config_result.config, options);
  } else {
    result = cfgc::Compiler::compile_single_file(args.input_file, options);
  }

  print_diagnostics(result);
  if (!result.success) {
    return 1;
  }

  if (mode == cfgc::CompileMode::Check) {
    std::cout << (project_mode ? "project" : args.input_file) << ": OK\n";
    return 0;
  }

  // A single file built without -o goes to stdout.
  if (!project_mode && !options.output_dir) {
    for (const auto & out : result.outputs) {
      std::cout << out.content;
    }
    return 0;
  }

  for (const auto & file : result.generated_files) {
    std::cerr << "Generated: " << file.string() << "\n";
  }
  return 0;
}

int cmd_init(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    std::cerr << "error: project name required\n";
    std::cerr << "usage: cfgc init <project-name>\n";
    return 1;
  }

  const fs::path project_dir = fs::current_path() / args.input_file;

  if (fs::exists(project_dir)) {
    std::cerr << "error: directory already exists: " << project_dir.string() << "\n";
    return 1;
  }

  try {
    fs::create_directories(project_dir / "src");
    fs::create_directories(project_dir / "generated");

    std::ofstream config(project_dir / cfgc::k_project_config_file_name);
    config << cfgc::default_project_config(args.input_file);
    config.close();

    std::ofstream main(project_dir / "src" / "main.c");
    main << "int main() {\n"
         << "    int i;\n"
         << "    int sum;\n"
         << "    sum = 0;\n"
         << "    for (i = 0; i < 10; i = i + 1) {\n"
         << "        sum = sum + i;\n"
         << "    }\n"
         << "    return sum;\n"
         << "}\n";
    main.close();

    if (!config || !main) {
      std::cerr << "error: failed to write project files in " << project_dir.string() << "\n";
      return 1;
    }

    std::cout << "Initialized new cfgc project in " << project_dir.string() << "\n";
    std::cout << "\nNext steps:\n"
              << "  cd " << args.input_file << "\n"
              << "  cfgc build\n";
    return 0;
  } catch (const fs::filesystem_error & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage();
    return 0;
  }

  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n";
    return 1;
  }

  if (args.command == "build") {
    return run_compile(args, cfgc::CompileMode::Build);
  }

  if (args.command == "check") {
    return run_compile(args, cfgc::CompileMode::Check);
  }

  if (args.command == "init") {
    return cmd_init(args);
  }

  if (!args.command.empty() && args.command[0] == '-') {
    std::cerr << "error: unknown option '" << args.command << "'\n";
    print_usage();
    return 1;
  }

  return cmd_print(args.command);
}
