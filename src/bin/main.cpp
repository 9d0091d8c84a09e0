#include <tocss/cpp_backend.hpp>
#include <tocss/cpp_writer.hpp>
#include <tocss/expat_reader.hpp>
#include <tocss/generator.hpp>
#include <tocss/ir_printer.hpp>
#include <tocss/naming.hpp>
#include <tocss/schema_parser.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static constexpr int exit_success = 0;
static constexpr int exit_usage = 1;
static constexpr int exit_io = 2;
static constexpr int exit_parse = 3;
static constexpr int exit_codegen = 4;

struct cli_options {
  std::vector<std::string> schema_files;
  std::string output_dir = ".";
  std::string namespace_name;
  bool show_help = false;
  bool show_version = false;
  bool list_outputs = false;
  bool check_only = false;
  bool dump_ir = false;
};

static void
print_usage(std::ostream& os) {
  os << "Usage: tocss [options] <schema.xml> [schema2.xml ...]\n"
     << "\n"
     << "Options:\n"
     << "  -o <dir>          Output directory (default: current directory)\n"
     << "  -n <namespace>    C++ namespace for generated code (overrides the "
        "schema)\n"
     << "  --check           Validate schemas and exit\n"
     << "  --dump-ir         Print render procedures instead of writing "
        "headers\n"
     << "  --list-outputs    Print expected output filenames and exit\n"
     << "  -h, --help        Show this help message\n"
     << "  --version         Show version information\n";
}

static void
print_version(std::ostream& os) {
  os << "tocss " << TOCSS_VERSION << "\n";
}

static cli_options
parse_args(int argc, char* argv[]) {
  cli_options opts;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      opts.show_help = true;
      return opts;
    }

    if (arg == "--version") {
      opts.show_version = true;
      return opts;
    }

    if (arg == "--check") {
      opts.check_only = true;
      continue;
    }

    if (arg == "--dump-ir") {
      opts.dump_ir = true;
      continue;
    }

    if (arg == "--list-outputs") {
      opts.list_outputs = true;
      continue;
    }

    if (arg == "-o") {
      if (i + 1 >= argc) {
        std::cerr << "tocss: -o requires an argument\n";
        std::exit(exit_usage);
      }
      opts.output_dir = argv[++i];
      continue;
    }

    if (arg == "-n") {
      if (i + 1 >= argc) {
        std::cerr << "tocss: -n requires an argument\n";
        std::exit(exit_usage);
      }
      opts.namespace_name = argv[++i];
      continue;
    }

    if (arg[0] == '-') {
      std::cerr << "tocss: unknown option: " << arg << "\n";
      std::exit(exit_usage);
    }

    opts.schema_files.push_back(arg);
  }

  if (opts.check_only && opts.dump_ir) {
    std::cerr << "tocss: --check and --dump-ir are mutually exclusive\n";
    std::exit(exit_usage);
  }
  if (opts.list_outputs && (opts.check_only || opts.dump_ir)) {
    std::cerr << "tocss: --list-outputs cannot be combined with "
              << (opts.check_only ? "--check" : "--dump-ir") << "\n";
    std::exit(exit_usage);
  }

  return opts;
}

static std::string
read_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    std::cerr << "tocss: cannot open file: " << path << "\n";
    std::exit(exit_io);
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

static int
run(const cli_options& opts) {
  // Parse all schema files
  std::vector<tocss::schema_module> modules;
  for (const auto& file : opts.schema_files) {
    std::string xml = read_file(file);
    try {
      tocss::expat_reader reader(xml);
      tocss::schema_parser parser;
      auto module = parser.parse(reader);
      if (module.header.empty())
        module.header = tocss::to_snake_case(fs::path(file).stem().string()) +
                        ".hpp";
      modules.push_back(std::move(module));
    } catch (const std::exception& e) {
      std::cerr << "tocss: error parsing schema " << file << ": " << e.what()
                << "\n";
      return exit_parse;
    }
  }

  // Compile every type before writing anything
  std::vector<tocss::render_procedure> procedures;
  std::vector<tocss::cpp_file> files;
  try {
    for (const auto& module : modules) {
      if (opts.dump_ir || opts.check_only) {
        auto procs = tocss::generate_module(module);
        procedures.insert(procedures.end(), procs.begin(), procs.end());
      } else {
        tocss::codegen_options codegen_opts;
        codegen_opts.namespace_name = opts.namespace_name;
        files.push_back(tocss::cpp_backend(module, codegen_opts).generate());
      }
    }
  } catch (const tocss::schema_error& e) {
    std::cerr << "tocss: invalid schema: " << e.what() << "\n";
    return exit_codegen;
  } catch (const std::exception& e) {
    std::cerr << "tocss: code generation error: " << e.what() << "\n";
    return exit_codegen;
  }

  if (opts.check_only) return exit_success;

  if (opts.dump_ir) {
    for (const auto& proc : procedures)
      std::cout << tocss::print_procedure(proc);
    return exit_success;
  }

  // --list-outputs: print filenames and exit
  if (opts.list_outputs) {
    for (const auto& file : files)
      std::cout << file.filename << "\n";
    return exit_success;
  }

  std::error_code ec;
  fs::create_directories(opts.output_dir, ec);
  if (ec) {
    std::cerr << "tocss: cannot create directory: " << opts.output_dir << ": "
              << ec.message() << "\n";
    return exit_io;
  }

  tocss::cpp_writer writer;
  for (const auto& file : files) {
    auto path = fs::path(opts.output_dir) / file.filename;
    std::ofstream out(path);
    if (!out) {
      std::cerr << "tocss: cannot write file: " << path.string() << "\n";
      return exit_io;
    }
    out << writer.write(file);
    if (!out) {
      std::cerr << "tocss: error writing file: " << path.string() << "\n";
      return exit_io;
    }
  }

  return exit_success;
}

int
main(int argc, char* argv[]) {
  auto opts = parse_args(argc, argv);

  if (opts.show_help) {
    print_usage(std::cout);
    return exit_success;
  }

  if (opts.show_version) {
    print_version(std::cout);
    return exit_success;
  }

  if (opts.schema_files.empty()) {
    std::cerr << "tocss: no input files\n";
    print_usage(std::cerr);
    return exit_usage;
  }

  return run(opts);
}
