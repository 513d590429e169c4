#include <mosdl/expat_reader.hpp>
#include <mosdl/generator.hpp>
#include <mosdl/log.hpp>
#include <mosdl/output_sink.hpp>
#include <mosdl/spec_parser.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

static constexpr int exit_success = 0;
static constexpr int exit_usage = 1;
static constexpr int exit_io = 2;
static constexpr int exit_parse = 3;
static constexpr int exit_generate = 4;

struct cli_options {
  std::vector<std::string> spec_files;
  std::string output_dir = ".";
  mosdl::doc_mode docs = mosdl::doc_mode::bulk;
  bool show_help = false;
  bool show_version = false;
  bool list_outputs = false;
  bool verbose = false;
};

static void
print_usage(std::ostream& os) {
  os << "Usage: mosdl [options] <spec.xml> [spec2.xml ...]\n"
     << "\n"
     << "Renders MO service specifications as MOSDL, one file per area.\n"
     << "\n"
     << "Options:\n"
     << "  -o <dir>          Output directory (default: current directory)\n"
     << "  -d, --doc <mode>  Documentation mode: bulk, inline or suppress\n"
     << "                    (default: bulk)\n"
     << "  --list-outputs    Print expected output filenames and exit\n"
     << "  -v, --verbose     Log progress to stderr\n"
     << "  -h, --help        Show this help message\n"
     << "  --version         Show version information\n";
}

static void
print_version(std::ostream& os) {
  os << "mosdl " << MOSDL_VERSION << "\n";
}

static mosdl::doc_mode
parse_doc_mode(const std::string& value) {
  if (value == "bulk") return mosdl::doc_mode::bulk;
  if (value == "inline") return mosdl::doc_mode::inline_docs;
  if (value == "suppress") return mosdl::doc_mode::suppress;
  std::cerr << "mosdl: unknown documentation mode: " << value
            << " (expected bulk, inline or suppress)\n";
  std::exit(exit_usage);
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

    if (arg == "--list-outputs") {
      opts.list_outputs = true;
      continue;
    }

    if (arg == "-v" || arg == "--verbose") {
      opts.verbose = true;
      continue;
    }

    if (arg == "-o") {
      if (i + 1 >= argc) {
        std::cerr << "mosdl: -o requires an argument\n";
        std::exit(exit_usage);
      }
      opts.output_dir = argv[++i];
      continue;
    }

    if (arg == "-d" || arg == "--doc") {
      if (i + 1 >= argc) {
        std::cerr << "mosdl: " << arg << " requires an argument\n";
        std::exit(exit_usage);
      }
      opts.docs = parse_doc_mode(argv[++i]);
      continue;
    }

    if (arg[0] == '-') {
      std::cerr << "mosdl: unknown option: " << arg << "\n";
      std::exit(exit_usage);
    }

    opts.spec_files.push_back(arg);
  }

  return opts;
}

static std::string
read_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    std::cerr << "mosdl: cannot open file: " << path << "\n";
    std::exit(exit_io);
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

static int
run(const cli_options& opts) {
  auto log = mosdl::logger();

  mosdl::specification spec;
  for (const auto& file : opts.spec_files) {
    std::string xml = read_file(file);
    try {
      log->debug("Loading specification '{}'.", file);
      mosdl::expat_reader reader(xml);
      mosdl::spec_parser parser;
      spec.merge(parser.parse(reader));
    } catch (const std::exception& e) {
      std::cerr << "mosdl: error parsing specification " << file << ": "
                << e.what() << "\n";
      return exit_parse;
    }
  }

  if (opts.list_outputs) {
    for (const auto& a : spec.areas)
      std::cout << mosdl::output_unit_name(a) << "\n";
    return exit_success;
  }

  mosdl::generator_options gen_opts;
  gen_opts.docs = opts.docs;

  try {
    mosdl::directory_sink sink(opts.output_dir);
    mosdl::generator gen(gen_opts);
    gen.generate(spec, sink);
  } catch (const mosdl::generator_error& e) {
    std::cerr << "mosdl: generation failed: " << e.what() << "\n";
    return exit_generate;
  }

  log->info("Wrote {} MOSDL file(s) to {}", spec.areas.size(),
            opts.output_dir);
  return exit_success;
}

int
main(int argc, char* argv[]) {
  cli_options opts = parse_args(argc, argv);

  if (opts.show_help) {
    print_usage(std::cerr);
    return exit_success;
  }

  if (opts.show_version) {
    print_version(std::cerr);
    return exit_success;
  }

  if (opts.spec_files.empty()) {
    std::cerr << "mosdl: no input files\n";
    print_usage(std::cerr);
    return exit_usage;
  }

  if (opts.verbose) mosdl::set_log_level(spdlog::level::debug);

  return run(opts);
}
