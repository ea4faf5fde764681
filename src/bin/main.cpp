#include <xsc/cache_config.hpp>
#include <xsc/canonical_key.hpp>
#include <xsc/errors.hpp>
#include <xsc/schema_cache.hpp>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

static constexpr int exit_success = 0;
static constexpr int exit_usage = 1;
static constexpr int exit_io = 2;
static constexpr int exit_parse = 3;
static constexpr int exit_rejected = 4;
static constexpr int exit_not_found = 5;

struct cli_options {
  std::vector<std::string> sources;
  std::vector<std::string> remove_keys;
  std::vector<std::string> get_keys;
  std::string config_file;
  bool list = false;
  bool show_help = false;
  bool show_version = false;
};

static void
print_usage(std::ostream& os) {
  os << "Usage: xsc [options] <source> [source ...]\n"
     << "\n"
     << "Loads schemas into a cache. A source naming a directory is scanned\n"
     << "recursively; anything else is fetched as a file://, http:// or\n"
     << "https:// URI (bare paths are taken as files).\n"
     << "\n"
     << "Options:\n"
     << "  -c <file>         JSON configuration file\n"
     << "  --remove <key>    Remove a schema by source key or identifier\n"
     << "  --list            Print cached rows: source key, identifier, "
        "mtime\n"
     << "  --get <key>       Print a schema as XML; URIs are fetched if absent\n"
     << "  -h, --help        Show this help message\n"
     << "  --version         Show version information\n";
}

static void
print_version(std::ostream& os) {
  os << "xsc " << XSC_VERSION << "\n";
}

static cli_options
parse_args(int argc, char* argv[]) {
  cli_options opts;

  auto require_value = [&](int& i, const std::string& flag) -> std::string {
    if (i + 1 >= argc) {
      std::cerr << "xsc: " << flag << " requires an argument\n";
      std::exit(exit_usage);
    }
    return argv[++i];
  };

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

    if (arg == "--list") {
      opts.list = true;
      continue;
    }

    if (arg == "-c") {
      opts.config_file = require_value(i, arg);
      continue;
    }

    if (arg == "--get") {
      opts.get_keys.push_back(require_value(i, arg));
      continue;
    }

    if (arg == "--remove") {
      opts.remove_keys.push_back(require_value(i, arg));
      continue;
    }

    if (arg.size() > 1 && arg[0] == '-') {
      std::cerr << "xsc: unknown option: " << arg << "\n";
      std::exit(exit_usage);
    }

    opts.sources.push_back(arg);
  }

  return opts;
}

static int
run(const cli_options& opts) {
  xsc::cache_options cache_opts;
  if (!opts.config_file.empty()) {
    try {
      cache_opts = xsc::load_cache_options(opts.config_file);
    } catch (const xsc::io_error& e) {
      std::cerr << "xsc: " << e.what() << "\n";
      return exit_io;
    } catch (const std::runtime_error& e) {
      std::cerr << "xsc: " << e.what() << "\n";
      return exit_usage;
    }
  }

  xsc::schema_cache cache(cache_opts);
  bool rejected = false;

  try {
    for (const auto& source : opts.sources) {
      std::error_code ec;
      auto path = xsc::file_path_of(xsc::canonical_key(source, "file"));
      auto failures = fs::is_directory(path, ec) ? cache.add_path(source)
                                                 : cache.add_uri(source);
      // Each failure has already been reported on the cache's log
      if (!failures.empty()) rejected = true;
    }

    for (const auto& key : opts.remove_keys) {
      cache.remove(key);
    }

    if (opts.list) {
      for (const auto& row : cache.load_all()) {
        std::cout << row.source_key << '\t' << row.id_key.value_or("-") << '\t'
                  << xsc::to_unix_seconds(row.mtime) << '\n';
      }
    }

    for (const auto& key : opts.get_keys) {
      // Only URIs can be fetched; identifiers must already be cached
      bool fetchable = !xsc::uri_scheme(xsc::canonical_key(key)).empty();
      auto schema = fetchable ? cache.load_uri(key) : cache.load(key);
      xsc::write_xml(std::cout, *schema);
      std::cout << '\n';
    }
  } catch (const xsc::unknown_uri_scheme& e) {
    std::cerr << "xsc: " << e.what() << "\n";
    return exit_usage;
  } catch (const xsc::schema_not_found& e) {
    std::cerr << "xsc: " << e.what() << "\n";
    return exit_not_found;
  } catch (const xsc::parse_error& e) {
    std::cerr << "xsc: " << e.what() << "\n";
    return exit_parse;
  } catch (const xsc::io_error& e) {
    std::cerr << "xsc: " << e.what() << "\n";
    return exit_io;
  } catch (const xsc::network_error& e) {
    std::cerr << "xsc: " << e.what() << "\n";
    return exit_io;
  }

  return rejected ? exit_rejected : exit_success;
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

  if (opts.sources.empty() && opts.get_keys.empty()) {
    std::cerr << "xsc: no sources\n";
    print_usage(std::cerr);
    return exit_usage;
  }

  return run(opts);
}
