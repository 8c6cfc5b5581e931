#include "sitecheck/app/cli.h"

#include "sitecheck/net/url.h"

#include <charconv>
#include <filesystem>
#include <ostream>
#include <string_view>
#include <system_error>
#include <utility>

namespace sitecheck::app {

namespace {

bool is_help_flag(std::string_view text) {
  return text == "--help";
}

bool is_version_flag(std::string_view text) {
  return text == "-V" || text == "--version";
}

bool validate_seed(const std::string& seed, std::string& err) {
  net::Url url;
  std::string parse_err;
  if (!net::parse_url(seed, url, parse_err)) {
    err = "Invalid seed URL '" + seed + "': " + parse_err;
    return false;
  }
  if (url.scheme != "http" && url.scheme != "https") {
    err = "Seed URL must use http or https: " + seed;
    return false;
  }
  return true;
}

bool validate_output_directory(const std::string& path, std::string& err) {
  std::error_code ec;
  if (!std::filesystem::is_directory(path, ec)) {
    err = "Output directory does not exist: " + path;
    return false;
  }
  return true;
}

}  // namespace

void print_usage(std::ostream& stream) {
  stream << "usage: " << core::config::kProgramName
         << " <seed-url> [-t <milliseconds>] [-h <header>[:<pattern>]]... [-p <output-directory>]\n"
         << "  -t  per-request timeout in milliseconds (default "
         << core::config::kDefaultTimeoutMs << ")\n"
         << "  -h  verify a response header; with ':<pattern>' its value must match the regex\n"
         << "  -p  directory the reports are written to (default: current directory)\n";
}

bool parse_positive_int(const char* input, int& value) {
  if (input == nullptr) {
    return false;
  }

  const std::string_view text(input);
  if (text.empty()) {
    return false;
  }

  int parsed = 0;
  const char* begin = text.data();
  const char* end = begin + text.size();
  const std::from_chars_result result = std::from_chars(begin, end, parsed);
  if (result.ec != std::errc() || result.ptr != end || parsed <= 0) {
    return false;
  }

  value = parsed;
  return true;
}

bool parse_cli_arguments(int argc, const char* const* argv, CliOptions& options,
                         std::string& err) {
  for (int index = 1; index < argc; ++index) {
    const std::string_view argument(argv[index] != nullptr ? argv[index] : "");
    if (is_help_flag(argument)) {
      options.show_help = true;
      return true;
    }
    if (is_version_flag(argument)) {
      options.show_version = true;
      return true;
    }
  }

  bool has_seed = false;
  for (int index = 1; index < argc; ++index) {
    const std::string argument(argv[index] != nullptr ? argv[index] : "");

    if (argument == "-t" || argument == "-h" || argument == "-p") {
      if (index + 1 >= argc || argv[index + 1] == nullptr) {
        err = "Missing value for " + argument;
        return false;
      }
      const char* value = argv[++index];

      if (argument == "-t") {
        if (!parse_positive_int(value, options.timeout_ms)) {
          err = std::string("Invalid timeout: '") + value + "' (expected positive milliseconds)";
          return false;
        }
      } else if (argument == "-h") {
        crawl::HeaderRule rule;
        std::string rule_err;
        if (!crawl::parse_header_rule(value, rule, rule_err)) {
          err = std::string("Invalid header rule '") + value + "': " + rule_err;
          return false;
        }
        crawl::add_header_rule(options.header_rules, std::move(rule));
      } else {
        options.output_directory = value;
      }
      continue;
    }

    if (argument.size() > 1 && argument[0] == '-') {
      err = "Unknown option: " + argument;
      return false;
    }
    if (has_seed) {
      err = "Unexpected argument: " + argument;
      return false;
    }
    options.seed = argument;
    has_seed = true;
  }

  if (!has_seed) {
    err = "Missing seed URL";
    return false;
  }
  if (!validate_seed(options.seed, err)) {
    return false;
  }
  return validate_output_directory(options.output_directory, err);
}

}  // namespace sitecheck::app
