#pragma once

#include "sitecheck/core/config.h"
#include "sitecheck/crawl/header_verifier.h"

#include <iosfwd>
#include <string>

namespace sitecheck::app {

struct CliOptions {
  std::string seed;
  int timeout_ms = core::config::kDefaultTimeoutMs;
  crawl::HeaderRuleSet header_rules;
  std::string output_directory = ".";
  bool show_help = false;
  bool show_version = false;
};

void print_usage(std::ostream& stream);

// On failure `err` names the offending argument; `options` is then
// unspecified. --help and --version short-circuit all other checks.
bool parse_cli_arguments(int argc, const char* const* argv, CliOptions& options,
                         std::string& err);

bool parse_positive_int(const char* input, int& value);

}  // namespace sitecheck::app
