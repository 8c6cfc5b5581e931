#include "sitecheck/app/cli.h"
#include "sitecheck/core/config.h"
#include "sitecheck/core/diagnostics.h"
#include "sitecheck/crawl/crawl_engine.h"
#include "sitecheck/net/url.h"
#include "sitecheck/report/console_report.h"
#include "sitecheck/report/html_report.h"
#include "sitecheck/report/json_report.h"
#include "sitecheck/report/report.h"

#include <filesystem>
#include <iostream>
#include <string>

#include <unistd.h>

namespace {

std::string report_path(const std::string& directory, const std::string& stem,
                        const char* extension) {
  return (std::filesystem::path(directory) / (stem + extension)).string();
}

}  // namespace

int main(int argc, char** argv) {
  sitecheck::app::CliOptions options;
  std::string err;
  if (!sitecheck::app::parse_cli_arguments(argc, argv, options, err)) {
    std::cerr << err << "\n";
    sitecheck::app::print_usage(std::cerr);
    return 1;
  }
  if (options.show_help) {
    sitecheck::app::print_usage(std::cout);
    return 0;
  }
  if (options.show_version) {
    std::cout << sitecheck::core::config::kVersionString << "\n";
    return 0;
  }

  const bool color = isatty(STDOUT_FILENO) != 0;

  sitecheck::crawl::CrawlOptions crawl_options;
  crawl_options.timeout_ms = options.timeout_ms;
  crawl_options.header_rules = options.header_rules;

  sitecheck::crawl::CrawlEngine engine(crawl_options);
  // Warnings and errors stream to stderr; nothing reads the history.
  engine.diagnostics().set_min_severity(sitecheck::core::Severity::Warning);
  engine.diagnostics().set_history_limit(0);
  engine.diagnostics().add_observer(sitecheck::core::make_stream_observer(std::cerr));
  engine.set_record_observer(
      [color](std::size_t position, std::size_t total,
              const sitecheck::crawl::CrawlRecord& record) {
        std::cout << sitecheck::report::format_progress_line(position, total, record, color)
                  << std::endl;
      });

  const sitecheck::crawl::CrawlResult result = engine.run(options.seed);
  if (!result.ok) {
    std::cerr << result.message << "\n";
    sitecheck::app::print_usage(std::cerr);
    return 1;
  }
  std::cout << "\n";

  const sitecheck::report::Report report =
      sitecheck::report::assemble_report(engine.queue(), result, engine.options());

  sitecheck::net::Url seed_url;
  std::string host = "site";
  if (sitecheck::net::parse_url(result.seed, seed_url, err)) {
    host = seed_url.host;
  }
  const std::string stem = sitecheck::report::report_file_stem(host, result.started_at);

  const std::string html_path = report_path(options.output_directory, stem, ".html");
  if (sitecheck::report::write_html_report(report, html_path, err)) {
    std::cout << "Wrote " << html_path << "\n";
  } else {
    engine.diagnostics().emit(sitecheck::core::Severity::Error, "report", "html", err);
  }

  const std::string json_path = report_path(options.output_directory, stem, ".json");
  if (sitecheck::report::write_json_report(report, json_path, err)) {
    std::cout << "Wrote " << json_path << "\n";
  } else {
    engine.diagnostics().emit(sitecheck::core::Severity::Error, "report", "json", err);
  }

  std::cout << "\n" << sitecheck::report::format_run_summary(report.summary, color);
  return 0;
}
