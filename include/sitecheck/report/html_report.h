#pragma once

#include "sitecheck/report/report.h"

#include <string>

namespace sitecheck::report {

std::string escape_html(const std::string& text);

// Self-contained page: run statistics, status code hits, header rules and
// one table row per record.
std::string render_html_report(const Report& report);

bool write_html_report(const Report& report, const std::string& path, std::string& err);

}  // namespace sitecheck::report
