#pragma once

#include "sitecheck/report/report.h"

#include <string>

namespace sitecheck::report {

// Pretty-printed dump with "run", "config" and "records" sections.
bool render_json_report(const Report& report, std::string& out, std::string& err);

bool write_json_report(const Report& report, const std::string& path, std::string& err);

}  // namespace sitecheck::report
