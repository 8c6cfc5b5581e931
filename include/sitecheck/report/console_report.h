#pragma once

#include "sitecheck/crawl/crawl_record.h"
#include "sitecheck/report/report.h"

#include <cstddef>
#include <string>

namespace sitecheck::report {

// " * [3/17] [200] 41ms http://host/page"; failed records show "ERR" and
// their first failure reason.
std::string format_progress_line(std::size_t position, std::size_t total,
                                 const crawl::CrawlRecord& record, bool color);

std::string format_run_summary(const ReportSummary& summary, bool color);

}  // namespace sitecheck::report
