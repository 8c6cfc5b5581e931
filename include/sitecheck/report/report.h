#pragma once

#include "sitecheck/crawl/crawl_engine.h"
#include "sitecheck/crawl/crawl_queue.h"
#include "sitecheck/crawl/crawl_record.h"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sitecheck::report {

using crawl::WallClock;

struct ReportSummary {
    std::string seed;
    WallClock::time_point started_at;
    WallClock::time_point finished_at;
    WallClock::duration duration{};

    std::size_t total = 0;
    std::size_t completed = 0;
    std::size_t failed = 0;

    // Completed records only, by status class.
    std::size_t status_2xx = 0;
    std::size_t status_3xx = 0;
    std::size_t status_other = 0;
    std::map<int, std::size_t> status_code_hits;

    // Over records that have a duration; absent when none do.
    std::optional<WallClock::duration> average_response_time;

    std::size_t failing_checks = 0;
};

struct RecordView {
    crawl::RecordId id = 0;
    std::string uri;
    std::string state;
    std::optional<WallClock::time_point> started_at;
    std::optional<WallClock::time_point> finished_at;
    std::optional<WallClock::duration> duration;
    std::optional<int> status_code;
    std::optional<std::string> status_description;
    std::string status_text;  // "200 OK", "" when never completed
    std::map<std::string, std::string> headers;
    std::map<std::string, std::optional<std::string>> headers_verified;
    std::map<std::string, std::optional<std::string>> headers_not_verified;
    std::vector<std::string> failure_reasons;
    std::vector<crawl::RecordId> links_to;
    bool passed = false;
};

struct Report {
    ReportSummary summary;
    int timeout_ms = 0;
    // (header name, pattern) in name order; nullopt for presence rules.
    std::vector<std::pair<std::string, std::optional<std::string>>> rules;
    std::vector<RecordView> records;
};

Report assemble_report(const crawl::CrawlQueue& queue,
                       const crawl::CrawlResult& run,
                       const crawl::CrawlOptions& options);

// "2024-03-05 14:07:09" in local time.
std::string format_local_time(WallClock::time_point at);
// "2024-03-05T13:07:09.123Z"
std::string format_iso8601_utc(WallClock::time_point at);
std::string format_duration_ms(WallClock::duration duration);
long long to_milliseconds(WallClock::duration duration);

// "report-YYYY-MM-DD-HH-MM-SS-<host>", local time, host made file-name safe.
std::string report_file_stem(const std::string& host, WallClock::time_point at);

}  // namespace sitecheck::report
