#include "sitecheck/report/console_report.h"

#include <sstream>

namespace sitecheck::report {

namespace {

constexpr const char kReset[] = "\x1b[0m";
constexpr const char kBlue[] = "\x1b[34m";
constexpr const char kGreen[] = "\x1b[32m";
constexpr const char kYellow[] = "\x1b[33m";
constexpr const char kRed[] = "\x1b[31m";

std::string paint(const std::string& text, const char* code, bool color) {
    if (!color) {
        return text;
    }
    return std::string(code) + text + kReset;
}

const char* status_color(const crawl::CrawlRecord& record) {
    if (!record.status_code) {
        return kRed;
    }
    const int code = *record.status_code;
    if (code >= 200 && code < 300) {
        return kGreen;
    }
    if (code >= 300 && code < 400) {
        return kYellow;
    }
    return kRed;
}

}  // namespace

std::string format_progress_line(std::size_t position, std::size_t total,
                                 const crawl::CrawlRecord& record, bool color) {
    std::ostringstream out;
    out << paint(" * ", kBlue, color) << "["
        << paint(std::to_string(position), kBlue, color) << "/"
        << paint(std::to_string(total), kBlue, color) << "] [";

    const std::string status = record.status_code ? std::to_string(*record.status_code) : "ERR";
    out << paint(status, status_color(record), color) << "] ";

    if (const auto duration = record.request_duration()) {
        out << paint(std::to_string(to_milliseconds(*duration)) + "ms", kBlue, color) << " ";
    }
    out << record.uri;
    if (!record.failure_reasons.empty()) {
        out << " (" << record.failure_reasons.front() << ")";
    }
    return out.str();
}

std::string format_run_summary(const ReportSummary& summary, bool color) {
    std::ostringstream out;
    out << "Run started " << paint(format_local_time(summary.started_at), kBlue, color) << "\n";
    out << "Run ended " << paint(format_local_time(summary.finished_at), kBlue, color) << "\n";
    out << "Run took " << paint(format_duration_ms(summary.duration), kBlue, color) << "\n\n";
    out << "Total URLs scanned " << paint(std::to_string(summary.total), kBlue, color) << "\n";
    out << "Failed requests " << paint(std::to_string(summary.failed), kBlue, color) << "\n";
    out << "Pages failing checks "
        << paint(std::to_string(summary.failing_checks), kBlue, color) << "\n";
    out << "Average response time (ms) "
        << paint(summary.average_response_time
                     ? std::to_string(to_milliseconds(*summary.average_response_time))
                     : std::string("-"),
                 kBlue, color)
        << "\n";
    return out.str();
}

}  // namespace sitecheck::report
