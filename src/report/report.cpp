#include "sitecheck/report/report.h"

#include <chrono>
#include <cstdio>
#include <ctime>

namespace sitecheck::report {

namespace {

std::tm to_local_tm(WallClock::time_point at) {
    const std::time_t seconds = WallClock::to_time_t(at);
    std::tm parts{};
    localtime_r(&seconds, &parts);
    return parts;
}

RecordView make_view(const crawl::CrawlRecord& record) {
    RecordView view;
    view.id = record.id;
    view.uri = record.uri;
    view.state = crawl::record_state_name(record.state);
    view.started_at = record.request_started_at;
    view.finished_at = record.request_finished_at;
    view.duration = record.request_duration();
    view.status_code = record.status_code;
    view.status_description = record.status_description;
    if (record.status_code) {
        view.status_text = std::to_string(*record.status_code);
        if (record.status_description && !record.status_description->empty()) {
            view.status_text += " " + *record.status_description;
        }
    }
    view.headers = record.headers;
    view.headers_verified = record.headers_verified;
    view.headers_not_verified = record.headers_not_verified;
    view.failure_reasons = record.failure_reasons;
    view.links_to = record.links_to;
    view.passed = record.passed_checks();
    return view;
}

}  // namespace

Report assemble_report(const crawl::CrawlQueue& queue,
                       const crawl::CrawlResult& run,
                       const crawl::CrawlOptions& options) {
    Report report;
    ReportSummary& summary = report.summary;
    summary.seed = run.seed;
    summary.started_at = run.started_at;
    summary.finished_at = run.finished_at;
    summary.duration = run.finished_at - run.started_at;
    summary.total = queue.size();

    WallClock::duration timed_total{};
    std::size_t timed_count = 0;

    for (const crawl::CrawlRecord& record : queue.records()) {
        if (record.state == crawl::RecordState::Failed) {
            ++summary.failed;
        }
        if (record.completed() && record.status_code) {
            ++summary.completed;
            const int code = *record.status_code;
            if (code >= 200 && code < 300) {
                ++summary.status_2xx;
            } else if (code >= 300 && code < 400) {
                ++summary.status_3xx;
            } else {
                ++summary.status_other;
            }
            ++summary.status_code_hits[code];
        }
        if (const auto duration = record.request_duration()) {
            timed_total += *duration;
            ++timed_count;
        }
        if (!record.passed_checks()) {
            ++summary.failing_checks;
        }
        report.records.push_back(make_view(record));
    }

    if (timed_count > 0) {
        summary.average_response_time =
            timed_total / static_cast<WallClock::rep>(timed_count);
    }

    report.timeout_ms = options.timeout_ms;
    for (const auto& [name, rule] : options.header_rules) {
        report.rules.emplace_back(name, rule.pattern);
    }
    return report;
}

std::string format_local_time(WallClock::time_point at) {
    const std::tm parts = to_local_tm(at);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &parts);
    return buffer;
}

std::string format_iso8601_utc(WallClock::time_point at) {
    const std::time_t seconds = WallClock::to_time_t(at);
    std::tm parts{};
    gmtime_r(&seconds, &parts);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &parts);

    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      at.time_since_epoch()).count() % 1000;
    if (millis < 0) {
        millis += 1000;
    }
    char fraction[8];
    std::snprintf(fraction, sizeof(fraction), ".%03lldZ", static_cast<long long>(millis));
    return std::string(buffer) + fraction;
}

long long to_milliseconds(WallClock::duration duration) {
    return static_cast<long long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(duration).count());
}

std::string format_duration_ms(WallClock::duration duration) {
    return std::to_string(to_milliseconds(duration)) + " ms";
}

std::string report_file_stem(const std::string& host, WallClock::time_point at) {
    const std::tm parts = to_local_tm(at);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d-%H-%M-%S", &parts);

    std::string safe_host;
    for (char ch : host) {
        const bool plain = (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') ||
                           (ch >= '0' && ch <= '9') || ch == '.' || ch == '-';
        safe_host.push_back(plain ? ch : '_');
    }
    return std::string("report-") + buffer + "-" + safe_host;
}

}  // namespace sitecheck::report
