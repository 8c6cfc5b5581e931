#include "sitecheck/report/html_report.h"

#include <fstream>
#include <sstream>

namespace sitecheck::report {

namespace {

constexpr const char kStyle[] =
    "body{font-family:sans-serif;margin:2em;color:#222}"
    "table{border-collapse:collapse;width:100%}"
    "th,td{border:1px solid #ccc;padding:4px 8px;text-align:left;vertical-align:top}"
    "th{background:#f0f0f0}"
    "tr.fail td{background:#fdecea}"
    "ul{margin:0;padding-left:1.2em}"
    "code{font-size:90%}";

std::string optional_time(const std::optional<WallClock::time_point>& at) {
    return at ? format_local_time(*at) : std::string("-");
}

void write_partition(std::ostringstream& out,
                     const std::map<std::string, std::optional<std::string>>& partition) {
    if (partition.empty()) {
        out << "-";
        return;
    }
    out << "<ul>";
    for (const auto& [name, pattern] : partition) {
        out << "<li><code>" << escape_html(name) << "</code>";
        if (pattern) {
            out << " ~ <code>" << escape_html(*pattern) << "</code>";
        }
        out << "</li>";
    }
    out << "</ul>";
}

void write_summary(std::ostringstream& out, const Report& report) {
    const ReportSummary& summary = report.summary;
    out << "<h2>Statistics</h2>\n<ul>\n";
    out << "<li>Seed: <a href=\"" << escape_html(summary.seed) << "\">"
        << escape_html(summary.seed) << "</a></li>\n";
    out << "<li>Started: " << format_local_time(summary.started_at) << "</li>\n";
    out << "<li>Finished: " << format_local_time(summary.finished_at) << "</li>\n";
    out << "<li>Duration: " << format_duration_ms(summary.duration) << "</li>\n";
    out << "<li>Pages: " << summary.total << " (" << summary.completed << " completed, "
        << summary.failed << " failed)</li>\n";
    out << "<li>2xx: " << summary.status_2xx << "</li>\n";
    out << "<li>3xx: " << summary.status_3xx << "</li>\n";
    out << "<li>Other: " << summary.status_other << "</li>\n";
    out << "<li>Average response time: "
        << (summary.average_response_time ? format_duration_ms(*summary.average_response_time)
                                          : std::string("-"))
        << "</li>\n";
    out << "<li>Pages failing checks: " << summary.failing_checks << "</li>\n";
    out << "</ul>\n";

    out << "<h2>Status codes</h2>\n";
    if (summary.status_code_hits.empty()) {
        out << "<p>None</p>\n";
    } else {
        out << "<table>\n<tr><th>Code</th><th>Hits</th></tr>\n";
        for (const auto& [code, hits] : summary.status_code_hits) {
            out << "<tr><td>" << code << "</td><td>" << hits << "</td></tr>\n";
        }
        out << "</table>\n";
    }

    out << "<h2>Header rules</h2>\n";
    if (report.rules.empty()) {
        out << "<p>None</p>\n";
    } else {
        out << "<ul>\n";
        for (const auto& [name, pattern] : report.rules) {
            out << "<li><code>" << escape_html(name) << "</code>: "
                << (pattern ? "<code>" + escape_html(*pattern) + "</code>"
                            : std::string("present"))
                << "</li>\n";
        }
        out << "</ul>\n";
    }
}

void write_records(std::ostringstream& out, const Report& report) {
    out << "<h2>Pages</h2>\n<table>\n"
        << "<tr><th>#</th><th>Address</th><th>Status</th><th>Started</th>"
        << "<th>Finished</th><th>Duration</th><th>Verified</th>"
        << "<th>Not verified</th><th>Failures</th></tr>\n";
    for (const RecordView& view : report.records) {
        out << "<tr" << (view.passed ? "" : " class=\"fail\"") << ">";
        out << "<td>" << view.id << "</td>";
        out << "<td><a href=\"" << escape_html(view.uri) << "\">" << escape_html(view.uri)
            << "</a></td>";
        out << "<td>" << (view.status_text.empty() ? escape_html(view.state)
                                                   : escape_html(view.status_text))
            << "</td>";
        out << "<td>" << optional_time(view.started_at) << "</td>";
        out << "<td>" << optional_time(view.finished_at) << "</td>";
        out << "<td>" << (view.duration ? format_duration_ms(*view.duration) : std::string("-"))
            << "</td>";
        out << "<td>";
        write_partition(out, view.headers_verified);
        out << "</td><td>";
        write_partition(out, view.headers_not_verified);
        out << "</td><td>";
        if (view.failure_reasons.empty()) {
            out << "-";
        } else {
            out << "<ul>";
            for (const std::string& reason : view.failure_reasons) {
                out << "<li>" << escape_html(reason) << "</li>";
            }
            out << "</ul>";
        }
        out << "</td></tr>\n";
    }
    out << "</table>\n";
}

}  // namespace

std::string escape_html(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char ch : text) {
        switch (ch) {
            case '&':  escaped += "&amp;"; break;
            case '<':  escaped += "&lt;"; break;
            case '>':  escaped += "&gt;"; break;
            case '"':  escaped += "&quot;"; break;
            case '\'': escaped += "&#39;"; break;
            default:   escaped.push_back(ch); break;
        }
    }
    return escaped;
}

std::string render_html_report(const Report& report) {
    std::ostringstream out;
    out << "<!DOCTYPE html>\n<html>\n<head>\n<meta charset=\"utf-8\">\n";
    out << "<title>sitecheck report: " << escape_html(report.summary.seed) << "</title>\n";
    out << "<style>" << kStyle << "</style>\n</head>\n<body>\n";
    out << "<h1>sitecheck report</h1>\n";
    write_summary(out, report);
    write_records(out, report);
    out << "</body>\n</html>\n";
    return out.str();
}

bool write_html_report(const Report& report, const std::string& path, std::string& err) {
    if (path.empty()) {
        err = "Empty report path";
        return false;
    }

    std::ofstream out(path, std::ios::binary);
    if (!out.is_open()) {
        err = "Cannot open " + path + " for writing";
        return false;
    }

    out << render_html_report(report);
    if (!out.good()) {
        err = "Failed writing " + path;
        return false;
    }
    return true;
}

}  // namespace sitecheck::report
