#include "sitecheck/report/console_report.h"
#include "sitecheck/report/html_report.h"
#include "sitecheck/report/json_report.h"
#include "sitecheck/report/report.h"

#include <gtest/gtest.h>
#include <yyjson.h>

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace sitecheck::report;
using sitecheck::crawl::CrawlOptions;
using sitecheck::crawl::CrawlQueue;
using sitecheck::crawl::CrawlRecord;
using sitecheck::crawl::CrawlResult;
using sitecheck::crawl::HeaderRule;
using sitecheck::crawl::RecordState;

namespace {

const WallClock::time_point kEpoch = WallClock::time_point(std::chrono::seconds(1700000000));

void complete(CrawlRecord& record, int status, int millis) {
    record.state = RecordState::Fetched;
    record.status_code = status;
    record.status_description = "Desc";
    record.request_started_at = kEpoch;
    record.request_finished_at = kEpoch + std::chrono::milliseconds(millis);
}

struct Fixture {
    CrawlQueue queue;
    CrawlResult run;
    CrawlOptions options;

    Fixture() {
        queue.find_or_add("http://example.test/");
        queue.find_or_add("http://example.test/a?x=<1>");
        queue.find_or_add("http://example.test/b");
        queue.find_or_add("http://example.test/c");
        queue.find_or_add("http://example.test/d");

        complete(queue.at(0), 200, 100);
        queue.at(0).links_to = {2, 3, 4, 5};
        queue.at(0).headers["server"] = "nginx";
        queue.at(0).headers_verified["server"] = std::string("nginx");
        complete(queue.at(1), 200, 300);
        complete(queue.at(2), 301, 200);
        queue.at(2).headers_not_verified["server"] = std::string("nginx");
        complete(queue.at(3), 404, 400);

        CrawlRecord& failed = queue.at(4);
        failed.state = RecordState::Failed;
        failed.request_started_at = kEpoch;
        failed.failure_reasons.push_back("Request timed out after 500ms");

        run.ok = true;
        run.seed = "http://example.test/";
        run.started_at = kEpoch;
        run.finished_at = kEpoch + std::chrono::seconds(2);

        options.timeout_ms = 500;
        HeaderRule rule;
        std::string err;
        EXPECT_TRUE(sitecheck::crawl::parse_header_rule("server:nginx", rule, err)) << err;
        sitecheck::crawl::add_header_rule(options.header_rules, std::move(rule));
        EXPECT_TRUE(sitecheck::crawl::parse_header_rule("etag", rule, err)) << err;
        sitecheck::crawl::add_header_rule(options.header_rules, std::move(rule));
    }
};

}  // namespace

// ---------------------------------------------------------------------------
// assemble_report
// ---------------------------------------------------------------------------
TEST(AssembleReportTest, CountsIgnoreFailedRecords) {
    Fixture fixture;
    const Report report = assemble_report(fixture.queue, fixture.run, fixture.options);
    const ReportSummary& summary = report.summary;

    EXPECT_EQ(summary.total, 5u);
    EXPECT_EQ(summary.completed, 4u);
    EXPECT_EQ(summary.failed, 1u);
    EXPECT_EQ(summary.status_2xx, 2u);
    EXPECT_EQ(summary.status_3xx, 1u);
    EXPECT_EQ(summary.status_other, 1u);
    EXPECT_EQ(summary.status_code_hits.at(200), 2u);
    EXPECT_EQ(summary.status_code_hits.at(404), 1u);
    EXPECT_EQ(summary.status_code_hits.count(0), 0u);
    EXPECT_EQ(summary.duration, std::chrono::seconds(2));
    ASSERT_TRUE(summary.average_response_time.has_value());
    EXPECT_EQ(*summary.average_response_time, std::chrono::milliseconds(250));
    EXPECT_EQ(summary.failing_checks, 2u);
}

TEST(AssembleReportTest, RecordViewsMirrorRecords) {
    Fixture fixture;
    const Report report = assemble_report(fixture.queue, fixture.run, fixture.options);

    ASSERT_EQ(report.records.size(), 5u);
    EXPECT_EQ(report.records[0].status_text, "200 Desc");
    EXPECT_TRUE(report.records[0].passed);
    EXPECT_EQ(report.records[0].duration, std::chrono::milliseconds(100));
    EXPECT_FALSE(report.records[2].passed);
    EXPECT_EQ(report.records[4].state, "failed");
    EXPECT_EQ(report.records[4].status_text, "");
    EXPECT_FALSE(report.records[4].duration.has_value());

    EXPECT_EQ(report.timeout_ms, 500);
    ASSERT_EQ(report.rules.size(), 2u);
    EXPECT_EQ(report.rules[0].first, "etag");
    EXPECT_FALSE(report.rules[0].second.has_value());
    EXPECT_EQ(report.rules[1].second, std::optional<std::string>("nginx"));
}

TEST(AssembleReportTest, NoTimedRecordsLeavesAverageEmpty) {
    CrawlQueue queue;
    queue.find_or_add("http://example.test/");
    queue.at(0).state = RecordState::Failed;
    CrawlResult run;
    run.started_at = kEpoch;
    run.finished_at = kEpoch;
    const Report report = assemble_report(queue, run, CrawlOptions{});
    EXPECT_FALSE(report.summary.average_response_time.has_value());
    EXPECT_EQ(report.summary.completed, 0u);
}

// ---------------------------------------------------------------------------
// Formatting helpers
// ---------------------------------------------------------------------------
TEST(ReportFormatTest, Iso8601UsesUtcWithMilliseconds) {
    EXPECT_EQ(format_iso8601_utc(kEpoch + std::chrono::milliseconds(42)),
              "2023-11-14T22:13:20.042Z");
}

TEST(ReportFormatTest, FileStemHasTimestampAndSafeHost) {
    const std::string stem = report_file_stem("example.test", kEpoch);
    EXPECT_EQ(stem.rfind("report-", 0), 0u);
    EXPECT_EQ(stem.size(), std::string("report-YYYY-MM-DD-HH-MM-SS-example.test").size());
    EXPECT_EQ(stem.substr(stem.size() - 13), "-example.test");

    const std::string v6 = report_file_stem("::1", kEpoch);
    EXPECT_EQ(v6.substr(v6.size() - 4), "-__1");
}

TEST(ReportFormatTest, DurationInMilliseconds) {
    EXPECT_EQ(format_duration_ms(std::chrono::milliseconds(1234)), "1234 ms");
    EXPECT_EQ(to_milliseconds(std::chrono::microseconds(2500)), 2);
}

// ---------------------------------------------------------------------------
// HTML
// ---------------------------------------------------------------------------
TEST(HtmlReportTest, EscapesText) {
    EXPECT_EQ(escape_html("<a href=\"x\">&'</a>"),
              "&lt;a href=&quot;x&quot;&gt;&amp;&#39;&lt;/a&gt;");
}

TEST(HtmlReportTest, RendersStatsRulesAndRows) {
    Fixture fixture;
    const std::string html =
        render_html_report(assemble_report(fixture.queue, fixture.run, fixture.options));

    EXPECT_NE(html.find("<!DOCTYPE html>"), std::string::npos);
    EXPECT_NE(html.find("http://example.test/a?x=&lt;1&gt;"), std::string::npos);
    EXPECT_EQ(html.find("x=<1>"), std::string::npos);
    EXPECT_NE(html.find("Request timed out after 500ms"), std::string::npos);
    EXPECT_NE(html.find("<td>404</td><td>1</td>"), std::string::npos);
    EXPECT_NE(html.find("<code>etag</code>: present"), std::string::npos);
    EXPECT_NE(html.find("class=\"fail\""), std::string::npos);
}

TEST(HtmlReportTest, WriteFailsForMissingDirectory) {
    Fixture fixture;
    const Report report = assemble_report(fixture.queue, fixture.run, fixture.options);
    std::string err;
    EXPECT_FALSE(write_html_report(report, "/nonexistent-sitecheck-dir/report.html", err));
    EXPECT_FALSE(err.empty());
}

// ---------------------------------------------------------------------------
// JSON
// ---------------------------------------------------------------------------
TEST(JsonReportTest, DumpHasRunConfigAndRecords) {
    Fixture fixture;
    const Report report = assemble_report(fixture.queue, fixture.run, fixture.options);
    std::string json;
    std::string err;
    ASSERT_TRUE(render_json_report(report, json, err)) << err;

    yyjson_doc* doc = yyjson_read(json.data(), json.size(), 0);
    ASSERT_NE(doc, nullptr);
    yyjson_val* root = yyjson_doc_get_root(doc);

    yyjson_val* run = yyjson_obj_get(root, "run");
    ASSERT_NE(run, nullptr);
    EXPECT_EQ(yyjson_get_int(yyjson_obj_get(run, "duration_ms")), 2000);
    EXPECT_STREQ(yyjson_get_str(yyjson_obj_get(run, "started_at")), "2023-11-14T22:13:20.000Z");

    yyjson_val* config = yyjson_obj_get(root, "config");
    ASSERT_NE(config, nullptr);
    EXPECT_STREQ(yyjson_get_str(yyjson_obj_get(config, "seed")), "http://example.test/");
    EXPECT_EQ(yyjson_get_int(yyjson_obj_get(config, "timeout_ms")), 500);
    yyjson_val* rules = yyjson_obj_get(config, "header_rules");
    EXPECT_TRUE(yyjson_is_null(yyjson_obj_get(rules, "etag")));
    EXPECT_STREQ(yyjson_get_str(yyjson_obj_get(rules, "server")), "nginx");

    yyjson_val* records = yyjson_obj_get(root, "records");
    ASSERT_TRUE(yyjson_is_arr(records));
    ASSERT_EQ(yyjson_arr_size(records), 5u);

    yyjson_val* seed = yyjson_arr_get(records, 0);
    EXPECT_EQ(yyjson_get_int(yyjson_obj_get(seed, "id")), 1);
    EXPECT_EQ(yyjson_get_int(yyjson_obj_get(seed, "status_code")), 200);
    EXPECT_EQ(yyjson_arr_size(yyjson_obj_get(seed, "links_to")), 4u);
    EXPECT_STREQ(yyjson_get_str(yyjson_obj_get(yyjson_obj_get(seed, "headers"), "server")), "nginx");
    EXPECT_STREQ(yyjson_get_str(yyjson_obj_get(seed, "status_description")), "Desc");

    yyjson_val* failed = yyjson_arr_get(records, 4);
    EXPECT_TRUE(yyjson_is_null(yyjson_obj_get(failed, "status_code")));
    ASSERT_NE(yyjson_obj_get(failed, "status_description"), nullptr);
    EXPECT_TRUE(yyjson_is_null(yyjson_obj_get(failed, "status_description")));
    EXPECT_TRUE(yyjson_is_null(yyjson_obj_get(failed, "request_finished_at")));
    EXPECT_EQ(yyjson_arr_size(yyjson_obj_get(failed, "failure_reasons")), 1u);
    EXPECT_FALSE(yyjson_get_bool(yyjson_obj_get(failed, "passed")));

    yyjson_doc_free(doc);
}

TEST(JsonReportTest, WritesFileAndReportsBadPath) {
    Fixture fixture;
    const Report report = assemble_report(fixture.queue, fixture.run, fixture.options);
    const std::filesystem::path path =
        std::filesystem::temp_directory_path() / "sitecheck_json_report_test.json";

    std::string err;
    ASSERT_TRUE(write_json_report(report, path.string(), err)) << err;
    std::ifstream in(path);
    std::stringstream contents;
    contents << in.rdbuf();
    EXPECT_NE(contents.str().find("\"records\""), std::string::npos);
    std::filesystem::remove(path);

    EXPECT_FALSE(write_json_report(report, "/nonexistent-sitecheck-dir/r.json", err));
    EXPECT_FALSE(err.empty());
}

TEST(JsonReportTest, NonUtf8HeaderBytesAreWrittenThrough) {
    Fixture fixture;
    fixture.queue.at(0).headers["x-city"] = "caf\xE9";
    const Report report = assemble_report(fixture.queue, fixture.run, fixture.options);

    std::string json;
    std::string err;
    ASSERT_TRUE(render_json_report(report, json, err)) << err;
    EXPECT_NE(json.find("caf\xE9"), std::string::npos);

    yyjson_doc* doc = yyjson_read(json.data(), json.size(), YYJSON_READ_ALLOW_INVALID_UNICODE);
    ASSERT_NE(doc, nullptr);
    yyjson_val* seed = yyjson_arr_get(yyjson_obj_get(yyjson_doc_get_root(doc), "records"), 0);
    EXPECT_STREQ(yyjson_get_str(yyjson_obj_get(yyjson_obj_get(seed, "headers"), "x-city")),
                 "caf\xE9");
    yyjson_doc_free(doc);

    const std::filesystem::path path =
        std::filesystem::temp_directory_path() / "sitecheck_json_latin1_test.json";
    EXPECT_TRUE(write_json_report(report, path.string(), err)) << err;
    std::filesystem::remove(path);
}

// ---------------------------------------------------------------------------
// Console
// ---------------------------------------------------------------------------
TEST(ConsoleReportTest, ProgressLineWithoutColor) {
    Fixture fixture;
    EXPECT_EQ(format_progress_line(1, 5, fixture.queue.at(0), false),
              " * [1/5] [200] 100ms http://example.test/");
    EXPECT_EQ(format_progress_line(5, 5, fixture.queue.at(4), false),
              " * [5/5] [ERR] http://example.test/d (Request timed out after 500ms)");
}

TEST(ConsoleReportTest, ProgressLineColorsByStatusClass) {
    Fixture fixture;
    EXPECT_NE(format_progress_line(1, 5, fixture.queue.at(0), true).find("\x1b[32m200"),
              std::string::npos);
    EXPECT_NE(format_progress_line(3, 5, fixture.queue.at(2), true).find("\x1b[33m301"),
              std::string::npos);
    EXPECT_NE(format_progress_line(4, 5, fixture.queue.at(3), true).find("\x1b[31m404"),
              std::string::npos);
}

TEST(ConsoleReportTest, SummaryMentionsTotalsAndAverage) {
    Fixture fixture;
    const Report report = assemble_report(fixture.queue, fixture.run, fixture.options);
    const std::string summary = format_run_summary(report.summary, false);
    EXPECT_NE(summary.find("Total URLs scanned 5\n"), std::string::npos);
    EXPECT_NE(summary.find("Failed requests 1\n"), std::string::npos);
    EXPECT_NE(summary.find("Average response time (ms) 250\n"), std::string::npos);
    EXPECT_NE(summary.find("Run took 2000 ms\n"), std::string::npos);
}
