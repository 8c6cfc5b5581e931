#include "sitecheck/report/json_report.h"

#include <yyjson.h>

#include <cstdlib>

namespace sitecheck::report {

namespace {

// Header values are raw bytes off the wire and need not be UTF-8.
constexpr yyjson_write_flag kWriteFlags = YYJSON_WRITE_PRETTY | YYJSON_WRITE_ALLOW_INVALID_UNICODE;

// Owns a yyjson_mut_doc for the lifetime of one dump.
class MutDocGuard {
public:
    explicit MutDocGuard(yyjson_mut_doc* doc) : doc_(doc) {}
    ~MutDocGuard() {
        if (doc_) yyjson_mut_doc_free(doc_);
    }

    MutDocGuard(const MutDocGuard&) = delete;
    MutDocGuard& operator=(const MutDocGuard&) = delete;

    yyjson_mut_doc* get() const { return doc_; }
    explicit operator bool() const { return doc_ != nullptr; }

private:
    yyjson_mut_doc* doc_;
};

// Keys built from runtime strings must be copied into the document.
void add_value(yyjson_mut_doc* doc, yyjson_mut_val* obj, const std::string& key,
               yyjson_mut_val* value) {
    yyjson_mut_obj_add(obj, yyjson_mut_strcpy(doc, key.c_str()), value);
}

yyjson_mut_val* optional_string(yyjson_mut_doc* doc, const std::optional<std::string>& value) {
    return value ? yyjson_mut_strcpy(doc, value->c_str()) : yyjson_mut_null(doc);
}

yyjson_mut_val* optional_time(yyjson_mut_doc* doc,
                              const std::optional<WallClock::time_point>& at) {
    return at ? yyjson_mut_strcpy(doc, format_iso8601_utc(*at).c_str()) : yyjson_mut_null(doc);
}

yyjson_mut_val* pattern_map(yyjson_mut_doc* doc,
                            const std::map<std::string, std::optional<std::string>>& entries) {
    yyjson_mut_val* obj = yyjson_mut_obj(doc);
    for (const auto& [name, pattern] : entries) {
        add_value(doc, obj, name, optional_string(doc, pattern));
    }
    return obj;
}

yyjson_mut_val* build_run(yyjson_mut_doc* doc, const ReportSummary& summary) {
    yyjson_mut_val* run = yyjson_mut_obj(doc);
    yyjson_mut_obj_add_strcpy(doc, run, "started_at",
                              format_iso8601_utc(summary.started_at).c_str());
    yyjson_mut_obj_add_strcpy(doc, run, "finished_at",
                              format_iso8601_utc(summary.finished_at).c_str());
    yyjson_mut_obj_add_int(doc, run, "duration_ms", to_milliseconds(summary.duration));
    yyjson_mut_obj_add_uint(doc, run, "total", summary.total);
    yyjson_mut_obj_add_uint(doc, run, "completed", summary.completed);
    yyjson_mut_obj_add_uint(doc, run, "failed", summary.failed);
    yyjson_mut_obj_add_uint(doc, run, "status_2xx", summary.status_2xx);
    yyjson_mut_obj_add_uint(doc, run, "status_3xx", summary.status_3xx);
    yyjson_mut_obj_add_uint(doc, run, "status_other", summary.status_other);
    if (summary.average_response_time) {
        yyjson_mut_obj_add_int(doc, run, "average_response_ms",
                               to_milliseconds(*summary.average_response_time));
    } else {
        yyjson_mut_obj_add_null(doc, run, "average_response_ms");
    }
    yyjson_mut_obj_add_uint(doc, run, "failing_checks", summary.failing_checks);

    yyjson_mut_val* hits = yyjson_mut_obj(doc);
    for (const auto& [code, count] : summary.status_code_hits) {
        add_value(doc, hits, std::to_string(code), yyjson_mut_uint(doc, count));
    }
    yyjson_mut_obj_add_val(doc, run, "status_code_hits", hits);
    return run;
}

yyjson_mut_val* build_config(yyjson_mut_doc* doc, const Report& report) {
    yyjson_mut_val* config = yyjson_mut_obj(doc);
    yyjson_mut_obj_add_strcpy(doc, config, "seed", report.summary.seed.c_str());
    yyjson_mut_obj_add_int(doc, config, "timeout_ms", report.timeout_ms);

    yyjson_mut_val* rules = yyjson_mut_obj(doc);
    for (const auto& [name, pattern] : report.rules) {
        add_value(doc, rules, name, optional_string(doc, pattern));
    }
    yyjson_mut_obj_add_val(doc, config, "header_rules", rules);
    return config;
}

yyjson_mut_val* build_record(yyjson_mut_doc* doc, const RecordView& view) {
    yyjson_mut_val* record = yyjson_mut_obj(doc);
    yyjson_mut_obj_add_uint(doc, record, "id", view.id);
    yyjson_mut_obj_add_strcpy(doc, record, "uri", view.uri.c_str());
    yyjson_mut_obj_add_strcpy(doc, record, "state", view.state.c_str());
    yyjson_mut_obj_add_val(doc, record, "request_started_at", optional_time(doc, view.started_at));
    yyjson_mut_obj_add_val(doc, record, "request_finished_at",
                           optional_time(doc, view.finished_at));
    if (view.duration) {
        yyjson_mut_obj_add_int(doc, record, "request_duration_ms",
                               to_milliseconds(*view.duration));
    } else {
        yyjson_mut_obj_add_null(doc, record, "request_duration_ms");
    }
    if (view.status_code) {
        yyjson_mut_obj_add_int(doc, record, "status_code", *view.status_code);
    } else {
        yyjson_mut_obj_add_null(doc, record, "status_code");
    }
    yyjson_mut_obj_add_val(doc, record, "status_description",
                           optional_string(doc, view.status_description));

    yyjson_mut_val* headers = yyjson_mut_obj(doc);
    for (const auto& [name, value] : view.headers) {
        add_value(doc, headers, name, yyjson_mut_strcpy(doc, value.c_str()));
    }
    yyjson_mut_obj_add_val(doc, record, "headers", headers);
    yyjson_mut_obj_add_val(doc, record, "headers_verified", pattern_map(doc, view.headers_verified));
    yyjson_mut_obj_add_val(doc, record, "headers_not_verified",
                           pattern_map(doc, view.headers_not_verified));

    yyjson_mut_val* reasons = yyjson_mut_arr(doc);
    for (const std::string& reason : view.failure_reasons) {
        yyjson_mut_arr_add_strcpy(doc, reasons, reason.c_str());
    }
    yyjson_mut_obj_add_val(doc, record, "failure_reasons", reasons);

    yyjson_mut_val* links = yyjson_mut_arr(doc);
    for (crawl::RecordId id : view.links_to) {
        yyjson_mut_arr_add_uint(doc, links, id);
    }
    yyjson_mut_obj_add_val(doc, record, "links_to", links);
    yyjson_mut_obj_add_bool(doc, record, "passed", view.passed);
    return record;
}

bool build_document(const Report& report, MutDocGuard& guard, std::string& err) {
    if (!guard) {
        err = "Failed to allocate JSON document";
        return false;
    }
    yyjson_mut_doc* doc = guard.get();
    yyjson_mut_val* root = yyjson_mut_obj(doc);
    yyjson_mut_doc_set_root(doc, root);

    yyjson_mut_obj_add_val(doc, root, "run", build_run(doc, report.summary));
    yyjson_mut_obj_add_val(doc, root, "config", build_config(doc, report));

    yyjson_mut_val* records = yyjson_mut_arr(doc);
    for (const RecordView& view : report.records) {
        yyjson_mut_arr_append(records, build_record(doc, view));
    }
    yyjson_mut_obj_add_val(doc, root, "records", records);
    return true;
}

}  // namespace

bool render_json_report(const Report& report, std::string& out, std::string& err) {
    MutDocGuard guard(yyjson_mut_doc_new(nullptr));
    if (!build_document(report, guard, err)) {
        return false;
    }

    size_t length = 0;
    yyjson_write_err write_err;
    char* json = yyjson_mut_write_opts(guard.get(), kWriteFlags, nullptr, &length,
                                       &write_err);
    if (!json) {
        err = std::string("JSON serialization failed: ") + (write_err.msg ? write_err.msg : "");
        return false;
    }
    out.assign(json, length);
    std::free(json);
    return true;
}

bool write_json_report(const Report& report, const std::string& path, std::string& err) {
    if (path.empty()) {
        err = "Empty report path";
        return false;
    }

    MutDocGuard guard(yyjson_mut_doc_new(nullptr));
    if (!build_document(report, guard, err)) {
        return false;
    }

    yyjson_write_err write_err;
    if (!yyjson_mut_write_file(path.c_str(), guard.get(), kWriteFlags, nullptr,
                               &write_err)) {
        err = "Failed writing " + path + ": " + (write_err.msg ? write_err.msg : "");
        return false;
    }
    return true;
}

}  // namespace sitecheck::report
