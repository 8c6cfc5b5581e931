#include "sitecheck/crawl/crawl_engine.h"

#include <chrono>
#include <map>
#include <string>
#include <utility>

namespace sitecheck::crawl {

namespace {

constexpr const char kModule[] = "crawl";

std::map<std::string, std::string> flatten_headers(const net::HeaderMultimap& headers) {
    std::map<std::string, std::string> flat;
    for (auto it = headers.begin(); it != headers.end();
         it = headers.upper_bound(it->first)) {
        flat[it->first] = net::joined_header_value(headers, it->first);
    }
    return flat;
}

std::string failure_reason(const net::Response& response, int timeout_ms) {
    if (response.timed_out) {
        return "Request timed out after " + std::to_string(timeout_ms) + "ms";
    }
    return "Request failed: " + response.error;
}

}  // namespace

CrawlEngine::CrawlEngine(CrawlOptions options)
    : options_(std::move(options)),
      fetcher_([](const std::string& url, const net::FetchOptions& fetch_options) {
          return net::fetch(url, fetch_options);
      }),
      clock_([] { return WallClock::now(); }) {}

void CrawlEngine::set_fetcher(Fetcher fetcher) {
    fetcher_ = std::move(fetcher);
}

void CrawlEngine::set_clock(Clock clock) {
    clock_ = std::move(clock);
}

void CrawlEngine::set_record_observer(RecordObserver observer) {
    observer_ = std::move(observer);
}

CrawlResult CrawlEngine::run(const std::string& seed) {
    CrawlResult result;
    result.seed = seed;
    result.started_at = clock_();
    queue_ = CrawlQueue();
    diagnostics_.set_record_id(0);

    net::Url base;
    std::string err;
    if (!net::normalize_url(seed, base, err)) {
        result.message = "Invalid seed URL: " + err;
        result.finished_at = clock_();
        diagnostics_.emit(core::Severity::Error, kModule, "seed", result.message);
        return result;
    }

    result.seed = base.to_string();
    queue_.find_or_add(result.seed);
    diagnostics_.emit(core::Severity::Info, kModule, "seed",
                      "Crawling from " + result.seed);

    LinkExtractor extractor(base, queue_);
    // The queue grows while we walk it; size() is re-read every pass.
    for (std::size_t cursor = 0; cursor < queue_.size(); ++cursor) {
        CrawlRecord& record = queue_.at(cursor);
        diagnostics_.set_record_id(record.id);
        process(record, extractor);
        if (observer_) {
            observer_(cursor + 1, queue_.size(), record);
        }
    }
    diagnostics_.set_record_id(0);

    result.finished_at = clock_();
    result.ok = true;
    result.message = "Crawled " + std::to_string(queue_.size()) + " page(s)";
    diagnostics_.emit(core::Severity::Info, kModule, "done", result.message);
    return result;
}

void CrawlEngine::process(CrawlRecord& record, LinkExtractor& extractor) {
    record.state = RecordState::Fetching;
    record.request_started_at = clock_();

    net::FetchOptions fetch_options;
    fetch_options.timeout_ms = options_.timeout_ms;
    fetch_options.user_agent = options_.user_agent;
    const net::Response response = fetcher_(record.uri, fetch_options);

    if (!response.ok()) {
        record.state = RecordState::Failed;
        record.failure_reasons.push_back(failure_reason(response, options_.timeout_ms));
        diagnostics_.emit(core::Severity::Warning, kModule, "fetch",
                          record.uri + ": " + record.failure_reasons.back());
        return;
    }
    record.request_finished_at = clock_();

    record.status_code = response.status_code;
    record.status_description = response.reason.empty()
                                    ? std::string(net::reason_phrase_for_status(response.status_code))
                                    : response.reason;
    record.headers = flatten_headers(response.headers);
    record.state = RecordState::Fetched;

    if (!options_.header_rules.empty()) {
        verify_headers(record, options_.header_rules);
        for (const auto& [name, pattern] : record.headers_not_verified) {
            diagnostics_.emit(core::Severity::Info, kModule, "verify",
                              record.uri + ": header '" + name + "' not verified");
        }
    }

    std::size_t discovered = extractor.extract(record, response.body);
    if (net::is_redirect_status(response.status_code)) {
        auto location = record.headers.find("location");
        if (location != record.headers.end() &&
            extractor.add_link(record, location->second) == LinkOutcome::Discovered) {
            ++discovered;
        }
    }
    if (discovered > 0) {
        diagnostics_.emit(core::Severity::Info, kModule, "extract",
                          record.uri + ": discovered " + std::to_string(discovered) +
                              " new page(s)");
    }
}

const CrawlQueue& CrawlEngine::queue() const {
    return queue_;
}

const CrawlOptions& CrawlEngine::options() const {
    return options_;
}

core::DiagnosticEmitter& CrawlEngine::diagnostics() {
    return diagnostics_;
}

const core::DiagnosticEmitter& CrawlEngine::diagnostics() const {
    return diagnostics_;
}

}  // namespace sitecheck::crawl
