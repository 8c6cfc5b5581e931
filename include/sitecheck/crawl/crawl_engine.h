#pragma once

#include "sitecheck/core/config.h"
#include "sitecheck/core/diagnostics.h"
#include "sitecheck/crawl/crawl_queue.h"
#include "sitecheck/crawl/crawl_record.h"
#include "sitecheck/crawl/header_verifier.h"
#include "sitecheck/crawl/link_extractor.h"
#include "sitecheck/net/http_client.h"
#include "sitecheck/net/url.h"

#include <cstddef>
#include <functional>
#include <string>

namespace sitecheck::crawl {

struct CrawlOptions {
    int timeout_ms = core::config::kDefaultTimeoutMs;
    std::string user_agent = core::config::kDefaultUserAgent;
    HeaderRuleSet header_rules;
};

struct CrawlResult {
    bool ok = false;
    std::string message;
    std::string seed;
    WallClock::time_point started_at;
    WallClock::time_point finished_at;
};

using Fetcher = std::function<net::Response(const std::string&, const net::FetchOptions&)>;
using Clock = std::function<WallClock::time_point()>;
// (1-based position, records known so far, record just processed)
using RecordObserver = std::function<void(std::size_t, std::size_t, const CrawlRecord&)>;

class CrawlEngine {
public:
    explicit CrawlEngine(CrawlOptions options);

    void set_fetcher(Fetcher fetcher);
    void set_clock(Clock clock);
    void set_record_observer(RecordObserver observer);

    // Crawls breadth-first from `seed`. Only an unusable seed is non-ok.
    CrawlResult run(const std::string& seed);

    const CrawlQueue& queue() const;
    const CrawlOptions& options() const;

    core::DiagnosticEmitter& diagnostics();
    const core::DiagnosticEmitter& diagnostics() const;

private:
    void process(CrawlRecord& record, LinkExtractor& extractor);

    CrawlOptions options_;
    Fetcher fetcher_;
    Clock clock_;
    RecordObserver observer_;
    CrawlQueue queue_;
    core::DiagnosticEmitter diagnostics_;
};

}  // namespace sitecheck::crawl
