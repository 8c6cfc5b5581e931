#pragma once

#include "sitecheck/crawl/crawl_queue.h"
#include "sitecheck/crawl/crawl_record.h"
#include "sitecheck/net/url.h"

#include <cstddef>
#include <string>

namespace sitecheck::crawl {

enum class LinkOutcome {
    Skipped,     // unresolvable, malformed or outside the origin
    Linked,      // edge to an existing record
    Discovered,  // new record appended to the queue
};

const char* link_outcome_name(LinkOutcome outcome);

// Turns a fetched page into edges and newly queued records. Resolution is
// relative to the page's own URI; confinement is relative to the crawl base.
class LinkExtractor {
public:
    LinkExtractor(net::Url base, CrawlQueue& queue);

    // Replaces record.links_to with the edges found in `body`. Returns the
    // number of records discovered.
    std::size_t extract(CrawlRecord& record, const std::string& body);

    // Appends one edge when `href` lands inside the origin.
    LinkOutcome add_link(CrawlRecord& record, const std::string& href);

    const net::Url& base() const;

private:
    net::Url base_;
    CrawlQueue& queue_;
};

}  // namespace sitecheck::crawl
