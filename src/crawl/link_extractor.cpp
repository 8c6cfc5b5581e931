#include "sitecheck/crawl/link_extractor.h"

#include "sitecheck/crawl/origin_guard.h"
#include "sitecheck/html/href_scanner.h"

#include <utility>

namespace sitecheck::crawl {
namespace {

bool is_html_space(char ch) {
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f';
}

std::string strip_html_space(const std::string& value) {
    std::size_t first = 0;
    while (first < value.size() && is_html_space(value[first])) {
        ++first;
    }
    std::size_t last = value.size();
    while (last > first && is_html_space(value[last - 1])) {
        --last;
    }
    return value.substr(first, last - first);
}

}  // namespace

const char* link_outcome_name(LinkOutcome outcome) {
    switch (outcome) {
        case LinkOutcome::Skipped:    return "skipped";
        case LinkOutcome::Linked:     return "linked";
        case LinkOutcome::Discovered: return "discovered";
    }
    return "unknown";
}

LinkExtractor::LinkExtractor(net::Url base, CrawlQueue& queue)
    : base_(std::move(base)), queue_(queue) {}

std::size_t LinkExtractor::extract(CrawlRecord& record, const std::string& body) {
    record.links_to.clear();
    std::size_t discovered = 0;
    for (const std::string& href : html::extract_hrefs(body)) {
        if (add_link(record, href) == LinkOutcome::Discovered) {
            ++discovered;
        }
    }
    return discovered;
}

LinkOutcome LinkExtractor::add_link(CrawlRecord& record, const std::string& href) {
    std::string err;
    const std::string resolved = net::resolve_url(record.uri, strip_html_space(href), err);
    if (resolved.empty()) {
        return LinkOutcome::Skipped;
    }

    net::Url target;
    if (!net::normalize_url(resolved, target, err)) {
        return LinkOutcome::Skipped;
    }
    if (!is_in_origin(base_, target)) {
        return LinkOutcome::Skipped;
    }

    const CrawlQueue::Admission admission = queue_.find_or_add(target.to_string());
    record.links_to.push_back(admission.id);
    return admission.created ? LinkOutcome::Discovered : LinkOutcome::Linked;
}

const net::Url& LinkExtractor::base() const {
    return base_;
}

}  // namespace sitecheck::crawl
