#include "sitecheck/crawl/crawl_record.h"

#include <utility>

namespace sitecheck::crawl {

const char* record_state_name(RecordState state) {
    switch (state) {
        case RecordState::Queued:   return "queued";
        case RecordState::Fetching: return "fetching";
        case RecordState::Fetched:  return "fetched";
        case RecordState::Failed:   return "failed";
    }
    return "unknown";
}

CrawlRecord::CrawlRecord(RecordId record_id, std::string record_uri)
    : id(record_id), uri(std::move(record_uri)) {}

std::optional<WallClock::duration> CrawlRecord::request_duration() const {
    if (!request_started_at || !request_finished_at) {
        return std::nullopt;
    }
    return *request_finished_at - *request_started_at;
}

bool CrawlRecord::passed_checks() const {
    return failure_reasons.empty() && headers_not_verified.empty();
}

}  // namespace sitecheck::crawl
