#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sitecheck::crawl {

using RecordId = std::uint64_t;
using WallClock = std::chrono::system_clock;

enum class RecordState {
    Queued,
    Fetching,
    Fetched,
    Failed,
};

const char* record_state_name(RecordState state);

struct CrawlRecord {
    RecordId id = 0;
    std::string uri;
    RecordState state = RecordState::Queued;

    std::optional<WallClock::time_point> request_started_at;
    std::optional<WallClock::time_point> request_finished_at;

    std::optional<int> status_code;
    std::optional<std::string> status_description;

    // Lower-cased name -> value; repeated headers joined with a space.
    std::map<std::string, std::string> headers;

    // Rule key -> expected pattern (nullopt for presence-only rules). A key
    // lives in at most one of the two maps.
    std::map<std::string, std::optional<std::string>> headers_verified;
    std::map<std::string, std::optional<std::string>> headers_not_verified;

    std::vector<std::string> failure_reasons;

    // One entry per in-origin href, in document order.
    std::vector<RecordId> links_to;

    CrawlRecord() = default;
    CrawlRecord(RecordId record_id, std::string record_uri);

    std::optional<WallClock::duration> request_duration() const;

    bool completed() const { return state == RecordState::Fetched; }
    bool passed_checks() const;
};

}  // namespace sitecheck::crawl
