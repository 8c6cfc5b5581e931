#pragma once

#include "sitecheck/crawl/crawl_record.h"

#include <cstddef>
#include <deque>
#include <string>
#include <unordered_map>

namespace sitecheck::crawl {

// Append-only record collection in discovery order. Records live in a
// deque so references handed out stay valid while new records are added.
class CrawlQueue {
public:
    struct Admission {
        RecordId id = 0;
        bool created = false;
    };

    // `normalized_uri` must already be in canonical form.
    Admission find_or_add(const std::string& normalized_uri);

    const CrawlRecord* find_by_uri(const std::string& normalized_uri) const;
    const CrawlRecord* find(RecordId id) const;

    CrawlRecord& at(std::size_t index);
    const CrawlRecord& at(std::size_t index) const;

    std::size_t size() const;
    bool empty() const;

    const std::deque<CrawlRecord>& records() const;

private:
    std::deque<CrawlRecord> records_;
    std::unordered_map<std::string, std::size_t> index_by_uri_;
};

}  // namespace sitecheck::crawl
