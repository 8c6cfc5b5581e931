#include "sitecheck/crawl/crawl_queue.h"

namespace sitecheck::crawl {

CrawlQueue::Admission CrawlQueue::find_or_add(const std::string& normalized_uri) {
    const auto it = index_by_uri_.find(normalized_uri);
    if (it != index_by_uri_.end()) {
        return {records_[it->second].id, false};
    }

    const std::size_t index = records_.size();
    const RecordId id = static_cast<RecordId>(index + 1);
    records_.emplace_back(id, normalized_uri);
    index_by_uri_.emplace(normalized_uri, index);
    return {id, true};
}

const CrawlRecord* CrawlQueue::find_by_uri(const std::string& normalized_uri) const {
    const auto it = index_by_uri_.find(normalized_uri);
    if (it == index_by_uri_.end()) {
        return nullptr;
    }
    return &records_[it->second];
}

const CrawlRecord* CrawlQueue::find(RecordId id) const {
    if (id == 0 || id > records_.size()) {
        return nullptr;
    }
    return &records_[static_cast<std::size_t>(id - 1)];
}

CrawlRecord& CrawlQueue::at(std::size_t index) {
    return records_.at(index);
}

const CrawlRecord& CrawlQueue::at(std::size_t index) const {
    return records_.at(index);
}

std::size_t CrawlQueue::size() const {
    return records_.size();
}

bool CrawlQueue::empty() const {
    return records_.empty();
}

const std::deque<CrawlRecord>& CrawlQueue::records() const {
    return records_;
}

}  // namespace sitecheck::crawl
