#include "sitecheck/crawl/crawl_queue.h"

#include <gtest/gtest.h>

#include <chrono>
#include <string>

using namespace sitecheck::crawl;

TEST(CrawlQueueTest, AssignsSequentialIdsInDiscoveryOrder) {
    CrawlQueue queue;
    EXPECT_TRUE(queue.empty());

    const auto first = queue.find_or_add("http://h/");
    const auto second = queue.find_or_add("http://h/a");
    EXPECT_TRUE(first.created);
    EXPECT_TRUE(second.created);
    EXPECT_EQ(first.id, 1u);
    EXPECT_EQ(second.id, 2u);
    EXPECT_EQ(queue.size(), 2u);
    EXPECT_EQ(queue.at(1).uri, "http://h/a");
    EXPECT_EQ(queue.at(1).state, RecordState::Queued);
}

TEST(CrawlQueueTest, DuplicateUriReturnsExistingRecord) {
    CrawlQueue queue;
    queue.find_or_add("http://h/");
    const auto again = queue.find_or_add("http://h/");
    EXPECT_FALSE(again.created);
    EXPECT_EQ(again.id, 1u);
    EXPECT_EQ(queue.size(), 1u);
}

TEST(CrawlQueueTest, LookupsByIdAndUri) {
    CrawlQueue queue;
    queue.find_or_add("http://h/");
    queue.find_or_add("http://h/b");

    ASSERT_NE(queue.find(2), nullptr);
    EXPECT_EQ(queue.find(2)->uri, "http://h/b");
    EXPECT_EQ(queue.find(0), nullptr);
    EXPECT_EQ(queue.find(3), nullptr);

    ASSERT_NE(queue.find_by_uri("http://h/"), nullptr);
    EXPECT_EQ(queue.find_by_uri("http://h/")->id, 1u);
    EXPECT_EQ(queue.find_by_uri("http://h/missing"), nullptr);
}

TEST(CrawlQueueTest, ReferencesSurviveGrowth) {
    CrawlQueue queue;
    queue.find_or_add("http://h/");
    CrawlRecord& first = queue.at(0);
    for (int i = 0; i < 1000; ++i) {
        queue.find_or_add("http://h/p" + std::to_string(i));
    }
    first.links_to.push_back(2);
    EXPECT_EQ(&first, &queue.at(0));
    EXPECT_EQ(queue.at(0).links_to.size(), 1u);
}

TEST(CrawlRecordTest, DurationNeedsBothTimestamps) {
    CrawlRecord record(1, "http://h/");
    EXPECT_FALSE(record.request_duration().has_value());

    const WallClock::time_point start = WallClock::time_point(std::chrono::seconds(100));
    record.request_started_at = start;
    EXPECT_FALSE(record.request_duration().has_value());

    record.request_finished_at = start + std::chrono::milliseconds(250);
    ASSERT_TRUE(record.request_duration().has_value());
    EXPECT_EQ(*record.request_duration(), std::chrono::milliseconds(250));
}

TEST(CrawlRecordTest, PassedChecksNeedsNoFailuresAndNoUnverifiedHeaders) {
    CrawlRecord record(1, "http://h/");
    EXPECT_TRUE(record.passed_checks());

    record.headers_not_verified["x-frame-options"] = std::nullopt;
    EXPECT_FALSE(record.passed_checks());

    record.headers_not_verified.clear();
    record.failure_reasons.push_back("Request failed: connection refused");
    EXPECT_FALSE(record.passed_checks());
}
