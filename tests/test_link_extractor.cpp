#include "sitecheck/crawl/link_extractor.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace sitecheck::crawl;
using sitecheck::net::Url;

namespace {

Url normalized(const std::string& text) {
    Url url;
    std::string err;
    EXPECT_TRUE(sitecheck::net::normalize_url(text, url, err)) << err;
    return url;
}

}  // namespace

TEST(LinkExtractorTest, DedupsAndSkipsExternalLinks) {
    CrawlQueue queue;
    queue.find_or_add("http://example.test/");
    LinkExtractor extractor(normalized("http://example.test/"), queue);

    CrawlRecord& seed = queue.at(0);
    const std::string body =
        "<a href=\"/a\">A</a><a href=\"https://other.test/x\">ext</a><a href=\"/a\">dup</a>";
    EXPECT_EQ(extractor.extract(seed, body), 1u);

    ASSERT_EQ(queue.size(), 2u);
    EXPECT_EQ(queue.at(1).uri, "http://example.test/a");
    EXPECT_EQ(seed.links_to, (std::vector<RecordId>{2, 2}));
}

TEST(LinkExtractorTest, RerunOnSameBodyIsIdempotent) {
    CrawlQueue queue;
    queue.find_or_add("http://example.test/");
    LinkExtractor extractor(normalized("http://example.test/"), queue);
    CrawlRecord& seed = queue.at(0);
    const std::string body = "<a href=\"/a\">A</a><a href=\"/b\">B</a><a href=\"/a\">A</a>";

    extractor.extract(seed, body);
    const std::vector<RecordId> first_links = seed.links_to;
    const std::size_t first_size = queue.size();

    EXPECT_EQ(extractor.extract(seed, body), 0u);
    EXPECT_EQ(seed.links_to, first_links);
    EXPECT_EQ(queue.size(), first_size);
}

TEST(LinkExtractorTest, ResolvesRelativeToRecordAndNormalizes) {
    CrawlQueue queue;
    queue.find_or_add("http://example.test/docs/");
    queue.find_or_add("http://example.test/docs/guide/intro");
    LinkExtractor extractor(normalized("http://example.test/docs/"), queue);

    CrawlRecord& page = queue.at(1);
    const std::string body =
        "<a href=\"  next#part  \">n</a>"
        "<a href=\"../api/\">api</a>"
        "<a href=\"../../blog/\">outside</a>"
        "<a href=\"HTTP://EXAMPLE.TEST:80/docs/\">home</a>";
    EXPECT_EQ(extractor.extract(page, body), 2u);

    ASSERT_NE(queue.find_by_uri("http://example.test/docs/guide/next"), nullptr);
    ASSERT_NE(queue.find_by_uri("http://example.test/docs/api/"), nullptr);
    EXPECT_EQ(queue.find_by_uri("http://example.test/blog/"), nullptr);
    EXPECT_EQ(page.links_to, (std::vector<RecordId>{3, 4, 1}));
}

TEST(LinkExtractorTest, SkipsUnusableHrefs) {
    CrawlQueue queue;
    queue.find_or_add("http://example.test/");
    LinkExtractor extractor(normalized("http://example.test/"), queue);
    CrawlRecord& seed = queue.at(0);

    EXPECT_EQ(extractor.add_link(seed, "mailto:team@example.test"), LinkOutcome::Skipped);
    EXPECT_EQ(extractor.add_link(seed, "javascript:void(0)"), LinkOutcome::Skipped);
    EXPECT_EQ(extractor.add_link(seed, "https://example.test/"), LinkOutcome::Skipped);
    EXPECT_EQ(extractor.add_link(seed, "http://exa mple.test/"), LinkOutcome::Skipped);
    EXPECT_TRUE(seed.links_to.empty());
    EXPECT_EQ(queue.size(), 1u);
}

TEST(LinkExtractorTest, SelfLinksAndFragmentsPointAtExistingRecord) {
    CrawlQueue queue;
    queue.find_or_add("http://example.test/");
    LinkExtractor extractor(normalized("http://example.test/"), queue);
    CrawlRecord& seed = queue.at(0);

    EXPECT_EQ(extractor.add_link(seed, "#top"), LinkOutcome::Linked);
    EXPECT_EQ(extractor.add_link(seed, ""), LinkOutcome::Linked);
    EXPECT_EQ(seed.links_to, (std::vector<RecordId>{1, 1}));
}

TEST(LinkExtractorTest, NonHtmlBodyYieldsNoLinks) {
    CrawlQueue queue;
    queue.find_or_add("http://example.test/");
    LinkExtractor extractor(normalized("http://example.test/"), queue);
    EXPECT_EQ(extractor.extract(queue.at(0), "{\"json\": true}"), 0u);
    EXPECT_TRUE(queue.at(0).links_to.empty());
}

TEST(LinkExtractorTest, OutcomeNames) {
    EXPECT_STREQ(link_outcome_name(LinkOutcome::Skipped), "skipped");
    EXPECT_STREQ(link_outcome_name(LinkOutcome::Linked), "linked");
    EXPECT_STREQ(link_outcome_name(LinkOutcome::Discovered), "discovered");
}
