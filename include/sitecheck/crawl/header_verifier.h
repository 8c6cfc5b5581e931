#pragma once

#include "sitecheck/crawl/crawl_record.h"

#include <map>
#include <optional>
#include <regex>
#include <string>

namespace sitecheck::crawl {

struct HeaderRule {
    std::string name;                     // lower-cased header name
    std::optional<std::string> pattern;   // nullopt: presence only
    std::optional<std::regex> expression; // compiled `pattern`

    bool presence_only() const { return !pattern.has_value(); }
};

// Keyed by header name; one rule per header.
using HeaderRuleSet = std::map<std::string, HeaderRule>;

// "name" or "name:pattern". Splits on the first ':'; an empty pattern means
// presence only. Fails on an empty name or a pattern that does not compile.
bool parse_header_rule(const std::string& text, HeaderRule& rule, std::string& err);

// Later rules for the same header replace earlier ones.
void add_header_rule(HeaderRuleSet& rules, HeaderRule rule);

bool header_rule_satisfied(const HeaderRule& rule,
                           const std::map<std::string, std::string>& headers);

// Files every rule under exactly one of record.headers_verified /
// record.headers_not_verified. Never touches failure_reasons.
void verify_headers(CrawlRecord& record, const HeaderRuleSet& rules);

}  // namespace sitecheck::crawl
