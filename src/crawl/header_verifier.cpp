#include "sitecheck/crawl/header_verifier.h"

#include <cctype>
#include <utility>

namespace sitecheck::crawl {
namespace {

std::string trim_ascii(const std::string& value) {
    std::size_t first = 0;
    while (first < value.size() && std::isspace(static_cast<unsigned char>(value[first]))) {
        ++first;
    }
    std::size_t last = value.size();
    while (last > first && std::isspace(static_cast<unsigned char>(value[last - 1]))) {
        --last;
    }
    return value.substr(first, last - first);
}

std::string to_lower_ascii(std::string value) {
    for (char& ch : value) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return value;
}

}  // namespace

bool parse_header_rule(const std::string& text, HeaderRule& rule, std::string& err) {
    rule = HeaderRule{};
    err.clear();

    const std::size_t colon = text.find(':');
    const std::string name = to_lower_ascii(trim_ascii(text.substr(0, colon)));
    if (name.empty()) {
        err = "Header rule has an empty header name: '" + text + "'";
        return false;
    }
    for (char ch : name) {
        if (std::isspace(static_cast<unsigned char>(ch)) || std::iscntrl(static_cast<unsigned char>(ch))) {
            err = "Header name contains whitespace: '" + name + "'";
            return false;
        }
    }
    rule.name = name;

    if (colon == std::string::npos || colon + 1 >= text.size()) {
        return true;
    }

    const std::string pattern = text.substr(colon + 1);
    try {
        rule.expression.emplace(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        err = "Invalid pattern for header '" + name + "': " + e.what();
        return false;
    }
    rule.pattern = pattern;
    return true;
}

void add_header_rule(HeaderRuleSet& rules, HeaderRule rule) {
    std::string key = rule.name;
    rules[std::move(key)] = std::move(rule);
}

bool header_rule_satisfied(const HeaderRule& rule,
                           const std::map<std::string, std::string>& headers) {
    const auto it = headers.find(rule.name);
    if (it == headers.end()) {
        return false;
    }
    if (rule.presence_only()) {
        return true;
    }
    if (it->second.empty() || !rule.expression) {
        return false;
    }
    return std::regex_search(it->second, *rule.expression);
}

void verify_headers(CrawlRecord& record, const HeaderRuleSet& rules) {
    for (const auto& [key, rule] : rules) {
        if (header_rule_satisfied(rule, record.headers)) {
            record.headers_not_verified.erase(key);
            record.headers_verified[key] = rule.pattern;
        } else {
            record.headers_verified.erase(key);
            record.headers_not_verified[key] = rule.pattern;
        }
    }
}

}  // namespace sitecheck::crawl
