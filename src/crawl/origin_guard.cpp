#include "sitecheck/crawl/origin_guard.h"

namespace sitecheck::crawl {
namespace {

std::string path_only(const std::string& path_and_query) {
    const std::size_t query_pos = path_and_query.find('?');
    const std::string path =
        (query_pos == std::string::npos) ? path_and_query : path_and_query.substr(0, query_pos);
    return path.empty() ? "/" : path;
}

std::string base_directory(const std::string& path) {
    const std::size_t slash = path.rfind('/');
    if (slash == std::string::npos) {
        return "/";
    }
    return path.substr(0, slash + 1);
}

}  // namespace

bool is_in_origin(const net::Url& base, const net::Url& candidate) {
    if (base.scheme != candidate.scheme || base.host != candidate.host ||
        base.port != candidate.port) {
        return false;
    }

    const std::string prefix = base_directory(path_only(base.path_and_query));
    const std::string candidate_path = path_only(candidate.path_and_query);
    return candidate_path.compare(0, prefix.size(), prefix) == 0;
}

bool is_in_origin(const std::string& base, const std::string& candidate) {
    net::Url base_url;
    net::Url candidate_url;
    std::string err;
    if (!net::normalize_url(base, base_url, err) ||
        !net::normalize_url(candidate, candidate_url, err)) {
        return false;
    }
    return is_in_origin(base_url, candidate_url);
}

}  // namespace sitecheck::crawl
