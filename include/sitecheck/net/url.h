#pragma once

#include <string>

namespace sitecheck::net {

struct Url {
  std::string scheme;
  std::string host;
  int port = 0;
  std::string path_and_query;

  std::string to_string() const;
};

// 80 for http, 443 for https, 0 otherwise.
int default_port_for_scheme(const std::string& scheme);

bool parse_url(const std::string& input, Url& out, std::string& err);
// RFC 3986 section 5.2 reference resolution. The result may use any scheme;
// only http and https survive parse_url.
std::string resolve_url(const std::string& base_url, const std::string& ref, std::string& err);

// Canonical form used as the crawl identity key: lower-case scheme and host,
// default port omitted, dot segments removed, fragment dropped, escapes of
// unreserved characters decoded, other escapes upper-cased and bytes outside
// the URI character set percent-encoded.
bool normalize_url(const std::string& input, Url& out, std::string& err);
bool normalize_url(const std::string& input, std::string& out, std::string& err);

}  // namespace sitecheck::net
