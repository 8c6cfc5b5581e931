#pragma once

#include "sitecheck/net/url.h"

#include <string>

namespace sitecheck::crawl {

// True when `candidate` has the scheme, host and port of `base` and its
// path lies under the directory of base's path (everything up to and
// including the last '/'). Queries and fragments are ignored. Both URLs are
// expected in normalized form.
bool is_in_origin(const net::Url& base, const net::Url& candidate);

// Normalizes both sides first; a side that fails to parse is never in origin.
bool is_in_origin(const std::string& base, const std::string& candidate);

}  // namespace sitecheck::crawl
