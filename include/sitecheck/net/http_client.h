#pragma once

#include "sitecheck/core/config.h"

#include <map>
#include <string>

namespace sitecheck::net {

// Header names are lower-cased; a header sent on several lines keeps one
// entry per line, in arrival order.
using HeaderMultimap = std::multimap<std::string, std::string>;

struct Response {
  int status_code = 0;
  std::string reason;
  std::string http_version;
  HeaderMultimap headers;
  std::string body;
  std::string error;
  bool timed_out = false;

  bool ok() const { return error.empty(); }
};

struct FetchOptions {
  // One deadline for connect, TLS, request and body. Name lookup is not
  // bounded by it.
  int timeout_ms = core::config::kDefaultTimeoutMs;
  std::string user_agent = core::config::kDefaultUserAgent;
};

// Single GET. Redirects are returned as-is. Transport problems land in
// `error`; `timed_out` is set when the deadline was what ended the exchange.
Response fetch(const std::string& url, const FetchOptions& options = {});

bool parse_http_status_line(const std::string& status_line,
                            std::string& http_version,
                            int& status_code,
                            std::string& reason,
                            std::string& err);

// Parses a status line followed by header lines (no trailing blank line).
bool parse_http_response_head(const std::string& head, Response& response, std::string& err);

// Standard reason phrase, or "" for unknown codes.
const char* reason_phrase_for_status(int status_code);

bool is_redirect_status(int status_code);

// All values of `name_lower` joined with a single space; "" when absent.
std::string joined_header_value(const HeaderMultimap& headers, const std::string& name_lower);

// True when the last transfer-coding in `transfer_encoding` is "chunked".
bool is_chunked_transfer(const std::string& transfer_encoding);

}  // namespace sitecheck::net
