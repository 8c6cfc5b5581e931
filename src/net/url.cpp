#include "sitecheck/net/url.h"

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace sitecheck::net {
namespace {

// The five components of a URI reference (RFC 3986 section 3). The
// has_* flags tell an absent component from an empty one.
struct Reference {
  std::string scheme;
  std::string authority;
  std::string path;
  std::string query;
  std::string fragment;
  bool has_scheme = false;
  bool has_authority = false;
  bool has_query = false;
  bool has_fragment = false;
};

bool is_alpha(char ch) {
  return std::isalpha(static_cast<unsigned char>(ch)) != 0;
}

bool is_unreserved(char ch) {
  return std::isalnum(static_cast<unsigned char>(ch)) != 0 ||
         ch == '-' || ch == '.' || ch == '_' || ch == '~';
}

bool is_sub_delim(char ch) {
  return std::string("!$&'()*+,;=").find(ch) != std::string::npos;
}

int hex_value(char ch) {
  if (ch >= '0' && ch <= '9') return ch - '0';
  if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
  if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
  return -1;
}

std::string lower(std::string text) {
  for (char& ch : text) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  return text;
}

Reference split(const std::string& text) {
  Reference ref;
  std::size_t pos = 0;

  const std::size_t colon = text.find(':');
  if (colon != std::string::npos && colon > 0 && is_alpha(text[0]) &&
      text.find_first_of("/?#") > colon) {
    bool scheme_chars = true;
    for (std::size_t i = 1; i < colon && scheme_chars; ++i) {
      const char ch = text[i];
      scheme_chars = std::isalnum(static_cast<unsigned char>(ch)) != 0 ||
                     ch == '+' || ch == '-' || ch == '.';
    }
    if (scheme_chars) {
      ref.has_scheme = true;
      ref.scheme = lower(text.substr(0, colon));
      pos = colon + 1;
    }
  }

  if (text.compare(pos, 2, "//") == 0) {
    const std::size_t end = text.find_first_of("/?#", pos + 2);
    ref.has_authority = true;
    ref.authority = text.substr(pos + 2, end == std::string::npos ? std::string::npos : end - pos - 2);
    pos = end == std::string::npos ? text.size() : end;
  }

  const std::size_t path_end = std::min(text.find_first_of("?#", pos), text.size());
  ref.path = text.substr(pos, path_end - pos);
  pos = path_end;

  if (pos < text.size() && text[pos] == '?') {
    const std::size_t end = std::min(text.find('#', pos), text.size());
    ref.has_query = true;
    ref.query = text.substr(pos + 1, end - pos - 1);
    pos = end;
  }
  if (pos < text.size()) {
    ref.has_fragment = true;
    ref.fragment = text.substr(pos + 1);
  }
  return ref;
}

std::string recompose(const Reference& ref) {
  std::string text;
  if (ref.has_scheme) text += ref.scheme + ":";
  if (ref.has_authority) text += "//" + ref.authority;
  text += ref.path;
  if (ref.has_query) text += "?" + ref.query;
  if (ref.has_fragment) text += "#" + ref.fragment;
  return text;
}

// RFC 3986 section 5.2.4. A trailing "." or ".." keeps the trailing slash.
std::string remove_dot_segments(const std::string& path) {
  const bool absolute = !path.empty() && path.front() == '/';
  std::vector<std::string> kept;
  bool trailing_slash = false;

  std::size_t start = absolute ? 1 : 0;
  while (start <= path.size()) {
    std::size_t slash = path.find('/', start);
    const bool last = slash == std::string::npos;
    const std::string segment = path.substr(start, last ? std::string::npos : slash - start);
    if (segment == "..") {
      if (!kept.empty()) kept.pop_back();
      trailing_slash = true;
    } else if (segment == ".") {
      trailing_slash = true;
    } else {
      kept.push_back(segment);
      trailing_slash = false;
    }
    if (last) break;
    start = slash + 1;
  }

  std::string out = absolute ? "/" : "";
  for (std::size_t i = 0; i < kept.size(); ++i) {
    if (i > 0) out += "/";
    out += kept[i];
  }
  if (trailing_slash && !out.empty() && out.back() != '/') {
    out += "/";
  }
  return out;
}

std::string merge_paths(const Reference& base, const std::string& relative) {
  if (base.has_authority && base.path.empty()) {
    return "/" + relative;
  }
  const std::size_t slash = base.path.rfind('/');
  return slash == std::string::npos ? relative : base.path.substr(0, slash + 1) + relative;
}

// Upper-cases escape hex, decodes escapes of unreserved characters and
// escapes every byte the component may not carry literally.
std::string canonical_escapes(const std::string& text, bool in_query) {
  static const char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    const char ch = text[i];
    if (ch == '%' && i + 2 < text.size() && hex_value(text[i + 1]) >= 0 &&
        hex_value(text[i + 2]) >= 0) {
      const char decoded = static_cast<char>(hex_value(text[i + 1]) * 16 + hex_value(text[i + 2]));
      if (is_unreserved(decoded)) {
        out += decoded;
      } else {
        out += '%';
        out += kHex[hex_value(text[i + 1])];
        out += kHex[hex_value(text[i + 2])];
      }
      i += 2;
    } else if (is_unreserved(ch) || is_sub_delim(ch) || ch == ':' || ch == '@' || ch == '/' ||
               (in_query && ch == '?')) {
      out += ch;
    } else {
      const unsigned char byte = static_cast<unsigned char>(ch);
      out += '%';
      out += kHex[byte >> 4];
      out += kHex[byte & 0x0F];
    }
  }
  return out;
}

bool parse_port(const std::string& digits, int& port) {
  if (digits.empty() || digits.size() > 5) {
    return false;
  }
  int value = 0;
  for (char ch : digits) {
    if (!std::isdigit(static_cast<unsigned char>(ch))) {
      return false;
    }
    value = value * 10 + (ch - '0');
  }
  if (value == 0 || value > 65535) {
    return false;
  }
  port = value;
  return true;
}

bool parse_authority(const std::string& authority, Url& out, std::string& err) {
  if (authority.empty()) {
    err = "URL is missing host";
    return false;
  }
  if (authority.find('@') != std::string::npos) {
    err = "User-info in URL is not supported";
    return false;
  }

  std::string host = authority;
  std::string port_text;
  if (authority.front() == '[') {
    const std::size_t close = authority.find(']');
    if (close == std::string::npos) {
      err = "Invalid IPv6 host: missing closing bracket";
      return false;
    }
    host = authority.substr(1, close - 1);
    const std::string rest = authority.substr(close + 1);
    if (!rest.empty() && rest.front() != ':') {
      err = "Invalid host/port separator";
      return false;
    }
    port_text = rest.empty() ? "" : rest.substr(1);
    for (char ch : host) {
      if (hex_value(ch) < 0 && ch != ':' && ch != '.') {
        err = "Invalid IPv6 host: " + host;
        return false;
      }
    }
  } else {
    const std::size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
      host = authority.substr(0, colon);
      port_text = authority.substr(colon + 1);
    }
    for (char ch : host) {
      if (!is_unreserved(ch) && !is_sub_delim(ch) && ch != '%') {
        err = "Invalid character in URL host: " + host;
        return false;
      }
    }
  }

  if (host.empty()) {
    err = "URL host is empty";
    return false;
  }
  out.host = host;
  out.port = default_port_for_scheme(out.scheme);
  // "http://host:/" keeps the default port.
  if (!port_text.empty() && !parse_port(port_text, out.port)) {
    err = "Invalid port: " + port_text;
    return false;
  }
  return true;
}

}  // namespace

int default_port_for_scheme(const std::string& scheme) {
  if (scheme == "http") return 80;
  if (scheme == "https") return 443;
  return 0;
}

std::string Url::to_string() const {
  std::string text = scheme + "://";
  text += host.find(':') != std::string::npos ? "[" + host + "]" : host;
  if (port != default_port_for_scheme(scheme)) {
    text += ":" + std::to_string(port);
  }
  if (path_and_query.empty() || path_and_query.front() != '/') {
    text += "/";
  }
  return text + path_and_query;
}

bool parse_url(const std::string& input, Url& out, std::string& err) {
  out = Url{};
  err.clear();
  if (input.empty()) {
    err = "URL is empty";
    return false;
  }

  const Reference ref = split(input);
  if (!ref.has_scheme || !ref.has_authority) {
    err = "URL must include scheme (http:// or https://)";
    return false;
  }
  if (ref.scheme != "http" && ref.scheme != "https") {
    err = "Unsupported URL scheme: " + ref.scheme;
    return false;
  }
  out.scheme = ref.scheme;
  if (!parse_authority(ref.authority, out, err)) {
    return false;
  }

  out.path_and_query = ref.path.empty() ? "/" : ref.path;
  if (ref.has_query) {
    out.path_and_query += "?" + ref.query;
  }
  return true;
}

std::string resolve_url(const std::string& base_url, const std::string& ref_text, std::string& err) {
  err.clear();
  const Reference base = split(base_url);
  if (!base.has_scheme) {
    err = "Base URL must include a valid scheme";
    return "";
  }

  const Reference ref = split(ref_text);
  Reference target;
  if (ref.has_scheme) {
    target = ref;
    target.path = remove_dot_segments(ref.path);
  } else {
    target.has_scheme = true;
    target.scheme = base.scheme;
    if (ref.has_authority) {
      target.has_authority = true;
      target.authority = ref.authority;
      target.path = remove_dot_segments(ref.path);
      target.has_query = ref.has_query;
      target.query = ref.query;
    } else {
      target.has_authority = base.has_authority;
      target.authority = base.authority;
      if (ref.path.empty()) {
        target.path = base.path;
        target.has_query = ref.has_query || base.has_query;
        target.query = ref.has_query ? ref.query : base.query;
      } else {
        target.path = remove_dot_segments(ref.path.front() == '/' ? ref.path
                                                                  : merge_paths(base, ref.path));
        target.has_query = ref.has_query;
        target.query = ref.query;
      }
    }
  }
  target.has_fragment = ref.has_fragment;
  target.fragment = ref.fragment;
  return recompose(target);
}

bool normalize_url(const std::string& input, Url& out, std::string& err) {
  if (!parse_url(input, out, err)) {
    return false;
  }
  out.host = lower(out.host);

  const std::size_t question = out.path_and_query.find('?');
  const std::string path = out.path_and_query.substr(0, question);
  std::string normalized = remove_dot_segments(canonical_escapes(path, false));
  if (normalized.empty()) {
    normalized = "/";
  }
  if (question != std::string::npos) {
    normalized += "?" + canonical_escapes(out.path_and_query.substr(question + 1), true);
  }
  out.path_and_query = normalized;
  return true;
}

bool normalize_url(const std::string& input, std::string& out, std::string& err) {
  Url parsed;
  if (!normalize_url(input, parsed, err)) {
    out.clear();
    return false;
  }
  out = parsed.to_string();
  return true;
}

}  // namespace sitecheck::net
