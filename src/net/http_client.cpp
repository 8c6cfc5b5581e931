#include "sitecheck/net/http_client.h"

#include "sitecheck/net/url.h"

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <limits>
#include <string>

#ifdef SITECHECK_USE_OPENSSL
#include <openssl/ssl.h>
#include <openssl/x509v3.h>
#endif

namespace sitecheck::net {
namespace {

constexpr std::size_t kChunkSize = 16 * 1024;
constexpr std::size_t kMaxHeadBytes = 256 * 1024;

using SteadyClock = std::chrono::steady_clock;

std::string lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  return text;
}

std::string strip(const std::string& text) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  auto first = std::find_if_not(text.begin(), text.end(), is_space);
  auto last = std::find_if_not(text.rbegin(), text.rend(), is_space).base();
  return first < last ? std::string(first, last) : std::string();
}

std::string errno_text(const char* call) {
  return std::string(call) + " failed: " + std::strerror(errno);
}

// Non-blocking socket, optionally wrapped in TLS. Every wait is bounded by
// the time left before `deadline`; running out sets timed_out().
class Channel {
 public:
  explicit Channel(SteadyClock::time_point deadline) : deadline_(deadline) {}

  ~Channel() {
#ifdef SITECHECK_USE_OPENSSL
    if (ssl_) {
      SSL_free(ssl_);
    }
    if (ctx_) {
      SSL_CTX_free(ctx_);
    }
#endif
    if (fd_ >= 0) {
      close(fd_);
    }
  }

  Channel(const Channel&) = delete;
  Channel& operator=(const Channel&) = delete;

  bool timed_out() const { return timed_out_; }

  bool connect_to(const Url& url, std::string& err) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* found = nullptr;
    const int rc = getaddrinfo(url.host.c_str(), std::to_string(url.port).c_str(), &hints, &found);
    if (rc != 0) {
      err = "Cannot resolve " + url.host + ": " + gai_strerror(rc);
      return false;
    }

    err = "No address for " + url.host;
    for (addrinfo* addr = found; addr != nullptr && fd_ < 0; addr = addr->ai_next) {
      try_address(*addr, err);
      if (timed_out_) {
        break;
      }
    }
    freeaddrinfo(found);
    if (fd_ < 0) {
      return false;
    }
    err.clear();
    return url.scheme != "https" || start_tls(url.host, err);
  }

  bool send_all(const std::string& data, std::string& err) {
    std::size_t sent = 0;
    while (sent < data.size()) {
      const long rc = raw_write(data.data() + sent, data.size() - sent, err);
      if (rc < 0) {
        return false;
      }
      sent += static_cast<std::size_t>(rc);
    }
    return true;
  }

  // Appends what arrives to `into`. Returns false on error; `eof` is set
  // when the peer closed cleanly.
  bool receive(std::string& into, bool& eof, std::string& err) {
    char chunk[kChunkSize];
    const long rc = raw_read(chunk, sizeof(chunk), err);
    if (rc < 0) {
      return false;
    }
    eof = rc == 0;
    into.append(chunk, static_cast<std::size_t>(rc));
    return true;
  }

 private:
  int remaining_ms() const {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline_ - SteadyClock::now()).count();
    return left <= 0 ? 0 : static_cast<int>(std::min<long long>(left, std::numeric_limits<int>::max()));
  }

  bool wait_for(short events, std::string& err) {
    while (true) {
      const int budget = remaining_ms();
      if (budget == 0) {
        timed_out_ = true;
        err = "Request timed out";
        return false;
      }
      pollfd entry{fd_, events, 0};
      const int rc = poll(&entry, 1, budget);
      if (rc > 0) {
        return true;
      }
      if (rc < 0 && errno != EINTR) {
        err = errno_text("poll()");
        return false;
      }
    }
  }

  void try_address(const addrinfo& addr, std::string& err) {
    const int fd = socket(addr.ai_family, addr.ai_socktype, addr.ai_protocol);
    if (fd < 0) {
      err = errno_text("socket()");
      return;
    }
    fd_ = fd;
    const int flags = fcntl(fd_, F_GETFL, 0);
    if (flags < 0 || fcntl(fd_, F_SETFL, flags | O_NONBLOCK) < 0) {
      err = errno_text("fcntl()");
      drop_socket();
      return;
    }

    if (connect(fd_, addr.ai_addr, addr.ai_addrlen) == 0) {
      return;
    }
    if (errno != EINPROGRESS) {
      err = errno_text("connect()");
      drop_socket();
      return;
    }
    if (!wait_for(POLLOUT, err)) {
      drop_socket();
      return;
    }
    int so_error = 0;
    socklen_t length = sizeof(so_error);
    if (getsockopt(fd_, SOL_SOCKET, SO_ERROR, &so_error, &length) < 0 || so_error != 0) {
      err = std::string("connect() failed: ") + std::strerror(so_error != 0 ? so_error : errno);
      drop_socket();
    }
  }

  void drop_socket() {
    close(fd_);
    fd_ = -1;
  }

#ifdef SITECHECK_USE_OPENSSL
  // Maps an SSL result onto a poll wait; false when the call really failed.
  bool wait_for_tls(int rc, const char* what, std::string& err) {
    switch (SSL_get_error(ssl_, rc)) {
      case SSL_ERROR_WANT_READ:  return wait_for(POLLIN, err);
      case SSL_ERROR_WANT_WRITE: return wait_for(POLLOUT, err);
      default:
        err = std::string(what) + " failed";
        return false;
    }
  }
#endif

  bool start_tls(const std::string& host, std::string& err) {
#ifdef SITECHECK_USE_OPENSSL
    ctx_ = SSL_CTX_new(TLS_client_method());
    if (!ctx_ || SSL_CTX_set_default_verify_paths(ctx_) != 1) {
      err = "Cannot set up TLS context";
      return false;
    }
    SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
    SSL_CTX_set_options(ctx_, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif
    ssl_ = SSL_new(ctx_);
    if (!ssl_) {
      err = "Cannot create TLS session";
      return false;
    }
    SSL_set_tlsext_host_name(ssl_, host.c_str());
    SSL_set1_host(ssl_, host.c_str());
    SSL_set_fd(ssl_, fd_);

    while (true) {
      const int rc = SSL_connect(ssl_);
      if (rc == 1) {
        break;
      }
      if (!wait_for_tls(rc, "TLS handshake", err)) {
        return false;
      }
    }
    const long verdict = SSL_get_verify_result(ssl_);
    if (verdict != X509_V_OK) {
      err = std::string("TLS certificate rejected: ") + X509_verify_cert_error_string(verdict);
      return false;
    }
    return true;
#else
    (void)host;
    err = "https is unavailable: built without OpenSSL";
    return false;
#endif
  }

  long raw_write(const char* data, std::size_t size, std::string& err) {
    while (true) {
#ifdef SITECHECK_USE_OPENSSL
      if (ssl_) {
        const int rc = SSL_write(ssl_, data, static_cast<int>(std::min<std::size_t>(size, kChunkSize)));
        if (rc > 0) {
          return rc;
        }
        if (!wait_for_tls(rc, "TLS write", err)) {
          return -1;
        }
        continue;
      }
#endif
      const ssize_t rc = send(fd_, data, size, MSG_NOSIGNAL);
      if (rc >= 0) {
        return static_cast<long>(rc);
      }
      if (errno == EINTR) {
        continue;
      }
      if (errno != EAGAIN && errno != EWOULDBLOCK) {
        err = errno_text("send()");
        return -1;
      }
      if (!wait_for(POLLOUT, err)) {
        return -1;
      }
    }
  }

  long raw_read(char* data, std::size_t size, std::string& err) {
    while (true) {
#ifdef SITECHECK_USE_OPENSSL
      if (ssl_) {
        errno = 0;
        const int rc = SSL_read(ssl_, data, static_cast<int>(size));
        if (rc > 0) {
          return rc;
        }
        const int reason = SSL_get_error(ssl_, rc);
        // A bare close without close_notify also ends the body.
        if (reason == SSL_ERROR_ZERO_RETURN || (reason == SSL_ERROR_SYSCALL && errno == 0)) {
          return 0;
        }
        if (!wait_for_tls(rc, "TLS read", err)) {
          return -1;
        }
        continue;
      }
#endif
      const ssize_t rc = recv(fd_, data, size, 0);
      if (rc >= 0) {
        return static_cast<long>(rc);
      }
      if (errno == EINTR) {
        continue;
      }
      if (errno != EAGAIN && errno != EWOULDBLOCK) {
        err = errno_text("recv()");
        return -1;
      }
      if (!wait_for(POLLIN, err)) {
        return -1;
      }
    }
  }

  SteadyClock::time_point deadline_;
  int fd_ = -1;
  bool timed_out_ = false;
#ifdef SITECHECK_USE_OPENSSL
  SSL_CTX* ctx_ = nullptr;
  SSL* ssl_ = nullptr;
#endif
};

// Pulls a response off a Channel; `pending_` holds bytes read but not yet
// consumed.
class ResponseReader {
 public:
  explicit ResponseReader(Channel& channel) : channel_(channel) {}

  bool read_head(Response& response, std::string& err) {
    std::size_t end = 0;
    while ((end = pending_.find("\r\n\r\n")) == std::string::npos) {
      if (pending_.size() > kMaxHeadBytes) {
        err = "Response head too large";
        return false;
      }
      if (!more("response head", err)) {
        return false;
      }
    }
    const std::string head = pending_.substr(0, end);
    pending_.erase(0, end + 4);
    return parse_http_response_head(head, response, err);
  }

  bool read_sized(std::size_t length, std::string& body, std::string& err) {
    while (pending_.size() < length) {
      if (!more("body", err)) {
        return false;
      }
    }
    body = pending_.substr(0, length);
    pending_.erase(0, length);
    return true;
  }

  bool read_to_eof(std::string& body, std::string& err) {
    bool eof = false;
    while (!eof) {
      if (!channel_.receive(pending_, eof, err)) {
        return false;
      }
    }
    body.swap(pending_);
    pending_.clear();
    return true;
  }

  bool read_chunked(std::string& body, std::string& err) {
    body.clear();
    while (true) {
      std::string size_line;
      if (!read_line(size_line, err)) {
        return false;
      }
      std::size_t size = 0;
      if (!parse_chunk_size(size_line, size)) {
        err = "Bad chunk size: " + size_line;
        return false;
      }
      if (size == 0) {
        break;
      }
      std::string data;
      if (!read_sized(size, data, err)) {
        return false;
      }
      body += data;
      std::string terminator;
      if (!read_line(terminator, err)) {
        return false;
      }
      if (!terminator.empty()) {
        err = "Chunk not terminated by CRLF";
        return false;
      }
    }
    // Trailer section ends with an empty line.
    std::string trailer;
    do {
      if (!read_line(trailer, err)) {
        return false;
      }
    } while (!trailer.empty());
    return true;
  }

 private:
  bool more(const char* stage, std::string& err) {
    bool eof = false;
    if (!channel_.receive(pending_, eof, err)) {
      return false;
    }
    if (eof) {
      err = std::string("Connection closed while reading ") + stage;
      return false;
    }
    return true;
  }

  bool read_line(std::string& line, std::string& err) {
    std::size_t end = 0;
    while ((end = pending_.find("\r\n")) == std::string::npos) {
      if (!more("chunked body", err)) {
        return false;
      }
    }
    line = pending_.substr(0, end);
    pending_.erase(0, end + 2);
    return true;
  }

  static bool parse_chunk_size(const std::string& line, std::size_t& size) {
    const std::string digits = strip(line.substr(0, line.find(';')));
    if (digits.empty() || digits.size() > 2 * sizeof(std::size_t)) {
      return false;
    }
    size = 0;
    for (char ch : digits) {
      if (!std::isxdigit(static_cast<unsigned char>(ch))) {
        return false;
      }
      const int value = std::isdigit(static_cast<unsigned char>(ch))
                            ? ch - '0'
                            : std::tolower(static_cast<unsigned char>(ch)) - 'a' + 10;
      size = size * 16 + static_cast<std::size_t>(value);
    }
    return true;
  }

  Channel& channel_;
  std::string pending_;
};

bool parse_decimal(const std::string& text, std::size_t& value) {
  const std::string digits = strip(text);
  if (digits.empty() || digits.size() > 18 ||
      !std::all_of(digits.begin(), digits.end(),
                   [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
    return false;
  }
  value = static_cast<std::size_t>(std::stoull(digits));
  return true;
}

std::string host_header(const Url& url) {
  std::string host = url.host.find(':') != std::string::npos ? "[" + url.host + "]" : url.host;
  if (url.port != default_port_for_scheme(url.scheme)) {
    host += ":" + std::to_string(url.port);
  }
  return host;
}

std::string build_request(const Url& url, const FetchOptions& options) {
  return "GET " + url.path_and_query + " HTTP/1.1\r\n"
         "Host: " + host_header(url) + "\r\n"
         "User-Agent: " + options.user_agent + "\r\n"
         "Accept: text/html,application/xhtml+xml,*/*;q=0.8\r\n"
         "Accept-Encoding: identity\r\n"
         "Connection: close\r\n\r\n";
}

bool read_body(ResponseReader& reader, Response& response, std::string& err) {
  const int code = response.status_code;
  if ((code >= 100 && code < 200) || code == 204 || code == 304) {
    return true;
  }
  if (is_chunked_transfer(joined_header_value(response.headers, "transfer-encoding"))) {
    return reader.read_chunked(response.body, err);
  }
  const auto length = response.headers.find("content-length");
  if (length == response.headers.end()) {
    return reader.read_to_eof(response.body, err);
  }
  std::size_t size = 0;
  if (!parse_decimal(length->second, size)) {
    err = "Bad Content-Length: " + length->second;
    return false;
  }
  return reader.read_sized(size, response.body, err);
}

}  // namespace

Response fetch(const std::string& url, const FetchOptions& options) {
  Response response;
  Url target;
  if (!parse_url(url, target, response.error)) {
    return response;
  }

  const int timeout_ms = options.timeout_ms > 0 ? options.timeout_ms : core::config::kDefaultTimeoutMs;
  Channel channel(SteadyClock::now() + std::chrono::milliseconds(timeout_ms));
  ResponseReader reader(channel);
  std::string err;
  const bool done = channel.connect_to(target, err) &&
                    channel.send_all(build_request(target, options), err) &&
                    reader.read_head(response, err) &&
                    read_body(reader, response, err);
  if (!done) {
    response.error = err.empty() ? "Request failed" : err;
    response.timed_out = channel.timed_out();
  }
  return response;
}

bool parse_http_status_line(const std::string& status_line,
                            std::string& http_version,
                            int& status_code,
                            std::string& reason,
                            std::string& err) {
  const std::size_t first = status_line.find(' ');
  const std::string version = status_line.substr(0, first);
  const std::string code =
      first == std::string::npos ? "" : status_line.substr(first + 1, 3);
  const bool well_formed =
      version.compare(0, 5, "HTTP/") == 0 && code.size() == 3 &&
      std::all_of(code.begin(), code.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; }) &&
      (status_line.size() == first + 4 || status_line[first + 4] == ' ');
  if (!well_formed) {
    err = "Malformed status line: " + status_line;
    http_version.clear();
    status_code = 0;
    reason.clear();
    return false;
  }

  http_version = version;
  status_code = std::stoi(code);
  reason = strip(status_line.substr(std::min(status_line.size(), first + 4)));
  if (reason.empty()) {
    reason = reason_phrase_for_status(status_code);
  }
  err.clear();
  return true;
}

bool parse_http_response_head(const std::string& head, Response& response, std::string& err) {
  response.headers.clear();
  std::size_t line_end = head.find("\r\n");
  if (!parse_http_status_line(head.substr(0, line_end), response.http_version,
                              response.status_code, response.reason, err)) {
    return false;
  }

  while (line_end != std::string::npos) {
    const std::size_t start = line_end + 2;
    line_end = head.find("\r\n", start);
    const std::string line = head.substr(start, line_end == std::string::npos ? std::string::npos
                                                                              : line_end - start);
    const std::size_t colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    const std::string name = lower(strip(line.substr(0, colon)));
    if (!name.empty()) {
      response.headers.emplace(name, strip(line.substr(colon + 1)));
    }
  }
  return true;
}

const char* reason_phrase_for_status(int status_code) {
  struct Phrase {
    int code;
    const char* text;
  };
  static const Phrase kPhrases[] = {
      {100, "Continue"}, {101, "Switching Protocols"},
      {200, "OK"}, {201, "Created"}, {202, "Accepted"}, {203, "Non-Authoritative Information"},
      {204, "No Content"}, {205, "Reset Content"}, {206, "Partial Content"},
      {300, "Multiple Choices"}, {301, "Moved Permanently"}, {302, "Found"},
      {303, "See Other"}, {304, "Not Modified"}, {307, "Temporary Redirect"},
      {308, "Permanent Redirect"},
      {400, "Bad Request"}, {401, "Unauthorized"}, {402, "Payment Required"},
      {403, "Forbidden"}, {404, "Not Found"}, {405, "Method Not Allowed"},
      {406, "Not Acceptable"}, {408, "Request Timeout"}, {409, "Conflict"}, {410, "Gone"},
      {411, "Length Required"}, {412, "Precondition Failed"}, {413, "Content Too Large"},
      {414, "URI Too Long"}, {415, "Unsupported Media Type"}, {416, "Range Not Satisfiable"},
      {418, "I'm a teapot"}, {421, "Misdirected Request"}, {422, "Unprocessable Content"},
      {425, "Too Early"}, {426, "Upgrade Required"}, {428, "Precondition Required"},
      {429, "Too Many Requests"}, {431, "Request Header Fields Too Large"},
      {451, "Unavailable For Legal Reasons"},
      {500, "Internal Server Error"}, {501, "Not Implemented"}, {502, "Bad Gateway"},
      {503, "Service Unavailable"}, {504, "Gateway Timeout"}, {505, "HTTP Version Not Supported"},
      {511, "Network Authentication Required"},
  };
  for (const Phrase& phrase : kPhrases) {
    if (phrase.code == status_code) {
      return phrase.text;
    }
  }
  return "";
}

bool is_redirect_status(int status_code) {
  return status_code == 301 || status_code == 302 || status_code == 303 ||
         status_code == 307 || status_code == 308;
}

std::string joined_header_value(const HeaderMultimap& headers, const std::string& name_lower) {
  std::string joined;
  const auto range = headers.equal_range(name_lower);
  for (auto it = range.first; it != range.second; ++it) {
    if (it != range.first) {
      joined += " ";
    }
    joined += it->second;
  }
  return joined;
}

bool is_chunked_transfer(const std::string& transfer_encoding) {
  const std::size_t comma = transfer_encoding.rfind(',');
  const std::string last =
      comma == std::string::npos ? transfer_encoding : transfer_encoding.substr(comma + 1);
  return lower(strip(last)) == "chunked";
}

}  // namespace sitecheck::net
