#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <string_view>

namespace sloguard::app {

// Upper bound on one request (head + body) read by the API server.
inline constexpr size_t kMaxRequestBytes = 64 * 1024;

struct HttpRequest {
  std::string method;
  std::string path;                           // decoded, without query string
  std::map<std::string, std::string> query;
  std::map<std::string, std::string> headers; // names lowercased
  std::string body;
};

struct HttpResponse {
  int status{200};
  std::string content_type{"application/json"};
  std::string body;
};

enum class ParseStatus { Complete, Incomplete, Invalid, TooLarge };

// Parses an HTTP/1.x request from `raw`. Incomplete means more bytes are
// needed (head not terminated, or fewer body bytes than Content-Length).
ParseStatus parse_request(std::string_view raw, HttpRequest& out, size_t max_bytes = kMaxRequestBytes);

// Status line and headers including the blank line; Connection: close.
[[nodiscard]] std::string format_head(const HttpResponse& resp);

[[nodiscard]] std::string_view reason_phrase(int status);

// %XX and '+' decoding. Malformed escapes are kept literally.
[[nodiscard]] std::string url_decode(std::string_view s, bool plus_as_space = true);

[[nodiscard]] std::map<std::string, std::string> parse_query(std::string_view qs);

} // namespace sloguard::app
