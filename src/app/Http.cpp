#include "app/Http.hpp"
#include "util/Strings.hpp"
#include <charconv>

namespace sloguard::app {

namespace {

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

std::string url_decode(std::string_view s, bool plus_as_space) {
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    char c = s[i];
    if (c == '%' && i + 2 < s.size()) {
      int hi = hex_value(s[i + 1]);
      int lo = hex_value(s[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out += static_cast<char>(hi * 16 + lo);
        i += 2;
        continue;
      }
    }
    out += (plus_as_space && c == '+') ? ' ' : c;
  }
  return out;
}

std::map<std::string, std::string> parse_query(std::string_view qs) {
  std::map<std::string, std::string> out;
  while (!qs.empty()) {
    auto amp = qs.find('&');
    std::string_view pair = qs.substr(0, amp);
    if (!pair.empty()) {
      auto eq = pair.find('=');
      std::string key = url_decode(pair.substr(0, eq));
      std::string val = eq == std::string_view::npos ? std::string{} : url_decode(pair.substr(eq + 1));
      if (!key.empty()) out[std::move(key)] = std::move(val);
    }
    if (amp == std::string_view::npos) break;
    qs.remove_prefix(amp + 1);
  }
  return out;
}

ParseStatus parse_request(std::string_view raw, HttpRequest& out, size_t max_bytes) {
  size_t head_end = raw.find("\r\n\r\n");
  size_t sep = 4;
  if (head_end == std::string_view::npos) {
    head_end = raw.find("\n\n");
    sep = 2;
  }
  if (head_end == std::string_view::npos)
    return raw.size() >= max_bytes ? ParseStatus::TooLarge : ParseStatus::Incomplete;

  std::string_view head = raw.substr(0, head_end);
  auto line_end = head.find('\n');
  std::string_view request_line = sloguard::util::trim(head.substr(0, line_end));

  // METHOD SP TARGET SP VERSION
  auto sp1 = request_line.find(' ');
  if (sp1 == std::string_view::npos) return ParseStatus::Invalid;
  auto sp2 = request_line.find(' ', sp1 + 1);
  if (sp2 == std::string_view::npos) return ParseStatus::Invalid;
  std::string_view method = request_line.substr(0, sp1);
  std::string_view target = request_line.substr(sp1 + 1, sp2 - sp1 - 1);
  std::string_view version = request_line.substr(sp2 + 1);
  if (method.empty() || target.empty() || !version.starts_with("HTTP/")) return ParseStatus::Invalid;

  HttpRequest req{};
  req.method = std::string(method);
  auto qpos = target.find('?');
  req.path = url_decode(target.substr(0, qpos), false);
  if (qpos != std::string_view::npos) req.query = parse_query(target.substr(qpos + 1));

  std::string_view rest = line_end == std::string_view::npos ? std::string_view{} : head.substr(line_end + 1);
  while (!rest.empty()) {
    auto nl = rest.find('\n');
    std::string_view line = sloguard::util::trim(rest.substr(0, nl));
    if (!line.empty()) {
      auto colon = line.find(':');
      if (colon == std::string_view::npos) return ParseStatus::Invalid;
      req.headers[sloguard::util::to_lower(sloguard::util::trim(line.substr(0, colon)))] =
          std::string(sloguard::util::trim(line.substr(colon + 1)));
    }
    if (nl == std::string_view::npos) break;
    rest.remove_prefix(nl + 1);
  }

  size_t content_length = 0;
  if (auto it = req.headers.find("content-length"); it != req.headers.end()) {
    const auto& v = it->second;
    auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), content_length);
    if (ec != std::errc{} || ptr != v.data() + v.size()) return ParseStatus::Invalid;
  }
  size_t body_start = head_end + sep;
  if (body_start + content_length > max_bytes) return ParseStatus::TooLarge;
  if (raw.size() < body_start + content_length) return ParseStatus::Incomplete;
  req.body = std::string(raw.substr(body_start, content_length));
  out = std::move(req);
  return ParseStatus::Complete;
}

std::string_view reason_phrase(int status) {
  switch (status) {
    case 200: return "OK";
    case 201: return "Created";
    case 204: return "No Content";
    case 400: return "Bad Request";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 409: return "Conflict";
    case 413: return "Payload Too Large";
    case 500: return "Internal Server Error";
    case 503: return "Service Unavailable";
  }
  return "Unknown";
}

std::string format_head(const HttpResponse& resp) {
  std::string headers = "HTTP/1.1 ";
  char num[16];
  auto [p1, e1] = std::to_chars(num, num + sizeof(num), resp.status);
  headers.append(num, p1);
  headers += ' ';
  headers += reason_phrase(resp.status);
  headers += "\r\nContent-Type: ";
  headers += resp.content_type;
  headers += "\r\nConnection: close\r\nContent-Length: ";
  auto [p2, e2] = std::to_chars(num, num + sizeof(num), resp.body.size());
  headers.append(num, p2);
  headers += "\r\n\r\n";
  return headers;
}

} // namespace sloguard::app
