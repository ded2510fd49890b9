#include "minitest.hpp"
#include "app/Http.hpp"
#include <string>

using namespace sloguard::app;

TEST(http_parse_get_with_query) {
  HttpRequest req{};
  auto st = parse_request("GET /api/v1/alerts?service=checkout&acknowledged=false&x HTTP/1.1\r\n"
                          "Host: localhost\r\nX-Trace-Id:  abc  \r\n\r\n", req);
  ASSERT_TRUE(st == ParseStatus::Complete);
  ASSERT_EQ(req.method, std::string("GET"));
  ASSERT_EQ(req.path, std::string("/api/v1/alerts"));
  ASSERT_EQ(req.query.at("service"), std::string("checkout"));
  ASSERT_EQ(req.query.at("acknowledged"), std::string("false"));
  ASSERT_TRUE(req.query.contains("x"));
  ASSERT_EQ(req.headers.at("host"), std::string("localhost"));
  ASSERT_EQ(req.headers.at("x-trace-id"), std::string("abc"));
  ASSERT_TRUE(req.body.empty());
}

TEST(http_parse_body_by_content_length) {
  std::string body = "{\"service_name\":\"api\"}";
  std::string raw = "POST /release/check HTTP/1.1\r\nContent-Type: application/json\r\nContent-Length: " +
                    std::to_string(body.size()) + "\r\n\r\n" + body;
  HttpRequest req{};
  ASSERT_TRUE(parse_request(raw, req) == ParseStatus::Complete);
  ASSERT_EQ(req.body, body);

  // Body still arriving
  HttpRequest partial{};
  ASSERT_TRUE(parse_request(raw.substr(0, raw.size() - 3), partial) == ParseStatus::Incomplete);
  // Head not terminated yet
  ASSERT_TRUE(parse_request("GET / HTTP/1.1\r\nHost: x\r\n", partial) == ParseStatus::Incomplete);
}

TEST(http_parse_bare_newlines) {
  HttpRequest req{};
  ASSERT_TRUE(parse_request("GET /health HTTP/1.0\nHost: x\n\n", req) == ParseStatus::Complete);
  ASSERT_EQ(req.path, std::string("/health"));
}

TEST(http_parse_rejects_garbage) {
  HttpRequest req{};
  ASSERT_TRUE(parse_request("HELLO\r\n\r\n", req) == ParseStatus::Invalid);
  ASSERT_TRUE(parse_request("GET / SMTP/1.0\r\n\r\n", req) == ParseStatus::Invalid);
  ASSERT_TRUE(parse_request("GET / HTTP/1.1\r\nno colon here\r\n\r\n", req) == ParseStatus::Invalid);
  ASSERT_TRUE(parse_request("POST / HTTP/1.1\r\nContent-Length: ten\r\n\r\n", req) == ParseStatus::Invalid);
}

TEST(http_parse_size_limit) {
  HttpRequest req{};
  std::string raw = "POST /metrics/ingest HTTP/1.1\r\nContent-Length: 5000\r\n\r\n";
  ASSERT_TRUE(parse_request(raw, req, 1024) == ParseStatus::TooLarge);
  std::string endless(2048, 'a');
  ASSERT_TRUE(parse_request(endless, req, 1024) == ParseStatus::TooLarge);
}

TEST(http_url_decoding) {
  ASSERT_EQ(url_decode("a%20b+c"), std::string("a b c"));
  ASSERT_EQ(url_decode("a+b", false), std::string("a+b"));
  ASSERT_EQ(url_decode("100%"), std::string("100%"));
  ASSERT_EQ(url_decode("%zz"), std::string("%zz"));
  ASSERT_EQ(url_decode("%2Fx"), std::string("/x"));
  auto q = parse_query("a=1&&b=two%20words&=skip&c=");
  ASSERT_EQ(q.size(), static_cast<size_t>(3));
  ASSERT_EQ(q.at("b"), std::string("two words"));
  ASSERT_EQ(q.at("c"), std::string(""));
}

TEST(http_format_head) {
  HttpResponse r{};
  r.status = 201;
  r.body = "{}";
  auto head = format_head(r);
  ASSERT_TRUE(head.starts_with("HTTP/1.1 201 Created\r\n"));
  ASSERT_TRUE(head.find("Content-Type: application/json\r\n") != std::string::npos);
  ASSERT_TRUE(head.find("Content-Length: 2\r\n") != std::string::npos);
  ASSERT_TRUE(head.find("Connection: close\r\n") != std::string::npos);
  ASSERT_TRUE(head.ends_with("\r\n\r\n"));
  ASSERT_EQ(reason_phrase(413), std::string_view("Payload Too Large"));
  ASSERT_EQ(reason_phrase(418), std::string_view("Unknown"));
}
