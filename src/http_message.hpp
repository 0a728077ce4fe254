#pragma once
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Just enough HTTP/1.1 for one request per connection.

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

inline constexpr const char* kHeaderTerminator = "\r\n\r\n";
inline constexpr std::size_t kMaxHeadBytes = 16 * 1024;

struct HttpRequest {
  std::string method;
  std::string target;
  HttpHeaders headers;

  std::string path() const;
  std::map<std::string, std::string> query() const;
  std::optional<std::string> header(const std::string& name) const;
  // nullopt when absent; -1 when present but malformed.
  std::optional<long long> content_length() const;
  std::string serialize_head() const;
};

struct HttpResponse {
  int status = 0;
  std::string reason;
  HttpHeaders headers;
  std::string body;

  std::optional<std::string> header(const std::string& name) const;
  std::optional<long long> content_length() const;
  std::string serialize() const;
};

// `head` is everything up to and excluding the blank line.
bool parse_request_head(const std::string& head, HttpRequest& out, std::string& error);
bool parse_response_head(const std::string& head, HttpResponse& out, std::string& error);

std::map<std::string, std::string> parse_query(const std::string& target);
std::string url_encode(const std::string& text);
std::string url_decode(const std::string& text);

const char* reason_phrase(int status);

HttpResponse make_response(int status, std::string body = {},
                           const std::string& content_type = "application/json");
