#include "http_message.hpp"

#include <cctype>
#include <sstream>

#include "settings_manager.hpp"

namespace {

// Peer bytes quoted in an error message: printable ASCII only, bounded.
std::string excerpt(const std::string& text) {
  constexpr std::size_t kMaxExcerpt = 64;
  std::string out;
  for(char ch : text.substr(0, kMaxExcerpt)) {
    const auto byte = static_cast<unsigned char>(ch);
    out += (byte >= 0x20 && byte < 0x7f) ? ch : '?';
  }
  if(text.size() > kMaxExcerpt) out += "...";
  return out;
}

std::optional<std::string> find_header(const HttpHeaders& headers, const std::string& name) {
  const auto wanted = SettingsManager::to_lower(name);
  for(const auto& h : headers) {
    if(SettingsManager::to_lower(h.first) == wanted) return h.second;
  }
  return std::nullopt;
}

std::optional<long long> parse_content_length(const HttpHeaders& headers) {
  auto value = find_header(headers, "Content-Length");
  if(!value) return std::nullopt;
  const auto text = SettingsManager::trim_copy(*value);
  if(text.empty()) return -1;
  long long length = 0;
  for(char ch : text) {
    if(ch < '0' || ch > '9') return -1;
    length = length * 10 + (ch - '0');
    if(length > (1LL << 50)) return -1;
  }
  return length;
}

// Splits the head into lines and parses "Name: value" header lines after the first.
bool split_head(const std::string& head,
                std::string& start_line,
                HttpHeaders& headers,
                std::string& error) {
  std::istringstream in(head);
  std::string line;
  bool first = true;
  while(std::getline(in, line)) {
    if(!line.empty() && line.back() == '\r') line.pop_back();
    if(first) {
      start_line = line;
      first = false;
      continue;
    }
    if(line.empty()) continue;
    auto colon = line.find(':');
    if(colon == std::string::npos || colon == 0) {
      error = "malformed header line '" + excerpt(line) + "'";
      return false;
    }
    headers.emplace_back(SettingsManager::trim_copy(line.substr(0, colon)),
                         SettingsManager::trim_copy(line.substr(colon + 1)));
  }
  if(first || start_line.empty()) {
    error = "empty HTTP head";
    return false;
  }
  return true;
}

int hex_value(char ch) {
  if(ch >= '0' && ch <= '9') return ch - '0';
  if(ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
  if(ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
  return -1;
}

} // namespace

std::string HttpRequest::path() const {
  auto q = target.find('?');
  return q == std::string::npos ? target : target.substr(0, q);
}

std::map<std::string, std::string> HttpRequest::query() const {
  return parse_query(target);
}

std::optional<std::string> HttpRequest::header(const std::string& name) const {
  return find_header(headers, name);
}

std::optional<long long> HttpRequest::content_length() const {
  return parse_content_length(headers);
}

std::string HttpRequest::serialize_head() const {
  std::ostringstream out;
  out << method << " " << target << " HTTP/1.1\r\n";
  for(const auto& h : headers) out << h.first << ": " << h.second << "\r\n";
  out << "\r\n";
  return out.str();
}

std::optional<std::string> HttpResponse::header(const std::string& name) const {
  return find_header(headers, name);
}

std::optional<long long> HttpResponse::content_length() const {
  return parse_content_length(headers);
}

std::string HttpResponse::serialize() const {
  std::ostringstream out;
  out << "HTTP/1.1 " << status << " " << (reason.empty() ? reason_phrase(status) : reason) << "\r\n";
  bool has_length = false;
  for(const auto& h : headers) {
    if(SettingsManager::to_lower(h.first) == "content-length") has_length = true;
    out << h.first << ": " << h.second << "\r\n";
  }
  if(!has_length) out << "Content-Length: " << body.size() << "\r\n";
  out << "Connection: close\r\n\r\n" << body;
  return out.str();
}

bool parse_request_head(const std::string& head, HttpRequest& out, std::string& error) {
  std::string start_line;
  HttpHeaders headers;
  if(!split_head(head, start_line, headers, error)) return false;

  std::istringstream line(start_line);
  std::string method, target, version;
  line >> method >> target >> version;
  if(method.empty() || target.empty() || version.rfind("HTTP/1.", 0) != 0) {
    error = "malformed request line '" + excerpt(start_line) + "'";
    return false;
  }
  out.method = std::move(method);
  out.target = std::move(target);
  out.headers = std::move(headers);
  return true;
}

bool parse_response_head(const std::string& head, HttpResponse& out, std::string& error) {
  std::string start_line;
  HttpHeaders headers;
  if(!split_head(head, start_line, headers, error)) return false;

  if(start_line.rfind("HTTP/1.", 0) != 0) {
    error = "malformed status line '" + excerpt(start_line) + "'";
    return false;
  }
  auto first_space = start_line.find(' ');
  if(first_space == std::string::npos || first_space + 4 > start_line.size()) {
    error = "malformed status line '" + excerpt(start_line) + "'";
    return false;
  }
  int status = 0;
  for(std::size_t i = first_space + 1; i < first_space + 4; ++i) {
    char ch = start_line[i];
    if(ch < '0' || ch > '9') {
      error = "malformed status code in '" + excerpt(start_line) + "'";
      return false;
    }
    status = status * 10 + (ch - '0');
  }
  out.status = status;
  out.reason = first_space + 5 <= start_line.size() ? start_line.substr(first_space + 5) : "";
  out.headers = std::move(headers);
  return true;
}

std::map<std::string, std::string> parse_query(const std::string& target) {
  std::map<std::string, std::string> params;
  auto q = target.find('?');
  if(q == std::string::npos) return params;
  std::string rest = target.substr(q + 1);
  std::size_t start = 0;
  while(start <= rest.size()) {
    auto amp = rest.find('&', start);
    std::string pair = rest.substr(start, amp == std::string::npos ? std::string::npos : amp - start);
    if(!pair.empty()) {
      auto eq = pair.find('=');
      if(eq == std::string::npos) {
        params[url_decode(pair)] = "";
      } else {
        params[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
      }
    }
    if(amp == std::string::npos) break;
    start = amp + 1;
  }
  return params;
}

std::string url_encode(const std::string& text) {
  static const char* kHex = "0123456789ABCDEF";
  std::string out;
  for(unsigned char ch : text) {
    if(std::isalnum(ch) || ch == '-' || ch == '_' || ch == '.' || ch == '~') {
      out.push_back(static_cast<char>(ch));
    } else {
      out.push_back('%');
      out.push_back(kHex[ch >> 4]);
      out.push_back(kHex[ch & 0x0F]);
    }
  }
  return out;
}

std::string url_decode(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for(std::size_t i = 0; i < text.size(); ++i) {
    if(text[i] == '+') {
      out.push_back(' ');
    } else if(text[i] == '%' && i + 2 < text.size() &&
              hex_value(text[i + 1]) >= 0 && hex_value(text[i + 2]) >= 0) {
      out.push_back(static_cast<char>(hex_value(text[i + 1]) * 16 + hex_value(text[i + 2])));
      i += 2;
    } else {
      out.push_back(text[i]);
    }
  }
  return out;
}

const char* reason_phrase(int status) {
  switch(status) {
    case 200: return "OK";
    case 204: return "No Content";
    case 400: return "Bad Request";
    case 403: return "Forbidden";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 409: return "Conflict";
    case 413: return "Payload Too Large";
    case 429: return "Too Many Requests";
    case 431: return "Request Header Fields Too Large";
    case 500: return "Internal Server Error";
    default:  return "Unknown";
  }
}

HttpResponse make_response(int status, std::string body, const std::string& content_type) {
  HttpResponse response;
  response.status = status;
  response.reason = reason_phrase(status);
  if(!body.empty()) response.headers.emplace_back("Content-Type", content_type);
  response.body = std::move(body);
  return response;
}
