#pragma once
#include <asio.hpp>
#include <asio/ssl.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "http_message.hpp"
#include "log.hpp"

struct HttpsRequest {
  asio::ip::tcp::endpoint endpoint;
  std::string method = "POST";
  std::string target;
  std::string content_type = "application/json";
  std::string body;
  // When set, the file is streamed as the body instead of `body`.
  std::filesystem::path body_file;
};

struct HttpsResult {
  std::string error; // empty on success, whatever the HTTP status
  HttpResponse response;

  bool ok() const { return error.empty(); }
};

// One request over one TLS connection. Every network wait is bounded by
// `timeout`; a stalled peer ends the exchange with a timeout error.
class HttpsExchange : public std::enable_shared_from_this<HttpsExchange> {
public:
  using Handler = std::function<void(HttpsResult)>;
  static constexpr std::size_t kChunkSize = 64 * 1024;
  static constexpr std::size_t kMaxResponseBytes = 4 * 1024 * 1024;

  static std::shared_ptr<HttpsExchange> start(asio::io_context& io,
                                              asio::ssl::context& tls,
                                              HttpsRequest request,
                                              std::chrono::milliseconds timeout,
                                              Handler handler,
                                              std::shared_ptr<Logger> logger = nullptr);

  // Aborts the exchange; the handler still runs once, with an error.
  void cancel();

private:
  HttpsExchange(asio::io_context& io,
                asio::ssl::context& tls,
                HttpsRequest request,
                std::chrono::milliseconds timeout,
                Handler handler,
                std::shared_ptr<Logger> logger);

  void run();
  void do_connect();
  void do_handshake();
  void do_write_head();
  void do_write_file_chunk();
  void do_read_head();
  void do_read_body();
  void arm_deadline();
  void complete(std::string error);
  std::string describe_error(const std::string& step, const std::error_code& ec) const;

  asio::ssl::stream<asio::ip::tcp::socket> stream_;
  asio::steady_timer deadline_;
  HttpsRequest request_;
  std::chrono::milliseconds timeout_;
  Handler handler_;
  std::shared_ptr<Logger> logger_;

  std::string head_;
  std::ifstream file_;
  uint64_t file_remaining_ = 0;
  std::vector<char> chunk_;
  asio::streambuf read_buf_;
  HttpResponse response_;
  bool timed_out_ = false;
  bool cancelled_ = false;
  bool done_ = false;
};
