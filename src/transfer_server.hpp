#pragma once
#include <asio.hpp>
#include <asio/ssl.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "device_info.hpp"
#include "http_message.hpp"
#include "log.hpp"
#include "protocol.hpp"

struct TransferServerConfig {
  std::string listen_ip = "0.0.0.0";
  uint16_t port = kDefaultPort;
  std::filesystem::path receive_dir = "received";
  bool accept_incoming = true;
  std::size_t max_body_bytes = 1024 * 1024;
  std::chrono::milliseconds timeout{30000};
};

class ServerConnection;

// HTTPS endpoint other devices push files to. Holds at most one upload session.
class TransferServer : public std::enable_shared_from_this<TransferServer> {
public:
  using DeviceProvider = std::function<DeviceDescriptor()>;
  using RegisterCallback = std::function<void(const DeviceDescriptor& device,
                                              const asio::ip::address& sender)>;

  TransferServer(asio::io_context& io,
                 asio::ssl::context& tls,
                 TransferServerConfig config,
                 DeviceProvider self,
                 RegisterCallback on_register,
                 std::shared_ptr<Logger> logger = nullptr);

  // Binds and starts accepting. Throws std::system_error when the port is taken.
  void start();
  // Closes the acceptor and every open connection; partial files are removed.
  void stop();

  uint16_t port() const { return bound_port_; }
  bool session_active() const { return session_.has_value(); }
  std::size_t files_received() const { return files_received_; }

private:
  friend class ServerConnection;

  struct PendingFile {
    UploadFile file;
    std::string token;
  };

  struct UploadSession {
    std::string id;
    std::string sender_fingerprint;
    std::string sender_alias;
    std::map<std::string, PendingFile> files;
    std::chrono::steady_clock::time_point last_activity;
  };

  // What an accepted upload request is allowed to write.
  struct UploadTicket {
    std::string session_id;
    std::string file_id;
    std::filesystem::path destination;
    uint64_t size = 0;
  };

  void do_accept();

  HttpResponse handle_info() const;
  HttpResponse handle_register(const std::string& body, const asio::ip::address& sender);
  HttpResponse handle_prepare_upload(const std::string& body);
  HttpResponse handle_cancel(const HttpRequest& request);

  // nullopt when the upload may proceed; otherwise the response to send.
  std::optional<HttpResponse> begin_upload(const HttpRequest& request, UploadTicket& ticket);
  HttpResponse finish_upload(const UploadTicket& ticket, const std::filesystem::path& part_file);
  void touch_session(const std::string& session_id);

  asio::io_context& io_;
  asio::ssl::context& tls_;
  TransferServerConfig config_;
  DeviceProvider self_;
  RegisterCallback on_register_;
  std::shared_ptr<Logger> logger_;
  asio::ip::tcp::acceptor acceptor_;
  uint16_t bound_port_ = 0;
  bool running_ = false;

  std::optional<UploadSession> session_;
  std::size_t files_received_ = 0;
  std::list<std::weak_ptr<ServerConnection>> connections_;
};
