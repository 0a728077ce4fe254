#pragma once
#include <asio.hpp>
#include <asio/ssl.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "https_client.hpp"
#include "multicast_discovery.hpp"
#include "share_client.hpp"
#include "tls_identity.hpp"
#include "transfer_server.hpp"

class SettingsManager;

struct LocalSendConfig {
  DeviceDescriptor device;
  TransferServerConfig server;
  std::string multicast_group = kDefaultMulticastGroup;
  uint16_t multicast_port = kDefaultPort;
  bool discovery = true;
  std::string bootstrap_peer;
  std::chrono::milliseconds announce_interval{5000};
  std::chrono::milliseconds peer_ttl{15000};
  std::chrono::milliseconds transfer_timeout{30000};
  std::filesystem::path identity_path;
};

LocalSendConfig config_from_settings(const SettingsManager& settings);

// ShareClient speaking LocalSend v2: multicast presence, HTTPS register,
// prepare-upload and upload.
class LocalSendClient : public ShareClient, public std::enable_shared_from_this<LocalSendClient> {
public:
  LocalSendClient(asio::io_context& io, LocalSendConfig config, std::shared_ptr<Logger> logger = nullptr);
  ~LocalSendClient() override;

  void configure_transport(const TransportOptions& options) override;
  void start() override;
  void stop() override;

  void async_peers(PeerSnapshotHandler handler) override;
  void async_send_file(const PeerTarget& target,
                       const std::filesystem::path& file_path,
                       TransferHandler handler) override;

  DeviceDescriptor local_device() const override;

  // Live peers after dropping the ones silent for longer than the TTL.
  PeerMap live_peers();

private:
  struct LivePeer {
    PeerEntry entry;
    std::chrono::steady_clock::time_point last_seen;
  };

  void record_peer(const DeviceDescriptor& device, const asio::ip::address& address);
  void on_announcement(const DeviceDescriptor& device, bool announce, const asio::ip::address& sender);
  void register_with(const asio::ip::tcp::endpoint& endpoint, bool multicast_fallback);
  void register_with_bootstrap();
  void schedule_announce();

  std::shared_ptr<HttpsExchange> exchange(HttpsRequest request, HttpsExchange::Handler handler);
  void upload(const PeerTarget& target,
              const std::filesystem::path& file_path,
              const UploadFile& file,
              const std::string& session_id,
              const std::string& token,
              TransferHandler handler);
  void send_cancel(const asio::ip::tcp::endpoint& endpoint, const std::string& session_id);

  asio::io_context& io_;
  LocalSendConfig config_;
  std::shared_ptr<Logger> logger_;
  asio::ssl::context client_tls_;
  asio::ssl::context server_tls_;
  std::optional<TlsIdentity> identity_;
  std::shared_ptr<TransferServer> server_;
  std::shared_ptr<MulticastDiscovery> discovery_;
  asio::steady_timer announce_timer_;
  asio::ip::tcp::resolver resolver_;
  std::list<std::weak_ptr<HttpsExchange>> exchanges_;
  bool configured_ = false;
  bool running_ = false;

  mutable std::mutex peers_mutex_;
  std::unordered_map<std::string, LivePeer> peers_;
};
