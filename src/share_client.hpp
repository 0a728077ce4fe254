#pragma once
#include <asio.hpp>

#include <filesystem>
#include <functional>
#include <memory>
#include <string>

#include "log.hpp"
#include "share_types.hpp"

class SettingsManager;

struct TransportOptions {
  // Peers present self-signed certificates; there is nothing to verify against.
  bool accept_self_signed = true;
};

struct PeerTarget {
  std::string fingerprint;
  PeerEntry entry;
};

struct TransferOutcome {
  bool success = false;
  std::string error;
};

// Discovery and transfer capability driven by the share worker. All methods are
// called on the worker's io_context thread; handlers are invoked there too.
class ShareClient {
public:
  using PeerSnapshotHandler = std::function<void(PeerMap)>;
  using TransferHandler = std::function<void(TransferOutcome)>;

  virtual ~ShareClient() = default;

  // Throws when the transport cannot be set up.
  virtual void configure_transport(const TransportOptions& options) = 0;
  // Starts announcing, listening and serving inbound transfers. Throws on failure.
  virtual void start() = 0;
  // Closes every socket; pending handlers complete with errors.
  virtual void stop() = 0;

  virtual void async_peers(PeerSnapshotHandler handler) = 0;
  virtual void async_send_file(const PeerTarget& target,
                               const std::filesystem::path& file_path,
                               TransferHandler handler) = 0;

  virtual DeviceDescriptor local_device() const = 0;
};

using ShareClientFactory = std::function<std::shared_ptr<ShareClient>(
  asio::io_context& io,
  const SettingsManager& settings,
  std::shared_ptr<Logger> logger)>;

// The LocalSend v2 implementation.
ShareClientFactory localsend_client_factory();
