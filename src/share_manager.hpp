#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "channel.hpp"
#include "log.hpp"
#include "peer_directory.hpp"
#include "settings_manager.hpp"
#include "share_client.hpp"
#include "share_types.hpp"

class ShareWorker;

// The only object a front end talks to. Discovery and transfers run on a
// background thread; the front end submits commands and polls events without
// ever blocking on the network.
class ShareManager {
public:
  struct Options {
    std::shared_ptr<SettingsManager> settings; // defaults when null
    ShareClientFactory client_factory;         // LocalSend client when empty
    std::shared_ptr<Logger> logger;            // Logger("share") when null
  };

  // Spawns the worker and returns immediately. Network start-up problems
  // arrive later as an ErrorEvent; nullptr only when no thread could be started.
  static std::unique_ptr<ShareManager> create(Options options, std::string& error);

  // Requests shutdown, then waits for the worker to finish its current transfer.
  ~ShareManager();

  ShareManager(const ShareManager&) = delete;
  ShareManager& operator=(const ShareManager&) = delete;

  // Queues a transfer. Fails only when the worker has already exited; the
  // outcome arrives as TransferStarted followed by TransferComplete/TransferFailed.
  bool send_file(const std::string& peer_fingerprint,
                 const std::filesystem::path& file_path,
                 std::string& error);

  // Copy of the peer directory as of the last reconciliation.
  PeerMap get_peers() const;

  // Everything queued since the previous call, oldest first. Never blocks.
  std::vector<ShareEvent> poll_events();

  // Idempotent; safe after the worker stopped.
  void shutdown();

  WorkerState state() const;
  std::optional<DeviceDescriptor> local_device() const;

private:
  ShareManager(std::shared_ptr<Channel<ShareCommand>> commands,
               std::shared_ptr<Channel<ShareEvent>> events,
               std::shared_ptr<PeerDirectory> directory,
               std::shared_ptr<ShareWorker> worker,
               std::shared_ptr<Logger> logger);

  std::shared_ptr<Channel<ShareCommand>> commands_;
  std::shared_ptr<Channel<ShareEvent>> events_;
  std::shared_ptr<PeerDirectory> directory_;
  std::shared_ptr<ShareWorker> worker_;
  std::shared_ptr<Logger> logger_;
  std::thread thread_;
  std::atomic<bool> shutdown_requested_{false};
};
