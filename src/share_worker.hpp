#pragma once

#include <asio.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "channel.hpp"
#include "log.hpp"
#include "peer_directory.hpp"
#include "settings_manager.hpp"
#include "share_client.hpp"
#include "share_types.hpp"

class DiscoverySync;
class TransferDispatcher;

// Everything that runs on the background thread: the io_context, the network
// client, the discovery sync loop and the command loop.
//
//   Initializing -> Running -> Draining -> Stopped
//
// Initialization failures skip straight to Stopped after an ErrorEvent.
class ShareWorker : public std::enable_shared_from_this<ShareWorker> {
public:
  ShareWorker(SettingsManager settings,
              ShareClientFactory client_factory,
              std::shared_ptr<Channel<ShareCommand>> commands,
              std::shared_ptr<Channel<ShareEvent>> events,
              std::shared_ptr<PeerDirectory> directory,
              std::shared_ptr<Logger> logger);
  ~ShareWorker();

  // Thread body. Returns once the worker reached Stopped.
  void run();

  WorkerState state() const { return state_.load(std::memory_order_acquire); }

  // This device as the client describes it; empty until the client started.
  std::optional<DeviceDescriptor> local_device() const;

private:
  using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;

  bool initialize();
  void install_command_notifier();
  void process_next_command();
  void begin_draining(const std::string& reason);
  void background_failure(const std::string& what);
  void stop_client();
  void finish_draining();
  void fail(const std::string& message);
  void set_state(WorkerState state);

  SettingsManager settings_;
  ShareClientFactory client_factory_;
  std::shared_ptr<Channel<ShareCommand>> commands_;
  std::shared_ptr<Channel<ShareEvent>> events_;
  std::shared_ptr<PeerDirectory> directory_;
  std::shared_ptr<Logger> logger_;

  asio::io_context io_;
  std::optional<WorkGuard> work_guard_;
  std::shared_ptr<ShareClient> client_;
  std::shared_ptr<DiscoverySync> sync_;
  std::unique_ptr<TransferDispatcher> dispatcher_;
  std::atomic<WorkerState> state_{WorkerState::Initializing};
  bool idle_ = false; // command loop parked until the notifier fires
  bool client_stopped_ = false;

  mutable std::mutex device_mutex_;
  std::optional<DeviceDescriptor> local_device_;
};
