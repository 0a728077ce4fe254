#pragma once
#include <asio.hpp>

#include <chrono>
#include <cstddef>
#include <memory>

#include "channel.hpp"
#include "log.hpp"
#include "peer_directory.hpp"
#include "share_client.hpp"

// Periodically pulls the live peer set from the client and folds it into the
// directory, emitting PeerDiscovered/PeerLost for what changed.
class DiscoverySync : public std::enable_shared_from_this<DiscoverySync> {
public:
  DiscoverySync(asio::io_context& io,
                std::shared_ptr<ShareClient> client,
                std::shared_ptr<PeerDirectory> directory,
                std::shared_ptr<Channel<ShareEvent>> events,
                std::chrono::milliseconds interval,
                std::shared_ptr<Logger> logger = nullptr);

  // First cycle runs one interval after start.
  void start();
  void stop();

  // One reconciliation pass against `live`. Discoveries are emitted before losses.
  void reconcile(const PeerMap& live);

  std::size_t cycles() const { return cycles_; }
  bool running() const { return running_; }

private:
  void schedule_tick();
  void run_cycle();

  std::shared_ptr<ShareClient> client_;
  std::shared_ptr<PeerDirectory> directory_;
  std::shared_ptr<Channel<ShareEvent>> events_;
  std::chrono::milliseconds interval_;
  std::shared_ptr<Logger> logger_;
  asio::steady_timer timer_;
  bool running_ = false;
  std::size_t cycles_ = 0;
};
