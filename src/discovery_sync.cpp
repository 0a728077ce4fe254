#include "discovery_sync.hpp"

DiscoverySync::DiscoverySync(asio::io_context& io,
                             std::shared_ptr<ShareClient> client,
                             std::shared_ptr<PeerDirectory> directory,
                             std::shared_ptr<Channel<ShareEvent>> events,
                             std::chrono::milliseconds interval,
                             std::shared_ptr<Logger> logger)
  : client_(std::move(client)),
    directory_(std::move(directory)),
    events_(std::move(events)),
    interval_(interval.count() > 0 ? interval : std::chrono::milliseconds(2000)),
    logger_(std::move(logger)),
    timer_(io) {}

void DiscoverySync::start() {
  if(running_) return;
  running_ = true;
  schedule_tick();
}

void DiscoverySync::stop() {
  running_ = false;
  timer_.cancel();
}

void DiscoverySync::schedule_tick() {
  timer_.expires_after(interval_);
  std::weak_ptr<DiscoverySync> weak = shared_from_this();
  timer_.async_wait([weak](const std::error_code& ec){
    auto self = weak.lock();
    if(ec || !self || !self->running_) return;
    self->run_cycle();
  });
}

void DiscoverySync::run_cycle() {
  std::weak_ptr<DiscoverySync> weak = shared_from_this();
  client_->async_peers([weak](PeerMap live){
    auto self = weak.lock();
    // A snapshot that arrives after stop() must not touch the directory.
    if(!self || !self->running_) return;
    self->reconcile(live);
    self->schedule_tick();
  });
}

void DiscoverySync::reconcile(const PeerMap& live) {
  auto changes = directory_->reconcile(live);
  ++cycles_;

  for(auto& discovered : changes.discovered) {
    log_debug(logger_.get(), "sync: discovered {} ({})",
              discovered.fingerprint, discovered.descriptor.alias);
    events_->send(std::move(discovered));
  }
  for(auto& fingerprint : changes.lost) {
    log_debug(logger_.get(), "sync: lost {}", fingerprint);
    events_->send(PeerLost{std::move(fingerprint)});
  }
}
