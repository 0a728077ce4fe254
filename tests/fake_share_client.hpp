#pragma once

#include "settings_manager.hpp"
#include "share_client.hpp"

#include <asio.hpp>

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace share::test {

inline PeerEntry make_peer(const std::string& fingerprint,
                           const std::string& alias,
                           uint16_t port = 53317) {
  PeerEntry entry;
  entry.address = asio::ip::tcp::endpoint(asio::ip::make_address("192.168.1.10"), port);
  entry.descriptor.alias = alias;
  entry.descriptor.fingerprint = fingerprint;
  entry.descriptor.port = port;
  entry.descriptor.device_model = "fake";
  return entry;
}

// What the scripted client sees and does; shared between the test thread and
// the worker thread.
class FakeNetwork {
public:
  struct Send {
    std::string fingerprint;
    std::filesystem::path path;
  };

  void set_peers(PeerMap peers) {
    std::lock_guard<std::mutex> lock(mutex_);
    peers_ = std::move(peers);
  }
  PeerMap peers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peers_;
  }

  void fail_start_with(std::string error) {
    std::lock_guard<std::mutex> lock(mutex_);
    start_error_ = std::move(error);
  }
  std::string start_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return start_error_;
  }

  void fail_transfers_to(const std::string& fingerprint, std::string error) {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_[fingerprint] = std::move(error);
  }

  // Every transfer also posts a handler that throws `what` on the worker thread.
  void throw_during_transfers(std::string what) {
    std::lock_guard<std::mutex> lock(mutex_);
    transfer_throw_ = std::move(what);
  }
  std::string transfer_throw() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transfer_throw_;
  }

  void set_transfer_delay(std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(mutex_);
    transfer_delay_ = delay;
  }
  std::chrono::milliseconds transfer_delay() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transfer_delay_;
  }

  // Records the send; returns the scripted error, empty for success.
  std::string begin_send(const std::string& fingerprint, const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    sends_.push_back({fingerprint, path});
    ++in_flight_;
    if(in_flight_ > max_in_flight_) max_in_flight_ = in_flight_;
    auto it = failures_.find(fingerprint);
    return it == failures_.end() ? std::string() : it->second;
  }
  void end_send() {
    std::lock_guard<std::mutex> lock(mutex_);
    --in_flight_;
  }

  std::vector<Send> sends() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sends_;
  }
  int in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
  }
  int max_in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return max_in_flight_;
  }

  void count_start() { std::lock_guard<std::mutex> lock(mutex_); ++starts_; }
  void count_stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stops_;
    in_flight_at_stop_ = in_flight_;
  }
  void count_query() { std::lock_guard<std::mutex> lock(mutex_); ++queries_; }
  int starts() const { std::lock_guard<std::mutex> lock(mutex_); return starts_; }
  int stops() const { std::lock_guard<std::mutex> lock(mutex_); return stops_; }
  int queries() const { std::lock_guard<std::mutex> lock(mutex_); return queries_; }
  int in_flight_at_stop() const { std::lock_guard<std::mutex> lock(mutex_); return in_flight_at_stop_; }

private:
  mutable std::mutex mutex_;
  PeerMap peers_;
  std::string start_error_;
  std::map<std::string, std::string> failures_;
  std::string transfer_throw_;
  std::chrono::milliseconds transfer_delay_{20};
  std::vector<Send> sends_;
  int in_flight_ = 0;
  int max_in_flight_ = 0;
  int starts_ = 0;
  int stops_ = 0;
  int queries_ = 0;
  int in_flight_at_stop_ = -1;
};

class FakeShareClient : public ShareClient {
public:
  FakeShareClient(asio::io_context& io, std::shared_ptr<FakeNetwork> network)
    : io_(io), network_(std::move(network)) {}

  void configure_transport(const TransportOptions& options) override {
    accept_self_signed_ = options.accept_self_signed;
  }

  void start() override {
    auto error = network_->start_error();
    if(!error.empty()) throw std::runtime_error(error);
    network_->count_start();
  }

  void stop() override {
    network_->count_stop();
  }

  void async_peers(PeerSnapshotHandler handler) override {
    network_->count_query();
    asio::post(io_, [handler = std::move(handler), peers = network_->peers()]() mutable {
      handler(std::move(peers));
    });
  }

  void async_send_file(const PeerTarget& target,
                       const std::filesystem::path& file_path,
                       TransferHandler handler) override {
    auto error = network_->begin_send(target.fingerprint, file_path);
    auto timer = std::make_shared<asio::steady_timer>(io_, network_->transfer_delay());
    auto network = network_;
    timer->async_wait([timer, network, handler, error](const std::error_code&){
      network->end_send();
      handler(TransferOutcome{error.empty(), error});
    });
    auto what = network_->transfer_throw();
    if(!what.empty()) {
      asio::post(io_, [what](){ throw std::runtime_error(what); });
    }
  }

  DeviceDescriptor local_device() const override {
    DeviceDescriptor self;
    self.alias = "fake-self";
    self.fingerprint = "fake-self-fingerprint";
    return self;
  }

private:
  asio::io_context& io_;
  std::shared_ptr<FakeNetwork> network_;
  bool accept_self_signed_ = false;
};

inline ShareClientFactory fake_client_factory(std::shared_ptr<FakeNetwork> network) {
  return [network](asio::io_context& io, const SettingsManager&, std::shared_ptr<Logger>)
      -> std::shared_ptr<ShareClient> {
    return std::make_shared<FakeShareClient>(io, network);
  };
}

} // namespace share::test
