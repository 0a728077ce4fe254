#include "share_types.hpp"

#include <spdlog/fmt/fmt.h>

namespace {

std::string endpoint_text(const asio::ip::tcp::endpoint& ep) {
  return ep.address().to_string() + ":" + std::to_string(ep.port());
}

struct Describer {
  std::string operator()(const PeerDiscovered& e) const {
    return fmt::format("peer discovered: {} ({}, {}) at {}",
                       e.descriptor.alias, device_type_name(e.descriptor.device_type),
                       e.fingerprint, endpoint_text(e.address));
  }
  std::string operator()(const PeerLost& e) const {
    return fmt::format("peer lost: {}", e.fingerprint);
  }
  std::string operator()(const TransferStarted& e) const {
    return fmt::format("sending {} to {}", e.file_path.string(), e.peer_fingerprint);
  }
  std::string operator()(const TransferComplete& e) const {
    return fmt::format("transfer to {} complete", e.peer_fingerprint);
  }
  std::string operator()(const TransferFailed& e) const {
    return fmt::format("transfer to {} failed: {}", e.peer_fingerprint, e.error);
  }
  std::string operator()(const ErrorEvent& e) const {
    return fmt::format("error: {}", e.message);
  }
};

} // namespace

std::string describe(const ShareEvent& event) {
  return std::visit(Describer{}, event);
}

const char* worker_state_name(WorkerState state) {
  switch(state) {
    case WorkerState::Initializing: return "initializing";
    case WorkerState::Running:      return "running";
    case WorkerState::Draining:     return "draining";
    case WorkerState::Stopped:      return "stopped";
  }
  return "unknown";
}
