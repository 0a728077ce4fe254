#include "peer_directory.hpp"

PeerDirectory::Changes PeerDirectory::reconcile(const PeerMap& live) {
  Changes changes;
  std::lock_guard<std::mutex> lock(mutex_);

  for(const auto& [fingerprint, entry] : live) {
    auto it = peers_.find(fingerprint);
    if(it == peers_.end()) {
      peers_.emplace(fingerprint, entry);
      changes.discovered.push_back(PeerDiscovered{fingerprint, entry.descriptor, entry.address});
    } else {
      it->second = entry;
    }
  }

  for(auto it = peers_.begin(); it != peers_.end();) {
    if(live.find(it->first) == live.end()) {
      changes.lost.push_back(it->first);
      it = peers_.erase(it);
    } else {
      ++it;
    }
  }
  return changes;
}

PeerMap PeerDirectory::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peers_;
}

std::optional<PeerEntry> PeerDirectory::find(const std::string& fingerprint) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = peers_.find(fingerprint);
  if(it == peers_.end()) return std::nullopt;
  return it->second;
}

std::size_t PeerDirectory::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peers_.size();
}
