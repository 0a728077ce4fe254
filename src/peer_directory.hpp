#pragma once
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "share_types.hpp"

// Reachable peers as of the last reconciliation. Written only by the discovery
// sync loop; everyone else reads copies.
class PeerDirectory {
public:
  struct Changes {
    std::vector<PeerDiscovered> discovered; // inserted this pass, in live-set order
    std::vector<std::string> lost;          // removed this pass
  };

  // Makes the directory equal to `live`: inserts new fingerprints, refreshes
  // known ones in place, removes the missing ones. One lock for the whole pass.
  Changes reconcile(const PeerMap& live);

  PeerMap snapshot() const;
  std::optional<PeerEntry> find(const std::string& fingerprint) const;
  std::size_t size() const;

private:
  mutable std::mutex mutex_;
  PeerMap peers_;
};
