#pragma once
#include <functional>
#include <memory>

#include "channel.hpp"
#include "log.hpp"
#include "peer_directory.hpp"
#include "share_client.hpp"

// Runs one SendFile command against the client and reports its outcome.
// The caller must not dispatch again until `done` has fired.
class TransferDispatcher {
public:
  using DoneCallback = std::function<void()>;

  TransferDispatcher(std::shared_ptr<ShareClient> client,
                     std::shared_ptr<PeerDirectory> directory,
                     std::shared_ptr<Channel<ShareEvent>> events,
                     std::shared_ptr<Logger> logger = nullptr);

  // Emits TransferStarted now and exactly one of TransferComplete or
  // TransferFailed later, then calls `done`.
  void dispatch(const SendFileCommand& command, DoneCallback done);

  bool busy() const { return busy_; }

private:
  void finish(const std::string& fingerprint, const TransferOutcome& outcome, const DoneCallback& done);

  std::shared_ptr<ShareClient> client_;
  std::shared_ptr<PeerDirectory> directory_;
  std::shared_ptr<Channel<ShareEvent>> events_;
  std::shared_ptr<Logger> logger_;
  bool busy_ = false;
};
