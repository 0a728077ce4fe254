#include "transfer_dispatcher.hpp"

#include <atomic>

TransferDispatcher::TransferDispatcher(std::shared_ptr<ShareClient> client,
                                       std::shared_ptr<PeerDirectory> directory,
                                       std::shared_ptr<Channel<ShareEvent>> events,
                                       std::shared_ptr<Logger> logger)
  : client_(std::move(client)),
    directory_(std::move(directory)),
    events_(std::move(events)),
    logger_(std::move(logger)) {}

void TransferDispatcher::dispatch(const SendFileCommand& command, DoneCallback done) {
  busy_ = true;
  const std::string fingerprint = command.peer_fingerprint;
  events_->send(TransferStarted{fingerprint, command.file_path});

  auto entry = directory_->find(fingerprint);
  if(!entry) {
    finish(fingerprint,
           TransferOutcome{false, "peer '" + fingerprint + "' is not in the peer directory"},
           done);
    return;
  }

  log_debug(logger_.get(), "transfer: {} -> {} ({}:{})",
            command.file_path.string(), entry->descriptor.alias,
            entry->address.address().to_string(), entry->address.port());

  // Clients should call back once; a second call must not report twice.
  auto reported = std::make_shared<std::atomic<bool>>(false);
  try {
    client_->async_send_file(PeerTarget{fingerprint, *entry}, command.file_path,
      [this, fingerprint, done, reported](TransferOutcome outcome){
        if(reported->exchange(true)) return;
        finish(fingerprint, outcome, done);
      });
  } catch(const std::exception& e) {
    if(!reported->exchange(true)) {
      finish(fingerprint, TransferOutcome{false, e.what()}, done);
    }
  }
}

void TransferDispatcher::finish(const std::string& fingerprint,
                                const TransferOutcome& outcome,
                                const DoneCallback& done) {
  if(outcome.success) {
    events_->send(TransferComplete{fingerprint});
  } else {
    std::string error = outcome.error.empty() ? std::string("transfer failed") : outcome.error;
    log_debug(logger_.get(), "transfer to {} failed: {}", fingerprint, error);
    events_->send(TransferFailed{fingerprint, std::move(error)});
  }
  busy_ = false;
  if(done) done();
}
