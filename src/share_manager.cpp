#include "share_manager.hpp"

#include <system_error>

#include "share_worker.hpp"

ShareManager::ShareManager(std::shared_ptr<Channel<ShareCommand>> commands,
                           std::shared_ptr<Channel<ShareEvent>> events,
                           std::shared_ptr<PeerDirectory> directory,
                           std::shared_ptr<ShareWorker> worker,
                           std::shared_ptr<Logger> logger)
  : commands_(std::move(commands)),
    events_(std::move(events)),
    directory_(std::move(directory)),
    worker_(std::move(worker)),
    logger_(std::move(logger)) {}

std::unique_ptr<ShareManager> ShareManager::create(Options options, std::string& error) {
  auto settings = options.settings ? *options.settings : SettingsManager();
  auto logger = options.logger ? std::move(options.logger) : std::make_shared<Logger>("share");

  auto commands = std::make_shared<Channel<ShareCommand>>();
  auto events = std::make_shared<Channel<ShareEvent>>();
  auto directory = std::make_shared<PeerDirectory>();
  auto worker = std::make_shared<ShareWorker>(std::move(settings),
                                              std::move(options.client_factory),
                                              commands, events, directory, logger);

  std::unique_ptr<ShareManager> manager(new ShareManager(commands, events, directory, worker, logger));
  try {
    manager->thread_ = std::thread([worker](){ worker->run(); });
  } catch(const std::system_error& e) {
    error = std::string("failed to start background thread: ") + e.what();
    // Nothing consumes commands without a thread.
    manager->commands_->close();
    return nullptr;
  }
  log_debug(logger.get(), "share manager started");
  return manager;
}

ShareManager::~ShareManager() {
  shutdown();
  // Dropping the sender side; the worker also drains on a closed channel.
  commands_->close();
  if(thread_.joinable()) {
    thread_.join();
  }
}

bool ShareManager::send_file(const std::string& peer_fingerprint,
                             const std::filesystem::path& file_path,
                             std::string& error) {
  if(!commands_->send(SendFileCommand{peer_fingerprint, file_path})) {
    error = "share worker is not running";
    return false;
  }
  return true;
}

PeerMap ShareManager::get_peers() const {
  return directory_->snapshot();
}

std::vector<ShareEvent> ShareManager::poll_events() {
  return events_->drain();
}

void ShareManager::shutdown() {
  if(shutdown_requested_.exchange(true)) return;
  if(!commands_->send(ShutdownCommand{})) {
    log_debug(logger_.get(), "shutdown: worker already stopped");
  }
}

WorkerState ShareManager::state() const {
  return worker_->state();
}

std::optional<DeviceDescriptor> ShareManager::local_device() const {
  return worker_->local_device();
}
