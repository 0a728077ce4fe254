#include "share_worker.hpp"

#include <chrono>
#include <stdexcept>
#include <type_traits>

#include "discovery_sync.hpp"
#include "transfer_dispatcher.hpp"

ShareWorker::ShareWorker(SettingsManager settings,
                         ShareClientFactory client_factory,
                         std::shared_ptr<Channel<ShareCommand>> commands,
                         std::shared_ptr<Channel<ShareEvent>> events,
                         std::shared_ptr<PeerDirectory> directory,
                         std::shared_ptr<Logger> logger)
  : settings_(std::move(settings)),
    client_factory_(client_factory ? std::move(client_factory) : localsend_client_factory()),
    commands_(std::move(commands)),
    events_(std::move(events)),
    directory_(std::move(directory)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("share")) {}

ShareWorker::~ShareWorker() = default;

std::optional<DeviceDescriptor> ShareWorker::local_device() const {
  std::lock_guard<std::mutex> lk(device_mutex_);
  return local_device_;
}

void ShareWorker::set_state(WorkerState state) {
  state_.store(state, std::memory_order_release);
  log_debug(logger_.get(), "worker state -> {}", worker_state_name(state));
}

void ShareWorker::fail(const std::string& message) {
  log_debug(logger_.get(), "worker failure: {}", message);
  events_->send(ErrorEvent{message});
}

bool ShareWorker::initialize() {
  const char* stage = "create client";
  try {
    client_ = client_factory_(io_, settings_, logger_);
    if(!client_) throw std::runtime_error("client factory returned nothing");

    stage = "configure transport";
    TransportOptions transport;
    transport.accept_self_signed = true;
    client_->configure_transport(transport);

    stage = "start client";
    client_->start();
    std::lock_guard<std::mutex> lk(device_mutex_);
    local_device_ = client_->local_device();
  } catch(const std::exception& e) {
    fail(std::string("failed to ") + stage + ": " + e.what());
    if(client_) client_->stop();
    return false;
  } catch(...) {
    fail(std::string("failed to ") + stage + ": unknown error");
    if(client_) client_->stop();
    return false;
  }

  const std::chrono::milliseconds interval(settings_.get<int>("sync_interval_ms"));
  sync_ = std::make_shared<DiscoverySync>(io_, client_, directory_, events_, interval, logger_);
  dispatcher_ = std::make_unique<TransferDispatcher>(client_, directory_, events_, logger_);
  return true;
}

void ShareWorker::run() {
  set_state(WorkerState::Initializing);
  if(!initialize()) {
    commands_->close();
    set_state(WorkerState::Stopped);
    return;
  }

  work_guard_.emplace(asio::make_work_guard(io_));
  set_state(WorkerState::Running);
  sync_->start();
  install_command_notifier();
  asio::post(io_, [self = shared_from_this()](){ self->process_next_command(); });

  while(true) {
    try {
      io_.run();
      break;
    } catch(const std::exception& e) {
      background_failure(e.what());
    } catch(...) {
      background_failure("unknown error");
    }
  }

  commands_->set_notifier(nullptr);
  commands_->close();

  // Let aborted operations run their handlers so nothing keeps us alive.
  io_.restart();
  try {
    io_.poll();
  } catch(const std::exception& e) {
    log_debug(logger_.get(), "handler failed while stopping: {}", e.what());
  } catch(...) {
    log_debug(logger_.get(), "handler failed while stopping");
  }
  dispatcher_.reset();
  sync_.reset();
  client_.reset();
  set_state(WorkerState::Stopped);
}

// A handler threw; nothing above us can recover it, so wind down.
void ShareWorker::background_failure(const std::string& what) {
  fail("background task failed: " + what);
  if(state() == WorkerState::Running) {
    begin_draining("background failure");
  } else if(!dispatcher_ || !dispatcher_->busy()) {
    stop_client();
  }
}

void ShareWorker::install_command_notifier() {
  std::weak_ptr<ShareWorker> weak = shared_from_this();
  commands_->set_notifier([weak](){
    auto self = weak.lock();
    if(!self || self->state() == WorkerState::Stopped) return;
    // Queued handlers hold the worker weakly; io_ belongs to it.
    asio::post(self->io_, [weak](){
      auto self = weak.lock();
      if(!self || !self->idle_) return;
      self->idle_ = false;
      self->process_next_command();
    });
  });
}

void ShareWorker::process_next_command() {
  if(state() == WorkerState::Draining) {
    // The transfer that held up draining has reported its outcome.
    if(!dispatcher_->busy()) stop_client();
    return;
  }
  if(state() != WorkerState::Running) return;

  auto command = commands_->try_receive();
  if(!command) {
    if(commands_->closed()) {
      begin_draining("command channel closed");
    } else {
      idle_ = true;
    }
    return;
  }

  std::visit([this](auto& cmd){
    using T = std::decay_t<decltype(cmd)>;
    if constexpr(std::is_same_v<T, ShutdownCommand>) {
      begin_draining("shutdown requested");
    } else {
      std::weak_ptr<ShareWorker> weak = shared_from_this();
      dispatcher_->dispatch(cmd, [weak](){
        auto self = weak.lock();
        if(!self) return;
        // Posted so a client that completes inline cannot recurse into us.
        asio::post(self->io_, [weak](){
          if(auto self = weak.lock()) self->process_next_command();
        });
      });
    }
  }, *command);
}

void ShareWorker::begin_draining(const std::string& reason) {
  if(state() != WorkerState::Running) return;
  set_state(WorkerState::Draining);
  log_debug(logger_.get(), "draining: {}", reason);

  // Commands still queued behind the shutdown are dropped.
  commands_->close();
  if(sync_) sync_->stop();

  // A failure can land mid-transfer; that transfer still reports its outcome
  // and the dispatcher's done callback comes back through process_next_command.
  if(dispatcher_ && dispatcher_->busy()) {
    log_debug(logger_.get(), "waiting for the running transfer");
    return;
  }
  stop_client();
}

void ShareWorker::stop_client() {
  if(client_stopped_) return;
  client_stopped_ = true;
  if(client_) client_->stop();
  asio::post(io_, [self = shared_from_this()](){ self->finish_draining(); });
}

void ShareWorker::finish_draining() {
  work_guard_.reset();
  io_.stop();
}
