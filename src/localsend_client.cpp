#include "localsend_client.hpp"

#include <fstream>
#include <stdexcept>
#include <system_error>

#include "settings_manager.hpp"
#include "utils.hpp"

LocalSendConfig config_from_settings(const SettingsManager& settings){
    LocalSendConfig config;
    auto& device = config.device;
    device.alias = settings.get<std::string>("alias");
    if(device.alias.empty()) device.alias = local_host_name();
    device.version = kProtocolVersion;
    device.device_model = settings.get<std::string>("device_model");
    device.device_type = parse_device_type(settings.get<std::string>("device_type"));
    device.port = static_cast<uint16_t>(settings.get<int>("port"));
    device.protocol = "https";
    device.download = false;

    config.server.listen_ip = settings.get<std::string>("listen_ip");
    config.server.port = device.port;
    const auto receive_dir = settings.get<std::string>("receive_dir");
    config.server.receive_dir = receive_dir.empty() ? std::filesystem::path("received")
                                                    : std::filesystem::path(receive_dir);
    config.server.accept_incoming = settings.get<bool>("accept_incoming");
    config.server.max_body_bytes = static_cast<std::size_t>(settings.get<int>("max_body_bytes"));
    config.server.timeout = std::chrono::milliseconds(settings.get<int>("transfer_timeout_ms"));

    config.multicast_group = settings.get<std::string>("multicast_group");
    config.multicast_port = static_cast<uint16_t>(settings.get<int>("multicast_port"));
    config.discovery = settings.get<bool>("discovery");
    config.bootstrap_peer = settings.get<std::string>("bootstrap_peer");
    config.announce_interval = std::chrono::milliseconds(settings.get<int>("announce_interval_ms"));
    config.peer_ttl = std::chrono::milliseconds(settings.get<int>("peer_ttl_ms"));
    config.transfer_timeout = config.server.timeout;
    config.identity_path = settings.get<std::string>("identity_path");
    return config;
}

ShareClientFactory localsend_client_factory(){
    return [](asio::io_context& io, const SettingsManager& settings, std::shared_ptr<Logger> logger)
        -> std::shared_ptr<ShareClient> {
        return std::make_shared<LocalSendClient>(io, config_from_settings(settings), std::move(logger));
    };
}

LocalSendClient::LocalSendClient(asio::io_context& io, LocalSendConfig config, std::shared_ptr<Logger> logger)
: io_(io),
  config_(std::move(config)),
  logger_(std::move(logger)),
  client_tls_(asio::ssl::context::tls_client),
  server_tls_(asio::ssl::context::tls_server),
  announce_timer_(io),
  resolver_(io)
{
}

LocalSendClient::~LocalSendClient(){
    stop();
}

void LocalSendClient::configure_transport(const TransportOptions& options){
    // Peers present self-signed certificates; the fingerprint is the identity.
    client_tls_.set_verify_mode(options.accept_self_signed ? asio::ssl::verify_none : asio::ssl::verify_peer);
    if(!options.accept_self_signed) client_tls_.set_default_verify_paths();

    if(config_.identity_path.empty()){
        identity_ = TlsIdentity::generate(config_.device.alias);
    } else {
        identity_ = TlsIdentity::load_or_create(config_.identity_path, config_.device.alias);
    }
    server_tls_.set_options(asio::ssl::context::default_workarounds |
                            asio::ssl::context::no_sslv2 |
                            asio::ssl::context::no_sslv3);
    identity_->apply_to(server_tls_);
    config_.device.fingerprint = identity_->fingerprint();
    configured_ = true;
    log_debug(logger_.get(), "identity fingerprint {}", config_.device.fingerprint);
}

void LocalSendClient::start(){
    if(!configured_) throw std::logic_error("transport not configured");
    if(running_) return;

    std::weak_ptr<LocalSendClient> weak = shared_from_this();
    server_ = std::make_shared<TransferServer>(io_, server_tls_, config_.server,
        [weak](){
            auto self = weak.lock();
            return self ? self->local_device() : DeviceDescriptor{};
        },
        [weak](const DeviceDescriptor& device, const asio::ip::address& sender){
            if(auto self = weak.lock()) self->record_peer(device, sender);
        },
        logger_);
    server_->start();

    if(config_.discovery){
        discovery_ = std::make_shared<MulticastDiscovery>(io_, config_.multicast_group,
                                                          config_.multicast_port, logger_);
        try {
            discovery_->start([weak](const DeviceDescriptor& device, bool announce, const asio::ip::address& sender){
                if(auto self = weak.lock()) self->on_announcement(device, announce, sender);
            });
        } catch(const std::system_error&){
            server_->stop();
            throw;
        }
    }

    running_ = true;
    log_info(logger_.get(), "{} ready on port {} ({})", config_.device.alias, server_->port(),
             config_.discovery ? "multicast discovery" : "no multicast");
    if(discovery_) discovery_->announce(local_device(), true);
    register_with_bootstrap();
    schedule_announce();
}

void LocalSendClient::stop(){
    if(!running_) return;
    running_ = false;
    announce_timer_.cancel();
    resolver_.cancel();
    for(auto& weak : exchanges_){
        if(auto exchange = weak.lock()) exchange->cancel();
    }
    exchanges_.clear();
    if(discovery_) discovery_->stop();
    if(server_) server_->stop();
    log_debug(logger_.get(), "localsend client stopped");
}

DeviceDescriptor LocalSendClient::local_device() const{
    DeviceDescriptor device = config_.device;
    if(server_ && server_->port() != 0) device.port = server_->port();
    return device;
}

void LocalSendClient::async_peers(PeerSnapshotHandler handler){
    auto peers = live_peers();
    asio::post(io_, [handler = std::move(handler), peers = std::move(peers)]() mutable {
        handler(std::move(peers));
    });
}

PeerMap LocalSendClient::live_peers(){
    const auto now = std::chrono::steady_clock::now();
    PeerMap out;
    std::lock_guard<std::mutex> lk(peers_mutex_);
    for(auto it = peers_.begin(); it != peers_.end();){
        if(now - it->second.last_seen > config_.peer_ttl){
            log_debug(logger_.get(), "peer {} timed out", it->second.entry.descriptor.alias);
            it = peers_.erase(it);
            continue;
        }
        out.emplace(it->first, it->second.entry);
        ++it;
    }
    return out;
}

void LocalSendClient::record_peer(const DeviceDescriptor& device, const asio::ip::address& address){
    if(device.fingerprint.empty() || device.fingerprint == config_.device.fingerprint) return;

    std::lock_guard<std::mutex> lk(peers_mutex_);
    auto& peer = peers_[device.fingerprint];
    const bool fresh = peer.entry.descriptor.fingerprint.empty();
    peer.entry.address = asio::ip::tcp::endpoint(address, device.port);
    peer.entry.descriptor = device;
    peer.last_seen = std::chrono::steady_clock::now();
    if(fresh){
        log_debug(logger_.get(), "peer {} at {}:{}", device.alias, address.to_string(), device.port);
    }
}

void LocalSendClient::on_announcement(const DeviceDescriptor& device,
                                      bool announce,
                                      const asio::ip::address& sender){
    if(device.fingerprint == config_.device.fingerprint) return;
    record_peer(device, sender);
    if(announce && running_){
        register_with(asio::ip::tcp::endpoint(sender, device.port), true);
    }
}

void LocalSendClient::register_with(const asio::ip::tcp::endpoint& endpoint, bool multicast_fallback){
    HttpsRequest request;
    request.endpoint = endpoint;
    request.target = kRegisterPath;
    request.body = json(local_device()).dump();

    std::weak_ptr<LocalSendClient> weak = shared_from_this();
    exchange(std::move(request), [weak, endpoint, multicast_fallback](HttpsResult result){
        auto self = weak.lock();
        if(!self || !self->running_) return;
        if(result.ok() && result.response.status == 200){
            auto j = json::parse(result.response.body, nullptr, false);
            DeviceDescriptor device;
            std::string error;
            if(!j.is_discarded() && parse_device_descriptor(j, device, error)){
                self->record_peer(device, endpoint.address());
                return;
            }
            log_debug(self->logger_.get(), "register reply from {} unusable: {}",
                      endpoint.address().to_string(), j.is_discarded() ? "invalid JSON" : error);
        } else {
            log_debug(self->logger_.get(), "register with {}:{} failed: {}",
                      endpoint.address().to_string(), endpoint.port(),
                      result.ok() ? "HTTP " + std::to_string(result.response.status) : result.error);
        }
        if(multicast_fallback && self->discovery_){
            self->discovery_->announce(self->local_device(), false);
        }
    });
}

void LocalSendClient::register_with_bootstrap(){
    if(config_.bootstrap_peer.empty()) return;
    std::string host;
    unsigned short port = 0;
    if(!split_host_port(config_.bootstrap_peer, host, port)){
        log_warn(logger_.get(), "bootstrap peer '{}' is not host:port", config_.bootstrap_peer);
        return;
    }
    std::weak_ptr<LocalSendClient> weak = shared_from_this();
    resolver_.async_resolve(host, std::to_string(port),
        [weak, host, port](std::error_code ec, asio::ip::tcp::resolver::results_type results){
            auto self = weak.lock();
            if(!self || !self->running_ || ec == asio::error::operation_aborted) return;
            if(ec || results.empty()){
                log_warn(self->logger_.get(), "cannot resolve bootstrap peer {}:{}: {}",
                         host, port, ec ? ec.message() : std::string("no addresses"));
                return;
            }
            self->register_with(results.begin()->endpoint(), false);
        });
}

void LocalSendClient::schedule_announce(){
    announce_timer_.expires_after(config_.announce_interval);
    std::weak_ptr<LocalSendClient> weak = shared_from_this();
    announce_timer_.async_wait([weak](const std::error_code& ec){
        auto self = weak.lock();
        if(ec || !self || !self->running_) return;
        if(self->discovery_) self->discovery_->announce(self->local_device(), true);
        self->register_with_bootstrap();
        self->schedule_announce();
    });
}

std::shared_ptr<HttpsExchange> LocalSendClient::exchange(HttpsRequest request, HttpsExchange::Handler handler){
    exchanges_.remove_if([](const std::weak_ptr<HttpsExchange>& e){ return e.expired(); });
    auto ex = HttpsExchange::start(io_, client_tls_, std::move(request),
                                   config_.transfer_timeout, std::move(handler), logger_);
    exchanges_.push_back(ex);
    return ex;
}

void LocalSendClient::async_send_file(const PeerTarget& target,
                                      const std::filesystem::path& file_path,
                                      TransferHandler handler){
    auto fail_soon = [this, &handler](std::string error){
        asio::post(io_, [handler, error = std::move(error)](){
            handler(TransferOutcome{false, error});
        });
    };

    const auto& peer = target.entry.descriptor;
    if(!running_){
        fail_soon("client is not running");
        return;
    }
    if(peer.protocol != "https"){
        fail_soon("unsupported protocol '" + peer.protocol + "'");
        return;
    }

    std::error_code ec;
    if(!std::filesystem::is_regular_file(file_path, ec)){
        fail_soon("'" + file_path.string() + "' is not a regular file");
        return;
    }
    const auto size = std::filesystem::file_size(file_path, ec);
    if(ec || !std::ifstream(file_path, std::ios::binary)){
        fail_soon("cannot read '" + file_path.string() + "'");
        return;
    }

    UploadFile file;
    file.id = random_hex(8);
    file.file_name = file_path.filename().string();
    file.size = size;
    file.file_type = mime_type_for(file_path);

    HttpsRequest request;
    request.endpoint = target.entry.address;
    request.target = kPrepareUploadPath;
    request.body = make_prepare_upload(local_device(), {file}).dump();

    log_info(logger_.get(), "sending {} ({} bytes) to {}", file.file_name, size, peer.alias);
    std::weak_ptr<LocalSendClient> weak = shared_from_this();
    exchange(std::move(request), [weak, target, file_path, file, handler](HttpsResult result){
        auto self = weak.lock();
        if(!self){
            handler(TransferOutcome{false, "client stopped"});
            return;
        }
        if(!result.ok()){
            handler(TransferOutcome{false, "prepare-upload failed: " + result.error});
            return;
        }
        const auto status = result.response.status;
        if(status == 204){
            handler(TransferOutcome{true, ""});
            return;
        }
        if(status == 403){
            handler(TransferOutcome{false, "transfer rejected by " + target.entry.descriptor.alias});
            return;
        }
        if(status != 200){
            handler(TransferOutcome{false, "prepare-upload failed: HTTP " + std::to_string(status)});
            return;
        }

        auto j = json::parse(result.response.body, nullptr, false);
        std::string session_id;
        FileTokens tokens;
        std::string error;
        if(j.is_discarded() || !parse_prepare_upload_response(j, session_id, tokens, error)){
            handler(TransferOutcome{false, "prepare-upload failed: " +
                                           (j.is_discarded() ? std::string("invalid JSON") : error)});
            return;
        }
        auto token = tokens.find(file.id);
        if(token == tokens.end()){
            self->send_cancel(target.entry.address, session_id);
            handler(TransferOutcome{false, "prepare-upload failed: no token for " + file.file_name});
            return;
        }
        self->upload(target, file_path, file, session_id, token->second, handler);
    });
}

void LocalSendClient::upload(const PeerTarget& target,
                             const std::filesystem::path& file_path,
                             const UploadFile& file,
                             const std::string& session_id,
                             const std::string& token,
                             TransferHandler handler){
    HttpsRequest request;
    request.endpoint = target.entry.address;
    request.target = upload_target(session_id, file.id, token);
    request.content_type = file.file_type;
    request.body_file = file_path;

    std::weak_ptr<LocalSendClient> weak = shared_from_this();
    const auto endpoint = target.entry.address;
    exchange(std::move(request), [weak, endpoint, session_id, handler, name = file.file_name](HttpsResult result){
        auto self = weak.lock();
        std::string error;
        if(!result.ok()){
            error = "upload failed: " + result.error;
        } else if(result.response.status != 200){
            error = "upload failed: HTTP " + std::to_string(result.response.status);
        }
        if(error.empty()){
            if(self) log_info(self->logger_.get(), "sent {}", name);
            handler(TransferOutcome{true, ""});
            return;
        }
        if(self && self->running_) self->send_cancel(endpoint, session_id);
        handler(TransferOutcome{false, error});
    });
}

void LocalSendClient::send_cancel(const asio::ip::tcp::endpoint& endpoint, const std::string& session_id){
    HttpsRequest request;
    request.endpoint = endpoint;
    request.target = cancel_target(session_id);
    std::weak_ptr<LocalSendClient> weak = shared_from_this();
    exchange(std::move(request), [weak, session_id](HttpsResult result){
        auto self = weak.lock();
        if(self && !result.ok()){
            log_debug(self->logger_.get(), "cancel of session {} failed: {}", session_id, result.error);
        }
    });
}
