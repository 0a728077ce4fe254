#include "transfer_server.hpp"

#include <algorithm>
#include <exception>
#include <functional>
#include <fstream>
#include <system_error>
#include <vector>

#include "utils.hpp"

namespace {

// Peer-supplied strings may hold invalid UTF-8; never let dump() throw on them.
std::string to_wire(const json& j){
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string message_body(const std::string& message){
    return to_wire(json{{"message", message}});
}

} // namespace

// One inbound request: TLS handshake, head, body, response, close.
class ServerConnection : public std::enable_shared_from_this<ServerConnection> {
public:
    ServerConnection(asio::ip::tcp::socket sock,
                     asio::ssl::context& tls,
                     std::shared_ptr<TransferServer> server);
    ~ServerConnection();

    void start();
    void close();

private:
    void arm_deadline();
    void do_handshake();
    void do_read_head();
    void route();
    void read_body(std::size_t length, std::function<void()> next);
    void start_upload(const TransferServer::UploadTicket& ticket);
    void do_read_upload();
    bool write_part(const char* data, std::size_t length);
    void discard_part_file();
    void respond(const HttpResponse& response);
    // Runs one request step; an exception fails this connection only.
    void guard(const std::function<void()>& step);

    asio::ssl::stream<asio::ip::tcp::socket> stream_;
    asio::steady_timer deadline_;
    std::shared_ptr<TransferServer> server_;
    std::shared_ptr<Logger> logger_;
    asio::ip::address remote_;
    asio::streambuf read_buf_;
    HttpRequest request_;
    std::string body_;
    std::string response_bytes_;

    TransferServer::UploadTicket ticket_;
    std::filesystem::path part_path_;
    std::ofstream part_file_;
    uint64_t remaining_ = 0;
    std::vector<char> chunk_;
    bool closed_ = false;
    bool responded_ = false;
};

ServerConnection::ServerConnection(asio::ip::tcp::socket sock,
                                   asio::ssl::context& tls,
                                   std::shared_ptr<TransferServer> server)
: stream_(std::move(sock), tls),
  deadline_(server->io_),
  server_(std::move(server)),
  logger_(server_->logger_),
  read_buf_(kMaxHeadBytes)
{
    std::error_code ec;
    auto endpoint = stream_.lowest_layer().remote_endpoint(ec);
    if(!ec) remote_ = endpoint.address();
}

ServerConnection::~ServerConnection(){
    discard_part_file();
}

void ServerConnection::start(){
    do_handshake();
}

void ServerConnection::close(){
    if(closed_) return;
    closed_ = true;
    deadline_.cancel();
    std::error_code ignored;
    stream_.lowest_layer().close(ignored);
    discard_part_file();
}

void ServerConnection::arm_deadline(){
    deadline_.expires_after(server_->config_.timeout);
    std::weak_ptr<ServerConnection> weak = shared_from_this();
    deadline_.async_wait([weak](const std::error_code& ec){
        auto self = weak.lock();
        if(ec || !self) return;
        log_debug(self->logger_.get(), "connection from {} timed out", self->remote_.to_string());
        self->close();
    });
}

void ServerConnection::do_handshake(){
    arm_deadline();
    auto self = shared_from_this();
    stream_.async_handshake(asio::ssl::stream_base::server,
        [this, self](std::error_code ec){
            if(ec){
                log_debug(logger_.get(), "TLS handshake with {} failed: {}", remote_.to_string(), ec.message());
                close();
                return;
            }
            do_read_head();
        });
}

void ServerConnection::do_read_head(){
    arm_deadline();
    auto self = shared_from_this();
    asio::async_read_until(stream_, read_buf_, kHeaderTerminator,
        [this, self](std::error_code ec, std::size_t head_bytes){
            if(ec == asio::error::not_found){
                respond(make_response(431));
                return;
            }
            if(ec){
                close();
                return;
            }
            guard([this, head_bytes](){
                auto begin = asio::buffers_begin(read_buf_.data());
                std::string head(begin, begin + static_cast<std::ptrdiff_t>(head_bytes));
                read_buf_.consume(head_bytes);
                std::string error;
                if(!parse_request_head(head, request_, error)){
                    respond(make_response(400, message_body(error)));
                    return;
                }
                route();
            });
        });
}

void ServerConnection::route(){
    const auto path = request_.path();
    const auto& method = request_.method;
    log_debug(logger_.get(), "{} {} from {}", method, request_.target, remote_.to_string());

    const auto length = request_.content_length();
    if(length && *length < 0){
        respond(make_response(400, message_body("malformed Content-Length")));
        return;
    }
    const auto body_length = static_cast<std::size_t>(length.value_or(0));

    if(path == kUploadPath && method == "POST"){
        TransferServer::UploadTicket ticket;
        if(auto rejected = server_->begin_upload(request_, ticket)){
            respond(*rejected);
            return;
        }
        if(!length || static_cast<uint64_t>(*length) != ticket.size){
            respond(make_response(400, message_body("Content-Length does not match the announced size")));
            return;
        }
        start_upload(ticket);
        return;
    }

    if(path == kInfoPath && method == "GET"){
        respond(server_->handle_info());
        return;
    }

    const bool json_route = method == "POST" &&
        (path == kRegisterPath || path == kPrepareUploadPath || path == kCancelPath);
    if(!json_route){
        respond(make_response(404));
        return;
    }
    if(body_length > server_->config_.max_body_bytes){
        respond(make_response(413));
        return;
    }

    auto self = shared_from_this();
    read_body(body_length, [this, self, path](){
        if(path == kRegisterPath){
            respond(server_->handle_register(body_, remote_));
        } else if(path == kPrepareUploadPath){
            respond(server_->handle_prepare_upload(body_));
        } else {
            respond(server_->handle_cancel(request_));
        }
    });
}

void ServerConnection::read_body(std::size_t length, std::function<void()> next){
    body_.assign(length, '\0');
    const auto buffered = std::min(length, read_buf_.size());
    asio::buffer_copy(asio::buffer(body_), read_buf_.data(), buffered);
    read_buf_.consume(buffered);
    if(buffered == length){
        guard(next);
        return;
    }
    arm_deadline();
    auto self = shared_from_this();
    asio::async_read(stream_, asio::buffer(&body_[buffered], length - buffered),
        [this, self, next](std::error_code ec, std::size_t){
            if(ec){
                log_debug(logger_.get(), "reading body from {} failed: {}", remote_.to_string(), ec.message());
                close();
                return;
            }
            guard(next);
        });
}

void ServerConnection::start_upload(const TransferServer::UploadTicket& ticket){
    ticket_ = ticket;
    part_path_ = ticket.destination;
    part_path_ += ".part";
    part_file_.open(part_path_, std::ios::binary | std::ios::trunc);
    if(!part_file_){
        log_warn(logger_.get(), "cannot write {}", part_path_.string());
        part_path_.clear();
        respond(make_response(500, message_body("cannot store file")));
        return;
    }
    remaining_ = ticket.size;

    const auto buffered = static_cast<std::size_t>(std::min<uint64_t>(remaining_, read_buf_.size()));
    if(buffered > 0){
        std::string head_bytes(asio::buffers_begin(read_buf_.data()),
                               asio::buffers_begin(read_buf_.data()) + static_cast<std::ptrdiff_t>(buffered));
        read_buf_.consume(buffered);
        if(!write_part(head_bytes.data(), head_bytes.size())) return;
    }
    chunk_.resize(64 * 1024);
    do_read_upload();
}

bool ServerConnection::write_part(const char* data, std::size_t length){
    part_file_.write(data, static_cast<std::streamsize>(length));
    if(!part_file_){
        log_warn(logger_.get(), "write to {} failed", part_path_.string());
        discard_part_file();
        respond(make_response(500, message_body("cannot store file")));
        return false;
    }
    remaining_ -= length;
    server_->touch_session(ticket_.session_id);
    return true;
}

void ServerConnection::do_read_upload(){
    if(remaining_ == 0){
        part_file_.close();
        auto response = server_->finish_upload(ticket_, part_path_);
        part_path_.clear();
        respond(response);
        return;
    }
    arm_deadline();
    const auto want = static_cast<std::size_t>(std::min<uint64_t>(remaining_, chunk_.size()));
    auto self = shared_from_this();
    stream_.async_read_some(asio::buffer(chunk_.data(), want),
        [this, self](std::error_code ec, std::size_t bytes){
            if(ec){
                log_info(logger_.get(), "upload of {} from {} aborted: {}",
                         ticket_.destination.filename().string(), remote_.to_string(), ec.message());
                close();
                return;
            }
            guard([this, bytes](){
                if(!write_part(chunk_.data(), bytes)) return;
                do_read_upload();
            });
        });
}

void ServerConnection::discard_part_file(){
    if(part_path_.empty()) return;
    if(part_file_.is_open()) part_file_.close();
    std::error_code ec;
    std::filesystem::remove(part_path_, ec);
    part_path_.clear();
}

void ServerConnection::guard(const std::function<void()>& step){
    try {
        step();
    } catch(const std::exception& e){
        log_warn(logger_.get(), "request from {} failed: {}", remote_.to_string(), e.what());
        discard_part_file();
        if(responded_){
            close();
        } else {
            respond(make_response(500));
        }
    }
}

void ServerConnection::respond(const HttpResponse& response){
    if(closed_ || responded_) return;
    responded_ = true;
    response_bytes_ = response.serialize();
    arm_deadline();
    auto self = shared_from_this();
    asio::async_write(stream_, asio::buffer(response_bytes_),
        [this, self](std::error_code ec, std::size_t){
            if(ec){
                log_debug(logger_.get(), "response to {} failed: {}", remote_.to_string(), ec.message());
            }
            close();
        });
}

// ---------------------------------------------------------------------------

TransferServer::TransferServer(asio::io_context& io,
                               asio::ssl::context& tls,
                               TransferServerConfig config,
                               DeviceProvider self,
                               RegisterCallback on_register,
                               std::shared_ptr<Logger> logger)
: io_(io),
  tls_(tls),
  config_(std::move(config)),
  self_(std::move(self)),
  on_register_(std::move(on_register)),
  logger_(std::move(logger)),
  acceptor_(io)
{
}

void TransferServer::start(){
    asio::ip::tcp::endpoint endpoint(asio::ip::make_address(config_.listen_ip), config_.port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
    bound_port_ = acceptor_.local_endpoint().port();

    std::error_code ec;
    std::filesystem::create_directories(config_.receive_dir, ec);
    if(ec){
        log_warn(logger_.get(), "cannot create {}: {}", config_.receive_dir.string(), ec.message());
    }

    running_ = true;
    log_info(logger_.get(), "transfer server listening on {}:{}", config_.listen_ip, bound_port_);
    do_accept();
}

void TransferServer::stop(){
    if(!running_) return;
    running_ = false;
    std::error_code ec;
    acceptor_.close(ec);
    for(auto& weak : connections_){
        if(auto conn = weak.lock()) conn->close();
    }
    connections_.clear();
    session_.reset();
}

void TransferServer::do_accept(){
    auto self = shared_from_this();
    acceptor_.async_accept([this, self](std::error_code ec, asio::ip::tcp::socket sock){
        if(!running_) return;
        if(ec){
            log_debug(logger_.get(), "accept failed: {}", ec.message());
        } else {
            connections_.remove_if([](const std::weak_ptr<ServerConnection>& c){ return c.expired(); });
            auto conn = std::make_shared<ServerConnection>(std::move(sock), tls_, self);
            connections_.push_back(conn);
            conn->start();
        }
        do_accept();
    });
}

HttpResponse TransferServer::handle_info() const{
    return make_response(200, to_wire(json(self_())));
}

HttpResponse TransferServer::handle_register(const std::string& body, const asio::ip::address& sender){
    auto j = json::parse(body, nullptr, false);
    DeviceDescriptor device;
    std::string error;
    if(j.is_discarded() || !parse_device_descriptor(j, device, error)){
        return make_response(400, message_body(j.is_discarded() ? "invalid JSON" : error));
    }
    if(on_register_) on_register_(device, sender);
    return make_response(200, to_wire(json(self_())));
}

HttpResponse TransferServer::handle_prepare_upload(const std::string& body){
    if(!config_.accept_incoming){
        return make_response(403, message_body("incoming transfers are disabled"));
    }
    auto j = json::parse(body, nullptr, false);
    DeviceDescriptor sender;
    std::vector<UploadFile> files;
    std::string error;
    if(j.is_discarded()){
        return make_response(400, message_body("invalid JSON"));
    }
    if(!parse_prepare_upload(j, sender, files, error)){
        return make_response(400, message_body(error));
    }
    if(files.empty()){
        return make_response(204);
    }

    const auto now = std::chrono::steady_clock::now();
    if(session_){
        const bool same_sender = session_->sender_fingerprint == sender.fingerprint;
        const bool stale = now - session_->last_activity > config_.timeout;
        if(!same_sender && !stale){
            return make_response(409, message_body("blocked by another session"));
        }
        log_debug(logger_.get(), "replacing upload session {} from {}", session_->id, session_->sender_alias);
    }

    UploadSession session;
    session.id = random_hex(16);
    session.sender_fingerprint = sender.fingerprint;
    session.sender_alias = sender.alias;
    session.last_activity = now;
    FileTokens tokens;
    for(auto& f : files){
        PendingFile pending;
        pending.token = random_hex(16);
        tokens[f.id] = pending.token;
        pending.file = std::move(f);
        session.files[pending.file.id] = std::move(pending);
    }
    log_info(logger_.get(), "{} wants to send {} file(s)", sender.alias, session.files.size());
    session_ = std::move(session);
    return make_response(200, to_wire(make_prepare_upload_response(session_->id, tokens)));
}

HttpResponse TransferServer::handle_cancel(const HttpRequest& request){
    const auto query = request.query();
    auto it = query.find("sessionId");
    if(session_ && it != query.end() && it->second == session_->id){
        log_info(logger_.get(), "{} cancelled the transfer", session_->sender_alias);
        session_.reset();
    }
    return make_response(200);
}

std::optional<HttpResponse> TransferServer::begin_upload(const HttpRequest& request, UploadTicket& ticket){
    const auto query = request.query();
    auto session_id = query.find("sessionId");
    auto file_id = query.find("fileId");
    auto token = query.find("token");
    if(session_id == query.end() || file_id == query.end() || token == query.end()){
        return make_response(400, message_body("missing parameters"));
    }
    if(!session_ || session_->id != session_id->second){
        return make_response(403, message_body("invalid session"));
    }
    auto pending = session_->files.find(file_id->second);
    if(pending == session_->files.end()){
        return make_response(409, message_body("unknown file"));
    }
    if(pending->second.token != token->second){
        return make_response(403, message_body("invalid token"));
    }

    ticket.session_id = session_->id;
    ticket.file_id = file_id->second;
    ticket.size = pending->second.file.size;
    ticket.destination = unique_destination(config_.receive_dir,
                                            sanitize_file_name(pending->second.file.file_name));
    session_->last_activity = std::chrono::steady_clock::now();
    return std::nullopt;
}

HttpResponse TransferServer::finish_upload(const UploadTicket& ticket, const std::filesystem::path& part_file){
    // Another upload may have claimed the name while this one streamed.
    auto destination = ticket.destination;
    if(std::filesystem::exists(destination)){
        destination = unique_destination(destination.parent_path(), destination.filename().string());
    }
    std::error_code ec;
    std::filesystem::rename(part_file, destination, ec);
    if(ec){
        log_warn(logger_.get(), "cannot store {}: {}", destination.string(), ec.message());
        std::filesystem::remove(part_file, ec);
        return make_response(500, message_body("cannot store file"));
    }

    ++files_received_;
    std::string sender = "unknown sender";
    if(session_ && session_->id == ticket.session_id){
        sender = session_->sender_alias;
        session_->files.erase(ticket.file_id);
        if(session_->files.empty()) session_.reset();
    }
    log_info(logger_.get(), "received {} ({} bytes) from {}", destination.filename().string(), ticket.size, sender);
    return make_response(200);
}

void TransferServer::touch_session(const std::string& session_id){
    if(session_ && session_->id == session_id){
        session_->last_activity = std::chrono::steady_clock::now();
    }
}
