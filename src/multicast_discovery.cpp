#include "multicast_discovery.hpp"

#include <exception>
#include <system_error>

#include "protocol.hpp"

MulticastDiscovery::MulticastDiscovery(asio::io_context& io,
                                       std::string group,
                                       uint16_t port,
                                       std::shared_ptr<Logger> logger)
: socket_(io),
  group_(std::move(group)),
  port_(port),
  logger_(std::move(logger))
{
}

void MulticastDiscovery::start(AnnouncementHandler handler){
    const auto group = asio::ip::make_address(group_);
    if(!group.is_multicast()){
        throw std::system_error(std::make_error_code(std::errc::invalid_argument),
                                "'" + group_ + "' is not a multicast address");
    }
    group_endpoint_ = asio::ip::udp::endpoint(group, port_);

    socket_.open(asio::ip::udp::v4());
    socket_.set_option(asio::ip::udp::socket::reuse_address(true));
    socket_.bind(asio::ip::udp::endpoint(asio::ip::address_v4::any(), port_));
    socket_.set_option(asio::ip::multicast::join_group(group));
    // Several instances on one host must hear each other.
    socket_.set_option(asio::ip::multicast::enable_loopback(true));

    handler_ = std::move(handler);
    running_ = true;
    log_debug(logger_.get(), "multicast discovery on {}:{}", group_, port_);
    do_receive();
}

void MulticastDiscovery::stop(){
    if(!running_) return;
    running_ = false;
    std::error_code ec;
    socket_.close(ec);
}

void MulticastDiscovery::announce(const DeviceDescriptor& self, bool announce){
    if(!running_) return;
    auto message = std::make_shared<std::string>(make_announcement(self, announce).dump());
    auto self_ptr = shared_from_this();
    socket_.async_send_to(asio::buffer(*message), group_endpoint_,
        [this, self_ptr, message](std::error_code ec, std::size_t){
            if(ec && ec != asio::error::operation_aborted){
                log_warn(logger_.get(), "multicast announce failed: {}", ec.message());
            }
        });
}

void MulticastDiscovery::do_receive(){
    auto self = shared_from_this();
    socket_.async_receive_from(asio::buffer(buffer_), sender_,
        [this, self](std::error_code ec, std::size_t bytes){
            if(!running_ || ec == asio::error::operation_aborted) return;
            if(ec){
                log_debug(logger_.get(), "multicast receive error: {}", ec.message());
                do_receive();
                return;
            }

            auto j = json::parse(buffer_.data(), buffer_.data() + bytes, nullptr, false);
            DeviceDescriptor device;
            bool announce = false;
            std::string error;
            if(j.is_discarded()){
                log_debug(logger_.get(), "ignoring non-JSON datagram from {}",
                          sender_.address().to_string());
            } else if(!parse_announcement(j, device, announce, error)){
                log_debug(logger_.get(), "ignoring announcement from {}: {}",
                          sender_.address().to_string(), error);
            } else if(handler_){
                try {
                    handler_(device, announce, sender_.address());
                } catch(const std::exception& e){
                    log_warn(logger_.get(), "announcement from {} not handled: {}",
                             sender_.address().to_string(), e.what());
                }
            }
            do_receive();
        });
}
