#pragma once
#include <asio.hpp>

#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "device_info.hpp"
#include "log.hpp"

// Presence announcements on a UDP multicast group.
class MulticastDiscovery : public std::enable_shared_from_this<MulticastDiscovery> {
public:
  using AnnouncementHandler = std::function<void(const DeviceDescriptor& device,
                                                 bool announce,
                                                 const asio::ip::address& sender)>;

  MulticastDiscovery(asio::io_context& io,
                     std::string group,
                     uint16_t port,
                     std::shared_ptr<Logger> logger = nullptr);

  // Binds, joins the group and starts receiving. Throws std::system_error.
  void start(AnnouncementHandler handler);
  void stop();

  // `announce` true asks receivers to answer; false is an answer.
  void announce(const DeviceDescriptor& self, bool announce);

  bool running() const { return running_; }

private:
  void do_receive();

  asio::ip::udp::socket socket_;
  std::string group_;
  uint16_t port_;
  std::shared_ptr<Logger> logger_;
  asio::ip::udp::endpoint group_endpoint_;
  asio::ip::udp::endpoint sender_;
  std::array<char, 8192> buffer_{};
  AnnouncementHandler handler_;
  bool running_ = false;
};
