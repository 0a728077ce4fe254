#pragma once
#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

enum class DeviceType { Mobile, Desktop, Web, Headless, Server };

const char* device_type_name(DeviceType type);
DeviceType parse_device_type(const std::string& text); // unknown -> Desktop

// What a peer says about itself in announcements and register calls.
struct DeviceDescriptor {
  std::string alias;
  std::string version = "2.0";
  std::string device_model;
  DeviceType device_type = DeviceType::Desktop;
  std::string fingerprint;
  uint16_t port = 53317;
  std::string protocol = "https";
  bool download = false;

  bool operator==(const DeviceDescriptor& other) const;
  bool operator!=(const DeviceDescriptor& other) const { return !(*this == other); }
};

void to_json(nlohmann::json& j, const DeviceDescriptor& d);
void from_json(const nlohmann::json& j, DeviceDescriptor& d);

// Non-throwing variant of from_json for untrusted input.
bool parse_device_descriptor(const nlohmann::json& j, DeviceDescriptor& out, std::string& error);
