#include "device_info.hpp"

#include "settings_manager.hpp"

const char* device_type_name(DeviceType type) {
  switch(type) {
    case DeviceType::Mobile:   return "mobile";
    case DeviceType::Desktop:  return "desktop";
    case DeviceType::Web:      return "web";
    case DeviceType::Headless: return "headless";
    case DeviceType::Server:   return "server";
  }
  return "desktop";
}

DeviceType parse_device_type(const std::string& text) {
  const auto lowered = SettingsManager::to_lower(text);
  if(lowered == "mobile") return DeviceType::Mobile;
  if(lowered == "web") return DeviceType::Web;
  if(lowered == "headless") return DeviceType::Headless;
  if(lowered == "server") return DeviceType::Server;
  return DeviceType::Desktop;
}

bool DeviceDescriptor::operator==(const DeviceDescriptor& other) const {
  return alias == other.alias && version == other.version &&
         device_model == other.device_model && device_type == other.device_type &&
         fingerprint == other.fingerprint && port == other.port &&
         protocol == other.protocol && download == other.download;
}

void to_json(nlohmann::json& j, const DeviceDescriptor& d) {
  j = nlohmann::json{
    {"alias", d.alias},
    {"version", d.version},
    {"deviceModel", d.device_model},
    {"deviceType", device_type_name(d.device_type)},
    {"fingerprint", d.fingerprint},
    {"port", d.port},
    {"protocol", d.protocol},
    {"download", d.download}
  };
}

void from_json(const nlohmann::json& j, DeviceDescriptor& d) {
  d.alias = j.at("alias").get<std::string>();
  d.fingerprint = j.at("fingerprint").get<std::string>();
  d.version = j.value("version", std::string("1.0"));
  // deviceModel and deviceType may be null on the wire.
  auto model = j.find("deviceModel");
  d.device_model = (model != j.end() && model->is_string()) ? model->get<std::string>() : "";
  auto type = j.find("deviceType");
  d.device_type = (type != j.end() && type->is_string())
    ? parse_device_type(type->get<std::string>())
    : DeviceType::Desktop;
  d.port = j.value("port", static_cast<uint16_t>(53317));
  d.protocol = j.value("protocol", std::string("https"));
  d.download = j.value("download", false);
}

bool parse_device_descriptor(const nlohmann::json& j, DeviceDescriptor& out, std::string& error) {
  if(!j.is_object()) {
    error = "device info must be a JSON object";
    return false;
  }
  try {
    DeviceDescriptor parsed = j.get<DeviceDescriptor>();
    if(parsed.fingerprint.empty()) {
      error = "device info has an empty fingerprint";
      return false;
    }
    out = std::move(parsed);
    return true;
  } catch(const nlohmann::json::exception& e) {
    error = e.what();
    return false;
  }
}
