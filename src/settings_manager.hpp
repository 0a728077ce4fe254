#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// Every setting the node understands. "min"/"max" bound integer settings;
// non-persistent entries are command line switches that never hit the file.
inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","alias"},                {"aliases", {"name","a"}},         {"type","string"}, {"default",""},            {"description","Name shown to other devices (empty = host name)"}, {"persistent", true}},
  {{"key","device_model"},         {"aliases", {"model"}},            {"type","string"}, {"default","localshare"},  {"description","Device model announced to peers"}, {"persistent", true}},
  {{"key","device_type"},          {"aliases", {"type"}},             {"type","string"}, {"default","desktop"},     {"description","mobile|desktop|web|headless|server"}, {"persistent", true}},
  {{"key","listen_ip"},            {"aliases", {"li"}},               {"type","string"}, {"default","0.0.0.0"},     {"description","Interface/IP the transfer server binds"}, {"persistent", true}},
  {{"key","port"},                 {"aliases", {"p","lp"}},           {"type","int"},    {"default",53317},         {"description","HTTPS transfer port (0 = ephemeral)"}, {"persistent", true}, {"min",0}, {"max",65535}},
  {{"key","multicast_group"},      {"aliases", {"mg"}},               {"type","string"}, {"default","224.0.0.167"}, {"description","Multicast group used for announcements"}, {"persistent", true}},
  {{"key","multicast_port"},       {"aliases", {"mp"}},               {"type","int"},    {"default",53317},         {"description","UDP port used for announcements"}, {"persistent", true}, {"min",1}, {"max",65535}},
  {{"key","discovery"},            {"aliases", {"multicast","d"}},    {"type","bool"},   {"default",true},          {"description","Announce and listen on the multicast group"}, {"persistent", true}},
  {{"key","bootstrap_peer"},       {"aliases", {"bootstrap"}},        {"type","string"}, {"default",""},            {"description","Register directly with host:port"}, {"persistent", true}},
  {{"key","sync_interval_ms"},     {"aliases", {"sync","sim"}},       {"type","int"},    {"default",2000},          {"description","Peer directory reconciliation period"}, {"persistent", true}, {"min",10}, {"max",3600000}},
  {{"key","announce_interval_ms"}, {"aliases", {"announce","aim"}},   {"type","int"},    {"default",5000},          {"description","Period between presence announcements"}, {"persistent", true}, {"min",100}, {"max",3600000}},
  {{"key","peer_ttl_ms"},          {"aliases", {"ttl"}},              {"type","int"},    {"default",15000},         {"description","Forget peers silent for this long"}, {"persistent", true}, {"min",100}, {"max",86400000}},
  {{"key","transfer_timeout_ms"},  {"aliases", {"timeout","tt"}},     {"type","int"},    {"default",30000},         {"description","Connect/idle timeout of one transfer step"}, {"persistent", true}, {"min",100}, {"max",86400000}},
  {{"key","receive_dir"},          {"aliases", {"rd","downloads"}},   {"type","string"}, {"default",""},            {"description","Where received files are stored (empty = ./received)"}, {"persistent", true}},
  {{"key","accept_incoming"},      {"aliases", {"accept"}},           {"type","bool"},   {"default",true},          {"description","Accept files pushed by peers"}, {"persistent", true}},
  {{"key","identity_path"},        {"aliases", {"identity","id"}},    {"type","string"}, {"default",""},            {"description","Directory holding cert.pem/key.pem (empty = ephemeral)"}, {"persistent", true}},
  {{"key","max_body_bytes"},       {"aliases", {"mbb"}},              {"type","int"},    {"default",1048576},       {"description","Largest JSON request body accepted"}, {"persistent", true}, {"min",1024}, {"max",67108864}},
  {{"key","verbose"},              {"aliases", {"v"}},                {"type","bool"},   {"default",false},         {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","help"},                 {"aliases", {"h","?"}},            {"type","bool"},   {"default",false},         {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                 {"aliases", {"persist"}},          {"type","bool"},   {"default",false},         {"description","Persist current settings to disk"}, {"persistent", false}}
});

class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const {
    auto it = values_.find(key);
    if(it == values_.end()) {
      throw std::runtime_error("Unknown setting: " + key);
    }
    return it->get<T>();
  }

  bool has(const std::string& key) const { return values_.contains(key); }

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  bool load();
  bool save() const;
  bool load_from_file(const std::filesystem::path& path);
  bool save_to_file(const std::filesystem::path& path) const;

  bool save_requested() const { return get<bool>("save"); }
  bool help_requested() const { return get<bool>("help"); }

  std::vector<std::string> keys() const;
  std::string value_as_string(const std::string& key) const;
  std::string description(const std::string& key) const;
  std::vector<std::string> aliases(const std::string& key) const;
  std::string type_name(const std::string& key) const;
  bool is_persistent(const std::string& key) const;
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);

  nlohmann::json to_json(bool persistent_only = true) const;
  void merge_json(const nlohmann::json& doc);

  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);
  static std::optional<bool> parse_bool(const std::string& value);

private:
  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;
    std::string type;
    nlohmann::json default_value;
    std::string description;
    bool persistent = true;
    std::optional<long long> min;
    std::optional<long long> max;
  };

  static std::vector<SettingSpec> parse_specification(const nlohmann::json& specification);
  const SettingSpec* find_spec(const std::string& token) const;
  bool store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);

  std::vector<SettingSpec> specs_;
  nlohmann::json values_ = nlohmann::json::object();
  std::filesystem::path settings_path_;
};
