#include "settings_manager.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

#include "log.hpp"

std::vector<SettingsManager::SettingSpec>
SettingsManager::parse_specification(const nlohmann::json& specification) {
  std::vector<SettingSpec> specs;
  for(const auto& entry : specification) {
    SettingSpec spec;
    spec.key = entry.at("key").get<std::string>();
    for(const auto& alias : entry.value("aliases", nlohmann::json::array())) {
      spec.aliases.push_back(to_lower(alias.get<std::string>()));
    }
    spec.type = entry.at("type").get<std::string>();
    spec.default_value = entry.at("default");
    spec.description = entry.value("description", "");
    spec.persistent = entry.value("persistent", true);
    if(entry.contains("min")) spec.min = entry.at("min").get<long long>();
    if(entry.contains("max")) spec.max = entry.at("max").get<long long>();
    specs.push_back(std::move(spec));
  }
  return specs;
}

SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

SettingsManager::SettingsManager(const nlohmann::json& specification)
  : specs_(parse_specification(specification)) {
  for(const auto& spec : specs_) {
    values_[spec.key] = spec.default_value;
  }
}

const SettingsManager::SettingSpec* SettingsManager::find_spec(const std::string& token) const {
  const std::string lowered = to_lower(trim_copy(token));
  for(const auto& spec : specs_) {
    if(to_lower(spec.key) == lowered) return &spec;
  }
  for(const auto& spec : specs_) {
    if(std::find(spec.aliases.begin(), spec.aliases.end(), lowered) != spec.aliases.end()) {
      return &spec;
    }
  }
  return nullptr;
}

bool SettingsManager::store(const SettingSpec& spec, const nlohmann::json& value, std::string& error) {
  if(spec.type == "bool") {
    if(value.is_boolean()) {
      values_[spec.key] = value.get<bool>();
      return true;
    }
    if(value.is_number_integer()) {
      values_[spec.key] = value.get<long long>() != 0;
      return true;
    }
    error = "expected boolean";
    return false;
  }
  if(spec.type == "int") {
    if(!value.is_number_integer()) {
      error = "expected integer";
      return false;
    }
    const auto number = value.get<long long>();
    if((spec.min && number < *spec.min) || (spec.max && number > *spec.max)) {
      error = fmt::format("out of range [{}, {}]",
                          spec.min ? std::to_string(*spec.min) : "-inf",
                          spec.max ? std::to_string(*spec.max) : "inf");
      return false;
    }
    values_[spec.key] = static_cast<int>(number);
    return true;
  }
  if(spec.type == "string") {
    if(!value.is_string()) {
      error = "expected string";
      return false;
    }
    values_[spec.key] = trim_copy(value.get<std::string>());
    return true;
  }
  error = "unsupported setting type '" + spec.type + "'";
  return false;
}

bool SettingsManager::set_from_json(const std::string& key,
                                    const nlohmann::json& value,
                                    std::string& error) {
  error.clear();
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  return store(*spec, value, error);
}

bool SettingsManager::set_from_string(const std::string& key,
                                      const std::string& value,
                                      std::string& error) {
  error.clear();
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  const std::string clean = trim_copy(value);
  if(spec->type == "bool") {
    auto parsed = parse_bool(clean);
    if(!parsed) {
      error = "expected boolean (true|false|on|off)";
      return false;
    }
    return store(*spec, *parsed, error);
  }
  if(spec->type == "int") {
    long long number = 0;
    std::size_t consumed = 0;
    try {
      number = std::stoll(clean, &consumed);
    } catch(const std::exception&) {
      error = "expected integer";
      return false;
    }
    if(consumed != clean.size()) {
      error = "expected integer";
      return false;
    }
    return store(*spec, number, error);
  }
  return store(*spec, clean, error);
}

void SettingsManager::merge_json(const nlohmann::json& doc) {
  if(!doc.is_object()) return;
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec || !spec->persistent) continue;
    std::string error;
    if(!store(*spec, item.value(), error)) {
      print_err(nullptr, "Ignoring invalid setting '{}': {}", item.key(), error);
    }
  }
}

nlohmann::json SettingsManager::to_json(bool persistent_only) const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& spec : specs_) {
    if(persistent_only && !spec.persistent) continue;
    doc[spec.key] = values_.at(spec.key);
  }
  return doc;
}

std::filesystem::path SettingsManager::settings_path() const {
  if(!settings_path_.empty()) return settings_path_;
  return std::filesystem::current_path() / ".config" / "settings.json";
}

void SettingsManager::set_settings_path(const std::filesystem::path& path) {
  settings_path_ = path;
}

bool SettingsManager::load() {
  return load_from_file(settings_path());
}

bool SettingsManager::save() const {
  return save_to_file(settings_path());
}

bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  std::ifstream in(path);
  if(!in) return false;
  try {
    nlohmann::json doc;
    in >> doc;
    merge_json(doc);
    return true;
  } catch(const nlohmann::json::exception& e) {
    print_err(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
}

bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path, std::ios::trunc);
  if(!out) {
    print_err(nullptr, "Unable to write {}", path.string());
    return false;
  }
  out << to_json(true).dump(2) << "\n";
  return static_cast<bool>(out);
}

std::vector<std::string> SettingsManager::keys() const {
  std::vector<std::string> out;
  out.reserve(specs_.size());
  for(const auto& spec : specs_) out.push_back(spec.key);
  return out;
}

std::string SettingsManager::value_as_string(const std::string& key) const {
  auto it = values_.find(key);
  if(it == values_.end()) return "<unknown>";
  if(it->is_string()) return it->get<std::string>();
  if(it->is_boolean()) return it->get<bool>() ? "true" : "false";
  return it->dump();
}

std::string SettingsManager::description(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec ? spec->description : std::string();
}

std::vector<std::string> SettingsManager::aliases(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec ? spec->aliases : std::vector<std::string>();
}

std::string SettingsManager::type_name(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec ? spec->type : std::string();
}

bool SettingsManager::is_persistent(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec && spec->persistent;
}

std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* spec = find_spec(token)) return spec->key;
  return std::nullopt;
}

bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec && spec->type == "bool";
}

std::string SettingsManager::to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

std::string SettingsManager::trim_copy(std::string value) {
  auto not_space = [](unsigned char ch){ return !std::isspace(ch); };
  value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
  value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
  return value;
}

std::optional<bool> SettingsManager::parse_bool(const std::string& value) {
  const std::string v = to_lower(trim_copy(value));
  if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
  if(v == "false" || v == "0" || v == "off" || v == "no") return false;
  return std::nullopt;
}
