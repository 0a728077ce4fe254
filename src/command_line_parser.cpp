#include "command_line_parser.hpp"

#include <cctype>
#include <utility>

#include "log.hpp"

CommandLineParser::CommandLineParser(std::string process_name,
                                     std::vector<std::string> positional_keys)
  : process_name_(std::move(process_name)),
    positional_keys_(std::move(positional_keys)) {}

bool CommandLineParser::looks_like_option(const std::string& token) {
  if(token.size() < 2 || token[0] != '-') return false;
  return token[1] == '-' || std::isalpha(static_cast<unsigned char>(token[1]));
}

bool CommandLineParser::is_bool_literal(const std::string& value) {
  return SettingsManager::parse_bool(value).has_value();
}

bool CommandLineParser::apply_option(const std::vector<std::string>& args,
                                     std::size_t& i,
                                     const std::string& name,
                                     std::optional<std::string> inline_value,
                                     bool long_form,
                                     SettingsManager& settings,
                                     std::string& error) const {
  const std::string shown = (long_form ? "--" : "-") + name;
  auto key = settings.resolve_key(name);

  // --no-discovery
  if(!key && long_form && name.rfind("no-", 0) == 0 && !inline_value) {
    auto negated = settings.resolve_key(name.substr(3));
    if(negated && settings.is_bool_setting(*negated)) {
      return settings.set_from_string(*negated, "false", error);
    }
  }
  if(!key) {
    error = "unknown option " + shown;
    return false;
  }

  std::string value;
  if(inline_value) {
    value = *inline_value;
  } else if(settings.is_bool_setting(*key)) {
    value = "true";
    if(i + 1 < args.size() && is_bool_literal(args[i + 1])) value = args[++i];
  } else {
    if(i + 1 >= args.size()) {
      error = "missing value for " + shown;
      return false;
    }
    value = args[++i];
  }

  std::string reason;
  if(!settings.set_from_string(*key, value, reason)) {
    error = "invalid value for " + shown + ": " + reason;
    return false;
  }
  return true;
}

bool CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings, std::string& error) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) args.assign(argv + 1, argv + argc);

  std::size_t next_positional = 0;
  bool options_done = false;
  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    if(!options_done && token == "--") {
      options_done = true;
      continue;
    }

    if(!options_done && looks_like_option(token)) {
      const bool long_form = token[1] == '-';
      std::string name = token.substr(long_form ? 2 : 1);
      std::optional<std::string> inline_value;
      auto eq = name.find('=');
      if(eq != std::string::npos) {
        inline_value = name.substr(eq + 1);
        name.erase(eq);
      }
      if(!apply_option(args, i, name, inline_value, long_form, settings, error)) return false;
      continue;
    }

    if(next_positional >= positional_keys_.size()) {
      error = "unexpected argument '" + token + "'";
      return false;
    }
    const auto& key = positional_keys_[next_positional++];
    std::string reason;
    if(!settings.set_from_string(key, token, reason)) {
      error = "invalid " + key + " '" + token + "': " + reason;
      return false;
    }
  }
  return true;
}

void CommandLineParser::usage() const {
  SettingsManager defaults;

  std::string synopsis = process_name_;
  for(const auto& key : positional_keys_) synopsis += " [" + key + "]";
  synopsis += " [options]";

  print_out(nullptr, "{} - share files with devices on the local network", process_name_);
  print_out(nullptr, "Usage:");
  print_out(nullptr, "  {}", synopsis);
  print_out(nullptr, "");

  auto print_option = [&](const std::string& key){
    const auto type = defaults.type_name(key);
    std::string hint = type == "bool" ? "[on|off]" : "<" + type + ">";
    std::string alias_text;
    for(const auto& alias : defaults.aliases(key)) {
      alias_text += alias_text.empty() ? " (-" : ", -";
      alias_text += alias;
    }
    if(!alias_text.empty()) alias_text += ")";
    std::string default_text = defaults.value_as_string(key);
    if(default_text.empty()) default_text = "\"\"";
    print_out(nullptr, "  --{:<22} {:<9} {}{} [{}]",
              key, hint, defaults.description(key), alias_text, default_text);
  };

  print_out(nullptr, "Settings (saved with --save):");
  for(const auto& key : defaults.keys()) {
    if(defaults.is_persistent(key)) print_option(key);
  }
  print_out(nullptr, "");
  print_out(nullptr, "Flags:");
  for(const auto& key : defaults.keys()) {
    if(!defaults.is_persistent(key)) print_option(key);
  }
  print_out(nullptr, "");
}
