#pragma once

#include <optional>
#include <string>
#include <vector>

#include "settings_manager.hpp"

// Maps argv onto SettingsManager keys.
//   localshare [alias] [port] [bootstrap_peer] [--key value] [--key=value] [-alias value] [--no-flag]
// Bool options take an optional literal (on/off, yes/no, 1/0, true/false).
// Everything after "--" is positional.
class CommandLineParser {
public:
  explicit CommandLineParser(std::string process_name = "localshare",
                             std::vector<std::string> positional_keys = {"alias", "port", "bootstrap_peer"});

  // Applies argv to `settings`; stops at the first bad token.
  bool parse(int argc, char* argv[], SettingsManager& settings, std::string& error) const;
  void usage() const;

private:
  bool apply_option(const std::vector<std::string>& args,
                    std::size_t& i,
                    const std::string& name,
                    std::optional<std::string> inline_value,
                    bool long_form,
                    SettingsManager& settings,
                    std::string& error) const;

  static bool looks_like_option(const std::string& token);
  static bool is_bool_literal(const std::string& value);

  std::string process_name_;
  std::vector<std::string> positional_keys_;
};
