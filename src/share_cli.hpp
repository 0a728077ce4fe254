#pragma once
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#ifdef HAVE_READLINE
#include <readline/readline.h>
#include <readline/history.h>
#endif

#include "settings_manager.hpp"
#include "share_manager.hpp"

// Interactive front end. Runs on the calling thread and only talks to the
// ShareManager, so nothing here ever waits on the network.
class ShareCLI {
public:
  ShareCLI(ShareManager& manager, std::shared_ptr<SettingsManager> settings)
    : manager_(manager), settings_(std::move(settings)) {}

  // Returns when the user quits or stdin closes.
  void run() {
    print_help();
    while(true) {
      print_pending_events();
      auto input = read_command_line("> ");
      if(!input) break;
      std::string line = *input;
      trim(line);
      if(line.empty()) continue;

      std::istringstream iss(line);
      std::string cmd;
      iss >> cmd;
      std::string args;
      std::getline(iss, args);
      trim(args);

      if(cmd == "peers" || cmd == "p") {
        list_peers();
      } else if(cmd == "send") {
        send_command(args);
      } else if(cmd == "events" || cmd == "e") {
        if(!print_pending_events()) std::cout << "No new events.\n";
      } else if(cmd == "whoami") {
        print_whoami();
      } else if(cmd == "settings" || cmd == "s") {
        handle_settings_command(args.empty() ? "list" : args);
      } else if(cmd == "help" || cmd == "h" || cmd == "?") {
        print_help();
      } else if(cmd == "quit" || cmd == "exit" || cmd == "q") {
        std::cout << "Quitting...\n";
        break;
      } else {
        print_help();
        std::cout << "Unknown command: " << cmd << "\n";
      }
    }
  }

private:
  ShareManager& manager_;
  std::shared_ptr<SettingsManager> settings_;

  std::optional<std::string> read_command_line(const char* prompt) {
#ifdef HAVE_READLINE
    char* line = readline(prompt);
    if(!line) return std::nullopt;
    std::string result(line);
    if(!result.empty()) add_history(result.c_str());
    free(line);
    return result;
#else
    std::cout << prompt;
    std::cout.flush();
    std::string line;
    if(!std::getline(std::cin, line)) return std::nullopt;
    return line;
#endif
  }

  bool print_pending_events() {
    auto events = manager_.poll_events();
    for(const auto& event : events) {
      std::cout << "[event] " << describe(event) << "\n";
    }
    return !events.empty();
  }

  // Peers ordered by alias so "#n" stays stable while the set does not change.
  std::vector<std::pair<std::string, PeerEntry>> sorted_peers() const {
    auto peers = manager_.get_peers();
    std::vector<std::pair<std::string, PeerEntry>> out(peers.begin(), peers.end());
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b){
      if(a.second.descriptor.alias != b.second.descriptor.alias) {
        return a.second.descriptor.alias < b.second.descriptor.alias;
      }
      return a.first < b.first;
    });
    return out;
  }

  void list_peers() {
    auto peers = sorted_peers();
    if(peers.empty()) {
      std::cout << "No peers discovered yet.\n";
      return;
    }
    std::size_t index = 1;
    for(const auto& [fingerprint, entry] : peers) {
      std::cout << "#" << index++ << "  " << entry.descriptor.alias
                << " (" << device_type_name(entry.descriptor.device_type)
                << ", " << entry.descriptor.device_model << ")  "
                << entry.address.address().to_string() << ":" << entry.address.port()
                << "\n    " << fingerprint << "\n";
    }
  }

  void send_command(const std::string& args) {
    std::istringstream iss(args);
    std::string peer;
    iss >> peer;
    std::string path;
    std::getline(iss, path);
    trim(path);
    if(path.size() >= 2 && path.front() == '"' && path.back() == '"') {
      path = path.substr(1, path.size() - 2);
    }
    if(peer.empty() || path.empty()) {
      std::cout << "Usage: send <fingerprint|#index> <path>\n";
      return;
    }

    std::string fingerprint = peer;
    if(peer.front() == '#') {
      auto peers = sorted_peers();
      std::size_t index = 0;
      try {
        index = std::stoul(peer.substr(1));
      } catch(const std::exception&) {
        index = 0;
      }
      if(index == 0 || index > peers.size()) {
        std::cout << "No peer " << peer << "; run 'peers' for the current list.\n";
        return;
      }
      fingerprint = peers[index - 1].first;
    }

    std::string error;
    if(!manager_.send_file(fingerprint, std::filesystem::path(path), error)) {
      std::cout << "Cannot send: " << error << "\n";
      return;
    }
    std::cout << "Queued " << path << "\n";
  }

  void print_whoami() {
    auto device = manager_.local_device();
    std::cout << "state: " << worker_state_name(manager_.state()) << "\n";
    if(!device) {
      std::cout << "Not started yet.\n";
      return;
    }
    std::cout << "alias:       " << device->alias << "\n"
              << "fingerprint: " << device->fingerprint << "\n"
              << "port:        " << device->port << " (" << device->protocol << ")\n";
  }

  void handle_settings_command(const std::string& args) {
    std::istringstream iss(args);
    std::string action;
    iss >> action;

    if(action == "list") {
      auto keys = settings_->keys();
      std::sort(keys.begin(), keys.end());
      for(const auto& key : keys) {
        std::cout << key << " = " << settings_->value_as_string(key) << "\n";
      }
      return;
    }

    if(action == "get") {
      std::string key;
      iss >> key;
      auto resolved = settings_->resolve_key(key);
      if(!resolved) {
        std::cout << "Unknown setting '" << key << "'.\n";
        return;
      }
      std::cout << *resolved << " = " << settings_->value_as_string(*resolved)
                << "    # " << settings_->description(*resolved) << "\n";
      return;
    }

    if(action == "set") {
      std::string key;
      iss >> key;
      std::string value;
      std::getline(iss, value);
      trim(value);
      if(key.empty() || value.empty()) {
        std::cout << "Usage: settings set <key> <value>\n";
        return;
      }
      auto resolved = settings_->resolve_key(key);
      if(!resolved) {
        std::cout << "Unknown setting '" << key << "'.\n";
        return;
      }
      std::string error;
      if(settings_->set_from_string(*resolved, value, error)) {
        std::cout << *resolved << " = " << settings_->value_as_string(*resolved)
                  << " (applies after restart)\n";
      } else {
        std::cout << "Failed to set " << *resolved << ": " << error << "\n";
      }
      return;
    }

    if(action == "save") {
      if(settings_->save()) {
        std::cout << "Saved settings to " << settings_->settings_path() << "\n";
      } else {
        std::cout << "Failed to save settings.\n";
      }
      return;
    }

    std::cout << "Usage: settings [list|get <key>|set <key> <value>|save]\n";
  }

  void print_help() {
    std::cout << "Available commands:\n";
    std::cout << "  help|h|?                          Show this help message\n";
    std::cout << "  peers|p                           List discovered devices\n";
    std::cout << "  send <fingerprint|#n> <path>      Send a file to a device\n";
    std::cout << "  events|e                          Show events not yet printed\n";
    std::cout << "  whoami                            Show this device\n";
    std::cout << "  settings [list|get|set|save]      Manage settings\n";
    std::cout << "  quit                              Exit the application\n";
  }

  static void trim(std::string& s) {
    s.erase(s.begin(), std::find_if(s.begin(), s.end(),
      [](unsigned char ch){ return !std::isspace(ch); }));
    s.erase(std::find_if(s.rbegin(), s.rend(),
      [](unsigned char ch){ return !std::isspace(ch); }).base(), s.end());
  }
};
