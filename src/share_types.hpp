#pragma once
#include <asio.hpp>

#include <filesystem>
#include <string>
#include <unordered_map>
#include <variant>

#include "device_info.hpp"

struct PeerEntry {
  asio::ip::tcp::endpoint address;
  DeviceDescriptor descriptor;
};

// fingerprint -> last known address and descriptor
using PeerMap = std::unordered_map<std::string, PeerEntry>;

// ---- commands (foreground -> worker) ---------------------------------------

struct SendFileCommand {
  std::string peer_fingerprint;
  std::filesystem::path file_path;
};

struct ShutdownCommand {};

using ShareCommand = std::variant<SendFileCommand, ShutdownCommand>;

// ---- events (worker -> foreground) -----------------------------------------

struct PeerDiscovered {
  std::string fingerprint;
  DeviceDescriptor descriptor;
  asio::ip::tcp::endpoint address;
};

struct PeerLost {
  std::string fingerprint;
};

struct TransferStarted {
  std::string peer_fingerprint;
  std::filesystem::path file_path;
};

struct TransferComplete {
  std::string peer_fingerprint;
};

struct TransferFailed {
  std::string peer_fingerprint;
  std::string error;
};

// Fatal background failure; the worker stops after emitting it.
struct ErrorEvent {
  std::string message;
};

using ShareEvent = std::variant<PeerDiscovered,
                                PeerLost,
                                TransferStarted,
                                TransferComplete,
                                TransferFailed,
                                ErrorEvent>;

std::string describe(const ShareEvent& event);

enum class WorkerState { Initializing, Running, Draining, Stopped };

const char* worker_state_name(WorkerState state);
