#pragma once
#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "device_info.hpp"

using json = nlohmann::json;

// LocalSend v2 wire constants.
inline constexpr const char* kDefaultMulticastGroup = "224.0.0.167";
inline constexpr uint16_t kDefaultPort = 53317;
inline constexpr const char* kProtocolVersion = "2.0";

inline constexpr const char* kInfoPath = "/api/localsend/v2/info";
inline constexpr const char* kRegisterPath = "/api/localsend/v2/register";
inline constexpr const char* kPrepareUploadPath = "/api/localsend/v2/prepare-upload";
inline constexpr const char* kUploadPath = "/api/localsend/v2/upload";
inline constexpr const char* kCancelPath = "/api/localsend/v2/cancel";

struct UploadFile {
  std::string id;
  std::string file_name;
  uint64_t size = 0;
  std::string file_type;
};

// fileId -> token
using FileTokens = std::map<std::string, std::string>;

json make_announcement(const DeviceDescriptor& self, bool announce);
bool parse_announcement(const json& j, DeviceDescriptor& out, bool& announce, std::string& error);

json make_prepare_upload(const DeviceDescriptor& sender, const std::vector<UploadFile>& files);
bool parse_prepare_upload(const json& j,
                          DeviceDescriptor& sender,
                          std::vector<UploadFile>& files,
                          std::string& error);

json make_prepare_upload_response(const std::string& session_id, const FileTokens& tokens);
bool parse_prepare_upload_response(const json& j,
                                   std::string& session_id,
                                   FileTokens& tokens,
                                   std::string& error);

std::string upload_target(const std::string& session_id,
                          const std::string& file_id,
                          const std::string& token);
std::string cancel_target(const std::string& session_id);

// MIME type guessed from the extension, "application/octet-stream" otherwise.
std::string mime_type_for(const std::filesystem::path& path);
