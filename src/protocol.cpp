#include "protocol.hpp"

#include "http_message.hpp"
#include "settings_manager.hpp"

#include <initializer_list>

json make_announcement(const DeviceDescriptor& self, bool announce){
    json j = self;
    j["announce"] = announce;
    return j;
}

bool parse_announcement(const json& j, DeviceDescriptor& out, bool& announce, std::string& error){
    if(!parse_device_descriptor(j, out, error)) return false;
    // Older peers send "announcement" instead of "announce".
    announce = false;
    for(const char* key : {"announce", "announcement"}){
        auto it = j.find(key);
        if(it == j.end() || it->is_null()) continue;
        if(!it->is_boolean()){
            error = std::string("'") + key + "' must be a boolean";
            return false;
        }
        announce = it->get<bool>();
        break;
    }
    return true;
}

json make_prepare_upload(const DeviceDescriptor& sender, const std::vector<UploadFile>& files){
    json file_map = json::object();
    for(const auto& f : files){
        file_map[f.id] = {
            {"id", f.id},
            {"fileName", f.file_name},
            {"size", f.size},
            {"fileType", f.file_type}
        };
    }
    json j;
    j["info"] = sender;
    j["files"] = std::move(file_map);
    return j;
}

bool parse_prepare_upload(const json& j,
                          DeviceDescriptor& sender,
                          std::vector<UploadFile>& files,
                          std::string& error){
    if(!j.is_object() || !j.contains("info") || !j.contains("files")){
        error = "prepare-upload needs 'info' and 'files'";
        return false;
    }
    if(!parse_device_descriptor(j.at("info"), sender, error)) return false;
    const auto& file_map = j.at("files");
    if(!file_map.is_object()){
        error = "'files' must be an object";
        return false;
    }
    files.clear();
    try {
        for(const auto& item : file_map.items()){
            const auto& entry = item.value();
            UploadFile f;
            f.id = entry.value("id", item.key());
            f.file_name = entry.at("fileName").get<std::string>();
            f.size = entry.at("size").get<uint64_t>();
            f.file_type = entry.value("fileType", std::string("application/octet-stream"));
            files.push_back(std::move(f));
        }
    } catch(const json::exception& e){
        error = e.what();
        return false;
    }
    return true;
}

json make_prepare_upload_response(const std::string& session_id, const FileTokens& tokens){
    json j;
    j["sessionId"] = session_id;
    j["files"] = tokens;
    return j;
}

bool parse_prepare_upload_response(const json& j,
                                   std::string& session_id,
                                   FileTokens& tokens,
                                   std::string& error){
    try {
        session_id = j.at("sessionId").get<std::string>();
        tokens = j.at("files").get<FileTokens>();
    } catch(const json::exception& e){
        error = std::string("malformed prepare-upload response: ") + e.what();
        return false;
    }
    if(session_id.empty()){
        error = "prepare-upload response has an empty sessionId";
        return false;
    }
    return true;
}

std::string upload_target(const std::string& session_id,
                          const std::string& file_id,
                          const std::string& token){
    return std::string(kUploadPath) +
           "?sessionId=" + url_encode(session_id) +
           "&fileId=" + url_encode(file_id) +
           "&token=" + url_encode(token);
}

std::string cancel_target(const std::string& session_id){
    return std::string(kCancelPath) + "?sessionId=" + url_encode(session_id);
}

std::string mime_type_for(const std::filesystem::path& path){
    static const std::map<std::string, std::string> kTypes = {
        {".png", "image/png"}, {".jpg", "image/jpeg"}, {".jpeg", "image/jpeg"},
        {".gif", "image/gif"}, {".bmp", "image/bmp"}, {".webp", "image/webp"},
        {".tif", "image/tiff"}, {".tiff", "image/tiff"}, {".svg", "image/svg+xml"},
        {".txt", "text/plain"}, {".pdf", "application/pdf"},
        {".mp4", "video/mp4"}, {".mp3", "audio/mpeg"}, {".zip", "application/zip"}
    };
    auto it = kTypes.find(SettingsManager::to_lower(path.extension().string()));
    return it != kTypes.end() ? it->second : "application/octet-stream";
}
