#include "utils.hpp"

#include <openssl/rand.h>
#include <openssl/sha.h>

#include <unistd.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>

std::string hex_from_bytes(const std::vector<unsigned char>& bytes){
    std::ostringstream oss;
    for(auto c : bytes) oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
    return oss.str();
}

std::vector<unsigned char> sha256_bytes(const std::string& data){
    std::vector<unsigned char> out(SHA256_DIGEST_LENGTH);
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), out.data());
    return out;
}

std::string sha256_hex(const std::string& data){
    return hex_from_bytes(sha256_bytes(data));
}

std::string random_hex(std::size_t byte_count){
    std::vector<unsigned char> bytes(byte_count);
    if(byte_count > 0 && RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1){
        throw std::runtime_error("RAND_bytes failed");
    }
    return hex_from_bytes(bytes);
}

std::string sanitize_file_name(const std::string& name){
    std::string base = name;
    auto slash = base.find_last_of("/\\");
    if(slash != std::string::npos) base = base.substr(slash + 1);

    std::string out;
    out.reserve(base.size());
    for(unsigned char ch : base){
        if(ch < 0x20 || ch == ':' || ch == '*' || ch == '?' || ch == '"' ||
           ch == '<' || ch == '>' || ch == '|'){
            out.push_back('_');
        } else {
            out.push_back(static_cast<char>(ch));
        }
    }
    while(!out.empty() && (out.front() == '.' || out.front() == ' ')) out.erase(out.begin());
    while(!out.empty() && out.back() == ' ') out.pop_back();
    if(out.empty()) out = "file";
    return out;
}

std::filesystem::path unique_destination(const std::filesystem::path& dir,
                                         const std::string& name){
    std::filesystem::path candidate = dir / name;
    std::error_code ec;
    if(!std::filesystem::exists(candidate, ec)) return candidate;

    const std::filesystem::path plain(name);
    const std::string stem = plain.stem().string();
    const std::string ext = plain.extension().string();
    for(int n = 1; ; ++n){
        candidate = dir / (stem + " (" + std::to_string(n) + ")" + ext);
        if(!std::filesystem::exists(candidate, ec)) return candidate;
    }
}

std::string local_host_name(){
    char hostname[256] = {0};
    if(gethostname(hostname, sizeof(hostname) - 1) != 0 || hostname[0] == '\0'){
        return "localshare";
    }
    return hostname;
}

bool split_host_port(const std::string& text, std::string& host, unsigned short& port){
    auto pos = text.rfind(':');
    if(pos == std::string::npos || pos == 0 || pos + 1 >= text.size()) return false;
    const std::string port_text = text.substr(pos + 1);
    unsigned long value = 0;
    for(char ch : port_text){
        if(ch < '0' || ch > '9') return false;
        value = value * 10 + static_cast<unsigned long>(ch - '0');
        if(value > 65535) return false;
    }
    if(value == 0) return false;
    host = text.substr(0, pos);
    port = static_cast<unsigned short>(value);
    return true;
}
