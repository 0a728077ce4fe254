#pragma once
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>& bytes);
std::vector<unsigned char> sha256_bytes(const std::string& data);
std::string sha256_hex(const std::string& data);

// Cryptographically random lowercase hex string of 2 * byte_count characters.
std::string random_hex(std::size_t byte_count);

// Strips directory components and characters unsafe in a file name.
// Never returns an empty name.
std::string sanitize_file_name(const std::string& name);

// `dir / name`, or `dir / "stem (n)ext"` for the first n that is not taken.
std::filesystem::path unique_destination(const std::filesystem::path& dir,
                                         const std::string& name);

std::string local_host_name();

// Splits "host:port". Returns false when the port is missing or not a number.
bool split_host_port(const std::string& text, std::string& host, unsigned short& port);
