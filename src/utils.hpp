#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::vector<unsigned char> random_bytes(std::size_t count);
// RFC 4122 version 4 UUID from OpenSSL's CSPRNG.
std::string random_uuid();

std::string base64_encode(const std::vector<unsigned char>& data);
std::optional<std::vector<unsigned char>> base64_decode(const std::string& text);

// "1.5 MB" style size labels (B, KB, MB, GB).
std::string format_size(uint64_t bytes);
std::string local_hostname();

// Relative path with '/' separators, independent of the host separator.
std::string to_portable_path(const std::filesystem::path& relative);
// Resolves a '/' separated relative path under root. Returns nullopt when the
// result would escape root (absolute paths, "..", empty components).
std::optional<std::filesystem::path> resolve_under(const std::filesystem::path& root,
                                                   const std::string& relative);
bool is_safe_component(const std::string& name);
// Picks "name (n).ext" for the first free n when the path already exists.
std::filesystem::path unique_destination(const std::filesystem::path& desired);
