#pragma once
#include <cstdint>
#include <vector>
#include <string>
#include <filesystem>

namespace fs = std::filesystem;

//
// String helpers
//
std::string to_lower(const std::string& text);
std::string trim(const std::string& text);
bool is_hex_digest(const std::string& text, size_t length);

//
// Path helpers
//
std::string lower_extension(const fs::path& path);
std::string strip_extension(const std::string& filename);

// "Nintendo - Game Boy (20240101-000000).dat" -> "Nintendo - Game Boy"
std::string platform_from_filename(const std::string& filename);

std::string to_hex(const std::uint8_t* data, size_t length);
