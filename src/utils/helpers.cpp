#include "helpers.hpp"
#include <algorithm>
#include <array>
#include <cctype>

std::string to_lower(const std::string& text) {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& text) {
    size_t start = 0;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start])))
        ++start;
    size_t end = text.size();
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1])))
        --end;
    return text.substr(start, end - start);
}

bool is_hex_digest(const std::string& text, size_t length) {
    if (text.size() != length)
        return false;
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isxdigit(c) != 0; });
}

std::string lower_extension(const fs::path& path) {
    return to_lower(path.extension().string());
}

std::string strip_extension(const std::string& filename) {
    return fs::path(filename).replace_extension().string();
}

std::string platform_from_filename(const std::string& filename) {
    size_t open = filename.find('(');
    if (open == std::string::npos) {
        return trim(strip_extension(filename));
    }
    return trim(filename.substr(0, open));
}

std::string to_hex(const std::uint8_t* data, size_t length) {
    static const std::array<char, 16> digits = {
        '0', '1', '2', '3', '4', '5', '6', '7',
        '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
    std::string hex;
    hex.reserve(length * 2);
    for (size_t i = 0; i < length; ++i) {
        hex.push_back(digits[data[i] >> 4]);
        hex.push_back(digits[data[i] & 0x0F]);
    }
    return hex;
}
