#include "file_reader.hpp"
#include "errors.hpp"
#include <fstream>
#include <iterator>

std::vector<uint8_t> readFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw IOError("Cannot open file " + path);
    }
    std::vector<uint8_t> blob((std::istreambuf_iterator<char>(file)),
                              std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw IOError("Read failure on " + path);
    }
    return blob;
}
