#pragma once
#include <cstdint>
#include <string>
#include <vector>

// Reads a whole file into memory. Throws IOError when it cannot be read.
std::vector<uint8_t> readFile(const std::string& path);
