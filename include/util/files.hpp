#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace sp::util {

std::vector<uint8_t> readFileToVector(const std::filesystem::path& path);
void writeFile(const std::filesystem::path& absPath, const std::vector<uint8_t>& data);

// Human readable size, e.g. "512B", "1.5KB", "20MB"
std::string bytesToSize(uintmax_t bytes);

}
