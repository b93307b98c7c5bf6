#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sp::util {

std::string toHex(std::span<const uint8_t> bytes);

// nullopt when the input has odd length or a non-hex character
std::optional<std::vector<uint8_t>> fromHex(std::string_view hex);

}
