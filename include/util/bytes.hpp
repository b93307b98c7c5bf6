#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sp::util {

inline std::string_view asStringView(const std::span<const uint8_t> bytes) {
    return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

inline std::span<const uint8_t> asBytes(const std::string_view str) {
    return {reinterpret_cast<const uint8_t*>(str.data()), str.size()};
}

inline std::vector<uint8_t> toBytes(const std::string_view str) {
    const auto b = asBytes(str);
    return {b.begin(), b.end()};
}

inline std::string toString(const std::span<const uint8_t> bytes) {
    return std::string(asStringView(bytes));
}

}
