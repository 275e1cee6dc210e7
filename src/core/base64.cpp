#include "core/base64.h"

#include <array>

namespace spoofwatch {
namespace base64 {

namespace {

constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
constexpr uint8_t kInvalid = 0xFF;

std::array<uint8_t, 256> buildReverseTable() {
    std::array<uint8_t, 256> table{};
    table.fill(kInvalid);
    for (uint8_t i = 0; i < 64; ++i) {
        table[static_cast<unsigned char>(kAlphabet[i])] = i;
    }
    return table;
}

const std::array<uint8_t, 256>& reverseTable() {
    static const std::array<uint8_t, 256> table = buildReverseTable();
    return table;
}

}  // namespace

std::size_t encodedSize(std::size_t inputLength) {
    return ((inputLength + 2) / 3) * 4;
}

std::string encode(const uint8_t* data, std::size_t length) {
    std::string out;
    out.reserve(encodedSize(length));

    std::size_t i = 0;
    for (; i + 3 <= length; i += 3) {
        const uint32_t group = (static_cast<uint32_t>(data[i]) << 16) |
                               (static_cast<uint32_t>(data[i + 1]) << 8) |
                               static_cast<uint32_t>(data[i + 2]);
        out.push_back(kAlphabet[(group >> 18) & 0x3F]);
        out.push_back(kAlphabet[(group >> 12) & 0x3F]);
        out.push_back(kAlphabet[(group >> 6) & 0x3F]);
        out.push_back(kAlphabet[group & 0x3F]);
    }

    const std::size_t tail = length - i;
    if (tail > 0) {
        uint32_t group = static_cast<uint32_t>(data[i]) << 16;
        if (tail == 2) {
            group |= static_cast<uint32_t>(data[i + 1]) << 8;
        }
        out.push_back(kAlphabet[(group >> 18) & 0x3F]);
        out.push_back(kAlphabet[(group >> 12) & 0x3F]);
        out.push_back(tail == 2 ? kAlphabet[(group >> 6) & 0x3F] : '=');
        out.push_back('=');
    }
    return out;
}

std::string encode(const std::vector<uint8_t>& data) {
    return encode(data.data(), data.size());
}

std::optional<std::vector<uint8_t>> decode(std::string_view encoded) {
    std::vector<uint8_t> out;
    if (encoded.empty()) {
        return out;
    }
    if (encoded.size() % 4 != 0) {
        return std::nullopt;
    }

    std::size_t padding = 0;
    if (encoded.back() == '=') {
        padding = (encoded[encoded.size() - 2] == '=') ? 2 : 1;
    }
    const std::size_t dataChars = encoded.size() - padding;

    const auto& table = reverseTable();
    out.reserve((encoded.size() / 4) * 3 - padding);

    uint32_t accumulator = 0;
    int bits = 0;
    for (std::size_t i = 0; i < dataChars; ++i) {
        const uint8_t value = table[static_cast<unsigned char>(encoded[i])];
        if (value == kInvalid) {
            // Covers '=' inside the data part as well as foreign characters.
            return std::nullopt;
        }
        accumulator = (accumulator << 6) | value;
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((accumulator >> bits) & 0xFF));
        }
    }
    return out;
}

}  // namespace base64
}  // namespace spoofwatch
