#ifndef SPOOFWATCH_BASE64_H
#define SPOOFWATCH_BASE64_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace spoofwatch {
namespace base64 {

// RFC 4648 standard alphabet with '=' padding.
std::string encode(const uint8_t* data, std::size_t length);
std::string encode(const std::vector<uint8_t>& data);

// Strict decode: rejects characters outside the alphabet, lengths that are not a multiple
// of 4 and padding anywhere but the last two positions. Returns nullopt on invalid input;
// an empty string decodes to an empty buffer.
std::optional<std::vector<uint8_t>> decode(std::string_view encoded);

std::size_t encodedSize(std::size_t inputLength);

}  // namespace base64
}  // namespace spoofwatch

#endif  // SPOOFWATCH_BASE64_H
