#include "Digest.h"
#include <openssl/sha.h>
#include <array>
#include <cstring>

namespace emochain {
namespace zkp {

uint256 sha256(const void* data, std::size_t size) {
    uint256 result;
    SHA256(static_cast<const unsigned char*>(data), size, result.begin());
    return result;
}

uint256 sha256Pair(const uint256& left, const uint256& right) {
    std::array<std::uint8_t, 64> input;
    std::memcpy(input.data(), left.begin(), 32);
    std::memcpy(input.data() + 32, right.begin(), 32);

    uint256 result;
    SHA256(input.data(), input.size(), result.begin());
    return result;
}

void appendBE32(Blob& out, std::uint32_t value) {
    out.push_back(static_cast<std::uint8_t>((value >> 24) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<std::uint8_t>(value & 0xFF));
}

} // namespace zkp
} // namespace emochain
