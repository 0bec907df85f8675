#pragma once

#include <xrpl/basics/base_uint.h>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace emochain {
namespace zkp {

using ripple::uint128;
using ripple::uint256;

using Blob = std::vector<std::uint8_t>;

/**
 * SHA256 helpers shared by the commitment scheme, the proof backends and
 * the batch Merkle tree. All digests are 256 bits.
 */
uint256 sha256(const void* data, std::size_t size);

inline uint256 sha256(const Blob& data) {
    return sha256(data.data(), data.size());
}

// SHA256(left || right), the interior node hash of the batch tree
uint256 sha256Pair(const uint256& left, const uint256& right);

// Appends value as 4 big-endian bytes
void appendBE32(Blob& out, std::uint32_t value);

inline void append(Blob& out, const uint256& digest) {
    out.insert(out.end(), digest.begin(), digest.end());
}

} // namespace zkp
} // namespace emochain
