#pragma once

#include <libemochain/zkp/Digest.h>
#include <cstddef>
#include <cstdint>

namespace emochain {
namespace zkp {

/**
 * Source of cryptographically secure randomness for nonces, batch ids and
 * dummy payloads.
 */
class NonceSource {
public:
    static constexpr std::size_t nonceBytes = 32;

    virtual ~NonceSource() = default;

    // Fills size bytes at out; throws ProofGenerationError on failure
    virtual void fill(void* out, std::size_t size) = 0;

    uint256 nonce();
    uint128 id128();
    Blob bytes(std::size_t size);

    // Non-zero seed for a beast::xor_shift_engine
    std::uint64_t prngSeed();
};

// Backed by OpenSSL RAND_bytes
class SecureNonceSource : public NonceSource {
public:
    void fill(void* out, std::size_t size) override;
};

// Process-wide secure source
NonceSource& defaultNonceSource();

} // namespace zkp
} // namespace emochain
