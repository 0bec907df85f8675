#include "NonceSource.h"
#include "ZkErrors.h"
#include <openssl/rand.h>
#include <climits>

namespace emochain {
namespace zkp {

uint256 NonceSource::nonce() {
    uint256 result;
    fill(result.begin(), uint256::size());
    return result;
}

uint128 NonceSource::id128() {
    uint128 result;
    fill(result.begin(), uint128::size());
    return result;
}

Blob NonceSource::bytes(std::size_t size) {
    Blob out(size);
    if (size != 0)
        fill(out.data(), out.size());
    return out;
}

std::uint64_t NonceSource::prngSeed() {
    std::uint64_t seed = 0;
    fill(&seed, sizeof(seed));
    return seed | 1;
}

void SecureNonceSource::fill(void* out, std::size_t size) {
    if (size > static_cast<std::size_t>(INT_MAX))
        throw ProofGenerationError("Requested too many random bytes");

    if (RAND_bytes(static_cast<unsigned char*>(out), static_cast<int>(size)) != 1)
        throw ProofGenerationError("RAND_bytes failed");
}

NonceSource& defaultNonceSource() {
    static SecureNonceSource source;
    return source;
}

} // namespace zkp
} // namespace emochain
