#pragma once

#include <libemochain/zkp/Digest.h>
#include <cstddef>
#include <vector>

namespace emochain {
namespace zkp {

/**
 * Binary Merkle tree over a fixed, ordered set of leaves.
 * Uses SHA256 for internal hash computations. A level with an odd number
 * of nodes duplicates its last node upward; a single leaf is its own root
 * and an empty tree has the zero root.
 *
 * Leaf order is significant: permuting the leaves changes the root.
 */
class BatchMerkleTree {
public:
    explicit BatchMerkleTree(std::vector<uint256> leaves);

    uint256 root() const;

    // Sibling hashes from leaf level up to (not including) the root
    std::vector<uint256> getAuthPath(size_t position) const;

    static bool verifyPath(
        const uint256& leaf,
        const std::vector<uint256>& path,
        size_t position,
        const uint256& root);

    static uint256 computeRoot(const std::vector<uint256>& leaves);

    size_t size() const { return levels_.front().size(); }
    bool empty() const { return levels_.front().empty(); }

private:
    // levels_[0] = leaves, levels_.back() = { root }
    std::vector<std::vector<uint256>> levels_;
};

} // namespace zkp
} // namespace emochain
