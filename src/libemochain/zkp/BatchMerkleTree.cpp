#include "BatchMerkleTree.h"
#include <stdexcept>

namespace emochain {
namespace zkp {

BatchMerkleTree::BatchMerkleTree(std::vector<uint256> leaves) {
    levels_.push_back(std::move(leaves));

    while (levels_.back().size() > 1) {
        const auto& level = levels_.back();

        std::vector<uint256> parents;
        parents.reserve((level.size() + 1) / 2);
        for (size_t i = 0; i < level.size(); i += 2) {
            const uint256& left = level[i];
            const uint256& right = (i + 1 < level.size()) ? level[i + 1] : left;
            parents.push_back(sha256Pair(left, right));
        }
        levels_.push_back(std::move(parents));
    }
}

uint256 BatchMerkleTree::root() const {
    if (empty())
        return uint256{};
    return levels_.back().front();
}

std::vector<uint256> BatchMerkleTree::getAuthPath(size_t position) const {
    if (position >= size()) {
        throw std::out_of_range("Leaf index out of range");
    }

    std::vector<uint256> path;
    size_t index = position;

    for (size_t level = 0; level + 1 < levels_.size(); ++level) {
        const auto& nodes = levels_[level];
        size_t sibling = index ^ 1;  // Flip last bit
        path.push_back(sibling < nodes.size() ? nodes[sibling] : nodes[index]);
        index >>= 1;
    }

    return path;
}

bool BatchMerkleTree::verifyPath(
    const uint256& leaf,
    const std::vector<uint256>& path,
    size_t position,
    const uint256& root)
{
    uint256 current = leaf;

    for (const auto& sibling : path) {
        if (position & 1) {
            // Current is right child
            current = sha256Pair(sibling, current);
        } else {
            current = sha256Pair(current, sibling);
        }
        position >>= 1;
    }

    return current == root;
}

uint256 BatchMerkleTree::computeRoot(const std::vector<uint256>& leaves) {
    return BatchMerkleTree(leaves).root();
}

} // namespace zkp
} // namespace emochain
