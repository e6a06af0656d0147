// VEIL - Function Tree Implementation
// Copyright (c) 2024 VEIL Developers
// MIT License

#include "veil/transition/merkle.h"
#include "veil/core/errors.h"
#include "veil/network/network.h"

namespace veil {

namespace {

Field HashPair(const Field& left, const Field& right) {
    return network::HashPSD2({left, right});
}

/// Hash the leaves and pad the bottom level to its full width
std::vector<Field> BottomLevel(const std::vector<TransitionLeaf>& leaves) {
    if (leaves.size() > TRANSITION_MAX_LEAVES) {
        throw Error("Function tree holds at most " + std::to_string(TRANSITION_MAX_LEAVES) +
                    " leaves, found " + std::to_string(leaves.size()));
    }
    std::vector<Field> level;
    level.reserve(TRANSITION_MAX_LEAVES);
    for (const auto& leaf : leaves) {
        level.push_back(leaf.ToHash());
    }
    level.resize(TRANSITION_MAX_LEAVES, Field::Zero());
    return level;
}

void Fold(std::vector<Field>& level) {
    size_t newSize = level.size() / 2;
    for (size_t i = 0; i < newSize; ++i) {
        level[i] = HashPair(level[i * 2], level[i * 2 + 1]);
    }
    level.resize(newSize);
}

} // namespace

Field TransitionLeaf::ToHash() const {
    return network::HashPSD4({Field(static_cast<uint64_t>(index)), Field(static_cast<uint64_t>(variant)), id});
}

// ============================================================================
// Root and Paths
// ============================================================================

Field ComputeFunctionTreeRoot(const std::vector<TransitionLeaf>& leaves) {
    std::vector<Field> level = BottomLevel(leaves);
    while (level.size() > 1) {
        Fold(level);
    }
    return level[0];
}

std::vector<Field> ComputeFunctionTreePath(const std::vector<TransitionLeaf>& leaves, uint32_t position) {
    std::vector<Field> path;
    if (position >= leaves.size()) {
        return path;
    }

    std::vector<Field> level = BottomLevel(leaves);
    uint32_t pos = position;
    path.reserve(TRANSITION_DEPTH);

    while (level.size() > 1) {
        path.push_back(level[pos ^ 1]);
        Fold(level);
        pos /= 2;
    }
    return path;
}

bool VerifyFunctionTreePath(const TransitionLeaf& leaf, uint32_t position,
                            const Field& root, const std::vector<Field>& path) {
    if (path.size() != TRANSITION_DEPTH || position >= TRANSITION_MAX_LEAVES) {
        return false;
    }

    Field current = leaf.ToHash();
    uint32_t pos = position;

    for (const Field& sibling : path) {
        if (pos & 1) {
            current = HashPair(sibling, current);
        } else {
            current = HashPair(current, sibling);
        }
        pos /= 2;
    }

    return current == root;
}

} // namespace veil
