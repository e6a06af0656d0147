// VEIL - Function Tree Header
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// Fixed-depth Poseidon Merkle tree over the inputs and outputs of a
// transition. The root is the transition ID; inclusion paths let a
// verifier check that a serial number or commitment belongs to it.

#ifndef VEIL_TRANSITION_MERKLE_H
#define VEIL_TRANSITION_MERKLE_H

#include <cstdint>
#include <vector>
#include "veil/crypto/field.h"

namespace veil {

/// Depth of the function tree
constexpr size_t TRANSITION_DEPTH = 5;

/// Leaves a function tree can hold
constexpr size_t TRANSITION_MAX_LEAVES = size_t(1) << TRANSITION_DEPTH;

/// Offset added to an output's variant in its leaf, so input and output
/// leaves never collide
constexpr uint8_t OUTPUT_VARIANT_OFFSET = 5;

// ============================================================================
// Leaves
// ============================================================================

/**
 * One input or output in the tree
 */
struct TransitionLeaf {
    uint16_t index{0};
    uint8_t variant{0};
    Field id;

    /// HashPSD4([index, variant, id])
    Field ToHash() const;

    bool operator==(const TransitionLeaf& other) const {
        return index == other.index && variant == other.variant && id == other.id;
    }
};

// ============================================================================
// Root and Paths
// ============================================================================

/// Compute the root over `leaves`. Missing leaves are zero and internal
/// nodes are HashPSD2([left, right]).
/// Throws Error when more than TRANSITION_MAX_LEAVES are given.
Field ComputeFunctionTreeRoot(const std::vector<TransitionLeaf>& leaves);

/// Sibling hashes from the leaf at `position` up to the root
std::vector<Field> ComputeFunctionTreePath(const std::vector<TransitionLeaf>& leaves, uint32_t position);

/// Check that `leaf` sits at `position` under `root`
bool VerifyFunctionTreePath(const TransitionLeaf& leaf, uint32_t position,
                            const Field& root, const std::vector<Field>& path);

} // namespace veil

#endif // VEIL_TRANSITION_MERKLE_H
