// VEIL - Function Tree Tests
// Copyright (c) 2024 VEIL Developers
// MIT License

#include <gtest/gtest.h>
#include "veil/core/errors.h"
#include "veil/transition/merkle.h"

using namespace veil;

namespace {

std::vector<TransitionLeaf> MakeLeaves(size_t count) {
    std::vector<TransitionLeaf> leaves;
    for (size_t i = 0; i < count; ++i) {
        leaves.push_back(TransitionLeaf{static_cast<uint16_t>(i), static_cast<uint8_t>(i % 10),
                                        Field(static_cast<uint64_t>(100 + i))});
    }
    return leaves;
}

} // namespace

TEST(FunctionTreeTest, RootIsDeterministic) {
    auto leaves = MakeLeaves(4);
    EXPECT_EQ(ComputeFunctionTreeRoot(leaves), ComputeFunctionTreeRoot(leaves));
    EXPECT_NE(ComputeFunctionTreeRoot(leaves), ComputeFunctionTreeRoot(MakeLeaves(3)));
}

TEST(FunctionTreeTest, LeafHashCoversVariant) {
    TransitionLeaf a{0, 1, Field(uint64_t(7))};
    TransitionLeaf b{0, 6, Field(uint64_t(7))};
    EXPECT_NE(a.ToHash(), b.ToHash());
}

TEST(FunctionTreeTest, EmptyTreeIsPaddedWithZeros) {
    Field root = ComputeFunctionTreeRoot({});
    EXPECT_EQ(root, ComputeFunctionTreeRoot({}));
    EXPECT_NE(root, ComputeFunctionTreeRoot(MakeLeaves(1)));
}

TEST(FunctionTreeTest, PathsVerify) {
    auto leaves = MakeLeaves(7);
    Field root = ComputeFunctionTreeRoot(leaves);
    for (uint32_t i = 0; i < leaves.size(); ++i) {
        auto path = ComputeFunctionTreePath(leaves, i);
        ASSERT_EQ(path.size(), TRANSITION_DEPTH);
        EXPECT_TRUE(VerifyFunctionTreePath(leaves[i], i, root, path)) << "leaf " << i;
    }
}

TEST(FunctionTreeTest, PathRejectsWrongLeafOrPosition) {
    auto leaves = MakeLeaves(5);
    Field root = ComputeFunctionTreeRoot(leaves);
    auto path = ComputeFunctionTreePath(leaves, 2);

    EXPECT_FALSE(VerifyFunctionTreePath(leaves[3], 2, root, path));
    EXPECT_FALSE(VerifyFunctionTreePath(leaves[2], 3, root, path));
    EXPECT_FALSE(VerifyFunctionTreePath(leaves[2], TRANSITION_MAX_LEAVES, root, path));

    path.pop_back();
    EXPECT_FALSE(VerifyFunctionTreePath(leaves[2], 2, root, path));
}

TEST(FunctionTreeTest, PathBeyondLeavesIsEmpty) {
    EXPECT_TRUE(ComputeFunctionTreePath(MakeLeaves(3), 3).empty());
}

TEST(FunctionTreeTest, FullTree) {
    auto leaves = MakeLeaves(TRANSITION_MAX_LEAVES);
    Field root = ComputeFunctionTreeRoot(leaves);
    auto path = ComputeFunctionTreePath(leaves, TRANSITION_MAX_LEAVES - 1);
    EXPECT_TRUE(VerifyFunctionTreePath(leaves.back(), TRANSITION_MAX_LEAVES - 1, root, path));
}

TEST(FunctionTreeTest, TooManyLeavesThrows) {
    EXPECT_THROW(ComputeFunctionTreeRoot(MakeLeaves(TRANSITION_MAX_LEAVES + 1)), Error);
}
