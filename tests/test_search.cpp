#include <gtest/gtest.h>

#include "../src/core/Search.hpp"
#include "puzzle_scrambler.h"

using pour::Layout;
using pour::Matrix;
using pour::Move;
using pour::MoveList;
using pour::SearchStats;

namespace {
    bool replaySolves(Layout s, const MoveList& moves) {
        for (const auto& m : moves) {
            if (!s.canPour(m.from, m.to)) return false;
            s.apply(m);
        }
        return s.isSolved();
    }
}

TEST(Sortedness, CountsAdjacentEqualPairs) {
    EXPECT_EQ(pour::sortedness(Layout(Matrix{}, 4)), 0);
    EXPECT_EQ(pour::sortedness(Layout({ { 1, 1, 1, 1 } }, 4)), 3);
    EXPECT_EQ(pour::sortedness(Layout({ { 1, 2, 1, 2 }, { 2, 2, 1 }, {} }, 4)), 1);
    EXPECT_EQ(pour::sortedness(Layout({ { 1, 1, 2, 2 }, { 3, 3, 3 } }, 4)), 4);
}

TEST(SearchDepthFirst, SolvesTwoBottleExampleWithOneEmpty) {
    Layout start({ { 1, 2, 1, 2 }, { 2, 1, 2, 1 } }, 4, 1);
    auto moves = pour::searchDepthFirst(start);
    ASSERT_TRUE(moves.has_value());
    EXPECT_TRUE(replaySolves(start, *moves));
}

TEST(SearchDepthFirst, NoMovesMeansNoSolution) {
    Layout start({ { 1, 2, 1, 2 }, { 2, 1, 2, 1 } }, 4);
    SearchStats st;
    EXPECT_FALSE(pour::searchDepthFirst(start, &st).has_value());
    EXPECT_EQ(st.expanded, 1u);
    EXPECT_EQ(st.generated, 0u);
}

TEST(SearchDepthFirst, AlreadySolvedStartNeedsNoMoves) {
    Layout start({ { 1, 1, 1, 1 }, { 2, 2, 2, 2 } }, 4);
    auto moves = pour::searchDepthFirst(start);
    ASSERT_TRUE(moves.has_value());
    EXPECT_TRUE(moves->empty());
}

// [1,2,3] with two empty bottles reaches exactly three distinct states:
// {123,-,-}, {12,3,-}, {1,3,2}. Pouring the 3 into either empty bottle gives
// the same state, so the visited set must drop the second one.
TEST(SearchDepthFirst, ExpandsEachStateOnce) {
    Layout start({ { 1, 2, 3 } }, 3, 2);
    SearchStats st;
    EXPECT_FALSE(pour::searchDepthFirst(start, &st).has_value());
    EXPECT_EQ(st.expanded, 3u);
    EXPECT_EQ(st.generated, 4u);
    EXPECT_EQ(st.duplicates, 2u);
    EXPECT_EQ(st.pruned, 0u);
}

TEST(SearchPriority, FindsShortestOnTwoBottleExample) {
    Layout start({ { 1, 2, 1, 2 }, { 2, 1, 2, 1 } }, 4, 1);
    auto shortest = pour::searchPriority(start, 0);
    auto balanced = pour::searchPriority(start, 1);
    ASSERT_TRUE(shortest.has_value());
    ASSERT_TRUE(balanced.has_value());
    EXPECT_TRUE(replaySolves(start, *shortest));
    EXPECT_TRUE(replaySolves(start, *balanced));
    // seven pours is the optimum for this puzzle
    EXPECT_EQ(shortest->size(), 7u);
    EXPECT_EQ(balanced->size(), 7u);
}

TEST(SearchPriority, ExhaustsWithoutSolution) {
    Layout start({ { 1, 2, 3 } }, 3, 2);
    EXPECT_FALSE(pour::searchPriority(start, 0).has_value());
    EXPECT_FALSE(pour::searchPriority(start, 1).has_value());
}

// Depth 1 holds {[1,1],[2],[2],[]} (sortedness 1) and {[1],[2],[2],[1]}
// (sortedness 0). Tolerance 0 drops the second; tolerance 1 queues it.
TEST(SearchPriority, ZeroToleranceDropsSiblingOneBelowBest) {
    Layout start({ { 1 }, { 2, 1 }, { 2 }, {} }, 2);
    const MoveList expected = { Move{ 1, 0 }, Move{ 1, 2 } };

    SearchStats st0;
    auto strict = pour::searchPriority(start, 0, &st0);
    ASSERT_TRUE(strict.has_value());
    EXPECT_EQ(*strict, expected);
    EXPECT_EQ(st0.expanded, 2u);
    EXPECT_EQ(st0.generated, 6u);
    EXPECT_EQ(st0.duplicates, 3u);
    EXPECT_EQ(st0.pruned, 1u);
    EXPECT_EQ(st0.peakFrontier, 1u);

    SearchStats st1;
    auto loose = pour::searchPriority(start, 1, &st1);
    ASSERT_TRUE(loose.has_value());
    EXPECT_EQ(*loose, expected);
    EXPECT_EQ(st1.pruned, 0u);
    EXPECT_EQ(st1.peakFrontier, 2u);
}

TEST(SearchPriority, ToleranceOneStillDropsNodesTwoBelowBest) {
    Layout start({ { 2 }, { 1, 1, 2 }, { 2, 1 }, {} }, 3);
    const MoveList expected = { Move{ 1, 0 }, Move{ 2, 1 }, Move{ 0, 2 } };

    SearchStats st0;
    auto strict = pour::searchPriority(start, 0, &st0);
    ASSERT_TRUE(strict.has_value());
    EXPECT_EQ(*strict, expected);
    EXPECT_EQ(st0.expanded, 3u);
    EXPECT_EQ(st0.generated, 10u);
    EXPECT_EQ(st0.pruned, 3u);

    SearchStats st1;
    auto loose = pour::searchPriority(start, 1, &st1);
    ASSERT_TRUE(loose.has_value());
    EXPECT_EQ(*loose, expected);
    EXPECT_EQ(st1.expanded, 5u);
    EXPECT_EQ(st1.generated, 18u);
    EXPECT_EQ(st1.duplicates, 8u);
    EXPECT_EQ(st1.pruned, 1u);
    EXPECT_EQ(st1.peakFrontier, 5u);
}

// A depth-2 node queued before a better sibling at the same depth was seen
// must be dropped when it reaches the front, not expanded.
TEST(SearchPriority, QueuedNodeRecheckedWhenPopped) {
    Layout start({ { 1, 2, 2 }, { 1 }, { 2, 1 }, {} }, 3);
    SearchStats st;
    auto moves = pour::searchPriority(start, 0, &st);
    ASSERT_TRUE(moves.has_value());
    EXPECT_EQ(*moves, (MoveList{ Move{ 2, 1 }, Move{ 0, 2 }, Move{ 0, 1 } }));
    EXPECT_EQ(st.expanded, 4u);
    EXPECT_EQ(st.generated, 14u);
    EXPECT_EQ(st.duplicates, 6u);
    EXPECT_EQ(st.pruned, 3u);
    EXPECT_EQ(st.peakFrontier, 3u);
}

TEST(SearchPriority, HigherSortednessServedFirstAtEqualDepth) {
    // the sortedness-1 child solves in one more pour; the 0 child is never expanded
    SearchStats a;
    ASSERT_TRUE(pour::searchPriority(Layout({ { 1 }, { 2, 1 }, { 2 }, {} }, 2), 1, &a).has_value());
    EXPECT_EQ(a.expanded, 2u);
    EXPECT_EQ(a.generated, 6u);

    SearchStats b;
    auto moves = pour::searchPriority(Layout({ { 2, 2, 1 }, { 1, 2, 1 }, {} }, 3), 1, &b);
    ASSERT_TRUE(moves.has_value());
    EXPECT_EQ(*moves, (MoveList{ Move{ 0, 2 }, Move{ 1, 2 }, Move{ 1, 0 }, Move{ 1, 2 } }));
    EXPECT_EQ(b.expanded, 5u);
    EXPECT_EQ(b.generated, 7u);
    EXPECT_EQ(b.duplicates, 1u);
}

TEST(SearchPriority, RejectsNegativeTolerance) {
    Layout start({ { 1, 2 } }, 4, 1);
    EXPECT_THROW(pour::searchPriority(start, -1), std::invalid_argument);
}

TEST(SearchPriority, NeverLongerThanDepthFirstOnScrambledPuzzles) {
    for (uint64_t seed = 1; seed <= 20; ++seed) {
        Matrix rows = scrambler::scramble(2 + int(seed % 3), 2, 4, 40, seed * 7919);
        Layout start(rows, 4);

        auto fastest = pour::searchDepthFirst(start);
        auto shortest = pour::searchPriority(start, 0);
        ASSERT_TRUE(fastest.has_value()) << "seed " << seed;
        ASSERT_TRUE(shortest.has_value()) << "seed " << seed;
        EXPECT_TRUE(replaySolves(start, *fastest)) << "seed " << seed;
        EXPECT_TRUE(replaySolves(start, *shortest)) << "seed " << seed;
        EXPECT_LE(shortest->size(), fastest->size()) << "seed " << seed;
    }
}
