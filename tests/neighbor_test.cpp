///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "neighbor.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <random>


///////////////////////////
///       FIXTURE       ///
///////////////////////////
class NeighborTest : public ::testing::Test {
protected:
    NeighborTest() : grid(2, 2, 3), rng(7) {
        grid.place(Cell{0, 0, 0}, makeLesson(1, LessonCategory::YOGA, {1, 2}));
        grid.place(Cell{0, 1, 2}, makeLesson(2, LessonCategory::ZUMBA, {3}));
        grid.place(Cell{1, 0, 1}, makeLesson(3, LessonCategory::PILATES, {4, 5, 6}));
    }

    AssignmentGrid grid;
    std::mt19937 rng;
};


///////////////////////////
///        TESTS        ///
///////////////////////////
TEST_F(NeighborTest, RelocatePreservesLessons) {
    std::vector<LessonTuple> before = lessonTuples(grid);
    for (int i = 0; i < 200; ++i) {
        Move move = relocateRandomLesson(grid, rng);
        EXPECT_EQ(move.type, MoveType::RELOCATE);
        EXPECT_FALSE(grid.at(move.from).has_value());
        EXPECT_TRUE(grid.at(move.to).has_value());
        EXPECT_EQ(grid.occupiedCount(), 3);
    }
    EXPECT_EQ(lessonTuples(grid), before);
}

TEST_F(NeighborTest, SwapPreservesLessons) {
    std::vector<LessonTuple> before = lessonTuples(grid);
    for (int i = 0; i < 200; ++i) {
        Move move = swapRandomLessons(grid, rng);
        EXPECT_EQ(move.type, MoveType::SWAP);
        EXPECT_NE(move.from, move.to);
        EXPECT_EQ(grid.occupiedCount(), 3);
    }
    EXPECT_EQ(lessonTuples(grid), before);
}

TEST_F(NeighborTest, UndoRestoresExactGrid) {
    std::vector<MoveType> both = {MoveType::RELOCATE, MoveType::SWAP};
    for (int i = 0; i < 100; ++i) {
        AssignmentGrid snapshot = grid;
        Move move = applyRandomMove(grid, both, rng);
        undoMove(grid, move);
        for (int k = 0; k < grid.cellCount(); ++k) {
            Cell cell = grid.cellAt(k);
            EXPECT_EQ(grid.at(cell), snapshot.at(cell));
        }
    }
}

TEST_F(NeighborTest, EmptyAllowedListMeansRelocate) {
    Move move = applyRandomMove(grid, {}, rng);
    EXPECT_EQ(move.type, MoveType::RELOCATE);
}

TEST(NeighborEdgeTest, RelocateFailsOnEmptyGrid) {
    AssignmentGrid grid(1, 1, 3);
    std::mt19937 rng(1);
    EXPECT_THROW(relocateRandomLesson(grid, rng), DegenerateStateError);
}

TEST(NeighborEdgeTest, RelocateFailsOnFullGrid) {
    AssignmentGrid grid(1, 1, 2);
    grid.place(Cell{0, 0, 0}, makeLesson(1, LessonCategory::YOGA, {1}));
    grid.place(Cell{0, 0, 1}, makeLesson(1, LessonCategory::YOGA, {2}));
    std::mt19937 rng(1);
    EXPECT_THROW(relocateRandomLesson(grid, rng), DegenerateStateError);
}

TEST(NeighborEdgeTest, SwapNeedsTwoLessons) {
    AssignmentGrid grid(1, 1, 3);
    grid.place(Cell{0, 0, 0}, makeLesson(1, LessonCategory::YOGA, {1}));
    std::mt19937 rng(1);
    EXPECT_THROW(swapRandomLessons(grid, rng), DegenerateStateError);
    EXPECT_THROW(applyRandomMove(grid, {MoveType::SWAP}, rng), DegenerateStateError);
}

TEST(NeighborEdgeTest, SwapFallsBackToRelocateWithOneLesson) {
    AssignmentGrid grid(1, 1, 3);
    grid.place(Cell{0, 0, 0}, makeLesson(1, LessonCategory::YOGA, {1}));
    std::mt19937 rng(3);
    for (int i = 0; i < 50; ++i) {
        Move move = applyRandomMove(grid, {MoveType::SWAP, MoveType::RELOCATE}, rng);
        EXPECT_EQ(move.type, MoveType::RELOCATE);
        EXPECT_EQ(grid.occupiedCount(), 1);
    }
}

TEST(NeighborEdgeTest, RelocateFallsBackToSwapOnFullGrid) {
    AssignmentGrid grid(1, 1, 2);
    grid.place(Cell{0, 0, 0}, makeLesson(1, LessonCategory::YOGA, {1}));
    grid.place(Cell{0, 0, 1}, makeLesson(2, LessonCategory::ZUMBA, {2}));
    std::mt19937 rng(5);
    for (int i = 0; i < 100; ++i) {
        Move move = applyRandomMove(grid, {MoveType::RELOCATE, MoveType::SWAP}, rng);
        EXPECT_EQ(move.type, MoveType::SWAP);
        EXPECT_EQ(grid.freeCount(), 0);
    }
    EXPECT_THROW(applyRandomMove(grid, {MoveType::RELOCATE}, rng), DegenerateStateError);
}
