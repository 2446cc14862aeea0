///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "grid.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <stdexcept>


///////////////////////////
///        TESTS        ///
///////////////////////////
TEST(AssignmentGridTest, StartsEmpty) {
    AssignmentGrid grid(2, 3, 4);
    EXPECT_EQ(grid.cellCount(), 24);
    EXPECT_EQ(grid.occupiedCount(), 0);
    EXPECT_EQ(grid.freeCount(), 24);
    EXPECT_TRUE(grid.occupiedCells().empty());
    EXPECT_EQ(grid.freeCells().size(), 24u);
}

TEST(AssignmentGridTest, RejectsNonPositiveDimensions) {
    EXPECT_THROW(AssignmentGrid(0, 6, 6), ConfigurationError);
    EXPECT_THROW(AssignmentGrid(1, -1, 6), ConfigurationError);
    EXPECT_THROW(AssignmentGrid(makeConfig(1, 6, 0)), ConfigurationError);
}

TEST(AssignmentGridTest, LinearIndexIsClassroomMajor) {
    AssignmentGrid grid(2, 3, 4);
    EXPECT_EQ(grid.linearIndex(Cell{0, 0, 0}), 0);
    EXPECT_EQ(grid.linearIndex(Cell{0, 1, 2}), 6);
    EXPECT_EQ(grid.linearIndex(Cell{1, 0, 0}), 12);
    EXPECT_EQ(grid.linearIndex(Cell{1, 2, 3}), 23);

    for (int i = 0; i < grid.cellCount(); ++i) {
        EXPECT_EQ(grid.linearIndex(grid.cellAt(i)), i);
    }
    EXPECT_THROW(grid.cellAt(24), std::out_of_range);
}

TEST(AssignmentGridTest, PlaceRefusesOccupiedCell) {
    AssignmentGrid grid(1, 1, 2);
    Cell cell{0, 0, 1};
    EXPECT_TRUE(grid.place(cell, makeLesson(1, LessonCategory::YOGA, {1, 2})));
    EXPECT_FALSE(grid.place(cell, makeLesson(2, LessonCategory::ZUMBA, {3})));

    ASSERT_TRUE(grid.at(cell).has_value());
    EXPECT_EQ(grid.at(cell)->instructorId, 1);
    EXPECT_EQ(grid.occupiedCount(), 1);
}

TEST(AssignmentGridTest, MoveTransfersOwnership) {
    AssignmentGrid grid(1, 2, 2);
    Cell from{0, 0, 0};
    Cell to{0, 1, 1};
    Lesson lesson = makeLesson(3, LessonCategory::PILATES, {4, 5, 6});
    grid.place(from, lesson);

    EXPECT_TRUE(grid.move(from, to));
    EXPECT_FALSE(grid.at(from).has_value());
    ASSERT_TRUE(grid.at(to).has_value());
    EXPECT_EQ(*grid.at(to), lesson);
    EXPECT_EQ(grid.occupiedCount(), 1);
}

TEST(AssignmentGridTest, MoveRejectsEmptySourceOrOccupiedTarget) {
    AssignmentGrid grid(1, 1, 3);
    grid.place(Cell{0, 0, 0}, makeLesson(1, LessonCategory::YOGA, {1}));
    grid.place(Cell{0, 0, 1}, makeLesson(2, LessonCategory::YOGA, {2}));

    EXPECT_FALSE(grid.move(Cell{0, 0, 2}, Cell{0, 0, 0}));
    EXPECT_FALSE(grid.move(Cell{0, 0, 0}, Cell{0, 0, 1}));
    EXPECT_EQ(grid.at(0, 0, 0)->instructorId, 1);
    EXPECT_EQ(grid.at(0, 0, 1)->instructorId, 2);
}

TEST(AssignmentGridTest, TakeEmptiesCell) {
    AssignmentGrid grid(1, 1, 1);
    grid.place(Cell{0, 0, 0}, makeLesson(1, LessonCategory::FITNESS, {9}));

    std::optional<Lesson> taken = grid.take(Cell{0, 0, 0});
    ASSERT_TRUE(taken.has_value());
    EXPECT_EQ(taken->participantIds, std::vector<int>{9});
    EXPECT_EQ(grid.occupiedCount(), 0);
    EXPECT_FALSE(grid.take(Cell{0, 0, 0}).has_value());
}

TEST(AssignmentGridTest, SwapExchangesContents) {
    AssignmentGrid grid(1, 1, 3);
    grid.place(Cell{0, 0, 0}, makeLesson(1, LessonCategory::YOGA, {1}));
    grid.place(Cell{0, 0, 2}, makeLesson(2, LessonCategory::ZUMBA, {2}));

    grid.swap(Cell{0, 0, 0}, Cell{0, 0, 2});
    EXPECT_EQ(grid.at(0, 0, 0)->instructorId, 2);
    EXPECT_EQ(grid.at(0, 0, 2)->instructorId, 1);

    // Swapping with an empty cell acts as a move.
    grid.swap(Cell{0, 0, 0}, Cell{0, 0, 1});
    EXPECT_FALSE(grid.at(0, 0, 0).has_value());
    EXPECT_EQ(grid.at(0, 0, 1)->instructorId, 2);
    EXPECT_EQ(grid.occupiedCount(), 2);
}

TEST(AssignmentGridTest, OutOfBoundsAccessThrows) {
    AssignmentGrid grid(1, 2, 2);
    EXPECT_THROW(grid.at(1, 0, 0), std::out_of_range);
    EXPECT_THROW(grid.at(0, 2, 0), std::out_of_range);
    EXPECT_THROW(grid.at(0, 0, -1), std::out_of_range);
    EXPECT_FALSE(grid.place(Cell{0, 5, 0}, makeLesson(1, LessonCategory::YOGA, {})));
}

TEST(AssignmentGridTest, InstructorBusyAtLooksAcrossClassrooms) {
    AssignmentGrid grid(3, 2, 2);
    grid.place(Cell{1, 1, 0}, makeLesson(7, LessonCategory::CROSSFIT, {1}));

    EXPECT_TRUE(grid.instructorBusyAt(7, 1, 0));
    EXPECT_FALSE(grid.instructorBusyAt(7, 1, 1));
    EXPECT_FALSE(grid.instructorBusyAt(8, 1, 0));
    EXPECT_FALSE(grid.instructorBusyAt(7, 1, 0, /*excludeClassroom=*/1));
    EXPECT_EQ(grid.lessonCountFor(7), 1);
}
