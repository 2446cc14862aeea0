///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "grid_buffer.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>


///////////////////////////
///        TESTS        ///
///////////////////////////
TEST(GridBufferTest, RestoresLessonsInPlace) {
    ScheduleConfig config = makeConfig(2, 2, 3);
    AssignmentGrid grid(config);
    grid.place(Cell{0, 1, 2}, makeLesson(4, LessonCategory::PILATES, {1, 5, 9}));
    grid.place(Cell{1, 0, 0}, makeLesson(7, LessonCategory::ZUMBA, {}));

    std::vector<int> buffer;
    serializeGrid(grid, buffer);
    AssignmentGrid restored = deserializeGrid(buffer, config);

    EXPECT_EQ(restored.freeCount(), grid.freeCount());
    ASSERT_TRUE(restored.at(0, 1, 2).has_value());
    EXPECT_EQ(*restored.at(0, 1, 2), *grid.at(0, 1, 2));
    ASSERT_TRUE(restored.at(1, 0, 0).has_value());
    EXPECT_TRUE(restored.at(1, 0, 0)->participantIds.empty());
}

TEST(GridBufferTest, EmptyGridIsEmptyBuffer) {
    ScheduleConfig config = makeConfig(1, 2, 2);
    std::vector<int> buffer{1, 2, 3};
    serializeGrid(AssignmentGrid(config), buffer);
    EXPECT_TRUE(buffer.empty());
    EXPECT_EQ(deserializeGrid(buffer, config).freeCount(), 4);
}

TEST(GridBufferTest, RejectsMalformedBuffers) {
    ScheduleConfig config = makeConfig(1, 1, 2);

    EXPECT_THROW(deserializeGrid({0, 1, 2}, config), DataError);
    EXPECT_THROW(deserializeGrid({0, 1, 2, 3, 10}, config), DataError);
    EXPECT_THROW(deserializeGrid({2, 1, 2, 0}, config), DataError);
    EXPECT_THROW(deserializeGrid({0, 1, 2, 0, 0, 1, 2, 0}, config), DataError);
    EXPECT_THROW(deserializeGrid({0, 1, 42, 0}, config), DataError);
}
