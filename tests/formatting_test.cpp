///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "formatting.hpp"
#include "cost.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <sstream>


///////////////////////////
///        TESTS        ///
///////////////////////////
TEST(FormattingTest, DayAndSlotLabels) {
    EXPECT_EQ(dayName(0), "Monday");
    EXPECT_EQ(dayName(5), "Saturday");
    EXPECT_EQ(dayName(9), "Day 10");

    EXPECT_EQ(slotRange(0), "16:00-17:00");
    EXPECT_EQ(slotRange(5), "21:00-22:00");
    EXPECT_EQ(slotRange(7), "23:00-00:00");
}

TEST(FormattingTest, ScheduleListsOccupiedSlots) {
    AssignmentGrid grid(makeConfig(2, 2, 3));
    grid.place(Cell{0, 1, 2}, makeLesson(4, LessonCategory::PILATES, {1, 5}));

    std::ostringstream out;
    printSchedule(grid, out);
    std::string text = out.str();

    EXPECT_NE(text.find("Classroom 1:"), std::string::npos);
    EXPECT_NE(text.find("Tuesday"), std::string::npos);
    EXPECT_EQ(text.find("Monday"), std::string::npos);
    EXPECT_NE(text.find("18:00-19:00"), std::string::npos);
    EXPECT_NE(text.find("PILATES"), std::string::npos);
    EXPECT_NE(text.find("[1,5]"), std::string::npos);
    EXPECT_NE(text.find("Classroom 2:"), std::string::npos);
    EXPECT_NE(text.find("(no lessons)"), std::string::npos);
}

TEST(FormattingTest, CostSummaryShowsRevenue) {
    ScheduleConfig config = makeConfig(1, 1, 2);
    AssignmentGrid grid(config);
    grid.place(Cell{0, 0, 0}, makeLesson(1, LessonCategory::YOGA, {1, 2}));

    std::ostringstream out;
    printCostSummary(computeCostBreakdown(grid, config), config, out);
    EXPECT_NE(out.str().find("Revenue:"), std::string::npos);
    EXPECT_NE(out.str().find("-220"), std::string::npos);
}

TEST(FormattingTest, CostTraceHandlesEmptyAndLong) {
    std::ostringstream empty;
    printCostTrace({}, empty);
    EXPECT_EQ(empty.str(), "(empty trace)\n");

    std::vector<double> trace(100);
    for (int i = 0; i < 100; ++i) trace[i] = i;
    std::ostringstream out;
    printCostTrace(trace, out, 10);
    EXPECT_NE(out.str().find("99"), std::string::npos);
}
