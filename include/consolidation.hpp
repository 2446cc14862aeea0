#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "grid.hpp"
#include <vector>


///////////////////////////
///    CONSOLIDATION    ///
///////////////////////////
/**
 * @brief What a consolidation pass changed.
 */
struct ConsolidationReport {
    int movedLessons = 0; ///< Lessons relocated to another day.
    int drainedDays = 0; ///< (classroom, instructor, day) groups emptied.
    int sweeps = 0; ///< Full passes over all classrooms and instructors.
};

/**
 * @brief One instructor's lessons on one day in one classroom.
 */
struct InstructorDayRecord {
    int day; ///< Day index.
    std::vector<int> occupiedSlots; ///< Slots where the instructor teaches here.
    std::vector<int> freeSlots; ///< Empty slots the instructor could take over.
};

/**
 * @brief Collect an instructor's per-day occupancy in one classroom.
 *
 * Only days where the instructor teaches in @p classroom are returned.
 * A slot counts as free when the cell is empty and the instructor is not
 * teaching in another classroom at that time. Records are in day order.
 */
std::vector<InstructorDayRecord> collectInstructorDays(const AssignmentGrid& grid,
                                                       int classroom,
                                                       int instructorId);

/**
 * @brief Repack each instructor's lessons onto fewer days.
 *
 * Per classroom and instructor, day records are sorted by ascending
 * occupancy. For each pair (i, j), i < j, the sparser day i is drained into
 * day j when j has enough free slots; otherwise day j is drained into day i
 * when i has room for all of j's lessons. After each drain the records are
 * rebuilt and the scan restarts. Sweeps repeat until nothing moves.
 *
 * Lessons keep their instructor, category and participants, and never
 * leave their classroom. Billable hours and participants are unchanged;
 * presence days and rented classroom-days can only decrease, so revenue
 * never goes down.
 */
ConsolidationReport consolidateInstructorDays(AssignmentGrid& grid, const ProblemInstance& inst);

/**
 * @brief Number of distinct days an instructor teaches on, over all classrooms.
 */
int instructorPresenceDays(const AssignmentGrid& grid, int instructorId);
