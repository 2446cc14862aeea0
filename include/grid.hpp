#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <optional>
#include <vector>


///////////////////////////
///        GRID         ///
///////////////////////////
/**
 * @brief Coordinate of a single slot in the timetable grid.
 */
struct Cell {
    int classroom; ///< Room index (0..classroomCount-1).
    int day; ///< Day index (0..dayCount-1).
    int slot; ///< Time slot index within the day (0..slotCount-1).
};

inline bool operator==(const Cell& a, const Cell& b) {
    return a.classroom == b.classroom && a.day == b.day && a.slot == b.slot;
}

inline bool operator!=(const Cell& a, const Cell& b) { return !(a == b); }

/**
 * @brief Mutable classroom x day x slot table of optional lessons.
 *
 * Every cell holds at most one lesson. Lessons are stored by value, so a
 * copy of the grid is a fully independent snapshot that can be mutated
 * without affecting the original.
 *
 * Linear indices are classroom-major:
 *   index = classroom * dayCount * slotCount + day * slotCount + slot
 * so index % (dayCount * slotCount) identifies the weekly time position.
 */
class AssignmentGrid {
public:
    /**
     * @brief Construct an empty grid of the given dimensions.
     *
     * Throws ConfigurationError if any dimension is not positive.
     */
    AssignmentGrid(int classroomCount, int dayCount, int slotCount);

    /**
     * @brief Construct an empty grid sized from a schedule configuration.
     */
    explicit AssignmentGrid(const ScheduleConfig& config);

    int classroomCount() const { return classrooms_; }
    int dayCount() const { return days_; }
    int slotCount() const { return slots_; }
    int cellCount() const { return (int)cells_.size(); }

    /// Number of cells currently holding a lesson.
    int occupiedCount() const { return occupied_; }

    /// Number of cells currently free.
    int freeCount() const { return cellCount() - occupied_; }

    bool inBounds(const Cell& cell) const;

    /**
     * @brief Linear index of a cell (see class description for layout).
     */
    int linearIndex(const Cell& cell) const;

    /**
     * @brief Inverse of linearIndex().
     */
    Cell cellAt(int index) const;

    /**
     * @brief Read a cell. Throws std::out_of_range for invalid coordinates.
     */
    const std::optional<Lesson>& at(const Cell& cell) const;
    const std::optional<Lesson>& at(int classroom, int day, int slot) const;

    bool isFree(const Cell& cell) const { return !at(cell).has_value(); }

    /**
     * @brief Put a lesson into an empty cell.
     *
     * @return false (grid unchanged) if the cell is out of bounds or occupied.
     */
    bool place(const Cell& cell, Lesson lesson);

    /**
     * @brief Remove and return the lesson stored in a cell.
     *
     * @return The removed lesson, or std::nullopt if the cell was empty.
     */
    std::optional<Lesson> take(const Cell& cell);

    /**
     * @brief Move the lesson at @p from into the empty cell @p to.
     *
     * @return false (grid unchanged) if @p from is empty or @p to is occupied.
     */
    bool move(const Cell& from, const Cell& to);

    /**
     * @brief Exchange the contents of two cells (either may be empty).
     */
    void swap(const Cell& a, const Cell& b);

    /// All occupied cells in linear-index order.
    std::vector<Cell> occupiedCells() const;

    /// All free cells in linear-index order.
    std::vector<Cell> freeCells() const;

    /**
     * @brief Whether an instructor teaches at (day, slot) in any classroom.
     *
     * @param excludeClassroom Classroom to ignore, or -1 to check all.
     */
    bool instructorBusyAt(int instructorId, int day, int slot, int excludeClassroom = -1) const;

    /// Number of lessons an instructor runs in the whole grid.
    int lessonCountFor(int instructorId) const;

private:
    int classrooms_;
    int days_;
    int slots_;
    int occupied_ = 0;
    std::vector<std::optional<Lesson>> cells_;

    std::optional<Lesson>& ref(const Cell& cell);
};
