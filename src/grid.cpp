///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "grid.hpp"
#include "errors.hpp"
#include <stdexcept>
#include <string>
#include <utility>


///////////////////////////
///        GRID         ///
///////////////////////////
/**
 * @brief Allocate an empty grid; every cell starts as std::nullopt.
 */
AssignmentGrid::AssignmentGrid(int classroomCount, int dayCount, int slotCount)
        : classrooms_(classroomCount),
          days_(dayCount),
          slots_(slotCount) {
    if (classroomCount <= 0 || dayCount <= 0 || slotCount <= 0) {
        throw ConfigurationError("grid dimensions must be positive, got " +
                                 std::to_string(classroomCount) + "x" +
                                 std::to_string(dayCount) + "x" +
                                 std::to_string(slotCount));
    }
    cells_.assign((size_t)classroomCount * dayCount * slotCount, std::nullopt);
}

AssignmentGrid::AssignmentGrid(const ScheduleConfig& config)
        : AssignmentGrid(config.classroomCount, config.dayCount, config.slotCount) {}

bool AssignmentGrid::inBounds(const Cell& cell) const {
    return cell.classroom >= 0 && cell.classroom < classrooms_ &&
           cell.day >= 0 && cell.day < days_ &&
           cell.slot >= 0 && cell.slot < slots_;
}

int AssignmentGrid::linearIndex(const Cell& cell) const {
    return cell.classroom * days_ * slots_ + cell.day * slots_ + cell.slot;
}

Cell AssignmentGrid::cellAt(int index) const {
    if (index < 0 || index >= cellCount()) {
        throw std::out_of_range("grid index out of range: " + std::to_string(index));
    }
    int weekly = days_ * slots_;
    Cell cell;
    cell.classroom = index / weekly;
    cell.day = (index % weekly) / slots_;
    cell.slot = index % slots_;
    return cell;
}

const std::optional<Lesson>& AssignmentGrid::at(const Cell& cell) const {
    if (!inBounds(cell)) {
        throw std::out_of_range("grid cell out of range: (" +
                                std::to_string(cell.classroom) + ", " +
                                std::to_string(cell.day) + ", " +
                                std::to_string(cell.slot) + ")");
    }
    return cells_[linearIndex(cell)];
}

const std::optional<Lesson>& AssignmentGrid::at(int classroom, int day, int slot) const {
    return at(Cell{classroom, day, slot});
}

std::optional<Lesson>& AssignmentGrid::ref(const Cell& cell) {
    if (!inBounds(cell)) {
        throw std::out_of_range("grid cell out of range");
    }
    return cells_[linearIndex(cell)];
}

bool AssignmentGrid::place(const Cell& cell, Lesson lesson) {
    if (!inBounds(cell)) return false;
    std::optional<Lesson>& target = cells_[linearIndex(cell)];
    if (target) return false;
    target = std::move(lesson);
    ++occupied_;
    return true;
}

std::optional<Lesson> AssignmentGrid::take(const Cell& cell) {
    std::optional<Lesson>& source = ref(cell);
    if (!source) return std::nullopt;
    std::optional<Lesson> out = std::move(source);
    source.reset();
    --occupied_;
    return out;
}

/**
 * @brief Relocate a lesson; ownership moves from one cell to the other.
 */
bool AssignmentGrid::move(const Cell& from, const Cell& to) {
    if (!inBounds(from) || !inBounds(to)) return false;
    std::optional<Lesson>& source = cells_[linearIndex(from)];
    std::optional<Lesson>& target = cells_[linearIndex(to)];
    if (!source || target) return false;
    target = std::move(source);
    source.reset();
    return true;
}

void AssignmentGrid::swap(const Cell& a, const Cell& b) {
    // Occupied count is unchanged by an exchange.
    std::swap(ref(a), ref(b));
}

std::vector<Cell> AssignmentGrid::occupiedCells() const {
    std::vector<Cell> out;
    out.reserve(occupied_);
    for (int i = 0; i < cellCount(); ++i) {
        if (cells_[i]) out.push_back(cellAt(i));
    }
    return out;
}

std::vector<Cell> AssignmentGrid::freeCells() const {
    std::vector<Cell> out;
    out.reserve(freeCount());
    for (int i = 0; i < cellCount(); ++i) {
        if (!cells_[i]) out.push_back(cellAt(i));
    }
    return out;
}

bool AssignmentGrid::instructorBusyAt(int instructorId, int day, int slot, int excludeClassroom) const {
    for (int c = 0; c < classrooms_; ++c) {
        if (c == excludeClassroom) continue;
        const std::optional<Lesson>& cell = at(c, day, slot);
        if (cell && cell->instructorId == instructorId) return true;
    }
    return false;
}

int AssignmentGrid::lessonCountFor(int instructorId) const {
    int count = 0;
    for (const std::optional<Lesson>& cell : cells_) {
        if (cell && cell->instructorId == instructorId) ++count;
    }
    return count;
}
