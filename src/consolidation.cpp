///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "consolidation.hpp"
#include <algorithm>
#include <set>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/**
 * @brief Move every lesson of @p source into the first free slots of @p target.
 *
 * Caller guarantees target has at least as many free slots as source has lessons.
 */
static int drainDay(AssignmentGrid& grid, int classroom,
                    const InstructorDayRecord& source, const InstructorDayRecord& target) {
    int moved = 0;
    for (size_t k = 0; k < source.occupiedSlots.size(); ++k) {
        Cell from{classroom, source.day, source.occupiedSlots[k]};
        Cell to{classroom, target.day, target.freeSlots[k]};
        if (grid.move(from, to)) ++moved;
    }
    return moved;
}

/**
 * @brief Perform the first available drain for one instructor in one classroom.
 *
 * @return true if lessons were moved (records are then stale).
 */
static bool drainOnce(AssignmentGrid& grid, int classroom, int instructorId,
                      ConsolidationReport& report) {
    std::vector<InstructorDayRecord> records = collectInstructorDays(grid, classroom, instructorId);
    if (records.size() < 2) return false;

    // Sparsest days first; stable so equal occupancy keeps day order.
    std::stable_sort(records.begin(), records.end(),
                     [](const InstructorDayRecord& a, const InstructorDayRecord& b) {
                         return a.occupiedSlots.size() < b.occupiedSlots.size();
                     });

    for (size_t i = 0; i + 1 < records.size(); ++i) {
        for (size_t j = i + 1; j < records.size(); ++j) {
            const InstructorDayRecord& a = records[i];
            const InstructorDayRecord& b = records[j];

            if (a.occupiedSlots.size() <= b.freeSlots.size()) {
                report.movedLessons += drainDay(grid, classroom, a, b);
                report.drainedDays += 1;
                return true;
            }
            if (a.freeSlots.size() >= b.occupiedSlots.size()) {
                report.movedLessons += drainDay(grid, classroom, b, a);
                report.drainedDays += 1;
                return true;
            }
        }
    }
    return false;
}


///////////////////////////
///    CONSOLIDATION    ///
///////////////////////////
std::vector<InstructorDayRecord> collectInstructorDays(const AssignmentGrid& grid,
                                                       int classroom,
                                                       int instructorId) {
    std::vector<InstructorDayRecord> records;
    for (int d = 0; d < grid.dayCount(); ++d) {
        InstructorDayRecord record;
        record.day = d;
        for (int s = 0; s < grid.slotCount(); ++s) {
            const std::optional<Lesson>& cell = grid.at(classroom, d, s);
            if (cell) {
                if (cell->instructorId == instructorId) record.occupiedSlots.push_back(s);
            } else if (!grid.instructorBusyAt(instructorId, d, s)) {
                record.freeSlots.push_back(s);
            }
        }
        if (!record.occupiedSlots.empty()) records.push_back(std::move(record));
    }
    return records;
}

/**
 * @brief Sweep all (classroom, instructor) pairs until no drain applies.
 *
 * Every drain empties one (classroom, instructor, day) group and never
 * creates a new one, so the loop terminates.
 */
ConsolidationReport consolidateInstructorDays(AssignmentGrid& grid, const ProblemInstance& inst) {
    // Instructors known to the instance plus any found in the grid itself.
    std::set<int> instructorIds;
    for (const Instructor& instructor : inst.instructors) instructorIds.insert(instructor.id);
    for (const Cell& cell : grid.occupiedCells()) instructorIds.insert(grid.at(cell)->instructorId);

    ConsolidationReport report;
    bool changed = true;
    while (changed) {
        changed = false;
        ++report.sweeps;
        for (int c = 0; c < grid.classroomCount(); ++c) {
            for (int id : instructorIds) {
                while (drainOnce(grid, c, id, report)) {
                    changed = true;
                }
            }
        }
    }
    return report;
}

int instructorPresenceDays(const AssignmentGrid& grid, int instructorId) {
    int days = 0;
    for (int d = 0; d < grid.dayCount(); ++d) {
        bool present = false;
        for (int c = 0; c < grid.classroomCount() && !present; ++c) {
            for (int s = 0; s < grid.slotCount(); ++s) {
                const std::optional<Lesson>& cell = grid.at(c, d, s);
                if (cell && cell->instructorId == instructorId) {
                    present = true;
                    break;
                }
            }
        }
        if (present) ++days;
    }
    return days;
}
