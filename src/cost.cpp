///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "cost.hpp"
#include <map>
#include <utility>


///////////////////////////
///      OBJECTIVE      ///
///////////////////////////
/**
 * @brief Single pass over the grid accumulating revenue and expense terms.
 *
 * Instructor hours are counted per lesson; presence is counted once per
 * (instructor, day) and rental once per (classroom, day).
 */
CostBreakdown computeCostBreakdown(const AssignmentGrid& grid, const ScheduleConfig& config) {
    CostBreakdown out;

    // (instructorId, day) -> lessons that day.
    std::map<std::pair<int, int>, int> instructorDayHours;

    for (int c = 0; c < grid.classroomCount(); ++c) {
        for (int d = 0; d < grid.dayCount(); ++d) {
            bool classroomUsed = false;
            for (int s = 0; s < grid.slotCount(); ++s) {
                const std::optional<Lesson>& cell = grid.at(c, d, s);
                if (!cell) continue;
                out.participants += cell->participantCount();
                instructorDayHours[{cell->instructorId, d}] += 1;
                classroomUsed = true;
            }
            if (classroomUsed) out.classroomDays += 1;
        }
    }

    for (const auto& entry : instructorDayHours) {
        out.instructorHours += entry.second;
        out.instructorPresenceDays += 1;
    }

    out.total = config.ticketPrice * out.participants -
                config.hourlyPay * out.instructorHours -
                config.presenceBonus * out.instructorPresenceDays -
                config.rentalCost * out.classroomDays;
    return out;
}

double computeCost(const AssignmentGrid& grid, const ScheduleConfig& config) {
    return computeCostBreakdown(grid, config).total;
}
