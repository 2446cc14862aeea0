///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "formatting.hpp"
#include <array>
#include <iomanip>
#include <sstream>

///////////////////////////
///       HELPERS       ///
///////////////////////////

/**
 * @brief Human-readable names for each weekday.
 *
 * Indexed by the 0-based day index used in the grid.
 */
static const std::array<std::string, 7> kDayNames = {
        "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday", "Sunday"
};

/// Hour at which slot 0 starts.
static constexpr int kFirstSlotHour = 16;

std::string dayName(int day) {
    if (day >= 0 && day < (int)kDayNames.size()) return kDayNames[day];
    return "Day " + std::to_string(day + 1);
}

std::string slotRange(int slot) {
    auto hour = [](int h) {
        std::ostringstream ss;
        ss << std::setw(2) << std::setfill('0') << (h % 24) << ":00";
        return ss.str();
    };
    return hour(kFirstSlotHour + slot) + "-" + hour(kFirstSlotHour + slot + 1);
}

static std::string joinIds(const std::vector<int>& ids) {
    std::ostringstream ss;
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i) ss << ",";
        ss << ids[i];
    }
    return ss.str();
}

/**
 * @brief Print the header row for a per-day schedule table.
 */
static void printDayTableHeader(std::ostream& out) {
    out << "    "
        << std::left << std::setw(11) << "Time"
        << " | " << std::left << std::setw(16) << "Lesson"
        << " | " << std::left << std::setw(10) << "Instructor"
        << " | " << "Participants"
        << "\n";

    out << "    "
        << std::string(11, '-')
        << "-+-" << std::string(16, '-')
        << "-+-" << std::string(10, '-')
        << "-+-" << std::string(12, '-')
        << "\n";
}

/**
 * @brief Print the timetable of every classroom, one table per day in use.
 *
 * Days without lessons in a classroom are skipped; a classroom without any
 * lesson prints a placeholder line.
 */
void printSchedule(const AssignmentGrid& grid, std::ostream& out) {
    for (int c = 0; c < grid.classroomCount(); ++c) {
        out << "----------------------------------------\n";
        out << "Classroom " << (c + 1) << ":\n";

        bool any = false;
        for (int d = 0; d < grid.dayCount(); ++d) {
            bool headerPrinted = false;
            for (int s = 0; s < grid.slotCount(); ++s) {
                const std::optional<Lesson>& lesson = grid.at(c, d, s);
                if (!lesson) continue;

                if (!headerPrinted) {
                    out << "\n  " << dayName(d) << ":\n";
                    printDayTableHeader(out);
                    headerPrinted = true;
                }
                any = true;

                out << "    "
                    << std::left << std::setw(11) << slotRange(s)
                    << " | " << std::left << std::setw(16) << categoryName(lesson->category)
                    << " | " << std::left << std::setw(10) << lesson->instructorId
                    << " | " << lesson->participantCount() << " [" << joinIds(lesson->participantIds) << "]"
                    << "\n";
            }
        }

        if (!any) out << "  (no lessons)\n";
        out << "\n";
    }
}

void printCostSummary(const CostBreakdown& cost, const ScheduleConfig& config, std::ostream& out) {
    out << "Participants:          " << cost.participants
        << "  (+" << cost.participants * config.ticketPrice << ")\n";
    out << "Instructor hours:      " << cost.instructorHours
        << "  (-" << cost.instructorHours * config.hourlyPay << ")\n";
    out << "Instructor days:       " << cost.instructorPresenceDays
        << "  (-" << cost.instructorPresenceDays * config.presenceBonus << ")\n";
    out << "Classroom days rented: " << cost.classroomDays
        << "  (-" << cost.classroomDays * config.rentalCost << ")\n";
    out << "Revenue:               " << cost.total << "\n";
}

void printCostTrace(const std::vector<double>& trace, std::ostream& out, int maxPoints) {
    if (trace.empty()) {
        out << "(empty trace)\n";
        return;
    }
    if (maxPoints < 2) maxPoints = 2;

    size_t n = trace.size();
    size_t step = n <= (size_t)maxPoints ? 1 : (n - 1) / (size_t)(maxPoints - 1);
    if (step == 0) step = 1;

    for (size_t i = 0; i < n; i += step) {
        out << "  iter " << std::setw(8) << (i + 1) << " : " << trace[i] << "\n";
    }
    if ((n - 1) % step != 0) {
        out << "  iter " << std::setw(8) << n << " : " << trace[n - 1] << "\n";
    }
}
