#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "grid.hpp"


///////////////////////////
///      OBJECTIVE      ///
///////////////////////////
/**
 * @brief Individual terms of the weekly revenue of a grid.
 */
struct CostBreakdown {
    int participants = 0; ///< Sum of participants over all lessons.
    int instructorHours = 0; ///< Billable lesson hours over all instructors.
    int instructorPresenceDays = 0; ///< Number of (instructor, day) pairs with a lesson.
    int classroomDays = 0; ///< Number of (classroom, day) pairs with a lesson.
    double total = 0.0; ///< Net revenue computed from the terms above.
};

/**
 * @brief Compute every revenue term of a grid.
 *
 * total = ticketPrice   * participants
 *       - hourlyPay     * instructorHours
 *       - presenceBonus * instructorPresenceDays
 *       - rentalCost    * classroomDays
 *
 * Pure: depends only on the grid contents and the config.
 */
CostBreakdown computeCostBreakdown(const AssignmentGrid& grid, const ScheduleConfig& config);

/**
 * @brief Net weekly revenue of a grid (higher is better).
 */
double computeCost(const AssignmentGrid& grid, const ScheduleConfig& config);
