#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "grid.hpp"
#include "cost.hpp"
#include <iostream>
#include <string>
#include <vector>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/**
 * @brief Display name of a 0-based day index ("Monday", ..., "Sunday").
 */
std::string dayName(int day);

/**
 * @brief One-hour time range of a slot, starting at 16:00 ("16:00-17:00").
 */
std::string slotRange(int slot);

/**
 * @brief Print the timetable per classroom and day as small tables.
 */
void printSchedule(const AssignmentGrid& grid, std::ostream& out = std::cout);

/**
 * @brief Print each revenue term and the total.
 */
void printCostSummary(const CostBreakdown& cost, const ScheduleConfig& config, std::ostream& out = std::cout);

/**
 * @brief Print a coarse view of a cost trace: at most @p maxPoints samples.
 */
void printCostTrace(const std::vector<double>& trace, std::ostream& out = std::cout, int maxPoints = 20);
