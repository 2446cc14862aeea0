#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "grid.hpp"
#include <random>
#include <vector>


///////////////////////////
///   INITIAL SOLUTION  ///
///////////////////////////
/**
 * @brief Clients of one category split into lesson-sized groups.
 */
struct LessonDemand {
    LessonCategory category; ///< Category all groups belong to.
    std::vector<std::vector<int>> groups; ///< Client ids per lesson, each of size <= max participants.
};

/**
 * @brief Split client demand into lesson groups, category by category.
 *
 * Clients wanting a category are taken in input order and cut into
 * consecutive chunks of at most config.maxParticipantsPerLesson, giving
 * ceil(n / max) lessons per category. Categories nobody wants are omitted.
 *
 * Throws ConfigurationError if maxParticipantsPerLesson is not positive.
 */
std::vector<LessonDemand> computeLessonDemand(const ProblemInstance& inst);

/**
 * @brief Total number of lessons the demand requires.
 */
int countRequiredLessons(const ProblemInstance& inst);

/**
 * @brief Build a starting grid holding every required lesson exactly once.
 *
 * Each lesson goes to the next sequential cell (@p greedy) or to a free cell
 * drawn uniformly without replacement. Its instructor is drawn uniformly
 * among those qualified for the category, excluding anyone already teaching
 * at the same weekly position (same day and slot) in another classroom.
 *
 * Throws ConfigurationError if the grid has fewer cells than required
 * lessons, or if a category with demand has no usable instructor.
 */
AssignmentGrid generateInitialGrid(const ProblemInstance& inst, bool greedy, std::mt19937& rng);
