#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"


///////////////////////////
///    DEMO INSTANCES   ///
///////////////////////////
/**
 * @brief Size presets for the synthetic studio instances.
 */
enum class DemoSize {
    SMALL, ///< 1 classroom, 12 clients, 3 instructors.
    MEDIUM, ///< 2 classrooms, 40 clients, 6 instructors.
    LARGE ///< 3 classrooms, 120 clients, 12 instructors.
};

/**
 * @brief Build a deterministic synthetic instance of the requested size.
 *
 * Every category has at least as many qualified instructors as there are
 * classrooms, so random initialization never runs out of instructors.
 */
ProblemInstance makeDemoInstance(DemoSize size);
