#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "grid.hpp"
#include <random>
#include <vector>


///////////////////////////
///      NEIGHBORS      ///
///////////////////////////
/**
 * @brief A perturbation applied to a grid, kept so it can be undone.
 *
 * RELOCATE: the lesson at @c from now sits in the previously empty @c to.
 * SWAP:     the lessons at @c from and @c to have been exchanged.
 */
struct Move {
    MoveType type;
    Cell from;
    Cell to;
};

/**
 * @brief Move one uniformly chosen lesson into one uniformly chosen free cell.
 *
 * The number of lessons in the grid is unchanged.
 * Throws DegenerateStateError if the grid has no lesson or no free cell.
 */
Move relocateRandomLesson(AssignmentGrid& grid, std::mt19937& rng);

/**
 * @brief Exchange two uniformly chosen, distinct occupied cells.
 *
 * Throws DegenerateStateError if fewer than two cells are occupied.
 */
Move swapRandomLessons(AssignmentGrid& grid, std::mt19937& rng);

/**
 * @brief Apply one random move of a type drawn uniformly from @p allowed.
 *
 * An empty @p allowed list behaves like {RELOCATE}. When both types are
 * allowed, SWAP drawn on a grid with a single lesson becomes RELOCATE, and
 * RELOCATE drawn on a full grid with at least two lessons becomes SWAP.
 *
 * @return The applied move, suitable for undoMove().
 */
Move applyRandomMove(AssignmentGrid& grid, const std::vector<MoveType>& allowed, std::mt19937& rng);

/**
 * @brief Revert a move previously returned by one of the functions above.
 */
void undoMove(AssignmentGrid& grid, const Move& move);
