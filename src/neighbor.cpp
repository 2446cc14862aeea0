///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "neighbor.hpp"
#include "errors.hpp"
#include <algorithm>


///////////////////////////
///       HELPERS       ///
///////////////////////////
static bool allows(const std::vector<MoveType>& allowed, MoveType type) {
    return std::find(allowed.begin(), allowed.end(), type) != allowed.end();
}


///////////////////////////
///      NEIGHBORS      ///
///////////////////////////
Move relocateRandomLesson(AssignmentGrid& grid, std::mt19937& rng) {
    if (grid.occupiedCount() == 0) {
        throw DegenerateStateError("cannot relocate: grid has no lessons");
    }
    if (grid.freeCount() == 0) {
        throw DegenerateStateError("cannot relocate: grid has no free cells");
    }

    std::vector<Cell> occupied = grid.occupiedCells();
    std::vector<Cell> free = grid.freeCells();

    std::uniform_int_distribution<size_t> pickOccupied(0, occupied.size() - 1);
    std::uniform_int_distribution<size_t> pickFree(0, free.size() - 1);
    Cell from = occupied[pickOccupied(rng)];
    Cell to = free[pickFree(rng)];

    grid.move(from, to);
    return Move{MoveType::RELOCATE, from, to};
}

Move swapRandomLessons(AssignmentGrid& grid, std::mt19937& rng) {
    if (grid.occupiedCount() < 2) {
        throw DegenerateStateError("cannot swap: grid has fewer than two lessons");
    }

    std::vector<Cell> occupied = grid.occupiedCells();

    // Draw the second index from the remaining n-1 cells to keep them distinct.
    std::uniform_int_distribution<size_t> pickFirst(0, occupied.size() - 1);
    std::uniform_int_distribution<size_t> pickSecond(0, occupied.size() - 2);
    size_t i = pickFirst(rng);
    size_t j = pickSecond(rng);
    if (j >= i) ++j;

    grid.swap(occupied[i], occupied[j]);
    return Move{MoveType::SWAP, occupied[i], occupied[j]};
}

Move applyRandomMove(AssignmentGrid& grid, const std::vector<MoveType>& allowed, std::mt19937& rng) {
    MoveType type = MoveType::RELOCATE;
    if (allowed.size() == 1) {
        type = allowed.front();
    } else if (allowed.size() > 1) {
        std::uniform_int_distribution<size_t> pickType(0, allowed.size() - 1);
        type = allowed[pickType(rng)];
        // A single lesson cannot be swapped and a full grid has no target
        // for relocation; use the other allowed type in either case.
        if (type == MoveType::SWAP && grid.occupiedCount() < 2 && allows(allowed, MoveType::RELOCATE)) {
            type = MoveType::RELOCATE;
        } else if (type == MoveType::RELOCATE && grid.freeCount() == 0 &&
                   grid.occupiedCount() >= 2 && allows(allowed, MoveType::SWAP)) {
            type = MoveType::SWAP;
        }
    }

    switch (type) {
        case MoveType::RELOCATE: return relocateRandomLesson(grid, rng);
        case MoveType::SWAP:     return swapRandomLessons(grid, rng);
    }
    return relocateRandomLesson(grid, rng);
}

void undoMove(AssignmentGrid& grid, const Move& move) {
    switch (move.type) {
        case MoveType::RELOCATE:
            grid.move(move.to, move.from);
            break;
        case MoveType::SWAP:
            grid.swap(move.from, move.to);
            break;
    }
}
