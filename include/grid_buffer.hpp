#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "grid.hpp"
#include <vector>


///////////////////////////
///   FLAT ENCODING     ///
///////////////////////////
/**
 * @brief Encode the occupied cells of a grid as a flat integer buffer.
 *
 * Each lesson is written as (linearIndex, instructorId, categoryOrdinal,
 * participantCount, participantIds...), in linear-index order. Used to ship
 * grids between MPI ranks as one contiguous MPI_INT array.
 */
void serializeGrid(const AssignmentGrid& grid, std::vector<int>& buffer);

/**
 * @brief Rebuild a grid of the configured dimensions from serializeGrid() output.
 *
 * Throws DataError if the buffer is truncated or names a cell outside the grid.
 */
AssignmentGrid deserializeGrid(const std::vector<int>& buffer, const ScheduleConfig& config);
