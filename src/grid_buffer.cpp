///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "grid_buffer.hpp"
#include "errors.hpp"
#include <string>


///////////////////////////
///   FLAT ENCODING     ///
///////////////////////////
void serializeGrid(const AssignmentGrid& grid, std::vector<int>& buffer) {
    buffer.clear();
    for (const Cell& cell : grid.occupiedCells()) {
        const Lesson& lesson = *grid.at(cell);
        buffer.push_back(grid.linearIndex(cell));
        buffer.push_back(lesson.instructorId);
        buffer.push_back(categoryOrdinal(lesson.category));
        buffer.push_back(lesson.participantCount());
        buffer.insert(buffer.end(), lesson.participantIds.begin(), lesson.participantIds.end());
    }
}

AssignmentGrid deserializeGrid(const std::vector<int>& buffer, const ScheduleConfig& config) {
    AssignmentGrid grid(config);

    size_t pos = 0;
    while (pos < buffer.size()) {
        if (pos + 4 > buffer.size()) {
            throw DataError("grid buffer truncated at offset " + std::to_string(pos));
        }
        int index = buffer[pos + 0];
        int instructorId = buffer[pos + 1];
        int ordinal = buffer[pos + 2];
        int count = buffer[pos + 3];
        pos += 4;

        if (index < 0 || index >= grid.cellCount()) {
            throw DataError("grid buffer names cell " + std::to_string(index) + " outside the grid");
        }
        if (count < 0 || pos + (size_t)count > buffer.size()) {
            throw DataError("grid buffer truncated in participant list of cell " + std::to_string(index));
        }

        Lesson lesson{instructorId, categoryFromOrdinal(ordinal),
                      std::vector<int>(buffer.begin() + pos, buffer.begin() + pos + count)};
        pos += (size_t)count;

        if (!grid.place(grid.cellAt(index), std::move(lesson))) {
            throw DataError("grid buffer places two lessons in cell " + std::to_string(index));
        }
    }
    return grid;
}
