///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "initializer.hpp"
#include "errors.hpp"
#include <algorithm>
#include <set>
#include <string>


///////////////////////////
///   INITIAL SOLUTION  ///
///////////////////////////
std::vector<LessonDemand> computeLessonDemand(const ProblemInstance& inst) {
    const int maxPerLesson = inst.config.maxParticipantsPerLesson;
    if (maxPerLesson <= 0) {
        throw ConfigurationError("max participants per lesson must be positive, got " +
                                 std::to_string(maxPerLesson));
    }

    std::vector<LessonDemand> demand;
    for (LessonCategory category : kAllCategories) {
        std::vector<int> participants;
        for (const Client& client : inst.clients) {
            if (client.wants(category)) participants.push_back(client.id);
        }
        if (participants.empty()) continue;

        LessonDemand entry;
        entry.category = category;
        int numLessons = ((int)participants.size() + maxPerLesson - 1) / maxPerLesson;
        for (int k = 0; k < numLessons; ++k) {
            auto first = participants.begin() + (size_t)k * maxPerLesson;
            auto last = participants.begin() +
                        std::min((size_t)(k + 1) * maxPerLesson, participants.size());
            entry.groups.emplace_back(first, last);
        }
        demand.push_back(std::move(entry));
    }
    return demand;
}

int countRequiredLessons(const ProblemInstance& inst) {
    int total = 0;
    for (const LessonDemand& entry : computeLessonDemand(inst)) {
        total += (int)entry.groups.size();
    }
    return total;
}

/**
 * @brief Place all demanded lessons into a fresh grid.
 *
 * Free cells are tracked as linear indices shared by all categories, so
 * random placement never reuses a cell.
 */
AssignmentGrid generateInitialGrid(const ProblemInstance& inst, bool greedy, std::mt19937& rng) {
    AssignmentGrid grid(inst.config);
    std::vector<LessonDemand> demand = computeLessonDemand(inst);

    int required = 0;
    for (const LessonDemand& entry : demand) required += (int)entry.groups.size();
    if (required > grid.cellCount()) {
        throw ConfigurationError("insufficient grid capacity: " + std::to_string(required) +
                                 " lessons required, grid has " +
                                 std::to_string(grid.cellCount()) + " cells");
    }

    std::vector<int> freeIndices(grid.cellCount());
    for (int i = 0; i < grid.cellCount(); ++i) freeIndices[i] = i;
    int nextSequential = 0;

    const int weekly = inst.config.weeklySlotCount();

    for (const LessonDemand& entry : demand) {
        std::vector<const Instructor*> qualified;
        for (const Instructor& instructor : inst.instructors) {
            if (instructor.canTeach(entry.category)) qualified.push_back(&instructor);
        }

        for (const std::vector<int>& group : entry.groups) {
            int index;
            if (greedy) {
                index = nextSequential++;
            } else {
                std::uniform_int_distribution<size_t> pick(0, freeIndices.size() - 1);
                size_t pos = pick(rng);
                index = freeIndices[pos];
                freeIndices.erase(freeIndices.begin() + (long)pos);
            }

            // Instructors already teaching at this weekly position in any classroom.
            std::set<int> busy;
            for (int ts = index % weekly; ts < grid.cellCount(); ts += weekly) {
                const std::optional<Lesson>& cell = grid.at(grid.cellAt(ts));
                if (cell) busy.insert(cell->instructorId);
            }

            std::vector<const Instructor*> candidates;
            for (const Instructor* instructor : qualified) {
                if (!busy.count(instructor->id)) candidates.push_back(instructor);
            }
            if (candidates.empty()) {
                throw ConfigurationError("no qualified instructor available for " +
                                         categoryName(entry.category) +
                                         " (" + std::to_string(qualified.size()) +
                                         " qualified, all busy or none on staff)");
            }

            std::uniform_int_distribution<size_t> pickInstructor(0, candidates.size() - 1);
            const Instructor* chosen = candidates[pickInstructor(rng)];

            Lesson lesson;
            lesson.instructorId = chosen->id;
            lesson.category = entry.category;
            lesson.participantIds = group;
            grid.place(grid.cellAt(index), std::move(lesson));
        }
    }
    return grid;
}
