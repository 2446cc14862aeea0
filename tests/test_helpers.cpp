///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "test_helpers.hpp"
#include <algorithm>
#include <utility>


///////////////////////////
///       HELPERS       ///
///////////////////////////
Client makeClient(int id, std::initializer_list<LessonCategory> categories) {
    return Client{id, std::set<LessonCategory>(categories)};
}

Instructor makeInstructor(int id, std::initializer_list<LessonCategory> categories) {
    return Instructor{id, std::set<LessonCategory>(categories)};
}

Lesson makeLesson(int instructorId, LessonCategory category, std::vector<int> participants) {
    return Lesson{instructorId, category, std::move(participants)};
}

ScheduleConfig makeConfig(int classrooms, int days, int slots, int maxParticipants) {
    ScheduleConfig config;
    config.classroomCount = classrooms;
    config.dayCount = days;
    config.slotCount = slots;
    config.maxParticipantsPerLesson = maxParticipants;
    return config;
}

std::vector<LessonTuple> lessonTuples(const AssignmentGrid& grid) {
    std::vector<LessonTuple> out;
    for (const Cell& cell : grid.occupiedCells()) {
        const Lesson& lesson = *grid.at(cell);
        out.emplace_back(lesson.instructorId, categoryOrdinal(lesson.category), lesson.participantIds);
    }
    std::sort(out.begin(), out.end());
    return out;
}

AnnealingParams quickParams(std::uint64_t seed) {
    AnnealingParams params;
    params.alpha = 0.9;
    params.initialTemperature = 50;
    params.iterationsPerTemperature = 20;
    params.minTemperature = 0.5;
    params.epsilon = 0.01;
    params.maxStagnantEpochs = 1000;
    params.seed = seed;
    return params;
}
