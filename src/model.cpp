///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "errors.hpp"


///////////////////////////
///       MODELS        ///
///////////////////////////
LessonCategory categoryFromOrdinal(int ordinal) {
    if (ordinal < 0 || ordinal >= CATEGORY_COUNT) {
        throw DataError("unknown lesson category ordinal: " + std::to_string(ordinal));
    }
    return kAllCategories[ordinal];
}

std::string categoryName(LessonCategory c) {
    switch (c) {
        case LessonCategory::CELLULITE_KILLER: return "CELLULITE_KILLER";
        case LessonCategory::ZUMBA:            return "ZUMBA";
        case LessonCategory::ZUMBA_ADVANCED:   return "ZUMBA_ADVANCED";
        case LessonCategory::FITNESS:          return "FITNESS";
        case LessonCategory::CROSSFIT:         return "CROSSFIT";
        case LessonCategory::BRAZILIAN_BUTT:   return "BRAZILIAN_BUTT";
        case LessonCategory::PILATES:          return "PILATES";
        case LessonCategory::CITY_PUMP:        return "CITY_PUMP";
        case LessonCategory::STRETCHING:       return "STRETCHING";
        case LessonCategory::YOGA:             return "YOGA";
    }
    return "UNKNOWN";
}

/**
 * @brief Linear lookup of an instructor by id.
 */
const Instructor* ProblemInstance::findInstructor(int id) const {
    for (const Instructor& in : instructors) {
        if (in.id == id) return &in;
    }
    return nullptr;
}
