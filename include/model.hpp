#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <array>
#include <cstdint>
#include <set>
#include <string>
#include <vector>


///////////////////////////
///       MODELS        ///
///////////////////////////
/**
 * @brief Kind of group lesson offered by the studio.
 *
 * Ordinals are fixed: the client intake questionnaire encodes categories
 * by these exact numbers, so values must never be renumbered.
 */
enum class LessonCategory : int {
    CELLULITE_KILLER = 0,
    ZUMBA = 1,
    ZUMBA_ADVANCED = 2,
    FITNESS = 3,
    CROSSFIT = 4,
    BRAZILIAN_BUTT = 5,
    PILATES = 6,
    CITY_PUMP = 7,
    STRETCHING = 8,
    YOGA = 9
};

/// Number of lesson categories.
static constexpr int CATEGORY_COUNT = 10;

/// All categories in ordinal order.
static constexpr std::array<LessonCategory, CATEGORY_COUNT> kAllCategories = {
        LessonCategory::CELLULITE_KILLER,
        LessonCategory::ZUMBA,
        LessonCategory::ZUMBA_ADVANCED,
        LessonCategory::FITNESS,
        LessonCategory::CROSSFIT,
        LessonCategory::BRAZILIAN_BUTT,
        LessonCategory::PILATES,
        LessonCategory::CITY_PUMP,
        LessonCategory::STRETCHING,
        LessonCategory::YOGA
};

/**
 * @brief Convert a questionnaire ordinal into a LessonCategory.
 *
 * Throws DataError if the ordinal does not name a category.
 */
LessonCategory categoryFromOrdinal(int ordinal);

/**
 * @brief Stable ordinal of a category.
 */
inline int categoryOrdinal(LessonCategory c) { return static_cast<int>(c); }

/**
 * @brief Upper-case display name of a category (e.g. "ZUMBA_ADVANCED").
 */
std::string categoryName(LessonCategory c);

/**
 * @brief A studio client with the lesson categories they signed up for.
 */
struct Client {
    int id; ///< Unique client identifier.
    std::set<LessonCategory> desiredCategories; ///< Categories the client wants to attend.

    bool wants(LessonCategory c) const { return desiredCategories.count(c) > 0; }
};

/**
 * @brief An instructor and the categories they are qualified to teach.
 */
struct Instructor {
    int id; ///< Unique instructor identifier.
    std::set<LessonCategory> qualifiedCategories; ///< Categories the instructor can run.

    bool canTeach(LessonCategory c) const { return qualifiedCategories.count(c) > 0; }
};

/**
 * @brief One weekly group lesson placed in the timetable.
 *
 * A lesson lives in exactly one grid cell. Moving it between cells moves
 * the value; it is never copied into a second cell.
 */
struct Lesson {
    int instructorId; ///< Id of the instructor running the lesson.
    LessonCategory category; ///< What is being taught.
    std::vector<int> participantIds; ///< Client ids, in enrollment order.

    int participantCount() const { return (int)participantIds.size(); }
};

inline bool operator==(const Lesson& a, const Lesson& b) {
    return a.instructorId == b.instructorId &&
           a.category == b.category &&
           a.participantIds == b.participantIds;
}

inline bool operator!=(const Lesson& a, const Lesson& b) { return !(a == b); }

/**
 * @brief Grid dimensions and economy parameters of a schedule.
 *
 * Defaults mirror the studio setup the tool was first used for:
 * one room, Monday-Saturday, six one-hour evening slots.
 */
struct ScheduleConfig {
    int classroomCount = 1; ///< Number of rooms.
    int dayCount = 6; ///< Number of teaching days per week.
    int slotCount = 6; ///< Number of one-hour slots per day.
    int maxParticipantsPerLesson = 5; ///< Group size cap.

    double ticketPrice = 40; ///< Revenue per participant per lesson.
    double hourlyPay = 50; ///< Instructor pay per lesson hour.
    double presenceBonus = 50; ///< Paid once per instructor per day present.
    double rentalCost = 200; ///< Paid once per classroom per day used.

    int weeklySlotCount() const { return dayCount * slotCount; }
    int cellCount() const { return classroomCount * dayCount * slotCount; }
};

/**
 * @brief Kinds of perturbation the neighbor operator may apply.
 */
enum class MoveType { RELOCATE, SWAP };

/**
 * @brief What the annealer does with a proposal it rejects.
 */
enum class RejectPolicy {
    ROLLBACK, ///< Undo the move so the working grid matches current cost.
    KEEP_MUTATION ///< Leave the move applied, only cost bookkeeping is kept.
};

/**
 * @brief Parameters of the simulated-annealing search.
 */
struct AnnealingParams {
    double alpha = 0.5; ///< Geometric cooling factor, in (0, 1).
    double initialTemperature = 100; ///< Starting temperature, > 0.
    int iterationsPerTemperature = 50; ///< Proposals per epoch.
    double minTemperature = 0.1; ///< Stop once temperature drops to this.
    double epsilon = 0.01; ///< |current - best| below this counts as stagnation.
    int maxStagnantEpochs = 1000; ///< Stop after this many stagnant epochs.
    bool useGreedyInitialPlacement = false; ///< Sequential instead of random seeding.
    std::vector<MoveType> allowedMoveTypes = {MoveType::RELOCATE}; ///< Empty means RELOCATE.
    RejectPolicy rejectPolicy = RejectPolicy::ROLLBACK;
    std::uint64_t seed = 0; ///< 0 = seed from std::random_device.
};

/**
 * @brief Complete input of a scheduling run.
 */
struct ProblemInstance {
    ScheduleConfig config; ///< Grid and economy parameters.
    std::vector<Client> clients; ///< Everyone who filled in the questionnaire.
    std::vector<Instructor> instructors; ///< Available staff.

    /**
     * @brief Find an instructor by id, or nullptr.
     */
    const Instructor* findInstructor(int id) const;
};
