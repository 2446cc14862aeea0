///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "demo_instances.hpp"
#include <algorithm>
#include <random>
#include <vector>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/**
 * @brief Fill an instance with generated clients and instructors.
 *
 * Instructor i is qualified for categoriesPerInstructor consecutive
 * categories starting at i * categoriesPerInstructor (mod CATEGORY_COUNT),
 * which spreads qualifications evenly. Each client wants between one and
 * three distinct categories.
 */
static ProblemInstance makeGenerated(int classrooms, int clients, int instructors,
                                     int categoriesPerInstructor, unsigned seed) {
    ProblemInstance inst;
    inst.config.classroomCount = classrooms;

    std::mt19937 rng(seed);

    for (int i = 0; i < instructors; ++i) {
        Instructor instructor;
        instructor.id = i + 1;
        for (int j = 0; j < categoriesPerInstructor; ++j) {
            int ordinal = (i * categoriesPerInstructor + j) % CATEGORY_COUNT;
            instructor.qualifiedCategories.insert(categoryFromOrdinal(ordinal));
        }
        inst.instructors.push_back(instructor);
    }

    std::uniform_int_distribution<int> wishCount(1, 3);
    std::vector<int> ordinals(CATEGORY_COUNT);
    for (int k = 0; k < CATEGORY_COUNT; ++k) ordinals[k] = k;

    for (int i = 0; i < clients; ++i) {
        Client client;
        client.id = i + 1;

        std::shuffle(ordinals.begin(), ordinals.end(), rng);
        int wishes = wishCount(rng);
        for (int k = 0; k < wishes; ++k) {
            client.desiredCategories.insert(categoryFromOrdinal(ordinals[k]));
        }
        inst.clients.push_back(client);
    }

    return inst;
}


///////////////////////////
///     DEMO: SMALL     ///
///////////////////////////
static ProblemInstance makeDemoSmall() {
    return makeGenerated(/*classrooms=*/1, /*clients=*/12, /*instructors=*/3,
                         /*categoriesPerInstructor=*/4, /*seed=*/11);
}


///////////////////////////
///    DEMO: MEDIUM     ///
///////////////////////////
static ProblemInstance makeDemoMedium() {
    return makeGenerated(2, 40, 6, 4, 23);
}


///////////////////////////
///     DEMO: LARGE     ///
///////////////////////////
static ProblemInstance makeDemoLarge() {
    return makeGenerated(3, 120, 12, 3, 37);
}


///////////////////////////
///       FACTORY       ///
///////////////////////////
ProblemInstance makeDemoInstance(DemoSize size) {
    switch (size) {
        case DemoSize::SMALL:  return makeDemoSmall();
        case DemoSize::MEDIUM: return makeDemoMedium();
        case DemoSize::LARGE:  return makeDemoLarge();
    }
    return makeDemoSmall();
}
