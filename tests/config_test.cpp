///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "config.hpp"
#include "errors.hpp"
#include <gtest/gtest.h>
#include <sstream>
#include <string>


///////////////////////////
///        TESTS        ///
///////////////////////////
TEST(ConfigTest, DefaultsMatchStudioSetup) {
    RunConfig config;
    EXPECT_EQ(config.schedule.classroomCount, 1);
    EXPECT_EQ(config.schedule.dayCount, 6);
    EXPECT_EQ(config.schedule.slotCount, 6);
    EXPECT_EQ(config.schedule.maxParticipantsPerLesson, 5);
    EXPECT_DOUBLE_EQ(config.schedule.ticketPrice, 40);
    EXPECT_DOUBLE_EQ(config.schedule.hourlyPay, 50);
    EXPECT_DOUBLE_EQ(config.schedule.presenceBonus, 50);
    EXPECT_DOUBLE_EQ(config.schedule.rentalCost, 200);

    EXPECT_DOUBLE_EQ(config.annealing.alpha, 0.5);
    EXPECT_DOUBLE_EQ(config.annealing.initialTemperature, 100);
    EXPECT_EQ(config.annealing.iterationsPerTemperature, 50);
    EXPECT_DOUBLE_EQ(config.annealing.minTemperature, 0.1);
    EXPECT_DOUBLE_EQ(config.annealing.epsilon, 0.01);
    EXPECT_EQ(config.annealing.maxStagnantEpochs, 1000);
    EXPECT_FALSE(config.annealing.useGreedyInitialPlacement);
    ASSERT_EQ(config.annealing.allowedMoveTypes.size(), 1u);
    EXPECT_EQ(config.annealing.allowedMoveTypes[0], MoveType::RELOCATE);
}

TEST(ConfigTest, ReadsAllKeys) {
    std::istringstream in(
            "# studio\n"
            "classroom_count: 2\n"
            "day_count: 5   # weekdays only\n"
            "slot_count: 4\n"
            "max_participants_per_lesson: 8\n"
            "ticket_price: 45.5\n"
            "hourly_pay: 60\n"
            "presence_bonus: 25\n"
            "rental_cost: 150\n"
            "\n"
            "Alpha: 0.9\n"
            "initial_temperature: 250\n"
            "iterations_per_temperature: 30\n"
            "min_temperature: 0.01\n"
            "epsilon: 0.5\n"
            "max_stagnant_epochs: 40\n"
            "use_greedy_initial_placement: yes\n"
            "allowed_neighbor_move_types: relocate, swap\n"
            "seed: 123\n"
            "rollback_policy: keep_mutation\n");

    RunConfig config;
    std::ostringstream warnings;
    parseConfig(in, config, ConfigParseMode::STRICT, &warnings);

    EXPECT_EQ(config.schedule.classroomCount, 2);
    EXPECT_EQ(config.schedule.dayCount, 5);
    EXPECT_EQ(config.schedule.slotCount, 4);
    EXPECT_EQ(config.schedule.maxParticipantsPerLesson, 8);
    EXPECT_DOUBLE_EQ(config.schedule.ticketPrice, 45.5);
    EXPECT_DOUBLE_EQ(config.schedule.hourlyPay, 60);
    EXPECT_DOUBLE_EQ(config.schedule.presenceBonus, 25);
    EXPECT_DOUBLE_EQ(config.schedule.rentalCost, 150);

    EXPECT_DOUBLE_EQ(config.annealing.alpha, 0.9);
    EXPECT_DOUBLE_EQ(config.annealing.initialTemperature, 250);
    EXPECT_EQ(config.annealing.iterationsPerTemperature, 30);
    EXPECT_DOUBLE_EQ(config.annealing.minTemperature, 0.01);
    EXPECT_DOUBLE_EQ(config.annealing.epsilon, 0.5);
    EXPECT_EQ(config.annealing.maxStagnantEpochs, 40);
    EXPECT_TRUE(config.annealing.useGreedyInitialPlacement);
    ASSERT_EQ(config.annealing.allowedMoveTypes.size(), 2u);
    EXPECT_EQ(config.annealing.allowedMoveTypes[0], MoveType::RELOCATE);
    EXPECT_EQ(config.annealing.allowedMoveTypes[1], MoveType::SWAP);
    EXPECT_EQ(config.annealing.seed, 123u);
    EXPECT_EQ(config.annealing.rejectPolicy, RejectPolicy::KEEP_MUTATION);
    EXPECT_TRUE(warnings.str().empty());
}

TEST(ConfigTest, LenientModeReadsGarbageAsZero) {
    std::istringstream in("ticket_price: forty\nslot_count: 6x\n");
    RunConfig config;
    std::ostringstream warnings;
    parseConfig(in, config, ConfigParseMode::LENIENT, &warnings);

    EXPECT_DOUBLE_EQ(config.schedule.ticketPrice, 0.0);
    EXPECT_EQ(config.schedule.slotCount, 0);
    EXPECT_NE(warnings.str().find("line 1"), std::string::npos);
    EXPECT_NE(warnings.str().find("line 2"), std::string::npos);
}

TEST(ConfigTest, StrictModeRejectsGarbage) {
    std::istringstream number("ticket_price: forty\n");
    RunConfig config;
    EXPECT_THROW(parseConfig(number, config, ConfigParseMode::STRICT), ConfigurationError);

    std::istringstream noColon("alpha 0.5\n");
    EXPECT_THROW(parseConfig(noColon, config, ConfigParseMode::STRICT), ConfigurationError);

    std::istringstream policy("rollback_policy: sometimes\n");
    EXPECT_THROW(parseConfig(policy, config, ConfigParseMode::STRICT), ConfigurationError);

    std::istringstream move("allowed_neighbor_move_types: relocate, teleport\n");
    EXPECT_THROW(parseConfig(move, config, ConfigParseMode::STRICT), ConfigurationError);
}

TEST(ConfigTest, UnknownKeysOnlyWarn) {
    std::istringstream in("colour: blue\nalpha: 0.7\n");
    RunConfig config;
    std::ostringstream warnings;
    EXPECT_NO_THROW(parseConfig(in, config, ConfigParseMode::STRICT, &warnings));
    EXPECT_DOUBLE_EQ(config.annealing.alpha, 0.7);
    EXPECT_NE(warnings.str().find("colour"), std::string::npos);
}

TEST(ConfigTest, MissingKeysKeepCurrentValues) {
    std::istringstream in("alpha: 0.25\n");
    RunConfig config;
    config.schedule.classroomCount = 3;
    parseConfig(in, config);
    EXPECT_EQ(config.schedule.classroomCount, 3);
    EXPECT_DOUBLE_EQ(config.annealing.alpha, 0.25);
}

TEST(ConfigTest, MissingFileThrows) {
    EXPECT_THROW(loadConfigFile("/nonexistent/settings.yaml"), ConfigurationError);
}
