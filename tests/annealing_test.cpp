///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "../sequential/annealing_solver.hpp"
#include "cost.hpp"
#include "demo_instances.hpp"
#include "errors.hpp"
#include "initializer.hpp"
#include "rng.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>


///////////////////////////
///       FIXTURE       ///
///////////////////////////
class AnnealingTest : public ::testing::Test {
protected:
    AnnealingTest() : inst(makeDemoInstance(DemoSize::SMALL)), rng(makeRng(42)) {
        start = generateInitialGrid(inst, false, rng);
    }

    ProblemInstance inst;
    std::mt19937 rng;
    std::optional<AssignmentGrid> start;
};


///////////////////////////
///        TESTS        ///
///////////////////////////
TEST_F(AnnealingTest, BestCostIsRunningMaximum) {
    SimulatedAnnealingSolver solver(quickParams());
    AnnealingResult result = solver.anneal(inst, *start, rng);

    EXPECT_FALSE(result.cancelled);
    EXPECT_DOUBLE_EQ(result.initialCost, computeCost(*start, inst.config));
    EXPECT_GE(result.bestCost, result.initialCost);
    EXPECT_DOUBLE_EQ(result.bestCost, computeCost(result.bestGrid, inst.config));

    ASSERT_FALSE(result.costTrace.empty());
    double traceMax = *std::max_element(result.costTrace.begin(), result.costTrace.end());
    EXPECT_LE(traceMax, result.bestCost);
}

TEST_F(AnnealingTest, TraceHasOneEntryPerProposal) {
    AnnealingParams params = quickParams();
    SimulatedAnnealingSolver solver(params);
    AnnealingResult result = solver.anneal(inst, *start, rng);

    EXPECT_EQ((long long)result.costTrace.size(), result.totalIterations);
    EXPECT_EQ(result.totalIterations, (long long)result.epochs * params.iterationsPerTemperature);
    EXPECT_LE(result.finalTemperature, params.minTemperature);
}

TEST_F(AnnealingTest, CallerGridIsNotModified) {
    std::vector<LessonTuple> tuples = lessonTuples(*start);
    AssignmentGrid copy = *start;

    SimulatedAnnealingSolver solver(quickParams());
    AnnealingResult result = solver.anneal(inst, *start, rng);

    for (int i = 0; i < start->cellCount(); ++i) {
        EXPECT_EQ(start->at(start->cellAt(i)), copy.at(copy.cellAt(i)));
    }
    EXPECT_EQ(lessonTuples(result.bestGrid), tuples);
}

TEST_F(AnnealingTest, OneEpochOneIterationNeverLosesRevenue) {
    AnnealingParams params;
    params.alpha = 0.5;
    params.initialTemperature = 1.0;
    params.minTemperature = 0.6;
    params.iterationsPerTemperature = 1;
    params.seed = 3;

    SimulatedAnnealingSolver solver(params);
    AnnealingResult result = solver.anneal(inst, *start, rng);

    EXPECT_EQ(result.totalIterations, 1);
    EXPECT_EQ(result.epochs, 1);
    EXPECT_GE(result.bestCost, result.initialCost);
}

TEST_F(AnnealingTest, KeepMutationPolicyStillTracksBest) {
    AnnealingParams params = quickParams();
    params.rejectPolicy = RejectPolicy::KEEP_MUTATION;
    params.allowedMoveTypes = {MoveType::RELOCATE, MoveType::SWAP};

    SimulatedAnnealingSolver solver(params);
    AnnealingResult result = solver.anneal(inst, *start, rng);

    EXPECT_GE(result.bestCost, result.initialCost);
    EXPECT_DOUBLE_EQ(result.bestCost, computeCost(result.bestGrid, inst.config));
    EXPECT_EQ(lessonTuples(result.bestGrid), lessonTuples(*start));
}

TEST_F(AnnealingTest, PresetCancelStopsBeforeFirstProposal) {
    std::atomic<bool> cancel{true};
    SimulatedAnnealingSolver solver(quickParams());
    AnnealingResult result = solver.anneal(inst, *start, rng, &cancel);

    EXPECT_TRUE(result.cancelled);
    EXPECT_EQ(result.totalIterations, 0);
    EXPECT_EQ(result.epochs, 0);
    EXPECT_TRUE(result.costTrace.empty());
    EXPECT_DOUBLE_EQ(result.bestCost, result.initialCost);
    EXPECT_DOUBLE_EQ(result.finalTemperature, quickParams().initialTemperature);
    EXPECT_EQ(result.bestGrid.occupiedCount(), start->occupiedCount());
}

TEST_F(AnnealingTest, CancelFromCallbackStopsPromptly) {
    std::atomic<bool> cancel{false};
    SimulatedAnnealingSolver solver(quickParams());
    AnnealingResult result = solver.anneal(
            inst, *start, rng, &cancel,
            [&cancel](long long iteration, double) {
                if (iteration == 10) cancel = true;
            });

    EXPECT_TRUE(result.cancelled);
    EXPECT_EQ(result.totalIterations, 10);
    EXPECT_EQ(result.costTrace.size(), 10u);
}

TEST(AnnealingStagnationTest, StopsAfterStagnantEpochs) {
    // Every relocation of a lone lesson within one day has the same revenue.
    ProblemInstance inst;
    inst.config = makeConfig(1, 1, 4);
    inst.clients.push_back(makeClient(1, {LessonCategory::YOGA}));
    inst.instructors.push_back(makeInstructor(1, {LessonCategory::YOGA}));

    std::mt19937 rng(9);
    AssignmentGrid start = generateInitialGrid(inst, false, rng);

    AnnealingParams params;
    params.alpha = 0.5;
    params.initialTemperature = 100;
    params.minTemperature = 0.1;
    params.iterationsPerTemperature = 5;
    params.maxStagnantEpochs = 2;

    SimulatedAnnealingSolver solver(params);
    AnnealingResult result = solver.anneal(inst, start, rng);

    EXPECT_EQ(result.epochs, 2);
    EXPECT_DOUBLE_EQ(result.bestCost, result.initialCost);
}

TEST(AnnealingParamsTest, InvalidParametersAreRejected) {
    AnnealingParams params;
    EXPECT_NO_THROW(SimulatedAnnealingSolver::validateParams(params));

    params.alpha = 1.0;
    EXPECT_THROW(SimulatedAnnealingSolver::validateParams(params), ConfigurationError);
    params = AnnealingParams{};
    params.alpha = 0.0;
    EXPECT_THROW(SimulatedAnnealingSolver::validateParams(params), ConfigurationError);

    params = AnnealingParams{};
    params.initialTemperature = 0.0;
    EXPECT_THROW(SimulatedAnnealingSolver::validateParams(params), ConfigurationError);

    params = AnnealingParams{};
    params.minTemperature = -1.0;
    EXPECT_THROW(SimulatedAnnealingSolver::validateParams(params), ConfigurationError);

    params = AnnealingParams{};
    params.iterationsPerTemperature = 0;
    EXPECT_THROW(SimulatedAnnealingSolver::validateParams(params), ConfigurationError);

    params = AnnealingParams{};
    params.epsilon = -0.5;
    EXPECT_THROW(SimulatedAnnealingSolver::validateParams(params), ConfigurationError);
}

TEST(AnnealingSolveTest, PipelineScoresNeverDecrease) {
    ProblemInstance inst = makeDemoInstance(DemoSize::MEDIUM);
    SimulatedAnnealingSolver solver(quickParams(17));

    std::optional<ScheduleSolution> sol = solver.solve(inst);
    ASSERT_TRUE(sol.has_value());
    EXPECT_GE(sol->annealedScore, sol->initialScore);
    EXPECT_GE(sol->score, sol->annealedScore);
    EXPECT_DOUBLE_EQ(sol->score, computeCost(sol->grid, inst.config));
    EXPECT_EQ(sol->grid.occupiedCount(), countRequiredLessons(inst));
    EXPECT_EQ((long long)sol->costTrace.size(), sol->iterations);
}

TEST(AnnealingSolveTest, FixedSeedIsReproducible) {
    ProblemInstance inst = makeDemoInstance(DemoSize::SMALL);
    SimulatedAnnealingSolver a(quickParams(5));
    SimulatedAnnealingSolver b(quickParams(5));

    std::optional<ScheduleSolution> first = a.solve(inst);
    std::optional<ScheduleSolution> second = b.solve(inst);
    ASSERT_TRUE(first && second);
    EXPECT_EQ(first->score, second->score);
    EXPECT_EQ(first->costTrace, second->costTrace);
    EXPECT_EQ(lessonTuples(first->grid), lessonTuples(second->grid));
}

TEST(AnnealingSolveTest, MissingInstructorFailsBeforeSearch) {
    ProblemInstance inst;
    inst.config = makeConfig(1, 6, 6);
    inst.clients.push_back(makeClient(1, {LessonCategory::CROSSFIT}));

    SimulatedAnnealingSolver solver(quickParams());
    EXPECT_THROW(solver.solve(inst), ConfigurationError);
}

TEST(AnnealingSolveTest, FullGridWithSwapAllowedCompletes) {
    ProblemInstance inst;
    inst.config = makeConfig(1, 1, 2);
    inst.clients.push_back(makeClient(1, {LessonCategory::YOGA}));
    inst.clients.push_back(makeClient(2, {LessonCategory::ZUMBA}));
    inst.instructors.push_back(makeInstructor(1, {LessonCategory::YOGA}));
    inst.instructors.push_back(makeInstructor(2, {LessonCategory::ZUMBA}));

    AnnealingParams params = quickParams(6);
    params.allowedMoveTypes = {MoveType::RELOCATE, MoveType::SWAP};

    SimulatedAnnealingSolver solver(params);
    std::optional<ScheduleSolution> solution;
    ASSERT_NO_THROW(solution = solver.solve(inst));
    ASSERT_TRUE(solution.has_value());
    EXPECT_EQ(solution->grid.freeCount(), 0);
    EXPECT_EQ(solution->iterations, (long long)solution->costTrace.size());
}
