///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "opencl_seeded_annealer.hpp"
#include "consolidation.hpp"
#include "cost.hpp"
#include "initializer.hpp"
#include "rng.hpp"
#include "../sequential/annealing_solver.hpp"
#include <iostream>
#include <utility>


///////////////////////////
///       SOLVERS       ///
///////////////////////////
OpenCLSeededAnnealer::OpenCLSeededAnnealer(AnnealingParams params, int batchSize, bool verbose)
        : params_(std::move(params)),
          batchSize_(batchSize < 1 ? 1 : batchSize),
          verbose_(verbose) {}

std::optional<ScheduleSolution> OpenCLSeededAnnealer::solve(const ProblemInstance& inst) {
    std::mt19937 rng = makeRng(params_.seed);

    // Generate candidate starting grids on the CPU.
    std::vector<AssignmentGrid> batch;
    batch.reserve(batchSize_);
    for (int i = 0; i < batchSize_; ++i) {
        batch.push_back(generateInitialGrid(inst, params_.useGreedyInitialPlacement, rng));
    }

    // Score the whole batch on the device.
    std::vector<CostBreakdown> scores;
    clctx_.evaluateBatch(inst, batch, scores);

    int bestIdx = 0;
    for (int i = 1; i < (int)scores.size(); ++i) {
        if (scores[i].total > scores[bestIdx].total) bestIdx = i;
    }

    if (verbose_) {
        std::cout << "Scored " << scores.size() << " starting grids on the device, best revenue = "
                  << scores[bestIdx].total << " (candidate " << bestIdx << ")\n";
    }

    SimulatedAnnealingSolver solver(params_, verbose_);
    AnnealingResult annealed = solver.anneal(inst, batch[bestIdx], rng);

    AssignmentGrid finalGrid = std::move(annealed.bestGrid);
    consolidateInstructorDays(finalGrid, inst);
    double finalScore = computeCost(finalGrid, inst.config);

    return ScheduleSolution{std::move(finalGrid),
                            finalScore,
                            annealed.initialCost,
                            annealed.bestCost,
                            annealed.totalIterations,
                            std::move(annealed.costTrace)};
}
