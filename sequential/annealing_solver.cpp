///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "annealing_solver.hpp"
#include "consolidation.hpp"
#include "cost.hpp"
#include "errors.hpp"
#include "initializer.hpp"
#include "neighbor.hpp"
#include "rng.hpp"
#include <cmath>
#include <iostream>
#include <string>
#include <utility>


///////////////////////////
///       SOLVERS       ///
///////////////////////////
SimulatedAnnealingSolver::SimulatedAnnealingSolver(AnnealingParams params, bool verbose)
        : params_(std::move(params)),
          verbose_(verbose) {}

void SimulatedAnnealingSolver::validateParams(const AnnealingParams& params) {
    if (!(params.alpha > 0.0 && params.alpha < 1.0)) {
        throw ConfigurationError("alpha must be in (0, 1), got " + std::to_string(params.alpha));
    }
    if (!(params.initialTemperature > 0.0)) {
        throw ConfigurationError("initial temperature must be > 0, got " +
                                 std::to_string(params.initialTemperature));
    }
    if (params.minTemperature < 0.0) {
        throw ConfigurationError("min temperature must be >= 0, got " +
                                 std::to_string(params.minTemperature));
    }
    if (params.iterationsPerTemperature < 1) {
        throw ConfigurationError("iterations per temperature must be >= 1, got " +
                                 std::to_string(params.iterationsPerTemperature));
    }
    if (params.epsilon < 0.0) {
        throw ConfigurationError("epsilon must be >= 0, got " + std::to_string(params.epsilon));
    }
}

/**
 * @brief Generate a random start, anneal it and consolidate the best grid.
 */
std::optional<ScheduleSolution> SimulatedAnnealingSolver::solve(const ProblemInstance& inst) {
    std::mt19937 rng = makeRng(params_.seed);

    AssignmentGrid start = generateInitialGrid(inst, params_.useGreedyInitialPlacement, rng);
    AnnealingResult annealed = anneal(inst, start, rng);

    AssignmentGrid finalGrid = std::move(annealed.bestGrid);
    ConsolidationReport report = consolidateInstructorDays(finalGrid, inst);
    if (verbose_) {
        std::cout << "Consolidation moved " << report.movedLessons << " lessons, freed "
                  << report.drainedDays << " instructor days\n";
    }

    double finalScore = computeCost(finalGrid, inst.config);
    return ScheduleSolution{std::move(finalGrid),
                            finalScore,
                            annealed.initialCost,
                            annealed.bestCost,
                            annealed.totalIterations,
                            std::move(annealed.costTrace)};
}

/**
 * @brief Core annealing loop.
 *
 * The working grid is mutated in place by each proposal. Under
 * RejectPolicy::ROLLBACK a rejected proposal is undone immediately, so the
 * working grid always has revenue current_cost. Under KEEP_MUTATION the
 * rejected move stays applied and only current_cost is left unchanged.
 */
AnnealingResult SimulatedAnnealingSolver::anneal(const ProblemInstance& inst,
                                                 const AssignmentGrid& initial,
                                                 std::mt19937& rng,
                                                 const std::atomic<bool>* cancel,
                                                 const ProgressCallback& onIteration) const {
    validateParams(params_);

    const ScheduleConfig& config = inst.config;
    AssignmentGrid current = initial;
    double currentCost = computeCost(current, config);

    AnnealingResult result{initial,
                           currentCost,
                           currentCost,
                           params_.initialTemperature,
                           0,
                           0,
                           {},
                           false};

    double temperature = params_.initialTemperature;
    int stagnantEpochs = 0;
    std::uniform_real_distribution<double> unit(0.0, 1.0);

    while (temperature > params_.minTemperature && stagnantEpochs < params_.maxStagnantEpochs) {
        for (int j = 0; j < params_.iterationsPerTemperature; ++j) {
            if (cancel && cancel->load(std::memory_order_relaxed)) {
                result.cancelled = true;
                result.finalTemperature = temperature;
                return result;
            }

            ++result.totalIterations;
            Move move = applyRandomMove(current, params_.allowedMoveTypes, rng);
            double neighborCost = computeCost(current, config);
            double delta = neighborCost - currentCost;

            if (delta >= 0) {
                currentCost = neighborCost;
                if (currentCost > result.bestCost) {
                    result.bestGrid = current;
                    result.bestCost = currentCost;
                }
            } else if (unit(rng) < std::exp(delta / temperature)) {
                currentCost = neighborCost;
            } else if (params_.rejectPolicy == RejectPolicy::ROLLBACK) {
                undoMove(current, move);
            }

            result.costTrace.push_back(currentCost);
            if (onIteration) onIteration(result.totalIterations, currentCost);
        }

        temperature *= params_.alpha;
        ++result.epochs;

        if (std::fabs(currentCost - result.bestCost) < params_.epsilon) {
            ++stagnantEpochs;
        } else {
            stagnantEpochs = 0;
        }

        if (verbose_) {
            std::cout << "epoch " << result.epochs
                      << " | T=" << temperature
                      << " | current=" << currentCost
                      << " | best=" << result.bestCost
                      << " | stagnant=" << stagnantEpochs << "\n";
        }
    }

    result.finalTemperature = temperature;
    return result;
}
