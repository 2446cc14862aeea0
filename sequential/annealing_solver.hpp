#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "grid.hpp"
#include "solver_base.hpp"
#include <atomic>
#include <functional>
#include <optional>
#include <random>
#include <vector>


///////////////////////////
///       RESULTS       ///
///////////////////////////
/**
 * @brief Outcome of one annealing search.
 */
struct AnnealingResult {
    AssignmentGrid bestGrid; ///< Independent copy of the best grid seen.
    double bestCost; ///< Revenue of bestGrid; never below initialCost.
    double initialCost; ///< Revenue of the starting grid.
    double finalTemperature; ///< Temperature when the search stopped.
    long long totalIterations = 0; ///< Proposals evaluated.
    int epochs = 0; ///< Completed temperature levels.
    std::vector<double> costTrace; ///< current_cost after each proposal.
    bool cancelled = false; ///< Stopped early by the cancellation flag.
};


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief Single-threaded simulated-annealing search over timetable grids.
 *
 * Maximizes revenue. Each epoch evaluates iterationsPerTemperature random
 * neighbors at a fixed temperature, then cools geometrically by alpha.
 * Improving or equal moves are always accepted; worse moves with
 * probability exp(delta / T). The search stops when the temperature falls
 * to minTemperature or after maxStagnantEpochs epochs in which the current
 * cost stayed within epsilon of the best cost.
 */
class SimulatedAnnealingSolver : public ISolver {
public:
    /// Called after every proposal with (iteration number, current cost).
    using ProgressCallback = std::function<void(long long, double)>;

    /**
     * @brief Create a solver with the given search parameters.
     *
     * @param params  Cooling schedule, stopping rules, move types and seed.
     * @param verbose Print a one-line summary per epoch to std::cout.
     */
    explicit SimulatedAnnealingSolver(AnnealingParams params, bool verbose = false);

    /**
     * @brief Full pipeline: random start, annealing, consolidation.
     *
     * Uses params.seed for the random engine.
     */
    std::optional<ScheduleSolution> solve(const ProblemInstance& inst) override;

    /**
     * @brief Run the annealing search from a given grid.
     *
     * The starting grid is copied; the caller's grid is never modified.
     * The cancellation flag, if given, is checked before every proposal;
     * once set the search returns immediately with cancelled = true.
     *
     * Throws ConfigurationError for invalid parameters and
     * DegenerateStateError if the grid cannot be perturbed.
     */
    AnnealingResult anneal(const ProblemInstance& inst,
                           const AssignmentGrid& initial,
                           std::mt19937& rng,
                           const std::atomic<bool>* cancel = nullptr,
                           const ProgressCallback& onIteration = nullptr) const;

    const AnnealingParams& params() const { return params_; }

    /**
     * @brief Reject parameter sets the search cannot run with.
     *
     * Throws ConfigurationError describing the first invalid value.
     */
    static void validateParams(const AnnealingParams& params);

private:
    AnnealingParams params_;
    bool verbose_;
};
