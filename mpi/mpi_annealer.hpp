#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "solver_base.hpp"
#include "../threads/threaded_runner.hpp"
#include <optional>
#include <vector>


///////////////////////////
///       SOLVER        ///
///////////////////////////
/**
 * @brief MPI-based multi-start wrapper around the annealing pipeline.
 *
 * Every rank runs numThreads independent annealing runs of the same
 * instance (solveMultiStart) with rank-specific seeds. The best revenue
 * across ranks is found with MPI_Allreduce; the rank holding it sends its
 * grid to rank 0 as a flat integer buffer together with its scores and
 * cost trace. Rank 0 returns the winning solution; other ranks return
 * std::nullopt.
 */
class MPIMultiStartAnnealer : public ISolver {
public:
    /**
     * @brief Construct a hybrid MPI + threads annealer.
     *
     * @param params     Search parameters; seed is offset per rank and thread.
     * @param numThreads Number of independent runs inside each MPI process.
     */
    MPIMultiStartAnnealer(AnnealingParams params, int numThreads);

    /**
     * @brief Solve cooperatively across all MPI ranks.
     *
     * Must be called on every rank of MPI_COMM_WORLD. If every rank fails,
     * each rank throws ConfigurationError with its own failure message.
     */
    std::optional<ScheduleSolution> solve(const ProblemInstance& inst) override;

private:
    AnnealingParams params_;
    int numThreads_;

    /**
     * @brief Pack the scalar fields and trace of a solution.
     *
     * Layout: score, initialScore, annealedScore, iterations, trace...
     */
    static void packScores(const ScheduleSolution& sol, std::vector<double>& buffer);
};
