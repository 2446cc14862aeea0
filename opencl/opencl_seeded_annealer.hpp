#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "solver_base.hpp"
#include "opencl_evaluator.hpp"
#include <optional>
#include <vector>


///////////////////////////
///       SOLVER        ///
///////////////////////////
/**
 * @brief Annealer whose starting grid is picked from a GPU-scored batch.
 *
 * Generates batchSize random starting grids on the CPU, scores them all in
 * one OpenCL kernel launch, anneals from the highest-revenue candidate and
 * consolidates the result.
 */
class OpenCLSeededAnnealer : public ISolver {
public:
    /**
     * @param params    Search parameters; params.seed drives the whole batch.
     * @param batchSize Number of random starting grids scored on the device.
     * @param verbose   Print batch statistics and per-epoch progress.
     */
    OpenCLSeededAnnealer(AnnealingParams params, int batchSize, bool verbose = false);

    std::optional<ScheduleSolution> solve(const ProblemInstance& inst) override;

private:
    AnnealingParams params_;
    int batchSize_;
    bool verbose_;

    GridOpenCLContext clctx_;
};
