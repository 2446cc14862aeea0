#pragma once
#define CL_TARGET_OPENCL_VERSION 120

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <CL/cl.h>
#include <vector>
#include "model.hpp"
#include "grid.hpp"
#include "cost.hpp"


///////////////////////////
///      EVALUATOR      ///
///////////////////////////
/**
 * @brief OpenCL helper context for batched grid scoring.
 *
 * Owns the OpenCL platform/device/context/queue and a compiled program
 * used to score many candidate grids in parallel on the GPU.
 */
class GridOpenCLContext {
public:
    /**
     * @brief Initialize OpenCL platform, device, context and command queue.
     *
     * Also builds the program containing the grid scoring kernel.
     * Throws std::runtime_error if OpenCL setup fails.
     */
    GridOpenCLContext();

    /**
     * @brief Release all OpenCL resources owned by this context.
     */
    ~GridOpenCLContext();

    GridOpenCLContext(const GridOpenCLContext&) = delete;
    GridOpenCLContext& operator=(const GridOpenCLContext&) = delete;

    /**
     * @brief Score a batch of grids in one kernel launch.
     *
     * All grids must have the dimensions of inst.config. The kernel counts
     * participants, lesson hours, instructor presence days and rented
     * classroom-days of each grid; the revenue total is then formed on the
     * host with the economy parameters of inst.config, so results[i]
     * equals computeCostBreakdown(batch[i], inst.config).
     */
    void evaluateBatch(
            const ProblemInstance& inst,
            const std::vector<AssignmentGrid>& batch,
            std::vector<CostBreakdown>& results
    );

private:
    cl_platform_id platform = nullptr;
    cl_device_id device = nullptr;
    cl_context context = nullptr;
    cl_program program = nullptr;
    cl_command_queue queue = nullptr;

    cl_program buildProgram(const char* src);
    void release();
};
