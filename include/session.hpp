#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "grid.hpp"
#include "cost.hpp"
#include "consolidation.hpp"
#include "solver_base.hpp"
#include "../sequential/annealing_solver.hpp"
#include <atomic>
#include <cstdint>
#include <optional>
#include <vector>


///////////////////////////
///       SESSION       ///
///////////////////////////
/**
 * @brief Explicit context for one scheduling problem and its committed grid.
 *
 * Owns the problem instance, the committed timetable and the cost trace of
 * the latest optimization. The committed grid is populated by initialize(),
 * replaced by optimize() or install(), and repacked in place by
 * consolidate(). Queries on a session without a grid throw
 * std::logic_error.
 */
class ScheduleSession {
public:
    explicit ScheduleSession(ProblemInstance inst);

    const ProblemInstance& instance() const { return inst_; }

    /// True once a grid has been committed.
    bool hasGrid() const { return grid_.has_value(); }

    /**
     * @brief Build and commit a fresh starting grid.
     *
     * Propagates ConfigurationError from the initializer; on failure the
     * previously committed grid (if any) is kept.
     */
    const AssignmentGrid& initialize(bool greedy, std::uint64_t seed);

    /**
     * @brief Anneal from the committed grid and commit the best grid found.
     *
     * Works on copies. If the run is cancelled the committed grid and the
     * previous trace are left as they were.
     */
    AnnealingResult optimize(const AnnealingParams& params,
                             const std::atomic<bool>* cancel = nullptr,
                             const SimulatedAnnealingSolver::ProgressCallback& onIteration = nullptr);

    /// Repack instructor days of the committed grid in place.
    ConsolidationReport consolidate();

    /**
     * @brief Commit a grid produced elsewhere (threaded, MPI or OpenCL runs).
     *
     * Throws ConfigurationError if the grid dimensions differ from the
     * instance configuration.
     */
    void install(AssignmentGrid grid, std::vector<double> trace);
    void install(const ScheduleSolution& solution);

    /// Snapshot of one cell of the committed grid.
    std::optional<Lesson> lessonAt(int classroom, int day, int slot) const;

    double totalCost() const;
    CostBreakdown costBreakdown() const;

    /// current_cost after every proposal of the latest committed run.
    const std::vector<double>& costTrace() const { return trace_; }

    const AssignmentGrid& grid() const;

    int instructorPresenceDays(int instructorId) const;

private:
    ProblemInstance inst_;
    std::optional<AssignmentGrid> grid_;
    std::vector<double> trace_;

    const AssignmentGrid& requireGrid() const;
};
