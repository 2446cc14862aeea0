#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "grid.hpp"
#include <optional>
#include <vector>

///////////////////////////
///        TYPES        ///
///////////////////////////
/**
 * @brief Final timetable of a full run and how it got there.
 *
 * Holds the consolidated grid together with the revenue at each stage of
 * the pipeline (random start, after annealing, after consolidation) and
 * the per-iteration cost trace of the search.
 */
struct ScheduleSolution {
    /// Final, consolidated grid.
    AssignmentGrid grid;

    /// Revenue of the final grid (higher is better).
    double score;

    /// Revenue of the random starting grid.
    double initialScore;

    /// Best revenue found by the annealing search, before consolidation.
    double annealedScore;

    /// Number of neighbor proposals evaluated.
    long long iterations;

    /// current_cost after every proposal, in iteration order.
    std::vector<double> costTrace;
};


///////////////////////////
///      INTERFACE      ///
///////////////////////////
/**
 * @brief Common interface for schedule solvers.
 *
 * Implementations may be sequential, multi-process (MPI) or GPU-assisted,
 * but all expose the same solve() contract.
 */
class ISolver {
public:
    virtual ~ISolver() = default;

    /**
     * @brief Build, optimize and consolidate a timetable for the instance.
     *
     * Configuration and degenerate-state errors propagate as exceptions.
     * std::nullopt is returned when this process does not own the result
     * (e.g. non-root MPI ranks).
     */
    virtual std::optional<ScheduleSolution> solve(const ProblemInstance& inst) = 0;
};
