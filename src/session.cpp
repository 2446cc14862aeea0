///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "session.hpp"
#include "errors.hpp"
#include "initializer.hpp"
#include "rng.hpp"
#include <stdexcept>
#include <string>
#include <utility>


///////////////////////////
///       SESSION       ///
///////////////////////////
ScheduleSession::ScheduleSession(ProblemInstance inst)
        : inst_(std::move(inst)) {}

const AssignmentGrid& ScheduleSession::requireGrid() const {
    if (!grid_) {
        throw std::logic_error("session has no committed grid; call initialize() first");
    }
    return *grid_;
}

const AssignmentGrid& ScheduleSession::initialize(bool greedy, std::uint64_t seed) {
    std::mt19937 rng = makeRng(seed);
    AssignmentGrid start = generateInitialGrid(inst_, greedy, rng);
    grid_ = std::move(start);
    trace_.clear();
    return *grid_;
}

AnnealingResult ScheduleSession::optimize(const AnnealingParams& params,
                                          const std::atomic<bool>* cancel,
                                          const SimulatedAnnealingSolver::ProgressCallback& onIteration) {
    const AssignmentGrid& start = requireGrid();

    SimulatedAnnealingSolver solver(params);
    std::mt19937 rng = makeRng(params.seed);
    AnnealingResult result = solver.anneal(inst_, start, rng, cancel, onIteration);

    if (!result.cancelled) {
        grid_ = result.bestGrid;
        trace_ = result.costTrace;
    }
    return result;
}

ConsolidationReport ScheduleSession::consolidate() {
    requireGrid();
    return consolidateInstructorDays(*grid_, inst_);
}

void ScheduleSession::install(AssignmentGrid grid, std::vector<double> trace) {
    const ScheduleConfig& config = inst_.config;
    if (grid.classroomCount() != config.classroomCount ||
        grid.dayCount() != config.dayCount ||
        grid.slotCount() != config.slotCount) {
        throw ConfigurationError("grid " + std::to_string(grid.classroomCount()) + "x" +
                                 std::to_string(grid.dayCount()) + "x" +
                                 std::to_string(grid.slotCount()) +
                                 " does not match the configured dimensions");
    }
    grid_ = std::move(grid);
    trace_ = std::move(trace);
}

void ScheduleSession::install(const ScheduleSolution& solution) {
    install(solution.grid, solution.costTrace);
}

std::optional<Lesson> ScheduleSession::lessonAt(int classroom, int day, int slot) const {
    return requireGrid().at(classroom, day, slot);
}

double ScheduleSession::totalCost() const {
    return computeCost(requireGrid(), inst_.config);
}

CostBreakdown ScheduleSession::costBreakdown() const {
    return computeCostBreakdown(requireGrid(), inst_.config);
}

const AssignmentGrid& ScheduleSession::grid() const {
    return requireGrid();
}

int ScheduleSession::instructorPresenceDays(int instructorId) const {
    return ::instructorPresenceDays(requireGrid(), instructorId);
}
