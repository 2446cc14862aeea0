///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "threaded_runner.hpp"
#include "consolidation.hpp"
#include "cost.hpp"
#include "initializer.hpp"
#include "rng.hpp"
#include "../sequential/annealing_solver.hpp"
#include <future>
#include <stdexcept>
#include <utility>
#include <vector>


///////////////////////////
///       PROGRESS      ///
///////////////////////////
void ProgressChannel::publish(long long iteration, double currentCost) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.iteration = iteration;
    state_.currentCost = currentCost;
    if (!hasBest_ || currentCost > state_.bestCost) {
        state_.bestCost = currentCost;
        hasBest_ = true;
    }
}

void ProgressChannel::markFinished() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.finished = true;
}

void ProgressChannel::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = ProgressSnapshot{};
    hasBest_ = false;
}

ProgressSnapshot ProgressChannel::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}


///////////////////////////
///       RUNNERS       ///
///////////////////////////
ThreadedScheduleRunner::ThreadedScheduleRunner(ProblemInstance inst, AnnealingParams params)
        : inst_(std::move(inst)),
          params_(std::move(params)) {}

ThreadedScheduleRunner::~ThreadedScheduleRunner() {
    if (worker_.joinable()) {
        cancel_ = true;
        worker_.join();
    }
}

void ThreadedScheduleRunner::start() {
    if (worker_.joinable()) {
        throw std::logic_error("runner already started");
    }
    cancel_ = false;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        cancelled_ = false;
        errorMessage_.clear();
        result_.reset();
    }
    channel_.reset();

    worker_ = std::thread(&ThreadedScheduleRunner::run, this);
}

void ThreadedScheduleRunner::cancel() {
    cancel_ = true;
}

std::optional<ScheduleSolution> ThreadedScheduleRunner::wait() {
    if (worker_.joinable()) {
        worker_.join();
    }
    std::lock_guard<std::mutex> lock(stateMutex_);
    return result_;
}

bool ThreadedScheduleRunner::cancelled() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return cancelled_;
}

std::string ThreadedScheduleRunner::errorMessage() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return errorMessage_;
}

bool ThreadedScheduleRunner::commitTo(ScheduleSession& session) {
    std::optional<ScheduleSolution> solution = wait();
    if (!solution) return false;
    session.install(*solution);
    return true;
}

/**
 * @brief Worker body: init, anneal, consolidate.
 *
 * Failures are recorded in errorMessage_ and end the run without a result.
 */
void ThreadedScheduleRunner::run() {
    try {
        std::mt19937 rng = makeRng(params_.seed);
        AssignmentGrid start = generateInitialGrid(inst_, params_.useGreedyInitialPlacement, rng);

        SimulatedAnnealingSolver solver(params_);
        AnnealingResult annealed = solver.anneal(
                inst_, start, rng, &cancel_,
                [this](long long iteration, double cost) { channel_.publish(iteration, cost); });

        if (annealed.cancelled) {
            std::lock_guard<std::mutex> lock(stateMutex_);
            cancelled_ = true;
        } else {
            AssignmentGrid finalGrid = std::move(annealed.bestGrid);
            consolidateInstructorDays(finalGrid, inst_);
            double score = computeCost(finalGrid, inst_.config);

            std::lock_guard<std::mutex> lock(stateMutex_);
            result_ = ScheduleSolution{std::move(finalGrid),
                                       score,
                                       annealed.initialCost,
                                       annealed.bestCost,
                                       annealed.totalIterations,
                                       std::move(annealed.costTrace)};
        }
    } catch (const std::exception& e) {
        std::lock_guard<std::mutex> lock(stateMutex_);
        errorMessage_ = e.what();
    }
    channel_.markFinished();
}

std::optional<ScheduleSolution> solveMultiStart(const ProblemInstance& inst,
                                                const AnnealingParams& params,
                                                int numThreads) {
    if (numThreads < 1) numThreads = 1;

    std::vector<std::future<std::optional<ScheduleSolution>>> futures;
    futures.reserve(numThreads);

    for (int t = 0; t < numThreads; ++t) {
        AnnealingParams local = params;
        if (params.seed != 0) local.seed = params.seed + (std::uint64_t)t;

        futures.push_back(std::async(std::launch::async, [&inst, local]() {
            SimulatedAnnealingSolver solver(local);
            return solver.solve(inst);
        }));
    }

    std::optional<ScheduleSolution> best;
    for (auto& f : futures) {
        std::optional<ScheduleSolution> sol = f.get();
        if (sol && (!best || sol->score > best->score)) {
            best = std::move(sol);
        }
    }
    return best;
}
