#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "solver_base.hpp"
#include "session.hpp"
#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <thread>


///////////////////////////
///       PROGRESS      ///
///////////////////////////
/**
 * @brief Point-in-time view of a running search.
 */
struct ProgressSnapshot {
    long long iteration = 0; ///< Proposals evaluated so far.
    double currentCost = 0.0; ///< current_cost after the latest proposal.
    double bestCost = 0.0; ///< Highest current_cost published so far.
    bool finished = false; ///< Worker has stopped (completed, cancelled or failed).
};

/**
 * @brief Mutex-guarded progress board: one writer, any number of readers.
 */
class ProgressChannel {
public:
    void publish(long long iteration, double currentCost);
    void markFinished();
    void reset();

    ProgressSnapshot snapshot() const;

private:
    mutable std::mutex mutex_;
    ProgressSnapshot state_;
    bool hasBest_ = false;
};


///////////////////////////
///       RUNNERS       ///
///////////////////////////
/**
 * @brief Runs one full schedule pipeline on a background thread.
 *
 * The worker builds a starting grid, anneals it and consolidates the best
 * grid, all on its own copies. cancel() is honored before every neighbor
 * proposal. The result becomes available through wait() once the worker
 * finishes; nothing is written to a session unless the run completed and
 * the caller commits it.
 */
class ThreadedScheduleRunner {
public:
    ThreadedScheduleRunner(ProblemInstance inst, AnnealingParams params);

    /// Cancels and joins a worker that is still running.
    ~ThreadedScheduleRunner();

    ThreadedScheduleRunner(const ThreadedScheduleRunner&) = delete;
    ThreadedScheduleRunner& operator=(const ThreadedScheduleRunner&) = delete;

    /**
     * @brief Launch the worker thread.
     *
     * Throws std::logic_error if a worker was already started.
     */
    void start();

    /// Ask the worker to stop before its next proposal.
    void cancel();

    /**
     * @brief Block until the worker finishes.
     *
     * @return The solution, or std::nullopt if the run was cancelled or
     *         failed (see cancelled() and errorMessage()).
     */
    std::optional<ScheduleSolution> wait();

    /**
     * @brief wait(), then install the solution into @p session.
     *
     * @return true if a solution was committed; the session is untouched otherwise.
     */
    bool commitTo(ScheduleSession& session);

    /// True once the worker stopped because of cancel(). Safe to poll while running.
    bool cancelled() const;

    /// Message of the failure that ended the run, empty otherwise. Safe to poll while running.
    std::string errorMessage() const;

    ProgressSnapshot progress() const { return channel_.snapshot(); }

private:
    ProblemInstance inst_;
    AnnealingParams params_;

    std::thread worker_;
    std::atomic<bool> cancel_{false};
    ProgressChannel channel_;

    // Written by the worker; guarded by stateMutex_.
    mutable std::mutex stateMutex_;
    std::optional<ScheduleSolution> result_;
    bool cancelled_ = false;
    std::string errorMessage_;

    void run();
};

/**
 * @brief Independent annealing runs on @p numThreads threads, best one wins.
 *
 * Thread i uses seed params.seed + i (or a random seed when params.seed is 0).
 * Errors from any run propagate to the caller.
 */
std::optional<ScheduleSolution> solveMultiStart(const ProblemInstance& inst,
                                                const AnnealingParams& params,
                                                int numThreads);
