///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "../threads/threaded_runner.hpp"
#include "model.hpp"
#include "driver_options.hpp"
#include "formatting.hpp"
#include "session.hpp"
#include <iostream>
#include <chrono>
#include <thread>


///////////////////////////
///     ENTRY POINT     ///
///////////////////////////
/**
 * @brief Entry point for the threaded lesson scheduler.
 *
 * Runs a full pipeline on a background thread while the main thread polls
 * its progress, commits the result into a session, then compares it with
 * a multi-start run over --threads independent searches.
 */
int main(int argc, char** argv) {
    try {
        DriverOptions options = parseDriverOptions(argc, argv);

        AnnealingParams params;
        ProblemInstance inst = loadProblem(options, params, &std::cerr);
        ScheduleSession session(inst);

        std::cout << "========================================\n";
        std::cout << "THREADED LESSON SCHEDULER\n";
        std::cout << "Clients: " << inst.clients.size()
                  << " | Instructors: " << inst.instructors.size() << "\n";

        // Background run with live progress.
        auto startBg = std::chrono::high_resolution_clock::now();
        ThreadedScheduleRunner runner(inst, params);
        runner.start();

        ProgressSnapshot snap = runner.progress();
        while (!snap.finished) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            snap = runner.progress();
            if (options.verbose) {
                std::cout << "  iter " << snap.iteration
                          << " | current=" << snap.currentCost
                          << " | best=" << snap.bestCost << "\n";
            }
        }

        bool committed = runner.commitTo(session);
        auto endBg = std::chrono::high_resolution_clock::now();
        double msBg = std::chrono::duration<double, std::milli>(endBg - startBg).count();

        std::cout << "Background run time: " << msBg << " ms\n";
        if (!committed) {
            std::cout << "Background run produced no schedule"
                      << (runner.errorMessage().empty() ? std::string() : ": " + runner.errorMessage())
                      << "\n";
            return 1;
        }
        std::cout << "Background run revenue = " << session.totalCost() << "\n";

        // Independent multi-start.
        auto startMs = std::chrono::high_resolution_clock::now();
        auto best = solveMultiStart(inst, params, options.threads);
        auto endMs = std::chrono::high_resolution_clock::now();
        double msMulti = std::chrono::duration<double, std::milli>(endMs - startMs).count();

        std::cout << "Multi-start (" << options.threads << " threads) time: " << msMulti << " ms\n";
        if (best) {
            std::cout << "Multi-start best revenue = " << best->score << "\n";
            if (best->score > session.totalCost()) {
                session.install(*best);
            }
        }

        std::cout << "\nFinal revenue:\n";
        printCostSummary(session.costBreakdown(), inst.config);

        std::cout << "\nTimetable:\n";
        printSchedule(session.grid());
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "========================================\n";
    return 0;
}
