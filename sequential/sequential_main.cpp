///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "../sequential/annealing_solver.hpp"
#include "model.hpp"
#include "driver_options.hpp"
#include "formatting.hpp"
#include "session.hpp"
#include <iostream>
#include <chrono>


///////////////////////////
///     ENTRY POINT     ///
///////////////////////////
/**
 * @brief Entry point for the sequential lesson scheduler.
 *
 * Loads records and settings (or a demo instance), builds a random start,
 * anneals it, consolidates instructor days and prints the revenue after
 * each stage together with the final timetable.
 */
int main(int argc, char** argv) {
    try {
        DriverOptions options = parseDriverOptions(argc, argv);

        AnnealingParams params;
        ProblemInstance inst = loadProblem(options, params, &std::cerr);
        ScheduleSession session(inst);

        std::cout << "========================================\n";
        std::cout << "SEQUENTIAL LESSON SCHEDULER\n";
        std::cout << "Clients: " << inst.clients.size()
                  << " | Instructors: " << inst.instructors.size()
                  << " | Grid: " << inst.config.classroomCount << "x"
                  << inst.config.dayCount << "x" << inst.config.slotCount << "\n";

        auto start = std::chrono::high_resolution_clock::now();

        session.initialize(params.useGreedyInitialPlacement, params.seed);
        double initialRevenue = session.totalCost();

        AnnealingResult annealed = session.optimize(params);
        double annealedRevenue = session.totalCost();

        ConsolidationReport report = session.consolidate();
        double finalRevenue = session.totalCost();

        auto end = std::chrono::high_resolution_clock::now();
        double ms = std::chrono::duration<double, std::milli>(end - start).count();

        std::cout << "Time: " << ms << " ms\n";
        std::cout << "Iterations: " << annealed.totalIterations
                  << " | Epochs: " << annealed.epochs
                  << " | Final temperature: " << annealed.finalTemperature << "\n";
        std::cout << "Initial revenue:      " << initialRevenue << "\n";
        std::cout << "Annealed revenue:     " << annealedRevenue << "\n";
        std::cout << "Consolidated revenue: " << finalRevenue
                  << " (" << report.movedLessons << " lessons moved, "
                  << report.drainedDays << " instructor days freed)\n\n";

        printCostSummary(session.costBreakdown(), inst.config);

        std::cout << "\nCost trace:\n";
        printCostTrace(session.costTrace());

        std::cout << "\nTimetable:\n";
        printSchedule(session.grid());
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "========================================\n";
    return 0;
}
