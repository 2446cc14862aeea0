///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "driver_options.hpp"
#include "formatting.hpp"
#include "session.hpp"
#include "opencl_seeded_annealer.hpp"
#include <iostream>
#include <chrono>

///////////////////////////
///     ENTRY POINT     ///
///////////////////////////
/**
 * @brief Entry point for the OpenCL-seeded lesson scheduler.
 *
 * Scores a batch of random starting grids on the device, anneals the best
 * one on the CPU and prints the consolidated timetable.
 */
int main(int argc, char** argv) {
    try {
        DriverOptions options = parseDriverOptions(argc, argv);

        AnnealingParams params;
        ProblemInstance inst = loadProblem(options, params, &std::cerr);

        std::cout << "========================================\n";
        std::cout << "OPENCL SEEDED LESSON SCHEDULER\n";
        std::cout << "Clients: " << inst.clients.size()
                  << " | Instructors: " << inst.instructors.size() << "\n";
        std::cout << "GPU batch size: " << options.batchSize << "\n";
        std::cout << "========================================\n";

        OpenCLSeededAnnealer solver(params, options.batchSize, options.verbose);

        auto start = std::chrono::high_resolution_clock::now();
        auto solOpt = solver.solve(inst);
        auto end   = std::chrono::high_resolution_clock::now();
        double elapsedMs = std::chrono::duration<double, std::milli>(end - start).count();

        std::cout << "OpenCL solver time: " << elapsedMs << " ms\n";

        if (!solOpt) {
            std::cout << "No timetable found.\n";
        } else {
            ScheduleSession session(inst);
            session.install(*solOpt);

            std::cout << "Best start revenue = " << solOpt->initialScore
                      << " | annealed = " << solOpt->annealedScore
                      << " | final = " << solOpt->score << "\n\n";
            printCostSummary(session.costBreakdown(), inst.config);
            std::cout << "\nTimetable:\n";
            printSchedule(session.grid());
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "========================================\n";
    return 0;
}
