///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "mpi_annealer.hpp"
#include "driver_options.hpp"
#include "formatting.hpp"
#include <mpi.h>
#include <iostream>

///////////////////////////
///     ENTRY POINT     ///
///////////////////////////

/**
 * @brief MPI entry point for the hybrid MPI + threads lesson scheduler.
 *
 * Every rank loads the same instance and runs MPIMultiStartAnnealer;
 * rank 0 prints the best timetable found across all ranks.
 */
int main(int argc, char** argv) {
    MPI_Init(&argc, &argv);

    int rank, size;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &size);

    int exitCode = 0;
    try {
        DriverOptions options = parseDriverOptions(argc, argv);

        AnnealingParams params;
        ProblemInstance inst = loadProblem(options, params, rank == 0 ? &std::cerr : nullptr);

        if (rank == 0) {
            std::cout << "========================================\n";
            std::cout << "MPI+THREADS LESSON SCHEDULER\n";
            std::cout << "Processes: " << size << " | Threads per process: " << options.threads << "\n";
            std::cout << "Clients: " << inst.clients.size()
                      << " | Instructors: " << inst.instructors.size() << "\n";
            std::cout << "========================================\n";
        }

        MPIMultiStartAnnealer solver(params, options.threads);
        auto best = solver.solve(inst);

        if (rank == 0 && best) {
            std::cout << "Best revenue across ranks = " << best->score
                      << " (annealed " << best->annealedScore
                      << ", start " << best->initialScore << ")\n\n";
            printCostSummary(computeCostBreakdown(best->grid, inst.config), inst.config);
            std::cout << "\nTimetable:\n";
            printSchedule(best->grid);
            std::cout << "========================================\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Rank " << rank << " error: " << e.what() << "\n";
        exitCode = 1;
    }

    MPI_Finalize();
    return exitCode;
}
