///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "mpi_annealer.hpp"
#include "errors.hpp"
#include "grid_buffer.hpp"
#include <mpi.h>
#include <limits>
#include <string>
#include <utility>


///////////////////////////
///       SOLVERS       ///
///////////////////////////
MPIMultiStartAnnealer::MPIMultiStartAnnealer(AnnealingParams params, int numThreads)
        : params_(std::move(params)),
          numThreads_(numThreads < 1 ? 1 : numThreads) {}

void MPIMultiStartAnnealer::packScores(const ScheduleSolution& sol, std::vector<double>& buffer) {
    buffer.clear();
    buffer.reserve(4 + sol.costTrace.size());
    buffer.push_back(sol.score);
    buffer.push_back(sol.initialScore);
    buffer.push_back(sol.annealedScore);
    buffer.push_back((double)sol.iterations);
    buffer.insert(buffer.end(), sol.costTrace.begin(), sol.costTrace.end());
}

/**
 * @brief Multi-start across MPI ranks plus threads per rank.
 *
 * Local failures do not break the collective calls: a failed rank reports
 * the lowest possible score and only raises once all ranks agree that
 * nobody produced a grid.
 */
std::optional<ScheduleSolution> MPIMultiStartAnnealer::solve(const ProblemInstance& inst) {
    int rank, size;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &size);

    // Rank-specific seeds; 0 keeps every run randomly seeded.
    AnnealingParams local = params_;
    if (params_.seed != 0) {
        local.seed = params_.seed + (std::uint64_t)rank * (std::uint64_t)numThreads_;
    }

    std::optional<ScheduleSolution> localOpt;
    std::string localError;
    try {
        localOpt = solveMultiStart(inst, local, numThreads_);
    } catch (const std::exception& e) {
        localError = e.what();
    }

    const double NO_SCORE = std::numeric_limits<double>::lowest();
    double localScore = localOpt ? localOpt->score : NO_SCORE;

    // Global best (maximum) revenue across all ranks.
    double globalBestScore = NO_SCORE;
    MPI_Allreduce(&localScore, &globalBestScore, 1, MPI_DOUBLE, MPI_MAX, MPI_COMM_WORLD);

    if (globalBestScore == NO_SCORE) {
        throw ConfigurationError("rank " + std::to_string(rank) + ": " +
                                 (localError.empty() ? std::string("no schedule produced") : localError));
    }

    // Highest rank holding the best score wins.
    int winnerRank = (localOpt && localScore == globalBestScore) ? rank : -1;
    int globalWinnerRank = -1;
    MPI_Allreduce(&winnerRank, &globalWinnerRank, 1, MPI_INT, MPI_MAX, MPI_COMM_WORLD);

    // Winner is rank 0: nothing to transfer.
    if (globalWinnerRank == 0) {
        if (rank == 0) return localOpt;
        return std::nullopt;
    }

    const int TAG_META = 300;
    const int TAG_GRID = 301;
    const int TAG_SCORES = 302;

    // Winner ships its grid and scores to rank 0.
    if (rank == globalWinnerRank) {
        std::vector<int> gridBuf;
        serializeGrid(localOpt->grid, gridBuf);
        std::vector<double> scoreBuf;
        packScores(*localOpt, scoreBuf);

        int lens[2] = {(int)gridBuf.size(), (int)scoreBuf.size()};
        MPI_Send(lens, 2, MPI_INT, 0, TAG_META, MPI_COMM_WORLD);
        if (lens[0] > 0) {
            MPI_Send(gridBuf.data(), lens[0], MPI_INT, 0, TAG_GRID, MPI_COMM_WORLD);
        }
        MPI_Send(scoreBuf.data(), lens[1], MPI_DOUBLE, 0, TAG_SCORES, MPI_COMM_WORLD);
        return std::nullopt;
    }

    if (rank != 0) {
        return std::nullopt;
    }

    int lens[2] = {0, 0};
    MPI_Recv(lens, 2, MPI_INT, globalWinnerRank, TAG_META, MPI_COMM_WORLD, MPI_STATUS_IGNORE);

    std::vector<int> gridBuf(lens[0]);
    if (lens[0] > 0) {
        MPI_Recv(gridBuf.data(), lens[0], MPI_INT, globalWinnerRank, TAG_GRID, MPI_COMM_WORLD, MPI_STATUS_IGNORE);
    }
    std::vector<double> scoreBuf(lens[1]);
    MPI_Recv(scoreBuf.data(), lens[1], MPI_DOUBLE, globalWinnerRank, TAG_SCORES, MPI_COMM_WORLD, MPI_STATUS_IGNORE);

    return ScheduleSolution{deserializeGrid(gridBuf, inst.config),
                            scoreBuf[0],
                            scoreBuf[1],
                            scoreBuf[2],
                            (long long)scoreBuf[3],
                            std::vector<double>(scoreBuf.begin() + 4, scoreBuf.end())};
}
