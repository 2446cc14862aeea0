#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "config.hpp"
#include "demo_instances.hpp"
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>


///////////////////////////
///   DRIVER OPTIONS    ///
///////////////////////////
/**
 * @brief Command-line options shared by all driver executables.
 *
 *   --clients PATH       client records (needs --instructors too)
 *   --instructors PATH   instructor records
 *   --config PATH        key: value settings file
 *   --strict             reject malformed config values
 *   --seed N             overrides the config seed
 *   --demo small|medium|large  synthetic instance when no records are given
 *   --threads N          worker threads (threaded / MPI drivers)
 *   --batch N            candidate grids per device batch (OpenCL driver)
 *   --verbose            per-epoch progress
 */
struct DriverOptions {
    std::string clientsPath;
    std::string instructorsPath;
    std::string configPath;
    bool strictConfig = false;
    std::optional<std::uint64_t> seed;
    DemoSize demo = DemoSize::SMALL;
    int threads = 4;
    int batchSize = 256;
    bool verbose = false;
};

/**
 * @brief Parse argv into DriverOptions.
 *
 * Throws std::runtime_error for unknown arguments or missing values.
 */
DriverOptions parseDriverOptions(int argc, char** argv);

/**
 * @brief Build the problem and search parameters the options describe.
 *
 * Reads the config file (if any), then the record files or the demo
 * instance. The demo's classroom count is kept unless a config file is
 * given. Config warnings go to @p warnings.
 */
ProblemInstance loadProblem(const DriverOptions& options, AnnealingParams& params, std::ostream* warnings);
