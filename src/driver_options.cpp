///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "driver_options.hpp"
#include "records.hpp"
#include <stdexcept>


///////////////////////////
///       HELPERS       ///
///////////////////////////
static std::string requireArg(int& i, int argc, char** argv, const std::string& name) {
    if (i + 1 >= argc) {
        throw std::runtime_error("Missing value for " + name);
    }
    return argv[++i];
}

static int parsePositive(const std::string& value, const std::string& name) {
    std::size_t used = 0;
    int out = 0;
    try {
        out = std::stoi(value, &used);
    } catch (const std::exception&) {
        throw std::runtime_error(name + " expects an integer, got '" + value + "'");
    }
    if (used != value.size() || out < 1) {
        throw std::runtime_error(name + " expects a positive integer, got '" + value + "'");
    }
    return out;
}

static DemoSize parseDemoSize(const std::string& value) {
    if (value == "small") return DemoSize::SMALL;
    if (value == "medium") return DemoSize::MEDIUM;
    if (value == "large") return DemoSize::LARGE;
    throw std::runtime_error("--demo must be small|medium|large.");
}


///////////////////////////
///   DRIVER OPTIONS    ///
///////////////////////////
DriverOptions parseDriverOptions(int argc, char** argv) {
    DriverOptions opt;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--clients") {
            opt.clientsPath = requireArg(i, argc, argv, arg);
        } else if (arg == "--instructors") {
            opt.instructorsPath = requireArg(i, argc, argv, arg);
        } else if (arg == "--config") {
            opt.configPath = requireArg(i, argc, argv, arg);
        } else if (arg == "--strict") {
            opt.strictConfig = true;
        } else if (arg == "--seed") {
            std::string value = requireArg(i, argc, argv, arg);
            std::size_t used = 0;
            unsigned long long seed = 0;
            try {
                seed = std::stoull(value, &used);
            } catch (const std::exception&) {
                throw std::runtime_error("--seed expects a non-negative integer, got '" + value + "'");
            }
            if (used != value.size()) {
                throw std::runtime_error("--seed expects a non-negative integer, got '" + value + "'");
            }
            opt.seed = (std::uint64_t)seed;
        } else if (arg == "--demo") {
            opt.demo = parseDemoSize(requireArg(i, argc, argv, arg));
        } else if (arg == "--threads") {
            opt.threads = parsePositive(requireArg(i, argc, argv, arg), arg);
        } else if (arg == "--batch") {
            opt.batchSize = parsePositive(requireArg(i, argc, argv, arg), arg);
        } else if (arg == "--verbose") {
            opt.verbose = true;
        } else {
            throw std::runtime_error("Unknown argument: " + arg);
        }
    }

    if (opt.clientsPath.empty() != opt.instructorsPath.empty()) {
        throw std::runtime_error("--clients and --instructors must be given together.");
    }
    return opt;
}

ProblemInstance loadProblem(const DriverOptions& options, AnnealingParams& params, std::ostream* warnings) {
    ProblemInstance inst;
    if (options.clientsPath.empty()) {
        inst = makeDemoInstance(options.demo);
    } else {
        inst.clients = toClients(loadRecordsFile(options.clientsPath));
        inst.instructors = toInstructors(loadRecordsFile(options.instructorsPath));
    }

    if (!options.configPath.empty()) {
        ConfigParseMode mode = options.strictConfig ? ConfigParseMode::STRICT : ConfigParseMode::LENIENT;
        RunConfig config = loadConfigFile(options.configPath, mode, warnings);
        inst.config = config.schedule;
        params = config.annealing;
    }

    if (options.seed) {
        params.seed = *options.seed;
    }
    return inst;
}
