///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "config.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <vector>


///////////////////////////
///       HELPERS       ///
///////////////////////////
static void trim(std::string& s) {
    s.erase(s.begin(), std::find_if(s.begin(), s.end(),
                                    [](unsigned char ch) { return !std::isspace(ch); }));
    s.erase(std::find_if(s.rbegin(), s.rend(),
                         [](unsigned char ch) { return !std::isspace(ch); }).base(), s.end());
}

static std::string toLower(std::string v) {
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    return v;
}

static bool parseLong(const std::string& v, long long& out) {
    if (v.empty()) return false;
    char* end = nullptr;
    long long value = std::strtoll(v.c_str(), &end, 10);
    if (!end || *end != '\0') return false;
    out = value;
    return true;
}

static bool parseDouble(const std::string& v, double& out) {
    if (v.empty()) return false;
    char* end = nullptr;
    double value = std::strtod(v.c_str(), &end);
    if (!end || *end != '\0') return false;
    out = value;
    return true;
}

static bool parseBool(const std::string& raw, bool& out) {
    std::string v = toLower(raw);
    if (v == "true" || v == "yes" || v == "on" || v == "1") { out = true; return true; }
    if (v == "false" || v == "no" || v == "off" || v == "0") { out = false; return true; }
    return false;
}

/**
 * @brief Per-line reporting shared by all key handlers.
 */
class LineReporter {
public:
    LineReporter(ConfigParseMode mode, std::ostream* warnings)
            : mode_(mode), warnings_(warnings) {}

    void setLine(int lineNo) { lineNo_ = lineNo; }

    /// Throws in STRICT mode, otherwise prints a warning and returns.
    void reject(const std::string& msg) const {
        std::string full = "config line " + std::to_string(lineNo_) + ": " + msg;
        if (mode_ == ConfigParseMode::STRICT) throw ConfigurationError(full);
        if (warnings_) *warnings_ << "Warning: " << full << "\n";
    }

    void warn(const std::string& msg) const {
        if (warnings_) *warnings_ << "Warning: config line " << lineNo_ << ": " << msg << "\n";
    }

    long long integer(const std::string& key, const std::string& v) const {
        long long out = 0;
        if (!parseLong(v, out)) {
            reject("invalid integer for " + key + " '" + v + "', using 0");
            return 0;
        }
        return out;
    }

    double real(const std::string& key, const std::string& v) const {
        double out = 0.0;
        if (!parseDouble(v, out)) {
            reject("invalid number for " + key + " '" + v + "', using 0");
            return 0.0;
        }
        return out;
    }

    bool boolean(const std::string& key, const std::string& v) const {
        bool out = false;
        if (!parseBool(v, out)) {
            reject("invalid boolean for " + key + " '" + v + "', using false");
            return false;
        }
        return out;
    }

private:
    ConfigParseMode mode_;
    std::ostream* warnings_;
    int lineNo_ = 0;
};

static std::vector<MoveType> parseMoveTypes(const std::string& value, const LineReporter& report) {
    std::vector<MoveType> types;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        trim(item);
        item = toLower(item);
        if (item.empty()) continue;

        MoveType type;
        if (item == "relocate") {
            type = MoveType::RELOCATE;
        } else if (item == "swap") {
            type = MoveType::SWAP;
        } else {
            report.reject("unknown move type '" + item + "' (use relocate|swap)");
            continue;
        }
        if (std::find(types.begin(), types.end(), type) == types.end()) types.push_back(type);
    }
    return types;
}


///////////////////////////
///    CONFIGURATION    ///
///////////////////////////
void parseConfig(std::istream& in, RunConfig& config, ConfigParseMode mode, std::ostream* warnings) {
    ScheduleConfig& sc = config.schedule;
    AnnealingParams& ap = config.annealing;
    LineReporter report(mode, warnings);

    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        report.setLine(lineNo);

        auto hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        trim(line);
        if (line.empty()) continue;

        auto colon = line.find(':');
        if (colon == std::string::npos) {
            report.reject("missing ':'");
            continue;
        }

        std::string key = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        trim(key);
        trim(value);
        key = toLower(key);

        if (key == "classroom_count") sc.classroomCount = (int)report.integer(key, value);
        else if (key == "day_count") sc.dayCount = (int)report.integer(key, value);
        else if (key == "slot_count") sc.slotCount = (int)report.integer(key, value);
        else if (key == "max_participants_per_lesson") sc.maxParticipantsPerLesson = (int)report.integer(key, value);
        else if (key == "ticket_price") sc.ticketPrice = report.real(key, value);
        else if (key == "hourly_pay") sc.hourlyPay = report.real(key, value);
        else if (key == "presence_bonus") sc.presenceBonus = report.real(key, value);
        else if (key == "rental_cost") sc.rentalCost = report.real(key, value);
        else if (key == "alpha") ap.alpha = report.real(key, value);
        else if (key == "initial_temperature") ap.initialTemperature = report.real(key, value);
        else if (key == "iterations_per_temperature") ap.iterationsPerTemperature = (int)report.integer(key, value);
        else if (key == "min_temperature") ap.minTemperature = report.real(key, value);
        else if (key == "epsilon") ap.epsilon = report.real(key, value);
        else if (key == "max_stagnant_epochs") ap.maxStagnantEpochs = (int)report.integer(key, value);
        else if (key == "use_greedy_initial_placement") ap.useGreedyInitialPlacement = report.boolean(key, value);
        else if (key == "allowed_neighbor_move_types") ap.allowedMoveTypes = parseMoveTypes(value, report);
        else if (key == "seed") {
            long long seed = report.integer(key, value);
            if (seed < 0) {
                report.reject("seed must be >= 0, using 0");
                seed = 0;
            }
            ap.seed = (std::uint64_t)seed;
        }
        else if (key == "rollback_policy") {
            std::string policy = toLower(value);
            if (policy == "rollback") ap.rejectPolicy = RejectPolicy::ROLLBACK;
            else if (policy == "keep_mutation") ap.rejectPolicy = RejectPolicy::KEEP_MUTATION;
            else report.reject("invalid rollback_policy '" + value + "' (use rollback|keep_mutation)");
        }
        else {
            report.warn("unknown key '" + key + "'");
        }
    }
}

RunConfig loadConfigFile(const std::string& path, ConfigParseMode mode, std::ostream* warnings) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigurationError("cannot open config file: " + path);
    }
    RunConfig config;
    parseConfig(file, config, mode, warnings);
    return config;
}
