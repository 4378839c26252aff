/*
 * ============================================================================
 * Gacha Forecast - Main Execution File
 * ============================================================================
 *
 * HOW TO BUILD AND RUN:
 * ---------------------
 *   cmake -S . -B build
 *   cmake --build build
 *   ./build/gacha_forecast '<request json>'
 *
 * A compiler with OpenMP support is required (GCC, or Clang with libomp).
 *
 * USAGE:
 * ------
 *   gacha_forecast [--tables <file>] [--quiet] '<request json>'
 *   gacha_forecast [--tables <file>] [--quiet] --request <file>
 *
 *   --tables   Load pity tables from a JSON file (see data/pity_tables.json)
 *              instead of the tables compiled into the binary.
 *   --request  Read the request JSON from a file.
 *   --quiet    Suppress [Init]/[Config]/[Monitor]/[Analysis] logging.
 *
 * REQUEST FORMAT:
 * ---------------
 *   {
 *     "game": "genshin", "pool": "character",
 *     "mode": "distribution",          // or "expectation" (default)
 *     "targetCount": 2,
 *     "initialState": {"pity": 40, "isGuaranteed": false,
 *                      "mingguangCounter": 1, "fatePoint": 0},
 *     "budget": 180, "up4C6": false,
 *     "seed": 42, "trials": 100000, "parallel": true
 *   }
 *
 * OUTPUT:
 * -------
 * The result JSON is the only thing written to stdout. Logging goes to
 * stderr. On failure a single line "FATAL <Kind> [field]: message" is
 * written to stderr and the exit code names the kind:
 *   1 = unexpected error, 2 = configuration, 3 = validation, 4 = compute.
 * ============================================================================
 */

#include "ForecastEngine.h"
#include "GachaErrors.h"
#include "ModelRegistry.h"
#include "RequestParser.h"
#include "ResultAggregator.h"
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace {

    int exitCodeFor(Gacha::ErrorKind kind) {
        switch (kind) {
            case Gacha::ErrorKind::CONFIGURATION: return 2;
            case Gacha::ErrorKind::VALIDATION:    return 3;
            case Gacha::ErrorKind::COMPUTE:       return 4;
        }
        return 1;
    }

    std::string readFile(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw Gacha::ValidationError("request", "Could not open request file: " + path);
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    void printUsage(const char* program) {
        std::cerr << "usage: " << program << " [--tables <file>] [--quiet] (<request json> | --request <file>)"
                  << std::endl;
    }

} // namespace

int main(int argc, char* argv[]) {
    std::string tablesFile;
    std::string requestFile;
    std::string requestText;
    bool quiet = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--tables" && i + 1 < argc) {
            tablesFile = argv[++i];
        } else if (arg == "--request" && i + 1 < argc) {
            requestFile = argv[++i];
        } else if (arg == "--quiet") {
            quiet = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (requestText.empty() && !arg.empty() && arg[0] != '-') {
            requestText = arg;
        } else {
            printUsage(argv[0]);
            return 1;
        }
    }
    if (requestText.empty() == requestFile.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    std::streambuf* logBuffer = std::clog.rdbuf();
    if (quiet) std::clog.rdbuf(nullptr);

    int status = 0;
    try {
        // --- Initialization ---
        Gacha::ModelRegistry registry;
        if (tablesFile.empty()) {
            registry.initializeWithBuiltinTables();
        } else {
            registry.initializeFromJSON(tablesFile);
        }

        // --- Request ---
        if (!requestFile.empty()) requestText = readFile(requestFile);
        const Gacha::SimulationRequest request = Gacha::parseRequest(requestText);

        // --- Execution ---
        const Gacha::SimulationResult result = Gacha::runForecast(registry, request);
        std::cout << Gacha::ResultAggregator::toJson(result) << std::endl;

    } catch (const Gacha::GachaError& e) {
        std::cerr << "FATAL " << Gacha::errorKindName(e.kind());
        if (!e.field().empty()) std::cerr << " [" << e.field() << "]";
        std::cerr << ": " << e.what() << std::endl;
        status = exitCodeFor(e.kind());
    } catch (const std::exception& e) {
        std::cerr << "FATAL " << e.what() << std::endl;
        status = 1;
    }

    std::clog.rdbuf(logBuffer);
    return status;
}
