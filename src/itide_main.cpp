/*─────────────────────────────────────────────────────────────
  File: src/itide_main.cpp

  Command-line entry point for the internal-tide initial-state
  generator.

  This file:
  - Parses CLI arguments
  - Merges defaults, the optional case file and -L
  - Initializes logging
  - Runs the pipeline and maps failures to exit codes

  All mesh, vertical-grid and netCDF work is delegated to other
  modules; this file contains no ocean math.
─────────────────────────────────────────────────────────────*/
#include "case_config.hpp"
#include "logger.hpp"
#include "pipeline.hpp"

#include <filesystem>
#include <iostream>

namespace {

/*-------------------------------------------------------------
  Print CLI usage.
-------------------------------------------------------------*/
void usage()
{
    std::cerr << "Usage: itide_init [-i|--input_file base_mesh.nc] "
                 "[-o|--output_file initial_state.nc]\n"
                 "                  [-L|--nVertLevels 50] [--config case.input] "
                 "[--threads N]\n";
}

/*-------------------------------------------------------------
  Match "-x VALUE", "--long VALUE" or "--long=VALUE".

  On a match, value receives the argument and i is advanced past a
  separate value token. Returns false when flag is not this option;
  throws std::invalid_argument when the value is missing.
-------------------------------------------------------------*/
bool take_value(int argc, char** argv, int& i, const std::string& flag,
                const char* shortName, const char* longName, std::string& value)
{
    const std::string longEq = std::string(longName) + "=";
    if (flag.rfind(longEq, 0) == 0) {
        value = flag.substr(longEq.size());
        return true;
    }
    if ((shortName && flag == shortName) || flag == longName) {
        if (i + 1 >= argc)
            throw std::invalid_argument("Missing value for " + flag);
        value = argv[++i];
        return true;
    }
    return false;
}

} // anonymous namespace


/*=====================================================================
  Program entry point.

  Exit codes:
    0 : success
    1 : usage error (unknown flag, missing or malformed value)
    2 : runtime failure (I/O, configuration, bathymetry); logged
=====================================================================*/
int main(int argc, char** argv)
{
    itide::RunOptions opts;
    std::string configPath;
    std::string levelsArg;
    std::string threadsArg;
    int levels = 0;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string flag = argv[i];
            if (flag == "-h" || flag == "--help") {
                usage();
                return 0;
            }
            if (take_value(argc, argv, i, flag, "-i", "--input_file", opts.inputPath)) continue;
            if (take_value(argc, argv, i, flag, "-o", "--output_file", opts.outputPath)) continue;
            if (take_value(argc, argv, i, flag, "-L", "--nVertLevels", levelsArg)) continue;
            if (take_value(argc, argv, i, flag, nullptr, "--config", configPath)) continue;
            if (take_value(argc, argv, i, flag, nullptr, "--threads", threadsArg)) continue;

            usage();
            return 1;
        }
        if (!levelsArg.empty())
            levels = itide::parse_int_value("--nVertLevels", levelsArg);
        if (!threadsArg.empty())
            opts.threads = itide::parse_int_value("--threads", threadsArg);
    }
    catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << '\n';
        usage();
        return 1;
    }

    /*---------------------------------------------------------
      Logger initialization.
      The log file is written next to the output file.
    ---------------------------------------------------------*/
    std::filesystem::path logPath =
        std::filesystem::path(opts.outputPath).parent_path() / "itide_init.log";
    itide::Logger log(logPath.string());
    if (!log.file_open())
        log.warn("Could not open log file " + logPath.string() + "; logging to console only");
    log.info("itide_init started");
    log.info("Input    : " + opts.inputPath);
    log.info("Output   : " + opts.outputPath);

    try {
        if (!configPath.empty()) {
            log.info("Case file: " + configPath);
            opts.config = itide::parse_case_file(configPath, opts.config);
        }
        if (!levelsArg.empty())
            opts.config.nVertLevels = levels;

        log.info("Flags    : nVertLevels=" + std::to_string(opts.config.nVertLevels) +
                 " threads=" + std::to_string(opts.threads));

        itide::RunSummary summary = itide::run_pipeline(opts, log);
        log.info("Generated " + std::to_string(summary.nCells) + " column(s).");
        log.info("Finished OK.  Exiting.");
        return 0;
    }
    catch (const std::exception& ex) {
        log.error(ex.what());
        std::cout << "Fatal: " << ex.what() << '\n';
        return 2;
    }
}
