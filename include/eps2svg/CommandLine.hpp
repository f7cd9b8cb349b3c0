#pragma once
#include "BatchConverter.hpp"

#include <ostream>
#include <string>

#ifndef EPS2SVG_VERSION
#define EPS2SVG_VERSION "1.0.0"
#endif

namespace eps2svg {

struct CommandLine {
    bool         showHelp    = false;
    bool         showVersion = false;
    BatchOptions batch;
};

// eps2svg [--inkscape <path>] [--text-to-path] [source] [output]
// throws std::invalid_argument on malformed input
CommandLine parseCommandLine(int argc, const char* const argv[]);

void printUsage(std::ostream& os, const std::string& program);

// Whole CLI: parse, convert with inkscape, report. Progress goes to `out`,
// "Error: <message>" to `err`. Returns the process exit code (0 or 1).
int runCli(int argc, const char* const argv[], std::ostream& out, std::ostream& err);

} // namespace eps2svg
