#pragma once
#include "Converter.hpp"
#include "Paths.hpp"

#include <filesystem>
#include <memory>
#include <ostream>
#include <vector>

namespace eps2svg {

struct BatchOptions {
    std::filesystem::path sourceDir{"."};
    std::filesystem::path outputDir;       // empty → <sourceDir>/SVG
    Options               converterOptions;
};

// Walks sourceDir for *.eps and feeds every file through one converter,
// mirroring the directory layout under outputDir. Sequential and fail-fast:
// the first exception from the converter or the filesystem ends the run.
class BatchConverter {
    std::unique_ptr<IConverter> converter_;
    std::ostream&               log_;
public:
    BatchConverter(std::unique_ptr<IConverter> converter, std::ostream& log);

    static std::filesystem::path outputDirFor(const BatchOptions& opts);

    // jobs in discovery order, no side effects
    std::vector<ConversionJob> plan(const BatchOptions& opts) const;

    // returns the number of converted files
    size_t run(const BatchOptions& opts);
};

} // namespace eps2svg
