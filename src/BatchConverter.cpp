#include "eps2svg/BatchConverter.hpp"

#include <stdexcept>

namespace fs = std::filesystem;

namespace eps2svg {

BatchConverter::BatchConverter(std::unique_ptr<IConverter> converter, std::ostream& log)
    : converter_(std::move(converter)), log_(log)
{
    if (!converter_)
        throw std::invalid_argument("BatchConverter: converter is null");
}

fs::path BatchConverter::outputDirFor(const BatchOptions& opts)
{
    if (!opts.outputDir.empty()) return opts.outputDir;
    return trimTrailingSeparator(opts.sourceDir) / "SVG";
}

std::vector<ConversionJob> BatchConverter::plan(const BatchOptions& opts) const
{
    const fs::path out = outputDirFor(opts);

    std::vector<ConversionJob> jobs;
    for (const auto& file : findEpsFiles(opts.sourceDir))
        jobs.push_back(mapToOutput(opts.sourceDir, out, file));
    return jobs;
}

size_t BatchConverter::run(const BatchOptions& opts)
{
    // 1. nothing gets created unless the converter can actually run
    converter_->checkAvailable(opts.converterOptions);

    if (!fs::is_directory(opts.sourceDir))
        throw std::runtime_error("source directory not found: " + opts.sourceDir.string());

    // 2. output root exists even when there is nothing to convert
    const fs::path out = outputDirFor(opts);
    fs::create_directories(out);

    // 3. one blocking conversion per file, in discovery order
    size_t converted = 0;
    for (const auto& job : plan(opts)) {
        fs::create_directories(job.output.parent_path());

        log_ << "[...] " << job.relativeInput.generic_string()
             << " → "    << job.relativeOutput.generic_string() << std::endl;

        converter_->convert(job.input.string(), job.output.string(), opts.converterOptions);

        log_ << "[OK]  " << job.relativeOutput.generic_string() << std::endl;
        ++converted;
    }

    log_ << "Done." << std::endl;
    return converted;
}

} // namespace eps2svg
