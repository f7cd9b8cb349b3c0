#pragma once
#include "Converter.hpp"

#include <filesystem>
#include <optional>

namespace eps2svg {

// Shells out to Inkscape 1.x:
//   inkscape <in> --export-filename=<out> --export-plain-svg [--export-text-to-path]
//
// Recognised params:
//   inkscape      explicit path to the executable
//   text_to_path  non-empty and not "0" → convert text to outlines
class InkscapeConverter final : public IConverter {
public:
    void checkAvailable(const Options& opts) const override;

    void convert(const std::string& inputPath,
                 const std::string& outputPath,
                 const Options&     opts) override;

    // --inkscape param, then $INKSCAPE, then PATH, then the platform install dir
    static std::optional<std::filesystem::path> locate(const Options& opts);

    // full shell command for one conversion (exposed for tests)
    static std::string buildCommand(const std::filesystem::path& executable,
                                    const std::string& inputPath,
                                    const std::string& outputPath,
                                    const Options&     opts);
};

} // namespace eps2svg
