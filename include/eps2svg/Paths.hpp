#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace eps2svg {

// One unit of work: where to read, where to write, and both paths relative
// to their roots (used for progress lines).
struct ConversionJob {
    std::filesystem::path input;
    std::filesystem::path output;
    std::filesystem::path relativeInput;
    std::filesystem::path relativeOutput;
};

// true if the file name ends with `ext` (".eps"), ignoring ASCII case
bool hasExtensionIgnoreCase(const std::filesystem::path& p, const std::string& ext);

inline bool isEpsFile(const std::filesystem::path& p) { return hasExtensionIgnoreCase(p, ".eps"); }

// "src/" → "src"; keeps lexically_relative() from producing "../" prefixes
std::filesystem::path trimTrailingSeparator(const std::filesystem::path& p);

// Regular files (not symlinks) under root whose name matches *.eps in any
// case, sorted. Throws std::filesystem::filesystem_error on traversal errors.
std::vector<std::filesystem::path> findEpsFiles(const std::filesystem::path& root);

// srcRoot/a/b/x.EPS → outRoot/a/b/x.svg
ConversionJob mapToOutput(const std::filesystem::path& srcRoot,
                          const std::filesystem::path& outRoot,
                          const std::filesystem::path& file,
                          const std::string& newExt = ".svg");

bool isExecutable(const std::filesystem::path& p);

// looks `name` up in $PATH
std::optional<std::filesystem::path> findExecutable(const std::string& name);

} // namespace eps2svg
