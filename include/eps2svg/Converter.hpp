#pragma once
#include <string>
#include <unordered_map>

namespace eps2svg {

struct Options {
    std::unordered_map<std::string, std::string> params;
};

class IConverter {
public:
    virtual ~IConverter() = default;

    // throws if the converter cannot run at all (missing binary etc.)
    virtual void checkAvailable(const Options& /*opts*/) const {}

    // inputPath → outputPath, with options; throws on failure
    virtual void convert(const std::string& inputPath,
                         const std::string& outputPath,
                         const Options& opts) = 0;
};

} // namespace eps2svg
