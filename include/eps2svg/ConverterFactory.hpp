#pragma once
#include "Converter.hpp"
#include <memory>
#include <string>

namespace eps2svg {

class ConverterFactory {
public:
    // creates a converter by key, e.g. "inkscape"
    static std::unique_ptr<IConverter> create(const std::string& converterId);
};

} // namespace eps2svg
