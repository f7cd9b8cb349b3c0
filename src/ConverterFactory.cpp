#include "eps2svg/ConverterFactory.hpp"
#include "eps2svg/InkscapeConverter.hpp"
#include <stdexcept>

namespace eps2svg {

std::unique_ptr<IConverter> ConverterFactory::create(const std::string& id) {
    if (id == "inkscape") return std::make_unique<InkscapeConverter>();
    throw std::invalid_argument("Unknown converter: " + id);
}

} // namespace eps2svg
